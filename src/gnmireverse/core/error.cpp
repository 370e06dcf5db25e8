#include "gnmireverse/core/error.h"

namespace gnmireverse {
namespace core {

const char* CodeName(Error::Code code) {
    switch (code) {
        case Error::Code::INVALID_ARGUMENT: return "invalid_argument";
        case Error::Code::CONFIG: return "config";
        case Error::Code::DIAL: return "dial";
        case Error::Code::STREAM: return "stream";
        case Error::Code::CANCELLED: return "cancelled";
        case Error::Code::INTERNAL: return "internal";
        case Error::Code::UNKNOWN:
        default:
            return "unknown";
    }
}

}  // namespace core
}  // namespace gnmireverse
