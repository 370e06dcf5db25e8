#include "gnmireverse/client/publisher.h"
#include "gnmireverse/common/logger.h"

#include <grpcpp/client_context.h>

namespace gnmireverse {
namespace client {

Publisher::Publisher(std::shared_ptr<grpc::ChannelInterface> collector_channel)
    : stub_(gnmireverse::gNMIReverse::NewStub(collector_channel)) {}

core::Result<void> Publisher::Run(core::CancellationScope& scope, UpdateChannel& channel) {
    grpc::ClientContext context;
    gnmireverse::Empty response;
    core::ScopedCancelCallback cancel_call(scope, [&context]() { context.TryCancel(); });

    auto writer = stub_->Publish(&context, &response);
    if (!writer) {
        return core::Result<void>::from_error(core::StreamError("error from Publish: no stream"));
    }

    for (;;) {
        auto next = channel.Receive();
        if (!next.ok()) {
            context.TryCancel();
            grpc::Status status = writer->Finish();
            GNMIREVERSE_DEBUG("publish stream finished after cancellation: {}",
                              FormatStatus(status));
            return core::Result<void>::error(next.error(), next.code());
        }

        UpdatePtr update = next.take_value();
        if (!writer->Write(*update)) {
            grpc::Status status = writer->Finish();
            if (scope.IsCancelled()) {
                return core::Result<void>::from_error(core::CancellationError(scope.Reason()));
            }
            return core::Result<void>::from_error(
                core::StreamError("error from Publish.Send: " + FormatStatus(status)));
        }
    }
}

} // namespace client
} // namespace gnmireverse
