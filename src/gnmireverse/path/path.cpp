#include "gnmireverse/path/path.h"
#include "gnmireverse/core/error.h"
#include "proto/gen/gnmi.pb.h"

namespace gnmireverse {
namespace path {

namespace {

std::string Escape(const std::string& in, const char* specials) {
    std::string out;
    out.reserve(in.size());
    for (char c : in) {
        for (const char* s = specials; *s != '\0'; ++s) {
            if (c == *s) {
                out.push_back('\\');
                break;
            }
        }
        out.push_back(c);
    }
    return out;
}

std::string RenderElement(const PathElem& elem) {
    std::string out = Escape(elem.name, "\\/[]");
    for (const auto& [key, value] : elem.keys) {
        out += '[';
        out += Escape(key, "\\=]");
        out += '=';
        out += Escape(value, "\\]");
        out += ']';
    }
    return out;
}

std::string ElementError(const std::string& element, const std::string& what) {
    return "invalid path element \"" + element + "\": " + what;
}

} // namespace

std::string Path::ToString() const {
    if (elems_.empty()) {
        return "/";
    }
    std::string out;
    for (const auto& elem : elems_) {
        out += '/';
        out += RenderElement(elem);
    }
    return out;
}

std::vector<std::string> Path::ElementStrings() const {
    if (elements_.size() == elems_.size()) {
        return elements_;
    }
    std::vector<std::string> rendered;
    rendered.reserve(elems_.size());
    for (const auto& elem : elems_) {
        rendered.push_back(RenderElement(elem));
    }
    return rendered;
}

void Path::ToProto(gnmi::Path* out) const {
    for (const auto& elem : elems_) {
        auto* proto_elem = out->add_elem();
        proto_elem->set_name(elem.name);
        for (const auto& [key, value] : elem.keys) {
            (*proto_elem->mutable_key())[key] = value;
        }
    }
    for (auto& element : ElementStrings()) {
        out->add_element(std::move(element));
    }
}

std::vector<std::string> SplitPath(const std::string& path) {
    std::vector<std::string> elements;
    std::string current;
    bool in_key = false;
    bool escaped = false;

    for (size_t i = 0; i < path.size(); ++i) {
        const char c = path[i];
        if (escaped) {
            current.push_back(c);
            escaped = false;
            continue;
        }
        switch (c) {
            case '\\':
                current.push_back(c);
                escaped = true;
                break;
            case '[':
                current.push_back(c);
                in_key = true;
                break;
            case ']':
                current.push_back(c);
                in_key = false;
                break;
            case '/':
                if (in_key) {
                    current.push_back(c);
                } else if (i != 0) {
                    elements.push_back(std::move(current));
                    current.clear();
                }
                break;
            default:
                current.push_back(c);
                break;
        }
    }
    if (in_key) {
        throw core::ConfigError("invalid path \"" + path + "\": unterminated '['");
    }
    if (!current.empty()) {
        elements.push_back(std::move(current));
    }
    return elements;
}

PathElem ParseElement(const std::string& element) {
    PathElem elem;
    size_t i = 0;

    // Name runs up to the first unescaped '['
    for (; i < element.size() && element[i] != '['; ++i) {
        if (element[i] == '\\') {
            if (++i == element.size()) {
                throw core::ConfigError(ElementError(element, "trailing backslash"));
            }
        } else if (element[i] == ']') {
            throw core::ConfigError(ElementError(element, "unexpected ']'"));
        }
        elem.name.push_back(element[i]);
    }
    if (elem.name.empty()) {
        throw core::ConfigError(ElementError(element, "empty name"));
    }

    while (i < element.size()) {
        if (element[i] != '[') {
            throw core::ConfigError(ElementError(element, "unexpected text after ']'"));
        }
        ++i;

        std::string key;
        for (; i < element.size() && element[i] != '=' && element[i] != ']'; ++i) {
            if (element[i] == '\\' && i + 1 < element.size()) {
                ++i;
            }
            key.push_back(element[i]);
        }
        if (i == element.size() || element[i] != '=') {
            throw core::ConfigError(ElementError(element, "missing '=' in key"));
        }
        if (key.empty()) {
            throw core::ConfigError(ElementError(element, "empty key name"));
        }
        ++i;

        std::string value;
        bool closed = false;
        for (; i < element.size(); ++i) {
            if (element[i] == '\\' && i + 1 < element.size()) {
                value.push_back(element[++i]);
            } else if (element[i] == ']') {
                closed = true;
                ++i;
                break;
            } else {
                value.push_back(element[i]);
            }
        }
        if (!closed) {
            throw core::ConfigError(ElementError(element, "unterminated '['"));
        }
        elem.keys[key] = value;
    }
    return elem;
}

Path ParsePath(const std::string& path) {
    std::vector<std::string> elements = SplitPath(path);
    std::vector<PathElem> elems;
    elems.reserve(elements.size());
    for (const auto& element : elements) {
        elems.push_back(ParseElement(element));
    }
    return Path(std::move(elems), std::move(elements));
}

std::string JoinPaths(const std::vector<Path>& paths) {
    std::string out;
    for (size_t i = 0; i < paths.size(); ++i) {
        if (i > 0) {
            out += ", ";
        }
        out += paths[i].ToString();
    }
    return out;
}

} // namespace path
} // namespace gnmireverse
