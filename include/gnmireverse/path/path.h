#ifndef GNMIREVERSE_PATH_PATH_H_
#define GNMIREVERSE_PATH_PATH_H_

#include <map>
#include <string>
#include <vector>

namespace gnmi {
class Path;
}

namespace gnmireverse {
namespace path {

/**
 * @brief One element of a structured path: a name plus optional keys
 */
struct PathElem {
    std::string name;
    std::map<std::string, std::string> keys;

    bool operator==(const PathElem& other) const {
        return name == other.name && keys == other.keys;
    }
    bool operator!=(const PathElem& other) const { return !(*this == other); }
};

/**
 * @brief Hierarchical subscription path such as /interfaces/interface[name=Ethernet1]/state
 */
class Path {
public:
    Path() = default;
    explicit Path(std::vector<PathElem> elems) : elems_(std::move(elems)) {}

    /**
     * @brief Path parsed from text, keeping each element as written
     * 
     * The element strings are sent as the deprecated gNMI element field for
     * targets that predate structured path elements.
     */
    Path(std::vector<PathElem> elems, std::vector<std::string> elements)
        : elems_(std::move(elems)), elements_(std::move(elements)) {}

    const std::vector<PathElem>& elems() const { return elems_; }
    bool empty() const { return elems_.empty(); }
    size_t size() const { return elems_.size(); }

    /**
     * @brief Render as a path string, "/" for the root path
     * 
     * Keys are printed in sorted order; separators inside names and values
     * are escaped with a backslash so the result parses back to this path.
     */
    std::string ToString() const;

    /**
     * @brief Element strings as written, or rendered from elems() when the
     * path was not parsed from text
     */
    std::vector<std::string> ElementStrings() const;

    /**
     * @brief Fill the elem and element fields of a gNMI Path message
     */
    void ToProto(gnmi::Path* out) const;

    bool operator==(const Path& other) const { return elems_ == other.elems_; }
    bool operator!=(const Path& other) const { return !(*this == other); }

private:
    std::vector<PathElem> elems_;
    std::vector<std::string> elements_;
};

/**
 * @brief Split a path string into its element strings
 * 
 * Splits on '/' outside of [...] key blocks, keeps backslash escapes intact
 * and ignores a leading or trailing '/'.
 * @throws core::ConfigError on an unterminated key block
 */
std::vector<std::string> SplitPath(const std::string& path);

/**
 * @brief Parse one element string, e.g. interface[name=Ethernet1]
 * @throws core::ConfigError if the element is malformed
 */
PathElem ParseElement(const std::string& element);

/**
 * @brief Parse a full path string
 * @throws core::ConfigError if the path is malformed
 */
Path ParsePath(const std::string& path);

/**
 * @brief Render a list of paths as "a, b, c"
 */
std::string JoinPaths(const std::vector<Path>& paths);

} // namespace path
} // namespace gnmireverse

#endif // GNMIREVERSE_PATH_PATH_H_
