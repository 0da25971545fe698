#pragma once

#include <filesystem>
#include <string>

namespace docserve {

// Maps decoded request paths onto the document root. This is the only place
// a request path is turned into a filesystem path.
class PathResolver {
   public:
    explicit PathResolver(const std::string &docRoot);
    ~PathResolver() = default;

    enum result_type {
        ok,
        bad_path,     // not an absolute request path
        outside_root  // a ".." segment would leave the document root
    };

    // Purely lexical: no filesystem access is done here. "." and empty
    // segments are dropped and ".." removes the previous segment. On ok
    // 'resolved' is the document root joined with the remaining segments.
    result_type resolve(const std::string &requestPath, std::filesystem::path &resolved) const;

    // True if 'path', which must already be canonical, is the document root
    // or lies below it. Used to stop symlinks pointing out of the root.
    bool isInsideRoot(const std::filesystem::path &path) const;

   private:
    // Absolute and lexically normal, without trailing separator.
    std::filesystem::path root_;

    // Symlinks resolved, empty if the root does not exist.
    std::filesystem::path canonicalRoot_;
};

}  // namespace docserve
