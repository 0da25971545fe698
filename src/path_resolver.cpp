#include <algorithm>
#include <system_error>
#include <vector>

#include "docserve/path_resolver.hpp"

namespace fs = std::filesystem;

namespace docserve {

namespace {
fs::path withoutTrailingSeparator(fs::path p) {
    if (!p.has_filename() && p.has_relative_path()) {
        p = p.parent_path();
    }
    return p;
}
}  // namespace

PathResolver::PathResolver(const std::string &docRoot) {
    std::error_code ec;
    fs::path root = fs::absolute(docRoot.empty() ? fs::path(".") : fs::path(docRoot), ec);
    if (ec) {
        root = fs::path(docRoot);
    }
    root_ = withoutTrailingSeparator(root.lexically_normal());

    fs::path canonical = fs::canonical(root_, ec);
    if (!ec) {
        canonicalRoot_ = withoutTrailingSeparator(canonical);
    }
}

PathResolver::result_type PathResolver::resolve(const std::string &requestPath,
                                                fs::path &resolved) const {
    if (requestPath.empty() || requestPath[0] != '/' ||
        requestPath.find('\0') != std::string::npos) {
        return bad_path;
    }

    std::vector<std::string> segments;
    size_t start = 1;
    while (start <= requestPath.size()) {
        size_t end = requestPath.find('/', start);
        if (end == std::string::npos) {
            end = requestPath.size();
        }
        std::string segment = requestPath.substr(start, end - start);
        start = end + 1;

        if (segment.empty() || segment == ".") {
            continue;
        }
        if (segment == "..") {
            if (segments.empty()) {
                return outside_root;
            }
            segments.pop_back();
            continue;
        }
        segments.push_back(segment);
    }

    resolved = root_;
    for (const auto &segment : segments) {
        resolved /= segment;
    }
    return ok;
}

bool PathResolver::isInsideRoot(const fs::path &path) const {
    if (canonicalRoot_.empty()) {
        return false;
    }
    auto rootEnd = canonicalRoot_.end();
    auto res = std::mismatch(canonicalRoot_.begin(), rootEnd, path.begin(), path.end());
    return res.first == rootEnd;
}

}  // namespace docserve
