#include <algorithm>
#include <cctype>
#include <unordered_map>

#include "docserve/mime_types.hpp"

namespace docserve {
namespace mime_types {

namespace {
const std::unordered_map<std::string, std::string> mime_map = {
    {"css", "text/css"},
    {"gif", "image/gif"},
    {"htm", "text/html"},
    {"html", "text/html"},
    {"jpg", "image/jpeg"},
    {"jpeg", "image/jpeg"},
    {"js", "text/javascript"},
    {"mjs", "text/javascript"},
    {"json", "application/json"},
    {"map", "application/json"},
    {"png", "image/png"},
    {"bmp", "image/bmp"},
    {"webp", "image/webp"},
    {"avif", "image/avif"},
    {"ico", "image/vnd.microsoft.icon"},
    {"svg", "image/svg+xml"},
    {"txt", "text/plain"},
    {"csv", "text/csv"},
    {"md", "text/markdown"},
    {"xml", "application/xml"},
    {"pdf", "application/pdf"},
    {"zip", "application/zip"},
    {"gz", "application/gzip"},
    {"tar", "application/x-tar"},
    {"mp3", "audio/mpeg"},
    {"mp4", "video/mp4"},
    {"webm", "video/webm"},
    {"ogg", "audio/ogg"},
    {"wav", "audio/wav"},
    {"woff", "font/woff"},
    {"woff2", "font/woff2"},
    {"ttf", "font/ttf"},
    {"otf", "font/otf"},
    {"wasm", "application/wasm"},
    {"webmanifest", "application/manifest+json"}};
}  // namespace

std::string extensionToType(const std::string &extension) {
    std::string ext = extension;
    std::transform(
        ext.begin(), ext.end(), ext.begin(), [](unsigned char c) { return std::tolower(c); });

    auto it = mime_map.find(ext);
    if (it != mime_map.end()) {
        return it->second;
    }
    return "application/octet-stream";
}

std::string extensionOf(const std::string &path) {
    std::size_t lastSlashPos = path.find_last_of('/');
    std::size_t lastDotPos = path.find_last_of('.');
    if (lastDotPos == std::string::npos ||
        (lastSlashPos != std::string::npos && lastDotPos < lastSlashPos)) {
        return "";
    }
    return path.substr(lastDotPos + 1);
}

}  // namespace mime_types
}  // namespace docserve
