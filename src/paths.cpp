#include "objstore/paths.hpp"
#include "objstore/net/http.hpp"

#include <algorithm>
#include <cctype>
#include <random>

namespace objstore::paths {

std::string normalize(std::string_view name) {
    std::string result;
    result.reserve(name.size());

    size_t pos = 0;
    while (pos <= name.size()) {
        size_t slash = name.find('/', pos);
        if (slash == std::string_view::npos) slash = name.size();

        std::string_view segment = name.substr(pos, slash - pos);
        // "." only counts as a relative marker before the first real segment
        bool leading_dot = result.empty() && segment == ".";
        if (!segment.empty() && !leading_dot) {
            if (!result.empty()) result += '/';
            result.append(segment);
        }
        pos = slash + 1;
    }
    return result;
}

std::string listing_prefix(std::string_view path) {
    std::string key = normalize(path);
    if (key.empty()) return key;
    return key + "/";
}

std::string encode_key(std::string_view key) {
    return net::url_encode_path(std::string(key));
}

std::string strip_trailing_slashes(std::string_view s) {
    while (!s.empty() && s.back() == '/') {
        s.remove_suffix(1);
    }
    return std::string(s);
}

std::string join_url(std::string_view base, std::string_view key) {
    return strip_trailing_slashes(base) + "/" + encode_key(key);
}

namespace {

struct MimeEntry {
    const char* ext;
    const char* type;
};

const MimeEntry kMimeTypes[] = {
    {"txt", "text/plain"},
    {"html", "text/html"},
    {"htm", "text/html"},
    {"css", "text/css"},
    {"csv", "text/csv"},
    {"md", "text/markdown"},
    {"xml", "application/xml"},
    {"js", "text/javascript"},
    {"mjs", "text/javascript"},
    {"json", "application/json"},
    {"pdf", "application/pdf"},
    {"zip", "application/zip"},
    {"gz", "application/gzip"},
    {"tar", "application/x-tar"},
    {"wasm", "application/wasm"},
    {"png", "image/png"},
    {"jpg", "image/jpeg"},
    {"jpeg", "image/jpeg"},
    {"gif", "image/gif"},
    {"svg", "image/svg+xml"},
    {"webp", "image/webp"},
    {"ico", "image/vnd.microsoft.icon"},
    {"bmp", "image/bmp"},
    {"tif", "image/tiff"},
    {"tiff", "image/tiff"},
    {"mp3", "audio/mpeg"},
    {"wav", "audio/x-wav"},
    {"ogg", "audio/ogg"},
    {"mp4", "video/mp4"},
    {"webm", "video/webm"},
    {"mov", "video/quicktime"},
    {"woff", "font/woff"},
    {"woff2", "font/woff2"},
    {"ttf", "font/ttf"},
    {"otf", "font/otf"},
};

// Position of the extension dot in the last segment, npos if none.
// A leading dot (".bashrc") is part of the name, not an extension.
size_t extension_dot(std::string_view key) {
    size_t slash = key.rfind('/');
    size_t start = slash == std::string_view::npos ? 0 : slash + 1;
    size_t dot = key.rfind('.');
    if (dot == std::string_view::npos || dot < start) return std::string_view::npos;
    std::string_view base = key.substr(start, dot - start);
    if (std::all_of(base.begin(), base.end(), [](char c) { return c == '.'; })) {
        return std::string_view::npos;
    }
    return dot;
}

} // namespace

std::string guess_content_type(std::string_view name) {
    size_t dot = extension_dot(name);
    if (dot == std::string_view::npos) return "application/octet-stream";

    std::string ext(name.substr(dot + 1));
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    for (const auto& entry : kMimeTypes) {
        if (ext == entry.ext) return entry.type;
    }
    return "application/octet-stream";
}

std::string alternative_name(std::string_view key, std::string_view suffix) {
    size_t dot = extension_dot(key);
    if (dot == std::string_view::npos) {
        return std::string(key) + "_" + std::string(suffix);
    }
    return std::string(key.substr(0, dot)) + "_" + std::string(suffix) +
           std::string(key.substr(dot));
}

std::string random_suffix(size_t length) {
    static constexpr char kAlphabet[] =
        "abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789";
    thread_local std::mt19937 rng{std::random_device{}()};
    std::uniform_int_distribution<size_t> dist(0, sizeof(kAlphabet) - 2);

    std::string result;
    result.reserve(length);
    for (size_t i = 0; i < length; ++i) {
        result += kAlphabet[dist(rng)];
    }
    return result;
}

} // namespace objstore::paths
