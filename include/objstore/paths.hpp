#pragma once

#include <string>
#include <string_view>

namespace objstore::paths {

// Canonical object key: no leading '/', no leading "./" segments, no empty
// segments, no trailing '/'. Other characters are kept verbatim.
// normalize(normalize(x)) == normalize(x).
std::string normalize(std::string_view name);

// "" for the bucket root, otherwise normalize(path) + "/"
std::string listing_prefix(std::string_view path);

// Percent-encodes everything but RFC 3986 unreserved characters and '/'
std::string encode_key(std::string_view key);

// Base without trailing '/', then '/', then the encoded key
std::string join_url(std::string_view base, std::string_view key);

std::string strip_trailing_slashes(std::string_view s);

// MIME type from the file extension, application/octet-stream if unknown
std::string guess_content_type(std::string_view name);

// "dir/photo.jpg" + "Ab3dE9x" -> "dir/photo_Ab3dE9x.jpg"
std::string alternative_name(std::string_view key, std::string_view suffix);

// Random [A-Za-z0-9] string
std::string random_suffix(size_t length = 7);

} // namespace objstore::paths
