/**
 * ksau - Remote drive path and URL helpers.
 */
#pragma once

#include <initializer_list>
#include <string>
#include <string_view>

namespace ksau
{

    // Joins path fragments with single '/' separators, dropping empty segments
    // and leading/trailing slashes: {"/root/", "a//b", "f.txt"} -> "root/a/b/f.txt".
    std::string join_remote_path(std::initializer_list<std::string_view> parts);

    std::string normalize_remote(std::string_view path);

    // Percent-encodes everything except RFC 3986 unreserved characters.
    std::string url_encode(std::string_view value);

    // Like url_encode, but keeps '/' separators intact.
    std::string url_encode_path(std::string_view path);

    // "https://host/path?query" -> "https://host/path"; used to keep
    // pre-authorized session URLs out of logs.
    std::string strip_query(std::string_view url);

} // namespace ksau
