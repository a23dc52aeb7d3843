#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace uploadwatch {
namespace utils {

/**
 * @brief Convert string to lowercase ASCII
 */
std::string to_lower_ascii(std::string_view input);

/**
 * @brief Case-insensitive substring test (ASCII)
 */
bool contains_ci(std::string_view haystack, std::string_view needle);

/**
 * @brief Percent-encode a query-string component (RFC 3986 unreserved set kept)
 */
std::string url_encode(std::string_view input);

/**
 * @brief Replace the value of every `token=` query parameter with `***`
 */
std::string mask_token_in_url(std::string_view url);

/**
 * @brief Strip trailing '/' characters
 */
std::string trim_trailing_slash(std::string_view url);

/**
 * @brief Map an http(s) base URL to its ws(s) counterpart
 * @return nullopt when the scheme is neither http nor https
 */
std::optional<std::string> derive_ws_base_url(std::string_view api_url);

/**
 * @brief Last path component of a filesystem path
 */
std::string base_name(std::string_view path);

} // namespace utils
} // namespace uploadwatch
