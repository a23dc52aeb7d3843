#include "utils/string_utils.h"
#include <algorithm>
#include <cctype>

namespace uploadwatch {
namespace utils {

std::string to_lower_ascii(std::string_view input) {
    std::string out(input.begin(), input.end());
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

bool contains_ci(std::string_view haystack, std::string_view needle) {
    if (needle.empty()) return true;
    return to_lower_ascii(haystack).find(to_lower_ascii(needle)) != std::string::npos;
}

std::string url_encode(std::string_view input) {
    static const char* kHex = "0123456789ABCDEF";
    std::string out;
    out.reserve(input.size());
    for (unsigned char c : input) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back('%');
            out.push_back(kHex[c >> 4]);
            out.push_back(kHex[c & 0x0F]);
        }
    }
    return out;
}

std::string mask_token_in_url(std::string_view url) {
    std::string out(url.begin(), url.end());
    static constexpr std::string_view kKey = "token=";
    std::size_t pos = 0;
    while ((pos = out.find(kKey, pos)) != std::string::npos) {
        // Only match a whole parameter name, not e.g. "csrf_token=".
        if (pos != 0 && out[pos - 1] != '?' && out[pos - 1] != '&') {
            pos += kKey.size();
            continue;
        }
        const std::size_t value_begin = pos + kKey.size();
        std::size_t value_end = out.find('&', value_begin);
        if (value_end == std::string::npos) value_end = out.size();
        out.replace(value_begin, value_end - value_begin, "***");
        pos = value_begin + 3;
    }
    return out;
}

std::string trim_trailing_slash(std::string_view url) {
    std::string out(url.begin(), url.end());
    while (!out.empty() && out.back() == '/') out.pop_back();
    return out;
}

std::optional<std::string> derive_ws_base_url(std::string_view api_url) {
    const std::string trimmed = trim_trailing_slash(api_url);
    const std::string lower = to_lower_ascii(trimmed);
    if (lower.rfind("https://", 0) == 0) return "wss://" + trimmed.substr(8);
    if (lower.rfind("http://", 0) == 0) return "ws://" + trimmed.substr(7);
    return std::nullopt;
}

std::string base_name(std::string_view path) {
    auto slash = path.find_last_of("/\\");
    if (slash == std::string_view::npos) return std::string(path);
    return std::string(path.substr(slash + 1));
}

} // namespace utils
} // namespace uploadwatch
