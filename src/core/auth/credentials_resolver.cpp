/**
 * @file credentials_resolver.cpp
 */

#include "core/auth/credentials_resolver.h"
#include <cctype>
#include <cstdlib>

namespace uploadwatch::auth {

namespace {
inline std::string getenv_string(const std::string& key) {
    if (const char* v = std::getenv(key.c_str())) return std::string(v);
    return {};
}

inline std::string trim_ascii(std::string s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.pop_back();
    std::size_t i = 0;
    while (i < s.size() && std::isspace(static_cast<unsigned char>(s[i]))) ++i;
    return s.substr(i);
}
} // namespace

std::string resolve_bearer_token(const std::string& cli_token) {
    std::string token = trim_ascii(cli_token);
    if (token.empty()) {
        token = trim_ascii(getenv_string("UPLOADWATCH_ACCESS_TOKEN"));
    }
    // Tolerate a pasted "Bearer xyz" header value.
    if (token.rfind("Bearer ", 0) == 0) token = trim_ascii(token.substr(7));
    return token;
}

} // namespace uploadwatch::auth
