/**
 * @file credentials_resolver.h
 * @brief Resolves the bearer token used for the upload API and progress stream.
 */

#pragma once

#include <string>

namespace uploadwatch::auth {

// CLI value wins, else UPLOADWATCH_ACCESS_TOKEN. Empty result means the
// session runs unauthenticated.
std::string resolve_bearer_token(const std::string& cli_token);

} // namespace uploadwatch::auth
