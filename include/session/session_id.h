/**
 * @file session_id.h
 * @brief Client-side identifiers for an upload and its stream connections.
 */

#pragma once

#include <string>

namespace uploadwatch::session {

// upload_<epoch_ms>_<9 base36 chars>. Shared by the synchronous upload request
// and the progress stream subscription.
std::string generate_correlation_id();

// session_<epoch_ms>_<9 base36 chars>. Fresh per connection attempt.
std::string generate_sub_session_id();

} // namespace uploadwatch::session
