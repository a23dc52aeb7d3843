/**
 * @file session_id.cpp
 */

#include "session/session_id.h"

#include <chrono>
#include <random>
#include <sstream>

namespace uploadwatch::session {

namespace {

constexpr int kRandomSuffixLen = 9;

std::string make_id(const char* prefix) {
    static thread_local std::mt19937_64 rng{std::random_device{}()};
    static constexpr char kAlphabet[] = "0123456789abcdefghijklmnopqrstuvwxyz";
    std::uniform_int_distribution<int> dist(0, 35);

    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();

    std::ostringstream oss;
    oss << prefix << "_" << ms << "_";
    for (int i = 0; i < kRandomSuffixLen; ++i) {
        oss << kAlphabet[dist(rng)];
    }
    return oss.str();
}

} // namespace

std::string generate_correlation_id() {
    return make_id("upload");
}

std::string generate_sub_session_id() {
    return make_id("session");
}

} // namespace uploadwatch::session
