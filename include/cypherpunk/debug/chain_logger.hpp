#pragma once

/**
 * @file chain_logger.hpp
 * @brief Debug tracing for chain resolution, layer construction and copies.
 *
 * Only hop names, positions and byte counts are printed. Message bodies and
 * key material never reach the log, but the chosen route of each copy does,
 * which is exactly what a remailer chain is meant to hide.
 * NEVER enable in builds that send real mail.
 *
 * Enable via CMake: -DCYPHERPUNK_DEBUG_CHAINS=ON
 */

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <string>
#include <string_view>
#include <vector>

namespace cypherpunk::debug {

// ============================================================================
// Stage identifiers - always defined so types are available
// ============================================================================

enum class Stage {
    Resolve,
    Envelope,
    Encrypt,
    Multiplex
};

#ifdef CYPHERPUNK_DEBUG_CHAINS

inline const char* StageToString(const Stage stage) {
    switch (stage) {
        case Stage::Resolve: return "RESOLVE";
        case Stage::Envelope: return "ENVELOPE";
        case Stage::Encrypt: return "ENCRYPT";
        case Stage::Multiplex: return "MULTIPLEX";
        default: return "UNKNOWN";
    }
}

inline std::string JoinNames(const std::vector<std::string>& names) {
    std::string joined;
    for (const auto& name : names) {
        if (!joined.empty()) {
            joined += " -> ";
        }
        joined += name;
    }
    return joined;
}

// ============================================================================
// Core logging macros
// ============================================================================

#define CPK_LOG_VALUE(stage, operation, name, value) \
    do { \
        fprintf(stderr, "[CPK-DEBUG] %s %s %s: %s\n", \
            ::cypherpunk::debug::StageToString(stage), \
            operation, \
            name, \
            std::to_string(value).c_str()); \
        fflush(stderr); \
    } while(0)

#define CPK_LOG_MSG(stage, operation, message) \
    do { \
        fprintf(stderr, "[CPK-DEBUG] %s %s %s\n", \
            ::cypherpunk::debug::StageToString(stage), \
            operation, \
            message); \
        fflush(stderr); \
    } while(0)

#define CPK_LOG_SECTION(stage, section_name) \
    do { \
        fprintf(stderr, "[CPK-DEBUG] %s ========== %s ==========\n", \
            ::cypherpunk::debug::StageToString(stage), \
            section_name); \
        fflush(stderr); \
    } while(0)

// ============================================================================
// Resolution Logging
// ============================================================================

inline void LogWildcardDraw(
    const size_t position,
    const size_t candidates,
    std::string_view chosen,
    const bool repeated) {

    char msg[160];
    snprintf(msg, sizeof(msg), "position %zu drew '%.*s' from %zu candidates%s",
        position, static_cast<int>(chosen.size()), chosen.data(), candidates,
        repeated ? " (repeat, degraded)" : "");
    CPK_LOG_MSG(Stage::Resolve, "WILDCARD", msg);
}

inline void LogChainResolved(const std::vector<std::string>& hops, const bool degraded) {
    CPK_LOG_MSG(Stage::Resolve, "CHAIN", JoinNames(hops).c_str());
    if (degraded) {
        CPK_LOG_MSG(Stage::Resolve, "CHAIN", "degraded: YES");
    }
}

// ============================================================================
// Layer Logging
// ============================================================================

inline void LogLayer(
    std::string_view hop,
    const size_t position,
    const size_t plaintext_size,
    const size_t ciphertext_size) {

    char msg[160];
    snprintf(msg, sizeof(msg), "hop %zu '%.*s' plaintext=%zu ciphertext=%zu",
        position, static_cast<int>(hop.size()), hop.data(), plaintext_size, ciphertext_size);
    CPK_LOG_MSG(Stage::Encrypt, "LAYER", msg);
}

// ============================================================================
// Copy Logging
// ============================================================================

inline void LogCopyStarted(const size_t copy_index, const bool parallel) {
    char msg[64];
    snprintf(msg, sizeof(msg), "copy %zu started (%s)", copy_index, parallel ? "parallel" : "sequential");
    CPK_LOG_MSG(Stage::Multiplex, "COPY", msg);
}

inline void LogCopyFinished(const size_t copy_index, std::string_view outcome) {
    char msg[160];
    snprintf(msg, sizeof(msg), "copy %zu: %.*s",
        copy_index, static_cast<int>(outcome.size()), outcome.data());
    CPK_LOG_MSG(Stage::Multiplex, "COPY", msg);
}

#else // !CYPHERPUNK_DEBUG_CHAINS

#define CPK_LOG_VALUE(stage, operation, name, value) ((void)0)
#define CPK_LOG_MSG(stage, operation, message) ((void)0)
#define CPK_LOG_SECTION(stage, section_name) ((void)0)

inline void LogWildcardDraw(size_t, size_t, std::string_view, bool) {}
inline void LogChainResolved(const std::vector<std::string>&, bool) {}
inline void LogLayer(std::string_view, size_t, size_t, size_t) {}
inline void LogCopyStarted(size_t, bool) {}
inline void LogCopyFinished(size_t, std::string_view) {}

#endif // CYPHERPUNK_DEBUG_CHAINS

} // namespace cypherpunk::debug
