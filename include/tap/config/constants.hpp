#pragma once
/**
 * @file constants.hpp
 * @brief Centralized named defaults for the packet pipeline.
 * @details These values eliminate magic numbers from the codebase. Override via the
 *          Config Loader (JSON) in deployments.
 */

#include <cstddef>
#include <cstdint>

namespace tap::config::constants {

// =====================
// Deferred (asynchronous) handoff ring
// =====================
/// Slots in the SPSC ring between the dispatch thread and the async worker.
/// Must be a power of two; one slot stays open, so usable depth is N-1.
inline constexpr std::size_t DEFERRED_QUEUE_CAPACITY = 1024;
/// Upper bound accepted from configuration files.
inline constexpr std::size_t DEFERRED_QUEUE_CAPACITY_MAX = 1u << 20;

// =====================
// Continuation markers
// =====================
inline constexpr uint32_t MARKER_TIMEOUT_MS       = 1800000; ///< 30 min, matches a slow async listener budget
inline constexpr uint32_t MARKER_TIMEOUT_MS_MAX   = 86400000; ///< 24 h
inline constexpr uint64_t MARKER_FIRST_SEQUENCE   = 1;       ///< 0 is never handed out

// =====================
// Persisted event record
// =====================
inline constexpr uint32_t EVENT_RECORD_FORMAT_VERSION = 1;

// =====================
// Session registry bounds
// =====================
inline constexpr std::size_t SESSION_REGISTRY_MAX_SESSIONS = 4096;
inline constexpr std::size_t SESSION_ID_MIN_LEN            = 2;
inline constexpr std::size_t SESSION_ID_MAX_LEN            = 64;

// =====================
// Logging
// =====================
inline constexpr const char* LOGGER_NAME       = "tap";
inline constexpr const char* LOG_LEVEL_DEFAULT = "info";

} // namespace tap::config::constants
