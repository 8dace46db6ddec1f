#pragma once
/**
 * @file config_loader.hpp
 * @brief Loader facade: JSON file → PipelineConfig, defaults when the file is absent.
 * @details All defaults reference named constants to avoid magic numbers.
 */

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include <nlohmann/json_fwd.hpp>

#include "tap/compat/expected.hpp"
#include "tap/config/constants.hpp"

namespace tap::config {

    /** @struct PipelineConfig
     *  @brief Knobs for the dispatcher and its deferred handoff.
     */
    struct PipelineConfig {
        std::size_t deferred_queue_capacity{constants::DEFERRED_QUEUE_CAPACITY}; ///< Ring slots (power of two)
        uint32_t    marker_timeout_ms{constants::MARKER_TIMEOUT_MS};             ///< Timeout stamped on new markers
        std::string log_level{constants::LOG_LEVEL_DEFAULT};                     ///< spdlog level name
    };

    /** @enum ConfigErr
     *  @brief Reasons a configuration source was rejected.
     */
    enum class ConfigErr : uint8_t {
        Unreadable = 1, ///< File exists but could not be read
        Malformed,      ///< Not JSON, or a field has the wrong type
        OutOfRange      ///< Value outside the accepted bounds
    };

    [[nodiscard]] std::string_view to_string(ConfigErr e) noexcept;

    /** @class Loader
     *  @brief Source of pipeline configuration (defaults or parsed files).
     */
    class Loader {
    public:
        /**
         * @brief Load configuration from a JSON file.
         * @param path File path. A missing file yields defaults.
         * @return PipelineConfig, or the reason the file was rejected.
         *
         * Recognised keys (all optional):
         * @code
         * { "deferred_queue_capacity": 1024, "marker_timeout_ms": 1800000, "log_level": "info" }
         * @endcode
         */
        static tap_detail::expected<PipelineConfig, ConfigErr> load_from_file(const std::string& path);

        /// Same rules as load_from_file, applied to an in-memory document.
        static tap_detail::expected<PipelineConfig, ConfigErr> load_from_json(const nlohmann::json& doc);
    };

} // namespace tap::config
