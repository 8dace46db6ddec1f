/**
* @file config_loader.cpp
 * @brief nlohmann::json-backed loader with range validation.
 */
#include "tap/config/config_loader.hpp"
#include "tap/obs/observability.hpp"

#include <filesystem>
#include <fstream>

#include <nlohmann/json.hpp>

namespace tap::config {
    using namespace tap::config::constants;

    std::string_view to_string(ConfigErr e) noexcept {
        switch (e) {
            case ConfigErr::Unreadable: return "unreadable";
            case ConfigErr::Malformed:  return "malformed";
            case ConfigErr::OutOfRange: return "out_of_range";
        }
        return "unknown";
    }

    static bool is_pow2(std::size_t v) noexcept { return v != 0 && (v & (v - 1)) == 0; }

    /// Integer field → value; Malformed for non-integers, OutOfRange for negatives.
    static tap_detail::expected<uint64_t, ConfigErr> read_count(const nlohmann::json& v) {
        if (v.is_number_unsigned()) return v.get<uint64_t>();
        if (!v.is_number_integer()) return tap_detail::unexpected(ConfigErr::Malformed);
        const auto s = v.get<int64_t>();
        if (s < 0) return tap_detail::unexpected(ConfigErr::OutOfRange);
        return static_cast<uint64_t>(s);
    }

    tap_detail::expected<PipelineConfig, ConfigErr> Loader::load_from_json(const nlohmann::json& doc) {
        if (!doc.is_object()) return tap_detail::unexpected(ConfigErr::Malformed);

        PipelineConfig pc;
        if (auto it = doc.find("deferred_queue_capacity"); it != doc.end()) {
            auto v = read_count(*it);
            if (!v) return tap_detail::unexpected(v.error());
            if (*v > DEFERRED_QUEUE_CAPACITY_MAX) return tap_detail::unexpected(ConfigErr::OutOfRange);
            pc.deferred_queue_capacity = static_cast<std::size_t>(*v);
        }
        if (auto it = doc.find("marker_timeout_ms"); it != doc.end()) {
            auto v = read_count(*it);
            if (!v) return tap_detail::unexpected(v.error());
            if (*v == 0 || *v > MARKER_TIMEOUT_MS_MAX) return tap_detail::unexpected(ConfigErr::OutOfRange);
            pc.marker_timeout_ms = static_cast<uint32_t>(*v);
        }
        if (auto it = doc.find("log_level"); it != doc.end()) {
            if (!it->is_string()) return tap_detail::unexpected(ConfigErr::Malformed);
            pc.log_level = it->get<std::string>();
        }

        // The ring keeps one slot open, so 2 is the smallest useful size.
        if (pc.deferred_queue_capacity < 2 || !is_pow2(pc.deferred_queue_capacity)) {
            return tap_detail::unexpected(ConfigErr::OutOfRange);
        }
        if (!obs::is_valid_log_level(pc.log_level)) return tap_detail::unexpected(ConfigErr::OutOfRange);
        return pc;
    }

    tap_detail::expected<PipelineConfig, ConfigErr> Loader::load_from_file(const std::string& path) {
        std::error_code ec;
        if (!std::filesystem::exists(path, ec)) {
            obs::logger()->info("config '{}' not found; using defaults", path);
            return PipelineConfig{};
        }

        std::ifstream in(path);
        if (!in) return tap_detail::unexpected(ConfigErr::Unreadable);

        // allow_exceptions=false: parse errors come back as a discarded value.
        const auto doc = nlohmann::json::parse(in, nullptr, /*allow_exceptions=*/false);
        if (doc.is_discarded()) {
            obs::logger()->error("config '{}' is not valid JSON", path);
            return tap_detail::unexpected(ConfigErr::Malformed);
        }

        auto pc = load_from_json(doc);
        if (!pc) obs::logger()->error("config '{}' rejected: {}", path, to_string(pc.error()));
        return pc;
    }

} // namespace tap::config
