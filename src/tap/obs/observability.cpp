/**
* @file observability.cpp
 * @brief spdlog-backed implementation of Observer.
 */
#include "tap/obs/observability.hpp"
#include "tap/config/constants.hpp"

#include <array>
#include <mutex>

#include <nlohmann/json.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace tap::obs {

    namespace {

    constexpr std::array<std::string_view, 7> kLevels{
        "trace", "debug", "info", "warn", "error", "critical", "off"};

    class LogObserver final : public Observer {
    public:
        void record(const DispatchRecord& r) override {
            {
                std::lock_guard<std::mutex> lk(mu_);
                ctr_.dispatched++;
                switch (r.outcome) {
                    case pipeline::DispatchOutcome::Delivered:       ctr_.delivered++;        break;
                    case pipeline::DispatchOutcome::Cancelled:       ctr_.cancelled++;        break;
                    case pipeline::DispatchOutcome::Deferred:        ctr_.deferred++;         break;
                    case pipeline::DispatchOutcome::DeferredDropped: ctr_.deferred_dropped++; break;
                }
            }
            const auto lvl = r.outcome == pipeline::DispatchOutcome::DeferredDropped
                                 ? spdlog::level::warn
                                 : spdlog::level::debug;
            logger()->log(lvl, "{}", format_record(r));
        }

        void marker_rejected(uint64_t sequence) override {
            {
                std::lock_guard<std::mutex> lk(mu_);
                ctr_.marker_rejections++;
            }
            logger()->warn("continuation marker is frozen on asynchronous event (seq={})", sequence);
        }

        void actor_unresolved(const session::ActorSnapshot& snapshot) override {
            {
                std::lock_guard<std::mutex> lk(mu_);
                ctr_.actor_resolution_failures++;
            }
            logger()->warn("actor '{}' did not resolve; event restored without actor", snapshot.id);
        }

        Counters snapshot() const override {
            std::lock_guard<std::mutex> lk(mu_);
            return ctr_;
        }

    private:
        mutable std::mutex mu_;
        Counters ctr_;
    };

    } // namespace

    std::string format_record(const DispatchRecord& r) {
        nlohmann::json line;
        line["seq"]       = r.sequence;
        line["packet_id"] = r.packet_id ? nlohmann::json(*r.packet_id) : nlohmann::json(nullptr);
        line["direction"] = r.direction ? nlohmann::json(std::string(events::to_string(*r.direction)))
                                        : nlohmann::json(nullptr);
        line["outcome"]   = std::string(pipeline::to_string(r.outcome));
        line["actor"]     = r.actor_id.empty() ? nlohmann::json(nullptr) : nlohmann::json(r.actor_id);
        line["reason"]    = r.reason;
        // Session ids are not validated outside the registry; never throw on bad UTF-8.
        return line.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    }

    Observer* make_log_observer() {
        static LogObserver obs; // process-wide singleton
        return &obs;
    }

    std::unique_ptr<Observer> make_counting_observer() {
        return std::make_unique<LogObserver>();
    }

    std::shared_ptr<spdlog::logger> logger() {
        static std::shared_ptr<spdlog::logger> lg = [] {
            if (auto existing = spdlog::get(config::constants::LOGGER_NAME)) return existing;
            return spdlog::stdout_color_mt(config::constants::LOGGER_NAME);
        }();
        return lg;
    }

    bool is_valid_log_level(std::string_view level) noexcept {
        for (auto l : kLevels) if (l == level) return true;
        return false;
    }

    bool set_log_level(std::string_view level) {
        if (!is_valid_log_level(level)) return false;
        logger()->set_level(spdlog::level::from_str(std::string(level)));
        return true;
    }

} // namespace tap::obs
