/**
 * @file observability.cpp
 * @brief spdlog-backed logger and Observer implementation.
 */
#include "warden/obs/observability.hpp"

#include <iostream>
#include <mutex>

#include <spdlog/sinks/ostream_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace warden::obs {

    namespace {

        constexpr const char* kPattern = "[%Y-%m-%d %H:%M:%S.%e] [%n:%P] [%^%l%$] %v";

        std::shared_ptr<spdlog::logger> make_process_logger() {
            auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
            auto lg = std::make_shared<spdlog::logger>("warden", std::move(sink));
            lg->set_pattern(kPattern);
            lg->set_level(spdlog::level::info);
            return lg;
        }

        // Not registered with spdlog's registry: the child replaces it without
        // touching any lock the parent may have held at fork time.
        std::shared_ptr<spdlog::logger>& logger_slot() {
            static std::shared_ptr<spdlog::logger> lg = make_process_logger();
            return lg;
        }

        class SimpleObserver : public Observer {
        public:
            void record(const LifecycleEvent& e) override {
                {
                    std::lock_guard<std::mutex> lk(mu_);
                    switch (e.kind) {
                        case EventKind::Started:        ctr_.starts++; break;
                        case EventKind::Stopped:        ctr_.stops++; break;
                        case EventKind::Restarted:      ctr_.restarts++; break;
                        case EventKind::Died:           ctr_.deaths++; break;
                        case EventKind::Degraded:       ctr_.degradations++; break;
                        case EventKind::Recovered:      ctr_.recoveries++; break;
                        case EventKind::RestartRefused: ctr_.restart_refusals++; break;
                        case EventKind::CallTimeout:    ctr_.call_timeouts++; break;
                        case EventKind::CallFailed:     ctr_.call_failures++; break;
                    }
                }
                const auto level = (e.kind == EventKind::Died || e.kind == EventKind::RestartRefused)
                    ? spdlog::level::err
                    : (e.kind == EventKind::Degraded || e.kind == EventKind::CallTimeout ||
                       e.kind == EventKind::CallFailed)
                        ? spdlog::level::warn
                        : spdlog::level::info;
                log().log(level,
                          R"({{"event":"{}","service":"{}","pid":{},"restarts":{},"detail":"{}"}})",
                          to_string(e.kind), e.service, e.pid, e.restart_count, e.detail);
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

    const char* to_string(EventKind k) noexcept {
        switch (k) {
            case EventKind::Started:        return "started";
            case EventKind::Stopped:        return "stopped";
            case EventKind::Restarted:      return "restarted";
            case EventKind::Died:           return "died";
            case EventKind::Degraded:       return "degraded";
            case EventKind::Recovered:      return "recovered";
            case EventKind::RestartRefused: return "restart_refused";
            case EventKind::CallTimeout:    return "call_timeout";
            case EventKind::CallFailed:     return "call_failed";
        }
        return "unknown";
    }

    std::unique_ptr<Observer> make_simple_observer() {
        return std::make_unique<SimpleObserver>();
    }

    spdlog::logger& log() {
        return *logger_slot();
    }

    void set_log_level(std::string_view level) {
        logger_slot()->set_level(spdlog::level::from_str(std::string(level)));
    }

    void reinit_for_child(std::string_view unit_name) {
        auto& slot = logger_slot();
        const auto level = slot ? slot->level() : spdlog::level::info;
        // Fresh sink, fresh mutex. The inherited logger is leaked on purpose:
        // its mutex may be locked by a thread that does not exist in this process.
        new std::shared_ptr<spdlog::logger>(std::move(slot));
        auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(std::cerr, true);
        auto lg = std::make_shared<spdlog::logger>(std::string(unit_name), std::move(sink));
        lg->set_pattern(kPattern);
        lg->set_level(level);
        slot = std::move(lg);
    }

} // namespace warden::obs
