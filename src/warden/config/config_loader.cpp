/**
 * @file config_loader.cpp
 * @brief Text-format settings parser on top of the named defaults.
 */
#include "warden/config/config_loader.hpp"

#include <fstream>
#include <sstream>

#include <google/protobuf/io/tokenizer.h>
#include <google/protobuf/text_format.h>

#include "settings.pb.h"
#include "warden/config/constants.hpp"

namespace warden::config {

    namespace {

        // Collects parser diagnostics instead of letting protobuf print them.
        class ErrorCollector : public google::protobuf::io::ErrorCollector {
        public:
            void AddError(int line, google::protobuf::io::ColumnNumber column,
                          const std::string& message) override {
                if (!text_.empty()) text_ += "; ";
                text_ += "line " + std::to_string(line + 1) + ":" + std::to_string(column + 1) +
                         ": " + message;
            }
            const std::string& text() const noexcept { return text_; }
        private:
            std::string text_;
        };

        bool is_pow2(uint32_t v) noexcept { return v >= 2 && (v & (v - 1)) == 0; }

        void apply(const warden::settings::Settings& in, Settings& out) {
            const auto& m = in.monitor();
            if (m.has_check_interval_ms()) out.monitor.check_interval_ms = m.check_interval_ms();
            if (m.has_slow_after_ms())     out.monitor.slow_after_ms     = m.slow_after_ms();
            if (m.has_dead_after_ms())     out.monitor.dead_after_ms     = m.dead_after_ms();
            if (m.has_auto_restart())      out.monitor.auto_restart      = m.auto_restart();

            const auto& s = in.supervisor();
            if (s.has_max_restarts())          out.supervisor.max_restarts          = s.max_restarts();
            if (s.has_startup_grace_ms())      out.supervisor.startup_grace_ms      = s.startup_grace_ms();
            if (s.has_drain_timeout_ms())      out.supervisor.drain_timeout_ms      = s.drain_timeout_ms();
            if (s.has_heartbeat_interval_ms()) out.supervisor.heartbeat_interval_ms = s.heartbeat_interval_ms();
            if (s.has_call_timeout_ms())       out.supervisor.call_timeout_ms       = s.call_timeout_ms();
            if (s.has_inbox_capacity())        out.supervisor.inbox_capacity        = s.inbox_capacity();
            if (s.has_slot_bytes())            out.supervisor.slot_bytes            = s.slot_bytes();

            if (in.has_log_level()) out.log_level = in.log_level();
        }

    } // namespace

    Result<void> Loader::validate(const Settings& s) {
        const auto& m  = s.monitor;
        const auto& sv = s.supervisor;
        if (m.check_interval_ms == 0) {
            return make_error(ErrorCode::ConfigError, "monitor.check_interval_ms must be > 0");
        }
        if (m.slow_after_ms >= m.dead_after_ms) {
            return make_error(ErrorCode::ConfigError,
                              "monitor.slow_after_ms (" + std::to_string(m.slow_after_ms) +
                                  ") must be below dead_after_ms (" + std::to_string(m.dead_after_ms) + ")");
        }
        if (sv.heartbeat_interval_ms == 0 || sv.heartbeat_interval_ms >= m.slow_after_ms) {
            return make_error(ErrorCode::ConfigError,
                              "supervisor.heartbeat_interval_ms (" + std::to_string(sv.heartbeat_interval_ms) +
                                  ") must be in (0, slow_after_ms)");
        }
        if (!is_pow2(sv.inbox_capacity)) {
            return make_error(ErrorCode::ConfigError,
                              "supervisor.inbox_capacity must be a power of two >= 2, got " +
                                  std::to_string(sv.inbox_capacity));
        }
        if (sv.slot_bytes < 256) {
            return make_error(ErrorCode::ConfigError, "supervisor.slot_bytes must be at least 256");
        }
        if (sv.call_timeout_ms == 0 || sv.startup_grace_ms == 0) {
            return make_error(ErrorCode::ConfigError, "timeouts must be > 0");
        }
        return {};
    }

    Result<Settings> Loader::load_from_string(const std::string& text) {
        warden::settings::Settings parsed;
        ErrorCollector errors;
        google::protobuf::TextFormat::Parser parser;
        parser.RecordErrorsTo(&errors);
        if (!parser.ParseFromString(text, &parsed)) {
            return make_error(ErrorCode::ConfigError,
                              errors.text().empty() ? std::string("unparsable settings") : errors.text());
        }

        Settings out; // named defaults
        apply(parsed, out);
        if (auto ok = validate(out); !ok) return make_error(ok.error().code, ok.error().detail);
        return out;
    }

    Result<Settings> Loader::load_from_file(const std::string& path) {
        if (path.empty()) return Settings{};

        std::ifstream in(path);
        if (!in) return make_error(ErrorCode::ConfigError, "cannot open settings file '" + path + "'");
        std::ostringstream buf;
        buf << in.rdbuf();

        auto s = load_from_string(buf.str());
        if (!s) return make_error(s.error().code, path + ": " + s.error().detail);
        return s;
    }

} // namespace warden::config
