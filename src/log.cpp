#include "log.hpp"

#include <kcenon/common/interfaces/global_logger_registry.h>
#include <kcenon/common/interfaces/logger_interface.h>

#include <memory>


namespace Stanza::detail::log {

    namespace {
        namespace kc = kcenon::common::interfaces;

        constexpr std::string_view logger_name = "stanza";

        kc::log_level map_level(level lvl) noexcept {
            switch (lvl) {
            case level::trace:   return kc::log_level::trace;
            case level::debug:   return kc::log_level::debug;
            case level::info:    return kc::log_level::info;
            case level::warning: return kc::log_level::warning;
            case level::error:   return kc::log_level::error;
            }
            return kc::log_level::info;
        }

        std::shared_ptr<kc::ILogger> current_logger() {
            auto& registry = kc::GlobalLoggerRegistry::instance();
            auto logger = registry.get_logger(std::string{ logger_name });
            if (logger && logger != kc::GlobalLoggerRegistry::null_logger()) return logger;
            auto fallback = registry.get_default_logger();
            if (fallback) return fallback;
            return kc::GlobalLoggerRegistry::null_logger();
        }
    } // namespace

    bool enabled(level lvl) {
        return current_logger()->is_enabled(map_level(lvl));
    }

    void write(level lvl, std::string_view msg) {
        auto logger = current_logger();
        std::string formatted;
        formatted.reserve(msg.size() + 9);
        formatted += "[stanza] ";
        formatted += msg;
        // Log failures do not affect serialization results.
        (void)logger->log(map_level(lvl), formatted);
    }

} // namespace Stanza::detail::log
