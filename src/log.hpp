#pragma once

// Internal logging helpers. Stanza logs through the kcenon common_system
// logger registry under the name "stanza", falling back to the registry's
// default logger when no named logger is registered.

#include <cstdint>
#include <format>
#include <string>
#include <string_view>
#include <utility>

namespace Stanza::detail::log {

    enum class level : uint8_t {
        trace,
        debug,
        info,
        warning,
        error,
    };

    [[nodiscard]] bool enabled(level lvl);
    void write(level lvl, std::string_view msg);

    template<typename... Args>
    void emit(level lvl, std::format_string<Args...> fmt, Args&&... args) {
        if (!enabled(lvl)) return;
        write(lvl, std::format(fmt, std::forward<Args>(args)...));
    }

    template<typename... Args>
    void debug(std::format_string<Args...> fmt, Args&&... args) {
        emit(level::debug, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void warning(std::format_string<Args...> fmt, Args&&... args) {
        emit(level::warning, fmt, std::forward<Args>(args)...);
    }

} // namespace Stanza::detail::log
