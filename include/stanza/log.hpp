#pragma once

#include <cstdint>
#include <format>
#include <functional>
#include <string_view>
#include <utility>

#include "stanza/config.hpp"

/// @defgroup StanzaLog Logging
/// @ingroup Stanza
/// @brief Library diagnostics with a replaceable sink
///
/// @details
/// Stanza logs model builds at `debug` and configuration failures at `warn`.
/// Conversion failures are returned to the caller, not logged. The default
/// level is `warn` and the default sink prints to stderr.
namespace Stanza::log {

    enum class level : uint8_t {
        trace,
        debug,
        info,
        warn,
        error,
        off,
    };

    /// @ingroup StanzaLog
    /// @brief Receives every message at or above the current level.
    using Sink = std::function<void(level, std::string_view)>;

    STANZA_API void set_level(level l) noexcept;
    [[nodiscard]] STANZA_API level get_level() noexcept;
    [[nodiscard]] STANZA_API bool enabled(level l) noexcept;

    /// @ingroup StanzaLog
    /// @brief Replaces the sink; an empty sink restores the stderr default.
    STANZA_API void set_sink(Sink sink);

    /// @ingroup StanzaLog
    /// @brief Hands @p msg to the sink if @p l is enabled.
    ///
    /// @details
    /// Writes to the stderr default are serialized. A user sink is called
    /// without the logger's lock held, so it may log itself but must be
    /// safe to call from several threads at once.
    STANZA_API void write(level l, std::string_view msg);

    [[nodiscard]] STANZA_API std::string_view to_string(level l) noexcept;

    template<typename... Args>
    void trace(std::format_string<Args...> fmt, Args&&... args) {
        if (enabled(level::trace)) write(level::trace, std::format(fmt, std::forward<Args>(args)...));
    }

    template<typename... Args>
    void debug(std::format_string<Args...> fmt, Args&&... args) {
        if (enabled(level::debug)) write(level::debug, std::format(fmt, std::forward<Args>(args)...));
    }

    template<typename... Args>
    void info(std::format_string<Args...> fmt, Args&&... args) {
        if (enabled(level::info)) write(level::info, std::format(fmt, std::forward<Args>(args)...));
    }

    template<typename... Args>
    void warn(std::format_string<Args...> fmt, Args&&... args) {
        if (enabled(level::warn)) write(level::warn, std::format(fmt, std::forward<Args>(args)...));
    }

    template<typename... Args>
    void error(std::format_string<Args...> fmt, Args&&... args) {
        if (enabled(level::error)) write(level::error, std::format(fmt, std::forward<Args>(args)...));
    }

} // namespace Stanza::log
