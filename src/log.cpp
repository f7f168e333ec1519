#include "stanza/log.hpp"

#include <atomic>
#include <cstdio>
#include <mutex>
#include <print>


namespace Stanza::log {

    namespace {

        std::atomic<level> g_Level{ level::warn };

        std::mutex& sink_mutex() {
            static std::mutex mutex;
            return mutex;
        }

        Sink& current_sink() {
            static Sink sink;
            return sink;
        }

        void stderr_sink(level l, std::string_view msg) {
            std::println(stderr, "[stanza] {}: {}", to_string(l), msg);
        }

    } // namespace

    void set_level(level l) noexcept { g_Level.store(l, std::memory_order_relaxed); }

    level get_level() noexcept { return g_Level.load(std::memory_order_relaxed); }

    bool enabled(level l) noexcept {
        level current = get_level();
        return current != level::off && l >= current && l != level::off;
    }

    void set_sink(Sink sink) {
        std::lock_guard lock{ sink_mutex() };
        current_sink() = std::move(sink);
    }

    void write(level l, std::string_view msg) {
        if (!enabled(l)) return;
        Sink sink;
        {
            std::lock_guard lock{ sink_mutex() };
            if (!current_sink()) {
                stderr_sink(l, msg);
                return;
            }
            sink = current_sink();
        }
        // Called unlocked so a sink may log in turn.
        sink(l, msg);
    }

    std::string_view to_string(level l) noexcept {
        switch (l) {
        case level::trace: return "trace";
        case level::debug: return "debug";
        case level::info: return "info";
        case level::warn: return "warn";
        case level::error: return "error";
        case level::off: return "off";
        }
        return "unknown";
    }

} // namespace Stanza::log
