#pragma once

#include "stanza/stanza.hpp"

#include <initializer_list>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace test {

    // Builds a JSON object from key/value pairs.
    inline Stanza::value obj(std::initializer_list<std::pair<std::string_view, Stanza::value>> members) {
        Stanza::value v;
        auto& o = v.as_object();
        for (const auto& [key, member] : members) {
            o.insert_or_assign(Stanza::string{ key, v.resource() }, member);
        }
        return v;
    }

    // Builds a JSON array.
    inline Stanza::value arr(std::initializer_list<Stanza::value> items) {
        Stanza::value v;
        auto& a = v.as_array();
        for (const auto& item : items) a.push_back(item);
        return v;
    }

    // Collects log output for the lifetime of the capture and restores the defaults afterwards.
    struct LogCapture {
        std::vector<std::pair<Stanza::log::level, std::string>> lines;

        explicit LogCapture(Stanza::log::level l = Stanza::log::level::trace) {
            Stanza::log::set_level(l);
            Stanza::log::set_sink([this](Stanza::log::level lvl, std::string_view msg) {
                lines.emplace_back(lvl, std::string{ msg });
            });
        }

        ~LogCapture() {
            Stanza::log::set_sink({});
            Stanza::log::set_level(Stanza::log::level::warn);
        }

        LogCapture(const LogCapture&) = delete;
        LogCapture& operator=(const LogCapture&) = delete;

        [[nodiscard]] bool contains(std::string_view needle) const {
            for (const auto& [lvl, msg] : lines) {
                if (msg.find(needle) != std::string::npos) return true;
            }
            return false;
        }
    };

} // namespace test
