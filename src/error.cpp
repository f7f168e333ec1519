#include "stanza/error.hpp"

#include <format>
#include <utility>

namespace Stanza {

    Error Error::make(code c, std::string_view m) {
        Error e;
        e.errc = c;
        e.msg.assign(m.begin(), m.end());
        return e;
    }

    Error Error::configuration(std::string_view owner, std::string_view m) {
        Error e = make(code::configuration, m);
        e.owner.assign(owner.begin(), owner.end());
        return e;
    }

    Error Error::missing_field(std::string_view owner, std::string_view field) {
        Error e = make(code::missing_field, std::format("required field \"{}\" is missing", field));
        e.owner.assign(owner.begin(), owner.end());
        e.path = std::format(".{}", field);
        return e;
    }

    Error Error::type_mismatch(std::string rendered, std::string_view m) {
        Error e = make(code::type_mismatch, m);
        e.value = std::move(rendered);
        return e;
    }

    Error& Error::at_field(std::string_view owning_class, std::string_view field) {
        path.insert(0, std::format(".{}", field));
        if (owner.empty()) owner.assign(owning_class.begin(), owning_class.end());
        return *this;
    }

    Error& Error::at_index(std::size_t idx) {
        path.insert(0, std::format("[{}]", idx));
        return *this;
    }

    Error& Error::at_key(std::string_view key) {
        path.insert(0, std::format("[\"{}\"]", key));
        return *this;
    }

    std::string Error::what() const {
        std::string out = std::format("{} at ${}", to_string(errc), path);
        if (!owner.empty()) out += std::format(" in {}", owner);
        out += std::format(": {}", msg);
        if (!value.empty()) out += std::format(" (got {})", value);
        return out;
    }

    std::string_view to_string(Error::code c) noexcept {
        switch (c) {
        case Error::code::configuration: return "configuration";
        case Error::code::missing_field: return "missing_field";
        case Error::code::type_mismatch: return "type_mismatch";
        }
        return "unknown";
    }

} // namespace Stanza
