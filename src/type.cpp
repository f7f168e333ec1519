#include "stanza/type.hpp"

#include <cstdlib>
#include <memory>

#if defined(__GNUG__)
#include <cxxabi.h>
#endif

namespace Stanza {

    std::string_view to_string(type_kind k) noexcept {
        switch (k) {
        case type_kind::unspecified: return "unspecified";
        case type_kind::raw: return "raw";
        case type_kind::boolean: return "boolean";
        case type_kind::integer: return "integer";
        case type_kind::floating: return "floating";
        case type_kind::string: return "string";
        case type_kind::decimal: return "decimal";
        case type_kind::list: return "list";
        case type_kind::set: return "set";
        case type_kind::map: return "map";
        case type_kind::enumeration: return "enumeration";
        case type_kind::object: return "object";
        case type_kind::optional: return "optional";
        case type_kind::union_: return "union";
        }
        return "unknown";
    }

    namespace detail {

        std::string demangle(const char* mangled) {
#if defined(__GNUG__)
            int status = 0;
            std::unique_ptr<char, void (*)(void*)> result{
                abi::__cxa_demangle(mangled, nullptr, nullptr, &status), std::free };
            if (result && status == 0) return result.get();
#endif
            return mangled;
        }

    } // namespace detail

} // namespace Stanza
