#pragma once


/*
    -----------------------------------------------------------
    Stanza::TypeDescriptor - Tagged description of a declared type
    -----------------------------------------------------------
    A `TypeDescriptor` says what a declared field type looks like to the
    converter provider, independent of the C++ type system:

        kind        | C++ types                                      | arguments
        ------------|------------------------------------------------|-----------------
        raw         | Stanza::value                                  | -
        boolean     | bool                                           | -
        integer     | integral types other than bool                 | -
        floating    | float, double, long double                     | -
        string      | std::string                                    | -
        decimal     | Stanza::decimal                                | -
        list        | std::vector, std::list, std::deque             | element
        set         | std::set, std::unordered_set                   | element
        map         | std::map / std::unordered_map keyed by string  | mapped value
        enumeration | enum and enum class types                      | -
        object      | any other class type                           | -
        optional    | std::optional<T>                               | T
        union_      | std::variant<A, B, ...>                        | A, B, ...

    `describe<T>()` derives the descriptor at compile time. Besides the kind
    and its arguments, each descriptor carries the type-erased hooks the
    runtime converters need to assemble a value of the exact C++ type from
    already-converted parts (`std::any` holding the element types).

    `unspecified` is the kind of a default-constructed descriptor; the model
    builder rejects fields declared with it.
*/

#include <any>
#include <cmath>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <limits>
#include <list>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <type_traits>
#include <typeindex>
#include <typeinfo>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <variant>
#include <vector>

#include <boost/multiprecision/cpp_dec_float.hpp>

#include "stanza/config.hpp"
#include "stanza/value.hpp"

/// @defgroup StanzaType Type Descriptors
/// @ingroup Stanza
/// @brief Run-time description of declared field types

namespace Stanza {

    /// @ingroup StanzaType
    /// @brief Decimal number type produced by the Decimal converter (50 significant digits).
    using decimal = boost::multiprecision::cpp_dec_float_50;

    /// @ingroup StanzaType
    /// @brief Shape of a declared type.
    enum class type_kind : uint8_t {
        unspecified,
        raw,
        boolean,
        integer,
        floating,
        string,
        decimal,
        list,
        set,
        map,
        enumeration,
        object,
        optional,
        union_,
    };

    /// @ingroup StanzaType
    /// @brief Returns the lowercase name of a type kind.
    [[nodiscard]] STANZA_API std::string_view to_string(type_kind k) noexcept;

    /// @ingroup StanzaType
    /// @brief Tagged-variant description of a declared type.
    struct TypeDescriptor {
        type_kind kind = type_kind::unspecified;      ///< Shape of the type.
        std::type_index type = typeid(void);          ///< Exact C++ type.
        std::string name{};                           ///< Display name for diagnostics.
        std::vector<TypeDescriptor> arguments{};      ///< Element, mapped or alternative types.

        double lower = 0.0; ///< integer: smallest accepted value.
        double upper = 0.0; ///< integer: first rejected value above the range.

        /// raw, boolean, integer, floating, string: boxes an already shape-checked JSON scalar.
        std::function<std::any(const value&)> make_scalar{};
        /// list, set: builds the container from converted elements.
        std::function<std::any(std::vector<std::any>&&)> make_sequence{};
        /// map: builds the container from keys and converted values.
        std::function<std::any(std::vector<std::pair<std::string, std::any>>&&)> make_mapping{};
        /// union_: wraps the converted value of alternative `index` into the variant.
        std::function<std::any(std::size_t, std::any&&)> make_alternative{};
        /// optional: wraps a converted value, or nothing, into the optional.
        std::function<std::any(std::optional<std::any>&&)> make_optional{};
    };

    namespace detail {

        /// @brief Demangles a `typeid(...).name()` string; returns it unchanged when that fails.
        [[nodiscard]] STANZA_API std::string demangle(const char* mangled);

        template<class T>
        [[nodiscard]] std::string type_name() {
            if constexpr (std::same_as<T, std::string>) return "string";
            else return demangle(typeid(T).name());
        }

        template<class T> struct is_optional : std::false_type {};
        template<class T> struct is_optional<std::optional<T>> : std::true_type {};

        template<class T> struct is_variant : std::false_type {};
        template<class... Ts> struct is_variant<std::variant<Ts...>> : std::true_type {};

        template<class T> struct is_sequence : std::false_type {};
        template<class T, class A> struct is_sequence<std::vector<T, A>> : std::true_type {};
        template<class T, class A> struct is_sequence<std::list<T, A>> : std::true_type {};
        template<class T, class A> struct is_sequence<std::deque<T, A>> : std::true_type {};

        template<class T> struct is_set : std::false_type {};
        template<class T, class C, class A> struct is_set<std::set<T, C, A>> : std::true_type {};
        template<class T, class H, class E, class A> struct is_set<std::unordered_set<T, H, E, A>> : std::true_type {};

        template<class T> struct is_string_map : std::false_type {};
        template<class V, class C, class A> struct is_string_map<std::map<std::string, V, C, A>> : std::true_type {};
        template<class V, class H, class E, class A> struct is_string_map<std::unordered_map<std::string, V, H, E, A>> : std::true_type {};

        template<class> inline constexpr bool dependent_false = false;

        template<class V, std::size_t... I>
        std::any make_variant(std::size_t index, std::any&& part, std::index_sequence<I...>) {
            std::any out;
            ((index == I
                ? (void)(out = V{ std::in_place_index<I>, std::any_cast<std::variant_alternative_t<I, V>>(std::move(part)) })
                : void()), ...);
            return out;
        }

    } // namespace detail

    /// @ingroup StanzaType
    /// @brief Derives the descriptor of @p T.
    ///
    /// @details
    /// Class types that are not one of the recognized containers are
    /// described as `object`; whether they can actually be converted is
    /// decided later, when the provider looks for their declaration. Other
    /// unsupported types are rejected at compile time.
    template<class T>
    [[nodiscard]] TypeDescriptor describe() {
        TypeDescriptor d;
        d.type = typeid(T);

        if constexpr (std::same_as<T, value>) {
            d.kind = type_kind::raw;
            d.name = "json";
            d.make_scalar = [](const value& v) { return std::any(value{ v }); };
        }
        else if constexpr (std::same_as<T, bool>) {
            d.kind = type_kind::boolean;
            d.name = "bool";
            d.make_scalar = [](const value& v) { return std::any(v.as_bool()); };
        }
        else if constexpr (std::same_as<T, decimal>) {
            d.kind = type_kind::decimal;
            d.name = "decimal";
        }
        else if constexpr (std::same_as<T, std::string>) {
            d.kind = type_kind::string;
            d.name = detail::type_name<T>();
            d.make_scalar = [](const value& v) { return std::any(std::string{ v.as_string() }); };
        }
        else if constexpr (std::integral<T>) {
            d.kind = type_kind::integer;
            d.name = detail::type_name<T>();
            d.lower = std::is_signed_v<T> ? -std::ldexp(1.0, std::numeric_limits<T>::digits) : 0.0;
            d.upper = std::ldexp(1.0, std::numeric_limits<T>::digits);
            d.make_scalar = [](const value& v) { return std::any(static_cast<T>(v.as_number())); };
        }
        else if constexpr (std::floating_point<T>) {
            d.kind = type_kind::floating;
            d.name = detail::type_name<T>();
            d.make_scalar = [](const value& v) { return std::any(static_cast<T>(v.as_number())); };
        }
        else if constexpr (std::is_enum_v<T>) {
            d.kind = type_kind::enumeration;
            d.name = detail::type_name<T>();
        }
        else if constexpr (detail::is_optional<T>::value) {
            using U = typename T::value_type;
            d.kind = type_kind::optional;
            d.arguments.push_back(describe<U>());
            d.name = "optional<" + d.arguments.front().name + ">";
            d.make_optional = [](std::optional<std::any>&& part) {
                if (!part) return std::any(T{});
                return std::any(T{ std::any_cast<U>(std::move(*part)) });
            };
        }
        else if constexpr (detail::is_variant<T>::value) {
            d.kind = type_kind::union_;
            [&]<std::size_t... I>(std::index_sequence<I...>) {
                (d.arguments.push_back(describe<std::variant_alternative_t<I, T>>()), ...);
            }(std::make_index_sequence<std::variant_size_v<T>>{});
            d.name = "union<";
            for (size_t i = 0; i < d.arguments.size(); i++) {
                if (i != 0) d.name += ", ";
                d.name += d.arguments[i].name;
            }
            d.name += ">";
            d.make_alternative = [](std::size_t index, std::any&& part) {
                return detail::make_variant<T>(index, std::move(part), std::make_index_sequence<std::variant_size_v<T>>{});
            };
        }
        else if constexpr (detail::is_sequence<T>::value || detail::is_set<T>::value) {
            using E = typename T::value_type;
            d.kind = detail::is_set<T>::value ? type_kind::set : type_kind::list;
            d.arguments.push_back(describe<E>());
            d.name = std::string{ to_string(d.kind) } + "<" + d.arguments.front().name + ">";
            d.make_sequence = [](std::vector<std::any>&& parts) {
                T out;
                for (auto& part : parts) out.insert(out.end(), std::any_cast<E>(std::move(part)));
                return std::any(std::move(out));
            };
        }
        else if constexpr (detail::is_string_map<T>::value) {
            using V = typename T::mapped_type;
            d.kind = type_kind::map;
            d.arguments.push_back(describe<V>());
            d.name = "map<string, " + d.arguments.front().name + ">";
            d.make_mapping = [](std::vector<std::pair<std::string, std::any>>&& parts) {
                T out;
                for (auto& [key, part] : parts) out.insert_or_assign(std::move(key), std::any_cast<V>(std::move(part)));
                return std::any(std::move(out));
            };
        }
        else if constexpr (std::is_class_v<T>) {
            d.kind = type_kind::object;
            d.name = detail::type_name<T>();
        }
        else {
            static_assert(detail::dependent_false<T>, "Stanza cannot describe this type");
        }
        return d;
    }

} // namespace Stanza
