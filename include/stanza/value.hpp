#pragma once


/*
    -----------------------------------------
    Stanza::value - Decoded JSON input tree
    -----------------------------------------
    `Stanza::value` is the language-native form of a JSON document that the
    converters consume:
        - null
        - boolean
        - number (as double)
        - string
        - array
        - object
    Turning JSON text into this tree is the job of whatever decoder the
    application already uses; Stanza only reads the tree.

    -----------------
    Memory Management
    -----------------
    - `value` is allocator-aware and uses `std::pmr::memory_resource` for all
      internal allocations (strings, arrays, objects)
    - Copy construction adopts the source's resource and deep-copies the tree
    - Move construction steals the source's resource and storage

    -----------------
    Kinds and Queries
    -----------------
    - `kind type() const` returns the current kind
    - `is_null()`, `is_bool()`, `is_number()`, `is_string()`, `is_array()`,
      `is_object()` test it; `is_integral()` additionally checks that a number
      has no fractional part
    - `as_*()` accessors assume the kind matches; the non-const container
      accessors replace the value with an empty container when it does not

    -----------
    Diagnostics
    -----------
    - `render(v, limit)` produces a compact one-line JSON rendering, cut at
      `limit` characters, used to quote offending values in errors
*/

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory_resource>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "stanza/config.hpp"

/// @defgroup Stanza Stanza JSON Mapping Library
/// @brief Declarative mapping of JSON values onto C++ data classes

/// @defgroup StanzaValue JSON Input Tree
/// @ingroup Stanza

namespace Stanza {
    /// @brief Enumerates the possible JSON value kinds held by Stanza::value
    enum class kind : uint8_t {
        null,    ///< JSON null value
        boolean, ///< JSON boolean value (`true` or `false`)
        number,  ///< JSON number value (stored as `double`)
        string,  ///< JSON string value
        array,   ///< JSON array value
        object,  ///< JSON object value
    };

    template<class T>
    using pmr_vector = std::pmr::vector<T>;

    template<class Key, class T, class Compare = std::less<>>
    using pmr_map = std::pmr::map<Key, T, Compare>;

    /// @ingroup StanzaValue
    /// @brief String type used by Stanza::value (allocator-aware)
    using string = std::pmr::string;

    struct value;
    using allocator_type = std::pmr::polymorphic_allocator<value>;

    /// @ingroup StanzaValue
    /// @brief Array type used by Stanza::value (JSON arrays)
    using array = pmr_vector<value>;

    /// @ingroup StanzaValue
    /// @brief Object type used by Stanza::value (JSON objects)
    using object = pmr_map<string, value>;

    /// @ingroup StanzaValue
    /// @brief Variant storage used internally by Stanza::value
    using storage_t = std::variant<
        std::monostate,
        bool,
        double,
        string,
        array,
        object
    >;

    /// @ingroup StanzaValue
    /// @brief Dynamic JSON tree node.
    ///
    /// @details
    /// All nested allocations (strings, arrays, objects) are performed using
    /// the `std::pmr::memory_resource` associated with the instance.
    struct value {
        /// @brief Constructs a null value.
        STANZA_API explicit value(std::pmr::memory_resource* res = std::pmr::get_default_resource()) noexcept;

        /// @brief Constructs a null value; exists to disambiguate `value{ nullptr }`.
        STANZA_API value(std::nullptr_t, std::pmr::memory_resource* res = std::pmr::get_default_resource()) noexcept;

        STANZA_API value(bool b, std::pmr::memory_resource* res = std::pmr::get_default_resource()) noexcept;

        STANZA_API value(double d, std::pmr::memory_resource* res = std::pmr::get_default_resource()) noexcept;

        /// @brief Constructs a number from any integral type other than `bool`.
        ///
        /// @details
        /// Implicit so that `obj["count"] = 3;` reads naturally. Values beyond
        /// 2^53 in magnitude lose precision, as they would in any JSON decoder
        /// that stores numbers as doubles.
        template<std::integral I>
            requires (!std::same_as<I, bool>)
        value(I i, std::pmr::memory_resource* res = std::pmr::get_default_resource()) noexcept
            : m_MemRes{ res }, m_Storage{ static_cast<double>(i) } {}

        STANZA_API value(const char* s, std::pmr::memory_resource* res = std::pmr::get_default_resource());

        STANZA_API value(std::string_view sv, std::pmr::memory_resource* res = std::pmr::get_default_resource());

        STANZA_API value(string s, std::pmr::memory_resource* res = std::pmr::get_default_resource());

        STANZA_API value(array a, std::pmr::memory_resource* res = std::pmr::get_default_resource());

        STANZA_API value(object o, std::pmr::memory_resource* res = std::pmr::get_default_resource());

        STANZA_API value(const value& other);
        STANZA_API value(value&& other) noexcept;
        STANZA_API value& operator=(const value& other);
        STANZA_API value& operator=(value&& other) noexcept;

        /// @ingroup StanzaValue
        /// @brief Returns the kind of JSON value currently stored.
        [[nodiscard]] STANZA_API kind type() const noexcept;

        [[nodiscard]] bool is_null()   const noexcept { return type() == kind::null;    }
        [[nodiscard]] bool is_bool()   const noexcept { return type() == kind::boolean; }
        [[nodiscard]] bool is_number() const noexcept { return type() == kind::number;  }
        [[nodiscard]] bool is_string() const noexcept { return type() == kind::string;  }
        [[nodiscard]] bool is_array()  const noexcept { return type() == kind::array;   }
        [[nodiscard]] bool is_object() const noexcept { return type() == kind::object;  }

        /// @ingroup StanzaValue
        /// @brief Checks whether the value is a finite number without a fractional part.
        [[nodiscard]] STANZA_API bool is_integral() const noexcept;

        /// @pre `is_bool()`
        [[nodiscard]] STANZA_API bool&       as_bool();
        [[nodiscard]] STANZA_API const bool& as_bool() const;

        /// @pre `is_number()`
        [[nodiscard]] STANZA_API double&       as_number();
        [[nodiscard]] STANZA_API const double& as_number() const;

        /// @pre `is_string()`
        [[nodiscard]] STANZA_API string&       as_string();
        [[nodiscard]] STANZA_API const string& as_string() const;

        /// @ingroup StanzaValue
        /// @brief Returns the stored array, replacing a non-array value with an empty one.
        [[nodiscard]] STANZA_API array&       as_array();
        /// @pre `is_array()`
        [[nodiscard]] STANZA_API const array& as_array() const;

        /// @ingroup StanzaValue
        /// @brief Returns the stored object, replacing a non-object value with an empty one.
        [[nodiscard]] STANZA_API object&       as_object();
        /// @pre `is_object()`
        [[nodiscard]] STANZA_API const object& as_object() const;

        /// @brief Element count for arrays and objects, 0 otherwise.
        [[nodiscard]] STANZA_API size_t size() const noexcept;

        /// @ingroup StanzaValue
        /// @brief Accesses or creates an array element, growing the array with nulls.
        STANZA_API value& operator[](size_t idx);

        /// @ingroup StanzaValue
        /// @brief Accesses or creates an object member (inserted as null).
        STANZA_API value& operator[](std::string_view key);

        /// @ingroup StanzaValue
        /// @brief Finds an object member.
        /// @return Pointer to the member, or nullptr when absent or when not an object
        [[nodiscard]] STANZA_API const value* find(std::string_view key) const;

        /// @brief Structural equality: same kind and equal contents. The memory
        ///        resource does not take part.
        friend bool operator==(const value& lhs, const value& rhs) { return lhs.m_Storage == rhs.m_Storage; }

        [[nodiscard]] std::pmr::memory_resource* resource() const noexcept { return m_MemRes; }

        [[nodiscard]] const storage_t& storage() const noexcept { return m_Storage; }

    private:
        std::pmr::memory_resource* m_MemRes{};
        storage_t m_Storage{};

        static storage_t clone_storage(const storage_t& s, std::pmr::memory_resource* res);
    };

    /// @ingroup StanzaValue
    /// @brief Returns the JSON name of a kind (`"null"`, `"boolean"`, `"number"`, ...).
    [[nodiscard]] STANZA_API std::string_view kind_name(kind k) noexcept;

    /// @ingroup StanzaValue
    /// @brief Renders @p v as compact JSON on one line.
    ///
    /// @details
    /// Output longer than @p limit characters is cut and terminated with
    /// `...`. A @p limit of 0 disables truncation. Non-finite numbers render
    /// as `null`.
    [[nodiscard]] STANZA_API std::string render(const value& v, std::size_t limit = 64);

} // namespace Stanza
