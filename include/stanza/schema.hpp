#pragma once


/*
    --------------------------------------------
    Stanza schemas - Declared shape of a C++ type
    --------------------------------------------
    A schema is the static declaration Stanza builds models from. It stands
    in for a constructor signature: the ordered list of fields a class is
    built from, with their declared names and types, which of them may be
    left at their default, and how an instance is created.

    - `ClassSchema` describes a class. It is normally filled in through
      `Registry::declare<T>()`, which derives the type descriptors, the
      assignment hooks and the factory from member pointers
    - `EnumSchema` lists the members of an enum type together with the
      JSON value each member is associated with, filled in through
      `Registry::enumeration<E>()`

    Schemas are plain data. They are validated by `ModelBuilder`, not here.
*/

#include <any>
#include <functional>
#include <optional>
#include <string>
#include <typeindex>
#include <vector>

#include "stanza/naming.hpp"
#include "stanza/options.hpp"
#include "stanza/type.hpp"
#include "stanza/value.hpp"

/// @defgroup StanzaSchema Schemas
/// @ingroup Stanza
/// @brief Static declarations of classes and enums

namespace Stanza {

    /// @ingroup StanzaSchema
    /// @brief Whether a field must appear in the payload.
    enum class presence : uint8_t {
        required,  ///< Field must be present.
        defaulted, ///< Field may be absent; the member keeps its default initializer.
    };

    /// @ingroup StanzaSchema
    /// @brief Stores a converted value into an instance.
    ///
    /// @return false when @p part does not hold the member's type
    using AssignFn = std::function<bool(std::any& instance, std::any&& part)>;

    /// @ingroup StanzaSchema
    /// @brief One declared field.
    struct FieldSchema {
        std::string name{};                 ///< Declared field name.
        TypeDescriptor type{};              ///< Declared type.
        presence mode = presence::required; ///< Required or defaulted.
        AssignFn assign{};
    };

    /// @ingroup StanzaSchema
    /// @brief Declared shape of one class.
    struct ClassSchema {
        std::type_index type = typeid(void);
        std::string name{};
        std::vector<FieldSchema> fields{};

        /// Creates a default instance; empty when the class has no usable constructor.
        std::function<std::any()> construct{};

        /// Name casing for this class; empty falls back to the registry default.
        NameRule naming{};

        /// Enum policy for this class's fields; empty falls back to the registry default.
        std::optional<EnumMatching> enum_matching{};
    };

    /// @ingroup StanzaSchema
    /// @brief One member of a declared enum.
    struct EnumMember {
        std::string name{};   ///< Symbolic name.
        value associated{};   ///< Value matched by EnumByValue.
        std::any enumerator{}; ///< The boxed enum value.
    };

    /// @ingroup StanzaSchema
    /// @brief Declared members of one enum type, in declaration order.
    struct EnumSchema {
        std::type_index type = typeid(void);
        std::string name{};
        std::vector<EnumMember> members{};
    };

} // namespace Stanza
