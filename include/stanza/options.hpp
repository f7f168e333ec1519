#pragma once


/*
    ----------------------------
    Stanza model-building options
    ----------------------------
    `ModelOptions` configures a `Stanza::Registry`. It supplies the defaults
    a declared class falls back to when it does not choose for itself:

    - `NameRule naming`:
        * Casing rule mapping declared field names to JSON member names
        * Defaults to `naming::identity`; `naming::camel_case` is provided
    - `EnumMatching enum_matching`:
        * How string literals select enum members for classes that do not
          set their own policy: exact name (default), case-insensitive name,
          or associated value
    - `bool null_as_absent`:
        * When true (default), a JSON `null` for an optional field is treated
          as if the field were absent and the member keeps its default
        * When false, the null is handed to the field's converter, which
          rejects it unless the field's type admits null

    -----
    Usage
    -----
        Stanza::Registry registry{ { .naming = Stanza::naming::camel_case } };

    These are plain aggregates suitable for designated initialization.
*/

#include <cstdint>

#include "stanza/naming.hpp"

/// @defgroup StanzaOptions Model Options
/// @ingroup Stanza
/// @brief Configuration objects controlling model building and parsing

namespace Stanza {

    /// @ingroup StanzaOptions
    /// @brief Selects the converter used for enum-typed fields.
    enum class EnumMatching : uint8_t {
        by_name,          ///< String must equal a member name exactly.
        case_insensitive, ///< String must equal a member name ignoring ASCII case.
        by_value,         ///< JSON value must equal a member's associated value.
    };

    /// @ingroup StanzaOptions
    /// @brief Registry-wide defaults for model building and parsing.
    ///
    /// Example:
    /// @code
    /// Stanza::ModelOptions opts;
    /// opts.naming = Stanza::naming::camel_case;
    /// opts.null_as_absent = false;
    /// Stanza::Registry registry{ opts };
    /// @endcode
    struct ModelOptions {
        NameRule naming = naming::identity;                 ///< Default field name casing.
        EnumMatching enum_matching = EnumMatching::by_name; ///< Default enum policy.
        bool null_as_absent = true;                         ///< Treat null as absence for optional fields.
    };

} // namespace Stanza
