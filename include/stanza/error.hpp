#pragma once


/*
    ------------------------------------------------------
    Stanza::Error - Structured conversion error reporting
    ------------------------------------------------------
    `Stanza::Error` describes a failure that occurred while building a class
    model or while converting a JSON value into a declared class.

    ------
    Fields
    ------
    - `code errc`:
        * Enumerated error category:
            - `configuration`   (class-shape problem found while building a model)
            - `missing_field`   (required field absent from the payload)
            - `type_mismatch`   (present value with the wrong shape)
    - `std::string owner`:
        * Declared name of the innermost class the failing field belongs to
        * Empty when the failure is not tied to a class (e.g. a bare converter)
    - `std::string path`:
        * JSON location of the failure relative to the parsed root,
          e.g. `.inner.items[2]`; empty for the root itself
    - `std::string value`:
        * Compact rendering of the offending JSON value, truncated for long
          payloads; empty for configuration and missing-field errors
    - `std::string msg`:
        * Human-readable description of the failure
        * Intended for debugging and logging; not stable for programmatic use

    -----
    Usage
    -----
    - Every fallible operation returns `Stanza::Result<T>`, an alias for
      `std::expected<T, Error>`
    - Converters produce errors without location; each enclosing converter
      and the parse entry point prepend their own path segment as the error
      travels outward, so the caller sees the full location
*/

#include <cstddef>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

#include "stanza/config.hpp"


/// @defgroup StanzaError Errors
/// @ingroup Stanza
/// @brief Error codes and structures produced while building models and parsing
namespace Stanza {

    /// @ingroup StanzaError
    /// @brief Structured error information produced by model building and parsing.
    ///
    /// @details
    /// Errors are returned, never thrown. Each one carries its category, the
    /// class and JSON path it was raised at, the offending value and a message.
    struct Error {
        /// @ingroup StanzaError
        /// @brief Enumeration of error categories.
        ///
        /// Members:
        /// - `configuration`
        ///     The declared shape of a class cannot be modeled: no usable
        ///     constructor, an untyped or unnamed field, an unresolved type,
        ///     an enum without members, or two fields whose external names
        ///     collide. Raised when the model is built, never while parsing data.
        ///
        /// - `missing_field`
        ///     A required field is absent from the JSON object.
        ///
        /// - `type_mismatch`
        ///     A present value does not have the shape its converter expects:
        ///     wrong JSON kind, fractional or out-of-range number for an
        ///     integral target, unknown enum literal, malformed decimal, or a
        ///     value no union alternative accepts.
        enum class code : uint8_t {
            configuration,  ///< Class cannot be modeled.
            missing_field,  ///< Required field absent.
            type_mismatch,  ///< Value has the wrong shape.
        };

        code errc{};          ///< The error category.
        std::string owner{};  ///< Innermost owning class, if any.
        std::string path{};   ///< JSON location relative to the root.
        std::string value{};  ///< Compact rendering of the offending value.
        std::string msg{};    ///< Human-readable diagnostic message.

        /// @ingroup StanzaError
        /// @brief Constructs an error with a category and message and no location.
        STANZA_API static Error make(code c, std::string_view m);

        /// @ingroup StanzaError
        /// @brief Constructs a `configuration` error for class @p owner.
        STANZA_API static Error configuration(std::string_view owner, std::string_view m);

        /// @ingroup StanzaError
        /// @brief Constructs a `missing_field` error for @p field of class @p owner.
        STANZA_API static Error missing_field(std::string_view owner, std::string_view field);

        /// @ingroup StanzaError
        /// @brief Constructs a `type_mismatch` error.
        ///
        /// @param rendered Compact rendering of the offending JSON value
        /// @param m        Description of what was expected
        STANZA_API static Error type_mismatch(std::string rendered, std::string_view m);

        /// @ingroup StanzaError
        /// @brief Prepends a field segment to the path.
        ///
        /// @details
        /// The owner is only recorded if none is set yet, so the innermost
        /// class survives as the error travels out through enclosing classes.
        STANZA_API Error& at_field(std::string_view owning_class, std::string_view field);

        /// @ingroup StanzaError
        /// @brief Prepends an array index segment (`[i]`) to the path.
        STANZA_API Error& at_index(std::size_t idx);

        /// @ingroup StanzaError
        /// @brief Prepends an object key segment (`["key"]`) to the path.
        STANZA_API Error& at_key(std::string_view key);

        /// @ingroup StanzaError
        /// @brief Formats the error on one line: category, location, owner, message, value.
        [[nodiscard]] STANZA_API std::string what() const;
    };

    /// @ingroup StanzaError
    /// @brief Result type of every fallible Stanza operation.
    template<typename T>
    using Result = std::expected<T, Error>;

    /// @ingroup StanzaError
    /// @brief Returns the lowercase name of an error category.
    [[nodiscard]] STANZA_API std::string_view to_string(Error::code c) noexcept;

} // namespace Stanza
