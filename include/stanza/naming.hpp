#pragma once

#include <functional>
#include <string>
#include <string_view>

#include "stanza/config.hpp"

/// @defgroup StanzaNaming Name Casing Rules
/// @ingroup Stanza
/// @brief Mapping of declared field names onto JSON member names

namespace Stanza {

    /// @ingroup StanzaNaming
    /// @brief Maps a declared field name to the name used in the JSON payload.
    using NameRule = std::function<std::string(std::string_view)>;

    namespace naming {

        /// @ingroup StanzaNaming
        /// @brief Returns @p name unchanged.
        [[nodiscard]] STANZA_API std::string identity(std::string_view name);

        /// @ingroup StanzaNaming
        /// @brief Converts `snake_case` to `camelCase`.
        ///
        /// @details
        /// Each underscore is dropped and the character after it upper-cased:
        /// `created_at` becomes `createdAt`. Leading underscores are kept, so
        /// `_id` stays `_id`, and the first word keeps its case.
        [[nodiscard]] STANZA_API std::string camel_case(std::string_view name);

    } // namespace naming

} // namespace Stanza
