#pragma once

#include <any>
#include <format>
#include <utility>
#include <typeinfo>

#include "stanza/config.hpp"
#include "stanza/error.hpp"
#include "stanza/model.hpp"
#include "stanza/options.hpp"
#include "stanza/registry.hpp"
#include "stanza/value.hpp"


namespace Stanza {

    /// @ingroup StanzaRegistry
    /// @brief Converts a JSON object into an instance of the class @p model describes.
    ///
    /// @details
    /// Attributes are converted in declaration order and parsing stops at the
    /// first failure. Members not present in @p model are ignored, as are
    /// absent optional attributes, which keep the member's default. The
    /// instance is only created once every attribute converted.
    ///
    /// Errors:
    /// - `type_mismatch` if @p v is not an object or a field's value has the wrong shape
    /// - `missing_field` if a required field is absent
    ///
    /// Errors raised below a field carry the field in their path.
    [[nodiscard]] STANZA_API Result<std::any> parse_model(const ClassModel& model, const value& v, const ModelOptions& options);

    /// @ingroup StanzaRegistry
    /// @brief Parses @p v into a `T`, building `T`'s model on first use.
    ///
    /// Example:
    /// @code
    /// auto r = Stanza::parse<Person>(registry, json);
    /// if (!r) std::println(stderr, "{}", r.error().what());
    /// @endcode
    template<Declarable T>
    [[nodiscard]] Result<T> parse(const Registry& registry, const value& v) {
        auto boxed = registry.parse(typeid(T), v);
        if (!boxed) return std::unexpected(std::move(boxed.error()));
        if (T* instance = std::any_cast<T>(&*boxed)) return std::move(*instance);
        return std::unexpected(Error::make(Error::code::configuration,
            std::format("model of {} produced an instance of another type", detail::type_name<T>())));
    }

} // namespace Stanza
