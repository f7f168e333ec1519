#pragma once


/*
    ---------------------------------------------
    Stanza::ClassModel - Resolved model of a class
    ---------------------------------------------
    A `ClassModel` is what a `ClassSchema` becomes once it has been validated
    and every field has a converter. It is built once per class by
    `ModelBuilder`, published by the `Registry`, and never changes afterwards.

    The model is also the read-only view a serializer needs: the attributes
    carry both the declared and the external field names and the declared
    types, in declaration order.
*/

#include <any>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <typeindex>
#include <vector>

#include "stanza/config.hpp"
#include "stanza/converter.hpp"
#include "stanza/error.hpp"
#include "stanza/schema.hpp"
#include "stanza/type.hpp"

/// @defgroup StanzaModel Class Models
/// @ingroup Stanza
/// @brief Per-class attribute models

namespace Stanza {

    /// @ingroup StanzaModel
    /// @brief Resolved description of one field.
    struct AttributeModel {
        std::string source_name{};    ///< Name as declared.
        std::string external_name{};  ///< Name in the JSON payload.
        TypeDescriptor declared_type{}; ///< Declared type, with `std::optional` unwrapped.
        bool optional = false;        ///< Whether the field may be absent.
        ConverterPtr converter{};     ///< Converter for the field's JSON value.
        AssignFn assign{};            ///< Stores a converted value into an instance.
    };

    /// @ingroup StanzaModel
    /// @brief Ordered attribute models of one class.
    class STANZA_API ClassModel {
    public:
        ClassModel(std::type_index type, std::string name, std::vector<AttributeModel> attributes,
                   std::function<std::any()> construct);

        [[nodiscard]] std::type_index type() const noexcept { return m_Type; }
        [[nodiscard]] const std::string& name() const noexcept { return m_Name; }
        [[nodiscard]] const std::vector<AttributeModel>& attributes() const noexcept { return m_Attributes; }

        /// @ingroup StanzaModel
        /// @brief Finds the attribute with the given external name.
        [[nodiscard]] const AttributeModel* find(std::string_view external_name) const noexcept;

        /// @ingroup StanzaModel
        /// @brief Creates an instance from converted attribute values.
        ///
        /// @details
        /// @p arguments holds one entry per attribute, in attribute order. An
        /// empty entry leaves the member at its default. Fails with
        /// `type_mismatch` when an entry does not hold the member's type,
        /// which can only happen with a misdeclared override converter.
        [[nodiscard]] Result<std::any> instantiate(std::vector<std::optional<std::any>>&& arguments) const;

    private:
        std::type_index m_Type;
        std::string m_Name;
        std::vector<AttributeModel> m_Attributes;
        std::function<std::any()> m_Construct;
    };

} // namespace Stanza
