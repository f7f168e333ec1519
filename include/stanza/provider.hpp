#pragma once


/*
    -----------------------------------------------------
    Stanza::ConverterProvider - Declared type to converter
    -----------------------------------------------------
    The provider decides which converter handles a declared type. It is
    consulted once per field when a model is built, and recursively for the
    element, mapped and alternative types of containers and unions.

    Resolution order, first match wins:
        1. a converter registered for this exact (class, field) pair; only
           the field's own declared type is overridden, never the types
           nested inside it
        2. a converter registered for the exact C++ type
        3. the rule registered for the type's `type_kind`
    Nothing matching is a `configuration` error naming the type.

    The built-in rule table maps:
        raw                              -> Passthrough
        boolean, integer, floating, string -> Scalar (one instance per type)
        decimal                          -> Decimal
        list / set / map                 -> List / Set / Mapping over the resolved element
        optional                         -> Nullable over the resolved element
        union_                           -> Union over the resolved alternatives
        enumeration                      -> EnumByName, EnumCaseInsensitive or EnumByValue,
                                            as the owning class's policy says
        object                           -> Object, for declared classes only

    Rules can be replaced with `set_rule`.
*/

#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <string_view>
#include <typeindex>
#include <unordered_map>
#include <utility>

#include "stanza/config.hpp"
#include "stanza/converter.hpp"
#include "stanza/error.hpp"
#include "stanza/options.hpp"
#include "stanza/schema.hpp"
#include "stanza/type.hpp"

/// @defgroup StanzaProvider Converter Provider
/// @ingroup Stanza
/// @brief Table-driven resolution of declared types to converters

namespace Stanza {

    class Registry;

    /// @ingroup StanzaProvider
    /// @brief Where a type is being resolved: which registry, class and field.
    struct FieldContext {
        const Registry& registry;
        const ClassSchema& owner;
        std::string_view field;
        EnumMatching enum_matching = EnumMatching::by_name;
    };

    /// @ingroup StanzaProvider
    /// @brief Registry of type-to-converter rules.
    class STANZA_API ConverterProvider {
    public:
        /// @brief Builds a converter for a descriptor of the rule's kind.
        using Rule = std::function<Result<ConverterPtr>(const ConverterProvider&, const TypeDescriptor&, const FieldContext&)>;

        /// @brief Creates a provider with the built-in rule table installed.
        ConverterProvider();

        /// @ingroup StanzaProvider
        /// @brief Resolves the converter for a field's declared type.
        ///
        /// @details
        /// Checks the (class, field) override before falling through to
        /// `resolve_type`.
        [[nodiscard]] Result<ConverterPtr> resolve(const TypeDescriptor& type, const FieldContext& ctx) const;

        /// @ingroup StanzaProvider
        /// @brief Resolves the converter for a type, ignoring field overrides.
        ///
        /// @details
        /// Used by rules for the types nested inside a field's declared type.
        [[nodiscard]] Result<ConverterPtr> resolve_type(const TypeDescriptor& type, const FieldContext& ctx) const;

        /// @brief Forces @p converter for @p field of class @p owner.
        void override_field(std::type_index owner, std::string field, ConverterPtr converter);

        /// @brief Uses @p converter wherever @p type is declared.
        void register_type(std::type_index type, ConverterPtr converter);

        /// @brief Replaces the rule for @p kind.
        void set_rule(type_kind kind, Rule rule);

        /// @brief Returns the override for (@p owner, @p field), or nullptr.
        [[nodiscard]] const ConverterPtr* find_override(std::type_index owner, std::string_view field) const;

    private:
        std::map<std::pair<std::type_index, std::string>, ConverterPtr> m_Overrides;
        std::unordered_map<std::type_index, ConverterPtr> m_TypeRules;
        std::map<type_kind, Rule> m_Rules;

        // Leaf converters are stateless, so one per scalar type is shared by every model.
        mutable std::mutex m_CacheMutex;
        mutable std::unordered_map<std::type_index, ConverterPtr> m_LeafCache;

        [[nodiscard]] ConverterPtr leaf(const TypeDescriptor& type) const;

        void install_builtin_rules();
    };

} // namespace Stanza
