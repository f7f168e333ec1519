#pragma once


/*
    ----------------------------------------------------
    Stanza::Registry - Declarations and the model cache
    ----------------------------------------------------
    The registry is the one object an application keeps around. It owns:

    - the class and enum declarations (`declare<T>()`, `enumeration<E>()`)
    - the converter provider, with its per-field overrides and type rules
    - the model cache: one `ClassModel` per declared class, built on first
      use and kept until the registry is destroyed

    ---------
    Lifecycle
    ---------
    1. Declare every class and enum, register overrides and type rules
    2. Optionally call `build_all()` so configuration errors show up at startup
    3. Parse, from any number of threads

    Declarations are not synchronized against parsing; finish step 1 before
    step 3 begins. Converters created from the registry refer back to it, so
    it must outlive every model and converter taken from it.

    -----------
    Concurrency
    -----------
    Published models are read under a shared lock. Building is serialized by
    a separate build lock, so a class's model is built at most once even when
    several threads ask for it first. Nested classes are built from inside an
    outer build on the same thread; the build lock is recursive for that.

    -----
    Usage
    -----
        struct Address { std::string city; std::optional<std::string> zip; };
        struct Person  { std::string full_name; int age = 0; std::vector<Address> addresses; };

        Stanza::Registry registry;
        registry.declare<Address>("Address")
            .field("city", &Address::city)
            .field("zip", &Address::zip);
        registry.declare<Person>("Person")
            .naming(Stanza::naming::camel_case)
            .field("full_name", &Person::full_name)
            .field("age", &Person::age, Stanza::presence::defaulted)
            .field("addresses", &Person::addresses);

        auto person = Stanza::parse<Person>(registry, json);
*/

#include <any>
#include <concepts>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <type_traits>
#include <typeindex>
#include <unordered_map>
#include <unordered_set>
#include <utility>

#include "stanza/config.hpp"
#include "stanza/converter.hpp"
#include "stanza/error.hpp"
#include "stanza/model.hpp"
#include "stanza/options.hpp"
#include "stanza/provider.hpp"
#include "stanza/schema.hpp"
#include "stanza/type.hpp"
#include "stanza/value.hpp"

/// @defgroup StanzaRegistry Registry
/// @ingroup Stanza
/// @brief Declarations, converter rules and the model cache

namespace Stanza {

    class Registry;

    /// @ingroup StanzaRegistry
    /// @brief Types that can be declared as classes: copyable class types.
    template<typename T>
    concept Declarable = std::is_class_v<T> && std::copy_constructible<T>;

    /// @ingroup StanzaRegistry
    /// @brief Fluent declaration of a class's fields and options.
    template<Declarable T>
    class ClassBuilder {
    public:
        ClassBuilder(Registry& registry, ClassSchema& schema) : m_Registry{ registry }, m_Schema{ schema } {}

        /// @ingroup StanzaRegistry
        /// @brief Declares the next field.
        ///
        /// @details
        /// Fields are modeled in declaration order. The member's type decides
        /// the converter; a `std::optional<U>` member is optional regardless
        /// of @p mode.
        ///
        /// @param name   Declared field name; the class's name rule derives the JSON name from it
        /// @param member Pointer to the data member
        /// @param mode   Whether the field may be absent from the payload
        template<typename M>
        ClassBuilder& field(std::string name, M T::*member, presence mode = presence::required) {
            FieldSchema f;
            f.name = std::move(name);
            f.type = describe<M>();
            f.mode = mode;
            f.assign = [member](std::any& instance, std::any&& part) -> bool {
                T* obj = std::any_cast<T>(&instance);
                if (!obj) return false;
                if (M* whole = std::any_cast<M>(&part)) {
                    obj->*member = std::move(*whole);
                    return true;
                }
                if constexpr (detail::is_optional<M>::value) {
                    if (auto* inner = std::any_cast<typename M::value_type>(&part)) {
                        obj->*member = std::move(*inner);
                        return true;
                    }
                }
                return false;
            };
            m_Schema.fields.push_back(std::move(f));
            return *this;
        }

        /// @brief Sets the name casing rule for this class.
        ClassBuilder& naming(NameRule rule) {
            m_Schema.naming = std::move(rule);
            return *this;
        }

        /// @brief Sets how this class's enum-typed fields match JSON values.
        ClassBuilder& enums(EnumMatching matching) {
            m_Schema.enum_matching = matching;
            return *this;
        }

        /// @brief Forces @p converter for the field declared as @p field_name.
        ClassBuilder& override_field(std::string field_name, ConverterPtr converter);

        [[nodiscard]] const ClassSchema& schema() const noexcept { return m_Schema; }

    private:
        Registry& m_Registry;
        ClassSchema& m_Schema;
    };

    /// @ingroup StanzaRegistry
    /// @brief Fluent declaration of an enum's members.
    template<typename E>
        requires std::is_enum_v<E>
    class EnumBuilder {
    public:
        explicit EnumBuilder(EnumSchema& schema) : m_Schema{ schema } {}

        /// @brief Declares a member whose associated value is its underlying integer.
        EnumBuilder& member(std::string name, E enumerator) {
            return member(std::move(name), enumerator, value{ static_cast<std::underlying_type_t<E>>(enumerator) });
        }

        /// @brief Declares a member with an explicit associated value.
        EnumBuilder& member(std::string name, E enumerator, value associated) {
            m_Schema.members.push_back(EnumMember{ std::move(name), std::move(associated), std::any(enumerator) });
            return *this;
        }

    private:
        EnumSchema& m_Schema;
    };

    /// @ingroup StanzaRegistry
    /// @brief Owns declarations, converter rules and the per-class model cache.
    class STANZA_API Registry {
    public:
        explicit Registry(ModelOptions options = {});

        Registry(const Registry&) = delete;
        Registry& operator=(const Registry&) = delete;

        /// @ingroup StanzaRegistry
        /// @brief Declares class @p T under @p name, or continues an earlier declaration.
        template<Declarable T>
        ClassBuilder<T> declare(std::string name) {
            auto& slot = m_Classes[typeid(T)];
            if (!slot) {
                slot = std::make_unique<ClassSchema>();
                slot->type = typeid(T);
                if constexpr (std::default_initializable<T>) {
                    slot->construct = [] { return std::any(T{}); };
                }
            }
            slot->name = std::move(name);
            return ClassBuilder<T>{ *this, *slot };
        }

        /// @ingroup StanzaRegistry
        /// @brief Declares enum @p E under @p name, or continues an earlier declaration.
        template<typename E>
            requires std::is_enum_v<E>
        EnumBuilder<E> enumeration(std::string name) {
            auto& slot = m_Enums[typeid(E)];
            if (!slot) {
                slot = std::make_shared<EnumSchema>();
                slot->type = typeid(E);
            }
            slot->name = std::move(name);
            return EnumBuilder<E>{ *slot };
        }

        /// @ingroup StanzaRegistry
        /// @brief Registers a schema built by hand rather than through `declare`.
        void declare_schema(ClassSchema schema);

        /// @ingroup StanzaRegistry
        /// @brief Uses @p converter for every field declared with type @p T.
        template<typename T>
        Registry& register_type(ConverterPtr converter) {
            m_Provider.register_type(typeid(T), std::move(converter));
            return *this;
        }

        /// @ingroup StanzaRegistry
        /// @brief Forces @p converter for field @p field_name of class @p T.
        template<typename T>
        Registry& override_field(std::string field_name, ConverterPtr converter) {
            m_Provider.override_field(typeid(T), std::move(field_name), std::move(converter));
            return *this;
        }

        /// @brief Provider used for model building; exposed to replace rules.
        [[nodiscard]] ConverterProvider& provider() noexcept { return m_Provider; }
        [[nodiscard]] const ConverterProvider& provider() const noexcept { return m_Provider; }

        [[nodiscard]] const ModelOptions& options() const noexcept { return m_Options; }

        /// @ingroup StanzaRegistry
        /// @brief Returns the model of @p type, building and caching it on first use.
        [[nodiscard]] Result<std::shared_ptr<const ClassModel>> model(std::type_index type) const;

        template<typename T>
        [[nodiscard]] Result<std::shared_ptr<const ClassModel>> model() const { return model(typeid(T)); }

        /// @ingroup StanzaRegistry
        /// @brief Builds every declared class's model, stopping at the first failure.
        [[nodiscard]] Result<void> build_all() const;

        /// @ingroup StanzaRegistry
        /// @brief Converts @p v into an instance of the declared class @p type.
        [[nodiscard]] Result<std::any> parse(std::type_index type, const value& v) const;

        /// @brief Declaration of class @p type, or nullptr.
        [[nodiscard]] const ClassSchema* find_class(std::type_index type) const;

        /// @brief Declaration of enum @p type, or nullptr.
        [[nodiscard]] std::shared_ptr<const EnumSchema> find_enum(std::type_index type) const;

        /// @ingroup StanzaRegistry
        /// @brief Makes sure the model of @p type is built or being built.
        ///
        /// @details
        /// Called by the provider for nested classes so their configuration
        /// errors surface while the outer class is built. A class whose build
        /// is already in progress on this thread (a self-referential class)
        /// counts as prepared.
        [[nodiscard]] Result<void> prepare(std::type_index type) const;

        /// @brief Whether the model of @p type has been built and published.
        [[nodiscard]] bool is_built(std::type_index type) const;

    private:
        ModelOptions m_Options;
        ConverterProvider m_Provider;
        std::unordered_map<std::type_index, std::unique_ptr<ClassSchema>> m_Classes;
        std::unordered_map<std::type_index, std::shared_ptr<EnumSchema>> m_Enums;

        mutable std::shared_mutex m_CacheMutex;
        mutable std::unordered_map<std::type_index, std::shared_ptr<const ClassModel>> m_Models;

        mutable std::recursive_mutex m_BuildMutex;
        mutable std::unordered_set<std::type_index> m_Building;

        [[nodiscard]] std::shared_ptr<const ClassModel> cached(std::type_index type) const;
        [[nodiscard]] Result<std::shared_ptr<const ClassModel>> build_locked(std::type_index type) const;
    };

    template<Declarable T>
    ClassBuilder<T>& ClassBuilder<T>::override_field(std::string field_name, ConverterPtr converter) {
        m_Registry.template override_field<T>(std::move(field_name), std::move(converter));
        return *this;
    }

} // namespace Stanza
