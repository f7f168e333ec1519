#pragma once


/*
    ----------------------------------------------
    Stanza converters - JSON value to typed value
    ----------------------------------------------
    A `Converter` turns one `Stanza::value` into one C++ value of a fixed
    target type, boxed in `std::any`. Converters are immutable once built and
    are shared between models through `ConverterPtr`.

    Each converter also exposes `accepts(v)`, a predicate on the JSON shape of
    `v`. It is what the Union converter uses to pick an alternative: the
    alternatives are asked in declared order and the first one that accepts
    the value converts it.

        converter            | accepts
        ---------------------|------------------------------------------------
        Passthrough          | anything
        Scalar               | matching JSON kind; integral targets also need
                             | an integral number inside the target's range
        List, Set            | array
        Mapping              | object
        EnumByName           | string equal to a member name
        EnumCaseInsensitive  | string equal to a member name ignoring case
        EnumByValue          | value equal to a member's associated value
        Decimal              | finite number or decimal literal string
        Union                | anything one of its alternatives accepts
        Nullable             | null or anything its inner converter accepts
        Object               | object

    Container converters prefix element errors with the element's index or
    key, so a failure deep in a payload reports its full path.
*/

#include <any>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <typeindex>
#include <unordered_map>
#include <utility>
#include <vector>

#include "stanza/config.hpp"
#include "stanza/error.hpp"
#include "stanza/schema.hpp"
#include "stanza/type.hpp"
#include "stanza/value.hpp"

/// @defgroup StanzaConverter Converters
/// @ingroup Stanza
/// @brief Composable JSON value converters

namespace Stanza {

    class Registry;

    /// @ingroup StanzaConverter
    /// @brief Converts a JSON value into a value of one target type.
    class STANZA_API Converter {
    public:
        virtual ~Converter() = default;

        /// @brief Converts @p v, or explains why it cannot.
        [[nodiscard]] virtual Result<std::any> convert(const value& v) const = 0;

        /// @brief Whether the JSON shape of @p v is one this converter handles.
        [[nodiscard]] virtual bool accepts(const value& v) const = 0;

        /// @brief Display name of the target type.
        [[nodiscard]] virtual const std::string& target() const noexcept = 0;
    };

    /// @ingroup StanzaConverter
    using ConverterPtr = std::shared_ptr<const Converter>;

    namespace detail {

        /// @brief Builds the `type_mismatch` error for @p v not being @p expected.
        [[nodiscard]] STANZA_API Error mismatch(const value& v, std::string_view expected);

    } // namespace detail

    /// @ingroup StanzaConverter
    /// @brief Identity converter for fields declared as `Stanza::value`.
    class STANZA_API PassthroughConverter final : public Converter {
    public:
        [[nodiscard]] Result<std::any> convert(const value& v) const override;
        [[nodiscard]] bool accepts(const value&) const override { return true; }
        [[nodiscard]] const std::string& target() const noexcept override { return m_Name; }

    private:
        std::string m_Name{ "json" };
    };

    /// @ingroup StanzaConverter
    /// @brief Converts a JSON scalar to a bool, integral, floating or string target.
    ///
    /// @details
    /// The JSON kind must match the target: no string-to-number or
    /// number-to-string coercion happens. For integral targets the number
    /// must be integral and lie in the target type's range.
    class STANZA_API ScalarConverter final : public Converter {
    public:
        /// @pre @p type is of kind boolean, integer, floating or string
        explicit ScalarConverter(TypeDescriptor type);

        [[nodiscard]] Result<std::any> convert(const value& v) const override;
        [[nodiscard]] bool accepts(const value& v) const override;
        [[nodiscard]] const std::string& target() const noexcept override { return m_Type.name; }

    private:
        TypeDescriptor m_Type;

        [[nodiscard]] bool in_range(const value& v) const noexcept;
    };

    /// @ingroup StanzaConverter
    /// @brief Converts a JSON array into a sequence container, element by element.
    class STANZA_API ListConverter final : public Converter {
    public:
        ListConverter(ConverterPtr element, TypeDescriptor type);

        [[nodiscard]] Result<std::any> convert(const value& v) const override;
        [[nodiscard]] bool accepts(const value& v) const override { return v.is_array(); }
        [[nodiscard]] const std::string& target() const noexcept override { return m_Type.name; }

        [[nodiscard]] const ConverterPtr& element() const noexcept { return m_Element; }

    private:
        ConverterPtr m_Element;
        TypeDescriptor m_Type;
    };

    /// @ingroup StanzaConverter
    /// @brief Converts a JSON array into a set; equal elements collapse.
    class STANZA_API SetConverter final : public Converter {
    public:
        SetConverter(ConverterPtr element, TypeDescriptor type);

        [[nodiscard]] Result<std::any> convert(const value& v) const override;
        [[nodiscard]] bool accepts(const value& v) const override { return v.is_array(); }
        [[nodiscard]] const std::string& target() const noexcept override { return m_Type.name; }

    private:
        ConverterPtr m_Element;
        TypeDescriptor m_Type;
    };

    /// @ingroup StanzaConverter
    /// @brief Converts a JSON object into a string-keyed map; keys are kept as-is.
    class STANZA_API MappingConverter final : public Converter {
    public:
        MappingConverter(ConverterPtr element, TypeDescriptor type);

        [[nodiscard]] Result<std::any> convert(const value& v) const override;
        [[nodiscard]] bool accepts(const value& v) const override { return v.is_object(); }
        [[nodiscard]] const std::string& target() const noexcept override { return m_Type.name; }

    private:
        ConverterPtr m_Element;
        TypeDescriptor m_Type;
    };

    /// @ingroup StanzaConverter
    /// @brief Selects an enum member by its exact name.
    class STANZA_API EnumByNameConverter final : public Converter {
    public:
        explicit EnumByNameConverter(std::shared_ptr<const EnumSchema> schema);

        [[nodiscard]] Result<std::any> convert(const value& v) const override;
        [[nodiscard]] bool accepts(const value& v) const override;
        [[nodiscard]] const std::string& target() const noexcept override { return m_Schema->name; }

    private:
        std::shared_ptr<const EnumSchema> m_Schema;

        [[nodiscard]] const EnumMember* lookup(const value& v) const;
    };

    /// @ingroup StanzaConverter
    /// @brief Selects an enum member by name, ignoring ASCII case.
    ///
    /// @details
    /// The lowercase lookup table is computed once at construction. When two
    /// member names differ only in case, the one declared first wins.
    class STANZA_API EnumCaseInsensitiveConverter final : public Converter {
    public:
        explicit EnumCaseInsensitiveConverter(std::shared_ptr<const EnumSchema> schema);

        [[nodiscard]] Result<std::any> convert(const value& v) const override;
        [[nodiscard]] bool accepts(const value& v) const override;
        [[nodiscard]] const std::string& target() const noexcept override { return m_Schema->name; }

    private:
        std::shared_ptr<const EnumSchema> m_Schema;
        std::unordered_map<std::string, const EnumMember*> m_Lowercase;

        [[nodiscard]] const EnumMember* lookup(const value& v) const;
    };

    /// @ingroup StanzaConverter
    /// @brief Selects the enum member whose associated value equals the input.
    class STANZA_API EnumByValueConverter final : public Converter {
    public:
        explicit EnumByValueConverter(std::shared_ptr<const EnumSchema> schema);

        [[nodiscard]] Result<std::any> convert(const value& v) const override;
        [[nodiscard]] bool accepts(const value& v) const override { return lookup(v) != nullptr; }
        [[nodiscard]] const std::string& target() const noexcept override { return m_Schema->name; }

    private:
        std::shared_ptr<const EnumSchema> m_Schema;

        [[nodiscard]] const EnumMember* lookup(const value& v) const;
    };

    /// @ingroup StanzaConverter
    /// @brief Converts a number or a decimal literal string into `Stanza::decimal`.
    ///
    /// @details
    /// Numbers go through their shortest round-trip text form, so `0.1`
    /// becomes exactly `0.1` rather than the binary expansion of the double.
    /// Strings must match `[+-]digits[.digits][(e|E)[+-]digits]`, where
    /// either side of the point may be empty but not both. A literal whose
    /// exponent does not fit `Stanza::decimal` is a `type_mismatch`.
    class STANZA_API DecimalConverter final : public Converter {
    public:
        [[nodiscard]] Result<std::any> convert(const value& v) const override;
        [[nodiscard]] bool accepts(const value& v) const override;
        [[nodiscard]] const std::string& target() const noexcept override { return m_Name; }

        /// @brief Checks a string against the decimal literal grammar.
        [[nodiscard]] static bool is_decimal_literal(std::string_view s) noexcept;

    private:
        [[nodiscard]] static Result<std::any> to_decimal(const value& v, std::string_view literal);

        std::string m_Name{ "decimal" };
    };

    /// @ingroup StanzaConverter
    /// @brief Converts through the first alternative whose `accepts` holds.
    ///
    /// @details
    /// Alternatives are tried in declared order. Once one accepts the value,
    /// its conversion result is final: a failure there is reported as is and
    /// later alternatives are not tried.
    class STANZA_API UnionConverter final : public Converter {
    public:
        UnionConverter(std::vector<ConverterPtr> alternatives, TypeDescriptor type);

        [[nodiscard]] Result<std::any> convert(const value& v) const override;
        [[nodiscard]] bool accepts(const value& v) const override;
        [[nodiscard]] const std::string& target() const noexcept override { return m_Type.name; }

        [[nodiscard]] const std::vector<ConverterPtr>& alternatives() const noexcept { return m_Alternatives; }

    private:
        std::vector<ConverterPtr> m_Alternatives;
        TypeDescriptor m_Type;
    };

    /// @ingroup StanzaConverter
    /// @brief Converts null to an empty `std::optional`, anything else through the inner converter.
    class STANZA_API NullableConverter final : public Converter {
    public:
        NullableConverter(ConverterPtr inner, TypeDescriptor type);

        [[nodiscard]] Result<std::any> convert(const value& v) const override;
        [[nodiscard]] bool accepts(const value& v) const override { return v.is_null() || m_Inner->accepts(v); }
        [[nodiscard]] const std::string& target() const noexcept override { return m_Type.name; }

    private:
        ConverterPtr m_Inner;
        TypeDescriptor m_Type;
    };

    /// @ingroup StanzaConverter
    /// @brief Converts a JSON object into an instance of a declared class.
    ///
    /// @details
    /// Holds a reference to the registry and looks the model up on every
    /// conversion, which keeps self-referential classes possible. The
    /// registry must outlive the converter.
    class STANZA_API ObjectConverter final : public Converter {
    public:
        ObjectConverter(const Registry& registry, std::type_index type, std::string name);

        [[nodiscard]] Result<std::any> convert(const value& v) const override;
        [[nodiscard]] bool accepts(const value& v) const override { return v.is_object(); }
        [[nodiscard]] const std::string& target() const noexcept override { return m_Name; }

    private:
        const Registry& m_Registry;
        std::type_index m_Type;
        std::string m_Name;
    };

    /// @ingroup StanzaConverter
    /// @brief Adapts a callable into a converter.
    class STANZA_API FunctionConverter final : public Converter {
    public:
        using ConvertFn = std::function<Result<std::any>(const value&)>;
        using AcceptFn = std::function<bool(const value&)>;

        FunctionConverter(std::string name, ConvertFn convert, AcceptFn accepts);

        [[nodiscard]] Result<std::any> convert(const value& v) const override { return m_Convert(v); }
        [[nodiscard]] bool accepts(const value& v) const override { return !m_Accepts || m_Accepts(v); }
        [[nodiscard]] const std::string& target() const noexcept override { return m_Name; }

    private:
        std::string m_Name;
        ConvertFn m_Convert;
        AcceptFn m_Accepts;
    };

    /// @ingroup StanzaConverter
    /// @brief Wraps @p fn, a callable `const value& -> Result<T>`, as a converter producing @p T.
    ///
    /// @details
    /// Intended for per-field overrides and exact-type rules. @p accepts is
    /// the shape predicate used when the converter ends up inside a union;
    /// when omitted every value is accepted.
    ///
    /// Example:
    /// @code
    /// auto upper = Stanza::make_converter<std::string>("upper string",
    ///     [](const Stanza::value& v) -> Stanza::Result<std::string> {
    ///         if (!v.is_string()) return std::unexpected(Stanza::detail::mismatch(v, "string"));
    ///         std::string s{ v.as_string() };
    ///         for (auto& c : s) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    ///         return s;
    ///     },
    ///     [](const Stanza::value& v) { return v.is_string(); });
    /// @endcode
    template<typename T, typename F>
    [[nodiscard]] ConverterPtr make_converter(std::string name, F fn, FunctionConverter::AcceptFn accepts = {}) {
        FunctionConverter::ConvertFn convert = [fn = std::move(fn)](const value& v) -> Result<std::any> {
            Result<T> r = fn(v);
            if (!r) return std::unexpected(std::move(r.error()));
            return std::any(std::move(*r));
        };
        return std::make_shared<const FunctionConverter>(std::move(name), std::move(convert), std::move(accepts));
    }

} // namespace Stanza
