#include "stanza/converter.hpp"
#include "stanza/registry.hpp"

#include <cctype>
#include <charconv>
#include <cmath>
#include <format>
#include <stdexcept>
#include <typeindex>


namespace Stanza {

    namespace detail {

        Error mismatch(const value& v, std::string_view expected) {
            return Error::type_mismatch(render(v), std::format("expected {}, got {}", expected, kind_name(v.type())));
        }

        std::string lowercase(std::string_view s) {
            std::string out{ s };
            for (auto& c : out) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
            return out;
        }

        // Guards the descriptor hooks, which any_cast each part to the declared element type.
        bool fits(const std::any& part, const TypeDescriptor& expected) noexcept {
            return std::type_index{ part.type() } == expected.type;
        }

        Error misfit(const value& v, const Converter& produced_by, const TypeDescriptor& expected) {
            return Error::type_mismatch(render(v), std::format("converter {} produced a value that does not fit {}",
                produced_by.target(), expected.name));
        }

    } // namespace detail

#pragma region Scalars

    Result<std::any> PassthroughConverter::convert(const value& v) const {
        return std::any(value{ v });
    }

    ScalarConverter::ScalarConverter(TypeDescriptor type)
        : m_Type{ std::move(type) } {}

    bool ScalarConverter::in_range(const value& v) const noexcept {
        double d = v.as_number();
        return d >= m_Type.lower && d < m_Type.upper;
    }

    bool ScalarConverter::accepts(const value& v) const {
        switch (m_Type.kind) {
        case type_kind::boolean: return v.is_bool();
        case type_kind::integer: return v.is_integral() && in_range(v);
        case type_kind::floating: return v.is_number();
        case type_kind::string: return v.is_string();
        default: return false;
        }
    }

    Result<std::any> ScalarConverter::convert(const value& v) const {
        switch (m_Type.kind) {
        case type_kind::boolean:
            if (!v.is_bool()) return std::unexpected(detail::mismatch(v, "boolean"));
            break;
        case type_kind::integer:
            if (!v.is_number()) return std::unexpected(detail::mismatch(v, m_Type.name));
            if (!v.is_integral())
                return std::unexpected(Error::type_mismatch(render(v), std::format("expected {}, got a fractional number", m_Type.name)));
            if (!in_range(v))
                return std::unexpected(Error::type_mismatch(render(v), std::format("number is out of range for {}", m_Type.name)));
            break;
        case type_kind::floating:
            if (!v.is_number()) return std::unexpected(detail::mismatch(v, "number"));
            break;
        case type_kind::string:
            if (!v.is_string()) return std::unexpected(detail::mismatch(v, "string"));
            break;
        default:
            return std::unexpected(Error::make(Error::code::configuration,
                std::format("{} is not a scalar type", m_Type.name)));
        }
        return m_Type.make_scalar(v);
    }

#pragma endregion
#pragma region Containers

    ListConverter::ListConverter(ConverterPtr element, TypeDescriptor type)
        : m_Element{ std::move(element) }, m_Type{ std::move(type) } {}

    Result<std::any> ListConverter::convert(const value& v) const {
        if (!v.is_array()) return std::unexpected(detail::mismatch(v, "array"));
        const auto& arr = v.as_array();
        std::vector<std::any> parts;
        parts.reserve(arr.size());
        for (size_t i = 0; i < arr.size(); i++) {
            auto part = m_Element->convert(arr[i]);
            if (!part) return std::unexpected(std::move(part.error().at_index(i)));
            if (!detail::fits(*part, m_Type.arguments.front()))
                return std::unexpected(std::move(detail::misfit(arr[i], *m_Element, m_Type.arguments.front()).at_index(i)));
            parts.push_back(std::move(*part));
        }
        return m_Type.make_sequence(std::move(parts));
    }

    SetConverter::SetConverter(ConverterPtr element, TypeDescriptor type)
        : m_Element{ std::move(element) }, m_Type{ std::move(type) } {}

    Result<std::any> SetConverter::convert(const value& v) const {
        if (!v.is_array()) return std::unexpected(detail::mismatch(v, "array"));
        const auto& arr = v.as_array();
        std::vector<std::any> parts;
        parts.reserve(arr.size());
        for (size_t i = 0; i < arr.size(); i++) {
            auto part = m_Element->convert(arr[i]);
            if (!part) return std::unexpected(std::move(part.error().at_index(i)));
            if (!detail::fits(*part, m_Type.arguments.front()))
                return std::unexpected(std::move(detail::misfit(arr[i], *m_Element, m_Type.arguments.front()).at_index(i)));
            parts.push_back(std::move(*part));
        }
        return m_Type.make_sequence(std::move(parts));
    }

    MappingConverter::MappingConverter(ConverterPtr element, TypeDescriptor type)
        : m_Element{ std::move(element) }, m_Type{ std::move(type) } {}

    Result<std::any> MappingConverter::convert(const value& v) const {
        if (!v.is_object()) return std::unexpected(detail::mismatch(v, "object"));
        std::vector<std::pair<std::string, std::any>> parts;
        parts.reserve(v.size());
        for (const auto& [key, member] : v.as_object()) {
            auto part = m_Element->convert(member);
            if (!part) return std::unexpected(std::move(part.error().at_key(key)));
            if (!detail::fits(*part, m_Type.arguments.front()))
                return std::unexpected(std::move(detail::misfit(member, *m_Element, m_Type.arguments.front()).at_key(key)));
            parts.emplace_back(std::string{ key }, std::move(*part));
        }
        return m_Type.make_mapping(std::move(parts));
    }

#pragma endregion
#pragma region Enums

    EnumByNameConverter::EnumByNameConverter(std::shared_ptr<const EnumSchema> schema)
        : m_Schema{ std::move(schema) } {}

    const EnumMember* EnumByNameConverter::lookup(const value& v) const {
        if (!v.is_string()) return nullptr;
        const auto& s = v.as_string();
        for (const auto& member : m_Schema->members) {
            if (member.name == s) return &member;
        }
        return nullptr;
    }

    bool EnumByNameConverter::accepts(const value& v) const {
        return lookup(v) != nullptr;
    }

    Result<std::any> EnumByNameConverter::convert(const value& v) const {
        if (!v.is_string()) return std::unexpected(detail::mismatch(v, std::format("{} member name", m_Schema->name)));
        if (const EnumMember* member = lookup(v)) return member->enumerator;
        return std::unexpected(Error::type_mismatch(render(v), std::format("not a valid member of enum {}", m_Schema->name)));
    }

    EnumCaseInsensitiveConverter::EnumCaseInsensitiveConverter(std::shared_ptr<const EnumSchema> schema)
        : m_Schema{ std::move(schema) } {
        for (const auto& member : m_Schema->members) {
            m_Lowercase.emplace(detail::lowercase(member.name), &member);
        }
    }

    const EnumMember* EnumCaseInsensitiveConverter::lookup(const value& v) const {
        if (!v.is_string()) return nullptr;
        auto it = m_Lowercase.find(detail::lowercase(v.as_string()));
        return it == m_Lowercase.end() ? nullptr : it->second;
    }

    bool EnumCaseInsensitiveConverter::accepts(const value& v) const {
        return lookup(v) != nullptr;
    }

    Result<std::any> EnumCaseInsensitiveConverter::convert(const value& v) const {
        if (!v.is_string()) return std::unexpected(detail::mismatch(v, std::format("{} member name", m_Schema->name)));
        if (const EnumMember* member = lookup(v)) return member->enumerator;
        return std::unexpected(Error::type_mismatch(render(v), std::format("not a valid member of enum {}", m_Schema->name)));
    }

    EnumByValueConverter::EnumByValueConverter(std::shared_ptr<const EnumSchema> schema)
        : m_Schema{ std::move(schema) } {}

    const EnumMember* EnumByValueConverter::lookup(const value& v) const {
        for (const auto& member : m_Schema->members) {
            if (member.associated == v) return &member;
        }
        return nullptr;
    }

    Result<std::any> EnumByValueConverter::convert(const value& v) const {
        if (const EnumMember* member = lookup(v)) return member->enumerator;
        return std::unexpected(Error::type_mismatch(render(v), std::format("not a value of enum {}", m_Schema->name)));
    }

#pragma endregion
#pragma region Decimal

    bool DecimalConverter::is_decimal_literal(std::string_view s) noexcept {
        size_t i = 0;
        auto digits = [&] {
            size_t start = i;
            while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) i++;
            return i - start;
        };

        if (i < s.size() && (s[i] == '+' || s[i] == '-')) i++;
        size_t int_digits = digits();
        size_t frac_digits = 0;
        if (i < s.size() && s[i] == '.') {
            i++;
            frac_digits = digits();
        }
        if (int_digits + frac_digits == 0) return false;

        if (i < s.size() && (s[i] == 'e' || s[i] == 'E')) {
            i++;
            if (i < s.size() && (s[i] == '+' || s[i] == '-')) i++;
            if (digits() == 0) return false;
        }
        return i == s.size();
    }

    bool DecimalConverter::accepts(const value& v) const {
        if (v.is_number()) return std::isfinite(v.as_number());
        return v.is_string() && is_decimal_literal(v.as_string());
    }

    Result<std::any> DecimalConverter::to_decimal(const value& v, std::string_view literal) {
        decimal d;
        try {
            d = decimal{ std::string{ literal } };
        }
        catch (const std::runtime_error&) {
            return std::unexpected(Error::type_mismatch(render(v), "decimal literal out of range"));
        }
        // Exponents past the type's range saturate instead of throwing.
        if (!boost::multiprecision::isfinite(d))
            return std::unexpected(Error::type_mismatch(render(v), "decimal literal out of range"));
        return std::any(std::move(d));
    }

    Result<std::any> DecimalConverter::convert(const value& v) const {
        if (v.is_number()) {
            double d = v.as_number();
            if (!std::isfinite(d)) return std::unexpected(detail::mismatch(v, "finite number"));
            char buf[64];
            auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), d);
            if (ec != std::errc{}) return std::unexpected(detail::mismatch(v, "decimal"));
            return to_decimal(v, std::string_view{ buf, ptr });
        }
        if (v.is_string()) {
            const auto& s = v.as_string();
            if (!is_decimal_literal(s))
                return std::unexpected(Error::type_mismatch(render(v), "string is not a decimal literal"));
            return to_decimal(v, s);
        }
        return std::unexpected(detail::mismatch(v, "number or decimal string"));
    }

#pragma endregion
#pragma region Composites

    UnionConverter::UnionConverter(std::vector<ConverterPtr> alternatives, TypeDescriptor type)
        : m_Alternatives{ std::move(alternatives) }, m_Type{ std::move(type) } {}

    bool UnionConverter::accepts(const value& v) const {
        for (const auto& alt : m_Alternatives) {
            if (alt->accepts(v)) return true;
        }
        return false;
    }

    Result<std::any> UnionConverter::convert(const value& v) const {
        for (size_t i = 0; i < m_Alternatives.size(); i++) {
            if (!m_Alternatives[i]->accepts(v)) continue;
            auto part = m_Alternatives[i]->convert(v);
            if (!part) return std::unexpected(std::move(part.error()));
            if (!detail::fits(*part, m_Type.arguments[i]))
                return std::unexpected(detail::misfit(v, *m_Alternatives[i], m_Type.arguments[i]));
            return m_Type.make_alternative(i, std::move(*part));
        }
        return std::unexpected(Error::type_mismatch(render(v),
            std::format("{} value matches no alternative of {}", kind_name(v.type()), m_Type.name)));
    }

    NullableConverter::NullableConverter(ConverterPtr inner, TypeDescriptor type)
        : m_Inner{ std::move(inner) }, m_Type{ std::move(type) } {}

    Result<std::any> NullableConverter::convert(const value& v) const {
        if (v.is_null()) return m_Type.make_optional(std::nullopt);
        auto part = m_Inner->convert(v);
        if (!part) return std::unexpected(std::move(part.error()));
        if (!detail::fits(*part, m_Type.arguments.front()))
            return std::unexpected(detail::misfit(v, *m_Inner, m_Type.arguments.front()));
        return m_Type.make_optional(std::optional<std::any>{ std::move(*part) });
    }

    ObjectConverter::ObjectConverter(const Registry& registry, std::type_index type, std::string name)
        : m_Registry{ registry }, m_Type{ type }, m_Name{ std::move(name) } {}

    Result<std::any> ObjectConverter::convert(const value& v) const {
        return m_Registry.parse(m_Type, v);
    }

    FunctionConverter::FunctionConverter(std::string name, ConvertFn convert, AcceptFn accepts)
        : m_Name{ std::move(name) }, m_Convert{ std::move(convert) }, m_Accepts{ std::move(accepts) } {}

#pragma endregion

} // namespace Stanza
