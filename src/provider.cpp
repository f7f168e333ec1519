#include "stanza/provider.hpp"
#include "stanza/log.hpp"
#include "stanza/registry.hpp"

#include <format>
#include <memory>


namespace Stanza {

    ConverterProvider::ConverterProvider() {
        install_builtin_rules();
    }

    Result<ConverterPtr> ConverterProvider::resolve(const TypeDescriptor& type, const FieldContext& ctx) const {
        if (const ConverterPtr* forced = find_override(ctx.owner.type, ctx.field)) {
            log::trace("{}.{}: using registered override ({})", ctx.owner.name, ctx.field, (*forced)->target());
            return *forced;
        }
        return resolve_type(type, ctx);
    }

    Result<ConverterPtr> ConverterProvider::resolve_type(const TypeDescriptor& type, const FieldContext& ctx) const {
        if (auto it = m_TypeRules.find(type.type); it != m_TypeRules.end()) return it->second;

        auto rule = m_Rules.find(type.kind);
        if (rule == m_Rules.end() || !rule->second) {
            return std::unexpected(Error::configuration(ctx.owner.name,
                std::format("unsupported type {} ({})", type.name, to_string(type.kind))));
        }
        return rule->second(*this, type, ctx);
    }

    void ConverterProvider::override_field(std::type_index owner, std::string field, ConverterPtr converter) {
        m_Overrides.insert_or_assign({ owner, std::move(field) }, std::move(converter));
    }

    void ConverterProvider::register_type(std::type_index type, ConverterPtr converter) {
        m_TypeRules.insert_or_assign(type, std::move(converter));
    }

    void ConverterProvider::set_rule(type_kind kind, Rule rule) {
        m_Rules.insert_or_assign(kind, std::move(rule));
    }

    const ConverterPtr* ConverterProvider::find_override(std::type_index owner, std::string_view field) const {
        auto it = m_Overrides.find({ owner, std::string{ field } });
        return it == m_Overrides.end() ? nullptr : &it->second;
    }

    ConverterPtr ConverterProvider::leaf(const TypeDescriptor& type) const {
        std::lock_guard lock{ m_CacheMutex };
        if (auto it = m_LeafCache.find(type.type); it != m_LeafCache.end()) return it->second;

        ConverterPtr created;
        switch (type.kind) {
        case type_kind::raw: created = std::make_shared<const PassthroughConverter>(); break;
        case type_kind::decimal: created = std::make_shared<const DecimalConverter>(); break;
        default: created = std::make_shared<const ScalarConverter>(type); break;
        }
        m_LeafCache.emplace(type.type, created);
        return created;
    }

    namespace {

        // Resolves arguments[0] of a container or optional descriptor.
        Result<ConverterPtr> element_of(const ConverterProvider& provider, const TypeDescriptor& type, const FieldContext& ctx) {
            if (type.arguments.empty()) {
                return std::unexpected(Error::configuration(ctx.owner.name,
                    std::format("{} declares no element type", type.name)));
            }
            return provider.resolve_type(type.arguments.front(), ctx);
        }

    } // namespace

    void ConverterProvider::install_builtin_rules() {
        Rule leaf_rule = [](const ConverterProvider& p, const TypeDescriptor& t, const FieldContext&) -> Result<ConverterPtr> {
            return p.leaf(t);
        };
        for (type_kind k : { type_kind::raw, type_kind::boolean, type_kind::integer, type_kind::floating,
                             type_kind::string, type_kind::decimal }) {
            m_Rules.emplace(k, leaf_rule);
        }

        m_Rules.emplace(type_kind::list, [](const ConverterProvider& p, const TypeDescriptor& t, const FieldContext& ctx) -> Result<ConverterPtr> {
            auto element = element_of(p, t, ctx);
            if (!element) return std::unexpected(std::move(element.error()));
            return std::make_shared<const ListConverter>(std::move(*element), t);
        });

        m_Rules.emplace(type_kind::set, [](const ConverterProvider& p, const TypeDescriptor& t, const FieldContext& ctx) -> Result<ConverterPtr> {
            auto element = element_of(p, t, ctx);
            if (!element) return std::unexpected(std::move(element.error()));
            return std::make_shared<const SetConverter>(std::move(*element), t);
        });

        m_Rules.emplace(type_kind::map, [](const ConverterProvider& p, const TypeDescriptor& t, const FieldContext& ctx) -> Result<ConverterPtr> {
            auto element = element_of(p, t, ctx);
            if (!element) return std::unexpected(std::move(element.error()));
            return std::make_shared<const MappingConverter>(std::move(*element), t);
        });

        m_Rules.emplace(type_kind::optional, [](const ConverterProvider& p, const TypeDescriptor& t, const FieldContext& ctx) -> Result<ConverterPtr> {
            auto element = element_of(p, t, ctx);
            if (!element) return std::unexpected(std::move(element.error()));
            return std::make_shared<const NullableConverter>(std::move(*element), t);
        });

        m_Rules.emplace(type_kind::union_, [](const ConverterProvider& p, const TypeDescriptor& t, const FieldContext& ctx) -> Result<ConverterPtr> {
            if (t.arguments.empty()) {
                return std::unexpected(Error::configuration(ctx.owner.name, std::format("{} has no alternatives", t.name)));
            }
            std::vector<ConverterPtr> alternatives;
            alternatives.reserve(t.arguments.size());
            for (const auto& alt : t.arguments) {
                auto converter = p.resolve_type(alt, ctx);
                if (!converter) return std::unexpected(std::move(converter.error()));
                alternatives.push_back(std::move(*converter));
            }
            return std::make_shared<const UnionConverter>(std::move(alternatives), t);
        });

        m_Rules.emplace(type_kind::enumeration, [](const ConverterProvider&, const TypeDescriptor& t, const FieldContext& ctx) -> Result<ConverterPtr> {
            auto schema = ctx.registry.find_enum(t.type);
            if (!schema || schema->members.empty()) {
                return std::unexpected(Error::configuration(ctx.owner.name,
                    std::format("enum {} has no declared members", t.name)));
            }
            switch (ctx.enum_matching) {
            case EnumMatching::case_insensitive: return std::make_shared<const EnumCaseInsensitiveConverter>(std::move(schema));
            case EnumMatching::by_value: return std::make_shared<const EnumByValueConverter>(std::move(schema));
            case EnumMatching::by_name: break;
            }
            return std::make_shared<const EnumByNameConverter>(std::move(schema));
        });

        m_Rules.emplace(type_kind::object, [](const ConverterProvider&, const TypeDescriptor& t, const FieldContext& ctx) -> Result<ConverterPtr> {
            const ClassSchema* nested = ctx.registry.find_class(t.type);
            if (!nested) {
                return std::unexpected(Error::configuration(ctx.owner.name,
                    std::format("class {} is not declared", t.name)));
            }
            if (auto prepared = ctx.registry.prepare(t.type); !prepared) return std::unexpected(std::move(prepared.error()));
            return std::make_shared<const ObjectConverter>(ctx.registry, t.type, nested->name);
        });
    }

} // namespace Stanza
