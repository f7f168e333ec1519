#include "stanza/model_builder.hpp"
#include "stanza/log.hpp"

#include <format>
#include <unordered_map>


namespace Stanza {

    ModelBuilder::ModelBuilder(const Registry& registry, const ConverterProvider& provider, const ModelOptions& options)
        : m_Registry{ registry }, m_Provider{ provider }, m_Options{ options } {}

    Result<ClassModel> ModelBuilder::build(const ClassSchema& schema) const {
        if (!schema.construct) {
            return std::unexpected(Error::configuration(schema.name,
                std::format("class {} has no usable constructor", schema.name)));
        }

        const NameRule& naming = schema.naming ? schema.naming : m_Options.naming;
        EnumMatching matching = schema.enum_matching.value_or(m_Options.enum_matching);

        std::vector<AttributeModel> attributes;
        attributes.reserve(schema.fields.size());
        std::unordered_map<std::string, std::string> taken; // external -> source

        for (size_t i = 0; i < schema.fields.size(); i++) {
            const auto& field = schema.fields[i];
            if (field.name.empty()) {
                return std::unexpected(Error::configuration(schema.name,
                    std::format("field #{} of {} is not a named field", i, schema.name)));
            }

            auto attr = build_attribute(schema, field, naming, matching);
            if (!attr) return std::unexpected(std::move(attr.error()));

            auto [it, inserted] = taken.emplace(attr->external_name, attr->source_name);
            if (!inserted) {
                return std::unexpected(Error::configuration(schema.name,
                    std::format("fields \"{}\" and \"{}\" both map to external name \"{}\"",
                        it->second, attr->source_name, attr->external_name)));
            }
            attributes.push_back(std::move(*attr));
        }

        log::debug("built model for {} with {} attribute(s)", schema.name, attributes.size());
        return ClassModel{ schema.type, schema.name, std::move(attributes), schema.construct };
    }

    Result<AttributeModel> ModelBuilder::build_attribute(const ClassSchema& schema, const FieldSchema& field,
                                                         const NameRule& naming, EnumMatching matching) const {
        if (field.type.kind == type_kind::unspecified) {
            return std::unexpected(Error::configuration(schema.name,
                std::format("field \"{}\" of {} has no declared type", field.name, schema.name)));
        }

        AttributeModel attr;
        attr.source_name = field.name;
        attr.external_name = naming(field.name);
        attr.optional = field.mode == presence::defaulted;
        attr.declared_type = field.type;
        attr.assign = field.assign;

        if (attr.external_name.empty()) {
            return std::unexpected(Error::configuration(schema.name,
                std::format("name rule maps field \"{}\" of {} to an empty name", field.name, schema.name)));
        }

        if (field.type.kind == type_kind::optional) {
            if (field.type.arguments.empty()) {
                return std::unexpected(Error::configuration(schema.name,
                    std::format("field \"{}\" of {} is optional without a value type", field.name, schema.name)));
            }
            attr.declared_type = field.type.arguments.front();
            attr.optional = true;
        }

        FieldContext ctx{ m_Registry, schema, field.name, matching };
        auto converter = m_Provider.resolve(attr.declared_type, ctx);
        if (!converter) {
            Error e = std::move(converter.error());
            if (e.errc == Error::code::configuration && e.path.empty()) e.path = std::format(".{}", field.name);
            return std::unexpected(std::move(e));
        }
        attr.converter = std::move(*converter);
        return attr;
    }

} // namespace Stanza
