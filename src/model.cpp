#include "stanza/model.hpp"

#include <format>


namespace Stanza {

    ClassModel::ClassModel(std::type_index type, std::string name, std::vector<AttributeModel> attributes,
                           std::function<std::any()> construct)
        : m_Type{ type }, m_Name{ std::move(name) }, m_Attributes{ std::move(attributes) }, m_Construct{ std::move(construct) } {}

    const AttributeModel* ClassModel::find(std::string_view external_name) const noexcept {
        for (const auto& attr : m_Attributes) {
            if (attr.external_name == external_name) return &attr;
        }
        return nullptr;
    }

    Result<std::any> ClassModel::instantiate(std::vector<std::optional<std::any>>&& arguments) const {
        if (arguments.size() != m_Attributes.size()) {
            return std::unexpected(Error::configuration(m_Name,
                std::format("expected {} arguments, got {}", m_Attributes.size(), arguments.size())));
        }

        std::any instance = m_Construct();
        for (size_t i = 0; i < m_Attributes.size(); i++) {
            if (!arguments[i]) continue;
            const auto& attr = m_Attributes[i];
            if (!attr.assign(instance, std::move(*arguments[i]))) {
                Error e = Error::type_mismatch({}, std::format("converter {} produced a value that does not fit {}",
                    attr.converter->target(), attr.declared_type.name));
                return std::unexpected(std::move(e.at_field(m_Name, attr.external_name)));
            }
        }
        return instance;
    }

} // namespace Stanza
