#include "stanza/parse.hpp"

#include <optional>
#include <vector>


namespace Stanza {

    Result<std::any> parse_model(const ClassModel& model, const value& v, const ModelOptions& options) {
        if (!v.is_object()) {
            Error e = detail::mismatch(v, std::format("object for {}", model.name()));
            e.owner = model.name();
            return std::unexpected(std::move(e));
        }

        const auto& attributes = model.attributes();
        std::vector<std::optional<std::any>> arguments(attributes.size());

        for (size_t i = 0; i < attributes.size(); i++) {
            const auto& attr = attributes[i];
            const value* member = v.find(attr.external_name);

            bool absent = !member || (attr.optional && options.null_as_absent && member->is_null());
            if (absent) {
                if (!attr.optional) return std::unexpected(Error::missing_field(model.name(), attr.external_name));
                continue;
            }

            auto converted = attr.converter->convert(*member);
            if (!converted) return std::unexpected(std::move(converted.error().at_field(model.name(), attr.external_name)));
            arguments[i] = std::move(*converted);
        }

        return model.instantiate(std::move(arguments));
    }

} // namespace Stanza
