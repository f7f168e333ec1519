#pragma once

#include "stanza/config.hpp"
#include "stanza/error.hpp"
#include "stanza/model.hpp"
#include "stanza/options.hpp"
#include "stanza/provider.hpp"
#include "stanza/schema.hpp"

namespace Stanza {

    class Registry;

    /// @ingroup StanzaModel
    /// @brief Turns a declared `ClassSchema` into a `ClassModel`.
    ///
    /// @details
    /// The builder validates the declaration and resolves one converter per
    /// field. It rejects, with a `configuration` error:
    ///  - a class without a usable constructor
    ///  - a field without a name or without a declared type
    ///  - a field whose type the provider cannot resolve
    ///  - two fields that map to the same external name
    ///
    /// A field is optional when it is declared `presence::defaulted` or its
    /// type is `std::optional<T>`; in the latter case the attribute's
    /// declared type is `T` and its converter is resolved for `T`.
    ///
    /// The builder does not cache anything; `Registry` does.
    class STANZA_API ModelBuilder {
    public:
        ModelBuilder(const Registry& registry, const ConverterProvider& provider, const ModelOptions& options);

        [[nodiscard]] Result<ClassModel> build(const ClassSchema& schema) const;

    private:
        const Registry& m_Registry;
        const ConverterProvider& m_Provider;
        const ModelOptions& m_Options;

        [[nodiscard]] Result<AttributeModel> build_attribute(const ClassSchema& schema, const FieldSchema& field,
                                                             const NameRule& naming, EnumMatching matching) const;
    };

} // namespace Stanza
