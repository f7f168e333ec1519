#include "stanza/registry.hpp"
#include "stanza/log.hpp"
#include "stanza/model_builder.hpp"
#include "stanza/parse.hpp"

#include <algorithm>
#include <format>


namespace Stanza {

    namespace {

        // Marks a class as being built for the lifetime of the guard.
        class BuildingGuard {
        public:
            BuildingGuard(std::unordered_set<std::type_index>& building, std::type_index type)
                : m_Building{ building }, m_Type{ type } {
                m_Building.insert(m_Type);
            }
            ~BuildingGuard() { m_Building.erase(m_Type); }

            BuildingGuard(const BuildingGuard&) = delete;
            BuildingGuard& operator=(const BuildingGuard&) = delete;

        private:
            std::unordered_set<std::type_index>& m_Building;
            std::type_index m_Type;
        };

    } // namespace

    Registry::Registry(ModelOptions options)
        : m_Options{ std::move(options) } {
        if (!m_Options.naming) m_Options.naming = naming::identity;
    }

    void Registry::declare_schema(ClassSchema schema) {
        auto type = schema.type;
        m_Classes.insert_or_assign(type, std::make_unique<ClassSchema>(std::move(schema)));
    }

    const ClassSchema* Registry::find_class(std::type_index type) const {
        auto it = m_Classes.find(type);
        return it == m_Classes.end() ? nullptr : it->second.get();
    }

    std::shared_ptr<const EnumSchema> Registry::find_enum(std::type_index type) const {
        auto it = m_Enums.find(type);
        if (it == m_Enums.end()) return nullptr;
        return it->second;
    }

    std::shared_ptr<const ClassModel> Registry::cached(std::type_index type) const {
        std::shared_lock lock{ m_CacheMutex };
        auto it = m_Models.find(type);
        return it == m_Models.end() ? nullptr : it->second;
    }

    bool Registry::is_built(std::type_index type) const {
        return cached(type) != nullptr;
    }

    Result<std::shared_ptr<const ClassModel>> Registry::model(std::type_index type) const {
        if (auto found = cached(type)) return found;

        std::lock_guard build{ m_BuildMutex };
        // Another thread may have published it while we waited.
        if (auto found = cached(type)) return found;
        return build_locked(type);
    }

    Result<void> Registry::prepare(std::type_index type) const {
        std::lock_guard build{ m_BuildMutex };
        if (m_Building.contains(type) || cached(type)) return {};

        auto built = build_locked(type);
        if (!built) return std::unexpected(std::move(built.error()));
        return {};
    }

    Result<std::shared_ptr<const ClassModel>> Registry::build_locked(std::type_index type) const {
        const ClassSchema* schema = find_class(type);
        if (!schema) {
            return std::unexpected(Error::configuration({},
                std::format("class {} is not declared", detail::demangle(type.name()))));
        }
        if (m_Building.contains(type)) {
            return std::unexpected(Error::configuration(schema->name,
                std::format("model of {} requested while it is being built", schema->name)));
        }

        Result<ClassModel> built = [&] {
            BuildingGuard guard{ m_Building, type };
            return ModelBuilder{ *this, m_Provider, m_Options }.build(*schema);
        }();

        if (!built) {
            // Nested failures travel outward; report them once, at the outermost build.
            if (m_Building.empty()) log::warn("cannot build model for {}: {}", schema->name, built.error().what());
            return std::unexpected(std::move(built.error()));
        }

        auto published = std::make_shared<const ClassModel>(std::move(*built));
        {
            std::unique_lock lock{ m_CacheMutex };
            m_Models.insert_or_assign(type, published);
        }
        return published;
    }

    Result<void> Registry::build_all() const {
        std::vector<const ClassSchema*> schemas;
        schemas.reserve(m_Classes.size());
        for (const auto& [type, schema] : m_Classes) schemas.push_back(schema.get());
        std::ranges::sort(schemas, {}, &ClassSchema::name);

        for (const ClassSchema* schema : schemas) {
            auto built = model(schema->type);
            if (!built) return std::unexpected(std::move(built.error()));
        }
        log::info("built {} class model(s)", schemas.size());
        return {};
    }

    Result<std::any> Registry::parse(std::type_index type, const value& v) const {
        auto found = model(type);
        if (!found) return std::unexpected(std::move(found.error()));
        return parse_model(**found, v, m_Options);
    }

} // namespace Stanza
