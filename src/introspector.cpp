#include "stanza/introspector.hpp"

#include <format>


namespace Stanza {

    Result<model_meta> introspector::describe_model(const object_ref& obj) const {
        return std::unexpected(SerializeError::make(SerializeError::code::not_a_model, type_name(obj), "",
            std::format("'{}' is not a model", type_name(obj))));
    }

#pragma region object_introspector

    object_introspector::object_introspector(const registry& reg) noexcept : m_Registry{ reg } {}

    Result<const class_info*> object_introspector::lookup(const object_ref& obj, std::string_view attribute) const {
        const class_info* info = m_Registry.find(obj.type);
        if (!info) {
            return std::unexpected(SerializeError::make(SerializeError::code::attribute_resolution, obj.type.name(), attribute,
                std::format("type '{}' is not registered", obj.type.name())));
        }
        return info;
    }

    Result<std::vector<std::string>> object_introspector::default_field_names(const object_ref& obj) const {
        auto info = lookup(obj, "");
        if (!info) return std::unexpected(info.error());

        std::vector<std::string> names;
        for (const auto& attr : (*info)->attributes) {
            if (attr.kind != attribute_kind::member && attr.kind != attribute_kind::relation) continue;
            if (attr.name.starts_with('_')) continue;
            names.push_back(attr.name);
        }
        return names;
    }

    Result<raw> object_introspector::read_attribute(const object_ref& obj, std::string_view name) const {
        auto info = lookup(obj, name);
        if (!info) return std::unexpected(info.error());

        const attribute_info* attr = (*info)->find(name);
        if (!attr || !attr->read) {
            return std::unexpected(SerializeError::make(SerializeError::code::attribute_resolution, (*info)->name, name,
                std::format("'{}' object has no attribute '{}'", (*info)->name, name)));
        }
        return attr->read(obj);
    }

    std::string object_introspector::display(const object_ref& obj) const {
        const class_info* info = m_Registry.find(obj.type);
        if (!info) return std::format("<{}>", obj.type.name());
        if (info->display) return info->display(obj);
        return std::format("<{}>", info->name);
    }

    std::string object_introspector::type_name(const object_ref& obj) const {
        const class_info* info = m_Registry.find(obj.type);
        return info ? info->name : std::string{ obj.type.name() };
    }

    Result<model_meta> object_introspector::describe_model(const object_ref& obj) const {
        const class_info* info = m_Registry.find(obj.type);
        if (!info || !info->model) return introspector::describe_model(obj);
        return *info->model;
    }

#pragma endregion
#pragma region model_introspector

    model_introspector::model_introspector(const registry& reg, bool include_primary_key) noexcept
        : object_introspector{ reg }, m_IncludePrimaryKey{ include_primary_key } {}

    Result<std::vector<std::string>> model_introspector::default_field_names(const object_ref& obj) const {
        auto info = lookup(obj, "");
        if (!info) return std::unexpected(info.error());
        if (!(*info)->model) return object_introspector::default_field_names(obj);

        const model_meta& meta = *(*info)->model;
        std::vector<std::string> names;
        for (const auto& attr : (*info)->attributes) {
            if (attr.kind != attribute_kind::member) continue;
            if (!m_IncludePrimaryKey && attr.name == meta.pk_name) continue;
            names.push_back(attr.name);
        }
        for (const auto& attr : (*info)->attributes) {
            if (attr.kind == attribute_kind::relation) names.push_back(attr.name);
        }
        return names;
    }

#pragma endregion

    std::shared_ptr<const introspector> default_introspector() {
        static const auto instance = std::make_shared<const object_introspector>();
        return instance;
    }

} // namespace Stanza
