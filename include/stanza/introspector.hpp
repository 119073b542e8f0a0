#pragma once


/*
    --------------------------------------------------------
    Stanza::introspector - Default field discovery interface
    --------------------------------------------------------
    Serializers never look inside a domain object themselves. They ask an
    introspector:
        - which field names an object has by default
        - how to read one named attribute
        - how to show the object flat (a string) when it is not expanded

    The only promises a serializer relies on are that the default names are
    deterministic for a given type and that every one of them can be read
    with `read_attribute`.

    Two adapters over `Stanza::registry` are provided:
        - `object_introspector`: plain objects; the default fields are the
          public instance members and relations, in registration order
        - `model_introspector`: model objects; the default fields are the
          schema fields followed by the relations
*/

#include <expected>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "stanza/config.hpp"
#include "stanza/error.hpp"
#include "stanza/raw.hpp"
#include "stanza/registry.hpp"

/// @defgroup StanzaIntrospection Default Field Discovery
/// @ingroup Stanza
/// @brief Discovering and reading the natural fields of objects

namespace Stanza {

    /// @ingroup StanzaIntrospection
    /// @brief Collaborator answering questions about domain objects.
    ///
    /// @details
    /// Implementations must be safe to call from several threads at once.
    class introspector {
    public:
        virtual ~introspector() = default;

        /// @brief Names serialized when no explicit field list says otherwise
        [[nodiscard]] virtual Result<std::vector<std::string>> default_field_names(const object_ref& obj) const = 0;

        /// @brief Reads one attribute
        /// @return The raw value, or `attribute_resolution` naming the type and attribute
        [[nodiscard]] virtual Result<raw> read_attribute(const object_ref& obj, std::string_view name) const = 0;

        /// @brief Flat (string) representation of the object
        [[nodiscard]] virtual std::string display(const object_ref& obj) const = 0;

        /// @brief Name of the object's type, for diagnostics
        [[nodiscard]] virtual std::string type_name(const object_ref& obj) const = 0;

        /// @brief Schema metadata of a model object
        /// @return The metadata, or `not_a_model`
        [[nodiscard]] STANZA_API virtual Result<model_meta> describe_model(const object_ref& obj) const;
    };

    /// @ingroup StanzaIntrospection
    /// @brief Plain-object discovery over a reflection registry
    class object_introspector : public introspector {
    public:
        STANZA_API explicit object_introspector(const registry& reg = registry::global()) noexcept;

        [[nodiscard]] STANZA_API Result<std::vector<std::string>> default_field_names(const object_ref& obj) const override;
        [[nodiscard]] STANZA_API Result<raw> read_attribute(const object_ref& obj, std::string_view name) const override;
        [[nodiscard]] STANZA_API std::string display(const object_ref& obj) const override;
        [[nodiscard]] STANZA_API std::string type_name(const object_ref& obj) const override;
        [[nodiscard]] STANZA_API Result<model_meta> describe_model(const object_ref& obj) const override;

    protected:
        [[nodiscard]] STANZA_API Result<const class_info*> lookup(const object_ref& obj, std::string_view attribute) const;

        const registry& m_Registry;
    };

    /// @ingroup StanzaIntrospection
    /// @brief Schema-driven discovery for model objects.
    ///
    /// @details
    /// For types registered with `model(...)` the default names are every
    /// member (the primary key included unless @p include_primary_key is
    /// false) followed by every relation, regardless of leading underscores.
    /// Other types are discovered like plain objects.
    class model_introspector : public object_introspector {
    public:
        STANZA_API explicit model_introspector(const registry& reg = registry::global(), bool include_primary_key = true) noexcept;

        [[nodiscard]] STANZA_API Result<std::vector<std::string>> default_field_names(const object_ref& obj) const override;

    private:
        bool m_IncludePrimaryKey;
    };

    /// @ingroup StanzaIntrospection
    /// @brief Shared plain-object introspector over `registry::global()`
    [[nodiscard]] STANZA_API std::shared_ptr<const introspector> default_introspector();

} // namespace Stanza
