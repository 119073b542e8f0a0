#pragma once


/*
    ---------------------------------------------------------
    Stanza::serializer - Recursive field resolution and assembly
    ---------------------------------------------------------
    A `serializer` is a composite `field`: where a plain field coerces an
    attribute into a scalar, a serializer expands an object into a mapping
    of named sub-fields, each of which may itself be a serializer.

    ---------------------
    Expanding one object
    ---------------------
    1. Cycle check: if the object is already being expanded further up the
       path, the recursive field factory produces the value instead
       (default: the flat strategy)
    2. Depth check: with no depth left, the flat field factory produces the
       value instead; otherwise the remaining depth drops by one for the
       object's own fields
    3. Field names (`get_field_names`):
        - `fields`, when set, is the exact ordered list
        - otherwise: declared names, then the discovered default names (only
          when nothing is declared or `include_default_fields` is set), then
          `include`; duplicates are dropped keeping the first occurrence and
          `exclude` removes names last
    4. Field per name (`get_field_serializer`): the declared field, else
       the flat factory (no depth left) or the nested factory (default: a
       field delegating back to this serializer)
    5. Assembly: every output key is resolved first and two names sharing a
       key is a `field_name_conflict`, reported before any attribute is
       read; then each value is resolved while the object sits on the path.
       Members keep resolution order with `preserve_field_ordering`, and are
       sorted by key otherwise

    The root object of `serialize(...)` is always expanded; `depth` bounds
    the nested levels below it. Sequences never consume depth.

    A field whose source is `"*"` receives the current object unchanged: a
    nested serializer declared that way re-expands the same object under a
    wrapper key, without consuming depth and without counting as a cycle.

    -----
    Usage
    -----
        auto s = Stanza::serializer_builder{}
                     .exclude({ "first_name", "last_name" })
                     .include({ "full_name" })
                     .build();
        if (!s) return;
        auto tree = (*s)->serialize(john);   // {"age": 42, "full_name": "john doe"}

    ----------------
    Field factories
    ----------------
    The flat and recursive factories are consulted where expansion has to
    stop, so they should return leaf fields. Their transform, when set,
    replaces `produce` as it does for declared fields. A serializer returned
    from either factory meets the same cycle or exhausted depth and degrades
    to the flat representation again.

    Serializers are immutable once built and may be shared between threads;
    all per-call state lives in a `Stanza::context`.
*/

#include <concepts>
#include <cstddef>
#include <functional>
#include <initializer_list>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "stanza/config.hpp"
#include "stanza/context.hpp"
#include "stanza/error.hpp"
#include "stanza/field.hpp"
#include "stanza/introspector.hpp"
#include "stanza/raw.hpp"
#include "stanza/value.hpp"

/// @defgroup StanzaSerializer Serializers
/// @ingroup Stanza
/// @brief Composite fields resolving and assembling named sub-fields

namespace Stanza {

    class serializer;

    /// @ingroup StanzaSerializer
    /// @brief Strategy producing the field used for an undeclared name
    ///
    /// @details
    /// Called with the serializer asking and the field name being resolved
    /// (empty for root and sequence elements).
    using field_factory = std::function<field_ptr(const serializer& owner, std::string_view name)>;

    /// @ingroup StanzaSerializer
    /// @brief Shared handle to an immutable serializer
    using serializer_ptr = std::shared_ptr<const serializer>;

    /// @ingroup StanzaSerializer
    /// @brief Result of `serializer::serialize`
    using SerializeResult = Result<value>;

    /// @ingroup StanzaSerializer
    /// @brief Result of `serializer_builder::build`
    using BuildResult = Result<serializer_ptr>;

    /// @ingroup StanzaSerializer
    /// @brief Resolved configuration of a serializer, as produced by a builder
    struct SerializerOptions {
        FieldOptions field_options{};                               ///< Label, source and transform of the serializer itself.
        std::vector<std::pair<std::string, field_ptr>> declared{};  ///< Declared fields in declaration order.
        std::optional<std::vector<std::string>> fields{};           ///< Exact field list; overrides everything else.
        std::vector<std::string> include{};                         ///< Extra names appended after declared and default names.
        std::vector<std::string> exclude{};                         ///< Names removed last.
        depth_limit depth{};                                        ///< Nested levels expanded; `std::nullopt` = unbounded.
        bool include_default_fields = false;                        ///< Union discovered names with declared ones.
        bool preserve_field_ordering = false;                       ///< Keep resolution order instead of sorting keys.
        field_factory flat_field_factory{};                         ///< Used when depth is exhausted.
        field_factory nested_field_factory{};                       ///< Used when depth remains.
        field_factory recursive_field_factory{};                    ///< Used at a cycle point.
        std::shared_ptr<const introspector> introspection{};        ///< Overrides the inherited introspector.
    };

    /// @ingroup StanzaSerializer
    /// @brief Composite field expanding objects into mappings
    class serializer : public field {
    public:
        /// @brief Prefer `serializer_builder`, which validates the options
        STANZA_API explicit serializer(SerializerOptions opts);

        /// @ingroup StanzaSerializer
        /// @brief Serializes a raw value with a fresh context
        ///
        /// @details
        /// Objects are expanded, sequences are serialized element by
        /// element, callables are invoked and scalars pass through.
        [[nodiscard]] STANZA_API SerializeResult serialize(const raw& root) const;

        /// @ingroup StanzaSerializer
        /// @brief Serializes any C++ value with a fresh context
        template<typename T> requires (!std::convertible_to<const T&, raw>)
        [[nodiscard]] SerializeResult serialize(const T& root) const {
            return serialize(make_raw(root));
        }

        /// @brief Names to serialize for @p obj, in resolution order
        [[nodiscard]] STANZA_API Result<std::vector<std::string>> get_field_names(const object_ref& obj, context& ctx) const;

        /// @brief Declared field for @p name, else the default field
        [[nodiscard]] STANZA_API field_ptr get_field_serializer(std::string_view name, context& ctx) const;

        /// @brief Field used for an undeclared @p name at the current depth
        [[nodiscard]] STANZA_API field_ptr get_default_field_serializer(std::string_view name, context& ctx) const;

        /// @brief Expands objects, honouring the cycle and depth policies
        [[nodiscard]] STANZA_API Result<value> produce(const raw& r, context& ctx) const override;

        [[nodiscard]] const SerializerOptions& options() const noexcept { return m_Options; }

        /// @brief Field declared under @p name, or null
        [[nodiscard]] STANZA_API field_ptr declared_field(std::string_view name) const;

        /// @brief Creates the flat field used by default when depth runs out
        [[nodiscard]] STANZA_API field_ptr make_flat_field(std::string_view name) const;

        /// @brief Creates the field used by default for nested objects
        [[nodiscard]] STANZA_API field_ptr make_nested_field(std::string_view name) const;

        /// @brief Creates the field used by default at a cycle point
        [[nodiscard]] STANZA_API field_ptr make_recursive_field(std::string_view name) const;

    protected:
        [[nodiscard]] STANZA_API Result<value> produce_projection(const object_ref& parent, context& ctx) const override;

    private:
        [[nodiscard]] Result<value> produce_root(const raw& r, context& ctx) const;
        [[nodiscard]] Result<value> expand(const object_ref& obj, context& ctx) const;
        [[nodiscard]] depth_limit narrowed(depth_limit inherited) const noexcept;

        SerializerOptions m_Options;
    };

    /// @ingroup StanzaSerializer
    /// @brief Fluent, validating construction of serializers.
    ///
    /// @details
    /// Builders are plain values: copy one to derive a variant of a
    /// configuration. `build()` checks names and produces an immutable
    /// serializer; nested builders passed to `declare` are built then.
    ///
    /// Example:
    /// @code
    /// auto s = Stanza::serializer_builder{}
    ///              .depth(1)
    ///              .declare("partner", Stanza::serializer_builder{}.fields({ "first_name" }))
    ///              .declare("name", { .source = "first_name" })
    ///              .build();
    /// @endcode
    class serializer_builder {
    public:
        serializer_builder() = default;

        STANZA_API serializer_builder& label(std::string label);
        STANZA_API serializer_builder& source(std::string source);
        STANZA_API serializer_builder& transform(transform_fn fn);

        STANZA_API serializer_builder& fields(std::vector<std::string> names);
        STANZA_API serializer_builder& include(std::vector<std::string> names);
        STANZA_API serializer_builder& exclude(std::vector<std::string> names);

        STANZA_API serializer_builder& depth(std::size_t levels);
        STANZA_API serializer_builder& unbounded();
        STANZA_API serializer_builder& include_default_fields(bool enabled = true);
        STANZA_API serializer_builder& preserve_field_ordering(bool enabled = true);

        STANZA_API serializer_builder& flat_field_factory(field_factory factory);
        STANZA_API serializer_builder& nested_field_factory(field_factory factory);
        STANZA_API serializer_builder& recursive_field_factory(field_factory factory);

        STANZA_API serializer_builder& use_introspector(std::shared_ptr<const introspector> intro);

        /// @brief Declares an already built field or serializer
        STANZA_API serializer_builder& declare(std::string name, field_ptr f);

        /// @brief Declares a plain field
        STANZA_API serializer_builder& declare(std::string name, FieldOptions opts);

        /// @brief Declares a nested serializer, built together with this one
        STANZA_API serializer_builder& declare(std::string name, serializer_builder nested);

        /// @ingroup StanzaSerializer
        /// @brief Validates the configuration and creates the serializer
        ///
        /// @return The serializer, or `field_name_conflict` when a reserved
        ///         name is used or a name is declared twice, or the first
        ///         error of a nested builder
        [[nodiscard]] STANZA_API BuildResult build() const;

    private:
        using deferred_field = std::function<Result<field_ptr>()>;

        SerializerOptions m_Options;
        std::vector<std::pair<std::string, deferred_field>> m_Declarations;
    };

    /// @ingroup StanzaSerializer
    /// @brief Default serializer: every default field, unbounded depth
    [[nodiscard]] STANZA_API serializer_ptr default_serializer();

} // namespace Stanza
