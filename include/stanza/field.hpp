#pragma once


/*
    ------------------------------------------------
    Stanza::field - Extracting one value from a parent
    ------------------------------------------------
    A `field` knows two things:

        - the key it is written under (`resolve_key`): its label if it has
          one, otherwise the name it was resolved for
        - the value it produces (`resolve_value`): it reads an attribute
          from the parent object and turns the result into a primitive
          `Stanza::value`

    ---------------
    Reading a value
    ---------------
    - `source` unset:    the attribute named like the field is read
    - `source = "a.b"`:  each dotted segment is read in turn; zero-argument
                         callables met on the way are invoked
    - `source = "*"`:    nothing is read; the field receives the parent
                         object itself (a projection)

    ------------------
    Producing a value
    ------------------
    A user `transform` replaces production entirely. Otherwise `produce`
    runs; for a plain field it coerces the raw value:

        null, bool, integer, number, string  -> unchanged
        date                                 -> "YYYY-MM-DD"
        datetime                             -> "YYYY-MM-DDTHH:MM:SS[.mmm]"
        time of day                          -> "HH:MM:SS[.mmm]"
        sequence                             -> array, element by element
        callable                             -> invoked, result produced
        object                               -> flat representation (the
                                                introspector's display string)

    Serializers are fields too (see `serializer.hpp`): they override
    `produce` to expand objects into mappings.
*/

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "stanza/config.hpp"
#include "stanza/context.hpp"
#include "stanza/error.hpp"
#include "stanza/raw.hpp"
#include "stanza/value.hpp"

/// @defgroup StanzaFields Fields
/// @ingroup Stanza
/// @brief Leaf policies for extracting and converting one named value

namespace Stanza {

    /// @ingroup StanzaFields
    /// @brief Source sentinel meaning "the entire parent object"
    inline constexpr std::string_view whole_object = "*";

    /// @ingroup StanzaFields
    /// @brief User-supplied replacement for a field's value production
    using transform_fn = std::function<value(const raw&)>;

    /// @ingroup StanzaFields
    /// @brief Declaration-time options of a field
    ///
    /// @details
    /// A plain aggregate suitable for designated initializers:
    /// @code
    /// auto f = Stanza::make_field({ .source = "partner.first_name", .label = "partner" });
    /// @endcode
    struct FieldOptions {
        std::optional<std::string> source{}; ///< Attribute path to read, or `"*"`.
        std::optional<std::string> label{};  ///< Output key override.
        transform_fn transform{};            ///< Replaces `produce` when set.
    };

    /// @ingroup StanzaFields
    /// @brief Plain field: reads one attribute and coerces it to a primitive.
    ///
    /// @details
    /// Fields are immutable once constructed and may be shared by any number
    /// of serializers and threads.
    class field {
    public:
        STANZA_API explicit field(FieldOptions opts = {});
        virtual ~field() = default;

        field(const field&) = delete;
        field& operator=(const field&) = delete;

        [[nodiscard]] const std::optional<std::string>& source() const noexcept { return m_Options.source; }
        [[nodiscard]] const std::optional<std::string>& label() const noexcept { return m_Options.label; }
        [[nodiscard]] bool has_transform() const noexcept { return static_cast<bool>(m_Options.transform); }

        /// @brief True if this field receives its parent unchanged (`source == "*"`)
        [[nodiscard]] bool is_projection() const noexcept { return m_Options.source && *m_Options.source == whole_object; }

        /// @ingroup StanzaFields
        /// @brief Output key: the label if set, else @p name
        [[nodiscard]] STANZA_API std::string resolve_key(std::string_view name) const;

        /// @ingroup StanzaFields
        /// @brief Reads and produces this field's value from @p parent
        ///
        /// @param parent Object the field belongs to
        /// @param name   Name the field was resolved for
        /// @param ctx    Context of the running serialization
        /// @return The primitive value, or the first error met
        [[nodiscard]] STANZA_API Result<value> resolve_value(const object_ref& parent, std::string_view name, context& ctx) const;

        /// @ingroup StanzaFields
        /// @brief Produces @p r through the transform when one is set,
        ///        through `produce` otherwise
        [[nodiscard]] STANZA_API Result<value> produce_value(const raw& r, context& ctx) const;

        /// @ingroup StanzaFields
        /// @brief Turns an already read raw value into a primitive value
        [[nodiscard]] STANZA_API virtual Result<value> produce(const raw& r, context& ctx) const;

    protected:
        /// @brief Production for `source == "*"`; defaults to `produce(parent)`
        [[nodiscard]] STANZA_API virtual Result<value> produce_projection(const object_ref& parent, context& ctx) const;

        /// @brief Follows a (possibly dotted) attribute path starting at @p parent
        [[nodiscard]] STANZA_API static Result<raw> read_path(const object_ref& parent, std::string_view path, context& ctx);

    private:
        FieldOptions m_Options;
    };

    /// @ingroup StanzaFields
    /// @brief Shared handle to an immutable field
    using field_ptr = std::shared_ptr<const field>;

    /// @ingroup StanzaFields
    /// @brief Creates a plain field
    [[nodiscard]] STANZA_API field_ptr make_field(FieldOptions opts = {});

    /// @ingroup StanzaFields
    /// @brief Produces the `app_label.model_name` label of the parent model.
    ///
    /// @details
    /// Always a projection: the parent object itself is inspected, no
    /// attribute is read. Fails with `not_a_model` for non-model objects.
    class model_name_field : public field {
    public:
        STANZA_API explicit model_name_field(std::optional<std::string> label = std::nullopt);

        [[nodiscard]] STANZA_API Result<value> produce(const raw& r, context& ctx) const override;
    };

    /// @ingroup StanzaFields
    /// @brief Produces the primary key of a related model object.
    ///
    /// @details
    /// Sequences of related objects become arrays of primary keys; null
    /// stays null; scalars are assumed to be keys already.
    class primary_key_field : public field {
    public:
        STANZA_API explicit primary_key_field(FieldOptions opts = {});

        [[nodiscard]] STANZA_API Result<value> produce(const raw& r, context& ctx) const override;
    };

    namespace detail {
        /// Canonical text forms of date and time values.
        [[nodiscard]] STANZA_API std::string format_date(const date& d);
        [[nodiscard]] STANZA_API std::string format_datetime(const datetime& t);
        [[nodiscard]] STANZA_API std::string format_time(const time_of_day& t);
    } // namespace detail

} // namespace Stanza
