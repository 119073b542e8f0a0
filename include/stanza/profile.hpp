#pragma once


/*
    -------------------------------------------------
    Stanza profiles - Serializers declared in YAML
    -------------------------------------------------
    A profile is a YAML mapping describing a serializer with the same
    options `serializer_builder` offers:

        fields: [first_name, age]          # exact list, overrides the rest
        include: [full_name]
        exclude: [last_name]
        depth: 1                           # integer, null or "unbounded"
        include_default_fields: false
        preserve_field_ordering: true
        label: person
        source: "*"
        introspector: model                # object (default) or model
        primary_key: false                 # model introspector only
        declare:
          name: first_name                 # shorthand: a field reading first_name
          partner:
            kind: serializer               # field (default), serializer,
            fields: [first_name]           # model_name or primary_key
          model:
            kind: model_name

    Entries of kind `serializer` accept every top-level key. Entries of kind
    `field` and `primary_key` accept `source` and `label`; `model_name`
    accepts `label`. Unknown keys and malformed values are reported as
    `invalid_configuration`.

    `dumpdata_serializer()` builds the legacy dump layout on top of the
    core:

        [{"pk": 1, "model": "app.person", "fields": {"first_name": "john", "friends": [2, 3]}}]
*/

#include <filesystem>
#include <string_view>

#include "stanza/config.hpp"
#include "stanza/error.hpp"
#include "stanza/registry.hpp"
#include "stanza/serializer.hpp"

/// @defgroup StanzaProfiles Declarative Profiles
/// @ingroup Stanza
/// @brief Serializer configurations loaded from YAML

namespace Stanza {

    /// @ingroup StanzaProfiles
    /// @brief Result of parsing a profile
    using ProfileResult = Result<serializer_builder>;

    /// @ingroup StanzaProfiles
    /// @brief Parses a profile from YAML text
    ///
    /// @details
    /// Introspectors named by the profile read from @p reg, which must
    /// outlive every serializer built from the result.
    ///
    /// @return A builder holding the profile, or `invalid_configuration`
    [[nodiscard]] STANZA_API ProfileResult parse_profile(std::string_view text, const registry& reg = registry::global());

    /// @ingroup StanzaProfiles
    /// @brief Loads a profile from a YAML file
    [[nodiscard]] STANZA_API ProfileResult load_profile(const std::filesystem::path& path, const registry& reg = registry::global());

    /// @ingroup StanzaProfiles
    /// @brief Builder for dump records `{"pk", "model", "fields"}` of model objects
    ///
    /// @details
    /// `fields` projects the object itself through a model introspector
    /// without the primary key; related objects are written as their
    /// primary keys.
    [[nodiscard]] STANZA_API serializer_builder dumpdata_builder(const registry& reg = registry::global());

    /// @ingroup StanzaProfiles
    /// @brief Shared dump record serializer over `registry::global()`
    [[nodiscard]] STANZA_API serializer_ptr dumpdata_serializer();

} // namespace Stanza
