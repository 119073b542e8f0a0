#pragma once


/*
    ------------------------------------------------------------------
    Stanza - Modern C++ object serialization (field resolution + render)
    ------------------------------------------------------------------

    This is the main public header for Stanza

    It brings together:
        - The primitive tree type:        `Stanza::value`
        - Raw attribute values:           `Stanza::raw`, `make_raw(...)`
        - Reflection and introspection:   `Stanza::registry`,
                                          `Stanza::object_introspector`,
                                          `Stanza::model_introspector`
        - Fields and serializers:         `Stanza::field`,
                                          `Stanza::serializer`,
                                          `Stanza::serializer_builder`
        - Renderers:                      `Stanza::renderer_table`
        - Error reporting:                `Stanza::SerializeError`
        - Declarative profiles:           `Stanza::load_profile(...)`
        - The entry point:                `Stanza::encode(...)`

    -------------------
    High-Level Overview
    -------------------
    - Reflection:
        * Types are described once through `registry::reflect<T>(...)`:
          members, computed properties, methods, constants, relations
    - Serialization:
        * A serializer decides which attributes of an object become output
          fields, serializes each (recursively, for nested objects), and
          assembles a mapping. Depth bounds and cycle detection degrade
          nested objects to a flat string instead of failing
    - Rendering:
        * The primitive tree is handed to a renderer chosen by format key
          ("json", "yaml", "xml", "csv") or returned as is

    ------------
    Design Goals
    ------------
    - Immutable policy:
        * Serializers and fields never change after construction and can
          be shared across threads; every call owns its state
    - Errors as values:
        * Every fallible call returns `std::expected<T, SerializeError>`
    - Pluggable collaborators:
        * Introspectors and renderers are interfaces; the built-in ones can
          be replaced per serializer or per call

    -----
    Usage
    -----
        #include <stanza/stanza.hpp>

        struct Person { std::string first_name, last_name; int age; };

        int main() {
            Stanza::registry::global().reflect<Person>("Person")
                .member("first_name", &Person::first_name)
                .member("last_name", &Person::last_name)
                .member("age", &Person::age);

            Person john{ "john", "doe", 42 };
            auto s = Stanza::serializer_builder{}.fields({ "first_name", "age" }).build();
            auto text = Stanza::encode(**s, john, "json");
            if (!text) {
                std::println("Error: {}", text.error().msg);
                return 1;
            }
            std::println("{}", std::get<std::string>(*text));   // {"age":42,"first_name":"john"}
        }

    Include this header if you want the full Stanza API. For finer-grained
    control or faster build times, include the individual headers directly
*/

/// @defgroup Stanza Stanza Serialization Library
/// @brief Core types and functions for Stanza

/// @defgroup StanzaAPI Top-level Encoding API
/// @ingroup Stanza
/// @brief Convenient free functions binding serializers to renderers

#include <concepts>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include "stanza/config.hpp"
#include "stanza/context.hpp"
#include "stanza/error.hpp"
#include "stanza/field.hpp"
#include "stanza/introspector.hpp"
#include "stanza/options.hpp"
#include "stanza/profile.hpp"
#include "stanza/raw.hpp"
#include "stanza/registry.hpp"
#include "stanza/render.hpp"
#include "stanza/serializer.hpp"
#include "stanza/value.hpp"

namespace Stanza {

    /// @ingroup StanzaAPI
    /// @brief Output of `encode`: the tree when no format was requested,
    ///        the rendered text otherwise
    using encoded = std::variant<value, std::string>;

    /// @ingroup StanzaAPI
    /// @brief Alias for the result type returned by `encode`
    ///
    /// @details
    /// `EncodeResult` is a convenience alias for:
    ///         std::expected<std::variant<value, std::string>, SerializeError>
    using EncodeResult = Result<encoded>;

    /// @ingroup StanzaAPI
    /// @brief Serializes @p root and optionally renders the tree
    ///
    /// @details
    /// `serialize` runs with a fresh context. Without a @p format the tree is
    /// returned unrendered; otherwise the renderer registered for @p format
    /// in @p renderers produces the text.
    ///
    /// Example:
    /// @code
    /// auto res = Stanza::encode(*s, Stanza::make_raw(people), "yaml");
    /// if (!res) {
    ///     std::cerr << res.error().msg << '\n';
    /// } else {
    ///     std::cout << std::get<std::string>(*res);
    /// }
    /// @endcode
    ///
    /// @param s         Serializer to apply
    /// @param root      Object, sequence or scalar to serialize
    /// @param format    Renderer key, or `std::nullopt` for the bare tree
    /// @param opts      Rendering options
    /// @param renderers Dispatch table consulted for @p format
    /// @return The tree or the text, or the first serialization or
    ///         rendering error (`unsupported_format` for unknown keys)
    [[nodiscard]] STANZA_API EncodeResult encode(
        const serializer& s,
        const raw& root,
        std::optional<std::string_view> format = std::nullopt,
        const RenderOptions& opts = {},
        const renderer_table& renderers = renderer_table::builtin());

    /// @ingroup StanzaAPI
    /// @brief Serializes any C++ value and optionally renders the tree
    template<typename T> requires (!std::convertible_to<const T&, raw>)
    [[nodiscard]] EncodeResult encode(
        const serializer& s,
        const T& root,
        std::optional<std::string_view> format = std::nullopt,
        const RenderOptions& opts = {},
        const renderer_table& renderers = renderer_table::builtin()) {
        return encode(s, make_raw(root), format, opts, renderers);
    }

} // namespace Stanza
