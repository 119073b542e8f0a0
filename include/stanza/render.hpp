#pragma once


/*
    -------------------------------------------------
    Stanza::renderer_table - Format-keyed tree renderers
    -------------------------------------------------
    A renderer turns a primitive tree (`Stanza::value`) into text. Renderers
    are looked up by format key in a `renderer_table`; the built-in table
    knows:

        - "json": RFC 8259 text, compact or pretty; NaN and infinities are
          written as null
        - "yaml": block or flow style YAML, written with yaml-cpp
        - "xml":  `<?xml version="1.0" encoding="utf-8"?>` followed by a
          `<root>` element; sequences emit `<list-item>` children, mappings
          one element per key in key order, null emits nothing
        - "csv":  a mapping or a sequence of mappings; the header comes
          from the keys of the first row, CRLF line endings

    Tables are values: copy the built-in one and `add` your own renderers,
    or replace a built-in one under the same key.
*/

#include <functional>
#include <iosfwd>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include "stanza/config.hpp"
#include "stanza/error.hpp"
#include "stanza/options.hpp"
#include "stanza/value.hpp"

/// @defgroup StanzaRender Renderers
/// @ingroup Stanza
/// @brief Turning primitive trees into text

namespace Stanza {

    /// @ingroup StanzaRender
    /// @brief Result of rendering a tree
    using RenderResult = Result<std::string>;

    /// @ingroup StanzaRender
    /// @brief Renders a primitive tree to text
    using renderer = std::function<RenderResult(const value& tree, const RenderOptions& opts)>;

    /// @ingroup StanzaRender
    /// @brief Dispatch table from format key to renderer
    class renderer_table {
    public:
        renderer_table() = default;

        /// @brief The table holding the json, yaml, xml and csv renderers
        [[nodiscard]] STANZA_API static const renderer_table& builtin();

        /// @brief Registers (or replaces) the renderer for @p format
        STANZA_API renderer_table& add(std::string format, renderer r);

        [[nodiscard]] STANZA_API bool contains(std::string_view format) const;

        /// @brief Registered format keys, sorted
        [[nodiscard]] STANZA_API std::vector<std::string> formats() const;

        /// @ingroup StanzaRender
        /// @brief Renders @p tree with the renderer registered for @p format
        ///
        /// @return The text, `unsupported_format` for unknown keys, or the
        ///         renderer's own error
        [[nodiscard]] STANZA_API RenderResult render(std::string_view format, const value& tree, const RenderOptions& opts = {}) const;

    private:
        std::map<std::string, renderer, std::less<>> m_Renderers;
    };

    /// @ingroup StanzaRender
    /// @brief JSON text of a tree
    [[nodiscard]] STANZA_API std::string render_json(const value& tree, const RenderOptions& opts = {});

    /// @ingroup StanzaRender
    /// @brief Writes the JSON text of a tree to a stream
    STANZA_API void render_json(const value& tree, std::ostream& os, const RenderOptions& opts = {});

    /// @ingroup StanzaRender
    /// @brief YAML text of a tree
    [[nodiscard]] STANZA_API RenderResult render_yaml(const value& tree, const RenderOptions& opts = {});

    /// @ingroup StanzaRender
    /// @brief XML document of a tree
    [[nodiscard]] STANZA_API std::string render_xml(const value& tree, const RenderOptions& opts = {});

    /// @ingroup StanzaRender
    /// @brief CSV text of a mapping or a sequence of mappings
    /// @return The text, or `invalid_data` for any other tree
    [[nodiscard]] STANZA_API RenderResult render_csv(const value& tree, const RenderOptions& opts = {});

} // namespace Stanza
