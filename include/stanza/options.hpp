#pragma once


/*
    -------------------------
    Stanza rendering options
    -------------------------
    This header defines the configuration structure that controls how a
    primitive tree is rendered to text by the built-in renderers

    ------------------------------------
    Rendering Options - Stanza::RenderOptions
    ------------------------------------
    - `bool pretty`:
        * json: when false (default), compact output without extra whitespace;
          when true, indented output with newlines
        * xml: when true, one element per line, indented
    - `size_t indent`:
        * Number of spaces per nesting level for pretty json/xml and for yaml
    - `bool sort_keys`:
        * json and yaml: when true, mapping keys are written in lexicographic
          order; when false, in tree order
        * xml always writes keys in lexicographic order
    - `bool flow_style`:
        * yaml: when true, collections are written in flow style
          (`{a: 1, b: [1, 2]}`); when false (default), block style
    - `std::string root_tag`, `std::string item_tag`:
        * xml: names of the document element and of sequence items

    -----
    Usage
    -----
        auto text = Stanza::encode(*s, john, "json", { .pretty = true, .indent = 4 });

    A plain aggregate suitable for brace-initialization. Renderers ignore
    the options that do not concern them.
*/


#include <cstddef>
#include <string>

/// @defgroup StanzaOptions Rendering Options
/// @ingroup Stanza
/// @brief Configuration objects controlling renderers

namespace Stanza {

    /// @ingroup StanzaOptions
    /// @brief Configuration options controlling renderers.
    ///
    /// @details
    /// Example:
    /// @code
    /// RenderOptions ro;
    /// ro.pretty = true;
    /// ro.indent = 4;
    /// auto text = Stanza::renderer_table::builtin().render("json", tree, ro);
    /// @endcode
    struct RenderOptions {
        bool pretty = false;                 ///< Enable pretty-printing (formatted output).
        std::size_t indent = 2;              ///< Number of spaces per indentation level.
        bool sort_keys = false;              ///< Sort mapping keys before writing if true.
        bool flow_style = false;             ///< YAML flow style collections if true.
        std::string root_tag = "root";       ///< XML document element name.
        std::string item_tag = "list-item";  ///< XML sequence item element name.
    };

} // namespace Stanza
