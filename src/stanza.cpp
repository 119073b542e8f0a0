#include "stanza/stanza.hpp"


namespace Stanza {

    EncodeResult encode(const serializer& s, const raw& root, std::optional<std::string_view> format, const RenderOptions& opts, const renderer_table& renderers) {
        auto tree = s.serialize(root);
        if (!tree) return std::unexpected(tree.error());
        if (!format) return encoded{ std::in_place_type<value>, *std::move(tree) };

        auto text = renderers.render(*format, *tree, opts);
        if (!text) return std::unexpected(text.error());
        return encoded{ std::in_place_type<std::string>, *std::move(text) };
    }

} // namespace Stanza
