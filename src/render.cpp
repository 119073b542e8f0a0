#include "stanza/render.hpp"

#include "log.hpp"

#include <format>


namespace Stanza {

    const renderer_table& renderer_table::builtin() {
        static const renderer_table table = [] {
            renderer_table t;
            t.add("json", [](const value& tree, const RenderOptions& opts) -> RenderResult { return render_json(tree, opts); });
            t.add("yaml", [](const value& tree, const RenderOptions& opts) { return render_yaml(tree, opts); });
            t.add("xml", [](const value& tree, const RenderOptions& opts) -> RenderResult { return render_xml(tree, opts); });
            t.add("csv", [](const value& tree, const RenderOptions& opts) { return render_csv(tree, opts); });
            return t;
        }();
        return table;
    }

    renderer_table& renderer_table::add(std::string format, renderer r) {
        m_Renderers.insert_or_assign(std::move(format), std::move(r));
        return *this;
    }

    bool renderer_table::contains(std::string_view format) const {
        return m_Renderers.find(format) != m_Renderers.end();
    }

    std::vector<std::string> renderer_table::formats() const {
        std::vector<std::string> keys;
        keys.reserve(m_Renderers.size());
        for (const auto& [key, r] : m_Renderers) keys.push_back(key);
        return keys;
    }

    RenderResult renderer_table::render(std::string_view format, const value& tree, const RenderOptions& opts) const {
        auto it = m_Renderers.find(format);
        if (it == m_Renderers.end() || !it->second) {
            detail::log::warning("no renderer registered for format '{}'", format);
            return std::unexpected(SerializeError::make(SerializeError::code::unsupported_format, "", format,
                std::format("unsupported format '{}'", format)));
        }
        detail::log::debug("rendering with '{}'", format);
        return it->second(tree, opts);
    }

} // namespace Stanza
