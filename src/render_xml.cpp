#include "stanza/render.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <string>


namespace Stanza {

    namespace {

        bool is_name_start(unsigned char c) noexcept {
            return std::isalpha(c) || c == '_' || c >= 0x80;
        }

        bool is_name_char(unsigned char c) noexcept {
            return is_name_start(c) || std::isdigit(c) || c == '-' || c == '.';
        }

        // Keys become element names; characters not allowed in an XML name
        // are replaced with '_'.
        std::string element_name(std::string_view key) {
            std::string name;
            name.reserve(key.size() + 1);
            if (key.empty() || !is_name_start(static_cast<unsigned char>(key.front()))) name.push_back('_');
            for (unsigned char c : key) name.push_back(is_name_char(c) ? static_cast<char>(c) : '_');
            return name;
        }

        // Control characters other than tab, newline and carriage return
        // cannot appear in XML 1.0 and are dropped.
        void xml_text(std::string_view s, std::string& out) {
            for (char c : s) {
                if (static_cast<unsigned char>(c) < 0x20 && c != '\t' && c != '\n' && c != '\r') continue;
                switch (c) {
                case '&': out += "&amp;"; break;
                case '<': out += "&lt;"; break;
                case '>': out += "&gt;"; break;
                default: out.push_back(c); break;
                }
            }
        }

        void xml_indent(std::string& out, std::size_t depth, const RenderOptions& opts) {
            if (!opts.pretty) return;
            out.append(depth * opts.indent, ' ');
        }

        bool has_children(const value& v) noexcept {
            return v.is_container() && v.size() != 0;
        }

        void xml_element(std::string_view name, const value& v, std::string& out, const RenderOptions& opts, std::size_t depth);

        void xml_content(const value& v, std::string& out, const RenderOptions& opts, std::size_t depth) {
            switch (v.type()) {
            case kind::null: return;
            case kind::boolean: out += v.as_bool() ? "true" : "false"; return;
            case kind::integer: out += std::to_string(v.as_integer()); return;
            case kind::number: {
                double d = v.as_number();
                if (!std::isfinite(d)) {
                    out += std::isnan(d) ? "nan" : (d < 0 ? "-inf" : "inf");
                    return;
                }
                char buf[64];
                auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), d);
                if (ec == std::errc{}) out.append(buf, ptr);
                return;
            }
            case kind::string: xml_text(v.as_string(), out); return;
            case kind::array: {
                const std::string item = element_name(opts.item_tag);
                for (const auto& element : v.as_array()) xml_element(item, element, out, opts, depth);
                return;
            }
            case kind::object: {
                std::vector<const member*> order;
                order.reserve(v.size());
                for (const auto& m : v.as_object()) order.push_back(&m);
                std::ranges::stable_sort(order, {}, [](const member* m) { return std::string_view{ m->first }; });
                for (const member* m : order) xml_element(element_name(m->first), m->second, out, opts, depth);
                return;
            }
            }
        }

        void xml_element(std::string_view name, const value& v, std::string& out, const RenderOptions& opts, std::size_t depth) {
            xml_indent(out, depth, opts);
            out.push_back('<');
            out += name;
            out.push_back('>');
            if (has_children(v)) {
                if (opts.pretty) out.push_back('\n');
                xml_content(v, out, opts, depth + 1);
                xml_indent(out, depth, opts);
            } else {
                xml_content(v, out, opts, depth + 1);
            }
            out += "</";
            out += name;
            out.push_back('>');
            if (opts.pretty) out.push_back('\n');
        }

    } // namespace

    std::string render_xml(const value& tree, const RenderOptions& opts) {
        std::string out = "<?xml version=\"1.0\" encoding=\"utf-8\"?>\n";
        xml_element(element_name(opts.root_tag), tree, out, opts, 0);
        return out;
    }

} // namespace Stanza
