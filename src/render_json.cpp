#include "stanza/render.hpp"

#include <algorithm>
#include <charconv>
#include <cmath>
#include <sstream>


namespace Stanza {

    namespace detail {
        void json_impl(const value& v, std::ostream& os, const RenderOptions& opts, size_t depth);

        void json_string(std::string_view s, std::ostream& os) {
            os.put('"');
            for (unsigned char c : s) {
                switch (c) {
                case '"': os << "\\\""; break;
                case '\\': os << "\\\\"; break;
                case '\b': os << "\\b"; break;
                case '\f': os << "\\f"; break;
                case '\n': os << "\\n"; break;
                case '\r': os << "\\r"; break;
                case '\t': os << "\\t"; break;
                default:
                    if (c < 0x20) {
                        // control characters -> \u00XX
                        static constexpr char hex[] = "0123456789ABCDEF";
                        os << "\\u00" << hex[(c >> 4) & 0xF] << hex[c & 0xF];
                    } else {
                        os.put(static_cast<char>(c));
                    }
                    break;
                }
            }
            os.put('"');
        }

        void json_indent(std::ostream& os, size_t depth, const RenderOptions& opts) {
            if (!opts.pretty || opts.indent == 0) return;
            size_t spaces = depth * opts.indent;
            for (size_t i = 0; i < spaces; i++) os.put(' ');
        }

        void json_number(double d, std::ostream& os) {
            if (!std::isfinite(d)) {
                os << "null";
                return;
            }
            char buf[64];
            auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), d);
            if (ec != std::errc{}) {
                os << "0";
                return;
            }
            std::string_view text{ buf, static_cast<size_t>(ptr - buf) };
            os << text;
            // 2.0 is written as 2.0, not 2
            if (text.find_first_of(".eE") == std::string_view::npos) os << ".0";
        }

        void json_impl(const value& v, std::ostream& os, const RenderOptions& opts, size_t depth) {
            switch (v.type()) {
            case kind::null: os << "null"; return;
            case kind::boolean: os << (v.as_bool() ? "true" : "false"); return;
            case kind::integer: os << v.as_integer(); return;
            case kind::number: json_number(v.as_number(), os); return;
            case kind::string: json_string(v.as_string(), os); return;
            case kind::array: {
                const auto& arr = v.as_array();
                size_t n = arr.size();

                os.put('[');
                if (n == 0) {
                    os.put(']');
                    return;
                }

                if (opts.pretty) os.put('\n');
                for (size_t i = 0; i < n; i++) {
                    if (opts.pretty) json_indent(os, depth + 1, opts);
                    json_impl(arr[i], os, opts, depth + 1);
                    if (i + 1 < n) os.put(',');
                    if (opts.pretty) os.put('\n');
                }
                if (opts.pretty) json_indent(os, depth, opts);
                os.put(']');
                return;
            }
            case kind::object: {
                const auto& obj = v.as_object();
                size_t n = obj.size();

                os.put('{');
                if (n == 0) {
                    os.put('}');
                    return;
                }

                std::vector<const member*> order;
                order.reserve(n);
                for (const auto& m : obj) order.push_back(&m);
                if (opts.sort_keys) {
                    std::ranges::stable_sort(order, {}, [](const member* m) { return std::string_view{ m->first }; });
                }

                if (opts.pretty) os.put('\n');
                for (size_t i = 0; i < n; i++) {
                    if (opts.pretty) json_indent(os, depth + 1, opts);
                    json_string(order[i]->first, os);
                    os << (opts.pretty ? ": " : ":");
                    json_impl(order[i]->second, os, opts, depth + 1);
                    if (i + 1 < n) os.put(',');
                    if (opts.pretty) os.put('\n');
                }
                if (opts.pretty) json_indent(os, depth, opts);
                os.put('}');
                return;
            }
            }
            os << "null";
        }

    } // namespace detail

    void render_json(const value& tree, std::ostream& os, const RenderOptions& opts) {
        detail::json_impl(tree, os, opts, 0);
    }

    std::string render_json(const value& tree, const RenderOptions& opts) {
        std::ostringstream oss;
        detail::json_impl(tree, oss, opts, 0);
        return oss.str();
    }

} // namespace Stanza
