#include "stanza/render.hpp"

#include <algorithm>
#include <charconv>
#include <format>


namespace Stanza {

    namespace {

        constexpr std::string_view line_end = "\r\n";

        void csv_field(std::string_view s, std::string& out) {
            if (s.find_first_of(",\"\r\n") == std::string_view::npos) {
                out += s;
                return;
            }
            out.push_back('"');
            for (char c : s) {
                if (c == '"') out.push_back('"');
                out.push_back(c);
            }
            out.push_back('"');
        }

        std::string cell_text(const value& v) {
            switch (v.type()) {
            case kind::null: return {};
            case kind::boolean: return v.as_bool() ? "true" : "false";
            case kind::integer: return std::to_string(v.as_integer());
            case kind::number: {
                char buf[64];
                auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), v.as_number());
                if (ec != std::errc{}) return "0";
                return std::string{ buf, ptr };
            }
            case kind::string: return std::string{ std::string_view{ v.as_string() } };
            case kind::array:
            case kind::object:
                return render_json(v);
            }
            return {};
        }

        SerializeError bad_shape(std::string msg) {
            return SerializeError::make(SerializeError::code::invalid_data, "", "csv", msg);
        }

    } // namespace

    RenderResult render_csv(const value& tree, const RenderOptions& opts) {
        std::vector<const value*> rows;
        if (tree.is_object()) {
            rows.push_back(&tree);
        } else if (tree.is_array()) {
            for (const auto& item : tree.as_array()) {
                if (!item.is_object()) return std::unexpected(bad_shape("every csv row must be a mapping"));
                rows.push_back(&item);
            }
        } else {
            return std::unexpected(bad_shape("csv needs a mapping or a sequence of mappings"));
        }
        if (rows.empty()) return std::string{};

        std::vector<std::string_view> header;
        for (const auto& [key, v] : rows.front()->as_object()) header.push_back(key);
        if (opts.sort_keys) std::ranges::sort(header);

        std::string out;
        for (size_t i = 0; i < header.size(); i++) {
            if (i != 0) out.push_back(',');
            csv_field(header[i], out);
        }
        out += line_end;

        for (const value* row : rows) {
            for (const auto& [key, v] : row->as_object()) {
                if (std::ranges::find(header, std::string_view{ key }) == header.end()) {
                    return std::unexpected(bad_shape(std::format("row key '{}' is not in the header", std::string_view{ key })));
                }
            }
            for (size_t i = 0; i < header.size(); i++) {
                if (i != 0) out.push_back(',');
                if (const value* cell = row->find(header[i])) csv_field(cell_text(*cell), out);
            }
            out += line_end;
        }
        return out;
    }

} // namespace Stanza
