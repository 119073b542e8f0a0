#include "stanza/render.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <string>


namespace Stanza {

    namespace {

        // Integers written with a 0x, 0o or 0b prefix, e.g. "0x1F" or "-0b101"
        bool is_prefixed_integer(std::string_view body) {
            if (body.size() < 3 || body[0] != '0') return false;

            int base = 0;
            switch (std::tolower(static_cast<unsigned char>(body[1]))) {
            case 'x': base = 16; break;
            case 'o': base = 8; break;
            case 'b': base = 2; break;
            default: return false;
            }

            bool any_digit = false;
            for (unsigned char c : body.substr(2)) {
                if (c == '_') continue;
                int d = std::isdigit(c) ? c - '0' : (std::isxdigit(c) ? std::tolower(c) - 'a' + 10 : base);
                if (d >= base) return false;
                any_digit = true;
            }
            return any_digit;
        }

        // Strings a YAML reader would resolve to null, a boolean or a number
        bool reads_as_non_string(std::string_view s) {
            if (s.empty()) return true;

            std::string lower;
            lower.reserve(s.size());
            for (unsigned char c : s) lower.push_back(static_cast<char>(std::tolower(c)));
            static constexpr std::string_view keywords[] = {
                "~", "null", "true", "false", "yes", "no", "on", "off", "y", "n", ".nan", ".inf", "-.inf", "+.inf"
            };
            if (std::ranges::find(keywords, std::string_view{ lower }) != std::end(keywords)) return true;

            std::string_view body = s;
            if (body.front() == '+' || body.front() == '-') body.remove_prefix(1);
            if (body.empty()) return false;
            if (is_prefixed_integer(body)) return true;

            // YAML 1.1 allows '_' as a digit separator
            std::string digits;
            digits.reserve(body.size());
            for (char c : body) {
                if (c != '_') digits.push_back(c);
            }
            double parsed{};
            auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), parsed);
            return ec == std::errc{} && ptr == digits.data() + digits.size();
        }

        void emit_string(YAML::Emitter& out, std::string_view s) {
            if (reads_as_non_string(s)) out << YAML::DoubleQuoted;
            out << std::string{ s };
        }

        void emit(YAML::Emitter& out, const value& v, const RenderOptions& opts) {
            switch (v.type()) {
            case kind::null: out << YAML::Null; return;
            case kind::boolean: out << v.as_bool(); return;
            case kind::integer: out << static_cast<long long>(v.as_integer()); return;
            case kind::number: out << v.as_number(); return;
            case kind::string: emit_string(out, v.as_string()); return;
            case kind::array: {
                out << YAML::BeginSeq;
                for (const auto& item : v.as_array()) emit(out, item, opts);
                out << YAML::EndSeq;
                return;
            }
            case kind::object: {
                std::vector<const member*> order;
                order.reserve(v.size());
                for (const auto& m : v.as_object()) order.push_back(&m);
                if (opts.sort_keys) {
                    std::ranges::stable_sort(order, {}, [](const member* m) { return std::string_view{ m->first }; });
                }

                out << YAML::BeginMap;
                for (const member* m : order) {
                    out << YAML::Key;
                    emit_string(out, m->first);
                    out << YAML::Value;
                    emit(out, m->second, opts);
                }
                out << YAML::EndMap;
                return;
            }
            }
            out << YAML::Null;
        }

    } // namespace

    RenderResult render_yaml(const value& tree, const RenderOptions& opts) {
        YAML::Emitter out;
        out.SetIndent(std::max<std::size_t>(opts.indent, 2));
        if (opts.flow_style) {
            out.SetMapFormat(YAML::Flow);
            out.SetSeqFormat(YAML::Flow);
        }

        emit(out, tree, opts);
        if (!out.good()) {
            return std::unexpected(SerializeError::make(SerializeError::code::invalid_data, "", "yaml", out.GetLastError()));
        }

        std::string text{ out.c_str(), out.size() };
        text.push_back('\n');
        return text;
    }

} // namespace Stanza
