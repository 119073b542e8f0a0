#include "stanza/field.hpp"
#include "stanza/introspector.hpp"

#include <format>


namespace Stanza {

    field::field(FieldOptions opts) : m_Options{ std::move(opts) } {}

    std::string field::resolve_key(std::string_view name) const {
        if (m_Options.label) return *m_Options.label;
        return std::string{ name };
    }

    Result<value> field::resolve_value(const object_ref& parent, std::string_view name, context& ctx) const {
        if (is_projection()) {
            if (m_Options.transform) return m_Options.transform(raw{ parent });
            return produce_projection(parent, ctx);
        }

        std::string_view path = m_Options.source ? std::string_view{ *m_Options.source } : name;
        auto r = read_path(parent, path, ctx);
        if (!r) return std::unexpected(r.error());

        return produce_value(*r, ctx);
    }

    Result<value> field::produce_value(const raw& r, context& ctx) const {
        if (has_transform()) return m_Options.transform(r);
        return produce(r, ctx);
    }

    Result<value> field::produce(const raw& r, context& ctx) const {
        const auto& s = r.storage();
        switch (r.kind()) {
        case raw_kind::null: return value{ nullptr };
        case raw_kind::boolean: return value{ std::get<bool>(s) };
        case raw_kind::integer: return value{ std::get<std::int64_t>(s) };
        case raw_kind::number: return value{ std::get<double>(s) };
        case raw_kind::string: return value{ std::get<std::string>(s) };
        case raw_kind::date: return value{ detail::format_date(std::get<date>(s)) };
        case raw_kind::datetime: return value{ detail::format_datetime(std::get<datetime>(s)) };
        case raw_kind::time: return value{ detail::format_time(std::get<time_of_day>(s)) };
        case raw_kind::sequence: {
            const auto& seq = r.as_sequence();
            array arr;
            arr.reserve(seq.size());
            for (const auto& item : seq) {
                auto v = produce(item, ctx);
                if (!v) return std::unexpected(v.error());
                arr.push_back(std::move(*v));
            }
            return value{ std::move(arr) };
        }
        case raw_kind::object:
            return value{ ctx.active_introspector().display(r.as_object()) };
        case raw_kind::callable: {
            const auto& fn = r.as_callable();
            if (!fn) return value{ nullptr };
            return produce(fn(), ctx);
        }
        }
        return value{ nullptr };
    }

    Result<value> field::produce_projection(const object_ref& parent, context& ctx) const {
        return produce(raw{ parent }, ctx);
    }

    Result<raw> field::read_path(const object_ref& parent, std::string_view path, context& ctx) {
        const introspector& intro = ctx.active_introspector();
        raw current{ parent };
        std::size_t start = 0;

        while (true) {
            std::size_t dot = path.find('.', start);
            std::string_view segment = path.substr(start, dot == std::string_view::npos ? std::string_view::npos : dot - start);

            while (current.is_callable() && current.as_callable()) current = current.as_callable()();
            if (!current.is_object()) {
                return std::unexpected(SerializeError::make(SerializeError::code::attribute_resolution, "", path,
                    std::format("cannot read '{}' from a value that is not an object", segment)));
            }

            auto next = intro.read_attribute(current.as_object(), segment);
            if (!next) {
                SerializeError e = std::move(next.error());
                e.path.assign(path.begin(), path.end());
                return std::unexpected(std::move(e));
            }
            current = std::move(*next);

            if (dot == std::string_view::npos) break;
            start = dot + 1;
        }
        return current;
    }

    field_ptr make_field(FieldOptions opts) {
        return std::make_shared<const field>(std::move(opts));
    }

#pragma region Model fields

    model_name_field::model_name_field(std::optional<std::string> label)
        : field{ FieldOptions{ .source = std::string{ whole_object }, .label = std::move(label) } } {}

    Result<value> model_name_field::produce(const raw& r, context& ctx) const {
        if (!r.is_object()) {
            return std::unexpected(SerializeError::make(SerializeError::code::not_a_model, "", ctx.current_field(),
                "model name requested for a value that is not an object"));
        }
        auto meta = ctx.active_introspector().describe_model(r.as_object());
        if (!meta) return std::unexpected(meta.error());
        return value{ meta->label() };
    }

    primary_key_field::primary_key_field(FieldOptions opts) : field{ std::move(opts) } {}

    Result<value> primary_key_field::produce(const raw& r, context& ctx) const {
        if (!r.is_object()) return field::produce(r, ctx);

        const introspector& intro = ctx.active_introspector();
        const object_ref& obj = r.as_object();
        auto meta = intro.describe_model(obj);
        if (!meta) return std::unexpected(meta.error());

        auto pk = intro.read_attribute(obj, meta->pk_name);
        if (!pk) return std::unexpected(pk.error());
        return field::produce(*pk, ctx);
    }

#pragma endregion

    namespace detail {

        std::string format_date(const date& d) {
            return std::format("{:04}-{:02}-{:02}",
                static_cast<int>(d.year()), static_cast<unsigned>(d.month()), static_cast<unsigned>(d.day()));
        }

        std::string format_time(const time_of_day& t) {
            std::string text = std::format("{:02}:{:02}:{:02}", t.hours().count(), t.minutes().count(), t.seconds().count());
            if (auto ms = t.subseconds().count(); ms != 0) text += std::format(".{:03}", ms);
            return text;
        }

        std::string format_datetime(const datetime& t) {
            auto day = std::chrono::floor<std::chrono::days>(t);
            return format_date(date{ day }) + "T" + format_time(time_of_day{ t - day });
        }

    } // namespace detail

} // namespace Stanza
