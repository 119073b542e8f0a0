#include "stanza/serializer.hpp"

#include "log.hpp"

#include <algorithm>
#include <format>
#include <functional>
#include <unordered_set>


namespace Stanza {

    namespace {

        // Default nested field: hands nested values back to the serializer
        // that created it, i.e. an identically configured serializer.
        class forward_field final : public field {
        public:
            explicit forward_field(const serializer& target) : m_Target{ target } {}

            [[nodiscard]] Result<value> produce(const raw& r, context& ctx) const override {
                return m_Target.produce(r, ctx);
            }

        private:
            const serializer& m_Target;
        };

        bool is_reserved(std::string_view name) noexcept {
            return name.empty() || name == whole_object;
        }

        SerializeError conflict(std::string_view name, std::string msg) {
            return SerializeError::make(SerializeError::code::field_name_conflict, "", name, msg);
        }

    } // namespace

    serializer::serializer(SerializerOptions opts)
        : field{ opts.field_options }, m_Options{ std::move(opts) } {}

#pragma region Entry points

    SerializeResult serializer::serialize(const raw& root) const {
        std::shared_ptr<const introspector> intro = m_Options.introspection ? m_Options.introspection : default_introspector();
        context ctx{ *intro, m_Options.depth };
        return produce_root(root, ctx);
    }

    Result<value> serializer::produce_root(const raw& r, context& ctx) const {
        switch (r.kind()) {
        case raw_kind::object:
            return expand(r.as_object(), ctx);
        case raw_kind::sequence: {
            const auto& seq = r.as_sequence();
            array arr;
            arr.reserve(seq.size());
            for (const auto& item : seq) {
                auto v = produce_root(item, ctx);
                if (!v) return std::unexpected(v.error());
                arr.push_back(std::move(*v));
            }
            return value{ std::move(arr) };
        }
        case raw_kind::callable: {
            const auto& fn = r.as_callable();
            if (!fn) return value{ nullptr };
            return produce_root(fn(), ctx);
        }
        default:
            return field::produce(r, ctx);
        }
    }

#pragma endregion
#pragma region Recursion

    Result<value> serializer::produce(const raw& r, context& ctx) const {
        if (!r.is_object()) return field::produce(r, ctx);

        const object_ref& obj = r.as_object();
        if (ctx.on_path(obj)) {
            detail::log::debug("cycle at field '{}' ({}), using the recursive field",
                ctx.current_field(), ctx.active_introspector().type_name(obj));
            return make_recursive_field(ctx.current_field())->produce_value(r, ctx);
        }
        if (ctx.depth_exhausted()) {
            detail::log::debug("depth exhausted at field '{}' ({}), using the flat field",
                ctx.current_field(), ctx.active_introspector().type_name(obj));
            return make_flat_field(ctx.current_field())->produce_value(r, ctx);
        }

        depth_limit remaining = ctx.remaining_depth();
        if (remaining) --*remaining;
        context::DepthGuard guard{ ctx, narrowed(remaining) };
        return expand(obj, ctx);
    }

    Result<value> serializer::produce_projection(const object_ref& parent, context& ctx) const {
        context::DepthGuard guard{ ctx, narrowed(ctx.remaining_depth()) };
        return expand(parent, ctx);
    }

    depth_limit serializer::narrowed(depth_limit inherited) const noexcept {
        if (!m_Options.depth) return inherited;
        if (!inherited) return m_Options.depth;
        return std::min(*inherited, *m_Options.depth);
    }

    Result<value> serializer::expand(const object_ref& obj, context& ctx) const {
        context::IntrospectorGuard intro_guard{ ctx, m_Options.introspection.get() };

        auto names = get_field_names(obj, ctx);
        if (!names) return std::unexpected(names.error());

        struct planned {
            std::string_view name;
            field_ptr f;
            std::string key;
        };

        // Keys are checked before any attribute is read.
        std::vector<planned> plan;
        plan.reserve(names->size());
        std::unordered_set<std::string_view> keys;
        for (const auto& name : *names) {
            field_ptr f = get_field_serializer(name, ctx);
            std::string key = f->resolve_key(name);
            plan.push_back(planned{ name, std::move(f), std::move(key) });
            if (!keys.insert(plan.back().key).second) {
                SerializeError e = conflict(name, std::format("more than one field resolves to the key '{}'", plan.back().key));
                e.type_name = ctx.active_introspector().type_name(obj);
                return std::unexpected(std::move(e));
            }
        }

        context::PathGuard path_guard{ ctx, obj };
        object out;
        out.reserve(plan.size());
        for (const auto& p : plan) {
            context::FieldGuard field_guard{ ctx, p.name };
            auto v = p.f->resolve_value(obj, p.name, ctx);
            if (!v) return std::unexpected(v.error());
            out.emplace_back(string{ std::string_view{ p.key } }, std::move(*v));
        }

        if (!m_Options.preserve_field_ordering) {
            std::ranges::sort(out, std::less<>{}, &member::first);
        }
        return value{ std::move(out) };
    }

#pragma endregion
#pragma region Field resolution

    Result<std::vector<std::string>> serializer::get_field_names(const object_ref& obj, context& ctx) const {
        if (m_Options.fields) return *m_Options.fields;

        std::vector<std::string> candidates;
        for (const auto& [name, f] : m_Options.declared) candidates.push_back(name);

        if (m_Options.declared.empty() || m_Options.include_default_fields) {
            auto defaults = ctx.active_introspector().default_field_names(obj);
            if (!defaults) return std::unexpected(defaults.error());
            candidates.insert(candidates.end(), defaults->begin(), defaults->end());
        }
        candidates.insert(candidates.end(), m_Options.include.begin(), m_Options.include.end());

        std::vector<std::string> names;
        std::unordered_set<std::string_view> seen;
        for (const auto& name : candidates) {
            if (std::ranges::find(m_Options.exclude, name) != m_Options.exclude.end()) continue;
            if (!seen.insert(name).second) continue;
            names.push_back(name);
        }
        return names;
    }

    field_ptr serializer::get_field_serializer(std::string_view name, context& ctx) const {
        if (auto declared = declared_field(name)) return declared;
        return get_default_field_serializer(name, ctx);
    }

    field_ptr serializer::get_default_field_serializer(std::string_view name, context& ctx) const {
        if (ctx.depth_exhausted()) return make_flat_field(name);
        return make_nested_field(name);
    }

    field_ptr serializer::declared_field(std::string_view name) const {
        auto it = std::ranges::find(m_Options.declared, name, [](const auto& entry) { return std::string_view{ entry.first }; });
        if (it == m_Options.declared.end()) return nullptr;
        return it->second;
    }

    field_ptr serializer::make_flat_field(std::string_view name) const {
        if (m_Options.flat_field_factory) {
            if (auto f = m_Options.flat_field_factory(*this, name)) return f;
        }
        static const field_ptr flat = make_field();
        return flat;
    }

    field_ptr serializer::make_nested_field(std::string_view name) const {
        if (m_Options.nested_field_factory) {
            if (auto f = m_Options.nested_field_factory(*this, name)) return f;
        }
        return std::make_shared<const forward_field>(*this);
    }

    field_ptr serializer::make_recursive_field(std::string_view name) const {
        if (m_Options.recursive_field_factory) {
            if (auto f = m_Options.recursive_field_factory(*this, name)) return f;
        }
        return make_flat_field(name);
    }

#pragma endregion
#pragma region Builder

    serializer_builder& serializer_builder::label(std::string label) {
        m_Options.field_options.label = std::move(label);
        return *this;
    }

    serializer_builder& serializer_builder::source(std::string source) {
        m_Options.field_options.source = std::move(source);
        return *this;
    }

    serializer_builder& serializer_builder::transform(transform_fn fn) {
        m_Options.field_options.transform = std::move(fn);
        return *this;
    }

    serializer_builder& serializer_builder::fields(std::vector<std::string> names) {
        m_Options.fields = std::move(names);
        return *this;
    }

    serializer_builder& serializer_builder::include(std::vector<std::string> names) {
        m_Options.include = std::move(names);
        return *this;
    }

    serializer_builder& serializer_builder::exclude(std::vector<std::string> names) {
        m_Options.exclude = std::move(names);
        return *this;
    }

    serializer_builder& serializer_builder::depth(std::size_t levels) {
        m_Options.depth = levels;
        return *this;
    }

    serializer_builder& serializer_builder::unbounded() {
        m_Options.depth.reset();
        return *this;
    }

    serializer_builder& serializer_builder::include_default_fields(bool enabled) {
        m_Options.include_default_fields = enabled;
        return *this;
    }

    serializer_builder& serializer_builder::preserve_field_ordering(bool enabled) {
        m_Options.preserve_field_ordering = enabled;
        return *this;
    }

    serializer_builder& serializer_builder::flat_field_factory(field_factory factory) {
        m_Options.flat_field_factory = std::move(factory);
        return *this;
    }

    serializer_builder& serializer_builder::nested_field_factory(field_factory factory) {
        m_Options.nested_field_factory = std::move(factory);
        return *this;
    }

    serializer_builder& serializer_builder::recursive_field_factory(field_factory factory) {
        m_Options.recursive_field_factory = std::move(factory);
        return *this;
    }

    serializer_builder& serializer_builder::use_introspector(std::shared_ptr<const introspector> intro) {
        m_Options.introspection = std::move(intro);
        return *this;
    }

    serializer_builder& serializer_builder::declare(std::string name, field_ptr f) {
        m_Declarations.emplace_back(std::move(name), [f = std::move(f)]() -> Result<field_ptr> { return f; });
        return *this;
    }

    serializer_builder& serializer_builder::declare(std::string name, FieldOptions opts) {
        return declare(std::move(name), make_field(std::move(opts)));
    }

    serializer_builder& serializer_builder::declare(std::string name, serializer_builder nested) {
        m_Declarations.emplace_back(std::move(name), [nested = std::move(nested)]() -> Result<field_ptr> {
            auto built = nested.build();
            if (!built) return std::unexpected(built.error());
            return field_ptr{ *built };
        });
        return *this;
    }

    BuildResult serializer_builder::build() const {
        SerializerOptions opts = m_Options;

        if (opts.fields) {
            for (const auto& name : *opts.fields) {
                if (is_reserved(name)) return std::unexpected(conflict(name, std::format("'{}' is a reserved field name", name)));
            }
        }
        for (const auto& name : opts.include) {
            if (is_reserved(name)) return std::unexpected(conflict(name, std::format("'{}' is a reserved field name", name)));
        }

        std::unordered_set<std::string_view> declared;
        std::unordered_set<std::string> keys;
        opts.declared.clear();
        for (const auto& [name, make] : m_Declarations) {
            if (is_reserved(name)) return std::unexpected(conflict(name, std::format("'{}' is a reserved field name", name)));
            if (!declared.insert(name).second) return std::unexpected(conflict(name, std::format("field '{}' is declared more than once", name)));

            auto f = make();
            if (!f) return std::unexpected(f.error());
            if (!*f) {
                return std::unexpected(SerializeError::make(SerializeError::code::invalid_configuration, "", name,
                    std::format("field '{}' is declared without an implementation", name)));
            }

            std::string key = (*f)->resolve_key(name);
            if (!keys.insert(key).second) {
                return std::unexpected(conflict(name, std::format("declared fields resolve to the same key '{}'", key)));
            }
            opts.declared.emplace_back(name, std::move(*f));
        }

        return std::make_shared<const serializer>(std::move(opts));
    }

#pragma endregion

    serializer_ptr default_serializer() {
        static const serializer_ptr instance = std::make_shared<const serializer>(SerializerOptions{});
        return instance;
    }

} // namespace Stanza
