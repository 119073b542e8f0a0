#include "stanza/profile.hpp"

#include "log.hpp"

#include <yaml-cpp/yaml.h>

#include <format>
#include <memory>
#include <optional>
#include <string>
#include <vector>


namespace Stanza {

    namespace {

        SerializeError invalid(std::string_view where, std::string msg) {
            return SerializeError::make(SerializeError::code::invalid_configuration, "", where, msg);
        }

        std::string scope(std::string_view where, std::string_view key) {
            if (where.empty()) return std::string{ key };
            return std::format("{}.{}", where, key);
        }

        Result<std::vector<std::string>> name_list(const YAML::Node& node, std::string_view where) {
            if (node.IsScalar()) return std::vector<std::string>{ node.as<std::string>() };
            if (!node.IsSequence()) return std::unexpected(invalid(where, "expected a list of field names"));

            std::vector<std::string> names;
            for (const auto& item : node) {
                if (!item.IsScalar()) return std::unexpected(invalid(where, "field names must be scalars"));
                names.push_back(item.as<std::string>());
            }
            return names;
        }

        Result<serializer_builder> builder_from(const YAML::Node& node, std::string_view where, const registry& reg, bool nested);

        Result<FieldOptions> field_options_from(const YAML::Node& node, std::string_view where, bool allow_source) {
            FieldOptions opts;
            for (auto it = node.begin(); it != node.end(); ++it) {
                auto key = it->first.as<std::string>();
                if (key == "kind") continue;
                if (key == "label") opts.label = it->second.as<std::string>();
                else if (key == "source" && allow_source) opts.source = it->second.as<std::string>();
                else return std::unexpected(invalid(scope(where, key), std::format("unknown field option '{}'", key)));
            }
            return opts;
        }

        Result<field_ptr> field_from(const YAML::Node& node, std::string_view where, const registry& reg) {
            if (node.IsScalar()) return make_field({ .source = node.as<std::string>() });
            if (node.IsNull()) return make_field();
            if (!node.IsMap()) return std::unexpected(invalid(where, "a declared field must be a mapping or a source name"));

            std::string kind = "field";
            if (const auto k = node["kind"]) kind = k.as<std::string>();

            if (kind == "serializer") {
                auto nested = builder_from(node, where, reg, true);
                if (!nested) return std::unexpected(nested.error());
                auto built = nested->build();
                if (!built) return std::unexpected(built.error());
                return field_ptr{ *built };
            }
            if (kind == "field" || kind == "primary_key") {
                auto opts = field_options_from(node, where, true);
                if (!opts) return std::unexpected(opts.error());
                if (kind == "field") return make_field(std::move(*opts));
                return std::make_shared<const primary_key_field>(std::move(*opts));
            }
            if (kind == "model_name") {
                auto opts = field_options_from(node, where, false);
                if (!opts) return std::unexpected(opts.error());
                return std::make_shared<const model_name_field>(std::move(opts->label));
            }
            return std::unexpected(invalid(scope(where, "kind"), std::format("unknown field kind '{}'", kind)));
        }

        Result<serializer_builder> builder_from(const YAML::Node& node, std::string_view where, const registry& reg, bool nested) {
            if (node.IsNull()) return serializer_builder{};
            if (!node.IsMap()) return std::unexpected(invalid(where, "a serializer profile must be a mapping"));

            serializer_builder b;
            std::optional<std::string> intro;
            bool primary_key = true;

            for (auto it = node.begin(); it != node.end(); ++it) {
                auto key = it->first.as<std::string>();
                const YAML::Node& v = it->second;
                std::string at = scope(where, key);

                if (key == "fields" || key == "include" || key == "exclude") {
                    auto names = name_list(v, at);
                    if (!names) return std::unexpected(names.error());
                    if (key == "fields") b.fields(std::move(*names));
                    else if (key == "include") b.include(std::move(*names));
                    else b.exclude(std::move(*names));
                } else if (key == "depth") {
                    if (v.IsNull() || (v.IsScalar() && v.Scalar() == "unbounded")) {
                        b.unbounded();
                    } else {
                        auto levels = v.as<long long>();
                        if (levels < 0) return std::unexpected(invalid(at, "depth must not be negative"));
                        b.depth(static_cast<std::size_t>(levels));
                    }
                } else if (key == "include_default_fields") {
                    b.include_default_fields(v.as<bool>());
                } else if (key == "preserve_field_ordering") {
                    b.preserve_field_ordering(v.as<bool>());
                } else if (key == "label") {
                    b.label(v.as<std::string>());
                } else if (key == "source") {
                    b.source(v.as<std::string>());
                } else if (key == "introspector") {
                    intro = v.as<std::string>();
                } else if (key == "primary_key") {
                    primary_key = v.as<bool>();
                } else if (key == "declare") {
                    if (!v.IsMap()) return std::unexpected(invalid(at, "'declare' must map field names to declarations"));
                    for (auto d = v.begin(); d != v.end(); ++d) {
                        auto name = d->first.as<std::string>();
                        auto f = field_from(d->second, scope(at, name), reg);
                        if (!f) return std::unexpected(f.error());
                        b.declare(std::move(name), std::move(*f));
                    }
                } else if (key == "kind" && nested) {
                    continue;
                } else {
                    return std::unexpected(invalid(at, std::format("unknown profile option '{}'", key)));
                }
            }

            if (intro) {
                if (*intro == "object") b.use_introspector(std::make_shared<const object_introspector>(reg));
                else if (*intro == "model") b.use_introspector(std::make_shared<const model_introspector>(reg, primary_key));
                else return std::unexpected(invalid(scope(where, "introspector"), std::format("unknown introspector '{}'", *intro)));
            }
            return b;
        }

    } // namespace

    ProfileResult parse_profile(std::string_view text, const registry& reg) {
        try {
            auto root = YAML::Load(std::string{ text });
            return builder_from(root, "", reg, false);
        } catch (const YAML::ParserException& e) {
            return std::unexpected(invalid("", std::string("YAML parse error: ") + e.what()));
        } catch (const YAML::Exception& e) {
            return std::unexpected(invalid("", std::string("malformed profile: ") + e.what()));
        }
    }

    ProfileResult load_profile(const std::filesystem::path& path, const registry& reg) {
        try {
            auto root = YAML::LoadFile(path.string());
            detail::log::debug("loaded serializer profile '{}'", path.string());
            return builder_from(root, "", reg, false);
        } catch (const YAML::BadFile&) {
            return std::unexpected(invalid(path.string(), "failed to open profile: " + path.string()));
        } catch (const YAML::ParserException& e) {
            return std::unexpected(invalid(path.string(), std::string("YAML parse error: ") + e.what()));
        } catch (const YAML::Exception& e) {
            return std::unexpected(invalid(path.string(), std::string("malformed profile: ") + e.what()));
        }
    }

#pragma region Dump records

    serializer_builder dumpdata_builder(const registry& reg) {
        field_factory as_primary_key = [](const serializer&, std::string_view) -> field_ptr {
            return std::make_shared<const primary_key_field>();
        };

        serializer_builder fields = serializer_builder{}
            .source(std::string{ whole_object })
            .use_introspector(std::make_shared<const model_introspector>(reg, false))
            .depth(0)
            .flat_field_factory(as_primary_key)
            .recursive_field_factory(as_primary_key)
            .preserve_field_ordering();

        return serializer_builder{}
            .use_introspector(std::make_shared<const model_introspector>(reg))
            .preserve_field_ordering()
            .declare("pk", std::make_shared<const primary_key_field>(FieldOptions{ .source = std::string{ whole_object } }))
            .declare("model", std::make_shared<const model_name_field>())
            .declare("fields", std::move(fields));
    }

    serializer_ptr dumpdata_serializer() {
        static const serializer_ptr instance = dumpdata_builder().build().value();
        return instance;
    }

#pragma endregion

} // namespace Stanza
