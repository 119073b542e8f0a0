#pragma once


/*
    -----------------------------------------------------
    Stanza::registry - Reflection data for domain types
    -----------------------------------------------------
    C++ has no runtime attribute lookup, so types that Stanza serializes are
    described once, up front, through a registry:

        Stanza::registry::global().reflect<Person>("Person")
            .member("first_name", &Person::first_name)
            .member("age", &Person::age)
            .property("full_name", &Person::full_name)
            .method("is_child", &Person::is_child)
            .constant("CHILD_AGE", 16)
            .display([](const Person& p) { return p.first_name; });

    ----------------
    Attribute kinds
    ----------------
    - `member`    instance data; discovered by default unless its name
                  starts with an underscore
    - `relation`  instance data pointing at other model objects (many-to-many
                  style); discovered by default after members
    - `property`  computed from a const object; readable, never discovered
    - `method`    zero-argument member function; readable, never discovered
    - `constant`  class-level value shared by every instance; readable,
                  never discovered

    ------
    Models
    ------
    `model(app_label, model_name)` and `primary_key(...)` attach schema
    metadata used by `model_introspector` and the model-aware fields.

    -------------
    Thread-Safety
    -------------
    Registration is not synchronized. Register every type before the first
    serialization; concurrent lookups afterwards are safe.
*/

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <typeindex>
#include <unordered_map>
#include <utility>
#include <vector>

#include "stanza/config.hpp"
#include "stanza/raw.hpp"

/// @defgroup StanzaRegistry Reflection Registry
/// @ingroup Stanza
/// @brief Describing domain types so they can be introspected

namespace Stanza {

    /// @ingroup StanzaRegistry
    /// @brief How an attribute participates in default field discovery
    enum class attribute_kind : uint8_t {
        member,
        relation,
        property,
        method,
        constant,
    };

    /// @ingroup StanzaRegistry
    /// @brief One readable attribute of a registered type
    struct attribute_info {
        std::string name;
        attribute_kind kind = attribute_kind::member;
        std::function<raw(const object_ref&)> read;
    };

    /// @ingroup StanzaRegistry
    /// @brief Schema metadata of a model type
    struct model_meta {
        std::string app_label;
        std::string model_name;
        std::string pk_name = "id";

        /// `app_label.model_name`
        [[nodiscard]] std::string label() const { return app_label + "." + model_name; }
    };

    /// @ingroup StanzaRegistry
    /// @brief Everything known about one registered type
    struct class_info {
        std::string name;
        std::vector<attribute_info> attributes;
        std::function<std::string(const object_ref&)> display;
        std::optional<model_meta> model;

        /// @brief Finds an attribute by name; nullptr if the type has none
        [[nodiscard]] STANZA_API const attribute_info* find(std::string_view attribute) const noexcept;
    };

    template<typename T>
    class class_builder;

    /// @ingroup StanzaRegistry
    /// @brief Maps C++ types to their reflection data
    class registry {
    public:
        registry() = default;
        registry(const registry&) = delete;
        registry& operator=(const registry&) = delete;

        /// @brief Starts (or restarts) the description of type `T`
        ///
        /// @details
        /// Registering a type twice replaces its previous description.
        template<typename T>
        class_builder<T> reflect(std::string name) {
            auto& info = m_Classes[std::type_index{ typeid(T) }];
            info = class_info{};
            info.name = std::move(name);
            return class_builder<T>{ info };
        }

        /// @brief Looks up the reflection data of a dynamic type
        [[nodiscard]] STANZA_API const class_info* find(std::type_index type) const noexcept;

        /// @brief True if `T` has been registered
        template<typename T>
        [[nodiscard]] bool contains() const noexcept { return find(std::type_index{ typeid(T) }) != nullptr; }

        /// @brief Process-wide registry used when no other one is supplied
        [[nodiscard]] STANZA_API static registry& global();

    private:
        std::unordered_map<std::type_index, class_info> m_Classes;
    };

    /// @ingroup StanzaRegistry
    /// @brief Fluent description of the attributes of `T`
    template<typename T>
    class class_builder {
    public:
        explicit class_builder(class_info& info) noexcept : m_Info{ info } {}

        /// @brief Instance data member
        template<typename M>
        class_builder& member(std::string name, M T::* ptr) {
            static_assert(!std::is_function_v<M>, "use property() or method() for member functions");
            return add(std::move(name), attribute_kind::member, [ptr](const object_ref& obj) {
                return make_raw(obj.get<T>().*ptr, obj.owner);
            });
        }

        /// @brief Instance data member referring to related model objects
        template<typename M>
        class_builder& relation(std::string name, M T::* ptr) {
            static_assert(!std::is_function_v<M>, "relations must be data members");
            return add(std::move(name), attribute_kind::relation, [ptr](const object_ref& obj) {
                return make_raw(obj.get<T>().*ptr, obj.owner);
            });
        }

        /// @brief Computed attribute: any callable taking `const T&`
        ///        (const member functions included)
        template<typename F>
        class_builder& property(std::string name, F fn) {
            return add(std::move(name), attribute_kind::property, [fn = std::move(fn)](const object_ref& obj) {
                return invoke_raw(obj.owner, fn, obj.get<T>());
            });
        }

        /// @brief Zero-argument member function, read as a lazily invoked callable
        template<typename F>
        class_builder& method(std::string name, F fn) {
            return add(std::move(name), attribute_kind::method, [fn = std::move(fn)](const object_ref& obj) {
                return raw{ thunk{ [fn, obj]() { return invoke_raw(obj.owner, fn, obj.get<T>()); } } };
            });
        }

        /// @brief Class-level value, identical for every instance
        template<typename V>
        class_builder& constant(std::string name, V v) {
            auto box = std::make_shared<const V>(std::move(v));
            return add(std::move(name), attribute_kind::constant, [box](const object_ref&) {
                return make_raw(*box, box);
            });
        }

        /// @brief Flat representation used once depth runs out or a cycle is met
        template<typename F>
        class_builder& display(F fn) {
            m_Info.display = [fn = std::move(fn)](const object_ref& obj) {
                return std::string{ std::invoke(fn, obj.get<T>()) };
            };
            return *this;
        }

        /// @brief Marks `T` as a model with schema metadata
        class_builder& model(std::string app_label, std::string model_name) {
            model_meta meta;
            if (m_Info.model) meta.pk_name = m_Info.model->pk_name;
            meta.app_label = std::move(app_label);
            meta.model_name = std::move(model_name);
            m_Info.model = std::move(meta);
            return *this;
        }

        /// @brief Primary key member; implies `model(...)` has been or will be called
        template<typename M>
        class_builder& primary_key(std::string name, M T::* ptr) {
            if (!m_Info.model) m_Info.model = model_meta{};
            m_Info.model->pk_name = name;
            return member(std::move(name), ptr);
        }

    private:
        class_builder& add(std::string name, attribute_kind kind, std::function<raw(const object_ref&)> read) {
            m_Info.attributes.push_back(attribute_info{ std::move(name), kind, std::move(read) });
            return *this;
        }

        class_info& m_Info;
    };

} // namespace Stanza
