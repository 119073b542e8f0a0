#pragma once


/*
    ---------------------------------------------------
    Stanza::context - Per-call resolution state
    ---------------------------------------------------
    A `context` is created by every top-level `serializer::serialize(...)`
    call and threaded by reference through every field and nested
    serializer involved in that call. It holds:

        - the remaining nesting depth (`std::nullopt` = unbounded)
        - the identities of the objects currently being expanded, used to
          detect cycles
        - the introspector in effect for the object being expanded
        - the name of the field currently being resolved

    Fields and serializers never store any of this themselves, which is what
    makes a single serializer safe to share between threads.

    Every mutation is scoped: the nested guard types restore the previous
    state when they go out of scope, so an early error return leaves the
    context exactly as it was found.
*/

#include <cstddef>
#include <optional>
#include <string_view>
#include <typeindex>
#include <utility>
#include <vector>

#include "stanza/config.hpp"
#include "stanza/raw.hpp"

/// @defgroup StanzaContext Resolution Context
/// @ingroup Stanza
/// @brief Per-call state of a serialization

namespace Stanza {

    class introspector;

    /// @ingroup StanzaContext
    /// @brief Remaining nesting depth; `std::nullopt` means unbounded
    using depth_limit = std::optional<std::size_t>;

    /// @ingroup StanzaContext
    /// @brief Mutable state of one top-level serialization call
    class context {
    public:
        STANZA_API context(const introspector& intro, depth_limit depth) noexcept;

        context(const context&) = delete;
        context& operator=(const context&) = delete;

        [[nodiscard]] const introspector& active_introspector() const noexcept { return *m_Introspector; }
        [[nodiscard]] depth_limit remaining_depth() const noexcept { return m_Remaining; }
        [[nodiscard]] bool depth_exhausted() const noexcept { return m_Remaining && *m_Remaining == 0; }

        /// @brief True if @p obj is being expanded further up the current path
        [[nodiscard]] STANZA_API bool on_path(const object_ref& obj) const noexcept;

        /// @brief Number of objects on the current path
        [[nodiscard]] std::size_t path_length() const noexcept { return m_Path.size(); }

        /// @brief Name of the field being resolved; empty at the root
        [[nodiscard]] std::string_view current_field() const noexcept { return m_Field; }

        /// @brief Pushes an object identity for the lifetime of the guard
        struct PathGuard {
            STANZA_API PathGuard(context& ctx, const object_ref& obj);
            STANZA_API ~PathGuard();
            PathGuard(const PathGuard&) = delete;
            PathGuard& operator=(const PathGuard&) = delete;

            context& c;
        };

        /// @brief Replaces the remaining depth for the lifetime of the guard
        struct DepthGuard {
            DepthGuard(context& ctx, depth_limit next) noexcept : c{ ctx }, saved{ ctx.m_Remaining } { c.m_Remaining = next; }
            ~DepthGuard() { c.m_Remaining = saved; }
            DepthGuard(const DepthGuard&) = delete;
            DepthGuard& operator=(const DepthGuard&) = delete;

            context& c;
            depth_limit saved;
        };

        /// @brief Switches the active introspector; a null replacement is a no-op
        struct IntrospectorGuard {
            IntrospectorGuard(context& ctx, const introspector* replacement) noexcept : c{ ctx }, saved{ ctx.m_Introspector } {
                if (replacement) c.m_Introspector = replacement;
            }
            ~IntrospectorGuard() { c.m_Introspector = saved; }
            IntrospectorGuard(const IntrospectorGuard&) = delete;
            IntrospectorGuard& operator=(const IntrospectorGuard&) = delete;

            context& c;
            const introspector* saved;
        };

        /// @brief Records the field being resolved for the lifetime of the guard
        struct FieldGuard {
            FieldGuard(context& ctx, std::string_view name) noexcept : c{ ctx }, saved{ ctx.m_Field } { c.m_Field = name; }
            ~FieldGuard() { c.m_Field = saved; }
            FieldGuard(const FieldGuard&) = delete;
            FieldGuard& operator=(const FieldGuard&) = delete;

            context& c;
            std::string_view saved;
        };

    private:
        const introspector* m_Introspector;
        depth_limit m_Remaining;
        std::vector<object_ref> m_Path;
        std::string_view m_Field{};
    };

} // namespace Stanza
