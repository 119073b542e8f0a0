#include "stanza/context.hpp"

#include <algorithm>


namespace Stanza {

    context::context(const introspector& intro, depth_limit depth) noexcept
        : m_Introspector{ &intro }, m_Remaining{ depth } {}

    bool context::on_path(const object_ref& obj) const noexcept {
        return std::ranges::any_of(m_Path, [&](const object_ref& entry) { return obj.same_object(entry); });
    }

    context::PathGuard::PathGuard(context& ctx, const object_ref& obj) : c{ ctx } {
        c.m_Path.push_back(obj);
    }

    context::PathGuard::~PathGuard() {
        c.m_Path.pop_back();
    }

} // namespace Stanza
