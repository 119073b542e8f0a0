#include "stanza/registry.hpp"

#include <algorithm>


namespace Stanza {

    const attribute_info* class_info::find(std::string_view attribute) const noexcept {
        auto it = std::ranges::find_if(attributes, [&](const attribute_info& a) { return a.name == attribute; });
        if (it == attributes.end()) return nullptr;
        return std::addressof(*it);
    }

    const class_info* registry::find(std::type_index type) const noexcept {
        auto it = m_Classes.find(type);
        if (it == m_Classes.end()) return nullptr;
        return std::addressof(it->second);
    }

    registry& registry::global() {
        static registry instance;
        return instance;
    }

} // namespace Stanza
