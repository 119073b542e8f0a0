#include "stanza/error.hpp"

namespace Stanza {

    SerializeError SerializeError::make(code c, std::string_view type_name, std::string_view path, std::string_view m) {
        SerializeError e;
        e.errc = c;
        e.type_name.assign(type_name.begin(), type_name.end());
        e.path.assign(path.begin(), path.end());
        e.msg.assign(m.begin(), m.end());
        return e;
    }

    std::string_view SerializeError::code_name(code c) noexcept {
        switch (c) {
        case code::attribute_resolution: return "attribute_resolution";
        case code::field_name_conflict: return "field_name_conflict";
        case code::unsupported_format: return "unsupported_format";
        case code::invalid_configuration: return "invalid_configuration";
        case code::invalid_data: return "invalid_data";
        case code::not_a_model: return "not_a_model";
        }
        return "unknown";
    }

} // namespace Stanza
