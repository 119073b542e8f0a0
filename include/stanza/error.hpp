#pragma once


/*
    -------------------------------------------------------------
    Stanza::SerializeError - Structured serialization error report
    -------------------------------------------------------------
    `Stanza::SerializeError` describes a failure that occurred while building
    a serializer, resolving fields, reading attributes or rendering a tree.

    ------
    Fields
    ------
    - `code errc`:
        * Enumerated error code describing the failure category:
            - `attribute_resolution`
            - `field_name_conflict`
            - `unsupported_format`
            - `invalid_configuration`
            - `invalid_data`
            - `not_a_model`
    - `std::string type_name`:
        * Registered name of the object type involved, when there is one
    - `std::string path`:
        * Attribute path (`"partner.first_name"`), field name, or format key
          the error is about
    - `std::string msg`:
        * Human-readable description of the error
        * Intended for debugging and logging; not stable for programmatic use

    -----
    Usage
    -----
    - Fallible operations such as `serializer::serialize(...)` and
      `Stanza::encode(...)` return `std::expected<T, SerializeError>`
    - Running out of depth and meeting a cycle are NOT errors; both are
      handled by degrading to a flat representation

    This header defines the error reporting structure and its error code
    enum; it contains no serialization logic
*/

#include <cstddef>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

#include "stanza/config.hpp"


/// @defgroup StanzaError Serialization Errors
/// @ingroup Stanza
/// @brief Error codes and structures produced by serializers and renderers
namespace Stanza {

    /// @ingroup StanzaError
    /// @brief Structured error information produced during serialization.
    ///
    /// @details
    /// Every error is reported to the direct caller; nothing is retried and
    /// nothing is swallowed along the way. A failure deep inside a nested
    /// serializer surfaces unchanged from the top-level call.
    struct SerializeError {
        /// @ingroup StanzaError
        /// @brief Enumeration of possible error categories.
        ///
        /// Members:
        /// - `attribute_resolution`
        ///     A named attribute or source path does not exist on the object,
        ///     or the object's type was never registered.
        ///
        /// - `field_name_conflict`
        ///     A `fields`/`include` list or a declaration names a reserved key,
        ///     a name is declared twice, or two fields resolve to the same
        ///     output key after label resolution.
        ///
        /// - `unsupported_format`
        ///     No renderer is registered for the requested format key.
        ///
        /// - `invalid_configuration`
        ///     A serializer profile could not be parsed or has the wrong shape.
        ///
        /// - `invalid_data`
        ///     A renderer cannot represent the given tree (e.g. CSV of a scalar).
        ///
        /// - `not_a_model`
        ///     A model-aware field was applied to an object without model metadata.
        enum class code : uint8_t {
            attribute_resolution,  ///< Missing attribute or unregistered type.
            field_name_conflict,   ///< Reserved or colliding field names.
            unsupported_format,    ///< Unknown renderer key.
            invalid_configuration, ///< Malformed serializer profile.
            invalid_data,          ///< Tree shape not representable by a renderer.
            not_a_model,           ///< Model metadata required but absent.
        };

        code errc{};              ///< The classification of the error.
        std::string type_name{};  ///< Type involved, empty when not applicable.
        std::string path{};       ///< Attribute path, field name or format key.
        std::string msg{};        ///< Human-readable diagnostic message.

        /// @ingroup StanzaError
        /// @brief Constructs a fully-populated `SerializeError` instance.
        ///
        /// @param c         Error classification.
        /// @param type_name Registered name of the object type involved.
        /// @param path      Attribute path, field name or format key.
        /// @param m         Human-readable message.
        /// @return A `SerializeError` containing all supplied information.
        [[nodiscard]] STANZA_API static SerializeError make(code c, std::string_view type_name, std::string_view path, std::string_view m);

        /// @ingroup StanzaError
        /// @brief Returns a stable lowercase name for an error code
        [[nodiscard]] STANZA_API static std::string_view code_name(code c) noexcept;
    };

    /// @ingroup StanzaError
    /// @brief Alias for the result type of every fallible Stanza operation
    template<typename T>
    using Result = std::expected<T, SerializeError>;

} // namespace Stanza
