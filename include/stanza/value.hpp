#pragma once


/*
    ---------------------------------------------
    Stanza::value - Primitive tree node
    ---------------------------------------------
    The `Stanza::value` type represents any node of a serialized tree:
        - null
        - boolean
        - integer (signed 64-bit)
        - number (double)
        - string
        - array
        - object
    It is what every serializer produces and what every renderer consumes.
    A tree of `value`s never refers back to the domain objects it was built
    from.

    -----------------
    Memory Management
    -----------------
    - `value` is allocator-aware and uses `std::pmr::memory_resource` for all
      internal allocations (strings, arrays, objects)
    - Each `value` instance stores a pointer to its `memory_resource`:
        * All nested containers and strings owned by that `value` are allocated
          from this resource
    - Copy construction/assignment:
        * The destination `value` adopts the allocator of the source and performs
          a deep copy of the underlying tree into that allocator
    - Move construction/assignment:
        * The destination `value` steals the allocator and storage of the source

    -------
    Objects
    -------
    - An `object` is a sequence of key/value members, not a hash map
        * Members keep insertion order, so a serializer that preserves its
          field ordering can hand that order to renderers unchanged
        * Serializers that do not preserve ordering sort members by key
          before returning them
    - Lookups are linear; serialized mappings are small

    -----------------
    Kinds and Queries
    -----------------
    - `kind type() const` returns the current kind
    - Convenience predicates:
        * `is_null()`, `is_bool()`, `is_integer()`, `is_number()`,
          `is_string()`, `is_array()`, `is_object()`

    -----------------------------
    Accessors and Auto-Conversion
    -----------------------------
    - Scalar accessors:
        * `as_bool()`, `as_integer()`, `as_number()`, `as_string()`
        * These assume the current type matches and throw
          `std::bad_variant_access` otherwise
    - Container accessors:
        * Non-const `as_array()` / `as_object()` **convert** the value in place
          to an empty container of that kind if necessary
        * Const versions assume the type is already correct

    --------
    Equality
    --------
    - Two values compare equal if they hold structurally equal contents
        * Objects compare as mappings: member order is ignored
        * An integer and a number compare equal when they hold the same
          numeric value

    -------------
    Thread-Safety
    -------------
    - `value` is not inherently thread-safe
    - It is safe to use separate `value` instances from multiple threads
    - Concurrent access to the same `value` instance must be externally synchronized
*/

/// @defgroup Stanza Stanza Serialization Library
/// @brief Core types and functions for Stanza

/// @defgroup StanzaValue Primitive Tree
/// @ingroup Stanza

#include <variant>
#include <string>
#include <string_view>
#include <vector>
#include <memory_resource>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <type_traits>
#include <concepts>
#include <utility>
#include "stanza/config.hpp"

namespace Stanza {
    /// @brief Enumerates the possible kinds held by Stanza::value
    enum class kind : uint8_t {
        null, ///< null value
        boolean, ///< boolean value (`true` or `false`)
        integer, ///< integral value (stored as `int64_t`)
        number, ///< floating point value (stored as `double`)
        string, ///< string value
        array, ///< ordered sequence of values
        object, ///< key/value mapping
    };


    template<class T>
    using pmr_vector = std::pmr::vector<T>;

    /// @ingroup StanzaValue
    /// @brief String type used by Stanza::value (allocator-aware)
    using string = std::pmr::string;

    struct value;
    using allocator_type = std::pmr::polymorphic_allocator<value>;

    /// @ingroup StanzaValue
    /// @brief One key/value entry of an object
    using member = std::pair<string, value>;

    /// @ingroup StanzaValue
    /// @brief Array type used by Stanza::value
    using array = pmr_vector<value>;

    /// @ingroup StanzaValue
    /// @brief Object type used by Stanza::value (insertion ordered)
    using object = pmr_vector<member>;

    /// @ingroup StanzaValue
    /// @brief Variant storage used internally by Stanza::value
    using storage_t = std::variant<
        std::monostate,
        bool,
        std::int64_t,
        double,
        string,
        array,
        object
    >;


    /// @ingroup StanzaValue
    /// @brief Node of a serialized primitive tree.
    ///
    /// @details
    /// All nested allocations (strings, arrays, objects) are performed using
    /// a `std::pmr::memory_resource` associated with each `value` instance.
    /// Container-like operations (e.g. `as_array`, `as_object`, `operator[]`)
    /// use this allocator
    struct value {
        // ------------------------------------------------------------
        // Constructors / assignment / destructor
        // ------------------------------------------------------------

        /// @ingroup StanzaValue
        /// @brief Constructs a null value using the given memory resource
        STANZA_API explicit value(std::pmr::memory_resource* res = std::pmr::get_default_resource()) noexcept;

        /// @ingroup StanzaValue
        /// @brief Constructs a null value using the given memory resource
        STANZA_API value(std::nullptr_t, std::pmr::memory_resource* res = std::pmr::get_default_resource()) noexcept;

        /// @ingroup StanzaValue
        /// @brief Constructs a boolean value
        STANZA_API value(bool b, std::pmr::memory_resource* res = std::pmr::get_default_resource()) noexcept;

        /// @ingroup StanzaValue
        /// @brief Constructs an integer value from any integral type except `bool`;
        ///        unsigned values above `INT64_MAX` become numbers
        template<std::integral I> requires (!std::same_as<I, bool>)
        value(I i, std::pmr::memory_resource* res = std::pmr::get_default_resource()) noexcept
            : m_MemRes{ res } {
            if constexpr (std::is_unsigned_v<I> && sizeof(I) >= sizeof(std::int64_t)) {
                if (i > static_cast<I>(std::numeric_limits<std::int64_t>::max())) {
                    m_Storage = static_cast<double>(i);
                    return;
                }
            }
            m_Storage = static_cast<std::int64_t>(i);
        }

        /// @ingroup StanzaValue
        /// @brief Constructs a floating point value
        STANZA_API value(double d, std::pmr::memory_resource* res = std::pmr::get_default_resource()) noexcept;

        /// @ingroup StanzaValue
        /// @brief Constructs a string value from a C string
        STANZA_API value(const char* s, std::pmr::memory_resource* res = std::pmr::get_default_resource());

        /// @ingroup StanzaValue
        /// @brief Constructs a string value from a string_view
        ///
        /// @param sv Characters are copied into an allocator-backed `Stanza::string`
        STANZA_API value(std::string_view sv, std::pmr::memory_resource* res = std::pmr::get_default_resource());

        /// @ingroup StanzaValue
        /// @brief Constructs a string value from a std::string
        STANZA_API value(const std::string& s, std::pmr::memory_resource* res = std::pmr::get_default_resource());

        /// @ingroup StanzaValue
        /// @brief Constructs a string value from an existing Stanza::string
        STANZA_API value(string s, std::pmr::memory_resource* res = std::pmr::get_default_resource());

        /// @ingroup StanzaValue
        /// @brief Constructs an array value from an existing array
        STANZA_API value(array a, std::pmr::memory_resource* res = std::pmr::get_default_resource());

        /// @ingroup StanzaValue
        /// @brief Constructs an object value from an existing object
        STANZA_API value(object o, std::pmr::memory_resource* res = std::pmr::get_default_resource());

        /// @ingroup StanzaValue
        /// @brief Copy-constructs a value
        ///
        /// @details
        /// The new value adopts the allocator of @p other. The entire tree
        /// rooted at @p other is deeply copied using that allocator
        STANZA_API value(const value& other);

        /// @ingroup StanzaValue
        /// @brief Move-constructs a value, stealing allocator and storage
        STANZA_API value(value&& other) noexcept;

        STANZA_API value& operator=(const value& other);
        STANZA_API value& operator=(value&& other) noexcept;

        // ------------------------------------------------------------
        // Introspection
        // ------------------------------------------------------------

        /// @ingroup StanzaValue
        /// @brief Returns the kind of value currently stored.
        [[nodiscard]] STANZA_API kind type() const noexcept;

        [[nodiscard]] bool is_null()    const noexcept { return type() == kind::null;    }
        [[nodiscard]] bool is_bool()    const noexcept { return type() == kind::boolean; }
        [[nodiscard]] bool is_integer() const noexcept { return type() == kind::integer; }
        [[nodiscard]] bool is_number()  const noexcept { return type() == kind::number;  }
        [[nodiscard]] bool is_string()  const noexcept { return type() == kind::string;  }
        [[nodiscard]] bool is_array()   const noexcept { return type() == kind::array;   }
        [[nodiscard]] bool is_object()  const noexcept { return type() == kind::object;  }

        /// @ingroup StanzaValue
        /// @brief True for arrays and objects
        [[nodiscard]] bool is_container() const noexcept { return is_array() || is_object(); }

        // ------------------------------------------------------------
        // Scalar accessors
        // ------------------------------------------------------------

        /// @pre `is_bool()` must be true.
        [[nodiscard]] STANZA_API bool&       as_bool();
        [[nodiscard]] STANZA_API const bool& as_bool() const;

        /// @pre `is_integer()` must be true.
        [[nodiscard]] STANZA_API std::int64_t&       as_integer();
        [[nodiscard]] STANZA_API const std::int64_t& as_integer() const;

        /// @pre `is_number()` must be true.
        [[nodiscard]] STANZA_API double&       as_number();
        [[nodiscard]] STANZA_API const double& as_number() const;

        /// @pre `is_string()` must be true.
        [[nodiscard]] STANZA_API string&       as_string();
        [[nodiscard]] STANZA_API const string& as_string() const;

        // ------------------------------------------------------------
        // Container accessors
        // ------------------------------------------------------------

        /// @ingroup StanzaValue
        /// @brief Returns the stored array, converting this value to an
        ///        empty array first if it holds anything else
        [[nodiscard]] STANZA_API array&       as_array();

        /// @pre `is_array()` must be true.
        [[nodiscard]] STANZA_API const array& as_array() const;

        /// @ingroup StanzaValue
        /// @brief Returns the stored object, converting this value to an
        ///        empty object first if it holds anything else
        [[nodiscard]] STANZA_API object&       as_object();

        /// @pre `is_object()` must be true.
        [[nodiscard]] STANZA_API const object& as_object() const;

        /// @ingroup StanzaValue
        /// @brief Number of elements (arrays) or members (objects); 0 otherwise
        [[nodiscard]] STANZA_API size_t size() const noexcept;

        // ------------------------------------------------------------
        // Indexing
        // ------------------------------------------------------------

        /// @ingroup StanzaValue
        /// @brief Accesses or creates an array element by index, growing the array as needed
        ///
        /// @details
        /// Non-arrays are converted to an empty array first. New elements are null.
        STANZA_API value& operator[](size_t idx);

        /// @ingroup StanzaValue
        /// @brief Accesses an array element by index (const overload)
        ///
        /// @details
        /// Returns a null sentinel for non-arrays and out of range indices
        STANZA_API const value& operator[](size_t idx) const;

        /// @ingroup StanzaValue
        /// @brief Accesses or appends an object member by key
        ///
        /// @details
        /// Non-objects are converted to an empty object first. A missing key
        /// is appended with a null value, preserving insertion order.
        STANZA_API value& operator[](std::string_view key);

        /// @ingroup StanzaValue
        /// @brief Finds a member with the given key; nullptr if absent or not an object
        [[nodiscard]] STANZA_API const value* find(std::string_view key) const;

        /// @ingroup StanzaValue
        /// @brief Returns the member mapped to @p key
        /// @throws std::out_of_range If the key does not exist or the value is not an object
        [[nodiscard]] STANZA_API const value& at(std::string_view key) const;

        /// @ingroup StanzaValue
        /// @brief Structural equality; objects compare as mappings
        STANZA_API friend bool operator==(const value& lhs, const value& rhs);

        /// @ingroup StanzaValue
        /// @brief Returns the memory resource associated with this value
        [[nodiscard]] std::pmr::memory_resource* resource() const noexcept { return m_MemRes; }

        /// @ingroup StanzaValue
        /// @brief Direct access to the underlying variant storage
        [[nodiscard]] const storage_t& storage() const noexcept { return m_Storage; }

        /// @ingroup StanzaValue
        /// @brief Mutable access to the underlying variant storage
        ///
        /// @details
        /// Bypasses the conversion rules of the accessors above.
        [[nodiscard]] storage_t& storage() noexcept { return m_Storage; }


    private:
        std::pmr::memory_resource* m_MemRes{};
        storage_t m_Storage{};

        static storage_t clone_storage(const storage_t& s, std::pmr::memory_resource* res);
    };

} // namespace Stanza
