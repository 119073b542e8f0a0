#pragma once


/*
    ------------------------------------------------------
    Stanza raw attribute values - to_raw conversion points
    ------------------------------------------------------
    This header defines `Stanza::raw`, the value an attribute read yields
    before any field turns it into a primitive, and the helpers that convert
    ordinary C++ values into it.

    -----
    Goals
    -----
    - Let fields see an attribute's value without knowing the C++ type it
      came from: scalars, dates, sequences and references to other objects
    - Keep object identity intact so serializers can detect cycles
    - Keep temporaries alive: a computed property that returns an object by
      value is boxed, and every reference derived from it shares the box

    ----------
    Core Ideas
    ----------
    - `make_raw(const T&)` converts built-in kinds automatically:
        * `bool`, integral types, enums, floating point types
        * anything convertible to `std::string_view`
        * `std::chrono::year_month_day`, `sys_time<D>`, `hh_mm_ss<D>`
        * `std::optional<T>`, raw pointers, `shared_ptr`, `unique_ptr`,
          `std::reference_wrapper` (empty ones become null)
        * `std::function<R()>` (kept as a lazily invoked callable)
        * ranges, element by element
    - For a user-defined type `T` you can define:

        Stanza::raw to_raw(const T& src);

      in the namespace of `T`; it is found by argument-dependent lookup and
      takes precedence over the generic rules for ranges and objects
    - Every other class type becomes an `object_ref`, resolved at read time
      by an introspector (see `introspector.hpp`)
*/


#include <chrono>
#include <concepts>
#include <cstdint>
#include <functional>
#include <limits>
#include <memory>
#include <optional>
#include <ranges>
#include <string>
#include <string_view>
#include <type_traits>
#include <typeindex>
#include <typeinfo>
#include <utility>
#include <variant>
#include <vector>

#include "stanza/config.hpp"

/// @defgroup StanzaRaw Raw Attribute Values
/// @ingroup Stanza
/// @brief Attribute values as read from domain objects

namespace Stanza {

    struct raw;

    /// @ingroup StanzaRaw
    /// @brief Calendar date, rendered as `YYYY-MM-DD`
    using date = std::chrono::year_month_day;

    /// @ingroup StanzaRaw
    /// @brief UTC point in time, rendered as `YYYY-MM-DDTHH:MM:SS[.mmm]`
    using datetime = std::chrono::sys_time<std::chrono::milliseconds>;

    /// @ingroup StanzaRaw
    /// @brief Time of day, rendered as `HH:MM:SS[.mmm]`
    using time_of_day = std::chrono::hh_mm_ss<std::chrono::milliseconds>;

    /// @ingroup StanzaRaw
    /// @brief Ordered collection of raw values
    using sequence = std::vector<raw>;

    /// @ingroup StanzaRaw
    /// @brief Zero-argument callable producing a raw value on demand
    using thunk = std::function<raw()>;

    /// @ingroup StanzaRaw
    /// @brief Reference to a domain object.
    ///
    /// @details
    /// `address` is borrowed. `owner` is set only when the object (or the
    /// object that contains it) was produced by value and must outlive the
    /// reference. Identity is the pair (address, type), so an object and its
    /// first member never compare equal.
    struct object_ref {
        const void* address = nullptr;
        std::type_index type = typeid(void);
        std::shared_ptr<const void> owner{};

        template<typename T>
        [[nodiscard]] const T& get() const noexcept { return *static_cast<const T*>(address); }

        [[nodiscard]] bool same_object(const object_ref& other) const noexcept {
            return address == other.address && type == other.type;
        }
    };

    /// @ingroup StanzaRaw
    /// @brief Enumerates the kinds held by Stanza::raw
    enum class raw_kind : uint8_t {
        null,
        boolean,
        integer,
        number,
        string,
        date,
        datetime,
        time,
        sequence,
        object,
        callable,
    };

    using raw_storage = std::variant<
        std::monostate,
        bool,
        std::int64_t,
        double,
        std::string,
        date,
        datetime,
        time_of_day,
        sequence,
        object_ref,
        thunk
    >;

    /// @ingroup StanzaRaw
    /// @brief Attribute value as read from a domain object.
    struct raw {
        raw() noexcept = default;
        raw(std::nullptr_t) noexcept {}
        raw(bool b) noexcept : m_Storage{ b } {}

        /// Unsigned values above `INT64_MAX` are stored as numbers.
        template<std::integral I> requires (!std::same_as<I, bool>)
        raw(I i) noexcept {
            if constexpr (std::is_unsigned_v<I> && sizeof(I) >= sizeof(std::int64_t)) {
                if (i > static_cast<I>(std::numeric_limits<std::int64_t>::max())) {
                    m_Storage = static_cast<double>(i);
                    return;
                }
            }
            m_Storage = static_cast<std::int64_t>(i);
        }

        raw(double d) noexcept : m_Storage{ d } {}
        raw(const char* s) : m_Storage{ std::string{ s } } {}
        raw(std::string s) noexcept : m_Storage{ std::move(s) } {}
        raw(date d) noexcept : m_Storage{ d } {}
        raw(datetime t) noexcept : m_Storage{ t } {}
        raw(time_of_day t) noexcept : m_Storage{ t } {}
        raw(sequence s) noexcept : m_Storage{ std::move(s) } {}
        raw(object_ref o) noexcept : m_Storage{ std::move(o) } {}
        raw(thunk f) noexcept : m_Storage{ std::move(f) } {}

        [[nodiscard]] raw_kind kind() const noexcept { return static_cast<raw_kind>(m_Storage.index()); }

        [[nodiscard]] bool is_null()     const noexcept { return kind() == raw_kind::null;     }
        [[nodiscard]] bool is_sequence() const noexcept { return kind() == raw_kind::sequence; }
        [[nodiscard]] bool is_object()   const noexcept { return kind() == raw_kind::object;   }
        [[nodiscard]] bool is_callable() const noexcept { return kind() == raw_kind::callable; }

        [[nodiscard]] const sequence&   as_sequence() const { return std::get<sequence>(m_Storage); }
        [[nodiscard]] const object_ref& as_object()   const { return std::get<object_ref>(m_Storage); }
        [[nodiscard]] const thunk&      as_callable() const { return std::get<thunk>(m_Storage); }

        [[nodiscard]] const raw_storage& storage() const noexcept { return m_Storage; }

    private:
        raw_storage m_Storage{};
    };

    /// @ingroup StanzaRaw
    /// @brief Concept for types with a user-supplied `to_raw` overload.
    template<typename T>
    concept RawConvertible = requires(const T& t) { { to_raw(t) } -> std::same_as<raw>; };

    namespace detail {
        template<typename T> struct is_optional : std::false_type {};
        template<typename T> struct is_optional<std::optional<T>> : std::true_type {};

        template<typename T> struct is_sys_time : std::false_type {};
        template<typename D> struct is_sys_time<std::chrono::sys_time<D>> : std::true_type {};

        template<typename T> struct is_hh_mm_ss : std::false_type {};
        template<typename D> struct is_hh_mm_ss<std::chrono::hh_mm_ss<D>> : std::true_type {};

        template<typename T> struct is_shared_ptr : std::false_type {};
        template<typename T> struct is_shared_ptr<std::shared_ptr<T>> : std::true_type {};

        template<typename T> struct is_unique_ptr : std::false_type {};
        template<typename T, typename D> struct is_unique_ptr<std::unique_ptr<T, D>> : std::true_type {};

        template<typename T> struct is_reference_wrapper : std::false_type {};
        template<typename T> struct is_reference_wrapper<std::reference_wrapper<T>> : std::true_type {};

        template<typename T> struct is_function : std::false_type {};
        template<typename R> struct is_function<std::function<R()>> : std::true_type {};

        /// Types whose conversion never yields an object reference.
        template<typename T>
        inline constexpr bool is_leaf_v =
            std::is_arithmetic_v<T> || std::is_enum_v<T> ||
            std::convertible_to<const T&, std::string_view> ||
            std::same_as<T, date> || is_sys_time<T>::value || is_hh_mm_ss<T>::value;
    } // namespace detail

    template<typename T>
    [[nodiscard]] raw make_raw(const T& v, const std::shared_ptr<const void>& owner = {});

    /// @ingroup StanzaRaw
    /// @brief Converts the result of a call into a raw value, keeping
    ///        by-value objects alive for as long as the raw value needs them.
    template<typename F, typename... Args>
    [[nodiscard]] raw invoke_raw(const std::shared_ptr<const void>& owner, F&& fn, Args&&... args) {
        using R = std::invoke_result_t<F, Args...>;
        using U = std::remove_cvref_t<R>;
        if constexpr (std::is_void_v<R>) {
            std::invoke(std::forward<F>(fn), std::forward<Args>(args)...);
            return raw{};
        } else if constexpr (std::is_reference_v<R> || detail::is_leaf_v<U>) {
            return make_raw(std::invoke(std::forward<F>(fn), std::forward<Args>(args)...), owner);
        } else {
            auto box = std::make_shared<const U>(std::invoke(std::forward<F>(fn), std::forward<Args>(args)...));
            return make_raw(*box, box);
        }
    }

    /// @ingroup StanzaRaw
    /// @brief Converts any C++ value into a raw attribute value.
    ///
    /// @details
    /// Object references produced from @p v (directly or from elements of a
    /// range) are borrowed and share @p owner, so they stay valid for as long
    /// as whatever keeps @p v alive.
    ///
    /// @param v     Value to convert.
    /// @param owner Keep-alive handle for the storage @p v lives in.
    template<typename T>
    raw make_raw(const T& v, const std::shared_ptr<const void>& owner) {
        using U = std::remove_cvref_t<T>;
        if constexpr (std::same_as<U, raw>) {
            return v;
        } else if constexpr (std::same_as<U, std::nullptr_t> || std::same_as<U, std::monostate>) {
            return raw{};
        } else if constexpr (std::same_as<U, bool>) {
            return raw{ v };
        } else if constexpr (std::is_enum_v<U>) {
            return raw{ static_cast<std::int64_t>(std::to_underlying(v)) };
        } else if constexpr (std::integral<U>) {
            return raw{ v };
        } else if constexpr (std::floating_point<U>) {
            return raw{ static_cast<double>(v) };
        } else if constexpr (std::convertible_to<const U&, std::string_view>) {
            return raw{ std::string{ std::string_view{ v } } };
        } else if constexpr (std::same_as<U, date>) {
            return raw{ v };
        } else if constexpr (detail::is_sys_time<U>::value) {
            return raw{ std::chrono::floor<std::chrono::milliseconds>(v) };
        } else if constexpr (detail::is_hh_mm_ss<U>::value) {
            return raw{ time_of_day{ std::chrono::floor<std::chrono::milliseconds>(v.to_duration()) } };
        } else if constexpr (RawConvertible<U>) {
            return to_raw(v);
        } else if constexpr (detail::is_optional<U>::value) {
            return v ? make_raw(*v, owner) : raw{};
        } else if constexpr (std::is_pointer_v<U>) {
            return v ? make_raw(*v, owner) : raw{};
        } else if constexpr (detail::is_shared_ptr<U>::value) {
            return v ? make_raw(*v, std::shared_ptr<const void>{ v }) : raw{};
        } else if constexpr (detail::is_unique_ptr<U>::value) {
            return v ? make_raw(*v, owner) : raw{};
        } else if constexpr (detail::is_reference_wrapper<U>::value) {
            return make_raw(v.get(), owner);
        } else if constexpr (detail::is_function<U>::value) {
            if (!v) return raw{};
            return raw{ thunk{ [fn = std::addressof(v), owner]() { return invoke_raw(owner, *fn); } } };
        } else if constexpr (std::ranges::input_range<const U&>) {
            sequence seq;
            if constexpr (std::ranges::sized_range<const U&>) seq.reserve(std::ranges::size(v));
            for (const auto& element : v) seq.push_back(make_raw(element, owner));
            return raw{ std::move(seq) };
        } else {
            static_assert(std::is_class_v<U>, "Stanza::make_raw: unsupported attribute type");
            return raw{ object_ref{ std::addressof(v), typeid(U), owner } };
        }
    }

} // namespace Stanza
