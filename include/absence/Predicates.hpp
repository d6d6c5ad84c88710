//          Copyright Tango Tango, Inc. 2020 - 2021.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          https://www.boost.org/LICENSE_1_0.txt)

#ifndef _ABSENCE_PREDICATES_H_
#define _ABSENCE_PREDICATES_H_

#include <type_traits>
#include <variant>
#include "Absent.hpp"
#include "AbsenceMarker.hpp"

namespace absence {

namespace detail {

template <typename V>
struct AbsenceCheck {
    static constexpr bool is_marker(const V&) noexcept { return false; }
    static constexpr bool is_absent(const V&) noexcept { return false; }
};

template <>
struct AbsenceCheck<Absent> {
    static constexpr bool is_marker(const Absent&) noexcept { return true; }
    static constexpr bool is_absent(const Absent&) noexcept { return true; }
};

template <>
struct AbsenceCheck<AbsenceMarker> {
    static bool is_marker(const AbsenceMarker&) noexcept { return true; }
    static bool is_absent(const AbsenceMarker&) noexcept { return false; }
};

template <typename T>
struct AbsenceCheck<Absential<T>> {
    static constexpr bool is_marker(const Absential<T>& value) noexcept {
        return std::holds_alternative<Absent>(value);
    }

    static constexpr bool is_absent(const Absential<T>& value) noexcept {
        return std::holds_alternative<Absent>(value);
    }
};

} // namespace detail

/**
 * Checks whether a value is any kind of absence marker - the canonical
 * `absent` or a marker from `make_marker`. This is a type check and
 * says nothing about which marker the value is.
 */
struct IsMarker {
    template <typename V>
    constexpr bool operator()(const V& value) const noexcept {
        return detail::AbsenceCheck<V>::is_marker(value);
    }
};

/**
 * Checks whether a value is the canonical `absent`. This is the test
 * for "was this Absential argument supplied". Markers from
 * `make_marker` are not the canonical marker and never satisfy it.
 */
struct IsAbsent {
    template <typename V>
    constexpr bool operator()(const V& value) const noexcept {
        return detail::AbsenceCheck<V>::is_absent(value);
    }
};

/**
 * The negation of `is_absent`. When it holds for an `Absential<T>` the
 * slot is safe to read as a `T`.
 */
struct IsPresent {
    template <typename V>
    constexpr bool operator()(const V& value) const noexcept {
        return !detail::AbsenceCheck<V>::is_absent(value);
    }
};

inline constexpr IsMarker is_marker{};
inline constexpr IsAbsent is_absent{};
inline constexpr IsPresent is_present{};

} // namespace absence

#endif
