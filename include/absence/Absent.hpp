//          Copyright Tango Tango, Inc. 2020 - 2021.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          https://www.boost.org/LICENSE_1_0.txt)

#ifndef _ABSENCE_ABSENT_H_
#define _ABSENCE_ABSENT_H_

#include <cstddef>
#include <functional>
#include <iosfwd>
#include <string>
#include <variant>

namespace absence {

/**
 * The canonical absence marker. It represents "no value was supplied"
 * and is deliberately distinct from `nullptr` or `std::nullopt`, which
 * a caller may pass on purpose. The type carries no state, so every
 * value of it is the same canonical absence and compares equal to
 * every other. Use the `absent` constant rather than constructing one.
 *
 * Markers made by `make_marker` are a different type and never
 * compare equal to this one.
 */
class Absent {
public:
    constexpr Absent() noexcept = default;

    /**
     * An absence marker is always falsey.
     */
    constexpr explicit operator bool() const noexcept {
        return false;
    }

    /**
     * @return The debugging representation, `absence.absent`.
     */
    std::string repr() const;

    /**
     * @return The display form, `absent`.
     */
    std::string str() const;

    /**
     * The canonical marker must never be reconstructed by a
     * deserializer, so serializing it is refused.
     *
     * @throws OperationValidityError always.
     */
    std::string serialize() const;

    static constexpr std::size_t hash_value = 0x61627365UL;
};

constexpr inline bool operator==(const Absent&, const Absent&) noexcept {
    return true;
}

constexpr inline bool operator!=(const Absent&, const Absent&) noexcept {
    return false;
}

std::ostream& operator<<(std::ostream& out, const Absent& marker);

/**
 * The one canonical absence value for the program.
 */
inline constexpr Absent absent{};

/**
 * Retrieve the canonical absence marker. Every call returns a
 * reference to the same object.
 *
 * @return The canonical marker.
 */
constexpr const Absent& canonical_marker() noexcept {
    return absent;
}

/**
 * A slot which holds either a concrete `T` or the canonical absence
 * marker. Functions take an `Absential<T>` parameter defaulted to
 * `absent` when they need to tell "not supplied" apart from any value
 * the caller could pass - including a null one.
 */
template <typename T>
using Absential = std::variant<Absent, T>;

} // namespace absence

namespace std {

template <>
struct hash<absence::Absent> {
    std::size_t operator()(const absence::Absent&) const noexcept {
        return absence::Absent::hash_value;
    }
};

} // namespace std

#endif
