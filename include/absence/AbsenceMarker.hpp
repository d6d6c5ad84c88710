//          Copyright Tango Tango, Inc. 2020 - 2021.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          https://www.boost.org/LICENSE_1_0.txt)

#ifndef _ABSENCE_ABSENCE_MARKER_H_
#define _ABSENCE_ABSENCE_MARKER_H_

#include <functional>
#include <iosfwd>
#include <memory>
#include <string>
#include "Absent.hpp"

namespace absence {

class AbsenceMarker;

/**
 * Formatting capability for an `AbsenceMarker`. A display is handed
 * to a marker when the marker is made and cannot be replaced later.
 */
class MarkerDisplay {
public:
    /**
     * @param marker The marker being formatted.
     * @return The debugging representation of the marker.
     */
    virtual std::string repr(const AbsenceMarker& marker) const = 0;

    /**
     * @param marker The marker being formatted.
     * @return The display form of the marker.
     */
    virtual std::string str(const AbsenceMarker& marker) const = 0;

    virtual ~MarkerDisplay() = default;
};

using MarkerFormatter = std::function<std::string(const AbsenceMarker&)>;

/**
 * An absence marker that is independent of the canonical `absent`.
 * Libraries which need a "not supplied" value of their own - one that
 * must never be mistaken for `absent` - make one with `make_marker`.
 *
 * A marker is a handle: copying it yields the same marker, while
 * every `create` call yields a new one. Markers compare by identity
 * only, so two separately created markers are never equal and no
 * marker is ever equal to `absent`.
 */
class AbsenceMarker {
public:
    /**
     * Create a new marker using the default formatting.
     *
     * @return A marker distinct from every other marker.
     */
    static AbsenceMarker create();

    /**
     * Create a new marker formatted by the given display.
     *
     * @param display The formatting to use for the marker's lifetime.
     * @return A marker distinct from every other marker.
     */
    static AbsenceMarker create(std::shared_ptr<const MarkerDisplay> display);

    /**
     * Markers cannot be reconstructed from serialized data.
     *
     * @throws OperationValidityError always.
     */
    static AbsenceMarker deserialize(const std::string& data);

    // A handle always names a marker, so moves copy the handle.
    AbsenceMarker(const AbsenceMarker& other) noexcept;
    AbsenceMarker(AbsenceMarker&& other) noexcept;
    AbsenceMarker& operator=(const AbsenceMarker& other) noexcept;
    AbsenceMarker& operator=(AbsenceMarker&& other) noexcept;

    explicit operator bool() const noexcept {
        return false;
    }

    std::string repr() const;
    std::string str() const;

    /**
     * @throws OperationValidityError always.
     */
    std::string serialize() const;

    /**
     * Check if this handle refers to the same marker as another.
     */
    bool is(const AbsenceMarker& other) const noexcept;

    std::size_t identity_hash() const noexcept;

private:
    struct State {
        std::shared_ptr<const MarkerDisplay> display;
    };

    explicit AbsenceMarker(std::shared_ptr<const State> state) noexcept;

    std::shared_ptr<const State> state;
};

/**
 * Make a new marker with optional formatting hooks. An empty hook keeps
 * the default text - `absence.AbsenceFactory( )` for `repr` and
 * `absence` for `str`. The canonical `absent` is never affected.
 *
 * @param repr_function Produces the marker's debugging representation.
 * @param str_function Produces the marker's display form.
 * @return A marker distinct from every other marker.
 */
AbsenceMarker make_marker(MarkerFormatter repr_function = MarkerFormatter(),
                          MarkerFormatter str_function = MarkerFormatter());

inline bool operator==(const AbsenceMarker& lhs, const AbsenceMarker& rhs) noexcept {
    return lhs.is(rhs);
}

inline bool operator!=(const AbsenceMarker& lhs, const AbsenceMarker& rhs) noexcept {
    return !lhs.is(rhs);
}

inline bool operator==(const AbsenceMarker&, const Absent&) noexcept {
    return false;
}

inline bool operator==(const Absent&, const AbsenceMarker&) noexcept {
    return false;
}

inline bool operator!=(const AbsenceMarker&, const Absent&) noexcept {
    return true;
}

inline bool operator!=(const Absent&, const AbsenceMarker&) noexcept {
    return true;
}

std::ostream& operator<<(std::ostream& out, const AbsenceMarker& marker);

} // namespace absence

namespace std {

template <>
struct hash<absence::AbsenceMarker> {
    std::size_t operator()(const absence::AbsenceMarker& marker) const noexcept {
        return marker.identity_hash();
    }
};

} // namespace std

#endif
