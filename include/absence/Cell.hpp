//          Copyright Tango Tango, Inc. 2020 - 2021.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          https://www.boost.org/LICENSE_1_0.txt)

#ifndef _ABSENCE_CELL_H_
#define _ABSENCE_CELL_H_

#include <functional>
#include <optional>
#include <ostream>
#include <type_traits>
#include <utility>
#include <variant>
#include "Absent.hpp"
#include "Errors.hpp"

namespace absence {

template <typename T>
class Cell;

template <typename C>
struct is_cell : std::false_type {};

template <typename T>
struct is_cell<Cell<T>> : std::true_type {};

template <typename C>
inline constexpr bool is_cell_v = is_cell<std::decay_t<C>>::value;

namespace detail {

template <typename T, typename = void>
struct is_streamable : std::false_type {};

template <typename T>
struct is_streamable<T, std::void_t<decltype(std::declval<std::ostream&>() << std::declval<const T&>())>>
    : std::true_type {};

} // namespace detail

template <typename Func, typename T>
using MapResult = Cell<std::decay_t<std::invoke_result_t<Func, const T&>>>;

template <typename Func, typename T>
using FlatMapResult = std::decay_t<std::invoke_result_t<Func, const T&>>;

/**
 * A cell holds either a single value or nothing at all - where "nothing"
 * is the canonical `absent` marker rather than a null. It wraps an
 * `Absential<T>` and offers combinators so that callers can transform,
 * test and fall back on possibly missing values without writing the
 * presence checks themselves.
 *
 * Cells are immutable values. Every combinator returns a new cell and
 * leaves the source untouched, so a cell may be shared freely between
 * threads. Callbacks handed to a combinator are invoked synchronously,
 * at most once, and any exception they throw propagates to the caller
 * unchanged.
 */
template <typename T>
class Cell {
public:
    using value_type = T;

    /**
     * Construct an empty cell.
     */
    constexpr Cell() noexcept;

    /**
     * Construct a cell around a raw slot. The cell is occupied unless
     * the slot holds `absent`.
     *
     * @param slot The slot to wrap.
     */
    constexpr explicit Cell(const Absential<T>& slot);
    constexpr explicit Cell(Absential<T>&& slot);

    /**
     * Construct an occupied cell.
     *
     * @param value The value to hold.
     * @return A cell holding the value.
     */
    static Cell<T> of(T value);

    /**
     * Construct an empty cell.
     *
     * @return A cell holding nothing.
     */
    static Cell<T> empty() noexcept;

    /**
     * Wrap a raw `Absential<T>` directly.
     *
     * @param slot The slot to wrap.
     * @return An occupied cell unless the slot holds `absent`.
     */
    static Cell<T> from_absential(Absential<T> slot);

    /**
     * Bridge from a nullable value where null means "not supplied".
     *
     * @param value The nullable value.
     * @return An empty cell for `std::nullopt`, otherwise an occupied cell.
     */
    static Cell<T> from_nullable(const std::optional<T>& value);

    /**
     * Bridge from a nullable value, choosing whether null means "not
     * supplied" or is itself a legitimate value. In the latter mode a
     * null input produces an occupied cell holding `std::nullopt`.
     *
     * @param value The nullable value.
     * @param none_is_absent True to treat `std::nullopt` as absence.
     * @return A cell over the nullable type.
     */
    static Cell<std::optional<T>> from_nullable(const std::optional<T>& value, bool none_is_absent);

    /**
     * @return True iff this cell holds no value.
     */
    constexpr bool is_absent() const noexcept;

    /**
     * @return True iff this cell holds a value.
     */
    constexpr bool is_occupied() const noexcept;

    constexpr explicit operator bool() const noexcept;

    /**
     * Access the raw slot, for passing on to functions which take an
     * `Absential<T>` parameter.
     *
     * @return The slot held by this cell.
     */
    constexpr const Absential<T>& value() const noexcept;

    /**
     * Obtain the held value.
     *
     * @return The held value.
     * @throws EmptyCellError if the cell is empty.
     */
    const T& extract() const &;
    T extract() &&;

    /**
     * Obtain the held value or the given fallback if the cell is empty.
     *
     * @param fallback The value to provide for an empty cell.
     * @return The held value or the fallback.
     */
    T extract_or(const T& fallback) const;

    /**
     * Obtain the held value or compute one if the cell is empty. The
     * factory is only invoked when the cell is empty.
     *
     * @param factory Produces the value for an empty cell.
     * @return The held value or the factory's result.
     */
    template <typename Factory>
    T extract_or_compute(Factory&& factory) const;

    /**
     * Apply a function to the held value, or provide the fallback when
     * the cell is empty. The function is never invoked on an empty cell.
     *
     * @param func The function to apply to the held value.
     * @param fallback The result for an empty cell.
     * @return The function's result or the fallback.
     */
    template <typename Func, typename U>
    U evaluate_or(Func&& func, const U& fallback) const;

    /**
     * Test the held value, passing when the cell is empty. Suited to
     * optional constraints where no constraint means anything goes.
     */
    template <typename Predicate>
    bool evaluate_or_true(Predicate&& predicate) const;

    /**
     * Test the held value, failing when the cell is empty.
     */
    template <typename Predicate>
    bool evaluate_or_false(Predicate&& predicate) const;

    /**
     * Transform the held value. An empty cell maps to an empty cell of
     * the result type without invoking the function.
     *
     * @param func The transformation to apply.
     * @return A cell holding the transformed value, or an empty cell.
     */
    template <typename Func>
    MapResult<Func,T> map(Func&& func) const;

    /**
     * Same as `map`.
     */
    template <typename Func>
    MapResult<Func,T> evaluate_or_absent(Func&& func) const;

    /**
     * Transform the held value with a function that itself returns a
     * cell. The returned cell is provided as-is rather than nested.
     *
     * @param func The transformation to apply. Must return a `Cell`.
     * @return The function's cell, or an empty cell.
     */
    template <typename Func>
    FlatMapResult<Func,T> flat_map(Func&& func) const;

    /**
     * Keep the held value only when it satisfies the predicate.
     *
     * @param predicate The test to apply to the held value.
     * @return This cell if occupied and passing, otherwise an empty cell.
     */
    template <typename Predicate>
    Cell<T> filter(Predicate&& predicate) const;

    /**
     * Fall back to another cell when this one is empty. Chaining calls
     * yields the first occupied cell from left to right.
     *
     * @param alternative The cell to provide when this one is empty.
     * @return This cell if occupied, otherwise the alternative.
     */
    Cell<T> or_else(const Cell<T>& alternative) const;

    /**
     * Fall back to a lazily computed cell when this one is empty. The
     * factory is not invoked for an occupied cell.
     *
     * @param factory Produces the alternative cell.
     * @return This cell if occupied, otherwise the factory's result.
     */
    template <typename Factory>
    Cell<T> or_compute(Factory&& factory) const;

    /**
     * Convert to a nullable value where absence becomes `std::nullopt`.
     *
     * @return The held value or `std::nullopt`.
     */
    std::optional<T> to_nullable() const;

    constexpr Cell(const Cell<T>&) = default;
    constexpr Cell(Cell<T>&&) = default;
    Cell<T>& operator=(const Cell<T>&) = default;
    Cell<T>& operator=(Cell<T>&&) = default;

    template <typename U>
    friend bool operator==(const Cell<U>& lhs, const Cell<U>& rhs);

private:
    Absential<T> slot;
};

template <typename T>
constexpr Cell<T>::Cell() noexcept
    : slot(std::in_place_index<0>)
{}

template <typename T>
constexpr Cell<T>::Cell(const Absential<T>& slot)
    : slot(slot)
{}

template <typename T>
constexpr Cell<T>::Cell(Absential<T>&& slot)
    : slot(std::move(slot))
{}

template <typename T>
Cell<T> Cell<T>::of(T value) {
    return Cell<T>(Absential<T>(std::in_place_index<1>, std::move(value)));
}

template <typename T>
Cell<T> Cell<T>::empty() noexcept {
    return Cell<T>();
}

template <typename T>
Cell<T> Cell<T>::from_absential(Absential<T> slot) {
    return Cell<T>(std::move(slot));
}

template <typename T>
Cell<T> Cell<T>::from_nullable(const std::optional<T>& value) {
    if(value.has_value()) {
        return Cell<T>::of(*value);
    } else {
        return Cell<T>::empty();
    }
}

template <typename T>
Cell<std::optional<T>> Cell<T>::from_nullable(const std::optional<T>& value, bool none_is_absent) {
    if(none_is_absent && !value.has_value()) {
        return Cell<std::optional<T>>::empty();
    } else {
        return Cell<std::optional<T>>::of(value);
    }
}

template <typename T>
constexpr bool Cell<T>::is_absent() const noexcept {
    return slot.index() == 0;
}

template <typename T>
constexpr bool Cell<T>::is_occupied() const noexcept {
    return slot.index() == 1;
}

template <typename T>
constexpr Cell<T>::operator bool() const noexcept {
    return is_occupied();
}

template <typename T>
constexpr const Absential<T>& Cell<T>::value() const noexcept {
    return slot;
}

template <typename T>
const T& Cell<T>::extract() const & {
    if(is_occupied()) {
        return std::get<1>(slot);
    } else {
        throw EmptyCellError();
    }
}

template <typename T>
T Cell<T>::extract() && {
    if(is_occupied()) {
        return std::get<1>(std::move(slot));
    } else {
        throw EmptyCellError();
    }
}

template <typename T>
T Cell<T>::extract_or(const T& fallback) const {
    if(is_occupied()) {
        return std::get<1>(slot);
    } else {
        return fallback;
    }
}

template <typename T>
template <typename Factory>
T Cell<T>::extract_or_compute(Factory&& factory) const {
    if(is_occupied()) {
        return std::get<1>(slot);
    } else {
        return std::invoke(std::forward<Factory>(factory));
    }
}

template <typename T>
template <typename Func, typename U>
U Cell<T>::evaluate_or(Func&& func, const U& fallback) const {
    if(is_occupied()) {
        return std::invoke(std::forward<Func>(func), std::get<1>(slot));
    } else {
        return fallback;
    }
}

template <typename T>
template <typename Predicate>
bool Cell<T>::evaluate_or_true(Predicate&& predicate) const {
    return evaluate_or(std::forward<Predicate>(predicate), true);
}

template <typename T>
template <typename Predicate>
bool Cell<T>::evaluate_or_false(Predicate&& predicate) const {
    return evaluate_or(std::forward<Predicate>(predicate), false);
}

template <typename T>
template <typename Func>
MapResult<Func,T> Cell<T>::map(Func&& func) const {
    if(is_occupied()) {
        return MapResult<Func,T>::of(std::invoke(std::forward<Func>(func), std::get<1>(slot)));
    } else {
        return MapResult<Func,T>::empty();
    }
}

template <typename T>
template <typename Func>
MapResult<Func,T> Cell<T>::evaluate_or_absent(Func&& func) const {
    return map(std::forward<Func>(func));
}

template <typename T>
template <typename Func>
FlatMapResult<Func,T> Cell<T>::flat_map(Func&& func) const {
    static_assert(is_cell_v<FlatMapResult<Func,T>>, "flat_map requires a function returning a Cell.");

    if(is_occupied()) {
        return std::invoke(std::forward<Func>(func), std::get<1>(slot));
    } else {
        return FlatMapResult<Func,T>::empty();
    }
}

template <typename T>
template <typename Predicate>
Cell<T> Cell<T>::filter(Predicate&& predicate) const {
    if(is_occupied() && std::invoke(std::forward<Predicate>(predicate), std::get<1>(slot))) {
        return *this;
    } else {
        return Cell<T>::empty();
    }
}

template <typename T>
Cell<T> Cell<T>::or_else(const Cell<T>& alternative) const {
    if(is_occupied()) {
        return *this;
    } else {
        return alternative;
    }
}

template <typename T>
template <typename Factory>
Cell<T> Cell<T>::or_compute(Factory&& factory) const {
    static_assert(
        std::is_convertible<std::invoke_result_t<Factory>, Cell<T>>::value,
        "or_compute requires a factory returning a Cell of the same type."
    );

    if(is_occupied()) {
        return *this;
    } else {
        return std::invoke(std::forward<Factory>(factory));
    }
}

template <typename T>
std::optional<T> Cell<T>::to_nullable() const {
    if(is_occupied()) {
        return std::get<1>(slot);
    } else {
        return std::nullopt;
    }
}

template <typename T>
bool operator==(const Cell<T>& lhs, const Cell<T>& rhs) {
    return lhs.slot == rhs.slot;
}

template <typename T>
bool operator!=(const Cell<T>& lhs, const Cell<T>& rhs) {
    return !(lhs == rhs);
}

template <typename T, typename = std::enable_if_t<detail::is_streamable<T>::value>>
std::ostream& operator<<(std::ostream& out, const Cell<T>& cell) {
    if(cell.is_occupied()) {
        return out << "Cell(" << cell.extract() << ")";
    } else {
        return out << "Cell()";
    }
}

} // namespace absence

namespace std {

template <typename T>
struct hash<absence::Cell<T>> {
    std::size_t operator()(const absence::Cell<T>& cell) const {
        if(cell.is_occupied()) {
            return std::hash<T>()(cell.extract());
        } else {
            return std::hash<absence::Absent>()(absence::absent);
        }
    }
};

} // namespace std

#endif
