//          Copyright Tango Tango, Inc. 2020 - 2021.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          https://www.boost.org/LICENSE_1_0.txt)

#ifndef _ABSENCE_ERRORS_H_
#define _ABSENCE_ERRORS_H_

#include <stdexcept>
#include <string>

namespace absence {

/**
 * Base for every error thrown by the absence library. Catching this
 * type catches any failure the library itself reports - but never
 * a failure raised by a callback supplied to a `Cell` combinator,
 * which always propagates untouched.
 */
class Error : public std::runtime_error {
public:
    explicit Error(const std::string& message);
};

/**
 * Thrown when an operation is attempted that is not valid on the
 * target object. Absence markers, for example, refuse to be
 * serialized because reconstructing one elsewhere would create a
 * second canonical marker.
 */
class OperationValidityError : public Error {
public:
    /**
     * Construct the error for the given operation.
     *
     * @param name The name of the disallowed operation.
     */
    explicit OperationValidityError(const std::string& name);

    /**
     * @return The name of the operation which was refused.
     */
    const std::string& operation() const noexcept;

private:
    std::string name;
};

/**
 * Thrown by `Cell::extract` when the cell holds no value.
 */
class EmptyCellError : public Error {
public:
    EmptyCellError();
};

} // namespace absence

#endif
