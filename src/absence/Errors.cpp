//          Copyright Tango Tango, Inc. 2020 - 2021.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          https://www.boost.org/LICENSE_1_0.txt)

#include "absence/Errors.hpp"

namespace absence {

Error::Error(const std::string& message)
    : std::runtime_error(message)
{}

OperationValidityError::OperationValidityError(const std::string& name)
    : Error("Operation '" + name + "' is not valid on this object.")
    , name(name)
{}

const std::string& OperationValidityError::operation() const noexcept {
    return name;
}

EmptyCellError::EmptyCellError()
    : Error("Cannot extract from absent cell")
{}

} // namespace absence
