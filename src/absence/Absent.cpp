//          Copyright Tango Tango, Inc. 2020 - 2021.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          https://www.boost.org/LICENSE_1_0.txt)

#include "absence/Absent.hpp"
#include "absence/Errors.hpp"

#include <ostream>

namespace absence {

std::string Absent::repr() const {
    return "absence.absent";
}

std::string Absent::str() const {
    return "absent";
}

std::string Absent::serialize() const {
    throw OperationValidityError("serialize");
}

std::ostream& operator<<(std::ostream& out, const Absent& marker) {
    return out << marker.str();
}

} // namespace absence
