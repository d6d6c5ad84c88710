//          Copyright Tango Tango, Inc. 2020 - 2021.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          https://www.boost.org/LICENSE_1_0.txt)

#ifndef _ABSENCE_ABSENCE_H_
#define _ABSENCE_ABSENCE_H_

#include "absence/Config.hpp"
#include "Absent.hpp"
#include "AbsenceMarker.hpp"
#include "Cell.hpp"
#include "Errors.hpp"
#include "Predicates.hpp"
#include "Registry.hpp"

#endif
