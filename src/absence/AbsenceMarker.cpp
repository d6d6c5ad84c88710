//          Copyright Tango Tango, Inc. 2020 - 2021.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          https://www.boost.org/LICENSE_1_0.txt)

#include "absence/AbsenceMarker.hpp"
#include "absence/Errors.hpp"

#include <ostream>
#include <utility>

namespace absence {

namespace {

class DefaultDisplay final : public MarkerDisplay {
public:
    std::string repr(const AbsenceMarker&) const override {
        return "absence.AbsenceFactory( )";
    }

    std::string str(const AbsenceMarker&) const override {
        return "absence";
    }
};

class FormatterDisplay final : public MarkerDisplay {
public:
    FormatterDisplay(MarkerFormatter repr_function, MarkerFormatter str_function)
        : repr_function(std::move(repr_function))
        , str_function(std::move(str_function))
    {}

    std::string repr(const AbsenceMarker& marker) const override {
        if(repr_function) {
            return repr_function(marker);
        }
        return fallback.repr(marker);
    }

    std::string str(const AbsenceMarker& marker) const override {
        if(str_function) {
            return str_function(marker);
        }
        return fallback.str(marker);
    }

private:
    MarkerFormatter repr_function;
    MarkerFormatter str_function;
    DefaultDisplay fallback;
};

const std::shared_ptr<const MarkerDisplay>& default_display() {
    static const std::shared_ptr<const MarkerDisplay> display = std::make_shared<DefaultDisplay>();
    return display;
}

} // namespace

AbsenceMarker::AbsenceMarker(std::shared_ptr<const State> state) noexcept
    : state(std::move(state))
{}

AbsenceMarker::AbsenceMarker(const AbsenceMarker& other) noexcept
    : state(other.state)
{}

AbsenceMarker::AbsenceMarker(AbsenceMarker&& other) noexcept
    : state(other.state)
{}

AbsenceMarker& AbsenceMarker::operator=(const AbsenceMarker& other) noexcept {
    state = other.state;
    return *this;
}

AbsenceMarker& AbsenceMarker::operator=(AbsenceMarker&& other) noexcept {
    state = other.state;
    return *this;
}

AbsenceMarker AbsenceMarker::create() {
    return create(default_display());
}

AbsenceMarker AbsenceMarker::create(std::shared_ptr<const MarkerDisplay> display) {
    if(!display) {
        display = default_display();
    }

    // Every marker owns a fresh state block; its address is the identity.
    return AbsenceMarker(std::make_shared<State>(State{std::move(display)}));
}

AbsenceMarker AbsenceMarker::deserialize(const std::string&) {
    throw OperationValidityError("deserialize");
}

std::string AbsenceMarker::repr() const {
    return state->display->repr(*this);
}

std::string AbsenceMarker::str() const {
    return state->display->str(*this);
}

std::string AbsenceMarker::serialize() const {
    throw OperationValidityError("serialize");
}

bool AbsenceMarker::is(const AbsenceMarker& other) const noexcept {
    return state == other.state;
}

std::size_t AbsenceMarker::identity_hash() const noexcept {
    return std::hash<const State*>()(state.get());
}

AbsenceMarker make_marker(MarkerFormatter repr_function, MarkerFormatter str_function) {
    if(!repr_function && !str_function) {
        return AbsenceMarker::create();
    }

    return AbsenceMarker::create(std::make_shared<FormatterDisplay>(
        std::move(repr_function),
        std::move(str_function)
    ));
}

std::ostream& operator<<(std::ostream& out, const AbsenceMarker& marker) {
    return out << marker.str();
}

} // namespace absence
