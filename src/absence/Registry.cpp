//          Copyright Tango Tango, Inc. 2020 - 2021.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          https://www.boost.org/LICENSE_1_0.txt)

#include "absence/Registry.hpp"

#include <iostream>

namespace absence {

Registry& Registry::global() {
    static Registry registry;
    return registry;
}

Registry::Registry()
    : mutex()
    , bindings()
{}

void Registry::bind_sentinel(const std::string& name) {
    bind(name, &absent);
}

void Registry::bind_predicate(const std::string& name) {
    bind(name, &is_absent);
}

void Registry::bind(const std::string& name, Binding binding) {
    bool replaced_other_kind = false;

    {
        std::lock_guard guard(mutex);
        auto existing = bindings.find(name);

        if(existing == bindings.end()) {
            bindings.emplace(name, binding);
        } else {
            replaced_other_kind = existing->second.index() != binding.index();
            existing->second = binding;
        }
    }

    if(replaced_other_kind) {
        std::cerr << "Rebinding '" << name << "' replaces a binding of another kind." << std::endl;
    }
}

const Absent* Registry::sentinel(const std::string& name) const {
    std::lock_guard guard(mutex);
    auto found = bindings.find(name);

    if(found == bindings.end() || !std::holds_alternative<const Absent*>(found->second)) {
        return nullptr;
    }

    return std::get<const Absent*>(found->second);
}

const IsAbsent* Registry::predicate(const std::string& name) const {
    std::lock_guard guard(mutex);
    auto found = bindings.find(name);

    if(found == bindings.end() || !std::holds_alternative<const IsAbsent*>(found->second)) {
        return nullptr;
    }

    return std::get<const IsAbsent*>(found->second);
}

bool Registry::contains(const std::string& name) const {
    std::lock_guard guard(mutex);
    return bindings.find(name) != bindings.end();
}

bool Registry::unbind(const std::string& name) {
    std::lock_guard guard(mutex);
    return bindings.erase(name) > 0;
}

void Registry::clear() {
    std::lock_guard guard(mutex);
    bindings.clear();
}

void install(const std::optional<std::string>& sentinel_name,
             const std::optional<std::string>& predicate_name) {
    auto& registry = Registry::global();

    if(sentinel_name.has_value()) {
        registry.bind_sentinel(*sentinel_name);
    }

    if(predicate_name.has_value()) {
        registry.bind_predicate(*predicate_name);
    }
}

} // namespace absence
