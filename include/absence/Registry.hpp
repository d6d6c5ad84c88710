//          Copyright Tango Tango, Inc. 2020 - 2021.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          https://www.boost.org/LICENSE_1_0.txt)

#ifndef _ABSENCE_REGISTRY_H_
#define _ABSENCE_REGISTRY_H_

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <variant>
#include "absence/Config.hpp"
#include "Absent.hpp"
#include "Predicates.hpp"

namespace absence {

/**
 * A named table through which the canonical marker and the `is_absent`
 * predicate can be reached without including this library's headers
 * at every use site. Each name is bound to at most one object, and a
 * lookup always hands back the library's own objects - never a copy -
 * so identity comparisons against `absent` keep working.
 *
 * All operations are safe to call from multiple threads.
 */
class Registry {
public:
    /**
     * @return The process-wide registry used by `install`.
     */
    static Registry& global();

    Registry();

    /**
     * Bind `absent` under the given name, replacing any prior binding.
     */
    void bind_sentinel(const std::string& name);

    /**
     * Bind `is_absent` under the given name, replacing any prior binding.
     */
    void bind_predicate(const std::string& name);

    /**
     * Look up the canonical marker by name.
     *
     * @return A pointer to `absent`, or nullptr if the name is unbound or
     *         bound to something else.
     */
    const Absent* sentinel(const std::string& name) const;

    /**
     * Look up the canonical predicate by name.
     *
     * @return A pointer to `is_absent`, or nullptr if the name is unbound or
     *         bound to something else.
     */
    const IsAbsent* predicate(const std::string& name) const;

    bool contains(const std::string& name) const;

    /**
     * Remove a binding.
     *
     * @return true iff the name was bound.
     */
    bool unbind(const std::string& name);

    void clear();

private:
    using Binding = std::variant<const Absent*, const IsAbsent*>;

    void bind(const std::string& name, Binding binding);

    mutable std::mutex mutex;
    std::map<std::string, Binding> bindings;
};

/**
 * Bind the canonical marker and the `is_absent` predicate into the
 * global registry. Passing `std::nullopt` for either name skips that
 * binding.
 *
 * @param sentinel_name The name for `absent`.
 * @param predicate_name The name for `is_absent`.
 */
void install(const std::optional<std::string>& sentinel_name = std::string(default_sentinel_name),
             const std::optional<std::string>& predicate_name = std::string(default_predicate_name));

} // namespace absence

#endif
