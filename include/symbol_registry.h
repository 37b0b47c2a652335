#ifndef NAME_GUARD_SYMBOL_REGISTRY_H
#define NAME_GUARD_SYMBOL_REGISTRY_H

#include <initializer_list>
#include <mutex>
#include <string>
#include <unordered_set>

#include <unique_name.h>

namespace nameguard {

/**
 * Fully-qualified names of the classes and interfaces declared so far in a
 * generation run
 *
 * Names are compared case-insensitively, as PHP does for classes. The
 * registry is owned by the code-generation driver. `validateClass` only reads
 * it, so the driver has to `declare` every name it emits
 *
 * All methods are thread-safe
 */
class SymbolRegistry {
    mutable std::mutex lock_;
    std::unordered_set<std::string> names_; // Lowercase

  public:
    SymbolRegistry() {}
    SymbolRegistry(std::initializer_list<std::string> names);

    SymbolRegistry(const SymbolRegistry &) = delete;
    SymbolRegistry &operator=(const SymbolRegistry &) = delete;

    /**
     * Join a namespace and a name with a backslash. An empty namespace is the
     * global namespace
     */
    static std::string qualify(const std::string &ns, const std::string &name);

    /**
     * Record a name
     *
     * @return false if it was already declared
     */
    bool declare(const std::string &qualifiedName);
    bool declare(const std::string &ns, const std::string &name) {
        return declare(qualify(ns, name));
    }

    bool contains(const std::string &qualifiedName) const;

    size_t size() const;
    void clear();

    /**
     * A predicate returning true for declared names, for `validateClass`. The
     * registry must outlive the predicate
     */
    NamePredicate existence() const;
};

} // namespace nameguard

#endif // NAME_GUARD_SYMBOL_REGISTRY_H
