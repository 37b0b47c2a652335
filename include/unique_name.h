#ifndef NAME_GUARD_UNIQUE_NAME_H
#define NAME_GUARD_UNIQUE_NAME_H

#include <functional>
#include <string>
#include <unordered_set>

namespace nameguard {

/**
 * Answers a question about a candidate name. Whether `true` means "free" or
 * "taken" is documented at each use
 */
typedef std::function<bool(const std::string &)> NamePredicate;

/**
 * Find the first free name derived from `name`
 *
 * Candidates are tried in this order until `isFree` returns true:
 *
 * - Without a suffix: `name`, `name2`, `name3`, ...
 * - With a suffix: `name`, `name<suffix>`, `name<suffix>2`,
 * `name<suffix>3`, ...
 *
 * There is no upper bound on the number of attempts. `isFree` must
 * eventually accept a candidate
 *
 * @param name : The name to start from
 * @param isFree : Returns true if the candidate is not in use
 * @param suffix : Inserted between the name and the numbering. Empty for no
 * suffix
 */
std::string validateUnique(const std::string &name, const NamePredicate &isFree,
                           const std::string &suffix = "");

/**
 * Find the first name derived from `name` that is not in `used`, in the same
 * order as `validateUnique`
 */
std::string getUniqueName(const std::string &name,
                          const std::unordered_set<std::string> &used,
                          const std::string &suffix = "");

} // namespace nameguard

#endif // NAME_GUARD_UNIQUE_NAME_H
