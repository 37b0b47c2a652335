#ifndef NAME_GUARD_CONFIG_H
#define NAME_GUARD_CONFIG_H

#include <string>

namespace nameguard {

/**
 * Global configurations
 *
 * All writable options can be set by environment variables, which are read
 * by `Config::init`
 */
class Config {
    static bool werror_;      /// Treat warnings as errors. Env NG_WERROR
    static bool logRename_;   /// Log every identifier renamed by a keyword
                              /// or uniqueness check. Env NG_LOG_RENAME
    static std::string namePrefix_; /// Prepended to names that do not start
                                    /// with a letter or underscore, and to
                                    /// keyword operations and constants.
                                    /// Env NG_NAME_PREFIX
    static std::string nameSuffix_; /// Appended to keyword types and to
                                    /// conflicting class names. Env
                                    /// NG_NAME_SUFFIX

  public:
    static void init(); /// Called in src/ffi/config.cc, or by the driver

    /**
     * Restore every option to its built-in default, ignoring the environment
     */
    static void reset();

    static void setWerror(bool flag = true) { werror_ = flag; }
    static bool werror() { return werror_; }

    static void setLogRename(bool flag = true) { logRename_ = flag; }
    static bool logRename() { return logRename_; }

    /**
     * @throw InvalidConfig if the prefix is not a legal identifier
     */
    static void setNamePrefix(const std::string &prefix);
    static const std::string &namePrefix() { return namePrefix_; }

    /**
     * @throw InvalidConfig if the suffix is empty or has a byte not allowed in
     * identifiers
     */
    static void setNameSuffix(const std::string &suffix);
    static const std::string &nameSuffix() { return nameSuffix_; }
};

} // namespace nameguard

#endif // NAME_GUARD_CONFIG_H
