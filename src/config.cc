#include <algorithm>
#include <cstdlib>
#include <mutex>
#include <optional>

#include <config.h>
#include <container_utils.h>
#include <except.h>
#include <naming_convention.h>

namespace nameguard {

static std::optional<std::string> getStrEnv(const char *name) {
    static std::mutex lock;
    std::lock_guard<std::mutex> guard(lock); // getenv is not thread safe
    char *env = getenv(name);
    if (env == nullptr) {
        return std::nullopt;
    } else {
        return std::make_optional<std::string>(env);
    }
}

static std::optional<bool> getBoolEnv(const char *name) {
    if (auto _env = getStrEnv(name); _env.has_value()) {
        auto &&env = tolower(*_env);
        if (env == "true" || env == "yes" || env == "on" || env == "1") {
            return true;
        } else if (env == "false" || env == "no" || env == "off" ||
                   env == "0") {
            return false;
        } else {
            throw InvalidConfig(
                NG_MSG << "Value of " << name
                       << " must be true/yes/on/1 or false/no/off/0 (case "
                          "insensitive)");
        }
    } else {
        return std::nullopt;
    }
}

bool Config::werror_ = false;
bool Config::logRename_ = false;
std::string Config::namePrefix_ = "a";
std::string Config::nameSuffix_ = "Custom";

void Config::setNamePrefix(const std::string &prefix) {
    if (!isIdentifier(prefix)) {
        throw InvalidConfig(NG_MSG << "Name prefix \"" << prefix
                                   << "\" is not a legal identifier");
    }
    namePrefix_ = prefix;
}

void Config::setNameSuffix(const std::string &suffix) {
    if (suffix.empty() ||
        !std::all_of(suffix.begin(), suffix.end(), isIdentChar)) {
        throw InvalidConfig(NG_MSG << "Name suffix \"" << suffix
                                   << "\" must be a non-empty sequence of "
                                      "identifier characters");
    }
    nameSuffix_ = suffix;
}

void Config::reset() {
    werror_ = false;
    logRename_ = false;
    namePrefix_ = "a";
    nameSuffix_ = "Custom";
}

void Config::init() {
    if (auto flag = getBoolEnv("NG_WERROR"); flag.has_value()) {
        Config::setWerror(*flag);
    }
    if (auto flag = getBoolEnv("NG_LOG_RENAME"); flag.has_value()) {
        Config::setLogRename(*flag);
    }
    if (auto prefix = getStrEnv("NG_NAME_PREFIX"); prefix.has_value()) {
        Config::setNamePrefix(*prefix);
    }
    if (auto suffix = getStrEnv("NG_NAME_SUFFIX"); suffix.has_value()) {
        Config::setNameSuffix(*suffix);
    }
}

} // namespace nameguard
