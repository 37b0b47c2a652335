#ifndef NAME_GUARD_EXCEPT_H
#define NAME_GUARD_EXCEPT_H

#include <source_location>
#include <sstream>
#include <stdexcept>
#include <string>

namespace nameguard {

class MessageBuilder {
    std::ostringstream os_;

  public:
    template <typename T> MessageBuilder &operator<<(const T &obj) {
        os_ << obj;
        return *this;
    }

    operator std::string() const { return os_.str(); }
};

#define NG_MSG ::nameguard::MessageBuilder()

class Error : public std::runtime_error {
  public:
    // NOTE: `source_location` is intended to have a small size and can be
    // copied efficiently.
    Error(const std::string &msg,
          std::source_location loc = std::source_location::current())
        : std::runtime_error(NG_MSG << loc.file_name() << ":" << loc.line()
                                    << ": " << msg) {}
};

/**
 * A name cannot be turned into a non-empty identifier
 *
 * With the default prefix every input yields at least the prefix itself, so
 * this is raised only when the configured prefix has no legal leading
 * character
 */
class InvalidName : public Error {
    std::string rawName_;

  public:
    InvalidName(const std::string &rawName, const std::string &msg,
                std::source_location loc = std::source_location::current())
        : Error(msg, loc), rawName_(rawName) {}

    const std::string &rawName() const { return rawName_; }
};

/**
 * Malformed value for a configuration option, either from the environment or
 * from a setter
 */
class InvalidConfig : public Error {
  public:
    InvalidConfig(const std::string &msg,
                  std::source_location loc = std::source_location::current())
        : Error(msg, loc) {}
};

void reportWarning(const std::string &msg);

#define ERROR(msg)                                                             \
    do {                                                                       \
        throw ::nameguard::Error(msg);                                         \
    } while (0)

#define WARNING(msg)                                                           \
    do {                                                                       \
        ::nameguard::reportWarning(NG_MSG << "[WARNING] " __FILE__ ":"         \
                                          << __LINE__ << ": "                  \
                                          << std::string(msg));                \
    } while (0)

#define ASSERT(expr)                                                           \
    do {                                                                       \
        if (!(expr))                                                           \
            ERROR("Assertion false: " #expr);                                  \
    } while (0)

} // namespace nameguard

#endif // NAME_GUARD_EXCEPT_H
