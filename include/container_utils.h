#ifndef NAME_GUARD_CONTAINER_UTILS_H
#define NAME_GUARD_CONTAINER_UTILS_H

#include <cctype>
#include <ranges>
#include <sstream>
#include <string>
#include <utility>

#include <range/v3/range.hpp>
#include <range/v3/view.hpp>

namespace nameguard {

namespace views = ranges::views;

inline std::string tolower(const std::string &s) {
    std::string ret;
    ret.reserve(s.length());
    for (char c : s) {
        ret.push_back(std::tolower((unsigned char)c));
    }
    return ret;
}

/**
 * Upper-case the first byte if it is an ASCII lowercase letter. Other bytes,
 * including a leading multi-byte UTF-8 sequence, are kept as is
 */
inline std::string ucfirst(const std::string &s) {
    if (s.empty() || s[0] < 'a' || s[0] > 'z') {
        return s;
    }
    auto ret = s;
    ret[0] = s[0] - 'a' + 'A';
    return ret;
}

inline bool endsWith(const std::string &s, const std::string &suffix) {
    return s.length() >= suffix.length() &&
           s.compare(s.length() - suffix.length(), suffix.length(), suffix) ==
               0;
}

/**
 * Join a sequence of elements to a string with given splitter
 */
struct _Join {
    const std::string &splitter;
};

template <std::ranges::range Container>
std::string join(Container &&c, const std::string &splitter) {
    std::ostringstream oss;
    for (auto &&[i, s] : views::enumerate(c)) {
        oss << (i > 0 ? splitter : "") << s;
    }
    return oss.str();
}

inline auto join(const std::string &splitter) { return _Join{splitter}; }

template <std::ranges::range Container>
auto operator|(Container &&c, const _Join &joiner) {
    return join(std::forward<Container>(c), joiner.splitter);
}

} // namespace nameguard

#endif // NAME_GUARD_CONTAINER_UTILS_H
