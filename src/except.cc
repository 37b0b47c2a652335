#include <iostream>
#include <mutex>
#include <unordered_map>

#include <config.h>
#include <except.h>

namespace nameguard {

void reportWarning(const std::string &msg) {
    static std::unordered_map<std::string, int> reportCnt;
    static std::mutex lock;

    if (Config::werror()) {
        throw Error(msg);
    }

    std::lock_guard<std::mutex> guard(lock);
    int cnt = ++reportCnt[msg];
    if (cnt <= 2) {
        std::cerr << msg << std::endl;
    }
    if (cnt == 2) {
        std::cerr << "[INFO] Further identical warnings will be suppressed"
                  << std::endl;
    }
}

} // namespace nameguard
