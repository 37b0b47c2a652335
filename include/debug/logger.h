#ifndef NAME_GUARD_LOGGER_H
#define NAME_GUARD_LOGGER_H

#include <iostream>
#include <mutex>
#include <thread>

namespace nameguard {

class Logger {
    std::ostream &os_;
    bool locked_ = true;

    static std::mutex lock_;

  public:
    Logger() : os_(std::cerr) {
        lock_.lock();
        os_ << "[tid " << std::hex << std::this_thread::get_id() << std::dec
            << "] ";
    }
    ~Logger() {
        if (locked_) {
            lock_.unlock();
        }
    }

    Logger(const Logger &) = delete;
    Logger(Logger &&other) : os_(other.os_) { other.locked_ = false; }
    Logger &operator=(const Logger &) = delete;

    template <class T> Logger &operator<<(T &&x) {
        os_ << x;
        return *this;
    }

    Logger &operator<<(std::ostream &(*manip)(std::ostream &)) {
        manip(os_);
        return *this;
    }
};

inline Logger logger() { return Logger(); }

} // namespace nameguard

#endif // NAME_GUARD_LOGGER_H
