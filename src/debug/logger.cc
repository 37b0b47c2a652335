#include <debug/logger.h>

namespace nameguard {

std::mutex Logger::lock_;

} // namespace nameguard
