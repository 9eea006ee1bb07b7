#include "log.hpp"
#include <mutex>

namespace crackbank {

std::mutex cerr_mutex;

thread_logger logger;

} // namespace crackbank
