#include "collaborators.hpp"
#include <chrono>

namespace tranchevault {
namespace service {

uint64_t SystemClock::now() const {
    auto since_epoch = std::chrono::system_clock::now().time_since_epoch();
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::seconds>(since_epoch).count());
}

} // namespace service
} // namespace tranchevault
