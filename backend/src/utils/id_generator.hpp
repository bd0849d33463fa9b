#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>

namespace proptrade::utils {

// Prefixed ids such as ORD_1718000000000_42. The counter keeps ids unique within one millisecond.
inline std::string generateId(const std::string& prefix) {
    static std::atomic<uint64_t> sequence{0};
    auto now = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    return prefix + "_" + std::to_string(now) + "_" + std::to_string(++sequence);
}

} // namespace proptrade::utils
