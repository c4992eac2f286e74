#include "kernel/hal.hpp"
#include "core/logger.hpp"
#include <openssl/rand.h>

namespace zero::kernel {

HostHal::HostHal()
    : boot_(std::chrono::steady_clock::now())
    , console_(core::console_logger()) {}

uint64_t HostHal::now_nanos() {
    auto elapsed = std::chrono::steady_clock::now() - boot_;
    return static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::nanoseconds>(elapsed).count());
}

bool HostHal::fill_random(uint8_t* buffer, size_t len) {
    if (len == 0) {
        return true;
    }
    if (RAND_bytes(buffer, static_cast<int>(len)) != 1) {
        spdlog::error("RAND_bytes failed for {} bytes", len);
        return false;
    }
    return true;
}

void HostHal::console_write(ProcessId pid, const std::string& text) {
    console_->info("[pid {}] {}", pid, text);
}

} // namespace zero::kernel
