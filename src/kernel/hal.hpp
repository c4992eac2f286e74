/**
 * Zero HAL
 *
 * The only sources of non-determinism the kernel sees: the clock, entropy
 * and the debug console. Every value read through here is recorded in the
 * commit log so replay never touches a HAL.
 */
#pragma once
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <spdlog/spdlog.h>
#include "kernel/types.hpp"

namespace zero::kernel {

class Hal {
public:
    virtual ~Hal() = default;

    // Nanoseconds since boot
    virtual uint64_t now_nanos() = 0;

    // Returns false when the entropy source fails
    virtual bool fill_random(uint8_t* buffer, size_t len) = 0;

    virtual void console_write(ProcessId pid, const std::string& text) = 0;
};

// Steady clock, OpenSSL CSPRNG and a "console" spdlog logger
class HostHal : public Hal {
public:
    HostHal();

    uint64_t now_nanos() override;
    bool fill_random(uint8_t* buffer, size_t len) override;
    void console_write(ProcessId pid, const std::string& text) override;

private:
    std::chrono::steady_clock::time_point boot_;
    std::shared_ptr<spdlog::logger> console_;
};

} // namespace zero::kernel
