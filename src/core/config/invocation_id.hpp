#pragma once
#include <cstdint>
#include <cstdio>
#include <random>
#include <string>

namespace popper::core::config {

    inline constexpr const char* kInvocationIdPrefix = "inv-";

    // Tags every log line and names the run journal of one `popper run`.
    // Format: "inv-" followed by 8 lowercase hex digits.
    inline std::string generate_invocation_id() {
        std::random_device device;
        std::uniform_int_distribution<std::uint32_t> bits;
        char digits[9];
        std::snprintf(digits, sizeof(digits), "%08x", static_cast<unsigned int>(bits(device)));
        return std::string(kInvocationIdPrefix) + digits;
    }

} // namespace popper::core::config
