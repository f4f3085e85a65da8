#pragma once
#include <cstdint>
#include <string>

namespace dustpan::util {

// SI (base 1000) size label: "7 B", "1.2 kB", "15 MB". One decimal below 10.
[[nodiscard]] std::string human_bytes(uint64_t bytes);

// Compact age label for day counts: "3d", "5w", "2y".
[[nodiscard]] std::string age_label(int days);

} // namespace dustpan::util
