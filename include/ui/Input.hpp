#pragma once

#include <cstddef>
#include <vector>
#include "app/StateMachine.hpp"
#include "ui/Config.hpp"

namespace dustpan::ui {

// Decode one read() worth of raw terminal bytes into keys. ESC sequences for
// arrows, PgUp/PgDn and Delete are recognised; a lone ESC is Escape.
[[nodiscard]] std::vector<dustpan::app::Key> decode_keys(const unsigned char* buf, size_t n, const Config& cfg);

// Drain stdin (non-blocking) and decode.
[[nodiscard]] std::vector<dustpan::app::Key> read_keys(const Config& cfg);

} // namespace dustpan::ui
