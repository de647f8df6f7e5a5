#include "audio_cue.hpp"
#include <thread>

TerminalBell::TerminalBell(std::ostream& out, std::chrono::milliseconds gap)
    : out_(out)
    , gap_(gap)
{}

bool TerminalBell::play() {
    out_ << '\a' << std::flush;
    std::this_thread::sleep_for(gap_);
    out_ << '\a' << std::flush;
    return static_cast<bool>(out_);
}
