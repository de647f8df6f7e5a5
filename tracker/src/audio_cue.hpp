#pragma once

#include "notifier.hpp"
#include <chrono>
#include <ostream>

// Two terminal bells separated by `gap`
class TerminalBell : public AudioCue {
public:
    explicit TerminalBell(std::ostream& out,
                          std::chrono::milliseconds gap = std::chrono::milliseconds(200));

    bool play() override;

private:
    std::ostream& out_;
    std::chrono::milliseconds gap_;
};
