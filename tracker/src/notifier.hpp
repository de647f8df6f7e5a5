#pragma once

#include <string>

// Outbound alert channel. Failures are reported through the return value
// and never thrown.
class Notifier {
public:
    virtual ~Notifier() = default;
    virtual bool send(const std::string& message) = 0;
    virtual std::string name() const = 0;
};

// Local audible cue, best effort
class AudioCue {
public:
    virtual ~AudioCue() = default;
    virtual bool play() = 0;
};
