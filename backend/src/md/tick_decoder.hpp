#pragma once
#include "tick.hpp"
#include <string>
#include <vector>

// Turns one feed frame into decoded ticks. Implementations reject ticks that
// carry no instrument token; nothing without a token reaches the tick cache.
struct ITickDecoder
{
    virtual ~ITickDecoder() = default;
    // Return true if at least one tick was appended to 'out'
    virtual bool decode(const std::string &frame, bool binary, std::vector<Tick> &out) = 0;
};
