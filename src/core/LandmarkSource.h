#pragma once
#include <optional>

#include "../common/Types.h"

/**
 * Anything that can hand the control loop one hand observation per tick.
 * nextFrame() must return within roughly timeoutMs; std::nullopt means
 * "nothing observed this tick".
 */
class LandmarkSource
{
public:
    virtual ~LandmarkSource() = default;

    virtual std::optional<LandmarkFrame> nextFrame(int timeoutMs) = 0;
};
