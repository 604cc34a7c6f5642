#include "PhaseClock.h"

#include "orbit/InvalidParameterError.h"

#include <string>

namespace {
constexpr double kTwoPi = 6.283185307179586476925286766559;

static int wrapFrame(int frameIndex, int frameCount)
{
    int k = frameIndex % frameCount;
    if (k < 0) {
        k += frameCount;
    }
    return k;
}
} // namespace

PhaseClock::PhaseClock(int frameCount)
    : frameCount_(frameCount)
{
    if (frameCount < 1) {
        throw InvalidParameterError("animation needs at least one frame (got " + std::to_string(frameCount) + ")");
    }
}

double PhaseClock::phaseRad() const
{
    return phaseAt(frameIndex_);
}

double PhaseClock::phaseStepRad() const
{
    return kTwoPi / static_cast<double>(frameCount_);
}

double PhaseClock::phaseAt(int frameIndex) const
{
    return static_cast<double>(wrapFrame(frameIndex, frameCount_)) * phaseStepRad();
}

void PhaseClock::advance()
{
    frameIndex_ = wrapFrame(frameIndex_ + 1, frameCount_);
}

void PhaseClock::setFrameIndex(int frameIndex)
{
    frameIndex_ = wrapFrame(frameIndex, frameCount_);
}
