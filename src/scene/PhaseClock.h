#pragma once

// Synthetic animation clock: one revolution split into frameCount equal phase
// steps. Frame k shows phase 2 pi k / frameCount; stepping past the last frame
// wraps to 0.
class PhaseClock
{
public:
    // Throws InvalidParameterError if frameCount < 1.
    explicit PhaseClock(int frameCount = 100);

    int frameCount() const { return frameCount_; }
    int frameIndex() const { return frameIndex_; }

    double phaseRad() const;
    double phaseStepRad() const;
    double phaseAt(int frameIndex) const;

    void advance();
    void setFrameIndex(int frameIndex); // wraps, negative counts back
    void reset() { frameIndex_ = 0; }

private:
    int frameCount_ = 100;
    int frameIndex_ = 0;
};
