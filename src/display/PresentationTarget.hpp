#pragma once

#include "display/FrameBuffer.hpp"

/* Something that can put a finished LCD frame on screen. The frame is only
   valid for the duration of the call; implementations copy what they need. */
class PresentationTarget {
public:
    virtual ~PresentationTarget() = default;
    virtual void present_frame(const LcdFrame &frame) = 0;
};
