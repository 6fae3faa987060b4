#include "playback_scheduler.h"
#include <algorithm>

namespace lumiere {

double PlaybackScheduler::schedule(double now, double duration) {
    double start = std::max(now, watermark_);
    watermark_ = start + std::max(duration, 0.0);
    return start;
}

} // namespace lumiere
