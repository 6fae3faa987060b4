#include "transcript_accumulator.h"

namespace lumiere {

const std::string& TranscriptAccumulator::append(const std::string& delta) {
    text_ += delta;
    return text_;
}

std::optional<std::string> TranscriptAccumulator::flush() {
    if (text_.empty()) {
        return std::nullopt;
    }
    std::string finalized;
    finalized.swap(text_);
    return finalized;
}

void TranscriptAccumulator::reset() {
    text_.clear();
}

} // namespace lumiere
