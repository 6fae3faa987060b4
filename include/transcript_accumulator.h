#pragma once

#include <optional>
#include <string>

namespace lumiere {

/// Which side of the conversation a transcript belongs to
enum class Speaker {
    User,
    Agent
};

/**
 * @brief Incremental transcript buffer for one direction
 *
 * Deltas are appended; a turn boundary flushes the whole utterance once and
 * leaves the buffer empty so the next delta starts a new utterance.
 * Not synchronized: the owning session serializes access.
 */
class TranscriptAccumulator {
public:
    explicit TranscriptAccumulator(Speaker speaker) : speaker_(speaker) {}

    /**
     * @brief Append a partial update
     * @param delta Text fragment from the service
     * @return Full accumulated text of the current utterance
     */
    const std::string& append(const std::string& delta);

    /**
     * @brief Finalize the utterance
     * @return Accumulated text, or nullopt when nothing was buffered
     */
    std::optional<std::string> flush();

    /// Drop buffered text without emitting it
    void reset();

    const std::string& text() const { return text_; }
    bool empty() const { return text_.empty(); }
    Speaker speaker() const { return speaker_; }

private:
    Speaker speaker_;
    std::string text_;
};

} // namespace lumiere
