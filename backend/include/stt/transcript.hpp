#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace pitchscribe {
namespace stt {

/**
 * One immutable piece of transcribed speech.
 */
class TranscriptSegment {
public:
    /**
     * @throws ProtocolException if text is blank, times are negative or
     *         inverted, confidence is outside [0,1] or channel is negative
     */
    TranscriptSegment(std::string id, std::string text, double startTime, double endTime,
                      std::string language = "en",
                      std::optional<int> channel = std::nullopt,
                      std::optional<double> confidence = std::nullopt,
                      bool isFinal = false);

    const std::string& getId() const { return id_; }
    const std::string& getText() const { return text_; }
    double getStartTime() const { return startTime_; }
    double getEndTime() const { return endTime_; }
    const std::string& getLanguage() const { return language_; }
    const std::optional<int>& getChannel() const { return channel_; }
    const std::optional<double>& getConfidence() const { return confidence_; }
    bool isFinal() const { return isFinal_; }

    double duration() const { return endTime_ - startTime_; }
    size_t wordCount() const;

    // missing confidence counts as high
    bool hasHighConfidence(double threshold = 0.8) const;

    nlohmann::json toJson() const;
    static TranscriptSegment fromJson(const nlohmann::json& j);

    bool operator==(const TranscriptSegment& other) const;

private:
    std::string id_;
    std::string text_;
    double startTime_;
    double endTime_;
    std::string language_;
    std::optional<int> channel_;
    std::optional<double> confidence_;
    bool isFinal_;
};

/**
 * Immutable, start-time ordered sequence of segments. Every operation that
 * changes the segment set returns a new collection.
 */
class TranscriptCollection {
public:
    using Clock = std::chrono::system_clock;

    TranscriptCollection();
    explicit TranscriptCollection(std::vector<TranscriptSegment> segments,
                                  Clock::time_point createdAt = Clock::now());

    static TranscriptCollection empty() { return TranscriptCollection(); }

    const std::vector<TranscriptSegment>& getSegments() const { return segments_; }
    Clock::time_point getCreatedAt() const { return createdAt_; }

    size_t segmentCount() const { return segments_.size(); }
    bool isEmpty() const { return segments_.empty(); }

    // max end - min start, 0 when empty
    double totalDuration() const;
    size_t wordCount() const;
    std::string fullText() const;

    TranscriptCollection addSegment(const TranscriptSegment& segment) const;
    TranscriptCollection finalSegmentsOnly() const;
    TranscriptCollection segmentsByChannel(int channel) const;

    nlohmann::json toJson() const;

    /**
     * @throws ProtocolException on malformed content
     */
    static TranscriptCollection fromJson(const nlohmann::json& j);

private:
    std::vector<TranscriptSegment> segments_;
    Clock::time_point createdAt_;
};

} // namespace stt
} // namespace pitchscribe
