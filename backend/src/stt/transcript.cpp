#include "stt/transcript.hpp"
#include "utils/error_handler.hpp"
#include <algorithm>
#include <cctype>
#include <iterator>
#include <sstream>

namespace pitchscribe {
namespace stt {

namespace {

bool isBlank(const std::string& text) {
    return std::all_of(text.begin(), text.end(),
                       [](unsigned char c) { return std::isspace(c) != 0; });
}

void sortByStartTime(std::vector<TranscriptSegment>& segments) {
    std::stable_sort(segments.begin(), segments.end(),
                     [](const TranscriptSegment& a, const TranscriptSegment& b) {
                         return a.getStartTime() < b.getStartTime();
                     });
}

} // namespace

TranscriptSegment::TranscriptSegment(std::string id, std::string text, double startTime, double endTime,
                                     std::string language, std::optional<int> channel,
                                     std::optional<double> confidence, bool isFinal)
    : id_(std::move(id)), text_(std::move(text)), startTime_(startTime), endTime_(endTime),
      language_(std::move(language)), channel_(channel), confidence_(confidence), isFinal_(isFinal) {

    if (isBlank(text_)) {
        throw utils::ProtocolException("Transcript text cannot be empty", id_);
    }
    if (startTime_ < 0.0) {
        throw utils::ProtocolException("Start time cannot be negative", id_);
    }
    if (endTime_ < startTime_) {
        throw utils::ProtocolException("End time must not precede start time", id_);
    }
    if (confidence_ && (*confidence_ < 0.0 || *confidence_ > 1.0)) {
        throw utils::ProtocolException("Confidence must be between 0 and 1", id_);
    }
    if (channel_ && *channel_ < 0) {
        throw utils::ProtocolException("Channel must be non-negative", id_);
    }
}

size_t TranscriptSegment::wordCount() const {
    std::istringstream stream(text_);
    size_t count = 0;
    std::string word;
    while (stream >> word) {
        ++count;
    }
    return count;
}

bool TranscriptSegment::hasHighConfidence(double threshold) const {
    if (!confidence_) {
        return true;
    }
    return *confidence_ >= threshold;
}

nlohmann::json TranscriptSegment::toJson() const {
    nlohmann::json j = {
        {"id", id_},
        {"text", text_},
        {"start_time", startTime_},
        {"end_time", endTime_},
        {"language", language_},
        {"channel", nullptr},
        {"confidence", nullptr},
        {"is_final", isFinal_},
        {"duration", duration()},
        {"word_count", wordCount()}
    };
    if (channel_) j["channel"] = *channel_;
    if (confidence_) j["confidence"] = *confidence_;
    return j;
}

TranscriptSegment TranscriptSegment::fromJson(const nlohmann::json& j) {
    try {
        std::optional<int> channel;
        std::optional<double> confidence;
        if (j.contains("channel") && !j.at("channel").is_null()) {
            channel = j.at("channel").get<int>();
        }
        if (j.contains("confidence") && !j.at("confidence").is_null()) {
            confidence = j.at("confidence").get<double>();
        }
        // duration and word_count are derived and recomputed
        return TranscriptSegment(j.value("id", std::string()),
                                 j.at("text").get<std::string>(),
                                 j.at("start_time").get<double>(),
                                 j.at("end_time").get<double>(),
                                 j.value("language", std::string("en")),
                                 channel, confidence,
                                 j.value("is_final", false));
    } catch (const nlohmann::json::exception& e) {
        throw utils::ProtocolException("Malformed transcript segment", e.what());
    }
}

bool TranscriptSegment::operator==(const TranscriptSegment& other) const {
    return id_ == other.id_ && text_ == other.text_ &&
           startTime_ == other.startTime_ && endTime_ == other.endTime_ &&
           language_ == other.language_ && channel_ == other.channel_ &&
           confidence_ == other.confidence_ && isFinal_ == other.isFinal_;
}

TranscriptCollection::TranscriptCollection()
    : createdAt_(Clock::now()) {
}

TranscriptCollection::TranscriptCollection(std::vector<TranscriptSegment> segments,
                                           Clock::time_point createdAt)
    : segments_(std::move(segments)), createdAt_(createdAt) {
    sortByStartTime(segments_);
}

double TranscriptCollection::totalDuration() const {
    if (segments_.empty()) {
        return 0.0;
    }
    double minStart = segments_.front().getStartTime();
    double maxEnd = segments_.front().getEndTime();
    for (const auto& segment : segments_) {
        minStart = std::min(minStart, segment.getStartTime());
        maxEnd = std::max(maxEnd, segment.getEndTime());
    }
    return maxEnd - minStart;
}

size_t TranscriptCollection::wordCount() const {
    size_t total = 0;
    for (const auto& segment : segments_) {
        total += segment.wordCount();
    }
    return total;
}

std::string TranscriptCollection::fullText() const {
    std::string text;
    for (size_t i = 0; i < segments_.size(); ++i) {
        if (i > 0) {
            text += ' ';
        }
        text += segments_[i].getText();
    }
    return text;
}

TranscriptCollection TranscriptCollection::addSegment(const TranscriptSegment& segment) const {
    std::vector<TranscriptSegment> segments = segments_;
    segments.push_back(segment);
    return TranscriptCollection(std::move(segments), createdAt_);
}

TranscriptCollection TranscriptCollection::finalSegmentsOnly() const {
    std::vector<TranscriptSegment> finals;
    std::copy_if(segments_.begin(), segments_.end(), std::back_inserter(finals),
                 [](const TranscriptSegment& s) { return s.isFinal(); });
    return TranscriptCollection(std::move(finals), createdAt_);
}

TranscriptCollection TranscriptCollection::segmentsByChannel(int channel) const {
    std::vector<TranscriptSegment> matching;
    std::copy_if(segments_.begin(), segments_.end(), std::back_inserter(matching),
                 [channel](const TranscriptSegment& s) {
                     return s.getChannel() && *s.getChannel() == channel;
                 });
    return TranscriptCollection(std::move(matching), createdAt_);
}

nlohmann::json TranscriptCollection::toJson() const {
    nlohmann::json segments = nlohmann::json::array();
    for (const auto& segment : segments_) {
        segments.push_back(segment.toJson());
    }
    auto createdMs = std::chrono::duration_cast<std::chrono::milliseconds>(
        createdAt_.time_since_epoch()).count();

    return {
        {"segments", segments},
        {"created_at", createdMs},
        {"total_duration", totalDuration()},
        {"word_count", wordCount()},
        {"full_text", fullText()}
    };
}

TranscriptCollection TranscriptCollection::fromJson(const nlohmann::json& j) {
    try {
        std::vector<TranscriptSegment> segments;
        for (const auto& item : j.at("segments")) {
            segments.push_back(TranscriptSegment::fromJson(item));
        }
        Clock::time_point createdAt = Clock::now();
        if (j.contains("created_at")) {
            createdAt = Clock::time_point(std::chrono::duration_cast<Clock::duration>(
                std::chrono::milliseconds(j.at("created_at").get<long long>())));
        }
        return TranscriptCollection(std::move(segments), createdAt);
    } catch (const nlohmann::json::exception& e) {
        throw utils::ProtocolException("Malformed transcript collection", e.what());
    }
}

} // namespace stt
} // namespace pitchscribe
