#include "stt/transcript_assembler.hpp"
#include <algorithm>
#include <set>

namespace pitchscribe {
namespace stt {

nlohmann::json TranscriptSummary::toJson() const {
    return {
        {"full_text", fullText},
        {"word_count", wordCount},
        {"total_duration", totalDuration},
        {"segment_count", segmentCount},
        {"final_segment_count", finalSegmentCount},
        {"channels", channels}
    };
}

TranscriptCollection TranscriptAssembler::assemble(const std::vector<TranscriptCollection>& sources) {
    if (sources.empty()) {
        return TranscriptCollection::empty();
    }

    std::vector<TranscriptSegment> merged;
    auto createdAt = sources.front().getCreatedAt();
    for (const auto& source : sources) {
        const auto& segments = source.getSegments();
        merged.insert(merged.end(), segments.begin(), segments.end());
        createdAt = std::min(createdAt, source.getCreatedAt());
    }
    return TranscriptCollection(std::move(merged), createdAt);
}

TranscriptCollection TranscriptAssembler::fromSegments(const std::vector<TranscriptSegment>& segments) {
    return TranscriptCollection(segments);
}

TranscriptCollection TranscriptAssembler::finalsOnly(const TranscriptCollection& collection) {
    return collection.finalSegmentsOnly();
}

TranscriptCollection TranscriptAssembler::channelView(const TranscriptCollection& collection, int channel) {
    return collection.segmentsByChannel(channel);
}

TranscriptCollection TranscriptAssembler::analysisView(const TranscriptCollection& collection) {
    TranscriptCollection finals = collection.finalSegmentsOnly();
    return finals.isEmpty() ? collection : finals;
}

std::vector<int> TranscriptAssembler::channels(const TranscriptCollection& collection) {
    std::set<int> distinct;
    for (const auto& segment : collection.getSegments()) {
        if (segment.getChannel()) {
            distinct.insert(*segment.getChannel());
        }
    }
    return std::vector<int>(distinct.begin(), distinct.end());
}

TranscriptSummary TranscriptAssembler::summarize(const TranscriptCollection& collection) {
    TranscriptSummary summary;
    summary.fullText = collection.fullText();
    summary.wordCount = collection.wordCount();
    summary.totalDuration = collection.totalDuration();
    summary.segmentCount = collection.segmentCount();
    summary.finalSegmentCount = static_cast<size_t>(
        std::count_if(collection.getSegments().begin(), collection.getSegments().end(),
                      [](const TranscriptSegment& s) { return s.isFinal(); }));
    summary.channels = channels(collection);
    return summary;
}

} // namespace stt
} // namespace pitchscribe
