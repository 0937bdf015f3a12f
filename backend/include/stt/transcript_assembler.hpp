#pragma once

#include <vector>
#include <nlohmann/json.hpp>
#include "stt/transcript.hpp"

namespace pitchscribe {
namespace stt {

struct TranscriptSummary {
    std::string fullText;
    size_t wordCount = 0;
    double totalDuration = 0.0;
    size_t segmentCount = 0;
    size_t finalSegmentCount = 0;
    std::vector<int> channels;

    nlohmann::json toJson() const;
};

/**
 * Merge, sort and derive views over transcript collections. Sources are never modified.
 */
class TranscriptAssembler {
public:
    /**
     * Merge collections into one start-time ordered collection. The creation
     * time is the earliest among the sources.
     */
    static TranscriptCollection assemble(const std::vector<TranscriptCollection>& sources);

    static TranscriptCollection fromSegments(const std::vector<TranscriptSegment>& segments);

    static TranscriptCollection finalsOnly(const TranscriptCollection& collection);
    static TranscriptCollection channelView(const TranscriptCollection& collection, int channel);

    /**
     * Finals when any exist, otherwise every segment. Interim results are only
     * analysed when the provider never finalised anything.
     */
    static TranscriptCollection analysisView(const TranscriptCollection& collection);

    // distinct channels in ascending order
    static std::vector<int> channels(const TranscriptCollection& collection);

    static TranscriptSummary summarize(const TranscriptCollection& collection);
};

} // namespace stt
} // namespace pitchscribe
