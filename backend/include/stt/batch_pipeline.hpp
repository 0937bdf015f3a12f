#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "audio/audio_configuration.hpp"
#include "stt/intelligence_annotations.hpp"
#include "stt/provider_client.hpp"
#include "stt/transcript.hpp"
#include "utils/cancellation.hpp"
#include "utils/config.hpp"

namespace pitchscribe {
namespace stt {

struct BatchResult {
    std::vector<TranscriptSegment> segments;   // all final
    IntelligenceAnnotations annotations;
    std::string jobId;
    size_t pollAttempts = 0;
    bool cancelled = false;
};

/**
 * Upload, submit and poll path used when the realtime path cannot deliver
 * the requested analysis.
 */
class BatchTranscriptionPipeline {
public:
    BatchTranscriptionPipeline(ProviderClient& client, utils::BatchSettings settings);

    /**
     * @throws SizeLimitExceededException if audio is larger than the upload ceiling
     * @throws UpstreamJobException if the provider reports the job failed
     * @throws TimeoutException if the job is not done after the maximum poll attempts
     * @throws ConnectionException if upload or submission fails
     */
    BatchResult run(const std::vector<uint8_t>& audio,
                    const audio::AudioConfiguration& config,
                    utils::CancellationToken& token,
                    const std::string& sessionId = "");

    /**
     * Utterances of a finished job, from result.transcription.utterances or
     * the legacy prediction.utterances. Blank or invalid utterances are skipped.
     */
    static std::vector<TranscriptSegment> extractSegments(const nlohmann::json& job);

    const utils::BatchSettings& settings() const { return settings_; }

private:
    BatchResult poll(const SubmittedJob& job, utils::CancellationToken& token,
                     const std::string& sessionId);

    ProviderClient& client_;
    utils::BatchSettings settings_;
};

} // namespace stt
} // namespace pitchscribe
