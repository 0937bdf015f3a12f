#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>

namespace pitchscribe {
namespace audio {

enum class AudioEncoding {
    WAV_PCM,
    MP3,
    FLAC,
    OGG,
    WEBM
};

std::string encodingToString(AudioEncoding encoding);

/**
 * @throws ConfigurationException for unsupported names
 */
AudioEncoding encodingFromString(const std::string& name);

/**
 * Advanced analysis flags. None of these can be delivered by the realtime
 * protocol, so any of them being set requires the batch path.
 */
struct AudioFeatures {
    bool sentimentAnalysis = false;
    bool emotionAnalysis = false;
    bool speakerIdentification = false;
    bool summarization = false;
    bool namedEntityRecognition = false;
    bool chapterization = false;
    bool translation = false;
    std::string targetLanguage;

    // translation without a target language is ignored
    bool translationActive() const { return translation && !targetLanguage.empty(); }
    bool any() const;
};

/**
 * Immutable recording profile.
 */
class AudioConfiguration {
public:
    /**
     * @throws ConfigurationException if sample rate, bit depth or channel count is unsupported
     */
    AudioConfiguration(AudioEncoding encoding, uint32_t sampleRate, uint16_t bitDepth,
                       uint16_t channels, AudioFeatures features = AudioFeatures());

    static AudioConfiguration createDefault();
    static AudioConfiguration createPitchAnalysis();
    static AudioConfiguration createFullIntelligence();

    AudioEncoding getEncoding() const { return encoding_; }
    uint32_t getSampleRate() const { return sampleRate_; }
    uint16_t getBitDepth() const { return bitDepth_; }
    uint16_t getChannels() const { return channels_; }
    const AudioFeatures& getFeatures() const { return features_; }

    size_t bytesPerSample() const { return bitDepth_ / 8; }
    bool isMultichannel() const { return channels_ > 1; }

    /**
     * Duration in seconds of a raw PCM payload of the given size.
     * Partial trailing frames are ignored.
     */
    double estimateDuration(size_t byteSize) const;

    bool requiresBatchForFullFidelity() const { return features_.any(); }

    /**
     * Provider-facing configuration. Feature flags are only emitted when
     * includeFeatures is set, i.e. for the batch API.
     */
    nlohmann::json toProviderConfig(bool includeFeatures) const;

    nlohmann::json toJson() const;

    /**
     * Missing keys take the defaults of createDefault().
     * @throws ConfigurationException on unsupported values
     */
    static AudioConfiguration fromJson(const nlohmann::json& j);

    bool operator==(const AudioConfiguration& other) const;
    bool operator!=(const AudioConfiguration& other) const { return !(*this == other); }

private:
    AudioEncoding encoding_;
    uint32_t sampleRate_;
    uint16_t bitDepth_;
    uint16_t channels_;
    AudioFeatures features_;
};

} // namespace audio
} // namespace pitchscribe
