#include "audio/audio_configuration.hpp"
#include "utils/error_handler.hpp"
#include <algorithm>
#include <array>

namespace pitchscribe {
namespace audio {

namespace {

constexpr std::array<uint32_t, 5> kSupportedSampleRates = {8000, 16000, 22050, 44100, 48000};
constexpr std::array<uint16_t, 4> kSupportedBitDepths = {8, 16, 24, 32};
constexpr uint16_t kMaxChannels = 8;

} // namespace

std::string encodingToString(AudioEncoding encoding) {
    switch (encoding) {
        case AudioEncoding::WAV_PCM: return "wav/pcm";
        case AudioEncoding::MP3: return "mp3";
        case AudioEncoding::FLAC: return "flac";
        case AudioEncoding::OGG: return "ogg";
        case AudioEncoding::WEBM: return "webm";
    }
    return "wav/pcm";
}

AudioEncoding encodingFromString(const std::string& name) {
    if (name == "wav/pcm") return AudioEncoding::WAV_PCM;
    if (name == "mp3") return AudioEncoding::MP3;
    if (name == "flac") return AudioEncoding::FLAC;
    if (name == "ogg") return AudioEncoding::OGG;
    if (name == "webm") return AudioEncoding::WEBM;
    throw utils::ConfigurationException("Unsupported audio encoding", name);
}

bool AudioFeatures::any() const {
    return sentimentAnalysis || emotionAnalysis || speakerIdentification ||
           summarization || namedEntityRecognition || chapterization ||
           translationActive();
}

AudioConfiguration::AudioConfiguration(AudioEncoding encoding, uint32_t sampleRate, uint16_t bitDepth,
                                       uint16_t channels, AudioFeatures features)
    : encoding_(encoding), sampleRate_(sampleRate), bitDepth_(bitDepth),
      channels_(channels), features_(std::move(features)) {

    if (channels_ < 1 || channels_ > kMaxChannels) {
        throw utils::ConfigurationException("Channels must be between 1 and 8",
                                            std::to_string(channels_));
    }
    if (std::find(kSupportedSampleRates.begin(), kSupportedSampleRates.end(), sampleRate_) ==
        kSupportedSampleRates.end()) {
        throw utils::ConfigurationException("Unsupported sample rate", std::to_string(sampleRate_));
    }
    if (std::find(kSupportedBitDepths.begin(), kSupportedBitDepths.end(), bitDepth_) ==
        kSupportedBitDepths.end()) {
        throw utils::ConfigurationException("Unsupported bit depth", std::to_string(bitDepth_));
    }
}

AudioConfiguration AudioConfiguration::createDefault() {
    return AudioConfiguration(AudioEncoding::WAV_PCM, 16000, 16, 1);
}

AudioConfiguration AudioConfiguration::createPitchAnalysis() {
    AudioFeatures features;
    features.sentimentAnalysis = true;
    features.emotionAnalysis = true;
    features.summarization = true;
    features.namedEntityRecognition = true;
    features.chapterization = true;
    return AudioConfiguration(AudioEncoding::WAV_PCM, 16000, 16, 1, features);
}

AudioConfiguration AudioConfiguration::createFullIntelligence() {
    AudioFeatures features;
    features.sentimentAnalysis = true;
    features.emotionAnalysis = true;
    features.speakerIdentification = true;
    features.summarization = true;
    features.namedEntityRecognition = true;
    features.chapterization = true;
    return AudioConfiguration(AudioEncoding::WAV_PCM, 16000, 16, 1, features);
}

double AudioConfiguration::estimateDuration(size_t byteSize) const {
    size_t frameBytes = bytesPerSample() * channels_;
    size_t totalSamples = byteSize / frameBytes;
    return static_cast<double>(totalSamples) / static_cast<double>(sampleRate_);
}

nlohmann::json AudioConfiguration::toProviderConfig(bool includeFeatures) const {
    nlohmann::json config = {
        {"encoding", encodingToString(encoding_)},
        {"sample_rate", sampleRate_},
        {"bit_depth", bitDepth_},
        {"channels", channels_}
    };

    if (!includeFeatures) {
        return config;
    }

    if (features_.sentimentAnalysis) config["sentiment_analysis"] = true;
    if (features_.emotionAnalysis) config["emotion_analysis"] = true;
    if (features_.speakerIdentification) config["speaker_identification"] = true;
    if (features_.summarization) config["summarization"] = true;
    if (features_.namedEntityRecognition) config["named_entity_recognition"] = true;
    if (features_.chapterization) config["chapterization"] = true;
    if (features_.translationActive()) {
        config["translation"] = true;
        config["target_language"] = features_.targetLanguage;
    }
    return config;
}

nlohmann::json AudioConfiguration::toJson() const {
    nlohmann::json j = {
        {"encoding", encodingToString(encoding_)},
        {"sample_rate", sampleRate_},
        {"bit_depth", bitDepth_},
        {"channels", channels_},
        {"sentiment_analysis", features_.sentimentAnalysis},
        {"emotion_analysis", features_.emotionAnalysis},
        {"speaker_identification", features_.speakerIdentification},
        {"summarization", features_.summarization},
        {"named_entity_recognition", features_.namedEntityRecognition},
        {"chapterization", features_.chapterization},
        {"translation", features_.translation}
    };
    if (!features_.targetLanguage.empty()) {
        j["target_language"] = features_.targetLanguage;
    }
    return j;
}

AudioConfiguration AudioConfiguration::fromJson(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw utils::ConfigurationException("Audio configuration must be a JSON object");
    }

    try {
        AudioFeatures features;
        features.sentimentAnalysis = j.value("sentiment_analysis", false);
        features.emotionAnalysis = j.value("emotion_analysis", false);
        features.speakerIdentification = j.value("speaker_identification", false);
        features.summarization = j.value("summarization", false);
        features.namedEntityRecognition = j.value("named_entity_recognition", false);
        features.chapterization = j.value("chapterization", false);
        features.translation = j.value("translation", false);
        if (j.contains("target_language") && !j.at("target_language").is_null()) {
            features.targetLanguage = j.at("target_language").get<std::string>();
        }

        // read wide and range-check before narrowing
        int64_t channels = j.value("channels", int64_t{1});
        if (channels < 1 || channels > kMaxChannels) {
            throw utils::ConfigurationException("Channels must be between 1 and 8",
                                                std::to_string(channels));
        }
        int64_t sampleRate = j.value("sample_rate", int64_t{16000});
        if (std::find(kSupportedSampleRates.begin(), kSupportedSampleRates.end(), sampleRate) ==
            kSupportedSampleRates.end()) {
            throw utils::ConfigurationException("Unsupported sample rate", std::to_string(sampleRate));
        }
        int64_t bitDepth = j.value("bit_depth", int64_t{16});
        if (std::find(kSupportedBitDepths.begin(), kSupportedBitDepths.end(), bitDepth) ==
            kSupportedBitDepths.end()) {
            throw utils::ConfigurationException("Unsupported bit depth", std::to_string(bitDepth));
        }

        return AudioConfiguration(encodingFromString(j.value("encoding", std::string("wav/pcm"))),
                                  static_cast<uint32_t>(sampleRate),
                                  static_cast<uint16_t>(bitDepth),
                                  static_cast<uint16_t>(channels),
                                  features);
    } catch (const nlohmann::json::exception& e) {
        throw utils::ConfigurationException("Invalid audio configuration", e.what());
    }
}

bool AudioConfiguration::operator==(const AudioConfiguration& other) const {
    return encoding_ == other.encoding_ &&
           sampleRate_ == other.sampleRate_ &&
           bitDepth_ == other.bitDepth_ &&
           channels_ == other.channels_ &&
           features_.sentimentAnalysis == other.features_.sentimentAnalysis &&
           features_.emotionAnalysis == other.features_.emotionAnalysis &&
           features_.speakerIdentification == other.features_.speakerIdentification &&
           features_.summarization == other.features_.summarization &&
           features_.namedEntityRecognition == other.features_.namedEntityRecognition &&
           features_.chapterization == other.features_.chapterization &&
           features_.translation == other.features_.translation &&
           features_.targetLanguage == other.features_.targetLanguage;
}

} // namespace audio
} // namespace pitchscribe
