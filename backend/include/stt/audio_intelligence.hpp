#pragma once

#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "stt/intelligence_annotations.hpp"
#include "stt/transcript.hpp"

namespace pitchscribe {
namespace stt {

enum class SpeakingRate {
    TOO_SLOW,
    APPROPRIATE,
    TOO_FAST
};

enum class EnergyLevel {
    LOW,
    MODERATE,
    HIGH
};

enum class ProfessionalismGrade {
    EXCELLENT,
    GOOD,
    FAIR,
    NEEDS_IMPROVEMENT
};

std::string speakingRateToString(SpeakingRate rate);
std::string energyLevelToString(EnergyLevel level);
std::string gradeToString(ProfessionalismGrade grade);

struct SpeechMetrics {
    double wordsPerMinute = 0.0;
    double totalDurationSeconds = 0.0;
    double speakingDurationSeconds = 0.0;
    double totalPauseDurationSeconds = 0.0;
    size_t pauseCount = 0;
    size_t totalWords = 0;
    SpeakingRate speakingRate = SpeakingRate::TOO_SLOW;
    double pauseEffectiveness = 0.0;    // 0..1
    double pacingConsistency = 0.0;     // 0..1
};

struct FillerAnalysis {
    size_t totalFillerCount = 0;
    std::vector<std::string> fillerWordsDetected;   // distinct, first occurrence order
    double fillerPercentage = 0.0;
    std::optional<std::string> mostCommonFiller;
    double fillerFrequencyPerMinute = 0.0;
    double professionalismScore = 0.0;  // 0..1
    ProfessionalismGrade grade = ProfessionalismGrade::EXCELLENT;
};

struct ConfidenceMetrics {
    double confidenceScore = 0.0;       // 0..1
    bool fromProvider = false;          // false when derived from filler usage
    EnergyLevel energyLevel = EnergyLevel::LOW;
    double vocalStability = 0.5;
    double paceConsistency = 0.0;
    double readinessScore = 0.0;
    std::string assessment;             // high, moderate, low
};

struct AudioIntelligenceReport {
    SpeechMetrics speech;
    FillerAnalysis fillers;
    ConfidenceMetrics confidence;
    double deliveryScore = 0.0;         // 0..25, one decimal
    std::vector<std::string> strengths;
    std::vector<std::string> improvementAreas;
    std::vector<std::string> coachingInsights;
    std::optional<IntelligenceAnnotations> annotations;

    nlohmann::json toJson() const;
};

struct IntelligenceWeights {
    static constexpr double kPace = 0.25;
    static constexpr double kPause = 0.20;
    static constexpr double kFiller = 0.30;
    static constexpr double kReadiness = 0.25;
    static constexpr double kMaxDeliveryScore = 25.0;
};

/**
 * Deterministic delivery metrics over a finalized transcript.
 */
class AudioIntelligenceExtractor {
public:
    explicit AudioIntelligenceExtractor(double targetWpm = 150.0);

    AudioIntelligenceReport analyze(const TranscriptCollection& transcript,
                                    const std::optional<IntelligenceAnnotations>& annotations = std::nullopt) const;

    SpeechMetrics computeSpeechMetrics(const TranscriptCollection& transcript) const;
    FillerAnalysis computeFillerAnalysis(const TranscriptCollection& transcript) const;
    ConfidenceMetrics computeConfidence(const TranscriptCollection& transcript,
                                        const SpeechMetrics& speech,
                                        const FillerAnalysis& fillers) const;

    SpeakingRate classifySpeakingRate(double wpm) const;

    static double pauseEffectiveness(double pauseSeconds, double totalSeconds);
    static double pacingConsistency(double speakingSeconds, double totalSeconds);
    static double professionalismScore(double fillerPercentage);
    static ProfessionalismGrade professionalismGrade(double fillerPercentage);
    static EnergyLevel energyFromWpm(double wpm);

    /**
     * Weighted 0..25 blend: pace 25%, pauses 20%, fillers 30%, readiness 25%.
     */
    static double deliveryScore(SpeakingRate rate, double pauseScore, double fillerScore,
                                double readinessScore);

    static const std::vector<std::string>& fillerLexicon();

private:
    double targetWpm_;
};

} // namespace stt
} // namespace pitchscribe
