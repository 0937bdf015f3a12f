#include "stt/audio_intelligence.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <iomanip>
#include <map>
#include <sstream>

namespace pitchscribe {
namespace stt {

namespace {

std::string formatNumber(double value, int precision) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(precision) << value;
    return ss.str();
}

double roundToTenth(double value) {
    return std::round(value * 10.0) / 10.0;
}

std::vector<std::string> normalizedTokens(const std::string& text) {
    std::vector<std::string> tokens;
    std::istringstream stream(text);
    std::string raw;
    while (stream >> raw) {
        std::string token;
        for (unsigned char c : raw) {
            token += static_cast<char>(std::tolower(c));
        }
        auto first = std::find_if(token.begin(), token.end(),
                                  [](unsigned char c) { return std::isalnum(c) != 0; });
        auto last = std::find_if(token.rbegin(), token.rend(),
                                 [](unsigned char c) { return std::isalnum(c) != 0; }).base();
        if (first < last) {
            tokens.emplace_back(first, last);
        }
    }
    return tokens;
}

} // namespace

std::string speakingRateToString(SpeakingRate rate) {
    switch (rate) {
        case SpeakingRate::TOO_SLOW: return "too_slow";
        case SpeakingRate::APPROPRIATE: return "appropriate";
        case SpeakingRate::TOO_FAST: return "too_fast";
    }
    return "appropriate";
}

std::string energyLevelToString(EnergyLevel level) {
    switch (level) {
        case EnergyLevel::LOW: return "low";
        case EnergyLevel::MODERATE: return "moderate";
        case EnergyLevel::HIGH: return "high";
    }
    return "low";
}

std::string gradeToString(ProfessionalismGrade grade) {
    switch (grade) {
        case ProfessionalismGrade::EXCELLENT: return "excellent";
        case ProfessionalismGrade::GOOD: return "good";
        case ProfessionalismGrade::FAIR: return "fair";
        case ProfessionalismGrade::NEEDS_IMPROVEMENT: return "needs_improvement";
    }
    return "needs_improvement";
}

nlohmann::json AudioIntelligenceReport::toJson() const {
    nlohmann::json j;
    j["speech_metrics"] = {
        {"words_per_minute", speech.wordsPerMinute},
        {"total_duration_seconds", speech.totalDurationSeconds},
        {"speaking_duration_seconds", speech.speakingDurationSeconds},
        {"total_pause_duration_seconds", speech.totalPauseDurationSeconds},
        {"pause_count", speech.pauseCount},
        {"total_words", speech.totalWords},
        {"speaking_rate", speakingRateToString(speech.speakingRate)},
        {"pause_effectiveness", speech.pauseEffectiveness},
        {"pacing_consistency", speech.pacingConsistency}
    };
    j["filler_analysis"] = {
        {"total_filler_count", fillers.totalFillerCount},
        {"filler_words_detected", fillers.fillerWordsDetected},
        {"filler_percentage", fillers.fillerPercentage},
        {"most_common_filler", fillers.mostCommonFiller ? nlohmann::json(*fillers.mostCommonFiller)
                                                        : nlohmann::json(nullptr)},
        {"filler_frequency_per_minute", fillers.fillerFrequencyPerMinute},
        {"professionalism_score", fillers.professionalismScore},
        {"professionalism_grade", gradeToString(fillers.grade)}
    };
    j["confidence_metrics"] = {
        {"confidence_score", confidence.confidenceScore},
        {"from_provider", confidence.fromProvider},
        {"energy_level", energyLevelToString(confidence.energyLevel)},
        {"vocal_stability", confidence.vocalStability},
        {"pace_consistency", confidence.paceConsistency},
        {"presentation_readiness", confidence.readinessScore},
        {"assessment", confidence.assessment}
    };
    j["delivery_score"] = deliveryScore;
    j["strengths"] = strengths;
    j["improvement_areas"] = improvementAreas;
    j["coaching_insights"] = coachingInsights;
    j["annotations"] = annotations ? annotations->toJson() : nlohmann::json(nullptr);
    return j;
}

AudioIntelligenceExtractor::AudioIntelligenceExtractor(double targetWpm)
    : targetWpm_(targetWpm > 0.0 ? targetWpm : 150.0) {
}

const std::vector<std::string>& AudioIntelligenceExtractor::fillerLexicon() {
    static const std::vector<std::string> lexicon = {
        "um", "uh", "like", "you know", "actually", "basically", "literally"
    };
    return lexicon;
}

SpeakingRate AudioIntelligenceExtractor::classifySpeakingRate(double wpm) const {
    const double variance = targetWpm_ * 0.2;
    if (wpm < targetWpm_ - variance) {
        return SpeakingRate::TOO_SLOW;
    }
    if (wpm > targetWpm_ + variance) {
        return SpeakingRate::TOO_FAST;
    }
    return SpeakingRate::APPROPRIATE;
}

double AudioIntelligenceExtractor::pauseEffectiveness(double pauseSeconds, double totalSeconds) {
    if (totalSeconds <= 0.0) {
        return 0.0;
    }
    double pct = pauseSeconds / totalSeconds * 100.0;
    if (pct >= 10.0 && pct <= 20.0) {
        return 1.0;
    }
    if ((pct >= 5.0 && pct < 10.0) || (pct > 20.0 && pct <= 30.0)) {
        return 0.7;
    }
    return 0.4;
}

double AudioIntelligenceExtractor::pacingConsistency(double speakingSeconds, double totalSeconds) {
    if (totalSeconds <= 0.0) {
        return 0.0;
    }
    double pct = speakingSeconds / totalSeconds * 100.0;
    if (pct >= 75.0 && pct <= 85.0) {
        return 1.0;
    }
    if ((pct >= 65.0 && pct < 75.0) || (pct > 85.0 && pct <= 90.0)) {
        return 0.8;
    }
    return 0.5;
}

double AudioIntelligenceExtractor::professionalismScore(double fillerPercentage) {
    if (fillerPercentage <= 1.0) return 1.0;
    if (fillerPercentage <= 2.5) return 0.8;
    if (fillerPercentage <= 5.0) return 0.6;
    return 0.3;
}

ProfessionalismGrade AudioIntelligenceExtractor::professionalismGrade(double fillerPercentage) {
    if (fillerPercentage <= 1.0) return ProfessionalismGrade::EXCELLENT;
    if (fillerPercentage <= 2.5) return ProfessionalismGrade::GOOD;
    if (fillerPercentage <= 5.0) return ProfessionalismGrade::FAIR;
    return ProfessionalismGrade::NEEDS_IMPROVEMENT;
}

EnergyLevel AudioIntelligenceExtractor::energyFromWpm(double wpm) {
    if (wpm > 160.0) return EnergyLevel::HIGH;
    if (wpm > 120.0) return EnergyLevel::MODERATE;
    return EnergyLevel::LOW;
}

double AudioIntelligenceExtractor::deliveryScore(SpeakingRate rate, double pauseScore,
                                                 double fillerScore, double readinessScore) {
    double paceScore = rate == SpeakingRate::APPROPRIATE ? 1.0 : 0.7;
    double overall = paceScore * IntelligenceWeights::kPace +
                     pauseScore * IntelligenceWeights::kPause +
                     fillerScore * IntelligenceWeights::kFiller +
                     readinessScore * IntelligenceWeights::kReadiness;
    return roundToTenth(overall * IntelligenceWeights::kMaxDeliveryScore);
}

SpeechMetrics AudioIntelligenceExtractor::computeSpeechMetrics(const TranscriptCollection& transcript) const {
    SpeechMetrics metrics;
    metrics.totalDurationSeconds = transcript.totalDuration();
    metrics.totalWords = transcript.wordCount();

    double spoken = 0.0;
    for (const auto& segment : transcript.getSegments()) {
        spoken += segment.duration();
    }
    metrics.speakingDurationSeconds = std::min(spoken, metrics.totalDurationSeconds);
    metrics.totalPauseDurationSeconds =
        std::max(0.0, metrics.totalDurationSeconds - spoken);

    // segments are start-ordered; a gap opens when a segment starts after everything before it ended
    const auto& segments = transcript.getSegments();
    if (!segments.empty()) {
        double coveredUntil = segments.front().getEndTime();
        for (size_t i = 1; i < segments.size(); ++i) {
            if (segments[i].getStartTime() > coveredUntil) {
                ++metrics.pauseCount;
            }
            coveredUntil = std::max(coveredUntil, segments[i].getEndTime());
        }
    }

    if (metrics.totalDurationSeconds > 0.0) {
        metrics.wordsPerMinute = static_cast<double>(metrics.totalWords) /
                                 (metrics.totalDurationSeconds / 60.0);
    }
    metrics.speakingRate = classifySpeakingRate(metrics.wordsPerMinute);
    metrics.pauseEffectiveness = pauseEffectiveness(metrics.totalPauseDurationSeconds,
                                                    metrics.totalDurationSeconds);
    metrics.pacingConsistency = pacingConsistency(metrics.speakingDurationSeconds,
                                                  metrics.totalDurationSeconds);
    return metrics;
}

FillerAnalysis AudioIntelligenceExtractor::computeFillerAnalysis(const TranscriptCollection& transcript) const {
    FillerAnalysis analysis;
    const auto& lexicon = fillerLexicon();
    std::map<std::string, size_t> counts;

    auto record = [&](const std::string& filler) {
        if (counts[filler]++ == 0) {
            analysis.fillerWordsDetected.push_back(filler);
        }
        ++analysis.totalFillerCount;
    };

    for (const auto& segment : transcript.getSegments()) {
        auto tokens = normalizedTokens(segment.getText());
        for (size_t i = 0; i < tokens.size(); ++i) {
            if (tokens[i] == "you" && i + 1 < tokens.size() && tokens[i + 1] == "know") {
                record("you know");
                ++i;
                continue;
            }
            if (std::find(lexicon.begin(), lexicon.end(), tokens[i]) != lexicon.end()) {
                record(tokens[i]);
            }
        }
    }

    size_t totalWords = transcript.wordCount();
    if (totalWords > 0) {
        analysis.fillerPercentage = static_cast<double>(analysis.totalFillerCount) /
                                    static_cast<double>(totalWords) * 100.0;
    }

    double duration = transcript.totalDuration();
    if (duration > 0.0) {
        analysis.fillerFrequencyPerMinute = static_cast<double>(analysis.totalFillerCount) /
                                            (duration / 60.0);
    }

    // ties go to the filler listed first in the lexicon
    size_t best = 0;
    for (const auto& filler : lexicon) {
        auto it = counts.find(filler);
        if (it != counts.end() && it->second > best) {
            best = it->second;
            analysis.mostCommonFiller = filler;
        }
    }

    analysis.professionalismScore = professionalismScore(analysis.fillerPercentage);
    analysis.grade = professionalismGrade(analysis.fillerPercentage);
    return analysis;
}

ConfidenceMetrics AudioIntelligenceExtractor::computeConfidence(const TranscriptCollection& transcript,
                                                                const SpeechMetrics& speech,
                                                                const FillerAnalysis& fillers) const {
    ConfidenceMetrics metrics;

    std::vector<double> values;
    for (const auto& segment : transcript.getSegments()) {
        if (segment.getConfidence()) {
            values.push_back(*segment.getConfidence());
        }
    }

    if (!values.empty()) {
        double sum = 0.0;
        for (double v : values) {
            sum += v;
        }
        double mean = sum / static_cast<double>(values.size());
        double variance = 0.0;
        for (double v : values) {
            variance += (v - mean) * (v - mean);
        }
        variance /= static_cast<double>(values.size());

        metrics.confidenceScore = mean;
        metrics.fromProvider = true;
        metrics.vocalStability = std::clamp(1.0 - std::sqrt(variance), 0.0, 1.0);
    } else {
        metrics.confidenceScore = std::max(0.3, 1.0 - 2.0 * (fillers.fillerPercentage / 100.0));
        metrics.vocalStability = 0.5;
    }

    metrics.energyLevel = energyFromWpm(speech.wordsPerMinute);
    metrics.paceConsistency = speech.pacingConsistency;

    double energyScore = metrics.energyLevel == EnergyLevel::HIGH ? 1.0
                       : metrics.energyLevel == EnergyLevel::MODERATE ? 0.7 : 0.4;
    metrics.readinessScore = metrics.confidenceScore * 0.4 +
                             energyScore * 0.3 +
                             metrics.vocalStability * 0.2 +
                             metrics.paceConsistency * 0.1;

    if (metrics.confidenceScore >= 0.8) {
        metrics.assessment = "high";
    } else if (metrics.confidenceScore >= 0.6) {
        metrics.assessment = "moderate";
    } else {
        metrics.assessment = "low";
    }
    return metrics;
}

AudioIntelligenceReport AudioIntelligenceExtractor::analyze(
    const TranscriptCollection& transcript,
    const std::optional<IntelligenceAnnotations>& annotations) const {

    AudioIntelligenceReport report;
    report.speech = computeSpeechMetrics(transcript);
    report.fillers = computeFillerAnalysis(transcript);
    report.confidence = computeConfidence(transcript, report.speech, report.fillers);
    report.deliveryScore = deliveryScore(report.speech.speakingRate,
                                         report.speech.pauseEffectiveness,
                                         report.fillers.professionalismScore,
                                         report.confidence.readinessScore);

    const std::string wpm = formatNumber(report.speech.wordsPerMinute, 0);
    const std::string fillerPct = formatNumber(report.fillers.fillerPercentage, 1);

    if (report.speech.speakingRate == SpeakingRate::TOO_SLOW) {
        report.coachingInsights.push_back("Increase speaking pace from " + wpm +
                                          " to 140-160 WPM for better engagement");
        report.improvementAreas.push_back("Speaking pace is too slow");
    } else if (report.speech.speakingRate == SpeakingRate::TOO_FAST) {
        report.coachingInsights.push_back("Slow down from " + wpm +
                                          " to 140-160 WPM for better comprehension");
        report.improvementAreas.push_back("Speaking pace is too fast");
    } else {
        report.strengths.push_back("Excellent pacing at " + wpm + " WPM");
    }

    if (report.fillers.fillerPercentage > 3.0) {
        report.coachingInsights.push_back("Reduce filler words from " + fillerPct +
                                          "% to under 2% (practice with pauses instead)");
        report.improvementAreas.push_back("Filler word usage");
    } else if (report.fillers.fillerPercentage <= 2.0) {
        report.strengths.push_back("Professional delivery with only " + fillerPct + "% filler words");
    }

    if (report.confidence.confidenceScore < 0.7) {
        report.coachingInsights.push_back("Practice delivery to improve vocal confidence and stability");
        report.improvementAreas.push_back("Vocal confidence");
    } else if (report.confidence.confidenceScore >= 0.8) {
        report.strengths.push_back("High vocal confidence and presentation energy");
    }

    if (report.speech.pauseEffectiveness < 0.7) {
        report.coachingInsights.push_back("Use more strategic pauses for emphasis and audience engagement");
        report.improvementAreas.push_back("Strategic use of pauses");
    } else if (report.speech.pauseEffectiveness >= 0.8) {
        report.strengths.push_back("Effective use of strategic pauses for emphasis");
    }

    if (annotations) {
        std::string dominant = annotations->dominantSentiment();
        if (dominant == "positive") {
            report.strengths.push_back("Predominantly positive tone throughout the pitch");
        } else if (dominant == "negative") {
            report.improvementAreas.push_back("Predominantly negative tone");
        }
        report.annotations = annotations;
    }

    if (report.strengths.empty()) {
        report.strengths.push_back("Completed full presentation delivery");
    }
    return report;
}

} // namespace stt
} // namespace pitchscribe
