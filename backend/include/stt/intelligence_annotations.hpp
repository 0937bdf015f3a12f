#pragma once

#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace pitchscribe {
namespace stt {

struct SentimentAnnotation {
    std::string sentiment;   // positive, negative, neutral, mixed
    std::string emotion;
    std::string text;
    double start = 0.0;
    double end = 0.0;
    std::optional<int> channel;
};

struct EntityAnnotation {
    std::string type;
    std::string text;
    double start = 0.0;
    double end = 0.0;
};

struct ChapterAnnotation {
    std::string headline;
    std::string summary;
    double start = 0.0;
    double end = 0.0;
    std::vector<std::string> keywords;
};

/**
 * Provider-supplied analysis that only the batch path can deliver.
 * Sentiment and emotion entries are segment scoped, the summary is document scoped.
 */
struct IntelligenceAnnotations {
    std::vector<SentimentAnnotation> sentiments;
    std::vector<EntityAnnotation> entities;
    std::vector<ChapterAnnotation> chapters;
    std::optional<std::string> summary;
    std::optional<std::string> translation;

    bool empty() const;

    /**
     * Most frequent sentiment label, empty when no sentiment was delivered.
     * Ties resolve to the label seen first.
     */
    std::string dominantSentiment() const;

    /**
     * Parse the "result" object of a finished batch job. Sections that are
     * missing or failed upstream are skipped.
     */
    static IntelligenceAnnotations fromProviderResult(const nlohmann::json& result);

    nlohmann::json toJson() const;
};

} // namespace stt
} // namespace pitchscribe
