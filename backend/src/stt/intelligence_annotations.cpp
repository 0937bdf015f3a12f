#include "stt/intelligence_annotations.hpp"
#include "utils/logging.hpp"
#include <map>

namespace pitchscribe {
namespace stt {

namespace {

// Provider sections look like {"success": bool, "results": ...}
const nlohmann::json* sectionResults(const nlohmann::json& result, const char* name) {
    if (!result.contains(name) || !result.at(name).is_object()) {
        return nullptr;
    }
    const auto& section = result.at(name);
    if (section.contains("success") && section.at("success").is_boolean() &&
        !section.at("success").get<bool>()) {
        utils::Logger::warn(std::string("Provider reported failed ") + name + " section");
        return nullptr;
    }
    if (!section.contains("results") || section.at("results").is_null()) {
        return nullptr;
    }
    return &section.at("results");
}

std::string stringField(const nlohmann::json& j, const char* key) {
    if (j.contains(key) && j.at(key).is_string()) {
        return j.at(key).get<std::string>();
    }
    return std::string();
}

double numberField(const nlohmann::json& j, const char* key) {
    if (j.contains(key) && j.at(key).is_number()) {
        return j.at(key).get<double>();
    }
    return 0.0;
}

} // namespace

bool IntelligenceAnnotations::empty() const {
    return sentiments.empty() && entities.empty() && chapters.empty() &&
           !summary && !translation;
}

std::string IntelligenceAnnotations::dominantSentiment() const {
    std::map<std::string, size_t> counts;
    std::vector<std::string> order;
    for (const auto& s : sentiments) {
        if (s.sentiment.empty()) {
            continue;
        }
        if (counts[s.sentiment]++ == 0) {
            order.push_back(s.sentiment);
        }
    }

    std::string dominant;
    size_t best = 0;
    for (const auto& label : order) {
        if (counts[label] > best) {
            best = counts[label];
            dominant = label;
        }
    }
    return dominant;
}

IntelligenceAnnotations IntelligenceAnnotations::fromProviderResult(const nlohmann::json& result) {
    IntelligenceAnnotations annotations;
    if (!result.is_object()) {
        return annotations;
    }

    // emotion labels arrive inside the sentiment results
    for (const char* name : {"sentiment_analysis", "emotion_analysis"}) {
        const auto* items = sectionResults(result, name);
        if (!items || !items->is_array() || !annotations.sentiments.empty()) {
            continue;
        }
        for (const auto& item : *items) {
            if (!item.is_object()) {
                continue;
            }
            SentimentAnnotation s;
            s.sentiment = stringField(item, "sentiment");
            s.emotion = stringField(item, "emotion");
            s.text = stringField(item, "text");
            s.start = numberField(item, "start");
            s.end = numberField(item, "end");
            if (item.contains("channel") && item.at("channel").is_number_integer()) {
                s.channel = item.at("channel").get<int>();
            }
            annotations.sentiments.push_back(std::move(s));
        }
    }

    if (const auto* items = sectionResults(result, "named_entity_recognition")) {
        if (items->is_array()) {
            for (const auto& item : *items) {
                if (!item.is_object()) {
                    continue;
                }
                EntityAnnotation e;
                e.type = stringField(item, "entity_type");
                if (e.type.empty()) {
                    e.type = stringField(item, "type");
                }
                e.text = stringField(item, "text");
                e.start = numberField(item, "start");
                e.end = numberField(item, "end");
                annotations.entities.push_back(std::move(e));
            }
        }
    }

    if (const auto* items = sectionResults(result, "chapterization")) {
        if (items->is_array()) {
            for (const auto& item : *items) {
                if (!item.is_object()) {
                    continue;
                }
                ChapterAnnotation c;
                c.headline = stringField(item, "headline");
                c.summary = stringField(item, "summary");
                c.start = numberField(item, "start");
                c.end = numberField(item, "end");
                if (item.contains("keywords") && item.at("keywords").is_array()) {
                    for (const auto& keyword : item.at("keywords")) {
                        if (keyword.is_string()) {
                            c.keywords.push_back(keyword.get<std::string>());
                        }
                    }
                }
                annotations.chapters.push_back(std::move(c));
            }
        }
    }

    if (const auto* summary = sectionResults(result, "summarization")) {
        if (summary->is_string() && !summary->get<std::string>().empty()) {
            annotations.summary = summary->get<std::string>();
        }
    }

    if (const auto* items = sectionResults(result, "translation")) {
        if (items->is_array() && !items->empty() && items->at(0).is_object()) {
            std::string text = stringField(items->at(0), "full_transcript");
            if (!text.empty()) {
                annotations.translation = text;
            }
        }
    }

    return annotations;
}

nlohmann::json IntelligenceAnnotations::toJson() const {
    nlohmann::json j;
    j["sentiments"] = nlohmann::json::array();
    for (const auto& s : sentiments) {
        nlohmann::json item = {
            {"sentiment", s.sentiment}, {"emotion", s.emotion}, {"text", s.text},
            {"start", s.start}, {"end", s.end}
        };
        if (s.channel) item["channel"] = *s.channel;
        j["sentiments"].push_back(item);
    }
    j["entities"] = nlohmann::json::array();
    for (const auto& e : entities) {
        j["entities"].push_back({{"type", e.type}, {"text", e.text},
                                 {"start", e.start}, {"end", e.end}});
    }
    j["chapters"] = nlohmann::json::array();
    for (const auto& c : chapters) {
        j["chapters"].push_back({{"headline", c.headline}, {"summary", c.summary},
                                 {"start", c.start}, {"end", c.end},
                                 {"keywords", c.keywords}});
    }
    j["summary"] = summary ? nlohmann::json(*summary) : nlohmann::json(nullptr);
    j["translation"] = translation ? nlohmann::json(*translation) : nlohmann::json(nullptr);
    j["dominant_sentiment"] = dominantSentiment();
    return j;
}

} // namespace stt
} // namespace pitchscribe
