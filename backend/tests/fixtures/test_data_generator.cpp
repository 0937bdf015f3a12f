#include "test_data_generator.hpp"

namespace fixtures {

std::string repeatWord(size_t count, const std::string& word) {
    std::string text;
    for (size_t i = 0; i < count; ++i) {
        if (i > 0) {
            text += ' ';
        }
        text += word;
    }
    return text;
}

pitchscribe::stt::TranscriptSegment makeSegment(const std::string& id, const std::string& text,
                                                double start, double end, bool isFinal,
                                                std::optional<double> confidence,
                                                std::optional<int> channel) {
    return pitchscribe::stt::TranscriptSegment(id, text, start, end, "en", channel, confidence, isFinal);
}

std::string transcriptMessage(const std::string& id, const std::string& text, double start, double end,
                              bool isFinal, std::optional<double> confidence) {
    nlohmann::json utterance = {
        {"text", text},
        {"start", start},
        {"end", end},
        {"language", "en"},
        {"channel", 0}
    };
    if (confidence) {
        utterance["confidence"] = *confidence;
    }
    nlohmann::json message = {
        {"type", "transcript"},
        {"session_id", "provider-session"},
        {"data", {{"id", id}, {"is_final", isFinal}, {"utterance", utterance}}}
    };
    return message.dump();
}

std::string sessionEndsMessage() {
    return nlohmann::json{{"type", "session_ends"}}.dump();
}

std::string providerErrorMessage(const std::string& message) {
    return nlohmann::json{{"type", "error"}, {"data", {{"message", message}}}}.dump();
}

std::string annotationMessage(const std::string& type) {
    return nlohmann::json{{"type", type}, {"data", {{"results", nlohmann::json::array()}}}}.dump();
}

nlohmann::json finishedJob(const std::vector<UtteranceSpec>& utterances) {
    nlohmann::json list = nlohmann::json::array();
    for (const auto& spec : utterances) {
        nlohmann::json u = {{"text", spec.text}, {"start", spec.start}, {"end", spec.end}};
        if (spec.confidence) {
            u["confidence"] = *spec.confidence;
        }
        if (spec.channel) {
            u["channel"] = *spec.channel;
        }
        list.push_back(u);
    }
    return {
        {"id", "job-1"},
        {"status", "done"},
        {"result", {
            {"transcription", {{"utterances", list}, {"languages", {"en"}}}}
        }}
    };
}

nlohmann::json pendingJob(const std::string& status) {
    return {{"id", "job-1"}, {"status", status}};
}

std::vector<uint8_t> silence(size_t bytes) {
    return std::vector<uint8_t>(bytes, 0);
}

} // namespace fixtures
