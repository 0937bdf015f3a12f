#include "stt/provider_client.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"
#include <cpr/cpr.h>

namespace pitchscribe {
namespace stt {

namespace {

void checkResponse(const cpr::Response& r, const std::string& operation) {
    if (r.error.code == cpr::ErrorCode::OPERATION_TIMEDOUT) {
        throw utils::TimeoutException(operation + " timed out", "ProviderHttp");
    }
    if (r.error.code != cpr::ErrorCode::OK) {
        throw utils::ConnectionException(operation + " failed: " + r.error.message, "ProviderHttp");
    }
    if (r.status_code < 200 || r.status_code >= 300) {
        throw utils::ConnectionException(operation + " returned HTTP " +
                                         std::to_string(r.status_code) + ": " + r.text,
                                         "ProviderHttp");
    }
}

nlohmann::json parseBody(const cpr::Response& r, const std::string& operation) {
    try {
        return nlohmann::json::parse(r.text);
    } catch (const nlohmann::json::parse_error& e) {
        throw utils::ProtocolException(operation + " returned malformed JSON", e.what());
    }
}

std::string requireString(const nlohmann::json& j, const char* key, const std::string& operation) {
    if (!j.is_object() || !j.contains(key) || !j.at(key).is_string()) {
        throw utils::ProtocolException(operation + " response without " + key);
    }
    return j.at(key).get<std::string>();
}

} // namespace

GladiaProviderClient::GladiaProviderClient(utils::ProviderSettings settings,
                                           std::chrono::milliseconds requestTimeout)
    : settings_(std::move(settings)), requestTimeout_(requestTimeout) {
    while (!settings_.baseUrl.empty() && settings_.baseUrl.back() == '/') {
        settings_.baseUrl.pop_back();
    }
    if (settings_.apiKey.empty()) {
        utils::Logger::warn("No provider API key configured; provider calls will be rejected");
    }
}

std::string GladiaProviderClient::endpoint(const std::string& path) const {
    return settings_.baseUrl + path;
}

LiveSessionInfo GladiaProviderClient::createLiveSession(const audio::AudioConfiguration& config) {
    const std::string operation = "Live session creation";
    auto r = cpr::Post(cpr::Url{endpoint("/v2/live")},
                       cpr::Header{{"X-Gladia-Key", settings_.apiKey},
                                   {"Content-Type", "application/json"}},
                       cpr::Body{config.toProviderConfig(false).dump()},
                       cpr::Timeout{requestTimeout_});
    checkResponse(r, operation);

    auto body = parseBody(r, operation);
    LiveSessionInfo info;
    info.id = requireString(body, "id", operation);
    info.url = requireString(body, "url", operation);
    utils::Logger::info("Created provider live session " + info.id);
    return info;
}

std::string GladiaProviderClient::uploadAudio(const std::vector<uint8_t>& audio,
                                              const std::string& filename) {
    const std::string operation = "Audio upload";
    auto r = cpr::Post(cpr::Url{endpoint("/v2/upload")},
                       cpr::Header{{"X-Gladia-Key", settings_.apiKey}},
                       cpr::Multipart{{"audio", cpr::Buffer{audio.begin(), audio.end(), filename},
                                       "audio/wav"}},
                       cpr::Timeout{requestTimeout_});
    checkResponse(r, operation);

    auto body = parseBody(r, operation);
    std::string audioUrl = requireString(body, "audio_url", operation);
    utils::Logger::info("Uploaded " + std::to_string(audio.size()) + " bytes for batch transcription");
    return audioUrl;
}

SubmittedJob GladiaProviderClient::submitTranscription(const std::string& audioUrl,
                                                       const audio::AudioConfiguration& config) {
    const std::string operation = "Transcription submission";

    nlohmann::json request = {{"audio_url", audioUrl}};
    // the batch API takes feature flags but not the raw PCM layout
    for (const auto& item : config.toProviderConfig(true).items()) {
        if (item.key() == "encoding" || item.key() == "sample_rate" ||
            item.key() == "bit_depth" || item.key() == "channels") {
            continue;
        }
        request[item.key()] = item.value();
    }

    auto r = cpr::Post(cpr::Url{endpoint("/v2/pre-recorded")},
                       cpr::Header{{"X-Gladia-Key", settings_.apiKey},
                                   {"Content-Type", "application/json"}},
                       cpr::Body{request.dump()},
                       cpr::Timeout{requestTimeout_});
    checkResponse(r, operation);

    auto body = parseBody(r, operation);
    SubmittedJob job;
    job.id = requireString(body, "id", operation);
    job.resultUrl = requireString(body, "result_url", operation);
    utils::Logger::info("Submitted batch transcription job " + job.id);
    return job;
}

JobStatus GladiaProviderClient::fetchJob(const std::string& resultUrl) {
    const std::string operation = "Job status request";
    auto r = cpr::Get(cpr::Url{resultUrl},
                      cpr::Header{{"X-Gladia-Key", settings_.apiKey}},
                      cpr::Timeout{requestTimeout_});
    checkResponse(r, operation);

    JobStatus status;
    status.payload = parseBody(r, operation);
    status.rawStatus = requireString(status.payload, "status", operation);
    status.state = parseJobState(status.rawStatus);

    if (status.state == JobStatus::State::ERROR) {
        if (status.payload.contains("error_code") && !status.payload.at("error_code").is_null()) {
            status.errorMessage = "error code " + status.payload.at("error_code").dump();
        } else {
            status.errorMessage = "job failed upstream";
        }
    }
    return status;
}

void GladiaProviderClient::deleteJob(const std::string& jobId) {
    auto r = cpr::Delete(cpr::Url{endpoint("/v2/pre-recorded/" + jobId)},
                         cpr::Header{{"X-Gladia-Key", settings_.apiKey}},
                         cpr::Timeout{requestTimeout_});
    checkResponse(r, "Job deletion");
    utils::Logger::debug("Deleted batch job " + jobId);
}

JobStatus::State GladiaProviderClient::parseJobState(const std::string& status) {
    if (status == "done" || status == "completed") {
        return JobStatus::State::DONE;
    }
    if (status == "error") {
        return JobStatus::State::ERROR;
    }
    if (status == "queued") {
        return JobStatus::State::QUEUED;
    }
    return JobStatus::State::PROCESSING;
}

} // namespace stt
} // namespace pitchscribe
