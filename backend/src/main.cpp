#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <string>
#include <vector>
#include "audio/audio_configuration.hpp"
#include "core/scoring_collaborator.hpp"
#include "core/session_orchestrator.hpp"
#include "core/websocket_server.hpp"
#include "stt/provider_client.hpp"
#include "stt/realtime_connection.hpp"
#include "utils/config.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"

using namespace pitchscribe;

namespace {

void printUsage(const char* program) {
    std::cout << "Usage: " << program << " [options]\n"
              << "Options:\n"
              << "  --config <path>    Configuration file (default: config/server.json)\n"
              << "  --port <port>      Set server port (default: 8080)\n"
              << "  --file <audio>     Transcribe and analyse one recording, print the result and exit\n"
              << "  --preset <name>    Audio profile for --file: default, pitch_analysis, full_intelligence\n"
              << "  --help, -h         Show this help message\n";
}

audio::AudioConfiguration presetConfiguration(const std::string& preset) {
    if (preset == "default") {
        return audio::AudioConfiguration::createDefault();
    }
    if (preset == "pitch_analysis") {
        return audio::AudioConfiguration::createPitchAnalysis();
    }
    if (preset == "full_intelligence") {
        return audio::AudioConfiguration::createFullIntelligence();
    }
    throw utils::ConfigurationException("Unknown audio preset", preset);
}

std::vector<uint8_t> readFile(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw utils::ConfigurationException("Cannot open audio file", path);
    }
    return std::vector<uint8_t>(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

int transcribeFile(core::SessionOrchestrator& orchestrator, const std::string& path,
                   const std::string& preset) {
    auto audioData = readFile(path);
    auto config = presetConfiguration(preset);

    std::string sessionId = orchestrator.createSession(config);
    orchestrator.feedAudio(sessionId, audioData);
    auto outcome = orchestrator.stopSession(sessionId);

    std::cout << outcome.toJson().dump(2) << std::endl;
    return outcome.succeeded() ? 0 : 2;
}

} // namespace

int main(int argc, char* argv[]) {
    try {
        utils::Logger::initialize();

        std::string configPath = "config/server.json";
        std::string audioFile;
        std::string preset = "pitch_analysis";
        int port = -1;

        for (int i = 1; i < argc; i++) {
            std::string arg = argv[i];
            if (arg == "--config" && i + 1 < argc) {
                configPath = argv[++i];
            } else if (arg == "--port" && i + 1 < argc) {
                port = std::stoi(argv[++i]);
            } else if (arg == "--file" && i + 1 < argc) {
                audioFile = argv[++i];
            } else if (arg == "--preset" && i + 1 < argc) {
                preset = argv[++i];
            } else if (arg == "--help" || arg == "-h") {
                printUsage(argv[0]);
                return 0;
            } else {
                std::cerr << "Unknown option: " << arg << std::endl;
                printUsage(argv[0]);
                return 1;
            }
        }

        auto config = utils::Config::load(configPath);
        if (port > 0) {
            config.setPort(port);
        }
        config.validate();
        utils::Logger::setLevel(utils::Logger::parseLevel(config.getLogLevel()));

        stt::GladiaProviderClient providerClient(config.provider(), config.batch().requestTimeout);
        stt::BeastRealtimeConnector connector;

        std::shared_ptr<core::ScoringCollaborator> scoring;
        if (config.scoring().endpoint.empty()) {
            scoring = std::make_shared<core::LoggingScoringCollaborator>();
        } else {
            scoring = std::make_shared<core::HttpScoringCollaborator>(config.scoring().endpoint,
                                                                      config.scoring().requestTimeout);
        }

        core::SessionOrchestrator orchestrator(config, connector, providerClient, scoring);

        if (!audioFile.empty()) {
            int status = transcribeFile(orchestrator, audioFile, preset);
            orchestrator.shutdown();
            return status;
        }

        core::WebSocketServer server(config.getPort(), orchestrator);

        std::cout << "Starting PitchScribe server on port " << config.getPort() << std::endl;
        server.start();

        std::cout << "Press Ctrl+C to stop the server" << std::endl;
        server.run();

        std::cout << "Shutting down..." << std::endl;
        server.stop();
        orchestrator.shutdown();

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
