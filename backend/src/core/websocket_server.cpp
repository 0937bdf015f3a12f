#include "core/websocket_server.hpp"
#include "core/client_session.hpp"
#include "core/session_orchestrator.hpp"
#include "core/task_queue.hpp"
#include "utils/logging.hpp"
#include <App.h>
#include <chrono>
#include <random>
#include <sstream>
#include <nlohmann/json.hpp>

namespace pitchscribe {
namespace core {

namespace {

// Finished sessions are kept this long for get_state before being purged
constexpr std::chrono::minutes kTerminalRetention{10};

} // namespace

WebSocketServer::WebSocketServer(int port, SessionOrchestrator& orchestrator, size_t workerThreads)
    : port_(port), orchestrator_(orchestrator), running_(false), connectionCount_(0),
      app_(nullptr), loop_(nullptr), listenSocket_(nullptr),
      workQueue_(std::make_shared<TaskQueue>()),
      workers_(std::make_unique<ThreadPool>(workerThreads)) {
}

WebSocketServer::~WebSocketServer() {
    stop();
}

std::string WebSocketServer::generateConnectionId() {
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> dis(0, 15);

    std::stringstream ss;
    ss << "conn_";
    for (int i = 0; i < 12; ++i) {
        ss << std::hex << dis(gen);
    }
    return ss.str();
}

void WebSocketServer::start() {
    utils::Logger::info("Starting WebSocket server on port " + std::to_string(port_));
    running_ = true;

    app_ = std::make_unique<uWS::App>();
    loop_ = uWS::Loop::get();
    workers_->start(workQueue_);

    uWS::App::WebSocketBehavior<PerSocketData> behavior;
    behavior.compression = uWS::DISABLED;
    behavior.maxPayloadLength = 16 * 1024 * 1024;
    behavior.idleTimeout = 120;

    behavior.upgrade = [this](uWS::HttpResponse<false>* res, uWS::HttpRequest* req,
                              struct us_socket_context_t* context) {
        std::string connectionId = generateConnectionId();
        utils::Logger::debug("WebSocket upgrade request, assigning connection ID: " + connectionId);

        res->template upgrade<PerSocketData>(
            PerSocketData{connectionId},
            req->getHeader("sec-websocket-key"),
            req->getHeader("sec-websocket-protocol"),
            req->getHeader("sec-websocket-extensions"),
            context
        );
    };

    behavior.open = [this](ClientSocket* ws) {
        auto* data = ws->getUserData();
        handleNewConnection(data->connectionId, ws);
    };

    behavior.message = [this](ClientSocket* ws, std::string_view message, uWS::OpCode opCode) {
        auto* data = ws->getUserData();
        if (opCode == uWS::OpCode::TEXT) {
            handleMessage(data->connectionId, std::string(message));
        } else if (opCode == uWS::OpCode::BINARY) {
            handleBinaryMessage(data->connectionId, message);
        }
    };

    behavior.close = [this](ClientSocket* ws, int /*code*/, std::string_view /*message*/) {
        handleDisconnection(ws->getUserData()->connectionId);
    };

    app_->ws<PerSocketData>("/*", std::move(behavior));

    app_->get("/health", [this](auto* res, auto* req) {
        handleHealthCheck(res, req);
    });
}

void WebSocketServer::run() {
    if (!app_) {
        utils::Logger::error("Server not started. Call start() first.");
        return;
    }

    app_->listen(port_, [this](us_listen_socket_t* listenSocket) {
        if (listenSocket) {
            listenSocket_ = listenSocket;
            utils::Logger::info("WebSocket server listening on port " + std::to_string(port_));
        } else {
            utils::Logger::error("Failed to listen on port " + std::to_string(port_));
            running_ = false;
        }
    });

    if (running_) {
        app_->run();
    }
}

void WebSocketServer::shutdown() {
    if (!loop_) {
        return;
    }
    loop_->defer([this]() {
        if (listenSocket_) {
            us_listen_socket_close(0, listenSocket_);
            listenSocket_ = nullptr;
        }
        for (auto& entry : websockets_) {
            entry.second->end(1001, "Server shutting down");
        }
    });
}

void WebSocketServer::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    utils::Logger::info("Stopping WebSocket server");

    workers_->stop();
    for (auto& entry : sessions_) {
        orchestrator_.unsubscribe(entry.second);
        entry.second->disconnect();
    }
    sessions_.clear();
    websockets_.clear();
    app_.reset();
}

void WebSocketServer::post(const std::string& connectionId, const std::string& message) {
    if (!loop_) {
        return;
    }
    loop_->defer([this, connectionId, message]() {
        sendMessage(connectionId, message);
    });
}

void WebSocketServer::sendMessage(const std::string& connectionId, const std::string& message) {
    auto wsIt = websockets_.find(connectionId);
    if (wsIt != websockets_.end()) {
        wsIt->second->send(message, uWS::OpCode::TEXT);
        utils::Logger::debug("Sent JSON message to " + connectionId + ": " + message);
    } else {
        utils::Logger::debug("Dropped message for closed connection " + connectionId);
    }
}

void WebSocketServer::handleNewConnection(const std::string& connectionId, ClientSocket* ws) {
    auto session = std::make_shared<ClientSession>(connectionId, orchestrator_);
    session->setSender([this, connectionId](const std::string& message) {
        post(connectionId, message);
    });
    auto queue = workQueue_;
    session->setDispatcher([queue, connectionId](std::function<void()> work) {
        queue->enqueue("stop:" + connectionId, std::move(work), TaskPriority::HIGH);
    });

    orchestrator_.subscribe(session);
    sessions_[connectionId] = session;
    websockets_[connectionId] = ws;
    connectionCount_ = sessions_.size();

    utils::Logger::info("New client connection " + connectionId + ". Total connections: " +
                        std::to_string(sessions_.size()));
}

void WebSocketServer::handleMessage(const std::string& connectionId, const std::string& message) {
    auto it = sessions_.find(connectionId);
    if (it != sessions_.end()) {
        it->second->handleMessage(message);
    } else {
        utils::Logger::warn("Message from unknown connection: " + connectionId);
    }
}

void WebSocketServer::handleBinaryMessage(const std::string& connectionId, std::string_view data) {
    auto it = sessions_.find(connectionId);
    if (it != sessions_.end()) {
        it->second->handleBinaryMessage(data);
    } else {
        utils::Logger::warn("Binary message from unknown connection: " + connectionId);
    }
}

void WebSocketServer::handleDisconnection(const std::string& connectionId) {
    auto sessionIt = sessions_.find(connectionId);
    if (sessionIt != sessions_.end()) {
        orchestrator_.unsubscribe(sessionIt->second);
        sessionIt->second->disconnect();
        sessions_.erase(sessionIt);
    }
    websockets_.erase(connectionId);
    connectionCount_ = sessions_.size();

    orchestrator_.purgeTerminalSessions(kTerminalRetention);
    utils::Logger::info("Client disconnected: " + connectionId + ". Remaining connections: " +
                        std::to_string(sessions_.size()));
}

void WebSocketServer::handleHealthCheck(uWS::HttpResponse<false>* res, uWS::HttpRequest* /*req*/) {
    nlohmann::json body = {
        {"status", "healthy"},
        {"service", "PitchScribe"},
        {"active_sessions", orchestrator_.activeSessionCount()},
        {"sessions", orchestrator_.sessionCount()},
        {"connections", connectionCount_.load()},
        {"timestamp", std::chrono::duration_cast<std::chrono::milliseconds>(
                          std::chrono::system_clock::now().time_since_epoch()).count()}
    };
    res->writeStatus("200 OK")
       ->writeHeader("Content-Type", "application/json")
       ->end(body.dump());
}

} // namespace core
} // namespace pitchscribe
