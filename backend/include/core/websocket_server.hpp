#pragma once

#include <atomic>
#include <memory>
#include <unordered_map>
#include <string>
#include <string_view>

// Forward declarations for uWS types
namespace uWS {
    template<bool SSL> struct TemplatedApp;
    template<bool SSL, bool isServer, typename USERDATA> struct WebSocket;
    template<bool SSL> struct HttpResponse;
    struct HttpRequest;
    struct Loop;
    using App = TemplatedApp<false>;
}
struct us_listen_socket_t;

namespace pitchscribe {
namespace core {

class ClientSession;
class SessionOrchestrator;
class TaskQueue;
class ThreadPool;

// Per-socket data structure
struct PerSocketData {
    std::string connectionId;
};

using ClientSocket = uWS::WebSocket<false, true, PerSocketData>;

/**
 * Recording gateway. Clients drive sessions over JSON text frames and stream
 * audio as binary frames. Stops run on worker threads; replies are deferred
 * back onto the event loop.
 */
class WebSocketServer {
public:
    WebSocketServer(int port, SessionOrchestrator& orchestrator, size_t workerThreads = 2);
    ~WebSocketServer();

    void start();

    // Blocks until the loop has no more sockets
    void run();

    /**
     * Close the listen socket and every client. Safe from any thread once run() is active.
     */
    void shutdown();

    // Join workers and release resources after run() returned
    void stop();

    size_t connectionCount() const { return connectionCount_; }

private:
    int port_;
    SessionOrchestrator& orchestrator_;
    std::atomic<bool> running_;
    std::atomic<size_t> connectionCount_;

    std::unique_ptr<uWS::App> app_;
    uWS::Loop* loop_;
    us_listen_socket_t* listenSocket_;

    std::unordered_map<std::string, std::shared_ptr<ClientSession>> sessions_;
    std::unordered_map<std::string, ClientSocket*> websockets_;

    std::shared_ptr<TaskQueue> workQueue_;
    std::unique_ptr<ThreadPool> workers_;

    std::string generateConnectionId();
    void handleNewConnection(const std::string& connectionId, ClientSocket* ws);
    void handleMessage(const std::string& connectionId, const std::string& message);
    void handleBinaryMessage(const std::string& connectionId, std::string_view data);
    void handleDisconnection(const std::string& connectionId);

    void handleHealthCheck(uWS::HttpResponse<false>* res, uWS::HttpRequest* req);

    // Loop thread only
    void sendMessage(const std::string& connectionId, const std::string& message);

    // Any thread
    void post(const std::string& connectionId, const std::string& message);
};

} // namespace core
} // namespace pitchscribe
