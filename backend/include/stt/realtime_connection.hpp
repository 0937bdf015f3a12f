#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace pitchscribe {
namespace stt {

struct ReceiveResult {
    enum class Status {
        MESSAGE,
        TIMEOUT,
        CLOSED
    };

    Status status = Status::TIMEOUT;
    std::string text;
    std::string error;   // close reason or transport error when CLOSED
};

/**
 * One open realtime connection to the transcription provider.
 * Implementations close the connection on destruction.
 */
class RealtimeConnection {
public:
    virtual ~RealtimeConnection() = default;

    /**
     * @throws ConnectionException if the frame cannot be written
     */
    virtual void sendBinary(const uint8_t* data, size_t size) = 0;
    virtual void sendText(const std::string& text) = 0;

    /**
     * Wait up to timeout for the next message. A read that times out stays
     * pending and is resumed by the next call.
     */
    virtual ReceiveResult receive(std::chrono::milliseconds timeout) = 0;

    virtual void close() = 0;
    virtual bool isOpen() const = 0;
};

class RealtimeConnector {
public:
    virtual ~RealtimeConnector() = default;

    /**
     * @throws ConnectionException when the endpoint cannot be reached or the handshake fails
     * @throws TimeoutException when the handshake does not finish within timeout
     */
    virtual std::unique_ptr<RealtimeConnection> connect(const std::string& url,
                                                        std::chrono::milliseconds timeout) = 0;
};

/**
 * Secure websocket (wss://) connector over Boost.Beast and OpenSSL.
 */
class BeastRealtimeConnector : public RealtimeConnector {
public:
    BeastRealtimeConnector() = default;

    std::unique_ptr<RealtimeConnection> connect(const std::string& url,
                                                std::chrono::milliseconds timeout) override;
};

struct WebSocketUrl {
    std::string host;
    std::string port;
    std::string target;

    /**
     * @throws ConnectionException for anything but a wss:// URL with a host
     */
    static WebSocketUrl parse(const std::string& url);
};

} // namespace stt
} // namespace pitchscribe
