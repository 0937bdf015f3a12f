#include "stt/realtime_connection.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"

#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>

namespace pitchscribe {
namespace stt {

namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
using tcp = boost::asio::ip::tcp;

namespace {

using Clock = std::chrono::steady_clock;
using WsStream = websocket::stream<beast::ssl_stream<beast::tcp_stream>>;

constexpr std::chrono::milliseconds kWriteTimeout{10000};
constexpr std::chrono::milliseconds kCloseTimeout{1000};

/**
 * Drive the io_context until done is set or the deadline passes.
 * Returns false on deadline.
 */
bool runUntil(net::io_context& ioc, const bool& done, Clock::time_point deadline) {
    while (!done) {
        auto now = Clock::now();
        if (now >= deadline) {
            return false;
        }
        if (ioc.stopped()) {
            ioc.restart();
        }
        ioc.run_one_for(deadline - now);
    }
    return true;
}

class BeastRealtimeConnection : public RealtimeConnection {
public:
    BeastRealtimeConnection()
        : sslContext_(ssl::context::tlsv12_client),
          ws_(std::make_unique<WsStream>(ioc_, sslContext_)) {
        sslContext_.set_default_verify_paths();
        sslContext_.set_verify_mode(ssl::verify_peer);
    }

    ~BeastRealtimeConnection() override {
        close();
    }

    void open(const WebSocketUrl& url, std::chrono::milliseconds timeout) {
        auto deadline = Clock::now() + timeout;

        if (!SSL_set_tlsext_host_name(ws_->next_layer().native_handle(), url.host.c_str())) {
            throw utils::ConnectionException("Failed to set TLS server name for " + url.host,
                                             "RealtimeConnect");
        }

        auto resolved = std::make_shared<tcp::resolver::results_type>();
        auto op = std::make_shared<PendingOp>();
        resolver_.async_resolve(url.host, url.port,
            [op, resolved](beast::error_code e, tcp::resolver::results_type results) {
                op->ec = e;
                *resolved = results;
                op->done = true;
            });
        step(*op, deadline, "resolve " + url.host);

        beast::get_lowest_layer(*ws_).expires_at(deadline);
        op = std::make_shared<PendingOp>();
        beast::get_lowest_layer(*ws_).async_connect(*resolved,
            [op](beast::error_code e, tcp::resolver::results_type::endpoint_type) {
                op->ec = e;
                op->done = true;
            });
        step(*op, deadline, "connect to " + url.host);

        op = std::make_shared<PendingOp>();
        ws_->next_layer().async_handshake(ssl::stream_base::client,
            [op](beast::error_code e) {
                op->ec = e;
                op->done = true;
            });
        step(*op, deadline, "TLS handshake with " + url.host);

        // the websocket layer manages its own timeouts from here on
        beast::get_lowest_layer(*ws_).expires_never();
        ws_->set_option(websocket::stream_base::timeout::suggested(beast::role_type::client));
        ws_->set_option(websocket::stream_base::decorator(
            [](websocket::request_type& req) {
                req.set(beast::http::field::user_agent, "pitchscribe");
            }));

        op = std::make_shared<PendingOp>();
        std::string hostHeader = url.host + (url.port == "443" ? "" : ":" + url.port);
        ws_->async_handshake(hostHeader, url.target,
            [op](beast::error_code e) {
                op->ec = e;
                op->done = true;
            });
        step(*op, deadline, "websocket handshake with " + url.host);

        open_ = true;
    }

    void sendBinary(const uint8_t* data, size_t size) override {
        ws_->binary(true);
        write(net::buffer(data, size));
    }

    void sendText(const std::string& text) override {
        ws_->text(true);
        write(net::buffer(text));
    }

    ReceiveResult receive(std::chrono::milliseconds timeout) override {
        ReceiveResult result;
        if (!open_ && !readPending_) {
            result.status = ReceiveResult::Status::CLOSED;
            result.error = "Connection is closed";
            return result;
        }

        if (!readPending_) {
            readPending_ = true;
            readDone_ = false;
            readBuffer_.clear();
            ws_->async_read(readBuffer_, [this](beast::error_code e, std::size_t) {
                readError_ = e;
                readDone_ = true;
            });
        }

        if (!runUntil(ioc_, readDone_, Clock::now() + timeout)) {
            result.status = ReceiveResult::Status::TIMEOUT;
            return result;
        }

        readPending_ = false;
        if (readError_) {
            open_ = false;
            result.status = ReceiveResult::Status::CLOSED;
            if (readError_ == websocket::error::closed) {
                result.error = ws_->reason().reason.empty()
                                   ? std::string("closed by provider")
                                   : std::string(ws_->reason().reason.c_str());
            } else {
                result.error = readError_.message();
            }
            return result;
        }

        result.status = ReceiveResult::Status::MESSAGE;
        result.text = beast::buffers_to_string(readBuffer_.data());
        return result;
    }

    void close() override {
        if (open_) {
            open_ = false;
            auto op = std::make_shared<PendingOp>();
            ws_->async_close(websocket::close_code::normal, [op](beast::error_code e) {
                op->ec = e;
                op->done = true;
            });
            if (!runUntil(ioc_, op->done, Clock::now() + kCloseTimeout)) {
                utils::Logger::debug("Realtime close handshake timed out");
            } else if (op->ec) {
                utils::Logger::debug("Realtime close handshake failed: " + op->ec.message());
            }
        }
        cancelPending();
        readPending_ = false;
    }

    bool isOpen() const override {
        return open_;
    }

private:
    struct PendingOp {
        bool done = false;
        beast::error_code ec;
    };

    // cancel outstanding operations and let their handlers run
    void cancelPending() {
        beast::error_code ignored;
        resolver_.cancel();
        beast::get_lowest_layer(*ws_).socket().close(ignored);
        ioc_.restart();
        ioc_.poll();
    }

    void step(const PendingOp& op, Clock::time_point deadline, const std::string& what) {
        if (!runUntil(ioc_, op.done, deadline)) {
            cancelPending();
            throw utils::TimeoutException("Timed out during " + what, "RealtimeConnect");
        }
        if (op.ec) {
            throw utils::ConnectionException("Failed to " + what + ": " + op.ec.message(),
                                             "RealtimeConnect");
        }
    }

    template <typename Buffer>
    void write(const Buffer& buffer) {
        if (!open_) {
            throw utils::ConnectionException("Realtime connection is closed", "RealtimeSend");
        }

        auto op = std::make_shared<PendingOp>();
        ws_->async_write(buffer, [op](beast::error_code e, std::size_t) {
            op->ec = e;
            op->done = true;
        });
        if (!runUntil(ioc_, op->done, Clock::now() + kWriteTimeout)) {
            open_ = false;
            cancelPending();
            throw utils::ConnectionException("Timed out writing to provider", "RealtimeSend");
        }
        if (op->ec) {
            open_ = false;
            throw utils::ConnectionException("Write to provider failed: " + op->ec.message(),
                                             "RealtimeSend");
        }
    }

    net::io_context ioc_;
    ssl::context sslContext_;
    tcp::resolver resolver_{ioc_};
    std::unique_ptr<WsStream> ws_;
    beast::flat_buffer readBuffer_;
    beast::error_code readError_;
    bool readPending_ = false;
    bool readDone_ = false;
    bool open_ = false;
};

} // namespace

WebSocketUrl WebSocketUrl::parse(const std::string& url) {
    const std::string scheme = "wss://";
    if (url.compare(0, scheme.size(), scheme) != 0) {
        throw utils::ConnectionException("Unsupported realtime URL " + url, "RealtimeConnect");
    }

    std::string rest = url.substr(scheme.size());
    size_t slash = rest.find('/');
    std::string authority = rest.substr(0, slash);

    WebSocketUrl parsed;
    parsed.target = slash == std::string::npos ? "/" : rest.substr(slash);

    size_t colon = authority.rfind(':');
    if (colon != std::string::npos) {
        parsed.host = authority.substr(0, colon);
        parsed.port = authority.substr(colon + 1);
    } else {
        parsed.host = authority;
        parsed.port = "443";
    }

    if (parsed.host.empty() || parsed.port.empty()) {
        throw utils::ConnectionException("Realtime URL without host " + url, "RealtimeConnect");
    }
    return parsed;
}

std::unique_ptr<RealtimeConnection> BeastRealtimeConnector::connect(const std::string& url,
                                                                    std::chrono::milliseconds timeout) {
    WebSocketUrl parsed = WebSocketUrl::parse(url);
    utils::Logger::debug("Opening realtime connection to " + parsed.host + ":" + parsed.port);

    auto connection = std::make_unique<BeastRealtimeConnection>();
    try {
        connection->open(parsed, timeout);
    } catch (const boost::system::system_error& e) {
        throw utils::ConnectionException(std::string("Realtime connection failed: ") + e.what(),
                                         "RealtimeConnect");
    }
    return connection;
}

} // namespace stt
} // namespace pitchscribe
