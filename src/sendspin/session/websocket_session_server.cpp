#include "websocket_session_server.h"

#include <rtc/rtc.hpp>

#include <chrono>
#include <exception>
#include <variant>

namespace sendspin {
namespace audio {

namespace {

class WebSocketTransport : public ISessionTransport {
public:
    WebSocketTransport(std::weak_ptr<rtc::WebSocket> ws, std::string remote_address, logging::LoggerPtr logger)
        : ws_(std::move(ws)), remote_address_(std::move(remote_address)), logger_(std::move(logger)) {}

    bool send_text(const std::string& message) override {
        auto ws = ws_.lock();
        if (!ws || !ws->isOpen()) {
            return false;
        }
        try {
            return ws->send(message);
        } catch (const std::exception& e) {
            LOG_CPP_WARNING(logger_, "[WebSocket:%s] send failed: %s", remote_address_.c_str(), e.what());
            return false;
        }
    }

    void close() override {
        auto ws = ws_.lock();
        if (!ws || ws->isClosed()) {
            return;
        }
        try {
            ws->close();
        } catch (const std::exception& e) {
            LOG_CPP_WARNING(logger_, "[WebSocket:%s] close failed: %s", remote_address_.c_str(), e.what());
        }
    }

    std::string remote_address() const override { return remote_address_; }

private:
    std::weak_ptr<rtc::WebSocket> ws_;
    std::string remote_address_;
    logging::LoggerPtr logger_;
};

std::string strip_query(const std::string& path) {
    const size_t query = path.find('?');
    return query == std::string::npos ? path : path.substr(0, query);
}

} // namespace

struct WebSocketSessionServer::Connection {
    std::shared_ptr<rtc::WebSocket> ws;
    std::string remote_address;

    std::mutex mutex;
    std::shared_ptr<ISessionHandler> handler;

    std::shared_ptr<ISessionHandler> current_handler() {
        std::lock_guard<std::mutex> lock(mutex);
        return handler;
    }
};

WebSocketSessionServer::WebSocketSessionServer(logging::LoggerPtr logger)
    : logger_(std::move(logger)) {}

WebSocketSessionServer::~WebSocketSessionServer() {
    stop();
}

bool WebSocketSessionServer::start(const ServiceSettings& settings, AcceptCallback on_accept) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (server_) {
        return true;
    }

    rtc::WebSocketServer::Configuration config;
    config.port = settings.port;
    config.enableTls = false;
    if (settings.connection_timeout_ms > 0) {
        config.connectionTimeout = std::chrono::milliseconds(settings.connection_timeout_ms);
    }

    on_accept_ = std::move(on_accept);
    service_path_ = settings.path;

    try {
        server_ = std::make_unique<rtc::WebSocketServer>(config);
    } catch (const std::exception& e) {
        LOG_CPP_ERROR(logger_, "[WebSocket] Failed to listen on port %u: %s", settings.port, e.what());
        on_accept_ = nullptr;
        return false;
    }

    server_->onClient([this](std::shared_ptr<rtc::WebSocket> ws) { handle_client(std::move(ws)); });
    LOG_CPP_INFO(logger_, "[WebSocket] Listening on port %u (path %s).", server_->port(), service_path_.c_str());
    return true;
}

void WebSocketSessionServer::stop() {
    std::unique_ptr<rtc::WebSocketServer> server;
    std::map<rtc::WebSocket*, std::shared_ptr<Connection>> connections;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        server = std::move(server_);
        connections.swap(connections_);
        on_accept_ = nullptr;
    }

    for (auto& entry : connections) {
        const auto& ws = entry.second->ws;
        ws->onOpen(nullptr);
        ws->onMessage(nullptr);
        ws->onError(nullptr);
        ws->onClosed(nullptr);
        if (!ws->isClosed()) {
            ws->close();
        }
    }
    if (server) {
        server->stop();
        LOG_CPP_INFO(logger_, "[WebSocket] Server stopped.");
    }
}

bool WebSocketSessionServer::path_accepted(const std::string& request_path) const {
    const std::string path = strip_query(request_path);
    return path.empty() || path == "/" || path == service_path_;
}

void WebSocketSessionServer::handle_client(std::shared_ptr<rtc::WebSocket> ws) {
    auto connection = std::make_shared<Connection>();
    connection->ws = ws;
    connection->remote_address = ws->remoteAddress().value_or("unknown");
    rtc::WebSocket* key = ws.get();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!server_) {
            ws->close();
            return;
        }
        connections_[key] = connection;
    }
    LOG_CPP_DEBUG(logger_, "[WebSocket] Incoming connection from %s", connection->remote_address.c_str());

    std::weak_ptr<Connection> weak = connection;

    ws->onOpen([this, weak]() {
        if (auto c = weak.lock()) {
            admit(c);
        }
    });

    ws->onMessage([this, weak](auto data) {
        auto c = weak.lock();
        if (!c) {
            return;
        }
        auto handler = c->current_handler();
        if (!handler) {
            return;
        }
        try {
            if (std::holds_alternative<std::string>(data)) {
                handler->on_text(std::get<std::string>(data));
            } else if (std::holds_alternative<rtc::binary>(data)) {
                const rtc::binary& bin = std::get<rtc::binary>(data);
                handler->on_binary(reinterpret_cast<const uint8_t*>(bin.data()), bin.size());
            }
        } catch (const std::exception& e) {
            LOG_CPP_ERROR(logger_, "[WebSocket:%s] Exception in message handler: %s",
                          c->remote_address.c_str(), e.what());
        }
    });

    ws->onError([this, weak](std::string error) {
        auto c = weak.lock();
        if (!c) {
            return;
        }
        LOG_CPP_WARNING(logger_, "[WebSocket:%s] Error: %s", c->remote_address.c_str(), error.c_str());
        if (auto handler = c->current_handler()) {
            handler->on_transport_error(error);
        }
    });

    ws->onClosed([this, weak, key]() {
        if (auto c = weak.lock()) {
            LOG_CPP_DEBUG(logger_, "[WebSocket:%s] Closed.", c->remote_address.c_str());
            if (auto handler = c->current_handler()) {
                handler->on_closed();
            }
        }
        forget(key);
    });
}

void WebSocketSessionServer::admit(const std::shared_ptr<Connection>& connection) {
    const std::string path = connection->ws->path().value_or("/");
    if (!path_accepted(path)) {
        LOG_CPP_WARNING(logger_, "[WebSocket:%s] Rejecting request for path '%s'.",
                        connection->remote_address.c_str(), path.c_str());
        connection->ws->close();
        return;
    }

    AcceptCallback on_accept;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        on_accept = on_accept_;
    }
    if (!on_accept) {
        connection->ws->close();
        return;
    }

    auto transport = std::make_shared<WebSocketTransport>(connection->ws, connection->remote_address, logger_);
    std::shared_ptr<ISessionHandler> handler;
    try {
        handler = on_accept(transport);
    } catch (const std::exception& e) {
        LOG_CPP_ERROR(logger_, "[WebSocket:%s] Failed to create session: %s",
                      connection->remote_address.c_str(), e.what());
    }
    if (!handler) {
        LOG_CPP_WARNING(logger_, "[WebSocket:%s] Connection refused.", connection->remote_address.c_str());
        connection->ws->close();
        return;
    }

    {
        std::lock_guard<std::mutex> lock(connection->mutex);
        connection->handler = handler;
    }
    LOG_CPP_INFO(logger_, "[WebSocket:%s] Controller connected on '%s'.",
                 connection->remote_address.c_str(), path.c_str());
    handler->on_open();
}

void WebSocketSessionServer::forget(rtc::WebSocket* ws) {
    std::lock_guard<std::mutex> lock(mutex_);
    connections_.erase(ws);
}

} // namespace audio
} // namespace sendspin
