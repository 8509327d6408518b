/**
 * @file websocket_session_server.h
 * @brief libdatachannel WebSocket server feeding controller connections to the service.
 */
#ifndef SENDSPIN_WEBSOCKET_SESSION_SERVER_H
#define SENDSPIN_WEBSOCKET_SESSION_SERVER_H

#include "session_transport.h"
#include "../utils/cpp_logger.h"

#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace rtc {
class WebSocket;
class WebSocketServer;
} // namespace rtc

namespace sendspin {
namespace audio {

/**
 * @class WebSocketSessionServer
 * @brief Accepts WebSocket connections on the configured port.
 * @details Connections whose request path is neither the configured service
 *          path nor "/" are closed right after the upgrade. Text and binary
 *          messages of admitted connections are forwarded to the handler
 *          returned by the accept callback, on libdatachannel's thread.
 */
class WebSocketSessionServer : public ISessionListener {
public:
    explicit WebSocketSessionServer(logging::LoggerPtr logger);
    ~WebSocketSessionServer() override;

    bool start(const ServiceSettings& settings, AcceptCallback on_accept) override;
    void stop() override;

private:
    struct Connection;

    void handle_client(std::shared_ptr<rtc::WebSocket> ws);
    void admit(const std::shared_ptr<Connection>& connection);
    void forget(rtc::WebSocket* ws);
    bool path_accepted(const std::string& request_path) const;

    logging::LoggerPtr logger_;

    std::mutex mutex_;
    std::unique_ptr<rtc::WebSocketServer> server_;
    AcceptCallback on_accept_;
    std::string service_path_;
    std::map<rtc::WebSocket*, std::shared_ptr<Connection>> connections_;
};

} // namespace audio
} // namespace sendspin

#endif // SENDSPIN_WEBSOCKET_SESSION_SERVER_H
