#ifndef SENDSPIN_SESSION_TRANSPORT_H
#define SENDSPIN_SESSION_TRANSPORT_H

#include "../configuration/sendspin_settings.h"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace sendspin {
namespace audio {

/**
 * @class ISessionTransport
 * @brief Outbound half of one controller connection.
 */
class ISessionTransport {
public:
    virtual ~ISessionTransport() = default;

    /** @return false if the frame could not be queued for sending. */
    virtual bool send_text(const std::string& message) = 0;

    /** @brief Closes the connection. Safe to call repeatedly. */
    virtual void close() = 0;

    virtual std::string remote_address() const = 0;
};

/**
 * @class ISessionHandler
 * @brief Inbound half of one controller connection, fed by the transport.
 */
class ISessionHandler {
public:
    virtual ~ISessionHandler() = default;

    virtual void on_open() = 0;
    virtual void on_text(const std::string& message) = 0;
    virtual void on_binary(const uint8_t* data, size_t size) = 0;
    virtual void on_transport_error(const std::string& error) = 0;
    virtual void on_closed() = 0;
};

/**
 * @class ISessionListener
 * @brief Accepts inbound controller connections.
 * @details For every admitted connection the listener calls `AcceptCallback`
 *          with its transport and then routes the connection's events to the
 *          returned handler. A null handler means the connection is refused.
 */
class ISessionListener {
public:
    using AcceptCallback =
        std::function<std::shared_ptr<ISessionHandler>(std::shared_ptr<ISessionTransport>)>;

    virtual ~ISessionListener() = default;

    /** @return false if the listening socket could not be opened. */
    virtual bool start(const ServiceSettings& settings, AcceptCallback on_accept) = 0;
    virtual void stop() = 0;
};

} // namespace audio
} // namespace sendspin

#endif // SENDSPIN_SESSION_TRANSPORT_H
