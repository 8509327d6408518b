/**
 * @file client_identity.h
 * @brief Persistent client id announced in client/hello.
 */
#ifndef SENDSPIN_CLIENT_IDENTITY_H
#define SENDSPIN_CLIENT_IDENTITY_H

#include "../utils/cpp_logger.h"

#include <string>
#include <utility>

namespace sendspin {
namespace audio {

/**
 * @class ClientIdentity
 * @brief A random UUID created once per state directory and reused afterwards.
 * @details The id is stored as text in `<state_dir>/client_id`. A missing,
 *          unreadable or malformed file is replaced by a fresh id. If the file
 *          cannot be written the id still holds for the lifetime of the process.
 */
class ClientIdentity {
public:
    static constexpr const char* kFileName = "client_id";

    /** @brief Loads the id stored under `state_dir`, creating it if needed. */
    static ClientIdentity load_or_create(const std::string& state_dir, const logging::LoggerPtr& logger);

    const std::string& id() const { return id_; }
    const std::string& path() const { return path_; }
    bool persisted() const { return persisted_; }

private:
    ClientIdentity(std::string id, std::string path, bool persisted)
        : id_(std::move(id)), path_(std::move(path)), persisted_(persisted) {}

    std::string id_;
    std::string path_;
    bool persisted_ = false;
};

} // namespace audio
} // namespace sendspin

#endif // SENDSPIN_CLIENT_IDENTITY_H
