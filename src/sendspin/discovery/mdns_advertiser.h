/**
 * @file mdns_advertiser.h
 * @brief Multicast DNS responder advertising the player as a DNS-SD service.
 */
#ifndef SENDSPIN_MDNS_ADVERTISER_H
#define SENDSPIN_MDNS_ADVERTISER_H

#include "dns_message.h"
#include "../utils/audio_component.h"
#include "../utils/cpp_logger.h"

#include <netinet/in.h>

#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace sendspin {
namespace audio {

inline constexpr const char* kSendspinServiceType = "_sendspin._tcp.local";
inline constexpr const char* kServiceEnumerationName = "_services._dns-sd._udp.local";
inline constexpr const char* kMdnsGroup = "224.0.0.251";
inline constexpr uint16_t kMdnsPort = 5353;
inline constexpr uint32_t kHostRecordTtl = 120;
inline constexpr uint32_t kServiceRecordTtl = 4500;

struct MdnsServiceInfo {
    std::string instance_name;
    std::string service_type = kSendspinServiceType;
    std::string hostname;
    uint16_t port = 0;
    std::vector<std::string> txt;
};

/**
 * @brief Builds the PTR, SRV, TXT and A records describing `info`.
 * @param ttl_override When set, used for every record (0 for goodbye packets).
 */
std::vector<dns::ResourceRecord> make_service_records(const MdnsServiceInfo& info,
                                                      const std::vector<uint32_t>& ipv4_addresses,
                                                      std::optional<uint32_t> ttl_override = std::nullopt);

/**
 * @brief Selects the records that answer `query`.
 * @return nullopt if the query is a response or asks for nothing we own.
 */
std::optional<dns::Message> answer_query(const dns::Message& query,
                                         const MdnsServiceInfo& info,
                                         const std::vector<dns::ResourceRecord>& records);

/**
 * @class MdnsAdvertiser
 * @brief Announces and answers for one `_sendspin._tcp` instance on 224.0.0.251:5353.
 * @details Announces twice on start and after a rename, answers matching
 *          queries while running, and sends TTL 0 goodbyes on stop. Name
 *          conflict probing is not performed.
 */
class MdnsAdvertiser : public AudioComponent {
public:
    MdnsAdvertiser(MdnsServiceInfo info, logging::LoggerPtr logger);
    ~MdnsAdvertiser() override;

    void start() override;
    void stop() override;

    /** @brief Withdraws the current instance name and announces `instance_name`. */
    void set_instance_name(const std::string& instance_name);

    MdnsServiceInfo info() const;

    /** @brief Non-loopback IPv4 addresses of this host, network byte order. */
    static std::vector<uint32_t> local_ipv4_addresses();

protected:
    void run() override;

private:
    bool setup_socket();
    void close_socket();
    void handle_packet(const uint8_t* data, size_t size, const struct sockaddr_in& source);
    void announce(std::optional<uint32_t> ttl_override);
    bool send_message(const dns::Message& message, const struct sockaddr_in& destination);
    struct sockaddr_in multicast_destination() const;

    logging::LoggerPtr logger_;
    std::string logger_prefix_ = "[mDNS]";

    mutable std::mutex info_mutex_;
    MdnsServiceInfo info_;

    int socket_fd_ = -1;
    int epoll_fd_ = -1;
    std::chrono::steady_clock::time_point next_announcement_{};
    int announcements_remaining_ = 0;
};

} // namespace audio
} // namespace sendspin

#endif // SENDSPIN_MDNS_ADVERTISER_H
