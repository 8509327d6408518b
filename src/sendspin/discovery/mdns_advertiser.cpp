#include "mdns_advertiser.h"

#include <algorithm>
#include <cerrno>
#include <cstring>

#include <arpa/inet.h>
#include <ifaddrs.h>
#include <net/if.h>
#include <sys/epoll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace sendspin {
namespace audio {

namespace {

constexpr int kEpollTimeoutMs = 250;
constexpr int kAnnouncementCount = 2;
constexpr auto kAnnouncementInterval = std::chrono::seconds(1);
constexpr uint32_t kLegacyUnicastTtl = 10;

dns::Name service_name(const MdnsServiceInfo& info) {
    return dns::name_from_string(info.service_type);
}

dns::Name instance_name(const MdnsServiceInfo& info) {
    dns::Name name{dns::truncate_label(info.instance_name)};
    const dns::Name service = service_name(info);
    name.insert(name.end(), service.begin(), service.end());
    return name;
}

dns::Name host_name(const MdnsServiceInfo& info) {
    std::string host = info.hostname;
    if (host.empty()) {
        char buffer[256] = {0};
        if (gethostname(buffer, sizeof(buffer) - 1) == 0 && buffer[0] != '\0') {
            host = buffer;
        } else {
            host = "sendspin-player";
        }
    }
    dns::Name name = dns::name_from_string(host);
    if (name.empty() || !dns::names_equal({name.back()}, {"local"})) {
        name.push_back("local");
    }
    return name;
}

bool same_record(const dns::ResourceRecord& a, const dns::ResourceRecord& b) {
    return a.type == b.type && dns::names_equal(a.name, b.name) && a.rdata == b.rdata;
}

void add_unique(std::vector<dns::ResourceRecord>& out, const dns::ResourceRecord& record) {
    if (std::none_of(out.begin(), out.end(), [&](const dns::ResourceRecord& r) { return same_record(r, record); })) {
        out.push_back(record);
    }
}

} // namespace

std::vector<dns::ResourceRecord> make_service_records(const MdnsServiceInfo& info,
                                                      const std::vector<uint32_t>& ipv4_addresses,
                                                      std::optional<uint32_t> ttl_override) {
    const uint32_t service_ttl = ttl_override.value_or(kServiceRecordTtl);
    const uint32_t host_ttl = ttl_override.value_or(kHostRecordTtl);
    const dns::Name service = service_name(info);
    const dns::Name instance = instance_name(info);
    const dns::Name host = host_name(info);

    std::vector<dns::ResourceRecord> records;
    records.push_back(dns::make_ptr_record(service, instance, service_ttl));
    records.push_back(dns::make_srv_record(instance, 0, 0, info.port, host, host_ttl));
    records.push_back(dns::make_txt_record(instance, info.txt, service_ttl));
    for (uint32_t address : ipv4_addresses) {
        records.push_back(dns::make_a_record(host, address, host_ttl));
    }
    return records;
}

std::optional<dns::Message> answer_query(const dns::Message& query,
                                         const MdnsServiceInfo& info,
                                         const std::vector<dns::ResourceRecord>& records) {
    if (query.is_response()) {
        return std::nullopt;
    }

    const dns::Name enumeration = dns::name_from_string(kServiceEnumerationName);
    const dns::Name service = service_name(info);

    dns::Message response;
    response.flags = dns::kFlagResponse | dns::kFlagAuthoritative;

    for (const auto& question : query.questions) {
        const bool any = question.type == dns::record_type::kAny;
        if (dns::names_equal(question.name, enumeration) && (any || question.type == dns::record_type::kPtr)) {
            add_unique(response.answers, dns::make_ptr_record(enumeration, service, kServiceRecordTtl));
        }
        for (const auto& record : records) {
            if (dns::names_equal(record.name, question.name) && (any || record.type == question.type)) {
                add_unique(response.answers, record);
            }
        }
    }
    if (response.answers.empty()) {
        return std::nullopt;
    }

    const bool answered_ptr = std::any_of(response.answers.begin(), response.answers.end(),
        [&](const dns::ResourceRecord& r) {
            return r.type == dns::record_type::kPtr && dns::names_equal(r.name, service);
        });
    const bool answered_srv = std::any_of(response.answers.begin(), response.answers.end(),
        [](const dns::ResourceRecord& r) { return r.type == dns::record_type::kSrv; });

    for (const auto& record : records) {
        const bool wanted = (answered_ptr && record.type != dns::record_type::kPtr) ||
                            (answered_srv && record.type == dns::record_type::kA);
        if (!wanted) {
            continue;
        }
        if (std::none_of(response.answers.begin(), response.answers.end(),
                         [&](const dns::ResourceRecord& r) { return same_record(r, record); })) {
            add_unique(response.additionals, record);
        }
    }
    return response;
}

MdnsAdvertiser::MdnsAdvertiser(MdnsServiceInfo info, logging::LoggerPtr logger)
    : logger_(std::move(logger)), info_(std::move(info)) {}

MdnsAdvertiser::~MdnsAdvertiser() {
    stop();
}

std::vector<uint32_t> MdnsAdvertiser::local_ipv4_addresses() {
    std::vector<uint32_t> addresses;
    struct ifaddrs* interfaces = nullptr;
    if (getifaddrs(&interfaces) != 0) {
        return addresses;
    }
    for (struct ifaddrs* it = interfaces; it != nullptr; it = it->ifa_next) {
        if (!it->ifa_addr || it->ifa_addr->sa_family != AF_INET) {
            continue;
        }
        if ((it->ifa_flags & IFF_UP) == 0 || (it->ifa_flags & IFF_LOOPBACK) != 0) {
            continue;
        }
        const auto* addr = reinterpret_cast<const struct sockaddr_in*>(it->ifa_addr);
        if (std::find(addresses.begin(), addresses.end(), addr->sin_addr.s_addr) == addresses.end()) {
            addresses.push_back(addr->sin_addr.s_addr);
        }
    }
    freeifaddrs(interfaces);
    return addresses;
}

MdnsServiceInfo MdnsAdvertiser::info() const {
    std::lock_guard<std::mutex> lock(info_mutex_);
    return info_;
}

void MdnsAdvertiser::start() {
    if (component_thread_.joinable()) {
        return;
    }
    if (!setup_socket()) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(info_mutex_);
        announcements_remaining_ = kAnnouncementCount;
        next_announcement_ = std::chrono::steady_clock::now();
        LOG_CPP_INFO(logger_, "%s Advertising '%s' (%s) on port %u.", logger_prefix_.c_str(),
                     info_.instance_name.c_str(), info_.service_type.c_str(), info_.port);
    }
    stop_flag_ = false;
    component_thread_ = std::thread(&MdnsAdvertiser::run, this);
}

void MdnsAdvertiser::stop() {
    if (!component_thread_.joinable()) {
        close_socket();
        return;
    }
    announce(0u);
    stop_flag_ = true;
    component_thread_.join();
    close_socket();
    LOG_CPP_INFO(logger_, "%s Advertisement withdrawn.", logger_prefix_.c_str());
}

void MdnsAdvertiser::set_instance_name(const std::string& instance_name) {
    MdnsServiceInfo previous;
    {
        std::lock_guard<std::mutex> lock(info_mutex_);
        if (info_.instance_name == instance_name) {
            return;
        }
        previous = info_;
        info_.instance_name = instance_name;
        announcements_remaining_ = kAnnouncementCount;
        next_announcement_ = std::chrono::steady_clock::now();
    }
    LOG_CPP_INFO(logger_, "%s Renaming '%s' -> '%s'.", logger_prefix_.c_str(),
                 previous.instance_name.c_str(), instance_name.c_str());

    if (socket_fd_ >= 0) {
        dns::Message goodbye;
        goodbye.flags = dns::kFlagResponse | dns::kFlagAuthoritative;
        goodbye.answers = make_service_records(previous, local_ipv4_addresses(), 0u);
        send_message(goodbye, multicast_destination());
    }
}

bool MdnsAdvertiser::setup_socket() {
    epoll_fd_ = epoll_create1(0);
    if (epoll_fd_ == -1) {
        LOG_CPP_ERROR(logger_, "%s Failed to create epoll instance", logger_prefix_.c_str());
        return false;
    }

    socket_fd_ = socket(AF_INET, SOCK_DGRAM, 0);
    if (socket_fd_ < 0) {
        LOG_CPP_ERROR(logger_, "%s Failed to create socket: %s", logger_prefix_.c_str(), strerror(errno));
        close_socket();
        return false;
    }

    int reuse = 1;
    if (setsockopt(socket_fd_, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse)) < 0) {
        LOG_CPP_WARNING(logger_, "%s Failed to set SO_REUSEADDR", logger_prefix_.c_str());
    }
#ifdef SO_REUSEPORT
    if (setsockopt(socket_fd_, SOL_SOCKET, SO_REUSEPORT, &reuse, sizeof(reuse)) < 0) {
        LOG_CPP_WARNING(logger_, "%s Failed to set SO_REUSEPORT", logger_prefix_.c_str());
    }
#endif

    struct sockaddr_in addr;
    memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_ANY);
    addr.sin_port = htons(kMdnsPort);
    if (bind(socket_fd_, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
        LOG_CPP_ERROR(logger_, "%s Failed to bind to port %d: %s", logger_prefix_.c_str(), kMdnsPort, strerror(errno));
        close_socket();
        return false;
    }

    struct ip_mreq mreq;
    memset(&mreq, 0, sizeof(mreq));
    inet_pton(AF_INET, kMdnsGroup, &mreq.imr_multiaddr);
    mreq.imr_interface.s_addr = htonl(INADDR_ANY);
    if (setsockopt(socket_fd_, IPPROTO_IP, IP_ADD_MEMBERSHIP, &mreq, sizeof(mreq)) < 0) {
        LOG_CPP_ERROR(logger_, "%s Failed to join multicast group %s: %s", logger_prefix_.c_str(), kMdnsGroup,
                      strerror(errno));
        close_socket();
        return false;
    }

    unsigned char ttl = 255;
    if (setsockopt(socket_fd_, IPPROTO_IP, IP_MULTICAST_TTL, &ttl, sizeof(ttl)) < 0) {
        LOG_CPP_WARNING(logger_, "%s Failed to set IP_MULTICAST_TTL", logger_prefix_.c_str());
    }
    unsigned char loop = 1;
    if (setsockopt(socket_fd_, IPPROTO_IP, IP_MULTICAST_LOOP, &loop, sizeof(loop)) < 0) {
        LOG_CPP_WARNING(logger_, "%s Failed to set IP_MULTICAST_LOOP", logger_prefix_.c_str());
    }

    struct epoll_event event;
    memset(&event, 0, sizeof(event));
    event.events = EPOLLIN;
    event.data.fd = socket_fd_;
    if (epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, socket_fd_, &event) == -1) {
        LOG_CPP_ERROR(logger_, "%s Failed to add socket to epoll", logger_prefix_.c_str());
        close_socket();
        return false;
    }
    LOG_CPP_INFO(logger_, "%s Listening on %s:%d", logger_prefix_.c_str(), kMdnsGroup, kMdnsPort);
    return true;
}

void MdnsAdvertiser::close_socket() {
    if (epoll_fd_ != -1) {
        close(epoll_fd_);
        epoll_fd_ = -1;
    }
    if (socket_fd_ != -1) {
        close(socket_fd_);
        socket_fd_ = -1;
    }
}

struct sockaddr_in MdnsAdvertiser::multicast_destination() const {
    struct sockaddr_in destination;
    memset(&destination, 0, sizeof(destination));
    destination.sin_family = AF_INET;
    destination.sin_port = htons(kMdnsPort);
    inet_pton(AF_INET, kMdnsGroup, &destination.sin_addr);
    return destination;
}

bool MdnsAdvertiser::send_message(const dns::Message& message, const struct sockaddr_in& destination) {
    if (socket_fd_ < 0) {
        return false;
    }
    const std::vector<uint8_t> packet = dns::encode_message(message);
    const ssize_t sent = sendto(socket_fd_, packet.data(), packet.size(), 0,
                                reinterpret_cast<const struct sockaddr*>(&destination), sizeof(destination));
    if (sent < 0) {
        LOG_CPP_WARNING(logger_, "%s sendto failed: %s", logger_prefix_.c_str(), strerror(errno));
        return false;
    }
    return true;
}

void MdnsAdvertiser::announce(std::optional<uint32_t> ttl_override) {
    dns::Message announcement;
    announcement.flags = dns::kFlagResponse | dns::kFlagAuthoritative;
    announcement.answers = make_service_records(info(), local_ipv4_addresses(), ttl_override);
    if (send_message(announcement, multicast_destination())) {
        LOG_CPP_DEBUG(logger_, "%s Sent %s with %zu records.", logger_prefix_.c_str(),
                      (ttl_override && *ttl_override == 0) ? "goodbye" : "announcement",
                      announcement.answers.size());
    }
}

void MdnsAdvertiser::handle_packet(const uint8_t* data, size_t size, const struct sockaddr_in& source) {
    auto query = dns::decode_message(data, size);
    if (!query || query->is_response() || query->questions.empty()) {
        return;
    }

    const MdnsServiceInfo current = info();
    const bool legacy_unicast = ntohs(source.sin_port) != kMdnsPort;
    auto records = make_service_records(current, local_ipv4_addresses(),
                                        legacy_unicast ? std::optional<uint32_t>(kLegacyUnicastTtl) : std::nullopt);
    auto response = answer_query(*query, current, records);
    if (!response) {
        return;
    }

    char source_ip[INET_ADDRSTRLEN] = {0};
    inet_ntop(AF_INET, &source.sin_addr, source_ip, sizeof(source_ip));

    if (legacy_unicast) {
        response->id = query->id;
        response->questions = query->questions;
        LOG_CPP_DEBUG(logger_, "%s Legacy unicast answer to %s:%u", logger_prefix_.c_str(), source_ip,
                      ntohs(source.sin_port));
        send_message(*response, source);
        return;
    }

    const bool unicast_requested = std::all_of(query->questions.begin(), query->questions.end(),
        [](const dns::Question& q) { return q.unicast_response; });
    LOG_CPP_DEBUG(logger_, "%s Answering query from %s with %zu records.", logger_prefix_.c_str(), source_ip,
                  response->answers.size());
    send_message(*response, unicast_requested ? source : multicast_destination());
}

void MdnsAdvertiser::run() {
    LOG_CPP_DEBUG(logger_, "%s Responder thread started.", logger_prefix_.c_str());
    uint8_t buffer[9000];
    const int kMaxEvents = 4;
    struct epoll_event events[kMaxEvents];

    while (!stop_flag_) {
        bool announce_now = false;
        {
            std::lock_guard<std::mutex> lock(info_mutex_);
            const auto now = std::chrono::steady_clock::now();
            if (announcements_remaining_ > 0 && now >= next_announcement_) {
                --announcements_remaining_;
                next_announcement_ = now + kAnnouncementInterval;
                announce_now = true;
            }
        }
        if (announce_now) {
            announce(std::nullopt);
        }

        int n_events = epoll_wait(epoll_fd_, events, kMaxEvents, kEpollTimeoutMs);
        if (stop_flag_) {
            break;
        }
        if (n_events < 0) {
            if (errno == EINTR) {
                continue;
            }
            LOG_CPP_ERROR(logger_, "%s epoll_wait() error: %s", logger_prefix_.c_str(), strerror(errno));
            continue;
        }

        for (int i = 0; i < n_events; ++i) {
            if (!(events[i].events & EPOLLIN)) {
                continue;
            }
            struct sockaddr_in source;
            socklen_t len = sizeof(source);
            ssize_t n_received = recvfrom(events[i].data.fd, buffer, sizeof(buffer), 0,
                                          reinterpret_cast<struct sockaddr*>(&source), &len);
            if (n_received > 0) {
                handle_packet(buffer, static_cast<size_t>(n_received), source);
            }
        }
    }
    LOG_CPP_DEBUG(logger_, "%s Responder thread finished.", logger_prefix_.c_str());
}

} // namespace audio
} // namespace sendspin
