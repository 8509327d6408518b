/**
 * @file dns_message.h
 * @brief Minimal DNS wire codec for the multicast DNS responder.
 * @details Names are handled as label lists so that service instance labels
 *          may contain dots and spaces. Encoding never compresses names;
 *          decoding follows compression pointers.
 */
#ifndef SENDSPIN_DNS_MESSAGE_H
#define SENDSPIN_DNS_MESSAGE_H

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace sendspin {
namespace audio {
namespace dns {

using Name = std::vector<std::string>;

namespace record_type {
inline constexpr uint16_t kA = 1;
inline constexpr uint16_t kPtr = 12;
inline constexpr uint16_t kTxt = 16;
inline constexpr uint16_t kSrv = 33;
inline constexpr uint16_t kAny = 255;
} // namespace record_type

inline constexpr uint16_t kClassIn = 1;
inline constexpr uint16_t kFlagResponse = 0x8000;
inline constexpr uint16_t kFlagAuthoritative = 0x0400;
inline constexpr size_t kMaxLabelLength = 63;

struct Question {
    Name name;
    uint16_t type = 0;
    uint16_t qclass = kClassIn;
    bool unicast_response = false;
};

struct ResourceRecord {
    Name name;
    uint16_t type = 0;
    uint16_t rclass = kClassIn;
    bool cache_flush = false;
    uint32_t ttl = 0;
    std::vector<uint8_t> rdata;
};

struct Message {
    uint16_t id = 0;
    uint16_t flags = 0;
    std::vector<Question> questions;
    std::vector<ResourceRecord> answers;
    std::vector<ResourceRecord> additionals;

    bool is_response() const { return (flags & kFlagResponse) != 0; }
};

/** @brief Splits "a.b.c" into labels. Empty labels are skipped. */
Name name_from_string(const std::string& dotted);
std::string name_to_string(const Name& name);

/** @brief Case-insensitive comparison of two names. */
bool names_equal(const Name& a, const Name& b);

/** @brief Truncates a label to the 63-byte DNS limit without splitting a UTF-8 sequence. */
std::string truncate_label(const std::string& label);

void encode_name(const Name& name, std::vector<uint8_t>& out);
std::vector<uint8_t> encode_message(const Message& message);

/**
 * @brief Decodes a message's header, questions and answer records.
 * @return nullopt when the packet is truncated or malformed.
 */
std::optional<Message> decode_message(const uint8_t* data, size_t size);

ResourceRecord make_ptr_record(const Name& name, const Name& target, uint32_t ttl);
ResourceRecord make_srv_record(const Name& name, uint16_t priority, uint16_t weight, uint16_t port,
                               const Name& target, uint32_t ttl);
ResourceRecord make_txt_record(const Name& name, const std::vector<std::string>& entries, uint32_t ttl);

/** @param ipv4_network_order Address as stored in `in_addr::s_addr`. */
ResourceRecord make_a_record(const Name& name, uint32_t ipv4_network_order, uint32_t ttl);

/** @brief Decodes the target name of a PTR record. */
std::optional<Name> decode_ptr_target(const ResourceRecord& record);

} // namespace dns
} // namespace audio
} // namespace sendspin

#endif // SENDSPIN_DNS_MESSAGE_H
