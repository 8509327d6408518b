#include "dns_message.h"

#include <algorithm>
#include <cctype>

namespace sendspin {
namespace audio {
namespace dns {

namespace {

constexpr size_t kHeaderSize = 12;
constexpr int kMaxPointerHops = 16;

void put_u16(std::vector<uint8_t>& out, uint16_t value) {
    out.push_back(static_cast<uint8_t>(value >> 8));
    out.push_back(static_cast<uint8_t>(value & 0xFF));
}

void put_u32(std::vector<uint8_t>& out, uint32_t value) {
    out.push_back(static_cast<uint8_t>(value >> 24));
    out.push_back(static_cast<uint8_t>((value >> 16) & 0xFF));
    out.push_back(static_cast<uint8_t>((value >> 8) & 0xFF));
    out.push_back(static_cast<uint8_t>(value & 0xFF));
}

class Reader {
public:
    Reader(const uint8_t* data, size_t size) : data_(data), size_(size) {}

    bool read_u16(uint16_t& value) {
        if (offset_ + 2 > size_) {
            return false;
        }
        value = static_cast<uint16_t>((data_[offset_] << 8) | data_[offset_ + 1]);
        offset_ += 2;
        return true;
    }

    bool read_u32(uint32_t& value) {
        uint16_t high = 0;
        uint16_t low = 0;
        if (!read_u16(high) || !read_u16(low)) {
            return false;
        }
        value = (static_cast<uint32_t>(high) << 16) | low;
        return true;
    }

    bool read_name(Name& name) {
        return read_name_at(offset_, name, &offset_);
    }

    bool read_name_at(size_t position, Name& name, size_t* end_offset) const {
        name.clear();
        bool jumped = false;
        int hops = 0;
        while (true) {
            if (position >= size_) {
                return false;
            }
            const uint8_t length = data_[position];
            if ((length & 0xC0) == 0xC0) {
                if (position + 1 >= size_ || ++hops > kMaxPointerHops) {
                    return false;
                }
                const size_t target = static_cast<size_t>(((length & 0x3F) << 8) | data_[position + 1]);
                if (!jumped && end_offset) {
                    *end_offset = position + 2;
                }
                jumped = true;
                position = target;
                continue;
            }
            if ((length & 0xC0) != 0) {
                return false;
            }
            if (length == 0) {
                if (!jumped && end_offset) {
                    *end_offset = position + 1;
                }
                return true;
            }
            if (position + 1 + length > size_) {
                return false;
            }
            name.emplace_back(reinterpret_cast<const char*>(data_ + position + 1), length);
            position += 1 + length;
        }
    }

    bool read_bytes(size_t count, std::vector<uint8_t>& out) {
        if (offset_ + count > size_) {
            return false;
        }
        out.assign(data_ + offset_, data_ + offset_ + count);
        offset_ += count;
        return true;
    }

    size_t offset() const { return offset_; }
    void seek(size_t offset) { offset_ = offset; }

private:
    const uint8_t* data_;
    size_t size_;
    size_t offset_ = 0;
};

bool read_record(Reader& reader, ResourceRecord& record) {
    uint16_t rclass = 0;
    uint16_t rdlength = 0;
    if (!reader.read_name(record.name) || !reader.read_u16(record.type) || !reader.read_u16(rclass) ||
        !reader.read_u32(record.ttl) || !reader.read_u16(rdlength)) {
        return false;
    }
    record.cache_flush = (rclass & 0x8000) != 0;
    record.rclass = static_cast<uint16_t>(rclass & 0x7FFF);

    const size_t rdata_offset = reader.offset();
    if (!reader.read_bytes(rdlength, record.rdata)) {
        return false;
    }
    if (record.type == record_type::kPtr) {
        // Expand compressed targets so rdata stands on its own.
        Name target;
        if (!reader.read_name_at(rdata_offset, target, nullptr)) {
            return false;
        }
        record.rdata.clear();
        encode_name(target, record.rdata);
    }
    return true;
}

void write_record(const ResourceRecord& record, std::vector<uint8_t>& out) {
    encode_name(record.name, out);
    put_u16(out, record.type);
    put_u16(out, static_cast<uint16_t>(record.rclass | (record.cache_flush ? 0x8000 : 0)));
    put_u32(out, record.ttl);
    put_u16(out, static_cast<uint16_t>(record.rdata.size()));
    out.insert(out.end(), record.rdata.begin(), record.rdata.end());
}

} // namespace

Name name_from_string(const std::string& dotted) {
    Name name;
    std::string label;
    for (char c : dotted) {
        if (c == '.') {
            if (!label.empty()) {
                name.push_back(label);
            }
            label.clear();
        } else {
            label.push_back(c);
        }
    }
    if (!label.empty()) {
        name.push_back(label);
    }
    return name;
}

std::string name_to_string(const Name& name) {
    std::string result;
    for (size_t i = 0; i < name.size(); ++i) {
        if (i > 0) {
            result.push_back('.');
        }
        result += name[i];
    }
    return result;
}

bool names_equal(const Name& a, const Name& b) {
    if (a.size() != b.size()) {
        return false;
    }
    for (size_t i = 0; i < a.size(); ++i) {
        if (a[i].size() != b[i].size()) {
            return false;
        }
        for (size_t j = 0; j < a[i].size(); ++j) {
            if (std::tolower(static_cast<unsigned char>(a[i][j])) !=
                std::tolower(static_cast<unsigned char>(b[i][j]))) {
                return false;
            }
        }
    }
    return true;
}

std::string truncate_label(const std::string& label) {
    if (label.size() <= kMaxLabelLength) {
        return label;
    }
    size_t cut = kMaxLabelLength;
    while (cut > 0 && (static_cast<unsigned char>(label[cut]) & 0xC0) == 0x80) {
        --cut;
    }
    return label.substr(0, cut);
}

void encode_name(const Name& name, std::vector<uint8_t>& out) {
    for (const auto& raw_label : name) {
        const std::string label = truncate_label(raw_label);
        if (label.empty()) {
            continue;
        }
        out.push_back(static_cast<uint8_t>(label.size()));
        out.insert(out.end(), label.begin(), label.end());
    }
    out.push_back(0);
}

std::vector<uint8_t> encode_message(const Message& message) {
    std::vector<uint8_t> out;
    out.reserve(512);
    put_u16(out, message.id);
    put_u16(out, message.flags);
    put_u16(out, static_cast<uint16_t>(message.questions.size()));
    put_u16(out, static_cast<uint16_t>(message.answers.size()));
    put_u16(out, 0);
    put_u16(out, static_cast<uint16_t>(message.additionals.size()));

    for (const auto& question : message.questions) {
        encode_name(question.name, out);
        put_u16(out, question.type);
        put_u16(out, static_cast<uint16_t>(question.qclass | (question.unicast_response ? 0x8000 : 0)));
    }
    for (const auto& record : message.answers) {
        write_record(record, out);
    }
    for (const auto& record : message.additionals) {
        write_record(record, out);
    }
    return out;
}

std::optional<Message> decode_message(const uint8_t* data, size_t size) {
    if (!data || size < kHeaderSize) {
        return std::nullopt;
    }
    Reader reader(data, size);
    Message message;
    uint16_t qdcount = 0;
    uint16_t ancount = 0;
    uint16_t nscount = 0;
    uint16_t arcount = 0;
    if (!reader.read_u16(message.id) || !reader.read_u16(message.flags) || !reader.read_u16(qdcount) ||
        !reader.read_u16(ancount) || !reader.read_u16(nscount) || !reader.read_u16(arcount)) {
        return std::nullopt;
    }

    for (uint16_t i = 0; i < qdcount; ++i) {
        Question question;
        uint16_t qclass = 0;
        if (!reader.read_name(question.name) || !reader.read_u16(question.type) || !reader.read_u16(qclass)) {
            return std::nullopt;
        }
        question.unicast_response = (qclass & 0x8000) != 0;
        question.qclass = static_cast<uint16_t>(qclass & 0x7FFF);
        message.questions.push_back(std::move(question));
    }
    for (uint16_t i = 0; i < ancount; ++i) {
        ResourceRecord record;
        if (!read_record(reader, record)) {
            return std::nullopt;
        }
        message.answers.push_back(std::move(record));
    }
    return message;
}

ResourceRecord make_ptr_record(const Name& name, const Name& target, uint32_t ttl) {
    ResourceRecord record;
    record.name = name;
    record.type = record_type::kPtr;
    record.ttl = ttl;
    encode_name(target, record.rdata);
    return record;
}

ResourceRecord make_srv_record(const Name& name, uint16_t priority, uint16_t weight, uint16_t port,
                               const Name& target, uint32_t ttl) {
    ResourceRecord record;
    record.name = name;
    record.type = record_type::kSrv;
    record.cache_flush = true;
    record.ttl = ttl;
    put_u16(record.rdata, priority);
    put_u16(record.rdata, weight);
    put_u16(record.rdata, port);
    encode_name(target, record.rdata);
    return record;
}

ResourceRecord make_txt_record(const Name& name, const std::vector<std::string>& entries, uint32_t ttl) {
    ResourceRecord record;
    record.name = name;
    record.type = record_type::kTxt;
    record.cache_flush = true;
    record.ttl = ttl;
    for (const auto& entry : entries) {
        const size_t length = std::min<size_t>(entry.size(), 255);
        record.rdata.push_back(static_cast<uint8_t>(length));
        record.rdata.insert(record.rdata.end(), entry.begin(), entry.begin() + static_cast<std::ptrdiff_t>(length));
    }
    if (record.rdata.empty()) {
        record.rdata.push_back(0);
    }
    return record;
}

ResourceRecord make_a_record(const Name& name, uint32_t ipv4_network_order, uint32_t ttl) {
    ResourceRecord record;
    record.name = name;
    record.type = record_type::kA;
    record.cache_flush = true;
    record.ttl = ttl;
    const auto* bytes = reinterpret_cast<const uint8_t*>(&ipv4_network_order);
    record.rdata.assign(bytes, bytes + 4);
    return record;
}

std::optional<Name> decode_ptr_target(const ResourceRecord& record) {
    if (record.type != record_type::kPtr || record.rdata.empty()) {
        return std::nullopt;
    }
    Reader reader(record.rdata.data(), record.rdata.size());
    Name target;
    if (!reader.read_name(target)) {
        return std::nullopt;
    }
    return target;
}

} // namespace dns
} // namespace audio
} // namespace sendspin
