#include "client_identity.h"

#include <boost/uuid/string_generator.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <optional>
#include <stdexcept>

#include <sys/stat.h>
#include <sys/types.h>

namespace sendspin {
namespace audio {

namespace {

bool ensure_directory(const std::string& path, const logging::LoggerPtr& logger) {
    if (path.empty()) {
        return false;
    }
    struct stat st {};
    if (stat(path.c_str(), &st) == 0) {
        return S_ISDIR(st.st_mode);
    }
    const size_t slash = path.find_last_of('/');
    if (slash != std::string::npos && slash > 0 && !ensure_directory(path.substr(0, slash), logger)) {
        return false;
    }
    if (mkdir(path.c_str(), 0755) == 0 || errno == EEXIST) {
        return true;
    }
    LOG_CPP_WARNING(logger, "[ClientIdentity] Failed to create %s (%s)", path.c_str(), std::strerror(errno));
    return false;
}

std::string trim(const std::string& text) {
    const char* whitespace = " \t\r\n";
    const size_t first = text.find_first_not_of(whitespace);
    if (first == std::string::npos) {
        return {};
    }
    const size_t last = text.find_last_not_of(whitespace);
    return text.substr(first, last - first + 1);
}

std::optional<boost::uuids::uuid> read_stored_id(const std::string& path, const logging::LoggerPtr& logger) {
    std::ifstream in(path);
    if (!in.is_open()) {
        return std::nullopt;
    }
    std::string text;
    std::getline(in, text);
    text = trim(text);
    if (text.empty()) {
        return std::nullopt;
    }
    try {
        boost::uuids::string_generator gen;
        const boost::uuids::uuid id = gen(text);
        if (id.is_nil()) {
            return std::nullopt;
        }
        return id;
    } catch (const std::runtime_error&) {
        LOG_CPP_WARNING(logger, "[ClientIdentity] Ignoring malformed id in %s", path.c_str());
        return std::nullopt;
    }
}

bool write_id(const std::string& path, const std::string& id, const logging::LoggerPtr& logger) {
    const std::string temp_path = path + ".tmp";
    {
        std::ofstream out(temp_path, std::ios::out | std::ios::trunc);
        if (!out.is_open()) {
            LOG_CPP_WARNING(logger, "[ClientIdentity] Failed to open %s for writing", temp_path.c_str());
            return false;
        }
        out << id << "\n";
        if (!out.good()) {
            LOG_CPP_WARNING(logger, "[ClientIdentity] Failed to write %s", temp_path.c_str());
            std::remove(temp_path.c_str());
            return false;
        }
    }
    if (std::rename(temp_path.c_str(), path.c_str()) != 0) {
        LOG_CPP_WARNING(logger, "[ClientIdentity] Failed to rename %s -> %s (%s)",
                        temp_path.c_str(), path.c_str(), std::strerror(errno));
        std::remove(temp_path.c_str());
        return false;
    }
    return true;
}

} // namespace

ClientIdentity ClientIdentity::load_or_create(const std::string& state_dir, const logging::LoggerPtr& logger) {
    const std::string path = state_dir + "/" + kFileName;

    if (auto stored = read_stored_id(path, logger)) {
        const std::string id = boost::uuids::to_string(*stored);
        LOG_CPP_DEBUG(logger, "[ClientIdentity] Loaded client id %s from %s", id.c_str(), path.c_str());
        return ClientIdentity(id, path, true);
    }

    const std::string id = boost::uuids::to_string(boost::uuids::random_generator()());
    bool persisted = false;
    if (ensure_directory(state_dir, logger)) {
        persisted = write_id(path, id, logger);
    }
    if (persisted) {
        LOG_CPP_INFO(logger, "[ClientIdentity] Created client id %s at %s", id.c_str(), path.c_str());
    } else {
        LOG_CPP_WARNING(logger, "[ClientIdentity] Using unsaved client id %s", id.c_str());
    }
    return ClientIdentity(id, path, persisted);
}

} // namespace audio
} // namespace sendspin
