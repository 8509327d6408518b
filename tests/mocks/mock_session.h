#pragma once
/**
 * Mock session transport and listener for driving the protocol state machine
 * and the service without a network.
 */

#include "session/session_transport.h"

#include <json/json.h>

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace sendspin {
namespace audio {
namespace testing {

/**
 * Captures every outbound text frame.
 */
class MockTransport : public ISessionTransport {
public:
    explicit MockTransport(std::string remote = "10.0.0.2:50000") : remote_(std::move(remote)) {}

    bool send_text(const std::string& message) override {
        std::function<void(const std::string&)> hook;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (fail_send_) {
                return false;
            }
            sent_.push_back(message);
            hook = send_hook_;
        }
        if (hook) {
            hook(message);
        }
        return true;
    }

    void close() override { ++close_calls_; }

    std::string remote_address() const override { return remote_; }

    // Test inspection methods
    std::vector<std::string> sent() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return sent_;
    }

    /** Payloads of every sent message with the given type, in send order. */
    std::vector<Json::Value> sent_of_type(const std::string& type) const {
        std::vector<Json::Value> matches;
        for (const auto& text : sent()) {
            Json::Value root = parse(text);
            if (root["type"].asString() == type) {
                matches.push_back(root["payload"]);
            }
        }
        return matches;
    }

    size_t count_of_type(const std::string& type) const { return sent_of_type(type).size(); }

    void clear_sent() {
        std::lock_guard<std::mutex> lock(mutex_);
        sent_.clear();
    }

    void set_fail_send(bool fail) {
        std::lock_guard<std::mutex> lock(mutex_);
        fail_send_ = fail;
    }

    /** Runs after every successful send, outside the mock's lock. */
    void set_send_hook(std::function<void(const std::string&)> hook) {
        std::lock_guard<std::mutex> lock(mutex_);
        send_hook_ = std::move(hook);
    }

    int close_calls() const { return close_calls_.load(); }

    static Json::Value parse(const std::string& text) {
        Json::CharReaderBuilder builder;
        std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
        Json::Value root;
        std::string errors;
        reader->parse(text.data(), text.data() + text.size(), &root, &errors);
        return root;
    }

private:
    std::string remote_;
    mutable std::mutex mutex_;
    std::vector<std::string> sent_;
    bool fail_send_ = false;
    std::function<void(const std::string&)> send_hook_;
    std::atomic<int> close_calls_{0};
};

/**
 * Listener that hands connections to the service only when the test calls `connect()`.
 */
class MockListener : public ISessionListener {
public:
    bool start(const ServiceSettings& settings, AcceptCallback on_accept) override {
        std::lock_guard<std::mutex> lock(mutex_);
        start_calls_++;
        port_ = settings.port;
        if (fail_start_) {
            return false;
        }
        on_accept_ = std::move(on_accept);
        return true;
    }

    void stop() override {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_calls_++;
        on_accept_ = nullptr;
    }

    /** Simulates an inbound connection; returns the handler (null if refused). */
    std::shared_ptr<ISessionHandler> connect(const std::shared_ptr<ISessionTransport>& transport) {
        AcceptCallback callback;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            callback = on_accept_;
        }
        return callback ? callback(transport) : nullptr;
    }

    void set_fail_start(bool fail) {
        std::lock_guard<std::mutex> lock(mutex_);
        fail_start_ = fail;
    }

    int start_calls() const { return start_calls_; }
    int stop_calls() const { return stop_calls_; }
    uint16_t port() const { return port_; }

private:
    std::mutex mutex_;
    AcceptCallback on_accept_;
    bool fail_start_ = false;
    int start_calls_ = 0;
    int stop_calls_ = 0;
    uint16_t port_ = 0;
};

} // namespace testing
} // namespace audio
} // namespace sendspin
