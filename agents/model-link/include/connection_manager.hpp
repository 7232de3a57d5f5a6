#pragma once
#include <chrono>
#include <functional>
#include <mutex>
#include <string>
#include "cancellation.hpp"
#include "link_channel.hpp"
#include "link_state.hpp"
#include "worker_config.hpp"

// ws(s)://host[:port]/<base path>/ws?<query>&mode=worker. Throws std::invalid_argument unless base is http(s).
std::string build_link_url(const std::string& base_url);

// base64url without padding.
std::string encode_protocol_value(const std::string& value);

// "aec-link.<kind>.<base64url(value)>"
std::string build_subprotocol(const std::string& kind, const std::string& value);

ConnectRequest make_connect_request(const LinkCredentials& creds);

// Owns the link lifecycle: connect, receive, classify closes, back off or suspend, reconnect.
class ConnectionManager {
public:
    using MessageHandler = std::function<void(const std::string&)>;
    using OpenHandler = std::function<void()>;

    ConnectionManager(ChannelSlot& slot, LinkConnector& connector, std::function<LinkCredentials()> credentials);

    // Handlers must be installed before run().
    void set_message_handler(MessageHandler handler);
    void set_open_handler(OpenHandler handler);

    // Blocks until stop fires.
    void run(const CancellationSignal& stop);

    // Credential rotation: marks state dirty and closes the current channel so the loop reconnects.
    void request_reconnect();

    // Normal closure of the current channel, bounded by timeout.
    void close(std::chrono::milliseconds timeout);

    LinkState state() const;

private:
    // One pass of the loop. Returns how long to wait before the next pass.
    std::chrono::milliseconds step(const CancellationSignal& stop);
    void read_loop(const std::shared_ptr<LinkChannel>& channel, const CancellationSignal& stop);
    std::chrono::milliseconds after_close(const std::shared_ptr<LinkChannel>& channel, const CancellationSignal& stop);

    mutable std::mutex mtx_;
    ChannelSlot& slot_;
    LinkConnector& connector_;
    std::function<LinkCredentials()> credentials_;
    MessageHandler on_message_;
    OpenHandler on_open_;
    LinkState state_;
};
