#pragma once
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "cancellation.hpp"
#include "../../../shared/cpp/agent_sdk/include/http_client.hpp"

struct CloseInfo {
    std::optional<int> code; // absent when the peer vanished without a close frame
    std::string reason;
};

enum class ReceiveStatus { Message, Idle, Closed };

// One physical bidirectional link. Implementations must allow send_text and close from any thread
// while another thread sits in receive.
class LinkChannel {
public:
    virtual ~LinkChannel() = default;

    virtual bool send_text(const std::string& text) = 0;
    // Waits up to `wait` for the next complete text message.
    virtual ReceiveStatus receive(std::string& out, std::chrono::milliseconds wait) = 0;
    virtual bool is_open() const = 0;
    virtual CloseInfo close_info() const = 0;
    // Normal-closure handshake bounded by timeout. Safe to call more than once.
    virtual void close(const std::string& reason, std::chrono::milliseconds timeout) = 0;
};

struct ConnectRequest {
    std::string url;
    HttpHeaders headers;
    std::vector<std::string> subprotocols;
};

class LinkConnector {
public:
    virtual ~LinkConnector() = default;
    // Returns an open channel. Throws std::runtime_error when the handshake fails or stop fires.
    virtual std::shared_ptr<LinkChannel> connect(const ConnectRequest& req, const CancellationSignal& stop) = 0;
};

// The single current channel, shared by the connection loop (which replaces and clears it) and every sender.
// Readers take a snapshot and work on that; sends are serialized so messages never interleave.
class ChannelSlot {
public:
    std::shared_ptr<LinkChannel> current() const;
    void replace(std::shared_ptr<LinkChannel> channel);
    // Clears the slot, returning what it held.
    std::shared_ptr<LinkChannel> take();
    // Clears the slot only if it still holds `channel`.
    void clear_if(const std::shared_ptr<LinkChannel>& channel);
    // False when there is no open channel or the send failed.
    bool send(const std::string& text);

private:
    mutable std::mutex mtx_;
    std::mutex send_mtx_;
    std::shared_ptr<LinkChannel> channel_;
};
