#pragma once
#include <functional>
#include "link_channel.hpp"
#include "messages.hpp"
#include "worker_config.hpp"

// Request/response path used when the link is down.
class FallbackSender {
public:
    virtual ~FallbackSender() = default;
    // True when an equivalent request was accepted. Messages without a request route return false.
    virtual bool deliver(const OutboundMessage& msg) = 0;
};

// progress  -> PATCH {base}/queue/{jobId}/progress
// inventory -> POST  {base}/inventory
class HttpFallbackSender : public FallbackSender {
public:
    explicit HttpFallbackSender(std::function<LinkCredentials()> credentials, long timeout_ms = 30000);
    bool deliver(const OutboundMessage& msg) override;

private:
    std::function<LinkCredentials()> credentials_;
    long timeout_ms_;
};

// Channel first, request fallback second. Callers never see which path carried a message.
class Transport {
public:
    Transport(ChannelSlot& slot, FallbackSender& fallback);
    bool send(const OutboundMessage& msg);

private:
    ChannelSlot& slot_;
    FallbackSender& fallback_;
};
