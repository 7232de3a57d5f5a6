#pragma once
#include "link_channel.hpp"

// websocketpp-backed link over Boost.Asio; ws:// in the clear, wss:// with peer and host name verification.
class WebsocketConnector : public LinkConnector {
public:
    std::shared_ptr<LinkChannel> connect(const ConnectRequest& req, const CancellationSignal& stop) override;
};
