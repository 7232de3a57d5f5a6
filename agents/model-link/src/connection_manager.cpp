#include "../include/connection_manager.hpp"
#include "../include/log.hpp"
#include "../include/text_util.hpp"
#include <openssl/evp.h>
#include <algorithm>
#include <stdexcept>
#include <vector>

namespace {
const std::chrono::milliseconds kIdleRecheck{1000};
const std::chrono::milliseconds kSuspendRecheck{5000};
const std::chrono::milliseconds kBadUrlRecheck{5000};
const std::chrono::milliseconds kReceiveWait{1000};
const std::chrono::milliseconds kCloseTimeout{1000};
const char* kProtocolPrefix = "aec-link.";
}

std::string build_link_url(const std::string& base_url) {
    std::string base = trim(base_url);
    size_t sep = base.find("://");
    if (sep == std::string::npos) throw std::invalid_argument("Base URL must start with http:// or https://");
    std::string scheme = to_lower(base.substr(0, sep));
    if (scheme != "http" && scheme != "https") throw std::invalid_argument("Base URL must start with http:// or https://");

    std::string rest = base.substr(sep + 3);
    size_t hash = rest.find('#');
    if (hash != std::string::npos) rest.resize(hash);
    std::string query;
    size_t q = rest.find('?');
    if (q != std::string::npos) {
        query = rest.substr(q + 1);
        rest.resize(q);
    }
    size_t slash = rest.find('/');
    std::string authority = slash == std::string::npos ? rest : rest.substr(0, slash);
    std::string path = slash == std::string::npos ? "" : rest.substr(slash);
    if (authority.empty()) throw std::invalid_argument("Base URL has no host");
    while (!path.empty() && path.back() == '/') path.pop_back();

    std::string url = (scheme == "https" ? "wss://" : "ws://") + authority + path + "/ws?";
    url += query.empty() ? "mode=worker" : query + "&mode=worker";
    return url;
}

std::string encode_protocol_value(const std::string& value) {
    std::vector<unsigned char> out(4 * ((value.size() + 2) / 3) + 1);
    int n = EVP_EncodeBlock(out.data(), reinterpret_cast<const unsigned char*>(value.data()),
                            static_cast<int>(value.size()));
    std::string s(reinterpret_cast<const char*>(out.data()), static_cast<size_t>(n));
    for (auto& c : s) {
        if (c == '+') c = '-';
        else if (c == '/') c = '_';
    }
    while (!s.empty() && s.back() == '=') s.pop_back();
    return s;
}

std::string build_subprotocol(const std::string& kind, const std::string& value) {
    return kProtocolPrefix + kind + "." + encode_protocol_value(value);
}

ConnectRequest make_connect_request(const LinkCredentials& creds) {
    ConnectRequest req;
    req.url = build_link_url(creds.base_url);
    req.headers = auth_headers(creds);
    if (!creds.link_key.empty()) req.subprotocols.push_back(build_subprotocol("link-key", creds.link_key));
    else if (!creds.api_key.empty()) req.subprotocols.push_back(build_subprotocol("api-key", creds.api_key));
    return req;
}

ConnectionManager::ConnectionManager(ChannelSlot& slot, LinkConnector& connector,
                                     std::function<LinkCredentials()> credentials)
    : slot_(slot), connector_(connector), credentials_(std::move(credentials)) {}

void ConnectionManager::set_message_handler(MessageHandler handler) { on_message_ = std::move(handler); }
void ConnectionManager::set_open_handler(OpenHandler handler) { on_open_ = std::move(handler); }

LinkState ConnectionManager::state() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return state_;
}

void ConnectionManager::run(const CancellationSignal& stop) {
    while (!stop.cancelled()) {
        std::chrono::milliseconds wait{0};
        try {
            wait = step(stop);
        } catch (const std::exception& e) {
            log_error(std::string("Link loop error: ") + e.what());
            wait = kBadUrlRecheck;
        }
        if (wait.count() > 0 && stop.wait_for(wait)) break;
    }
}

std::chrono::milliseconds ConnectionManager::step(const CancellationSignal& stop) {
    LinkCredentials creds = credentials_();
    auto now = LinkClock::now();
    {
        std::lock_guard<std::mutex> lock(mtx_);
        state_ = link_refresh(state_, now);
        if (!creds.has_any()) return kIdleRecheck;
        if (state_.phase == LinkPhase::Suspended) {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(state_.suspend_until - now);
            return std::max(std::chrono::milliseconds(1), std::min(kSuspendRecheck, remaining));
        }
        if (!link_can_connect(state_, creds.has_any(), now)) return kIdleRecheck;
    }

    ConnectRequest req;
    try {
        req = make_connect_request(creds);
    } catch (const std::invalid_argument& e) {
        log_error(std::string("Invalid base URL: ") + e.what());
        return kBadUrlRecheck;
    }

    {
        std::lock_guard<std::mutex> lock(mtx_);
        state_ = link_connecting(state_);
    }
    log_info("Connecting to " + req.url);

    std::shared_ptr<LinkChannel> channel;
    try {
        channel = connector_.connect(req, stop);
    } catch (const std::exception& e) {
        std::lock_guard<std::mutex> lock(mtx_);
        state_ = link_connect_failed(state_);
        if (stop.cancelled()) return std::chrono::milliseconds(0);
        log_error(std::string("Link connect failed: ") + e.what());
        return link_next_backoff(state_);
    }

    {
        std::lock_guard<std::mutex> lock(mtx_);
        state_ = link_opened(state_);
    }
    slot_.replace(channel);
    log_info("Link open");

    if (credentials_differ(creds, credentials_())) {
        log_info("Credentials changed while connecting; reconnecting");
        channel->close("credentials changed", kCloseTimeout);
    } else if (on_open_) {
        try {
            on_open_();
        } catch (const std::exception& e) {
            log_error(std::string("Link open handler failed: ") + e.what());
        }
    }

    read_loop(channel, stop);
    return after_close(channel, stop);
}

void ConnectionManager::read_loop(const std::shared_ptr<LinkChannel>& channel, const CancellationSignal& stop) {
    std::string text;
    while (!stop.cancelled()) {
        ReceiveStatus status = channel->receive(text, kReceiveWait);
        if (status == ReceiveStatus::Closed) break;
        if (status == ReceiveStatus::Idle) continue;
        if (!on_message_) continue;
        try {
            on_message_(text);
        } catch (const std::exception& e) {
            log_error(std::string("Link message error: ") + e.what());
        }
    }
}

std::chrono::milliseconds ConnectionManager::after_close(const std::shared_ptr<LinkChannel>& channel,
                                                         const CancellationSignal& stop) {
    CloseInfo info = channel->close_info();
    slot_.clear_if(channel);
    channel->close("closing", kCloseTimeout);

    std::lock_guard<std::mutex> lock(mtx_);
    if (stop.cancelled()) {
        state_ = link_connect_failed(state_);
        return std::chrono::milliseconds(0);
    }
    state_ = link_closed(state_, info, LinkClock::now());
    std::string code = info.code ? std::to_string(*info.code) : "none";
    if (state_.phase == LinkPhase::Suspended) {
        auto wait = std::chrono::duration_cast<std::chrono::seconds>(state_.suspend_until - LinkClock::now());
        if (info.code && *info.code == kUnauthorizedCloseCode) {
            log_error("Authentication failed; check the link key or API key. Retrying in " +
                      std::to_string(wait.count()) + "s");
        } else if (info.code && *info.code == kRateLimitedCloseCode) {
            log_warn("Rate limited; retrying in " + std::to_string(wait.count()) + "s");
        } else {
            log_warn("Link service disabled by server; retrying in " + std::to_string(wait.count()) + "s");
        }
        return std::chrono::milliseconds(0);
    }
    log_info("Link closed (code " + code + ")");
    return link_next_backoff(state_);
}

void ConnectionManager::request_reconnect() {
    {
        std::lock_guard<std::mutex> lock(mtx_);
        state_ = link_credentials_rotated(state_);
    }
    log_info("Credentials changed; reconnecting link");
    if (auto channel = slot_.current()) channel->close("credentials changed", kCloseTimeout);
}

void ConnectionManager::close(std::chrono::milliseconds timeout) {
    if (auto channel = slot_.take()) channel->close("closing", timeout);
}
