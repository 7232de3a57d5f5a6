#include "../include/link_state.hpp"
#include "../include/text_util.hpp"
#include <algorithm>
#include <cmath>

namespace {
const char* kRateLimitedMarker = "RATE_LIMITED:";
}

const char* link_phase_name(LinkPhase p) {
    switch (p) {
    case LinkPhase::Disconnected: return "disconnected";
    case LinkPhase::Connecting: return "connecting";
    case LinkPhase::Open: return "open";
    case LinkPhase::Suspended: return "suspended";
    }
    return "unknown";
}

std::optional<std::chrono::milliseconds> parse_retry_after(const std::string& reason) {
    std::string r = trim(reason);
    std::string marker = kRateLimitedMarker;
    if (!starts_with_ci(r, marker)) return std::nullopt;
    std::string value = trim(r.substr(marker.size()));
    if (value.empty()) return std::nullopt;
    try {
        size_t used = 0;
        double seconds = std::stod(value, &used);
        if (used != value.size() || std::isnan(seconds) || seconds < 0) return std::nullopt;
        double cap = static_cast<double>(kMaxRetryAfter.count());
        return std::chrono::milliseconds(static_cast<long long>(std::min(seconds, cap) * 1000.0));
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::optional<std::chrono::milliseconds> suspension_for(const CloseInfo& info) {
    if (!info.code) return std::nullopt;
    switch (*info.code) {
    case kUnauthorizedCloseCode:
        return std::chrono::milliseconds(kUnauthorizedSuspension);
    case kRateLimitedCloseCode: {
        auto parsed = parse_retry_after(info.reason);
        return parsed ? *parsed : std::chrono::milliseconds(kRateLimitedDefaultSuspension);
    }
    case kServiceDisabledCloseCode:
        return std::chrono::milliseconds(kServiceDisabledSuspension);
    default:
        return std::nullopt;
    }
}

std::chrono::seconds reconnect_delay(int attempts) {
    int a = std::clamp(attempts, 0, kMaxReconnectAttempts);
    return std::min(kReconnectMaxDelay, kReconnectBaseDelay * (1 << a));
}

LinkState link_refresh(LinkState s, LinkClock::time_point now) {
    if (s.phase == LinkPhase::Suspended && now >= s.suspend_until) {
        s.phase = LinkPhase::Disconnected;
        s.suspend_until = {};
    }
    return s;
}

bool link_can_connect(const LinkState& s, bool has_credentials, LinkClock::time_point now) {
    if (!has_credentials) return false;
    LinkState r = link_refresh(s, now);
    return r.phase == LinkPhase::Disconnected;
}

LinkState link_connecting(LinkState s) {
    s.phase = LinkPhase::Connecting;
    return s;
}

LinkState link_opened(LinkState s) {
    s.phase = LinkPhase::Open;
    s.reconnect_attempts = 0;
    s.credentials_dirty = false;
    return s;
}

LinkState link_connect_failed(LinkState s) {
    s.phase = LinkPhase::Disconnected;
    return s;
}

LinkState link_closed(LinkState s, const CloseInfo& info, LinkClock::time_point now) {
    if (auto wait = suspension_for(info)) {
        s.phase = LinkPhase::Suspended;
        s.suspend_until = now + *wait;
    } else {
        s.phase = LinkPhase::Disconnected;
    }
    return s;
}

LinkState link_credentials_rotated(LinkState s) {
    s.credentials_dirty = true;
    if (s.phase == LinkPhase::Suspended) {
        s.phase = LinkPhase::Disconnected;
        s.suspend_until = {};
    }
    return s;
}

std::chrono::seconds link_next_backoff(LinkState& s) {
    std::chrono::seconds delay = reconnect_delay(s.reconnect_attempts);
    s.reconnect_attempts = std::min(s.reconnect_attempts + 1, kMaxReconnectAttempts);
    return delay;
}
