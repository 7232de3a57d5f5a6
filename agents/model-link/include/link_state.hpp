#pragma once
#include <chrono>
#include <optional>
#include <string>
#include "link_channel.hpp"

using LinkClock = std::chrono::steady_clock;

enum class LinkPhase { Disconnected, Connecting, Open, Suspended };

const char* link_phase_name(LinkPhase p);

struct LinkState {
    LinkPhase phase{LinkPhase::Disconnected};
    LinkClock::time_point suspend_until{}; // meaningful only while Suspended
    int reconnect_attempts{0};
    bool credentials_dirty{false};
};

constexpr int kUnauthorizedCloseCode = 4401;
constexpr int kRateLimitedCloseCode = 4429;
constexpr int kServiceDisabledCloseCode = 1013;
constexpr int kMaxReconnectAttempts = 6;
constexpr std::chrono::seconds kReconnectBaseDelay{1};
constexpr std::chrono::seconds kReconnectMaxDelay{10};
constexpr std::chrono::seconds kUnauthorizedSuspension{600};
constexpr std::chrono::seconds kRateLimitedDefaultSuspension{900};
constexpr std::chrono::seconds kServiceDisabledSuspension{30};
constexpr std::chrono::seconds kMaxRetryAfter{86400};

// "RATE_LIMITED:<seconds>" (marker matched case-insensitively, fractional seconds allowed).
// Values above kMaxRetryAfter are clamped to it.
std::optional<std::chrono::milliseconds> parse_retry_after(const std::string& reason);

// Cooldown imposed by a close code, or nothing when the loop should go straight to backoff.
std::optional<std::chrono::milliseconds> suspension_for(const CloseInfo& info);

// min(max, base * 2^attempts) with attempts as stored (already capped).
std::chrono::seconds reconnect_delay(int attempts);

// Transitions. All are pure: the caller owns the state and the clock.
LinkState link_refresh(LinkState s, LinkClock::time_point now);
bool link_can_connect(const LinkState& s, bool has_credentials, LinkClock::time_point now);
LinkState link_connecting(LinkState s);
LinkState link_opened(LinkState s);
LinkState link_connect_failed(LinkState s);
LinkState link_closed(LinkState s, const CloseInfo& info, LinkClock::time_point now);
// Marks credentials dirty and lifts any suspension.
LinkState link_credentials_rotated(LinkState s);
// Consumes one backoff step: returns the wait and advances the attempt counter.
std::chrono::seconds link_next_backoff(LinkState& s);
