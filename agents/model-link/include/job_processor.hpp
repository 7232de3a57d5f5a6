#pragma once
#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include "artifact_fetcher.hpp"
#include "cancellation.hpp"
#include "hash_cache.hpp"
#include "inventory_reporter.hpp"
#include "messages.hpp"
#include "path_resolver.hpp"
#include "sidecar_writer.hpp"
#include "transport.hpp"
#include "worker_config.hpp"

// Rate limit for intermediate progress: a value passes once it is at least two points past the
// last one and 1.5 s have gone by. 0 and 100 always pass unless they repeat the last value.
class ProgressThrottle {
public:
    explicit ProgressThrottle(std::chrono::steady_clock::time_point start);
    std::optional<int> accept(double fraction, std::chrono::steady_clock::time_point now);

private:
    int last_pct_{0};
    std::chrono::steady_clock::time_point last_ts_;
};

constexpr std::chrono::seconds kMaxRetryDelay{3600};

// base^attempt seconds plus jitter (expected in [0, 1)), capped at kMaxRetryDelay.
std::chrono::milliseconds retry_delay(int base, int attempt, double jitter);

// Absolute http(s) URLs pass through; anything else is resolved against the base URL's host,
// with the "/api/..." tail of the base dropped.
std::string resolve_download_url(const std::string& raw, const std::string& base_url);

// Last path segment of the URL, percent-decoded, without a leading "<digits>_" or "<uuid>_" token.
// Throws std::invalid_argument when the URL names no file.
std::string derive_filename(const std::string& url);

// dir/name, or dir/<stem>_N<ext> for the first N where neither the file nor its ".part" exists.
std::filesystem::path unique_filename(const std::filesystem::path& dir, const std::string& name);

// True when free space is unknown or at least min_mb megabytes.
bool has_enough_free_space(const std::filesystem::path& dir, int min_mb);

class JobProcessor {
public:
    JobProcessor(const ConfigStore& config, const PathResolver& paths, HashCache& hashes,
                 InventoryReporter& inventory, Transport& transport, ArtifactFetcher& fetcher,
                 SidecarWriter& sidecars);

    // Runs one job to a terminal DONE or ERROR report. Never throws.
    void process(const Job& job, const CancellationSignal& stop);

private:
    void install(const Job& job, const WorkerConfig& cfg, const CancellationSignal& stop);
    void download_with_retry(const std::string& url, const std::filesystem::path& tmp, const WorkerConfig& cfg,
                             const FetchProgress& progress, const CancellationSignal& stop);
    void report(int job_id, std::optional<int> progress, std::optional<JobState> state,
                const std::string& message = "");

    const ConfigStore& config_;
    const PathResolver& paths_;
    HashCache& hashes_;
    InventoryReporter& inventory_;
    Transport& transport_;
    ArtifactFetcher& fetcher_;
    SidecarWriter& sidecars_;
};
