#include "../include/job_processor.hpp"
#include "../include/log.hpp"
#include "../include/text_util.hpp"
#include "../../../shared/cpp/agent_sdk/include/http_client.hpp"
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <random>
#include <regex>
#include <stdexcept>

namespace fs = std::filesystem;
using SteadyClock = std::chrono::steady_clock;

namespace {
const int kProgressMinStep = 2;
const std::chrono::milliseconds kProgressMinInterval{1500};

void remove_temp(const fs::path& tmp) {
    std::error_code ec;
    fs::remove(tmp, ec);
    if (ec) log_warn("Could not remove " + tmp.string() + ": " + ec.message());
}

// Path component of an absolute URL, without query or fragment.
std::string url_path(const std::string& url) {
    size_t sep = url.find("://");
    size_t start = sep == std::string::npos ? 0 : url.find('/', sep + 3);
    if (start == std::string::npos) return "/";
    size_t end = url.find_first_of("?#", start);
    return url.substr(start, end == std::string::npos ? std::string::npos : end - start);
}
}

ProgressThrottle::ProgressThrottle(SteadyClock::time_point start) : last_ts_(start) {}

std::optional<int> ProgressThrottle::accept(double fraction, SteadyClock::time_point now) {
    int pct = std::clamp(static_cast<int>(fraction * 100.0), 0, 100);
    if (pct == last_pct_) return std::nullopt;
    if (pct != 0 && pct != 100) {
        if (pct - last_pct_ < kProgressMinStep || now - last_ts_ < kProgressMinInterval) return std::nullopt;
    }
    last_pct_ = pct;
    last_ts_ = now;
    return pct;
}

std::chrono::milliseconds retry_delay(int base, int attempt, double jitter) {
    double seconds = std::pow(static_cast<double>(base), attempt) + jitter;
    double cap = static_cast<double>(kMaxRetryDelay.count());
    if (!(seconds < cap)) return std::chrono::duration_cast<std::chrono::milliseconds>(kMaxRetryDelay);
    return std::chrono::milliseconds(static_cast<long long>(seconds * 1000.0));
}

std::string resolve_download_url(const std::string& raw, const std::string& base_url) {
    if (starts_with_ci(raw, "http://") || starts_with_ci(raw, "https://")) return raw;
    std::string lowered = to_lower(base_url);
    size_t api = lowered.find("/api/");
    std::string root = api == std::string::npos ? base_url : base_url.substr(0, api);
    while (!root.empty() && root.back() == '/') root.pop_back();
    size_t skip = raw.find_first_not_of('/');
    return root + "/" + (skip == std::string::npos ? "" : raw.substr(skip));
}

std::string derive_filename(const std::string& url) {
    static const std::regex random_prefix(
        "^(?:\\d+_|[0-9a-f]{8}-[0-9a-f]{4}-[0-9a-f]{4}-[0-9a-f]{4}-[0-9a-f]{12}_)", std::regex::icase);

    std::string path = url_unescape(url_path(url));
    size_t slash = path.find_last_of('/');
    std::string raw = slash == std::string::npos ? path : path.substr(slash + 1);
    if (trim(raw).empty() || raw == "." || raw == "..") throw std::invalid_argument("Download URL has no file name.");

    std::string clean = std::regex_replace(raw, random_prefix, "", std::regex_constants::format_first_only);
    if (trim(clean).empty()) clean = raw;
    return clean;
}

fs::path unique_filename(const fs::path& dir, const std::string& name) {
    fs::path p(name);
    std::string stem = p.stem().string();
    if (stem.empty()) stem = "_";
    std::string ext = p.extension().string();

    auto taken = [](const fs::path& candidate) {
        std::error_code ec;
        fs::path part = candidate;
        part += ".part";
        return fs::exists(candidate, ec) || fs::exists(part, ec);
    };

    fs::path candidate = dir / name;
    for (int idx = 1; taken(candidate); ++idx) {
        candidate = dir / (stem + "_" + std::to_string(idx) + ext);
    }
    return candidate;
}

bool has_enough_free_space(const fs::path& dir, int min_mb) {
    std::error_code ec;
    fs::space_info info = fs::space(dir, ec);
    if (ec) return true;
    return info.available / (1024 * 1024) >= static_cast<std::uintmax_t>(std::max(min_mb, 0));
}

JobProcessor::JobProcessor(const ConfigStore& config, const PathResolver& paths, HashCache& hashes,
                           InventoryReporter& inventory, Transport& transport, ArtifactFetcher& fetcher,
                           SidecarWriter& sidecars)
    : config_(config), paths_(paths), hashes_(hashes), inventory_(inventory), transport_(transport),
      fetcher_(fetcher), sidecars_(sidecars) {}

void JobProcessor::process(const Job& job, const CancellationSignal& stop) {
    WorkerConfig cfg = config_.snapshot();
    log_info("Job " + std::to_string(job.id) + " started: " + job.target_path);
    try {
        install(job, cfg, stop);
        log_info("Job " + std::to_string(job.id) + " done");
    } catch (const std::exception& e) {
        log_error("Job " + std::to_string(job.id) + " failed: " + e.what());
        report(job.id, std::nullopt, JobState::Error, e.what());
    }
}

void JobProcessor::install(const Job& job, const WorkerConfig& cfg, const CancellationSignal& stop) {
    std::string source = trim(job.download_url);
    if (source.empty()) throw std::invalid_argument("No download URL provided.");

    std::string url = resolve_download_url(source, cfg.base_url);
    std::string name = derive_filename(url);
    fs::path dir = paths_.resolve(job.target_path);

    fs::create_directories(dir);
    if (!has_enough_free_space(dir, cfg.min_free_mb)) {
        throw std::runtime_error("Less than " + std::to_string(cfg.min_free_mb) + " MB free");
    }

    fs::path dest = unique_filename(dir, name);
    fs::path tmp = dest;
    tmp += ".part";

    report(job.id, 0, JobState::Downloading);
    ProgressThrottle throttle(SteadyClock::now());
    FetchProgress on_progress = [&](double fraction) {
        if (auto pct = throttle.accept(fraction, SteadyClock::now())) report(job.id, *pct, std::nullopt);
    };

    std::string actual;
    try {
        download_with_retry(url, tmp, cfg, on_progress, stop);
        actual = sha256_file(tmp);
        if (!job.sha256.empty() && !iequals(job.sha256, actual)) throw std::runtime_error("SHA-256 mismatch");
        fs::rename(tmp, dest);
    } catch (const std::exception&) {
        remove_temp(tmp);
        throw;
    }

    if (job.meta) sidecars_.write(SidecarRequest{dest, actual, *job.meta, cfg.save_html_preview});

    inventory_.push(hashes_.update(dest, actual));
    report(job.id, 100, JobState::Done);
    if (!transport_.send(make_poll())) log_warn("Poll after job " + std::to_string(job.id) + " not delivered");
}

void JobProcessor::download_with_retry(const std::string& url, const fs::path& tmp, const WorkerConfig& cfg,
                                       const FetchProgress& progress, const CancellationSignal& stop) {
    std::mt19937 rng(std::random_device{}());
    std::uniform_real_distribution<double> jitter(0.0, 1.0);
    int attempts = std::max(1, cfg.max_retries);

    for (int attempt = 1; attempt <= attempts; ++attempt) {
        try {
            fetcher_.fetch(url, tmp, progress, stop);
            return;
        } catch (const std::exception& e) {
            remove_temp(tmp);
            if (attempt == attempts || stop.cancelled()) throw;
            auto delay = retry_delay(cfg.backoff_base, attempt, jitter(rng));
            log_warn("Download attempt " + std::to_string(attempt) + " failed: " + e.what() + "; retrying in " +
                     std::to_string(delay.count()) + "ms");
            if (stop.wait_for(delay)) throw std::runtime_error("Download cancelled");
        }
    }
}

void JobProcessor::report(int job_id, std::optional<int> progress, std::optional<JobState> state,
                          const std::string& message) {
    if (!transport_.send(make_progress(ProgressUpdate{job_id, progress, state, message}))) {
        log_warn("Progress for job " + std::to_string(job_id) + " not delivered");
    }
}
