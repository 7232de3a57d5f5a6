#include "../include/worker_config.hpp"
#include "../include/text_util.hpp"
#include <cstdlib>
#include <regex>
#include <stdexcept>

namespace {
static int env_int(const char* key, int def) {
    const char* v = std::getenv(key);
    if (!v || !*v) return def;
    try {
        return std::stoi(v);
    } catch (const std::exception&) {
        throw std::invalid_argument(std::string(key) + " must be an integer");
    }
}

static bool env_bool(const char* key, bool def) {
    const char* v = std::getenv(key);
    if (!v || !*v) return def;
    std::string s = to_lower(v);
    return s == "1" || s == "true" || s == "yes" || s == "on";
}
}

std::string getenv_or(const char* key, const std::string& def) {
    const char* v = std::getenv(key);
    return v ? std::string(v) : def;
}

HttpHeaders auth_headers(const LinkCredentials& creds) {
    if (!creds.link_key.empty()) return {{"x-link-key", creds.link_key}};
    if (!creds.api_key.empty()) return {{"x-api-key", creds.api_key}};
    return {};
}

LinkCredentials WorkerConfig::credentials() const {
    return LinkCredentials{base_url, link_key, api_key};
}

WorkerConfig normalize_config(WorkerConfig c) {
    c.base_url = trim(c.base_url);
    while (!c.base_url.empty() && c.base_url.back() == '/') c.base_url.pop_back();
    c.link_key = trim(c.link_key);
    c.api_key = trim(c.api_key);
    return c;
}

bool is_valid_link_key(const std::string& key) {
    static const std::regex pattern("^lk_[A-Za-z0-9_-]{32}$");
    return std::regex_match(key, pattern);
}

std::vector<std::string> validate_config(const WorkerConfig& c) {
    std::vector<std::string> errors;
    if (c.base_url.empty()) {
        errors.push_back("Base URL required");
    } else if (!starts_with_ci(c.base_url, "http://") && !starts_with_ci(c.base_url, "https://")) {
        errors.push_back("Base URL must be http(s)");
    }
    if (!c.link_key.empty() && !is_valid_link_key(c.link_key)) errors.push_back("Invalid link key format");
    if (c.min_free_mb < 0) errors.push_back("Min free MB must be >= 0");
    if (c.max_retries < 1) errors.push_back("Max retries must be >= 1");
    if (c.backoff_base < 1) errors.push_back("Backoff base must be >= 1");
    return errors;
}

bool credentials_differ(const LinkCredentials& a, const LinkCredentials& b) {
    return !iequals(a.base_url, b.base_url) || a.link_key != b.link_key || a.api_key != b.api_key;
}

WorkerConfig config_from_env() {
    WorkerConfig c;
    c.base_url = getenv_or("MODEL_LINK_BASE_URL", c.base_url);
    c.link_key = getenv_or("MODEL_LINK_LINK_KEY", c.link_key);
    c.api_key = getenv_or("MODEL_LINK_API_KEY", c.api_key);
    c.enabled = env_bool("MODEL_LINK_ENABLED", c.enabled);
    c.min_free_mb = env_int("MODEL_LINK_MIN_FREE_MB", c.min_free_mb);
    c.max_retries = env_int("MODEL_LINK_MAX_RETRIES", c.max_retries);
    c.backoff_base = env_int("MODEL_LINK_BACKOFF_BASE", c.backoff_base);
    c.save_html_preview = env_bool("MODEL_LINK_HTML_PREVIEW", c.save_html_preview);
    c.data_dir = getenv_or("MODEL_LINK_DATA_DIR", c.data_dir.string());
    c.models_root = getenv_or("MODEL_LINK_MODELS_ROOT", c.models_root.string());
    return normalize_config(std::move(c));
}

ConfigStore::ConfigStore(WorkerConfig initial) : config_(normalize_config(std::move(initial))) {}

WorkerConfig ConfigStore::snapshot() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return config_;
}

LinkCredentials ConfigStore::credentials() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return config_.credentials();
}

bool ConfigStore::apply(WorkerConfig next) {
    next = normalize_config(std::move(next));
    std::lock_guard<std::mutex> lock(mtx_);
    bool changed = credentials_differ(config_.credentials(), next.credentials());
    config_ = std::move(next);
    return changed;
}

void ConfigStore::set_enabled(bool enabled) {
    std::lock_guard<std::mutex> lock(mtx_);
    config_.enabled = enabled;
}
