#pragma once
#include <filesystem>
#include <mutex>
#include <string>
#include <vector>
#include "../../../shared/cpp/agent_sdk/include/http_client.hpp"

struct LinkCredentials {
    std::string base_url;
    std::string link_key; // primary
    std::string api_key;  // legacy, used only when link_key is empty

    bool has_any() const { return !link_key.empty() || !api_key.empty(); }
};

// x-link-key when a link key is configured, else x-api-key.
HttpHeaders auth_headers(const LinkCredentials& creds);

struct WorkerConfig {
    std::string base_url{"https://link.arcenciel.io/api/link"};
    std::string link_key;
    std::string api_key;
    bool enabled{false};
    int min_free_mb{2048};
    int max_retries{5};
    int backoff_base{2};
    bool save_html_preview{false};
    std::filesystem::path data_dir{"data"};
    std::filesystem::path models_root{"models"};

    LinkCredentials credentials() const;
};

// Trims keys and base URL, drops trailing slashes from the base URL.
WorkerConfig normalize_config(WorkerConfig c);

// Returns one message per violated rule; empty means valid.
std::vector<std::string> validate_config(const WorkerConfig& c);

bool is_valid_link_key(const std::string& key);

// Endpoint compares case-insensitively, keys exactly.
bool credentials_differ(const LinkCredentials& a, const LinkCredentials& b);

// Defaults overridden by MODEL_LINK_* environment variables.
WorkerConfig config_from_env();

std::string getenv_or(const char* key, const std::string& def);

class ConfigStore {
public:
    explicit ConfigStore(WorkerConfig initial);

    WorkerConfig snapshot() const;
    LinkCredentials credentials() const;
    // Replaces the whole config. Returns true when endpoint or credentials changed.
    bool apply(WorkerConfig next);
    void set_enabled(bool enabled);

private:
    mutable std::mutex mtx_;
    WorkerConfig config_;
};
