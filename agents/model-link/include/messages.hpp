#pragma once
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

struct Job {
    int id{0};
    std::string target_path;  // logical and untrusted, e.g. "models/lora/style"
    std::string download_url; // absolute, or relative to the service host
    std::string sha256;       // empty when the service sent none
    std::optional<json> meta; // sidecar input
};

enum class JobState { Downloading, Done, Error };

const char* job_state_name(JobState s);

struct ProgressUpdate {
    int job_id{0};
    std::optional<int> progress;
    std::optional<JobState> state;
    std::string message;
};

struct OutboundMessage {
    std::string type;
    json body = json::object(); // payload fields, without "type"

    std::string wire() const;
};

OutboundMessage make_worker_state(bool running);
OutboundMessage make_poll();
OutboundMessage make_progress(const ProgressUpdate& u);
OutboundMessage make_inventory(const std::vector<std::string>& hashes);
OutboundMessage make_reply(const std::string& type, json body);

// Extracts a job from {type:"job", data:{id, targetPath, version:{externalDownloadUrl|filePath, sha256, meta}}}.
// Returns nothing for a missing data object, a non-positive id, or an empty target path.
std::optional<Job> parse_job(const json& msg);

// Reads obj[key] as a string; "" when absent, null, or not a string.
std::string string_field(const json& obj, const char* key);
