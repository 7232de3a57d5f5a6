#include "../include/messages.hpp"
#include "../include/text_util.hpp"
#include <cstdint>
#include <limits>

const char* job_state_name(JobState s) {
    switch (s) {
    case JobState::Downloading: return "DOWNLOADING";
    case JobState::Done: return "DONE";
    case JobState::Error: return "ERROR";
    }
    return "ERROR";
}

std::string OutboundMessage::wire() const {
    json j = body.is_object() ? body : json::object();
    j["type"] = type;
    return j.dump();
}

OutboundMessage make_worker_state(bool running) {
    return OutboundMessage{"worker_state", {{"running", running}}};
}

OutboundMessage make_poll() {
    return OutboundMessage{"poll", json::object()};
}

OutboundMessage make_progress(const ProgressUpdate& u) {
    json body = {{"jobId", u.job_id}};
    if (u.progress) body["progress"] = *u.progress;
    if (u.state) body["state"] = job_state_name(*u.state);
    if (!trim(u.message).empty()) body["message"] = u.message;
    return OutboundMessage{"progress", std::move(body)};
}

OutboundMessage make_inventory(const std::vector<std::string>& hashes) {
    return OutboundMessage{"inventory", {{"hashes", hashes}}};
}

OutboundMessage make_reply(const std::string& type, json body) {
    return OutboundMessage{type, std::move(body)};
}

std::string string_field(const json& obj, const char* key) {
    if (!obj.is_object()) return {};
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string()) return {};
    return it->get<std::string>();
}

std::optional<Job> parse_job(const json& msg) {
    auto data = msg.find("data");
    if (data == msg.end() || !data->is_object()) return std::nullopt;

    Job job;
    auto id = data->find("id");
    if (id != data->end() && id->is_number_unsigned()) {
        std::uint64_t v = id->get<std::uint64_t>();
        if (v <= static_cast<std::uint64_t>(std::numeric_limits<int>::max())) job.id = static_cast<int>(v);
    } else if (id != data->end() && id->is_number_integer()) {
        std::int64_t v = id->get<std::int64_t>();
        if (v > 0 && v <= std::numeric_limits<int>::max()) job.id = static_cast<int>(v);
    }
    job.target_path = string_field(*data, "targetPath");
    if (job.id <= 0 || trim(job.target_path).empty()) return std::nullopt;

    auto version = data->find("version");
    if (version != data->end() && version->is_object()) {
        job.download_url = string_field(*version, "externalDownloadUrl");
        if (job.download_url.empty()) job.download_url = string_field(*version, "filePath");
        job.sha256 = trim(string_field(*version, "sha256"));
        auto meta = version->find("meta");
        if (meta != version->end() && meta->is_object()) job.meta = *meta;
    }
    return job;
}
