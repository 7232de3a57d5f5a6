#include "../include/transport.hpp"
#include "../include/log.hpp"

HttpFallbackSender::HttpFallbackSender(std::function<LinkCredentials()> credentials, long timeout_ms)
    : credentials_(std::move(credentials)), timeout_ms_(timeout_ms) {}

bool HttpFallbackSender::deliver(const OutboundMessage& msg) {
    LinkCredentials creds = credentials_();
    if (creds.base_url.empty()) return false;

    std::string method;
    std::string url;
    json body = json::object();
    if (msg.type == "progress") {
        int job_id = msg.body.value("jobId", 0);
        if (job_id <= 0) return false;
        method = "PATCH";
        url = creds.base_url + "/queue/" + std::to_string(job_id) + "/progress";
        for (const char* key : {"progress", "state", "message"}) {
            if (msg.body.contains(key)) body[key] = msg.body[key];
        }
    } else if (msg.type == "inventory") {
        method = "POST";
        url = creds.base_url + "/inventory";
        body["hashes"] = msg.body.value("hashes", json::array());
    } else {
        return false;
    }

    try {
        HttpResponse r = http_send_json(method, url, body.dump(), auth_headers(creds), timeout_ms_);
        if (!http_ok(r.status)) {
            log_error("Fallback " + msg.type + " update rejected: status " + std::to_string(r.status));
            return false;
        }
        return true;
    } catch (const std::exception& e) {
        log_error("Fallback " + msg.type + " update failed: " + e.what());
        return false;
    }
}

Transport::Transport(ChannelSlot& slot, FallbackSender& fallback) : slot_(slot), fallback_(fallback) {}

bool Transport::send(const OutboundMessage& msg) {
    if (slot_.send(msg.wire())) return true;
    return fallback_.deliver(msg);
}
