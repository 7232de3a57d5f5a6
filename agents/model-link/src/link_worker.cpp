#include "../include/link_worker.hpp"
#include "../include/log.hpp"
#include "../include/text_util.hpp"
#include <stdexcept>

namespace {
const std::chrono::hours kInventoryInterval{1};
const std::chrono::milliseconds kShutdownCloseTimeout{1000};

std::optional<std::string> optional_key(const json& msg, const char* key) {
    if (!msg.contains(key)) return std::nullopt;
    return trim(string_field(msg, key));
}
}

LinkWorker::LinkWorker(ConfigStore& config, ModelRegistry registry, LinkServices services)
    : config_(config),
      services_(services),
      paths_(std::move(registry)),
      hashes_(config.snapshot().data_dir / "hashes.json"),
      transport_(slot_, services.fallback),
      inventory_(transport_),
      connection_(slot_, services.connector, [this] { return config_.credentials(); }),
      processor_(config_, paths_, hashes_, inventory_, transport_, services.fetcher, services.sidecars),
      dispatcher_(queue_, gate_, [this](const Job& job) { processor_.process(job, stop_); },
                  [this] { transport_.send(make_poll()); }) {
    connection_.set_message_handler([this](const std::string& text) { handle_message(text); });
    connection_.set_open_handler([this] { on_link_open(); });
}

LinkWorker::~LinkWorker() { stop(); }

void LinkWorker::start() {
    if (started_) return;
    started_ = true;
    if (config_.snapshot().enabled) gate_.open();
    threads_.emplace_back([this] { connection_.run(stop_); });
    threads_.emplace_back([this] { dispatcher_.run(stop_); });
    threads_.emplace_back([this] { inventory_loop(); });
    log_info(std::string("Worker started (") + (gate_.is_open() ? "enabled" : "paused") + ")");
}

void LinkWorker::stop() {
    if (!started_) return;
    started_ = false;
    stop_.cancel();
    gate_.open();
    queue_.release_waiters();
    connection_.close(kShutdownCloseTimeout);
    for (auto& t : threads_) {
        if (t.joinable()) t.join();
    }
    threads_.clear();
    log_info("Worker stopped");
}

void LinkWorker::update_config(WorkerConfig next) {
    next = normalize_config(std::move(next));
    std::vector<std::string> errors = validate_config(next);
    if (!errors.empty()) {
        std::string msg;
        for (const auto& e : errors) msg += (msg.empty() ? "" : "; ") + e;
        throw std::invalid_argument(msg);
    }
    bool enabled = next.enabled;
    if (config_.apply(std::move(next))) connection_.request_reconnect();
    set_worker_enabled(enabled);
}

void LinkWorker::set_worker_enabled(bool enabled) {
    config_.set_enabled(enabled);
    if (enabled) gate_.open();
    else gate_.close();
    log_info(std::string("Worker ") + (enabled ? "enabled" : "paused"));
    transport_.send(make_worker_state(enabled));
}

bool LinkWorker::is_worker_running() const { return gate_.is_open(); }

void LinkWorker::on_link_open() {
    transport_.send(make_worker_state(gate_.is_open()));
    transport_.send(make_poll());
}

void LinkWorker::handle_message(const std::string& text) {
    json msg = json::parse(text);
    std::string type = string_field(msg, "type");
    if (type == "job") {
        if (auto job = parse_job(msg)) {
            log_info("Job " + std::to_string(job->id) + " queued");
            queue_.push(std::move(*job));
        } else {
            log_warn("Ignoring malformed job message");
        }
    } else if (type == "control") {
        handle_control(msg);
    }
}

void LinkWorker::handle_control(const json& msg) {
    std::string command = trim(string_field(msg, "command"));
    if (command.empty()) return;
    json request_id = msg.contains("requestId") ? msg["requestId"] : json(nullptr);

    if (command == "set_worker_state") {
        auto enable_it = msg.find("enable");
        bool enable = enable_it != msg.end() && enable_it->is_boolean() ? enable_it->get<bool>() : true;
        std::optional<std::string> link_key = optional_key(msg, "linkKey");
        std::optional<std::string> api_key = optional_key(msg, "apiKey");

        if (link_key && !link_key->empty() && !is_valid_link_key(*link_key)) {
            reply(make_reply("control_ack", {{"command", command},
                                             {"requestId", request_id},
                                             {"ok", false},
                                             {"message", "Invalid link key format"}}));
            return;
        }
        bool rotated = apply_worker_state(enable, link_key, api_key);
        reply(make_reply("control_ack", {{"command", command},
                                         {"requestId", request_id},
                                         {"ok", true},
                                         {"enable", enable},
                                         {"running", is_worker_running()}}));
        // the ack must leave on the channel that carried the request
        if (rotated) connection_.request_reconnect();
    } else if (command == "list_subfolders") {
        std::string kind = string_field(msg, "kind");
        try {
            std::vector<std::string> folders = paths_.list_subfolders(kind);
            reply(make_reply("folders_result",
                             {{"requestId", request_id}, {"ok", true}, {"kind", kind}, {"folders", folders}}));
        } catch (const std::exception& e) {
            reply(make_reply("folders_result",
                             {{"requestId", request_id}, {"ok", false}, {"error", e.what()}, {"kind", kind}}));
        }
    } else {
        reply(make_reply("control_ack", {{"command", command},
                                         {"requestId", request_id},
                                         {"ok", false},
                                         {"message", "Unsupported command"}}));
    }
}

bool LinkWorker::apply_worker_state(bool enable, const std::optional<std::string>& link_key,
                                    const std::optional<std::string>& api_key) {
    WorkerConfig next = config_.snapshot();
    if (link_key) next.link_key = *link_key;
    if (api_key) next.api_key = *api_key;
    next.enabled = enable;
    bool rotated = config_.apply(std::move(next));
    set_worker_enabled(enable);
    return rotated;
}

void LinkWorker::reply(const OutboundMessage& msg) {
    if (!transport_.send(msg)) log_warn("Reply " + msg.type + " dropped: link is down");
}

bool LinkWorker::rescan_inventory() {
    std::vector<std::string> hashes = hashes_.scan(paths_.model_roots(), is_model_file);
    return inventory_.push(hashes);
}

int LinkWorker::generate_sidecars() {
    bool html = config_.snapshot().save_html_preview;
    int written = 0;
    for (const auto& kv : hashes_.files_by_hash(paths_.model_roots(), is_model_file)) {
        if (stop_.cancelled()) break;
        const std::filesystem::path& model = kv.second;
        std::error_code ec;
        if (std::filesystem::exists(model.parent_path() / (model.stem().string() + ".metadata.json"), ec)) continue;
        try {
            services_.sidecars.write(SidecarRequest{model, kv.first, json::object(), html});
            ++written;
        } catch (const std::exception& e) {
            log_warn("Sidecar generation failed for " + model.string() + ": " + e.what());
        }
    }
    log_info("Sidecars written for " + std::to_string(written) + " models");
    return written;
}

void LinkWorker::inventory_loop() {
    while (!stop_.cancelled()) {
        gate_.wait(stop_);
        if (stop_.cancelled()) break;
        try {
            rescan_inventory();
        } catch (const std::exception& e) {
            log_error(std::string("Inventory update failed: ") + e.what());
        }
        if (stop_.wait_for(kInventoryInterval)) break;
    }
}
