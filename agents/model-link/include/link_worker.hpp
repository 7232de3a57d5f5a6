#pragma once
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include "artifact_fetcher.hpp"
#include "cancellation.hpp"
#include "connection_manager.hpp"
#include "hash_cache.hpp"
#include "inventory_reporter.hpp"
#include "job_dispatcher.hpp"
#include "job_processor.hpp"
#include "job_queue.hpp"
#include "link_channel.hpp"
#include "messages.hpp"
#include "path_resolver.hpp"
#include "sidecar_writer.hpp"
#include "transport.hpp"
#include "worker_config.hpp"

// Pluggable edges of the worker. Production wiring uses WebsocketConnector, HttpFallbackSender,
// CurlArtifactFetcher and MetadataSidecarWriter.
struct LinkServices {
    LinkConnector& connector;
    FallbackSender& fallback;
    ArtifactFetcher& fetcher;
    SidecarWriter& sidecars;
};

// Owns the three long-running loops (link, dispatch, inventory) and routes inbound link messages.
// Start once; stop() is idempotent and also runs from the destructor.
class LinkWorker {
public:
    LinkWorker(ConfigStore& config, ModelRegistry registry, LinkServices services);
    ~LinkWorker();

    LinkWorker(const LinkWorker&) = delete;
    LinkWorker& operator=(const LinkWorker&) = delete;

    void start();
    void stop();

    // Validates and applies a full config. Throws std::invalid_argument listing every violation.
    // A credential change forces the link to reconnect.
    void update_config(WorkerConfig next);

    // Opens or closes the dispatch/inventory gate and announces the new state over the link.
    void set_worker_enabled(bool enabled);
    bool is_worker_running() const;

    // Entry point for every text frame the link receives. Throws on malformed JSON.
    void handle_message(const std::string& text);
    void handle_control(const json& msg);

    // Full hash scan of every model root followed by an inventory push. True when a push went out.
    bool rescan_inventory();

    // Writes sidecars for installed models that have no <stem>.metadata.json yet. Failures are logged
    // and skipped. Returns the number of models that got sidecars.
    int generate_sidecars();

    const PathResolver& paths() const { return paths_; }
    HashCache& hashes() { return hashes_; }
    JobQueue& queue() { return queue_; }
    ConnectionManager& connection() { return connection_; }

private:
    // Returns true when the credentials changed; the caller forces the reconnect.
    bool apply_worker_state(bool enable, const std::optional<std::string>& link_key,
                            const std::optional<std::string>& api_key);
    void on_link_open();
    void reply(const OutboundMessage& msg);
    void inventory_loop();

    ConfigStore& config_;
    LinkServices services_;
    PathResolver paths_;
    HashCache hashes_;
    ChannelSlot slot_;
    Transport transport_;
    InventoryReporter inventory_;
    JobQueue queue_;
    RunGate gate_;
    CancellationSignal stop_;
    ConnectionManager connection_;
    JobProcessor processor_;
    JobDispatcher dispatcher_;
    std::vector<std::thread> threads_;
    bool started_{false};
};
