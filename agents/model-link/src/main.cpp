#include "../include/artifact_fetcher.hpp"
#include "../include/link_worker.hpp"
#include "../include/log.hpp"
#include "../include/sidecar_writer.hpp"
#include "../include/transport.hpp"
#include "../include/websocket_channel.hpp"
#include "../include/worker_config.hpp"
#include <curl/curl.h>
#include <chrono>
#include <csignal>
#include <iostream>
#include <thread>

static volatile std::sig_atomic_t g_stop = 0;

static void on_signal(int) { g_stop = 1; }

static void usage() {
    std::cerr << "model_link usage:\n"
              << "  model_link [--base-url <url>] [--link-key <lk_...>] [--api-key <key>] [--enable]\n"
              << "             [--min-free-mb N] [--max-retries N] [--backoff-base N] [--html-preview]\n"
              << "             [--data-dir <path>] [--models-root <path>] [--generate-sidecars]\n"
              << "             [--checkpoint-dir <path>] [--lora-dir <path>] [--vae-dir <path>] [--embedding-dir <path>]\n"
              << "Environment: MODEL_LINK_BASE_URL, MODEL_LINK_LINK_KEY, MODEL_LINK_API_KEY, MODEL_LINK_ENABLED,\n"
              << "             MODEL_LINK_MIN_FREE_MB, MODEL_LINK_MAX_RETRIES, MODEL_LINK_BACKOFF_BASE,\n"
              << "             MODEL_LINK_HTML_PREVIEW, MODEL_LINK_DATA_DIR, MODEL_LINK_MODELS_ROOT\n";
}

int main(int argc, char** argv) {
    WorkerConfig cfg;
    std::string checkpoint_dir, lora_dir, vae_dir, embedding_dir;
    bool generate_only = false;
    try {
        cfg = config_from_env();
        for (int i = 1; i < argc; ++i) {
            std::string a = argv[i];
            if (a == "--base-url" && i + 1 < argc) cfg.base_url = argv[++i];
            else if (a == "--link-key" && i + 1 < argc) cfg.link_key = argv[++i];
            else if (a == "--api-key" && i + 1 < argc) cfg.api_key = argv[++i];
            else if (a == "--enable") cfg.enabled = true;
            else if (a == "--min-free-mb" && i + 1 < argc) cfg.min_free_mb = std::stoi(argv[++i]);
            else if (a == "--max-retries" && i + 1 < argc) cfg.max_retries = std::stoi(argv[++i]);
            else if (a == "--backoff-base" && i + 1 < argc) cfg.backoff_base = std::stoi(argv[++i]);
            else if (a == "--html-preview") cfg.save_html_preview = true;
            else if (a == "--data-dir" && i + 1 < argc) cfg.data_dir = argv[++i];
            else if (a == "--models-root" && i + 1 < argc) cfg.models_root = argv[++i];
            else if (a == "--checkpoint-dir" && i + 1 < argc) checkpoint_dir = argv[++i];
            else if (a == "--lora-dir" && i + 1 < argc) lora_dir = argv[++i];
            else if (a == "--vae-dir" && i + 1 < argc) vae_dir = argv[++i];
            else if (a == "--embedding-dir" && i + 1 < argc) embedding_dir = argv[++i];
            else if (a == "--generate-sidecars") generate_only = true;
            else if (a == "--help" || a == "-h") { usage(); return 0; }
            else { usage(); return 2; }
        }
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] " << e.what() << "\n";
        usage();
        return 2;
    }

    cfg = normalize_config(cfg);
    std::vector<std::string> errors = validate_config(cfg);
    if (!errors.empty()) {
        for (const auto& e : errors) std::cerr << "[ERROR] " << e << "\n";
        usage();
        return 2;
    }

    ModelRegistry registry = registry_from_models_root(cfg.models_root);
    override_category_root(registry, ModelCategory::StableDiffusion, checkpoint_dir);
    override_category_root(registry, ModelCategory::Lora, lora_dir);
    override_category_root(registry, ModelCategory::Vae, vae_dir);
    override_category_root(registry, ModelCategory::Embedding, embedding_dir);

    if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
        std::cerr << "[ERROR] curl_global_init failed\n";
        return 1;
    }
    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);

    int rc = 0;
    try {
        ConfigStore config(cfg);
        WebsocketConnector connector;
        HttpFallbackSender fallback([&config] { return config.credentials(); });
        CurlArtifactFetcher fetcher;
        MetadataSidecarWriter sidecars;

        LinkWorker worker(config, std::move(registry), LinkServices{connector, fallback, fetcher, sidecars});
        if (generate_only) {
            worker.generate_sidecars();
        } else {
            worker.start();
            while (!g_stop) std::this_thread::sleep_for(std::chrono::milliseconds(200));
            log_info("Shutting down");
            worker.stop();
        }
    } catch (const std::exception& e) {
        log_error(e.what());
        rc = 1;
    }
    curl_global_cleanup();
    return rc;
}
