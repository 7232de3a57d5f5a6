#include "../include/job_processor.hpp"
#include "fixture_server.hpp"
#include "test_helpers.hpp"
#include <doctest/doctest.h>

using namespace std::chrono_literals;

namespace {
const char* kKey = "lk_0123456789abcdefABCDEF_-01234567";

std::string failure_of(const std::function<void()>& fn) {
    try {
        fn();
    } catch (const std::exception& e) {
        return e.what();
    }
    return "";
}

struct HttpPipeline {
    FixtureServer server;
    TempDir tmp;
    ConfigStore config{make_config()};
    PathResolver paths{registry_from_models_root(tmp.path / "models")};
    HashCache hashes{tmp.path / "data" / "hashes.json"};
    ChannelSlot slot;
    HttpFallbackSender fallback{[this] { return config.credentials(); }, 5000};
    Transport transport{slot, fallback};
    InventoryReporter inventory{transport};
    CurlArtifactFetcher fetcher;
    MetadataSidecarWriter sidecars;
    JobProcessor processor{config, paths, hashes, inventory, transport, fetcher, sidecars};
    CancellationSignal stop;

    HttpPipeline() {
        server.serve("PATCH", "/api/link/queue/3/progress", 200, "{\"ok\":true}");
        server.serve("POST", "/api/link/inventory", 200, "{\"ok\":true}");
    }

    WorkerConfig make_config() const {
        WorkerConfig c;
        c.base_url = server.url("/api/link");
        c.link_key = kKey;
        c.min_free_mb = 0;
        c.max_retries = 2;
        c.backoff_base = 1;
        c.data_dir = tmp.path / "data";
        return c;
    }

    std::vector<json> progress_bodies() const {
        std::vector<json> out;
        for (const auto& r : server.requests("PATCH", "/api/link/queue/3/progress")) out.push_back(json::parse(r.body));
        return out;
    }
};
}

TEST_SUITE("http") {
TEST_CASE("downloads a file and reports fractional progress") {
    FixtureServer server;
    std::string payload(300 * 1024, 'x');
    server.serve("GET", "/files/blob.bin", 200, payload, "application/octet-stream");
    TempDir tmp;
    CurlArtifactFetcher fetcher;
    CancellationSignal stop;
    std::vector<double> seen;

    fetcher.fetch(server.url("/files/blob.bin"), tmp.path / "blob.bin", [&](double f) { seen.push_back(f); }, stop);

    CHECK(read_file(tmp.path / "blob.bin") == payload);
    REQUIRE(!seen.empty());
    CHECK(seen.back() == doctest::Approx(1.0));
    CHECK(std::is_sorted(seen.begin(), seen.end()));
}

TEST_CASE("error statuses fail the download") {
    FixtureServer server;
    TempDir tmp;
    CurlArtifactFetcher fetcher;
    CancellationSignal stop;
    std::string err = failure_of([&] { fetcher.fetch(server.url("/missing"), tmp.path / "m.part", nullptr, stop); });
    CHECK(err.find("HTTP 404") != std::string::npos);
}

TEST_CASE("a cancelled signal aborts the transfer") {
    FixtureServer server;
    server.serve("GET", "/files/blob.bin", 200, std::string(64 * 1024, 'x'), "application/octet-stream");
    TempDir tmp;
    CurlArtifactFetcher fetcher;
    CancellationSignal stop;
    stop.cancel();
    std::string err =
        failure_of([&] { fetcher.fetch(server.url("/files/blob.bin"), tmp.path / "b.part", nullptr, stop); });
    CHECK(err == "Download cancelled");
}

TEST_CASE("json requests carry method, headers and body") {
    FixtureServer server;
    server.serve("PATCH", "/echo", 204, "");
    HttpResponse r = http_send_json("PATCH", server.url("/echo"), "{\"a\":1}", {{"x-link-key", kKey}});
    CHECK(r.status == 204);
    auto seen = server.requests("PATCH", "/echo");
    REQUIRE(seen.size() == 1);
    CHECK(seen[0].body == "{\"a\":1}");
    CHECK(seen[0].headers["x-link-key"] == kKey);
    CHECK(seen[0].headers["content-type"] == "application/json");
}
}

TEST_SUITE("http_fallback") {
TEST_CASE("progress and inventory map to their endpoints") {
    FixtureServer server;
    server.serve("PATCH", "/api/link/queue/9/progress", 200, "{}");
    server.serve("POST", "/api/link/inventory", 200, "{}");
    HttpFallbackSender sender([&] { return LinkCredentials{server.url("/api/link"), "", "legacy"}; }, 5000);

    CHECK(sender.deliver(make_progress(ProgressUpdate{9, 40, JobState::Downloading, "halfway"})));
    CHECK(sender.deliver(make_inventory({"aa", "bb"})));

    auto progress = server.requests("PATCH", "/api/link/queue/9/progress");
    REQUIRE(progress.size() == 1);
    json body = json::parse(progress[0].body);
    CHECK(body == json{{"progress", 40}, {"state", "DOWNLOADING"}, {"message", "halfway"}});
    CHECK(progress[0].headers["x-api-key"] == "legacy");
    CHECK(progress[0].headers.count("x-link-key") == 0);

    auto inv = server.requests("POST", "/api/link/inventory");
    REQUIRE(inv.size() == 1);
    CHECK(json::parse(inv[0].body) == json{{"hashes", {"aa", "bb"}}});
}

TEST_CASE("only progress and inventory have a fallback") {
    FixtureServer server;
    HttpFallbackSender sender([&] { return LinkCredentials{server.url("/api/link"), kKey, ""}; }, 5000);
    CHECK_FALSE(sender.deliver(make_poll()));
    CHECK_FALSE(sender.deliver(make_worker_state(true)));
    CHECK_FALSE(sender.deliver(make_reply("control_ack", {{"ok", true}})));
    CHECK(server.requests().empty());
}

TEST_CASE("rejected or unreachable deliveries report failure") {
    FixtureServer server;
    server.serve("POST", "/api/link/inventory", 503, "{}");
    HttpFallbackSender sender([&] { return LinkCredentials{server.url("/api/link"), kKey, ""}; }, 5000);
    CHECK_FALSE(sender.deliver(make_inventory({"aa"})));
    CHECK(server.requests().size() == 1);

    HttpFallbackSender unreachable([] { return LinkCredentials{"http://127.0.0.1:1/api/link", kKey, ""}; }, 2000);
    CHECK_FALSE(unreachable.deliver(make_inventory({"aa"})));
}
}

TEST_SUITE("http_pipeline") {
TEST_CASE("a job runs end to end over plain HTTP") {
    HttpPipeline p;
    std::string payload(128 * 1024, 'm');
    p.server.serve("GET", "/files/12_model.safetensors", 200, payload, "application/octet-stream");

    p.processor.process(Job{3, "models/lora", p.server.url("/files/12_model.safetensors"), sha256_of(payload),
                            json{{"name", "Model"}}},
                        p.stop);

    fs::path lora = fs::absolute(p.tmp.path / "models" / "Lora").lexically_normal();
    CHECK(read_file(lora / "model.safetensors") == payload);
    CHECK(fs::exists(lora / "model.metadata.json"));

    auto progress = p.progress_bodies();
    REQUIRE(progress.size() >= 2);
    CHECK(progress.front() == json{{"progress", 0}, {"state", "DOWNLOADING"}});
    CHECK(progress.back() == json{{"progress", 100}, {"state", "DONE"}});
    for (const auto& r : p.server.requests("PATCH", "/api/link/queue/3/progress")) {
        CHECK(r.headers.at("x-link-key") == kKey);
    }

    auto inv = p.server.requests("POST", "/api/link/inventory");
    REQUIRE(inv.size() == 1);
    CHECK(json::parse(inv[0].body)["hashes"] == json::array({sha256_of(payload)}));
}

TEST_CASE("server errors exhaust the retries") {
    HttpPipeline p;
    p.server.serve("GET", "/files/broken.safetensors", 500, "oops", "text/plain");

    p.processor.process(Job{3, "models/lora", p.server.url("/files/broken.safetensors"), "", std::nullopt}, p.stop);

    CHECK(p.server.requests("GET", "/files/broken.safetensors").size() == 2);
    json last = p.progress_bodies().back();
    CHECK(last["state"] == "ERROR");
    CHECK(last["message"].get<std::string>().find("HTTP 500") != std::string::npos);
    fs::path lora = fs::absolute(p.tmp.path / "models" / "Lora").lexically_normal();
    CHECK_FALSE(fs::exists(lora / "broken.safetensors.part"));
    CHECK(p.server.requests("POST", "/api/link/inventory").empty());
}

TEST_CASE("relative sources resolve against the service host") {
    HttpPipeline p;
    p.server.serve("GET", "/files/7_small.pt", 200, "tiny", "application/octet-stream");
    p.processor.process(Job{3, "models/lora", "/files/7_small.pt", "", std::nullopt}, p.stop);
    fs::path lora = fs::absolute(p.tmp.path / "models" / "Lora").lexically_normal();
    CHECK(read_file(lora / "small.pt") == "tiny");
    CHECK(p.progress_bodies().back()["state"] == "DONE");
}
}
