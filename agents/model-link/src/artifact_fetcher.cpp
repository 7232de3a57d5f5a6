#include "../include/artifact_fetcher.hpp"
#include "../../../shared/cpp/agent_sdk/include/http_client.hpp"

void CurlArtifactFetcher::fetch(const std::string& url, const std::filesystem::path& dest,
                                const FetchProgress& progress, const CancellationSignal& stop) {
    std::int64_t last = -1;
    http_download_file(url, dest, [&](std::int64_t now, std::int64_t total) {
        if (stop.cancelled()) return false;
        if (total > 0 && now != last && progress) {
            last = now;
            progress(static_cast<double>(now) / static_cast<double>(total));
        }
        return true;
    });
}
