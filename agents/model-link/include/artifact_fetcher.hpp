#pragma once
#include <filesystem>
#include <functional>
#include <string>
#include "cancellation.hpp"

// Receives completion in [0, 1].
using FetchProgress = std::function<void(double)>;

class ArtifactFetcher {
public:
    virtual ~ArtifactFetcher() = default;
    // Writes url to dest. Throws std::runtime_error on any failure, including cancellation.
    virtual void fetch(const std::string& url, const std::filesystem::path& dest, const FetchProgress& progress,
                       const CancellationSignal& stop) = 0;
};

class CurlArtifactFetcher : public ArtifactFetcher {
public:
    void fetch(const std::string& url, const std::filesystem::path& dest, const FetchProgress& progress,
               const CancellationSignal& stop) override;
};
