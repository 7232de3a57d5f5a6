#pragma once
#include <filesystem>
#include <string>
#include "messages.hpp"

struct SidecarRequest {
    std::filesystem::path model_path;
    std::string sha256;
    json meta;
    bool html_preview{false};
};

// Produces auxiliary files next to an installed model. Throws on failure.
class SidecarWriter {
public:
    virtual ~SidecarWriter() = default;
    virtual void write(const SidecarRequest& req) = 0;
};

// <stem>.metadata.json always, <stem>.html when html_preview is set.
class MetadataSidecarWriter : public SidecarWriter {
public:
    void write(const SidecarRequest& req) override;
};

std::string html_escape(const std::string& s);
