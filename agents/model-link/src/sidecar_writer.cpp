#include "../include/sidecar_writer.hpp"
#include <fstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace {
void write_text(const fs::path& p, const std::string& text) {
    std::ofstream out(p, std::ios::binary | std::ios::trunc);
    if (!out) throw std::runtime_error("Cannot write " + p.string());
    out << text;
    if (!out) throw std::runtime_error("Write failed: " + p.string());
}
}

std::string html_escape(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        switch (c) {
        case '&': out += "&amp;"; break;
        case '<': out += "&lt;"; break;
        case '>': out += "&gt;"; break;
        case '"': out += "&quot;"; break;
        case '\'': out += "&#39;"; break;
        default: out += c;
        }
    }
    return out;
}

void MetadataSidecarWriter::write(const SidecarRequest& req) {
    fs::path dir = req.model_path.parent_path();
    std::string stem = req.model_path.stem().string();

    json doc = req.meta.is_object() ? req.meta : json{{"meta", req.meta}};
    doc["sha256"] = req.sha256;
    doc["file"] = req.model_path.filename().string();
    write_text(dir / (stem + ".metadata.json"), doc.dump(2));

    if (!req.html_preview) return;
    std::string title = string_field(req.meta, "name");
    if (title.empty()) title = string_field(req.meta, "title");
    if (title.empty()) title = stem;
    std::string description = string_field(req.meta, "description");

    std::string html;
    html += "<!DOCTYPE html>\n<html><head><meta charset=\"utf-8\"><title>" + html_escape(title) + "</title></head>\n<body>\n";
    html += "<h1>" + html_escape(title) + "</h1>\n";
    html += "<p>File: <code>" + html_escape(req.model_path.filename().string()) + "</code></p>\n";
    if (!req.sha256.empty()) html += "<p>SHA-256: <code>" + html_escape(req.sha256) + "</code></p>\n";
    if (!description.empty()) html += "<div>" + html_escape(description) + "</div>\n";
    html += "</body></html>\n";
    write_text(dir / (stem + ".html"), html);
}
