#pragma once
#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>
#include <utility>
#include <vector>

struct HttpResponse {
    long status{0};
    std::string body;
};

using HttpHeaders = std::vector<std::pair<std::string, std::string>>;

// Called with (bytes received, bytes expected or 0 when unknown). Returning false aborts the transfer.
using TransferProgress = std::function<bool(std::int64_t, std::int64_t)>;

// Sends json_body with the given method (POST, PATCH, ...). Throws std::runtime_error on transport failure;
// any HTTP status is returned to the caller.
HttpResponse http_send_json(const std::string& method, const std::string& url, const std::string& json_body,
                            const HttpHeaders& headers = {}, long timeout_ms = 30000);

// Streams url into path, truncating it first. No overall timeout: large artifacts may take hours.
// Throws std::runtime_error on transport failure, HTTP status >= 400, write failure, or abort.
void http_download_file(const std::string& url, const std::filesystem::path& path,
                        const TransferProgress& progress, const HttpHeaders& headers = {});

std::string url_unescape(const std::string& s);

bool http_ok(long status);
