#include "../include/http_client.hpp"
#include <curl/curl.h>
#include <fstream>
#include <stdexcept>

namespace {
const char* kUserAgent = "model-link/1.0";
constexpr long kDownloadBufferSize = 512L * 1024L;

static size_t write_cb(void* contents, size_t size, size_t nmemb, void* userp) {
    size_t total = size * nmemb;
    std::string* s = static_cast<std::string*>(userp);
    s->append(static_cast<char*>(contents), total);
    return total;
}

struct FileSink {
    std::ofstream out;
    bool failed{false};
};

static size_t file_write_cb(void* contents, size_t size, size_t nmemb, void* userp) {
    size_t total = size * nmemb;
    auto* sink = static_cast<FileSink*>(userp);
    sink->out.write(static_cast<const char*>(contents), static_cast<std::streamsize>(total));
    if (!sink->out) {
        sink->failed = true;
        return 0;
    }
    return total;
}

static int xferinfo_cb(void* clientp, curl_off_t dltotal, curl_off_t dlnow, curl_off_t, curl_off_t) {
    auto* progress = static_cast<const TransferProgress*>(clientp);
    if (!progress || !*progress) return 0;
    return (*progress)(static_cast<std::int64_t>(dlnow), static_cast<std::int64_t>(dltotal)) ? 0 : 1;
}

struct CurlHandle {
    CURL* h{nullptr};
    CurlHandle() { h = curl_easy_init(); if (!h) throw std::runtime_error("curl_easy_init failed"); }
    ~CurlHandle() { if (h) curl_easy_cleanup(h); }
    CurlHandle(const CurlHandle&) = delete;
    CurlHandle& operator=(const CurlHandle&) = delete;
};

struct CurlHeaders {
    struct curl_slist* list{nullptr};
    ~CurlHeaders() { if (list) curl_slist_free_all(list); }
    void add(const std::string& line) { list = curl_slist_append(list, line.c_str()); }
};

static void add_headers(CurlHeaders& out, const HttpHeaders& headers) {
    for (const auto& h : headers) out.add(h.first + ": " + h.second);
}
}

bool http_ok(long status) {
    return status >= 200 && status < 300;
}

HttpResponse http_send_json(const std::string& method, const std::string& url, const std::string& json_body,
                            const HttpHeaders& headers, long timeout_ms) {
    CurlHandle c;
    CurlHeaders hdrs;
    hdrs.add("Content-Type: application/json");
    add_headers(hdrs, headers);

    std::string buf;
    curl_easy_setopt(c.h, CURLOPT_URL, url.c_str());
    curl_easy_setopt(c.h, CURLOPT_CUSTOMREQUEST, method.c_str());
    curl_easy_setopt(c.h, CURLOPT_HTTPHEADER, hdrs.list);
    curl_easy_setopt(c.h, CURLOPT_USERAGENT, kUserAgent);
    curl_easy_setopt(c.h, CURLOPT_POSTFIELDS, json_body.c_str());
    curl_easy_setopt(c.h, CURLOPT_POSTFIELDSIZE, (long)json_body.size());
    curl_easy_setopt(c.h, CURLOPT_WRITEFUNCTION, write_cb);
    curl_easy_setopt(c.h, CURLOPT_WRITEDATA, &buf);
    curl_easy_setopt(c.h, CURLOPT_TIMEOUT_MS, timeout_ms);
    curl_easy_setopt(c.h, CURLOPT_NOSIGNAL, 1L);

    CURLcode code = curl_easy_perform(c.h);
    if (code != CURLE_OK) {
        throw std::runtime_error(std::string("curl_easy_perform failed: ") + curl_easy_strerror(code));
    }
    HttpResponse resp;
    curl_easy_getinfo(c.h, CURLINFO_RESPONSE_CODE, &resp.status);
    resp.body = std::move(buf);
    return resp;
}

void http_download_file(const std::string& url, const std::filesystem::path& path,
                        const TransferProgress& progress, const HttpHeaders& headers) {
    FileSink sink;
    sink.out.open(path, std::ios::binary | std::ios::trunc);
    if (!sink.out) throw std::runtime_error("Cannot open " + path.string() + " for writing");

    CurlHandle c;
    CurlHeaders hdrs;
    add_headers(hdrs, headers);

    curl_easy_setopt(c.h, CURLOPT_URL, url.c_str());
    if (hdrs.list) curl_easy_setopt(c.h, CURLOPT_HTTPHEADER, hdrs.list);
    curl_easy_setopt(c.h, CURLOPT_USERAGENT, kUserAgent);
    curl_easy_setopt(c.h, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(c.h, CURLOPT_MAXREDIRS, 10L);
    curl_easy_setopt(c.h, CURLOPT_FAILONERROR, 1L);
    curl_easy_setopt(c.h, CURLOPT_BUFFERSIZE, kDownloadBufferSize);
    curl_easy_setopt(c.h, CURLOPT_WRITEFUNCTION, file_write_cb);
    curl_easy_setopt(c.h, CURLOPT_WRITEDATA, &sink);
    curl_easy_setopt(c.h, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(c.h, CURLOPT_XFERINFOFUNCTION, xferinfo_cb);
    curl_easy_setopt(c.h, CURLOPT_XFERINFODATA, &progress);
    curl_easy_setopt(c.h, CURLOPT_NOSIGNAL, 1L);

    CURLcode code = curl_easy_perform(c.h);
    sink.out.close();
    if (code == CURLE_ABORTED_BY_CALLBACK) throw std::runtime_error("Download cancelled");
    if (code == CURLE_HTTP_RETURNED_ERROR) {
        long status = 0;
        curl_easy_getinfo(c.h, CURLINFO_RESPONSE_CODE, &status);
        throw std::runtime_error("Download failed: HTTP " + std::to_string(status));
    }
    if (code == CURLE_WRITE_ERROR && sink.failed) throw std::runtime_error("Write failed: " + path.string());
    if (code != CURLE_OK) {
        throw std::runtime_error(std::string("Download failed: ") + curl_easy_strerror(code));
    }
    if (!sink.out && !sink.failed) {
        // close() flushes; a failure there means the tail never reached disk
        throw std::runtime_error("Write failed: " + path.string());
    }
}

std::string url_unescape(const std::string& s) {
    CurlHandle c;
    int out_len = 0;
    char* out = curl_easy_unescape(c.h, s.c_str(), (int)s.size(), &out_len);
    if (!out) throw std::runtime_error("curl_easy_unescape failed");
    std::string decoded(out, (size_t)out_len);
    curl_free(out);
    return decoded;
}
