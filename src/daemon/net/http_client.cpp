#include "net/http_client.hpp"

#include <curl/curl.h>
#include <fstream>
#include <memory>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace http {

namespace {

struct CurlDeleter {
    void operator()(CURL* c) const { curl_easy_cleanup(c); }
};
using CurlPtr = std::unique_ptr<CURL, CurlDeleter>;

struct SlistDeleter {
    void operator()(curl_slist* l) const { curl_slist_free_all(l); }
};
using SlistPtr = std::unique_ptr<curl_slist, SlistDeleter>;

size_t write_string(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* resp = static_cast<std::string*>(userdata);
    resp->append(ptr, size * nmemb);
    return size * nmemb;
}

struct FileSink {
    std::ofstream out;
    const ByteCallback* on_bytes;
    bool aborted = false;
};

size_t write_file(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* sink = static_cast<FileSink*>(userdata);
    size_t n = size * nmemb;
    sink->out.write(ptr, static_cast<std::streamsize>(n));
    if (!sink->out) return 0;
    if (*sink->on_bytes && !(*sink->on_bytes)(n)) {
        sink->aborted = true;
        return 0;
    }
    return n;
}

// Runs about once a second even when no data arrives, so a stalled
// transfer can still be aborted.
int transfer_info(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* sink = static_cast<FileSink*>(userdata);
    if (*sink->on_bytes && !(*sink->on_bytes)(0)) {
        sink->aborted = true;
        return 1;
    }
    return 0;
}

void apply_timeouts(CURL* curl, const Options& opts) {
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, opts.timeout_s);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, opts.connect_timeout_s);
    if (opts.low_speed_time_s > 0) {
        curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, 1L);
        curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME, opts.low_speed_time_s);
    }
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
}

Result<json> perform_json(CURL* curl, const std::string& url) {
    std::string body;
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_string);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &body);

    CURLcode res = curl_easy_perform(curl);
    if (res != CURLE_OK) {
        return make_error(ErrorKind::TransientIO,
                          std::string("curl error: ") + curl_easy_strerror(res));
    }

    long code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &code);

    auto j = json::parse(body, nullptr, false);
    if (j.is_discarded()) {
        if (code >= 400) {
            return make_error(ErrorKind::TransientIO,
                              "HTTP " + std::to_string(code) + " from " + url);
        }
        return make_error(ErrorKind::TransientIO, "invalid JSON from " + url);
    }
    // Error bodies are returned as-is so callers can read their details.
    return j;
}

} // namespace

GlobalInit::GlobalInit() {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

GlobalInit::~GlobalInit() {
    curl_global_cleanup();
}

Result<json> post_json(const std::string& url, const json& body, const Options& opts) {
    CurlPtr curl(curl_easy_init());
    if (!curl) return make_error(ErrorKind::TransientIO, "curl_easy_init failed");

    auto payload = body.dump();
    SlistPtr headers(curl_slist_append(nullptr, "Content-Type: application/json"));

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, payload.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(payload.size()));
    apply_timeouts(curl.get(), opts);

    return perform_json(curl.get(), url);
}

Result<json> get_json(const std::string& url, const Options& opts) {
    CurlPtr curl(curl_easy_init());
    if (!curl) return make_error(ErrorKind::TransientIO, "curl_easy_init failed");

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_HTTPGET, 1L);
    apply_timeouts(curl.get(), opts);

    return perform_json(curl.get(), url);
}

Result<void> download_file(const std::string& url, const fs::path& dest,
                           const ByteCallback& on_bytes, const Options& opts) {
    std::error_code ec;
    fs::create_directories(dest.parent_path(), ec);
    if (ec) {
        return make_error(ErrorKind::TransientIO,
                          "cannot create " + dest.parent_path().string() + ": " + ec.message());
    }

    auto partial = dest;
    partial += ".part";

    FileSink sink{.out = std::ofstream(partial, std::ios::binary | std::ios::trunc),
                  .on_bytes = &on_bytes};
    if (!sink.out.is_open()) {
        return make_error(ErrorKind::TransientIO, "cannot write " + partial.string());
    }

    CurlPtr curl(curl_easy_init());
    if (!curl) return make_error(ErrorKind::TransientIO, "curl_easy_init failed");

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_file);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &sink);
    curl_easy_setopt(curl.get(), CURLOPT_XFERINFOFUNCTION, transfer_info);
    curl_easy_setopt(curl.get(), CURLOPT_XFERINFODATA, &sink);
    curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl.get(), CURLOPT_FAILONERROR, 1L);
    apply_timeouts(curl.get(), opts);

    CURLcode res = curl_easy_perform(curl.get());
    sink.out.close();

    if (res != CURLE_OK) {
        fs::remove(partial, ec);
        if (sink.aborted) {
            return make_error(ErrorKind::DownloadCancelled, "transfer aborted: " + url);
        }
        return make_error(ErrorKind::TransientIO,
                          std::string("curl error: ") + curl_easy_strerror(res) + " (" + url + ")");
    }

    fs::rename(partial, dest, ec);
    if (ec) {
        return make_error(ErrorKind::TransientIO,
                          "cannot move " + partial.string() + ": " + ec.message());
    }
    return {};
}

std::string escape(const std::string& s) {
    CurlPtr curl(curl_easy_init());
    if (!curl) return s;
    char* out = curl_easy_escape(curl.get(), s.c_str(), static_cast<int>(s.size()));
    if (!out) return s;
    std::string result(out);
    curl_free(out);
    return result;
}

} // namespace http
