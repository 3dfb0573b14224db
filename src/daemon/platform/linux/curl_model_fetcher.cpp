#include "platform/linux/curl_model_fetcher.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <curl/curl.h>
#include <print>

namespace {

size_t write_to_file(char* ptr, size_t size, size_t nmemb, void* userdata) {
    return std::fwrite(ptr, size, nmemb, static_cast<FILE*>(userdata)) * size;
}

} // namespace

CurlModelFetcher::CurlModelFetcher() {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

CurlModelFetcher::~CurlModelFetcher() {
    curl_global_cleanup();
}

std::expected<void, std::string> CurlModelFetcher::fetch(const std::string& url,
                                                         const std::string& dest_path) {
    FILE* out = std::fopen(dest_path.c_str(), "wb");
    if (!out) {
        return std::unexpected("cannot open " + dest_path + ": " + std::strerror(errno));
    }

    CURL* curl = curl_easy_init();
    if (!curl) {
        std::fclose(out);
        return std::unexpected(std::string("curl_easy_init failed"));
    }

    char errbuf[CURL_ERROR_SIZE] = {};

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_to_file);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, out);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_FAILONERROR, 1L);
    curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, errbuf);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, 15L);
    // Models are large; give up only when the transfer stalls.
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, 1024L);
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME, 60L);

    std::println(stderr, "model: downloading {}", url);
    CURLcode res = curl_easy_perform(curl);
    curl_easy_cleanup(curl);

    bool flushed = std::fclose(out) == 0;

    if (res != CURLE_OK) {
        std::string reason = errbuf[0] ? errbuf : curl_easy_strerror(res);
        return std::unexpected("download failed: " + reason);
    }
    if (!flushed) {
        return std::unexpected("write to " + dest_path + " failed");
    }
    return {};
}
