#include "lan_engine.hpp"
#include "wav.hpp"

#include <curl/curl.h>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

static size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* resp = static_cast<std::string*>(userdata);
    resp->append(ptr, size * nmemb);
    return size * nmemb;
}

static void add_field(curl_mime* mime, const char* name, const std::string& value) {
    curl_mimepart* part = curl_mime_addpart(mime);
    curl_mime_name(part, name);
    curl_mime_data(part, value.c_str(), CURL_ZERO_TERMINATED);
}

std::expected<TranscriptResult, Error> parse_lan_response(long http_status,
                                                          const std::string& body,
                                                          double audio_duration_s) {
    auto j = json::parse(body, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        if (http_status >= 400) {
            return std::unexpected(Error{ErrorKind::Engine,
                "server returned HTTP " + std::to_string(http_status)});
        }
        return std::unexpected(Error{ErrorKind::Engine, "malformed server reply: " + body});
    }

    if (j.contains("error")) {
        const auto& e = j["error"];
        std::string msg = e.is_string() ? e.get<std::string>()
                        : e.is_object() && e.contains("message") && e["message"].is_string()
                              ? e["message"].get<std::string>()
                              : e.dump();
        return std::unexpected(Error{ErrorKind::Engine, "server error: " + msg});
    }
    if (http_status >= 400) {
        return std::unexpected(Error{ErrorKind::Engine,
            "server returned HTTP " + std::to_string(http_status) + ": " + body});
    }

    const auto it = j.find("text");
    if (it == j.end() || !it->is_string()) {
        return std::unexpected(Error{ErrorKind::EmptyResult, "server returned no text"});
    }
    auto text = trim_whitespace(it->get_ref<const std::string&>());
    if (text.empty()) {
        return std::unexpected(Error{ErrorKind::EmptyResult, "server returned no text"});
    }

    return TranscriptResult{
        .text = std::move(text),
        .duration_s = audio_duration_s,
    };
}

LanEngine::LanEngine(std::string url, std::string api_format)
    : url_(std::move(url)), api_format_(std::move(api_format)) {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

LanEngine::~LanEngine() {
    curl_global_cleanup();
}

std::expected<TranscriptResult, Error>
LanEngine::transcribe(const TranscribeRequest& request) {
    auto info = wav::read_info(request.audio_path);
    if (!info) {
        return std::unexpected(Error{ErrorKind::CorruptArtifact, info.error()});
    }

    CURL* curl = curl_easy_init();
    if (!curl) {
        return std::unexpected(Error{ErrorKind::Engine, "curl_easy_init failed"});
    }

    bool openai = api_format_ == "openai";
    std::string endpoint = url_ + (openai ? "/v1/audio/transcriptions" : "/inference");

    curl_mime* mime = curl_mime_init(curl);

    // Streamed from disk by libcurl; the recording is never held in memory here.
    curl_mimepart* part = curl_mime_addpart(mime);
    curl_mime_name(part, "file");
    curl_mime_filedata(part, request.audio_path.c_str());
    curl_mime_filename(part, "audio.wav");
    curl_mime_type(part, "audio/wav");

    add_field(mime, "response_format", "json");
    if (openai) {
        add_field(mime, "model", "whisper-1");
        // OpenAI detects the language when the field is absent.
        if (request.language != "auto") add_field(mime, "language", request.language);
    } else {
        add_field(mime, "temperature", "0.0");
        add_field(mime, "language", request.language);
    }

    std::string response_body;

    curl_easy_setopt(curl, CURLOPT_URL, endpoint.c_str());
    curl_easy_setopt(curl, CURLOPT_MIMEPOST, mime);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_body);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, 300L);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, 10L);

    CURLcode res = curl_easy_perform(curl);
    long http_status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_status);

    curl_mime_free(mime);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK) {
        return std::unexpected(Error{ErrorKind::Engine,
            std::string("curl error: ") + curl_easy_strerror(res)});
    }

    return parse_lan_response(http_status, response_body, info->duration_s());
}
