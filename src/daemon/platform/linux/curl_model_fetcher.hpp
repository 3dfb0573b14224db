#pragma once

#include "platform/model_fetcher.hpp"

// One-shot HTTP(S) download with libcurl, streamed straight to disk.
class CurlModelFetcher : public ModelFetcher {
public:
    CurlModelFetcher();
    ~CurlModelFetcher() override;

    CurlModelFetcher(const CurlModelFetcher&) = delete;
    CurlModelFetcher& operator=(const CurlModelFetcher&) = delete;

    std::expected<void, std::string> fetch(const std::string& url,
                                           const std::string& dest_path) override;
};
