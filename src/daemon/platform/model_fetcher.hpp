#pragma once

#include <expected>
#include <string>

class ModelFetcher {
public:
    virtual ~ModelFetcher() = default;
    // Downloads url into dest_path. On failure dest_path may be left partial.
    virtual std::expected<void, std::string> fetch(const std::string& url,
                                                   const std::string& dest_path) = 0;
};
