#pragma once

#include "errors.hpp"
#include "platform/model_fetcher.hpp"

#include <cstdint>
#include <expected>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

struct ModelSpec {
    std::string name;
    uint64_t expected_min_size_bytes = 100 * 1024;
    std::string size_hint;

    // Derived filename shared by the bundle, the cache and the download URL.
    std::string file_name() const { return "ggml-" + name + ".bin"; }
};

namespace models {

const std::vector<ModelSpec>& catalog();
std::optional<ModelSpec> find(std::string_view name);
// Smallest and fastest.
const ModelSpec& default_spec();

} // namespace models

struct ModelUninitialized {};
struct ModelInitializing { std::string model_name; };
struct ModelReady { std::string model_name; };
struct ModelFailed { std::string reason; };

using ModelState = std::variant<ModelUninitialized, ModelInitializing, ModelReady, ModelFailed>;

struct ModelLocations {
    std::string cache_dir;
    std::string bundle_dir;
    std::string download_url;
};

// Keeps one model file available in the local cache. A cached file is
// trusted when it is larger than ModelSpec::expected_min_size_bytes; there is no checksum.
class ModelManager {
public:
    using StateListener = std::function<void(const ModelState&)>;

    ModelManager(ModelLocations locations, ModelFetcher& fetcher);

    ModelManager(const ModelManager&) = delete;
    ModelManager& operator=(const ModelManager&) = delete;

    void set_listener(StateListener listener) { listener_ = std::move(listener); }

    // begin() + materialize() + complete() on the calling thread.
    ModelState initialize(const ModelSpec& spec);
    // Same as initialize(); Ready for the old model is dropped before any work.
    ModelState change_model(const ModelSpec& spec);

    // Split form for running materialize() off the event loop thread.
    void begin(const ModelSpec& spec);
    // Cache, then bundle, then network, strictly in that order. Returns the cached path.
    // Touches only the filesystem and the fetcher.
    std::expected<std::string, Error> materialize(const ModelSpec& spec) const;
    const ModelState& complete(const ModelSpec& spec,
                               const std::expected<std::string, Error>& result);

    const ModelState& state() const { return state_; }
    bool is_ready() const { return std::holds_alternative<ModelReady>(state_); }
    bool is_initializing() const { return std::holds_alternative<ModelInitializing>(state_); }
    const ModelSpec& current_spec() const { return spec_; }
    // Valid while Ready.
    const std::string& model_path() const { return model_path_; }

    std::string cached_path(const ModelSpec& spec) const;
    std::string bundled_path(const ModelSpec& spec) const;
    std::string download_url(const ModelSpec& spec) const;
    bool is_cached(const ModelSpec& spec) const;

private:
    std::expected<void, std::string> copy_from_bundle(const ModelSpec& spec,
                                                      const std::string& part) const;
    std::expected<void, std::string> fetch_from_network(const ModelSpec& spec,
                                                        const std::string& part) const;
    std::expected<void, std::string> promote(const ModelSpec& spec, const std::string& part,
                                             const std::string& dest) const;
    void set_state(ModelState state);

    ModelLocations locations_;
    ModelFetcher& fetcher_;
    ModelSpec spec_ = models::default_spec();
    ModelState state_ = ModelUninitialized{};
    std::string model_path_;
    StateListener listener_;
};
