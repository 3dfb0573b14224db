#include "model_manager.hpp"

#include <filesystem>
#include <format>
#include <print>

namespace fs = std::filesystem;

namespace models {

const std::vector<ModelSpec>& catalog() {
    static const std::vector<ModelSpec> specs = {
        {.name = "tiny", .size_hint = "75 MB"},
        {.name = "tiny.en", .size_hint = "75 MB"},
        {.name = "base", .size_hint = "142 MB"},
        {.name = "base.en", .size_hint = "142 MB"},
        {.name = "small", .size_hint = "466 MB"},
        {.name = "small.en", .size_hint = "466 MB"},
        {.name = "medium", .size_hint = "1.5 GB"},
        {.name = "large-v3", .size_hint = "2.9 GB"},
    };
    return specs;
}

std::optional<ModelSpec> find(std::string_view name) {
    for (const auto& spec : catalog()) {
        if (spec.name == name) return spec;
    }
    return std::nullopt;
}

const ModelSpec& default_spec() {
    return catalog().front();
}

} // namespace models

namespace {

bool larger_than(const std::string& path, uint64_t min_bytes) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) return false;
    auto size = fs::file_size(path, ec);
    return !ec && size > min_bytes;
}

} // namespace

ModelManager::ModelManager(ModelLocations locations, ModelFetcher& fetcher)
    : locations_(std::move(locations)), fetcher_(fetcher) {}

ModelState ModelManager::initialize(const ModelSpec& spec) {
    begin(spec);
    return complete(spec, materialize(spec));
}

ModelState ModelManager::change_model(const ModelSpec& spec) {
    return initialize(spec);
}

void ModelManager::begin(const ModelSpec& spec) {
    spec_ = spec;
    model_path_.clear();
    set_state(ModelInitializing{spec.name});
}

std::expected<std::string, Error> ModelManager::materialize(const ModelSpec& spec) const {
    auto dest = cached_path(spec);
    if (larger_than(dest, spec.expected_min_size_bytes)) {
        return dest;
    }

    std::error_code ec;
    if (fs::exists(dest, ec)) {
        std::println(stderr, "model: cached {} is below {} bytes, replacing",
                     dest, spec.expected_min_size_bytes);
    }

    fs::create_directories(locations_.cache_dir, ec);
    if (ec) {
        return std::unexpected(Error{ErrorKind::ModelInit,
            std::format("cannot create {}: {}", locations_.cache_dir, ec.message())});
    }

    auto part = dest + ".part";

    auto copied = copy_from_bundle(spec, part);
    if (copied) copied = promote(spec, part, dest);
    if (copied) {
        std::println(stderr, "model: {} copied from bundle to {}", spec.name, dest);
        return dest;
    }
    std::println(stderr, "model: bundle unavailable for {}: {}", spec.name, copied.error());

    auto fetched = fetch_from_network(spec, part);
    if (fetched) fetched = promote(spec, part, dest);
    if (fetched) {
        std::println(stderr, "model: {} downloaded to {}", spec.name, dest);
        return dest;
    }
    std::println(stderr, "model: download failed for {}: {}", spec.name, fetched.error());

    fs::remove(part, ec);
    return std::unexpected(Error{ErrorKind::ModelInit,
        std::format("model {} unavailable (bundle: {}; download: {})",
                    spec.name, copied.error(), fetched.error())});
}

const ModelState& ModelManager::complete(const ModelSpec& spec,
                                         const std::expected<std::string, Error>& result) {
    spec_ = spec;
    if (result) {
        model_path_ = *result;
        set_state(ModelReady{spec.name});
    } else {
        model_path_.clear();
        set_state(ModelFailed{result.error().message});
    }
    return state_;
}

std::string ModelManager::cached_path(const ModelSpec& spec) const {
    return (fs::path(locations_.cache_dir) / spec.file_name()).string();
}

std::string ModelManager::bundled_path(const ModelSpec& spec) const {
    return (fs::path(locations_.bundle_dir) / spec.file_name()).string();
}

std::string ModelManager::download_url(const ModelSpec& spec) const {
    auto base = locations_.download_url;
    while (!base.empty() && base.back() == '/') base.pop_back();
    return base + "/" + spec.file_name();
}

bool ModelManager::is_cached(const ModelSpec& spec) const {
    return larger_than(cached_path(spec), spec.expected_min_size_bytes);
}

std::expected<void, std::string> ModelManager::copy_from_bundle(const ModelSpec& spec,
                                                                const std::string& part) const {
    if (locations_.bundle_dir.empty()) return std::unexpected("no bundle directory");

    auto src = bundled_path(spec);
    std::error_code ec;
    if (!fs::is_regular_file(src, ec)) return std::unexpected("not found at " + src);

    fs::copy_file(src, part, fs::copy_options::overwrite_existing, ec);
    if (ec) return std::unexpected(std::format("copy {} failed: {}", src, ec.message()));
    return {};
}

std::expected<void, std::string> ModelManager::fetch_from_network(const ModelSpec& spec,
                                                                  const std::string& part) const {
    if (locations_.download_url.empty()) return std::unexpected("no download url");
    return fetcher_.fetch(download_url(spec), part);
}

std::expected<void, std::string> ModelManager::promote(const ModelSpec& spec,
                                                       const std::string& part,
                                                       const std::string& dest) const {
    std::error_code ec;
    if (!larger_than(part, spec.expected_min_size_bytes)) {
        uintmax_t size = fs::file_size(part, ec);
        if (ec) size = 0;
        fs::remove(part, ec);
        return std::unexpected(std::format("file too small ({} bytes)", size));
    }

    fs::rename(part, dest, ec);
    if (ec) {
        auto reason = "rename into cache failed: " + ec.message();
        fs::remove(part, ec);
        return std::unexpected(reason);
    }
    return {};
}

void ModelManager::set_state(ModelState state) {
    state_ = std::move(state);
    if (listener_) listener_(state_);
}
