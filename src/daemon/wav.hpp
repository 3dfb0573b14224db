#pragma once

#include <array>
#include <cstdint>
#include <expected>
#include <fstream>
#include <span>
#include <string>
#include <vector>

// 16-bit PCM WAV helpers. Recordings are always 16 kHz mono; the engine
// contract depends on it.
namespace wav {

constexpr uint32_t SAMPLE_RATE = 16000;
constexpr uint16_t CHANNELS = 1;
constexpr uint16_t BITS_PER_SAMPLE = 16;
constexpr size_t HEADER_SIZE = 44;
// RIFF sizes are 32-bit; the RIFF chunk size is 36 + data size.
constexpr uint32_t MAX_DATA_BYTES = UINT32_MAX - 36;

std::array<uint8_t, HEADER_SIZE> header(uint32_t data_size, uint32_t sample_rate = SAMPLE_RATE,
                                        uint16_t channels = CHANNELS);

struct Info {
    uint16_t format = 0;
    uint16_t channels = 0;
    uint32_t sample_rate = 0;
    uint16_t bits_per_sample = 0;
    uint32_t data_size = 0;
    uint64_t data_offset = 0;

    double duration_s() const {
        uint32_t frame = channels * (bits_per_sample / 8u);
        if (frame == 0 || sample_rate == 0) return 0.0;
        return static_cast<double>(data_size / frame) / sample_rate;
    }
};

// Walks the RIFF chunks; tolerates extra chunks (LIST, fact) before "data".
std::expected<Info, std::string> read_info(const std::string& path);

// Reads a 16 kHz mono 16-bit PCM file. Any other layout is rejected.
std::expected<std::vector<int16_t>, std::string> read_samples(const std::string& path);

// Streams samples into a WAV file. The header is written on open() with a
// zero data size and patched on finalize().
class Writer {
public:
    explicit Writer(uint32_t max_data_bytes = MAX_DATA_BYTES);
    ~Writer();

    Writer(const Writer&) = delete;
    Writer& operator=(const Writer&) = delete;

    bool open(const std::string& path, uint32_t sample_rate = SAMPLE_RATE);
    // Samples past the data size limit are discarded; the first cut is logged.
    bool append(std::span<const int16_t> samples);
    bool finalize();
    // Closes without patching the header.
    void close();

    bool is_open() const { return out_.is_open(); }
    uint32_t data_bytes() const { return data_bytes_; }
    bool limit_reached() const { return limit_reached_; }

private:
    std::ofstream out_;
    uint32_t sample_rate_ = SAMPLE_RATE;
    uint32_t max_data_bytes_;
    uint32_t data_bytes_ = 0;
    bool limit_reached_ = false;
};

} // namespace wav
