#include "wav.hpp"

#include <algorithm>
#include <cstring>
#include <limits>
#include <print>

namespace wav {

std::array<uint8_t, HEADER_SIZE> header(uint32_t data_size, uint32_t sample_rate,
                                        uint16_t channels) {
    uint32_t byte_rate = sample_rate * channels * BITS_PER_SAMPLE / 8;
    uint16_t block_align = channels * BITS_PER_SAMPLE / 8;
    uint32_t file_size = 36 + data_size;

    std::array<uint8_t, HEADER_SIZE> out{};
    auto w = [&out, pos = size_t(0)](const void* data, size_t len) mutable {
        std::memcpy(out.data() + pos, data, len);
        pos += len;
    };
    auto w16 = [&w](uint16_t v) { w(&v, 2); };
    auto w32 = [&w](uint32_t v) { w(&v, 4); };

    w("RIFF", 4);
    w32(file_size);
    w("WAVE", 4);
    w("fmt ", 4);
    w32(16);                // subchunk1 size
    w16(1);                 // PCM format
    w16(channels);
    w32(sample_rate);
    w32(byte_rate);
    w16(block_align);
    w16(BITS_PER_SAMPLE);
    w("data", 4);
    w32(data_size);
    return out;
}

std::expected<Info, std::string> read_info(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return std::unexpected("cannot open " + path);
    }

    char riff[12];
    if (!in.read(riff, sizeof(riff)) || std::memcmp(riff, "RIFF", 4) != 0 ||
        std::memcmp(riff + 8, "WAVE", 4) != 0) {
        return std::unexpected("not a RIFF/WAVE file: " + path);
    }

    Info info;
    bool have_fmt = false;
    char chunk[8];
    while (in.read(chunk, sizeof(chunk))) {
        uint32_t size;
        std::memcpy(&size, chunk + 4, 4);

        if (std::memcmp(chunk, "fmt ", 4) == 0) {
            if (size < 16) return std::unexpected("fmt chunk too small");
            char fmt[16];
            if (!in.read(fmt, sizeof(fmt))) return std::unexpected("truncated fmt chunk");
            std::memcpy(&info.format, fmt, 2);
            std::memcpy(&info.channels, fmt + 2, 2);
            std::memcpy(&info.sample_rate, fmt + 4, 4);
            std::memcpy(&info.bits_per_sample, fmt + 14, 2);
            in.seekg(size - 16 + (size & 1), std::ios::cur);
            have_fmt = true;
        } else if (std::memcmp(chunk, "data", 4) == 0) {
            if (!have_fmt) return std::unexpected("data chunk before fmt chunk");
            info.data_offset = static_cast<uint64_t>(in.tellg());
            info.data_size = size;

            // A writer that never finalized leaves the size at zero; trust the file length.
            in.seekg(0, std::ios::end);
            auto remaining = static_cast<uint64_t>(in.tellg()) - info.data_offset;
            if (info.data_size == 0 || info.data_size > remaining) {
                info.data_size = static_cast<uint32_t>(
                    std::min<uint64_t>(remaining, std::numeric_limits<uint32_t>::max()));
            }
            return info;
        } else {
            in.seekg(size + (size & 1), std::ios::cur);
        }
    }

    return std::unexpected("no data chunk in " + path);
}

std::expected<std::vector<int16_t>, std::string> read_samples(const std::string& path) {
    auto info = read_info(path);
    if (!info) return std::unexpected(info.error());

    if (info->format != 1 || info->bits_per_sample != BITS_PER_SAMPLE) {
        return std::unexpected("unsupported encoding (want 16-bit PCM)");
    }
    if (info->sample_rate != SAMPLE_RATE || info->channels != CHANNELS) {
        return std::unexpected("unsupported layout " + std::to_string(info->sample_rate) + " Hz, " +
                               std::to_string(info->channels) + " ch (want 16000 Hz mono)");
    }

    std::ifstream in(path, std::ios::binary);
    in.seekg(static_cast<std::streamoff>(info->data_offset));

    std::vector<int16_t> samples(info->data_size / sizeof(int16_t));
    if (!samples.empty() &&
        !in.read(reinterpret_cast<char*>(samples.data()),
                 static_cast<std::streamsize>(samples.size() * sizeof(int16_t)))) {
        return std::unexpected("truncated sample data in " + path);
    }
    return samples;
}

Writer::Writer(uint32_t max_data_bytes)
    : max_data_bytes_(std::min(max_data_bytes, MAX_DATA_BYTES)) {}

Writer::~Writer() {
    if (out_.is_open()) finalize();
}

bool Writer::open(const std::string& path, uint32_t sample_rate) {
    close();
    sample_rate_ = sample_rate;
    data_bytes_ = 0;
    limit_reached_ = false;

    out_.open(path, std::ios::binary | std::ios::trunc);
    if (!out_.is_open()) return false;

    auto hdr = header(0, sample_rate_);
    out_.write(reinterpret_cast<const char*>(hdr.data()), hdr.size());
    return out_.good();
}

bool Writer::append(std::span<const int16_t> samples) {
    if (!out_.is_open()) return false;
    if (samples.empty()) return true;

    // Whole samples only, so the data chunk stays aligned.
    size_t room = (max_data_bytes_ - data_bytes_) & ~size_t(1);
    size_t bytes = samples.size() * sizeof(int16_t);
    if (bytes > room) {
        if (!limit_reached_) {
            std::println(stderr, "wav: data size limit of {} bytes reached, dropping further audio",
                         max_data_bytes_);
            limit_reached_ = true;
        }
        bytes = room;
        if (bytes == 0) return true;
    }

    out_.write(reinterpret_cast<const char*>(samples.data()),
               static_cast<std::streamsize>(bytes));
    if (!out_.good()) return false;

    data_bytes_ += static_cast<uint32_t>(bytes);
    return true;
}

bool Writer::finalize() {
    if (!out_.is_open()) return false;

    auto hdr = header(data_bytes_, sample_rate_);
    out_.seekp(0);
    out_.write(reinterpret_cast<const char*>(hdr.data()), hdr.size());
    out_.flush();
    bool ok = out_.good();
    out_.close();
    return ok;
}

void Writer::close() {
    if (out_.is_open()) out_.close();
}

} // namespace wav
