#pragma once

#include <cstdint>
#include <sqlite3.h>
#include <string>
#include <vector>

// Where a transcript came from: the recording, and which model and engine produced it.
struct TranscriptContext {
    std::string audio_path;
    std::string model;
    std::string language;
    std::string engine;
};

struct HistoryEntry {
    int64_t id;
    std::string timestamp;
    std::string text;
    std::string audio_path;
    double audio_duration;
    double processing_time;
    std::string model;
    std::string language;
    std::string engine;
};

class HistoryDb {
public:
    HistoryDb() = default;
    ~HistoryDb();

    HistoryDb(const HistoryDb&) = delete;
    HistoryDb& operator=(const HistoryDb&) = delete;

    bool open(const std::string& path);
    void close();
    bool is_open() const { return db_ != nullptr; }

    bool insert(const std::string& text, double audio_duration, double processing_time,
                const TranscriptContext& context);

    // Newest first.
    std::vector<HistoryEntry> recent(int limit = 10);

private:
    bool create_tables();

    sqlite3* db_ = nullptr;
    sqlite3_stmt* insert_stmt_ = nullptr;
    sqlite3_stmt* recent_stmt_ = nullptr;
};
