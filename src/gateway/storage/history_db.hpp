#pragma once

#include "../whisper/protocol.hpp"

#include <cstdint>
#include <mutex>
#include <sqlite3.h>
#include <string>
#include <vector>

struct HistoryEntry {
    int64_t id;
    std::string timestamp;
    std::string text;
    std::string language;
    std::string model;
    std::string task;
    std::string source;
    int64_t audio_bytes;
    double processing_time;
};

// Transcriptions served by the gateway. All methods may be called from any
// request thread.
class HistoryDb {
public:
    HistoryDb();
    ~HistoryDb();

    HistoryDb(const HistoryDb&) = delete;
    HistoryDb& operator=(const HistoryDb&) = delete;

    bool open(const std::string& path);
    void close();
    bool is_open() const;

    bool insert(const TranscriptionResult& result, const TranscribeParams& params,
                const std::string& source, size_t audio_bytes, double processing_time);

    std::vector<HistoryEntry> recent(int limit = 10);

private:
    bool create_tables();
    void close_locked();

    mutable std::mutex mutex_;
    sqlite3* db_ = nullptr;
    sqlite3_stmt* insert_stmt_ = nullptr;
    sqlite3_stmt* recent_stmt_ = nullptr;
};
