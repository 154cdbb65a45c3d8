#pragma once

#include "platform/window_info.hpp"

#include <cstdint>
#include <sqlite3.h>
#include <string>
#include <vector>

struct TranscriptRecord {
    std::string text;
    double audio_duration = 0.0;
    double processing_time = 0.0;
    std::string recorder;  // audio capability name
    std::string model;
    std::string language;
    std::string delivery;  // pasted, clipboard, none
    WindowInfo target;
};

struct HistoryEntry {
    int64_t id = 0;
    std::string timestamp;
    TranscriptRecord record;
};

class HistoryDb {
public:
    HistoryDb();
    ~HistoryDb();

    HistoryDb(const HistoryDb&) = delete;
    HistoryDb& operator=(const HistoryDb&) = delete;

    bool open(const std::string& path);
    void close();
    bool is_open() const { return db_ != nullptr; }

    bool insert(const TranscriptRecord& rec);

    // Newest first.
    std::vector<HistoryEntry> recent(int limit = 10);

private:
    bool create_tables();

    sqlite3* db_ = nullptr;
    sqlite3_stmt* insert_stmt_ = nullptr;
    sqlite3_stmt* recent_stmt_ = nullptr;
};
