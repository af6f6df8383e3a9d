#pragma once
#include <sqlite3.h>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

namespace soda {

// Recognition session and result store.
// Schema:
//  - sessions(id INTEGER PK, started_ms INTEGER, ended_ms INTEGER, engine TEXT, language_pack TEXT)
//  - results(id INTEGER PK, session_id INTEGER, ts_ms INTEGER, is_final INTEGER, text TEXT)
//
// Notes:
//  * Times use system_clock millis so rows can be correlated with other logs.
//  * Threading: results arrive on engine threads, so every statement runs
//    under one mutex.
class TranscriptLog {
public:
    struct Entry {
        std::int64_t ts_ms;
        bool is_final;
        std::string text;
    };

    explicit TranscriptLog(const std::string& db_path);
    ~TranscriptLog();

    TranscriptLog(const TranscriptLog&) = delete;
    TranscriptLog& operator=(const TranscriptLog&) = delete;

    // Begins a session; returns the new session id.
    std::int64_t start_session(const std::string& engine, const std::string& language_pack);

    // Marks end time for a session.
    void end_session(std::int64_t session_id);

    void log_result(std::int64_t session_id, bool is_final, const std::string& text);

    // Results of one session in insertion order.
    std::vector<Entry> results(std::int64_t session_id, bool final_only = false);

    const std::string& path() const { return db_path_; }

private:
    void init_schema();
    static std::int64_t now_ms();

    std::string db_path_;
    sqlite3* db_ = nullptr;
    std::mutex mutex_;
};

} // namespace soda
