#include "storage/transcript_log.hpp"
#include <chrono>
#include <filesystem>
#include <stdexcept>

namespace soda {

static void exec_sql(sqlite3* db, const char* sql) {
    char* err = nullptr;
    if (sqlite3_exec(db, sql, nullptr, nullptr, &err) != SQLITE_OK) {
        std::string msg = err ? err : "unknown error";
        sqlite3_free(err);
        throw std::runtime_error("SQLite exec failed: " + msg);
    }
}

// Finalizes on scope exit.
class Statement {
public:
    Statement(sqlite3* db, const char* sql) {
        if (sqlite3_prepare_v2(db, sql, -1, &st_, nullptr) != SQLITE_OK) {
            throw std::runtime_error(std::string("SQLite prepare failed: ") + sqlite3_errmsg(db));
        }
    }
    ~Statement() { sqlite3_finalize(st_); }
    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    sqlite3_stmt* get() const { return st_; }

private:
    sqlite3_stmt* st_ = nullptr;
};

TranscriptLog::TranscriptLog(const std::string& db_path) : db_path_(db_path) {
    std::filesystem::path p(db_path);
    if (p.has_parent_path()) {
        std::filesystem::create_directories(p.parent_path());
    }
    if (sqlite3_open(db_path.c_str(), &db_) != SQLITE_OK) {
        sqlite3_close(db_);
        db_ = nullptr;
        throw std::runtime_error("Cannot open SQLite DB at " + db_path);
    }
    init_schema();
}

TranscriptLog::~TranscriptLog() {
    if (db_) sqlite3_close(db_);
}

void TranscriptLog::init_schema() {
    const char* schema = R"SQL(
    PRAGMA journal_mode=WAL;
    CREATE TABLE IF NOT EXISTS sessions (
        id INTEGER PRIMARY KEY AUTOINCREMENT,
        started_ms INTEGER NOT NULL,
        ended_ms INTEGER,
        engine TEXT,
        language_pack TEXT
    );
    CREATE TABLE IF NOT EXISTS results (
        id INTEGER PRIMARY KEY AUTOINCREMENT,
        session_id INTEGER NOT NULL,
        ts_ms INTEGER NOT NULL,
        is_final INTEGER NOT NULL,
        text TEXT NOT NULL,
        FOREIGN KEY(session_id) REFERENCES sessions(id)
    );
    )SQL";
    exec_sql(db_, schema);
}

std::int64_t TranscriptLog::now_ms() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

std::int64_t TranscriptLog::start_session(const std::string& engine, const std::string& language_pack) {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement st(db_, "INSERT INTO sessions (started_ms, engine, language_pack) VALUES (?, ?, ?);");
    sqlite3_bind_int64(st.get(), 1, now_ms());
    sqlite3_bind_text(st.get(), 2, engine.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(st.get(), 3, language_pack.c_str(), -1, SQLITE_TRANSIENT);
    if (sqlite3_step(st.get()) != SQLITE_DONE) {
        throw std::runtime_error("Failed to insert session");
    }
    return sqlite3_last_insert_rowid(db_);
}

void TranscriptLog::end_session(std::int64_t session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement st(db_, "UPDATE sessions SET ended_ms=? WHERE id=?;");
    sqlite3_bind_int64(st.get(), 1, now_ms());
    sqlite3_bind_int64(st.get(), 2, session_id);
    if (sqlite3_step(st.get()) != SQLITE_DONE) {
        throw std::runtime_error("Failed to end session");
    }
}

void TranscriptLog::log_result(std::int64_t session_id, bool is_final, const std::string& text) {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement st(db_, "INSERT INTO results (session_id, ts_ms, is_final, text) VALUES (?, ?, ?, ?);");
    sqlite3_bind_int64(st.get(), 1, session_id);
    sqlite3_bind_int64(st.get(), 2, now_ms());
    sqlite3_bind_int(st.get(), 3, is_final ? 1 : 0);
    sqlite3_bind_text(st.get(), 4, text.c_str(), static_cast<int>(text.size()), SQLITE_TRANSIENT);
    if (sqlite3_step(st.get()) != SQLITE_DONE) {
        throw std::runtime_error("Failed to insert result");
    }
}

std::vector<TranscriptLog::Entry> TranscriptLog::results(std::int64_t session_id, bool final_only) {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement st(db_, final_only
        ? "SELECT ts_ms, is_final, text FROM results WHERE session_id=? AND is_final=1 ORDER BY id;"
        : "SELECT ts_ms, is_final, text FROM results WHERE session_id=? ORDER BY id;");
    sqlite3_bind_int64(st.get(), 1, session_id);

    std::vector<Entry> out;
    int rc;
    while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
        Entry e;
        e.ts_ms = sqlite3_column_int64(st.get(), 0);
        e.is_final = sqlite3_column_int(st.get(), 1) != 0;
        const auto* text = reinterpret_cast<const char*>(sqlite3_column_text(st.get(), 2));
        e.text = text ? text : "";
        out.push_back(std::move(e));
    }
    if (rc != SQLITE_DONE) {
        throw std::runtime_error("Failed to read results");
    }
    return out;
}

} // namespace soda
