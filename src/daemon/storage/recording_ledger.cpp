#include "storage/recording_ledger.hpp"

#include <chrono>
#include <filesystem>
#include <format>
#include <print>

namespace fs = std::filesystem;

namespace {

std::string get_text(sqlite3_stmt* stmt, int col) {
    auto* p = sqlite3_column_text(stmt, col);
    return p ? reinterpret_cast<const char*>(p) : "";
}

std::optional<std::string> get_nullable_text(sqlite3_stmt* stmt, int col) {
    if (sqlite3_column_type(stmt, col) == SQLITE_NULL) return std::nullopt;
    return get_text(stmt, col);
}

void bind_text(sqlite3_stmt* stmt, int idx, const std::string& val) {
    sqlite3_bind_text(stmt, idx, val.c_str(), -1, SQLITE_TRANSIENT);
}

SessionRecord read_session(sqlite3_stmt* stmt) {
    return SessionRecord{
        .id = sqlite3_column_int64(stmt, 0),
        .title = get_text(stmt, 1),
        .audio_file_path = get_text(stmt, 2),
        .created_at = get_text(stmt, 3),
        .updated_at = get_text(stmt, 4),
    };
}

} // namespace

RecordingLedger::RecordingLedger() = default;

RecordingLedger::~RecordingLedger() {
    close();
}

bool RecordingLedger::open(const std::string& path) {
    fs::path p(path);
    std::error_code ec;
    fs::create_directories(p.parent_path(), ec);

    int rc = sqlite3_open(path.c_str(), &db_);
    if (rc != SQLITE_OK) {
        std::println(stderr, "db: failed to open {}: {}", path, sqlite3_errmsg(db_));
        sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }

    sqlite3_exec(db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr);

    if (!create_tables()) {
        close();
        return false;
    }

    bool ok =
        prepare("INSERT INTO sessions (title, created_at, updated_at) VALUES (?, ?, ?)",
                &create_session_stmt_) &&
        prepare("SELECT id, title, audio_file_path, created_at, updated_at "
                "FROM sessions ORDER BY updated_at DESC, id DESC",
                &list_sessions_stmt_) &&
        prepare("INSERT INTO transcript_segments "
                "(session_id, speaker_id, text, start_ms, end_ms, created_at) "
                "VALUES (?, ?, ?, ?, ?, ?)",
                &insert_segment_stmt_) &&
        prepare("SELECT id, session_id, speaker_id, speaker_name, text, start_ms, end_ms, created_at "
                "FROM transcript_segments WHERE session_id = ? ORDER BY start_ms ASC, id ASC",
                &segments_stmt_) &&
        prepare("UPDATE transcript_segments SET speaker_name = ? "
                "WHERE session_id = ? AND speaker_id = ?",
                &rename_stmt_) &&
        prepare("INSERT INTO session_recordings "
                "(session_id, file_path, started_at, stopped_at, duration_ms, created_at) "
                "VALUES (?, ?, ?, ?, ?, ?)",
                &insert_recording_stmt_) &&
        prepare("UPDATE sessions SET audio_file_path = ?, updated_at = ? WHERE id = ?",
                &update_audio_stmt_) &&
        prepare("SELECT id, session_id, file_path, started_at, stopped_at, duration_ms, created_at "
                "FROM session_recordings WHERE session_id = ? ORDER BY id ASC",
                &recordings_stmt_);

    if (!ok) {
        close();
        return false;
    }
    return true;
}

void RecordingLedger::close() {
    for (auto** stmt : {&create_session_stmt_, &list_sessions_stmt_, &insert_segment_stmt_,
                        &segments_stmt_, &rename_stmt_, &insert_recording_stmt_,
                        &update_audio_stmt_, &recordings_stmt_}) {
        if (*stmt) { sqlite3_finalize(*stmt); *stmt = nullptr; }
    }
    if (db_) { sqlite3_close(db_); db_ = nullptr; }
}

std::optional<SessionRecord> RecordingLedger::create_session(const std::string& title) {
    if (!create_session_stmt_) return std::nullopt;

    auto now = now_iso();
    sqlite3_reset(create_session_stmt_);
    bind_text(create_session_stmt_, 1, title.empty() ? "Untitled Meeting" : title);
    bind_text(create_session_stmt_, 2, now);
    bind_text(create_session_stmt_, 3, now);

    if (sqlite3_step(create_session_stmt_) != SQLITE_DONE) {
        std::println(stderr, "db: create session failed: {}", sqlite3_errmsg(db_));
        return std::nullopt;
    }

    return SessionRecord{
        .id = sqlite3_last_insert_rowid(db_),
        .title = title.empty() ? "Untitled Meeting" : title,
        .audio_file_path = {},
        .created_at = now,
        .updated_at = now,
    };
}

std::vector<SessionRecord> RecordingLedger::list_sessions() {
    std::vector<SessionRecord> sessions;
    if (!list_sessions_stmt_) return sessions;

    sqlite3_reset(list_sessions_stmt_);
    while (sqlite3_step(list_sessions_stmt_) == SQLITE_ROW) {
        sessions.push_back(read_session(list_sessions_stmt_));
    }
    return sessions;
}

std::optional<TranscriptSegment> RecordingLedger::insert_segment(int64_t session_id,
                                                                 const std::string& speaker_id,
                                                                 const std::string& text,
                                                                 int64_t start_ms, int64_t end_ms) {
    if (!insert_segment_stmt_) return std::nullopt;

    auto now = now_iso();
    sqlite3_reset(insert_segment_stmt_);
    sqlite3_bind_int64(insert_segment_stmt_, 1, session_id);
    bind_text(insert_segment_stmt_, 2, speaker_id);
    bind_text(insert_segment_stmt_, 3, text);
    sqlite3_bind_int64(insert_segment_stmt_, 4, start_ms);
    sqlite3_bind_int64(insert_segment_stmt_, 5, end_ms);
    bind_text(insert_segment_stmt_, 6, now);

    if (sqlite3_step(insert_segment_stmt_) != SQLITE_DONE) {
        std::println(stderr, "db: insert segment failed: {}", sqlite3_errmsg(db_));
        return std::nullopt;
    }

    return TranscriptSegment{
        .id = sqlite3_last_insert_rowid(db_),
        .session_id = session_id,
        .speaker_id = speaker_id,
        .speaker_name = std::nullopt,
        .text = text,
        .start_ms = start_ms,
        .end_ms = end_ms,
        .created_at = now,
    };
}

std::vector<TranscriptSegment> RecordingLedger::segments(int64_t session_id) {
    std::vector<TranscriptSegment> rows;
    if (!segments_stmt_) return rows;

    sqlite3_reset(segments_stmt_);
    sqlite3_bind_int64(segments_stmt_, 1, session_id);

    while (sqlite3_step(segments_stmt_) == SQLITE_ROW) {
        TranscriptSegment s;
        s.id = sqlite3_column_int64(segments_stmt_, 0);
        s.session_id = sqlite3_column_int64(segments_stmt_, 1);
        s.speaker_id = get_text(segments_stmt_, 2);
        s.speaker_name = get_nullable_text(segments_stmt_, 3);
        s.text = get_text(segments_stmt_, 4);
        s.start_ms = sqlite3_column_int64(segments_stmt_, 5);
        s.end_ms = sqlite3_column_int64(segments_stmt_, 6);
        s.created_at = get_text(segments_stmt_, 7);
        rows.push_back(std::move(s));
    }
    return rows;
}

bool RecordingLedger::rename_speaker(int64_t session_id, const std::string& speaker_id,
                                     const std::string& name) {
    if (!rename_stmt_) return false;

    sqlite3_reset(rename_stmt_);
    bind_text(rename_stmt_, 1, name);
    sqlite3_bind_int64(rename_stmt_, 2, session_id);
    bind_text(rename_stmt_, 3, speaker_id);

    if (sqlite3_step(rename_stmt_) != SQLITE_DONE) {
        std::println(stderr, "db: rename speaker failed: {}", sqlite3_errmsg(db_));
        return false;
    }
    return true;
}

bool RecordingLedger::record_recording(const RecordingEntry& e) {
    if (!insert_recording_stmt_ || !update_audio_stmt_) return false;

    auto created_at = e.created_at.empty() ? e.stopped_at : e.created_at;

    if (sqlite3_exec(db_, "BEGIN", nullptr, nullptr, nullptr) != SQLITE_OK) {
        std::println(stderr, "db: begin failed: {}", sqlite3_errmsg(db_));
        return false;
    }

    sqlite3_reset(update_audio_stmt_);
    bind_text(update_audio_stmt_, 1, e.file_path);
    bind_text(update_audio_stmt_, 2, e.stopped_at);
    sqlite3_bind_int64(update_audio_stmt_, 3, e.session_id);
    bool ok = sqlite3_step(update_audio_stmt_) == SQLITE_DONE;

    if (ok) {
        sqlite3_reset(insert_recording_stmt_);
        sqlite3_bind_int64(insert_recording_stmt_, 1, e.session_id);
        bind_text(insert_recording_stmt_, 2, e.file_path);
        bind_text(insert_recording_stmt_, 3, e.started_at);
        bind_text(insert_recording_stmt_, 4, e.stopped_at);
        if (e.duration_ms) sqlite3_bind_int64(insert_recording_stmt_, 5, *e.duration_ms);
        else sqlite3_bind_null(insert_recording_stmt_, 5);
        bind_text(insert_recording_stmt_, 6, created_at);
        ok = sqlite3_step(insert_recording_stmt_) == SQLITE_DONE;
    }

    if (!ok) {
        std::println(stderr, "db: record recording failed: {}", sqlite3_errmsg(db_));
        sqlite3_exec(db_, "ROLLBACK", nullptr, nullptr, nullptr);
        return false;
    }

    if (sqlite3_exec(db_, "COMMIT", nullptr, nullptr, nullptr) != SQLITE_OK) {
        std::println(stderr, "db: commit failed: {}", sqlite3_errmsg(db_));
        sqlite3_exec(db_, "ROLLBACK", nullptr, nullptr, nullptr);
        return false;
    }
    return true;
}

std::vector<RecordingEntry> RecordingLedger::recordings(int64_t session_id) {
    std::vector<RecordingEntry> rows;
    if (!recordings_stmt_) return rows;

    sqlite3_reset(recordings_stmt_);
    sqlite3_bind_int64(recordings_stmt_, 1, session_id);

    while (sqlite3_step(recordings_stmt_) == SQLITE_ROW) {
        RecordingEntry r;
        r.id = sqlite3_column_int64(recordings_stmt_, 0);
        r.session_id = sqlite3_column_int64(recordings_stmt_, 1);
        r.file_path = get_text(recordings_stmt_, 2);
        r.started_at = get_text(recordings_stmt_, 3);
        r.stopped_at = get_text(recordings_stmt_, 4);
        if (sqlite3_column_type(recordings_stmt_, 5) != SQLITE_NULL) {
            r.duration_ms = sqlite3_column_int64(recordings_stmt_, 5);
        }
        r.created_at = get_text(recordings_stmt_, 6);
        rows.push_back(std::move(r));
    }
    return rows;
}

std::string RecordingLedger::now_iso() {
    auto now = std::chrono::floor<std::chrono::milliseconds>(std::chrono::system_clock::now());
    return std::format("{:%FT%T}Z", now);
}

bool RecordingLedger::create_tables() {
    const char* sql = R"(
        CREATE TABLE IF NOT EXISTS sessions (
            id              INTEGER PRIMARY KEY AUTOINCREMENT,
            title           TEXT NOT NULL DEFAULT 'Untitled Meeting',
            audio_file_path TEXT,
            created_at      TEXT NOT NULL,
            updated_at      TEXT NOT NULL
        );

        CREATE TABLE IF NOT EXISTS transcript_segments (
            id            INTEGER PRIMARY KEY AUTOINCREMENT,
            session_id    INTEGER NOT NULL,
            speaker_id    TEXT NOT NULL,
            speaker_name  TEXT,
            text          TEXT NOT NULL,
            start_ms      INTEGER NOT NULL,
            end_ms        INTEGER NOT NULL,
            created_at    TEXT NOT NULL
        );

        CREATE INDEX IF NOT EXISTS idx_segments_session
            ON transcript_segments (session_id, start_ms);

        CREATE TABLE IF NOT EXISTS session_recordings (
            id          INTEGER PRIMARY KEY AUTOINCREMENT,
            session_id  INTEGER NOT NULL,
            file_path   TEXT NOT NULL,
            started_at  TEXT NOT NULL,
            stopped_at  TEXT NOT NULL,
            duration_ms INTEGER,
            created_at  TEXT NOT NULL
        );
    )";

    char* err = nullptr;
    int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        std::println(stderr, "db: create tables failed: {}", err ? err : "unknown");
        sqlite3_free(err);
        return false;
    }
    return true;
}

bool RecordingLedger::prepare(const char* sql, sqlite3_stmt** stmt) {
    if (sqlite3_prepare_v2(db_, sql, -1, stmt, nullptr) != SQLITE_OK) {
        std::println(stderr, "db: prepare failed: {}", sqlite3_errmsg(db_));
        return false;
    }
    return true;
}
