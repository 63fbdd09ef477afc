#pragma once

#include <cstdint>
#include <optional>
#include <sqlite3.h>
#include <string>
#include <vector>

struct SessionRecord {
    int64_t id = 0;
    std::string title;
    std::string audio_file_path;
    std::string created_at;
    std::string updated_at;
};

struct TranscriptSegment {
    int64_t id = 0;
    int64_t session_id = 0;
    std::string speaker_id;
    std::optional<std::string> speaker_name;
    std::string text;
    int64_t start_ms = 0;
    int64_t end_ms = 0;
    std::string created_at;
};

struct RecordingEntry {
    int64_t id = 0;
    int64_t session_id = 0;
    std::string file_path;
    std::string started_at;
    std::string stopped_at;
    std::optional<int64_t> duration_ms;
    std::string created_at;
};

// Durable record of sessions, their live transcript and their recorded
// audio artifacts.
class RecordingLedger {
public:
    RecordingLedger();
    ~RecordingLedger();

    RecordingLedger(const RecordingLedger&) = delete;
    RecordingLedger& operator=(const RecordingLedger&) = delete;

    bool open(const std::string& path);
    void close();
    bool is_open() const { return db_ != nullptr; }

    std::optional<SessionRecord> create_session(const std::string& title);
    std::vector<SessionRecord> list_sessions();

    std::optional<TranscriptSegment> insert_segment(int64_t session_id, const std::string& speaker_id,
                                                    const std::string& text,
                                                    int64_t start_ms, int64_t end_ms);
    // Ordered by start_ms.
    std::vector<TranscriptSegment> segments(int64_t session_id);
    bool rename_speaker(int64_t session_id, const std::string& speaker_id, const std::string& name);

    // Inserts the recording row and points the session at the new artifact,
    // both or neither.
    bool record_recording(const RecordingEntry& entry);
    std::vector<RecordingEntry> recordings(int64_t session_id);

    // UTC, millisecond precision, e.g. 2024-05-01T09:30:00.000Z
    static std::string now_iso();

private:
    bool create_tables();
    bool prepare(const char* sql, sqlite3_stmt** stmt);

    sqlite3* db_ = nullptr;
    sqlite3_stmt* create_session_stmt_ = nullptr;
    sqlite3_stmt* list_sessions_stmt_ = nullptr;
    sqlite3_stmt* insert_segment_stmt_ = nullptr;
    sqlite3_stmt* segments_stmt_ = nullptr;
    sqlite3_stmt* rename_stmt_ = nullptr;
    sqlite3_stmt* insert_recording_stmt_ = nullptr;
    sqlite3_stmt* update_audio_stmt_ = nullptr;
    sqlite3_stmt* recordings_stmt_ = nullptr;
};
