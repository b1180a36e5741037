/**
 * TrackSense - Result Store Implementation
 */

#include "store.h"
#include "log.h"
#include "serialization.h"
#include "utils.h"
#include <cstring>

namespace tracksense {

namespace {
    ResultError storage_error(const std::string& message) {
        return ResultError{ErrorKind::Storage, "sink", message};
    }

    const char* kSelectColumns =
        "SELECT analysis_id, track_ref, timestamp, analysis_type, status, created_at, "
        "duration_seconds, tempo, segment_count, boundaries, result_json FROM analyses ";

    std::string column_text(sqlite3_stmt* stmt, int col) {
        const char* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
        return text ? text : "";
    }
}

Store::Store(const std::string& db_path) {
    int rc = sqlite3_open(db_path.c_str(), &db_);
    if (rc != SQLITE_OK) {
        last_error_ = sqlite3_errmsg(db_);
        sqlite3_close(db_);
        db_ = nullptr;
        TRACKSENSE_LOG_ERROR("Store", "cannot open " << db_path << ": " << last_error_);
        return;
    }

    // Enable WAL mode for better concurrency
    sqlite3_exec(db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr);
    sqlite3_exec(db_, "PRAGMA synchronous=NORMAL;", nullptr, nullptr, nullptr);

    init_schema();
}

Store::~Store() {
    if (db_) {
        sqlite3_close(db_);
    }
}

Store::Store(Store&& other) noexcept
    : db_(other.db_), last_error_(std::move(other.last_error_)) {
    other.db_ = nullptr;
}

Store& Store::operator=(Store&& other) noexcept {
    if (this != &other) {
        if (db_) sqlite3_close(db_);
        db_ = other.db_;
        last_error_ = std::move(other.last_error_);
        other.db_ = nullptr;
    }
    return *this;
}

void Store::init_schema() {
    const char* schema = R"(
        CREATE TABLE IF NOT EXISTS analyses (
            analysis_id TEXT PRIMARY KEY NOT NULL,
            track_ref TEXT NOT NULL,
            timestamp TEXT,
            analysis_type TEXT,
            status TEXT,
            created_at INTEGER DEFAULT 0,
            duration_seconds REAL DEFAULT 0,
            tempo REAL DEFAULT 0,
            segment_count INTEGER DEFAULT 0,
            boundaries BLOB,
            result_json TEXT NOT NULL
        );

        CREATE INDEX IF NOT EXISTS idx_analyses_track ON analyses(track_ref);
        CREATE INDEX IF NOT EXISTS idx_analyses_created ON analyses(created_at);
    )";

    char* err_msg = nullptr;
    int rc = sqlite3_exec(db_, schema, nullptr, nullptr, &err_msg);
    if (rc != SQLITE_OK) {
        last_error_ = err_msg ? err_msg : "Failed to create schema";
        sqlite3_free(err_msg);
        TRACKSENSE_LOG_ERROR("Store", last_error_);
    }
}

std::vector<uint8_t> Store::serialize_floats(const std::vector<float>& data) {
    std::vector<uint8_t> result(data.size() * sizeof(float));
    if (!data.empty()) {
        std::memcpy(result.data(), data.data(), result.size());
    }
    return result;
}

std::vector<float> Store::deserialize_floats(const void* data, int size) {
    if (!data || size <= 0) return {};

    size_t count = size / sizeof(float);
    std::vector<float> result(count);
    std::memcpy(result.data(), data, count * sizeof(float));
    return result;
}

Status Store::save(const std::string& track_ref, const AnalysisResult& result) {
    if (!db_) return storage_error("Database not open");
    if (result.analysis_id.empty()) return storage_error("Result has no analysis_id");

    const char* sql = R"(
        INSERT OR REPLACE INTO analyses (analysis_id, track_ref, timestamp, analysis_type, status,
            created_at, duration_seconds, tempo, segment_count, boundaries, result_json)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)
    )";

    sqlite3_stmt* stmt;
    int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return storage_error(std::string("Prepare failed: ") + sqlite3_errmsg(db_));
    }

    auto boundaries_data = serialize_floats(result.segmentation.boundaries);
    std::string document = to_json_string(result);

    sqlite3_bind_text(stmt, 1, result.analysis_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, track_ref.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 3, result.timestamp.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 4, result.analysis_type.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 5, result.metadata.status.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 6, utils::current_timestamp());
    sqlite3_bind_double(stmt, 7, result.metadata.duration_seconds);
    sqlite3_bind_double(stmt, 8, result.segmentation.tempo);
    sqlite3_bind_int(stmt, 9, static_cast<int>(result.segments.size()));
    sqlite3_bind_blob(stmt, 10, boundaries_data.data(), static_cast<int>(boundaries_data.size()),
                      SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 11, document.c_str(), -1, SQLITE_TRANSIENT);

    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return storage_error(std::string("Insert failed: ") + sqlite3_errmsg(db_));
    }

    TRACKSENSE_LOG_DEBUG("Store", "saved " << result.analysis_id << " for " << track_ref);
    return Unit{};
}

StoredAnalysis Store::read_row(sqlite3_stmt* stmt) {
    StoredAnalysis row;
    row.analysis_id = column_text(stmt, 0);
    row.track_ref = column_text(stmt, 1);
    row.timestamp = column_text(stmt, 2);
    row.analysis_type = column_text(stmt, 3);
    row.status = column_text(stmt, 4);
    row.created_at = sqlite3_column_int64(stmt, 5);
    row.duration_seconds = sqlite3_column_double(stmt, 6);
    row.tempo = static_cast<float>(sqlite3_column_double(stmt, 7));
    row.segment_count = sqlite3_column_int(stmt, 8);
    row.boundaries = deserialize_floats(sqlite3_column_blob(stmt, 9), sqlite3_column_bytes(stmt, 9));
    row.result_json = column_text(stmt, 10);
    return row;
}

std::vector<StoredAnalysis> Store::query(const char* where, const std::string& arg) {
    std::vector<StoredAnalysis> rows;
    if (!db_) return rows;

    std::string sql = std::string(kSelectColumns) + where;
    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        last_error_ = sqlite3_errmsg(db_);
        return rows;
    }

    sqlite3_bind_text(stmt, 1, arg.c_str(), -1, SQLITE_TRANSIENT);

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        rows.push_back(read_row(stmt));
    }

    sqlite3_finalize(stmt);
    return rows;
}

std::optional<StoredAnalysis> Store::get_analysis(const std::string& analysis_id) {
    auto rows = query("WHERE analysis_id = ?", analysis_id);
    if (rows.empty()) return std::nullopt;
    return rows.front();
}

std::optional<StoredAnalysis> Store::get_latest_for_track(const std::string& track_ref) {
    auto rows = query("WHERE track_ref = ? ORDER BY created_at DESC, rowid DESC LIMIT 1", track_ref);
    if (rows.empty()) return std::nullopt;
    return rows.front();
}

std::vector<StoredAnalysis> Store::get_analyses_for_track(const std::string& track_ref) {
    return query("WHERE track_ref = ? ORDER BY created_at DESC, rowid DESC", track_ref);
}

int Store::get_analysis_count() {
    if (!db_) return 0;

    const char* sql = "SELECT COUNT(*) FROM analyses";
    sqlite3_stmt* stmt;

    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return 0;
    }

    int count = 0;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        count = sqlite3_column_int(stmt, 0);
    }

    sqlite3_finalize(stmt);
    return count;
}

bool Store::delete_analysis(const std::string& analysis_id) {
    if (!db_) return false;

    const char* sql = "DELETE FROM analyses WHERE analysis_id = ?";
    sqlite3_stmt* stmt;

    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return false;
    }

    sqlite3_bind_text(stmt, 1, analysis_id.c_str(), -1, SQLITE_TRANSIENT);
    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    return rc == SQLITE_DONE && sqlite3_changes(db_) > 0;
}

int Store::delete_track_analyses(const std::string& track_ref) {
    if (!db_) return 0;

    const char* sql = "DELETE FROM analyses WHERE track_ref = ?";
    sqlite3_stmt* stmt;

    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return 0;
    }

    sqlite3_bind_text(stmt, 1, track_ref.c_str(), -1, SQLITE_TRANSIENT);
    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    return rc == SQLITE_DONE ? sqlite3_changes(db_) : 0;
}

} // namespace tracksense
