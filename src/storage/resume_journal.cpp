#include "assetrelay/storage/resume_journal.hpp"
#include "assetrelay/core/logger.hpp"
#include "assetrelay/crypto/hash.hpp"
#include <fmt/format.h>
#include <sqlite3.h>

namespace assetrelay::storage {

namespace {

int64_t to_unix_seconds(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
}

std::string column_text(sqlite3_stmt* stmt, int column) {
    auto text = sqlite3_column_text(stmt, column);
    return text ? reinterpret_cast<const char*>(text) : "";
}

CompletedPartRecord read_record(sqlite3_stmt* stmt) {
    CompletedPartRecord record;
    record.transfer_key = column_text(stmt, 0);
    record.part_index = static_cast<uint32_t>(sqlite3_column_int64(stmt, 1));
    record.range_start = static_cast<uint64_t>(sqlite3_column_int64(stmt, 2));
    record.range_end = static_cast<uint64_t>(sqlite3_column_int64(stmt, 3));
    record.asset_name = column_text(stmt, 4);
    record.asset_id = static_cast<uint64_t>(sqlite3_column_int64(stmt, 5));
    record.checksum = column_text(stmt, 6);
    record.completed_at = std::chrono::system_clock::time_point(
        std::chrono::seconds(sqlite3_column_int64(stmt, 7)));
    return record;
}

}

ResumeJournal::ResumeJournal(const std::filesystem::path& database_path)
    : db_path_(database_path), db_(nullptr) {
}

ResumeJournal::~ResumeJournal() {
    if (db_) {
        sqlite3_close(db_);
    }
}

bool ResumeJournal::initialize() {
    if (db_) {
        return true;
    }

    int result = sqlite3_open(db_path_.string().c_str(), &db_);
    if (result != SQLITE_OK) {
        LOG_ERROR("Failed to open resume journal {}: {}", db_path_.string(),
                  db_ ? sqlite3_errmsg(db_) : "out of memory");
        sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }

    if (!create_tables()) {
        sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }
    return true;
}

bool ResumeJournal::create_tables() {
    const char* create_parts_table = R"(
        CREATE TABLE IF NOT EXISTS completed_parts (
            transfer_key TEXT NOT NULL,
            part_index INTEGER NOT NULL,
            range_start INTEGER NOT NULL,
            range_end INTEGER NOT NULL,
            asset_name TEXT NOT NULL,
            asset_id INTEGER NOT NULL,
            checksum TEXT,
            completed_at INTEGER NOT NULL,
            PRIMARY KEY (transfer_key, part_index)
        );
    )";

    const char* create_indexes = R"(
        CREATE INDEX IF NOT EXISTS idx_parts_completed_at ON completed_parts(completed_at);
    )";

    char* error_msg = nullptr;

    int result = sqlite3_exec(db_, create_parts_table, nullptr, nullptr, &error_msg);
    if (result != SQLITE_OK) {
        LOG_ERROR("Failed to create resume journal table: {}", error_msg ? error_msg : "unknown");
        sqlite3_free(error_msg);
        return false;
    }

    result = sqlite3_exec(db_, create_indexes, nullptr, nullptr, &error_msg);
    if (result != SQLITE_OK) {
        LOG_ERROR("Failed to create resume journal index: {}", error_msg ? error_msg : "unknown");
        sqlite3_free(error_msg);
        return false;
    }

    return true;
}

bool ResumeJournal::record_part(const CompletedPartRecord& record) {
    if (!db_) {
        return false;
    }

    const char* insert_sql = R"(
        INSERT OR REPLACE INTO completed_parts
        (transfer_key, part_index, range_start, range_end, asset_name, asset_id, checksum, completed_at)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?);
    )";

    sqlite3_stmt* stmt;
    int result = sqlite3_prepare_v2(db_, insert_sql, -1, &stmt, nullptr);
    if (result != SQLITE_OK) {
        LOG_ERROR("Failed to prepare journal insert: {}", sqlite3_errmsg(db_));
        return false;
    }

    sqlite3_bind_text(stmt, 1, record.transfer_key.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_int64(stmt, 2, record.part_index);
    sqlite3_bind_int64(stmt, 3, static_cast<sqlite3_int64>(record.range_start));
    sqlite3_bind_int64(stmt, 4, static_cast<sqlite3_int64>(record.range_end));
    sqlite3_bind_text(stmt, 5, record.asset_name.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_int64(stmt, 6, static_cast<sqlite3_int64>(record.asset_id));
    sqlite3_bind_text(stmt, 7, record.checksum.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_int64(stmt, 8, to_unix_seconds(record.completed_at));

    result = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (result != SQLITE_DONE) {
        LOG_ERROR("Failed to record part {} in journal: {}", record.part_index, sqlite3_errmsg(db_));
        return false;
    }
    return true;
}

std::optional<CompletedPartRecord> ResumeJournal::find_part(const std::string& transfer_key,
                                                            uint32_t part_index) const {
    if (!db_) {
        return std::nullopt;
    }

    const char* select_sql = R"(
        SELECT transfer_key, part_index, range_start, range_end, asset_name, asset_id, checksum, completed_at
        FROM completed_parts WHERE transfer_key = ? AND part_index = ?;
    )";

    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(db_, select_sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return std::nullopt;
    }

    sqlite3_bind_text(stmt, 1, transfer_key.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_int64(stmt, 2, part_index);

    std::optional<CompletedPartRecord> record;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        record = read_record(stmt);
    }
    sqlite3_finalize(stmt);
    return record;
}

std::vector<CompletedPartRecord> ResumeJournal::list_parts(const std::string& transfer_key) const {
    std::vector<CompletedPartRecord> records;
    if (!db_) {
        return records;
    }

    const char* select_sql = R"(
        SELECT transfer_key, part_index, range_start, range_end, asset_name, asset_id, checksum, completed_at
        FROM completed_parts WHERE transfer_key = ? ORDER BY part_index;
    )";

    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(db_, select_sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return records;
    }

    sqlite3_bind_text(stmt, 1, transfer_key.c_str(), -1, SQLITE_STATIC);
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        records.push_back(read_record(stmt));
    }
    sqlite3_finalize(stmt);
    return records;
}

bool ResumeJournal::clear_transfer(const std::string& transfer_key) {
    if (!db_) {
        return false;
    }

    const char* delete_sql = "DELETE FROM completed_parts WHERE transfer_key = ?;";

    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(db_, delete_sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return false;
    }

    sqlite3_bind_text(stmt, 1, transfer_key.c_str(), -1, SQLITE_STATIC);
    int result = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    return result == SQLITE_DONE;
}

void ResumeJournal::cleanup_old_entries(std::chrono::hours max_age) {
    if (!db_) {
        return;
    }

    const char* delete_sql = "DELETE FROM completed_parts WHERE completed_at < ?;";

    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(db_, delete_sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return;
    }

    auto cutoff = std::chrono::system_clock::now() - max_age;
    sqlite3_bind_int64(stmt, 1, to_unix_seconds(cutoff));
    if (sqlite3_step(stmt) != SQLITE_DONE) {
        LOG_WARN("Resume journal cleanup failed: {}", sqlite3_errmsg(db_));
    }
    sqlite3_finalize(stmt);
}

size_t ResumeJournal::get_entry_count() const {
    if (!db_) {
        return 0;
    }

    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(db_, "SELECT COUNT(*) FROM completed_parts;", -1, &stmt, nullptr) != SQLITE_OK) {
        return 0;
    }

    size_t count = 0;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        count = static_cast<size_t>(sqlite3_column_int64(stmt, 0));
    }
    sqlite3_finalize(stmt);
    return count;
}

std::string ResumeJournal::make_transfer_key(const std::string& source, uint64_t release_id,
                                             const std::string& asset_name, uint64_t total_size,
                                             uint64_t part_size) {
    auto composite = fmt::format("{}\n{}\n{}\n{}\n{}", source, release_id, asset_name, total_size, part_size);
    return crypto::hash_utils::hash_to_hex(crypto::hash_utils::hash_string(composite));
}

}
