#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

struct sqlite3;

namespace assetrelay::storage {

struct CompletedPartRecord {
    std::string transfer_key;
    uint32_t part_index = 0;
    uint64_t range_start = 0;
    uint64_t range_end = 0;
    std::string asset_name;
    uint64_t asset_id = 0;
    std::string checksum;
    std::chrono::system_clock::time_point completed_at;
};

// SQLite ledger of parts already uploaded, keyed by a stable transfer key
// so that a re-run of the same request can skip them.
class ResumeJournal {
public:
    explicit ResumeJournal(const std::filesystem::path& database_path);
    ~ResumeJournal();

    ResumeJournal(const ResumeJournal&) = delete;
    ResumeJournal& operator=(const ResumeJournal&) = delete;

    bool initialize();
    bool is_open() const { return db_ != nullptr; }

    bool record_part(const CompletedPartRecord& record);
    std::optional<CompletedPartRecord> find_part(const std::string& transfer_key, uint32_t part_index) const;
    std::vector<CompletedPartRecord> list_parts(const std::string& transfer_key) const;

    bool clear_transfer(const std::string& transfer_key);
    void cleanup_old_entries(std::chrono::hours max_age = std::chrono::hours(72));

    size_t get_entry_count() const;

    // Key for a transfer of `source` into `asset_name` of `release_id`
    // with parts of `part_size` bytes and `total_size` bytes overall.
    static std::string make_transfer_key(const std::string& source, uint64_t release_id,
                                         const std::string& asset_name, uint64_t total_size,
                                         uint64_t part_size);

private:
    std::filesystem::path db_path_;
    sqlite3* db_;

    bool create_tables();
};

} // namespace assetrelay::storage
