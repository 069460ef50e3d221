// =============================================================================
// refdb - Accession Status Table
// =============================================================================
// Persistent accession -> (archive status, sequence status) table.
//
// File format (tab-separated, header row):
//   accession   archive      sequence
//   GCF_1.1     downloaded   extracted
//
// Updates are held in memory and written atomically by save(). Stages
// save through a StatusCheckpoint every `interval` updates, at the end of
// the stage and while unwinding, so an interrupted run loses at most one
// interval of records and a stage costs O(n / interval) rewrites.
//
// The acquisition stage consults the table on resume: an archive recorded
// as acquired gets a structural check only, any other local archive is
// fully CRC-verified before it is trusted.
// =============================================================================

#ifndef REFDB_PIPELINE_STATUS_TABLE_H
#define REFDB_PIPELINE_STATUS_TABLE_H

#include <filesystem>
#include <cstddef>
#include <map>
#include <optional>

#include "refdb/common/types.h"

namespace refdb::pipeline {

/// @brief Recorded state of one accession.
struct StatusRecord {
    EntryStatus archive = EntryStatus::kPending;
    SequenceStatus sequence = SequenceStatus::kPending;

    [[nodiscard]] bool operator==(const StatusRecord& other) const noexcept = default;
};

/// @brief On-disk status table.
class StatusTable {
public:
    /// @brief Create an empty table bound to `path` (nothing is read).
    explicit StatusTable(std::filesystem::path path);

    /// @brief Load the table at `path`; a missing file yields an empty table.
    /// @note Malformed rows are skipped with a warning.
    /// @throws IOError if the file exists but cannot be read.
    [[nodiscard]] static StatusTable load(std::filesystem::path path);

    /// @brief Look up an accession.
    [[nodiscard]] std::optional<StatusRecord> find(const Accession& accession) const;

    /// @brief Record the archive state (in memory until save()).
    void setArchiveStatus(const Accession& accession, EntryStatus status);

    /// @brief Record the sequence state (in memory until save()).
    void setSequenceStatus(const Accession& accession, SequenceStatus status);

    /// @brief Write the table atomically.
    /// @throws IOError on failure.
    void save();

    /// @brief True if updates were made since the last save().
    [[nodiscard]] bool dirty() const noexcept { return dirty_; }

    [[nodiscard]] std::size_t size() const noexcept { return records_.size(); }

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    std::filesystem::path path_;
    std::map<Accession, StatusRecord> records_;
    bool dirty_ = false;
};

/// @brief Batches status table writes over one stage.
///
/// Call tick() after each processed item and finish() when the stage is
/// done. If the stage unwinds first, the destructor saves what was
/// recorded so far.
class StatusCheckpoint {
public:
    StatusCheckpoint(StatusTable& table, std::size_t interval) noexcept
        : table_(table), interval_(interval == 0 ? 1 : interval) {}

    ~StatusCheckpoint();

    StatusCheckpoint(const StatusCheckpoint&) = delete;
    StatusCheckpoint& operator=(const StatusCheckpoint&) = delete;

    /// @brief Count one update; saves every `interval` updates.
    void tick();

    /// @brief Save any pending updates.
    void finish();

private:
    StatusTable& table_;
    std::size_t interval_;
    std::size_t pending_ = 0;
};

}  // namespace refdb::pipeline

#endif  // REFDB_PIPELINE_STATUS_TABLE_H
