// =============================================================================
// refdb - Accession Status Table Implementation
// =============================================================================

#include "refdb/pipeline/status_table.h"

#include <string>
#include <vector>

#include "refdb/common/error.h"
#include "refdb/common/logger.h"
#include "refdb/io/file_utils.h"

namespace refdb::pipeline {

namespace {

constexpr std::string_view kHeader = "accession\tarchive\tsequence";

}  // namespace

StatusTable::StatusTable(std::filesystem::path path) : path_(std::move(path)) {}

StatusTable StatusTable::load(std::filesystem::path path) {
    StatusTable table(std::move(path));

    const auto lines = io::readLines(table.path_);
    for (std::size_t i = 0; i < lines.size(); ++i) {
        const std::string& line = lines[i];
        if (i == 0 && line == kHeader) {
            continue;
        }

        const auto firstTab = line.find('\t');
        const auto secondTab =
            firstTab == std::string::npos ? std::string::npos : line.find('\t', firstTab + 1);
        if (secondTab == std::string::npos) {
            REFDB_LOG_WARNING("Ignoring malformed status row {} in {}", i + 1,
                              table.path_.string());
            continue;
        }

        const auto archive =
            entryStatusFromString(std::string_view(line).substr(firstTab + 1,
                                                                secondTab - firstTab - 1));
        const auto sequence =
            sequenceStatusFromString(std::string_view(line).substr(secondTab + 1));
        if (!archive || !sequence) {
            REFDB_LOG_WARNING("Ignoring status row {} with unknown state in {}", i + 1,
                              table.path_.string());
            continue;
        }

        table.records_[line.substr(0, firstTab)] = StatusRecord{*archive, *sequence};
    }

    return table;
}

std::optional<StatusRecord> StatusTable::find(const Accession& accession) const {
    const auto it = records_.find(accession);
    if (it == records_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void StatusTable::setArchiveStatus(const Accession& accession, EntryStatus status) {
    records_[accession].archive = status;
    dirty_ = true;
}

void StatusTable::setSequenceStatus(const Accession& accession, SequenceStatus status) {
    records_[accession].sequence = status;
    dirty_ = true;
}

void StatusTable::save() {
    std::vector<std::string> lines;
    lines.reserve(records_.size() + 1);
    lines.emplace_back(kHeader);
    for (const auto& [accession, record] : records_) {
        lines.push_back(accession + "\t" + std::string(entryStatusToString(record.archive)) +
                        "\t" + std::string(sequenceStatusToString(record.sequence)));
    }
    io::writeLinesAtomic(path_, lines);
    dirty_ = false;
}

// =============================================================================
// StatusCheckpoint
// =============================================================================

StatusCheckpoint::~StatusCheckpoint() {
    if (!table_.dirty()) {
        return;
    }
    try {
        table_.save();
    } catch (const RefdbException& ex) {
        REFDB_LOG_ERROR("Could not save status table {}: {}", table_.path().string(),
                        ex.what());
    }
}

void StatusCheckpoint::tick() {
    if (++pending_ >= interval_) {
        finish();
    }
}

void StatusCheckpoint::finish() {
    if (table_.dirty()) {
        table_.save();
    }
    pending_ = 0;
}

}  // namespace refdb::pipeline
