#pragma once

#include "diffdb/results/entities.hpp"
#include <diffdb/persistence/database.hpp>
#include <diffdb/core/result.hpp>
#include <string_view>

namespace diffdb::results {

// Incremental producer-side API of a result file.
//
// Expected call sequence: install_schema() and create_result() once, then
// add_file() for the primary and the secondary binary (in that order), then
// any number of add_function_match() / add_basic_block_match() /
// add_instruction_match() calls. Writes accumulate in one open transaction
// until commit(); anything not committed is dropped when the connection closes.
class Writer {
public:
    explicit Writer(persistence::Database& db);

    Writer(const Writer&) = delete;
    Writer& operator=(const Writer&) = delete;

    // Create every table and fill the two algorithm lookup tables
    [[nodiscard]] Result<void> install_schema();

    // Insert the single metadata row (created = modified = now)
    [[nodiscard]] Result<void> create_result(const ResultInfo& info);

    // Insert a file row. The display name is export_name without directory and
    // extension; executable_name defaults to it.
    [[nodiscard]] Result<RowId> add_file(std::string_view export_name,
                                         std::string_view hash,
                                         std::string_view executable_name = {},
                                         const FileStats& stats = {});

    [[nodiscard]] Result<RowId> add_function_match(Address address1,
                                                   Address address2,
                                                   std::string_view name1,
                                                   std::string_view name2,
                                                   double similarity,
                                                   double confidence = 0.0,
                                                   Count identical_basic_blocks = 0);

    [[nodiscard]] Result<RowId> add_basic_block_match(RowId function_match_id,
                                                      Address address1,
                                                      Address address2);

    [[nodiscard]] Result<void> add_instruction_match(RowId basic_block_match_id,
                                                     Address address1,
                                                     Address address2);

    // Overwrite the function, library function, basic block and instruction counters
    [[nodiscard]] Result<void> update_file_info(RowId file_id,
                                                Count functions,
                                                Count libfunctions,
                                                Count basicblocks,
                                                Count instructions);

    [[nodiscard]] Result<void> update_same_basic_block_count(RowId function_match_id,
                                                             Count same_basic_blocks);

    // Set metadata.modified to now
    [[nodiscard]] Result<void> touch_modified();

    // Flush pending writes
    [[nodiscard]] Result<void> commit();

private:
    // Internal error unless the connection is open read-write
    [[nodiscard]] Result<void> check_writable() const;

    // Open a transaction if none is running
    [[nodiscard]] Result<void> ensure_transaction();

    [[nodiscard]] Result<persistence::Statement> prepare_write(std::string_view sql);

    persistence::Database& db_;
};

} // namespace diffdb::results
