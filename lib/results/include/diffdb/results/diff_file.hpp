#pragma once

#include "diffdb/results/entities.hpp"
#include "diffdb/results/loader.hpp"
#include "diffdb/results/writer.hpp"
#include <diffdb/persistence/database.hpp>
#include <diffdb/core/result.hpp>
#include <filesystem>
#include <memory>
#include <string_view>
#include <vector>

namespace diffdb::results {

// Permission a result file is opened with
enum class OpenMode {
    ReadOnly,   // "ro": load every index eagerly
    ReadWrite,  // "rw": producer access, no indices
};

// "ro" / "rw" -> OpenMode, InvalidArgument for anything else
[[nodiscard]] Result<OpenMode> parse_open_mode(std::string_view permission);

// Handle on one diff result file.
//
// A read-only handle is fully loaded when open() returns; a failed load
// returns the error and no handle. A read-write handle exposes the Writer
// operations, and its index accessors see empty indices.
class DiffFile {
public:
    ~DiffFile();

    DiffFile(const DiffFile&) = delete;
    DiffFile& operator=(const DiffFile&) = delete;

    [[nodiscard]] static Result<std::unique_ptr<DiffFile>> open(
        const std::filesystem::path& path,
        OpenMode mode = OpenMode::ReadOnly,
        const LoadProgressCallback& callback = nullptr
    );

    [[nodiscard]] static Result<std::unique_ptr<DiffFile>> open(
        const std::filesystem::path& path,
        std::string_view permission
    );

    // Create (or truncate) a result file: schema, algorithm tables and
    // metadata row are written and committed. Returns a read-write handle.
    [[nodiscard]] static Result<std::unique_ptr<DiffFile>> create(
        const std::filesystem::path& path,
        const ResultInfo& info
    );

    // Releases the connection; uncommitted writes are discarded
    void close();

    [[nodiscard]] bool is_open() const { return db_.is_open(); }
    [[nodiscard]] OpenMode mode() const noexcept { return mode_; }
    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

    // Read side
    [[nodiscard]] const Loader& index() const noexcept { return loader_; }

    [[nodiscard]] const DiffMetadata& metadata() const noexcept { return loader_.metadata(); }
    [[nodiscard]] double similarity() const noexcept { return loader_.metadata().similarity; }
    [[nodiscard]] double confidence() const noexcept { return loader_.metadata().confidence; }

    [[nodiscard]] const File& primary_file() const noexcept { return loader_.primary_file(); }
    [[nodiscard]] const File& secondary_file() const noexcept { return loader_.secondary_file(); }

    [[nodiscard]] const FunctionIndex& primary_function_matches() const noexcept {
        return loader_.primary_function_matches();
    }
    [[nodiscard]] const FunctionIndex& secondary_function_matches() const noexcept {
        return loader_.secondary_function_matches();
    }
    [[nodiscard]] const BasicBlockIndex& primary_basic_block_matches() const noexcept {
        return loader_.primary_basic_block_matches();
    }
    [[nodiscard]] const BasicBlockIndex& secondary_basic_block_matches() const noexcept {
        return loader_.secondary_basic_block_matches();
    }
    [[nodiscard]] const InstructionIndex& primary_instruction_matches() const noexcept {
        return loader_.primary_instruction_matches();
    }
    [[nodiscard]] const InstructionIndex& secondary_instruction_matches() const noexcept {
        return loader_.secondary_instruction_matches();
    }

    [[nodiscard]] Count unmatched_primary_count() const noexcept { return loader_.unmatched_primary_count(); }
    [[nodiscard]] Count unmatched_secondary_count() const noexcept { return loader_.unmatched_secondary_count(); }
    [[nodiscard]] std::vector<const FunctionMatch*> function_matches() const { return loader_.function_matches(); }
    [[nodiscard]] std::vector<const BasicBlockMatch*> basic_block_matches() const { return loader_.basic_block_matches(); }

    // Write side (fails with an Internal error on a read-only handle)
    [[nodiscard]] Writer& writer() noexcept { return writer_; }

    [[nodiscard]] Result<RowId> add_file(std::string_view export_name,
                                         std::string_view hash,
                                         std::string_view executable_name = {},
                                         const FileStats& stats = {}) {
        return writer_.add_file(export_name, hash, executable_name, stats);
    }

    [[nodiscard]] Result<RowId> add_function_match(Address address1, Address address2,
                                                   std::string_view name1, std::string_view name2,
                                                   double similarity, double confidence = 0.0,
                                                   Count identical_basic_blocks = 0) {
        return writer_.add_function_match(address1, address2, name1, name2,
                                          similarity, confidence, identical_basic_blocks);
    }

    [[nodiscard]] Result<RowId> add_basic_block_match(RowId function_match_id,
                                                      Address address1, Address address2) {
        return writer_.add_basic_block_match(function_match_id, address1, address2);
    }

    [[nodiscard]] Result<void> add_instruction_match(RowId basic_block_match_id,
                                                     Address address1, Address address2) {
        return writer_.add_instruction_match(basic_block_match_id, address1, address2);
    }

    [[nodiscard]] Result<void> update_file_info(RowId file_id, Count functions, Count libfunctions,
                                                Count basicblocks, Count instructions) {
        return writer_.update_file_info(file_id, functions, libfunctions, basicblocks, instructions);
    }

    [[nodiscard]] Result<void> update_same_basic_block_count(RowId function_match_id,
                                                             Count same_basic_blocks) {
        return writer_.update_same_basic_block_count(function_match_id, same_basic_blocks);
    }

    [[nodiscard]] Result<void> commit() { return writer_.commit(); }

private:
    DiffFile();

    persistence::Database db_;
    Loader loader_;
    Writer writer_;
    std::filesystem::path path_;
    OpenMode mode_{OpenMode::ReadOnly};
};

} // namespace diffdb::results
