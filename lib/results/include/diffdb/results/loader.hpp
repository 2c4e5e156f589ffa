#pragma once

#include "diffdb/results/entities.hpp"
#include <diffdb/persistence/database.hpp>
#include <diffdb/core/result.hpp>
#include <functional>
#include <optional>
#include <unordered_map>
#include <vector>

namespace diffdb::results {

// Progress callback for the load passes
using LoadProgressCallback = std::function<void(float progress, const char* phase)>;

// Builds the in-memory indices of a result file.
//
// load() runs every pass over full table scans. It is all-or-nothing: on
// failure the loader is left empty. The loader owns the entities, so the
// pointers handed out by the indices live as long as the loader does.
class Loader {
public:
    explicit Loader(persistence::Database& db);

    Loader(const Loader&) = delete;
    Loader& operator=(const Loader&) = delete;

    [[nodiscard]] Result<void> load(const LoadProgressCallback& callback = nullptr);

    [[nodiscard]] bool loaded() const noexcept { return loaded_; }

    // Metadata
    [[nodiscard]] const DiffMetadata& metadata() const noexcept { return metadata_; }

    // File pair
    [[nodiscard]] const File& primary_file() const noexcept { return primary_file_; }
    [[nodiscard]] const File& secondary_file() const noexcept { return secondary_file_; }

    // Function matches keyed by address on either side
    [[nodiscard]] const FunctionIndex& primary_function_matches() const noexcept { return primary_functions_; }
    [[nodiscard]] const FunctionIndex& secondary_function_matches() const noexcept { return secondary_functions_; }

    // Basic block matches: block address -> function address -> match
    [[nodiscard]] const BasicBlockIndex& primary_basic_block_matches() const noexcept { return primary_blocks_; }
    [[nodiscard]] const BasicBlockIndex& secondary_basic_block_matches() const noexcept { return secondary_blocks_; }

    // Instruction matches: instruction address -> function address -> counterpart
    [[nodiscard]] const InstructionIndex& primary_instruction_matches() const noexcept { return primary_instructions_; }
    [[nodiscard]] const InstructionIndex& secondary_instruction_matches() const noexcept { return secondary_instructions_; }

    // Point lookups (nullptr / nullopt when absent)
    [[nodiscard]] const FunctionMatch* find_primary_function(Address address) const;
    [[nodiscard]] const FunctionMatch* find_secondary_function(Address address) const;
    [[nodiscard]] const BasicBlockMatch* find_primary_basic_block(Address block, Address function) const;
    [[nodiscard]] const BasicBlockMatch* find_secondary_basic_block(Address block, Address function) const;
    [[nodiscard]] std::optional<Address> find_primary_instruction(Address insn, Address function) const;
    [[nodiscard]] std::optional<Address> find_secondary_instruction(Address insn, Address function) const;

    // Functions of each binary without a match
    [[nodiscard]] Count unmatched_primary_count() const noexcept;
    [[nodiscard]] Count unmatched_secondary_count() const noexcept;

    // Flat lists, ordered by row id
    [[nodiscard]] std::vector<const FunctionMatch*> function_matches() const;
    [[nodiscard]] std::vector<const BasicBlockMatch*> basic_block_matches() const;

private:
    // Individual passes, in the order load() runs them
    [[nodiscard]] Result<void> load_metadata();
    [[nodiscard]] Result<void> load_files();
    [[nodiscard]] Result<void> load_function_matches();
    [[nodiscard]] Result<void> load_basic_block_matches();
    [[nodiscard]] Result<void> load_instruction_matches();

    void clear();

    persistence::Database& db_;
    bool loaded_{false};

    DiffMetadata metadata_;
    File primary_file_;
    File secondary_file_;

    // Entity storage by row id (node-based, so addresses are stable)
    std::unordered_map<RowId, FunctionMatch> function_rows_;
    std::unordered_map<RowId, BasicBlockMatch> basic_block_rows_;

    FunctionIndex primary_functions_;
    FunctionIndex secondary_functions_;
    BasicBlockIndex primary_blocks_;
    BasicBlockIndex secondary_blocks_;
    InstructionIndex primary_instructions_;
    InstructionIndex secondary_instructions_;
};

} // namespace diffdb::results
