#include "diffdb/results/loader.hpp"
#include <diffdb/core/address.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <charconv>
#include <system_error>

namespace diffdb::results {

namespace {

constexpr int LOAD_PHASES = 5;

// Three decimals, rounded from the exact binary value as "%.3f" prints it
double round_score(double value) {
    char buffer[64];
    auto [end, ec] = std::to_chars(buffer, buffer + sizeof(buffer), value,
                                   std::chars_format::fixed, 3);
    if (ec != std::errc{}) {
        return value;
    }

    double rounded = value;
    auto parsed = std::from_chars(buffer, end, rounded);
    return parsed.ec == std::errc{} ? rounded : value;
}

template<typename Map, typename Key>
auto* find_nested(const Map& index, Key outer, Key inner) {
    using Value = typename Map::mapped_type::mapped_type;
    const Value* found = nullptr;
    auto it = index.find(outer);
    if (it != index.end()) {
        auto inner_it = it->second.find(inner);
        if (inner_it != it->second.end()) {
            found = &inner_it->second;
        }
    }
    return found;
}

} // anonymous namespace

Loader::Loader(persistence::Database& db)
    : db_(db)
{}

Result<void> Loader::load(const LoadProgressCallback& callback) {
    clear();

    using Pass = Result<void> (Loader::*)();
    struct Phase {
        Pass pass;
        const char* name;
    };
    const Phase phases[LOAD_PHASES] = {
        {&Loader::load_metadata, "Loading metadata..."},
        {&Loader::load_files, "Loading files..."},
        {&Loader::load_function_matches, "Loading function matches..."},
        {&Loader::load_basic_block_matches, "Loading basic block matches..."},
        {&Loader::load_instruction_matches, "Loading instruction matches..."},
    };

    int done = 0;
    for (const auto& phase : phases) {
        if (callback) {
            callback(static_cast<float>(done) / LOAD_PHASES, phase.name);
        }

        auto result = (this->*phase.pass)();
        if (!result) {
            clear();
            return std::unexpected(result.error().with_context(db_.path()));
        }
        ++done;
    }

    if (callback) {
        callback(1.0f, "Done");
    }

    loaded_ = true;
    spdlog::debug("Loaded '{}': {} function, {} basic block matches",
                  db_.path(), function_rows_.size(), basic_block_rows_.size());
    return {};
}

Result<void> Loader::load_metadata() {
    bool found = false;
    std::string created;
    std::string modified;

    auto result = db_.query(
        "SELECT version, description, created, modified, similarity, confidence FROM metadata",
        [&](persistence::Statement& stmt) -> Result<bool> {
            metadata_.version = stmt.column_text(0);
            metadata_.description = stmt.column_text(1);
            created = stmt.column_text(2);
            modified = stmt.column_text(3);
            metadata_.similarity = round_score(stmt.column_double(4));
            metadata_.confidence = round_score(stmt.column_double(5));
            found = true;
            return false;  // single row
        }
    );
    DIFFDB_TRY_VOID(result);

    if (!found) {
        return std::unexpected(not_found_error("metadata row missing"));
    }

    metadata_.created = DIFFDB_TRY(parse_timestamp(created));
    metadata_.modified = DIFFDB_TRY(parse_timestamp(modified));
    return {};
}

Result<void> Loader::load_files() {
    std::vector<File> files;

    auto result = db_.query(
        "SELECT id, filename, exefilename, hash, functions, libfunctions, calls, "
        "basicblocks, libbasicblocks, edges, libedges, instructions, libinstructions "
        "FROM file ORDER BY id",
        [&](persistence::Statement& stmt) -> Result<bool> {
            File file;
            file.id = stmt.column_int64(0);
            file.filename = stmt.column_text(1);
            file.exefilename = stmt.column_text(2);
            file.hash = stmt.column_text(3);
            file.stats.functions = stmt.column_int64(4);
            file.stats.libfunctions = stmt.column_int64(5);
            file.stats.calls = stmt.column_int64(6);
            file.stats.basicblocks = stmt.column_int64(7);
            file.stats.libbasicblocks = stmt.column_int64(8);
            file.stats.edges = stmt.column_int64(9);
            file.stats.libedges = stmt.column_int64(10);
            file.stats.instructions = stmt.column_int64(11);
            file.stats.libinstructions = stmt.column_int64(12);
            files.push_back(std::move(file));
            return true;
        }
    );
    DIFFDB_TRY_VOID(result);

    if (files.size() < 2) {
        return std::unexpected(not_found_error(
            std::format("expected two file rows, found {}", files.size())));
    }
    if (files.size() > 2) {
        spdlog::warn("'{}' has {} file rows, using the first two", db_.path(), files.size());
    }

    // Pairing is positional: first inserted is primary
    primary_file_ = std::move(files[0]);
    secondary_file_ = std::move(files[1]);
    return {};
}

Result<void> Loader::load_function_matches() {
    auto result = db_.query(
        "SELECT id, address1, name1, address2, name2, similarity, confidence, algorithm "
        "FROM function",
        [&](persistence::Statement& stmt) -> Result<bool> {
            auto algorithm = function_algorithm_from_code(stmt.column_int64(7));
            if (!algorithm) {
                return std::unexpected(parse_error(std::format(
                    "function match {} has unknown algorithm {}",
                    stmt.column_int64(0), stmt.column_int64(7))));
            }

            RowId id = stmt.column_int64(0);
            FunctionMatch match;
            match.id = id;
            match.address1 = decode_address(stmt.column_int64(1));
            match.name1 = stmt.column_text(2);
            match.address2 = decode_address(stmt.column_int64(3));
            match.name2 = stmt.column_text(4);
            match.similarity = stmt.column_double(5);
            match.confidence = stmt.column_double(6);
            match.algorithm = *algorithm;

            auto [it, inserted] = function_rows_.insert_or_assign(id, std::move(match));
            const FunctionMatch* stored = &it->second;

            // Last row wins on a duplicated single-side address
            auto [p, p_new] = primary_functions_.insert_or_assign(stored->address1, stored);
            if (!p_new) {
                spdlog::warn("Primary function {:#x} matched more than once, keeping match {}",
                             stored->address1, stored->id);
            }
            auto [s, s_new] = secondary_functions_.insert_or_assign(stored->address2, stored);
            if (!s_new) {
                spdlog::warn("Secondary function {:#x} matched more than once, keeping match {}",
                             stored->address2, stored->id);
            }
            return true;
        }
    );
    DIFFDB_TRY_VOID(result);

    spdlog::debug("Loaded {} function matches", function_rows_.size());
    return {};
}

Result<void> Loader::load_basic_block_matches() {
    auto result = db_.query(
        "SELECT id, functionid, address1, address2, algorithm FROM basicblock",
        [&](persistence::Statement& stmt) -> Result<bool> {
            RowId id = stmt.column_int64(0);
            RowId function_id = stmt.column_int64(1);

            auto owner = function_rows_.find(function_id);
            if (owner == function_rows_.end()) {
                return std::unexpected(integrity_error(std::format(
                    "basic block match {} references unknown function match {}",
                    id, function_id)));
            }

            auto algorithm = basic_block_algorithm_from_code(stmt.column_int64(4));
            if (!algorithm) {
                return std::unexpected(parse_error(std::format(
                    "basic block match {} has unknown algorithm {}",
                    id, stmt.column_int64(4))));
            }

            BasicBlockMatch match;
            match.id = id;
            match.function_match = &owner->second;
            match.address1 = decode_address(stmt.column_int64(2));
            match.address2 = decode_address(stmt.column_int64(3));
            match.algorithm = *algorithm;

            auto [it, inserted] = basic_block_rows_.insert_or_assign(id, match);
            const BasicBlockMatch* stored = &it->second;

            // A block can belong to several functions: key by block, then function
            primary_blocks_[stored->address1][owner->second.address1] = stored;
            secondary_blocks_[stored->address2][owner->second.address2] = stored;
            return true;
        }
    );
    DIFFDB_TRY_VOID(result);

    spdlog::debug("Loaded {} basic block matches", basic_block_rows_.size());
    return {};
}

Result<void> Loader::load_instruction_matches() {
    std::size_t count = 0;

    auto result = db_.query(
        "SELECT basicblockid, address1, address2 FROM instruction",
        [&](persistence::Statement& stmt) -> Result<bool> {
            RowId block_id = stmt.column_int64(0);

            auto block = basic_block_rows_.find(block_id);
            if (block == basic_block_rows_.end()) {
                return std::unexpected(integrity_error(std::format(
                    "instruction match references unknown basic block match {}", block_id)));
            }

            Address address1 = decode_address(stmt.column_int64(1));
            Address address2 = decode_address(stmt.column_int64(2));
            const FunctionMatch* function = block->second.function_match;

            primary_instructions_[address1][function->address1] = address2;
            secondary_instructions_[address2][function->address2] = address1;
            ++count;
            return true;
        }
    );
    DIFFDB_TRY_VOID(result);

    spdlog::debug("Loaded {} instruction matches", count);
    return {};
}

void Loader::clear() {
    loaded_ = false;
    metadata_ = DiffMetadata{};
    primary_file_ = File{};
    secondary_file_ = File{};
    primary_instructions_.clear();
    secondary_instructions_.clear();
    primary_blocks_.clear();
    secondary_blocks_.clear();
    primary_functions_.clear();
    secondary_functions_.clear();
    basic_block_rows_.clear();
    function_rows_.clear();
}

const FunctionMatch* Loader::find_primary_function(Address address) const {
    auto it = primary_functions_.find(address);
    return it != primary_functions_.end() ? it->second : nullptr;
}

const FunctionMatch* Loader::find_secondary_function(Address address) const {
    auto it = secondary_functions_.find(address);
    return it != secondary_functions_.end() ? it->second : nullptr;
}

const BasicBlockMatch* Loader::find_primary_basic_block(Address block, Address function) const {
    auto* found = find_nested(primary_blocks_, block, function);
    return found ? *found : nullptr;
}

const BasicBlockMatch* Loader::find_secondary_basic_block(Address block, Address function) const {
    auto* found = find_nested(secondary_blocks_, block, function);
    return found ? *found : nullptr;
}

std::optional<Address> Loader::find_primary_instruction(Address insn, Address function) const {
    auto* found = find_nested(primary_instructions_, insn, function);
    if (!found) return std::nullopt;
    return *found;
}

std::optional<Address> Loader::find_secondary_instruction(Address insn, Address function) const {
    auto* found = find_nested(secondary_instructions_, insn, function);
    if (!found) return std::nullopt;
    return *found;
}

Count Loader::unmatched_primary_count() const noexcept {
    return primary_file_.stats.functions + primary_file_.stats.libfunctions -
           static_cast<Count>(primary_functions_.size());
}

Count Loader::unmatched_secondary_count() const noexcept {
    return secondary_file_.stats.functions + secondary_file_.stats.libfunctions -
           static_cast<Count>(secondary_functions_.size());
}

std::vector<const FunctionMatch*> Loader::function_matches() const {
    std::vector<const FunctionMatch*> matches;
    matches.reserve(primary_functions_.size());
    for (const auto& [address, match] : primary_functions_) {
        matches.push_back(match);
    }

    std::sort(matches.begin(), matches.end(),
              [](const FunctionMatch* a, const FunctionMatch* b) { return a->id < b->id; });
    return matches;
}

std::vector<const BasicBlockMatch*> Loader::basic_block_matches() const {
    std::vector<const BasicBlockMatch*> matches;
    for (const auto& [block, by_function] : primary_blocks_) {
        for (const auto& [function, match] : by_function) {
            matches.push_back(match);
        }
    }

    std::sort(matches.begin(), matches.end(),
              [](const BasicBlockMatch* a, const BasicBlockMatch* b) { return a->id < b->id; });
    return matches;
}

} // namespace diffdb::results
