#include "diffdb/results/writer.hpp"
#include <diffdb/core/address.hpp>
#include <diffdb/core/timestamp.hpp>
#include <spdlog/spdlog.h>
#include <filesystem>
#include <string>

namespace diffdb::results {

Writer::Writer(persistence::Database& db)
    : db_(db)
{}

Result<void> Writer::ensure_transaction() {
    if (db_.in_transaction()) {
        return {};
    }
    return db_.begin_transaction();
}

Result<void> Writer::check_writable() const {
    if (!db_.is_open()) {
        return std::unexpected(internal_error("Result file not open"));
    }
    if (db_.is_read_only()) {
        return std::unexpected(internal_error(
            std::format("'{}' is opened read-only", db_.path())));
    }
    return {};
}

Result<persistence::Statement> Writer::prepare_write(std::string_view sql) {
    DIFFDB_TRY_VOID(check_writable());
    DIFFDB_TRY_VOID(ensure_transaction());
    return db_.prepare(sql);
}

Result<void> Writer::install_schema() {
    DIFFDB_TRY_VOID(check_writable());
    if (db_.in_transaction()) {
        return std::unexpected(internal_error("Cannot install schema inside a pending transaction"));
    }
    DIFFDB_TRY_VOID(db_.create_schema());

    auto function_stmt = DIFFDB_TRY(prepare_write(
        "INSERT INTO functionalgorithm (name) VALUES (:name)"));
    for (auto algorithm : ALL_FUNCTION_ALGORITHMS) {
        function_stmt.reset();
        std::string name = std::format("function: {}", function_algorithm_name(algorithm));
        function_stmt.bind(":name", std::string_view{name});
        DIFFDB_TRY_VOID(db_.execute(function_stmt));
    }

    auto block_stmt = DIFFDB_TRY(prepare_write(
        "INSERT INTO basicblockalgorithm (name) VALUES (:name)"));
    for (auto algorithm : ALL_BASIC_BLOCK_ALGORITHMS) {
        block_stmt.reset();
        std::string name = std::format("basicBlock: {}", basic_block_algorithm_name(algorithm));
        block_stmt.bind(":name", std::string_view{name});
        DIFFDB_TRY_VOID(db_.execute(block_stmt));
    }

    return {};
}

Result<void> Writer::create_result(const ResultInfo& info) {
    auto stmt = DIFFDB_TRY(prepare_write(R"(
        INSERT INTO metadata (version, file1, file2, description, created, modified,
                              similarity, confidence)
        VALUES (:version, :file1, :file2, :description, :created, :modified,
                :similarity, :confidence)
    )"));

    // modified must be filled, start it at the creation time
    std::string now = format_timestamp(now_timestamp());

    stmt.bind(":version", std::string_view{info.version});
    stmt.bind(":file1", persistence::PRIMARY_FILE_ID);
    stmt.bind(":file2", persistence::SECONDARY_FILE_ID);
    stmt.bind(":description", std::string_view{info.description});
    stmt.bind(":created", std::string_view{now});
    stmt.bind(":modified", std::string_view{now});
    stmt.bind(":similarity", info.similarity);
    stmt.bind(":confidence", info.confidence);

    return db_.execute(stmt);
}

Result<RowId> Writer::add_file(std::string_view export_name,
                               std::string_view hash,
                               std::string_view executable_name,
                               const FileStats& stats) {
    auto stmt = DIFFDB_TRY(prepare_write(R"(
        INSERT INTO file (filename, exefilename, hash, functions, libfunctions, calls,
                          basicblocks, libbasicblocks, edges, libedges, instructions,
                          libinstructions)
        VALUES (:filename, :exefilename, :hash, :functions, :libfunctions, :calls,
                :basicblocks, :libbasicblocks, :edges, :libedges, :instructions,
                :libinstructions)
    )"));

    std::string filename = std::filesystem::path(export_name).stem().string();
    std::string exefilename = executable_name.empty() ? filename : std::string(executable_name);

    stmt.bind(":filename", std::string_view{filename});
    stmt.bind(":exefilename", std::string_view{exefilename});
    stmt.bind(":hash", hash);
    stmt.bind(":functions", stats.functions);
    stmt.bind(":libfunctions", stats.libfunctions);
    stmt.bind(":calls", stats.calls);
    stmt.bind(":basicblocks", stats.basicblocks);
    stmt.bind(":libbasicblocks", stats.libbasicblocks);
    stmt.bind(":edges", stats.edges);
    stmt.bind(":libedges", stats.libedges);
    stmt.bind(":instructions", stats.instructions);
    stmt.bind(":libinstructions", stats.libinstructions);

    DIFFDB_TRY_VOID(db_.execute(stmt));

    RowId id = db_.last_insert_rowid();
    spdlog::debug("Added file '{}' as row {}", filename, id);
    return id;
}

Result<RowId> Writer::add_function_match(Address address1,
                                         Address address2,
                                         std::string_view name1,
                                         std::string_view name2,
                                         double similarity,
                                         double confidence,
                                         Count identical_basic_blocks) {
    // flags, evaluate, commentsported, edges and instructions are not
    // tracked by producers and stay at zero
    auto stmt = DIFFDB_TRY(prepare_write(R"(
        INSERT INTO function (address1, address2, name1, name2, similarity, confidence,
                              flags, algorithm, evaluate, commentsported, basicblocks,
                              edges, instructions)
        VALUES (:address1, :address2, :name1, :name2, :similarity, :confidence,
                0, :algorithm, 0, 0, :identical_bbs, 0, 0)
    )"));

    stmt.bind(":address1", encode_address(address1));
    stmt.bind(":address2", encode_address(address2));
    stmt.bind(":name1", name1);
    stmt.bind(":name2", name2);
    stmt.bind(":similarity", similarity);
    stmt.bind(":confidence", confidence);
    stmt.bind(":algorithm", persistence::DEFAULT_FUNCTION_ALGORITHM);
    stmt.bind(":identical_bbs", identical_basic_blocks);

    DIFFDB_TRY_VOID(db_.execute(stmt));
    return db_.last_insert_rowid();
}

Result<RowId> Writer::add_basic_block_match(RowId function_match_id,
                                            Address address1,
                                            Address address2) {
    auto stmt = DIFFDB_TRY(prepare_write(R"(
        INSERT INTO basicblock (functionid, address1, address2, algorithm, evaluate)
        VALUES (:functionid, :address1, :address2, :algorithm, 0)
    )"));

    stmt.bind(":functionid", function_match_id);
    stmt.bind(":address1", encode_address(address1));
    stmt.bind(":address2", encode_address(address2));
    stmt.bind(":algorithm", persistence::DEFAULT_BASIC_BLOCK_ALGORITHM);

    DIFFDB_TRY_VOID(db_.execute(stmt));
    return db_.last_insert_rowid();
}

Result<void> Writer::add_instruction_match(RowId basic_block_match_id,
                                           Address address1,
                                           Address address2) {
    auto stmt = DIFFDB_TRY(prepare_write(
        "INSERT INTO instruction (basicblockid, address1, address2) "
        "VALUES (:basicblockid, :address1, :address2)"));

    stmt.bind(":basicblockid", basic_block_match_id);
    stmt.bind(":address1", encode_address(address1));
    stmt.bind(":address2", encode_address(address2));

    return db_.execute(stmt);
}

Result<void> Writer::update_file_info(RowId file_id,
                                      Count functions,
                                      Count libfunctions,
                                      Count basicblocks,
                                      Count instructions) {
    auto stmt = DIFFDB_TRY(prepare_write(R"(
        UPDATE file
        SET functions = :functions, libfunctions = :libfunctions,
            basicblocks = :basicblocks, instructions = :instructions
        WHERE id = :id
    )"));

    stmt.bind(":functions", functions);
    stmt.bind(":libfunctions", libfunctions);
    stmt.bind(":basicblocks", basicblocks);
    stmt.bind(":instructions", instructions);
    stmt.bind(":id", file_id);

    DIFFDB_TRY_VOID(db_.execute(stmt));
    if (db_.changes() == 0) {
        return std::unexpected(not_found_error(std::format("no file row with id {}", file_id)));
    }
    return {};
}

Result<void> Writer::update_same_basic_block_count(RowId function_match_id,
                                                   Count same_basic_blocks) {
    auto stmt = DIFFDB_TRY(prepare_write(
        "UPDATE function SET basicblocks = :bb_count WHERE id = :id"));

    stmt.bind(":bb_count", same_basic_blocks);
    stmt.bind(":id", function_match_id);

    DIFFDB_TRY_VOID(db_.execute(stmt));
    if (db_.changes() == 0) {
        return std::unexpected(not_found_error(
            std::format("no function match with id {}", function_match_id)));
    }
    return {};
}

Result<void> Writer::touch_modified() {
    auto stmt = DIFFDB_TRY(prepare_write("UPDATE metadata SET modified = :modified"));

    std::string now = format_timestamp(now_timestamp());
    stmt.bind(":modified", std::string_view{now});
    return db_.execute(stmt);
}

Result<void> Writer::commit() {
    if (!db_.in_transaction()) {
        return {};
    }

    auto result = db_.commit();
    if (!result) {
        spdlog::error("Failed to commit '{}': {}", db_.path(), result.error().message());
        return result;
    }

    spdlog::info("Committed '{}'", db_.path());
    return {};
}

} // namespace diffdb::results
