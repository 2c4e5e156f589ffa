#pragma once

#include <cstdint>
#include <string_view>

namespace diffdb::persistence {

// SQL statements for creating the result-file tables. The column layout is
// the on-disk contract shared with other tools reading these files; keep it
// byte-for-byte.
namespace sql {

// One row per diffed binary, primary first
constexpr std::string_view CREATE_FILE_TABLE = R"(
    CREATE TABLE file (
        id INTEGER PRIMARY KEY,
        filename TEXT,
        exefilename TEXT,
        hash CHARACTER(40),
        functions INT,
        libfunctions INT,
        calls INT,
        basicblocks INT,
        libbasicblocks INT,
        edges INT,
        libedges INT,
        instructions INT,
        libinstructions INT
    )
)";

constexpr std::string_view CREATE_METADATA_TABLE = R"(
    CREATE TABLE metadata (
        version TEXT,
        file1 INTEGER,
        file2 INTEGER,
        description TEXT,
        created DATE,
        modified DATE,
        similarity DOUBLE PRECISION,
        confidence DOUBLE PRECISION,
        FOREIGN KEY(file1) REFERENCES file(id),
        FOREIGN KEY(file2) REFERENCES file(id)
    )
)";

constexpr std::string_view CREATE_FUNCTION_ALGORITHM_TABLE = R"(
    CREATE TABLE functionalgorithm (
        id INTEGER PRIMARY KEY,
        name TEXT
    )
)";

constexpr std::string_view CREATE_FUNCTION_TABLE = R"(
    CREATE TABLE function (
        id INTEGER PRIMARY KEY,
        address1 BIGINT,
        name1 TEXT,
        address2 BIGINT,
        name2 TEXT,
        similarity DOUBLE PRECISION,
        confidence DOUBLE PRECISION,
        flags INTEGER,
        algorithm SMALLINT,
        evaluate BOOLEAN,
        commentsported BOOLEAN,
        basicblocks INTEGER,
        edges INTEGER,
        instructions INTEGER,
        UNIQUE(address1, address2),
        FOREIGN KEY(algorithm) REFERENCES functionalgorithm(id)
    )
)";

constexpr std::string_view CREATE_BASIC_BLOCK_ALGORITHM_TABLE = R"(
    CREATE TABLE basicblockalgorithm (
        id INTEGER PRIMARY KEY,
        name TEXT
    )
)";

constexpr std::string_view CREATE_BASIC_BLOCK_TABLE = R"(
    CREATE TABLE basicblock (
        id INTEGER,
        functionid INT,
        address1 BIGINT,
        address2 BIGINT,
        algorithm SMALLINT,
        evaluate BOOLEAN,
        PRIMARY KEY(id),
        FOREIGN KEY(functionid) REFERENCES function(id),
        FOREIGN KEY(algorithm) REFERENCES basicblockalgorithm(id)
    )
)";

constexpr std::string_view CREATE_INSTRUCTION_TABLE = R"(
    CREATE TABLE instruction (
        basicblockid INT,
        address1 BIGINT,
        address2 BIGINT,
        FOREIGN KEY(basicblockid) REFERENCES basicblock(id)
    )
)";

// Creation order respects the foreign keys
constexpr std::string_view ALL_CREATE_TABLES[] = {
    CREATE_FILE_TABLE,
    CREATE_METADATA_TABLE,
    CREATE_FUNCTION_ALGORITHM_TABLE,
    CREATE_FUNCTION_TABLE,
    CREATE_BASIC_BLOCK_ALGORITHM_TABLE,
    CREATE_BASIC_BLOCK_TABLE,
    CREATE_INSTRUCTION_TABLE,
};

} // namespace sql

// Fixed values written by the match inserts
constexpr int DEFAULT_FUNCTION_ALGORITHM = 19;      // function: manual
constexpr int DEFAULT_BASIC_BLOCK_ALGORITHM = 1;    // basicBlock: edges prime product

// metadata.file1 / metadata.file2 always point at the first two file rows
constexpr std::int64_t PRIMARY_FILE_ID = 1;
constexpr std::int64_t SECONDARY_FILE_ID = 2;

} // namespace diffdb::persistence
