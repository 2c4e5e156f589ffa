#pragma once

#include "diffdb/results/algorithm.hpp"
#include <diffdb/core/types.hpp>
#include <diffdb/core/timestamp.hpp>
#include <string>
#include <unordered_map>

namespace diffdb::results {

// Aggregate statistics of one diffed binary
struct FileStats {
    Count functions{0};         // total number of functions
    Count libfunctions{0};      // functions identified as library code
    Count calls{0};
    Count basicblocks{0};
    Count libbasicblocks{0};    // basic blocks belonging to library functions
    Count edges{0};             // call graph edges
    Count libedges{0};          // call graph edges targeting library code
    Count instructions{0};
    Count libinstructions{0};

    bool operator==(const FileStats&) const = default;
};

// One row of the file table
struct File {
    RowId id{INVALID_ROW_ID};
    std::string filename;       // display name
    std::string exefilename;
    std::string hash;           // hex digest
    FileStats stats;

    bool operator==(const File&) const = default;
};

// Matched function pair
struct FunctionMatch {
    RowId id{INVALID_ROW_ID};
    Address address1{INVALID_ADDRESS};
    std::string name1;
    Address address2{INVALID_ADDRESS};
    std::string name2;
    double similarity{0.0};
    double confidence{0.0};
    FunctionAlgorithm algorithm{FunctionAlgorithm::Manual};
};

// Matched basic block pair, owned by a function match
struct BasicBlockMatch {
    RowId id{INVALID_ROW_ID};
    const FunctionMatch* function_match{nullptr};
    Address address1{INVALID_ADDRESS};
    Address address2{INVALID_ADDRESS};
    BasicBlockAlgorithm algorithm{BasicBlockAlgorithm::EdgesPrimeProduct};
};

// Parameters of a new result file
struct ResultInfo {
    std::string version;
    std::string description;
    double similarity{0.0};
    double confidence{0.0};
};

// Contents of the metadata row
struct DiffMetadata {
    std::string version;
    std::string description;
    Timestamp created{};
    Timestamp modified{};
    double similarity{0.0};     // rounded to 3 decimals on load
    double confidence{0.0};     // rounded to 3 decimals on load
};

// function address -> match
using FunctionIndex = std::unordered_map<Address, const FunctionMatch*>;

// block address -> owning function address -> match
using BasicBlockIndex =
    std::unordered_map<Address, std::unordered_map<Address, const BasicBlockMatch*>>;

// instruction address -> owning function address -> counterpart instruction address
using InstructionIndex = std::unordered_map<Address, std::unordered_map<Address, Address>>;

} // namespace diffdb::results
