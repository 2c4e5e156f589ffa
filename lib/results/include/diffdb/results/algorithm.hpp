#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace diffdb::results {

// Heuristic that produced a function match. Codes are the values stored in
// function.algorithm and the ids of the functionalgorithm lookup table.
enum class FunctionAlgorithm : std::uint8_t {
    NameHashMatching = 1,
    HashMatching = 2,
    EdgesFlowgraphMdIndex = 3,
    EdgesCallgraphMdIndex = 4,
    MdIndexMatchingFlowgraphTopDown = 5,
    MdIndexMatchingFlowgraphBottomUp = 6,
    PrimeSignatureMatching = 7,
    MdIndexMatchingCallgraphTopDown = 8,
    MdIndexMatchingCallgraphBottomUp = 9,
    RelaxedMdIndexMatching = 10,
    InstructionCount = 11,
    AddressSequence = 12,
    StringReferences = 13,
    LoopCountMatching = 14,
    CallSequenceMatchingExact = 15,
    CallSequenceMatchingTopology = 16,
    CallSequenceMatchingSequence = 17,
    CallReferenceMatching = 18,
    Manual = 19,
};

// Heuristic that produced a basic block match
enum class BasicBlockAlgorithm : std::uint8_t {
    EdgesPrimeProduct = 1,
    HashMatchingFourInstMin = 2,
    PrimeMatchingFourInstMin = 3,
    CallReferenceMatching = 4,
    StringReferencesMatching = 5,
    EdgesMdIndexTopDown = 6,
    MdIndexMatchingTopDown = 7,
    EdgesMdIndexBottomUp = 8,
    MdIndexMatchingBottomUp = 9,
    RelaxedMdIndexMatching = 10,
    PrimeMatchingNoInstMin = 11,
    EdgesLengauerTarjanDominated = 12,
    LoopEntryMatching = 13,
    SelfLoopMatching = 14,
    EntryPointMatching = 15,
    ExitPointMatching = 16,
    InstructionCountMatching = 17,
    JumpSequenceMatching = 18,
    PropagationSizeOne = 19,
    Manual = 20,
};

inline constexpr FunctionAlgorithm ALL_FUNCTION_ALGORITHMS[] = {
    FunctionAlgorithm::NameHashMatching,
    FunctionAlgorithm::HashMatching,
    FunctionAlgorithm::EdgesFlowgraphMdIndex,
    FunctionAlgorithm::EdgesCallgraphMdIndex,
    FunctionAlgorithm::MdIndexMatchingFlowgraphTopDown,
    FunctionAlgorithm::MdIndexMatchingFlowgraphBottomUp,
    FunctionAlgorithm::PrimeSignatureMatching,
    FunctionAlgorithm::MdIndexMatchingCallgraphTopDown,
    FunctionAlgorithm::MdIndexMatchingCallgraphBottomUp,
    FunctionAlgorithm::RelaxedMdIndexMatching,
    FunctionAlgorithm::InstructionCount,
    FunctionAlgorithm::AddressSequence,
    FunctionAlgorithm::StringReferences,
    FunctionAlgorithm::LoopCountMatching,
    FunctionAlgorithm::CallSequenceMatchingExact,
    FunctionAlgorithm::CallSequenceMatchingTopology,
    FunctionAlgorithm::CallSequenceMatchingSequence,
    FunctionAlgorithm::CallReferenceMatching,
    FunctionAlgorithm::Manual,
};

inline constexpr BasicBlockAlgorithm ALL_BASIC_BLOCK_ALGORITHMS[] = {
    BasicBlockAlgorithm::EdgesPrimeProduct,
    BasicBlockAlgorithm::HashMatchingFourInstMin,
    BasicBlockAlgorithm::PrimeMatchingFourInstMin,
    BasicBlockAlgorithm::CallReferenceMatching,
    BasicBlockAlgorithm::StringReferencesMatching,
    BasicBlockAlgorithm::EdgesMdIndexTopDown,
    BasicBlockAlgorithm::MdIndexMatchingTopDown,
    BasicBlockAlgorithm::EdgesMdIndexBottomUp,
    BasicBlockAlgorithm::MdIndexMatchingBottomUp,
    BasicBlockAlgorithm::RelaxedMdIndexMatching,
    BasicBlockAlgorithm::PrimeMatchingNoInstMin,
    BasicBlockAlgorithm::EdgesLengauerTarjanDominated,
    BasicBlockAlgorithm::LoopEntryMatching,
    BasicBlockAlgorithm::SelfLoopMatching,
    BasicBlockAlgorithm::EntryPointMatching,
    BasicBlockAlgorithm::ExitPointMatching,
    BasicBlockAlgorithm::InstructionCountMatching,
    BasicBlockAlgorithm::JumpSequenceMatching,
    BasicBlockAlgorithm::PropagationSizeOne,
    BasicBlockAlgorithm::Manual,
};

// Human-readable names, as rendered by diff viewers
[[nodiscard]] std::string_view function_algorithm_name(FunctionAlgorithm algorithm) noexcept;
[[nodiscard]] std::string_view basic_block_algorithm_name(BasicBlockAlgorithm algorithm) noexcept;

// Stored code -> enumerator; nullopt for codes outside the enumeration
[[nodiscard]] std::optional<FunctionAlgorithm> function_algorithm_from_code(std::int64_t code) noexcept;
[[nodiscard]] std::optional<BasicBlockAlgorithm> basic_block_algorithm_from_code(std::int64_t code) noexcept;

[[nodiscard]] constexpr int to_code(FunctionAlgorithm algorithm) noexcept {
    return static_cast<int>(algorithm);
}

[[nodiscard]] constexpr int to_code(BasicBlockAlgorithm algorithm) noexcept {
    return static_cast<int>(algorithm);
}

} // namespace diffdb::results
