#include "diffdb/results/algorithm.hpp"

namespace diffdb::results {

std::string_view function_algorithm_name(FunctionAlgorithm algorithm) noexcept {
    switch (algorithm) {
        case FunctionAlgorithm::NameHashMatching:                 return "name hash matching";
        case FunctionAlgorithm::HashMatching:                     return "hash matching";
        case FunctionAlgorithm::EdgesFlowgraphMdIndex:            return "edges flowgraph MD index";
        case FunctionAlgorithm::EdgesCallgraphMdIndex:            return "edges callgraph MD index";
        case FunctionAlgorithm::MdIndexMatchingFlowgraphTopDown:  return "MD index matching (flowgraph MD index, top down)";
        case FunctionAlgorithm::MdIndexMatchingFlowgraphBottomUp: return "MD index matching (flowgraph MD index, bottom up)";
        case FunctionAlgorithm::PrimeSignatureMatching:           return "prime signature matching";
        case FunctionAlgorithm::MdIndexMatchingCallgraphTopDown:  return "MD index matching (callGraph MD index, top down)";
        case FunctionAlgorithm::MdIndexMatchingCallgraphBottomUp: return "MD index matching (callGraph MD index, bottom up)";
        case FunctionAlgorithm::RelaxedMdIndexMatching:           return "relaxed MD index matching";
        case FunctionAlgorithm::InstructionCount:                 return "instruction count";
        case FunctionAlgorithm::AddressSequence:                  return "address sequence";
        case FunctionAlgorithm::StringReferences:                 return "string references";
        case FunctionAlgorithm::LoopCountMatching:                return "loop count matching";
        case FunctionAlgorithm::CallSequenceMatchingExact:        return "call sequence matching(exact)";
        case FunctionAlgorithm::CallSequenceMatchingTopology:     return "call sequence matching(topology)";
        case FunctionAlgorithm::CallSequenceMatchingSequence:     return "call sequence matching(sequence)";
        case FunctionAlgorithm::CallReferenceMatching:            return "call reference matching";
        case FunctionAlgorithm::Manual:                           return "manual";
    }
    return "unknown";
}

std::string_view basic_block_algorithm_name(BasicBlockAlgorithm algorithm) noexcept {
    switch (algorithm) {
        case BasicBlockAlgorithm::EdgesPrimeProduct:            return "edges prime product";
        case BasicBlockAlgorithm::HashMatchingFourInstMin:      return "hash matching (4 instructions minimum)";
        case BasicBlockAlgorithm::PrimeMatchingFourInstMin:     return "prime matching (4 instructions minimum)";
        case BasicBlockAlgorithm::CallReferenceMatching:        return "call reference matching";
        case BasicBlockAlgorithm::StringReferencesMatching:     return "string references matching";
        case BasicBlockAlgorithm::EdgesMdIndexTopDown:          return "edges MD index (top down)";
        case BasicBlockAlgorithm::MdIndexMatchingTopDown:       return "MD index matching (top down)";
        case BasicBlockAlgorithm::EdgesMdIndexBottomUp:         return "edges MD index (bottom up)";
        case BasicBlockAlgorithm::MdIndexMatchingBottomUp:      return "MD index matching (bottom up)";
        case BasicBlockAlgorithm::RelaxedMdIndexMatching:       return "relaxed MD index matching";
        case BasicBlockAlgorithm::PrimeMatchingNoInstMin:       return "prime matching (0 instructions minimum)";
        case BasicBlockAlgorithm::EdgesLengauerTarjanDominated: return "edges Lengauer Tarjan dominated";
        case BasicBlockAlgorithm::LoopEntryMatching:            return "loop entry matching";
        case BasicBlockAlgorithm::SelfLoopMatching:             return "self loop matching";
        case BasicBlockAlgorithm::EntryPointMatching:           return "entry point matching";
        case BasicBlockAlgorithm::ExitPointMatching:            return "exit point matching";
        case BasicBlockAlgorithm::InstructionCountMatching:     return "instruction count matching";
        case BasicBlockAlgorithm::JumpSequenceMatching:         return "jump sequence matching";
        case BasicBlockAlgorithm::PropagationSizeOne:           return "propagation (size==1)";
        case BasicBlockAlgorithm::Manual:                       return "manual";
    }
    return "unknown";
}

std::optional<FunctionAlgorithm> function_algorithm_from_code(std::int64_t code) noexcept {
    if (code < to_code(FunctionAlgorithm::NameHashMatching) ||
        code > to_code(FunctionAlgorithm::Manual)) {
        return std::nullopt;
    }
    return static_cast<FunctionAlgorithm>(code);
}

std::optional<BasicBlockAlgorithm> basic_block_algorithm_from_code(std::int64_t code) noexcept {
    if (code < to_code(BasicBlockAlgorithm::EdgesPrimeProduct) ||
        code > to_code(BasicBlockAlgorithm::Manual)) {
        return std::nullopt;
    }
    return static_cast<BasicBlockAlgorithm>(code);
}

} // namespace diffdb::results
