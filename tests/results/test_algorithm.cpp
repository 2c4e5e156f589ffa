// Matching algorithm enumeration tests

#include <diffdb/results/algorithm.hpp>

#include <gtest/gtest.h>

#include <set>
#include <string>

using namespace diffdb::results;

TEST(AlgorithmTest, FunctionCodesAreContiguous) {
    int expected = 1;
    for (auto algorithm : ALL_FUNCTION_ALGORITHMS) {
        EXPECT_EQ(to_code(algorithm), expected);
        ++expected;
    }
    EXPECT_EQ(std::size(ALL_FUNCTION_ALGORITHMS), 19u);
    EXPECT_EQ(to_code(FunctionAlgorithm::Manual), 19);
}

TEST(AlgorithmTest, BasicBlockCodesAreContiguous) {
    int expected = 1;
    for (auto algorithm : ALL_BASIC_BLOCK_ALGORITHMS) {
        EXPECT_EQ(to_code(algorithm), expected);
        ++expected;
    }
    EXPECT_EQ(std::size(ALL_BASIC_BLOCK_ALGORITHMS), 20u);
    EXPECT_EQ(to_code(BasicBlockAlgorithm::EdgesPrimeProduct), 1);
}

TEST(AlgorithmTest, NamesAreDistinct) {
    std::set<std::string> function_names;
    for (auto algorithm : ALL_FUNCTION_ALGORITHMS) {
        function_names.emplace(function_algorithm_name(algorithm));
    }
    EXPECT_EQ(function_names.size(), std::size(ALL_FUNCTION_ALGORITHMS));

    std::set<std::string> block_names;
    for (auto algorithm : ALL_BASIC_BLOCK_ALGORITHMS) {
        block_names.emplace(basic_block_algorithm_name(algorithm));
    }
    EXPECT_EQ(block_names.size(), std::size(ALL_BASIC_BLOCK_ALGORITHMS));
}

TEST(AlgorithmTest, KnownNames) {
    EXPECT_EQ(function_algorithm_name(FunctionAlgorithm::NameHashMatching), "name hash matching");
    EXPECT_EQ(function_algorithm_name(FunctionAlgorithm::Manual), "manual");
    EXPECT_EQ(basic_block_algorithm_name(BasicBlockAlgorithm::EdgesPrimeProduct), "edges prime product");
    EXPECT_EQ(basic_block_algorithm_name(BasicBlockAlgorithm::PropagationSizeOne), "propagation (size==1)");
}

TEST(AlgorithmTest, FromCode) {
    EXPECT_EQ(function_algorithm_from_code(19), FunctionAlgorithm::Manual);
    EXPECT_EQ(function_algorithm_from_code(2), FunctionAlgorithm::HashMatching);
    EXPECT_FALSE(function_algorithm_from_code(0).has_value());
    EXPECT_FALSE(function_algorithm_from_code(20).has_value());
    EXPECT_FALSE(function_algorithm_from_code(-1).has_value());

    EXPECT_EQ(basic_block_algorithm_from_code(1), BasicBlockAlgorithm::EdgesPrimeProduct);
    EXPECT_EQ(basic_block_algorithm_from_code(20), BasicBlockAlgorithm::Manual);
    EXPECT_FALSE(basic_block_algorithm_from_code(0).has_value());
    EXPECT_FALSE(basic_block_algorithm_from_code(21).has_value());
}
