// Index building tests

#include <diffdb/results/loader.hpp>
#include <diffdb/results/writer.hpp>

#include "../test_utils.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <string>
#include <vector>

using namespace diffdb;
using namespace diffdb::results;
using persistence::Database;
using persistence::OpenFlags;

// Writes through a Writer, then reloads read-only
class LoaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(rw_.open(file_.string(), OpenFlags::ReadWriteCreate).has_value());
        writer_ = std::make_unique<Writer>(rw_);
        ASSERT_TRUE(writer_->install_schema().has_value());
        ASSERT_TRUE(writer_->create_result({"diffdb 1.0", "loader", 0.87654, 0.12345}).has_value());
    }

    void add_files(FileStats primary = {}, FileStats secondary = {}) {
        ASSERT_TRUE(writer_->add_file("primary.BinExport", "aaaa", "", primary).has_value());
        ASSERT_TRUE(writer_->add_file("secondary.BinExport", "bbbb", "", secondary).has_value());
    }

    // Commit, close the writer and load
    Result<void> reload() {
        auto committed = writer_->commit();
        if (!committed) return committed;
        writer_.reset();
        rw_.close();

        auto opened = ro_.open(file_.string(), OpenFlags::ReadOnly);
        if (!opened) return opened;
        loader_ = std::make_unique<Loader>(ro_);
        return loader_->load();
    }

    test::TempFile file_;
    Database rw_;
    Database ro_;
    std::unique_ptr<Writer> writer_;
    std::unique_ptr<Loader> loader_;
};

TEST_F(LoaderTest, MetadataRounded) {
    add_files();
    ASSERT_TRUE(reload().has_value());

    const auto& meta = loader_->metadata();
    EXPECT_EQ(meta.version, "diffdb 1.0");
    EXPECT_EQ(meta.description, "loader");
    EXPECT_DOUBLE_EQ(meta.similarity, 0.877);
    EXPECT_DOUBLE_EQ(meta.confidence, 0.123);
    EXPECT_EQ(meta.created, meta.modified);
}

TEST_F(LoaderTest, MetadataRoundsStoredBinaryValue) {
    add_files();
    // 0.0045 is stored as 0.00449999..., which rounds down
    auto update = rw_.prepare("UPDATE metadata SET similarity = :similarity, confidence = :confidence");
    ASSERT_TRUE(update.has_value());
    update->bind(":similarity", 0.0045);
    update->bind(":confidence", 0.0005);
    ASSERT_TRUE(rw_.execute(*update).has_value());
    ASSERT_TRUE(reload().has_value());

    EXPECT_DOUBLE_EQ(loader_->metadata().similarity, 0.004);
    EXPECT_DOUBLE_EQ(loader_->metadata().confidence, 0.001);
}

TEST_F(LoaderTest, FilePairInInsertionOrder) {
    FileStats primary{.functions = 10, .libfunctions = 2, .calls = 3, .basicblocks = 4,
                      .libbasicblocks = 5, .edges = 6, .libedges = 7, .instructions = 8,
                      .libinstructions = 9};
    FileStats secondary{.functions = 11, .libfunctions = 12, .calls = 13, .basicblocks = 14,
                        .libbasicblocks = 15, .edges = 16, .libedges = 17, .instructions = 18,
                        .libinstructions = 19};
    add_files(primary, secondary);
    ASSERT_TRUE(reload().has_value());

    File expected_primary{1, "primary", "primary", "aaaa", primary};
    File expected_secondary{2, "secondary", "secondary", "bbbb", secondary};
    EXPECT_EQ(loader_->primary_file(), expected_primary);
    EXPECT_EQ(loader_->secondary_file(), expected_secondary);
}

TEST_F(LoaderTest, SingleFileIsNotFound) {
    ASSERT_TRUE(writer_->add_file("only.BinExport", "aaaa").has_value());
    ASSERT_TRUE(writer_->add_function_match(0x1000, 0x2000, "f1", "f2", 1.0).has_value());

    auto result = reload();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().category(), ErrorCategory::NotFound);

    EXPECT_FALSE(loader_->loaded());
    EXPECT_TRUE(loader_->primary_function_matches().empty());
    EXPECT_TRUE(loader_->secondary_function_matches().empty());
    EXPECT_TRUE(loader_->primary_basic_block_matches().empty());
    EXPECT_TRUE(loader_->primary_instruction_matches().empty());
}

TEST_F(LoaderTest, FunctionMatchReachableFromBothSides) {
    add_files();
    auto id = writer_->add_function_match(0x1000, 0x2000, "f1", "f2", 0.87, 0.5);
    ASSERT_TRUE(id.has_value());
    ASSERT_TRUE(reload().has_value());

    const auto* by_primary = loader_->find_primary_function(0x1000);
    const auto* by_secondary = loader_->find_secondary_function(0x2000);
    ASSERT_NE(by_primary, nullptr);
    ASSERT_EQ(by_primary, by_secondary);

    EXPECT_EQ(by_primary->id, *id);
    EXPECT_EQ(by_primary->name1, "f1");
    EXPECT_EQ(by_primary->name2, "f2");
    EXPECT_DOUBLE_EQ(std::round(by_primary->similarity * 1000.0) / 1000.0, 0.870);
    EXPECT_DOUBLE_EQ(by_primary->confidence, 0.5);
    EXPECT_EQ(by_primary->algorithm, FunctionAlgorithm::Manual);

    EXPECT_EQ(loader_->find_primary_function(0x2000), nullptr);
    EXPECT_EQ(loader_->find_secondary_function(0x1000), nullptr);
}

TEST_F(LoaderTest, HighAddressesDecoded) {
    add_files();
    auto fn = writer_->add_function_match(0xFFFFFFFFFFFFFFFFull, 0x8000000000000000ull, "a", "b", 1.0);
    ASSERT_TRUE(fn.has_value());
    auto bb = writer_->add_basic_block_match(*fn, 0xFFFFFFFFFFFFFFF0ull, 0x8000000000000010ull);
    ASSERT_TRUE(bb.has_value());
    ASSERT_TRUE(writer_->add_instruction_match(*bb, 0xFFFFFFFFFFFFFFF4ull, 0x8000000000000014ull).has_value());
    ASSERT_TRUE(reload().has_value());

    const auto* match = loader_->find_primary_function(18446744073709551615ull);
    ASSERT_NE(match, nullptr);
    EXPECT_EQ(match->address2, 0x8000000000000000ull);

    const auto* block = loader_->find_primary_basic_block(0xFFFFFFFFFFFFFFF0ull, 0xFFFFFFFFFFFFFFFFull);
    ASSERT_NE(block, nullptr);
    EXPECT_EQ(block->address2, 0x8000000000000010ull);

    auto insn = loader_->find_secondary_instruction(0x8000000000000014ull, 0x8000000000000000ull);
    ASSERT_TRUE(insn.has_value());
    EXPECT_EQ(*insn, 0xFFFFFFFFFFFFFFF4ull);
}

TEST_F(LoaderTest, SharedBlockKeptPerFunction) {
    add_files();
    auto f1 = writer_->add_function_match(0x1000, 0x2000, "f1", "g1", 1.0);
    auto f2 = writer_->add_function_match(0x1050, 0x2050, "f2", "g2", 1.0);
    ASSERT_TRUE(f1.has_value());
    ASSERT_TRUE(f2.has_value());

    auto b1 = writer_->add_basic_block_match(*f1, 0x1100, 0x2100);
    auto b2 = writer_->add_basic_block_match(*f2, 0x1100, 0x2200);
    ASSERT_TRUE(b1.has_value());
    ASSERT_TRUE(b2.has_value());
    ASSERT_TRUE(reload().has_value());

    const auto& primary = loader_->primary_basic_block_matches();
    ASSERT_EQ(primary.count(0x1100), 1u);
    const auto& owners = primary.at(0x1100);
    ASSERT_EQ(owners.size(), 2u);
    EXPECT_EQ(owners.at(0x1000)->id, *b1);
    EXPECT_EQ(owners.at(0x1050)->id, *b2);
    EXPECT_EQ(owners.at(0x1000)->function_match->name1, "f1");
    EXPECT_EQ(owners.at(0x1050)->function_match->name1, "f2");

    const auto& secondary = loader_->secondary_basic_block_matches();
    EXPECT_EQ(secondary.at(0x2100).at(0x2000)->id, *b1);
    EXPECT_EQ(secondary.at(0x2200).at(0x2050)->id, *b2);

    EXPECT_EQ(loader_->basic_block_matches().size(), 2u);
}

TEST_F(LoaderTest, InstructionIndicesBothDirections) {
    add_files();
    auto f1 = writer_->add_function_match(0x1000, 0x2000, "f1", "g1", 1.0);
    auto f2 = writer_->add_function_match(0x1050, 0x2050, "f2", "g2", 1.0);
    ASSERT_TRUE(f1.has_value() && f2.has_value());
    auto b1 = writer_->add_basic_block_match(*f1, 0x1100, 0x2100);
    auto b2 = writer_->add_basic_block_match(*f2, 0x1100, 0x2200);
    ASSERT_TRUE(b1.has_value() && b2.has_value());

    ASSERT_TRUE(writer_->add_instruction_match(*b1, 0x1104, 0x2104).has_value());
    ASSERT_TRUE(writer_->add_instruction_match(*b2, 0x1104, 0x2204).has_value());
    ASSERT_TRUE(reload().has_value());

    const auto& primary = loader_->primary_instruction_matches();
    ASSERT_EQ(primary.at(0x1104).size(), 2u);
    EXPECT_EQ(primary.at(0x1104).at(0x1000), 0x2104u);
    EXPECT_EQ(primary.at(0x1104).at(0x1050), 0x2204u);

    EXPECT_EQ(loader_->find_secondary_instruction(0x2104, 0x2000), 0x1104u);
    EXPECT_EQ(loader_->find_secondary_instruction(0x2204, 0x2050), 0x1104u);
    EXPECT_FALSE(loader_->find_secondary_instruction(0x2204, 0x2000).has_value());
}

TEST_F(LoaderTest, DuplicateSingleSideAddressLastWins) {
    add_files();
    auto first = writer_->add_function_match(0x1000, 0x2000, "a", "b", 0.4);
    auto second = writer_->add_function_match(0x1000, 0x3000, "a", "c", 0.6);
    ASSERT_TRUE(first.has_value() && second.has_value());
    ASSERT_TRUE(reload().has_value());

    EXPECT_EQ(loader_->primary_function_matches().size(), 1u);
    EXPECT_EQ(loader_->find_primary_function(0x1000)->id, *second);

    // Both secondaries keep their own match
    EXPECT_EQ(loader_->find_secondary_function(0x2000)->id, *first);
    EXPECT_EQ(loader_->find_secondary_function(0x3000)->id, *second);
}

TEST_F(LoaderTest, UnmatchedCounts) {
    add_files(FileStats{.functions = 10, .libfunctions = 3},
              FileStats{.functions = 8, .libfunctions = 1});

    // Zero matches
    {
        ASSERT_TRUE(writer_->commit().has_value());
        Database ro;
        ASSERT_TRUE(ro.open(file_.string(), OpenFlags::ReadOnly).has_value());
        Loader loader(ro);
        ASSERT_TRUE(loader.load().has_value());
        EXPECT_EQ(loader.unmatched_primary_count(), 13);
        EXPECT_EQ(loader.unmatched_secondary_count(), 9);
    }

    ASSERT_TRUE(writer_->add_function_match(0x1000, 0x2000, "a", "b", 1.0).has_value());
    ASSERT_TRUE(writer_->add_function_match(0x1100, 0x2100, "c", "d", 1.0).has_value());
    // Same primary again: still one distinct primary address
    ASSERT_TRUE(writer_->add_function_match(0x1100, 0x2200, "c", "e", 1.0).has_value());
    ASSERT_TRUE(reload().has_value());

    EXPECT_EQ(loader_->unmatched_primary_count(), 13 - 2);
    EXPECT_EQ(loader_->unmatched_secondary_count(), 9 - 3);
}

TEST_F(LoaderTest, FlatListsOrderedById) {
    add_files();
    std::vector<RowId> ids;
    for (Address a = 0x5000; a > 0x1000; a -= 0x1000) {
        auto id = writer_->add_function_match(a, a + 0x10000, "f", "g", 1.0);
        ASSERT_TRUE(id.has_value());
        ids.push_back(*id);
        ASSERT_TRUE(writer_->add_basic_block_match(*id, a + 4, a + 0x10004).has_value());
    }
    ASSERT_TRUE(reload().has_value());

    auto functions = loader_->function_matches();
    ASSERT_EQ(functions.size(), ids.size());
    for (std::size_t i = 0; i < ids.size(); ++i) {
        EXPECT_EQ(functions[i]->id, ids[i]);
    }

    auto blocks = loader_->basic_block_matches();
    ASSERT_EQ(blocks.size(), ids.size());
    for (std::size_t i = 1; i < blocks.size(); ++i) {
        EXPECT_LT(blocks[i - 1]->id, blocks[i]->id);
    }
}

TEST_F(LoaderTest, DanglingBasicBlockIsIntegrityError) {
    add_files();
    ASSERT_TRUE(writer_->add_function_match(0x1000, 0x2000, "a", "b", 1.0).has_value());
    ASSERT_TRUE(writer_->add_basic_block_match(999, 0x1010, 0x2010).has_value());

    auto result = reload();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().category(), ErrorCategory::ReferentialIntegrity);
    EXPECT_TRUE(loader_->primary_function_matches().empty());
}

TEST_F(LoaderTest, DanglingInstructionIsIntegrityError) {
    add_files();
    auto fn = writer_->add_function_match(0x1000, 0x2000, "a", "b", 1.0);
    ASSERT_TRUE(fn.has_value());
    ASSERT_TRUE(writer_->add_basic_block_match(*fn, 0x1010, 0x2010).has_value());
    ASSERT_TRUE(writer_->add_instruction_match(777, 0x1010, 0x2010).has_value());

    auto result = reload();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().category(), ErrorCategory::ReferentialIntegrity);
    EXPECT_TRUE(loader_->primary_basic_block_matches().empty());
}

TEST_F(LoaderTest, BadTimestampIsParseError) {
    add_files();
    ASSERT_TRUE(rw_.execute("UPDATE metadata SET created = '05/04/2023 06:07'").has_value());

    auto result = reload();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().category(), ErrorCategory::Parse);
}

TEST_F(LoaderTest, UnknownAlgorithmIsParseError) {
    add_files();
    ASSERT_TRUE(writer_->add_function_match(0x1000, 0x2000, "a", "b", 1.0).has_value());
    ASSERT_TRUE(rw_.execute("UPDATE function SET algorithm = 77").has_value());

    auto result = reload();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().category(), ErrorCategory::Parse);
}

TEST_F(LoaderTest, ProgressReported) {
    add_files();
    ASSERT_TRUE(writer_->commit().has_value());

    Database ro;
    ASSERT_TRUE(ro.open(file_.string(), OpenFlags::ReadOnly).has_value());
    Loader loader(ro);

    std::vector<std::string> phases;
    float last = -1.0f;
    auto result = loader.load([&](float progress, const char* phase) {
        EXPECT_GE(progress, last);
        last = progress;
        phases.emplace_back(phase);
    });

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(phases.size(), 6u);
    EXPECT_FLOAT_EQ(last, 1.0f);
}
