/*
 * ConfigStoreTests.cpp
 *
 *  Created on: Nov 6, 2025
 */

#include <gtest/gtest.h>

#include <vector>

#include "app_config_store.hpp"
#include "app_result_store.hpp"
#include "app_debug_if.hpp"

//==============================================================================
// Configuration store
//==============================================================================

TEST(ConfigStoreTests, WritesLandOnCommit) {
	Config_Store store(2, 128);
	store.request_write(Config_Store::Write_Port::PATTERN_MODIFIER, 130, 0xCAFE'F00D);
	EXPECT_EQ(store.read_word(130), 0u);

	store.commit();
	EXPECT_EQ(store.read_word(130), 0xCAFE'F00Du);
	EXPECT_EQ(store.partition(1)[2], 0xCAFE'F00Du);
	EXPECT_EQ(store.committed_writes(), 1u);
}

TEST(ConfigStoreTests, DataMoverWinsTheWritePort) {
	Config_Store store(1, 128);
	store.request_write(Config_Store::Write_Port::PATTERN_MODIFIER, 3, 0x1111'1111);
	store.request_write(Config_Store::Write_Port::DATA_MOVER, 4, 0x2222'2222);
	store.commit();

	EXPECT_EQ(store.read_word(3), 0u);
	EXPECT_EQ(store.read_word(4), 0x2222'2222u);
	EXPECT_EQ(store.dropped_writes(), 1u);
}

TEST(ConfigStoreTests, OnlyTheDataMoverFillsTheMirror) {
	Config_Store store(1, 128);
	store.request_write(Config_Store::Write_Port::DATA_MOVER, 0, 0xAAAA'AAAA);
	store.commit();
	store.request_write(Config_Store::Write_Port::PATTERN_MODIFIER, 0, 0x5555'5555);
	store.commit();

	EXPECT_EQ(store.read_word(0), 0x5555'5555u);
	EXPECT_EQ(store.mirror_word(0), 0xAAAA'AAAAu);
	EXPECT_EQ(store.mirror_partition(0)[0], 0xAAAA'AAAAu);
}

TEST(ConfigStoreTests, BitAddressing) {
	Config_Store store(2, 128);
	std::vector<uint32_t> words(128, 0);
	words[1] = 0x8000'0001;
	store.load_partition(1, words);

	uint32_t base = 128 * 32;
	EXPECT_TRUE(store.read_bit(base + 32));
	EXPECT_TRUE(store.read_bit(base + 63));
	EXPECT_FALSE(store.read_bit(base + 33));
	EXPECT_FALSE(store.read_bit(32));
}

TEST(ConfigStoreTests, OutOfRangeAccessIsHarmless) {
	Config_Store store(1, 128);
	size_t warnings = Debug::warn_count();

	store.request_write(Config_Store::Write_Port::DATA_MOVER, 128, 1);
	store.commit();
	EXPECT_EQ(store.dropped_writes(), 1u);
	EXPECT_EQ(store.read_word(128), 0u);
	EXPECT_FALSE(store.read_bit(128 * 32));
	EXPECT_TRUE(store.partition(1).empty());
	EXPECT_GT(Debug::warn_count(), warnings);
}

//==============================================================================
// Result store
//==============================================================================

TEST(ResultStoreTests, IndexLayout) {
	Result_Store results(4);
	EXPECT_EQ(results.size_words(), 64u * 4u * 32u);
	EXPECT_EQ(results.index(0, 0, 0), 0u);
	EXPECT_EQ(results.index(0, 1, 0), 32u);
	EXPECT_EQ(results.index(1, 0, 0), 128u);
	EXPECT_EQ(results.index(63, 3, 31), results.size_words() - 1);
}

TEST(ResultStoreTests, WritesAreCounted) {
	Result_Store results(2);
	results.write(10, 1, 7, 1234);
	results.write(10, 1, 7, 4321);

	uint32_t i = results.index(10, 1, 7);
	EXPECT_EQ(results.read(i), 4321u);
	EXPECT_EQ(results.read(10, 1, 7), 4321u);
	EXPECT_EQ(results.write_count(i), 2u);

	results.clear_write_counts();
	EXPECT_EQ(results.write_count(i), 0u);
	EXPECT_EQ(results.read(i), 4321u);
}

TEST(ResultStoreTests, OutOfRangeIsDropped) {
	Result_Store results(1);
	results.write(64, 0, 0, 1);
	results.write(0, 1, 0, 1);
	results.write(0, 0, 32, 1);
	for(uint32_t i = 0; i < results.size_words(); i++) ASSERT_EQ(results.write_count(i), 0u);
	EXPECT_EQ(results.read(results.size_words()), 0u);
}
