/*
 * WriteMaskTests.cpp
 *
 *  Created on: Nov 6, 2025
 */

#include <gtest/gtest.h>

#include "app_write_mask.hpp"

//==============================================================================
// Mask table
//==============================================================================

TEST(WriteMaskTests, FieldInsideWord) {
	for(int32_t lsb = 0; lsb <= 26; lsb++) {
		SCOPED_TRACE("lsb " + std::to_string(lsb));
		EXPECT_EQ(Write_Mask::mask(lsb), 0x3Fu << lsb);
	}
}

TEST(WriteMaskTests, FieldRunsOffTheTop) {
	EXPECT_EQ(Write_Mask::mask(27), 0xF800'0000u);
	EXPECT_EQ(Write_Mask::mask(30), 0xC000'0000u);
	EXPECT_EQ(Write_Mask::mask(31), 0x8000'0000u);
}

TEST(WriteMaskTests, FieldStartedInPreviousWord) {
	EXPECT_EQ(Write_Mask::mask(-1), 0x0000'001Fu);
	EXPECT_EQ(Write_Mask::mask(-4), 0x0000'0003u);
	EXPECT_EQ(Write_Mask::mask(-5), 0x0000'0001u);
}

TEST(WriteMaskTests, OutOfRangeTouchesNothing) {
	EXPECT_EQ(Write_Mask::mask(-6), 0u);
	EXPECT_EQ(Write_Mask::mask(32), 0u);
	EXPECT_EQ(Write_Mask::merge(0xDEAD'BEEF, 0x3F, -6), 0xDEAD'BEEFu);
	EXPECT_EQ(Write_Mask::merge(0xDEAD'BEEF, 0x3F, 40), 0xDEAD'BEEFu);
}

//==============================================================================
// Merge
//==============================================================================

TEST(WriteMaskTests, MergeKeepsEverythingOutsideTheWindow) {
	const uint32_t original = 0xA5A5'5A5A;
	for(int32_t lsb = Write_Mask::LSB_MIN; lsb <= Write_Mask::LSB_MAX; lsb++) {
		for(uint8_t value : {uint8_t(0x00), uint8_t(0x15), uint8_t(0x2A), uint8_t(0x3F)}) {
			uint32_t merged = Write_Mask::merge(original, value, lsb);
			EXPECT_EQ(merged & ~Write_Mask::mask(lsb), original & ~Write_Mask::mask(lsb)) << "lsb " << lsb;
		}
	}
}

TEST(WriteMaskTests, MergeSplitsAStraddlingField) {
	//field at bit 29: low 3 bits in this word, high 3 bits in the next one
	const uint8_t value = 0b101'110;
	uint32_t low = Write_Mask::merge(0, value, 29);
	uint32_t high = Write_Mask::merge(0, value, 29 - 32);
	EXPECT_EQ(low, 0b110u << 29);
	EXPECT_EQ(high, 0b101u);
}

TEST(WriteMaskTests, MergeIgnoresBitsAboveTheField) {
	EXPECT_EQ(Write_Mask::merge(0, 0xFF, 0), 0x3Fu);
}

TEST(WriteMaskTests, ReverseFieldBits) {
	EXPECT_EQ(reverse_field_bits(0b000001), 0b100000);
	EXPECT_EQ(reverse_field_bits(0b110100), 0b001011);
	for(uint8_t v = 0; v < 64; v++) EXPECT_EQ(reverse_field_bits(reverse_field_bits(v)), v);
}
