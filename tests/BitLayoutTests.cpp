/*
 * BitLayoutTests.cpp
 *
 *  Created on: Nov 6, 2025
 */

#include <gtest/gtest.h>

#include <vector>

#include "app_bit_layout.hpp"

static const MuTRiG_Variant ALL_VARIANTS[] = {MuTRiG_Variant::MUTRIG1, MuTRiG_Variant::MUTRIG2, MuTRiG_Variant::MUTRIG3};

TEST(BitLayoutTests, VariantLengths) {
	EXPECT_EQ(layout_for(MuTRiG_Variant::MUTRIG1).cfg_length_bits, 2358u);
	EXPECT_EQ(layout_for(MuTRiG_Variant::MUTRIG2).cfg_length_bits, 2719u);
	EXPECT_EQ(layout_for(MuTRiG_Variant::MUTRIG3).cfg_length_bits, 2662u);
}

TEST(BitLayoutTests, DerivedSizes) {
	Controller_Config_t config = {};
	config.variant = MuTRiG_Variant::MUTRIG3;
	EXPECT_EQ(config.cfg_length_words(), 84u);
	EXPECT_EQ(config.cfg_length_rounded_bits(), 2688u);
	EXPECT_EQ(config.partition_words(), 128u);

	config.variant = MuTRiG_Variant::MUTRIG2;
	EXPECT_EQ(config.cfg_length_words(), 85u);
	EXPECT_EQ(config.partition_words(), 128u);
}

TEST(BitLayoutTests, EveryFieldIsSixBitsWide) {
	for(auto variant : ALL_VARIANTS) {
		Bit_Layout layout(layout_for(variant));
		for(uint32_t c = 0; c < Bit_Layout::N_CHANNELS; c++) {
			const auto& loc = layout[c];
			EXPECT_EQ(loc.bit_end - loc.bit_start + 1, FIELD_WIDTH_BITS);
			EXPECT_EQ(loc.word_start, loc.bit_start / 32);
			EXPECT_EQ(loc.word_end, loc.bit_end / 32);
			EXPECT_LT(loc.bit_end, layout.variant_layout().cfg_length_bits);
		}
	}
}

TEST(BitLayoutTests, StraddlingFieldsSplitCorrectly) {
	for(auto variant : ALL_VARIANTS) {
		Bit_Layout layout(layout_for(variant));
		for(uint32_t c = 0; c < Bit_Layout::N_CHANNELS; c++) {
			const auto& loc = layout[c];
			SCOPED_TRACE("channel " + std::to_string(c));
			if(loc.straddles()) {
				EXPECT_EQ(loc.word_end, loc.word_start + 1);
				EXPECT_GE(loc.lsb[0], 27);
				EXPECT_EQ(loc.lsb[1], loc.lsb[0] - 32);
				EXPECT_EQ(loc.overflow_bits, (loc.bit_end % 32) + 1);
				EXPECT_TRUE(Write_Mask::valid(loc.lsb[1]));
			}
			else {
				EXPECT_EQ(loc.word_count, 1u);
				EXPECT_LE(loc.lsb[0], 26);
				EXPECT_EQ(loc.overflow_bits, 0u);
			}
		}
	}
}

//every variant has to exercise both merge paths
TEST(BitLayoutTests, EveryVariantHasBothKindsOfField) {
	for(auto variant : ALL_VARIANTS) {
		Bit_Layout layout(layout_for(variant));
		size_t straddling = 0;
		for(const auto& loc : layout.entries()) straddling += loc.straddles() ? 1 : 0;
		EXPECT_GT(straddling, 0u);
		EXPECT_LT(straddling, Bit_Layout::N_CHANNELS);
	}
}

TEST(BitLayoutTests, KnownChannelPositions) {
	//MuTRiG 3: header 40, records of 78, threshold 36 bits in
	Bit_Layout layout(VARIANT_LAYOUT_MUTRIG3);
	EXPECT_EQ(layout[0].bit_start, 76u);
	EXPECT_EQ(layout[1].bit_start, 154u);
	EXPECT_EQ(layout[31].bit_start, 40u + 31u * 78u + 36u);
}

TEST(BitLayoutTests, DecodeReadsMostSignificantBitFirst) {
	Bit_Layout layout(VARIANT_LAYOUT_MUTRIG1);
	std::vector<uint32_t> partition(128, 0);

	//only the first bit of channel 0's field set --> 0b100000
	uint32_t bit = layout[0].bit_start;
	partition[bit / 32] |= 1u << (bit % 32);
	EXPECT_EQ(layout.decode(partition, 0), 0b100000);
	EXPECT_EQ(layout.decode(partition, 1), 0);
}
