/*
 * app_write_mask.hpp
 *
 *  Created on: Oct 24, 2025
 *
 *  Drops a 6-bit value into a 32-bit word at a given LSB position, leaving every other bit alone
 *  	- lsb in [0, 26]: the whole field fits in the word
 *  	- lsb in [27, 31]: the field runs off the top; the high bits belong to the next word and get cut
 *  	- lsb in [-5, -1]: the field started in the previous word; only its high bits land at the bottom of this one
 *  Anything outside [-5, 31] doesn't touch the word at all.
 *
 *  Fully constexpr; the masks come out of a lookup table built at compile time.
 */

#pragma once

#include "app_proctypes.hpp"
#include "app_utils.hpp"

//the 6-bit threshold field
static constexpr uint32_t FIELD_WIDTH_BITS = 6;
static constexpr uint32_t FIELD_MASK = (1u << FIELD_WIDTH_BITS) - 1;

//field window clipped to the word, for every lsb position
constexpr uint32_t field_window(int32_t lsb) {
	if(lsb >= 0) return static_cast<uint32_t>((static_cast<uint64_t>(FIELD_MASK) << lsb) & 0xFFFF'FFFFull);
	return FIELD_MASK >> (-lsb);
}

//lsb positions that still leave part of the field inside the word
static constexpr int32_t FIELD_LSB_MIN = -static_cast<int32_t>(FIELD_WIDTH_BITS - 1);
static constexpr int32_t FIELD_LSB_MAX = 31;
static constexpr size_t FIELD_LSB_POSITIONS = FIELD_LSB_MAX - FIELD_LSB_MIN + 1;

constexpr std::array<uint32_t, FIELD_LSB_POSITIONS> build_field_masks() {
	std::array<uint32_t, FIELD_LSB_POSITIONS> table = {};
	for(size_t i = 0; i < FIELD_LSB_POSITIONS; i++) table[i] = field_window(static_cast<int32_t>(i) + FIELD_LSB_MIN);
	return table;
}

class Write_Mask {
public:
	static constexpr int32_t LSB_MIN = FIELD_LSB_MIN;
	static constexpr int32_t LSB_MAX = FIELD_LSB_MAX;
	static constexpr size_t TABLE_SIZE = FIELD_LSB_POSITIONS;

	static constexpr bool valid(int32_t lsb) { return lsb >= LSB_MIN && lsb <= LSB_MAX; }

	//bits of the word owned by the field; 0 for an invalid lsb
	static constexpr uint32_t mask(int32_t lsb) {
		if(!valid(lsb)) return 0;
		return MASKS[static_cast<size_t>(lsb - LSB_MIN)];
	}

	//replace the field bits of `original` with `replacement`
	static constexpr uint32_t merge(uint32_t original, uint8_t replacement, int32_t lsb) {
		if(!valid(lsb)) return original;
		uint32_t repl = replacement & FIELD_MASK;
		uint32_t value = (lsb >= 0) ?
				static_cast<uint32_t>((static_cast<uint64_t>(repl) << lsb) & 0xFFFF'FFFFull) :
				repl >> (-lsb);
		return (original & ~mask(lsb)) | value;
	}

private:
	static constexpr std::array<uint32_t, TABLE_SIZE> MASKS = build_field_masks();
};

//the field goes out on the bus MSB first, stored MSB at the lowest bit index
//so the value gets mirrored before it's merged into the little-endian words
constexpr uint8_t reverse_field_bits(uint8_t value) {
	uint8_t out = 0;
	for(uint32_t i = 0; i < FIELD_WIDTH_BITS; i++) {
		if(value & (1u << i)) out |= static_cast<uint8_t>(1u << (FIELD_WIDTH_BITS - 1 - i));
	}
	return out;
}

//spot checks
static_assert(Write_Mask::mask(0) == 0x0000'003F);
static_assert(Write_Mask::mask(26) == 0xFC00'0000);
static_assert(Write_Mask::mask(29) == 0xE000'0000);
static_assert(Write_Mask::mask(-3) == 0x0000'0007);
static_assert(reverse_field_bits(0b000001) == 0b100000);
