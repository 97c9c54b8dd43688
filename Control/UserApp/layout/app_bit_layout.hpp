/*
 * app_bit_layout.hpp
 *
 *  Created on: Oct 24, 2025
 *
 *  Where the 6-bit threshold of every channel lives inside a device's configuration partition
 *  Built once from the variant layout and never touched again; the pattern modifier just indexes it.
 *
 *  For channel c:
 *  	bit_start = header_bits + c*channel_bits + field_offset
 *  	bit_end = bit_start + 5
 *  	word_start/word_end --> words holding the first/last field bit; word_count = 1 or 2
 *  	lsb[0] = bit_start % 32; the part that runs past bit 31 is `overflow_bits` long
 *  	lsb[1] = lsb[0] - 32 for a straddling field (negative: the field started in the previous word)
 */

#pragma once

#include "app_proctypes.hpp"
#include "app_utils.hpp"
#include "app_controller_config.hpp"
#include "app_write_mask.hpp"

struct Field_Location_t {
	uint32_t bit_start = 0;
	uint32_t bit_end = 0;
	uint32_t word_start = 0;
	uint32_t word_end = 0;
	uint32_t word_count = 0;
	uint32_t overflow_bits = 0;				//field bits past the top of word_start
	std::array<int32_t, 2> lsb = {0, 0};	//merge position in each word

	bool straddles() const { return word_count == 2; }
};

class Bit_Layout {
public:
	static constexpr size_t N_CHANNELS = Controller_Config_t::CHANNELS_PER_DEVICE;

	//compute the location of one channel's field
	static constexpr Field_Location_t locate(const Variant_Layout_t& layout, uint32_t channel) {
		Field_Location_t loc = {};
		loc.bit_start = layout.header_bits + channel * layout.channel_bits + layout.field_offset;
		loc.bit_end = loc.bit_start + FIELD_WIDTH_BITS - 1;
		loc.word_start = loc.bit_start / 32;
		loc.word_end = loc.bit_end / 32;
		loc.word_count = loc.word_end - loc.word_start + 1;
		loc.lsb[0] = static_cast<int32_t>(loc.bit_start % 32);
		loc.lsb[1] = loc.lsb[0] - 32;
		loc.overflow_bits = (loc.word_count == 2) ? (loc.bit_end % 32) + 1 : 0;
		return loc;
	}

	constexpr explicit Bit_Layout(const Variant_Layout_t& _layout): layout(_layout), table() {
		for(uint32_t c = 0; c < N_CHANNELS; c++) table[c] = locate(_layout, c);
	}

	const Field_Location_t& operator[](size_t channel) const { return table[channel]; }
	const std::array<Field_Location_t, N_CHANNELS>& entries() const { return table; }
	const Variant_Layout_t& variant_layout() const { return layout; }

	//does every field sit inside the configuration register?
	constexpr bool fits() const { return table[N_CHANNELS - 1].bit_end < layout.cfg_length_bits; }

	//read a channel's threshold back out of a partition (MSB at the lowest bit index)
	uint8_t decode(std::span<const uint32_t> partition, uint32_t channel) const {
		const auto& loc = table[channel];
		uint8_t value = 0;
		for(uint32_t i = 0; i < FIELD_WIDTH_BITS; i++) {
			uint32_t bit = loc.bit_start + i;
			if(bit / 32 >= partition.size()) return 0;
			if((partition[bit / 32] >> (bit % 32)) & 0x1) value |= static_cast<uint8_t>(1u << (FIELD_WIDTH_BITS - 1 - i));
		}
		return value;
	}

private:
	Variant_Layout_t layout;
	std::array<Field_Location_t, N_CHANNELS> table;
};

//every variant keeps its 32 fields inside the register
static_assert(Bit_Layout(VARIANT_LAYOUT_MUTRIG1).fits());
static_assert(Bit_Layout(VARIANT_LAYOUT_MUTRIG2).fits());
static_assert(Bit_Layout(VARIANT_LAYOUT_MUTRIG3).fits());
