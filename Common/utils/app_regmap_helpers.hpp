/*
 * app_regmap_helpers.hpp
 *
 *  Created on: Oct 22, 2025
 */

#pragma once

#include "app_proctypes.hpp"
#include "app_utils.hpp"

/*
 * `Regmap_Field` pulls a bit field out of (or pushes one into) a byte buffer.
 * Every 32-bit register the controller exposes gets picked apart with these,
 * i.e. the COMMAND register carries the command code in bits [31:20], the device id in bits [19:16]
 * and the data mover length in bits [15:0].
 *
 * Some notes:
 *  - the buffer is a span over the raw bytes of the register, in the byte order named by `big_endian`
 * 	- `offset` refers to the position of the LEAST SIGNIFICANT BIT in the LSByte
 * 	- `base_byte` refers to the position of the START of the field, i.e. the LSByte
 * 		\--> be extra careful with fields that are less than 8 bits but span multiple bytes
 *  - fields are at most 32 bits wide and touch at most 4 bytes
 */

class Regmap_Field {
public:
	//NON-owning! reference to buffer passed as a span
	//no bounds checking on the buffer--size it for the widest field
	Regmap_Field(	const size_t _base_byte,
					const size_t _offset_bits,
					const size_t _field_width_bits,
					const bool _big_endian,
					std::span<uint8_t, std::dynamic_extent> _buffer):
		offset_bits(_offset_bits),
		field_width_bits(_field_width_bits),
		field_width_bytes(((_offset_bits + _field_width_bits + 7) / 8)),				// how many bytes we touch in our buffer (account for offset)
		mask((field_width_bits == 32) ? 0xFFFFFFFFu : ((1u << field_width_bits) - 1)),	// applied after shifting for read, before shifting for write
		big_endian(_big_endian),
		base_byte(_big_endian ?  _base_byte - (field_width_bytes - 1) : _base_byte),
		buffer(_buffer)
	{}

	//point at a different register image with the same layout
	inline void repoint(std::span<uint8_t, std::dynamic_extent> _buffer) {	buffer = _buffer; }

	//size-aware byte swap
	//the first byte of the field has to land in the LSB after the 32-bit swap
	inline static uint32_t byte_swap(uint32_t v, size_t s) {
		if(s == 1) 	return v;
		if(s == 2) 	return swap_endian_32(v) >> 16;
		if(s == 3) 	return swap_endian_32(v) >> 8;
		else		return swap_endian_32(v) >> 0;
	}

	//============================== READ/WRITE FUNCTIONS =============================

	//value gets masked to the field width before it goes in
	inline void write(uint32_t value) {
		value = (value & mask) << offset_bits;
		uint32_t clear_mask = ~(mask << offset_bits);

		uint32_t mod_field = 0;
		memcpy(&mod_field, buffer.data() + base_byte, field_width_bytes);
		if(big_endian != PROCESSOR_IS_BIG_ENDIAN) mod_field = byte_swap(mod_field, field_width_bytes);

		mod_field = (mod_field & clear_mask) | value;

		if(big_endian != PROCESSOR_IS_BIG_ENDIAN) mod_field = byte_swap(mod_field, field_width_bytes);
		memcpy(buffer.data() + base_byte, &mod_field, field_width_bytes);
	}

	inline uint32_t read() const {
		uint32_t out = 0;
		memcpy(&out, buffer.data() + base_byte, field_width_bytes);
		if(big_endian != PROCESSOR_IS_BIG_ENDIAN) out = byte_swap(out, field_width_bytes);
		return (out >> offset_bits) & mask;
	}

	//============================== OVERRIDES FOR EASY READING/WRITING =============================
	inline operator uint32_t() const { return read(); }
	inline void operator=(uint32_t value) { write(value); }

private:
	const size_t offset_bits;
	const size_t field_width_bits;
	const size_t field_width_bytes;
	const uint32_t mask;
	const bool big_endian;
	const size_t base_byte;
	std::span<uint8_t, std::dynamic_extent> buffer;
};
