/*
 * app_controller_config.hpp
 *
 *  Created on: Oct 23, 2025
 *
 *  Elaboration-time parameters of the controller
 *  Everything here is fixed once the controller is built; nothing reads these back from the host at run time
 */

#pragma once

#include "app_proctypes.hpp"
#include "app_utils.hpp"

//=================================== MUTRIG VARIANTS ===================================

enum class MuTRiG_Variant : uint8_t {
	MUTRIG1 = 1,
	MUTRIG2 = 2,
	MUTRIG3 = 3,
};

//where things live inside the configuration bitstream of one chip
//bit 0 is the first bit of the stored bitstream (and the last one shifted out on the bus)
struct Variant_Layout_t {
	uint32_t cfg_length_bits;	//total length of the configuration register
	uint32_t header_bits;		//global bits ahead of the first channel record
	uint32_t channel_bits;		//length of one channel record
	uint32_t field_offset;		//threshold position inside a channel record, MSB first
};

//bitstream lengths of the three chip revisions
//header/record sizes put the threshold on both sides of word boundaries for every variant
constexpr Variant_Layout_t VARIANT_LAYOUT_MUTRIG1 = {2358, 48, 70, 33};
constexpr Variant_Layout_t VARIANT_LAYOUT_MUTRIG2 = {2719, 60, 80, 47};
constexpr Variant_Layout_t VARIANT_LAYOUT_MUTRIG3 = {2662, 40, 78, 36};

constexpr Variant_Layout_t layout_for(MuTRiG_Variant variant) {
	switch(variant) {
	case MuTRiG_Variant::MUTRIG1: return VARIANT_LAYOUT_MUTRIG1;
	case MuTRiG_Variant::MUTRIG2: return VARIANT_LAYOUT_MUTRIG2;
	default: return VARIANT_LAYOUT_MUTRIG3;
	}
}

//=================================== COMMAND CODES ===================================

//command code, bits [31:20] of the command register
enum class Command_Code : uint16_t {
	NONE = 0x000,
	CONFIGURE = 0x011,		//move a bitstream into one device's partition and write it out
	SCAN_ONE = 0x014,		//threshold scan, one device
	SCAN_ALL = 0x015,		//threshold scan, every device
};

constexpr bool is_scan(Command_Code code) { return code == Command_Code::SCAN_ONE || code == Command_Code::SCAN_ALL; }

//=================================== CONTROLLER CONFIGURATION ===================================

struct Controller_Config_t {
	//validation result; no exceptions, callers check this
	enum class Status : uint8_t {
		OK = 0,
		BAD_N_MUTRIG,
		BAD_VARIANT,
		BAD_CLOCK,
		BAD_SPI_CLOCK,
		BAD_COUNTER_BASE,
		BAD_SEL_SUBROUTINES,
		BAD_DEBUG_LEVEL,
		BAD_SPI_MODE,
		BAD_TIMING,
		BAD_MONITOR_WINDOW,
		BAD_SYNC_STAGES,
	};

	//which routines get built
	enum Sel_Subroutines : uint8_t {
		SEL_TSA_ONLY = 0,
		SEL_MCC_ONLY = 1,
		SEL_BOTH = 2,
	};

	static constexpr uint32_t N_MUTRIG_MAX = 128;
	static constexpr uint32_t CHANNELS_PER_DEVICE = 32;
	static constexpr uint32_t THRESHOLD_STEPS = 64;		//6-bit threshold
	static constexpr uint32_t MAX_CLK_FREQUENCY_HZ = 1'000'000'000;
	static constexpr uint32_t MAX_SPI_FREQUENCY_HZ = 80'000'000;
	static constexpr uint32_t MAX_SYNC_STAGES = 8;

	//------------ parameters ------------
	uint32_t n_mutrig = 8;
	MuTRiG_Variant variant = MuTRiG_Variant::MUTRIG3;
	uint32_t clk_frequency_hz = 156'250'000;
	uint32_t clk_frequency_spi_hz = 40'000'000;	//sclk toggles at half of this
	uint32_t counter_base_word = 0;				//word address of device 0's counters
	uint8_t sel_subroutines = SEL_BOTH;
	uint8_t debug_level = 1;
	uint8_t cpol = 0;							//only mode 0 is built
	uint8_t cpha = 0;

	//------------ timing ------------
	uint32_t spi_settle_cycles = 1000;			//serial cycles in STARTING and PAUSING
	uint32_t sclr_delay_cycles = 5;
	uint32_t monitor_window_cycles = 0;			//0 --> one second worth of control clock
	uint32_t monitor_margin_cycles = 5;
	uint32_t bus_timeout_cycles = 500;
	uint32_t sync_stages = 2;

	//------------ validation ------------
	Status validate() const;
	static const char* status_str(Status status);

	//------------ derived ------------
	Variant_Layout_t layout() const { return layout_for(variant); }
	uint32_t cfg_length_bits() const { return layout().cfg_length_bits; }
	uint32_t cfg_length_words() const { return div_roundup<uint32_t>(cfg_length_bits(), 32); }
	uint32_t cfg_length_rounded_bits() const { return cfg_length_words() * 32; }
	uint32_t partition_words() const { return static_cast<uint32_t>(next_pow2(cfg_length_words())); }
	uint32_t partition_bits() const { return partition_words() * 32; }
	uint32_t monitor_window() const { return monitor_window_cycles ? monitor_window_cycles : clk_frequency_hz; }
	uint32_t result_words() const { return THRESHOLD_STEPS * n_mutrig * CHANNELS_PER_DEVICE; }

	bool mcc_enabled() const { return sel_subroutines != SEL_TSA_ONLY; }
	bool tsa_enabled() const { return sel_subroutines != SEL_MCC_ONLY; }

	//is this command built into the controller?
	bool command_enabled(Command_Code code) const;
};
