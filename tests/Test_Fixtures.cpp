/*
 * Test_Fixtures.cpp
 *
 *  Created on: Nov 6, 2025
 */

#include "Test_Fixtures.hpp"

Controller_Config_t small_config(uint32_t n_mutrig, MuTRiG_Variant variant) {
	Controller_Config_t config = {};
	config.n_mutrig = n_mutrig;
	config.variant = variant;
	config.clk_frequency_hz = 10'000'000;
	config.clk_frequency_spi_hz = 10'000'000;
	config.spi_settle_cycles = 4;
	config.sclr_delay_cycles = 2;
	config.monitor_window_cycles = 16;
	config.monitor_margin_cycles = 1;
	config.bus_timeout_cycles = 500;
	config.sync_stages = 2;
	config.debug_level = 0;
	return config;
}

std::vector<uint32_t> make_bitstream(const Controller_Config_t& config, uint32_t seed) {
	std::vector<uint32_t> words(config.cfg_length_words());

	//xorshift32, never seeded with zero
	uint32_t state = seed ? seed : 0x1234'5678;
	for(auto& word : words) {
		state ^= state << 13;
		state ^= state >> 17;
		state ^= state << 5;
		word = state;
	}

	uint32_t tail_bits = config.cfg_length_bits() % 32;
	if(tail_bits) words.back() &= (1u << tail_bits) - 1;
	return words;
}
