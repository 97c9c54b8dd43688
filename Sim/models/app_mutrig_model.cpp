/*
 * app_mutrig_model.cpp
 *
 *  Created on: Oct 29, 2025
 */

#include "app_mutrig_model.hpp"
#include "app_debug_if.hpp"

MuTRiG_Model::MuTRiG_Model(uint8_t _device, const Controller_Config_t& _config):
	device_id(_device),
	cfg_length_bits(_config.cfg_length_bits()),
	layout(_config.layout()),
	cfg_register(_config.cfg_length_bits(), 0)
{
	shifting.reserve(_config.cfg_length_rounded_bits());
}

void MuTRiG_Model::tick() {
	auto pins = spi_pins.read();
	bool selected_now = !pins.ssn(device_id);

	//frame opens on chip select falling
	if(selected_now && !in_frame) {
		in_frame = true;
		shifting.clear();
	}

	//sample on the rising edge of sclk
	if(in_frame && selected_now && pins.sclk && !prev_pins.sclk) {
		shifting.push_back(pins.mosi ? 1 : 0);
	}

	//and closes on chip select rising
	if(!selected_now && in_frame) {
		in_frame = false;
		close_frame();
	}

	prev_pins = pins;
}

void MuTRiG_Model::close_frame() {
	if(shifting.empty()) {
		Debug::WARN("MuTRiG " + std::to_string(device_id) + ": chip select without any clocks");
		return;
	}

	latest ^= 1;
	frames[latest] = shifting;
	frame_count++;

	//whatever came first has been shifted out the far end if the frame is longer than the register
	size_t n = shifting.size();
	for(size_t i = 0; i < cfg_length_bits; i++) {
		if(i < n) cfg_register[i] = shifting[n - 1 - i];
	}

	if(n < cfg_length_bits) {
		Debug::WARN("MuTRiG " + std::to_string(device_id) + ": short frame, " + std::to_string(n) + " bits");
	}
}

void MuTRiG_Model::reset() {
	prev_pins = {};
	in_frame = false;
	shifting.clear();
	frames[0].clear();
	frames[1].clear();
	latest = 0;
	frame_count = 0;
	std::fill(cfg_register.begin(), cfg_register.end(), 0);
}

bool MuTRiG_Model::register_bit(uint32_t bit) const {
	if(bit >= cfg_length_bits) return false;
	return cfg_register[bit] != 0;
}

uint8_t MuTRiG_Model::threshold(uint32_t channel) const {
	if(channel >= Bit_Layout::N_CHANNELS) return 0;

	//most significant bit sits at the lowest index
	uint32_t start = layout[channel].bit_start;
	uint8_t value = 0;
	for(uint32_t i = 0; i < FIELD_WIDTH_BITS; i++) {
		value = static_cast<uint8_t>((value << 1) | (register_bit(start + i) ? 1 : 0));
	}
	return value;
}
