/*
 * app_mutrig_model.hpp
 *
 *  Created on: Oct 29, 2025
 *
 *  Behavioural MuTRiG, serial domain
 *  	- shifts mosi in on every rising sclk while its chip select is low
 *  	- a chip select release closes the frame; the configuration register is the last `cfg_length_bits` bits shifted in
 *  	  i.e. register bit i is the i-th bit from the END of the frame, which is bit i of the stored bitstream
 *  	- thresholds decode straight out of the register through the bit layout
 *
 *  Ticks AFTER the config writer on every serial edge.
 */

#pragma once

#include <vector>

#include "app_proctypes.hpp"
#include "app_threading.hpp"
#include "app_spi_bus.hpp"
#include "app_controller_config.hpp"
#include "app_bit_layout.hpp"

class MuTRiG_Model {
public:
	MuTRiG_Model(uint8_t _device, const Controller_Config_t& _config);

	//delete copy constructor and assignment operator
	MuTRiG_Model(const MuTRiG_Model& other) = delete;
	void operator=(const MuTRiG_Model& other) = delete;

	void tick();

	//power cycle: forget the configuration and every frame
	void reset();

	LINK_FUNC(spi_pins);

	//====================== INSPECTION ======================
	bool configured() const { return frame_count > 0; }
	uint32_t frames_received() const { return frame_count; }
	bool selected() const { return in_frame; }

	//last two complete frames, in shift order
	const std::vector<uint8_t>& last_frame() const { return frames[latest]; }
	const std::vector<uint8_t>& previous_frame() const { return frames[latest ^ 1]; }

	bool register_bit(uint32_t bit) const;
	uint8_t threshold(uint32_t channel) const;

	uint8_t device() const { return device_id; }

private:
	const uint8_t device_id;
	const uint32_t cfg_length_bits;
	const Bit_Layout layout;

	Spi_Master_Pins_t prev_pins = {};
	bool in_frame = false;
	std::vector<uint8_t> shifting;
	std::array<std::vector<uint8_t>, 2> frames;
	size_t latest = 0;
	uint32_t frame_count = 0;

	//configuration register, bit 0 first
	std::vector<uint8_t> cfg_register;

	void close_frame();

	Sub_Var<Spi_Master_Pins_t> spi_pins;
};
