/*
 * app_result_store.hpp
 *
 *  Created on: Oct 24, 2025
 *
 *  Rate snapshots of a threshold scan
 *  Flat, word addressed: index = tth*n_devices*32 + device*32 + channel
 *  Written by the rate monitor, read by the host whenever it likes
 */

#pragma once

#include <vector>

#include "app_proctypes.hpp"
#include "app_controller_config.hpp"

class Result_Store {
public:
	Result_Store(uint32_t _n_devices);

	//delete copy constructor and assignment operator
	Result_Store(const Result_Store& other) = delete;
	void operator=(const Result_Store& other) = delete;

	uint32_t index(uint32_t tth, uint32_t device, uint32_t channel) const {
		return (tth * n_devices + device) * Controller_Config_t::CHANNELS_PER_DEVICE + channel;
	}

	//rate monitor side
	void write(uint32_t tth, uint32_t device, uint32_t channel, uint32_t value);

	//host side; out of range reads come back as 0
	uint32_t read(uint32_t word_index) const;
	uint32_t read(uint32_t tth, uint32_t device, uint32_t channel) const { return read(index(tth, device, channel)); }

	//how many times an entry has been written since the last clear
	uint32_t write_count(uint32_t word_index) const;
	void clear_write_counts();

	uint32_t size_words() const { return static_cast<uint32_t>(results.size()); }
	uint32_t devices() const { return n_devices; }

private:
	const uint32_t n_devices;
	std::vector<uint32_t> results;
	std::vector<uint32_t> writes;
};
