/*
 * app_result_store.cpp
 *
 *  Created on: Oct 24, 2025
 */

#include "app_result_store.hpp"
#include "app_debug_if.hpp"

Result_Store::Result_Store(uint32_t _n_devices):
	n_devices(_n_devices),
	results(static_cast<size_t>(Controller_Config_t::THRESHOLD_STEPS) * _n_devices * Controller_Config_t::CHANNELS_PER_DEVICE, 0),
	writes(results.size(), 0)
{}

void Result_Store::write(uint32_t tth, uint32_t device, uint32_t channel, uint32_t value) {
	if(	tth >= Controller_Config_t::THRESHOLD_STEPS ||
		device >= n_devices ||
		channel >= Controller_Config_t::CHANNELS_PER_DEVICE)
	{
		Debug::WARN("Result_Store: write outside of the result region dropped");
		return;
	}
	uint32_t i = index(tth, device, channel);
	results[i] = value;
	writes[i]++;
}

uint32_t Result_Store::read(uint32_t word_index) const {
	if(word_index >= results.size()) {
		Debug::WARN("Result_Store: read outside of the result region, index " + std::to_string(word_index));
		return 0;
	}
	return results[word_index];
}

uint32_t Result_Store::write_count(uint32_t word_index) const {
	if(word_index >= writes.size()) return 0;
	return writes[word_index];
}

void Result_Store::clear_write_counts() {
	std::fill(writes.begin(), writes.end(), 0);
}
