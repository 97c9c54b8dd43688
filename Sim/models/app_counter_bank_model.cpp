/*
 * app_counter_bank_model.cpp
 *
 *  Created on: Oct 29, 2025
 */

#include "app_counter_bank_model.hpp"
#include "app_debug_if.hpp"

Counter_Bank_Model::Counter_Bank_Model(const Controller_Config_t& _config):
	Avalon_Slave_Model("counters"),
	n_devices(_config.n_mutrig),
	counter_base(_config.counter_base_word),
	chips(_config.n_mutrig, nullptr),
	counters(_config.n_mutrig * Controller_Config_t::CHANNELS_PER_DEVICE, 0),
	fixed(_config.n_mutrig * Controller_Config_t::CHANNELS_PER_DEVICE),
	snapshot(_config.n_mutrig * Controller_Config_t::CHANNELS_PER_DEVICE, 0),
	rates(_config.n_mutrig * Controller_Config_t::CHANNELS_PER_DEVICE, 0),
	rate_frames(_config.n_mutrig, 0)
{}

void Counter_Bank_Model::link_chip(uint32_t device, const MuTRiG_Model* chip) {
	if(device >= n_devices) {
		Debug::WARN("Counter bank: no device " + std::to_string(device));
		return;
	}
	chips[device] = chip;
	rate_frames[device] = 0;
	refresh_rates(device);
}

void Counter_Bank_Model::refresh_rates(uint32_t device) {
	const MuTRiG_Model* chip = chips[device];
	bool counting = chip != nullptr && chip->configured();
	for(uint32_t c = 0; c < Controller_Config_t::CHANNELS_PER_DEVICE; c++) {
		rates[device * Controller_Config_t::CHANNELS_PER_DEVICE + c] = counting ? hits_per_cycle(chip->threshold(c)) : 0;
	}
	rate_frames[device] = counting ? chip->frames_received() : 0;
}

void Counter_Bank_Model::set_fixed(uint32_t device, uint32_t channel, uint32_t value) {
	if(device >= n_devices || channel >= Controller_Config_t::CHANNELS_PER_DEVICE) return;
	fixed[device * Controller_Config_t::CHANNELS_PER_DEVICE + channel] = {true, value};
}

void Counter_Bank_Model::clear_fixed() {
	std::fill(fixed.begin(), fixed.end(), Fixed_Value_t{});
}

uint32_t Counter_Bank_Model::counter(uint32_t device, uint32_t channel) const {
	if(device >= n_devices || channel >= Controller_Config_t::CHANNELS_PER_DEVICE) return 0;
	size_t i = device * Controller_Config_t::CHANNELS_PER_DEVICE + channel;
	return fixed[i].active ? fixed[i].value : counters[i];
}

void Counter_Bank_Model::reset_counters() {
	std::fill(counters.begin(), counters.end(), 0);
	std::fill(snapshot.begin(), snapshot.end(), 0);
	sclr_count = 0;
}

bool Counter_Bank_Model::decode(uint32_t address, uint32_t& index) const {
	if(address < counter_base) return false;
	index = address - counter_base;
	return index < counters.size();
}

//counters move before the bus logic sees the edge
void Counter_Bank_Model::on_tick() {
	if(counter_sclr.read()) {
		std::fill(counters.begin(), counters.end(), 0);
		sclr_count++;
		return;
	}

	//only re-decode thresholds when a chip took a new frame
	for(uint32_t d = 0; d < n_devices; d++) {
		const MuTRiG_Model* chip = chips[d];
		uint32_t frames = chip ? chip->frames_received() : 0;
		if(frames != rate_frames[d]) refresh_rates(d);
	}

	for(size_t i = 0; i < counters.size(); i++) counters[i] += rates[i];
}

void Counter_Bank_Model::on_accept(const Avalon_Read_Master_t& cmd) {
	for(uint32_t i = 0; i < cmd.burstcount; i++) {
		uint32_t index = 0;
		if(!decode(cmd.address + i, index)) continue;
		snapshot[index] = fixed[index].active ? fixed[index].value : counters[index];
	}
}

uint32_t Counter_Bank_Model::fetch(uint32_t address, Avalon_Response& response) {
	uint32_t index = 0;
	if(!decode(address, index)) {
		response = Avalon_Response::DECODEERROR;
		return 0;
	}
	response = Avalon_Response::OKAY;
	return snapshot[index];
}
