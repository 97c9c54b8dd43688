/*
 * app_counter_bank_model.hpp
 *
 *  Created on: Oct 29, 2025
 *
 *  Per-channel hit counters of every MuTRiG, control domain
 *  Device d's 32 counters sit at word addresses counter_base + d*32 .. + 31
 *
 *  Counters run from the last counter clear (sclr) pulse. Each edge channel c of device d gains
 *  (64 - threshold) hits, threshold taken from the configuration register of the linked chip
 *  (unlinked or unconfigured chips count nothing). A burst returns the counters as they stood when it was taken.
 *  Fixed values override the running counters per channel.
 */

#pragma once

#include <vector>

#include "app_avalon_slave_model.hpp"
#include "app_controller_config.hpp"
#include "app_mutrig_model.hpp"

class Counter_Bank_Model : public Avalon_Slave_Model {
public:
	Counter_Bank_Model(const Controller_Config_t& _config);

	LINK_FUNC(counter_sclr);

	//take thresholds from this chip; nullptr to unlink
	void link_chip(uint32_t device, const MuTRiG_Model* chip);

	//pin a counter to a constant, or let it run again
	void set_fixed(uint32_t device, uint32_t channel, uint32_t value);
	void clear_fixed();

	//running count right now
	uint32_t counter(uint32_t device, uint32_t channel) const;
	uint32_t sclr_pulses() const { return sclr_count; }

	//hits a channel gains per edge at a given threshold
	static uint32_t hits_per_cycle(uint8_t threshold) { return Controller_Config_t::THRESHOLD_STEPS - (threshold & FIELD_MASK); }

	void reset_counters();

protected:
	uint32_t fetch(uint32_t address, Avalon_Response& response) override;
	void on_accept(const Avalon_Read_Master_t& cmd) override;
	void on_tick() override;

private:
	struct Fixed_Value_t {
		bool active = false;
		uint32_t value = 0;
	};

	const uint32_t n_devices;
	const uint32_t counter_base;

	std::vector<const MuTRiG_Model*> chips;
	std::vector<uint32_t> counters;
	std::vector<Fixed_Value_t> fixed;
	std::vector<uint32_t> snapshot;		//what the running burst returns
	std::vector<uint32_t> rates;			//hits per edge, refreshed whenever a chip takes a new frame
	std::vector<uint32_t> rate_frames;		//frame count of each chip the rates were taken from
	uint32_t sclr_count = 0;

	bool decode(uint32_t address, uint32_t& index) const;
	void refresh_rates(uint32_t device);

	Sub_Var<bool> counter_sclr;
};
