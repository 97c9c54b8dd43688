/*
 * app_co_simulation.hpp
 *
 *  Created on: Oct 30, 2025
 *
 *  Controller plus every model of the world around it, on two simulated clocks
 *  	control edge: controller --> scratchpad --> counters
 *  	serial edge: config writer --> MuTRiG chips
 *
 *  Everything the host tools and the end-to-end tests do goes through here
 */

#pragma once

#include <memory>
#include <vector>

#include "app_proctypes.hpp"
#include "app_clock_domain.hpp"
#include "app_mutrig_controller.hpp"
#include "app_scratchpad_model.hpp"
#include "app_counter_bank_model.hpp"
#include "app_mutrig_model.hpp"

class Co_Simulation {
public:
	Co_Simulation(const Controller_Config_t& _config);

	//delete copy constructor and assignment operator
	Co_Simulation(const Co_Simulation& other) = delete;
	void operator=(const Co_Simulation& other) = delete;

	//bring up the controller and attach the models
	Controller_Config_t::Status init();

	//============================ HOST ACCESS ============================
	bool csr_write(uint8_t address, uint32_t data) { return controller.csr_write(address, data); }
	uint32_t csr_read(uint8_t address) const { return controller.csr_read(address); }
	uint32_t result_read(uint32_t word_index) const { return controller.result_read(word_index); }
	bool load_scratchpad(uint32_t word_offset, std::span<const uint32_t> words) { return scratchpad.load(word_offset, words); }

	//write OFFSET then COMMAND, the way the host starts a routine
	bool issue_command(Command_Code code, uint8_t device, uint16_t payload_words = 0, uint32_t offset = 0);

	//============================ TIME ============================
	void run_cycles(uint64_t control_cycles);

	//run until every block is back in its idle state; false if that didn't happen within `max_control_cycles`
	//the first edge is always run so a fresh command gets seen
	bool run_until_idle(uint64_t max_control_cycles);

	//synchronous reset of the controller and the bus models; chips keep their configuration
	void reset();

	uint64_t now_ps() const { return tree.now_ps(); }
	uint64_t timestamp_ps() { return tree.now_ps(); }	//bindable, for debug sinks
	uint64_t control_cycles() const { return control_clock.cycles(); }
	uint64_t serial_cycles() const { return serial_clock.cycles(); }

	//============================ MODELS ============================
	MuTRiG_Controller& get_controller() { return controller; }
	Scratchpad_Model& get_scratchpad() { return scratchpad; }
	Counter_Bank_Model& get_counters() { return counters; }
	MuTRiG_Model& get_chip(uint32_t device) { return *chips[device]; }
	uint32_t n_chips() const { return static_cast<uint32_t>(chips.size()); }

private:
	const Controller_Config_t config;

	MuTRiG_Controller controller;
	Scratchpad_Model scratchpad;
	Counter_Bank_Model counters;
	std::vector<std::unique_ptr<MuTRiG_Model>> chips;

	Clock_Domain control_clock;
	Clock_Domain serial_clock;
	Clock_Tree tree;

	bool initialized = false;

	//clock domain tasks
	void tick_control();
	void tick_serial();
};
