/*
 * app_co_simulation.cpp
 *
 *  Created on: Oct 30, 2025
 */

#include "app_co_simulation.hpp"
#include "app_debug_if.hpp"

Co_Simulation::Co_Simulation(const Controller_Config_t& _config):
	config(_config),
	controller(_config),
	scratchpad(),
	counters(_config),
	chips(),
	control_clock("control", _config.clk_frequency_hz),
	serial_clock("serial", _config.clk_frequency_spi_hz),
	tree(control_clock, serial_clock)
{
	for(uint32_t d = 0; d < config.n_mutrig && d < Controller_Config_t::N_MUTRIG_MAX; d++) {
		chips.push_back(std::make_unique<MuTRiG_Model>(static_cast<uint8_t>(d), config));
	}
}

Controller_Config_t::Status Co_Simulation::init() {
	auto status = controller.init();
	if(status != Controller_Config_t::Status::OK) return status;

	//#### STAGING BUFFER ####
	scratchpad.link_bus_master(controller.subscribe_scratchpad_master());
	controller.link_scratchpad_slave(scratchpad.subscribe_bus_slave());

	//#### COUNTERS ####
	counters.link_bus_master(controller.subscribe_counter_master());
	counters.link_counter_sclr(controller.subscribe_counter_sclr());
	controller.link_counter_slave(counters.subscribe_bus_slave());

	//#### CHIPS ####
	for(auto& chip : chips) {
		chip->link_spi_pins(controller.subscribe_spi_pins());
		counters.link_chip(chip->device(), chip.get());
	}

	control_clock.attach(BIND_CALLBACK(this, tick_control));
	serial_clock.attach(BIND_CALLBACK(this, tick_serial));

	initialized = true;
	return status;
}

//models see what the controller drove on this same edge
void Co_Simulation::tick_control() {
	controller.tick_control();
	scratchpad.tick();
	counters.tick();
}

void Co_Simulation::tick_serial() {
	controller.tick_serial();
	for(auto& chip : chips) chip->tick();
}

bool Co_Simulation::issue_command(Command_Code code, uint8_t device, uint16_t payload_words, uint32_t offset) {
	uint32_t word = (static_cast<uint32_t>(code) << 20) | (static_cast<uint32_t>(device & 0xF) << 16) | payload_words;
	if(!csr_write(Csr_Block::OFFSET, offset)) return false;
	return csr_write(Csr_Block::COMMAND, word);
}

void Co_Simulation::run_cycles(uint64_t n) {
	if(!initialized) {
		Debug::WARN("Co_Simulation: not initialized, nothing to run");
		return;
	}
	tree.run_control_cycles(n);
}

bool Co_Simulation::run_until_idle(uint64_t max_control_cycles) {
	if(!initialized) {
		Debug::WARN("Co_Simulation: not initialized, nothing to run");
		return false;
	}

	for(uint64_t i = 0; i < max_control_cycles; i++) {
		tree.run_control_cycles(1);
		if(controller.all_idle()) return true;
	}
	return false;
}

void Co_Simulation::reset() {
	controller.reset();
	scratchpad.reset();
	counters.reset();
	counters.reset_counters();
}
