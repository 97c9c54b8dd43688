/*
 * app_mutrig_controller.hpp
 *
 *  Created on: Oct 28, 2025
 *
 *  Top level of the MuTRiG controller
 *  Owns every block of both clock domains and wires their state variables together
 *
 *  Control domain, stepped in this order each edge:
 *  	interpreter --> MCC --> TSA --> data mover --> pattern modifier --> rate monitor --> arbiter --> store commit
 *  Serial domain:
 *  	config writer
 *
 *  External buses (staging buffer, rate counters, counter clear, serial pins) are exposed as link/subscribe hooks
 *  so whatever models or drives them can be attached after `init()`
 */

#pragma once

#include "app_proctypes.hpp"
#include "app_controller_config.hpp"
#include "app_bit_layout.hpp"
#include "app_config_store.hpp"
#include "app_result_store.hpp"
#include "app_cross_domain_channel.hpp"
#include "app_channel_messages.hpp"

#include "app_csr_block.hpp"
#include "app_interpreter.hpp"
#include "app_config_controller.hpp"
#include "app_scan_automation.hpp"
#include "app_cfg_arbiter.hpp"
#include "app_data_mover.hpp"
#include "app_pattern_modifier.hpp"
#include "app_rate_monitor.hpp"
#include "app_config_writer.hpp"

class MuTRiG_Controller {
public:
	MuTRiG_Controller(const Controller_Config_t& _config);

	//delete copy constructor and assignment operator
	MuTRiG_Controller(const MuTRiG_Controller& other) = delete;
	void operator=(const MuTRiG_Controller& other) = delete;

	//check the configuration and wire the blocks together
	//nothing ticks before this returns OK
	Controller_Config_t::Status init();

	//one edge of either domain
	void tick_control();
	void tick_serial();

	//synchronous reset of every state machine and status variable
	//stores keep their contents
	void reset();

	//============================ HOST ACCESS ============================
	bool csr_write(uint8_t address, uint32_t data) { return csr.write(address, data); }
	uint32_t csr_read(uint8_t address) const { return csr.read(address); }
	uint32_t result_read(uint32_t word_index) const { return results.read(word_index); }

	//============================ EXTERNAL BUSES ============================
	auto subscribe_scratchpad_master() { return mover.subscribe_bus_master(); }
	void link_scratchpad_slave(const Sub_Var<Avalon_Read_Slave_t>& sub) { mover.link_bus_slave(sub); }
	auto subscribe_counter_master() { return monitor.subscribe_bus_master(); }
	void link_counter_slave(const Sub_Var<Avalon_Read_Slave_t>& sub) { monitor.link_bus_slave(sub); }
	auto subscribe_counter_sclr() { return monitor.subscribe_status_sclr(); }
	auto subscribe_spi_pins() { return writer.subscribe_spi_pins(); }

	//============================ STATUS ============================
	bool ready() const { return initialized; }
	bool busy() const { return !interpreter.idle(); }
	bool all_idle() const;

	const Controller_Config_t& get_config() const { return config; }
	const Bit_Layout& get_layout() const { return layout; }
	Config_Store& get_config_store() { return store; }
	Result_Store& get_result_store() { return results; }

	//blocks, for status reporting and tests
	Instruction_Interpreter& get_interpreter() { return interpreter; }
	Config_Controller& get_mcc() { return mcc; }
	Scan_Automation& get_tsa() { return tsa; }
	Cfg_Arbiter& get_arbiter() { return arbiter; }
	Data_Mover& get_data_mover() { return mover; }
	Pattern_Modifier& get_pattern_modifier() { return modifier; }
	Rate_Monitor& get_rate_monitor() { return monitor; }
	Config_Writer& get_config_writer() { return writer; }
	Cross_Domain_Channel<Cfg_Write_Request_t>& get_request_channel() { return to_writer; }
	Cross_Domain_Channel<Cfg_Write_Response_t>& get_response_channel() { return to_control; }

private:
	//keep our own copy, every block holds a reference to it
	const Controller_Config_t config;
	const Bit_Layout layout;

	Config_Store store;
	Result_Store results;

	Cross_Domain_Channel<Cfg_Write_Request_t> to_writer;
	Cross_Domain_Channel<Cfg_Write_Response_t> to_control;

	Csr_Block csr;
	Instruction_Interpreter interpreter;
	Config_Controller mcc;
	Scan_Automation tsa;
	Data_Mover mover;
	Pattern_Modifier modifier;
	Rate_Monitor monitor;
	Cfg_Arbiter arbiter;
	Config_Writer writer;

	bool initialized = false;
};
