/*
 * app_interpreter.hpp
 *
 *  Created on: Oct 27, 2025
 *
 *  Decodes writes to the command register and hands them to MCC or TSA
 *  	IDLE: every command write gets decoded
 *  		- unknown code, a routine that isn't built, or a device without a partition --> dropped with a warning
 *  		- anything else --> latched into the routine request with start high
 *  	RUNNING: further command writes are dropped; TSA may step/rewind the device index
 *  	ACKNOWLEDGE: routine reported done, start goes low; back to IDLE once done drops
 *
 *  Command register layout: [31:20] command code, [19:16] device id, [15:0] payload length (words)
 */

#pragma once

#include "app_proctypes.hpp"
#include "app_threading.hpp"
#include "app_state_machine_library.hpp"
#include "app_regmap_helpers.hpp"
#include "app_controller_config.hpp"
#include "app_routine_request.hpp"

class Instruction_Interpreter {
public:
	//decoded fields of a command word
	struct Command_Fields_t {
		uint16_t code;
		uint8_t device_id;
		uint16_t payload_length;
	};

	Instruction_Interpreter(const Controller_Config_t& _config);

	//delete copy constructor and assignment operator
	Instruction_Interpreter(const Instruction_Interpreter& other) = delete;
	void operator=(const Instruction_Interpreter& other) = delete;

	void tick();
	void reset();

	//pick a command word apart
	static Command_Fields_t decode(uint32_t command_word);

	LINK_FUNC(command_csr_command);
	LINK_FUNC(status_mcc_done);
	LINK_FUNC(status_tsa_done);
	LINK_FUNC_RC(command_device_increment);
	LINK_FUNC_RC(command_device_reset);
	SUBSCRIBE_FUNC(status_rpc);
	SUBSCRIBE_FUNC(status_device);
	SUBSCRIBE_FUNC(status_busy);
	SUBSCRIBE_FUNC(status_command_word);

	bool idle() const { return interpreter_esm.in(interpreter_state_IDLE); }
	uint32_t discarded_commands() const { return discarded; }

private:
	const Controller_Config_t& config;

	//command latched in IDLE, published on the way out
	Routine_Request_t pending = {};
	uint32_t pending_word = 0;
	bool accepted = false;
	uint32_t discarded = 0;

	//check a fresh command write; true if it should start a routine
	bool accept_command(uint32_t command_word);
	void drop_busy_command();
	void service_device_index();

	//##### STATE FUNCTIONS #####
	void do_idle_entry();
	void do_idle();
	void do_dispatch();				//IDLE exit
	void do_running();
	void do_acknowledge_entry();
	void do_acknowledge();
	void do_release();			//ACKNOWLEDGE exit

	bool routine_done() { return status_mcc_done.read() || status_tsa_done.read(); }

	bool trans_IDLE_to_RUNNING()			{ return accepted; }
	bool trans_RUNNING_to_ACKNOWLEDGE()		{ return routine_done(); }
	bool trans_ACKNOWLEDGE_to_IDLE()		{ return !routine_done(); }

	ESM_State interpreter_state_IDLE;
	ESM_State interpreter_state_RUNNING;
	ESM_State interpreter_state_ACKNOWLEDGE;

	ESM_Transition interpreter_trans_FROM_IDLE[1] = {	{&interpreter_state_RUNNING, {BIND_CALLBACK(this, trans_IDLE_to_RUNNING)}	}	};
	ESM_Transition interpreter_trans_FROM_RUNNING[1] = {	{&interpreter_state_ACKNOWLEDGE, {BIND_CALLBACK(this, trans_RUNNING_to_ACKNOWLEDGE)}	}	};
	ESM_Transition interpreter_trans_FROM_ACKNOWLEDGE[1] = {	{&interpreter_state_IDLE, {BIND_CALLBACK(this, trans_ACKNOWLEDGE_to_IDLE)}	}	};

	Extended_State_Machine interpreter_esm;

	//###### STATE VARIABLES #######
	Sub_Var<uint32_t> command_csr_command;			//event: every host write signals, even repeats
	Sub_Var<bool> status_mcc_done;
	Sub_Var<bool> status_tsa_done;
	Sub_Var_RC<bool> command_device_increment;
	Sub_Var_RC<bool> command_device_reset;
	PERSISTENT((Pub_Var<Routine_Request_t>), status_rpc);
	PERSISTENT((Pub_Var<uint8_t>), status_device);
	PERSISTENT((Pub_Var<bool>), status_busy);
	PERSISTENT((Pub_Var<uint32_t>), status_command_word);
};
