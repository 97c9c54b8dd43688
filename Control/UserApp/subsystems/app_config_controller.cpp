/*
 * app_config_controller.cpp
 *
 *  Created on: Oct 26, 2025
 */

#include "app_config_controller.hpp"
#include "app_debug_if.hpp"

Config_Controller::Config_Controller():
	mcc_state_IDLE(BIND_CALLBACK(this, do_idle_entry), BIND_CALLBACK(this, do_idle), {}, "IDLE"),
	mcc_state_MOVE_DATA(BIND_CALLBACK(this, do_move_begin), BIND_CALLBACK(this, do_move), {}, "MOVE_DATA"),
	mcc_state_WRITE_CFG(BIND_CALLBACK(this, do_write_begin), BIND_CALLBACK(this, do_write), {}, "WRITE_CFG"),
	mcc_state_EXCEPTION(BIND_CALLBACK(this, do_exception), {}, {}, "EXCEPTION"),
	mcc_esm(&mcc_state_IDLE, "MCC")
{
	mcc_state_IDLE.attach_state_transitions(mcc_trans_FROM_IDLE);
	mcc_state_MOVE_DATA.attach_state_transitions(mcc_trans_FROM_MOVE_DATA);
	mcc_state_WRITE_CFG.attach_state_transitions(mcc_trans_FROM_WRITE_CFG);
}

void Config_Controller::tick() {
	mcc_esm.RUN_ESM();
}

void Config_Controller::reset() {
	mcc_esm.RESET_ESM();
	mover_call.reset();
	cfg_call.reset();
	command_mover_start.publish(false);
	command_cfg_request.publish(false);
	status_mcc_done.publish(false);
	status_mcc_busy.publish(false);
	status_mcc_exception.publish(false);
}

//================================= STATE FUNCTIONS =================================

void Config_Controller::do_idle_entry() {
	status_mcc_busy.publish(false);
}

void Config_Controller::do_idle() {
	//interpreter took our done, clear it
	if(!status_rpc.read().start) status_mcc_done.publish(false);
}

void Config_Controller::do_move_begin() {
	status_mcc_busy.publish(true);
	mover_call.begin(status_mover_done.read());
}

void Config_Controller::do_move() {
	//a stale done goes straight to EXCEPTION, don't even raise start
	if(mover_call.stale_done()) return;
	mover_call.step(status_mover_done.read());
	command_mover_start.publish(mover_call.start());
}

void Config_Controller::do_write_begin() {
	cfg_call.begin(status_cfg_done.read());
}

void Config_Controller::do_write() {
	cfg_call.step(status_cfg_done.read());
	command_cfg_request.publish(cfg_call.start());
	if(cfg_call.complete()) {
		if(!status_mcc_done.read()) Debug::PRINT("MCC: device " + std::to_string(status_rpc.read().device_id) + " configured");
		status_mcc_done.publish(true);
	}
}

void Config_Controller::do_exception() {
	command_mover_start.publish(false);
	command_cfg_request.publish(false);
	status_mcc_exception.publish(true);
	Debug::ERROR("MCC: data mover reported done before it was started, trapped until reset");
}
