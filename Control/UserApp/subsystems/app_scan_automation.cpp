/*
 * app_scan_automation.cpp
 *
 *  Created on: Oct 26, 2025
 */

#include "app_scan_automation.hpp"
#include "app_debug_if.hpp"

Scan_Automation::Scan_Automation(const Controller_Config_t& _config):
	n_devices(_config.n_mutrig),
	tsa_state_IDLE(BIND_CALLBACK(this, do_idle_entry), BIND_CALLBACK(this, do_idle), BIND_CALLBACK(this, do_start), "IDLE"),
	tsa_state_MOD_TTH(BIND_CALLBACK(this, do_modify_begin), BIND_CALLBACK(this, do_modify), {}, "MOD_TTH"),
	tsa_state_CFG(BIND_CALLBACK(this, do_cfg_begin), BIND_CALLBACK(this, do_cfg), BIND_CALLBACK(this, do_cfg_end), "CFG"),
	tsa_state_MONITOR_RATE(BIND_CALLBACK(this, do_monitor_begin), BIND_CALLBACK(this, do_monitor), {}, "MONITOR_RATE"),
	tsa_state_EVALUATION(BIND_CALLBACK(this, do_evaluate_entry), BIND_CALLBACK(this, do_evaluate), BIND_CALLBACK(this, do_next_tth), "EVALUATION"),
	tsa_esm(&tsa_state_IDLE, "TSA")
{
	tsa_state_IDLE.attach_state_transitions(tsa_trans_FROM_IDLE);
	tsa_state_MOD_TTH.attach_state_transitions(tsa_trans_FROM_MOD_TTH);
	tsa_state_CFG.attach_state_transitions(tsa_trans_FROM_CFG);
	tsa_state_MONITOR_RATE.attach_state_transitions(tsa_trans_FROM_MONITOR_RATE);
	tsa_state_EVALUATION.attach_state_transitions(tsa_trans_FROM_EVALUATION);
}

void Scan_Automation::tick() {
	tsa_esm.RUN_ESM();
}

void Scan_Automation::reset() {
	tsa_esm.RESET_ESM();
	modifier_call.reset();
	cfg_call.reset();
	monitor_call.reset();
	tth = 0;
	scan_all = false;
	command_modifier_start.publish(false);
	command_cfg_request.publish(false);
	command_monitor.publish({});
	command_device_increment.publish(false);
	command_device_reset.publish(false);
	status_tth.publish(0);
	status_progress.publish(0);
	status_tsa_done.publish(false);
	status_tsa_busy.publish(false);
}

//================================= STATE FUNCTIONS =================================

void Scan_Automation::do_idle_entry() {
	status_tsa_busy.publish(false);
}

void Scan_Automation::do_idle() {
	if(!status_rpc.read().start) status_tsa_done.publish(false);
}

void Scan_Automation::do_start() {
	auto rpc = status_rpc.read();
	scan_all = rpc.command == Command_Code::SCAN_ALL;
	tth = 0;
	status_tth.publish(tth);
	status_progress.publish(0);
	status_tsa_busy.publish(true);
	Debug::PRINT(scan_all ? std::string("TSA: scanning all devices") :
							"TSA: scanning device " + std::to_string(rpc.device_id));
}

void Scan_Automation::do_modify_begin() {
	modifier_call.begin(status_modifier_done.read());
}

void Scan_Automation::do_modify() {
	modifier_call.step(status_modifier_done.read());
	command_modifier_start.publish(modifier_call.start());
}

void Scan_Automation::do_cfg_begin() {
	cfg_call.begin(status_cfg_done.read());
}

void Scan_Automation::do_cfg() {
	cfg_call.step(status_cfg_done.read());
	command_cfg_request.publish(cfg_call.start());
}

void Scan_Automation::do_cfg_end() {
	if(!scan_all) return;

	//interpreter picks these up on the next edge, before the modifier latches the device
	if(more_devices()) command_device_increment.publish(true);
	else command_device_reset.publish(true);
}

void Scan_Automation::do_monitor_begin() {
	monitor_call.begin(status_monitor_done.read());
}

void Scan_Automation::do_monitor() {
	monitor_call.step(status_monitor_done.read());
	Monitor_Request_t request = {};
	request.start = monitor_call.start();
	request.tth = tth;
	command_monitor.publish(request);
}

void Scan_Automation::do_evaluate_entry() {
	status_progress.publish(tth);
}

void Scan_Automation::do_evaluate() {
	if(tth >= TTH_LAST) status_tsa_done.publish(true);
}

void Scan_Automation::do_next_tth() {
	if(tth < TTH_LAST) tth++;
	else {
		//back to idle: progress reads 0 until the next scan
		tth = 0;
		status_progress.publish(0);
		Debug::PRINT("TSA: scan complete");
	}
	status_tth.publish(tth);
}
