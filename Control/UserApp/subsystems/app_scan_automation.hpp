/*
 * app_scan_automation.hpp
 *
 *  Created on: Oct 26, 2025
 *
 *  TSA - threshold scan, 64 steps (tth 0..63) per invocation
 *  	IDLE --> MOD_TTH --> CFG --> MONITOR_RATE --> EVALUATION --> MOD_TTH (next tth) ... --> IDLE
 *  	- MOD_TTH: pattern modifier patches tth into every channel of the current device
 *  	- CFG: config writer pushes the patched bitstream out
 *  	  scanning all devices: loop back to MOD_TTH for the next device at the same tth,
 *  	  and only go on to MONITOR_RATE once the last device is written (device index back to 0)
 *  	- MONITOR_RATE: one rate snapshot of every device for this tth
 *  	- EVALUATION: report progress, next tth or done
 *
 *  The device index itself lives in the interpreter; we just ask it to step/rewind.
 *  Partitions have to hold a full configuration from an earlier configure command; only the threshold gets touched here.
 */

#pragma once

#include "app_proctypes.hpp"
#include "app_threading.hpp"
#include "app_state_machine_library.hpp"
#include "app_handshake.hpp"
#include "app_routine_request.hpp"
#include "app_controller_config.hpp"

class Scan_Automation {
public:
	static constexpr uint8_t TTH_LAST = Controller_Config_t::THRESHOLD_STEPS - 1;

	Scan_Automation(const Controller_Config_t& _config);

	//delete copy constructor and assignment operator
	Scan_Automation(const Scan_Automation& other) = delete;
	void operator=(const Scan_Automation& other) = delete;

	void tick();
	void reset();

	LINK_FUNC(status_rpc);
	LINK_FUNC(status_device);
	LINK_FUNC(status_modifier_done);
	LINK_FUNC(status_cfg_done);
	LINK_FUNC(status_monitor_done);
	SUBSCRIBE_FUNC(command_modifier_start);
	SUBSCRIBE_FUNC(command_cfg_request);
	SUBSCRIBE_FUNC(command_monitor);
	SUBSCRIBE_FUNC_RC(command_device_increment);
	SUBSCRIBE_FUNC_RC(command_device_reset);
	SUBSCRIBE_FUNC(status_tth);
	SUBSCRIBE_FUNC(status_progress);
	SUBSCRIBE_FUNC(status_tsa_done);
	SUBSCRIBE_FUNC(status_tsa_busy);

	bool idle() const { return tsa_esm.in(tsa_state_IDLE); }

private:
	const uint32_t n_devices;

	Handshake_Master modifier_call;
	Handshake_Master cfg_call;
	Handshake_Master monitor_call;

	uint8_t tth = 0;
	bool scan_all = false;

	bool more_devices() { return scan_all && static_cast<uint32_t>(status_device.read()) + 1 < n_devices; }

	//##### STATE FUNCTIONS #####
	void do_idle_entry();
	void do_idle();
	void do_start();			//IDLE exit
	void do_modify_begin();
	void do_modify();
	void do_cfg_begin();
	void do_cfg();
	void do_cfg_end();			//CFG exit: step or rewind the device index
	void do_monitor_begin();
	void do_monitor();
	void do_evaluate_entry();
	void do_evaluate();
	void do_next_tth();			//EVALUATION exit

	bool trans_IDLE_to_MOD_TTH()				{ auto rpc = status_rpc.read(); return rpc.start && is_scan(rpc.command) && !status_tsa_done.read(); }
	bool trans_MOD_TTH_to_CFG()					{ return modifier_call.complete(); }
	bool trans_CFG_to_MOD_TTH()					{ return cfg_call.complete() && more_devices(); }
	bool trans_CFG_to_MONITOR_RATE()			{ return cfg_call.complete(); }
	bool trans_MONITOR_RATE_to_EVALUATION()		{ return monitor_call.complete(); }
	bool trans_EVALUATION_to_MOD_TTH()			{ return tth < TTH_LAST; }
	bool trans_EVALUATION_to_IDLE()				{ return status_tsa_done.read() && !status_rpc.read().start; }

	ESM_State tsa_state_IDLE;
	ESM_State tsa_state_MOD_TTH;
	ESM_State tsa_state_CFG;
	ESM_State tsa_state_MONITOR_RATE;
	ESM_State tsa_state_EVALUATION;

	ESM_Transition tsa_trans_FROM_IDLE[1] = {	{&tsa_state_MOD_TTH, {BIND_CALLBACK(this, trans_IDLE_to_MOD_TTH)}	}	};
	ESM_Transition tsa_trans_FROM_MOD_TTH[1] = {	{&tsa_state_CFG, {BIND_CALLBACK(this, trans_MOD_TTH_to_CFG)}	}	};
	ESM_Transition tsa_trans_FROM_CFG[2] = {	{&tsa_state_MOD_TTH, {BIND_CALLBACK(this, trans_CFG_to_MOD_TTH)}			},
												{&tsa_state_MONITOR_RATE, {BIND_CALLBACK(this, trans_CFG_to_MONITOR_RATE)}	}	};
	ESM_Transition tsa_trans_FROM_MONITOR_RATE[1] = {	{&tsa_state_EVALUATION, {BIND_CALLBACK(this, trans_MONITOR_RATE_to_EVALUATION)}	}	};
	ESM_Transition tsa_trans_FROM_EVALUATION[2] = {	{&tsa_state_MOD_TTH, {BIND_CALLBACK(this, trans_EVALUATION_to_MOD_TTH)}	},
														{&tsa_state_IDLE, {BIND_CALLBACK(this, trans_EVALUATION_to_IDLE)}		}	};

	Extended_State_Machine tsa_esm;

	//###### STATE VARIABLES #######
	Sub_Var<Routine_Request_t> status_rpc;
	Sub_Var<uint8_t> status_device;
	Sub_Var<bool> status_modifier_done;
	Sub_Var<bool> status_cfg_done;
	Sub_Var<bool> status_monitor_done;
	PERSISTENT((Pub_Var<bool>), command_modifier_start);
	PERSISTENT((Pub_Var<bool>), command_cfg_request);
	PERSISTENT((Pub_Var<Monitor_Request_t>), command_monitor);
	PERSISTENT((Pub_Var<bool>), command_device_increment);	//read-clear, interpreter acknowledges
	PERSISTENT((Pub_Var<bool>), command_device_reset);		//read-clear, interpreter acknowledges
	PERSISTENT((Pub_Var<uint8_t>), status_tth);
	PERSISTENT((Pub_Var<uint8_t>), status_progress);
	PERSISTENT((Pub_Var<bool>), status_tsa_done);
	PERSISTENT((Pub_Var<bool>), status_tsa_busy);
};
