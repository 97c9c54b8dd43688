/*
 * app_config_controller.hpp
 *
 *  Created on: Oct 26, 2025
 *
 *  MCC - one-shot configuration of a single device
 *  	IDLE --> MOVE_DATA (data mover copies the bitstream in) --> WRITE_CFG (config writer pushes it out) --> IDLE
 *
 *  EXCEPTION traps a data mover that reports done before we ever asked it to start.
 *  That can only be a logic fault, so nothing leaves EXCEPTION except a full reset.
 */

#pragma once

#include "app_proctypes.hpp"
#include "app_threading.hpp"
#include "app_state_machine_library.hpp"
#include "app_handshake.hpp"
#include "app_routine_request.hpp"

class Config_Controller {
public:
	Config_Controller();

	//delete copy constructor and assignment operator
	Config_Controller(const Config_Controller& other) = delete;
	void operator=(const Config_Controller& other) = delete;

	void tick();
	void reset();

	LINK_FUNC(status_rpc);
	LINK_FUNC(status_mover_done);
	LINK_FUNC(status_cfg_done);
	SUBSCRIBE_FUNC(command_mover_start);
	SUBSCRIBE_FUNC(command_cfg_request);
	SUBSCRIBE_FUNC(status_mcc_done);
	SUBSCRIBE_FUNC(status_mcc_busy);
	SUBSCRIBE_FUNC(status_mcc_exception);

	bool idle() const { return mcc_esm.in(mcc_state_IDLE); }
	bool trapped() const { return mcc_esm.in(mcc_state_EXCEPTION); }

private:
	Handshake_Master mover_call;
	Handshake_Master cfg_call;

	//##### STATE FUNCTIONS #####
	void do_idle_entry();
	void do_idle();
	void do_move_begin();
	void do_move();
	void do_write_begin();
	void do_write();
	void do_exception();

	bool trans_IDLE_to_MOVE_DATA()			{ auto rpc = status_rpc.read(); return rpc.start && rpc.command == Command_Code::CONFIGURE && !status_mcc_done.read(); }
	bool trans_MOVE_DATA_to_EXCEPTION()		{ return mover_call.stale_done(); }
	bool trans_MOVE_DATA_to_WRITE_CFG()		{ return mover_call.complete(); }
	bool trans_WRITE_CFG_to_IDLE()			{ return cfg_call.complete() && !status_rpc.read().start; }

	ESM_State mcc_state_IDLE;
	ESM_State mcc_state_MOVE_DATA;
	ESM_State mcc_state_WRITE_CFG;
	ESM_State mcc_state_EXCEPTION;

	ESM_Transition mcc_trans_FROM_IDLE[1] = {	{&mcc_state_MOVE_DATA, {BIND_CALLBACK(this, trans_IDLE_to_MOVE_DATA)}	}	};
	ESM_Transition mcc_trans_FROM_MOVE_DATA[2] = {	{&mcc_state_EXCEPTION, {BIND_CALLBACK(this, trans_MOVE_DATA_to_EXCEPTION)}	},
													{&mcc_state_WRITE_CFG, {BIND_CALLBACK(this, trans_MOVE_DATA_to_WRITE_CFG)}	}	};
	ESM_Transition mcc_trans_FROM_WRITE_CFG[1] = {	{&mcc_state_IDLE, {BIND_CALLBACK(this, trans_WRITE_CFG_to_IDLE)}	}	};
	//no way out of EXCEPTION

	Extended_State_Machine mcc_esm;

	//###### STATE VARIABLES #######
	Sub_Var<Routine_Request_t> status_rpc;
	Sub_Var<bool> status_mover_done;
	Sub_Var<bool> status_cfg_done;
	PERSISTENT((Pub_Var<bool>), command_mover_start);
	PERSISTENT((Pub_Var<bool>), command_cfg_request);
	PERSISTENT((Pub_Var<bool>), status_mcc_done);
	PERSISTENT((Pub_Var<bool>), status_mcc_busy);
	PERSISTENT((Pub_Var<bool>), status_mcc_exception);
};
