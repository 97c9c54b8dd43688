/*
 * app_cfg_arbiter.hpp
 *
 *  Created on: Oct 25, 2025
 *
 *  Hands the config writer to exactly one of MCC/TSA at a time
 *  	- FREE: grant to whoever asks, MCC first if both do
 *  	- GRANTED: start goes across to the serial domain; the writer's done comes back to the owner only
 *  	- RELEASING: owner dropped its request, start goes low; the token frees up once the writer's done has dropped
 *
 *  Holding the token until done is low means a new grant can never see the previous call's done.
 */

#pragma once

#include "app_proctypes.hpp"
#include "app_threading.hpp"
#include "app_state_machine_library.hpp"
#include "app_cross_domain_channel.hpp"
#include "app_channel_messages.hpp"
#include "app_routine_request.hpp"

class Cfg_Arbiter {
public:
	enum class Owner : uint8_t {
		NONE = 0,
		MCC = 1,
		TSA = 2,
	};

	Cfg_Arbiter(Cross_Domain_Channel<Cfg_Write_Request_t>& _to_writer,
				Cross_Domain_Channel<Cfg_Write_Response_t>& _from_writer);

	//delete copy constructor and assignment operator
	Cfg_Arbiter(const Cfg_Arbiter& other) = delete;
	void operator=(const Cfg_Arbiter& other) = delete;

	//pulls in the response channel first, then runs the state machine
	void tick();
	void reset();

	LINK_FUNC(command_mcc_cfg_request);
	LINK_FUNC(command_tsa_cfg_request);
	LINK_FUNC(status_rpc);
	LINK_FUNC(status_device);
	SUBSCRIBE_FUNC(status_mcc_cfg_done);
	SUBSCRIBE_FUNC(status_tsa_cfg_done);
	SUBSCRIBE_FUNC(status_cfg_owner);
	SUBSCRIBE_FUNC(status_cfg_write_error);

	Owner owner() const { return current_owner; }
	bool idle() const { return arbiter_esm.in(arbiter_state_FREE); }

private:
	Cross_Domain_Channel<Cfg_Write_Request_t>& to_writer;
	Cross_Domain_Channel<Cfg_Write_Response_t>& from_writer;

	Owner current_owner = Owner::NONE;
	Owner pending_owner = Owner::NONE;
	uint8_t device = 0;

	bool owner_request();
	void forward_done(bool done);

	//##### STATE FUNCTIONS #####
	void do_free_entry();
	void do_free();
	void do_grant();		//FREE exit
	void do_granted_entry();
	void do_granted();
	void do_releasing_entry();

	bool trans_FREE_to_GRANTED()			{ return pending_owner != Owner::NONE; }
	bool trans_GRANTED_to_RELEASING()		{ return !owner_request(); }
	bool trans_RELEASING_to_FREE()			{ return !from_writer.value().done; }

	ESM_State arbiter_state_FREE;
	ESM_State arbiter_state_GRANTED;
	ESM_State arbiter_state_RELEASING;

	ESM_Transition arbiter_trans_FROM_FREE[1] = {	{&arbiter_state_GRANTED, {BIND_CALLBACK(this, trans_FREE_to_GRANTED)}	}	};
	ESM_Transition arbiter_trans_FROM_GRANTED[1] = {	{&arbiter_state_RELEASING, {BIND_CALLBACK(this, trans_GRANTED_to_RELEASING)}	}	};
	ESM_Transition arbiter_trans_FROM_RELEASING[1] = {	{&arbiter_state_FREE, {BIND_CALLBACK(this, trans_RELEASING_to_FREE)}	}	};

	Extended_State_Machine arbiter_esm;

	//###### STATE VARIABLES #######
	Sub_Var<bool> command_mcc_cfg_request;
	Sub_Var<bool> command_tsa_cfg_request;
	Sub_Var<Routine_Request_t> status_rpc;		//device for MCC
	Sub_Var<uint8_t> status_device;				//device for TSA
	PERSISTENT((Pub_Var<bool>), status_mcc_cfg_done);
	PERSISTENT((Pub_Var<bool>), status_tsa_cfg_done);
	PERSISTENT((Pub_Var<Owner>), status_cfg_owner, Owner::NONE);
	PERSISTENT((Pub_Var<bool>), status_cfg_write_error);
};
