/*
 * app_cfg_arbiter.cpp
 *
 *  Created on: Oct 25, 2025
 */

#include "app_cfg_arbiter.hpp"
#include "app_debug_if.hpp"

Cfg_Arbiter::Cfg_Arbiter(	Cross_Domain_Channel<Cfg_Write_Request_t>& _to_writer,
							Cross_Domain_Channel<Cfg_Write_Response_t>& _from_writer):
	to_writer(_to_writer),
	from_writer(_from_writer),
	arbiter_state_FREE(BIND_CALLBACK(this, do_free_entry), BIND_CALLBACK(this, do_free), BIND_CALLBACK(this, do_grant), "FREE"),
	arbiter_state_GRANTED(BIND_CALLBACK(this, do_granted_entry), BIND_CALLBACK(this, do_granted), {}, "GRANTED"),
	arbiter_state_RELEASING(BIND_CALLBACK(this, do_releasing_entry), BIND_CALLBACK(this, do_granted), {}, "RELEASING"),
	arbiter_esm(&arbiter_state_FREE, "cfg arbiter")
{
	arbiter_state_FREE.attach_state_transitions(arbiter_trans_FROM_FREE);
	arbiter_state_GRANTED.attach_state_transitions(arbiter_trans_FROM_GRANTED);
	arbiter_state_RELEASING.attach_state_transitions(arbiter_trans_FROM_RELEASING);
}

void Cfg_Arbiter::tick() {
	from_writer.sync();

	//report writer errors once per response
	if(from_writer.available()) {
		auto response = from_writer.receive();
		if(response.done && response.error) {
			Debug::ERROR("Cfg_Arbiter: config writer reported error " + std::to_string(response.error_info));
			status_cfg_write_error.publish(true);
		}
	}

	arbiter_esm.RUN_ESM();
}

void Cfg_Arbiter::reset() {
	arbiter_esm.RESET_ESM();
	current_owner = Owner::NONE;
	pending_owner = Owner::NONE;
	device = 0;
	status_mcc_cfg_done.publish(false);
	status_tsa_cfg_done.publish(false);
	status_cfg_owner.publish(Owner::NONE);
	status_cfg_write_error.publish(false);
}

bool Cfg_Arbiter::owner_request() {
	switch(current_owner) {
	case Owner::MCC: return command_mcc_cfg_request.read();
	case Owner::TSA: return command_tsa_cfg_request.read();
	default: return false;
	}
}

void Cfg_Arbiter::forward_done(bool done) {
	status_mcc_cfg_done.publish(done && current_owner == Owner::MCC);
	status_tsa_cfg_done.publish(done && current_owner == Owner::TSA);
}

//================================= STATE FUNCTIONS =================================

void Cfg_Arbiter::do_free_entry() {
	current_owner = Owner::NONE;
	pending_owner = Owner::NONE;
	forward_done(false);
	status_cfg_owner.publish(Owner::NONE);
}

void Cfg_Arbiter::do_free() {
	//fixed priority
	if(command_mcc_cfg_request.read()) pending_owner = Owner::MCC;
	else if(command_tsa_cfg_request.read()) pending_owner = Owner::TSA;
	else pending_owner = Owner::NONE;

	if(command_mcc_cfg_request.read() && command_tsa_cfg_request.read()) {
		Debug::WARN("Cfg_Arbiter: MCC and TSA both requesting the config writer, MCC wins");
	}
}

void Cfg_Arbiter::do_grant() {
	current_owner = pending_owner;
	device = (current_owner == Owner::MCC) ? status_rpc.read().device_id : status_device.read();
	status_cfg_owner.publish(current_owner);
}

void Cfg_Arbiter::do_granted_entry() {
	Cfg_Write_Request_t request = {};
	request.start = true;
	request.device_id = device;
	to_writer.send(request);
}

void Cfg_Arbiter::do_granted() {
	forward_done(from_writer.value().done);
}

void Cfg_Arbiter::do_releasing_entry() {
	Cfg_Write_Request_t request = {};
	request.start = false;
	request.device_id = device;
	to_writer.send(request);
}
