/*
 * app_data_mover.cpp
 *
 *  Created on: Oct 24, 2025
 */

#include "app_data_mover.hpp"
#include "app_debug_if.hpp"

Data_Mover::Data_Mover(Config_Store& _store):
	store(_store),
	mover_state_IDLE({}, BIND_CALLBACK(this, do_idle), BIND_CALLBACK(this, do_latch), "IDLE"),
	mover_state_POSTING(BIND_CALLBACK(this, do_post), BIND_CALLBACK(this, do_posting), {}, "POSTING"),
	mover_state_RECEIVING({}, BIND_CALLBACK(this, do_receive), {}, "RECEIVING"),
	mover_state_DONE(BIND_CALLBACK(this, do_done), {}, {}, "DONE"),
	mover_esm(&mover_state_IDLE, "data mover")
{
	mover_state_IDLE.attach_state_transitions(mover_trans_FROM_IDLE);
	mover_state_POSTING.attach_state_transitions(mover_trans_FROM_POSTING);
	mover_state_RECEIVING.attach_state_transitions(mover_trans_FROM_RECEIVING);
	mover_state_DONE.attach_state_transitions(mover_trans_FROM_DONE);
}

void Data_Mover::tick() {
	mover_esm.RUN_ESM();
}

void Data_Mover::reset() {
	mover_esm.RESET_ESM();
	bus_master.publish({});
	status_mover_done.publish(false);
	status_mover_bus_error.publish(false);
	base_address = 0;
	source_address = 0;
	length = 0;
	beat_count = 0;
	accepted = false;
}

bool Data_Mover::command_accepted() {
	return bus_master.read().read && !bus_slave.read().waitrequest;
}

//================================= STATE FUNCTIONS =================================

void Data_Mover::do_idle() {
	//owner let go of start, finish the handshake
	if(!command_mover_start.read()) status_mover_done.publish(false);
}

void Data_Mover::do_latch() {
	auto rpc = status_rpc.read();
	base_address = static_cast<uint32_t>(rpc.device_id) * store.partition_words();
	source_address = status_offset.read();
	length = rpc.payload_length;
	beat_count = 0;
	accepted = false;
	status_mover_bus_error.publish(false);

	//never spill into the next device's partition
	if(length > store.partition_words()) {
		Debug::WARN("Data_Mover: payload of " + std::to_string(length) + " words clamped to the partition size");
		length = store.partition_words();
	}
	if(rpc.device_id >= store.partitions()) {
		Debug::WARN("Data_Mover: no partition for device " + std::to_string(rpc.device_id));
	}
}

void Data_Mover::do_post() {
	Avalon_Read_Master_t cmd = {};
	cmd.address = source_address;
	cmd.read = true;
	cmd.burstcount = static_cast<uint16_t>(length);
	bus_master.publish(cmd);
}

void Data_Mover::do_posting() {
	//hold the command until the slave takes it
	if(!command_accepted()) return;
	accepted = true;
	bus_master.publish({});
}

void Data_Mover::do_receive() {
	auto slave = bus_slave.read();
	if(!slave.readdatavalid) return;

	if(slave.response == Avalon_Response::OKAY) {
		store.request_write(Config_Store::Write_Port::DATA_MOVER, base_address + beat_count, slave.readdata);
	}
	else {
		//count it so we still finish, but keep the bad word out of the store
		if(!status_mover_bus_error.read()) {
			Debug::WARN("Data_Mover: error response on beat " + std::to_string(beat_count) +
						", code " + std::to_string(static_cast<uint32_t>(slave.response)));
		}
		status_mover_bus_error.publish(true);
	}
	beat_count++;
}

void Data_Mover::do_done() {
	bus_master.publish({});
	status_mover_done.publish(true);
}
