/*
 * app_avalon_slave_model.cpp
 *
 *  Created on: Oct 29, 2025
 */

#include "app_avalon_slave_model.hpp"
#include "app_debug_if.hpp"

Avalon_Slave_Model::Avalon_Slave_Model(const char* _name):
	model_name(_name)
{}

void Avalon_Slave_Model::tick() {
	on_tick();

	auto cmd = bus_master.read();
	Avalon_Read_Slave_t out = {};	//waitrequest high, nothing valid

	//master gave up on the burst
	if(cmd.flush) {
		if(burst_active || read_pending) flush_count++;
		burst_active = false;
		read_pending = false;
		bus_slave.publish(out);
		return;
	}

	if(burst_active) {
		if(wait_left > 0) wait_left--;
		if(wait_left == 0 && beats_left > 0) {
			Avalon_Response response = Avalon_Response::OKAY;
			uint32_t data = fetch(burst_address, response);
			if(error_armed && beat_index == error_beat) {
				response = error_response;
				data = 0;
			}

			out.readdatavalid = true;
			out.readdata = data;
			out.response = response;

			burst_address++;
			beat_index++;
			beat_count++;
			beats_left--;
			wait_left = beat_gap + 1;
		}
		if(beats_left == 0) burst_active = false;
	}
	else if(cmd.read && !stall_forever) {
		//count the stall from the first edge we see this read
		if(!read_pending) {
			read_pending = true;
			stall_left = stall_cycles;
		}

		if(stall_left > 0) stall_left--;
		else {
			out.waitrequest = false;
			read_pending = false;
			burst_active = cmd.burstcount > 0;
			burst_address = cmd.address;
			beats_left = cmd.burstcount;
			beat_index = 0;
			wait_left = latency;
			last_cmd = cmd;
			accepted_count++;
			on_accept(cmd);
		}
	}
	else if(!cmd.read) read_pending = false;

	bus_slave.publish(out);
}

void Avalon_Slave_Model::reset() {
	burst_active = false;
	read_pending = false;
	beats_left = 0;
	beat_index = 0;
	wait_left = 0;
	stall_left = 0;
	last_cmd = {};
	accepted_count = 0;
	beat_count = 0;
	flush_count = 0;
	bus_slave.publish({});
}
