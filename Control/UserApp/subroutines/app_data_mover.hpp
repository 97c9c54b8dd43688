/*
 * app_data_mover.hpp
 *
 *  Created on: Oct 24, 2025
 *
 *  Bulk copy: staging buffer --> one device's configuration partition
 *  	- one burst read of `payload_length` words starting at the offset register
 *  	- every beat lands at device*partition_words + beat index (and in the mirror)
 *  	- beats with an error response still count, but don't get written; `bus_error` latches
 *  No timeout; a staging buffer that never answers stalls the mover.
 */

#pragma once

#include "app_proctypes.hpp"
#include "app_threading.hpp"
#include "app_state_machine_library.hpp"
#include "app_avalon_bus.hpp"
#include "app_config_store.hpp"
#include "app_routine_request.hpp"

class Data_Mover {
public:
	Data_Mover(Config_Store& _store);

	//delete copy constructor and assignment operator
	Data_Mover(const Data_Mover& other) = delete;
	void operator=(const Data_Mover& other) = delete;

	//run one control edge
	void tick();

	//back to IDLE with every output at its reset value
	void reset();

	//state variable hooks
	LINK_FUNC(command_mover_start);
	LINK_FUNC(status_rpc);
	LINK_FUNC(status_offset);
	LINK_FUNC(bus_slave);
	SUBSCRIBE_FUNC(bus_master);
	SUBSCRIBE_FUNC(status_mover_done);
	SUBSCRIBE_FUNC(status_mover_bus_error);

	//for tests and status
	bool idle() const { return mover_esm.in(mover_state_IDLE); }
	uint32_t beats_received() const { return beat_count; }

private:
	Config_Store& store;

	//latched on the way out of IDLE
	uint32_t base_address = 0;		//first word of the partition
	uint32_t source_address = 0;	//staging buffer word address
	uint32_t length = 0;
	uint32_t beat_count = 0;

	//did the slave take our command on the last edge?
	bool command_accepted();

	//##### STATE FUNCTIONS #####
	void do_idle();			//drops done once the owner lets go of start
	void do_latch();		//IDLE exit: sample device/length/offset
	void do_post();			//POSTING entry: present the burst command
	void do_posting();		//drops read once accepted
	void do_receive();		//RECEIVING: collect beats
	void do_done();			//DONE entry: report

	bool trans_IDLE_to_POSTING()		{ return command_mover_start.read() && !status_mover_done.read() && length_requested() > 0; }
	bool trans_IDLE_to_DONE()			{ return command_mover_start.read() && !status_mover_done.read() && length_requested() == 0; }
	bool trans_POSTING_to_RECEIVING()	{ return accepted; }
	bool trans_RECEIVING_to_DONE()		{ return beat_count >= length; }
	bool trans_DONE_to_IDLE()			{ return !command_mover_start.read(); }

	uint32_t length_requested() { return status_rpc.read().payload_length; }
	bool accepted = false;

	ESM_State mover_state_IDLE;
	ESM_State mover_state_POSTING;
	ESM_State mover_state_RECEIVING;
	ESM_State mover_state_DONE;

	ESM_Transition mover_trans_FROM_IDLE[2] = {	{&mover_state_POSTING, {BIND_CALLBACK(this, trans_IDLE_to_POSTING)}	},
												{&mover_state_DONE, {BIND_CALLBACK(this, trans_IDLE_to_DONE)}		}	};
	ESM_Transition mover_trans_FROM_POSTING[1] = {	{&mover_state_RECEIVING, {BIND_CALLBACK(this, trans_POSTING_to_RECEIVING)}	}	};
	ESM_Transition mover_trans_FROM_RECEIVING[1] = {	{&mover_state_DONE, {BIND_CALLBACK(this, trans_RECEIVING_to_DONE)}	}	};
	ESM_Transition mover_trans_FROM_DONE[1] = {	{&mover_state_IDLE, {BIND_CALLBACK(this, trans_DONE_to_IDLE)}	}	};

	Extended_State_Machine mover_esm;

	//###### STATE VARIABLES #######
	Sub_Var<bool> command_mover_start;
	Sub_Var<Routine_Request_t> status_rpc;
	Sub_Var<uint32_t> status_offset;
	Sub_Var<Avalon_Read_Slave_t> bus_slave;
	PERSISTENT((Pub_Var<Avalon_Read_Master_t>), bus_master);
	PERSISTENT((Pub_Var<bool>), status_mover_done);
	PERSISTENT((Pub_Var<bool>), status_mover_bus_error);
};
