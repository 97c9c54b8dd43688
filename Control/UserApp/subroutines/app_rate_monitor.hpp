/*
 * app_rate_monitor.hpp
 *
 *  Created on: Oct 25, 2025
 *
 *  Takes one rate snapshot of every channel of every device for the current threshold
 *  	SCLR_COUNTERS --> wait a few cycles, pulse counter clear for one cycle
 *  	WAIT_FOR_COUNTERS --> let the counters accumulate (window + margin)
 *  	POSTING_CMD/RECEIVING_READDATA --> one 32-word burst per device, beats go into the result store
 *  	FINISHING --> done, held until the requester lets go
 *
 *  Bus timeout:
 *  	the idle counter runs on every edge spent waiting for the command to be taken or for a beat
 *  	at `bus_timeout_cycles` the rest of the read is abandoned, the timeout flag latches,
 *  	flush goes high for exactly one edge and we finish anyway
 */

#pragma once

#include "app_proctypes.hpp"
#include "app_threading.hpp"
#include "app_state_machine_library.hpp"
#include "app_timed_wait.hpp"
#include "app_avalon_bus.hpp"
#include "app_controller_config.hpp"
#include "app_result_store.hpp"
#include "app_routine_request.hpp"

class Rate_Monitor {
public:
	Rate_Monitor(const Controller_Config_t& _config, Result_Store& _results);

	//delete copy constructor and assignment operator
	Rate_Monitor(const Rate_Monitor& other) = delete;
	void operator=(const Rate_Monitor& other) = delete;

	void tick();
	void reset();

	LINK_FUNC(command_monitor);
	LINK_FUNC(bus_slave);
	SUBSCRIBE_FUNC(bus_master);
	SUBSCRIBE_FUNC(status_sclr);
	SUBSCRIBE_FUNC(status_monitor_done);
	SUBSCRIBE_FUNC(status_monitor_timeout);
	SUBSCRIBE_FUNC(status_monitor_timeout_count);

	bool idle() const { return monitor_esm.in(monitor_state_IDLE); }
	bool reading() const { return monitor_esm.in(monitor_state_POSTING_CMD) || monitor_esm.in(monitor_state_RECEIVING_READDATA); }
	uint32_t idle_cycles() const { return bus_idle_cycles; }
	uint32_t current_device() const { return device; }

private:
	const uint32_t n_devices;
	const uint32_t counter_base;
	const uint32_t bus_timeout_cycles;
	Result_Store& results;

	Timed_Wait sclr_wait;
	Timed_Wait window_wait;

	//working registers
	uint8_t tth = 0;
	uint32_t device = 0;
	uint32_t beat_count = 0;
	uint32_t bus_idle_cycles = 0;
	bool sclr_pulsed = false;
	bool window_done = false;
	bool timed_out = false;

	bool command_accepted();
	void count_idle_cycle();	//and abort once we hit the limit

	//##### STATE FUNCTIONS #####
	void do_idle();
	void do_sclr_begin();
	void do_sclr();
	void do_window_begin();
	void do_window();
	void do_post();
	void do_posting();
	void do_receive();
	void do_next_device();
	void do_finish();

	bool trans_IDLE_to_SCLR()				{ auto req = command_monitor.read(); return req.start && !status_monitor_done.read(); }
	bool trans_SCLR_to_WAIT()				{ return sclr_pulsed; }
	bool trans_WAIT_to_POSTING()			{ return window_done; }
	bool trans_READ_to_FINISHING_timeout()	{ return timed_out; }
	bool trans_POSTING_to_RECEIVING()		{ return posted; }
	bool trans_RECEIVING_to_POSTING()		{ return beat_count >= Controller_Config_t::CHANNELS_PER_DEVICE && device + 1 < n_devices; }
	bool trans_RECEIVING_to_FINISHING()		{ return beat_count >= Controller_Config_t::CHANNELS_PER_DEVICE && device + 1 >= n_devices; }
	bool trans_FINISHING_to_IDLE()			{ return !command_monitor.read().start; }

	bool posted = false;	//command taken by the slave

	ESM_State monitor_state_IDLE;
	ESM_State monitor_state_SCLR_COUNTERS;
	ESM_State monitor_state_WAIT_FOR_COUNTERS;
	ESM_State monitor_state_POSTING_CMD;
	ESM_State monitor_state_RECEIVING_READDATA;
	ESM_State monitor_state_FINISHING;

	ESM_Transition monitor_trans_FROM_IDLE[1] = {	{&monitor_state_SCLR_COUNTERS, {BIND_CALLBACK(this, trans_IDLE_to_SCLR)}	}	};
	ESM_Transition monitor_trans_FROM_SCLR[1] = {	{&monitor_state_WAIT_FOR_COUNTERS, {BIND_CALLBACK(this, trans_SCLR_to_WAIT)}	}	};
	ESM_Transition monitor_trans_FROM_WAIT[1] = {	{&monitor_state_POSTING_CMD, {BIND_CALLBACK(this, trans_WAIT_to_POSTING)}	}	};
	ESM_Transition monitor_trans_FROM_POSTING[2] = {	{&monitor_state_FINISHING, {BIND_CALLBACK(this, trans_READ_to_FINISHING_timeout)}	},
														{&monitor_state_RECEIVING_READDATA, {BIND_CALLBACK(this, trans_POSTING_to_RECEIVING)}	}	};
	ESM_Transition monitor_trans_FROM_RECEIVING[3] = {	{&monitor_state_FINISHING, {BIND_CALLBACK(this, trans_READ_to_FINISHING_timeout)}	},
														{&monitor_state_POSTING_CMD, {BIND_CALLBACK(this, trans_RECEIVING_to_POSTING)}	},
														{&monitor_state_FINISHING, {BIND_CALLBACK(this, trans_RECEIVING_to_FINISHING)}	}	};
	ESM_Transition monitor_trans_FROM_FINISHING[1] = {	{&monitor_state_IDLE, {BIND_CALLBACK(this, trans_FINISHING_to_IDLE)}	}	};

	Extended_State_Machine monitor_esm;

	//###### STATE VARIABLES #######
	Sub_Var<Monitor_Request_t> command_monitor;
	Sub_Var<Avalon_Read_Slave_t> bus_slave;
	PERSISTENT((Pub_Var<Avalon_Read_Master_t>), bus_master);
	PERSISTENT((Pub_Var<bool>), status_sclr);
	PERSISTENT((Pub_Var<bool>), status_monitor_done);
	PERSISTENT((Pub_Var<bool>), status_monitor_timeout);
	PERSISTENT((Pub_Var<uint32_t>), status_monitor_timeout_count);
};
