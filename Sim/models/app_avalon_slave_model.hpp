/*
 * app_avalon_slave_model.hpp
 *
 *  Created on: Oct 29, 2025
 *
 *  Behavioural burst-read slave, control domain
 *  Ticks AFTER the controller on every control edge:
 *  	- `waitrequest` stays high until a presented read is taken; it's low for exactly the edge that takes it
 *  	- beats start `latency` edges after the command is taken, one per edge
 *  	- `flush` from the master abandons whatever burst is running
 *
 *  The knobs (stall, latency, error injection) are there to push the controller into its corner cases.
 *  Implementations only supply the words.
 */

#pragma once

#include "app_proctypes.hpp"
#include "app_threading.hpp"
#include "app_avalon_bus.hpp"

class Avalon_Slave_Model {
public:
	Avalon_Slave_Model(const char* _name);
	virtual ~Avalon_Slave_Model() = default;

	//delete copy constructor and assignment operator
	Avalon_Slave_Model(const Avalon_Slave_Model& other) = delete;
	void operator=(const Avalon_Slave_Model& other) = delete;

	void tick();
	void reset();

	LINK_FUNC(bus_master);
	SUBSCRIBE_FUNC(bus_slave);

	//====================== FAULT/TIMING KNOBS ======================
	void set_latency(uint32_t _latency) { latency = _latency ? _latency : 1; }	//at least one edge
	void set_stall_cycles(uint32_t _stall) { stall_cycles = _stall; }		//edges a presented read waits before it's taken
	void set_stall_forever(bool _stall) { stall_forever = _stall; }			//never take anything
	void set_beat_gap(uint32_t _gap) { beat_gap = _gap; }					//idle edges between beats

	//answer beat `beat` of every burst with `response` (and no data)
	void inject_error(uint32_t beat, Avalon_Response response) { error_beat = beat; error_response = response; error_armed = true; }
	void clear_error() { error_armed = false; }

	//====================== STATISTICS ======================
	uint32_t commands_accepted() const { return accepted_count; }
	uint32_t beats_sent() const { return beat_count; }
	uint32_t flushes_seen() const { return flush_count; }
	bool bursting() const { return burst_active; }
	Avalon_Read_Master_t last_command() const { return last_cmd; }

protected:
	//word at `address`; set `response` to something other than OKAY for a failed read
	virtual uint32_t fetch(uint32_t address, Avalon_Response& response) = 0;

	//a command just got taken, i.e. snapshot whatever the burst should return
	virtual void on_accept(const Avalon_Read_Master_t& cmd) { (void)cmd; }

	//called once per edge before anything else happens, bus or not
	virtual void on_tick() {}

	const char* model_name;

private:
	uint32_t latency = 1;
	uint32_t stall_cycles = 0;
	uint32_t beat_gap = 0;
	bool stall_forever = false;
	bool error_armed = false;
	uint32_t error_beat = 0;
	Avalon_Response error_response = Avalon_Response::SLVERR;

	//burst in progress
	bool burst_active = false;
	uint32_t burst_address = 0;
	uint32_t beats_left = 0;
	uint32_t beat_index = 0;
	uint32_t wait_left = 0;			//latency, then beat gaps
	bool read_pending = false;		//master is presenting a read we haven't taken
	uint32_t stall_left = 0;
	Avalon_Read_Master_t last_cmd = {};

	uint32_t accepted_count = 0;
	uint32_t beat_count = 0;
	uint32_t flush_count = 0;

	Sub_Var<Avalon_Read_Master_t> bus_master;
	PERSISTENT((Pub_Var<Avalon_Read_Slave_t>), bus_slave);
};
