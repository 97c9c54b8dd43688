/*
 * app_clock_domain.hpp
 *
 *  Created on: Oct 23, 2025
 *
 *  Simulated clock domains
 *  	- every block of the controller attaches a tick task to the domain it's clocked from
 *  	- the clock tree always advances to the earliest pending edge across both domains
 *  	- coincident edges run the control domain first
 */

#pragma once

#include "app_proctypes.hpp"
#include "app_utils.hpp"
#include "app_vector.hpp"

class Clock_Domain {
public:
	//plenty for the control domain; it hosts the most blocks
	static constexpr size_t MAX_TASKS = 32;

	//name only shows up in debug messages
	Clock_Domain(const char* _name, uint64_t _frequency_hz);

	//delete copy constructor and assignment operator
	Clock_Domain(const Clock_Domain& other) = delete;
	void operator=(const Clock_Domain& other) = delete;

	//tasks run in the order they were attached, once per rising edge
	//returns false if the task table is full
	bool attach(Callback_Function<> task);

	//run every attached task, then schedule the next edge
	void tick();

	//go back to time zero; attached tasks are kept
	void reset();

	//change the frequency; takes effect from the next edge
	void set_frequency(uint64_t _frequency_hz);

	//accessors
	uint64_t frequency_hz() const { return frequency; }
	uint64_t period_ps() const { return period; }
	uint64_t next_edge_ps() const { return next_edge; }
	uint64_t cycles() const { return cycle_count; }
	const char* name() const { return domain_name; }

private:
	const char* domain_name;
	uint64_t frequency;
	uint64_t period;			//rounded to the nearest picosecond
	uint64_t next_edge;
	uint64_t cycle_count = 0;
	App_Vector<Callback_Function<>, MAX_TASKS> tasks;
};

class Clock_Tree {
public:
	//control domain wins ties
	Clock_Tree(Clock_Domain& _control, Clock_Domain& _serial);

	//delete copy constructor and assignment operator
	Clock_Tree(const Clock_Tree& other) = delete;
	void operator=(const Clock_Tree& other) = delete;

	//advance to the next edge of either domain and run it
	void step();

	//run until the control domain has seen `n` more edges
	void run_control_cycles(uint64_t n);

	//simulated time of the most recent edge
	uint64_t now_ps() const { return now; }

	void reset();

private:
	Clock_Domain& control;
	Clock_Domain& serial;
	uint64_t now = 0;
};
