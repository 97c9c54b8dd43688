/*
 * app_timed_wait.hpp
 *
 *  Created on: Oct 24, 2025
 *
 *  Cycle-counted wait
 *  Settle windows, debounce delays, accumulation windows all use one of these
 *  Duration is a parameter so tests can shrink the long windows down to a handful of cycles
 */

#pragma once

#include "app_proctypes.hpp"

class Timed_Wait {
public:
	explicit Timed_Wait(uint32_t _duration = 1): duration_cycles(_duration) {}

	//start counting from zero
	void arm() { elapsed_cycles = 0; armed = true; }

	//count one cycle; true on the `duration`-th tick after arming and every tick after that
	bool tick() {
		if(!armed) return false;
		if(elapsed_cycles < duration_cycles) elapsed_cycles++;
		return elapsed_cycles >= duration_cycles;
	}

	//stop counting altogether
	void reset() { elapsed_cycles = 0; armed = false; }

	void set_duration(uint32_t _duration) { duration_cycles = _duration; }

	uint32_t duration() const { return duration_cycles; }
	uint32_t elapsed() const { return elapsed_cycles; }
	bool expired() const { return armed && elapsed_cycles >= duration_cycles; }

private:
	uint32_t duration_cycles;
	uint32_t elapsed_cycles = 0;
	bool armed = false;
};
