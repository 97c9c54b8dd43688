/*
 * app_clock_domain.cpp
 *
 *  Created on: Oct 23, 2025
 */

#include "app_clock_domain.hpp"
#include "app_debug_if.hpp"

//======================================= CLOCK DOMAIN =======================================

//convert the frequency into an integer period
//rounding to the nearest picosecond keeps both standard clocks exact (6400ps and 25000ps)
static uint64_t period_from_frequency(uint64_t frequency_hz) {
	if(frequency_hz == 0) return 0;
	return (1'000'000'000'000ull + frequency_hz / 2) / frequency_hz;
}

Clock_Domain::Clock_Domain(const char* _name, uint64_t _frequency_hz):
	domain_name(_name),
	frequency(_frequency_hz),
	period(period_from_frequency(_frequency_hz)),
	next_edge(period)	//first edge one period after time zero
{
	if(period == 0) {
		Debug::ERROR(std::string("Clock_Domain: ") + domain_name + " has no valid period, forcing 1ps");
		period = 1;
		next_edge = 1;
	}
}

bool Clock_Domain::attach(Callback_Function<> task) {
	return tasks.push_back(task);
}

void Clock_Domain::tick() {
	for(auto& task : tasks) task();
	cycle_count++;
	next_edge += period;
}

void Clock_Domain::reset() {
	cycle_count = 0;
	next_edge = period;
}

void Clock_Domain::set_frequency(uint64_t _frequency_hz) {
	uint64_t new_period = period_from_frequency(_frequency_hz);
	if(new_period == 0) {
		Debug::WARN(std::string("Clock_Domain: ignoring zero frequency for ") + domain_name);
		return;
	}

	//the pending edge stays where it is, everything after it uses the new period
	frequency = _frequency_hz;
	period = new_period;
}

//======================================= CLOCK TREE =======================================

Clock_Tree::Clock_Tree(Clock_Domain& _control, Clock_Domain& _serial):
	control(_control), serial(_serial)
{}

void Clock_Tree::step() {
	//control domain on ties
	if(control.next_edge_ps() <= serial.next_edge_ps()) {
		now = control.next_edge_ps();
		control.tick();
	}
	else {
		now = serial.next_edge_ps();
		serial.tick();
	}
}

void Clock_Tree::run_control_cycles(uint64_t n) {
	uint64_t target = control.cycles() + n;
	while(control.cycles() < target) step();
}

void Clock_Tree::reset() {
	control.reset();
	serial.reset();
	now = 0;
}
