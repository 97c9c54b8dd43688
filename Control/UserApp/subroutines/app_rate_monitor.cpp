/*
 * app_rate_monitor.cpp
 *
 *  Created on: Oct 25, 2025
 */

#include "app_rate_monitor.hpp"
#include "app_debug_if.hpp"

Rate_Monitor::Rate_Monitor(const Controller_Config_t& _config, Result_Store& _results):
	n_devices(_config.n_mutrig),
	counter_base(_config.counter_base_word),
	bus_timeout_cycles(_config.bus_timeout_cycles),
	results(_results),
	sclr_wait(_config.sclr_delay_cycles),
	window_wait(_config.monitor_window() + _config.monitor_margin_cycles),
	monitor_state_IDLE({}, BIND_CALLBACK(this, do_idle), {}, "IDLE"),
	monitor_state_SCLR_COUNTERS(BIND_CALLBACK(this, do_sclr_begin), BIND_CALLBACK(this, do_sclr), {}, "SCLR_COUNTERS"),
	monitor_state_WAIT_FOR_COUNTERS(BIND_CALLBACK(this, do_window_begin), BIND_CALLBACK(this, do_window), {}, "WAIT_FOR_COUNTERS"),
	monitor_state_POSTING_CMD(BIND_CALLBACK(this, do_post), BIND_CALLBACK(this, do_posting), {}, "POSTING_CMD"),
	monitor_state_RECEIVING_READDATA({}, BIND_CALLBACK(this, do_receive), BIND_CALLBACK(this, do_next_device), "RECEIVING_READDATA"),
	monitor_state_FINISHING(BIND_CALLBACK(this, do_finish), {}, {}, "FINISHING"),
	monitor_esm(&monitor_state_IDLE, "rate monitor")
{
	monitor_state_IDLE.attach_state_transitions(monitor_trans_FROM_IDLE);
	monitor_state_SCLR_COUNTERS.attach_state_transitions(monitor_trans_FROM_SCLR);
	monitor_state_WAIT_FOR_COUNTERS.attach_state_transitions(monitor_trans_FROM_WAIT);
	monitor_state_POSTING_CMD.attach_state_transitions(monitor_trans_FROM_POSTING);
	monitor_state_RECEIVING_READDATA.attach_state_transitions(monitor_trans_FROM_RECEIVING);
	monitor_state_FINISHING.attach_state_transitions(monitor_trans_FROM_FINISHING);
}

void Rate_Monitor::tick() {
	monitor_esm.RUN_ESM();
}

void Rate_Monitor::reset() {
	monitor_esm.RESET_ESM();
	sclr_wait.reset();
	window_wait.reset();
	bus_master.publish({});
	status_sclr.publish(false);
	status_monitor_done.publish(false);
	status_monitor_timeout.publish(false);
	status_monitor_timeout_count.publish(0);
	tth = 0;
	device = 0;
	beat_count = 0;
	bus_idle_cycles = 0;
	sclr_pulsed = false;
	window_done = false;
	timed_out = false;
	posted = false;
}

bool Rate_Monitor::command_accepted() {
	return bus_master.read().read && !bus_slave.read().waitrequest;
}

void Rate_Monitor::count_idle_cycle() {
	bus_idle_cycles++;
	if(bus_idle_cycles < bus_timeout_cycles) return;

	//give up on this device and every one after it
	timed_out = true;
	status_monitor_timeout.publish(true);
	status_monitor_timeout_count.publish(status_monitor_timeout_count.read() + 1);
	Avalon_Read_Master_t flush = {};
	flush.flush = true;
	bus_master.publish(flush);
	Debug::WARN("Rate_Monitor: counter bus timed out on device " + std::to_string(device) +
				" at threshold " + std::to_string(tth) + ", flushing");
}

//================================= STATE FUNCTIONS =================================

void Rate_Monitor::do_idle() {
	//acknowledged, clear everything for the next step
	if(!command_monitor.read().start && status_monitor_done.read()) {
		status_monitor_done.publish(false);
		status_monitor_timeout.publish(false);
		device = 0;
		beat_count = 0;
		bus_idle_cycles = 0;
		timed_out = false;
	}
}

void Rate_Monitor::do_sclr_begin() {
	tth = command_monitor.read().tth;
	device = 0;
	beat_count = 0;
	bus_idle_cycles = 0;
	sclr_pulsed = false;
	window_done = false;
	timed_out = false;
	posted = false;
	sclr_wait.arm();
}

void Rate_Monitor::do_sclr() {
	if(sclr_pulsed) return;
	if(!sclr_wait.tick()) return;
	status_sclr.publish(true);
	sclr_pulsed = true;
}

void Rate_Monitor::do_window_begin() {
	//one edge of counter clear is enough
	status_sclr.publish(false);
	window_wait.arm();
}

void Rate_Monitor::do_window() {
	window_done = window_wait.tick();
}

void Rate_Monitor::do_post() {
	beat_count = 0;
	posted = false;
	Avalon_Read_Master_t cmd = {};
	cmd.address = counter_base + device * Controller_Config_t::CHANNELS_PER_DEVICE;
	cmd.read = true;
	cmd.burstcount = Controller_Config_t::CHANNELS_PER_DEVICE;
	bus_master.publish(cmd);
}

void Rate_Monitor::do_posting() {
	if(command_accepted()) {
		posted = true;
		bus_idle_cycles = 0;
		bus_master.publish({});
		return;
	}
	count_idle_cycle();
}

void Rate_Monitor::do_receive() {
	auto slave = bus_slave.read();
	if(!slave.readdatavalid) {
		count_idle_cycle();
		return;
	}

	bus_idle_cycles = 0;
	if(slave.response != Avalon_Response::OKAY) {
		Debug::WARN("Rate_Monitor: error response from the counters of device " + std::to_string(device));
	}
	results.write(tth, device, beat_count, slave.response == Avalon_Response::OKAY ? slave.readdata : 0);
	beat_count++;
}

void Rate_Monitor::do_next_device() {
	if(beat_count >= Controller_Config_t::CHANNELS_PER_DEVICE) device++;
}

void Rate_Monitor::do_finish() {
	//drops flush if we got here through a timeout
	bus_master.publish({});
	status_monitor_done.publish(true);
}
