/*
 * app_mutrig_controller.cpp
 *
 *  Created on: Oct 28, 2025
 */

#include "app_mutrig_controller.hpp"
#include "app_debug_if.hpp"

//storage gets sized off a clipped device count; `init()` refuses anything out of range anyway
MuTRiG_Controller::MuTRiG_Controller(const Controller_Config_t& _config):
	config(_config),
	layout(_config.layout()),
	store(clip<uint32_t>(_config.n_mutrig, 1, Controller_Config_t::N_MUTRIG_MAX), _config.partition_words()),
	results(clip<uint32_t>(_config.n_mutrig, 1, Controller_Config_t::N_MUTRIG_MAX)),
	to_writer("cfg_request", _config.sync_stages),
	to_control("cfg_response", _config.sync_stages),
	csr(),
	interpreter(config),
	mcc(),
	tsa(config),
	mover(store),
	modifier(store, layout),
	monitor(config, results),
	arbiter(to_writer, to_control),
	writer(config, store, to_writer, to_control)
{}

Controller_Config_t::Status MuTRiG_Controller::init() {
	auto status = config.validate();
	if(status != Controller_Config_t::Status::OK) {
		Debug::ERROR(std::string("MuTRiG Controller: bad configuration, ") + Controller_Config_t::status_str(status));
		return status;
	}

	Debug::set_level(config.debug_level);

	//#### HOST REGISTERS ####
	csr.link_status_busy(interpreter.subscribe_status_busy());
	csr.link_status_command_word(interpreter.subscribe_status_command_word());
	csr.link_status_progress(tsa.subscribe_status_progress());

	//#### INTERPRETER ####
	interpreter.link_command_csr_command(csr.subscribe_command_csr_command());
	interpreter.link_status_mcc_done(mcc.subscribe_status_mcc_done());
	interpreter.link_status_tsa_done(tsa.subscribe_status_tsa_done());
	interpreter.link_RC_command_device_increment(tsa.subscribe_RC_command_device_increment());
	interpreter.link_RC_command_device_reset(tsa.subscribe_RC_command_device_reset());

	//#### MCC ####
	mcc.link_status_rpc(interpreter.subscribe_status_rpc());
	mcc.link_status_mover_done(mover.subscribe_status_mover_done());
	mcc.link_status_cfg_done(arbiter.subscribe_status_mcc_cfg_done());

	//#### TSA ####
	tsa.link_status_rpc(interpreter.subscribe_status_rpc());
	tsa.link_status_device(interpreter.subscribe_status_device());
	tsa.link_status_modifier_done(modifier.subscribe_status_modifier_done());
	tsa.link_status_cfg_done(arbiter.subscribe_status_tsa_cfg_done());
	tsa.link_status_monitor_done(monitor.subscribe_status_monitor_done());

	//#### SUBROUTINES ####
	mover.link_command_mover_start(mcc.subscribe_command_mover_start());
	mover.link_status_rpc(interpreter.subscribe_status_rpc());
	mover.link_status_offset(csr.subscribe_status_offset());

	modifier.link_command_modifier_start(tsa.subscribe_command_modifier_start());
	modifier.link_status_device(interpreter.subscribe_status_device());
	modifier.link_status_tth(tsa.subscribe_status_tth());

	monitor.link_command_monitor(tsa.subscribe_command_monitor());

	//#### CONFIG WRITER ARBITRATION ####
	arbiter.link_command_mcc_cfg_request(mcc.subscribe_command_cfg_request());
	arbiter.link_command_tsa_cfg_request(tsa.subscribe_command_cfg_request());
	arbiter.link_status_rpc(interpreter.subscribe_status_rpc());
	arbiter.link_status_device(interpreter.subscribe_status_device());

	Debug::PRINT("MuTRiG Controller: " + std::to_string(config.n_mutrig) + " devices, "
					+ std::to_string(config.cfg_length_bits()) + " configuration bits each");
	initialized = true;
	return status;
}

void MuTRiG_Controller::tick_control() {
	if(!initialized) return;

	interpreter.tick();
	mcc.tick();
	tsa.tick();
	mover.tick();
	modifier.tick();
	monitor.tick();
	arbiter.tick();

	//writes posted this edge land now
	store.commit();
}

void MuTRiG_Controller::tick_serial() {
	if(!initialized) return;
	writer.tick();
}

void MuTRiG_Controller::reset() {
	//channels first so nothing stale crosses over once the blocks restart
	to_writer.reset();
	to_control.reset();

	csr.reset();
	interpreter.reset();
	mcc.reset();
	tsa.reset();
	mover.reset();
	modifier.reset();
	monitor.reset();
	arbiter.reset();
	writer.reset();
}

bool MuTRiG_Controller::all_idle() const {
	return	interpreter.idle() && mcc.idle() && tsa.idle() && mover.idle() &&
			modifier.idle() && monitor.idle() && arbiter.idle() && writer.idle();
}
