/*
 * app_config_writer.cpp
 *
 *  Created on: Oct 26, 2025
 */

#include "app_config_writer.hpp"
#include "app_debug_if.hpp"

Config_Writer::Config_Writer(	const Controller_Config_t& _config,
								const Config_Store& _store,
								Cross_Domain_Channel<Cfg_Write_Request_t>& _from_control,
								Cross_Domain_Channel<Cfg_Write_Response_t>& _to_control):
	n_devices(_config.n_mutrig),
	rounded_bits(_config.cfg_length_rounded_bits()),
	partition_bits(_config.partition_bits()),
	store(_store),
	from_control(_from_control),
	to_control(_to_control),
	settle_wait(_config.spi_settle_cycles),
	writer_state_IDLE({}, BIND_CALLBACK(this, do_idle), BIND_CALLBACK(this, do_accept), "IDLE"),
	writer_state_INIT(BIND_CALLBACK(this, do_init), {}, {}, "INIT"),
	writer_state_STARTING(BIND_CALLBACK(this, do_settle_begin), BIND_CALLBACK(this, do_settle), BIND_CALLBACK(this, do_first_bit), "STARTING"),
	writer_state_WRITING(BIND_CALLBACK(this, do_write_begin), BIND_CALLBACK(this, do_write), {}, "WRITING"),
	writer_state_FINISHING(BIND_CALLBACK(this, do_finish), {}, {}, "FINISHING"),
	writer_state_PAUSE({}, BIND_CALLBACK(this, do_pause), {}, "PAUSE"),
	writer_state_PAUSING(BIND_CALLBACK(this, do_settle_begin), BIND_CALLBACK(this, do_settle), {}, "PAUSING"),
	writer_state_VALIDATING(BIND_CALLBACK(this, do_validate), {}, {}, "VALIDATING"),
	writer_esm(&writer_state_IDLE, "config writer")
{
	writer_state_IDLE.attach_state_transitions(writer_trans_FROM_IDLE);
	writer_state_INIT.attach_state_transitions(writer_trans_FROM_INIT);
	writer_state_STARTING.attach_state_transitions(writer_trans_FROM_STARTING);
	writer_state_WRITING.attach_state_transitions(writer_trans_FROM_WRITING);
	writer_state_FINISHING.attach_state_transitions(writer_trans_FROM_FINISHING);
	writer_state_PAUSE.attach_state_transitions(writer_trans_FROM_PAUSE);
	writer_state_PAUSING.attach_state_transitions(writer_trans_FROM_PAUSING);
	writer_state_VALIDATING.attach_state_transitions(writer_trans_FROM_VALIDATING);
}

void Config_Writer::tick() {
	from_control.sync();
	writer_esm.RUN_ESM();
	spi_pins.publish(pins);
}

void Config_Writer::reset() {
	writer_esm.RESET_ESM();
	settle_wait.reset();
	device = 0;
	pass = 0;
	bit_counter = 0;
	frame_count = 0;
	done = false;
	error = false;
	error_info = Cfg_Write_Response_t::ERR_NONE;
	settled = false;
	pins = {};
	spi_pins.publish(pins);
}

bool Config_Writer::frame_bit(uint32_t i) const {
	return store.read_bit(static_cast<uint32_t>(device) * partition_bits + rounded_bits - 1 - i);
}

void Config_Writer::respond() {
	Cfg_Write_Response_t response = {};
	response.done = done;
	response.error = error;
	response.error_info = error_info;
	to_control.send(response);
}

//================================= STATE FUNCTIONS =================================

void Config_Writer::do_idle() {
	//requester dropped start, finish the handshake
	if(!from_control.value().start && done) {
		done = false;
		error = false;
		error_info = Cfg_Write_Response_t::ERR_NONE;
		respond();
	}
}

void Config_Writer::do_accept() {
	device = from_control.value().device_id;
	pass = 0;
}

void Config_Writer::do_init() {
	error = false;
	error_info = Cfg_Write_Response_t::ERR_NONE;

	//no chip select for this one; report instead of writing
	if(device >= n_devices) {
		error = true;
		error_info = Cfg_Write_Response_t::ERR_BAD_DEVICE;
		Debug::ERROR("Config_Writer: no chip select for device " + std::to_string(device));
		return;
	}

	pins.cs_active = true;
	pins.cs_device = device;
	pins.sclk = false;
	pins.mosi = false;
	bit_counter = 0;
}

void Config_Writer::do_settle_begin() {
	settled = false;
	settle_wait.arm();
}

void Config_Writer::do_settle() {
	settled = settle_wait.tick();
}

void Config_Writer::do_first_bit() {
	//data is up an edge before the first rising sclk
	pins.mosi = frame_bit(0);
}

void Config_Writer::do_write_begin() {
	bit_counter = 0;
}

void Config_Writer::do_write() {
	if(!pins.sclk) {
		//low phase: rising edge, the chip takes the bit
		pins.sclk = true;
		bit_counter++;
	}
	else {
		//high phase: falling edge, put up the next bit
		pins.sclk = false;
		if(bit_counter < rounded_bits) pins.mosi = frame_bit(bit_counter);
	}
}

void Config_Writer::do_finish() {
	pins.sclk = false;
	pins.mosi = false;
	pins.cs_active = false;
	pass++;
	frame_count++;
}

void Config_Writer::do_pause() {
	bit_counter = 0;
}

void Config_Writer::do_validate() {
	//readback comparison not implemented; the frame is reported as written
	done = true;
	respond();
	if(!error && Debug::tracing()) Debug::TRACE("Config_Writer: device " + std::to_string(device) + " written twice");
}
