/*
 * app_interpreter.cpp
 *
 *  Created on: Oct 27, 2025
 */

#include "app_interpreter.hpp"
#include "app_debug_if.hpp"

Instruction_Interpreter::Instruction_Interpreter(const Controller_Config_t& _config):
	config(_config),
	interpreter_state_IDLE(BIND_CALLBACK(this, do_idle_entry), BIND_CALLBACK(this, do_idle), BIND_CALLBACK(this, do_dispatch), "IDLE"),
	interpreter_state_RUNNING({}, BIND_CALLBACK(this, do_running), {}, "RUNNING"),
	interpreter_state_ACKNOWLEDGE(BIND_CALLBACK(this, do_acknowledge_entry), BIND_CALLBACK(this, do_acknowledge), BIND_CALLBACK(this, do_release), "ACKNOWLEDGE"),
	interpreter_esm(&interpreter_state_IDLE, "interpreter")
{
	interpreter_state_IDLE.attach_state_transitions(interpreter_trans_FROM_IDLE);
	interpreter_state_RUNNING.attach_state_transitions(interpreter_trans_FROM_RUNNING);
	interpreter_state_ACKNOWLEDGE.attach_state_transitions(interpreter_trans_FROM_ACKNOWLEDGE);
}

void Instruction_Interpreter::tick() {
	interpreter_esm.RUN_ESM();
}

void Instruction_Interpreter::reset() {
	interpreter_esm.RESET_ESM();
	pending = {};
	pending_word = 0;
	accepted = false;
	discarded = 0;
	command_csr_command.refresh();
	status_rpc.publish({});
	status_device.publish(0);
	status_busy.publish(false);
	status_command_word.publish(0);
}

Instruction_Interpreter::Command_Fields_t Instruction_Interpreter::decode(uint32_t command_word) {
	//register image, little endian like the bus
	std::array<uint8_t, 4> reg = {};
	memcpy(reg.data(), &command_word, sizeof(command_word));
	if(PROCESSOR_IS_BIG_ENDIAN) std::reverse(reg.begin(), reg.end());

	Regmap_Field code_field(2, 4, 12, false, reg);
	Regmap_Field device_field(2, 0, 4, false, reg);
	Regmap_Field length_field(0, 0, 16, false, reg);

	Command_Fields_t fields = {};
	fields.code = static_cast<uint16_t>(code_field.read());
	fields.device_id = static_cast<uint8_t>(device_field.read());
	fields.payload_length = static_cast<uint16_t>(length_field.read());
	return fields;
}

bool Instruction_Interpreter::accept_command(uint32_t command_word) {
	auto fields = decode(command_word);
	auto code = static_cast<Command_Code>(fields.code);

	switch(code) {
	case Command_Code::CONFIGURE:
	case Command_Code::SCAN_ONE:
	case Command_Code::SCAN_ALL:
		break;
	default:
		Debug::WARN("Interpreter: unknown command code " + std::to_string(fields.code) + ", dropped");
		return false;
	}

	if(!config.command_enabled(code)) {
		Debug::WARN("Interpreter: command " + std::to_string(fields.code) + " not built into this controller, dropped");
		return false;
	}

	//scanning all devices doesn't care about the device field
	if(code != Command_Code::SCAN_ALL && fields.device_id >= config.n_mutrig) {
		Debug::WARN("Interpreter: no device " + std::to_string(fields.device_id) + ", dropped");
		return false;
	}

	pending.command = code;
	pending.device_id = (code == Command_Code::SCAN_ALL) ? 0 : fields.device_id;
	pending.payload_length = fields.payload_length;
	pending.start = true;
	pending_word = command_word;
	return true;
}

void Instruction_Interpreter::drop_busy_command() {
	if(!command_csr_command.check()) return;
	discarded++;
	Debug::WARN("Interpreter: busy, command dropped");
}

void Instruction_Interpreter::service_device_index() {
	//TSA asks for these one at a time; clearing the request is our acknowledgement
	if(command_device_reset.read()) {
		status_device.publish(0);
		command_device_reset.acknowledge_reset(false);
	}
	if(command_device_increment.read()) {
		status_device.publish(status_device.read() + 1);
		command_device_increment.acknowledge_reset(false);
	}
}

//================================= STATE FUNCTIONS =================================

void Instruction_Interpreter::do_idle_entry() {
	accepted = false;
	pending = {};
	status_rpc.publish({});
	status_busy.publish(false);
}

void Instruction_Interpreter::do_idle() {
	if(!command_csr_command.check()) return;
	accepted = accept_command(command_csr_command.read());
	if(!accepted) discarded++;
}

void Instruction_Interpreter::do_dispatch() {
	status_command_word.publish(pending_word);
	status_device.publish(pending.device_id);
	status_rpc.publish(pending);
	status_busy.publish(true);
}

void Instruction_Interpreter::do_running() {
	drop_busy_command();
	service_device_index();
}

void Instruction_Interpreter::do_acknowledge_entry() {
	Routine_Request_t rpc = status_rpc.read();
	rpc.start = false;
	status_rpc.publish(rpc);
}

void Instruction_Interpreter::do_acknowledge() {
	drop_busy_command();
}

void Instruction_Interpreter::do_release() {
	//busy drops on the same edge we go idle
	status_rpc.publish({});
	status_busy.publish(false);
}
