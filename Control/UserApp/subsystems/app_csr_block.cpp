/*
 * app_csr_block.cpp
 *
 *  Created on: Oct 27, 2025
 */

#include "app_csr_block.hpp"
#include "app_debug_if.hpp"

bool Csr_Block::write(uint8_t address, uint32_t data) {
	switch(address) {
	case COMMAND:
		//a repeated word is still a new command
		last_command = data;
		command_csr_command.publish_unconditional(data);
		return true;

	case OFFSET:
		status_offset.publish(data);
		return true;

	case MONITOR_INTERVAL:
		status_monitor_interval.publish(static_cast<uint16_t>(data & 0xFFFF));
		return true;

	case STATUS:
		Debug::WARN("CSR: STATUS is read only");
		return false;

	default:
		Debug::WARN("CSR: write to unmapped address " + std::to_string(address));
		return false;
	}
}

uint32_t Csr_Block::read(uint8_t address) const {
	switch(address) {
	case COMMAND:
		return last_command;

	case OFFSET:
		return status_offset.read();

	case STATUS:
		if(status_busy.read())
			return (status_command_word.read() & 0xFFFF'0000) | status_progress.read();
		return COMPLETION_OK;

	case MONITOR_INTERVAL:
		return status_monitor_interval.read();

	default:
		Debug::WARN("CSR: read from unmapped address " + std::to_string(address));
		return 0;
	}
}

void Csr_Block::reset() {
	last_command = 0;
	status_offset.publish(0);
	status_monitor_interval.publish(0);
}
