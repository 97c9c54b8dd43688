/*
 * app_csr_block.hpp
 *
 *  Created on: Oct 27, 2025
 *
 *  Host-facing control/status registers
 *  	0: COMMAND (W: triggers the interpreter, R: last word written)
 *  	1: OFFSET (RW, staging buffer word offset for MCC)
 *  	2: STATUS (R, {command[31:16], current threshold} while busy; completion code while idle)
 *  	3: MONITOR_INTERVAL (RW, 16 bits, seconds; reported only)
 *
 *  Host accesses land between control edges; the interpreter sees a command write on its next edge.
 */

#pragma once

#include "app_proctypes.hpp"
#include "app_threading.hpp"

class Csr_Block {
public:
	enum Address : uint8_t {
		COMMAND = 0,
		OFFSET = 1,
		STATUS = 2,
		MONITOR_INTERVAL = 3,
	};
	static constexpr uint8_t NUM_REGISTERS = 4;

	//idle status value when the last routine finished cleanly
	static constexpr uint32_t COMPLETION_OK = 0;

	Csr_Block() {}

	//delete copy constructor and assignment operator
	Csr_Block(const Csr_Block& other) = delete;
	void operator=(const Csr_Block& other) = delete;

	//returns false for a read-only or unmapped register
	bool write(uint8_t address, uint32_t data);

	//unmapped registers read back 0
	uint32_t read(uint8_t address) const;

	void reset();

	LINK_FUNC(status_busy);
	LINK_FUNC(status_command_word);
	LINK_FUNC(status_progress);
	SUBSCRIBE_FUNC(command_csr_command);
	SUBSCRIBE_FUNC(status_offset);
	SUBSCRIBE_FUNC(status_monitor_interval);

private:
	uint32_t last_command = 0;

	Sub_Var<bool> status_busy;
	Sub_Var<uint32_t> status_command_word;
	Sub_Var<uint8_t> status_progress;
	PERSISTENT((Pub_Var<uint32_t>), command_csr_command);		//signals on every write
	PERSISTENT((Pub_Var<uint32_t>), status_offset);
	PERSISTENT((Pub_Var<uint16_t>), status_monitor_interval);
};
