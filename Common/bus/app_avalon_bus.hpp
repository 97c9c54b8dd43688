/*
 * app_avalon_bus.hpp
 *
 *  Created on: Oct 23, 2025
 *
 *  Signal bundles of the two burst-read buses the controller masters
 *  	- staging buffer (scratch pad), read by the data mover
 *  	- rate counters, read by the rate monitor
 *
 *  Handshake:
 *  	- the master holds `read` with an address and burst count until a cycle where `waitrequest` is low
 *  	  that cycle accepts the command; the master drops `read` on the next edge
 *  	- beats then come back one per cycle `readdatavalid` is high, each with a response code
 *  	- slaves keep `waitrequest` high while no read is presented
 */

#pragma once

#include "app_proctypes.hpp"

enum class Avalon_Response : uint8_t {
	OKAY = 0,
	RESERVED = 1,
	SLVERR = 2,
	DECODEERROR = 3,
};

//driven by the controller
struct Avalon_Read_Master_t {
	uint32_t address = 0;		//word address
	bool read = false;
	uint16_t burstcount = 0;
	bool flush = false;			//counter bus only; abandon whatever burst is in progress

	bool operator==(const Avalon_Read_Master_t& other) const = default;
};

//driven by the bus slave
struct Avalon_Read_Slave_t {
	bool waitrequest = true;
	bool readdatavalid = false;
	uint32_t readdata = 0;
	Avalon_Response response = Avalon_Response::OKAY;

	bool operator==(const Avalon_Read_Slave_t& other) const = default;
};

//widths of the address/burst ports, bits
static constexpr uint32_t SCRATCHPAD_ADDRESS_BITS = 16;
static constexpr uint32_t SCRATCHPAD_BURST_MAX = 255;		//8-bit burst count
static constexpr uint32_t COUNTER_BURST_MAX = 511;			//9-bit burst count
