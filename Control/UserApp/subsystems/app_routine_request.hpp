/*
 * app_routine_request.hpp
 *
 *  Created on: Oct 24, 2025
 *
 *  Request the interpreter hands to whichever routine a command starts
 *  Owned (published) by the interpreter only; the routines, data mover and arbiter subscribe
 */

#pragma once

#include "app_proctypes.hpp"
#include "app_controller_config.hpp"

struct Routine_Request_t {
	Command_Code command = Command_Code::NONE;
	uint8_t device_id = 0;
	uint16_t payload_length = 0;	//words
	bool start = false;

	bool operator==(const Routine_Request_t& other) const = default;
};

//what the rate monitor gets asked to do
struct Monitor_Request_t {
	bool start = false;
	uint8_t tth = 0;	//result row to fill

	bool operator==(const Monitor_Request_t& other) const = default;
};
