/*
 * app_channel_messages.hpp
 *
 *  Created on: Oct 23, 2025
 *
 *  The only two things that cross between the control and serial clock domains
 */

#pragma once

#include "app_proctypes.hpp"

//control --> serial
//asks the config writer to push the configuration of one device out twice
struct Cfg_Write_Request_t {
	bool start = false;
	uint8_t device_id = 0;

	bool operator==(const Cfg_Write_Request_t& other) const = default;
};

//serial --> control
struct Cfg_Write_Response_t {
	//error codes carried in `error_info`, 2 bits on the wire
	enum Error_Info : uint8_t {
		ERR_NONE = 0,
		ERR_BAD_DEVICE = 1,	//device id outside the chip-select range
	};

	bool done = false;
	bool error = false;
	uint8_t error_info = ERR_NONE;

	bool operator==(const Cfg_Write_Response_t& other) const = default;
};
