/*
 * app_message_ports.hpp
 *
 *  Created on: Nov 3, 2025
 *
 *  Lets decoded protobuf messages travel through Pub_Var/Sub_Var ports
 *  Pub_Var needs an equality check for its change detection; nanopb structs are plain C, so compare the bytes
 *  Ports carrying these publish unconditionally anyway, a false "changed" costs nothing
 */

#pragma once

#include <cstring>

#include "app_messages.pb.h"

#define PB_BYTEWISE_EQUALS(type)										\
	inline bool operator==(const type& a, const type& b) {				\
		return std::memcmp(&a, &b, sizeof(type)) == 0;					\
	}

PB_BYTEWISE_EQUALS(app_Debug)
PB_BYTEWISE_EQUALS(app_Csr_Access)
PB_BYTEWISE_EQUALS(app_Scratchpad_Write)
PB_BYTEWISE_EQUALS(app_Result_Request)
PB_BYTEWISE_EQUALS(app_Result_Block)
PB_BYTEWISE_EQUALS(app_Sim_Control)
PB_BYTEWISE_EQUALS(app_Sim_Status)
