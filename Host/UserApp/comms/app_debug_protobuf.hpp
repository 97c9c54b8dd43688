/*
 * app_debug_protobuf.hpp
 *
 *  Created on: Nov 4, 2025
 *
 *  Print debug messages out over the host link as `app.Debug` messages
 */

#pragma once

#include "app_comms_link.hpp"
#include "app_debug_if.hpp"
#include "app_string.hpp"
#include "app_message_ports.hpp"

//### protobuf includes ###
#include "app_messages.pb.h"
#include "pb.h"
#include "pb_common.h"
#include "pb_encode.h"

class Debug_Protobuf : public Debug_Interface {
public:
	//messages go out through this link as soon as they're raised
	Debug_Protobuf(Comms_Link& _comms);

	//delete copy constructor and assignment operator
	Debug_Protobuf(const Debug_Protobuf& other) = delete;
	void operator=(const Debug_Protobuf& other) = delete;

	//and implement the debug interface
	void print(Msg_t msg) override;
	void warn(Msg_t msg) override;
	void error(Msg_t msg) override;

	//link this into the comms link's debug port
	SUBSCRIBE_FUNC(comms_debug_inbound);

private:
	Comms_Link& comms;

	void send(app_Debug_Level level, const Msg_t& msg);

	PERSISTENT((Pub_Var<app_Debug>), comms_debug_inbound);
};
