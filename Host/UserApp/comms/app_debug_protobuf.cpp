/*
 * app_debug_protobuf.cpp
 *
 *  Created on: Nov 4, 2025
 */

#include "app_debug_protobuf.hpp"

Debug_Protobuf::Debug_Protobuf(Comms_Link& _comms):
	comms(_comms)
{}

void Debug_Protobuf::print(Msg_t msg) { send(app_Debug_Level_INFO, msg); }
void Debug_Protobuf::warn(Msg_t msg) { send(app_Debug_Level_WARNING, msg); }
void Debug_Protobuf::error(Msg_t msg) { send(app_Debug_Level_ERROR, msg); }

void Debug_Protobuf::send(app_Debug_Level level, const Msg_t& msg) {
	//zero init leaves the text null terminated
	app_Debug debug_message = app_Debug_init_zero;
	debug_message.level = level;

	//msg field holds one more byte than the longest debug message
	static_assert(sizeof(debug_message.msg) > MSG_SIZE, "debug text doesn't fit the protobuf field");
	uint8_t* dest = reinterpret_cast<uint8_t*>(&debug_message.msg);
	auto text = msg.span();
	std::copy(text.begin(), text.end(), dest);

	//push the debug out to the publish port, push immediately
	comms_debug_inbound.publish_unconditional(debug_message);
	comms.push_messages();
}
