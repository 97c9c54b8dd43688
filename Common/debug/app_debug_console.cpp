/*
 * app_debug_console.cpp
 *
 *  Created on: Oct 21, 2025
 */

#include "app_debug_console.hpp"

Debug_Console::Debug_Console(Callback_Function<uint64_t> _timestamp_ps):
	timestamp_ps(_timestamp_ps)
{}

void Debug_Console::print(Msg_t msg) { emit(stdout, "INFO", msg); }
void Debug_Console::warn(Msg_t msg) { emit(stderr, "WARN", msg); }
void Debug_Console::error(Msg_t msg) { emit(stderr, "ERROR", msg); }

//one line per message, timestamp in nanoseconds of simulated time
void Debug_Console::emit(FILE* stream, const char* tag, const Msg_t& msg) {
	uint64_t now_ps = timestamp_ps();
	std::string text = msg.str();
	std::fprintf(stream, "[%12.3f ns] %-5s %s\n", static_cast<double>(now_ps) / 1000.0, tag, text.c_str());
	std::fflush(stream);
}
