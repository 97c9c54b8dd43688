/*
 * app_debug_console.hpp
 *
 *  Created on: Oct 21, 2025
 *
 *  Debug sink for the command-line tools
 *  prints go to stdout, warnings and errors to stderr
 */

#pragma once

#include <cstdio>	//fputs, fprintf

#include "app_debug_if.hpp"
#include "app_utils.hpp"	//for callback functions

class Debug_Console : public Debug_Interface {
public:
	//pass a function that reports the current simulation time in picoseconds
	//defaults to no timestamp
	Debug_Console(Callback_Function<uint64_t> _timestamp_ps = {});

	//implement the debug interface
	void print(Msg_t msg) override;
	void warn(Msg_t msg) override;
	void error(Msg_t msg) override;

	//delete copy constructor and assignment operator
	Debug_Console(const Debug_Console& other) = delete;
	void operator=(const Debug_Console& other) = delete;

private:
	void emit(FILE* stream, const char* tag, const Msg_t& msg);

	Callback_Function<uint64_t> timestamp_ps;
};
