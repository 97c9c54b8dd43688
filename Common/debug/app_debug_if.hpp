/*
 * app_debug_if.hpp
 *
 *  Created on: Oct 21, 2025
 *
 *  Debug printing goes through a single attached sink
 *  Anything in the controller can call `Debug::PRINT/WARN/ERROR` without knowing where the text ends up
 *  	\--> console when running the command-line simulation
 *  	\--> protobuf debug messages when running behind the host link
 */

#pragma once

#include "app_proctypes.hpp"
#include "app_string.hpp"

class Debug_Interface {
public:
	//messages are fixed size; anything longer gets truncated
	static constexpr size_t MSG_SIZE = 128;
	using Msg_t = App_String<MSG_SIZE>;

	//implement these in the sinks
	virtual void print(Msg_t msg) = 0;
	virtual void warn(Msg_t msg) = 0;
	virtual void error(Msg_t msg) = 0;

	virtual ~Debug_Interface() = default;
};

class Debug {
public:
	//verbosity follows the controller's `debug_level` parameter
	enum class Level : uint8_t {
		QUIET = 0,	//warnings and errors only
		INFO = 1,	//+ regular prints
		TRACE = 2,	//+ every state machine transition
	};

	//point all debug output to this sink; nullptr to mute everything
	static void attach(Debug_Interface* _sink);
	static void set_level(Level _level);
	static void set_level(uint8_t _level);
	static Level level();
	static bool tracing();

	//static print/warn/error forwarding functions
	static void PRINT(Debug_Interface::Msg_t msg);
	static void WARN(Debug_Interface::Msg_t msg);
	static void ERROR(Debug_Interface::Msg_t msg);
	static void TRACE(Debug_Interface::Msg_t msg);

	//running tallies, handy when checking that an anomaly got reported
	static size_t warn_count();
	static size_t error_count();
	static void clear_counts();

private:
	Debug() = delete;	//don't allow instantiation

	static Debug_Interface* sink;
	static Level active_level;
	static size_t warnings;
	static size_t errors;
};
