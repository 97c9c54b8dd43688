/*
 * app_cli_options.hpp
 *
 *  Created on: Nov 5, 2025
 *
 *  Command-line options shared by the host tools
 *  Every controller parameter has a flag; the simulation-only flags are ignored by the link server
 */

#pragma once

#include <string>

#include "app_proctypes.hpp"
#include "app_controller_config.hpp"

class Cli_Options {
public:
	//what `mutrig_sim` should do after configuring
	enum class Action : uint8_t {
		NONE = 0,
		CONFIGURE,
		SCAN_ONE,
		SCAN_ALL,
	};

	struct Options_t {
		Controller_Config_t config = {};
		Action action = Action::NONE;
		uint8_t device = 0;
		uint32_t offset = 0;						//staging buffer word offset for the bitstream
		std::string bitstream_path;
		std::string results_path;					//"-" --> stdout
		uint64_t cycle_budget = 0;					//0 --> no limit
		bool help = false;
	};

	enum class Status : uint8_t {
		OK = 0,
		BAD_VALUE,
		UNKNOWN_OPTION,
		BAD_ACTION,
	};

	static Status parse(int argc, char** argv, Options_t& options);
	static void usage(const char* program, bool simulation_flags);

private:
	Cli_Options() = delete;	//don't allow instantiation

	static bool parse_u64(const char* text, uint64_t& value);
	static bool parse_action(const char* text, Action& action);
};
