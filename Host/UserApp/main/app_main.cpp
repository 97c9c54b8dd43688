/*
 * app_main.cpp
 *
 *  Created on: Nov 5, 2025
 *
 *  mutrig_sim: runs one routine of the controller against the simulated chips
 *  	- loads the bitstream into the staging buffer and configures the target chip(s) with it
 *  	- optionally runs a threshold scan afterwards
 *  	- dumps the result region as CSV
 */

#include <cstdio>
#include <vector>

#include "app_co_simulation.hpp"
#include "app_debug_console.hpp"
#include "app_debug_if.hpp"
#include "app_cli_options.hpp"
#include "app_bitstream_file.hpp"

//process exit codes
static const int EXIT_OK = 0;
static const int EXIT_INCOMPLETE = 1;	//budget ran out, or the controller got stuck
static const int EXIT_USAGE = 2;

static bool run_routine(Co_Simulation& sim, Command_Code code, uint8_t device, uint16_t payload_words, uint32_t offset, uint64_t budget) {
	if(!sim.issue_command(code, device, payload_words, offset)) return false;
	uint64_t limit = budget ? budget : UINT64_MAX;
	if(!sim.run_until_idle(limit)) {
		Debug::ERROR("mutrig_sim: routine didn't finish within " + std::to_string(limit) + " control cycles");
		return false;
	}
	return true;
}

static bool write_results(Co_Simulation& sim, const std::string& path) {
	FILE* out = (path == "-") ? stdout : std::fopen(path.c_str(), "w");
	if(out == nullptr) {
		Debug::ERROR("mutrig_sim: can't open " + path);
		return false;
	}

	auto& results = sim.get_controller().get_result_store();
	std::fprintf(out, "tth,device,channel,count\n");
	for(uint32_t tth = 0; tth < Controller_Config_t::THRESHOLD_STEPS; tth++) {
		for(uint32_t dev = 0; dev < results.devices(); dev++) {
			for(uint32_t ch = 0; ch < Controller_Config_t::CHANNELS_PER_DEVICE; ch++) {
				std::fprintf(out, "%u,%u,%u,%u\n", tth, dev, ch, results.read(tth, dev, ch));
			}
		}
	}

	if(out != stdout) std::fclose(out);
	return true;
}

int main(int argc, char** argv) {
	Cli_Options::Options_t options = {};
	auto parse_status = Cli_Options::parse(argc, argv, options);
	if(parse_status != Cli_Options::Status::OK || options.help) {
		Cli_Options::usage(argv[0], true);
		return options.help ? EXIT_OK : EXIT_USAGE;
	}

	Co_Simulation sim(options.config);
	Debug_Console console(BIND_CALLBACK(&sim, timestamp_ps));
	Debug::attach(&console);

	if(sim.init() != Controller_Config_t::Status::OK) return EXIT_USAGE;

	const auto& config = sim.get_controller().get_config();
	bool scanning = options.action == Cli_Options::Action::SCAN_ONE || options.action == Cli_Options::Action::SCAN_ALL;

	//#### CONFIGURATION ####
	//configure goes through the staging buffer and the data mover
	//scans get the bitstream preloaded into every partition they touch; the scan writes the chips itself
	if(!options.bitstream_path.empty()) {
		std::vector<uint32_t> words;
		auto status = Bitstream_File::load(options.bitstream_path, words, config.partition_words());
		if(status != Bitstream_File::Status::OK) {
			Debug::ERROR(std::string("mutrig_sim: ") + Bitstream_File::status_str(status));
			return EXIT_USAGE;
		}
		if(words.size() < config.cfg_length_words()) {
			Debug::WARN("mutrig_sim: bitstream has " + std::to_string(words.size()) + " words, chip takes " +
						std::to_string(config.cfg_length_words()));
		}

		if(options.action == Cli_Options::Action::CONFIGURE) {
			if(!sim.load_scratchpad(options.offset, words)) return EXIT_USAGE;
			if(!run_routine(sim, Command_Code::CONFIGURE, options.device, static_cast<uint16_t>(words.size()),
							options.offset, options.cycle_budget)) return EXIT_INCOMPLETE;
		}
		else if(scanning) {
			auto& store = sim.get_controller().get_config_store();
			bool all = options.action == Cli_Options::Action::SCAN_ALL;
			for(uint32_t dev = 0; dev < config.n_mutrig; dev++) {
				if(all || dev == options.device) store.load_partition(dev, words);
			}
		}
	}
	else if(options.action == Cli_Options::Action::CONFIGURE) {
		Debug::ERROR("mutrig_sim: configure needs a bitstream (-i)");
		return EXIT_USAGE;
	}

	//#### SCAN ####
	if(scanning) {
		Command_Code code = (options.action == Cli_Options::Action::SCAN_ALL) ? Command_Code::SCAN_ALL : Command_Code::SCAN_ONE;
		if(!run_routine(sim, code, options.device, 0, 0, options.cycle_budget)) return EXIT_INCOMPLETE;
	}

	Debug::PRINT("mutrig_sim: done after " + std::to_string(sim.control_cycles()) + " control cycles, " +
				std::to_string(Debug::warn_count()) + " warnings");

	if(!options.results_path.empty() && !write_results(sim, options.results_path)) return EXIT_INCOMPLETE;
	return sim.get_controller().get_mcc().trapped() ? EXIT_INCOMPLETE : EXIT_OK;
}
