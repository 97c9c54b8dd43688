/*
 * app_cli_options.cpp
 *
 *  Created on: Nov 5, 2025
 */

#include <getopt.h>
#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <cstring>

#include "app_cli_options.hpp"

bool Cli_Options::parse_u64(const char* text, uint64_t& value) {
	if(text == nullptr || *text == '\0') return false;
	char* end = nullptr;
	value = std::strtoull(text, &end, 0);	//decimal or 0x-prefixed hex
	return end != nullptr && *end == '\0';
}

bool Cli_Options::parse_action(const char* text, Action& action) {
	if(std::strcmp(text, "configure") == 0) action = Action::CONFIGURE;
	else if(std::strcmp(text, "scan-one") == 0) action = Action::SCAN_ONE;
	else if(std::strcmp(text, "scan-all") == 0) action = Action::SCAN_ALL;
	else return false;
	return true;
}

Cli_Options::Status Cli_Options::parse(int argc, char** argv, Options_t& options) {
	static const option long_options[] = {
		{"n-mutrig",		required_argument, nullptr, 'n'},
		{"variant",			required_argument, nullptr, 'V'},
		{"clk",				required_argument, nullptr, 'f'},
		{"spi-clk",			required_argument, nullptr, 'F'},
		{"counter-base",	required_argument, nullptr, 'b'},
		{"subroutines",		required_argument, nullptr, 'S'},
		{"debug",			required_argument, nullptr, 'd'},
		{"settle",			required_argument, nullptr, 'e'},
		{"sclr-delay",		required_argument, nullptr, 'c'},
		{"window",			required_argument, nullptr, 'w'},
		{"margin",			required_argument, nullptr, 'm'},
		{"bus-timeout",		required_argument, nullptr, 't'},
		{"sync-stages",		required_argument, nullptr, 'y'},
		{"bitstream",		required_argument, nullptr, 'i'},
		{"run",				required_argument, nullptr, 'r'},
		{"device",			required_argument, nullptr, 'D'},
		{"offset",			required_argument, nullptr, 'o'},
		{"budget",			required_argument, nullptr, 'B'},
		{"results",			required_argument, nullptr, 'O'},
		{"help",			no_argument,       nullptr, 'h'},
		{nullptr, 0, nullptr, 0},
	};

	auto& config = options.config;
	optind = 0;	//0 rather than 1, glibc rescans from scratch and the parser can run more than once
	int opt = 0;
	while((opt = getopt_long(argc, argv, "n:V:f:F:b:S:d:e:c:w:m:t:y:i:r:D:o:B:O:h", long_options, nullptr)) != -1) {
		uint64_t value = 0;

		//everything but the strings is numeric
		switch(opt) {
		case 'i': options.bitstream_path = optarg; continue;
		case 'O': options.results_path = optarg; continue;
		case 'r':
			if(!parse_action(optarg, options.action)) return Status::BAD_ACTION;
			continue;
		case 'h': options.help = true; continue;
		case '?': return Status::UNKNOWN_OPTION;
		default:
			if(!parse_u64(optarg, value)) return Status::BAD_VALUE;
			break;
		}

		//range checks happen in the controller configuration; just keep the values from wrapping here
		uint32_t v32 = static_cast<uint32_t>(std::min<uint64_t>(value, UINT32_MAX));
		uint8_t v8 = static_cast<uint8_t>(std::min<uint64_t>(value, UINT8_MAX));
		switch(opt) {
		case 'n': config.n_mutrig = v32; break;
		case 'V': config.variant = static_cast<MuTRiG_Variant>(v8); break;
		case 'f': config.clk_frequency_hz = v32; break;
		case 'F': config.clk_frequency_spi_hz = v32; break;
		case 'b': config.counter_base_word = v32; break;
		case 'S': config.sel_subroutines = v8; break;
		case 'd': config.debug_level = v8; break;
		case 'e': config.spi_settle_cycles = v32; break;
		case 'c': config.sclr_delay_cycles = v32; break;
		case 'w': config.monitor_window_cycles = v32; break;
		case 'm': config.monitor_margin_cycles = v32; break;
		case 't': config.bus_timeout_cycles = v32; break;
		case 'y': config.sync_stages = v32; break;
		case 'D': options.device = v8; break;
		case 'o': options.offset = v32; break;
		case 'B': options.cycle_budget = value; break;
		default: return Status::UNKNOWN_OPTION;
		}
	}

	if(optind < argc) return Status::UNKNOWN_OPTION;
	return Status::OK;
}

void Cli_Options::usage(const char* program, bool simulation_flags) {
	std::fprintf(stderr,
		"usage: %s [options]\n"
		"controller parameters:\n"
		"  -n, --n-mutrig N         number of MuTRiG chips (1..128, default 8)\n"
		"  -V, --variant V          MuTRiG variant 1, 2 or 3 (default 3)\n"
		"  -f, --clk HZ             control clock (default 156250000)\n"
		"  -F, --spi-clk HZ         serial clock, sclk runs at half of it (default 40000000)\n"
		"  -b, --counter-base W     word address of chip 0's counters (default 0)\n"
		"  -S, --subroutines S      0: scans only, 1: configure only, 2: both (default 2)\n"
		"  -d, --debug L            0: warnings, 1: info, 2: state traces (default 1)\n"
		"  -e, --settle N           serial cycles before each frame (default 1000)\n"
		"  -c, --sclr-delay N       control cycles before the counter clear (default 5)\n"
		"  -w, --window N           counting window, control cycles (default: one second)\n"
		"  -m, --margin N           extra cycles after the window (default 5)\n"
		"  -t, --bus-timeout N      counter bus idle limit (default 500)\n"
		"  -y, --sync-stages N      clock crossing synchronizer depth (1..8, default 2)\n",
		program);

	if(!simulation_flags) return;
	std::fprintf(stderr,
		"simulation:\n"
		"  -i, --bitstream FILE     configuration bitstream, hex words\n"
		"  -r, --run ACTION         configure | scan-one | scan-all\n"
		"  -D, --device D           target chip (default 0)\n"
		"  -o, --offset W           staging buffer offset for the bitstream (default 0)\n"
		"  -B, --budget N           give up after N control cycles (default: no limit)\n"
		"  -O, --results FILE       write the result region as CSV, '-' for stdout\n"
		"  -h, --help\n");
}
