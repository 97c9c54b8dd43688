/*
 * app_link_main.cpp
 *
 *  Created on: Nov 5, 2025
 *
 *  mutrig_link: serves the host link over stdin/stdout
 *  Debug output goes down the link too, so nothing else may write to stdout
 */

#include "app_co_simulation.hpp"
#include "app_debug_if.hpp"
#include "app_cli_options.hpp"
#include "app_hal_tick.hpp"
#include "app_stdio_stream.hpp"
#include "app_comms_link.hpp"
#include "app_debug_protobuf.hpp"
#include "app_link_server.hpp"

//poll interval when nothing is coming in
static const uint32_t IDLE_POLL_MS = 1;

int main(int argc, char** argv) {
	Cli_Options::Options_t options = {};
	auto parse_status = Cli_Options::parse(argc, argv, options);
	if(parse_status != Cli_Options::Status::OK || options.help) {
		Cli_Options::usage(argv[0], false);
		return options.help ? 0 : 2;
	}

	Stdio_Stream stream;
	Comms_Link comms(stream);
	Debug_Protobuf debug(comms);
	comms.link_comms_debug_inbound(debug.subscribe_comms_debug_inbound());
	Debug::attach(&debug);

	Co_Simulation sim(options.config);
	if(sim.init() != Controller_Config_t::Status::OK) {
		comms.poll();	//flush the error out before leaving
		return 2;
	}

	Link_Server server(sim, comms);
	server.init();

	while(stream.connected()) {
		uint32_t served_before = server.requests_served();
		comms.poll();
		server.service();
		comms.push_messages();
		if(server.requests_served() == served_before) Tick::delay_ms(IDLE_POLL_MS);
	}
	return 0;
}
