/*
 * app_link_server.cpp
 *
 *  Created on: Nov 4, 2025
 */

#include "app_link_server.hpp"
#include "app_debug_if.hpp"

Link_Server::Link_Server(Co_Simulation& _sim, Comms_Link& _comms):
	sim(_sim), comms(_comms)
{}

void Link_Server::init() {
	comms_csr_access_outbound = comms.subscribe_comms_csr_access_outbound();
	comms_scratchpad_write_outbound = comms.subscribe_comms_scratchpad_write_outbound();
	comms_result_request_outbound = comms.subscribe_comms_result_request_outbound();
	comms_sim_control_outbound = comms.subscribe_comms_sim_control_outbound();
	comms_debug_outbound = comms.subscribe_comms_debug_outbound();

	comms.link_comms_csr_access_inbound(comms_csr_access_inbound.subscribe());
	comms.link_comms_scratchpad_write_inbound(comms_scratchpad_write_inbound.subscribe());
	comms.link_comms_result_block_inbound(comms_result_block_inbound.subscribe());
	comms.link_comms_sim_status_inbound(comms_sim_status_inbound.subscribe());
}

void Link_Server::service() {
	if(comms_csr_access_outbound.check()) do_csr_access();
	if(comms_scratchpad_write_outbound.check()) do_scratchpad_write();
	if(comms_result_request_outbound.check()) do_result_request();
	if(comms_sim_control_outbound.check()) do_sim_control();
	if(comms_debug_outbound.check()) do_debug();
}

//================================= HANDLERS =================================

void Link_Server::do_csr_access() {
	auto request = comms_csr_access_outbound.read();
	app_Csr_Access reply = request;

	if(request.address > 0xFF) {
		Debug::WARN("Link: CSR address " + std::to_string(request.address) + " out of range");
		reply.ok = false;
	}
	else if(request.write) {
		reply.ok = sim.csr_write(static_cast<uint8_t>(request.address), request.data);
	}
	else {
		reply.data = sim.csr_read(static_cast<uint8_t>(request.address));
		reply.ok = true;
	}

	comms_csr_access_inbound.publish_unconditional(reply);
	served++;
}

void Link_Server::do_scratchpad_write() {
	auto request = comms_scratchpad_write_outbound.read();
	std::span<const uint32_t> words(request.words, request.words_count);

	app_Scratchpad_Write reply = app_Scratchpad_Write_init_zero;
	reply.offset = request.offset;
	reply.ok = sim.load_scratchpad(request.offset, words);

	comms_scratchpad_write_inbound.publish_unconditional(reply);
	served++;
}

void Link_Server::do_result_request() {
	auto request = comms_result_request_outbound.read();
	const size_t block_words = sizeof(app_Result_Block::words) / sizeof(uint32_t);

	//every block goes out before the next one gets staged
	uint32_t sent = 0;
	while(sent < request.count) {
		app_Result_Block block = app_Result_Block_init_zero;
		block.start = request.start + sent;
		uint32_t n = static_cast<uint32_t>(std::min<size_t>(block_words, request.count - sent));
		for(uint32_t i = 0; i < n; i++) block.words[i] = sim.result_read(block.start + i);
		block.words_count = static_cast<pb_size_t>(n);

		comms_result_block_inbound.publish_unconditional(block);
		comms.push_messages();
		sent += n;
	}
	served++;
}

void Link_Server::do_sim_control() {
	auto request = comms_sim_control_outbound.read();
	bool run_timed_out = false;

	switch(request.action) {
	case app_Sim_Control_Action_RUN_CYCLES:
		sim.run_cycles(request.cycles);
		break;
	case app_Sim_Control_Action_RUN_UNTIL_IDLE:
		run_timed_out = !sim.run_until_idle(request.cycles);
		break;
	case app_Sim_Control_Action_RESET:
		sim.reset();
		break;
	case app_Sim_Control_Action_STATUS:
	default:
		break;
	}

	send_status(run_timed_out);
	served++;
}

void Link_Server::do_debug() {
	auto msg = comms_debug_outbound.read();
	Debug::PRINT(std::string("Host: ") + msg.msg);
}

void Link_Server::send_status(bool run_timed_out) {
	auto& controller = sim.get_controller();

	app_Sim_Status status = app_Sim_Status_init_zero;
	status.idle = controller.all_idle();
	status.busy = controller.busy();
	status.exception = controller.get_mcc().trapped();
	status.monitor_timeout = controller.get_rate_monitor().subscribe_status_monitor_timeout_count().read() > 0;
	status.run_timed_out = run_timed_out;
	status.status_register = sim.csr_read(Csr_Block::STATUS);
	status.control_cycles = sim.control_cycles();
	status.time_ps = sim.now_ps();

	comms_sim_status_inbound.publish_unconditional(status);
}
