/*
 * app_link_server.hpp
 *
 *  Created on: Nov 4, 2025
 *
 *  Executes host link requests against a co-simulation and publishes the replies
 *  	Csr_Access 			--> register read/write, echoed back with `ok` and the data
 *  	Scratchpad_Write 	--> staging buffer load, echoed back (offset only) with `ok`
 *  	Result_Request 		--> Result_Block replies, split into blocks of at most 128 words
 *  	Sim_Control			--> run/reset, answered with Sim_Status
 *  	Debug				--> printed locally
 */

#pragma once

#include "app_proctypes.hpp"
#include "app_threading.hpp"
#include "app_comms_link.hpp"
#include "app_co_simulation.hpp"

class Link_Server {
public:
	Link_Server(Co_Simulation& _sim, Comms_Link& _comms);

	//delete copy constructor and assignment operator
	Link_Server(const Link_Server& other) = delete;
	void operator=(const Link_Server& other) = delete;

	//hook up to the link's ports
	void init();

	//service everything that came in since the last call
	void service();

	uint32_t requests_served() const { return served; }

private:
	Co_Simulation& sim;
	Comms_Link& comms;
	uint32_t served = 0;

	void do_csr_access();
	void do_scratchpad_write();
	void do_result_request();
	void do_sim_control();
	void do_debug();

	void send_status(bool run_timed_out);

	//requests from the host
	Sub_Var<app_Csr_Access> comms_csr_access_outbound;
	Sub_Var<app_Scratchpad_Write> comms_scratchpad_write_outbound;
	Sub_Var<app_Result_Request> comms_result_request_outbound;
	Sub_Var<app_Sim_Control> comms_sim_control_outbound;
	Sub_Var<app_Debug> comms_debug_outbound;

	//replies
	PERSISTENT((Pub_Var<app_Csr_Access>), comms_csr_access_inbound);
	PERSISTENT((Pub_Var<app_Scratchpad_Write>), comms_scratchpad_write_inbound);
	PERSISTENT((Pub_Var<app_Result_Block>), comms_result_block_inbound);
	PERSISTENT((Pub_Var<app_Sim_Status>), comms_sim_status_inbound);
};
