/*
 * app_comms_link.hpp
 *
 *  Created on: Nov 3, 2025
 *
 *  Host link of the controller simulation
 *  Frames: [0xEE][payload size, 16 bits big endian][protobuf `app.Communication`]
 *  	- decoded messages get published on the outbound ports, one port per message type
 *  	- anything published on an inbound port gets framed and transmitted on the next poll
 *  Bad frames and unknown message types are counted and reported, the link keeps going
 */

#pragma once

#include "app_utils.hpp"
#include "app_proctypes.hpp"
#include "app_threading.hpp"
#include "app_regmap_helpers.hpp"	//to pack and unpack message size into bytestream
#include "app_byte_stream.hpp"
#include "app_message_ports.hpp"

#include "app_messages.pb.h"		//do protobuf decoding in this module
#include "pb.h"
#include "pb_common.h"
#include "pb_decode.h"
#include "pb_encode.h"

class Comms_Link {
public:
	//============== TYPEDEFS =============

	static constexpr size_t BUFFER_SIZE = 2048;
	static constexpr uint8_t START_BYTE = 0xEE;
	static constexpr size_t HEADER_PADDING = 3; //start byte + message size (2 bytes)

	//=========== PUBLIC FUNCTIONS ===========

	Comms_Link(Byte_Stream& _stream);

	//delete copy constructor and assignment operator
	Comms_Link(const Comms_Link& other) = delete;
	void operator=(const Comms_Link& other) = delete;

	//one pass of the link: transmit whatever is staged, then receive/decode/dispatch
	void poll();

	//transmit anything staged on the inbound ports
	void push_messages();

	//##### STATE VARIABLE ASSOCIATION #####
	SUBSCRIBE_FUNC(		status_comms_connected			);
	SUBSCRIBE_FUNC_RC(	status_comms_activity			);
	SUBSCRIBE_FUNC(		status_comms_decode_err_deserz	);
	SUBSCRIBE_FUNC(		status_comms_decode_err_msgtype	);
	SUBSCRIBE_FUNC(		status_comms_encode_err_serz	);

	//##### IO PORTS ######
	//from the host
	SUBSCRIBE_FUNC(	comms_csr_access_outbound		);
	SUBSCRIBE_FUNC(	comms_scratchpad_write_outbound	);
	SUBSCRIBE_FUNC(	comms_result_request_outbound	);
	SUBSCRIBE_FUNC(	comms_sim_control_outbound		);
	SUBSCRIBE_FUNC(	comms_debug_outbound			);
	//to the host
	LINK_FUNC(		comms_csr_access_inbound		);
	LINK_FUNC(		comms_scratchpad_write_inbound	);
	LINK_FUNC(		comms_result_block_inbound		);
	LINK_FUNC(		comms_sim_status_inbound		);
	LINK_FUNC(		comms_debug_inbound				);

	//framed bytes in one direction, for whoever is on the other end of a loopback
	static size_t frame(const app_Communication& msg, std::span<uint8_t, std::dynamic_extent> out);

private:
	Byte_Stream& stream;

	void receive_poll();
	void deserialize_dispatch(std::span<uint8_t, std::dynamic_extent> msg);

	//returns whether we should acknowledge the "data available" signal
	bool serialize_transmit(app_Communication& msg);

	//drop a complete (or garbage) frame from the front of the inbound buffer
	void consume_inbound(size_t n_bytes);

	//inbound buffer variables
	std::array<uint8_t, BUFFER_SIZE> INBOUND_DATA = {0};
	Regmap_Field inbound_data_size = {2, 0, 16, true, INBOUND_DATA};
	size_t inbound_buffer_head = 0;

	//outbound buffer variables
	std::array<uint8_t, BUFFER_SIZE> OUTBOUND_DATA = {0};
	Regmap_Field outbound_data_size = {2, 0, 16, true, OUTBOUND_DATA};

	//protobuf serialization buffer
	std::array<uint8_t, BUFFER_SIZE> SERZ_BUFFER = {0};

	//communication ports for deserialized protobuf messages
	PERSISTENT((Pub_Var<app_Csr_Access>), comms_csr_access_outbound);
	PERSISTENT((Pub_Var<app_Scratchpad_Write>), comms_scratchpad_write_outbound);
	PERSISTENT((Pub_Var<app_Result_Request>), comms_result_request_outbound);
	PERSISTENT((Pub_Var<app_Sim_Control>), comms_sim_control_outbound);
	PERSISTENT((Pub_Var<app_Debug>), comms_debug_outbound);
	Sub_Var<app_Csr_Access> comms_csr_access_inbound;
	Sub_Var<app_Scratchpad_Write> comms_scratchpad_write_inbound;
	Sub_Var<app_Result_Block> comms_result_block_inbound;
	Sub_Var<app_Sim_Status> comms_sim_status_inbound;
	Sub_Var<app_Debug> comms_debug_inbound;

	//link status
	PERSISTENT((Pub_Var<bool>), status_comms_connected);
	PERSISTENT((Pub_Var<bool>), status_comms_activity);
	PERSISTENT((Pub_Var<size_t>), status_comms_decode_err_deserz);	//deserialization decode error
	PERSISTENT((Pub_Var<size_t>), status_comms_decode_err_msgtype);	//incorrect message type
	PERSISTENT((Pub_Var<size_t>), status_comms_encode_err_serz);		//serialization encode error
	size_t local_deserz_err_count = 0;
	size_t local_msgtype_err_count = 0;
	size_t local_serz_err_count = 0;

	//debug messages raised while we're mid-transmit wait for the next push
	bool transmitting = false;
};
