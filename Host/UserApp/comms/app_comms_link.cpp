/*
 * app_comms_link.cpp
 *
 *  Created on: Nov 3, 2025
 */

#include "app_comms_link.hpp"
#include "app_debug_if.hpp"

//========================== PUBLIC FUNCTIONS ==========================

Comms_Link::Comms_Link(Byte_Stream& _stream):
	stream(_stream)
{}

void Comms_Link::poll() {
	status_comms_connected.publish(stream.connected());

	//transmit any messages that have been pushed into our inbound variables
	push_messages();

	//then copy/parse/dispatch whatever came in
	receive_poll();
}

//stage-then-acknowledge: a port only gets refreshed once its message made it into the stream
void Comms_Link::push_messages() {
	if(transmitting) return;
	transmitting = true;

	if(comms_debug_inbound.check(false)) {
		app_Communication msg = app_Communication_init_zero;
		msg.which_payload = app_Communication_debug_message_tag;
		msg.payload.debug_message = comms_debug_inbound.read();
		if(serialize_transmit(msg)) comms_debug_inbound.refresh();
	}

	if(comms_csr_access_inbound.check(false)) {
		app_Communication msg = app_Communication_init_zero;
		msg.which_payload = app_Communication_csr_access_tag;
		msg.payload.csr_access = comms_csr_access_inbound.read();
		if(serialize_transmit(msg)) comms_csr_access_inbound.refresh();
	}

	if(comms_scratchpad_write_inbound.check(false)) {
		app_Communication msg = app_Communication_init_zero;
		msg.which_payload = app_Communication_scratchpad_write_tag;
		msg.payload.scratchpad_write = comms_scratchpad_write_inbound.read();
		if(serialize_transmit(msg)) comms_scratchpad_write_inbound.refresh();
	}

	if(comms_result_block_inbound.check(false)) {
		app_Communication msg = app_Communication_init_zero;
		msg.which_payload = app_Communication_result_block_tag;
		msg.payload.result_block = comms_result_block_inbound.read();
		if(serialize_transmit(msg)) comms_result_block_inbound.refresh();
	}

	if(comms_sim_status_inbound.check(false)) {
		app_Communication msg = app_Communication_init_zero;
		msg.which_payload = app_Communication_sim_status_tag;
		msg.payload.sim_status = comms_sim_status_inbound.read();
		if(serialize_transmit(msg)) comms_sim_status_inbound.refresh();
	}

	transmitting = false;
}

size_t Comms_Link::frame(const app_Communication& msg, std::span<uint8_t, std::dynamic_extent> out) {
	if(out.size() <= HEADER_PADDING) return 0;

	auto pb_stream = pb_ostream_from_buffer(out.data() + HEADER_PADDING, out.size() - HEADER_PADDING);
	if(!pb_encode(&pb_stream, app_Communication_fields, &msg)) return 0;
	if(pb_stream.bytes_written > 0xFFFF) return 0;

	out[0] = START_BYTE;
	Regmap_Field size_field(2, 0, 16, true, out);
	size_field = static_cast<uint32_t>(pb_stream.bytes_written);
	return pb_stream.bytes_written + HEADER_PADDING;
}

//========================== PRIVATE FUNCTIONS =======================

bool Comms_Link::serialize_transmit(app_Communication& msg) {
	//quick exit path--nobody listening
	if(!stream.connected()) return true;	//clear our thread signal

	//reset the output stream before each encode (critical!)
	auto pb_stream = pb_ostream_from_buffer(SERZ_BUFFER.data(), SERZ_BUFFER.size());

	if(!pb_encode(&pb_stream, app_Communication_fields, &msg)) {
		local_serz_err_count++;
		status_comms_encode_err_serz.publish(local_serz_err_count);
		return true; //clear our thread signal
	}

	size_t message_size = pb_stream.bytes_written;
	auto active_message = section(SERZ_BUFFER, 0, message_size);

	if(OUTBOUND_DATA.size() < (message_size + HEADER_PADDING)) {
		Debug::WARN("TX: message too large for intermediate buffer!");
		return true;
	}
	std::copy(active_message.begin(), active_message.end(), OUTBOUND_DATA.begin() + HEADER_PADDING);
	OUTBOUND_DATA[0] = START_BYTE;				//drop in start byte
	outbound_data_size = active_message.size();	//drop in size of the active message
	message_size += HEADER_PADDING;

	//no room right now, keep the signal asserted and retry on the next push
	if(stream.tx_bytes_available() < message_size) return false;

	stream.tx_bytes_write(section(OUTBOUND_DATA, 0, message_size));
	return true;
}

void Comms_Link::consume_inbound(size_t n_bytes) {
	n_bytes = std::min(n_bytes, inbound_buffer_head);
	std::copy(INBOUND_DATA.begin() + n_bytes, INBOUND_DATA.begin() + inbound_buffer_head, INBOUND_DATA.begin());
	inbound_buffer_head -= n_bytes;
}

void Comms_Link::receive_poll() {
	size_t bytes_available = stream.rx_bytes_available();
	if(bytes_available == 0) return;

	//copy as much as fits into our inbound buffer
	size_t buffer_end = std::min(inbound_buffer_head + bytes_available, INBOUND_DATA.size());
	size_t bytes_copied = stream.rx_bytes_read(section(INBOUND_DATA, inbound_buffer_head, buffer_end));
	inbound_buffer_head += bytes_copied;

	//work through every complete frame we're holding
	while(inbound_buffer_head > 0) {
		//throw away anything ahead of a start byte
		size_t start_index = 0;
		while(start_index < inbound_buffer_head && INBOUND_DATA[start_index] != START_BYTE) start_index++;
		consume_inbound(start_index);
		if(inbound_buffer_head < HEADER_PADDING) break;

		//NOTE: size counts the payload only; a zero-size frame is a keepalive
		inbound_data_size.repoint(INBOUND_DATA);
		size_t frame_end = inbound_data_size.read() + HEADER_PADDING;

		//a frame that could never fit: drop the start byte and resync
		if(frame_end > INBOUND_DATA.size()) {
			local_deserz_err_count++;
			status_comms_decode_err_deserz.publish(local_deserz_err_count);
			Debug::WARN("RX: frame larger than the receive buffer, resyncing");
			consume_inbound(1);
			continue;
		}

		//wait for the rest of it
		if(inbound_buffer_head < frame_end) break;

		if(frame_end > HEADER_PADDING) deserialize_dispatch(section(INBOUND_DATA, HEADER_PADDING, frame_end));
		consume_inbound(frame_end);
		status_comms_activity.publish(true);
	}
}

void Comms_Link::deserialize_dispatch(std::span<uint8_t, std::dynamic_extent> msg) {
	//temporary to parse into
	app_Communication message = app_Communication_init_zero;

	pb_istream_t pb_stream = pb_istream_from_buffer(msg.data(), msg.size());

	if(!pb_decode(&pb_stream, app_Communication_fields, &message)) {
		local_deserz_err_count++;
		status_comms_decode_err_deserz.publish(local_deserz_err_count);
		Debug::WARN("RX: Protobuf Deserialization Error!");
		return;
	}

	//dispatch based on message type
	//every message is an event, even if it repeats the last one
	switch(message.which_payload) {
		case app_Communication_csr_access_tag:
			comms_csr_access_outbound.publish_unconditional(message.payload.csr_access);
			break;
		case app_Communication_scratchpad_write_tag:
			comms_scratchpad_write_outbound.publish_unconditional(message.payload.scratchpad_write);
			break;
		case app_Communication_result_request_tag:
			comms_result_request_outbound.publish_unconditional(message.payload.result_request);
			break;
		case app_Communication_sim_control_tag:
			comms_sim_control_outbound.publish_unconditional(message.payload.sim_control);
			break;
		case app_Communication_debug_message_tag:
			comms_debug_outbound.publish_unconditional(message.payload.debug_message);
			break;
		default:
			local_msgtype_err_count++;
			status_comms_decode_err_msgtype.publish(local_msgtype_err_count);
			Debug::WARN("RX: Invalid Protobuf Message Type");
			break;
	}
}
