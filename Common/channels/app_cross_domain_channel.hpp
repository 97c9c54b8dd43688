/*
 * app_cross_domain_channel.hpp
 *
 *  Created on: Oct 23, 2025
 *
 *  One-slot, edge-triggered link between the control and serial clock domains
 *  	- the sending domain calls `send()`; only a CHANGE of value is ever transferred
 *  	- the receiving domain calls `sync()` once per edge, before anything reads the channel
 *  	- a changed value takes `sync_stages` receiver edges to show up (like a flop synchronizer)
 *  	- the receiver never sees the same value delivered twice in a row
 *
 *  There's exactly one value in flight. If the sender changes the value again before the first
 *  change made it across, the newer value replaces it and an overrun gets counted.
 *  The request/acknowledge protocol on top keeps changes far apart, so this shouldn't happen.
 */

#pragma once

#include "app_proctypes.hpp"
#include "app_threading.hpp"
#include "app_debug_if.hpp"

template<typename Msg_t>
class Cross_Domain_Channel {
public:
	static constexpr uint32_t MAX_SYNC_STAGES = 8;

	Cross_Domain_Channel(const char* _name, uint32_t _sync_stages = 2):
		channel_name(_name),
		sync_stages(clip<uint32_t>(_sync_stages, 1, MAX_SYNC_STAGES)),
		sender_side(Pub_Var<Msg_t>::mk()),
		receiver_side(sender_side.subscribe())
	{}

	//delete copy constructor and assignment operator
	Cross_Domain_Channel(const Cross_Domain_Channel& other) = delete;
	void operator=(const Cross_Domain_Channel& other) = delete;

	//================= SENDING DOMAIN =================
	//pub var drops unchanged values for us
	void send(const Msg_t& msg) { sender_side.publish(msg); }

	//================= RECEIVING DOMAIN =================
	//run once per receiver edge
	void sync() {
		//new value published since the last edge?
		if(receiver_side.check()) {
			if(in_flight) {
				overruns++;
				Debug::WARN(std::string("Cross_Domain_Channel: overrun on ") + channel_name);
			}
			in_flight = true;
			in_flight_msg = receiver_side.read();
			stages_left = sync_stages;
		}

		//walk the value through the synchronizer
		if(!in_flight) return;
		if(--stages_left > 0) return;
		in_flight = false;

		//suppress a repeat of what's already on the receiving side
		if(in_flight_msg == delivered_msg) return;
		delivered_msg = in_flight_msg;
		fresh = true;
		delivered_count++;
	}

	//level view: whatever made it across most recently
	const Msg_t& value() const { return delivered_msg; }

	//event view: true once per delivered change
	bool available() const { return fresh; }
	Msg_t receive() { fresh = false; return delivered_msg; }

	//================= BOTH =================
	//return to the power-on state; both sides read a default message afterwards
	void reset() {
		sender_side.publish(Msg_t());
		receiver_side.refresh();
		in_flight = false;
		in_flight_msg = Msg_t();
		delivered_msg = Msg_t();
		fresh = false;
		stages_left = 0;
	}

	uint32_t deliveries() const { return delivered_count; }
	uint32_t overrun_count() const { return overruns; }
	const char* name() const { return channel_name; }

private:
	const char* channel_name;
	uint32_t sync_stages;

	Pub_Var<Msg_t>& sender_side;
	Sub_Var<Msg_t> receiver_side;

	//synchronizer state, receiving domain only
	bool in_flight = false;
	Msg_t in_flight_msg = {};
	uint32_t stages_left = 0;

	Msg_t delivered_msg = {};
	bool fresh = false;

	uint32_t delivered_count = 0;
	uint32_t overruns = 0;
};
