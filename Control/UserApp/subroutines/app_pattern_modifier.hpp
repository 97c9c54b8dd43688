/*
 * app_pattern_modifier.hpp
 *
 *  Created on: Oct 25, 2025
 *
 *  Patches the threshold of all 32 channels of one device's configuration partition
 *  Read-modify-write per channel, nothing outside the 6 field bits changes:
 *  	READ32 --> READ32_PENDING (once per word the field touches)
 *  	MODIFY --> merge the bit-mirrored threshold into the word(s)
 *  	WRITE32 (once per word) --> next channel or DONE
 *
 *  READ32 puts the address on the read port, READ32_PENDING takes the data one edge later.
 *  Fields inside one word take 4 edges, straddling fields 7.
 */

#pragma once

#include "app_proctypes.hpp"
#include "app_threading.hpp"
#include "app_state_machine_library.hpp"
#include "app_config_store.hpp"
#include "app_bit_layout.hpp"

class Pattern_Modifier {
public:
	Pattern_Modifier(Config_Store& _store, const Bit_Layout& _layout);

	//delete copy constructor and assignment operator
	Pattern_Modifier(const Pattern_Modifier& other) = delete;
	void operator=(const Pattern_Modifier& other) = delete;

	void tick();
	void reset();

	LINK_FUNC(command_modifier_start);
	LINK_FUNC(status_device);
	LINK_FUNC(status_tth);
	SUBSCRIBE_FUNC(status_modifier_done);

	bool idle() const { return modifier_esm.in(modifier_state_IDLE); }
	uint32_t current_channel() const { return channel; }

private:
	Config_Store& store;
	const Bit_Layout& layout;

	//working registers
	uint32_t device_base = 0;			//first word of the partition
	uint8_t field_value = 0;			//threshold, already mirrored
	uint32_t channel = 0;
	uint32_t word_index = 0;			//0 or 1, which word of the field we're on
	uint32_t read_address = 0;
	std::array<uint32_t, 2> words = {0, 0};

	const Field_Location_t& field() const { return layout[channel]; }
	uint32_t word_address(uint32_t w) const { return device_base + field().word_start + w; }

	//##### STATE FUNCTIONS #####
	void do_idle();
	void do_begin();			//IDLE exit: latch device and threshold
	void do_read_address();		//READ32 entry
	void do_read_latch();		//READ32_PENDING
	void do_modify();
	void do_write_begin();		//WRITE32 entry
	void do_write();			//WRITE32, one word per edge
	void do_next_channel();		//WRITE32 exit
	void do_done();

	bool trans_IDLE_to_READ32()				{ return command_modifier_start.read() && !status_modifier_done.read(); }
	bool trans_READ32_to_PENDING()			{ return true; }
	bool trans_PENDING_to_READ32()			{ return word_index < field().word_count; }
	bool trans_PENDING_to_MODIFY()			{ return word_index >= field().word_count; }
	bool trans_MODIFY_to_WRITE32()			{ return true; }
	bool trans_WRITE32_to_READ32()			{ return word_index >= field().word_count && channel + 1 < Bit_Layout::N_CHANNELS; }
	bool trans_WRITE32_to_DONE()			{ return word_index >= field().word_count && channel + 1 >= Bit_Layout::N_CHANNELS; }
	bool trans_DONE_to_IDLE()				{ return !command_modifier_start.read(); }

	ESM_State modifier_state_IDLE;
	ESM_State modifier_state_READ32;
	ESM_State modifier_state_READ32_PENDING;
	ESM_State modifier_state_MODIFY;
	ESM_State modifier_state_WRITE32;
	ESM_State modifier_state_DONE;

	ESM_Transition modifier_trans_FROM_IDLE[1] = {	{&modifier_state_READ32, {BIND_CALLBACK(this, trans_IDLE_to_READ32)}	}	};
	ESM_Transition modifier_trans_FROM_READ32[1] = {	{&modifier_state_READ32_PENDING, {BIND_CALLBACK(this, trans_READ32_to_PENDING)}	}	};
	ESM_Transition modifier_trans_FROM_PENDING[2] = {	{&modifier_state_READ32, {BIND_CALLBACK(this, trans_PENDING_to_READ32)}	},
														{&modifier_state_MODIFY, {BIND_CALLBACK(this, trans_PENDING_to_MODIFY)}	}	};
	ESM_Transition modifier_trans_FROM_MODIFY[1] = {	{&modifier_state_WRITE32, {BIND_CALLBACK(this, trans_MODIFY_to_WRITE32)}	}	};
	ESM_Transition modifier_trans_FROM_WRITE32[2] = {	{&modifier_state_READ32, {BIND_CALLBACK(this, trans_WRITE32_to_READ32)}	},
														{&modifier_state_DONE, {BIND_CALLBACK(this, trans_WRITE32_to_DONE)}	}	};
	ESM_Transition modifier_trans_FROM_DONE[1] = {	{&modifier_state_IDLE, {BIND_CALLBACK(this, trans_DONE_to_IDLE)}	}	};

	Extended_State_Machine modifier_esm;

	//###### STATE VARIABLES #######
	Sub_Var<bool> command_modifier_start;
	Sub_Var<uint8_t> status_device;
	Sub_Var<uint8_t> status_tth;
	PERSISTENT((Pub_Var<bool>), status_modifier_done);
};
