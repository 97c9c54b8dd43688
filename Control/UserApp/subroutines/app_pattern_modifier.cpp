/*
 * app_pattern_modifier.cpp
 *
 *  Created on: Oct 25, 2025
 */

#include "app_pattern_modifier.hpp"
#include "app_write_mask.hpp"

Pattern_Modifier::Pattern_Modifier(Config_Store& _store, const Bit_Layout& _layout):
	store(_store),
	layout(_layout),
	modifier_state_IDLE({}, BIND_CALLBACK(this, do_idle), BIND_CALLBACK(this, do_begin), "IDLE"),
	modifier_state_READ32(BIND_CALLBACK(this, do_read_address), {}, {}, "READ32"),
	modifier_state_READ32_PENDING({}, BIND_CALLBACK(this, do_read_latch), {}, "READ32_PENDING"),
	modifier_state_MODIFY({}, BIND_CALLBACK(this, do_modify), {}, "MODIFY"),
	modifier_state_WRITE32(BIND_CALLBACK(this, do_write_begin), BIND_CALLBACK(this, do_write), BIND_CALLBACK(this, do_next_channel), "WRITE32"),
	modifier_state_DONE(BIND_CALLBACK(this, do_done), {}, {}, "DONE"),
	modifier_esm(&modifier_state_IDLE, "pattern modifier")
{
	modifier_state_IDLE.attach_state_transitions(modifier_trans_FROM_IDLE);
	modifier_state_READ32.attach_state_transitions(modifier_trans_FROM_READ32);
	modifier_state_READ32_PENDING.attach_state_transitions(modifier_trans_FROM_PENDING);
	modifier_state_MODIFY.attach_state_transitions(modifier_trans_FROM_MODIFY);
	modifier_state_WRITE32.attach_state_transitions(modifier_trans_FROM_WRITE32);
	modifier_state_DONE.attach_state_transitions(modifier_trans_FROM_DONE);
}

void Pattern_Modifier::tick() {
	modifier_esm.RUN_ESM();
}

void Pattern_Modifier::reset() {
	modifier_esm.RESET_ESM();
	status_modifier_done.publish(false);
	device_base = 0;
	field_value = 0;
	channel = 0;
	word_index = 0;
	read_address = 0;
	words = {0, 0};
}

//================================= STATE FUNCTIONS =================================

void Pattern_Modifier::do_idle() {
	if(!command_modifier_start.read()) status_modifier_done.publish(false);
}

void Pattern_Modifier::do_begin() {
	device_base = static_cast<uint32_t>(status_device.read()) * store.partition_words();
	field_value = reverse_field_bits(status_tth.read() & FIELD_MASK);
	channel = 0;
	word_index = 0;
}

void Pattern_Modifier::do_read_address() {
	read_address = word_address(word_index);
}

void Pattern_Modifier::do_read_latch() {
	//address has been sitting on the port for an edge, data is good
	words[word_index] = store.read_word(read_address);
	word_index++;
}

void Pattern_Modifier::do_modify() {
	const auto& loc = field();
	words[0] = Write_Mask::merge(words[0], field_value, loc.lsb[0]);
	if(loc.straddles()) words[1] = Write_Mask::merge(words[1], field_value, loc.lsb[1]);
}

void Pattern_Modifier::do_write_begin() {
	word_index = 0;
}

void Pattern_Modifier::do_write() {
	//single-word fields never get here a second time
	if(word_index >= field().word_count) return;
	store.request_write(Config_Store::Write_Port::PATTERN_MODIFIER, word_address(word_index), words[word_index]);
	word_index++;
}

void Pattern_Modifier::do_next_channel() {
	word_index = 0;
	if(channel + 1 < Bit_Layout::N_CHANNELS) channel++;
}

void Pattern_Modifier::do_done() {
	status_modifier_done.publish(true);
}
