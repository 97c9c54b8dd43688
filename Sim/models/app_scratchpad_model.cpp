/*
 * app_scratchpad_model.cpp
 *
 *  Created on: Oct 29, 2025
 */

#include "app_scratchpad_model.hpp"
#include "app_debug_if.hpp"

Scratchpad_Model::Scratchpad_Model():
	Avalon_Slave_Model("scratchpad"),
	memory(SIZE_WORDS, 0)
{}

bool Scratchpad_Model::load(uint32_t word_offset, std::span<const uint32_t> words) {
	if(word_offset >= SIZE_WORDS || words.size() > SIZE_WORDS - word_offset) {
		Debug::WARN("Scratchpad: " + std::to_string(words.size()) + " words at " + std::to_string(word_offset) + " don't fit");
		return false;
	}
	std::copy(words.begin(), words.end(), memory.begin() + word_offset);
	return true;
}

void Scratchpad_Model::clear() {
	std::fill(memory.begin(), memory.end(), 0);
}

uint32_t Scratchpad_Model::fetch(uint32_t address, Avalon_Response& response) {
	response = Avalon_Response::OKAY;
	return memory[address % SIZE_WORDS];
}
