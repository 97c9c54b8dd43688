/*
 * app_scratchpad_model.hpp
 *
 *  Created on: Oct 29, 2025
 *
 *  Staging buffer the host drops configuration bitstreams into
 *  64K words, addresses wrap at the 16-bit port width
 */

#pragma once

#include <vector>

#include "app_avalon_slave_model.hpp"

class Scratchpad_Model : public Avalon_Slave_Model {
public:
	static constexpr uint32_t SIZE_WORDS = 1u << SCRATCHPAD_ADDRESS_BITS;

	Scratchpad_Model();

	//host side, bypasses the bus
	//returns false if the block runs off the end (nothing is written then)
	bool load(uint32_t word_offset, std::span<const uint32_t> words);
	uint32_t peek(uint32_t address) const { return memory[address % SIZE_WORDS]; }
	void clear();

protected:
	uint32_t fetch(uint32_t address, Avalon_Response& response) override;

private:
	std::vector<uint32_t> memory;
};
