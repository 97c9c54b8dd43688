/*
 * app_spi_bus.hpp
 *
 *  Created on: Oct 23, 2025
 *
 *  Serial bus pins between the config writer and the MuTRiG chips
 *  Mode 0 only: sclk idles low, mosi changes while sclk is low, chips sample on the rising edge
 */

#pragma once

#include "app_proctypes.hpp"

//driven by the config writer
//one chip select line per chip; at most one of them is ever low, so carry it as an index
struct Spi_Master_Pins_t {
	bool cs_active = false;		//true --> ssn[cs_device] is low
	uint8_t cs_device = 0;
	bool sclk = false;
	bool mosi = false;

	//state of the active-low chip select line of `device`
	bool ssn(uint8_t device) const { return !(cs_active && cs_device == device); }

	bool operator==(const Spi_Master_Pins_t& other) const = default;
};
