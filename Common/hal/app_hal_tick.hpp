/*
 * app_hal_tick.hpp
 *
 *  Created on: Oct 21, 2025
 *
 *  Wall-clock tick for the host build
 *  Only the host link idles on it; simulated time lives in the clock tree
 */

#pragma once

#include "app_proctypes.hpp"

class Tick {
public:
	static void delay_ms(uint32_t ms);

private:
	Tick(); //don't allow instantiation of a timer class
};
