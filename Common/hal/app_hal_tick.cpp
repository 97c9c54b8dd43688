/*
 * app_hal_tick.cpp
 *
 *  Created on: Oct 21, 2025
 */

#include <chrono>
#include <thread>

#include "app_hal_tick.hpp"

//utility delay function
//never called by the controller model; the host link sleeps with it between polls
void Tick::delay_ms(uint32_t ms) {
	std::this_thread::sleep_for(std::chrono::milliseconds(ms));
}

