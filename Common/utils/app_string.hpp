/*
 * app_string.hpp
 *
 *  Created on: Oct 21, 2025
 *
 *  Fixed-capacity string, no heap
 *  Debug messages get passed around as these so sinks (console, protobuf) can copy them into fixed-size buffers
 */

#pragma once

#include "app_proctypes.hpp"
#include "app_utils.hpp"

template<size_t STRING_SIZE = 64, uint8_t PADDING = 0>
class App_String {
public:
	//======================== CONSTRUCTORS =======================
	constexpr App_String() : string_data{}, actual_length(0)
	{
		string_data.fill(PADDING);
	}

	//initialize with a char array
	template<size_t N>
	constexpr App_String(const char (&init)[N]) : string_data{}, actual_length(N - 1)
	{
		//literals have to fit, checked at compile time
		static_assert((N - 1) <= STRING_SIZE, "array initializer too large for string wrapper");

		//pad all characters with padding
		//and drop the rest of the characters to the beginning of the array
		string_data.fill(PADDING);
		for (size_t i = 0; i < N - 1; i++) string_data[i] = init[i];
	}

	//built-up messages (std::string concatenation) get truncated to fit
	App_String(const std::string& init) : string_data{}, actual_length(std::min(init.size(), STRING_SIZE))
	{
		string_data.fill(PADDING);
		for (size_t i = 0; i < actual_length; i++) string_data[i] = init[i];
	}

	//====================== UTILITY CONVERSIONS =======================
	//just views the valid region of the string
	std::span<const uint8_t, std::dynamic_extent> span() const {
		return std::span<const uint8_t, std::dynamic_extent>(string_data.data(), actual_length);
	}

	//copy out into a std::string for stream-style sinks
	std::string str() const { return std::string(reinterpret_cast<const char*>(string_data.data()), actual_length); }

	//======================= ACCESSORS =========================
	constexpr size_t size() const { return actual_length; }

private:
	std::array<uint8_t, STRING_SIZE> string_data;
	size_t actual_length;
};
