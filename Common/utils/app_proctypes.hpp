/*
 * app_proctypes.hpp
 *
 *	Looks kinda stupid, but basically provide a central place where common datatypes are defined
 *	And also global data types related to the machine running the controller model
 *
 *  Created on: Oct 20, 2025
 */

#pragma once

#include <cstdint>	//uintxx_t types
#include <cstddef>	//size_t
#include <stdbool.h>

//flag that shares byte ordering on the particular compiled processor
//useful for when we're reliant on endianness for buffer creation/byte ordering
constexpr bool PROCESSOR_IS_BIG_ENDIAN = false;
