/*
 * app_stdio_stream.hpp
 *
 *  Created on: Nov 3, 2025
 *
 *  Byte stream over a pair of file descriptors (stdin/stdout by default)
 *  Reads never block: availability is polled, whatever is there gets pulled into a local buffer
 */

#pragma once

#include <vector>

#include "app_byte_stream.hpp"

class Stdio_Stream : public Byte_Stream {
public:
	static constexpr size_t READ_CHUNK = 1024;
	static constexpr size_t TX_WINDOW = 4096;

	Stdio_Stream(int _fd_in = 0, int _fd_out = 1);

	//delete copy constructor and assignment operator
	Stdio_Stream(const Stdio_Stream& other) = delete;
	void operator=(const Stdio_Stream& other) = delete;

	bool connected() override { return !input_closed; }
	size_t rx_bytes_available() override;
	size_t rx_bytes_read(std::span<uint8_t, std::dynamic_extent> dest) override;
	size_t tx_bytes_available() override { return TX_WINDOW; }
	size_t tx_bytes_write(std::span<const uint8_t, std::dynamic_extent> src) override;

private:
	const int fd_in;
	const int fd_out;
	bool input_closed = false;
	std::vector<uint8_t> pending;

	//pull anything waiting on the input into `pending`
	void fill();
};
