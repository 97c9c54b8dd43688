/*
 * app_byte_stream.hpp
 *
 *  Created on: Nov 3, 2025
 *
 *  Byte pipe the host link runs over
 *  Non-blocking on both sides; the link polls it
 */

#pragma once

#include <deque>

#include "app_proctypes.hpp"
#include "app_utils.hpp"

class Byte_Stream {
public:
	virtual ~Byte_Stream() = default;

	//is the other end still there
	virtual bool connected() = 0;

	//receive side
	virtual size_t rx_bytes_available() = 0;
	virtual size_t rx_bytes_read(std::span<uint8_t, std::dynamic_extent> dest) = 0;

	//transmit side
	virtual size_t tx_bytes_available() = 0;
	virtual size_t tx_bytes_write(std::span<const uint8_t, std::dynamic_extent> src) = 0;
};

//================================ LOOPBACK ================================
//two ends of an in-memory pipe; whatever one end writes the other reads
//the tests and anything driving a link from the same process use this
class Loopback_Stream : public Byte_Stream {
public:
	static constexpr size_t TX_CAPACITY = 8192;

	Loopback_Stream() {}

	//delete copy constructor and assignment operator
	Loopback_Stream(const Loopback_Stream& other) = delete;
	void operator=(const Loopback_Stream& other) = delete;

	//join two ends together
	static void pair(Loopback_Stream& a, Loopback_Stream& b) { a.peer = &b; b.peer = &a; }

	bool connected() override { return peer != nullptr; }

	size_t rx_bytes_available() override { return rx_fifo.size(); }

	size_t rx_bytes_read(std::span<uint8_t, std::dynamic_extent> dest) override {
		size_t n = std::min(dest.size(), rx_fifo.size());
		for(size_t i = 0; i < n; i++) {
			dest[i] = rx_fifo.front();
			rx_fifo.pop_front();
		}
		return n;
	}

	size_t tx_bytes_available() override {
		if(!peer) return 0;
		return TX_CAPACITY - std::min(TX_CAPACITY, peer->rx_fifo.size());
	}

	size_t tx_bytes_write(std::span<const uint8_t, std::dynamic_extent> src) override {
		size_t n = std::min(src.size(), tx_bytes_available());
		for(size_t i = 0; i < n; i++) peer->rx_fifo.push_back(src[i]);
		return n;
	}

private:
	Loopback_Stream* peer = nullptr;
	std::deque<uint8_t> rx_fifo;
};
