/*
 * app_config_store.hpp
 *
 *  Created on: Oct 24, 2025
 *
 *  Dual-port configuration memory
 *  	- control side: one write port shared by the data mover and the pattern modifier, one word read port
 *  	- serial side: bit read port for the config writer
 *  	- one partition of `partition_words` per chip; device d starts at word d*partition_words
 *
 *  Writes get posted during a control edge and land at the end of it (`commit()`).
 *  Only one write lands per edge; data mover beats the pattern modifier.
 *  Bit b of the partition lives in word b/32, bit position b%32.
 *
 *  Also carries the mirror memory the data mover fills alongside the store.
 *  Nothing inside the controller reads the mirror back; it's exposed for inspection only.
 */

#pragma once

#include <vector>

#include "app_proctypes.hpp"
#include "app_utils.hpp"

class Config_Store {
public:
	//lower value wins
	enum class Write_Port : uint8_t {
		DATA_MOVER = 0,
		PATTERN_MODIFIER = 1,
	};
	static constexpr size_t NUM_WRITE_PORTS = 2;

	Config_Store(uint32_t _n_partitions, uint32_t _partition_words);

	//delete copy constructor and assignment operator
	Config_Store(const Config_Store& other) = delete;
	void operator=(const Config_Store& other) = delete;

	//====================== CONTROL DOMAIN ======================
	//post a write for this edge; a port posting twice in an edge keeps its last write
	void request_write(Write_Port port, uint32_t address, uint32_t data);

	//land the winning write, drop (and report) the rest
	void commit();

	uint32_t read_word(uint32_t address) const;

	//====================== SERIAL DOMAIN ======================
	bool read_bit(uint32_t bit_address) const;

	//====================== INSPECTION ======================
	uint32_t mirror_word(uint32_t address) const;
	std::span<const uint32_t> partition(uint32_t device) const;
	std::span<const uint32_t> mirror_partition(uint32_t device) const;

	//host-side preload, bypasses the write port
	//used to seed a partition without running the data mover
	void load_partition(uint32_t device, std::span<const uint32_t> words);

	uint32_t size_words() const { return static_cast<uint32_t>(storage.size()); }
	uint32_t partition_words() const { return words_per_partition; }
	uint32_t partitions() const { return n_partitions; }
	uint32_t dropped_writes() const { return dropped; }
	uint32_t committed_writes() const { return committed; }

private:
	struct Pending_Write_t {
		bool valid = false;
		uint32_t address = 0;
		uint32_t data = 0;
	};

	const uint32_t n_partitions;
	const uint32_t words_per_partition;

	std::vector<uint32_t> storage;
	std::vector<uint32_t> mirror;
	std::array<Pending_Write_t, NUM_WRITE_PORTS> pending = {};

	uint32_t dropped = 0;
	uint32_t committed = 0;
};
