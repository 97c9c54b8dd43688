/*
 * app_config_store.cpp
 *
 *  Created on: Oct 24, 2025
 */

#include "app_config_store.hpp"
#include "app_debug_if.hpp"

Config_Store::Config_Store(uint32_t _n_partitions, uint32_t _partition_words):
	n_partitions(_n_partitions),
	words_per_partition(_partition_words),
	storage(static_cast<size_t>(_n_partitions) * _partition_words, 0),
	mirror(static_cast<size_t>(_n_partitions) * _partition_words, 0)
{}

void Config_Store::request_write(Write_Port port, uint32_t address, uint32_t data) {
	auto& slot = pending[static_cast<size_t>(port)];
	slot.valid = true;
	slot.address = address;
	slot.data = data;
}

void Config_Store::commit() {
	bool landed = false;
	for(size_t port = 0; port < NUM_WRITE_PORTS; port++) {
		auto& slot = pending[port];
		if(!slot.valid) continue;
		slot.valid = false;

		//someone with higher priority already wrote this edge
		if(landed) {
			dropped++;
			Debug::WARN("Config_Store: pattern modifier write dropped, data mover owns the port");
			continue;
		}
		landed = true;

		if(slot.address >= storage.size()) {
			dropped++;
			Debug::WARN("Config_Store: write outside of the store dropped, address " + std::to_string(slot.address));
			continue;
		}

		storage[slot.address] = slot.data;
		if(port == static_cast<size_t>(Write_Port::DATA_MOVER)) mirror[slot.address] = slot.data;
		committed++;
	}
}

uint32_t Config_Store::read_word(uint32_t address) const {
	if(address >= storage.size()) {
		Debug::WARN("Config_Store: read outside of the store, address " + std::to_string(address));
		return 0;
	}
	return storage[address];
}

bool Config_Store::read_bit(uint32_t bit_address) const {
	uint32_t word = bit_address / 32;
	if(word >= storage.size()) {
		Debug::WARN("Config_Store: bit read outside of the store, bit " + std::to_string(bit_address));
		return false;
	}
	return (storage[word] >> (bit_address % 32)) & 0x1;
}

uint32_t Config_Store::mirror_word(uint32_t address) const {
	if(address >= mirror.size()) return 0;
	return mirror[address];
}

std::span<const uint32_t> Config_Store::partition(uint32_t device) const {
	if(device >= n_partitions) return {};
	return std::span<const uint32_t>(storage.data() + static_cast<size_t>(device) * words_per_partition, words_per_partition);
}

std::span<const uint32_t> Config_Store::mirror_partition(uint32_t device) const {
	if(device >= n_partitions) return {};
	return std::span<const uint32_t>(mirror.data() + static_cast<size_t>(device) * words_per_partition, words_per_partition);
}

void Config_Store::load_partition(uint32_t device, std::span<const uint32_t> words) {
	if(device >= n_partitions) {
		Debug::WARN("Config_Store: preload of a partition that doesn't exist");
		return;
	}
	size_t n = std::min<size_t>(words.size(), words_per_partition);
	std::copy(words.begin(), words.begin() + n, storage.begin() + static_cast<size_t>(device) * words_per_partition);
}
