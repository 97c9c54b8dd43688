/*
 * app_bitstream_file.hpp
 *
 *  Created on: Nov 4, 2025
 *
 *  Configuration bitstreams on disk: whitespace separated 32-bit hex words, `#` to end of line is a comment
 *  Word 0 holds stored bits 0..31 (bit 0 in the LSB), the way the data mover puts them into the configuration store
 */

#pragma once

#include <string>
#include <vector>

#include "app_proctypes.hpp"

class Bitstream_File {
public:
	enum class Status : uint8_t {
		OK = 0,
		CANT_OPEN,
		BAD_WORD,		//token that isn't a 32-bit hex number
		TOO_LONG,		//more words than a partition holds
	};

	//parse a whole file into `words`; `max_words` bounds the result
	static Status load(const std::string& path, std::vector<uint32_t>& words, size_t max_words);

	//same, from text already in memory
	static Status parse(const std::string& text, std::vector<uint32_t>& words, size_t max_words);

	static const char* status_str(Status status);

private:
	Bitstream_File() = delete;	//don't allow instantiation
};
