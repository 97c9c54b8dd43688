/*
 * app_bitstream_file.cpp
 *
 *  Created on: Nov 4, 2025
 */

#include <fstream>
#include <sstream>
#include <cstdlib>
#include <cctype>
#include <algorithm>

#include "app_bitstream_file.hpp"
#include "app_debug_if.hpp"

Bitstream_File::Status Bitstream_File::parse(const std::string& text, std::vector<uint32_t>& words, size_t max_words) {
	words.clear();
	std::istringstream lines(text);
	std::string line;
	size_t line_number = 0;

	while(std::getline(lines, line)) {
		line_number++;
		auto comment = line.find('#');
		if(comment != std::string::npos) line.erase(comment);

		std::istringstream tokens(line);
		std::string token;
		while(tokens >> token) {
			//optional 0x prefix, at most 8 digits
			if(token.size() > 2 && token[0] == '0' && (token[1] == 'x' || token[1] == 'X')) token.erase(0, 2);
			bool hex = !token.empty() && token.size() <= 8 &&
						std::all_of(token.begin(), token.end(), [](char c) { return std::isxdigit(static_cast<unsigned char>(c)) != 0; });
			if(!hex) {
				Debug::WARN("Bitstream: bad word '" + token + "' on line " + std::to_string(line_number));
				return Status::BAD_WORD;
			}
			if(words.size() >= max_words) {
				Debug::WARN("Bitstream: more than " + std::to_string(max_words) + " words");
				return Status::TOO_LONG;
			}
			words.push_back(static_cast<uint32_t>(std::strtoul(token.c_str(), nullptr, 16)));
		}
	}
	return Status::OK;
}

Bitstream_File::Status Bitstream_File::load(const std::string& path, std::vector<uint32_t>& words, size_t max_words) {
	std::ifstream file(path);
	if(!file) {
		Debug::WARN("Bitstream: can't open " + path);
		return Status::CANT_OPEN;
	}
	std::stringstream contents;
	contents << file.rdbuf();
	return parse(contents.str(), words, max_words);
}

const char* Bitstream_File::status_str(Status status) {
	switch(status) {
	case Status::OK: return "ok";
	case Status::CANT_OPEN: return "can't open file";
	case Status::BAD_WORD: return "bad hex word";
	case Status::TOO_LONG: return "too many words";
	default: return "unknown";
	}
}
