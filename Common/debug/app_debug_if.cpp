/*
 * app_debug_if.cpp
 *
 *  Created on: Oct 21, 2025
 */

#include "app_debug_if.hpp"

//=============================== STATIC MEMBER INITIALIZATION ================================
Debug_Interface* Debug::sink = nullptr;
Debug::Level Debug::active_level = Debug::Level::INFO;
size_t Debug::warnings = 0;
size_t Debug::errors = 0;

//=============================== CONFIGURATION ================================

void Debug::attach(Debug_Interface* _sink) { sink = _sink; }

void Debug::set_level(Level _level) { active_level = _level; }

//anything above the most verbose level just means most verbose
void Debug::set_level(uint8_t _level) {
	if(_level >= static_cast<uint8_t>(Level::TRACE)) active_level = Level::TRACE;
	else active_level = static_cast<Level>(_level);
}

Debug::Level Debug::level() { return active_level; }
bool Debug::tracing() { return sink && (active_level == Level::TRACE); }

//=============================== FORWARDING ================================
//counts happen even without a sink attached

void Debug::PRINT(Debug_Interface::Msg_t msg) {
	if(sink && (active_level >= Level::INFO)) sink->print(msg);
}

void Debug::WARN(Debug_Interface::Msg_t msg) {
	warnings++;
	if(sink) sink->warn(msg);
}

void Debug::ERROR(Debug_Interface::Msg_t msg) {
	errors++;
	if(sink) sink->error(msg);
}

void Debug::TRACE(Debug_Interface::Msg_t msg) {
	if(tracing()) sink->print(msg);
}

size_t Debug::warn_count() { return warnings; }
size_t Debug::error_count() { return errors; }
void Debug::clear_counts() { warnings = 0; errors = 0; }
