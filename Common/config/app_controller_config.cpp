/*
 * app_controller_config.cpp
 *
 *  Created on: Oct 23, 2025
 */

#include "app_controller_config.hpp"

Controller_Config_t::Status Controller_Config_t::validate() const {
	if(n_mutrig < 1 || n_mutrig > N_MUTRIG_MAX) return Status::BAD_N_MUTRIG;
	if(	variant != MuTRiG_Variant::MUTRIG1 &&
		variant != MuTRiG_Variant::MUTRIG2 &&
		variant != MuTRiG_Variant::MUTRIG3) return Status::BAD_VARIANT;
	if(clk_frequency_hz < 1 || clk_frequency_hz > MAX_CLK_FREQUENCY_HZ) return Status::BAD_CLOCK;
	if(clk_frequency_spi_hz < 1 || clk_frequency_spi_hz > MAX_SPI_FREQUENCY_HZ) return Status::BAD_SPI_CLOCK;
	if(counter_base_word > 0x7FFF'FFFF) return Status::BAD_COUNTER_BASE;
	if(sel_subroutines > SEL_BOTH) return Status::BAD_SEL_SUBROUTINES;
	if(debug_level > 2) return Status::BAD_DEBUG_LEVEL;
	if(cpol != 0 || cpha != 0) return Status::BAD_SPI_MODE;
	if(spi_settle_cycles < 1 || sclr_delay_cycles < 1 || bus_timeout_cycles < 1) return Status::BAD_TIMING;
	//the rate monitor waits window + margin control cycles, counted in 32 bits
	if(static_cast<uint64_t>(monitor_window()) + monitor_margin_cycles > UINT32_MAX) return Status::BAD_MONITOR_WINDOW;
	if(sync_stages < 1 || sync_stages > MAX_SYNC_STAGES) return Status::BAD_SYNC_STAGES;
	return Status::OK;
}

const char* Controller_Config_t::status_str(Status status) {
	switch(status) {
	case Status::OK:					return "ok";
	case Status::BAD_N_MUTRIG:			return "n_mutrig must be 1..128";
	case Status::BAD_VARIANT:			return "variant must be 1, 2 or 3";
	case Status::BAD_CLOCK:				return "control clock must be 1Hz..1GHz";
	case Status::BAD_SPI_CLOCK:			return "serial clock must be 1Hz..80MHz";
	case Status::BAD_COUNTER_BASE:		return "counter base address out of range";
	case Status::BAD_SEL_SUBROUTINES:	return "sel_subroutines must be 0, 1 or 2";
	case Status::BAD_DEBUG_LEVEL:		return "debug level must be 0, 1 or 2";
	case Status::BAD_SPI_MODE:			return "only cpol=0/cpha=0 is supported";
	case Status::BAD_TIMING:			return "settle/sclr/timeout cycles must be at least 1";
	case Status::BAD_MONITOR_WINDOW:	return "monitor window plus margin must fit in 32 bits";
	case Status::BAD_SYNC_STAGES:		return "sync stages must be 1..8";
	default:							return "unknown";
	}
}

bool Controller_Config_t::command_enabled(Command_Code code) const {
	switch(code) {
	case Command_Code::CONFIGURE:	return mcc_enabled();
	case Command_Code::SCAN_ONE:
	case Command_Code::SCAN_ALL:	return tsa_enabled();
	default:						return false;
	}
}
