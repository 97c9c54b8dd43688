/*
 * app_config_writer.hpp
 *
 *  Created on: Oct 26, 2025
 *
 *  Serial-domain half of the controller: shifts one device's configuration out on the serial bus
 *
 *  Every write goes out twice:
 *  	IDLE --> INIT --> STARTING --> WRITING --> FINISHING --> PAUSE --> PAUSING --> INIT (second pass)
 *  	     ... --> FINISHING --> PAUSE --> VALIDATING --> IDLE, done
 *  	- INIT pulls the chip select of the target low
 *  	- STARTING/PAUSING hold everything quiet for the settle window
 *  	- WRITING: one bit per two edges; low phase raises sclk and counts the bit, high phase drops sclk and puts up the next bit
 *  	- bits come out last-stored-first: bit i of the frame is partition bit (rounded_length - 1 - i)
 *  	- VALIDATING is where a readback check would go; it doesn't compare anything
 *
 *  Start/done come and go over the cross-domain channels; done stays up until start drops.
 */

#pragma once

#include "app_proctypes.hpp"
#include "app_threading.hpp"
#include "app_state_machine_library.hpp"
#include "app_timed_wait.hpp"
#include "app_cross_domain_channel.hpp"
#include "app_channel_messages.hpp"
#include "app_controller_config.hpp"
#include "app_config_store.hpp"
#include "app_spi_bus.hpp"

class Config_Writer {
public:
	static constexpr uint32_t PASSES_PER_WRITE = 2;

	Config_Writer(	const Controller_Config_t& _config,
					const Config_Store& _store,
					Cross_Domain_Channel<Cfg_Write_Request_t>& _from_control,
					Cross_Domain_Channel<Cfg_Write_Response_t>& _to_control);

	//delete copy constructor and assignment operator
	Config_Writer(const Config_Writer& other) = delete;
	void operator=(const Config_Writer& other) = delete;

	//run one serial edge: sync the request channel, step, drive the pins
	void tick();
	void reset();

	SUBSCRIBE_FUNC(spi_pins);

	bool idle() const { return writer_esm.in(writer_state_IDLE); }
	uint32_t frames_written() const { return frame_count; }
	uint32_t bits_sent() const { return bit_counter; }

private:
	const uint32_t n_devices;
	const uint32_t rounded_bits;		//bits per frame
	const uint32_t partition_bits;
	const Config_Store& store;
	Cross_Domain_Channel<Cfg_Write_Request_t>& from_control;
	Cross_Domain_Channel<Cfg_Write_Response_t>& to_control;

	Timed_Wait settle_wait;

	//working registers
	uint8_t device = 0;
	uint32_t pass = 0;
	uint32_t bit_counter = 0;
	uint32_t frame_count = 0;
	bool done = false;
	bool error = false;
	uint8_t error_info = Cfg_Write_Response_t::ERR_NONE;
	bool settled = false;
	Spi_Master_Pins_t pins = {};

	//frame bit `i`, straight out of the store
	bool frame_bit(uint32_t i) const;
	void respond();

	//##### STATE FUNCTIONS #####
	void do_idle();
	void do_accept();				//IDLE exit
	void do_init();
	void do_settle_begin();			//STARTING/PAUSING entry
	void do_settle();
	void do_first_bit();			//STARTING exit
	void do_write_begin();
	void do_write();
	void do_finish();
	void do_pause();
	void do_validate();

	bool trans_IDLE_to_INIT()				{ return from_control.value().start && !done; }
	bool trans_INIT_to_VALIDATING()			{ return error; }
	bool trans_INIT_to_STARTING()			{ return !error; }
	bool trans_SETTLED()					{ return settled; }
	bool trans_WRITING_to_FINISHING()		{ return bit_counter >= rounded_bits && !pins.sclk; }
	bool trans_FINISHING_to_PAUSE()			{ return true; }
	bool trans_PAUSE_to_PAUSING()			{ return pass < PASSES_PER_WRITE; }
	bool trans_PAUSE_to_VALIDATING()		{ return pass >= PASSES_PER_WRITE; }
	bool trans_VALIDATING_to_IDLE()			{ return true; }

	ESM_State writer_state_IDLE;
	ESM_State writer_state_INIT;
	ESM_State writer_state_STARTING;
	ESM_State writer_state_WRITING;
	ESM_State writer_state_FINISHING;
	ESM_State writer_state_PAUSE;
	ESM_State writer_state_PAUSING;
	ESM_State writer_state_VALIDATING;

	ESM_Transition writer_trans_FROM_IDLE[1] = {	{&writer_state_INIT, {BIND_CALLBACK(this, trans_IDLE_to_INIT)}	}	};
	ESM_Transition writer_trans_FROM_INIT[2] = {	{&writer_state_VALIDATING, {BIND_CALLBACK(this, trans_INIT_to_VALIDATING)}	},
													{&writer_state_STARTING, {BIND_CALLBACK(this, trans_INIT_to_STARTING)}		}	};
	ESM_Transition writer_trans_FROM_STARTING[1] = {	{&writer_state_WRITING, {BIND_CALLBACK(this, trans_SETTLED)}	}	};
	ESM_Transition writer_trans_FROM_WRITING[1] = {	{&writer_state_FINISHING, {BIND_CALLBACK(this, trans_WRITING_to_FINISHING)}	}	};
	ESM_Transition writer_trans_FROM_FINISHING[1] = {	{&writer_state_PAUSE, {BIND_CALLBACK(this, trans_FINISHING_to_PAUSE)}	}	};
	ESM_Transition writer_trans_FROM_PAUSE[2] = {	{&writer_state_PAUSING, {BIND_CALLBACK(this, trans_PAUSE_to_PAUSING)}		},
													{&writer_state_VALIDATING, {BIND_CALLBACK(this, trans_PAUSE_to_VALIDATING)}	}	};
	ESM_Transition writer_trans_FROM_PAUSING[1] = {	{&writer_state_INIT, {BIND_CALLBACK(this, trans_SETTLED)}	}	};
	ESM_Transition writer_trans_FROM_VALIDATING[1] = {	{&writer_state_IDLE, {BIND_CALLBACK(this, trans_VALIDATING_to_IDLE)}	}	};

	Extended_State_Machine writer_esm;

	//###### STATE VARIABLES #######
	PERSISTENT((Pub_Var<Spi_Master_Pins_t>), spi_pins);
};
