/*
 * ControllerTests.cpp
 *
 *  Created on: Nov 9, 2025
 *
 *  Whole controller in the co-simulation: configuration checks, MCC configure runs, reset, the MCC trap
 */

#include <gtest/gtest.h>

#include <memory>
#include <vector>

#include "app_co_simulation.hpp"
#include "Test_Fixtures.hpp"

//==============================================================================
// Configuration
//==============================================================================

TEST(ControllerConfigTests, DefaultsAreValid) {
	Controller_Config_t config = {};
	EXPECT_EQ(config.validate(), Controller_Config_t::Status::OK);
	EXPECT_EQ(small_config().validate(), Controller_Config_t::Status::OK);
}

TEST(ControllerConfigTests, EveryParameterIsChecked) {
	using Status = Controller_Config_t::Status;
	struct Case_t {
		void (*mutate)(Controller_Config_t&);
		Status expected;
	};
	const Case_t cases[] = {
		{[](Controller_Config_t& c) { c.n_mutrig = 0; },							Status::BAD_N_MUTRIG},
		{[](Controller_Config_t& c) { c.n_mutrig = 129; },							Status::BAD_N_MUTRIG},
		{[](Controller_Config_t& c) { c.variant = static_cast<MuTRiG_Variant>(4); },	Status::BAD_VARIANT},
		{[](Controller_Config_t& c) { c.clk_frequency_hz = 0; },					Status::BAD_CLOCK},
		{[](Controller_Config_t& c) { c.clk_frequency_spi_hz = 100'000'000; },		Status::BAD_SPI_CLOCK},
		{[](Controller_Config_t& c) { c.sel_subroutines = 3; },						Status::BAD_SEL_SUBROUTINES},
		{[](Controller_Config_t& c) { c.debug_level = 3; },							Status::BAD_DEBUG_LEVEL},
		{[](Controller_Config_t& c) { c.cpha = 1; },								Status::BAD_SPI_MODE},
		{[](Controller_Config_t& c) { c.bus_timeout_cycles = 0; },					Status::BAD_TIMING},
		{[](Controller_Config_t& c) { c.monitor_window_cycles = 0xFFFF'FFFF; c.monitor_margin_cycles = 5; },	Status::BAD_MONITOR_WINDOW},
		{[](Controller_Config_t& c) { c.sync_stages = 9; },							Status::BAD_SYNC_STAGES},
	};

	for(const auto& test_case : cases) {
		Controller_Config_t config = small_config();
		test_case.mutate(config);
		EXPECT_EQ(config.validate(), test_case.expected) << Controller_Config_t::status_str(test_case.expected);
	}
}

TEST(ControllerConfigTests, DerivedSizes) {
	Controller_Config_t config = small_config(4, MuTRiG_Variant::MUTRIG1);
	EXPECT_EQ(config.cfg_length_words(), 74u);
	EXPECT_EQ(config.cfg_length_rounded_bits(), 74u * 32u);
	EXPECT_EQ(config.partition_words(), 128u);
	EXPECT_EQ(config.result_words(), 64u * 4u * 32u);
	EXPECT_EQ(config.monitor_window(), 16u);

	config.monitor_window_cycles = 0;
	EXPECT_EQ(config.monitor_window(), config.clk_frequency_hz);
}

TEST(ControllerConfigTests, MonitorWindowPlusMarginFits) {
	Controller_Config_t config = small_config();
	config.monitor_window_cycles = 0xFFFF'FFFA;
	config.monitor_margin_cycles = 5;
	EXPECT_EQ(config.validate(), Controller_Config_t::Status::OK);

	config.monitor_margin_cycles = 6;
	EXPECT_EQ(config.validate(), Controller_Config_t::Status::BAD_MONITOR_WINDOW);

	//derived window is the control clock; margin still has to fit on top of it
	config.monitor_window_cycles = 0;
	config.clk_frequency_hz = Controller_Config_t::MAX_CLK_FREQUENCY_HZ;
	config.monitor_margin_cycles = 0xFFFF'FFFF - Controller_Config_t::MAX_CLK_FREQUENCY_HZ + 1;
	EXPECT_EQ(config.validate(), Controller_Config_t::Status::BAD_MONITOR_WINDOW);
}

TEST(ControllerConfigTests, BadConfigurationNeverRuns) {
	Controller_Config_t config = small_config();
	config.n_mutrig = 0;
	Co_Simulation sim(config);

	EXPECT_EQ(sim.init(), Controller_Config_t::Status::BAD_N_MUTRIG);
	EXPECT_FALSE(sim.get_controller().ready());
	EXPECT_FALSE(sim.run_until_idle(10));
	EXPECT_EQ(sim.control_cycles(), 0u);
}

//==============================================================================
// Configure runs
//==============================================================================

class ControllerTests : public ::testing::Test {
protected:
	Controller_Config_t config = small_config(2);
	Co_Simulation sim{config};

	void SetUp() override {
		ASSERT_EQ(sim.init(), Controller_Config_t::Status::OK);
	}

	MuTRiG_Controller& controller() { return sim.get_controller(); }

	bool configure(uint8_t device, const std::vector<uint32_t>& bitstream, uint32_t offset) {
		if(!sim.load_scratchpad(offset, bitstream)) return false;
		if(!sim.issue_command(Command_Code::CONFIGURE, device, static_cast<uint16_t>(bitstream.size()), offset)) return false;
		return sim.run_until_idle(50'000);
	}

	void expect_chip_holds(uint8_t device, const std::vector<uint32_t>& bitstream) {
		auto& chip = sim.get_chip(device);
		for(uint32_t b = 0; b < config.cfg_length_bits(); b++) {
			ASSERT_EQ(chip.register_bit(b), word_bit(bitstream, b)) << "device " << int(device) << ", bit " << b;
		}
		for(uint32_t c = 0; c < Bit_Layout::N_CHANNELS; c++) {
			EXPECT_EQ(chip.threshold(c), controller().get_layout().decode(bitstream, c));
		}
	}
};

TEST_F(ControllerTests, ConfigureOneDevice) {
	auto bitstream = make_bitstream(config, 41);
	ASSERT_TRUE(configure(1, bitstream, 500));

	//partition holds the bitstream, the rest stays clear
	auto partition = controller().get_config_store().partition(1);
	for(size_t i = 0; i < bitstream.size(); i++) ASSERT_EQ(partition[i], bitstream[i]) << "word " << i;
	for(size_t i = bitstream.size(); i < partition.size(); i++) ASSERT_EQ(partition[i], 0u);

	//the same frame twice, and the chip ends up holding the bitstream
	auto& chip = sim.get_chip(1);
	ASSERT_EQ(chip.frames_received(), 2u);
	EXPECT_EQ(chip.last_frame().size(), config.cfg_length_rounded_bits());
	EXPECT_EQ(chip.previous_frame(), chip.last_frame());
	expect_chip_holds(1, bitstream);

	EXPECT_EQ(sim.get_chip(0).frames_received(), 0u);
	EXPECT_EQ(sim.csr_read(Csr_Block::STATUS), Csr_Block::COMPLETION_OK);
	EXPECT_FALSE(controller().get_mcc().subscribe_status_mcc_exception().read());
}

TEST_F(ControllerTests, DevicesKeepTheirOwnConfiguration) {
	auto first = make_bitstream(config, 42);
	auto second = make_bitstream(config, 43);
	ASSERT_TRUE(configure(0, first, 0));
	ASSERT_TRUE(configure(1, second, 1000));

	expect_chip_holds(0, first);
	expect_chip_holds(1, second);
	EXPECT_EQ(sim.get_chip(0).frames_received(), 2u);
	EXPECT_EQ(sim.get_chip(1).frames_received(), 2u);
}

TEST_F(ControllerTests, OnlyTheConfigControllerRunsDuringConfigure) {
	auto mcc_busy = controller().get_mcc().subscribe_status_mcc_busy();
	auto tsa_busy = controller().get_tsa().subscribe_status_tsa_busy();
	auto bitstream = make_bitstream(config, 44);
	ASSERT_TRUE(sim.load_scratchpad(0, bitstream));
	ASSERT_TRUE(sim.issue_command(Command_Code::CONFIGURE, 0, static_cast<uint16_t>(bitstream.size())));

	bool saw_mcc = false;
	bool saw_owner = false;
	for(int i = 0; i < 50'000; i++) {
		sim.run_cycles(1);
		ASSERT_FALSE(tsa_busy.read()) << "edge " << i;
		ASSERT_NE(controller().get_arbiter().owner(), Cfg_Arbiter::Owner::TSA) << "edge " << i;
		saw_mcc |= mcc_busy.read();
		saw_owner |= controller().get_arbiter().owner() == Cfg_Arbiter::Owner::MCC;
		if(controller().all_idle()) break;
	}
	EXPECT_TRUE(saw_mcc);
	EXPECT_TRUE(saw_owner);
	EXPECT_TRUE(controller().all_idle());
}

TEST_F(ControllerTests, ResetMidConfigure) {
	auto bitstream = make_bitstream(config, 45);
	ASSERT_TRUE(sim.load_scratchpad(0, bitstream));
	ASSERT_TRUE(sim.issue_command(Command_Code::CONFIGURE, 0, static_cast<uint16_t>(bitstream.size())));
	sim.run_cycles(2000);
	ASSERT_TRUE(controller().busy());
	ASSERT_TRUE(sim.get_chip(0).selected());

	sim.reset();
	EXPECT_TRUE(controller().all_idle());
	EXPECT_FALSE(controller().busy());
	EXPECT_EQ(sim.csr_read(Csr_Block::STATUS), Csr_Block::COMPLETION_OK);
	sim.run_cycles(10);
	EXPECT_FALSE(sim.get_chip(0).selected());

	//store keeps what the mover already copied; a fresh run finishes normally
	ASSERT_TRUE(sim.issue_command(Command_Code::CONFIGURE, 0, static_cast<uint16_t>(bitstream.size())));
	ASSERT_TRUE(sim.run_until_idle(50'000));
	expect_chip_holds(0, bitstream);
}

//==============================================================================
// MCC trap, on its own
//==============================================================================

TEST(ConfigControllerTests, StaleMoverDoneTraps) {
	Config_Controller mcc;
	PERSISTENT((Pub_Var<Routine_Request_t>), rpc);
	PERSISTENT((Pub_Var<bool>), mover_done);
	PERSISTENT((Pub_Var<bool>), cfg_done);
	mcc.link_status_rpc(rpc.subscribe());
	mcc.link_status_mover_done(mover_done.subscribe());
	mcc.link_status_cfg_done(cfg_done.subscribe());
	auto exception = mcc.subscribe_status_mcc_exception();
	auto mover_start = mcc.subscribe_command_mover_start();

	//mover claims to be done before anyone asked
	mover_done.publish(true);
	rpc.publish({Command_Code::CONFIGURE, 0, 74, true});

	ASSERT_TRUE(step_until([&] { mcc.tick(); }, [&] { return exception.read(); }, 10));
	EXPECT_TRUE(mcc.trapped());
	EXPECT_FALSE(mover_start.read());

	//nothing gets it out, not even the request going away
	rpc.publish({});
	mover_done.publish(false);
	for(int i = 0; i < 100; i++) mcc.tick();
	EXPECT_TRUE(mcc.trapped());
	EXPECT_TRUE(exception.read());

	mcc.reset();
	EXPECT_TRUE(mcc.idle());
	EXPECT_FALSE(exception.read());
}
