/*
 * ScanTests.cpp
 *
 *  Created on: Nov 9, 2025
 *
 *  Threshold scans end to end
 *  Counter model: every channel gains (64 - threshold) hits per control edge from the last counter clear,
 *  so a clean scan gives result(tth, device, channel) = (64 - tth) * k_device, k fixed by when the device is read.
 */

#include <gtest/gtest.h>

#include <memory>
#include <set>
#include <vector>

#include "app_co_simulation.hpp"
#include "Test_Fixtures.hpp"

static constexpr uint64_t CONFIGURE_BUDGET = 50'000;
static constexpr uint64_t SCAN_BUDGET = 3'000'000;

static bool configure(Co_Simulation& sim, uint8_t device, const std::vector<uint32_t>& bitstream, uint32_t offset) {
	if(!sim.load_scratchpad(offset, bitstream)) return false;
	if(!sim.issue_command(Command_Code::CONFIGURE, device, static_cast<uint16_t>(bitstream.size()), offset)) return false;
	return sim.run_until_idle(CONFIGURE_BUDGET);
}

//every result of one device is (64 - tth) times the same nonzero factor; returns the factor
static uint32_t check_rate_rows(Co_Simulation& sim, uint32_t device) {
	const auto& results = sim.get_controller().get_result_store();
	uint32_t k = results.read(0, device, 0) / Controller_Config_t::THRESHOLD_STEPS;
	EXPECT_GT(k, 0u) << "device " << device;

	for(uint32_t t = 0; t < Controller_Config_t::THRESHOLD_STEPS; t++) {
		for(uint32_t c = 0; c < Controller_Config_t::CHANNELS_PER_DEVICE; c++) {
			uint32_t want = (Controller_Config_t::THRESHOLD_STEPS - t) * k;
			EXPECT_EQ(results.read(t, device, c), want) << "tth " << t << ", device " << device << ", channel " << c;
			if(results.read(t, device, c) != want) return k;
		}
	}
	return k;
}

//every bit outside the threshold fields still matches what got configured
static void check_outside_fields(Co_Simulation& sim, uint32_t device, const std::vector<uint32_t>& bitstream) {
	const auto& layout = sim.get_controller().get_layout();
	std::set<uint32_t> field_bits;
	for(const auto& loc : layout.entries()) {
		for(uint32_t b = loc.bit_start; b <= loc.bit_end; b++) field_bits.insert(b);
	}

	auto partition = sim.get_controller().get_config_store().partition(device);
	auto& chip = sim.get_chip(device);
	for(uint32_t b = 0; b < layout.variant_layout().cfg_length_bits; b++) {
		if(field_bits.count(b)) continue;
		ASSERT_EQ(word_bit(partition, b), word_bit(bitstream, b)) << "partition bit " << b;
		ASSERT_EQ(chip.register_bit(b), word_bit(bitstream, b)) << "register bit " << b;
	}
}

//==============================================================================
// Single device
//==============================================================================

class ScanOneTests : public ::testing::Test {
protected:
	Controller_Config_t config = small_config(2);
	Co_Simulation sim{config};
	std::vector<uint32_t> bitstream = make_bitstream(config, 51);

	void SetUp() override {
		ASSERT_EQ(sim.init(), Controller_Config_t::Status::OK);
		ASSERT_TRUE(configure(sim, 1, bitstream, 0));
	}

	MuTRiG_Controller& controller() { return sim.get_controller(); }
};

TEST_F(ScanOneTests, SweepsEveryThreshold) {
	auto mcc_busy = controller().get_mcc().subscribe_status_mcc_busy();
	auto tsa_busy = controller().get_tsa().subscribe_status_tsa_busy();
	ASSERT_TRUE(sim.issue_command(Command_Code::SCAN_ONE, 1));

	//step it by hand: one routine at a time, progress only ever goes up while the TSA runs
	//and reads 0 again once it's back in IDLE waiting for the acknowledge to finish
	uint32_t last_progress = 0;
	bool saw_wrap_up = false;
	bool finished = false;
	for(uint64_t i = 0; i < SCAN_BUDGET && !finished; i++) {
		sim.run_cycles(1);
		ASSERT_FALSE(mcc_busy.read() && tsa_busy.read()) << "edge " << i;
		ASSERT_NE(controller().get_arbiter().owner(), Cfg_Arbiter::Owner::MCC) << "edge " << i;

		if(controller().busy()) {
			uint32_t status = sim.csr_read(Csr_Block::STATUS);
			ASSERT_EQ(status & 0xFFFF'0000, 0x0141'0000u) << "edge " << i;
			if(controller().get_tsa().idle()) {
				ASSERT_EQ(status & 0xFFFF, 0u) << "edge " << i;
				saw_wrap_up |= last_progress == Scan_Automation::TTH_LAST;
			}
			else {
				ASSERT_GE(status & 0xFF, last_progress) << "edge " << i;
				last_progress = status & 0xFF;
			}
		}
		finished = controller().all_idle();
	}
	ASSERT_TRUE(finished);
	EXPECT_EQ(last_progress, Scan_Automation::TTH_LAST);
	EXPECT_TRUE(saw_wrap_up);
	EXPECT_EQ(sim.csr_read(Csr_Block::STATUS), Csr_Block::COMPLETION_OK);

	//rewritten once per threshold, on top of the configure run
	EXPECT_EQ(sim.get_chip(1).frames_received(), 2u + 2u * Controller_Config_t::THRESHOLD_STEPS);
	EXPECT_EQ(sim.get_chip(0).frames_received(), 0u);
}

TEST_F(ScanOneTests, RatesFollowTheThreshold) {
	ASSERT_TRUE(sim.issue_command(Command_Code::SCAN_ONE, 1));
	ASSERT_TRUE(sim.run_until_idle(SCAN_BUDGET));

	check_rate_rows(sim, 1);

	//every device gets read at every step; the unconfigured one just counts nothing
	const auto& results = controller().get_result_store();
	for(uint32_t i = 0; i < results.size_words(); i++) ASSERT_EQ(results.write_count(i), 1u) << "entry " << i;
	for(uint32_t t = 0; t < Controller_Config_t::THRESHOLD_STEPS; t++) {
		for(uint32_t c = 0; c < Controller_Config_t::CHANNELS_PER_DEVICE; c++) ASSERT_EQ(results.read(t, 0, c), 0u);
	}
}

TEST_F(ScanOneTests, LeavesTheLastThresholdBehind) {
	ASSERT_TRUE(sim.issue_command(Command_Code::SCAN_ONE, 1));
	ASSERT_TRUE(sim.run_until_idle(SCAN_BUDGET));

	auto partition = controller().get_config_store().partition(1);
	for(uint32_t c = 0; c < Bit_Layout::N_CHANNELS; c++) {
		EXPECT_EQ(controller().get_layout().decode(partition, c), Scan_Automation::TTH_LAST);
		EXPECT_EQ(sim.get_chip(1).threshold(c), Scan_Automation::TTH_LAST);
	}
	check_outside_fields(sim, 1, bitstream);
}

TEST_F(ScanOneTests, ConfigureAfterAScanReportsNoProgress) {
	ASSERT_TRUE(sim.issue_command(Command_Code::SCAN_ONE, 1));
	ASSERT_TRUE(sim.run_until_idle(SCAN_BUDGET));
	EXPECT_EQ(controller().get_tsa().subscribe_status_progress().read(), 0);
	EXPECT_EQ(controller().get_tsa().subscribe_status_tth().read(), 0);

	//staging buffer still holds the bitstream from SetUp
	ASSERT_TRUE(sim.issue_command(Command_Code::CONFIGURE, 1, static_cast<uint16_t>(bitstream.size())));
	uint32_t busy_edges = 0;
	bool finished = false;
	for(uint64_t i = 0; i < CONFIGURE_BUDGET && !finished; i++) {
		sim.run_cycles(1);
		if(controller().busy()) {
			ASSERT_EQ(sim.csr_read(Csr_Block::STATUS), 0x0111'0000u) << "edge " << i;
			busy_edges++;
		}
		finished = controller().all_idle();
	}
	ASSERT_TRUE(finished);
	EXPECT_GT(busy_edges, 0u);
	EXPECT_EQ(sim.csr_read(Csr_Block::STATUS), Csr_Block::COMPLETION_OK);
}

TEST_F(ScanOneTests, CounterBusTimeoutsDoNotStopTheScan) {
	auto timeout_count = controller().get_rate_monitor().subscribe_status_monitor_timeout_count();
	auto timeout = controller().get_rate_monitor().subscribe_status_monitor_timeout();
	sim.get_counters().set_stall_forever(true);

	ASSERT_TRUE(sim.issue_command(Command_Code::SCAN_ONE, 1));
	ASSERT_TRUE(sim.run_until_idle(SCAN_BUDGET));

	EXPECT_EQ(timeout_count.read(), Controller_Config_t::THRESHOLD_STEPS);
	EXPECT_FALSE(timeout.read());
	EXPECT_EQ(sim.get_chip(1).frames_received(), 2u + 2u * Controller_Config_t::THRESHOLD_STEPS);

	const auto& results = controller().get_result_store();
	for(uint32_t i = 0; i < results.size_words(); i++) ASSERT_EQ(results.write_count(i), 0u);
}

//==============================================================================
// Every device, run once for the whole suite
//==============================================================================

class ScanAllTests : public ::testing::Test {
protected:
	static inline std::unique_ptr<Co_Simulation> sim;
	static inline std::vector<std::vector<uint32_t>> bitstreams;
	static inline bool configured = false;
	static inline bool scanned = false;

	static void SetUpTestSuite() {
		Controller_Config_t config = small_config(2);
		sim = std::make_unique<Co_Simulation>(config);
		if(sim->init() != Controller_Config_t::Status::OK) return;

		configured = true;
		for(uint32_t d = 0; d < config.n_mutrig; d++) {
			bitstreams.push_back(make_bitstream(config, 60 + d));
			configured &= configure(*sim, static_cast<uint8_t>(d), bitstreams.back(), d * 256);
		}
		if(!configured) return;

		//device field ignored for a full scan
		scanned = sim->issue_command(Command_Code::SCAN_ALL, 0xF) && sim->run_until_idle(SCAN_BUDGET);
	}

	static void TearDownTestSuite() {
		sim.reset();
		bitstreams.clear();
	}

	void SetUp() override {
		ASSERT_TRUE(configured);
		ASSERT_TRUE(scanned);
	}
};

TEST_F(ScanAllTests, EveryEntryWrittenExactlyOnce) {
	const auto& results = sim->get_controller().get_result_store();
	ASSERT_EQ(results.size_words(), 64u * 2u * 32u);
	for(uint32_t i = 0; i < results.size_words(); i++) ASSERT_EQ(results.write_count(i), 1u) << "entry " << i;
}

TEST_F(ScanAllTests, RatesFollowTheThreshold) {
	uint32_t k0 = check_rate_rows(*sim, 0);
	uint32_t k1 = check_rate_rows(*sim, 1);

	//device 1's counters get read after device 0's burst, so they ran longer
	EXPECT_GT(k1, k0);
}

TEST_F(ScanAllTests, EveryChipRewrittenAtEveryStep) {
	for(uint32_t d = 0; d < sim->n_chips(); d++) {
		EXPECT_EQ(sim->get_chip(d).frames_received(), 2u + 2u * Controller_Config_t::THRESHOLD_STEPS) << "device " << d;
		for(uint32_t c = 0; c < Bit_Layout::N_CHANNELS; c++) EXPECT_EQ(sim->get_chip(d).threshold(c), Scan_Automation::TTH_LAST);
		check_outside_fields(*sim, d, bitstreams[d]);
	}
}

TEST_F(ScanAllTests, EndsIdleWithTheDeviceIndexRewound) {
	auto& controller = sim->get_controller();
	EXPECT_TRUE(controller.all_idle());
	EXPECT_EQ(sim->csr_read(Csr_Block::STATUS), Csr_Block::COMPLETION_OK);
	EXPECT_EQ(controller.get_interpreter().subscribe_status_device().read(), 0);
	EXPECT_EQ(controller.get_tsa().subscribe_status_progress().read(), 0);
	EXPECT_EQ(controller.get_rate_monitor().subscribe_status_monitor_timeout_count().read(), 0u);
}

//==============================================================================
// Reset partway through a full scan
//==============================================================================

class ScanResetTests : public ::testing::Test {
protected:
	Controller_Config_t config = small_config(2);
	Co_Simulation sim{config};
	std::vector<uint32_t> bitstreams[2] = {make_bitstream(config, 81), make_bitstream(config, 82)};

	void SetUp() override {
		ASSERT_EQ(sim.init(), Controller_Config_t::Status::OK);
		ASSERT_TRUE(configure(sim, 0, bitstreams[0], 0));
		ASSERT_TRUE(configure(sim, 1, bitstreams[1], 256));
	}

	MuTRiG_Controller& controller() { return sim.get_controller(); }
};

TEST_F(ScanResetTests, ResetWhilePatchingTheSecondDevice) {
	auto device = controller().get_interpreter().subscribe_status_device();
	auto& modifier = controller().get_pattern_modifier();
	ASSERT_TRUE(sim.issue_command(Command_Code::SCAN_ALL, 0));

	//device 0 written at tth 0, device 1 being patched
	ASSERT_TRUE(step_until([&] { sim.run_cycles(1); },
							[&] { return device.read() == 1 && !modifier.idle(); }, 200'000));
	ASSERT_TRUE(controller().busy());
	ASSERT_FALSE(controller().get_tsa().idle());

	sim.reset();
	EXPECT_TRUE(controller().all_idle());
	EXPECT_FALSE(controller().busy());
	EXPECT_TRUE(controller().get_tsa().idle());
	EXPECT_TRUE(modifier.idle());
	EXPECT_EQ(device.read(), 0);
	EXPECT_EQ(controller().get_tsa().subscribe_status_tth().read(), 0);
	EXPECT_EQ(controller().get_tsa().subscribe_status_progress().read(), 0);
	EXPECT_EQ(sim.csr_read(Csr_Block::STATUS), Csr_Block::COMPLETION_OK);

	//nothing restarts on its own
	sim.run_cycles(100);
	EXPECT_TRUE(controller().all_idle());
	EXPECT_FALSE(sim.get_chip(0).selected());
	EXPECT_FALSE(sim.get_chip(1).selected());

	//no step got measured before the reset
	const auto& results = controller().get_result_store();
	for(uint32_t i = 0; i < results.size_words(); i++) ASSERT_EQ(results.write_count(i), 0u) << "entry " << i;

	//and a fresh scan runs clean from tth 0
	ASSERT_TRUE(sim.issue_command(Command_Code::SCAN_ONE, 1));
	ASSERT_TRUE(sim.run_until_idle(SCAN_BUDGET));
	check_rate_rows(sim, 1);
	for(uint32_t c = 0; c < Bit_Layout::N_CHANNELS; c++) EXPECT_EQ(sim.get_chip(1).threshold(c), Scan_Automation::TTH_LAST);
	check_outside_fields(sim, 1, bitstreams[1]);
}
