/*
 * InterpreterTests.cpp
 *
 *  Created on: Nov 8, 2025
 *
 *  Command decode, host registers and what happens to commands that can't run
 */

#include <gtest/gtest.h>

#include <memory>

#include "app_co_simulation.hpp"
#include "app_debug_if.hpp"
#include "Test_Fixtures.hpp"

static uint32_t command_word(uint16_t code, uint8_t device, uint16_t length) {
	return (static_cast<uint32_t>(code) << 20) | (static_cast<uint32_t>(device & 0xF) << 16) | length;
}

//==============================================================================
// Decode
//==============================================================================

TEST(InterpreterDecodeTests, FieldsComeOutOfTheirBitRanges) {
	auto fields = Instruction_Interpreter::decode(command_word(0x015, 7, 0x1234));
	EXPECT_EQ(fields.code, 0x015);
	EXPECT_EQ(fields.device_id, 7);
	EXPECT_EQ(fields.payload_length, 0x1234);

	fields = Instruction_Interpreter::decode(0xFFFF'FFFF);
	EXPECT_EQ(fields.code, 0xFFF);
	EXPECT_EQ(fields.device_id, 0xF);
	EXPECT_EQ(fields.payload_length, 0xFFFF);

	fields = Instruction_Interpreter::decode(0x0110'004A);
	EXPECT_EQ(static_cast<Command_Code>(fields.code), Command_Code::CONFIGURE);
	EXPECT_EQ(fields.device_id, 0);
	EXPECT_EQ(fields.payload_length, 74);
}

//==============================================================================
// Against a running controller
//==============================================================================

class InterpreterTests : public ::testing::Test {
protected:
	Controller_Config_t config = small_config(2);
	std::unique_ptr<Co_Simulation> sim;

	void SetUp() override { build(config); }

	void build(const Controller_Config_t& cfg) {
		sim = std::make_unique<Co_Simulation>(cfg);
		ASSERT_EQ(sim->init(), Controller_Config_t::Status::OK);
	}

	MuTRiG_Controller& controller() { return sim->get_controller(); }

	//command went nowhere: nothing busy, nothing written, one more discard
	void expect_dropped(uint32_t discards_before) {
		EXPECT_TRUE(sim->run_until_idle(10));
		EXPECT_FALSE(controller().busy());
		EXPECT_TRUE(controller().get_mcc().idle());
		EXPECT_TRUE(controller().get_tsa().idle());
		EXPECT_EQ(sim->csr_read(Csr_Block::STATUS), Csr_Block::COMPLETION_OK);
		EXPECT_EQ(controller().get_interpreter().discarded_commands(), discards_before + 1);
		EXPECT_EQ(sim->get_scratchpad().commands_accepted(), 0u);
		EXPECT_EQ(sim->get_chip(0).frames_received(), 0u);
		EXPECT_EQ(sim->get_chip(1).frames_received(), 0u);
	}
};

TEST_F(InterpreterTests, RegistersReadBack) {
	EXPECT_TRUE(sim->csr_write(Csr_Block::OFFSET, 0x55));
	EXPECT_EQ(sim->csr_read(Csr_Block::OFFSET), 0x55u);

	//16-bit register
	EXPECT_TRUE(sim->csr_write(Csr_Block::MONITOR_INTERVAL, 0x1'2345));
	EXPECT_EQ(sim->csr_read(Csr_Block::MONITOR_INTERVAL), 0x2345u);

	EXPECT_TRUE(sim->csr_write(Csr_Block::COMMAND, command_word(0x7FF, 0, 0)));
	EXPECT_EQ(sim->csr_read(Csr_Block::COMMAND), command_word(0x7FF, 0, 0));
}

TEST_F(InterpreterTests, StatusIsReadOnly) {
	size_t warnings = Debug::warn_count();
	EXPECT_FALSE(sim->csr_write(Csr_Block::STATUS, 0xFFFF'FFFF));
	EXPECT_EQ(sim->csr_read(Csr_Block::STATUS), 0u);
	EXPECT_GT(Debug::warn_count(), warnings);
}

TEST_F(InterpreterTests, UnmappedRegisters) {
	EXPECT_FALSE(sim->csr_write(7, 1));
	EXPECT_EQ(sim->csr_read(7), 0u);
}

TEST_F(InterpreterTests, UnknownCodeIsANoOp) {
	ASSERT_TRUE(sim->csr_write(Csr_Block::COMMAND, command_word(0x012, 0, 74)));
	expect_dropped(0);
}

TEST_F(InterpreterTests, DeviceWithoutAPartitionIsDropped) {
	ASSERT_TRUE(sim->issue_command(Command_Code::CONFIGURE, 2, 74));
	expect_dropped(0);

	ASSERT_TRUE(sim->issue_command(Command_Code::SCAN_ONE, 9));
	expect_dropped(1);
}

TEST_F(InterpreterTests, RoutineThatIsNotBuiltIsDropped) {
	config.sel_subroutines = Controller_Config_t::SEL_MCC_ONLY;
	build(config);
	ASSERT_TRUE(sim->issue_command(Command_Code::SCAN_ONE, 0));
	expect_dropped(0);

	config.sel_subroutines = Controller_Config_t::SEL_TSA_ONLY;
	build(config);
	ASSERT_TRUE(sim->issue_command(Command_Code::CONFIGURE, 0, 74));
	expect_dropped(0);
}

TEST_F(InterpreterTests, CommandWhileBusyIsDropped) {
	auto bitstream = make_bitstream(config, 31);
	ASSERT_TRUE(sim->load_scratchpad(0, bitstream));
	ASSERT_TRUE(sim->issue_command(Command_Code::CONFIGURE, 0, static_cast<uint16_t>(bitstream.size())));
	sim->run_cycles(5);
	ASSERT_TRUE(controller().busy());

	//busy status: command bits on top, progress (0 outside a scan) below
	EXPECT_EQ(sim->csr_read(Csr_Block::STATUS), 0x0110'0000u);

	ASSERT_TRUE(sim->issue_command(Command_Code::SCAN_ONE, 1));
	sim->run_cycles(5);
	EXPECT_EQ(controller().get_interpreter().discarded_commands(), 1u);
	EXPECT_TRUE(controller().get_tsa().idle());

	ASSERT_TRUE(sim->run_until_idle(50'000));
	EXPECT_EQ(sim->csr_read(Csr_Block::STATUS), Csr_Block::COMPLETION_OK);
	EXPECT_EQ(sim->get_chip(0).frames_received(), 2u);
	EXPECT_EQ(controller().get_tsa().subscribe_status_progress().read(), 0);
	for(uint32_t i = 0; i < controller().get_result_store().size_words(); i++) {
		ASSERT_EQ(controller().get_result_store().write_count(i), 0u);
	}
}

TEST_F(InterpreterTests, SameCommandWordRunsAgain) {
	auto bitstream = make_bitstream(config, 32);
	ASSERT_TRUE(sim->load_scratchpad(0, bitstream));

	for(int run = 0; run < 2; run++) {
		ASSERT_TRUE(sim->issue_command(Command_Code::CONFIGURE, 1, static_cast<uint16_t>(bitstream.size())));
		ASSERT_TRUE(sim->run_until_idle(50'000)) << "run " << run;
	}
	EXPECT_EQ(sim->get_chip(1).frames_received(), 4u);
	EXPECT_EQ(sim->get_scratchpad().commands_accepted(), 2u);
	EXPECT_EQ(controller().get_interpreter().discarded_commands(), 0u);
}
