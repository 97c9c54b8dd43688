/*
 * DataMoverTests.cpp
 *
 *  Created on: Nov 7, 2025
 *
 *  Data mover against the staging buffer model, driven the way MCC drives it
 */

#include <gtest/gtest.h>

#include <vector>

#include "app_data_mover.hpp"
#include "app_scratchpad_model.hpp"
#include "Test_Fixtures.hpp"

class DataMoverTests : public ::testing::Test {
protected:
	Config_Store store{4, 128};
	Data_Mover mover{store};
	Scratchpad_Model scratchpad;

	PERSISTENT((Pub_Var<bool>), start);
	PERSISTENT((Pub_Var<Routine_Request_t>), rpc);
	PERSISTENT((Pub_Var<uint32_t>), offset);
	Sub_Var<bool> done;
	Sub_Var<bool> bus_error;

	void SetUp() override {
		mover.link_command_mover_start(start.subscribe());
		mover.link_status_rpc(rpc.subscribe());
		mover.link_status_offset(offset.subscribe());
		mover.link_bus_slave(scratchpad.subscribe_bus_slave());
		scratchpad.link_bus_master(mover.subscribe_bus_master());
		done = mover.subscribe_status_mover_done();
		bus_error = mover.subscribe_status_mover_bus_error();
	}

	void tick() {
		mover.tick();
		store.commit();
		scratchpad.tick();
	}

	//full start/done call; false if either half of the handshake hangs
	bool move(uint8_t device, uint16_t length, uint32_t source) {
		Routine_Request_t request = {};
		request.command = Command_Code::CONFIGURE;
		request.device_id = device;
		request.payload_length = length;
		request.start = true;
		rpc.publish(request);
		offset.publish(source);
		start.publish(true);

		if(!step_until([this] { tick(); }, [this] { return done.read(); }, 10'000)) return false;
		start.publish(false);
		return step_until([this] { tick(); }, [this] { return !done.read() && mover.idle(); }, 10);
	}

	std::vector<uint32_t> pattern(size_t n, uint32_t seed) {
		std::vector<uint32_t> words(n);
		for(size_t i = 0; i < n; i++) words[i] = seed * 0x0101'0101u + static_cast<uint32_t>(i);
		return words;
	}
};

TEST_F(DataMoverTests, CopiesIntoThePartition) {
	auto words = pattern(84, 3);
	ASSERT_TRUE(scratchpad.load(1000, words));

	ASSERT_TRUE(move(2, 84, 1000));
	auto partition = store.partition(2);
	for(size_t i = 0; i < words.size(); i++) ASSERT_EQ(partition[i], words[i]) << "word " << i;
	EXPECT_EQ(partition[84], 0u);
	EXPECT_EQ(mover.beats_received(), 84u);
	EXPECT_FALSE(bus_error.read());

	//neighbours untouched
	for(auto w : store.partition(1)) ASSERT_EQ(w, 0u);
	for(auto w : store.partition(3)) ASSERT_EQ(w, 0u);
}

TEST_F(DataMoverTests, SingleBurstCommand) {
	ASSERT_TRUE(scratchpad.load(0, pattern(40, 1)));
	ASSERT_TRUE(move(0, 40, 0));

	EXPECT_EQ(scratchpad.commands_accepted(), 1u);
	EXPECT_EQ(scratchpad.last_command().burstcount, 40u);
	EXPECT_EQ(scratchpad.last_command().address, 0u);
	EXPECT_EQ(scratchpad.beats_sent(), 40u);
}

TEST_F(DataMoverTests, MirrorFollowsTheStore) {
	auto words = pattern(16, 9);
	ASSERT_TRUE(scratchpad.load(64, words));
	ASSERT_TRUE(move(1, 16, 64));

	auto mirror = store.mirror_partition(1);
	for(size_t i = 0; i < words.size(); i++) ASSERT_EQ(mirror[i], words[i]);
}

TEST_F(DataMoverTests, SlowSlaveStillDeliversEverything) {
	auto words = pattern(32, 5);
	ASSERT_TRUE(scratchpad.load(0, words));
	scratchpad.set_stall_cycles(7);
	scratchpad.set_latency(4);
	scratchpad.set_beat_gap(2);

	ASSERT_TRUE(move(3, 32, 0));
	auto partition = store.partition(3);
	for(size_t i = 0; i < words.size(); i++) ASSERT_EQ(partition[i], words[i]);
}

TEST_F(DataMoverTests, ErrorBeatIsCountedButNotWritten) {
	auto words = pattern(20, 7);
	ASSERT_TRUE(scratchpad.load(0, words));
	scratchpad.inject_error(5, Avalon_Response::SLVERR);

	ASSERT_TRUE(move(0, 20, 0));
	EXPECT_EQ(mover.beats_received(), 20u);

	auto partition = store.partition(0);
	EXPECT_EQ(partition[5], 0u);
	EXPECT_EQ(partition[4], words[4]);
	EXPECT_EQ(partition[6], words[6]);
}

TEST_F(DataMoverTests, BusErrorIsStickyUntilTheNextCall) {
	ASSERT_TRUE(scratchpad.load(0, pattern(8, 2)));
	scratchpad.inject_error(0, Avalon_Response::DECODEERROR);

	//still up after the handshake finished
	ASSERT_TRUE(move(0, 8, 0));
	EXPECT_TRUE(bus_error.read());

	scratchpad.clear_error();
	ASSERT_TRUE(move(0, 8, 0));
	EXPECT_FALSE(bus_error.read());
}

TEST_F(DataMoverTests, ZeroLengthCompletesWithoutTheBus) {
	ASSERT_TRUE(move(0, 0, 0));
	EXPECT_EQ(scratchpad.commands_accepted(), 0u);
	EXPECT_EQ(mover.beats_received(), 0u);
}

TEST_F(DataMoverTests, LengthIsClampedToThePartition) {
	auto words = pattern(200, 4);
	ASSERT_TRUE(scratchpad.load(0, words));

	ASSERT_TRUE(move(1, 200, 0));
	EXPECT_EQ(scratchpad.last_command().burstcount, 128u);
	EXPECT_EQ(store.partition(1)[127], words[127]);
	EXPECT_EQ(store.partition(2)[0], 0u);
}

TEST_F(DataMoverTests, StallForeverHangsTheMover) {
	ASSERT_TRUE(scratchpad.load(0, pattern(8, 1)));
	scratchpad.set_stall_forever(true);

	start.publish(true);
	Routine_Request_t request = {Command_Code::CONFIGURE, 0, 8, true};
	rpc.publish(request);
	for(int i = 0; i < 5000; i++) tick();
	EXPECT_FALSE(done.read());
	EXPECT_FALSE(mover.idle());

	mover.reset();
	EXPECT_TRUE(mover.idle());
	EXPECT_FALSE(done.read());
}
