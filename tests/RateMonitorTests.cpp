/*
 * RateMonitorTests.cpp
 *
 *  Created on: Nov 8, 2025
 *
 *  Rate monitor reading the counter bank model for one threshold step at a time
 */

#include <gtest/gtest.h>

#include "app_rate_monitor.hpp"
#include "app_counter_bank_model.hpp"
#include "Test_Fixtures.hpp"

class RateMonitorTests : public ::testing::Test {
protected:
	Controller_Config_t config = small_config(2);
	Result_Store results{config.n_mutrig};
	Rate_Monitor monitor{config, results};
	Counter_Bank_Model counters{config};

	PERSISTENT((Pub_Var<Monitor_Request_t>), request);
	Sub_Var<Avalon_Read_Master_t> bus;
	Sub_Var<bool> done;
	Sub_Var<bool> timeout;
	Sub_Var<uint32_t> timeout_count;

	void SetUp() override {
		monitor.link_command_monitor(request.subscribe());
		monitor.link_bus_slave(counters.subscribe_bus_slave());
		counters.link_bus_master(monitor.subscribe_bus_master());
		counters.link_counter_sclr(monitor.subscribe_status_sclr());
		bus = monitor.subscribe_bus_master();
		done = monitor.subscribe_status_monitor_done();
		timeout = monitor.subscribe_status_monitor_timeout();
		timeout_count = monitor.subscribe_status_monitor_timeout_count();
	}

	void tick() {
		monitor.tick();
		counters.tick();
	}

	bool measure(uint8_t tth) {
		request.publish({true, tth});
		return step_until([this] { tick(); }, [this] { return done.read(); }, 20'000);
	}

	bool release() {
		request.publish({false, 0});
		return step_until([this] { tick(); }, [this] { return !done.read() && monitor.idle(); }, 10);
	}

	uint32_t row_writes(uint32_t tth, uint32_t device) {
		uint32_t n = 0;
		for(uint32_t c = 0; c < Controller_Config_t::CHANNELS_PER_DEVICE; c++) n += results.write_count(results.index(tth, device, c));
		return n;
	}
};

TEST_F(RateMonitorTests, EveryChannelLandsInItsRow) {
	for(uint32_t d = 0; d < config.n_mutrig; d++) {
		for(uint32_t c = 0; c < Controller_Config_t::CHANNELS_PER_DEVICE; c++) counters.set_fixed(d, c, d * 1000 + c + 1);
	}

	ASSERT_TRUE(measure(7));
	EXPECT_FALSE(timeout.read());
	for(uint32_t d = 0; d < config.n_mutrig; d++) {
		for(uint32_t c = 0; c < Controller_Config_t::CHANNELS_PER_DEVICE; c++) {
			uint32_t i = results.index(7, d, c);
			ASSERT_EQ(results.read(i), d * 1000 + c + 1) << "device " << d << ", channel " << c;
			ASSERT_EQ(results.write_count(i), 1u);
		}
	}
	EXPECT_EQ(row_writes(6, 0), 0u);
	EXPECT_EQ(row_writes(8, 1), 0u);

	//one 32-word burst per device, at the device's counter block
	EXPECT_EQ(counters.commands_accepted(), config.n_mutrig);
	EXPECT_EQ(counters.last_command().address, 32u);
	EXPECT_EQ(counters.last_command().burstcount, 32u);
	ASSERT_TRUE(release());
}

TEST_F(RateMonitorTests, ClearsTheCountersOncePerStep) {
	ASSERT_TRUE(measure(0));
	EXPECT_EQ(counters.sclr_pulses(), 1u);
	ASSERT_TRUE(release());

	ASSERT_TRUE(measure(1));
	EXPECT_EQ(counters.sclr_pulses(), 2u);
	ASSERT_TRUE(release());
}

TEST_F(RateMonitorTests, SlowCounterBusStillCompletes) {
	counters.set_stall_cycles(20);
	counters.set_latency(30);
	counters.set_beat_gap(3);
	counters.set_fixed(1, 31, 0xABCD);

	ASSERT_TRUE(measure(12));
	EXPECT_FALSE(timeout.read());
	EXPECT_EQ(results.read(12, 1, 31), 0xABCDu);
	EXPECT_EQ(row_writes(12, 0), 32u);
	EXPECT_EQ(row_writes(12, 1), 32u);
}

TEST_F(RateMonitorTests, ErrorBeatIsStoredAsZero) {
	for(uint32_t c = 0; c < Controller_Config_t::CHANNELS_PER_DEVICE; c++) counters.set_fixed(0, c, 55);
	counters.inject_error(3, Avalon_Response::SLVERR);

	ASSERT_TRUE(measure(2));
	EXPECT_FALSE(timeout.read());
	EXPECT_EQ(results.read(2, 0, 3), 0u);
	EXPECT_EQ(results.write_count(results.index(2, 0, 3)), 1u);
	EXPECT_EQ(results.read(2, 0, 4), 55u);
}

TEST_F(RateMonitorTests, CommandNeverTakenTimesOut) {
	counters.set_stall_forever(true);
	request.publish({true, 5});
	ASSERT_TRUE(step_until([this] { tick(); }, [this] { return monitor.reading(); }, 1000));

	//every edge waiting on the command counts, the first one included
	uint32_t posting_edges = 0;
	uint32_t flush_edges = 0;
	ASSERT_TRUE(step_until([&] {
		if(monitor.reading()) posting_edges++;
		tick();
		if(bus.read().flush) flush_edges++;
	}, [this] { return done.read(); }, 2000));

	EXPECT_EQ(posting_edges, config.bus_timeout_cycles);
	EXPECT_EQ(flush_edges, 1u);
	EXPECT_FALSE(bus.read().flush);
	EXPECT_TRUE(timeout.read());
	EXPECT_EQ(timeout_count.read(), 1u);

	//nothing got read, for any device
	EXPECT_EQ(row_writes(5, 0), 0u);
	EXPECT_EQ(row_writes(5, 1), 0u);
	EXPECT_EQ(counters.commands_accepted(), 0u);

	//the flag goes with the acknowledgement, the count stays
	ASSERT_TRUE(release());
	EXPECT_FALSE(timeout.read());
	EXPECT_EQ(timeout_count.read(), 1u);

	counters.set_stall_forever(false);
	ASSERT_TRUE(measure(6));
	EXPECT_FALSE(timeout.read());
	EXPECT_EQ(timeout_count.read(), 1u);
	EXPECT_EQ(row_writes(6, 1), 32u);
}

TEST_F(RateMonitorTests, MissingBeatsTimeOut) {
	counters.set_latency(config.bus_timeout_cycles * 4);

	ASSERT_TRUE(measure(9));
	EXPECT_TRUE(timeout.read());
	EXPECT_EQ(counters.commands_accepted(), 1u);
	EXPECT_EQ(counters.flushes_seen(), 1u);
	EXPECT_FALSE(counters.bursting());
	EXPECT_EQ(row_writes(9, 0), 0u);
	EXPECT_EQ(monitor.current_device(), 0u);
}

TEST_F(RateMonitorTests, ResetClearsTheCount) {
	counters.set_stall_forever(true);
	ASSERT_TRUE(measure(1));
	ASSERT_EQ(timeout_count.read(), 1u);

	monitor.reset();
	EXPECT_TRUE(monitor.idle());
	EXPECT_FALSE(done.read());
	EXPECT_FALSE(timeout.read());
	EXPECT_EQ(timeout_count.read(), 0u);
	EXPECT_EQ(monitor.idle_cycles(), 0u);
}
