#include <gtest/gtest.h>
#include <cerrno>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "FakeSink.hpp"
#include "irq/MmioIrq.hpp"

namespace {

struct MmioIrqFixture : ::testing::Test {
    std::shared_ptr<FakeSink> sink = std::make_shared<FakeSink>();
    MmioIrq                   irq{sink};
};

} // namespace

// Walks the full signal / ack sequence a driver would see.
TEST_F(MmioIrqFixture, SignalAckScenario) {
    EXPECT_EQ(irq.status(), 0u);

    EXPECT_TRUE(irq.signal_used_queue());
    EXPECT_EQ(irq.status(), 0x1u);

    EXPECT_TRUE(irq.signal_configuration_change());
    EXPECT_EQ(irq.status(), 0x3u);

    irq.acknowledge(0x1u);
    EXPECT_EQ(irq.status(), 0x2u);

    irq.acknowledge(0x2u);
    EXPECT_EQ(irq.status(), 0x0u);

    EXPECT_EQ(sink->calls.load(), 2);
}

// Every signal triggers the sink, even when the bit was already set.
TEST_F(MmioIrqFixture, RepeatedSignalsCoalesceInStatus) {
    for (int i = 0; i < 5; ++i) {
        EXPECT_TRUE(irq.signal_used_queue());
    }
    EXPECT_EQ(irq.status(), 0x1u);
    EXPECT_EQ(sink->calls.load(), 5);
}

// Signal then ack of the same reason restores the previous value.
TEST_F(MmioIrqFixture, SignalAckRoundTrip) {
    ASSERT_TRUE(irq.signal_configuration_change());
    const u32 before = irq.status();

    ASSERT_TRUE(irq.signal_used_queue());
    irq.acknowledge(VMM::reason_bit(IrqReason::UsedQueueActivity));
    EXPECT_EQ(irq.status(), before);
}

// The guest must never take an interrupt and find InterruptStatus stale.
TEST_F(MmioIrqFixture, StatusIsSetBeforeTrigger) {
    u32 seen = 0xFFu;
    sink->on_trigger = [&] { seen = irq.status(); };

    ASSERT_TRUE(irq.signal_used_queue());
    EXPECT_EQ(seen, 0x1u);

    irq.acknowledge(0x1u);
    ASSERT_TRUE(irq.signal_configuration_change());
    EXPECT_EQ(seen, 0x2u);
}

// A failed trigger is reported with the right kind and cause, and the bit stays.
TEST_F(MmioIrqFixture, UsedQueueFailureKeepsBit) {
    sink->fail = true;

    const IrqResult res = irq.signal_used_queue();
    EXPECT_FALSE(res);
    EXPECT_EQ(res.error.kind, IrqErrorKind::SignalUsedQueueFailed);
    EXPECT_EQ(res.error.cause, std::make_error_code(std::errc::broken_pipe));
    EXPECT_EQ(irq.status(), 0x1u);
}

TEST_F(MmioIrqFixture, ConfigurationChangeFailureKeepsBit) {
    sink->fail    = true;
    sink->failure = std::error_code(EBADF, std::system_category());

    const IrqResult res = irq.signal_configuration_change();
    EXPECT_FALSE(res);
    EXPECT_EQ(res.error.kind, IrqErrorKind::SignalConfigurationChangeFailed);
    EXPECT_EQ(res.error.cause.value(), EBADF);
    EXPECT_EQ(irq.status(), 0x2u);
}

// Failures are not sticky: the next successful trigger reports ok.
TEST_F(MmioIrqFixture, RecoversAfterSinkFailure) {
    sink->fail = true;
    EXPECT_FALSE(irq.signal_used_queue());

    sink->fail = false;
    EXPECT_TRUE(irq.signal_used_queue());
    EXPECT_EQ(irq.status(), 0x1u);
}

// Error text names the reason and carries the sink's cause.
TEST(InterruptError, MessageNamesKindAndCause) {
    const InterruptError err{IrqErrorKind::SignalConfigurationChangeFailed,
                             std::make_error_code(std::errc::io_error)};
    const std::string msg = err.message();
    EXPECT_NE(msg.find("signal configuration change failed"), std::string::npos) << msg;
    EXPECT_NE(msg.find(std::make_error_code(std::errc::io_error).message()),
              std::string::npos) << msg;
}

// N used-queue threads and M config threads leave both bits set.
TEST_F(MmioIrqFixture, ConcurrentSignalsLeaveBothBits) {
    constexpr int kUsed   = 4;
    constexpr int kConfig = 3;
    constexpr int kIters  = 2'000;

    std::vector<std::thread> threads;
    for (int t = 0; t < kUsed; ++t) {
        threads.emplace_back([this] {
            for (int i = 0; i < kIters; ++i) EXPECT_TRUE(irq.signal_used_queue());
        });
    }
    for (int t = 0; t < kConfig; ++t) {
        threads.emplace_back([this] {
            for (int i = 0; i < kIters; ++i) EXPECT_TRUE(irq.signal_configuration_change());
        });
    }
    for (auto& th : threads) th.join();

    EXPECT_EQ(irq.status(), 0x3u);
    EXPECT_EQ(sink->calls.load(), (kUsed + kConfig) * kIters);
}

// Two devices on one line keep separate status registers.
TEST(MmioIrq, SharedSinkSeparateStatus) {
    auto sink = std::make_shared<FakeSink>();
    MmioIrq a(sink);
    MmioIrq b(sink);

    ASSERT_TRUE(a.signal_used_queue());
    ASSERT_TRUE(b.signal_configuration_change());

    EXPECT_EQ(a.status(), 0x1u);
    EXPECT_EQ(b.status(), 0x2u);
    EXPECT_EQ(sink->calls.load(), 2);
}

// The register handle given to the read path sees the controller's writes.
TEST(MmioIrq, StatusRegisterHandleIsShared) {
    auto stat = std::make_shared<InterruptStatus>();
    MmioIrq irq(stat, std::make_shared<FakeSink>());

    EXPECT_EQ(irq.status_register(), stat);
    ASSERT_TRUE(irq.signal_used_queue());
    EXPECT_EQ(stat->snapshot(), 0x1u);

    stat->acknowledge(0x1u);
    EXPECT_EQ(irq.status(), 0u);
}

// Devices only need the transport-neutral interface.
TEST(MmioIrq, UsableThroughTransportInterface) {
    auto sink = std::make_shared<FakeSink>();
    std::unique_ptr<TransportIrq> irq = std::make_unique<MmioIrq>(sink);

    EXPECT_TRUE(irq->signal_configuration_change());
    EXPECT_EQ(irq->status(), VMM::CONFIG_INTERRUPT);
    irq->acknowledge(VMM::CONFIG_INTERRUPT);
    EXPECT_EQ(irq->status(), 0u);
}

// A controller with no sink still latches the bit and reports ENODEV.
TEST(MmioIrq, UnwiredSinkReportsNoDevice) {
    MmioIrq irq(nullptr);

    const IrqResult used = irq.signal_used_queue();
    ASSERT_FALSE(used);
    EXPECT_EQ(used.error.kind, IrqErrorKind::SignalUsedQueueFailed);
    EXPECT_EQ(used.error.cause, std::make_error_code(std::errc::no_such_device));
    EXPECT_EQ(irq.status(), VMM::VRING_INTERRUPT);

    const IrqResult config = irq.signal_configuration_change();
    ASSERT_FALSE(config);
    EXPECT_EQ(config.error.kind, IrqErrorKind::SignalConfigurationChangeFailed);
    EXPECT_EQ(irq.status(), VMM::VRING_INTERRUPT | VMM::CONFIG_INTERRUPT);
}

// A null status handle is replaced by a fresh register.
TEST(MmioIrq, NullStatusGetsFreshRegister) {
    auto sink = std::make_shared<FakeSink>();
    MmioIrq irq(nullptr, sink);

    ASSERT_NE(irq.status_register(), nullptr);
    EXPECT_EQ(irq.status(), 0u);
    EXPECT_TRUE(irq.signal_used_queue());
    EXPECT_EQ(irq.status(), VMM::VRING_INTERRUPT);
    EXPECT_EQ(sink->calls.load(), 1);
}
