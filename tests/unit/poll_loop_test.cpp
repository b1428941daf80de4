#include "tetherlock/core/PollLoop.hpp"
#include "tetherlock/device/DeviceErrors.hpp"
#include "test_utils/FakePresenceSource.hpp"

#include <chrono>
#include <exception>
#include <future>
#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <mutex>
#include <stdexcept>
#include <thread>

namespace
{
using tetherlock::core::PollLoop;
using tetherlock::core::PresenceMonitor;
using tetherlock::core::PresenceState;
using tetherlock::core::TickStatus;
using tetherlock::test_utils::FakePresenceSource;
using tetherlock::test_utils::MockSessionLocker;
using tetherlock::test_utils::waitUntil;
using namespace std::chrono_literals;

constexpr const char* g_kPhone{ "AA:BB:CC:DD:EE:01" };

class PollLoopTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        m_source.addDevice(g_kPhone, "Phone", true);
    }

    FakePresenceSource m_source;                              // NOLINT
    ::testing::NiceMock<MockSessionLocker> m_locker;          // NOLINT
    PresenceMonitor m_monitor{ m_source, m_locker };          // NOLINT
};

} // namespace

TEST_F(PollLoopTest, TicksAtTheInterval)
{
    m_monitor.startDiscovery();
    PollLoop loop{ m_monitor, 5ms };
    loop.start();

    ASSERT_TRUE(waitUntil([&]() { return loop.tickCount() >= 3; }));
    EXPECT_TRUE(loop.running());

    loop.requestStop();
    EXPECT_NO_THROW(loop.wait());
    EXPECT_FALSE(loop.running());
}

TEST_F(PollLoopTest, PostedCommandIsVisibleInTheSnapshot)
{
    m_monitor.startDiscovery();
    PollLoop loop{ m_monitor, 5ms };
    loop.start();
    ASSERT_TRUE(waitUntil([&]() { return !loop.snapshot().detecting; }));

    const bool selected{ loop.post([](PresenceMonitor& monitor) { return monitor.selectIndex(0); }).get() };

    EXPECT_TRUE(selected);
    EXPECT_EQ(loop.snapshot().selected, 0U);

    ASSERT_TRUE(waitUntil([&]() { return loop.snapshot().state == PresenceState::Connected; }));
    EXPECT_EQ(loop.lastStatus(), TickStatus::Evaluated);
}

TEST_F(PollLoopTest, PostWakesTheLoopWithoutAnExtraTick)
{
    PollLoop loop{ m_monitor, 10s };
    loop.start();
    ASSERT_TRUE(waitUntil([&]() { return loop.tickCount() == 1; }));

    const auto started{ std::chrono::steady_clock::now() };
    loop.post([](PresenceMonitor& monitor) { monitor.setConfirmationTimeout(15s); }).get();

    EXPECT_LT(std::chrono::steady_clock::now() - started, 2s);
    EXPECT_EQ(loop.tickCount(), 1U);
    EXPECT_EQ(loop.snapshot().confirmationTimeout, 15s);
}

TEST_F(PollLoopTest, CommandExceptionReachesTheCaller)
{
    PollLoop loop{ m_monitor, 5ms };
    loop.start();

    auto result{ loop.post([](PresenceMonitor& monitor) { monitor.setConfirmationTimeout(4s); }) };

    EXPECT_THROW(result.get(), std::invalid_argument);
    EXPECT_TRUE(loop.running());
}

TEST_F(PollLoopTest, MissingRadioStackStopsTheLoop)
{
    m_source.failNextDiscover(FakePresenceSource::Failure::Unavailable);
    m_monitor.startDiscovery();
    PollLoop loop{ m_monitor, 5ms };
    loop.start();

    ASSERT_TRUE(waitUntil([&]() { return !loop.running(); }));
    EXPECT_THROW(loop.wait(), tetherlock::device::ProbeUnavailable);
}

TEST_F(PollLoopTest, PostAfterStopIsBroken)
{
    PollLoop loop{ m_monitor, 5ms };
    loop.start();
    loop.requestStop();
    loop.wait();

    auto result{ loop.post([](PresenceMonitor& monitor) { return monitor.selectIndex(0); }) };
    EXPECT_THROW((void)result.get(), std::future_error);
}

TEST_F(PollLoopTest, StopWaitsForReconnection)
{
    m_source.setConnected(g_kPhone, false);
    m_monitor.setPreferredDevice(tetherlock::device::DeviceHandle{ g_kPhone });
    m_monitor.startDiscovery();
    m_source.closeGate();

    PollLoop loop{ m_monitor, 5ms };
    loop.start();
    ASSERT_TRUE(waitUntil([&]() { return m_source.connectsWaiting() == 1; }));

    loop.requestStop();
    std::jthread opener{ [this]()
                         {
                             std::this_thread::sleep_for(20ms);
                             m_source.openGate();
                         } };
    loop.wait();

    EXPECT_FALSE(m_monitor.reconnectInFlight());
    EXPECT_EQ(m_source.connectCalls(), 1);
}

TEST_F(PollLoopTest, FaultIsReportedAsSoonAsTheLoopStops)
{
    m_monitor.setPreferredDevice(tetherlock::device::DeviceHandle{ g_kPhone });
    m_monitor.startDiscovery();

    PollLoop loop{ m_monitor, 5ms };
    std::mutex mutex;
    std::exception_ptr reported{};
    bool runningWhenReported{ false };
    loop.setFaultHandler(
        [&](std::exception_ptr fault)
        {
            std::scoped_lock lock{ mutex };
            reported = fault;
            runningWhenReported = loop.running();
        });
    loop.start();
    ASSERT_TRUE(waitUntil([&]() { return loop.snapshot().state == PresenceState::Connected; }));

    m_source.failRefresh(g_kPhone, FakePresenceSource::Failure::Unavailable);

    ASSERT_TRUE(waitUntil(
        [&]()
        {
            std::scoped_lock lock{ mutex };
            return reported != nullptr;
        }));
    {
        std::scoped_lock lock{ mutex };
        EXPECT_THROW(std::rethrow_exception(reported), tetherlock::device::ProbeUnavailable);
        EXPECT_TRUE(runningWhenReported);
    }
    EXPECT_THROW(loop.wait(), tetherlock::device::ProbeUnavailable);
    EXPECT_FALSE(loop.running());
}
