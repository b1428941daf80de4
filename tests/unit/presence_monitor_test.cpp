#include "tetherlock/core/PresenceMonitor.hpp"
#include "tetherlock/device/DeviceErrors.hpp"
#include "tetherlock/session/SessionErrors.hpp"
#include "test_utils/FakePresenceSource.hpp"

#include <algorithm>
#include <chrono>
#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <iterator>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

namespace
{
using tetherlock::core::MonitorEvent;
using tetherlock::core::MonitorEventKind;
using tetherlock::core::PresenceMonitor;
using tetherlock::core::PresenceState;
using tetherlock::core::TickStatus;
using tetherlock::test_utils::FakePresenceSource;
using tetherlock::test_utils::ManualClock;
using tetherlock::test_utils::MockSessionLocker;
using std::chrono::seconds;
using ::testing::NiceMock;
using ::testing::StrictMock;

constexpr const char* g_kPhone{ "AA:BB:CC:DD:EE:01" };
constexpr const char* g_kWatch{ "AA:BB:CC:DD:EE:02" };

// Events arrive from the reconnection worker too.
class EventLog final
{
public:
    [[nodiscard]] tetherlock::core::EventSink sink()
    {
        return [this](const MonitorEvent& event)
        {
            std::scoped_lock lock{ m_mutex };
            m_events.push_back(event);
        };
    }

    [[nodiscard]] std::size_t count(MonitorEventKind kind) const
    {
        std::scoped_lock lock{ m_mutex };
        return static_cast<std::size_t>(std::count_if(m_events.begin(), m_events.end(),
                                                      [kind](const MonitorEvent& e) { return e.kind == kind; }));
    }

    [[nodiscard]] std::vector<MonitorEvent> of(MonitorEventKind kind) const
    {
        std::scoped_lock lock{ m_mutex };
        std::vector<MonitorEvent> out{};
        std::copy_if(m_events.begin(), m_events.end(), std::back_inserter(out),
                     [kind](const MonitorEvent& e) { return e.kind == kind; });
        return out;
    }

private:
    mutable std::mutex m_mutex;
    std::vector<MonitorEvent> m_events;
};

// Ticks until discovery has completed and returns the first settled status.
TickStatus settleDiscovery(PresenceMonitor& monitor)
{
    const auto deadline{ std::chrono::steady_clock::now() + seconds{ 2 } };
    auto status{ monitor.tick() };
    while (status == TickStatus::Detecting && std::chrono::steady_clock::now() < deadline)
    {
        std::this_thread::sleep_for(std::chrono::milliseconds{ 1 });
        status = monitor.tick();
    }
    return status;
}

template <class Locker> class PresenceMonitorTestBase : public ::testing::Test
{
protected:
    void SetUp() override
    {
        m_source.addDevice(g_kPhone, "Phone", true);
        m_source.addDevice(g_kWatch, "Watch", false);
        m_monitor.setEventSink(m_events.sink());
    }

    void discoverAndSelectPhone()
    {
        m_monitor.startDiscovery();
        ASSERT_NE(settleDiscovery(m_monitor), TickStatus::Detecting);
        ASSERT_TRUE(m_monitor.selectIndex(0));
    }

    TickStatus tickAt(seconds t)
    {
        const auto target{ ManualClock::TimePoint{} + t };
        m_clock.advance(std::chrono::duration_cast<std::chrono::milliseconds>(target - m_clock.now()));
        return m_monitor.tick();
    }

    FakePresenceSource m_source;   // NOLINT
    Locker m_locker;               // NOLINT
    ManualClock m_clock;           // NOLINT
    EventLog m_events;             // NOLINT
    PresenceMonitor m_monitor{ m_source, m_locker, m_clock.provider() }; // NOLINT
};

using PresenceMonitorTest = PresenceMonitorTestBase<StrictMock<MockSessionLocker>>;
using PresenceMonitorLenientTest = PresenceMonitorTestBase<NiceMock<MockSessionLocker>>;

} // namespace

TEST_F(PresenceMonitorTest, LocksOnceAfterTheConfirmationTimeout)
{
    EXPECT_CALL(m_locker, lockSession()).Times(1);
    discoverAndSelectPhone();

    EXPECT_EQ(tickAt(seconds{ 0 }), TickStatus::Evaluated);
    EXPECT_EQ(m_monitor.state(), PresenceState::Connected);
    EXPECT_TRUE(m_monitor.canLock());

    m_source.setConnected(g_kPhone, false);
    (void)tickAt(seconds{ 1 });
    EXPECT_EQ(m_monitor.state(), PresenceState::WaitingConfirmDisconnect);
    EXPECT_TRUE(m_monitor.departureTimer().isActive());

    (void)tickAt(seconds{ 3 });
    EXPECT_EQ(m_monitor.state(), PresenceState::WaitingConfirmDisconnect);

    (void)tickAt(seconds{ 6 });
    EXPECT_EQ(m_monitor.state(), PresenceState::Disconnected);
    EXPECT_FALSE(m_monitor.departureTimer().isActive());
    EXPECT_FALSE(m_monitor.canLock());

    (void)tickAt(seconds{ 7 });
    (void)tickAt(seconds{ 30 });
    EXPECT_EQ(m_monitor.state(), PresenceState::Disconnected);
    EXPECT_EQ(m_events.count(MonitorEventKind::SessionLocked), 1U);

    m_monitor.waitForReconnection();
}

TEST_F(PresenceMonitorTest, ReturningDeviceCancelsTheEpisode)
{
    EXPECT_CALL(m_locker, lockSession()).Times(1);
    discoverAndSelectPhone();
    (void)tickAt(seconds{ 0 });

    m_source.setConnected(g_kPhone, false);
    (void)tickAt(seconds{ 1 });
    m_source.setConnected(g_kPhone, true);
    (void)tickAt(seconds{ 3 });
    EXPECT_EQ(m_monitor.state(), PresenceState::Connected);
    EXPECT_FALSE(m_monitor.departureTimer().isActive());

    // A fresh episode starts from the second departure, not the first.
    m_source.setConnected(g_kPhone, false);
    (void)tickAt(seconds{ 4 });
    (void)tickAt(seconds{ 8 });
    EXPECT_EQ(m_monitor.state(), PresenceState::WaitingConfirmDisconnect);
    (void)tickAt(seconds{ 9 });
    EXPECT_EQ(m_monitor.state(), PresenceState::Disconnected);

    m_monitor.waitForReconnection();
}

TEST_F(PresenceMonitorTest, EachEpisodeLocksAtMostOnce)
{
    EXPECT_CALL(m_locker, lockSession()).Times(2);
    discoverAndSelectPhone();

    for (int episode{ 0 }; episode < 2; ++episode)
    {
        const int base{ episode * 100 };
        m_source.setConnected(g_kPhone, true);
        (void)tickAt(seconds{ base });
        m_source.setConnected(g_kPhone, false);
        for (int t{ 1 }; t <= 20; ++t)
        {
            (void)tickAt(seconds{ base + t });
        }
        EXPECT_EQ(m_monitor.state(), PresenceState::Disconnected);
    }

    m_monitor.waitForReconnection();
}

TEST_F(PresenceMonitorTest, AbsentDeviceNeverSeenPresentDoesNotLock)
{
    m_source.setConnected(g_kPhone, false);
    discoverAndSelectPhone();

    for (int t{ 0 }; t <= 20; ++t)
    {
        EXPECT_EQ(tickAt(seconds{ t }), TickStatus::Evaluated);
    }
    EXPECT_EQ(m_monitor.state(), PresenceState::None);
    EXPECT_FALSE(m_monitor.canLock());

    m_monitor.waitForReconnection();
}

TEST_F(PresenceMonitorTest, SwitchingDeviceMidEpisodeNeverLocks)
{
    discoverAndSelectPhone();
    (void)tickAt(seconds{ 0 });

    m_source.setConnected(g_kPhone, false);
    (void)tickAt(seconds{ 1 });
    ASSERT_EQ(m_monitor.state(), PresenceState::WaitingConfirmDisconnect);

    ASSERT_TRUE(m_monitor.selectIndex(1));
    EXPECT_EQ(m_monitor.state(), PresenceState::None);
    EXPECT_FALSE(m_monitor.departureTimer().isActive());
    EXPECT_FALSE(m_monitor.canLock());

    for (int t{ 2 }; t <= 30; ++t)
    {
        (void)tickAt(seconds{ t });
    }
    EXPECT_EQ(m_monitor.state(), PresenceState::None);
    EXPECT_EQ(m_events.count(MonitorEventKind::SessionLocked), 0U);

    m_monitor.waitForReconnection();
}

TEST_F(PresenceMonitorTest, DeselectStopsMonitoring)
{
    discoverAndSelectPhone();
    (void)tickAt(seconds{ 0 });
    m_source.setConnected(g_kPhone, false);
    (void)tickAt(seconds{ 1 });

    m_monitor.deselect();

    EXPECT_FALSE(m_monitor.selectedIndex().has_value());
    EXPECT_EQ(m_monitor.state(), PresenceState::None);
    EXPECT_EQ(tickAt(seconds{ 10 }), TickStatus::Idle);
    EXPECT_EQ(m_events.count(MonitorEventKind::DeviceDeselected), 1U);

    m_monitor.waitForReconnection();
}

TEST_F(PresenceMonitorTest, SelectingTheSameDeviceKeepsTheEpisode)
{
    discoverAndSelectPhone();
    (void)tickAt(seconds{ 0 });
    m_source.setConnected(g_kPhone, false);
    (void)tickAt(seconds{ 1 });

    EXPECT_TRUE(m_monitor.select(tetherlock::device::DeviceHandle{ g_kPhone }));
    EXPECT_EQ(m_monitor.state(), PresenceState::WaitingConfirmDisconnect);
    EXPECT_TRUE(m_monitor.canLock());

    m_monitor.waitForReconnection();
}

TEST_F(PresenceMonitorTest, UnknownSelectionIsRejected)
{
    discoverAndSelectPhone();

    EXPECT_FALSE(m_monitor.selectIndex(7));
    EXPECT_FALSE(m_monitor.select(tetherlock::device::DeviceHandle{ "00:00:00:00:00:00" }));
    EXPECT_EQ(m_monitor.selectedIndex(), 0U);
}

TEST_F(PresenceMonitorTest, IdenticalObservationsEmitNoStateChanges)
{
    discoverAndSelectPhone();

    for (int t{ 0 }; t < 5; ++t)
    {
        (void)tickAt(seconds{ t });
    }
    EXPECT_EQ(m_events.count(MonitorEventKind::StateChanged), 1U);
}

TEST_F(PresenceMonitorTest, TransientProbeFailureLeavesStateAlone)
{
    discoverAndSelectPhone();
    (void)tickAt(seconds{ 0 });
    m_source.setConnected(g_kPhone, false);
    (void)tickAt(seconds{ 1 });

    m_source.failRefresh(g_kPhone, FakePresenceSource::Failure::Transient);
    EXPECT_EQ(tickAt(seconds{ 9 }), TickStatus::ProbeFailed);
    EXPECT_EQ(m_monitor.state(), PresenceState::WaitingConfirmDisconnect);
    EXPECT_EQ(m_events.count(MonitorEventKind::ProbeFailed), 1U);

    EXPECT_CALL(m_locker, lockSession()).Times(1);
    m_source.failRefresh(g_kPhone, FakePresenceSource::Failure::None);
    EXPECT_EQ(tickAt(seconds{ 10 }), TickStatus::Evaluated);
    EXPECT_EQ(m_monitor.state(), PresenceState::Disconnected);

    m_monitor.waitForReconnection();
}

TEST_F(PresenceMonitorTest, FailingUnselectedDeviceDoesNotStopEvaluation)
{
    discoverAndSelectPhone();
    m_source.failRefresh(g_kWatch, FakePresenceSource::Failure::Transient);

    EXPECT_EQ(tickAt(seconds{ 0 }), TickStatus::Evaluated);
    EXPECT_EQ(m_monitor.state(), PresenceState::Connected);
    EXPECT_EQ(m_events.count(MonitorEventKind::ProbeFailed), 1U);
}

TEST_F(PresenceMonitorTest, MissingRadioStackPropagates)
{
    discoverAndSelectPhone();
    m_source.failRefresh(g_kPhone, FakePresenceSource::Failure::Unavailable);

    EXPECT_THROW((void)tickAt(seconds{ 0 }), tetherlock::device::ProbeUnavailable);
}

TEST_F(PresenceMonitorTest, MissingRadioStackDuringDiscoveryPropagates)
{
    m_source.failNextDiscover(FakePresenceSource::Failure::Unavailable);
    m_monitor.startDiscovery();

    EXPECT_THROW((void)settleDiscovery(m_monitor), tetherlock::device::ProbeUnavailable);
}

TEST_F(PresenceMonitorTest, TransientDiscoveryFailureIsRetried)
{
    m_source.failNextDiscover(FakePresenceSource::Failure::Transient);
    m_monitor.startDiscovery();

    EXPECT_EQ(settleDiscovery(m_monitor), TickStatus::Idle);
    EXPECT_EQ(m_source.discoverCalls(), 2);
    EXPECT_EQ(m_events.count(MonitorEventKind::DiscoveryFailed), 1U);
    EXPECT_EQ(m_monitor.devices().size(), 2U);
}

TEST_F(PresenceMonitorTest, DetectingUntilDiscoveryCompletes)
{
    m_source.holdDiscovery();
    m_monitor.startDiscovery();

    EXPECT_EQ(m_monitor.tick(), TickStatus::Detecting);
    EXPECT_TRUE(m_monitor.snapshot().detecting);
    EXPECT_TRUE(m_monitor.devices().empty());

    m_source.releaseDiscovery();
    EXPECT_EQ(settleDiscovery(m_monitor), TickStatus::Idle);
    EXPECT_FALSE(m_monitor.discoveryPending());
    EXPECT_EQ(m_events.count(MonitorEventKind::DiscoveryFinished), 1U);
}

TEST_F(PresenceMonitorTest, EveryDeviceIsRefreshedEachTick)
{
    discoverAndSelectPhone();
    const int before{ m_source.refreshCalls() };

    m_source.setConnected(g_kWatch, true);
    (void)tickAt(seconds{ 0 });

    EXPECT_EQ(m_source.refreshCalls() - before, 2);
    ASSERT_EQ(m_monitor.devices().size(), 2U);
    EXPECT_EQ(m_monitor.devices()[1].displayName, "Watch");
    EXPECT_TRUE(m_monitor.devices()[1].connected);
}

TEST_F(PresenceMonitorTest, PreferredDeviceIsSelectedAfterDiscovery)
{
    m_monitor.setPreferredDevice(tetherlock::device::DeviceHandle{ g_kWatch });
    m_monitor.startDiscovery();

    (void)settleDiscovery(m_monitor);

    EXPECT_EQ(m_monitor.selectedIndex(), 1U);
    m_monitor.waitForReconnection();
}

TEST_F(PresenceMonitorTest, MissingPreferredDeviceIsReported)
{
    m_monitor.setPreferredDevice(tetherlock::device::DeviceHandle{ "00:00:00:00:00:00" });
    m_monitor.startDiscovery();

    EXPECT_EQ(settleDiscovery(m_monitor), TickStatus::Idle);
    EXPECT_FALSE(m_monitor.selectedIndex().has_value());
    EXPECT_EQ(m_events.count(MonitorEventKind::PreferredDeviceMissing), 1U);
}

TEST_F(PresenceMonitorTest, TimeoutChangeAppliesToTheRunningEpisode)
{
    EXPECT_CALL(m_locker, lockSession()).Times(1);
    m_monitor.setConfirmationTimeout(seconds{ 15 });
    discoverAndSelectPhone();
    (void)tickAt(seconds{ 0 });

    m_source.setConnected(g_kPhone, false);
    (void)tickAt(seconds{ 1 });
    (void)tickAt(seconds{ 3 });
    ASSERT_EQ(m_monitor.state(), PresenceState::WaitingConfirmDisconnect);

    m_monitor.setConfirmationTimeout(seconds{ 3 });
    (void)tickAt(seconds{ 4 });
    EXPECT_EQ(m_monitor.state(), PresenceState::Disconnected);
    EXPECT_EQ(m_events.count(MonitorEventKind::TimeoutChanged), 2U);

    m_monitor.waitForReconnection();
}

TEST_F(PresenceMonitorTest, RejectsUnsupportedTimeouts)
{
    EXPECT_THROW(m_monitor.setConfirmationTimeout(seconds{ 4 }), std::invalid_argument);
    EXPECT_THROW(m_monitor.setConfirmationTimeout(seconds{ 0 }), std::invalid_argument);
    EXPECT_EQ(m_monitor.confirmationTimeout(), tetherlock::core::g_defaultConfirmationTimeout);
}

TEST_F(PresenceMonitorTest, LockFailureIsReportedAndNotRetried)
{
    EXPECT_CALL(m_locker, lockSession())
        .WillOnce(::testing::Throw(tetherlock::session::LockActionFailure{ "no session" }));
    discoverAndSelectPhone();
    (void)tickAt(seconds{ 0 });
    m_source.setConnected(g_kPhone, false);
    (void)tickAt(seconds{ 1 });
    (void)tickAt(seconds{ 6 });
    (void)tickAt(seconds{ 7 });

    EXPECT_EQ(m_monitor.state(), PresenceState::Disconnected);
    const auto failures{ m_events.of(MonitorEventKind::LockFailed) };
    ASSERT_EQ(failures.size(), 1U);
    EXPECT_EQ(failures.front().detail, "no session");

    m_monitor.waitForReconnection();
}

TEST_F(PresenceMonitorTest, NoDevicesFoundLeavesMonitorIdle)
{
    FakePresenceSource empty;
    StrictMock<MockSessionLocker> locker;
    EventLog events;
    PresenceMonitor monitor{ empty, locker };
    monitor.setEventSink(events.sink());

    monitor.startDiscovery();
    EXPECT_EQ(settleDiscovery(monitor), TickStatus::Idle);
    EXPECT_EQ(monitor.tick(), TickStatus::Idle);
    EXPECT_EQ(events.count(MonitorEventKind::NoDevicesFound), 1U);
    EXPECT_FALSE(monitor.selectIndex(0));
}

TEST_F(PresenceMonitorLenientTest, BlockedReconnectionNeitherStallsNorRepeats)
{
    discoverAndSelectPhone();
    (void)tickAt(seconds{ 0 });

    m_source.closeGate();
    m_source.setConnected(g_kPhone, false);

    const auto started{ std::chrono::steady_clock::now() };
    for (int t{ 1 }; t <= 10; ++t)
    {
        EXPECT_EQ(tickAt(seconds{ t }), TickStatus::Evaluated);
    }
    EXPECT_LT(std::chrono::steady_clock::now() - started, seconds{ 1 });

    ASSERT_TRUE(tetherlock::test_utils::waitUntil([this]() { return m_source.connectsWaiting() == 1; }));
    EXPECT_EQ(m_source.connectCalls(), 1);
    EXPECT_TRUE(m_monitor.reconnectInFlight());
    EXPECT_EQ(m_monitor.state(), PresenceState::Disconnected);
    EXPECT_EQ(m_events.count(MonitorEventKind::ReconnectStarted), 1U);

    m_source.openGate();
    m_monitor.waitForReconnection();
    EXPECT_FALSE(m_monitor.reconnectInFlight());
    EXPECT_EQ(m_events.count(MonitorEventKind::ReconnectSucceeded), 1U);

    (void)tickAt(seconds{ 11 });
    m_monitor.waitForReconnection();
    EXPECT_EQ(m_source.connectCalls(), 2);
}

TEST_F(PresenceMonitorLenientTest, ProbeFailureDoesNotLaunchReconnection)
{
    discoverAndSelectPhone();
    m_source.setConnected(g_kPhone, false);
    m_source.failRefresh(g_kPhone, FakePresenceSource::Failure::Transient);

    EXPECT_EQ(tickAt(seconds{ 0 }), TickStatus::ProbeFailed);
    m_monitor.waitForReconnection();
    EXPECT_EQ(m_source.connectCalls(), 0);
}

TEST_F(PresenceMonitorLenientTest, SnapshotMirrorsTheMonitor)
{
    discoverAndSelectPhone();
    (void)tickAt(seconds{ 0 });

    const auto snapshot{ m_monitor.snapshot() };
    EXPECT_FALSE(snapshot.detecting);
    EXPECT_EQ(snapshot.devices.size(), 2U);
    EXPECT_EQ(snapshot.selected, 0U);
    EXPECT_EQ(snapshot.state, PresenceState::Connected);
    EXPECT_TRUE(snapshot.canLock);
    EXPECT_EQ(snapshot.confirmationTimeout, tetherlock::core::g_defaultConfirmationTimeout);
}
