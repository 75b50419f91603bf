#include <gtest/gtest.h>
#include <glib.h>
#include <string>
#include <vector>

#include "GLibTypes.h"
#include "OperationWatcher.h"
#include "PeerConnection.h"

using namespace hapble;

class OperationWatcherTest : public ::testing::Test {
protected:
    OperationWatcherTest()
        : context(g_main_context_new()), peer("AA:BB:CC:DD:EE:FF") {
    }

    // Runs the test's main context for `ms` milliseconds
    void runLoopFor(unsigned int ms) {
        GMainLoopPtr loop(g_main_loop_new(context.get(), FALSE));
        GSourcePtr quit(g_timeout_source_new(ms));
        g_source_set_callback(quit.get(), [](gpointer data) -> gboolean {
            g_main_loop_quit(static_cast<GMainLoop*>(data));
            return G_SOURCE_REMOVE;
        }, loop.get(), nullptr);
        g_source_attach(quit.get(), context.get());
        g_main_loop_run(loop.get());
    }

    std::shared_ptr<OperationWatcher> armWatcher(unsigned int timeoutMs) {
        return OperationWatcher::arm(peer, [this](const std::string& reason) {
            reasons.push_back(reason);
            firedAt = g_get_monotonic_time();
        }, timeoutMs, context.get());
    }

    GMainContextPtr context;
    PeerDisconnectNotifier peer;
    std::vector<std::string> reasons;
    gint64 firedAt = 0;
};

// 1. 타임아웃
TEST_F(OperationWatcherTest, TimeoutFiresWithTimeoutReason) {
    gint64 armedAt = g_get_monotonic_time();
    auto watcher = armWatcher(50);
    EXPECT_TRUE(watcher->hasPendingTimer());
    EXPECT_FALSE(watcher->isRejected());

    runLoopFor(250);

    ASSERT_EQ(reasons.size(), 1u);
    EXPECT_EQ(reasons[0], "Timeout");
    EXPECT_GE(firedAt - armedAt, 45 * 1000);
    EXPECT_TRUE(watcher->isRejected());
    EXPECT_EQ(watcher->getState(), OperationWatcher::State::Fired);
    EXPECT_FALSE(watcher->hasPendingTimer());

    OperationWatcher::disarm(peer, watcher);
    EXPECT_EQ(peer.getListenerCount(), 0u);
}

// 2. 연결 해제가 먼저 오면 타이머 취소
TEST_F(OperationWatcherTest, DisconnectBeforeTimeoutCancelsTimer) {
    auto watcher = armWatcher(100);

    peer.notifyDisconnected();

    ASSERT_EQ(reasons.size(), 1u);
    EXPECT_EQ(reasons[0], "Disconnected");
    EXPECT_FALSE(watcher->hasPendingTimer());

    runLoopFor(250);
    EXPECT_EQ(reasons.size(), 1u);

    OperationWatcher::disarm(peer, watcher);
    EXPECT_EQ(watcher->getState(), OperationWatcher::State::Fired);
}

// 3. 사용자 지정 사유
TEST_F(OperationWatcherTest, DisconnectCarriesPeerReason) {
    auto watcher = armWatcher(0);

    peer.notifyDisconnected("Link supervision timeout");

    ASSERT_EQ(reasons.size(), 1u);
    EXPECT_EQ(reasons[0], "Link supervision timeout");
    OperationWatcher::disarm(peer, watcher);
}

// 4. 트리거 전에 해제
TEST_F(OperationWatcherTest, DisarmBeforeEitherTriggerNeverFires) {
    auto watcher = armWatcher(50);
    OperationWatcher::disarm(peer, watcher);

    EXPECT_EQ(watcher->getState(), OperationWatcher::State::Disarmed);
    EXPECT_FALSE(watcher->hasPendingTimer());
    EXPECT_EQ(peer.getListenerCount(), 0u);

    runLoopFor(150);
    peer.notifyDisconnected();

    EXPECT_TRUE(reasons.empty());
    EXPECT_FALSE(watcher->isRejected());
}

// 5. timeoutMs = 0 이면 타이머 없음
TEST_F(OperationWatcherTest, ZeroTimeoutDisablesTimer) {
    auto watcher = armWatcher(0);
    EXPECT_FALSE(watcher->hasPendingTimer());

    runLoopFor(100);
    EXPECT_TRUE(reasons.empty());

    peer.notifyDisconnected();
    ASSERT_EQ(reasons.size(), 1u);
    EXPECT_EQ(reasons[0], "Disconnected");

    OperationWatcher::disarm(peer, watcher);
}

// 6. 타임아웃 후 연결 해제는 무시
TEST_F(OperationWatcherTest, DisconnectAfterTimeoutIsIgnored) {
    auto watcher = armWatcher(20);
    runLoopFor(100);
    ASSERT_EQ(reasons.size(), 1u);

    // The one-shot disconnect listener stays registered until disarm
    EXPECT_EQ(peer.getListenerCount(), 1u);
    peer.notifyDisconnected();

    ASSERT_EQ(reasons.size(), 1u);
    EXPECT_EQ(reasons[0], "Timeout");
    OperationWatcher::disarm(peer, watcher);
}

TEST_F(OperationWatcherTest, DefaultTimeout) {
    auto watcher = OperationWatcher::arm(peer, [](const std::string&) {}, OperationWatcher::kDefaultTimeoutMs,
                                         context.get());
    EXPECT_EQ(watcher->getTimeoutMs(), 3000u);
    EXPECT_TRUE(watcher->hasPendingTimer());
    OperationWatcher::disarm(peer, watcher);
}

TEST_F(OperationWatcherTest, SecondDisarmIsIgnored) {
    auto watcher = armWatcher(50);
    OperationWatcher::disarm(peer, watcher);
    OperationWatcher::disarm(peer, watcher);

    EXPECT_TRUE(watcher->isDisarmed());
    EXPECT_EQ(watcher->getState(), OperationWatcher::State::Disarmed);
}

TEST_F(OperationWatcherTest, DisarmFromInsideFireCallback) {
    std::shared_ptr<OperationWatcher> watcher;
    int calls = 0;

    watcher = OperationWatcher::arm(peer, [&](const std::string&) {
        ++calls;
        OperationWatcher::disarm(peer, watcher);
        watcher.reset();
    }, 20, context.get());

    runLoopFor(100);

    EXPECT_EQ(calls, 1);
    EXPECT_FALSE(watcher);
    EXPECT_EQ(peer.getListenerCount(), 0u);
}

TEST_F(OperationWatcherTest, ReleasedWatcherIgnoresLateEvents) {
    auto watcher = armWatcher(30);
    watcher.reset();

    runLoopFor(100);
    peer.notifyDisconnected();

    EXPECT_TRUE(reasons.empty());
}

TEST_F(OperationWatcherTest, EveryWatcherOnPeerFiresOnDisconnect) {
    auto first = armWatcher(500);
    auto second = armWatcher(500);

    peer.notifyDisconnected();

    EXPECT_EQ(reasons.size(), 2u);
    EXPECT_TRUE(first->isRejected());
    EXPECT_TRUE(second->isRejected());

    OperationWatcher::disarm(peer, first);
    OperationWatcher::disarm(peer, second);
}

TEST_F(OperationWatcherTest, IndependentTimersFireIndependently) {
    auto shortWatcher = armWatcher(20);
    auto longWatcher = armWatcher(1000);

    runLoopFor(100);

    EXPECT_TRUE(shortWatcher->isRejected());
    EXPECT_FALSE(longWatcher->isRejected());
    EXPECT_EQ(reasons.size(), 1u);

    OperationWatcher::disarm(peer, shortWatcher);
    OperationWatcher::disarm(peer, longWatcher);
    EXPECT_EQ(peer.getListenerCount(), 0u);
}
