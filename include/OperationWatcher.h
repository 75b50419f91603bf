#pragma once

#include <glib.h>
#include <functional>
#include <memory>
#include <string>

#include "GLibTypes.h"
#include "PeerConnection.h"

namespace hapble {

/**
 * @brief Guards one in-flight BLE operation against peer disconnect and timeout
 *
 * The BLE transport offers no per-operation timeout, so callers arm a watcher before issuing a read or
 * write and disarm it once the operation resolves, on every exit path:
 *
 *     auto watcher = OperationWatcher::arm(peer, [&](const std::string& reason) { fail(reason); });
 *     ... issue the transport call; on completion:
 *     OperationWatcher::disarm(peer, watcher);
 *
 * The fire callback runs at most once, with "Disconnected" (or the peer's reason) or "Timeout",
 * whichever trigger comes first. The watcher borrows the peer and owns its timer source and listener
 * registration. Everything runs on the main context the watcher was armed on.
 */
class OperationWatcher : public std::enable_shared_from_this<OperationWatcher> {
public:
    using FireCallback = std::function<void(const std::string& reason)>;

    static constexpr unsigned int kDefaultTimeoutMs = 3000;
    static constexpr const char* kReasonDisconnected = "Disconnected";
    static constexpr const char* kReasonTimeout = "Timeout";

    enum class State {
        Armed,
        Fired,
        Disarmed
    };

    /**
     * @brief Start watching an operation
     *
     * @param peer Peer the operation runs against; must outlive the watcher or its disarm()
     * @param onFire Called once when the operation should be treated as failed
     * @param timeoutMs Timer duration; 0 disables the timer
     * @param context Main context for the timer, or nullptr for the thread-default context
     * @return The armed watcher
     */
    static std::shared_ptr<OperationWatcher> arm(PeerConnection& peer,
                                                 FireCallback onFire,
                                                 unsigned int timeoutMs = kDefaultTimeoutMs,
                                                 GMainContext* context = nullptr);

    /**
     * @brief Stop watching: clears the pending timer and removes the disconnect listener from `peer`
     *
     * Call exactly once per watcher, whether the operation succeeded, failed or was cancelled by the
     * watcher itself.
     */
    static void disarm(PeerConnection& peer, const std::shared_ptr<OperationWatcher>& watcher);

    ~OperationWatcher();

    OperationWatcher(const OperationWatcher&) = delete;
    OperationWatcher& operator=(const OperationWatcher&) = delete;

    bool isRejected() const { return rejected; }
    bool isDisarmed() const { return disarmed; }
    State getState() const { return state; }
    bool hasPendingTimer() const { return timer != nullptr; }
    unsigned int getTimeoutMs() const { return timeoutMs; }

    // Fires the watcher as if the peer had dropped; empty reason maps to "Disconnected"
    void fire(const std::string& reason);

private:
    OperationWatcher(FireCallback onFire, unsigned int timeoutMs, GMainContext* context);

    void startTimer();
    void clearTimer();

    static gboolean onTimeout(gpointer userData);

    FireCallback onFire;
    unsigned int timeoutMs;
    GMainContextPtr context;
    GSourcePtr timer;
    PeerConnection::ListenerId listenerId;
    std::string peerIdentifier;
    bool rejected;
    bool disarmed;
    State state;
};

} // namespace hapble
