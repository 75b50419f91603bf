#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <string>

namespace hapble {

/**
 * @brief Capability a connected BLE peer offers to operation watchers
 *
 * Implemented by the transport layer. All calls, and every listener invocation, happen on the thread that
 * runs the owning GLib main context.
 */
class PeerConnection {
public:
    // Receives the disconnect reason; empty when the peer supplied none
    using DisconnectListener = std::function<void(const std::string& reason)>;
    using ListenerId = uint64_t;

    virtual ~PeerConnection() = default;

    /**
     * @brief Subscribe to the next disconnect notification only
     *
     * @param listener Called once, then dropped
     * @return Id for removeDisconnectListener()
     */
    virtual ListenerId onceDisconnect(DisconnectListener listener) = 0;

    /**
     * @brief Unsubscribe a listener registered with onceDisconnect()
     *
     * @return false if the id is unknown (already notified or removed)
     */
    virtual bool removeDisconnectListener(ListenerId id) = 0;

    /**
     * @brief Identifier used in log lines (address, object path, ...)
     */
    virtual std::string getIdentifier() const = 0;
};

/**
 * @brief PeerConnection with the one-shot listener bookkeeping done
 *
 * Transport implementations derive from this and call notifyDisconnected() when the link drops.
 */
class PeerDisconnectNotifier : public PeerConnection {
public:
    explicit PeerDisconnectNotifier(std::string identifier);

    ListenerId onceDisconnect(DisconnectListener listener) override;
    bool removeDisconnectListener(ListenerId id) override;
    std::string getIdentifier() const override { return identifier; }

    /**
     * @brief Deliver a disconnect to every current listener
     *
     * Listeners are detached before any of them runs, so each fires once and a listener may safely
     * register or remove others.
     */
    void notifyDisconnected(const std::string& reason = "");

    size_t getListenerCount() const { return listeners.size(); }

private:
    std::string identifier;
    std::map<ListenerId, DisconnectListener> listeners;
    ListenerId nextListenerId;
    // Listeners detached by an in-progress notifyDisconnected() that have not run yet
    std::map<ListenerId, DisconnectListener>* firing;
};

} // namespace hapble
