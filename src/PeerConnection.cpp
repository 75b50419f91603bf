#include "PeerConnection.h"
#include "Logger.h"

namespace hapble {

PeerDisconnectNotifier::PeerDisconnectNotifier(std::string identifier)
    : identifier(std::move(identifier)), nextListenerId(1), firing(nullptr) {
}

PeerConnection::ListenerId PeerDisconnectNotifier::onceDisconnect(DisconnectListener listener) {
    ListenerId id = nextListenerId++;
    listeners.emplace(id, std::move(listener));
    return id;
}

bool PeerDisconnectNotifier::removeDisconnectListener(ListenerId id) {
    if (listeners.erase(id) > 0) {
        return true;
    }
    // Still waiting in the batch being notified
    return firing != nullptr && firing->erase(id) > 0;
}

void PeerDisconnectNotifier::notifyDisconnected(const std::string& reason) {
    std::map<ListenerId, DisconnectListener> pending;
    pending.swap(listeners);

    Logger::debug(SSTR << "Peer " << identifier << " disconnected"
                       << (reason.empty() ? "" : ": " + reason)
                       << " (" << pending.size() << " listener(s))");

    std::map<ListenerId, DisconnectListener>* previous = firing;
    firing = &pending;

    try {
        while (!pending.empty()) {
            auto entry = pending.begin();
            DisconnectListener listener = std::move(entry->second);
            pending.erase(entry);
            if (listener) {
                listener(reason);
            }
        }
    } catch (...) {
        firing = previous;
        throw;
    }

    firing = previous;
}

} // namespace hapble
