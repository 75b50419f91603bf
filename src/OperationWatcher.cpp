#include "OperationWatcher.h"
#include "Logger.h"

namespace hapble {

OperationWatcher::OperationWatcher(FireCallback onFire, unsigned int timeoutMs, GMainContext* context)
    : onFire(std::move(onFire)),
      timeoutMs(timeoutMs),
      context(refGMainContext(context)),
      listenerId(0),
      rejected(false),
      disarmed(false),
      state(State::Armed) {
}

OperationWatcher::~OperationWatcher() {
    if (!disarmed) {
        Logger::trace(SSTR << "Watcher for " << peerIdentifier << " released without disarm");
    }
    clearTimer();
}

std::shared_ptr<OperationWatcher> OperationWatcher::arm(PeerConnection& peer,
                                                        FireCallback onFire,
                                                        unsigned int timeoutMs,
                                                        GMainContext* context) {
    std::shared_ptr<OperationWatcher> watcher(new OperationWatcher(std::move(onFire), timeoutMs, context));
    watcher->peerIdentifier = peer.getIdentifier();

    // The peer may outlive the watcher, so the listener only holds a weak reference
    std::weak_ptr<OperationWatcher> weakWatcher = watcher;
    watcher->listenerId = peer.onceDisconnect([weakWatcher](const std::string& reason) {
        if (auto self = weakWatcher.lock()) {
            self->fire(reason);
        }
    });

    if (timeoutMs > 0) {
        watcher->startTimer();
    }

    Logger::trace(SSTR << "Watcher armed for " << watcher->peerIdentifier << " (timeout " << timeoutMs << " ms)");
    return watcher;
}

void OperationWatcher::disarm(PeerConnection& peer, const std::shared_ptr<OperationWatcher>& watcher) {
    if (!watcher) {
        return;
    }

    if (watcher->disarmed) {
        Logger::warn(SSTR << "Watcher for " << watcher->peerIdentifier << " disarmed twice; ignoring");
        return;
    }

    watcher->disarmed = true;
    watcher->clearTimer();

    // After a disconnect fire the one-shot listener is already gone
    if (!peer.removeDisconnectListener(watcher->listenerId)) {
        Logger::trace(SSTR << "No disconnect listener left on " << peer.getIdentifier());
    }

    if (watcher->state == State::Armed) {
        watcher->state = State::Disarmed;
    }

    Logger::trace(SSTR << "Watcher disarmed for " << watcher->peerIdentifier);
}

void OperationWatcher::fire(const std::string& reason) {
    if (rejected || state != State::Armed) {
        return;
    }

    rejected = true;
    state = State::Fired;
    clearTimer();

    std::string effectiveReason = reason.empty() ? kReasonDisconnected : reason;
    Logger::info(SSTR << "Operation on " << peerIdentifier << " aborted: " << effectiveReason);

    if (onFire) {
        onFire(effectiveReason);
    }
}

void OperationWatcher::startTimer() {
    GSource* source = g_timeout_source_new(timeoutMs);
    g_source_set_callback(source, &OperationWatcher::onTimeout, this, nullptr);
    g_source_attach(source, context.get());
    timer.reset(source);
}

void OperationWatcher::clearTimer() {
    timer.reset();
}

gboolean OperationWatcher::onTimeout(gpointer userData) {
    OperationWatcher* watcher = static_cast<OperationWatcher*>(userData);

    // The fire callback may disarm and drop the last reference
    std::shared_ptr<OperationWatcher> self = watcher->shared_from_this();
    self->timer.reset();
    self->fire(kReasonTimeout);

    return G_SOURCE_REMOVE;
}

} // namespace hapble
