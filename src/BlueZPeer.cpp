// src/BlueZPeer.cpp
#include "BlueZPeer.h"
#include "BlueZConstants.h"
#include "Logger.h"

#include <algorithm>
#include <cctype>
#include <vector>

namespace hapble {

namespace {

const char* const kDisconnectReason = "Disconnected";

} // anonymous namespace

std::shared_ptr<BlueZPeer> BlueZPeer::create(sdbus::IConnection& connection,
                                             const std::string& deviceAddress,
                                             const std::string& adapterPath,
                                             GMainContext* context) {
    std::shared_ptr<BlueZPeer> peer(
        new BlueZPeer(deviceAddress, devicePathFromAddress(adapterPath, deviceAddress), context));

    if (!peer->registerSignalHandler(connection)) {
        return nullptr;
    }

    Logger::info("BlueZ peer ready: " + peer->objectPath);
    return peer;
}

BlueZPeer::BlueZPeer(const std::string& deviceAddress, std::string objectPath, GMainContext* context)
    : PeerDisconnectNotifier(deviceAddress),
      objectPath(std::move(objectPath)),
      context(refGMainContext(context)) {
}

BlueZPeer::~BlueZPeer() {
    // Drop the proxy first so no signal handler runs against a half-destroyed peer
    deviceProxy.reset();
    Logger::debug("BlueZ peer released: " + objectPath);
}

std::string BlueZPeer::devicePathFromAddress(const std::string& adapterPath, const std::string& deviceAddress) {
    std::string node = deviceAddress;
    std::transform(node.begin(), node.end(), node.begin(), [](unsigned char c) {
        return c == ':' ? '_' : static_cast<char>(std::toupper(c));
    });

    return adapterPath + "/" + BlueZConstants::DEVICE_PATH_PREFIX + node;
}

bool BlueZPeer::isDisconnectChange(const std::string& interfaceName,
                                   const std::map<std::string, sdbus::Variant>& changedProperties) {
    if (interfaceName != BlueZConstants::DEVICE_INTERFACE) {
        return false;
    }

    auto it = changedProperties.find(BlueZConstants::PROPERTY_CONNECTED);
    if (it == changedProperties.end() || !it->second.containsValueOfType<bool>()) {
        return false;
    }

    return !it->second.get<bool>();
}

bool BlueZPeer::registerSignalHandler(sdbus::IConnection& connection) {
    try {
        deviceProxy = sdbus::createProxy(
            connection,
            sdbus::ServiceName{BlueZConstants::BLUEZ_SERVICE},
            sdbus::ObjectPath{objectPath}
        );

        std::weak_ptr<BlueZPeer> weakSelf = weak_from_this();
        deviceProxy->uponSignal(sdbus::SignalName{BlueZConstants::SIGNAL_PROPERTIES_CHANGED})
            .onInterface(sdbus::InterfaceName{BlueZConstants::PROPERTIES_INTERFACE})
            .call([weakSelf](std::string interfaceName,
                             std::map<std::string, sdbus::Variant> changedProperties,
                             std::vector<std::string> invalidatedProperties) {
                (void)invalidatedProperties;
                if (auto self = weakSelf.lock()) {
                    self->handlePropertiesChanged(interfaceName, changedProperties);
                }
            });

        return true;
    }
    catch (const sdbus::Error& e) {
        Logger::error("Failed to watch BlueZ device " + objectPath + ": " + e.getMessage());
        deviceProxy.reset();
        return false;
    }
}

// Runs on the sdbus-c++ event loop thread
void BlueZPeer::handlePropertiesChanged(const std::string& interfaceName,
                                        const std::map<std::string, sdbus::Variant>& changedProperties) {
    if (!isDisconnectChange(interfaceName, changedProperties)) {
        return;
    }

    Logger::debug("BlueZ reports " + objectPath + " disconnected");

    // Owned by the destroy notify (destroyDispatch)
    auto* target = new std::weak_ptr<BlueZPeer>(weak_from_this());
    g_main_context_invoke_full(context.get(), G_PRIORITY_DEFAULT,
                               &BlueZPeer::dispatchDisconnect, target, &BlueZPeer::destroyDispatch);
}

// Runs on the owning main context
gboolean BlueZPeer::dispatchDisconnect(gpointer userData) {
    auto* target = static_cast<std::weak_ptr<BlueZPeer>*>(userData);
    if (auto peer = target->lock()) {
        peer->notifyDisconnected(kDisconnectReason);
    }
    return G_SOURCE_REMOVE;
}

void BlueZPeer::destroyDispatch(gpointer userData) {
    delete static_cast<std::weak_ptr<BlueZPeer>*>(userData);
}

} // namespace hapble
