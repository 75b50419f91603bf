// include/BlueZPeer.h
#pragma once

#include <sdbus-c++/sdbus-c++.h>
#include <glib.h>
#include <map>
#include <memory>
#include <string>

#include "BlueZConstants.h"
#include "GLibTypes.h"
#include "PeerConnection.h"

namespace hapble {

/**
 * @brief PeerConnection for a device managed by BlueZ
 *
 * Watches org.bluez.Device1 "Connected" on the device object through its PropertiesChanged signal. sdbus-c++
 * delivers signals on its own event loop thread, so a drop is re-posted onto the owning GLib main context and
 * delivered there as notifyDisconnected("Disconnected").
 */
class BlueZPeer : public PeerDisconnectNotifier, public std::enable_shared_from_this<BlueZPeer> {
public:
    /**
     * @brief Create a peer for a connected device
     *
     * @param connection D-Bus system bus connection with a running event loop
     * @param deviceAddress Bluetooth address, e.g. "AA:BB:CC:DD:EE:FF"
     * @param adapterPath Adapter object path
     * @param context Main context that receives disconnects, or nullptr for the thread-default context
     * @return The peer, or nullptr if the device proxy could not be created
     */
    static std::shared_ptr<BlueZPeer> create(sdbus::IConnection& connection,
                                             const std::string& deviceAddress,
                                             const std::string& adapterPath = BlueZConstants::DEFAULT_ADAPTER_PATH,
                                             GMainContext* context = nullptr);

    ~BlueZPeer() override;

    BlueZPeer(const BlueZPeer&) = delete;
    BlueZPeer& operator=(const BlueZPeer&) = delete;

    const std::string& getObjectPath() const { return objectPath; }

    /**
     * @brief Build the BlueZ object path of a device
     *
     * "/org/bluez/hci0", "aa:bb:cc:dd:ee:ff" -> "/org/bluez/hci0/dev_AA_BB_CC_DD_EE_FF"
     */
    static std::string devicePathFromAddress(const std::string& adapterPath, const std::string& deviceAddress);

    /**
     * @brief True if a PropertiesChanged payload reports the device as no longer connected
     */
    static bool isDisconnectChange(const std::string& interfaceName,
                                   const std::map<std::string, sdbus::Variant>& changedProperties);

private:
    BlueZPeer(const std::string& deviceAddress, std::string objectPath, GMainContext* context);

    bool registerSignalHandler(sdbus::IConnection& connection);
    void handlePropertiesChanged(const std::string& interfaceName,
                                 const std::map<std::string, sdbus::Variant>& changedProperties);

    static gboolean dispatchDisconnect(gpointer userData);
    static void destroyDispatch(gpointer userData);

    std::string objectPath;
    GMainContextPtr context;
    std::unique_ptr<sdbus::IProxy> deviceProxy;
};

} // namespace hapble
