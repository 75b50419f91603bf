// BlueZConstants.h
#pragma once
#include <string>

namespace hapble {
namespace BlueZConstants {

// Service name
const std::string BLUEZ_SERVICE = "org.bluez";

// Common paths
const std::string DEFAULT_ADAPTER_PATH = "/org/bluez/hci0";
const std::string DEVICE_PATH_PREFIX = "dev_";

// Interfaces
const std::string PROPERTIES_INTERFACE = "org.freedesktop.DBus.Properties";
const std::string DEVICE_INTERFACE = "org.bluez.Device1";

// Property names
const std::string PROPERTY_CONNECTED = "Connected";

// Signals
const std::string SIGNAL_PROPERTIES_CHANGED = "PropertiesChanged";

} // namespace BlueZConstants
} // namespace hapble
