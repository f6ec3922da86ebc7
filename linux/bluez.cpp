#include "bluez.hpp"

#include <strings.h>
#include <unistd.h>

#include <algorithm>
#include <cstring>
#include <iostream>

namespace bluez {

using probelink::ErrorKind;
using probelink::Result;
using probelink::Status;

constexpr int DEFAULT_TIMEOUT_MS = 5000;
constexpr int CONNECT_TIMEOUT_MS = 10000;
constexpr int SERVICES_RESOLVED_WAIT_MS = 10000;
constexpr int SERVICES_RESOLVED_POLL_MS = 100;

constexpr const char* BLUEZ_SERVICE = "org.bluez";
constexpr const char* ADAPTER_IFACE = "org.bluez.Adapter1";
constexpr const char* DEVICE_IFACE = "org.bluez.Device1";
constexpr const char* GATT_SERVICE_IFACE = "org.bluez.GattService1";
constexpr const char* GATT_CHARACTERISTIC_IFACE = "org.bluez.GattCharacteristic1";
constexpr const char* PROPERTIES_IFACE = "org.freedesktop.DBus.Properties";
constexpr const char* OBJECT_MANAGER_IFACE = "org.freedesktop.DBus.ObjectManager";

ErrorKind classify_error(const char* error_name) {
    if (!error_name) return ErrorKind::TransportFailure;

    // Stack not there or not allowed: nothing the device did
    static const char* const unavailable[] = {
        "org.bluez.Error.NotReady",
        "org.bluez.Error.NotAuthorized",
        DBUS_ERROR_SERVICE_UNKNOWN,
        DBUS_ERROR_NAME_HAS_NO_OWNER,
        DBUS_ERROR_NO_SERVER,
        DBUS_ERROR_ACCESS_DENIED,
        DBUS_ERROR_DISCONNECTED,
    };
    for (const char* name : unavailable) {
        if (strcmp(error_name, name) == 0) return ErrorKind::TransportUnavailable;
    }
    return ErrorKind::TransportFailure;
}

static Status take_error(DBusError* err, const char* what) {
    auto status = Status::failure(classify_error(err->name),
                                  std::string(what) + ": " + (err->message ? err->message : err->name));
    dbus_error_free(err);
    return status;
}

// "Already" errors are OK (already connected, already discovering, etc)
static bool is_already_error(const DBusError& err) {
    return (err.message && (strstr(err.message, "Already") || strstr(err.message, "already"))) ||
           (err.name && strstr(err.name, "Already"));
}

// Send msg (consumed) and wait for the reply. nullptr with *status set on failure.
static DBusMessage* send_for_reply(DBusConnection* conn, DBusMessage* msg, const char* what,
                                   Status* status, int timeout_ms = DEFAULT_TIMEOUT_MS) {
    DBusError err;
    dbus_error_init(&err);

    DBusMessage* reply = dbus_connection_send_with_reply_and_block(conn, msg, timeout_ms, &err);
    dbus_message_unref(msg);

    if (dbus_error_is_set(&err)) {
        std::cerr << "bluez: " << what << " failed: " << err.message << std::endl;
        *status = take_error(&err, what);
        return nullptr;
    }
    if (!reply) {
        *status = Status::failure(ErrorKind::TransportFailure, std::string(what) + ": no reply");
        return nullptr;
    }
    *status = {};
    return reply;
}

// Send msg (consumed), discard the reply
static Status send_void(DBusConnection* conn, DBusMessage* msg, const char* what,
                        int timeout_ms = DEFAULT_TIMEOUT_MS) {
    DBusError err;
    dbus_error_init(&err);

    DBusMessage* reply = dbus_connection_send_with_reply_and_block(conn, msg, timeout_ms, &err);
    dbus_message_unref(msg);

    if (dbus_error_is_set(&err)) {
        if (is_already_error(err)) {
            dbus_error_free(&err);
            return {};
        }
        std::cerr << "bluez: " << what << " failed: " << err.message << std::endl;
        return take_error(&err, what);
    }

    if (reply) dbus_message_unref(reply);
    return {};
}

static Status out_of_memory(const char* what) {
    return Status::failure(ErrorKind::TransportFailure, std::string(what) + ": out of memory");
}

// Helper to call a method with no arguments and no return
static Status call_method_void(DBusConnection* conn, const char* path, const char* iface,
                               const char* method, int timeout_ms = DEFAULT_TIMEOUT_MS) {
    DBusMessage* msg = dbus_message_new_method_call(BLUEZ_SERVICE, path, iface, method);
    if (!msg) return out_of_memory(method);
    return send_void(conn, msg, method, timeout_ms);
}

// Properties.Get, reply holds a single variant
static DBusMessage* get_property(DBusConnection* conn, const char* path, const char* iface,
                                 const char* prop) {
    DBusMessage* msg = dbus_message_new_method_call(BLUEZ_SERVICE, path, PROPERTIES_IFACE, "Get");
    if (!msg) return nullptr;

    dbus_message_append_args(msg, DBUS_TYPE_STRING, &iface,
                             DBUS_TYPE_STRING, &prop, DBUS_TYPE_INVALID);

    DBusError err;
    dbus_error_init(&err);
    DBusMessage* reply = dbus_connection_send_with_reply_and_block(conn, msg, 2000, &err);
    dbus_message_unref(msg);

    if (dbus_error_is_set(&err)) {
        dbus_error_free(&err);
        return nullptr;
    }
    return reply;
}

// Helper to get a bool property
static bool get_bool_property(DBusConnection* conn, const char* path,
                              const char* iface, const char* prop) {
    DBusMessage* reply = get_property(conn, path, iface, prop);
    if (!reply) return false;

    bool result = false;
    DBusMessageIter iter, variant;
    if (dbus_message_iter_init(reply, &iter) &&
        dbus_message_iter_get_arg_type(&iter) == DBUS_TYPE_VARIANT) {
        dbus_message_iter_recurse(&iter, &variant);
        if (dbus_message_iter_get_arg_type(&variant) == DBUS_TYPE_BOOLEAN) {
            dbus_bool_t val;
            dbus_message_iter_get_basic(&variant, &val);
            result = val;
        }
    }
    dbus_message_unref(reply);
    return result;
}

// Iterate an a{sv} dict, iterator positioned at the array
template<typename Fn>
static void for_each_property(DBusMessageIter* array_iter, Fn&& fn) {
    if (dbus_message_iter_get_arg_type(array_iter) != DBUS_TYPE_ARRAY) return;

    DBusMessageIter dict;
    dbus_message_iter_recurse(array_iter, &dict);

    while (dbus_message_iter_get_arg_type(&dict) == DBUS_TYPE_DICT_ENTRY) {
        DBusMessageIter entry, variant;
        dbus_message_iter_recurse(&dict, &entry);

        if (dbus_message_iter_get_arg_type(&entry) == DBUS_TYPE_STRING) {
            const char* name;
            dbus_message_iter_get_basic(&entry, &name);
            dbus_message_iter_next(&entry);

            if (dbus_message_iter_get_arg_type(&entry) == DBUS_TYPE_VARIANT) {
                dbus_message_iter_recurse(&entry, &variant);
                fn(name, &variant);
            }
        }
        dbus_message_iter_next(&dict);
    }
}

static std::vector<uint8_t> read_byte_array(DBusMessageIter* iter) {
    std::vector<uint8_t> result;
    if (dbus_message_iter_get_arg_type(iter) != DBUS_TYPE_ARRAY ||
        dbus_message_iter_get_element_type(iter) != DBUS_TYPE_BYTE) {
        return result;
    }

    DBusMessageIter bytes;
    dbus_message_iter_recurse(iter, &bytes);

    const uint8_t* data = nullptr;
    int len = 0;
    dbus_message_iter_get_fixed_array(&bytes, &data, &len);
    if (data && len > 0) {
        result.assign(data, data + len);
    }
    return result;
}

static std::optional<std::string> read_string(DBusMessageIter* iter) {
    int type = dbus_message_iter_get_arg_type(iter);
    if (type != DBUS_TYPE_STRING && type != DBUS_TYPE_OBJECT_PATH) return std::nullopt;
    const char* val;
    dbus_message_iter_get_basic(iter, &val);
    return std::string(val);
}

// Check if an "as" UUID list contains uuid
static bool uuids_contain(DBusMessageIter* uuids_iter, const std::string& uuid) {
    if (dbus_message_iter_get_arg_type(uuids_iter) != DBUS_TYPE_ARRAY) {
        return false;
    }

    DBusMessageIter array_iter;
    dbus_message_iter_recurse(uuids_iter, &array_iter);

    while (dbus_message_iter_get_arg_type(&array_iter) == DBUS_TYPE_STRING) {
        const char* value;
        dbus_message_iter_get_basic(&array_iter, &value);
        if (strcasecmp(value, uuid.c_str()) == 0) {
            return true;
        }
        dbus_message_iter_next(&array_iter);
    }
    return false;
}

// ManufacturerData is a{qv} - dict of uint16 -> variant(array of bytes)
static std::optional<std::vector<uint8_t>> extract_manufacturer_data(DBusMessageIter* mfr_data_iter,
                                                                     uint16_t vendor_id) {
    if (dbus_message_iter_get_arg_type(mfr_data_iter) != DBUS_TYPE_ARRAY) {
        return std::nullopt;
    }

    DBusMessageIter dict;
    dbus_message_iter_recurse(mfr_data_iter, &dict);

    while (dbus_message_iter_get_arg_type(&dict) == DBUS_TYPE_DICT_ENTRY) {
        DBusMessageIter entry;
        dbus_message_iter_recurse(&dict, &entry);

        if (dbus_message_iter_get_arg_type(&entry) == DBUS_TYPE_UINT16) {
            uint16_t mfr_id;
            dbus_message_iter_get_basic(&entry, &mfr_id);
            dbus_message_iter_next(&entry);

            if (mfr_id == vendor_id && dbus_message_iter_get_arg_type(&entry) == DBUS_TYPE_VARIANT) {
                DBusMessageIter variant;
                dbus_message_iter_recurse(&entry, &variant);
                return read_byte_array(&variant);
            }
        }
        dbus_message_iter_next(&dict);
    }
    return std::nullopt;
}

DeviceProperties parse_device_properties(DBusMessageIter* props, const std::string& filter_uuid,
                                         uint16_t vendor_id) {
    DeviceProperties result;

    for_each_property(props, [&](const char* name, DBusMessageIter* variant) {
        int type = dbus_message_iter_get_arg_type(variant);

        if (strcmp(name, "Address") == 0) {
            result.address = read_string(variant);
        } else if (strcmp(name, "Name") == 0) {
            result.name = read_string(variant);
        } else if (strcmp(name, "RSSI") == 0 && type == DBUS_TYPE_INT16) {
            dbus_int16_t rssi;
            dbus_message_iter_get_basic(variant, &rssi);
            result.rssi = rssi;
        } else if (strcmp(name, "ManufacturerData") == 0) {
            result.manufacturer_data = extract_manufacturer_data(variant, vendor_id);
        } else if (strcmp(name, "Connected") == 0 && type == DBUS_TYPE_BOOLEAN) {
            dbus_bool_t connected;
            dbus_message_iter_get_basic(variant, &connected);
            result.connected = connected;
        } else if (strcmp(name, "UUIDs") == 0) {
            result.exposes_filter_uuid = !filter_uuid.empty() && uuids_contain(variant, filter_uuid);
        }
    });

    return result;
}

// Append {s: v(as)} / {s: v(s)} / {s: v(b)} entries to an a{sv} being built
static void append_string_list_entry(DBusMessageIter* dict, const char* key, const char* value) {
    DBusMessageIter entry, variant, array;
    dbus_message_iter_open_container(dict, DBUS_TYPE_DICT_ENTRY, nullptr, &entry);
    dbus_message_iter_append_basic(&entry, DBUS_TYPE_STRING, &key);
    dbus_message_iter_open_container(&entry, DBUS_TYPE_VARIANT, "as", &variant);
    dbus_message_iter_open_container(&variant, DBUS_TYPE_ARRAY, "s", &array);
    dbus_message_iter_append_basic(&array, DBUS_TYPE_STRING, &value);
    dbus_message_iter_close_container(&variant, &array);
    dbus_message_iter_close_container(&entry, &variant);
    dbus_message_iter_close_container(dict, &entry);
}

static void append_string_entry(DBusMessageIter* dict, const char* key, const char* value) {
    DBusMessageIter entry, variant;
    dbus_message_iter_open_container(dict, DBUS_TYPE_DICT_ENTRY, nullptr, &entry);
    dbus_message_iter_append_basic(&entry, DBUS_TYPE_STRING, &key);
    dbus_message_iter_open_container(&entry, DBUS_TYPE_VARIANT, "s", &variant);
    dbus_message_iter_append_basic(&variant, DBUS_TYPE_STRING, &value);
    dbus_message_iter_close_container(&entry, &variant);
    dbus_message_iter_close_container(dict, &entry);
}

static void append_bool_entry(DBusMessageIter* dict, const char* key, dbus_bool_t value) {
    DBusMessageIter entry, variant;
    dbus_message_iter_open_container(dict, DBUS_TYPE_DICT_ENTRY, nullptr, &entry);
    dbus_message_iter_append_basic(&entry, DBUS_TYPE_STRING, &key);
    dbus_message_iter_open_container(&entry, DBUS_TYPE_VARIANT, "b", &variant);
    dbus_message_iter_append_basic(&variant, DBUS_TYPE_BOOLEAN, &value);
    dbus_message_iter_close_container(&entry, &variant);
    dbus_message_iter_close_container(dict, &entry);
}

// GATT calls take an options a{sv}, always empty here
static void append_empty_options(DBusMessageIter* iter) {
    DBusMessageIter options;
    dbus_message_iter_open_container(iter, DBUS_TYPE_ARRAY, "{sv}", &options);
    dbus_message_iter_close_container(iter, &options);
}

static std::optional<std::string> get_adapter_path(DBusConnection* conn) {
    DBusMessage* msg = dbus_message_new_method_call(BLUEZ_SERVICE, "/",
        OBJECT_MANAGER_IFACE, "GetManagedObjects");
    if (!msg) return std::nullopt;

    Status status;
    DBusMessage* reply = send_for_reply(conn, msg, "GetManagedObjects", &status);
    if (!reply) return std::nullopt;

    std::optional<std::string> result;

    DBusMessageIter iter, dict;
    if (dbus_message_iter_init(reply, &iter) &&
        dbus_message_iter_get_arg_type(&iter) == DBUS_TYPE_ARRAY) {

        dbus_message_iter_recurse(&iter, &dict);

        while (dbus_message_iter_get_arg_type(&dict) == DBUS_TYPE_DICT_ENTRY) {
            DBusMessageIter entry, ifaces;
            dbus_message_iter_recurse(&dict, &entry);

            const char* obj_path;
            dbus_message_iter_get_basic(&entry, &obj_path);
            dbus_message_iter_next(&entry);

            // Check interfaces
            if (dbus_message_iter_get_arg_type(&entry) == DBUS_TYPE_ARRAY) {
                dbus_message_iter_recurse(&entry, &ifaces);

                while (dbus_message_iter_get_arg_type(&ifaces) == DBUS_TYPE_DICT_ENTRY) {
                    DBusMessageIter iface_entry;
                    dbus_message_iter_recurse(&ifaces, &iface_entry);

                    const char* iface_name;
                    dbus_message_iter_get_basic(&iface_entry, &iface_name);

                    if (strcmp(iface_name, ADAPTER_IFACE) == 0) {
                        result = obj_path;
                        break;
                    }
                    dbus_message_iter_next(&ifaces);
                }
            }

            if (result) break;
            dbus_message_iter_next(&dict);
        }
    }
    dbus_message_unref(reply);

    return result;
}

std::string get_device_path(const std::string& adapter_path, const std::string& mac_address) {
    std::string result = mac_address;
    std::replace(result.begin(), result.end(), ':', '_');
    return adapter_path + "/dev_" + result;
}

std::optional<std::string> device_path_of(const std::string& object_path) {
    auto dev = object_path.find("/dev_");
    if (dev == std::string::npos) return std::nullopt;
    auto end = object_path.find('/', dev + 1);
    return object_path.substr(0, end);
}

std::optional<std::string> address_from_path(const std::string& object_path) {
    auto device = device_path_of(object_path);
    if (!device) return std::nullopt;

    std::string address = device->substr(device->find("/dev_") + 5);
    if (address.size() != 17) return std::nullopt;
    std::replace(address.begin(), address.end(), '_', ':');
    return address;
}

static DBusHandlerResult signal_filter(DBusConnection* conn, DBusMessage* msg, void* data) {
    (void)conn;
    auto* transport = static_cast<GattTransport*>(data);

    if (dbus_message_get_type(msg) == DBUS_MESSAGE_TYPE_SIGNAL) {
        if (transport->handle_signal(msg)) {
            return DBUS_HANDLER_RESULT_HANDLED;
        }
    }
    return DBUS_HANDLER_RESULT_NOT_YET_HANDLED;
}

GattTransport::GattTransport(uint16_t vendor_id) : vendor_id_(vendor_id) {}

GattTransport::~GattTransport() {
    if (!conn_) return;

    if (on_advertisement_) {
        auto status = stop_scan();
        if (!status) {
            std::cerr << "bluez: stop scan on shutdown failed: " << status.error().message << std::endl;
        }
    }
    if (filter_installed_) {
        dbus_connection_remove_filter(conn_, signal_filter, this);
    }
    dbus_connection_unref(conn_);
}

Status GattTransport::initialize() {
    if (conn_) return {};

    DBusError err;
    dbus_error_init(&err);

    DBusConnection* conn = dbus_bus_get(DBUS_BUS_SYSTEM, &err);
    if (dbus_error_is_set(&err)) {
        std::cerr << "bluez: failed to connect to system D-Bus: " << err.message << std::endl;
        auto status = Status::failure(ErrorKind::TransportUnavailable,
                                      std::string("system bus: ") + err.message);
        dbus_error_free(&err);
        return status;
    }
    if (!conn) {
        return Status::failure(ErrorKind::TransportUnavailable, "system bus unavailable");
    }

    auto adapter = get_adapter_path(conn);
    if (!adapter) {
        std::cerr << "bluez: no adapter found" << std::endl;
        dbus_connection_unref(conn);
        return Status::failure(ErrorKind::TransportUnavailable, "no Bluetooth adapter found");
    }
    if (!get_bool_property(conn, adapter->c_str(), ADAPTER_IFACE, "Powered")) {
        std::cerr << "bluez: adapter " << *adapter << " is powered off" << std::endl;
        dbus_connection_unref(conn);
        return Status::failure(ErrorKind::TransportUnavailable, "Bluetooth adapter is powered off");
    }

    conn_ = conn;
    adapter_path_ = *adapter;

    // Subscribe to InterfacesAdded (new devices discovered)
    dbus_bus_add_match(conn_,
        "type='signal',sender='org.bluez',interface='org.freedesktop.DBus.ObjectManager',member='InterfacesAdded'",
        &err);
    if (dbus_error_is_set(&err)) {
        std::cerr << "bluez: failed to add InterfacesAdded match: " << err.message << std::endl;
        dbus_connection_unref(conn_);
        conn_ = nullptr;
        return take_error(&err, "AddMatch");
    }

    // Subscribe to PropertiesChanged (RSSI, Connected, characteristic Value)
    dbus_bus_add_match(conn_,
        "type='signal',sender='org.bluez',interface='org.freedesktop.DBus.Properties',member='PropertiesChanged'",
        &err);
    if (dbus_error_is_set(&err)) {
        std::cerr << "bluez: failed to add PropertiesChanged match: " << err.message << std::endl;
        dbus_connection_unref(conn_);
        conn_ = nullptr;
        return take_error(&err, "AddMatch");
    }

    dbus_connection_add_filter(conn_, signal_filter, this, nullptr);
    filter_installed_ = true;
    dbus_connection_flush(conn_);

    std::cout << "bluez: using adapter " << adapter_path_ << std::endl;
    return {};
}

std::string GattTransport::device_path(const std::string& id) const {
    return get_device_path(adapter_path_, id);
}

Status GattTransport::request_scan(const std::string& service_uuid,
                                   probelink::AdvertisementHandler on_event) {
    if (!conn_) {
        return Status::failure(ErrorKind::TransportUnavailable, "transport not initialized");
    }

    DBusMessage* msg = dbus_message_new_method_call(BLUEZ_SERVICE, adapter_path_.c_str(),
        ADAPTER_IFACE, "SetDiscoveryFilter");
    if (!msg) return out_of_memory("SetDiscoveryFilter");

    DBusMessageIter iter, dict;
    dbus_message_iter_init_append(msg, &iter);
    dbus_message_iter_open_container(&iter, DBUS_TYPE_ARRAY, "{sv}", &dict);
    append_string_list_entry(&dict, "UUIDs", service_uuid.c_str());
    append_string_entry(&dict, "Transport", "le");
    append_bool_entry(&dict, "DuplicateData", TRUE);
    dbus_message_iter_close_container(&iter, &dict);

    if (auto status = send_void(conn_, msg, "SetDiscoveryFilter"); !status) {
        return status;
    }

    scan_filter_ = service_uuid;
    on_advertisement_ = std::move(on_event);
    filter_matches_.clear();
    last_rssi_.clear();

    auto status = call_method_void(conn_, adapter_path_.c_str(), ADAPTER_IFACE, "StartDiscovery");
    if (!status) {
        on_advertisement_ = nullptr;
    }
    return status;
}

Status GattTransport::stop_scan() {
    on_advertisement_ = nullptr;
    if (!conn_) {
        return Status::failure(ErrorKind::TransportUnavailable, "transport not initialized");
    }
    return call_method_void(conn_, adapter_path_.c_str(), ADAPTER_IFACE, "StopDiscovery");
}

Status GattTransport::connect(const std::string& id, probelink::DisconnectHandler on_disconnect) {
    if (!conn_) {
        return Status::failure(ErrorKind::TransportUnavailable, "transport not initialized");
    }

    std::string path = device_path(id);
    std::cout << "bluez: connecting to " << id << "..." << std::endl;

    auto status = call_method_void(conn_, path.c_str(), DEVICE_IFACE, "Connect", CONNECT_TIMEOUT_MS);
    if (!status) return status;

    // GATT objects only exist once service discovery finished
    int waited_ms = 0;
    while (!get_bool_property(conn_, path.c_str(), DEVICE_IFACE, "ServicesResolved")) {
        if (waited_ms >= SERVICES_RESOLVED_WAIT_MS) {
            std::cerr << "bluez: services not resolved on " << id << std::endl;
            auto dropped = call_method_void(conn_, path.c_str(), DEVICE_IFACE, "Disconnect");
            if (!dropped) {
                std::cerr << "bluez: disconnect after failed connect: "
                          << dropped.error().message << std::endl;
            }
            return Status::failure(ErrorKind::TransportFailure,
                                   "services not resolved on " + id);
        }
        usleep(SERVICES_RESOLVED_POLL_MS * 1000);
        waited_ms += SERVICES_RESOLVED_POLL_MS;
    }

    disconnect_handlers_[path] = std::move(on_disconnect);
    std::cout << "bluez: connected to " << id << std::endl;
    return {};
}

void GattTransport::forget_device(const std::string& device_path) {
    disconnect_handlers_.erase(device_path);

    std::string prefix = device_path + "/";
    for (auto it = notify_handlers_.begin(); it != notify_handlers_.end();) {
        it = it->first.starts_with(prefix) ? notify_handlers_.erase(it) : std::next(it);
    }
    for (auto it = characteristic_cache_.begin(); it != characteristic_cache_.end();) {
        it = it->second.starts_with(prefix) ? characteristic_cache_.erase(it) : std::next(it);
    }
}

Status GattTransport::disconnect(const std::string& id) {
    if (!conn_) {
        return Status::failure(ErrorKind::TransportUnavailable, "transport not initialized");
    }

    std::string path = device_path(id);
    forget_device(path);

    auto status = call_method_void(conn_, path.c_str(), DEVICE_IFACE, "Disconnect");
    if (status) {
        std::cout << "bluez: disconnected from " << id << std::endl;
    }
    return status;
}

Result<GattTransport::GattTree> GattTransport::collect_gatt(const std::string& device_path) {
    if (!conn_) {
        return Result<GattTree>::failure(ErrorKind::TransportUnavailable, "transport not initialized");
    }

    DBusMessage* msg = dbus_message_new_method_call(BLUEZ_SERVICE, "/",
        OBJECT_MANAGER_IFACE, "GetManagedObjects");
    if (!msg) return out_of_memory("GetManagedObjects").error();

    Status status;
    DBusMessage* reply = send_for_reply(conn_, msg, "GetManagedObjects", &status);
    if (!reply) return status.error();

    GattTree tree;
    std::string prefix = device_path + "/";

    DBusMessageIter iter, dict;
    if (dbus_message_iter_init(reply, &iter) &&
        dbus_message_iter_get_arg_type(&iter) == DBUS_TYPE_ARRAY) {

        dbus_message_iter_recurse(&iter, &dict);

        while (dbus_message_iter_get_arg_type(&dict) == DBUS_TYPE_DICT_ENTRY) {
            DBusMessageIter entry, ifaces;
            dbus_message_iter_recurse(&dict, &entry);

            const char* obj_path;
            dbus_message_iter_get_basic(&entry, &obj_path);
            dbus_message_iter_next(&entry);

            if (std::string(obj_path).starts_with(prefix) &&
                dbus_message_iter_get_arg_type(&entry) == DBUS_TYPE_ARRAY) {
                dbus_message_iter_recurse(&entry, &ifaces);

                while (dbus_message_iter_get_arg_type(&ifaces) == DBUS_TYPE_DICT_ENTRY) {
                    DBusMessageIter iface_entry;
                    dbus_message_iter_recurse(&ifaces, &iface_entry);

                    const char* iface_name;
                    dbus_message_iter_get_basic(&iface_entry, &iface_name);
                    dbus_message_iter_next(&iface_entry);

                    std::optional<std::string> uuid;
                    std::optional<std::string> service;
                    for_each_property(&iface_entry, [&](const char* name, DBusMessageIter* variant) {
                        if (strcmp(name, "UUID") == 0) uuid = read_string(variant);
                        else if (strcmp(name, "Service") == 0) service = read_string(variant);
                    });

                    if (uuid && strcmp(iface_name, GATT_SERVICE_IFACE) == 0) {
                        tree.services.emplace_back(obj_path, *uuid);
                    } else if (uuid && service && strcmp(iface_name, GATT_CHARACTERISTIC_IFACE) == 0) {
                        tree.characteristics.push_back({obj_path, *uuid, *service});
                    }
                    dbus_message_iter_next(&ifaces);
                }
            }

            dbus_message_iter_next(&dict);
        }
    }
    dbus_message_unref(reply);

    // Object paths carry the attribute handle, so path order is handle order
    std::sort(tree.services.begin(), tree.services.end());
    std::sort(tree.characteristics.begin(), tree.characteristics.end(),
              [](const auto& a, const auto& b) { return a.path < b.path; });

    // Resolve the Service object path of each characteristic to its UUID
    for (auto& characteristic : tree.characteristics) {
        auto it = std::find_if(tree.services.begin(), tree.services.end(),
                               [&](const auto& s) { return s.first == characteristic.service_uuid; });
        characteristic.service_uuid = it != tree.services.end() ? it->second : std::string();
    }

    return tree;
}

Result<probelink::ServiceMap> GattTransport::list_services(const std::string& id) {
    auto tree = collect_gatt(device_path(id));
    if (!tree) return tree.error();

    probelink::ServiceMap services;
    for (const auto& [path, uuid] : tree->services) {
        services[uuid];
    }
    for (const auto& characteristic : tree->characteristics) {
        services[characteristic.service_uuid].push_back(characteristic.uuid);
    }
    return services;
}

Result<std::string> GattTransport::characteristic_path(const std::string& id,
                                                       const std::string& service,
                                                       const std::string& characteristic) {
    std::string key = id + "|" + service + "|" + characteristic;
    if (auto it = characteristic_cache_.find(key); it != characteristic_cache_.end()) {
        return it->second;
    }

    auto tree = collect_gatt(device_path(id));
    if (!tree) return tree.error();

    for (const auto& c : tree->characteristics) {
        if (strcasecmp(c.uuid.c_str(), characteristic.c_str()) == 0 &&
            strcasecmp(c.service_uuid.c_str(), service.c_str()) == 0) {
            characteristic_cache_[key] = c.path;
            return c.path;
        }
    }

    return Result<std::string>::failure(ErrorKind::TransportFailure,
        "characteristic " + characteristic + " not found on " + id);
}

Result<std::vector<uint8_t>> GattTransport::read_characteristic(const std::string& id,
                                                                const std::string& service,
                                                                const std::string& characteristic) {
    auto path = characteristic_path(id, service, characteristic);
    if (!path) return path.error();

    DBusMessage* msg = dbus_message_new_method_call(BLUEZ_SERVICE, path->c_str(),
        GATT_CHARACTERISTIC_IFACE, "ReadValue");
    if (!msg) return out_of_memory("ReadValue").error();

    DBusMessageIter iter;
    dbus_message_iter_init_append(msg, &iter);
    append_empty_options(&iter);

    Status status;
    DBusMessage* reply = send_for_reply(conn_, msg, "ReadValue", &status);
    if (!reply) return status.error();

    std::vector<uint8_t> value;
    DBusMessageIter reply_iter;
    if (dbus_message_iter_init(reply, &reply_iter)) {
        value = read_byte_array(&reply_iter);
    }
    dbus_message_unref(reply);
    return value;
}

Status GattTransport::write_characteristic(const std::string& id, const std::string& service,
                                           const std::string& characteristic,
                                           std::span<const uint8_t> value) {
    auto path = characteristic_path(id, service, characteristic);
    if (!path) return path.status();

    DBusMessage* msg = dbus_message_new_method_call(BLUEZ_SERVICE, path->c_str(),
        GATT_CHARACTERISTIC_IFACE, "WriteValue");
    if (!msg) return out_of_memory("WriteValue");

    DBusMessageIter iter, array;
    dbus_message_iter_init_append(msg, &iter);
    dbus_message_iter_open_container(&iter, DBUS_TYPE_ARRAY, DBUS_TYPE_BYTE_AS_STRING, &array);
    const uint8_t* data = value.data();
    dbus_message_iter_append_fixed_array(&array, DBUS_TYPE_BYTE, &data, static_cast<int>(value.size()));
    dbus_message_iter_close_container(&iter, &array);
    append_empty_options(&iter);

    return send_void(conn_, msg, "WriteValue");
}

Status GattTransport::subscribe_notifications(const std::string& id, const std::string& service,
                                              const std::string& characteristic,
                                              probelink::NotificationHandler on_value) {
    auto path = characteristic_path(id, service, characteristic);
    if (!path) return path.status();

    notify_handlers_[*path] = std::move(on_value);

    auto status = call_method_void(conn_, path->c_str(), GATT_CHARACTERISTIC_IFACE, "StartNotify");
    if (!status) {
        notify_handlers_.erase(*path);
    }
    return status;
}

Status GattTransport::unsubscribe_notifications(const std::string& id, const std::string& service,
                                                const std::string& characteristic) {
    auto path = characteristic_path(id, service, characteristic);
    if (!path) return path.status();

    notify_handlers_.erase(*path);
    return call_method_void(conn_, path->c_str(), GATT_CHARACTERISTIC_IFACE, "StopNotify");
}

int GattTransport::get_fd() const {
    int fd = -1;
    if (!conn_ || !dbus_connection_get_unix_fd(conn_, &fd)) return -1;
    return fd;
}

void GattTransport::process_pending() {
    if (!conn_) return;
    dbus_connection_read_write(conn_, 0);
    while (dbus_connection_dispatch(conn_) == DBUS_DISPATCH_DATA_REMAINS) {}
}

bool GattTransport::device_matches_filter(const std::string& path) {
    if (auto it = filter_matches_.find(path); it != filter_matches_.end()) {
        return it->second;
    }

    DBusMessage* reply = get_property(conn_, path.c_str(), DEVICE_IFACE, "UUIDs");
    if (!reply) return false;

    bool matches = false;
    DBusMessageIter iter, variant;
    if (dbus_message_iter_init(reply, &iter) &&
        dbus_message_iter_get_arg_type(&iter) == DBUS_TYPE_VARIANT) {
        dbus_message_iter_recurse(&iter, &variant);
        matches = uuids_contain(&variant, scan_filter_);
    }
    dbus_message_unref(reply);

    filter_matches_[path] = matches;
    return matches;
}

void GattTransport::emit_advertisement(const std::string& path, const DeviceProperties& props) {
    if (!on_advertisement_) return;

    if (props.exposes_filter_uuid) {
        filter_matches_[path] = true;
    }
    if (!device_matches_filter(path)) return;

    // Nothing to report without a signal strength reading
    if (props.rssi) {
        last_rssi_[path] = *props.rssi;
    }
    auto rssi = last_rssi_.find(path);
    if (rssi == last_rssi_.end()) return;

    probelink::Advertisement adv;
    if (props.address) {
        adv.id = *props.address;
    } else if (auto address = address_from_path(path)) {
        adv.id = *address;
    } else {
        return;
    }
    adv.name = props.name;
    adv.rssi = rssi->second;
    adv.manufacturer_data = props.manufacturer_data;

    // Handler may stop the scan
    auto handler = on_advertisement_;
    handler(adv);
}

void GattTransport::on_interfaces_added(DBusMessage* msg) {
    DBusMessageIter iter;
    if (!dbus_message_iter_init(msg, &iter)) return;

    // First arg: object path
    if (dbus_message_iter_get_arg_type(&iter) != DBUS_TYPE_OBJECT_PATH) return;
    const char* obj_path;
    dbus_message_iter_get_basic(&iter, &obj_path);

    // Only care about devices themselves
    std::string path(obj_path);
    if (device_path_of(path) != path) return;

    // Second arg: interfaces dict
    dbus_message_iter_next(&iter);
    if (dbus_message_iter_get_arg_type(&iter) != DBUS_TYPE_ARRAY) return;

    DBusMessageIter ifaces;
    dbus_message_iter_recurse(&iter, &ifaces);

    while (dbus_message_iter_get_arg_type(&ifaces) == DBUS_TYPE_DICT_ENTRY) {
        DBusMessageIter entry;
        dbus_message_iter_recurse(&ifaces, &entry);

        const char* iface_name;
        dbus_message_iter_get_basic(&entry, &iface_name);

        if (strcmp(iface_name, DEVICE_IFACE) == 0) {
            dbus_message_iter_next(&entry);
            auto props = parse_device_properties(&entry, scan_filter_, vendor_id_);
            emit_advertisement(path, props);
            return;
        }
        dbus_message_iter_next(&ifaces);
    }
}

void GattTransport::on_device_properties_changed(const std::string& path, DBusMessageIter* props) {
    auto parsed = parse_device_properties(props, scan_filter_, vendor_id_);

    if (parsed.connected && !*parsed.connected) {
        auto it = disconnect_handlers_.find(path);
        if (it != disconnect_handlers_.end()) {
            auto handler = std::move(it->second);
            forget_device(path);

            std::string id = address_from_path(path).value_or(path);
            std::cout << "bluez: link lost to " << id << std::endl;
            if (handler) handler(id);
        }
    }

    if (parsed.rssi || parsed.manufacturer_data) {
        emit_advertisement(path, parsed);
    }
}

void GattTransport::on_characteristic_properties_changed(const std::string& path,
                                                         DBusMessageIter* props) {
    auto it = notify_handlers_.find(path);
    if (it == notify_handlers_.end()) return;
    auto handler = it->second;

    for_each_property(props, [&](const char* name, DBusMessageIter* variant) {
        if (strcmp(name, "Value") == 0) {
            auto value = read_byte_array(variant);
            handler(value);
        }
    });
}

bool GattTransport::handle_signal(DBusMessage* msg) {
    const char* iface = dbus_message_get_interface(msg);
    const char* member = dbus_message_get_member(msg);

    if (!iface || !member) return false;

    // Handle InterfacesAdded - new device discovered
    if (strcmp(iface, OBJECT_MANAGER_IFACE) == 0 && strcmp(member, "InterfacesAdded") == 0) {
        on_interfaces_added(msg);
        return true;
    }

    // Handle PropertiesChanged - RSSI, connection state, notifications
    if (strcmp(iface, PROPERTIES_IFACE) == 0 && strcmp(member, "PropertiesChanged") == 0) {
        const char* obj_path = dbus_message_get_path(msg);
        if (!obj_path || !strstr(obj_path, "/dev_")) return false;

        DBusMessageIter iter;
        if (!dbus_message_iter_init(msg, &iter)) return false;

        // First arg: interface name
        if (dbus_message_iter_get_arg_type(&iter) != DBUS_TYPE_STRING) return false;
        const char* changed_iface;
        dbus_message_iter_get_basic(&iter, &changed_iface);

        // Second arg: changed properties dict
        dbus_message_iter_next(&iter);
        if (dbus_message_iter_get_arg_type(&iter) != DBUS_TYPE_ARRAY) return false;

        if (strcmp(changed_iface, DEVICE_IFACE) == 0) {
            on_device_properties_changed(obj_path, &iter);
            return true;
        }
        if (strcmp(changed_iface, GATT_CHARACTERISTIC_IFACE) == 0) {
            on_characteristic_properties_changed(obj_path, &iter);
            return true;
        }
        return false;
    }

    return false;
}

} // namespace bluez
