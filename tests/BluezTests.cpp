#include <gtest/gtest.h>

#include "bluez.hpp"

#include <protocol/packets.hpp>

#include <functional>

using namespace bluez;
using probelink::ErrorKind;

//==============================================================================
// Object paths
//==============================================================================

TEST(BluezPathTests, DevicePathFromAddress) {
    EXPECT_EQ(get_device_path("/org/bluez/hci0", "AA:BB:CC:DD:EE:01"),
              "/org/bluez/hci0/dev_AA_BB_CC_DD_EE_01");
}

TEST(BluezPathTests, DevicePathOfNestedObject) {
    EXPECT_EQ(device_path_of("/org/bluez/hci0/dev_AA_BB_CC_DD_EE_01/service0010/char0011"),
              "/org/bluez/hci0/dev_AA_BB_CC_DD_EE_01");
    EXPECT_EQ(device_path_of("/org/bluez/hci0/dev_AA_BB_CC_DD_EE_01"),
              "/org/bluez/hci0/dev_AA_BB_CC_DD_EE_01");
    EXPECT_FALSE(device_path_of("/org/bluez/hci0").has_value());
}

TEST(BluezPathTests, AddressFromPath) {
    EXPECT_EQ(address_from_path("/org/bluez/hci0/dev_AA_BB_CC_DD_EE_01"), "AA:BB:CC:DD:EE:01");
    EXPECT_EQ(address_from_path("/org/bluez/hci0/dev_AA_BB_CC_DD_EE_01/service0010"),
              "AA:BB:CC:DD:EE:01");
    EXPECT_FALSE(address_from_path("/org/bluez/hci0/dev_AA_BB").has_value());
    EXPECT_FALSE(address_from_path("/org/bluez/hci0").has_value());
}

//==============================================================================
// Error mapping
//==============================================================================

TEST(BluezErrorTests, StackNotReadyIsUnavailable) {
    EXPECT_EQ(classify_error("org.bluez.Error.NotReady"), ErrorKind::TransportUnavailable);
    EXPECT_EQ(classify_error("org.bluez.Error.NotAuthorized"), ErrorKind::TransportUnavailable);
    EXPECT_EQ(classify_error(DBUS_ERROR_SERVICE_UNKNOWN), ErrorKind::TransportUnavailable);
    EXPECT_EQ(classify_error(DBUS_ERROR_ACCESS_DENIED), ErrorKind::TransportUnavailable);
}

TEST(BluezErrorTests, DeviceErrorsAreFailures) {
    EXPECT_EQ(classify_error("org.bluez.Error.Failed"), ErrorKind::TransportFailure);
    EXPECT_EQ(classify_error("org.bluez.Error.NotConnected"), ErrorKind::TransportFailure);
    EXPECT_EQ(classify_error(DBUS_ERROR_NO_REPLY), ErrorKind::TransportFailure);
    EXPECT_EQ(classify_error(nullptr), ErrorKind::TransportFailure);
}

//==============================================================================
// Device1 property parsing
//==============================================================================

namespace {

constexpr uint16_t VENDOR = probelink::packets::VENDOR_ID;

// Owns a PropertiesChanged-shaped message whose body is one a{sv} dict
class PropertiesMessage {
public:
    PropertiesMessage() {
        msg_ = dbus_message_new_signal("/org/bluez/hci0/dev_AA_BB_CC_DD_EE_01",
                                       "org.freedesktop.DBus.Properties", "PropertiesChanged");
        dbus_message_iter_init_append(msg_, &root_);
        dbus_message_iter_open_container(&root_, DBUS_TYPE_ARRAY, "{sv}", &dict_);
    }

    ~PropertiesMessage() { dbus_message_unref(msg_); }

    PropertiesMessage(const PropertiesMessage&) = delete;
    PropertiesMessage& operator=(const PropertiesMessage&) = delete;

    void add_string(const char* key, const char* value) {
        add(key, "s", [&](DBusMessageIter* v) {
            dbus_message_iter_append_basic(v, DBUS_TYPE_STRING, &value);
        });
    }

    void add_int16(const char* key, dbus_int16_t value) {
        add(key, "n", [&](DBusMessageIter* v) {
            dbus_message_iter_append_basic(v, DBUS_TYPE_INT16, &value);
        });
    }

    void add_bool(const char* key, bool value) {
        dbus_bool_t b = value;
        add(key, "b", [&](DBusMessageIter* v) {
            dbus_message_iter_append_basic(v, DBUS_TYPE_BOOLEAN, &b);
        });
    }

    void add_uuids(const std::vector<const char*>& uuids) {
        add("UUIDs", "as", [&](DBusMessageIter* v) {
            DBusMessageIter array;
            dbus_message_iter_open_container(v, DBUS_TYPE_ARRAY, "s", &array);
            for (const char* uuid : uuids) {
                dbus_message_iter_append_basic(&array, DBUS_TYPE_STRING, &uuid);
            }
            dbus_message_iter_close_container(v, &array);
        });
    }

    // a{qv}, each value an ay
    void add_manufacturer_data(const std::vector<std::pair<uint16_t, std::vector<uint8_t>>>& entries) {
        add("ManufacturerData", "a{qv}", [&](DBusMessageIter* v) {
            DBusMessageIter array;
            dbus_message_iter_open_container(v, DBUS_TYPE_ARRAY, "{qv}", &array);
            for (const auto& [id, bytes] : entries) {
                DBusMessageIter entry, variant, data;
                dbus_message_iter_open_container(&array, DBUS_TYPE_DICT_ENTRY, nullptr, &entry);
                dbus_message_iter_append_basic(&entry, DBUS_TYPE_UINT16, &id);
                dbus_message_iter_open_container(&entry, DBUS_TYPE_VARIANT, "ay", &variant);
                dbus_message_iter_open_container(&variant, DBUS_TYPE_ARRAY, "y", &data);
                const uint8_t* ptr = bytes.data();
                dbus_message_iter_append_fixed_array(&data, DBUS_TYPE_BYTE, &ptr,
                                                     static_cast<int>(bytes.size()));
                dbus_message_iter_close_container(&variant, &data);
                dbus_message_iter_close_container(&entry, &variant);
                dbus_message_iter_close_container(&array, &entry);
            }
            dbus_message_iter_close_container(v, &array);
        });
    }

    DeviceProperties parse(const std::string& filter_uuid = probelink::packets::uuids::PRIMARY_SERVICE) {
        dbus_message_iter_close_container(&root_, &dict_);
        DBusMessageIter iter;
        dbus_message_iter_init(msg_, &iter);
        return parse_device_properties(&iter, filter_uuid, VENDOR);
    }

private:
    void add(const char* key, const char* signature,
             const std::function<void(DBusMessageIter*)>& append_value) {
        DBusMessageIter entry, variant;
        dbus_message_iter_open_container(&dict_, DBUS_TYPE_DICT_ENTRY, nullptr, &entry);
        dbus_message_iter_append_basic(&entry, DBUS_TYPE_STRING, &key);
        dbus_message_iter_open_container(&entry, DBUS_TYPE_VARIANT, signature, &variant);
        append_value(&variant);
        dbus_message_iter_close_container(&entry, &variant);
        dbus_message_iter_close_container(&dict_, &entry);
    }

    DBusMessage* msg_;
    DBusMessageIter root_;
    DBusMessageIter dict_;
};

} // namespace

TEST(BluezPropertiesTests, ParsesAdvertisementFields) {
    PropertiesMessage msg;
    msg.add_string("Address", "AA:BB:CC:DD:EE:01");
    msg.add_string("Name", "probe-1");
    msg.add_int16("RSSI", -58);
    msg.add_uuids({"71C47CD7-D486-4CA3-A350-8379EDFAED8C"});
    msg.add_manufacturer_data({{VENDOR, {0x00, 0x23, 0x00, 0x11}}});

    auto props = msg.parse();

    EXPECT_EQ(props.address, "AA:BB:CC:DD:EE:01");
    EXPECT_EQ(props.name, "probe-1");
    EXPECT_EQ(props.rssi, -58);
    EXPECT_TRUE(props.exposes_filter_uuid);
    ASSERT_TRUE(props.manufacturer_data.has_value());
    EXPECT_EQ(*props.manufacturer_data, (std::vector<uint8_t>{0x00, 0x23, 0x00, 0x11}));
    EXPECT_FALSE(props.connected.has_value());
}

TEST(BluezPropertiesTests, ManufacturerDataFromOtherVendorsIsIgnored) {
    PropertiesMessage msg;
    msg.add_manufacturer_data({{0x004C, {0x01, 0x02}}});

    auto props = msg.parse();

    EXPECT_FALSE(props.manufacturer_data.has_value());
}

TEST(BluezPropertiesTests, PicksVendorEntryAmongSeveral) {
    PropertiesMessage msg;
    msg.add_manufacturer_data({{0x004C, {0x01}}, {VENDOR, {0x02, 0x03}}});

    auto props = msg.parse();

    ASSERT_TRUE(props.manufacturer_data.has_value());
    EXPECT_EQ(*props.manufacturer_data, (std::vector<uint8_t>{0x02, 0x03}));
}

TEST(BluezPropertiesTests, OtherServiceDoesNotMatchFilter) {
    PropertiesMessage msg;
    msg.add_uuids({"0000180f-0000-1000-8000-00805f9b34fb"});

    auto props = msg.parse();

    EXPECT_FALSE(props.exposes_filter_uuid);
}

TEST(BluezPropertiesTests, ConnectedChange) {
    PropertiesMessage msg;
    msg.add_bool("Connected", false);

    auto props = msg.parse();

    ASSERT_TRUE(props.connected.has_value());
    EXPECT_FALSE(*props.connected);
    EXPECT_FALSE(props.rssi.has_value());
    EXPECT_FALSE(props.address.has_value());
}
