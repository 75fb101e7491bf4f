#include "catch2/catch_all.hpp"

#include "libmypv/snapshot_json.hpp"

#include "jsonutils.hpp"

using namespace mypv;

namespace {

std::shared_ptr<const RegisterMap>
acThor9s() {
    return RegisterMap::forDevice(DeviceIdentity(DeviceModel::AC_THOR_9S, "2002001912345678", FirmwareVersion(210, 2)));
}

DeviceSnapshot
makeSnapshot(std::map<FieldId, SnapshotValue>&& values) {
    return DeviceSnapshot(
        std::move(values),
        std::vector<uint16_t>(),
        1000,
        std::chrono::system_clock::time_point(std::chrono::milliseconds(1700000000123LL)),
        std::chrono::steady_clock::now()
    );
}

}

TEST_CASE ("Snapshot JSON should") {

std::shared_ptr<const RegisterMap> map(acThor9s());

SECTION ("contain map name and timestamp") {
    DeviceSnapshot snapshot(makeSnapshot(std::map<FieldId, SnapshotValue>()));
    REQUIRE_JSON(snapshotToJson(snapshot, *map),
        R"({"map": "AC-THOR 9s a0021002", "timestamp": 1700000000123, "values": {}})");
}

SECTION ("write typed values by field name") {
    std::map<FieldId, SnapshotValue> values;
    values.emplace(FieldId::POWER, SnapshotValue(DomainValue::fromInt(1500), true));
    values.emplace(FieldId::TEMPERATURE_2, SnapshotValue(DomainValue::fromRational(-20, 10), true));
    values.emplace(FieldId::CONTROL_TYPE, SnapshotValue(DomainValue::fromEnum(2, "MODBUS_TCP"), true));
    values.emplace(FieldId::BOOST_MODE, SnapshotValue(DomainValue::fromEnum(7, nullptr), true));
    values.emplace(FieldId::LOAD_STATE, SnapshotValue(DomainValue::fromBits(5), true));
    values.emplace(FieldId::TEMPERATURE_8, SnapshotValue(DomainValue::fromInt(0), false));

    DeviceSnapshot snapshot(makeSnapshot(std::move(values)));
    REQUIRE_JSON(snapshotToJson(snapshot, *map), R"({
        "map": "AC-THOR 9s a0021002",
        "timestamp": 1700000000123,
        "values": {
            "power": 1500,
            "temperature_2": -2,
            "control_type": "MODBUS_TCP",
            "boost_mode": "Unknown(7)",
            "load_state": 5,
            "temperature_8": null
        }
    })");
}

SECTION ("keep field resolution for fractions") {
    std::map<FieldId, SnapshotValue> values;
    values.emplace(FieldId::FREQUENCY, SnapshotValue(DomainValue::fromRational(50012, 1000), true));
    values.emplace(FieldId::TEMPERATURE_1, SnapshotValue(DomainValue::fromRational(452, 10), true));

    DeviceSnapshot snapshot(makeSnapshot(std::move(values)));
    std::string json(snapshotToJson(snapshot, *map));
    REQUIRE(json.find("\"frequency\":50.012") != std::string::npos);
    REQUIRE(json.find("\"temperature_1\":45.2") != std::string::npos);
}

}
