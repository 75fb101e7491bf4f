#pragma once

#include <string>

#include "device_snapshot.hpp"
#include "register_map.hpp"

namespace mypv {

/**
 * Snapshot as a JSON object:
 *
 * {"map": "AC-THOR 9s a0021002", "timestamp": 1700000000000, "values": {"power": 1500, ...}}
 *
 * Numbers keep the resolution of their field, enum values are
 * written as tag names, values without meaning for the device as null.
 * Fields that were not polled are omitted.
 * */
std::string snapshotToJson(const DeviceSnapshot& snapshot, const RegisterMap& registerMap);

}
