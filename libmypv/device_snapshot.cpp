#include "device_snapshot.hpp"

namespace mypv {

const SnapshotValue*
DeviceSnapshot::get(FieldId id) const {
    auto it = mValues.find(id);
    if (it == mValues.end())
        return nullptr;
    return &(it->second);
}

bool
DeviceSnapshot::isValid(FieldId id) const {
    const SnapshotValue* val = get(id);
    return val != nullptr && val->mValid;
}

}
