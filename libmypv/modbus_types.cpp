#include "modbus_types.hpp"

#include <algorithm>

#include "exceptions.hpp"

namespace mypv {

void
AddressRange::merge(const AddressRange& other) {
    int first = std::min(firstRegister(), other.firstRegister());
    int last = std::max(lastRegister(), other.lastRegister());
    mRegister = first;
    mCount = last - first + 1;
}

bool
AddressRange::overlaps(const AddressRange& other) const {
    return firstRegister() <= other.lastRegister() && other.firstRegister() <= lastRegister();
}

bool
AddressRange::isConsecutiveOf(const AddressRange& other) const {
    return other.lastRegister() + 1 == firstRegister();
}

void
ReadSpan::add(const RegisterField& field) {
    merge(AddressRange(field.mAddress, field.mWordCount));
    mFields.push_back(&field);
}

std::vector<uint16_t>
ReadSpan::slice(const RegisterField& field, const std::vector<uint16_t>& spanValues) const {
    int offset = field.firstRegister() - firstRegister();
    if (offset < 0 || field.lastRegister() > lastRegister())
        throw MyPvProgramException(std::string("Field ") + field.mName + " is not a part of span at " + std::to_string(mRegister));

    if (offset + field.mWordCount > static_cast<int>(spanValues.size())) {
        throw DecodeError(std::string("Not enough registers for field ") + field.mName
            + ", got " + std::to_string(spanValues.size()) + " for span at " + std::to_string(mRegister));
    }
    return std::vector<uint16_t>(spanValues.begin() + offset, spanValues.begin() + offset + field.mWordCount);
}

}
