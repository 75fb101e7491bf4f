#pragma once

#include <chrono>
#include <map>
#include <memory>
#include <vector>

#include "domain_value.hpp"
#include "register_field.hpp"

namespace mypv {

class SnapshotValue {
    public:
        SnapshotValue(const DomainValue& value, bool valid) : mValue(value), mValid(valid) {}

        DomainValue mValue;
        // false if field has no meaning for this device variant
        bool mValid;
};

/**
 * Decoded state of all polled fields from a single successful
 * poll cycle. Never modified after creation.
 * */
class DeviceSnapshot {
    public:
        DeviceSnapshot(
            std::map<FieldId, SnapshotValue>&& values,
            std::vector<uint16_t>&& rawRegisters,
            uint16_t firstRegister,
            const std::chrono::system_clock::time_point& timestamp,
            const std::chrono::steady_clock::time_point& monotonicTimestamp
        ) : mValues(std::move(values)),
            mRawRegisters(std::move(rawRegisters)),
            mFirstRegister(firstRegister),
            mTimestamp(timestamp),
            mMonotonicTimestamp(monotonicTimestamp)
        {}

        // nullptr if field was not polled
        const SnapshotValue* get(FieldId id) const;

        bool has(FieldId id) const { return mValues.find(id) != mValues.end(); }
        bool isValid(FieldId id) const;

        const std::map<FieldId, SnapshotValue>& getValues() const { return mValues; }

        /**
         * Raw register contents from first to last polled register,
         * registers that were not read are set to zero.
         * */
        const std::vector<uint16_t>& getRawRegisters() const { return mRawRegisters; }
        uint16_t getFirstRegister() const { return mFirstRegister; }

        const std::chrono::system_clock::time_point& getTimestamp() const { return mTimestamp; }

        std::chrono::steady_clock::duration getAge() const {
            return std::chrono::steady_clock::now() - mMonotonicTimestamp;
        }

    private:
        const std::map<FieldId, SnapshotValue> mValues;
        const std::vector<uint16_t> mRawRegisters;
        const uint16_t mFirstRegister;
        const std::chrono::system_clock::time_point mTimestamp;
        const std::chrono::steady_clock::time_point mMonotonicTimestamp;
};

typedef std::shared_ptr<const DeviceSnapshot> DeviceSnapshotPtr;

}
