#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>

#include "device_identity.hpp"
#include "modbus_types.hpp"
#include "register_field.hpp"

namespace mypv {

/**
 * Register layout of a single device model and firmware
 * generation. Immutable after construction.
 * */
class RegisterMap {
    public:
        // holding register read limit for FC3
        static constexpr int MAX_READ_SPAN = 125;

        /**
         * Validates field table. Throws RegisterMapException if
         * field word count does not match its encoding, raw range does
         * not fit in encoding, scale is invalid or
         * fields overlap without being aliased.
         * */
        RegisterMap(
            const std::string& name,
            const std::vector<RegisterField>& fields,
            WordOrder wordOrder = WordOrder::HIGH_FIRST,
            const DeviceFeatures& features = DeviceFeatures::all()
        );

        /**
         * AC-THOR map with availability set from device features.
         * Throws UnknownDeviceModel for unsupported models.
         * */
        static std::shared_ptr<const RegisterMap> forDevice(const DeviceIdentity& identity);

        // AC-THOR register table, shared by all supported models
        static const std::vector<RegisterField>& acThorFields();

        const RegisterField* field(FieldId id) const;
        const RegisterField* field(const std::string& name) const;

        const RegisterField& getField(FieldId id) const;

        // fields in ascending address order
        const std::vector<RegisterField>& fields() const { return mFields; }

        // fields inside device readable register range
        std::vector<const RegisterField*> pollableFields() const;

        bool isAvailable(const RegisterField& field) const;
        bool isReadable(const RegisterField& field) const;

        /**
         * Merge adjacent or overlapping fields into contiguous spans
         * no longer than maxSpan registers. Every field is covered by
         * exactly one span, spans are returned in ascending address order.
         * */
        static std::vector<ReadSpan> coalesceReads(const std::vector<const RegisterField*>& fields, int maxSpan = MAX_READ_SPAN);

        const std::string& getName() const { return mName; }
        WordOrder getWordOrder() const { return mWordOrder; }
        const DeviceFeatures& getFeatures() const { return mFeatures; }

    private:
        void validate() const;
        static void validateField(const RegisterField& field);

        std::string mName;
        std::vector<RegisterField> mFields;
        WordOrder mWordOrder;
        DeviceFeatures mFeatures;
        std::map<FieldId, size_t> mById;
        std::map<std::string, size_t> mByName;
};

}
