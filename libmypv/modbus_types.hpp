#pragma once

#include <vector>

#include "register_field.hpp"

namespace mypv {

class AddressRange {
    public:
        AddressRange(int pRegister, int pCount)
            : mRegister(pRegister), mCount(pCount)
        {}

        void merge(const AddressRange& other);
        bool overlaps(const AddressRange& other) const;
        bool isConsecutiveOf(const AddressRange& other) const;
        int firstRegister() const { return mRegister; }
        int lastRegister() const { return (mRegister + mCount) - 1; }

        int mRegister;
        int mCount;
};

/**
 * Contiguous range of registers read with a single request
 * and list of fields it contains
 * */
class ReadSpan : public AddressRange {
    public:
        ReadSpan(const RegisterField& field)
            : AddressRange(field.mAddress, field.mWordCount)
        {
            mFields.push_back(&field);
        }

        /**
         * Extend span to include field registers
         * */
        void add(const RegisterField& field);

        /**
         * Field registers from values read for this span
         * */
        std::vector<uint16_t> slice(const RegisterField& field, const std::vector<uint16_t>& spanValues) const;

        std::vector<const RegisterField*> mFields;
};

}
