#pragma once

#include <cstdint>
#include <string>
#include <ostream>

#include "exceptions.hpp"

namespace mypv {

class DomainValueException : public MyPvException {
    public:
        DomainValueException(const std::string& what) : MyPvException(what) {}
};

/**
 * Decoded register value.
 *
 * Numbers are kept as exact reduced fractions, so scaled values can be
 * converted back to the same raw register contents without floating
 * point drift.
 * */
class DomainValue {
    public:
        typedef enum {
            NUMBER = 0,
            ENUM = 1,
            BITS = 2
        } ValueType;

        static DomainValue fromRational(int64_t numerator, int64_t denominator);

        static DomainValue fromInt(int64_t val) {
            return fromRational(val, 1);
        }

        /**
         * Rounds val to the nearest multiple of 1/resolution
         * */
        static DomainValue fromDouble(double val, int64_t resolution = 1);

        /**
         * Enumeration tag. Pass nullptr as name for tags
         * that are not known to register map
         * */
        static DomainValue fromEnum(uint32_t raw, const char* name);

        static DomainValue fromBits(uint32_t bits) {
            DomainValue ret;
            ret.mType = ValueType::BITS;
            ret.mNumerator = bits;
            return ret;
        }

        DomainValue() {}

        ValueType getType() const { return mType; }
        bool isNumber() const { return mType == ValueType::NUMBER; }

        int64_t getNumerator() const { return mNumerator; }
        int64_t getDenominator() const { return mDenominator; }
        bool isInteger() const { return mDenominator == 1; }

        double getDouble() const {
            return static_cast<double>(mNumerator) / static_cast<double>(mDenominator);
        }

        /**
         * Integer value. Throws if number has a fractional part
         * */
        int64_t getInt64() const;

        /**
         * Raw enum tag or bitfield contents
         * */
        uint32_t getRaw() const { return static_cast<uint32_t>(mNumerator); }

        bool getBool() const { return mNumerator != 0; }
        bool getBit(int bit) const {
            return (static_cast<uint64_t>(mNumerator) & (uint64_t(1) << bit)) != 0;
        }

        bool isKnownTag() const { return mType == ValueType::ENUM && !mTagName.empty(); }

        /**
         * Tag name or Unknown(raw) for unknown tags
         * */
        std::string getTagName() const;

        std::string toString() const;

        bool operator==(const DomainValue& other) const {
            return mType == other.mType
                && mNumerator == other.mNumerator
                && mDenominator == other.mDenominator;
        }
        bool operator!=(const DomainValue& other) const { return !(*this == other); }

    private:
        ValueType mType = ValueType::NUMBER;
        int64_t mNumerator = 0;
        int64_t mDenominator = 1;
        std::string mTagName;
};

std::ostream& operator<< (std::ostream& strm, const DomainValue& value);

}
