#include "domain_value.hpp"

#include <cmath>
#include <cstdlib>
#include <numeric>
#include <sstream>
#include <iomanip>

namespace mypv {

DomainValue
DomainValue::fromRational(int64_t numerator, int64_t denominator) {
    if (denominator == 0)
        throw DomainValueException("Denominator cannot be zero");

    if (denominator < 0) {
        numerator = -numerator;
        denominator = -denominator;
    }

    int64_t div = std::gcd(numerator, denominator);
    if (div > 1) {
        numerator /= div;
        denominator /= div;
    }

    DomainValue ret;
    ret.mType = ValueType::NUMBER;
    ret.mNumerator = numerator;
    ret.mDenominator = denominator;
    return ret;
}

DomainValue
DomainValue::fromDouble(double val, int64_t resolution) {
    if (!std::isfinite(val))
        throw DomainValueException("Value is not a finite number");
    if (resolution <= 0)
        throw DomainValueException("Resolution must be positive");

    return fromRational(std::llround(val * resolution), resolution);
}

DomainValue
DomainValue::fromEnum(uint32_t raw, const char* name) {
    DomainValue ret;
    ret.mType = ValueType::ENUM;
    ret.mNumerator = raw;
    if (name != nullptr)
        ret.mTagName = name;
    return ret;
}

int64_t
DomainValue::getInt64() const {
    if (mDenominator != 1) {
        throw DomainValueException(std::string("Value ") + toString() + " is not an integer");
    }
    return mNumerator;
}

std::string
DomainValue::getTagName() const {
    if (!mTagName.empty())
        return mTagName;
    return std::string("Unknown(") + std::to_string(getRaw()) + ")";
}

std::string
DomainValue::toString() const {
    std::stringstream out;
    switch(mType) {
        case ValueType::ENUM:
            out << getTagName();
        break;
        case ValueType::BITS:
            out << "0x" << std::hex << getRaw();
        break;
        case ValueType::NUMBER:
            if (mDenominator == 1) {
                out << mNumerator;
            } else {
                // enough digits to show every decimal scale used by register maps
                int digits = static_cast<int>(std::ceil(std::log10(static_cast<double>(mDenominator))));
                out << std::fixed << std::setprecision(digits) << getDouble();
            }
        break;
    }
    return out.str();
}

std::ostream& operator<< (std::ostream& strm, const DomainValue& value) {
    strm << value.toString();
    return strm;
}

}
