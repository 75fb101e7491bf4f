#include "register_codec.hpp"

#include "exceptions.hpp"

namespace mypv {

uint32_t
RegisterCodec::registersToUInt32(const std::vector<uint16_t>& words, WordOrder order) {
    if (words.size() == 1)
        return words[0];

    int high = 0, low = 1;
    if (order == WordOrder::LOW_FIRST) {
        high = 1;
        low = 0;
    }
    uint32_t val = words[high];
    val = val << 16;
    val |= words[low];
    return val;
}

std::vector<uint16_t>
RegisterCodec::uint32ToRegisters(uint32_t val, WordOrder order, int registerCount) {
    std::vector<uint16_t> ret;
    ret.push_back(val & 0xffff);
    if (registerCount == 2) {
        if (order == WordOrder::HIGH_FIRST)
            ret.insert(ret.begin(), val >> 16);
        else
            ret.push_back(val >> 16);
    }
    return ret;
}

int64_t
RegisterCodec::toSigned(uint32_t raw, int wordCount) {
    if (wordCount == 1)
        return static_cast<int16_t>(static_cast<uint16_t>(raw));
    return static_cast<int32_t>(raw);
}

DomainValue
RegisterCodec::decode(const RegisterField& field, const std::vector<uint16_t>& words, WordOrder order) {
    if (words.size() != field.mWordCount) {
        throw DecodeError(std::string("Field ") + field.mName + " needs " + std::to_string(field.mWordCount)
            + " register(s), got " + std::to_string(words.size()));
    }

    uint32_t raw = registersToUInt32(words, order);
    switch(field.mEncoding) {
        case RegisterEncoding::ENUM: {
            const EnumTag* tag = field.findTag(raw);
            return DomainValue::fromEnum(raw, tag == nullptr ? nullptr : tag->mName);
        }
        case RegisterEncoding::BITFIELD:
            return DomainValue::fromBits(raw);
        case RegisterEncoding::I16:
        case RegisterEncoding::I32: {
            int64_t val = toSigned(raw, field.mWordCount);
            return DomainValue::fromRational(val * field.mScale.mNumerator, field.mScale.mDenominator);
        }
        case RegisterEncoding::U16:
        case RegisterEncoding::U32:
            return DomainValue::fromRational(static_cast<int64_t>(raw) * field.mScale.mNumerator, field.mScale.mDenominator);
    }
    throw DecodeError(std::string("Unknown encoding for field ") + field.mName);
}

int64_t
RegisterCodec::toRaw(const RegisterField& field, const DomainValue& value) {
    switch(field.mEncoding) {
        case RegisterEncoding::ENUM:
            if (value.getType() == DomainValue::ValueType::ENUM)
                return value.getRaw();
            break;
        case RegisterEncoding::BITFIELD:
            if (value.getType() == DomainValue::ValueType::BITS)
                return value.getRaw();
            break;
        default:
            if (value.isNumber()) {
                // raw = value / scale = (n * sden) / (d * snum)
                int64_t dividend, divisor;
                if (__builtin_mul_overflow(value.getNumerator(), static_cast<int64_t>(field.mScale.mDenominator), &dividend)
                    || __builtin_mul_overflow(value.getDenominator(), static_cast<int64_t>(field.mScale.mNumerator), &divisor))
                {
                    throw EncodeError(EncodeError::Reason::OUT_OF_RANGE,
                        std::string("Value ") + value.toString() + " is out of range for field " + field.mName);
                }
                if (dividend % divisor != 0) {
                    throw EncodeError(EncodeError::Reason::OUT_OF_RANGE,
                        std::string("Value ") + value.toString() + " cannot be represented by field "
                        + field.mName + " with its resolution");
                }
                return dividend / divisor;
            }
    }
    throw EncodeError(EncodeError::Reason::TYPE_MISMATCH,
        std::string("Cannot encode ") + value.toString() + " as " + RegisterField::encodingName(field.mEncoding)
        + " field " + field.mName);
}

std::vector<uint16_t>
RegisterCodec::encode(const RegisterField& field, const DomainValue& value, WordOrder order) {
    int64_t raw = toRaw(field, value);

    if (raw < field.mRawMin || raw > field.mRawMax) {
        throw EncodeError(EncodeError::Reason::OUT_OF_RANGE,
            std::string("Value ") + value.toString() + " is out of range for field " + field.mName
            + " (raw " + std::to_string(raw) + " not in "
            + std::to_string(field.mRawMin) + ".." + std::to_string(field.mRawMax) + ")");
    }

    // two's complement for signed values is done by uint32_t conversion
    return uint32ToRegisters(static_cast<uint32_t>(raw), order, field.mWordCount);
}

std::vector<uint16_t>
RegisterCodec::encodeTag(const RegisterField& field, const std::string& tagName, WordOrder order) {
    const EnumTag* tag = field.findTag(tagName);
    if (tag == nullptr) {
        throw EncodeError(EncodeError::Reason::UNKNOWN_TAG,
            std::string("Tag ") + tagName + " is not defined for field " + field.mName);
    }
    return encode(field, DomainValue::fromEnum(tag->mRaw, tag->mName), order);
}

}
