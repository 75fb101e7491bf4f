#include "catch2/catch_all.hpp"

#include "libmypv/exceptions.hpp"
#include "libmypv/register_codec.hpp"
#include "libmypv/register_map.hpp"

using namespace mypv;

namespace {

const std::vector<EnumTag> modeTags = {
    EnumTag(0, "OFF"),
    EnumTag(1, "ON"),
    EnumTag(3, "RELAY_BOOST_ON")
};

}

TEST_CASE ("Register codec decode should") {

SECTION ("apply rational scale to two register value") {
    RegisterField field(FieldId::POWER_32, "power_watts", 100, RegisterEncoding::U32, Scale(1, 10), "W", 0, 0xFFFFFFFF);
    DomainValue val = RegisterCodec::decode(field, {0x0000, 0x03E8}, WordOrder::HIGH_FIRST);
    REQUIRE(val == DomainValue::fromInt(100));
    REQUIRE(val.getInt64() == 100);
}

SECTION ("honor word order") {
    RegisterField field(FieldId::POWER_32, "power_32", 1078, RegisterEncoding::U32, Scale(), "W", 0, 0xFFFFFFFF);
    REQUIRE(RegisterCodec::decode(field, {0x0001, 0x1170}, WordOrder::HIGH_FIRST).getInt64() == 70000);
    REQUIRE(RegisterCodec::decode(field, {0x1170, 0x0001}, WordOrder::LOW_FIRST).getInt64() == 70000);
}

SECTION ("decode negative values as two's complement") {
    RegisterField temp(FieldId::TEMPERATURE_1, "temperature_1", 1001, RegisterEncoding::I16, Scale(1, 10), "°C", -32768, 32767);
    REQUIRE(RegisterCodec::decode(temp, {0xFFEC}, WordOrder::HIGH_FIRST).getDouble() == Catch::Approx(-2.0));

    RegisterField meter(FieldId::METER_POWER_32, "meter_power_32", 1087, RegisterEncoding::I32, Scale(), "W", INT32_MIN, INT32_MAX);
    REQUIRE(RegisterCodec::decode(meter, {0xFFFF, 0xFED4}, WordOrder::HIGH_FIRST).getInt64() == -300);
}

SECTION ("keep exact fractions") {
    RegisterField freq(FieldId::FREQUENCY, "frequency", 1064, RegisterEncoding::U16, Scale(1, 1000), "Hz", 0, 0xFFFF);
    DomainValue val = RegisterCodec::decode(freq, {50012}, WordOrder::HIGH_FIRST);
    REQUIRE(val.getNumerator() == 12503);
    REQUIRE(val.getDenominator() == 250);
    REQUIRE(val.toString() == "50.012");
}

SECTION ("return enum tag by raw value") {
    RegisterField field(FieldId::BOOST_MODE, "boost_mode", 1005, RegisterEncoding::ENUM, Scale(), "", 0, 0xFFFF);
    field.withTags(modeTags);
    DomainValue val = RegisterCodec::decode(field, {3}, WordOrder::HIGH_FIRST);
    REQUIRE(val.isKnownTag());
    REQUIRE(val.getTagName() == "RELAY_BOOST_ON");
}

SECTION ("return unknown enum raw value unchanged") {
    RegisterField field(FieldId::BOOST_MODE, "boost_mode", 1005, RegisterEncoding::ENUM, Scale(), "", 0, 0xFFFF);
    field.withTags(modeTags);
    DomainValue val = RegisterCodec::decode(field, {7}, WordOrder::HIGH_FIRST);
    REQUIRE(!val.isKnownTag());
    REQUIRE(val.getRaw() == 7);
    REQUIRE(val.getTagName() == "Unknown(7)");
    REQUIRE(RegisterCodec::encode(field, val, WordOrder::HIGH_FIRST) == std::vector<uint16_t>({7}));
}

SECTION ("return bits without scaling") {
    RegisterField field(FieldId::POWER_WITH_RELAYS, "power_with_relays", 1080, RegisterEncoding::BITFIELD, Scale(), "", 0, 0xFFFF);
    DomainValue val = RegisterCodec::decode(field, {0x6123}, WordOrder::HIGH_FIRST);
    REQUIRE(val.getType() == DomainValue::ValueType::BITS);
    REQUIRE(val.getBit(14));
    REQUIRE(!val.getBit(15));
}

SECTION ("fail if number of words does not match field") {
    RegisterField field(FieldId::POWER_32, "power_32", 1078, RegisterEncoding::U32, Scale(), "W", 0, 0xFFFFFFFF);
    REQUIRE_THROWS_AS(RegisterCodec::decode(field, {1}, WordOrder::HIGH_FIRST), DecodeError);
    REQUIRE_THROWS_AS(RegisterCodec::decode(field, {1, 2, 3}, WordOrder::HIGH_FIRST), DecodeError);
}

}

TEST_CASE ("Register codec encode should") {

RegisterField hotWater(FieldId::HOT_WATER_1_MAX, "hot_water_1_max", 1002, RegisterEncoding::U16, Scale(1, 10), "°C", 50, 900);

SECTION ("convert scaled value to raw register") {
    REQUIRE(RegisterCodec::encode(hotWater, DomainValue::fromDouble(55.5, 10), WordOrder::HIGH_FIRST) == std::vector<uint16_t>({555}));
}

SECTION ("accept range bounds") {
    REQUIRE(RegisterCodec::encode(hotWater, DomainValue::fromInt(5), WordOrder::HIGH_FIRST) == std::vector<uint16_t>({50}));
    REQUIRE(RegisterCodec::encode(hotWater, DomainValue::fromInt(90), WordOrder::HIGH_FIRST) == std::vector<uint16_t>({900}));
}

SECTION ("reject values outside of field range") {
    REQUIRE_THROWS_MATCHES(
        RegisterCodec::encode(hotWater, DomainValue::fromDouble(90.1, 10), WordOrder::HIGH_FIRST),
        EncodeError,
        Catch::Matchers::Predicate<EncodeError>([](const EncodeError& e) { return e.getReason() == EncodeError::Reason::OUT_OF_RANGE; })
    );
    REQUIRE_THROWS_AS(RegisterCodec::encode(hotWater, DomainValue::fromDouble(4.9, 10), WordOrder::HIGH_FIRST), EncodeError);
}

SECTION ("reject values too large to scale") {
    RegisterField power(FieldId::POWER_32, "power_watts", 100, RegisterEncoding::U32, Scale(1, 10), "W", 0, 0xFFFFFFFF);
    REQUIRE_THROWS_MATCHES(
        RegisterCodec::encode(power, DomainValue::fromInt(INT64_MAX / 2), WordOrder::HIGH_FIRST),
        EncodeError,
        Catch::Matchers::Predicate<EncodeError>([](const EncodeError& e) { return e.getReason() == EncodeError::Reason::OUT_OF_RANGE; })
    );
    REQUIRE_THROWS_AS(RegisterCodec::encode(hotWater, DomainValue::fromInt(INT64_MIN / 3), WordOrder::HIGH_FIRST), EncodeError);
}

SECTION ("reject values finer than field resolution") {
    REQUIRE_THROWS_AS(RegisterCodec::encode(hotWater, DomainValue::fromDouble(55.55, 100), WordOrder::HIGH_FIRST), EncodeError);
}

SECTION ("reject value of wrong type") {
    REQUIRE_THROWS_MATCHES(
        RegisterCodec::encode(hotWater, DomainValue::fromEnum(1, "ON"), WordOrder::HIGH_FIRST),
        EncodeError,
        Catch::Matchers::Predicate<EncodeError>([](const EncodeError& e) { return e.getReason() == EncodeError::Reason::TYPE_MISMATCH; })
    );
}

SECTION ("split 32-bit values by word order") {
    RegisterField power(FieldId::POWER_32, "power_32", 1078, RegisterEncoding::U32, Scale(), "W", 0, 0xFFFFFFFF);
    REQUIRE(RegisterCodec::encode(power, DomainValue::fromInt(70000), WordOrder::HIGH_FIRST) == std::vector<uint16_t>({0x0001, 0x1170}));
    REQUIRE(RegisterCodec::encode(power, DomainValue::fromInt(70000), WordOrder::LOW_FIRST) == std::vector<uint16_t>({0x1170, 0x0001}));
}

SECTION ("encode negative numbers as two's complement") {
    RegisterField meter(FieldId::METER_POWER, "meter_power", 1069, RegisterEncoding::I16, Scale(), "W", -32768, 32767);
    REQUIRE(RegisterCodec::encode(meter, DomainValue::fromInt(-200), WordOrder::HIGH_FIRST) == std::vector<uint16_t>({0xFF38}));
}

SECTION ("encode enum by tag name") {
    RegisterField field(FieldId::BOOST_MODE, "boost_mode", 1005, RegisterEncoding::ENUM, Scale(), "", 0, 0xFFFF);
    field.withTags(modeTags);
    REQUIRE(RegisterCodec::encodeTag(field, "ON", WordOrder::HIGH_FIRST) == std::vector<uint16_t>({1}));
    REQUIRE_THROWS_MATCHES(
        RegisterCodec::encodeTag(field, "TURBO", WordOrder::HIGH_FIRST),
        EncodeError,
        Catch::Matchers::Predicate<EncodeError>([](const EncodeError& e) { return e.getReason() == EncodeError::Reason::UNKNOWN_TAG; })
    );
}

SECTION ("produce registers that decode to the same value") {
    DomainValue val = DomainValue::fromDouble(62.3, 10);
    std::vector<uint16_t> regs = RegisterCodec::encode(hotWater, val, WordOrder::HIGH_FIRST);
    REQUIRE(RegisterCodec::decode(hotWater, regs, WordOrder::HIGH_FIRST) == val);
}

}

namespace {

// whole range of 16-bit fields, bounds and evenly spread sample of 32-bit fields
std::vector<int64_t>
rawSamples(const RegisterField& field) {
    std::vector<int64_t> ret;
    if (field.mWordCount == 1) {
        for(int64_t raw = field.mRawMin; raw <= field.mRawMax; raw++)
            ret.push_back(raw);
        return ret;
    }
    int64_t step = (field.mRawMax - field.mRawMin) / 4096 + 1;
    for(int64_t raw = field.mRawMin; raw <= field.mRawMax; raw += step)
        ret.push_back(raw);
    ret.push_back(field.mRawMin + 1);
    ret.push_back(field.mRawMax - 1);
    ret.push_back(field.mRawMax);
    if (field.mRawMin < 0 && field.mRawMax > 0) {
        ret.push_back(-1);
        ret.push_back(0);
        ret.push_back(1);
    }
    return ret;
}

}

TEST_CASE ("Every AC-THOR field should") {

SECTION ("encode decoded registers back to the same words") {
    for(WordOrder order: {WordOrder::HIGH_FIRST, WordOrder::LOW_FIRST}) {
        for(const RegisterField& field: RegisterMap::acThorFields()) {
            for(int64_t raw: rawSamples(field)) {
                std::vector<uint16_t> words(RegisterCodec::uint32ToRegisters(static_cast<uint32_t>(raw), order, field.mWordCount));
                DomainValue value(RegisterCodec::decode(field, words, order));
                std::vector<uint16_t> encoded(RegisterCodec::encode(field, value, order));
                if (encoded != words)
                    FAIL("Field " << field.mName << " does not round trip raw value " << raw);
            }
        }
    }
}

}
