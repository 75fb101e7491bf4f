#include <algorithm>
#include <map>
#include <random>

#include "catch2/catch_all.hpp"

#include "libmypv/device_identity.hpp"
#include "libmypv/exceptions.hpp"
#include "libmypv/register_map.hpp"

using namespace mypv;

namespace {

RegisterField
holding(FieldId id, const char* name, uint16_t address, RegisterEncoding encoding = RegisterEncoding::U16) {
    int64_t max = encoding == RegisterEncoding::U32 ? 0xFFFFFFFF : 0xFFFF;
    return RegisterField(id, name, address, encoding, Scale(), "", 0, max);
}

std::vector<std::pair<int, int>>
spanBounds(const std::vector<ReadSpan>& spans) {
    std::vector<std::pair<int, int>> ret;
    for(const ReadSpan& span: spans)
        ret.push_back(std::make_pair(span.firstRegister(), span.lastRegister()));
    return ret;
}

}

TEST_CASE ("Register map should") {

SECTION ("accept AC-THOR register table") {
    RegisterMap map("AC-THOR", RegisterMap::acThorFields());
    REQUIRE(map.fields().size() == RegisterMap::acThorFields().size());
    REQUIRE(map.fields().front().mAddress == 1000);
    REQUIRE(map.fields().back().mAddress == 1087);
}

SECTION ("find fields by id and name") {
    RegisterMap map("AC-THOR", RegisterMap::acThorFields());
    REQUIRE(map.field(FieldId::FREQUENCY)->mAddress == 1064);
    REQUIRE(map.field("hot_water_1_max")->mId == FieldId::HOT_WATER_1_MAX);
    REQUIRE(map.field("no_such_field") == nullptr);
    REQUIRE(map.getField(FieldId::POWER_32).mWordCount == 2);
}

SECTION ("reject duplicated field names") {
    std::vector<RegisterField> fields = {
        holding(FieldId::POWER, "power", 1),
        holding(FieldId::STATUS, "power", 2)
    };
    REQUIRE_THROWS_AS(RegisterMap("test", fields), RegisterMapException);
}

SECTION ("reject overlapping fields unless aliased") {
    std::vector<RegisterField> fields = {
        holding(FieldId::POWER_32, "power_32", 10, RegisterEncoding::U32),
        holding(FieldId::POWER, "power", 11)
    };
    REQUIRE_THROWS_AS(RegisterMap("test", fields), RegisterMapException);

    fields[1].aliased();
    REQUIRE_NOTHROW(RegisterMap("test", fields));
}

SECTION ("reject word count that does not match encoding") {
    std::vector<RegisterField> fields = {
        RegisterField(FieldId::POWER, "power", 1, 2, RegisterEncoding::U16, Scale(), "W", 0, 0xFFFF)
    };
    REQUIRE_THROWS_AS(RegisterMap("test", fields), RegisterMapException);
}

SECTION ("reject raw range that does not fit encoding") {
    std::vector<RegisterField> fields = {
        RegisterField(FieldId::METER_POWER, "meter_power", 1, RegisterEncoding::I16, Scale(), "W", -40000, 0)
    };
    REQUIRE_THROWS_AS(RegisterMap("test", fields), RegisterMapException);
}

SECTION ("reject enum without tags") {
    std::vector<RegisterField> fields = {
        RegisterField(FieldId::BOOST_MODE, "boost_mode", 1, RegisterEncoding::ENUM, Scale(), "", 0, 0xFFFF)
    };
    REQUIRE_THROWS_AS(RegisterMap("test", fields), RegisterMapException);
}

SECTION ("reject zero scale") {
    std::vector<RegisterField> fields = {
        RegisterField(FieldId::POWER, "power", 1, RegisterEncoding::U16, Scale(0, 1), "W", 0, 0xFFFF)
    };
    REQUIRE_THROWS_AS(RegisterMap("test", fields), RegisterMapException);
}

SECTION ("select map for identified device") {
    DeviceIdentity identity(DeviceModel::AC_THOR_9S, "2002000000000001", FirmwareVersion(210, 2));
    std::shared_ptr<const RegisterMap> map(RegisterMap::forDevice(identity));
    REQUIRE(map->getName() == "AC-THOR 9s a0021002");
    REQUIRE(map->getWordOrder() == WordOrder::HIGH_FIRST);
    REQUIRE(map->isAvailable(map->getField(FieldId::VOLTAGE_L3)));
}

SECTION ("mark fields of other variants as not available") {
    DeviceIdentity identity(DeviceModel::AC_THOR, "2001000000000001", FirmwareVersion(202, 1));
    std::shared_ptr<const RegisterMap> map(RegisterMap::forDevice(identity));
    REQUIRE(!map->isAvailable(map->getField(FieldId::VOLTAGE_L2)));
    REQUIRE(!map->isAvailable(map->getField(FieldId::TEMPERATURE_5)));
    REQUIRE(!map->isAvailable(map->getField(FieldId::METER_POWER_32)));
    REQUIRE(map->isAvailable(map->getField(FieldId::TEMPERATURE_4)));
}

}

TEST_CASE ("Read coalescing should") {

RegisterField a = holding(FieldId::POWER, "a", 10);
RegisterField b = holding(FieldId::TEMPERATURE_1, "b", 11);
RegisterField c = holding(FieldId::STATUS, "c", 13);
RegisterField d = holding(FieldId::POWER_32, "d", 14, RegisterEncoding::U32);

SECTION ("merge adjacent fields") {
    std::vector<ReadSpan> spans = RegisterMap::coalesceReads({&a, &b});
    REQUIRE(spans.size() == 1);
    REQUIRE(spans[0].firstRegister() == 10);
    REQUIRE(spans[0].mCount == 2);
    REQUIRE(spans[0].mFields.size() == 2);
}

SECTION ("split on address gap") {
    std::vector<ReadSpan> spans = RegisterMap::coalesceReads({&c, &a, &b, &d});
    REQUIRE(spanBounds(spans) == std::vector<std::pair<int, int>>({{10, 11}, {13, 15}}));
}

SECTION ("respect maximum span") {
    std::vector<ReadSpan> spans = RegisterMap::coalesceReads({&c, &d}, 2);
    REQUIRE(spanBounds(spans) == std::vector<std::pair<int, int>>({{13, 13}, {14, 15}}));
}

SECTION ("ignore duplicated fields") {
    std::vector<ReadSpan> spans = RegisterMap::coalesceReads({&a, &a, &b});
    REQUIRE(spans.size() == 1);
    REQUIRE(spans[0].mFields.size() == 2);
}

SECTION ("fail if field does not fit in single span") {
    REQUIRE_THROWS_AS(RegisterMap::coalesceReads({&d}, 1), RegisterMapException);
}

SECTION ("start new span at aliased register group") {
    RegisterField x = holding(FieldId::TEMPERATURE_2, "x", 12);
    RegisterField alias = holding(FieldId::METER_POWER_32, "alias", 13, RegisterEncoding::U32);
    alias.aliased();
    std::vector<ReadSpan> spans = RegisterMap::coalesceReads({&x, &c, &alias}, 2);
    REQUIRE(spanBounds(spans) == std::vector<std::pair<int, int>>({{12, 12}, {13, 14}}));
    REQUIRE(spans[1].mFields.size() == 2);
}

SECTION ("fail if aliased register group does not fit in single span") {
    RegisterField alias = holding(FieldId::METER_POWER_32, "alias", 14, RegisterEncoding::U32);
    alias.aliased();
    RegisterField wide = holding(FieldId::POWER_TIMEOUT, "wide", 13, RegisterEncoding::U32);
    REQUIRE_THROWS_AS(RegisterMap::coalesceReads({&wide, &d, &alias}, 2), RegisterMapException);
    REQUIRE(spanBounds(RegisterMap::coalesceReads({&wide, &d, &alias}, 3)) == std::vector<std::pair<int, int>>({{13, 15}}));
}

SECTION ("read AC-THOR registers around serial number and reserved registers") {
    RegisterMap map("AC-THOR", RegisterMap::acThorFields());
    std::vector<ReadSpan> spans = RegisterMap::coalesceReads(map.pollableFields());
    REQUIRE(spanBounds(spans) == std::vector<std::pair<int, int>>({
        {1000, 1017}, {1026, 1065}, {1067, 1085}, {1087, 1088}
    }));
}

SECTION ("skip registers not readable by older firmware") {
    DeviceIdentity identity(DeviceModel::AC_THOR, "2001000000000001", FirmwareVersion(101, 3));
    std::shared_ptr<const RegisterMap> map(RegisterMap::forDevice(identity));
    std::vector<ReadSpan> spans = RegisterMap::coalesceReads(map->pollableFields());
    REQUIRE(spanBounds(spans) == std::vector<std::pair<int, int>>({
        {1000, 1017}, {1026, 1065}, {1067, 1080}
    }));
}

}

namespace {

// random layout of single, double and aliased fields with gaps between them
std::vector<RegisterField>
randomLayout(std::mt19937& rnd) {
    std::vector<RegisterField> ret;
    int address = 100;
    int count = std::uniform_int_distribution<int>(1, 20)(rnd);
    for(int i = 0; i < count; i++) {
        FieldId id = static_cast<FieldId>(ret.size());
        switch(std::uniform_int_distribution<int>(0, 4)(rnd)) {
            case 0:
                address += std::uniform_int_distribution<int>(1, 3)(rnd);
                break;
            case 1:
                ret.push_back(holding(id, "u16", address));
                address += 1;
                break;
            case 2:
                ret.push_back(holding(id, "u32", address, RegisterEncoding::U32));
                address += 2;
                break;
            default: {
                ret.push_back(holding(id, "u32", address, RegisterEncoding::U32));
                int offset = std::uniform_int_distribution<int>(0, 1)(rnd);
                ret.push_back(holding(static_cast<FieldId>(ret.size()), "alias", address + offset).aliased());
                address += 2;
            }
        }
    }
    return ret;
}

}

TEST_CASE ("Read spans should") {

SECTION ("cover every field once within maximum length") {
    std::mt19937 rnd(20240517);
    for(int iteration = 0; iteration < 500; iteration++) {
        std::vector<RegisterField> fields(randomLayout(rnd));
        std::vector<const RegisterField*> input;
        for(const RegisterField& field: fields)
            input.push_back(&field);
        std::shuffle(input.begin(), input.end(), rnd);
        int maxSpan = std::uniform_int_distribution<int>(2, 10)(rnd);

        std::vector<ReadSpan> spans = RegisterMap::coalesceReads(input, maxSpan);

        std::map<const RegisterField*, int> covered;
        for(std::size_t i = 0; i < spans.size(); i++) {
            const ReadSpan& span(spans[i]);
            REQUIRE(span.mCount >= 1);
            REQUIRE(span.mCount <= maxSpan);
            if (i > 0) {
                const ReadSpan& previous(spans[i-1]);
                REQUIRE(previous.lastRegister() < span.firstRegister());
                // adjacent spans are merged whenever the result fits
                if (span.isConsecutiveOf(previous))
                    REQUIRE(span.lastRegister() - previous.firstRegister() + 1 > maxSpan);
            }
            for(const RegisterField* field: span.mFields) {
                covered[field]++;
                REQUIRE(field->firstRegister() >= span.firstRegister());
                REQUIRE(field->lastRegister() <= span.lastRegister());
            }
        }
        REQUIRE(covered.size() == fields.size());
        for(const auto& entry: covered)
            REQUIRE(entry.second == 1);
    }
}

}
