#include "catch2/catch_all.hpp"

#include "libmypv/domain_value.hpp"

using namespace mypv;

TEST_CASE ("Domain value should") {

SECTION ("reduce fractions") {
    DomainValue val = DomainValue::fromRational(450, 10);
    REQUIRE(val.isInteger());
    REQUIRE(val.getInt64() == 45);
    REQUIRE(val == DomainValue::fromInt(45));
}

SECTION ("keep sign in numerator") {
    DomainValue val = DomainValue::fromRational(5, -10);
    REQUIRE(val.getNumerator() == -1);
    REQUIRE(val.getDenominator() == 2);
}

SECTION ("round doubles to given resolution") {
    DomainValue val = DomainValue::fromDouble(55.54, 10);
    REQUIRE(val == DomainValue::fromRational(555, 10));
    REQUIRE(val.toString() == "55.5");
}

SECTION ("throw when integer is requested from fraction") {
    REQUIRE_THROWS_AS(DomainValue::fromRational(1, 3).getInt64(), DomainValueException);
}

SECTION ("reject zero denominator") {
    REQUIRE_THROWS_AS(DomainValue::fromRational(1, 0), DomainValueException);
}

SECTION ("print bits as hex") {
    REQUIRE(DomainValue::fromBits(0x6123).toString() == "0x6123");
}

}
