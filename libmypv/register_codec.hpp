#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "domain_value.hpp"
#include "register_field.hpp"

namespace mypv {

/**
 *  Conversion between raw register words and domain values.
 *  Stateless, safe to use from any thread.
 **/
class RegisterCodec {
    private:
        RegisterCodec() {};
    public:
        /**
         * Converts field registers to domain value.
         * Throws DecodeError if number of words does not match field.
         * Unknown enumeration tags are returned as Unknown(raw) values.
         * */
        static DomainValue decode(const RegisterField& field, const std::vector<uint16_t>& words, WordOrder order);

        /**
         * Converts domain value to field registers, ready to be written
         * at field address. Throws EncodeError before anything is sent
         * to device if value is outside field range or cannot be
         * represented with field scale.
         * */
        static std::vector<uint16_t> encode(const RegisterField& field, const DomainValue& value, WordOrder order);

        /**
         * Encodes enumeration tag by its name
         * */
        static std::vector<uint16_t> encodeTag(const RegisterField& field, const std::string& tagName, WordOrder order);

        /**
         * Converts single or two registers to raw unsigned value
         * */
        static uint32_t registersToUInt32(const std::vector<uint16_t>& words, WordOrder order);

        /**
         * Converts raw value to single or two registers
         * */
        static std::vector<uint16_t> uint32ToRegisters(uint32_t val, WordOrder order, int registerCount);

        /**
         * Reinterprets composed registers as two's complement number
         * of given width in words
         * */
        static int64_t toSigned(uint32_t raw, int wordCount);

        /**
         * Field value in raw units. Throws EncodeError if
         * value is not a multiple of field scale
         * */
        static int64_t toRaw(const RegisterField& field, const DomainValue& value);
};

}
