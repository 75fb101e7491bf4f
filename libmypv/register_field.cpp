#include "register_field.hpp"

#include "exceptions.hpp"

namespace mypv {

const EnumTag*
RegisterField::findTag(uint32_t raw) const {
    if (mTags == nullptr)
        return nullptr;
    for(const EnumTag& tag: *mTags) {
        if (tag.mRaw == raw)
            return &tag;
    }
    return nullptr;
}

const EnumTag*
RegisterField::findTag(const std::string& name) const {
    if (mTags == nullptr)
        return nullptr;
    for(const EnumTag& tag: *mTags) {
        if (name == tag.mName)
            return &tag;
    }
    return nullptr;
}

uint8_t
RegisterField::wordCountFor(RegisterEncoding encoding) {
    switch(encoding) {
        case RegisterEncoding::U32:
        case RegisterEncoding::I32:
            return 2;
        default:
            return 1;
    }
}

const char*
RegisterField::encodingName(RegisterEncoding encoding) {
    switch(encoding) {
        case RegisterEncoding::U16: return "u16";
        case RegisterEncoding::I16: return "i16";
        case RegisterEncoding::U32: return "u32";
        case RegisterEncoding::I32: return "i32";
        case RegisterEncoding::ENUM: return "enum";
        case RegisterEncoding::BITFIELD: return "bitfield";
    }
    throw MyPvProgramException("Unknown register encoding " + std::to_string(encoding));
}

}
