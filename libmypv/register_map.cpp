#include "register_map.hpp"

#include <algorithm>
#include <cstdint>
#include <limits>
#include <set>

#include "acthor_types.hpp"
#include "exceptions.hpp"

namespace mypv {

RegisterMap::RegisterMap(
    const std::string& name,
    const std::vector<RegisterField>& fields,
    WordOrder wordOrder,
    const DeviceFeatures& features)
    : mName(name), mFields(fields), mWordOrder(wordOrder), mFeatures(features)
{
    std::stable_sort(mFields.begin(), mFields.end(),
        [](const RegisterField& a, const RegisterField& b) -> bool {
            return a.mAddress < b.mAddress;
        }
    );

    for(size_t i = 0; i < mFields.size(); i++) {
        const RegisterField& f(mFields[i]);
        if (!mById.emplace(f.mId, i).second)
            throw RegisterMapException(mName + ": field " + f.mName + " declared twice");
        if (!mByName.emplace(f.mName, i).second)
            throw RegisterMapException(mName + ": field name " + f.mName + " is not unique");
    }

    validate();
}

void
RegisterMap::validateField(const RegisterField& field) {
    const std::string name(field.mName);

    if (field.mWordCount != RegisterField::wordCountFor(field.mEncoding)) {
        throw RegisterMapException(name + ": " + RegisterField::encodingName(field.mEncoding)
            + " needs " + std::to_string(RegisterField::wordCountFor(field.mEncoding))
            + " register(s), declared " + std::to_string(field.mWordCount));
    }

    if (field.lastRegister() > std::numeric_limits<uint16_t>::max())
        throw RegisterMapException(name + ": field does not fit in register address space");

    if (field.mScale.mDenominator == 0 || field.mScale.mNumerator == 0)
        throw RegisterMapException(name + ": invalid scale");

    int64_t minVal, maxVal;
    switch(field.mEncoding) {
        case RegisterEncoding::I16:
            minVal = std::numeric_limits<int16_t>::min();
            maxVal = std::numeric_limits<int16_t>::max();
        break;
        case RegisterEncoding::U32:
            minVal = 0;
            maxVal = std::numeric_limits<uint32_t>::max();
        break;
        case RegisterEncoding::I32:
            minVal = std::numeric_limits<int32_t>::min();
            maxVal = std::numeric_limits<int32_t>::max();
        break;
        default:
            minVal = 0;
            maxVal = std::numeric_limits<uint16_t>::max();
    }

    if (field.mRawMin > field.mRawMax)
        throw RegisterMapException(name + ": raw range minimum is greater than maximum");

    if (field.mRawMin < minVal || field.mRawMax > maxVal) {
        throw RegisterMapException(name + ": raw range " + std::to_string(field.mRawMin) + ".." + std::to_string(field.mRawMax)
            + " does not fit in " + RegisterField::encodingName(field.mEncoding));
    }

    if (field.mEncoding == RegisterEncoding::ENUM && (field.mTags == nullptr || field.mTags->empty()))
        throw RegisterMapException(name + ": enum field without tags");

    if (field.mTags != nullptr) {
        std::set<uint32_t> raws;
        std::set<std::string> names;
        for(const EnumTag& tag: *field.mTags) {
            if (!raws.insert(tag.mRaw).second || !names.insert(tag.mName).second)
                throw RegisterMapException(name + ": duplicate tag " + tag.mName);
        }
    }
}

void
RegisterMap::validate() const {
    for(const RegisterField& field: mFields)
        validateField(field);

    // fields are sorted, only check until first field that starts after current one
    for(auto it = mFields.begin(); it != mFields.end(); it++) {
        for(auto next = it + 1; next != mFields.end() && it->overlaps(*next); next++) {
            if (!it->mAliased && !next->mAliased) {
                throw RegisterMapException(mName + ": field " + next->mName + " at " + std::to_string(next->mAddress)
                    + " overlaps " + it->mName + ", mark one of them as aliased");
            }
        }
    }
}

const RegisterField*
RegisterMap::field(FieldId id) const {
    auto it = mById.find(id);
    if (it == mById.end())
        return nullptr;
    return &mFields[it->second];
}

const RegisterField*
RegisterMap::field(const std::string& name) const {
    auto it = mByName.find(name);
    if (it == mByName.end())
        return nullptr;
    return &mFields[it->second];
}

const RegisterField&
RegisterMap::getField(FieldId id) const {
    const RegisterField* ret = field(id);
    if (ret == nullptr)
        throw RegisterMapException(mName + ": no field with id " + std::to_string(static_cast<int>(id)));
    return *ret;
}

bool
RegisterMap::isAvailable(const RegisterField& field) const {
    return mFeatures.supports(field.mRequirement);
}

bool
RegisterMap::isReadable(const RegisterField& field) const {
    if (field.firstRegister() < AcThor::FIRST_REGISTER)
        return true;
    return field.lastRegister() <= mFeatures.lastReadableRegister();
}

std::vector<const RegisterField*>
RegisterMap::pollableFields() const {
    std::vector<const RegisterField*> ret;
    for(const RegisterField& field: mFields) {
        if (isReadable(field))
            ret.push_back(&field);
    }
    return ret;
}

std::vector<ReadSpan>
RegisterMap::coalesceReads(const std::vector<const RegisterField*>& fields, int maxSpan) {
    if (maxSpan <= 0)
        throw RegisterMapException("Maximum read span must be positive, got " + std::to_string(maxSpan));

    std::vector<const RegisterField*> sorted;
    std::set<FieldId> seen;
    for(const RegisterField* field: fields) {
        if (seen.insert(field->mId).second)
            sorted.push_back(field);
    }

    std::stable_sort(sorted.begin(), sorted.end(),
        [](const RegisterField* a, const RegisterField* b) -> bool {
            if (a->firstRegister() != b->firstRegister())
                return a->firstRegister() < b->firstRegister();
            return a->lastRegister() < b->lastRegister();
        }
    );

    // fields sharing registers form a group that is always read in one request
    std::vector<std::vector<const RegisterField*>> groups;
    std::vector<AddressRange> groupRanges;
    for(const RegisterField* field: sorted) {
        if (field->mWordCount > maxSpan) {
            throw RegisterMapException(std::string("Field ") + field->mName + " needs "
                + std::to_string(field->mWordCount) + " registers, maximum span is " + std::to_string(maxSpan));
        }
        AddressRange range(field->mAddress, field->mWordCount);
        if (!groupRanges.empty() && groupRanges.back().overlaps(range)) {
            groupRanges.back().merge(range);
            groups.back().push_back(field);
        } else {
            groupRanges.push_back(range);
            groups.push_back(std::vector<const RegisterField*>(1, field));
        }
    }

    std::vector<ReadSpan> ret;
    for(std::size_t i = 0; i < groups.size(); i++) {
        const AddressRange& range(groupRanges[i]);
        if (range.mCount > maxSpan) {
            throw RegisterMapException(std::string("Aliased field ") + groups[i].back()->mName
                + " extends register group at " + std::to_string(range.firstRegister())
                + " to " + std::to_string(range.mCount) + " registers, maximum span is " + std::to_string(maxSpan));
        }

        if (!ret.empty()) {
            ReadSpan& current(ret.back());
            if (range.isConsecutiveOf(current) && range.lastRegister() - current.firstRegister() + 1 <= maxSpan) {
                for(const RegisterField* field: groups[i])
                    current.add(*field);
                continue;
            }
        }
        ReadSpan span(*groups[i].front());
        for(std::size_t f = 1; f < groups[i].size(); f++)
            span.add(*groups[i][f]);
        ret.push_back(span);
    }
    return ret;
}

std::shared_ptr<const RegisterMap>
RegisterMap::forDevice(const DeviceIdentity& identity) {
    switch(identity.mModel) {
        case DeviceModel::AC_THOR:
        case DeviceModel::AC_THOR_9S:
            return std::shared_ptr<const RegisterMap>(new RegisterMap(
                std::string(DeviceIdentity::modelName(identity.mModel)) + " " + identity.mFirmwareVersion.toString(),
                acThorFields(),
                WordOrder::HIGH_FIRST,
                identity.getFeatures()
            ));
    }
    throw UnknownDeviceModel("No register map for device model " + std::to_string(identity.mModel));
}

}
