#include "snapshot_json.hpp"

#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

namespace mypv {

namespace {

int
decimalPlaces(int64_t denominator) {
    int ret = 0;
    while(denominator > 1) {
        denominator /= 10;
        ret++;
    }
    return ret;
}

void
writeValue(rapidjson::Writer<rapidjson::StringBuffer>& writer, const RegisterField& field, const DomainValue& value) {
    switch(value.getType()) {
        case DomainValue::ValueType::ENUM: {
            std::string tag(value.getTagName());
            writer.String(tag.c_str(), tag.size());
            break;
        }
        case DomainValue::ValueType::BITS:
            writer.Uint(value.getRaw());
            break;
        case DomainValue::ValueType::NUMBER:
            if (value.isInteger()) {
                writer.Int64(value.getNumerator());
            } else {
                // field scale gives resolution, value itself may be reduced
                writer.SetMaxDecimalPlaces(decimalPlaces(field.mScale.mDenominator));
                writer.Double(value.getDouble());
                writer.SetMaxDecimalPlaces(rapidjson::Writer<rapidjson::StringBuffer>::kDefaultMaxDecimalPlaces);
            }
            break;
    }
}

}

std::string
snapshotToJson(const DeviceSnapshot& snapshot, const RegisterMap& registerMap) {
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);

    writer.StartObject();
    writer.Key("map");
    writer.String(registerMap.getName().c_str(), registerMap.getName().size());
    writer.Key("timestamp");
    writer.Int64(std::chrono::duration_cast<std::chrono::milliseconds>(
        snapshot.getTimestamp().time_since_epoch()).count());

    writer.Key("values");
    writer.StartObject();
    for(const RegisterField& field: registerMap.fields()) {
        const SnapshotValue* val = snapshot.get(field.mId);
        if (val == nullptr)
            continue;
        writer.Key(field.mName);
        if (val->mValid)
            writeValue(writer, field, val->mValue);
        else
            writer.Null();
    }
    writer.EndObject();

    writer.EndObject();
    return buffer.GetString();
}

}
