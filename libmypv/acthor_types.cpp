#include "acthor_types.hpp"

#include <cstdio>
#include <cstdlib>

namespace mypv {

const char*
StatusCode::categoryName(StatusCategory category) {
    switch(category) {
        case StatusCategory::OFF: return "OFF";
        case StatusCategory::START_UP: return "START_UP";
        case StatusCategory::OPERATION: return "OPERATION";
        case StatusCategory::ERROR: return "ERROR";
    }
    return "UNKNOWN";
}

std::string
StatusCode::toString() const {
    return std::string(categoryName(getCategory())) + " (" + std::to_string(mCode) + ")";
}

std::string
UtcCorrection::offsetString() const {
    char buf[8];
    int minutes = std::abs(mOffsetMinutes);
    std::snprintf(buf, sizeof(buf), "%c%02d:%02d", mOffsetMinutes < 0 ? '-' : '+', minutes / 60, minutes % 60);
    return buf;
}

const std::vector<UtcCorrection>&
UtcCorrection::table() {
    static const std::vector<UtcCorrection> zones = {
        UtcCorrection(-11 * 60, "SST"),
        UtcCorrection(-10 * 60, "HST"),
        UtcCorrection(-9 * 60 - 30, "MART"),
        UtcCorrection(-9 * 60, "HADT"),
        UtcCorrection(-8 * 60, "AKDT"),
        UtcCorrection(-7 * 60, "PDT"),
        UtcCorrection(-6 * 60, "CST"),
        UtcCorrection(-5 * 60, "EST"),
        UtcCorrection(-4 * 60 - 30, "VET"),
        UtcCorrection(-4 * 60, "AST"),
        UtcCorrection(-3 * 60, "BRT"),
        UtcCorrection(-2 * 60 - 30, "NDT"),
        UtcCorrection(-2 * 60, "WGST"),
        UtcCorrection(-1 * 60, "CVT"),
        UtcCorrection(0, "GMT"),
        UtcCorrection(1 * 60, "CET"),
        UtcCorrection(2 * 60, "CAT"),
        UtcCorrection(3 * 60, "EAT"),
        UtcCorrection(4 * 60, "GST"),
        UtcCorrection(4 * 60 + 30, "AFT"),
        UtcCorrection(5 * 60, "MAWT"),
        UtcCorrection(5 * 60 + 30, "IST"),
        UtcCorrection(5 * 60 + 45, "NPT"),
        UtcCorrection(6 * 60, "VOST"),
        UtcCorrection(6 * 60 + 30, "MMT"),
        UtcCorrection(7 * 60, "DAVT"),
        UtcCorrection(8 * 60, "AWST"),
        UtcCorrection(8 * 60 + 45, "CWST"),
        UtcCorrection(9 * 60, "TLT"),
        UtcCorrection(9 * 60 + 30, "ACST"),
        UtcCorrection(10 * 60, "DDUT"),
        UtcCorrection(10 * 60 + 30, "LHST"),
        UtcCorrection(11 * 60, "MIST"),
        UtcCorrection(11 * 60 + 30, "NFT"),
        UtcCorrection(12 * 60, "NZST"),
        UtcCorrection(12 * 60 + 45, "CHAST"),
        UtcCorrection(13 * 60, "WST"),
        UtcCorrection(14 * 60, "LINT")
    };
    return zones;
}

std::string
DeviceTime::toString() const {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%02d:%02d:%02d", mHour, mMinute, mSecond);
    return std::string(buf) + mUtcCorrection.offsetString();
}

}
