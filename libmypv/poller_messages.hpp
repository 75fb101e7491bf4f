#pragma once

#include <cstdint>
#include <future>
#include <memory>
#include <vector>

namespace mypv {

class EndWorkMessage {
    // no fields
};

/**
 * Register write executed by poller thread between poll cycles.
 * Result or error is passed back through mResult
 * */
class MsgRegisterWrite {
    public:
        MsgRegisterWrite(uint16_t address, const std::vector<uint16_t>& values)
            : mAddress(address), mValues(values), mResult(new std::promise<void>())
        {}

        uint16_t mAddress;
        std::vector<uint16_t> mValues;
        std::shared_ptr<std::promise<void>> mResult;
};

}
