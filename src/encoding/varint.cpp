#include "olmwire/encoding/varint.hpp"
#include "olmwire/core/constants.hpp"

namespace olmwire::protocol::encoding {

size_t RequiredEncodedSpace(uint64_t value) noexcept {
    if (value == 0) {
        return 1;
    }
    size_t groups = 0;
    while (value > 0) {
        ++groups;
        value >>= kVarintPayloadBits;
    }
    return groups;
}

std::vector<uint8_t> EncodeVarint(const uint64_t value) {
    std::vector<uint8_t> encoded;
    encoded.reserve(RequiredEncodedSpace(value));
    AppendVarint(encoded, value);
    return encoded;
}

void AppendVarint(std::vector<uint8_t>& output, uint64_t value) {
    while (value > kVarintPayloadMask) {
        output.push_back(static_cast<uint8_t>(kVarintContinuationBit | (value & kVarintPayloadMask)));
        value >>= kVarintPayloadBits;
    }
    output.push_back(static_cast<uint8_t>(value));
}

}
