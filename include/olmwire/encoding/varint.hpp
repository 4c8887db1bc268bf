#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>

namespace olmwire::protocol::encoding {

/// Bytes needed by the minimal varint form of `value` (1 for zero, at most 10).
[[nodiscard]] size_t RequiredEncodedSpace(uint64_t value) noexcept;

/**
 * @brief Minimal base-128 varint, least significant group first
 *
 * Every byte but the last has the continuation bit (0x80) set. Zero encodes
 * as the single byte 0x00, never as an empty sequence.
 */
[[nodiscard]] std::vector<uint8_t> EncodeVarint(uint64_t value);

void AppendVarint(std::vector<uint8_t>& output, uint64_t value);

}
