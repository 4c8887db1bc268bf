#pragma once

/**
 * @file wire_logger.hpp
 * @brief Debug tracing of envelope encoding and decoding.
 *
 * Prints ratchet keys, chain indices and MAC tags to stdout. Public keys and
 * MAC tags are not secret, but the trace links messages to sessions, so keep
 * OLMWIRE_DEBUG_WIRE off in release builds.
 *
 * Enable via CMake: -DOLMWIRE_DEBUG_WIRE=ON
 */

#include <cstdint>
#include <cstdio>
#include <span>
#include <string>
#include <string_view>

namespace olmwire::debug {

#ifdef OLMWIRE_DEBUG_WIRE

inline std::string ToHex(std::span<const uint8_t> data) {
    static constexpr char hex_chars[] = "0123456789abcdef";
    std::string result;
    result.reserve(data.size() * 2);
    for (const auto byte : data) {
        result.push_back(hex_chars[(byte >> 4) & 0x0F]);
        result.push_back(hex_chars[byte & 0x0F]);
    }
    return result;
}

inline std::string ToHexTruncated(std::span<const uint8_t> data, size_t max_bytes = 48) {
    if (data.size() <= max_bytes) {
        return ToHex(data);
    }
    auto truncated = ToHex(data.subspan(0, max_bytes));
    truncated += "...(" + std::to_string(data.size()) + " bytes)";
    return truncated;
}

#define OLMWIRE_LOG_BYTES(operation, name, data) \
    do { \
        fprintf(stdout, "[OLMWIRE-DEBUG] %s %s: %s\n", \
            operation, \
            name, \
            ::olmwire::debug::ToHexTruncated(data).c_str()); \
        fflush(stdout); \
    } while(0)

#define OLMWIRE_LOG_VALUE(operation, name, value) \
    do { \
        fprintf(stdout, "[OLMWIRE-DEBUG] %s %s: %s\n", \
            operation, \
            name, \
            std::to_string(value).c_str()); \
        fflush(stdout); \
    } while(0)

#define OLMWIRE_LOG_SECTION(section_name) \
    do { \
        fprintf(stdout, "[OLMWIRE-DEBUG] ========== %s ==========\n", \
            section_name); \
        fflush(stdout); \
    } while(0)

inline void LogOlmMessageEncoded(
    std::span<const uint8_t> ratchet_key,
    uint64_t chain_index,
    size_t ciphertext_length,
    size_t encoded_length) {

    OLMWIRE_LOG_SECTION("OLM MESSAGE ENCODED");
    OLMWIRE_LOG_BYTES("ENCODE", "ratchet_key", ratchet_key);
    OLMWIRE_LOG_VALUE("ENCODE", "chain_index", chain_index);
    OLMWIRE_LOG_VALUE("ENCODE", "ciphertext_length", ciphertext_length);
    OLMWIRE_LOG_VALUE("ENCODE", "encoded_length", encoded_length);
}

inline void LogMacAppended(std::span<const uint8_t> truncated_mac) {
    OLMWIRE_LOG_BYTES("ENCODE", "truncated_mac", truncated_mac);
}

inline void LogPreKeyMessageEncoded(
    std::span<const uint8_t> one_time_key,
    std::span<const uint8_t> base_key,
    std::span<const uint8_t> identity_key,
    size_t embedded_length) {

    OLMWIRE_LOG_SECTION("PRE-KEY MESSAGE ENCODED");
    OLMWIRE_LOG_BYTES("ENCODE", "one_time_key", one_time_key);
    OLMWIRE_LOG_BYTES("ENCODE", "base_key", base_key);
    OLMWIRE_LOG_BYTES("ENCODE", "identity_key", identity_key);
    OLMWIRE_LOG_VALUE("ENCODE", "embedded_length", embedded_length);
}

inline void LogOlmMessageDecoded(
    std::span<const uint8_t> ratchet_key,
    uint64_t chain_index,
    size_t ciphertext_length) {

    OLMWIRE_LOG_SECTION("OLM MESSAGE DECODED");
    OLMWIRE_LOG_BYTES("DECODE", "ratchet_key", ratchet_key);
    OLMWIRE_LOG_VALUE("DECODE", "chain_index", chain_index);
    OLMWIRE_LOG_VALUE("DECODE", "ciphertext_length", ciphertext_length);
}

inline void LogPreKeyMessageDecoded(
    std::span<const uint8_t> one_time_key,
    std::span<const uint8_t> base_key,
    std::span<const uint8_t> identity_key,
    size_t embedded_length) {

    OLMWIRE_LOG_SECTION("PRE-KEY MESSAGE DECODED");
    OLMWIRE_LOG_BYTES("DECODE", "one_time_key", one_time_key);
    OLMWIRE_LOG_BYTES("DECODE", "base_key", base_key);
    OLMWIRE_LOG_BYTES("DECODE", "identity_key", identity_key);
    OLMWIRE_LOG_VALUE("DECODE", "embedded_length", embedded_length);
}

inline void LogDecodeRejected(const char* envelope, const std::string& reason) {
    fprintf(stdout, "[OLMWIRE-DEBUG] DECODE %s rejected: %s\n", envelope, reason.c_str());
    fflush(stdout);
}

#else // !OLMWIRE_DEBUG_WIRE

#define OLMWIRE_LOG_BYTES(operation, name, data) ((void)0)
#define OLMWIRE_LOG_VALUE(operation, name, value) ((void)0)
#define OLMWIRE_LOG_SECTION(section_name) ((void)0)

inline void LogOlmMessageEncoded(std::span<const uint8_t>, uint64_t, size_t, size_t) {}
inline void LogMacAppended(std::span<const uint8_t>) {}
inline void LogPreKeyMessageEncoded(std::span<const uint8_t>, std::span<const uint8_t>,
    std::span<const uint8_t>, size_t) {}
inline void LogOlmMessageDecoded(std::span<const uint8_t>, uint64_t, size_t) {}
inline void LogPreKeyMessageDecoded(std::span<const uint8_t>, std::span<const uint8_t>,
    std::span<const uint8_t>, size_t) {}
inline void LogDecodeRejected(const char*, const std::string&) {}

#endif // OLMWIRE_DEBUG_WIRE

} // namespace olmwire::debug
