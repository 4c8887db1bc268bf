#include <catch2/catch_test_macros.hpp>
#include "olmwire/core/failures.hpp"
#include "olmwire/core/constants.hpp"
#include <string>

using namespace olmwire::protocol;

TEST_CASE("DecodeError - Messages match the legacy wording", "[failures][decode]") {
    SECTION("MissingVersion") {
        const auto error = DecodeError::MissingVersion();
        REQUIRE(error.type == DecodeFailureType::MissingVersion);
        REQUIRE(error.message == "The message didn't contain a version");
    }

    SECTION("InvalidVersion reports expected and actual") {
        const auto error = DecodeError::InvalidVersion(3, 2);
        REQUIRE(error.type == DecodeFailureType::InvalidVersion);
        REQUIRE(error.expected == 3);
        REQUIRE(error.actual == 2);
        REQUIRE(error.message == "The message didn't have a valid version, expected 3, got 2");
    }

    SECTION("MessageTooShort carries the actual length") {
        const auto error = DecodeError::MessageTooShort(9);
        REQUIRE(error.type == DecodeFailureType::MessageTooShort);
        REQUIRE(error.actual == 9);
        REQUIRE(error.expected == kMinimumOlmMessageBytes);
        REQUIRE(error.message.find("too short") != std::string::npos);
    }

    SECTION("InvalidKeyLength") {
        const auto error = DecodeError::InvalidKeyLength(32, 31);
        REQUIRE(error.type == DecodeFailureType::InvalidKeyLength);
        REQUIRE(error.expected == 32);
        REQUIRE(error.actual == 31);
        REQUIRE(error.message ==
                "The message contained a public key with an invalid size, expected 32, got 31");
    }

    SECTION("InvalidMacLength") {
        const auto error = DecodeError::InvalidMacLength(8, 7);
        REQUIRE(error.type == DecodeFailureType::InvalidMacLength);
        REQUIRE(error.message == "The message contained a MAC with an invalid size, expected 8, got 7");
    }

    SECTION("Signature wraps the collaborator's diagnostic") {
        const auto error = DecodeError::Signature("signature does not verify");
        REQUIRE(error.type == DecodeFailureType::Signature);
        REQUIRE(error.message == "The message contained an invalid Signature: signature does not verify");
    }

    SECTION("StructuralDecode keeps the parser diagnostic verbatim") {
        const auto error = DecodeError::StructuralDecode("truncated varint");
        REQUIRE(error.type == DecodeFailureType::StructuralDecode);
        REQUIRE(error.message == "truncated varint");
    }
}

TEST_CASE("DecodeError - Equality and classification", "[failures][decode]") {
    REQUIRE(DecodeError::InvalidVersion(3, 2) == DecodeError::InvalidVersion(3, 2));
    REQUIRE_FALSE(DecodeError::InvalidVersion(3, 2) == DecodeError::InvalidVersion(3, 4));
    REQUIRE(DecodeError::MissingVersion().Is(DecodeFailureType::MissingVersion));
    REQUIRE_FALSE(DecodeError::MissingVersion().Is(DecodeFailureType::MessageTooShort));
    REQUIRE(ToString(DecodeFailureType::InvalidKeyLength) == "InvalidKeyLength");
    REQUIRE(ToString(DecodeFailureType::StructuralDecode) == "StructuralDecode");
}
