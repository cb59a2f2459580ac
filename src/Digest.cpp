/**
 * @file Digest.cpp
 *
 * This module contains the implementation of the Retrieval::Digest
 * structure.
 *
 * © 2018 by Richard Walters
 */

#include <Retrieval/Digest.hpp>
#include <stddef.h>
#include <stdint.h>
#include <string>
#include <utility>
#include <vector>

namespace {

    /**
     * These are the characters used to render digest bytes.
     */
    const char HEX_DIGITS[] = "0123456789abcdef";

    /**
     * This function decodes the given character as a hexadecimal digit.
     *
     * @param[in] c
     *     This is the character to decode.
     *
     * @param[out] value
     *     This is where to store the value of the digit.
     *
     * @return
     *     An indication of whether or not the character is
     *     a hexadecimal digit is returned.
     */
    bool DecodeNybble(char c, uint8_t& value) {
        if ((c >= '0') && (c <= '9')) {
            value = (uint8_t)(c - '0');
        } else if ((c >= 'A') && (c <= 'F')) {
            value = (uint8_t)(c - 'A' + 10);
        } else if ((c >= 'a') && (c <= 'f')) {
            value = (uint8_t)(c - 'a' + 10);
        } else {
            return false;
        }
        return true;
    }

}

namespace Retrieval {

    bool Digest::operator==(const Digest& other) const {
        return (
            (algorithm == other.algorithm)
            && (bytes == other.bytes)
        );
    }

    bool Digest::operator!=(const Digest& other) const {
        return !(*this == other);
    }

    std::string Digest::ToHex() const {
        std::string hex;
        hex.reserve(bytes.size() * 2);
        for (auto byte: bytes) {
            hex.push_back(HEX_DIGITS[(byte >> 4) & 0x0F]);
            hex.push_back(HEX_DIGITS[byte & 0x0F]);
        }
        return hex;
    }

    bool Digest::FromHex(
        Algorithm algorithm,
        const std::string& hex,
        Digest& digest
    ) {
        if ((hex.length() % 2) != 0) {
            return false;
        }
        std::vector< uint8_t > bytes;
        bytes.reserve(hex.length() / 2);
        for (size_t i = 0; i < hex.length(); i += 2) {
            uint8_t high, low;
            if (
                !DecodeNybble(hex[i], high)
                || !DecodeNybble(hex[i + 1], low)
            ) {
                return false;
            }
            bytes.push_back((uint8_t)((high << 4) | low));
        }
        digest.algorithm = algorithm;
        digest.bytes = std::move(bytes);
        return true;
    }

    size_t Digest::SizeOf(Algorithm algorithm) {
        switch (algorithm) {
            case Algorithm::Sha2_256: return 32;
            case Algorithm::Sha2_512: return 64;
            case Algorithm::Sha3_512: return 64;
            case Algorithm::Sha3_256: return 32;
            default: return 0;
        }
    }

    void PrintTo(
        const Digest& digest,
        std::ostream* os
    ) {
        switch (digest.algorithm) {
            case Digest::Algorithm::Sha2_256: {
                *os << "sha2-256:";
            } break;
            case Digest::Algorithm::Sha2_512: {
                *os << "sha2-512:";
            } break;
            case Digest::Algorithm::Sha3_512: {
                *os << "sha3-512:";
            } break;
            case Digest::Algorithm::Sha3_256: {
                *os << "sha3-256:";
            } break;
            default: {
                *os << "0x" << std::hex << (uint32_t)digest.algorithm << std::dec << ":";
            };
        }
        *os << digest.ToHex();
    }

}
