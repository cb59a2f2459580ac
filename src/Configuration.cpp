/**
 * @file Configuration.cpp
 *
 * This module contains the implementation of the
 * Retrieval::Configuration structure.
 *
 * © 2018 by Richard Walters
 */

#include <inttypes.h>
#include <map>
#include <Retrieval/Configuration.hpp>
#include <stdio.h>
#include <string>
#include <SystemAbstractions/StringExtensions.hpp>

namespace {

    /**
     * This is a helper function which formats the given double-precision
     * floating-point value as a string, ensuring that it will always
     * look like a floating-point value, and never an integer.
     *
     * @param[in] number
     *     This is the number to format.
     *
     * @return
     *     A string representation of the number, guaranteed not to
     *     look like an integer, is returned.
     */
    std::string FormatDoubleAsDistinctlyNotInteger(double number) {
        auto s = SystemAbstractions::sprintf("%.15lg", number);
        if (s.find_first_not_of("0123456789-") == std::string::npos) {
            s += ".0";
        }
        return s;
    }

    /**
     * This function parses a configuration item from its text form.
     *
     * @param[in,out] item
     *     This is the configuration item to set.
     *
     * @param[in] scanFormat
     *     This is the scanf-style format specification for parsing
     *     the configuration item.
     *
     * @param[in] value
     *     This is the value to parse to be the new value of the item.
     *
     * @return
     *     An indication of whether or not the value could be parsed
     *     is returned.
     */
    template<
        typename ItemType
    > bool ParseConfigurationItem(
        ItemType& item,
        const char* const scanFormat,
        const std::string& value
    ) {
        if (
            value.empty()
            || (value[0] == '-')
        ) {
            return false;
        }
        ItemType newItem;
        if (
            sscanf(
                value.c_str(),
                scanFormat,
                &newItem
            ) != 1
        ) {
            return false;
        }
        item = newItem;
        return true;
    }

    /**
     * This function parses a flag configuration item from its text form.
     *
     * @param[in,out] item
     *     This is the configuration item to set.
     *
     * @param[in] value
     *     This is the value to parse to be the new value of the item.
     *
     * @return
     *     An indication of whether or not the value could be parsed
     *     is returned.
     */
    bool ParseFlagConfigurationItem(
        bool& item,
        const std::string& value
    ) {
        const auto normalizedValue = SystemAbstractions::ToLower(value);
        if (
            (normalizedValue == "true")
            || (normalizedValue == "yes")
            || (normalizedValue == "1")
        ) {
            item = true;
        } else if (
            (normalizedValue == "false")
            || (normalizedValue == "no")
            || (normalizedValue == "0")
        ) {
            item = false;
        } else {
            return false;
        }
        return true;
    }

}

namespace Retrieval {

    bool Configuration::Set(
        const std::string& key,
        const std::string& value
    ) {
        if (key == "MaxChunkSize") {
            return ParseConfigurationItem(maxChunkSize, "%" SCNu64, value);
        } else if (key == "MaxDecodedSize") {
            return ParseConfigurationItem(maxDecodedSize, "%" SCNu64, value);
        } else if (key == "MaxSizeLineLength") {
            return ParseConfigurationItem(maxSizeLineLength, "%zu", value);
        } else if (key == "MaxTrailerSize") {
            return ParseConfigurationItem(maxTrailerSize, "%zu", value);
        } else if (key == "MaxHeaderBytes") {
            return ParseConfigurationItem(maxHeaderBytes, "%zu", value);
        } else if (key == "Timeout") {
            return ParseConfigurationItem(timeout, "%lf", value);
        } else if (key == "InactivityTimeout") {
            return ParseConfigurationItem(inactivityTimeout, "%lf", value);
        } else if (key == "PollingPeriod") {
            unsigned int newPollingPeriod = pollingPeriod;
            if (
                !ParseConfigurationItem(newPollingPeriod, "%u", value)
                || (newPollingPeriod == 0)
            ) {
                return false;
            }
            pollingPeriod = newPollingPeriod;
            return true;
        } else if (key == "AcceptContentCodings") {
            return ParseFlagConfigurationItem(acceptContentCodings, value);
        } else if (key == "UserAgent") {
            userAgent = value;
            return true;
        } else if (key == "ReceiveBufferSize") {
            size_t newReceiveBufferSize = receiveBufferSize;
            if (
                !ParseConfigurationItem(newReceiveBufferSize, "%zu", value)
                || (newReceiveBufferSize == 0)
            ) {
                return false;
            }
            receiveBufferSize = newReceiveBufferSize;
            return true;
        } else {
            return false;
        }
    }

    std::map< std::string, std::string > Configuration::GetItems() const {
        std::map< std::string, std::string > items;
        items["MaxChunkSize"] = SystemAbstractions::sprintf("%" PRIu64, maxChunkSize);
        items["MaxDecodedSize"] = SystemAbstractions::sprintf("%" PRIu64, maxDecodedSize);
        items["MaxSizeLineLength"] = SystemAbstractions::sprintf("%zu", maxSizeLineLength);
        items["MaxTrailerSize"] = SystemAbstractions::sprintf("%zu", maxTrailerSize);
        items["MaxHeaderBytes"] = SystemAbstractions::sprintf("%zu", maxHeaderBytes);
        items["Timeout"] = FormatDoubleAsDistinctlyNotInteger(timeout);
        items["InactivityTimeout"] = FormatDoubleAsDistinctlyNotInteger(inactivityTimeout);
        items["PollingPeriod"] = SystemAbstractions::sprintf("%u", pollingPeriod);
        items["AcceptContentCodings"] = (acceptContentCodings ? "true" : "false");
        items["UserAgent"] = userAgent;
        items["ReceiveBufferSize"] = SystemAbstractions::sprintf("%zu", receiveBufferSize);
        return items;
    }

    ChunkDecoder::Limits Configuration::GetDecoderLimits(uint64_t requestMaxDecodedSize) const {
        ChunkDecoder::Limits limits;
        limits.maxChunkSize = maxChunkSize;
        limits.maxDecodedSize = (
            (requestMaxDecodedSize == 0)
            ? maxDecodedSize
            : requestMaxDecodedSize
        );
        limits.maxSizeLineLength = maxSizeLineLength;
        limits.maxTrailerSize = maxTrailerSize;
        return limits;
    }

}
