/**
 * @file ConfigurationTests.cpp
 *
 * This module contains the unit tests of the
 * Retrieval::Configuration structure.
 *
 * © 2018 by Richard Walters
 */

#include <gtest/gtest.h>
#include <map>
#include <Retrieval/Configuration.hpp>
#include <string>

TEST(ConfigurationTests, DefaultItems) {
    const Retrieval::Configuration configuration;
    const std::map< std::string, std::string > expectedItems{
        {"MaxChunkSize", "16777216"},
        {"MaxDecodedSize", "1073741824"},
        {"MaxSizeLineLength", "4096"},
        {"MaxTrailerSize", "8192"},
        {"MaxHeaderBytes", "65536"},
        {"Timeout", "30.0"},
        {"InactivityTimeout", "0.0"},
        {"PollingPeriod", "50"},
        {"AcceptContentCodings", "false"},
        {"UserAgent", "Retrieval/1.0"},
        {"ReceiveBufferSize", "65536"},
    };
    EXPECT_EQ(expectedItems, configuration.GetItems());
}

TEST(ConfigurationTests, SetItems) {
    Retrieval::Configuration configuration;
    EXPECT_TRUE(configuration.Set("MaxChunkSize", "1024"));
    EXPECT_TRUE(configuration.Set("MaxDecodedSize", "4096"));
    EXPECT_TRUE(configuration.Set("MaxSizeLineLength", "100"));
    EXPECT_TRUE(configuration.Set("MaxTrailerSize", "200"));
    EXPECT_TRUE(configuration.Set("MaxHeaderBytes", "300"));
    EXPECT_TRUE(configuration.Set("Timeout", "2.5"));
    EXPECT_TRUE(configuration.Set("InactivityTimeout", "0.75"));
    EXPECT_TRUE(configuration.Set("PollingPeriod", "10"));
    EXPECT_TRUE(configuration.Set("AcceptContentCodings", "Yes"));
    EXPECT_TRUE(configuration.Set("UserAgent", "Tester/2.0"));
    EXPECT_TRUE(configuration.Set("ReceiveBufferSize", "512"));
    EXPECT_EQ(1024, configuration.maxChunkSize);
    EXPECT_EQ(4096, configuration.maxDecodedSize);
    EXPECT_EQ(100, configuration.maxSizeLineLength);
    EXPECT_EQ(200, configuration.maxTrailerSize);
    EXPECT_EQ(300, configuration.maxHeaderBytes);
    EXPECT_EQ(2.5, configuration.timeout);
    EXPECT_EQ(0.75, configuration.inactivityTimeout);
    EXPECT_EQ(10, configuration.pollingPeriod);
    EXPECT_TRUE(configuration.acceptContentCodings);
    EXPECT_EQ("Tester/2.0", configuration.userAgent);
    EXPECT_EQ(512, configuration.receiveBufferSize);
    const auto items = configuration.GetItems();
    EXPECT_EQ("2.5", items.at("Timeout"));
    EXPECT_EQ("0.75", items.at("InactivityTimeout"));
    EXPECT_EQ("true", items.at("AcceptContentCodings"));
}

TEST(ConfigurationTests, RejectBadValues) {
    Retrieval::Configuration configuration;
    EXPECT_FALSE(configuration.Set("MaxChunkSize", ""));
    EXPECT_FALSE(configuration.Set("MaxChunkSize", "-5"));
    EXPECT_FALSE(configuration.Set("MaxChunkSize", "lots"));
    EXPECT_FALSE(configuration.Set("Timeout", "soon"));
    EXPECT_FALSE(configuration.Set("AcceptContentCodings", "maybe"));
    EXPECT_FALSE(configuration.Set("ReceiveBufferSize", "0"));
    EXPECT_FALSE(configuration.Set("PollingPeriod", "0"));
    EXPECT_FALSE(configuration.Set("InactivityTimeout", "-1"));
    EXPECT_FALSE(configuration.Set("NoSuchThing", "42"));
    EXPECT_EQ(Retrieval::Configuration().GetItems(), configuration.GetItems());
}

TEST(ConfigurationTests, DecoderLimits) {
    Retrieval::Configuration configuration;
    configuration.maxChunkSize = 10;
    configuration.maxDecodedSize = 100;
    configuration.maxSizeLineLength = 20;
    configuration.maxTrailerSize = 30;
    auto limits = configuration.GetDecoderLimits();
    EXPECT_EQ(10, limits.maxChunkSize);
    EXPECT_EQ(100, limits.maxDecodedSize);
    EXPECT_EQ(20, limits.maxSizeLineLength);
    EXPECT_EQ(30, limits.maxTrailerSize);
    limits = configuration.GetDecoderLimits(50);
    EXPECT_EQ(50, limits.maxDecodedSize);
}
