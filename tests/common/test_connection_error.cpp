/*
 * test_connection_error.cpp - Tests for connection error codes and exceptions
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include <gtest/gtest.h>

#include "common/connection_error.hpp"
#include "common/connection_exceptions.hpp"

using namespace purelink;

TEST(ConnectionErrorCodeTest, ToString_NamesKnownCodes) {
    EXPECT_EQ(connectionErrorCodeToString(ConnectionErrorCode::ConnectionTimeout),
              "ConnectionTimeout");
    EXPECT_EQ(connectionErrorCodeToString(ConnectionErrorCode::InvalidState),
              "InvalidState");
    EXPECT_EQ(connectionErrorCodeToString(static_cast<ConnectionErrorCode>(42)),
              "Unknown(42)");
}

TEST(ConnectionErrorCodeTest, ToString_UnassignedValuesAreUnknown) {
    EXPECT_EQ(connectionErrorCodeToString(static_cast<ConnectionErrorCode>(1)),
              "Unknown(1)");
    EXPECT_EQ(connectionErrorCodeToString(static_cast<ConnectionErrorCode>(15)),
              "Unknown(15)");
    EXPECT_EQ(connectionErrorCodeToString(static_cast<ConnectionErrorCode>(900)),
              "Unknown(900)");
    EXPECT_EQ(connectionErrorCodeToString(ConnectionErrorCode::ConfigurationError),
              "ConfigurationError");
}

TEST(ConnectionErrorCodeTest, IsRecoverable_OnlyTransientFailures) {
    EXPECT_TRUE(isRecoverable(ConnectionErrorCode::ConnectionTimeout));
    EXPECT_TRUE(isRecoverable(ConnectionErrorCode::ConnectionLost));
    EXPECT_TRUE(isRecoverable(ConnectionErrorCode::NotConnected));
    EXPECT_FALSE(isRecoverable(ConnectionErrorCode::AuthenticationFailed));
    EXPECT_FALSE(isRecoverable(ConnectionErrorCode::ConfigurationError));
}

TEST(ConnectionErrorTest, ToString_IncludesDeviceAndDetails) {
    ConnectionError error(ConnectionErrorCode::ConnectionRefused, "Refused",
                          "AB1-UK-0001A");
    error.details = "port 1883";

    EXPECT_EQ(error.toString(),
              "[ConnectionRefused] Refused (device: AB1-UK-0001A) - port 1883");
}

TEST(ConnectionErrorTest, ToJson_OmitsAbsentFields) {
    ConnectionError error(ConnectionErrorCode::DiscoveryFailed, "No network");

    auto j = error.toJson();

    EXPECT_EQ(j["code"], 200);
    EXPECT_EQ(j["codeName"], "DiscoveryFailed");
    EXPECT_EQ(j["message"], "No network");
    EXPECT_FALSE(j.contains("deviceName"));
    EXPECT_FALSE(j.contains("details"));
    EXPECT_TRUE(j.contains("timestamp"));
}

TEST(ConnectionExceptionTest, Timeout_CarriesCodeDeviceAndAddress) {
    ConnectTimeoutException e("AB1-UK-0001A", "10.0.0.5");

    EXPECT_EQ(e.code(), ConnectionErrorCode::ConnectionTimeout);
    EXPECT_EQ(e.deviceName(), "AB1-UK-0001A");
    EXPECT_EQ(e.address(), "10.0.0.5");
    EXPECT_STREQ(e.what(), "Connection timeout connecting to 10.0.0.5");
    EXPECT_TRUE(e.error().isRecoverable());
}

TEST(ConnectionExceptionTest, Timeout_IsCaughtAsConnectionException) {
    try {
        throw ConnectTimeoutException("AB1-UK-0001A");
    } catch (const ConnectionException& e) {
        EXPECT_STREQ(e.what(), "Connection timeout");
        return;
    }
    FAIL() << "ConnectTimeoutException was not caught";
}

TEST(ConnectionExceptionTest, Lost_IsRecoverable) {
    ConnectionLostException e("XYZ-UK-0002B");

    EXPECT_EQ(e.code(), ConnectionErrorCode::ConnectionLost);
    EXPECT_STREQ(e.what(), "Connection lost: XYZ-UK-0002B");
    EXPECT_TRUE(e.error().isRecoverable());
}

TEST(ConnectionExceptionTest, DefaultCode_IsConnectionFailed) {
    ConnectionException e("Socket closed");

    EXPECT_EQ(e.code(), ConnectionErrorCode::ConnectionFailed);
    EXPECT_FALSE(e.deviceName().has_value());
    EXPECT_FALSE(e.error().isRecoverable());
}

TEST(ConfigurationExceptionTest, Source_IsPrefixedAndKeptAsDetails) {
    ConfigurationException e("connection", "retryDelaySeconds must be > 0");

    EXPECT_STREQ(e.what(), "connection: retryDelaySeconds must be > 0");
    EXPECT_EQ(e.error().code, ConnectionErrorCode::ConfigurationError);
    EXPECT_EQ(e.error().details, "connection");
}
