/**
 * @file test_version.cpp
 * @brief Checks the CMake-generated build identity header.
 */
#include <gtest/gtest.h>
#include <string>

#include "dronet/version.hpp"

TEST(Version, StringMatchesComponents) {
  const std::string expected = std::to_string(dronet::version_major) + "." +
                               std::to_string(dronet::version_minor) + "." +
                               std::to_string(dronet::version_patch);
  EXPECT_EQ(dronet::version_string, expected);
}

TEST(Version, ExpectedBackendMatchesBuild) {
#if defined(DRONET_USE_TL_EXPECTED)
  EXPECT_EQ(dronet::expected_backend, "tl");
#else
  EXPECT_EQ(dronet::expected_backend, "std");
#endif
}
