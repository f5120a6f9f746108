// Copyright 2026 The dxcapture Authors
// Tests for: dxcapture_version_string, dxcapture_version_major,
//            dxcapture_version_minor, dxcapture_version_patch

#include "dxcapture/dxcapture.h"
#include "dxcapture/dxcapture.hpp"
#include "gtest/gtest.h"

TEST(VersionTest, VersionStringIsNotNull) {
  const char* ver = dxcapture_version_string();
  ASSERT_NE(ver, nullptr);
}

TEST(VersionTest, VersionStringMatchesMacro) {
  EXPECT_STREQ(dxcapture_version_string(), DXCAPTURE_VERSION_STRING);
}

TEST(VersionTest, VersionStringMatchesExpected) {
  EXPECT_STREQ(dxcapture_version_string(), "1.0.0");
}

TEST(VersionTest, MajorVersion) {
  EXPECT_EQ(dxcapture_version_major(), DXCAPTURE_VERSION_MAJOR);
  EXPECT_EQ(dxcapture_version_major(), 1);
}

TEST(VersionTest, MinorVersion) {
  EXPECT_EQ(dxcapture_version_minor(), DXCAPTURE_VERSION_MINOR);
  EXPECT_EQ(dxcapture_version_minor(), 0);
}

TEST(VersionTest, PatchVersion) {
  EXPECT_EQ(dxcapture_version_patch(), DXCAPTURE_VERSION_PATCH);
  EXPECT_EQ(dxcapture_version_patch(), 0);
}

TEST(VersionTest, CppWrapperMatches) {
  EXPECT_STREQ(dxcapture::version_string(), DXCAPTURE_VERSION_STRING);
}
