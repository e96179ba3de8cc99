#include <string>

#include "gtest/gtest.h"

#include "bk_manifest.h"

namespace esphome {
namespace bk_flasher {

TEST(BkManifest, PrimaryKeys) {
  FirmwareManifest m;
  ASSERT_TRUE(parse_manifest(R"({"fw_url":"https://example.org/all-app.bin",)"
                             R"("md5":"0123456789abcdef0123456789abcdef","size":1048576,"version":"1.4.2"})",
                             m));
  EXPECT_EQ(m.fw_url, "https://example.org/all-app.bin");
  EXPECT_EQ(m.md5, "0123456789abcdef0123456789abcdef");
  EXPECT_EQ(m.size, 1048576u);
  EXPECT_EQ(m.version, "1.4.2");
  EXPECT_FALSE(m.has_address);
}

TEST(BkManifest, FallbackKeys) {
  FirmwareManifest m;
  ASSERT_TRUE(parse_manifest(R"({"firmware_url":"http://h/fw.bin","md5sum":"abc","length":"4096","rev":"r7"})", m));
  EXPECT_EQ(m.fw_url, "http://h/fw.bin");
  EXPECT_EQ(m.md5, "abc");
  EXPECT_EQ(m.size, 4096u);
  EXPECT_EQ(m.version, "r7");

  ASSERT_TRUE(parse_manifest(R"({"url":"http://h/x.bin","md5_hex":"def","code_revision":"9"})", m));
  EXPECT_EQ(m.fw_url, "http://h/x.bin");
  EXPECT_EQ(m.md5, "def");
  EXPECT_EQ(m.version, "9");
  EXPECT_EQ(m.size, 0u);
}

TEST(BkManifest, AddressAsNumberOrHexString) {
  FirmwareManifest m;
  ASSERT_TRUE(parse_manifest(R"({"url":"u","address":"0x11000"})", m));
  EXPECT_TRUE(m.has_address);
  EXPECT_EQ(m.address, 0x11000u);
  ASSERT_TRUE(parse_manifest(R"({"url":"u","addr":4096})", m));
  EXPECT_TRUE(m.has_address);
  EXPECT_EQ(m.address, 4096u);
  ASSERT_TRUE(parse_manifest(R"({"url":"u","address":"nope"})", m));
  EXPECT_FALSE(m.has_address);
}

TEST(BkManifest, Rejects) {
  FirmwareManifest m;
  EXPECT_FALSE(parse_manifest(R"({"md5":"x"})", m));
  EXPECT_FALSE(parse_manifest("not json", m));
  EXPECT_FALSE(parse_manifest("[1,2]", m));
}

TEST(BkManifest, DirectImageUrl) {
  EXPECT_TRUE(is_direct_image_url("https://h/all-app.bin"));
  EXPECT_TRUE(is_direct_image_url("https://h/ALL-APP.BIN?token=1#x"));
  EXPECT_FALSE(is_direct_image_url("https://h/manifest.json"));
  EXPECT_FALSE(is_direct_image_url("https://h/bin?x=.bin"));
  EXPECT_TRUE(ends_with_ignore_query("a.json", ".json"));
  EXPECT_FALSE(ends_with_ignore_query("n", ".bin"));
}

TEST(BkImageBuffer, PlannedSize) {
  EXPECT_EQ(planned_image_size(4 * 1024 * 1024, 0), 4u * 1024 * 1024);
  EXPECT_EQ(planned_image_size(5000, 6000), 5000u);
  EXPECT_EQ(planned_image_size(-1, 6000), 6000u);
  EXPECT_EQ(planned_image_size(0, 0), 0u);
}

TEST(BkImageBuffer, LargeImageDoesNotFitSmallHeap) {
  EXPECT_FALSE(image_fits(4 * 1024 * 1024, 300 * 1024));
  EXPECT_TRUE(image_fits(200 * 1024, 300 * 1024));
  // The reserve is never handed to the image.
  EXPECT_FALSE(image_fits(1, IMAGE_HEAP_RESERVE));
  EXPECT_FALSE(image_fits(1, 0));
  EXPECT_TRUE(image_fits(100, 100, 0));
}

TEST(BkImageBuffer, GrowthCoversNeed) {
  EXPECT_EQ(grow_image_capacity(0, 4096), IMAGE_GROW_MIN);
  EXPECT_EQ(grow_image_capacity(0, 100 * 1024), 100u * 1024);
  EXPECT_EQ(grow_image_capacity(1024 * 1024, 1024 * 1024 + 1), 1536u * 1024);
}

}  // namespace bk_flasher
}  // namespace esphome
