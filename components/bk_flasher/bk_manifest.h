// bk_manifest.h - JSON update manifest for BK firmware images
#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace esphome {
namespace bk_flasher {

struct FirmwareManifest {
  std::string fw_url;
  std::string md5;
  uint32_t size{0};
  std::string version;
  uint32_t address{0};
  bool has_address{false};
};

bool ends_with_ignore_query(const std::string &s, const char *suffix);
// A URL pointing straight at a .bin is flashed without a manifest.
inline bool is_direct_image_url(const std::string &url){ return ends_with_ignore_query(url, ".bin"); }

bool parse_manifest(const std::string &body, FirmwareManifest &out);

// Heap left untouched by the image buffer so TLS and the HTTP client keep working.
constexpr size_t IMAGE_HEAP_RESERVE = 32 * 1024;
constexpr size_t IMAGE_GROW_MIN = 64 * 1024;

// Bytes to allocate before the body arrives: the server's length, else the manifest's, else 0.
size_t planned_image_size(int64_t content_length, uint32_t manifest_size);
// Next buffer capacity when a download without a known length outgrows `capacity`.
size_t grow_image_capacity(size_t capacity, size_t needed);
// True when `bytes` can come out of a heap whose largest free block is `largest_block`.
bool image_fits(size_t bytes, size_t largest_block, size_t reserve = IMAGE_HEAP_RESERVE);

}  // namespace bk_flasher
}  // namespace esphome
