#include "bk_manifest.h"

#include <cstdlib>
#include <cstring>
#include <strings.h>

#include <ArduinoJson.h>

#include "esphome/core/log.h"

namespace esphome {
namespace bk_flasher {

static const char *const TAG = "bk_flasher.manifest";

bool ends_with_ignore_query(const std::string &s, const char *suffix) {
  size_t end = s.find_first_of("?#");
  if (end == std::string::npos) end = s.size();
  size_t n = std::strlen(suffix);
  if (end < n) return false;
  return strncasecmp(s.c_str() + end - n, suffix, n) == 0;
}

// Numbers may come as JSON numbers or as strings ("4096", "0x11000").
static bool read_u32_(JsonVariantConst v, uint32_t &out) {
  if (v.is<uint32_t>()) { out = v.as<uint32_t>(); return true; }
  if (v.is<const char*>()) {
    const char *s = v.as<const char*>();
    char *endp = nullptr;
    unsigned long val = std::strtoul(s, &endp, 0);
    if (endp == s || *endp != '\0') return false;
    out = static_cast<uint32_t>(val);
    return true;
  }
  return false;
}

static bool read_str_(JsonVariantConst v, std::string &out) {
  if (!v.is<const char*>()) return false;
  out = v.as<const char*>();
  return true;
}

bool parse_manifest(const std::string &body, FirmwareManifest &out) {
  out = FirmwareManifest{};
  JsonDocument doc;
  auto err = deserializeJson(doc, body);
  if(err){ ESP_LOGE(TAG,"JSON parse error: %s", err.c_str()); return false; }
  if (!doc.is<JsonObjectConst>()) { ESP_LOGE(TAG, "Manifest is not a JSON object"); return false; }

  if (!read_str_(doc["fw_url"], out.fw_url) && !read_str_(doc["firmware_url"], out.fw_url))
    read_str_(doc["url"], out.fw_url);
  if (!read_str_(doc["md5"], out.md5) && !read_str_(doc["md5sum"], out.md5))
    read_str_(doc["md5_hex"], out.md5);
  if (!read_u32_(doc["size"], out.size))
    read_u32_(doc["length"], out.size);
  if (!read_str_(doc["version"], out.version) && !read_str_(doc["code_revision"], out.version))
    read_str_(doc["rev"], out.version);
  out.has_address = read_u32_(doc["address"], out.address) || read_u32_(doc["addr"], out.address);

  if (out.fw_url.empty()) { ESP_LOGE(TAG, "Manifest missing firmware URL."); return false; }
  if (!out.md5.empty() && out.md5.size() != 32)
    ESP_LOGW(TAG, "Manifest MD5 '%s' is not 32 hex digits; it will be ignored", out.md5.c_str());
  if (!out.md5.empty()) ESP_LOGI(TAG, "Manifest MD5=%s", out.md5.c_str());
  if (out.size) ESP_LOGI(TAG, "Manifest size=%u", (unsigned)out.size);
  if (!out.version.empty()) ESP_LOGI(TAG, "Manifest version=%s", out.version.c_str());
  if (out.has_address) ESP_LOGI(TAG, "Manifest address=0x%08X", (unsigned)out.address);
  return true;
}

size_t planned_image_size(int64_t content_length, uint32_t manifest_size) {
  if (content_length > 0) return static_cast<size_t>(content_length);
  return manifest_size;
}

size_t grow_image_capacity(size_t capacity, size_t needed) {
  size_t step = capacity / 2 > IMAGE_GROW_MIN ? capacity / 2 : IMAGE_GROW_MIN;
  size_t next = capacity + step;
  return next > needed ? next : needed;
}

bool image_fits(size_t bytes, size_t largest_block, size_t reserve) {
  if (largest_block <= reserve) return false;
  return bytes <= largest_block - reserve;
}

}  // namespace bk_flasher
}  // namespace esphome
