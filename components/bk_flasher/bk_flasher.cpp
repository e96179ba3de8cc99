// ====== BK Flasher (external component) ======
#include "bk_flasher.h"
#include <vector>
#include <string>
#include <cstring>
#include <algorithm>
#include <cstdio>
#include <strings.h>

#include "esphome/core/component.h"
#include "esphome/core/log.h"
#include "esphome/core/application.h"
#include "esphome/components/uart/uart.h"
#include "esphome/components/switch/switch.h"
#include "esphome/components/text_sensor/text_sensor.h"
#include "esphome/components/md5/md5.h"

#ifdef USE_ESP_IDF
  #include "esp_http_client.h"
  #include "esp_crt_bundle.h"
  #include "esp_heap_caps.h"
#else
  #error "BK flasher requires ESP-IDF framework."
#endif

namespace esphome { namespace bk_flasher {

static const char *const TAG = "bk_flasher";

// Longest monitor line before it is logged without a newline.
static constexpr size_t MONITOR_LINE_MAX = 256;
// Extra probes a link check gets on top of connect_retries.
static constexpr uint16_t LINK_CHECK_EXTRA_RETRIES = 10;

// Manifests are small JSON documents; anything bigger is not one.
static constexpr size_t MANIFEST_MAX = 8 * 1024;
static constexpr int HTTP_MAX_REDIRECTS = 5;

static bool is_redirect_status(int status){
  return status == 301 || status == 302 || status == 303 || status == 307 || status == 308;
}

void BkFlasher::setup(){
  // Remember the rate the UART came up with; flashing may leave it at the fast rate.
  if (boot_baud_ == 0 && uart_ != nullptr) boot_baud_ = uart_->get_baud_rate();
  configure_engine_();
}

void BkFlasher::dump_config(){
  ESP_LOGCONFIG(TAG, "BK Flasher:");
  ESP_LOGCONFIG(TAG, "  Update URL: %s", manifest_url_.empty() ? "<none>" : manifest_url_.c_str());
  ESP_LOGCONFIG(TAG, "  Start address: 0x%08X", (unsigned)start_address_);
  ESP_LOGCONFIG(TAG, "  Boot baud: %u, fast baud: %u", (unsigned)boot_baud_, (unsigned)fast_baud_);
  ESP_LOGCONFIG(TAG, "  Connect retries: %u", (unsigned)connect_retries_);
  ESP_LOGCONFIG(TAG, "  Reset switch: %s", rst_sw_ ? "yes" : "no");
  ESP_LOGCONFIG(TAG, "  Monitor: %s", monitor_ ? "on" : "off");
}

void BkFlasher::configure_engine_(){
  link_.attach(uart_);
  link_.set_verbose(verbose_);
  proto_.set_timeouts(timeouts_);
  programmer_.set_connect_retries(connect_retries_);
  programmer_.set_verbose(verbose_);
  programmer_.set_show_progress(show_progress_);
  programmer_.set_progress_step(progress_step_);
}

void BkFlasher::restore_baud_(){
  if (boot_baud_ == 0) return;
  if (!link_.set_baud(boot_baud_)) return;
  link_.delay_ms(100);
}

void BkFlasher::reset_target_(){
  if (!rst_sw_) {
    ESP_LOGI(TAG, "No reset switch configured; power-cycle the BK chip now");
    return;
  }
  ESP_LOGD(TAG, "Resetting target into boot ROM…");
  rst_sw_->turn_on(); link_.delay_ms(15); rst_sw_->turn_off();
}

bool BkFlasher::http_open_(const std::string &url, esp_http_client_handle_t &client, int timeout_ms){
  esp_http_client_config_t cfg = {};
  cfg.url = url.c_str();
  cfg.timeout_ms = timeout_ms;
  cfg.crt_bundle_attach = esp_crt_bundle_attach;
  // Redirects are resolved below so every hop goes through the same status checks.
  cfg.disable_auto_redirect = true;
  cfg.buffer_size = 4096;
  cfg.buffer_size_tx = 1024;
  client = esp_http_client_init(&cfg);
  if (!client) { ESP_LOGE(TAG, "HTTP client init failed for %s", url.c_str()); return false; }

  int hops = 0;
  while (true) {
    esp_err_t err = esp_http_client_open(client, 0);
    if (err != ESP_OK) { ESP_LOGE(TAG, "HTTP connect failed: %s", esp_err_to_name(err)); break; }
    int64_t hdr_len = esp_http_client_fetch_headers(client);
    int status = esp_http_client_get_status_code(client);
    ESP_LOGD(TAG, "HTTP %d, length %lld", status, (long long)hdr_len);
    if (status == 200) return true;
    esp_http_client_close(client);
    if (!is_redirect_status(status)) { ESP_LOGE(TAG, "HTTP status %d for %s", status, url.c_str()); break; }
    if (++hops > HTTP_MAX_REDIRECTS) { ESP_LOGE(TAG, "More than %d redirects for %s", HTTP_MAX_REDIRECTS, url.c_str()); break; }
    if (esp_http_client_set_redirection(client) != ESP_OK) { ESP_LOGE(TAG, "HTTP %d without a usable Location", status); break; }
    ESP_LOGD(TAG, "Following redirect %d/%d", hops, HTTP_MAX_REDIRECTS);
  }
  esp_http_client_cleanup(client);
  client = nullptr;
  return false;
}

void BkFlasher::http_close_(esp_http_client_handle_t client){
  esp_http_client_close(client);
  esp_http_client_cleanup(client);
}

bool BkFlasher::fetch_manifest_(const std::string &url, FirmwareManifest &manifest){
  ESP_LOGI(TAG, "Fetching manifest %s", url.c_str());
  esp_http_client_handle_t client;
  if (!http_open_(url, client, 15000)) return false;
  std::string body;
  char buf[512];
  bool ok = true;
  while (true) {
    int r = esp_http_client_read(client, buf, sizeof(buf));
    if (r < 0) { ESP_LOGE(TAG, "Manifest read error after %u bytes", (unsigned)body.size()); ok = false; break; }
    if (r == 0) break;
    if (body.size() + r > MANIFEST_MAX) { ESP_LOGE(TAG, "Manifest exceeds %u bytes", (unsigned)MANIFEST_MAX); ok = false; break; }
    body.append(buf, r);
  }
  http_close_(client);
  return ok && parse_manifest(body, manifest);
}

bool BkFlasher::reserve_image_(std::vector<uint8_t> &image, size_t bytes){
  size_t largest = heap_caps_get_largest_free_block(MALLOC_CAP_8BIT);
  if (!image_fits(bytes, largest)) {
    ESP_LOGE(TAG, "Image too large: %u bytes needed, largest free block %u", (unsigned)bytes, (unsigned)largest);
    publish_status_("image too large");
    return false;
  }
  image.reserve(bytes);
  return true;
}

bool BkFlasher::download_image_(const std::string &url, std::vector<uint8_t> &image){
  esp_http_client_handle_t client;
  if (!http_open_(url, client)) { publish_status_("download error"); return false; }
  int64_t len64 = esp_http_client_get_content_length(client);
  if (expected_size_ && len64 > 0 && (uint64_t)len64 != expected_size_)
    ESP_LOGW(TAG, "Content-Length %lld differs from manifest size %u", (long long)len64, (unsigned)expected_size_);

  image.clear();
  size_t planned = planned_image_size(len64, expected_size_);
  if (planned && !reserve_image_(image, planned)) { http_close_(client); return false; }

  esphome::md5::MD5Digest md5; md5.init();
  std::vector<uint8_t> net_buf(4096);
  bool ok = true;
  while (true){
    int r = esp_http_client_read(client, (char*)net_buf.data(), net_buf.size());
    if (r < 0) { ESP_LOGE(TAG, "HTTP read error after %u bytes", (unsigned)image.size()); publish_status_("download error"); ok = false; break; }
    if (r == 0) break;
    size_t needed = image.size() + r;
    if (needed > image.capacity() && !reserve_image_(image, grow_image_capacity(image.capacity(), needed))) { ok = false; break; }
    image.insert(image.end(), net_buf.begin(), net_buf.begin() + r);
    md5.add(net_buf.data(), r);
    App.feed_wdt();
  }
  http_close_(client);
  if (!ok) return false;

  if (len64 > 0 && image.size() != (uint64_t)len64){
    ESP_LOGE(TAG, "Short download: %u of %lld bytes", (unsigned)image.size(), (long long)len64);
    publish_status_("download error");
    return false;
  }
  if (expected_size_ && image.size() != expected_size_){
    ESP_LOGE(TAG, "Image size %u does not match manifest size %u", (unsigned)image.size(), (unsigned)expected_size_);
    publish_status_("size mismatch");
    return false;
  }
  md5.calculate(); char md5hex[33]; md5.get_hex(md5hex); md5hex[32]=0;
  if (expected_md5_.size()==32 && strcasecmp(expected_md5_.c_str(), md5hex)!=0){
    ESP_LOGE(TAG, "MD5 mismatch: expected %s, got %s", expected_md5_.c_str(), md5hex);
    publish_status_("md5 mismatch");
    return false;
  }
  ESP_LOGI(TAG, "Downloaded image: bytes=%u md5=%s", (unsigned)image.size(), md5hex);
  return true;
}

void BkFlasher::finish_run_(){
  link_.close();
  set_busy_(false);
}

void BkFlasher::run_update_(){
  if(!uart_){ ESP_LOGE(TAG, "Not configured (uart)"); return; }
  if (manifest_url_.empty()) { ESP_LOGE(TAG, "No update URL configured"); return; }
  set_busy_(true);
  configure_engine_();
  publish_status_("downloading");

  std::string fw_url;
  uint32_t address = start_address_;
  expected_md5_.clear(); expected_size_ = 0;
  if (is_direct_image_url(manifest_url_)) {
    fw_url = manifest_url_;
    ESP_LOGI(TAG, "Using direct firmware URL (no manifest): %s", fw_url.c_str());
  } else {
    FirmwareManifest manifest;
    if (!fetch_manifest_(manifest_url_, manifest)) {
      ESP_LOGE(TAG, "Manifest fetch/parse failed"); publish_status_("manifest error"); finish_run_(); return;
    }
    fw_url = manifest.fw_url;
    expected_md5_ = manifest.md5;
    expected_size_ = manifest.size;
    if (manifest.has_address) address = manifest.address;
    ESP_LOGI(TAG, "Firmware: %s", fw_url.c_str());
  }

  std::vector<uint8_t> image;
  if (!download_image_(fw_url, image)) { finish_run_(); return; }

  publish_status_("connecting");
  restore_baud_();
  reset_target_();
  publish_status_("flashing");
  ProgrammingResult res = programmer_.flash(image, address, fast_baud_);
  // Free the image before anything else allocates.
  std::vector<uint8_t>().swap(image);
  restore_baud_();

  if (flash_id_text_ && res.flash_id) {
    char buf[16]; snprintf(buf, sizeof(buf), "0x%08X", (unsigned)res.flash_id);
    flash_id_text_->publish_state(buf);
  }
  if (crc_text_ && res.completed()) {
    char buf[48];
    if (res.has_device_crc) snprintf(buf, sizeof(buf), "0x%08X/0x%08X", (unsigned)res.local_crc, (unsigned)res.device_crc);
    else snprintf(buf, sizeof(buf), "0x%08X/none", (unsigned)res.local_crc);
    crc_text_->publish_state(buf);
  }
  if (res.completed()) {
    publish_status_(flash_outcome_to_string(res.outcome));
  } else {
    char buf[48];
    snprintf(buf, sizeof(buf), "failed: %s @0x%08X", flash_step_to_string(res.failed_step), (unsigned)res.failed_address);
    publish_status_(buf);
  }
  ESP_LOGI(TAG, "run_update finished: %s, %u written, %u skipped, %u ms", flash_outcome_to_string(res.outcome),
           (unsigned)res.sectors_written, (unsigned)res.sectors_skipped, (unsigned)res.elapsed_ms);
  finish_run_();
}

void BkFlasher::run_link_check_(){
  if(!uart_){ ESP_LOGE(TAG, "Not configured (uart)"); return; }
  set_busy_(true);
  configure_engine_();
  publish_status_("connecting");
  restore_baud_();
  reset_target_();
  // Longer budget than a flash run; the user may be power-cycling by hand.
  if (!programmer_.connect(extend_retries(connect_retries_, LINK_CHECK_EXTRA_RETRIES))) {
    publish_status_("no response");
    finish_run_();
    return;
  }
  if (!proto_.stay_rom()) ESP_LOGW(TAG, "No answer to stay-in-ROM");
  uint32_t id = proto_.read_flash_id();
  if (id) {
    ESP_LOGI(TAG, "Link OK, flash ID 0x%08X", (unsigned)id);
    if (flash_id_text_) { char buf[16]; snprintf(buf, sizeof(buf), "0x%08X", (unsigned)id); flash_id_text_->publish_state(buf); }
  } else {
    ESP_LOGW(TAG, "Link OK, flash ID unknown");
  }
  publish_status_("connected");
  finish_run_();
}

void BkFlasher::pump_monitor_(){
  uint8_t b;
  while (uart_->available() && uart_->read_byte(&b)) {
    if (b == '\n' || monitor_buf_.size() >= MONITOR_LINE_MAX) {
      if (b != '\n') monitor_buf_.push_back(b);
      std::string line = BkLink::render_monitor_line(monitor_buf_.data(), monitor_buf_.size());
      if (!line.empty()) ESP_LOGI(TAG, "[bk] %s", line.c_str());
      monitor_buf_.clear();
      continue;
    }
    monitor_buf_.push_back(b);
  }
}

void BkFlasher::loop(){
  if (want_link_check_){ want_link_check_ = false; run_link_check_(); return; }
  if (want_update_){ want_update_ = false; run_update_(); return; }
  if (monitor_ && !busy_ && uart_) pump_monitor_();
}

} } // namespace
