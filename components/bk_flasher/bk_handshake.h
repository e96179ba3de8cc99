// bk_handshake.h - link-check probing that tolerates the ROM's power-on startup frame
#pragma once

#include <cstdint>

#include "bk_protocol.h"

namespace esphome {
namespace bk_flasher {

enum class HandshakeState : uint8_t {
  IDLE = 0,
  PROBING,
  STARTUP_SEEN,
  CONNECTED,
  FAILED,
};

const char *handshake_state_to_string(HandshakeState state);

// retries + extra, saturating at UINT16_MAX.
uint16_t extend_retries(uint16_t retries, uint16_t extra);

class BkHandshake {
 public:
  explicit BkHandshake(BkProtocol &proto) : proto_(proto) {}

  void set_verbose(bool v){ verbose_ = v; }

  // Probes until a response is confirmed or the attempt budget runs out.
  bool connect(uint16_t retries);

  HandshakeState get_state() const { return state_; }
  uint16_t get_attempts() const { return attempts_; }

 private:
  bool probe_once_();

  BkProtocol &proto_;
  HandshakeState state_{HandshakeState::IDLE};
  uint16_t attempts_{0};
  bool verbose_{false};
};

}  // namespace bk_flasher
}  // namespace esphome
