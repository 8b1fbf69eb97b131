#pragma once

#include <cstdint>
#include <cstddef>
#include <functional>

namespace esphome {
namespace g2_glasses_ble {

// One physical glasses unit. Each side is connected and authenticated on its own.
enum class Endpoint : uint8_t {
  LEFT = 0,
  RIGHT = 1,
};

static constexpr size_t ENDPOINT_COUNT = 2;

enum class Characteristic : uint8_t {
  CONTROL_WRITE = 0,   // ...5401: auth, AI, teleprompter, heartbeat
  CONTROL_NOTIFY = 1,  // ...5402
  FILE_WRITE = 2,      // ...7401: notification file transfer
  FILE_NOTIFY = 3,     // ...7402
};

// BLE UUIDs
static const char *const CHARACTERISTIC_UUID_CONTROL_WRITE = "00002760-08c2-11e1-9073-0e8ac72e5401";
static const char *const CHARACTERISTIC_UUID_CONTROL_NOTIFY = "00002760-08c2-11e1-9073-0e8ac72e5402";
static const char *const CHARACTERISTIC_UUID_FILE_WRITE = "00002760-08c2-11e1-9073-0e8ac72e7401";
static const char *const CHARACTERISTIC_UUID_FILE_NOTIFY = "00002760-08c2-11e1-9073-0e8ac72e7402";

inline const char *characteristic_uuid(Characteristic characteristic) {
  switch (characteristic) {
    case Characteristic::CONTROL_WRITE:
      return CHARACTERISTIC_UUID_CONTROL_WRITE;
    case Characteristic::CONTROL_NOTIFY:
      return CHARACTERISTIC_UUID_CONTROL_NOTIFY;
    case Characteristic::FILE_WRITE:
      return CHARACTERISTIC_UUID_FILE_WRITE;
    case Characteristic::FILE_NOTIFY:
      return CHARACTERISTIC_UUID_FILE_NOTIFY;
  }
  return "";
}

inline const char *endpoint_name(Endpoint endpoint) { return endpoint == Endpoint::LEFT ? "left" : "right"; }

inline size_t endpoint_index(Endpoint endpoint) { return static_cast<size_t>(endpoint); }

/**
 * Byte sink towards the glasses. Scanning, connecting and characteristic
 * discovery live behind this interface.
 */
class Transport {
 public:
  using NotifyCallback = std::function<void(const uint8_t *data, size_t len)>;

  virtual ~Transport() = default;

  /**
   * Write one frame to a characteristic of an endpoint
   * @return false if the write was rejected
   */
  virtual bool write(Endpoint endpoint, Characteristic characteristic, const uint8_t *data, size_t len) = 0;

  // Register for notifications on a characteristic of an endpoint
  virtual void subscribe(Endpoint endpoint, Characteristic characteristic, NotifyCallback callback) = 0;
};

}  // namespace g2_glasses_ble
}  // namespace esphome
