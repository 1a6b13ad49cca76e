/*
 * Copyright 2024 Google LLC
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *      http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */
#ifndef DAP_HPKE_HPKE_H_
#define DAP_HPKE_HPKE_H_

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "dap/protos/messages.pb.h"
#include "openssl/hpke.h"

namespace dap {
namespace hpke {

// Algorithm identifiers from RFC 9180. The only supported suite is
// DHKEM(X25519, HKDF-SHA256) / HKDF-SHA256 / AES-128-GCM.
inline constexpr uint32_t kKemIdX25519HkdfSha256 = 0x0020;
inline constexpr uint32_t kKdfIdHkdfSha256 = 0x0001;
inline constexpr uint32_t kAeadIdAes128Gcm = 0x0001;

// Decrypts ciphertexts addressed to one of the receiver's HPKE configs.
//
// Returns NOT_FOUND if the ciphertext names a config ID the receiver does not
// hold and INVALID_ARGUMENT if decryption fails for any other reason.
class HpkeDecrypter {
 public:
  virtual ~HpkeDecrypter() = default;

  virtual absl::StatusOr<std::string> Decrypt(
      absl::string_view info, absl::string_view aad,
      const HpkeCiphertext& ciphertext) const = 0;
};

// An HPKE config together with its private key.
//
// This class is thread-safe.
class HpkeReceiverConfig {
 public:
  // Generates a fresh X25519 keypair.
  static absl::StatusOr<HpkeReceiverConfig> Generate(uint32_t config_id);
  // Loads a keypair from a raw X25519 private key.
  static absl::StatusOr<HpkeReceiverConfig> FromPrivateKey(
      uint32_t config_id, absl::string_view private_key);

  HpkeReceiverConfig(HpkeReceiverConfig&&) = default;
  HpkeReceiverConfig& operator=(HpkeReceiverConfig&&) = default;

  const HpkeConfig& config() const { return config_; }

  // Raw private key bytes.
  std::string private_key() const;

  // Decrypts a ciphertext addressed to this config. The config ID of the
  // ciphertext is not checked.
  absl::StatusOr<std::string> Decrypt(absl::string_view info,
                                      absl::string_view aad,
                                      const HpkeCiphertext& ciphertext) const;

 private:
  HpkeReceiverConfig(HpkeConfig config, bssl::ScopedEVP_HPKE_KEY key)
      : config_(std::move(config)), key_(std::move(key)) {}

  HpkeConfig config_;
  bssl::ScopedEVP_HPKE_KEY key_;
};

// The set of configs an aggregator advertises. The first one is returned
// from the hpke_config endpoint.
class HpkeReceiverConfigList : public HpkeDecrypter {
 public:
  explicit HpkeReceiverConfigList(std::vector<HpkeReceiverConfig> configs);

  const HpkeConfig& primary() const;
  bool empty() const { return configs_.empty(); }

  absl::StatusOr<std::string> Decrypt(
      absl::string_view info, absl::string_view aad,
      const HpkeCiphertext& ciphertext) const override;

 private:
  std::vector<HpkeReceiverConfig> configs_;
};

// Encrypts plaintext to the given config. Fails with INVALID_ARGUMENT if the
// config names an unsupported algorithm suite.
absl::StatusOr<HpkeCiphertext> HpkeEncrypt(const HpkeConfig& config,
                                           absl::string_view info,
                                           absl::string_view aad,
                                           absl::string_view plaintext);

}  // namespace hpke
}  // namespace dap

#endif  // DAP_HPKE_HPKE_H_
