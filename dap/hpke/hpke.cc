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

#include "dap/hpke/hpke.h"

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "dap/base/monitoring.h"
#include "openssl/base.h"
#include "openssl/err.h"
#include "openssl/hpke.h"
#include "openssl/mem.h"

namespace dap {
namespace hpke {

namespace {

absl::Status CheckSuite(const HpkeConfig& config) {
  if (config.kem_id() != kKemIdX25519HkdfSha256 ||
      config.kdf_id() != kKdfIdHkdfSha256 ||
      config.aead_id() != kAeadIdAes128Gcm) {
    return DAP_STATUS(INVALID_ARGUMENT)
           << "unsupported HPKE suite (kem " << config.kem_id() << ", kdf "
           << config.kdf_id() << ", aead " << config.aead_id() << ")";
  }
  return absl::OkStatus();
}

absl::StatusOr<HpkeConfig> MakeConfig(uint32_t config_id,
                                      const EVP_HPKE_KEY* key) {
  std::string public_key(EVP_HPKE_MAX_PUBLIC_KEY_LENGTH, '\0');
  size_t public_key_len = 0;
  if (EVP_HPKE_KEY_public_key(
          key, reinterpret_cast<uint8_t*>(public_key.data()), &public_key_len,
          public_key.size()) != 1) {
    return DAP_STATUS(INTERNAL) << "Failed to get HPKE public key: "
                                << ERR_reason_error_string(ERR_get_error());
  }
  public_key.resize(public_key_len);

  HpkeConfig config;
  config.set_id(config_id);
  config.set_kem_id(kKemIdX25519HkdfSha256);
  config.set_kdf_id(kKdfIdHkdfSha256);
  config.set_aead_id(kAeadIdAes128Gcm);
  config.set_public_key(std::move(public_key));
  return config;
}

}  // namespace

absl::StatusOr<HpkeReceiverConfig> HpkeReceiverConfig::Generate(
    uint32_t config_id) {
  bssl::ScopedEVP_HPKE_KEY key;
  if (EVP_HPKE_KEY_generate(key.get(), EVP_hpke_x25519_hkdf_sha256()) != 1) {
    return DAP_STATUS(INTERNAL)
           << "Failed to generate HPKE public/private keypair: "
           << ERR_reason_error_string(ERR_get_error());
  }
  DAP_ASSIGN_OR_RETURN(HpkeConfig config, MakeConfig(config_id, key.get()));
  return HpkeReceiverConfig(std::move(config), std::move(key));
}

absl::StatusOr<HpkeReceiverConfig> HpkeReceiverConfig::FromPrivateKey(
    uint32_t config_id, absl::string_view private_key) {
  bssl::ScopedEVP_HPKE_KEY key;
  if (EVP_HPKE_KEY_init(key.get(), EVP_hpke_x25519_hkdf_sha256(),
                        reinterpret_cast<const uint8_t*>(private_key.data()),
                        private_key.size()) != 1) {
    return DAP_STATUS(INVALID_ARGUMENT)
           << "Invalid HPKE private key: "
           << ERR_reason_error_string(ERR_get_error());
  }
  DAP_ASSIGN_OR_RETURN(HpkeConfig config, MakeConfig(config_id, key.get()));
  return HpkeReceiverConfig(std::move(config), std::move(key));
}

std::string HpkeReceiverConfig::private_key() const {
  std::string private_key(EVP_HPKE_MAX_PRIVATE_KEY_LENGTH, '\0');
  size_t private_key_len = 0;
  DAP_CHECK(EVP_HPKE_KEY_private_key(
                key_.get(), reinterpret_cast<uint8_t*>(private_key.data()),
                &private_key_len, private_key.size()) == 1);
  private_key.resize(private_key_len);
  return private_key;
}

absl::StatusOr<std::string> HpkeReceiverConfig::Decrypt(
    absl::string_view info, absl::string_view aad,
    const HpkeCiphertext& ciphertext) const {
  bssl::ScopedEVP_HPKE_CTX hpke_ctx;
  if (EVP_HPKE_CTX_setup_recipient(
          hpke_ctx.get(), key_.get(), EVP_hpke_hkdf_sha256(),
          EVP_hpke_aes_128_gcm(),
          reinterpret_cast<const uint8_t*>(ciphertext.enc().data()),
          ciphertext.enc().size(),
          reinterpret_cast<const uint8_t*>(info.data()), info.size()) != 1) {
    return DAP_STATUS(INVALID_ARGUMENT)
           << "Failed to set up HPKE context: "
           << ERR_reason_error_string(ERR_get_error());
  }

  std::string plaintext(ciphertext.payload().size(), '\0');
  size_t plaintext_len = 0;
  if (EVP_HPKE_CTX_open(
          hpke_ctx.get(), reinterpret_cast<uint8_t*>(plaintext.data()),
          &plaintext_len, plaintext.size(),
          reinterpret_cast<const uint8_t*>(ciphertext.payload().data()),
          ciphertext.payload().size(),
          reinterpret_cast<const uint8_t*>(aad.data()), aad.size()) != 1) {
    // Clear the buffer in case partial data was written.
    OPENSSL_cleanse(plaintext.data(), plaintext.size());
    return DAP_STATUS(INVALID_ARGUMENT)
           << "Failed to open HPKE ciphertext: "
           << ERR_reason_error_string(ERR_get_error());
  }
  plaintext.resize(plaintext_len);
  return plaintext;
}

HpkeReceiverConfigList::HpkeReceiverConfigList(
    std::vector<HpkeReceiverConfig> configs)
    : configs_(std::move(configs)) {}

const HpkeConfig& HpkeReceiverConfigList::primary() const {
  DAP_CHECK(!configs_.empty()) << "no HPKE receiver config";
  return configs_.front().config();
}

absl::StatusOr<std::string> HpkeReceiverConfigList::Decrypt(
    absl::string_view info, absl::string_view aad,
    const HpkeCiphertext& ciphertext) const {
  for (const HpkeReceiverConfig& receiver : configs_) {
    if (receiver.config().id() == ciphertext.config_id()) {
      return receiver.Decrypt(info, aad, ciphertext);
    }
  }
  return DAP_STATUS(NOT_FOUND)
         << "unknown HPKE config id " << ciphertext.config_id();
}

absl::StatusOr<HpkeCiphertext> HpkeEncrypt(const HpkeConfig& config,
                                           absl::string_view info,
                                           absl::string_view aad,
                                           absl::string_view plaintext) {
  DAP_RETURN_IF_ERROR(CheckSuite(config));

  bssl::ScopedEVP_HPKE_CTX hpke_ctx;
  std::string enc(EVP_HPKE_MAX_ENC_LENGTH, '\0');
  size_t enc_len = 0;
  if (EVP_HPKE_CTX_setup_sender(
          hpke_ctx.get(), reinterpret_cast<uint8_t*>(enc.data()), &enc_len,
          enc.size(), EVP_hpke_x25519_hkdf_sha256(), EVP_hpke_hkdf_sha256(),
          EVP_hpke_aes_128_gcm(),
          reinterpret_cast<const uint8_t*>(config.public_key().data()),
          config.public_key().size(),
          reinterpret_cast<const uint8_t*>(info.data()), info.size()) != 1) {
    return DAP_STATUS(INVALID_ARGUMENT)
           << "Failed to set up HPKE: "
           << ERR_reason_error_string(ERR_get_error());
  }
  enc.resize(enc_len);

  std::string payload(
      plaintext.size() + EVP_HPKE_CTX_max_overhead(hpke_ctx.get()), '\0');
  size_t payload_len = 0;
  if (EVP_HPKE_CTX_seal(
          hpke_ctx.get(), reinterpret_cast<uint8_t*>(payload.data()),
          &payload_len, payload.size(),
          reinterpret_cast<const uint8_t*>(plaintext.data()), plaintext.size(),
          reinterpret_cast<const uint8_t*>(aad.data()), aad.size()) != 1) {
    return DAP_STATUS(INTERNAL) << "Failed to seal HPKE payload: "
                                << ERR_reason_error_string(ERR_get_error());
  }
  payload.resize(payload_len);

  HpkeCiphertext ciphertext;
  ciphertext.set_config_id(config.id());
  ciphertext.set_enc(std::move(enc));
  ciphertext.set_payload(std::move(payload));
  return ciphertext;
}

}  // namespace hpke
}  // namespace dap
