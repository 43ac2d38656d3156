/* -*- Mode:C++; c-file-style:"gnu"; indent-tabs-mode:nil; -*- */
/*
 * Copyright (c) 2024, The gp-okta Authors.
 *
 * This file is part of gp-okta, a GlobalProtect login helper for Okta SSO.
 *
 * gp-okta is free software: you can redistribute it and/or modify it under the terms
 * of the GNU General Public License as published by the Free Software Foundation, either
 * version 3 of the License, or (at your option) any later version.
 *
 * gp-okta is distributed in the hope that it will be useful, but WITHOUT ANY
 * WARRANTY; without even the implied warranty of MERCHANTABILITY or FITNESS FOR A
 * PARTICULAR PURPOSE.  See the GNU General Public License for more details.
 *
 * You should have received copies of the GNU General Public License along with
 * gp-okta, e.g., in COPYING.md file.  If not, see <http://www.gnu.org/licenses/>.
 *
 * See AUTHORS.md for complete list of gp-okta authors and contributors.
 */

#include "fido2-authenticator.hpp"
#include "error.hpp"
#include "detail/crypto-helpers.hpp"

#include <memory>

#include <fido.h>

namespace gpokta {

NDN_LOG_INIT(gpokta.fido2);

namespace {

const size_t MAX_DEVICES = 16;

struct DeviceDeleter
{
  void
  operator()(fido_dev_t* dev) const
  {
    fido_dev_close(dev);
    fido_dev_free(&dev);
  }
};

struct AssertDeleter
{
  void
  operator()(fido_assert_t* assert) const
  {
    fido_assert_free(&assert);
  }
};

struct DeviceInfoDeleter
{
  void
  operator()(fido_dev_info_t* devlist) const
  {
    fido_dev_info_free(&devlist, MAX_DEVICES);
  }
};

void
checkFido(int r, const std::string& call)
{
  if (r != FIDO_OK) {
    NDN_THROW(Error(call + ": " + fido_strerr(r)));
  }
}

} // namespace

Fido2Authenticator::Fido2Authenticator()
{
  fido_init(0);
}

bool
Fido2Authenticator::isDeviceAvailable()
{
  m_devicePath.clear();
  std::unique_ptr<fido_dev_info_t, DeviceInfoDeleter> devlist(fido_dev_info_new(MAX_DEVICES));
  if (devlist == nullptr) {
    NDN_THROW(Error("fido_dev_info_new failed"));
  }

  size_t nDevices = 0;
  int r = fido_dev_info_manifest(devlist.get(), MAX_DEVICES, &nDevices);
  if (r != FIDO_OK) {
    NDN_LOG_DEBUG("Device enumeration failed: " << fido_strerr(r));
    return false;
  }
  if (nDevices == 0) {
    return false;
  }

  const fido_dev_info_t* info = fido_dev_info_ptr(devlist.get(), 0);
  m_devicePath = fido_dev_info_path(info);
  NDN_LOG_DEBUG("Using " << fido_dev_info_manufacturer_string(info) << " "
                << fido_dev_info_product_string(info) << " at " << m_devicePath);
  return true;
}

std::string
Fido2Authenticator::makeClientDataJson(const AssertionRequest& request)
{
  std::vector<uint8_t> challenge(request.challenge.begin(), request.challenge.end());
  return R"({"type":"webauthn.get","challenge":")" + websafeBase64Encode(challenge) +
         R"(","origin":")" + request.origin + R"(","crossOrigin":false})";
}

std::vector<uint8_t>
Fido2Authenticator::decodeAuthenticatorData(const uint8_t* data, size_t size)
{
  if (size == 0 || (data[0] & 0xe0) != 0x40) {
    NDN_THROW(Error("Authenticator data is not a CBOR byte string"));
  }

  size_t length = data[0] & 0x1f;
  size_t offset = 1;
  if (length == 24 && size >= 2) {
    length = data[1];
    offset = 2;
  }
  else if (length == 25 && size >= 3) {
    length = (static_cast<size_t>(data[1]) << 8) | data[2];
    offset = 3;
  }
  else if (length > 23) {
    NDN_THROW(Error("Unsupported CBOR byte string length encoding"));
  }

  if (offset + length != size) {
    NDN_THROW(Error("Truncated authenticator data"));
  }
  return std::vector<uint8_t>(data + offset, data + size);
}

Assertion
Fido2Authenticator::getAssertion(const AssertionRequest& request, AuthenticatorInteraction& interaction)
{
  if (m_devicePath.empty() && !isDeviceAvailable()) {
    NDN_THROW(DeviceUnavailable("No FIDO2 device attached"));
  }

  std::unique_ptr<fido_dev_t, DeviceDeleter> dev(fido_dev_new());
  if (dev == nullptr) {
    NDN_THROW(Error("fido_dev_new failed"));
  }
  int r = fido_dev_open(dev.get(), m_devicePath.data());
  if (r != FIDO_OK) {
    NDN_THROW(DeviceUnavailable("Cannot open " + m_devicePath + ": " + fido_strerr(r)));
  }

  auto clientData = makeClientDataJson(request);
  auto clientDataHash = sha256(reinterpret_cast<const uint8_t*>(clientData.data()), clientData.size());

  std::unique_ptr<fido_assert_t, AssertDeleter> assert(fido_assert_new());
  if (assert == nullptr) {
    NDN_THROW(Error("fido_assert_new failed"));
  }
  checkFido(fido_assert_set_clientdata_hash(assert.get(), clientDataHash.data(), clientDataHash.size()),
            "fido_assert_set_clientdata_hash");
  checkFido(fido_assert_set_rp(assert.get(), request.rpId.data()), "fido_assert_set_rp");
  for (const auto& credential : request.allowCredentials) {
    checkFido(fido_assert_allow_cred(assert.get(), credential.data(), credential.size()),
              "fido_assert_allow_cred");
  }
  checkFido(fido_assert_set_up(assert.get(), FIDO_OPT_TRUE), "fido_assert_set_up");
  if (fido_dev_has_uv(dev.get()) && interaction.requestUserVerification(0, request.rpId)) {
    checkFido(fido_assert_set_uv(assert.get(), FIDO_OPT_TRUE), "fido_assert_set_uv");
  }

  interaction.promptPresence();
  r = fido_dev_get_assert(dev.get(), assert.get(), nullptr);
  if (r == FIDO_ERR_PIN_REQUIRED) {
    auto pin = interaction.requestPin(0, request.rpId);
    if (!pin) {
      NDN_THROW(UserCancelled("No PIN entered"));
    }
    interaction.promptPresence();
    r = fido_dev_get_assert(dev.get(), assert.get(), pin->data());
  }
  checkFido(r, "fido_dev_get_assert");
  if (fido_assert_count(assert.get()) == 0) {
    NDN_THROW(Error("Hardware key returned no assertion"));
  }

  auto authData = decodeAuthenticatorData(fido_assert_authdata_ptr(assert.get(), 0),
                                          fido_assert_authdata_len(assert.get(), 0));
  std::vector<uint8_t> signature(fido_assert_sig_ptr(assert.get(), 0),
                                 fido_assert_sig_ptr(assert.get(), 0) + fido_assert_sig_len(assert.get(), 0));
  NDN_LOG_DEBUG("Got assertion with " << signature.size() << "-byte signature");

  return {websafeBase64Encode(authData),
          websafeBase64Encode(std::vector<uint8_t>(clientData.begin(), clientData.end())),
          websafeBase64Encode(signature)};
}

} // namespace gpokta
