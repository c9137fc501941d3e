// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "device_error.h"

#include <cstdint>
#include <string>

/**
 * @file device_identity.h
 * @brief Printer identity (serial number) discovery from the TLS certificate
 *
 * The printer's broker certificate carries the serial number as subject
 * common name. The serial is needed before the MQTT session can be opened:
 * it is the TLS SNI value and part of both topic names.
 */

namespace turion {

/**
 * @brief Read the device identity from the server certificate
 *
 * Performs a plain TLS client handshake with certificate verification
 * disabled, takes the leaf certificate and returns its first subject
 * common-name value byte for byte. One shot, no retry.
 *
 * @param host Hostname or IP address
 * @param port TLS port (the MQTT broker port)
 * @param timeout_ms Bound for the TCP connect and each socket read/write
 * @param identity Output: the common name on success
 * @return IDENTITY error when connect or handshake fails, when no certificate
 *         is presented or when it has no usable common name
 */
DeviceError probe_device_identity(const std::string& host, int port, uint32_t timeout_ms,
                                  std::string& identity);

/**
 * @brief Extract the identity from a PEM encoded certificate
 */
DeviceError identity_from_pem(const std::string& pem, std::string& identity);

/**
 * @brief Drain the OpenSSL error queue into one string
 */
std::string openssl_error_string();

} // namespace turion
