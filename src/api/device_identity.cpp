// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "device_identity.h"

#include <spdlog/spdlog.h>

#include <memory>

#include "hv/hsocket.h"

#include <openssl/err.h>
#include <openssl/pem.h>
#include <openssl/ssl.h>
#include <openssl/x509.h>

namespace turion {

namespace {

struct SslCtxDeleter {
    void operator()(SSL_CTX* ctx) const {
        SSL_CTX_free(ctx);
    }
};

struct SslDeleter {
    void operator()(SSL* ssl) const {
        SSL_free(ssl);
    }
};

struct X509Deleter {
    void operator()(X509* cert) const {
        X509_free(cert);
    }
};

struct BioDeleter {
    void operator()(BIO* bio) const {
        BIO_free(bio);
    }
};

// Closes the probe socket on every exit path
class SocketGuard {
  public:
    explicit SocketGuard(int fd) : fd_(fd) {}
    ~SocketGuard() {
        if (fd_ >= 0) {
            closesocket(fd_);
        }
    }
    SocketGuard(const SocketGuard&) = delete;
    SocketGuard& operator=(const SocketGuard&) = delete;

    int get() const {
        return fd_;
    }

  private:
    int fd_;
};

DeviceError identity_from_certificate(X509* cert, const std::string& source,
                                      std::string& identity) {
    X509_NAME* subject = X509_get_subject_name(cert);
    if (subject == nullptr) {
        return DeviceError::identity_failed("certificate has no subject", source);
    }

    int index = X509_NAME_get_index_by_NID(subject, NID_commonName, -1);
    if (index < 0) {
        return DeviceError::identity_failed("certificate subject has no common name", source);
    }

    X509_NAME_ENTRY* entry = X509_NAME_get_entry(subject, index);
    ASN1_STRING* data = entry ? X509_NAME_ENTRY_get_data(entry) : nullptr;
    if (data == nullptr || ASN1_STRING_length(data) <= 0) {
        return DeviceError::identity_failed("certificate common name is empty", source);
    }

    identity.assign(reinterpret_cast<const char*>(ASN1_STRING_get0_data(data)),
                    static_cast<size_t>(ASN1_STRING_length(data)));
    return DeviceError::success();
}

} // namespace

std::string openssl_error_string() {
    std::string result;
    unsigned long err;
    while ((err = ERR_get_error()) != 0) {
        char buf[256];
        ERR_error_string_n(err, buf, sizeof(buf));
        if (!result.empty()) {
            result += "; ";
        }
        result += buf;
    }
    return result.empty() ? "unknown TLS error" : result;
}

DeviceError probe_device_identity(const std::string& host, int port, uint32_t timeout_ms,
                                  std::string& identity) {
    const std::string endpoint = host + ":" + std::to_string(port);
    spdlog::debug("[Device Identity] Probing certificate of {}", endpoint);

    SocketGuard sock(ConnectTimeout(host.c_str(), port, static_cast<int>(timeout_ms)));
    if (sock.get() < 0) {
        spdlog::error("[Device Identity] TCP connect to {} failed ({})", endpoint, sock.get());
        return DeviceError::identity_failed("TCP connect failed", endpoint, sock.get());
    }
    so_rcvtimeo(sock.get(), static_cast<int>(timeout_ms));
    so_sndtimeo(sock.get(), static_cast<int>(timeout_ms));

    std::unique_ptr<SSL_CTX, SslCtxDeleter> ctx(SSL_CTX_new(TLS_client_method()));
    if (!ctx) {
        return DeviceError::identity_failed(openssl_error_string(), endpoint);
    }
    // The printer presents a certificate from a private CA
    SSL_CTX_set_verify(ctx.get(), SSL_VERIFY_NONE, nullptr);

    std::unique_ptr<SSL, SslDeleter> ssl(SSL_new(ctx.get()));
    if (!ssl || SSL_set_fd(ssl.get(), sock.get()) != 1) {
        return DeviceError::identity_failed(openssl_error_string(), endpoint);
    }

    int ret = SSL_connect(ssl.get());
    if (ret != 1) {
        int ssl_err = SSL_get_error(ssl.get(), ret);
        std::string what = "TLS handshake failed: " + openssl_error_string();
        spdlog::error("[Device Identity] {} ({})", what, endpoint);
        return DeviceError::identity_failed(what, endpoint, ssl_err);
    }

    std::unique_ptr<X509, X509Deleter> cert(SSL_get_peer_certificate(ssl.get()));
    if (!cert) {
        SSL_shutdown(ssl.get());
        return DeviceError::identity_failed("server presented no certificate", endpoint);
    }

    DeviceError err = identity_from_certificate(cert.get(), endpoint, identity);
    SSL_shutdown(ssl.get());

    if (err) {
        spdlog::info("[Device Identity] {} identifies as '{}'", endpoint, identity);
    } else {
        spdlog::error("[Device Identity] {}", err.message);
    }
    return err;
}

DeviceError identity_from_pem(const std::string& pem, std::string& identity) {
    std::unique_ptr<BIO, BioDeleter> bio(
        BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())));
    if (!bio) {
        return DeviceError::identity_failed(openssl_error_string(), "PEM");
    }

    std::unique_ptr<X509, X509Deleter> cert(
        PEM_read_bio_X509(bio.get(), nullptr, nullptr, nullptr));
    if (!cert) {
        return DeviceError::identity_failed("not a PEM certificate: " + openssl_error_string(),
                                            "PEM");
    }
    return identity_from_certificate(cert.get(), "PEM", identity);
}

} // namespace turion
