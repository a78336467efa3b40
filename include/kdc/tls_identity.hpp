/**
 * @file tls_identity.hpp
 * @brief Local self-signed TLS identity (key + certificate) and SSL context setup.
 *
 * @details
 * PURPOSE
 * -------
 * Every device proves who it is with a self-signed certificate whose subject CN
 * is its device id. There is no CA: trust comes from pinning the SHA-256
 * fingerprint of the peer certificate in the trust store after pairing.
 *
 * FILES
 * -----
 * `<config_dir>/certificate.pem` and `<config_dir>/privateKey.pem` (0600). They
 * are created on first start and reused afterwards; regenerating them would
 * break every existing pairing.
 *
 * CONTEXTS
 * --------
 * `make_context()` builds an SSL_CTX that presents our certificate, requires a
 * peer certificate, accepts it at TLS level (self-signed), and leaves the real
 * decision to `PairingManager::verify_handshake()` on the fingerprint.
 */
#ifndef KDC_TLS_IDENTITY_HPP
#define KDC_TLS_IDENTITY_HPP

#include <memory>
#include <string>

#include <openssl/evp.h>
#include <openssl/ssl.h>
#include <openssl/x509.h>

#include "kdc/status.hpp"

namespace kdc {

struct SslCtxDeleter   { void operator()(SSL_CTX* p) const { SSL_CTX_free(p); } };
struct SslDeleter      { void operator()(SSL* p) const { SSL_free(p); } };
struct X509Deleter     { void operator()(X509* p) const { X509_free(p); } };
struct EvpPkeyDeleter  { void operator()(EVP_PKEY* p) const { EVP_PKEY_free(p); } };

using SslCtxPtr  = std::unique_ptr<SSL_CTX, SslCtxDeleter>;
using SslPtr     = std::unique_ptr<SSL, SslDeleter>;
using X509Ptr    = std::unique_ptr<X509, X509Deleter>;
using EvpPkeyPtr = std::unique_ptr<EVP_PKEY, EvpPkeyDeleter>;

/// "AB:CD:..." SHA-256 over the DER encoding. Empty string on failure.
std::string certificate_fingerprint(X509* cert);

/// Subject CN (UTF-8). KDE peers put their device id there.
std::string certificate_common_name(X509* cert);

class TlsIdentity {
public:
  TlsIdentity() = default;
  TlsIdentity(TlsIdentity&&) = default;
  TlsIdentity& operator=(TlsIdentity&&) = default;

  /**
   * @brief Load the identity from @p dir, generating it if absent.
   * @param dir        config directory (created if missing)
   * @param device_id  becomes the certificate CN on generation
   */
  static Status load_or_create(const std::string& dir, const std::string& device_id,
                               TlsIdentity& out);

  /// Generate an in-memory identity (tests, ephemeral peers).
  static Status generate(const std::string& device_id, TlsIdentity& out);

  /// TLS 1.2+ context presenting this identity. @p server selects the method role.
  Status make_context(bool server, SslCtxPtr& out) const;

  const std::string& fingerprint() const { return fingerprint_; }
  const std::string& device_id() const { return device_id_; }
  bool valid() const { return cert_ && key_; }

private:
  X509Ptr     cert_;
  EvpPkeyPtr  key_;
  std::string fingerprint_;
  std::string device_id_;
};

} // namespace kdc

#endif // KDC_TLS_IDENTITY_HPP
