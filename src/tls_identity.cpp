// ============================================================================
// tls_identity.cpp — implementation for tls_identity.hpp
// Key/cert generation, PEM persistence and SSL_CTX construction (OpenSSL 1.1/3).
// ============================================================================

#include "kdc/tls_identity.hpp"

#include <openssl/bio.h>
#include <openssl/ec.h>
#include <openssl/err.h>
#include <openssl/obj_mac.h>
#include <openssl/pem.h>

#include <filesystem>
#include <system_error>

#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace kdc {

namespace {

constexpr const char* CERT_FILE = "certificate.pem";
constexpr const char* KEY_FILE  = "privateKey.pem";
constexpr long CERT_VALIDITY_S  = 10L * 365 * 24 * 3600;
constexpr long CERT_BACKDATE_S  = 365L * 24 * 3600;   // tolerate skewed peer clocks

struct BioDeleter { void operator()(BIO* b) const { BIO_free(b); } };
using BioPtr = std::unique_ptr<BIO, BioDeleter>;

struct PkeyCtxDeleter { void operator()(EVP_PKEY_CTX* c) const { EVP_PKEY_CTX_free(c); } };

std::string openssl_error() {
  unsigned long e = ERR_get_error();
  if (e == 0) return "unknown openssl error";
  char buf[256];
  ERR_error_string_n(e, buf, sizeof(buf));
  return buf;
}

EvpPkeyPtr generate_key() {
  std::unique_ptr<EVP_PKEY_CTX, PkeyCtxDeleter> ctx(EVP_PKEY_CTX_new_id(EVP_PKEY_EC, nullptr));
  if (!ctx) return nullptr;
  if (EVP_PKEY_keygen_init(ctx.get()) <= 0) return nullptr;
  if (EVP_PKEY_CTX_set_ec_paramgen_curve_nid(ctx.get(), NID_X9_62_prime256v1) <= 0) return nullptr;
  EVP_PKEY* raw = nullptr;
  if (EVP_PKEY_keygen(ctx.get(), &raw) <= 0) return nullptr;
  return EvpPkeyPtr(raw);
}

bool add_name_entry(X509_NAME* name, const char* field, const std::string& value) {
  return X509_NAME_add_entry_by_txt(name, field, MBSTRING_UTF8,
                                    reinterpret_cast<const unsigned char*>(value.c_str()),
                                    -1, -1, 0) == 1;
}

X509Ptr self_sign(EVP_PKEY* key, const std::string& cn) {
  X509Ptr cert(X509_new());
  if (!cert) return nullptr;

  X509_set_version(cert.get(), 2);
  ASN1_INTEGER_set(X509_get_serialNumber(cert.get()), 10);
  X509_gmtime_adj(X509_getm_notBefore(cert.get()), -CERT_BACKDATE_S);
  X509_gmtime_adj(X509_getm_notAfter(cert.get()), CERT_VALIDITY_S);
  if (X509_set_pubkey(cert.get(), key) != 1) return nullptr;

  X509_NAME* name = X509_get_subject_name(cert.get());
  if (!add_name_entry(name, "O", "KDE") ||
      !add_name_entry(name, "OU", "Kde connect") ||
      !add_name_entry(name, "CN", cn))
    return nullptr;
  if (X509_set_issuer_name(cert.get(), name) != 1) return nullptr;

  if (X509_sign(cert.get(), key, EVP_sha256()) <= 0) return nullptr;
  return cert;
}

// Peers are self-signed; chain validation is meaningless. Pinning happens on the fingerprint.
int accept_self_signed(int /*preverify_ok*/, X509_STORE_CTX* /*ctx*/) {
  return 1;
}

} // namespace

std::string certificate_fingerprint(X509* cert) {
  if (!cert) return {};
  unsigned char md[EVP_MAX_MD_SIZE];
  unsigned int len = 0;
  if (X509_digest(cert, EVP_sha256(), md, &len) != 1) return {};

  static const char* HEX = "0123456789ABCDEF";
  std::string out;
  out.reserve(len * 3);
  for (unsigned int i = 0; i < len; ++i) {
    if (i) out.push_back(':');
    out.push_back(HEX[md[i] >> 4]);
    out.push_back(HEX[md[i] & 0x0F]);
  }
  return out;
}

std::string certificate_common_name(X509* cert) {
  if (!cert) return {};
  X509_NAME* name = X509_get_subject_name(cert);
  int idx = X509_NAME_get_index_by_NID(name, NID_commonName, -1);
  if (idx < 0) return {};
  ASN1_STRING* data = X509_NAME_ENTRY_get_data(X509_NAME_get_entry(name, idx));
  unsigned char* utf8 = nullptr;
  int n = ASN1_STRING_to_UTF8(&utf8, data);
  if (n < 0) return {};
  std::string cn(reinterpret_cast<char*>(utf8), static_cast<std::size_t>(n));
  OPENSSL_free(utf8);
  return cn;
}

Status TlsIdentity::generate(const std::string& device_id, TlsIdentity& out) {
  EvpPkeyPtr key = generate_key();
  if (!key) return Status(ErrorKind::Tls, "keygen: " + openssl_error());
  X509Ptr cert = self_sign(key.get(), device_id);
  if (!cert) return Status(ErrorKind::Tls, "self-sign: " + openssl_error());

  TlsIdentity id;
  id.fingerprint_ = certificate_fingerprint(cert.get());
  id.cert_        = std::move(cert);
  id.key_         = std::move(key);
  id.device_id_   = device_id;
  out = std::move(id);
  return Status();
}

Status TlsIdentity::load_or_create(const std::string& dir, const std::string& device_id,
                                   TlsIdentity& out) {
  std::error_code ec;
  fs::create_directories(dir, ec);
  if (ec) return Status(ErrorKind::Config, "config dir " + dir + ": " + ec.message());

  const fs::path cert_path = fs::path(dir) / CERT_FILE;
  const fs::path key_path  = fs::path(dir) / KEY_FILE;

  if (fs::exists(cert_path, ec) && fs::exists(key_path, ec)) {
    BioPtr cb(BIO_new_file(cert_path.c_str(), "r"));
    BioPtr kb(BIO_new_file(key_path.c_str(), "r"));
    if (!cb || !kb) return Status(ErrorKind::PermissionDenied, "cannot open identity files in " + dir);

    X509Ptr cert(PEM_read_bio_X509(cb.get(), nullptr, nullptr, nullptr));
    EvpPkeyPtr key(PEM_read_bio_PrivateKey(kb.get(), nullptr, nullptr, nullptr));
    if (!cert || !key) return Status(ErrorKind::Tls, "identity PEM unreadable: " + openssl_error());
    if (X509_check_private_key(cert.get(), key.get()) != 1)
      return Status(ErrorKind::Tls, "identity key does not match certificate");

    TlsIdentity id;
    id.fingerprint_ = certificate_fingerprint(cert.get());
    id.device_id_   = certificate_common_name(cert.get());
    id.cert_        = std::move(cert);
    id.key_         = std::move(key);
    if (id.device_id_ != device_id)
      spdlog::warn("tls: certificate CN {} differs from configured device id {}", id.device_id_, device_id);
    out = std::move(id);
    return Status();
  }

  TlsIdentity id;
  Status st = generate(device_id, id);
  if (!st) return st;

  {
    BioPtr cb(BIO_new_file(cert_path.c_str(), "w"));
    BioPtr kb(BIO_new_file(key_path.c_str(), "w"));
    if (!cb || !kb) return Status(ErrorKind::PermissionDenied, "cannot write identity files in " + dir);
    if (PEM_write_bio_X509(cb.get(), id.cert_.get()) != 1 ||
        PEM_write_bio_PrivateKey(kb.get(), id.key_.get(), nullptr, nullptr, 0, nullptr, nullptr) != 1)
      return Status(ErrorKind::Tls, "identity PEM write: " + openssl_error());
  }
  fs::permissions(key_path, fs::perms::owner_read | fs::perms::owner_write,
                  fs::perm_options::replace, ec);
  if (ec) spdlog::warn("tls: chmod {}: {}", key_path.string(), ec.message());

  spdlog::info("tls: generated identity certificate fingerprint={}", id.fingerprint_);
  out = std::move(id);
  return Status();
}

Status TlsIdentity::make_context(bool server, SslCtxPtr& out) const {
  if (!valid()) return Status(ErrorKind::Internal, "tls identity not loaded");

  SslCtxPtr ctx(SSL_CTX_new(server ? TLS_server_method() : TLS_client_method()));
  if (!ctx) return Status(ErrorKind::Tls, "SSL_CTX_new: " + openssl_error());

  SSL_CTX_set_min_proto_version(ctx.get(), TLS1_2_VERSION);
  if (SSL_CTX_use_certificate(ctx.get(), cert_.get()) != 1 ||
      SSL_CTX_use_PrivateKey(ctx.get(), key_.get()) != 1 ||
      SSL_CTX_check_private_key(ctx.get()) != 1)
    return Status(ErrorKind::Tls, "SSL_CTX identity: " + openssl_error());

  SSL_CTX_set_verify(ctx.get(), SSL_VERIFY_PEER | SSL_VERIFY_FAIL_IF_NO_PEER_CERT, accept_self_signed);
  SSL_CTX_set_mode(ctx.get(), SSL_MODE_ACCEPT_MOVING_WRITE_BUFFER);

  out = std::move(ctx);
  return Status();
}

} // namespace kdc
