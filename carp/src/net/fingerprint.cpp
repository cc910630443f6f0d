#include "net/fingerprint.hpp"

#include <openssl/bio.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/pem.h>

namespace carp::net {

namespace {

/// Looks up a digest, accepting `SHA-256` as well as OpenSSL's `SHA256`.
auto find_digest(std::string_view algorithm) -> const EVP_MD* {
    std::string name(algorithm);
    if (const EVP_MD* md = EVP_get_digestbyname(name.c_str())) {
        return md;
    }
    std::string compact;
    for (char c : name) {
        if (c != '-') {
            compact += c;
        }
    }
    return EVP_get_digestbyname(compact.c_str());
}

auto openssl_error(const std::string& what) -> std::string {
    unsigned long code = ERR_get_error();
    if (code == 0) {
        return what;
    }
    char buf[256];
    ERR_error_string_n(code, buf, sizeof(buf));
    ERR_clear_error();
    return what + ": " + buf;
}

} // namespace

auto Fingerprint::of_der(std::string_view algorithm, std::span<const uint8_t> der)
    -> Result<Fingerprint, std::string> {
    const EVP_MD* md = find_digest(algorithm);
    if (md == nullptr) {
        return "unknown digest algorithm: " + std::string(algorithm);
    }
    unsigned char buf[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    if (EVP_Digest(der.data(), der.size(), buf, &len, md, nullptr) != 1) {
        return openssl_error("digest failed");
    }
    return Fingerprint(std::string(algorithm), std::vector<uint8_t>(buf, buf + len));
}

auto Fingerprint::of_certificate(std::string_view algorithm, const X509* cert)
    -> Result<Fingerprint, std::string> {
    if (cert == nullptr) {
        return std::string("no certificate");
    }
    const EVP_MD* md = find_digest(algorithm);
    if (md == nullptr) {
        return "unknown digest algorithm: " + std::string(algorithm);
    }
    unsigned char buf[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    if (X509_digest(cert, md, buf, &len) != 1) {
        return openssl_error("certificate digest failed");
    }
    return Fingerprint(std::string(algorithm), std::vector<uint8_t>(buf, buf + len));
}

auto Fingerprint::of_pem(std::string_view algorithm, std::string_view pem)
    -> Result<Fingerprint, std::string> {
    std::unique_ptr<BIO, decltype(&BIO_free)> bio(
        BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())), &BIO_free);
    if (!bio) {
        return openssl_error("cannot buffer PEM text");
    }
    std::unique_ptr<X509, decltype(&X509_free)> cert(
        PEM_read_bio_X509(bio.get(), nullptr, nullptr, nullptr), &X509_free);
    if (!cert) {
        return openssl_error("no certificate in PEM text");
    }
    return of_certificate(algorithm, cert.get());
}

auto Fingerprint::to_hex() const -> std::string {
    static const char* hex = "0123456789ABCDEF";
    std::string out;
    for (size_t i = 0; i < bytes_.size(); ++i) {
        if (i > 0) {
            out += ':';
        }
        out += hex[bytes_[i] >> 4];
        out += hex[bytes_[i] & 0x0F];
    }
    return out;
}

} // namespace carp::net
