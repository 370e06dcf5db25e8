#include "gnmireverse/client/credentials.h"
#include "gnmireverse/core/error.h"

#include <fstream>
#include <sstream>
#include <vector>

#include <grpcpp/security/tls_certificate_provider.h>
#include <grpcpp/security/tls_certificate_verifier.h>
#include <grpcpp/security/tls_credentials_options.h>
#include <openssl/bio.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/x509.h>

namespace gnmireverse {
namespace client {

namespace {

struct BioDeleter {
    void operator()(BIO* bio) const { BIO_free(bio); }
};
struct X509Deleter {
    void operator()(X509* cert) const { X509_free(cert); }
};
struct PKeyDeleter {
    void operator()(EVP_PKEY* key) const { EVP_PKEY_free(key); }
};

using BioPtr = std::unique_ptr<BIO, BioDeleter>;
using X509Ptr = std::unique_ptr<X509, X509Deleter>;
using PKeyPtr = std::unique_ptr<EVP_PKEY, PKeyDeleter>;

std::string ReadFile(const std::string& path, const char* what) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw core::ConfigError(std::string("failed to read ") + what + " \"" + path + "\"");
    }
    std::ostringstream contents;
    contents << in.rdbuf();
    if (in.bad()) {
        throw core::ConfigError(std::string("failed to read ") + what + " \"" + path + "\"");
    }
    return contents.str();
}

BioPtr MemoryBio(const std::string& pem) {
    return BioPtr(BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())));
}

/**
 * @brief Number of certificates in a PEM bundle
 */
size_t CountCertificates(const std::string& pem) {
    BioPtr bio = MemoryBio(pem);
    if (!bio) {
        return 0;
    }
    size_t count = 0;
    for (;;) {
        X509Ptr cert(PEM_read_bio_X509(bio.get(), nullptr, nullptr, nullptr));
        if (!cert) {
            break;
        }
        ++count;
    }
    // Reading past the last certificate leaves a "no start line" error queued
    ERR_clear_error();
    return count;
}

void CheckKeyPair(const std::string& cert_pem, const std::string& key_pem,
                  const std::string& cert_file, const std::string& key_file) {
    BioPtr cert_bio = MemoryBio(cert_pem);
    X509Ptr cert{cert_bio ? PEM_read_bio_X509(cert_bio.get(), nullptr, nullptr, nullptr) : nullptr};
    if (!cert) {
        ERR_clear_error();
        throw core::ConfigError("failed to parse client certificate \"" + cert_file + "\"");
    }

    BioPtr key_bio = MemoryBio(key_pem);
    PKeyPtr key{key_bio ? PEM_read_bio_PrivateKey(key_bio.get(), nullptr, nullptr, nullptr) : nullptr};
    if (!key) {
        ERR_clear_error();
        throw core::ConfigError("failed to parse client key \"" + key_file + "\"");
    }

    if (X509_check_private_key(cert.get(), key.get()) != 1) {
        ERR_clear_error();
        throw core::ConfigError("client key \"" + key_file +
                                "\" does not match certificate \"" + cert_file + "\"");
    }
}

} // namespace

std::shared_ptr<grpc::ChannelCredentials> TransportCredentials::ToChannelCredentials() const {
    switch (security) {
        case Security::INSECURE:
            return grpc::InsecureChannelCredentials();

        case Security::TLS: {
            grpc::SslCredentialsOptions options;
            options.pem_root_certs = root_certs_pem;
            options.pem_private_key = private_key_pem;
            options.pem_cert_chain = cert_chain_pem;
            return grpc::SslCredentials(options);
        }

        case Security::TLS_SKIP_VERIFY:
        default: {
            grpc::experimental::TlsChannelCredentialsOptions options;
            options.set_verify_server_certs(false);
            options.set_check_call_host(false);
            options.set_certificate_verifier(
                std::make_shared<grpc::experimental::NoOpCertificateVerifier>());
            if (has_client_identity()) {
                std::vector<grpc::experimental::IdentityKeyCertPair> pairs;
                pairs.push_back({private_key_pem, cert_chain_pem});
                options.set_certificate_provider(
                    std::make_shared<grpc::experimental::StaticDataCertificateProvider>(pairs));
                options.watch_identity_key_cert_pairs();
            }
            return grpc::experimental::TlsCredentials(options);
        }
    }
}

std::string TransportCredentials::Describe() const {
    std::string out;
    switch (security) {
        case Security::INSECURE:
            return "plaintext";
        case Security::TLS:
            out = root_certs_pem.empty() ? "tls (system roots)" : "tls (custom roots)";
            break;
        case Security::TLS_SKIP_VERIFY:
            out = "tls (server certificate not verified)";
            break;
    }
    if (has_client_identity()) {
        out += ", client certificate";
    }
    return out;
}

TransportCredentials BuildCredentials(const core::TlsConfig& tls) {
    TransportCredentials creds;
    if (!tls.enabled) {
        creds.security = TransportCredentials::Security::INSECURE;
        return creds;
    }

    if (tls.skip_verify) {
        creds.security = TransportCredentials::Security::TLS_SKIP_VERIFY;
    } else {
        creds.security = TransportCredentials::Security::TLS;
        if (!tls.ca_file.empty()) {
            std::string pem = ReadFile(tls.ca_file, "CA file");
            if (CountCertificates(pem) == 0) {
                throw core::ConfigError("credentials: failed to append certificates from \"" +
                                        tls.ca_file + "\"");
            }
            creds.root_certs_pem = std::move(pem);
        }
    }

    if (!tls.cert_file.empty()) {
        if (tls.key_file.empty()) {
            throw core::ConfigError("please provide both -collector_certfile and -collector_keyfile");
        }
        std::string cert_pem = ReadFile(tls.cert_file, "client certificate");
        std::string key_pem = ReadFile(tls.key_file, "client key");
        CheckKeyPair(cert_pem, key_pem, tls.cert_file, tls.key_file);
        creds.cert_chain_pem = std::move(cert_pem);
        creds.private_key_pem = std::move(key_pem);
    }
    return creds;
}

} // namespace client
} // namespace gnmireverse
