#include "kvm_certificate.hpp"

#include <arpa/inet.h>
#include <errno.h>
#include <openssl/bio.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/rand.h>
#include <openssl/rsa.h>
#include <openssl/x509.h>
#include <openssl/x509v3.h>

#include <boost/asio/buffer.hpp>
#include <phosphor-logging/elog-errors.hpp>
#include <phosphor-logging/elog.hpp>
#include <phosphor-logging/log.hpp>
#include <xyz/openbmc_project/Common/File/error.hpp>
#include <xyz/openbmc_project/Common/error.hpp>

#include <cstring>
#include <fstream>
#include <memory>
#include <sstream>

namespace kvm
{

using namespace phosphor::logging;
using namespace sdbusplus::xyz::openbmc_project::Common::Error;
using namespace sdbusplus::xyz::openbmc_project::Common::File::Error;

namespace
{

constexpr int keyBits = 2048;
constexpr long validSeconds = 365L * 24 * 60 * 60;

struct PkeyDeleter
{
    void operator()(EVP_PKEY* p) const
    {
        EVP_PKEY_free(p);
    }
};

struct X509Deleter
{
    void operator()(X509* p) const
    {
        X509_free(p);
    }
};

struct ExtDeleter
{
    void operator()(X509_EXTENSION* p) const
    {
        X509_EXTENSION_free(p);
    }
};

struct BioDeleter
{
    void operator()(BIO* p) const
    {
        BIO_free(p);
    }
};

std::string readPem(const std::string& path)
{
    std::ifstream file(path);

    if (!file)
    {
        int err = errno;

        log<level::ERR>("Failed to read TLS file",
                        entry("PATH=%s", path.c_str()),
                        entry("ERROR=%s", strerror(err)));
        elog<Open>(
            xyz::openbmc_project::Common::File::Open::ERRNO(err),
            xyz::openbmc_project::Common::File::Open::PATH(path.c_str()));
    }

    std::stringstream content;

    content << file.rdbuf();

    return content.str();
}

std::string bioToString(BIO* bio)
{
    char* data = nullptr;
    long len = BIO_get_mem_data(bio, &data);

    return std::string(data, len);
}

void opensslFailure(const char* what)
{
    log<level::ERR>("Failed to generate TLS certificate",
                    entry("STEP=%s", what),
                    entry("ERROR=%lu", ERR_get_error()));
    elog<InternalFailure>();
}

} // namespace

Credentials loadOrGenerate(const std::string& certPath,
                           const std::string& keyPath,
                           const std::string& commonName)
{
    if (certPath.empty() && keyPath.empty())
    {
        log<level::INFO>("Generating self-signed TLS certificate",
                         entry("CN=%s", commonName.c_str()));
        return generateSelfSigned(commonName);
    }

    if (certPath.empty() || keyPath.empty())
    {
        log<level::ERR>("TLS certificate and key must be given together");
        elog<InvalidArgument>(
            xyz::openbmc_project::Common::InvalidArgument::ARGUMENT_NAME(
                certPath.empty() ? "cert" : "key"),
            xyz::openbmc_project::Common::InvalidArgument::ARGUMENT_VALUE(""));
    }

    return Credentials{readPem(certPath), readPem(keyPath)};
}

Credentials generateSelfSigned(const std::string& commonName)
{
    std::unique_ptr<EVP_PKEY, PkeyDeleter> key(EVP_RSA_gen(keyBits));

    if (!key)
    {
        opensslFailure("key");
    }

    std::unique_ptr<X509, X509Deleter> cert(X509_new());

    if (!cert)
    {
        opensslFailure("certificate");
    }

    uint64_t serial;

    if (RAND_bytes((unsigned char*)&serial, sizeof(serial)) != 1)
    {
        opensslFailure("serial");
    }

    X509_set_version(cert.get(), 2);
    ASN1_INTEGER_set_uint64(X509_get_serialNumber(cert.get()),
                            serial & 0x7fffffffffffffffULL);
    X509_gmtime_adj(X509_getm_notBefore(cert.get()), 0);
    X509_gmtime_adj(X509_getm_notAfter(cert.get()), validSeconds);
    X509_set_pubkey(cert.get(), key.get());

    X509_NAME* name = X509_get_subject_name(cert.get());

    X509_NAME_add_entry_by_txt(
        name, "O", MBSTRING_ASC,
        (const unsigned char*)"OpenBMC", -1, -1, 0);
    X509_NAME_add_entry_by_txt(
        name, "CN", MBSTRING_ASC,
        (const unsigned char*)commonName.c_str(), -1, -1, 0);
    X509_set_issuer_name(cert.get(), name);

    unsigned char addr[sizeof(in6_addr)];
    bool isIp = inet_pton(AF_INET, commonName.c_str(), addr) == 1 ||
                inet_pton(AF_INET6, commonName.c_str(), addr) == 1;
    std::string san = (isIp ? "IP:" : "DNS:") + commonName;
    X509V3_CTX ctx;

    X509V3_set_ctx_nodb(&ctx);
    X509V3_set_ctx(&ctx, cert.get(), cert.get(), nullptr, nullptr, 0);

    std::unique_ptr<X509_EXTENSION, ExtDeleter> ext(
        X509V3_EXT_conf_nid(nullptr, &ctx, NID_subject_alt_name, san.c_str()));

    if (!ext || !X509_add_ext(cert.get(), ext.get(), -1))
    {
        opensslFailure("subjectAltName");
    }

    if (!X509_sign(cert.get(), key.get(), EVP_sha256()))
    {
        opensslFailure("sign");
    }

    std::unique_ptr<BIO, BioDeleter> certBio(BIO_new(BIO_s_mem()));
    std::unique_ptr<BIO, BioDeleter> keyBio(BIO_new(BIO_s_mem()));

    if (!certBio || !keyBio || !PEM_write_bio_X509(certBio.get(), cert.get()) ||
        !PEM_write_bio_PrivateKey(keyBio.get(), key.get(), nullptr, nullptr, 0,
                                  nullptr, nullptr))
    {
        opensslFailure("pem");
    }

    return Credentials{bioToString(certBio.get()), bioToString(keyBio.get())};
}

boost::asio::ssl::context makeServerContext(const Credentials& credentials)
{
    boost::asio::ssl::context ctx(boost::asio::ssl::context::tls_server);
    boost::system::error_code ec;

    ctx.set_options(boost::asio::ssl::context::default_workarounds |
                    boost::asio::ssl::context::no_sslv2 |
                    boost::asio::ssl::context::no_sslv3 |
                    boost::asio::ssl::context::no_tlsv1 |
                    boost::asio::ssl::context::no_tlsv1_1 |
                    boost::asio::ssl::context::single_dh_use);

    ctx.use_certificate_chain(
        boost::asio::buffer(credentials.certificateChain), ec);
    if (!ec)
    {
        ctx.use_private_key(boost::asio::buffer(credentials.privateKey),
                            boost::asio::ssl::context::pem, ec);
    }

    if (ec)
    {
        log<level::ERR>("Invalid TLS certificate or key",
                        entry("ERROR=%s", ec.message().c_str()));
        elog<InvalidArgument>(
            xyz::openbmc_project::Common::InvalidArgument::ARGUMENT_NAME(
                "cert"),
            xyz::openbmc_project::Common::InvalidArgument::ARGUMENT_VALUE(
                ec.message().c_str()));
    }

    return ctx;
}

} // namespace kvm
