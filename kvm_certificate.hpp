#pragma once

#include <boost/asio/ssl/context.hpp>

#include <string>

namespace kvm
{

/*
 * @struct Credentials
 * @brief PEM encoded certificate chain and private key
 */
struct Credentials
{
    std::string certificateChain;
    std::string privateKey;
};

/*
 * @brief Reads the certificate chain and key, or makes a self-signed pair
 *        when no path is given
 *
 * @param[in] certPath   - PEM certificate chain file, may be empty
 * @param[in] keyPath    - PEM private key file, may be empty
 * @param[in] commonName - Subject of a generated certificate, normally the
 *                         bind address
 *
 * @return The credentials; throws InvalidArgument when only one path is
 *         given and Open when a file cannot be read
 */
Credentials loadOrGenerate(const std::string& certPath,
                           const std::string& keyPath,
                           const std::string& commonName);

/*
 * @brief Makes a self-signed RSA certificate valid for one year
 *
 * @param[in] commonName - Used as CN and subjectAltName
 */
Credentials generateSelfSigned(const std::string& commonName);

/*
 * @brief Builds a TLS server context around the credentials
 */
boost::asio::ssl::context makeServerContext(const Credentials& credentials);

} // namespace kvm
