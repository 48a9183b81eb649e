#include "checksum.hpp"
#include <fstream>
#include <algorithm>
#include <cctype>
#include <memory>
#include <sstream>
#include <iomanip>
#include <stdexcept>
#include <fmt/core.h>

// OpenSSL EVP digests (MD5, SHA-1, SHA-256)
#include <openssl/evp.h>

namespace
{

const EVP_MD *digestFor(ChecksumVerifier::Algorithm algorithm)
{
    switch (algorithm)
    {
    case ChecksumVerifier::Algorithm::SHA256:
        return EVP_sha256();
    case ChecksumVerifier::Algorithm::MD5:
        return EVP_md5();
    case ChecksumVerifier::Algorithm::SHA1:
        return EVP_sha1();
    }
    return nullptr;
}

} // namespace

std::string ChecksumVerifier::compute(const std::filesystem::path &filePath, Algorithm algorithm)
{
    std::ifstream file(filePath, std::ios::binary);
    if (!file)
    {
        throw std::runtime_error(
            fmt::format("Cannot open file for checksum: {}", filePath.string()));
    }

    // RAII wrapper to ensure context is freed even if exception occurs
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> context(EVP_MD_CTX_new(), EVP_MD_CTX_free);
    if (!context)
    {
        throw std::runtime_error("Failed to create OpenSSL context");
    }

    if (EVP_DigestInit_ex(context.get(), digestFor(algorithm), nullptr) != 1)
    {
        throw std::runtime_error(fmt::format("Failed to initialize {} digest", toString(algorithm)));
    }

    std::vector<char> buffer(CHUNK_SIZE);

    while (file.read(buffer.data(), static_cast<std::streamsize>(buffer.size())) || file.gcount() > 0)
    {
        size_t bytesRead = static_cast<size_t>(file.gcount());
        if (EVP_DigestUpdate(context.get(), buffer.data(), bytesRead) != 1)
        {
            throw std::runtime_error(fmt::format("Failed to update {} digest", toString(algorithm)));
        }
    }

    if (file.bad())
    {
        throw std::runtime_error(fmt::format("Error while reading {}", filePath.string()));
    }

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hashLength = 0;

    if (EVP_DigestFinal_ex(context.get(), hash, &hashLength) != 1)
    {
        throw std::runtime_error(fmt::format("Failed to finalize {} digest", toString(algorithm)));
    }

    return toHex(std::vector<unsigned char>(hash, hash + hashLength));
}

bool ChecksumVerifier::verify(const std::filesystem::path &filePath,
                              const std::string &expectedChecksum)
{
    auto [algorithm, expectedHash] = parseChecksum(expectedChecksum);

    // Both sides are lowercase hex at this point
    return compute(filePath, algorithm) == expectedHash;
}

std::pair<ChecksumVerifier::Algorithm, std::string>
ChecksumVerifier::parseChecksum(const std::string &checksumString)
{
    // Expected format: "algorithm:hexhash"
    size_t colonPos = checksumString.find(':');
    if (colonPos == std::string::npos)
    {
        throw std::runtime_error(
            "Invalid checksum format. Expected 'algorithm:hexhash'");
    }

    std::string algorithmStr = checksumString.substr(0, colonPos);
    std::string hexHash = checksumString.substr(colonPos + 1);

    std::transform(algorithmStr.begin(), algorithmStr.end(), algorithmStr.begin(),
                   [](unsigned char ch)
                   { return static_cast<char>(std::tolower(ch)); });

    // Accept both "sha256" and "sha-256" spellings
    algorithmStr.erase(std::remove(algorithmStr.begin(), algorithmStr.end(), '-'), algorithmStr.end());

    Algorithm algorithm;
    if (algorithmStr == "sha256")
    {
        algorithm = Algorithm::SHA256;
    }
    else if (algorithmStr == "md5")
    {
        algorithm = Algorithm::MD5;
    }
    else if (algorithmStr == "sha1")
    {
        algorithm = Algorithm::SHA1;
    }
    else
    {
        throw std::runtime_error(
            fmt::format("Unsupported algorithm: '{}'", checksumString.substr(0, colonPos)));
    }

    std::string normalizedHex = normalizeHex(hexHash);

    if (normalizedHex.length() != hexLength(algorithm))
    {
        throw std::runtime_error(
            fmt::format("Invalid {} hash length. Expected {} hex characters, got {}",
                        toString(algorithm), hexLength(algorithm), normalizedHex.length()));
    }

    return {algorithm, normalizedHex};
}

std::string ChecksumVerifier::toString(Algorithm algorithm)
{
    switch (algorithm)
    {
    case Algorithm::SHA256:
        return "sha256";
    case Algorithm::MD5:
        return "md5";
    case Algorithm::SHA1:
        return "sha1";
    }
    return "unknown";
}

std::size_t ChecksumVerifier::hexLength(Algorithm algorithm)
{
    switch (algorithm)
    {
    case Algorithm::SHA256:
        return 64; // 256 bits / 4 bits per hex digit
    case Algorithm::MD5:
        return 32; // 128 bits / 4
    case Algorithm::SHA1:
        return 40; // 160 bits / 4
    }
    return 0;
}

std::string ChecksumVerifier::toHex(const std::vector<unsigned char> &data)
{
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');

    for (unsigned char byte : data)
    {
        oss << std::setw(2) << static_cast<unsigned int>(byte);
    }

    return oss.str();
}

std::string ChecksumVerifier::normalizeHex(const std::string &hex)
{
    std::string result;
    result.reserve(hex.length());

    for (char ch : hex)
    {
        unsigned char uch = static_cast<unsigned char>(ch);

        // Skip whitespace and common separators
        if (std::isspace(uch) || ch == ':' || ch == '-')
        {
            continue;
        }

        // Keep only hex digits
        if (std::isxdigit(uch))
        {
            result += static_cast<char>(std::tolower(uch));
        }
        else
        {
            throw std::runtime_error(
                fmt::format("Invalid character in checksum: '{}'", ch));
        }
    }

    return result;
}
