#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <utility>
#include <vector>

/**
 * File integrity verification using cryptographic hashes.
 * Used to check staging files before they replace the destination,
 * and by the standalone `verify` command.
 */
class ChecksumVerifier
{
public:
    // Names accepted in "algorithm:hexhash": sha256 (or sha-256), md5, sha1
    enum class Algorithm
    {
        SHA256,
        MD5,
        SHA1
    };

    /**
     * Digest of a whole file, streamed through OpenSSL EVP in CHUNK_SIZE pieces.
     *
     * @return Lowercase hex digest
     * @throws std::runtime_error if the file can't be opened or read
     */
    static std::string compute(const std::filesystem::path &filePath, Algorithm algorithm);

    /**
     * Compare a file against "algorithm:hexhash", e.g. "md5:5eb63bbb...".
     *
     * @return false on a digest mismatch
     * @throws std::runtime_error for a malformed checksum or an unreadable file
     */
    static bool verify(const std::filesystem::path &filePath,
                       const std::string &expectedChecksum);

    /**
     * Split "algorithm:hexhash" and check the digest length for the algorithm.
     * Both parts are case-insensitive; the hash comes back lowercase.
     *
     * @throws std::runtime_error for an unknown algorithm or a bad hash
     */
    static std::pair<Algorithm, std::string> parseChecksum(const std::string &checksumString);

    static std::string toString(Algorithm algorithm);

private:
    // {0x01, 0xFF} -> "01ff"
    static std::string toHex(const std::vector<unsigned char> &data);

    // Lowercase, drop blanks and ':'/'-' separators, reject anything else
    static std::string normalizeHex(const std::string &hex);

    /**
     * Number of hex characters a digest of this algorithm has.
     */
    static std::size_t hexLength(Algorithm algorithm);

    // Read buffer for compute()
    static constexpr std::size_t CHUNK_SIZE = 1024 * 1024;
};
