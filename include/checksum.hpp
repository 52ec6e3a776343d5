#pragma once

#include <cstddef>
#include <filesystem>
#include <istream>
#include <memory>
#include <string>
#include <vector>

#include <openssl/evp.h>

/**
 * Incremental SHA-256 over a byte stream.
 * Wraps an OpenSSL EVP digest context (RAII).
 */
class Sha256Hasher
{
public:
    Sha256Hasher();

    Sha256Hasher(const Sha256Hasher &) = delete;
    Sha256Hasher &operator=(const Sha256Hasher &) = delete;

    /**
     * Feed more bytes into the digest.
     * @throws XgetError (ErrorKind::Io) if OpenSSL rejects the update
     */
    void update(const char *data, std::size_t length);

    /**
     * Finalize and return the lowercase hex digest (64 characters).
     * The hasher cannot be updated afterwards.
     */
    std::string finalHex();

private:
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> context_;
    bool finalized_ = false;
};

/**
 * File integrity verification using SHA-256.
 * Digests are exchanged as 64-character lowercase hex strings.
 */
class ChecksumVerifier
{
public:
    /**
     * Compute SHA-256 hash of a file.
     * Reads file in chunks to avoid loading entire file into memory.
     *
     * @param filePath Path to file to hash
     * @return Hex-encoded hash string (64 characters for SHA-256)
     * @throws XgetError (ErrorKind::Io) if file cannot be read
     */
    static std::string computeSHA256(const std::filesystem::path &filePath);

    /**
     * Validate and canonicalize a SHA-256 digest string.
     * Accepts an optional "sha256:" prefix, upper or lower case hex,
     * and ignores whitespace.
     *
     * @return 64-character lowercase hex digest
     * @throws XgetError (ErrorKind::Config) if the value is not a SHA-256 digest
     */
    static std::string normalizeDigest(const std::string &digest);

    /**
     * Convert binary data to hex string.
     * Example: {0x01, 0xFF} → "01ff"
     */
    static std::string toHex(const unsigned char *data, std::size_t length);

    static constexpr std::size_t DIGEST_HEX_LENGTH = 64;

private:
    static std::string computeSHA256(std::istream &input);

    // Chunk size for file reading (1 MB)
    static constexpr std::size_t CHUNK_SIZE = 1024 * 1024;
};
