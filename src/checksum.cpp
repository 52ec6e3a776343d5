#include "checksum.hpp"
#include "errors.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <fmt/core.h>

Sha256Hasher::Sha256Hasher() : context_(EVP_MD_CTX_new(), EVP_MD_CTX_free)
{
    if (!context_)
    {
        throw XgetError(ErrorKind::Io, "Failed to create OpenSSL context");
    }

    // EVP = "Envelope" API (high-level cryptography interface)
    if (EVP_DigestInit_ex(context_.get(), EVP_sha256(), nullptr) != 1)
    {
        throw XgetError(ErrorKind::Io, "Failed to initialize SHA-256 digest");
    }
}

void Sha256Hasher::update(const char *data, std::size_t length)
{
    if (finalized_)
    {
        throw std::logic_error("SHA-256 digest already finalized");
    }
    if (length == 0)
    {
        return;
    }
    if (EVP_DigestUpdate(context_.get(), data, length) != 1)
    {
        throw XgetError(ErrorKind::Io, "Failed to update SHA-256 digest");
    }
}

std::string Sha256Hasher::finalHex()
{
    if (finalized_)
    {
        throw std::logic_error("SHA-256 digest already finalized");
    }

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hashLength = 0;

    if (EVP_DigestFinal_ex(context_.get(), hash, &hashLength) != 1)
    {
        throw XgetError(ErrorKind::Io, "Failed to finalize SHA-256 digest");
    }
    finalized_ = true;

    return ChecksumVerifier::toHex(hash, hashLength);
}

std::string ChecksumVerifier::computeSHA256(const std::filesystem::path &filePath)
{
    // Open file in binary mode
    std::ifstream file(filePath, std::ios::binary);
    if (!file)
    {
        throw XgetError(ErrorKind::Io,
                        fmt::format("Cannot open file for checksum: {}", filePath.string()));
    }

    std::string digest = computeSHA256(file);
    if (file.bad())
    {
        throw XgetError(ErrorKind::Io,
                        fmt::format("Read error while hashing {}", filePath.string()));
    }
    return digest;
}

std::string ChecksumVerifier::computeSHA256(std::istream &input)
{
    Sha256Hasher hasher;
    std::vector<char> buffer(CHUNK_SIZE);

    // Read in chunks and update digest
    while (input.read(buffer.data(), static_cast<std::streamsize>(buffer.size())) || input.gcount() > 0)
    {
        hasher.update(buffer.data(), static_cast<std::size_t>(input.gcount()));
    }

    return hasher.finalHex();
}

std::string ChecksumVerifier::normalizeDigest(const std::string &digest)
{
    std::string hex = digest;

    // Optional "algorithm:" prefix, only sha256 is meaningful here
    std::size_t colonPos = hex.find(':');
    if (colonPos != std::string::npos)
    {
        std::string algorithm = hex.substr(0, colonPos);
        std::transform(algorithm.begin(), algorithm.end(), algorithm.begin(),
                       [](unsigned char c)
                       { return static_cast<char>(std::tolower(c)); });
        if (algorithm != "sha256")
        {
            throw XgetError(ErrorKind::Config,
                            fmt::format("Unsupported digest algorithm: '{}'", algorithm));
        }
        hex = hex.substr(colonPos + 1);
    }

    std::string result;
    result.reserve(hex.length());

    for (char ch : hex)
    {
        auto uch = static_cast<unsigned char>(ch);
        if (std::isspace(uch))
        {
            continue;
        }

        // Keep only hex digits
        if (!std::isxdigit(uch))
        {
            throw XgetError(ErrorKind::Config,
                            fmt::format("Invalid character in digest: '{}'", ch));
        }
        result += static_cast<char>(std::tolower(uch));
    }

    if (result.length() != DIGEST_HEX_LENGTH)
    {
        throw XgetError(ErrorKind::Config,
                        fmt::format("Invalid sha256 digest length. Expected {} hex characters, got {}",
                                    DIGEST_HEX_LENGTH, result.length()));
    }

    return result;
}

std::string ChecksumVerifier::toHex(const unsigned char *data, std::size_t length)
{
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');

    for (std::size_t i = 0; i < length; ++i)
    {
        oss << std::setw(2) << static_cast<unsigned int>(data[i]);
    }

    return oss.str();
}
