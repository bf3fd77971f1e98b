// src/checksum_utility.cpp
#include "checksum_utility.hpp"
#include "errors.hpp"
#include <iomanip>   // For std::hex, std::setw, std::setfill
#include <sstream>   // For std::stringstream
#include <stdexcept> // For std::runtime_error

// OpenSSL headers for SHA256
#include <openssl/sha.h>

namespace SnapFetch
{
    namespace Checksum
    {

        namespace
        {
            constexpr size_t READ_BUFFER_SIZE = 64 * 1024;

            int hexValue(char c)
            {
                if (c >= '0' && c <= '9')
                    return c - '0';
                if (c >= 'a' && c <= 'f')
                    return c - 'a' + 10;
                if (c >= 'A' && c <= 'F')
                    return c - 'A' + 10;
                return -1;
            }
        }

        Bytes ChecksumUtility::sha256(const std::vector<char> &data_buffer)
        {
            unsigned char hash[SHA256_DIGEST_LENGTH];
            SHA256_CTX sha256;

            if (!SHA256_Init(&sha256))
            {
                throw std::runtime_error("Failed to initialize SHA256 context.");
            }
            // A hash for empty data is valid and consistent, so an empty buffer skips the update.
            if (!data_buffer.empty() && !SHA256_Update(&sha256, data_buffer.data(), data_buffer.size()))
            {
                throw std::runtime_error("Failed to update SHA256 context with data.");
            }
            if (!SHA256_Final(hash, &sha256))
            {
                throw std::runtime_error("Failed to finalize SHA256 hash calculation.");
            }
            return Bytes(hash, hash + SHA256_DIGEST_LENGTH);
        }

        Bytes ChecksumUtility::sha256(std::istream &input)
        {
            unsigned char hash[SHA256_DIGEST_LENGTH];
            SHA256_CTX sha256;

            if (!SHA256_Init(&sha256))
            {
                throw std::runtime_error("Failed to initialize SHA256 context.");
            }

            std::vector<char> buffer(READ_BUFFER_SIZE);
            while (input)
            {
                input.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
                std::streamsize got = input.gcount();
                if (got > 0 && !SHA256_Update(&sha256, buffer.data(), static_cast<size_t>(got)))
                {
                    throw std::runtime_error("Failed to update SHA256 context with data.");
                }
            }
            if (input.bad())
            {
                throw Errors::IOError("Read failure while hashing stream.");
            }

            if (!SHA256_Final(hash, &sha256))
            {
                throw std::runtime_error("Failed to finalize SHA256 hash calculation.");
            }
            return Bytes(hash, hash + SHA256_DIGEST_LENGTH);
        }

        std::string ChecksumUtility::toHex(const Bytes &bytes)
        {
            std::stringstream ss;
            for (std::uint8_t b : bytes)
            {
                ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(b);
            }
            return ss.str();
        }

        Bytes ChecksumUtility::fromHex(const std::string &hex)
        {
            if (hex.size() % 2 != 0)
            {
                throw std::invalid_argument("Hex string has odd length: " + hex);
            }
            Bytes bytes;
            bytes.reserve(hex.size() / 2);
            for (size_t i = 0; i < hex.size(); i += 2)
            {
                int hi = hexValue(hex[i]);
                int lo = hexValue(hex[i + 1]);
                if (hi < 0 || lo < 0)
                {
                    throw std::invalid_argument("Invalid hex string: " + hex);
                }
                bytes.push_back(static_cast<std::uint8_t>((hi << 4) | lo));
            }
            return bytes;
        }

    } // namespace Checksum
} // namespace SnapFetch
