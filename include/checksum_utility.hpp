// include/checksum_utility.hpp
#pragma once

#include <cstdint>
#include <istream>
#include <string>
#include <vector>

namespace SnapFetch
{
    namespace Checksum
    {

        using Bytes = std::vector<std::uint8_t>;

        class ChecksumUtility
        {
        public:
            // SHA-256 digest of the buffer (32 bytes).
            static Bytes sha256(const std::vector<char> &data_buffer);

            // SHA-256 digest of everything remaining in the stream.
            // Throws Errors::IOError if the stream fails before end of file.
            static Bytes sha256(std::istream &input);

            // Lowercase hex, two digits per byte.
            static std::string toHex(const Bytes &bytes);

            // Inverse of toHex; accepts either case. Throws std::invalid_argument
            // on odd length or non-hex characters.
            static Bytes fromHex(const std::string &hex);
        };

    } // namespace Checksum
} // namespace SnapFetch
