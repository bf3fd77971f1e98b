// include/errors.hpp
#pragma once

#include <exception>
#include <stdexcept> // For std::runtime_error
#include <string>

namespace SnapFetch
{
    namespace Errors
    {

        // Fault while reading or writing the backing store or the transport.
        // Propagated to the caller unwrapped.
        class IOError : public std::runtime_error
        {
        public:
            explicit IOError(const std::string &what) : std::runtime_error(what) {}
        };

        // Stored bytes do not hash to the checksum they were filed under.
        class ChecksumError : public IOError
        {
        public:
            explicit ChecksumError(const std::string &what) : IOError(what) {}
        };

        // Unexpected failure surfaced from a worker. Not recoverable, never retried.
        // The original exception is kept as the nested exception.
        class FatalError : public std::runtime_error
        {
        public:
            explicit FatalError(const std::string &what) : std::runtime_error(what) {}
        };

        // True for IOError and for the standard library's own I/O failures
        // (std::filesystem::filesystem_error, std::ios_base::failure).
        bool isIOFailure(const std::exception_ptr &error);

        // Message of the exception held by error, or "unknown error".
        std::string describe(const std::exception_ptr &error);

    } // namespace Errors
} // namespace SnapFetch
