// src/errors.cpp
#include "errors.hpp"
#include <filesystem>
#include <ios> // For std::ios_base::failure

namespace SnapFetch
{
    namespace Errors
    {

        bool isIOFailure(const std::exception_ptr &error)
        {
            if (!error)
            {
                return false;
            }
            try
            {
                std::rethrow_exception(error);
            }
            catch (const IOError &)
            {
                return true;
            }
            catch (const std::filesystem::filesystem_error &)
            {
                return true;
            }
            catch (const std::ios_base::failure &)
            {
                return true;
            }
            catch (...)
            {
                return false;
            }
        }

        std::string describe(const std::exception_ptr &error)
        {
            if (!error)
            {
                return "no error";
            }
            try
            {
                std::rethrow_exception(error);
            }
            catch (const std::exception &e)
            {
                return e.what();
            }
            catch (...)
            {
                return "unknown error";
            }
        }

    } // namespace Errors
} // namespace SnapFetch
