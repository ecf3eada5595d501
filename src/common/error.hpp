#ifndef REVGRAD_COMMON_ERROR_HPP
#define REVGRAD_COMMON_ERROR_HPP

#include <cstddef>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>

namespace Revgrad {
    // Raised while a graph is being assembled: mismatched list lengths, parameters that cannot be
    // attributed to a layer, gradient functions breaking their count contract.
    class ConfigurationError : public std::invalid_argument {
    public:
        using std::invalid_argument::invalid_argument;
    };

    namespace Details {
        [[nodiscard]] inline std::string length_mismatch(std::string_view what, std::size_t expected, std::size_t actual)
        {
            std::ostringstream message;
            message << what << ": expected " << expected << " but got " << actual << '.';
            return message.str();
        }

        inline void require_length(std::string_view what, std::size_t expected, std::size_t actual)
        {
            if (expected != actual) {
                throw ConfigurationError(length_mismatch(what, expected, actual));
            }
        }
    }
}

#endif // REVGRAD_COMMON_ERROR_HPP
