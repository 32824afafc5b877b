#include <shardrt/support/env.hpp>

#include <cctype>
#include <cstdlib>
#include <limits>
#include <stdexcept>

namespace shardrt::support {

std::optional<std::string> env_string(const char* name)
{
    const char* value = std::getenv(name);
    if (value == nullptr || *value == '\0') {
        return std::nullopt;
    }
    return std::string{value};
}

std::optional<std::size_t> env_positive_size(const char* name)
{
    auto value = env_string(name);
    if (!value) {
        return std::nullopt;
    }

    std::size_t n = 0;
    for (char ch : *value) {
        if (!std::isdigit(static_cast<unsigned char>(ch))) {
            throw std::invalid_argument(std::string{"\""} + name + "\" must be a positive integer, got \"" + *value + "\"");
        }
        const auto digit = static_cast<std::size_t>(ch - '0');
        if (n > (std::numeric_limits<std::size_t>::max() - digit) / 10) {
            throw std::invalid_argument(std::string{"\""} + name + "\" is out of range: \"" + *value + "\"");
        }
        n = n * 10 + digit;
    }
    if (n == 0) {
        throw std::invalid_argument(std::string{"\""} + name + "\" cannot be set to 0");
    }
    return n;
}

} // namespace shardrt::support
