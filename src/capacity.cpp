#include "leastrecent/capacity.hpp"

#include <cerrno>
#include <cstdlib>

namespace leastrecent {

std::size_t ParseCapacity(const std::string& text) {
    auto begin = text.find_first_not_of(" \t\r\n");
    auto end = text.find_last_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        throw InvalidCapacityError("capacity is empty");
    }
    const std::string trimmed = text.substr(begin, end - begin + 1);

    if (trimmed == "true" || trimmed == "false") {
        throw InvalidCapacityError("boolean is not a capacity");
    }

    errno = 0;
    char* parsed_end = nullptr;
    const double value = std::strtod(trimmed.c_str(), &parsed_end);
    if (parsed_end == trimmed.c_str() || *parsed_end != '\0') {
        throw InvalidCapacityError("'" + text + "' is not a number");
    }
    if (errno == ERANGE && std::isinf(value)) {
        throw InvalidCapacityError("capacity is not finite");
    }
    return ParseCapacity(value);
}

} // namespace leastrecent
