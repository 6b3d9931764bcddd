#include "config.h"
#include <cstdlib>
#include <stdexcept>

namespace utils {

double GetEnvDouble(const std::string& key, double default_val)
{
    const char* val = std::getenv(key.c_str());
    if (!val || *val == '\0') return default_val;

    std::string text(val);
    try {
        size_t consumed = 0;
        double parsed = std::stod(text, &consumed);
        if (text.find_first_not_of(" \t", consumed) != std::string::npos)
            return default_val;
        return parsed;
    } catch (const std::invalid_argument&) {
        return default_val;
    } catch (const std::out_of_range&) {
        return default_val;
    }
}

std::string GetEnvString(const std::string& key, const std::string& default_val)
{
    const char* val = std::getenv(key.c_str());
    return (val && *val != '\0') ? std::string(val) : default_val;
}

} // namespace utils
