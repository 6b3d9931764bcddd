#include "logging.h"
#include <fstream>
#include <iostream>

namespace utils {

bool LogToCSV(const std::string &path, const std::string &header, const std::string &line,
              std::mutex &mtx)
{
    std::lock_guard<std::mutex> lock(mtx);

    bool needs_header = false;
    if (!header.empty())
    {
        std::ifstream existing(path, std::ios::ate);
        needs_header = !existing.is_open() || existing.tellg() == 0;
    }

    std::ofstream ofs(path, std::ios::app);
    if (!ofs.is_open())
    {
        std::cerr << "[ERROR] Could not write log file: " << path << std::endl;
        return false;
    }

    if (needs_header)
        ofs << header << "\n";
    ofs << line << "\n";
    return true;
}

} // namespace utils
