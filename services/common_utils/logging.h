#pragma once

#include <string>
#include <mutex>

namespace utils {

// Append one line to a CSV file. When the file does not exist yet (or is empty)
// the header row is written first. An empty header skips that step.
// Returns false if the file could not be opened; the error is reported on stderr.
bool LogToCSV(const std::string &path, const std::string &header, const std::string &line,
              std::mutex &mtx);

} // namespace utils
