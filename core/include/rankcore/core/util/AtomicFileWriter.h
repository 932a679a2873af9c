#pragma once

#include <string>

namespace rankcore::core::util {

// Writes `<path>.tmp` and renames it over `path`. Missing parent directories are created.
class AtomicFileWriter {
public:
    static bool Write(const std::string& path, const std::string& contents, std::string* error);
};

}  // namespace rankcore::core::util
