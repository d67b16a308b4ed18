#pragma once

#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>

namespace util {

inline std::string readTextFile(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw std::runtime_error("Failed to open file: " + path);
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

inline bool fileExists(const std::string& path) {
    std::ifstream f(path.c_str());
    return (bool)f;
}

// "dir" + "name" -> "dir/name"; absolute or already-qualified names pass through.
inline std::string joinPath(const std::string& dir, const std::string& name) {
    if (dir.empty() || name.empty()) return name;
    if (name[0] == '/' || name[0] == '\\' || (name.size() > 1 && name[1] == ':')) return name;
    if (dir.back() == '/' || dir.back() == '\\') return dir + name;
    return dir + "/" + name;
}

// stdout also carries protocol messages (JSON, one per line); log lines are
// always prefixed so a host can tell them apart.
inline void logInfo(const std::string& msg) {
    std::cout << "[INFO] " << msg << std::endl;
}

inline void logWarn(const std::string& msg) {
    std::cout << "[WARN] " << msg << std::endl;
}

inline void logError(const std::string& msg) {
    std::cerr << "[ERROR] " << msg << std::endl;
}

} // namespace util
