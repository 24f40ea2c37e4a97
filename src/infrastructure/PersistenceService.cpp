/**
 * @file PersistenceService.cpp
 * @brief Implementation of PersistenceService.
 */

#include "infrastructure/PersistenceService.hpp"
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <system_error>

namespace lyricflow::infrastructure {

namespace fs = std::filesystem;

void PersistenceService::saveText(const std::string& filename, const std::string& content) {
    std::lock_guard<std::mutex> lock(m_mutex);

    fs::path finalPath = filename;

    // filename.<timestamp>.tmp keeps concurrent writers of different files apart
    auto timestamp = std::chrono::steady_clock::now().time_since_epoch().count();
    fs::path tempPath = finalPath;
    tempPath += "." + std::to_string(timestamp) + ".tmp";

    // 1. Ensure directory exists
    if (finalPath.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(finalPath.parent_path(), ec);
        if (ec) {
            std::cerr << "[PersistenceService] Error creating directories: " << ec.message() << std::endl;
            throw std::runtime_error("Cannot create directory for " + filename + ": " + ec.message());
        }
    }

    // 2. Write to Temp
    {
        std::ofstream ofs(tempPath, std::ios::binary | std::ios::trunc);
        if (!ofs.is_open()) {
            std::cerr << "[PersistenceService] Failed to open temp file: " << tempPath << std::endl;
            throw std::runtime_error("Cannot open temp file for " + filename);
        }
        ofs << content;
        ofs.flush();
        if (ofs.fail()) {
            std::cerr << "[PersistenceService] Write failed during output: " << tempPath << std::endl;
            ofs.close();
            std::error_code ignored;
            fs::remove(tempPath, ignored);
            throw std::runtime_error("Write failed for " + filename);
        }
    }

    // 3. Atomic Rename
    std::error_code ec;
    fs::rename(tempPath, finalPath, ec);
    if (ec) {
        std::cerr << "[PersistenceService] Rename failed: " << ec.message() << std::endl;
        std::error_code ignored;
        fs::remove(tempPath, ignored);
        throw std::runtime_error("Rename failed for " + filename + ": " + ec.message());
    }
}

std::optional<std::string> PersistenceService::loadText(const std::string& filename) const {
    std::ifstream in(filename, std::ios::binary);
    if (!in.is_open()) {
        return std::nullopt;
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

} // namespace lyricflow::infrastructure
