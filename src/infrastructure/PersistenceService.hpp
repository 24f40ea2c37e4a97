/**
 * @file PersistenceService.hpp
 * @brief Centralized service for serialized, atomic file I/O operations.
 */

#pragma once
#include <mutex>
#include <optional>
#include <string>

namespace lyricflow::infrastructure {

/**
 * @class PersistenceService
 * @brief Performs write-to-temp-then-rename writes, one at a time.
 *
 * Readers of a file written through this service either see the previous
 * complete document or the new complete document, never a partial one.
 */
class PersistenceService {
public:
    PersistenceService() = default;

    /**
     * @brief Atomically replaces @p filename with @p content.
     * @throws std::runtime_error if the directory, temp file or rename fails.
     */
    void saveText(const std::string& filename, const std::string& content);

    /** @brief Reads a whole file, nullopt if it is missing or unreadable. */
    std::optional<std::string> loadText(const std::string& filename) const;

private:
    std::mutex m_mutex;
};

} // namespace lyricflow::infrastructure
