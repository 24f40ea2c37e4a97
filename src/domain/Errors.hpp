/**
 * @file Errors.hpp
 * @brief Exception taxonomy shared by the processing pipeline and the read paths.
 */

#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>

namespace lyricflow::domain {

/** @brief The URL does not contain a recognizable media identifier. */
class InvalidSourceError : public std::runtime_error {
public:
    explicit InvalidSourceError(const std::string& msg) : std::runtime_error(msg) {}
};

/** @brief Download or audio conversion failed. Fatal to the job. */
class AcquisitionError : public std::runtime_error {
public:
    explicit AcquisitionError(const std::string& msg) : std::runtime_error(msg) {}
};

/** @brief Every model tier failed, or inference itself failed. Fatal to the job. */
class TranscriptionError : public std::runtime_error {
public:
    explicit TranscriptionError(const std::string& msg) : std::runtime_error(msg) {}
};

/** @brief A single model tier could not be loaded. */
class ModelLoadError : public std::runtime_error {
public:
    explicit ModelLoadError(const std::string& msg) : std::runtime_error(msg) {}
};

/** @brief Unknown song or asset on a read path. */
class NotFoundError : public std::runtime_error {
public:
    explicit NotFoundError(const std::string& msg) : std::runtime_error(msg) {}
};

/** @brief Malformed or out-of-bounds byte range. */
class RangeNotSatisfiableError : public std::runtime_error {
public:
    RangeNotSatisfiableError(const std::string& msg, std::uintmax_t fileSize)
        : std::runtime_error(msg), m_fileSize(fileSize) {}

    std::uintmax_t fileSize() const { return m_fileSize; }

private:
    std::uintmax_t m_fileSize;
};

} // namespace lyricflow::domain
