#pragma once

#include <filesystem>
#include <string>
#include <functional>
#include <vector>
#include <memory>
#include <optional>
#include <chrono>
#include <cstdint>
#include <ctime>

namespace fs = std::filesystem;

// Simple custom observable implementation
template <typename T>
class SimpleObservable
{
public:
    using Observer = std::function<void(const T &)>;
    using ErrorHandler = std::function<void(const std::exception &)>;
    using CompleteHandler = std::function<void()>;

    SimpleObservable(std::function<void(Observer, ErrorHandler, CompleteHandler)> source)
        : source_(std::move(source)) {}

    void subscribe(Observer onNext, ErrorHandler onError = nullptr, CompleteHandler onComplete = nullptr)
    {
        if (source_)
        {
            source_(onNext, onError, onComplete);
        }
    }

    void subscribe(Observer onNext, CompleteHandler onComplete)
    {
        subscribe(onNext, nullptr, onComplete);
    }

    void subscribe(Observer onNext)
    {
        subscribe(onNext, nullptr, nullptr);
    }

private:
    std::function<void(Observer, ErrorHandler, CompleteHandler)> source_;
};

/**
 * @brief Filesystem facts captured once per discovered file
 */
struct FileMetadata
{
    std::string file_path;
    std::time_t modification_time; // Last modification time
    uint64_t file_size;            // File size in bytes

    std::string toString() const;
};

/**
 * @brief File utilities for scanning, hashing and bounded reads
 */
class FileUtils
{
public:
    /**
     * @brief Get file metadata without reading content
     * @param file_path Path to the file
     * @return Optional FileMetadata if the path is an accessible regular file
     */
    static std::optional<FileMetadata> getFileMetadata(const std::string &file_path);

    /**
     * Scans a directory recursively and calls the provided function for each regular file
     * @param dir_path Directory path to scan
     * @param onNext Function to call for each file found
     * @param skipDirectory Optional predicate; directories for which it returns true are not entered
     */
    static void scanDirectoryRecursively(const std::string &dir_path,
                                         std::function<void(const std::string &)> onNext,
                                         std::function<bool(const fs::path &)> skipDirectory = nullptr);

    /**
     * Validates if a path is a valid directory
     * @param path Path to validate
     * @return true if path is a valid directory, false otherwise
     */
    static bool isValidDirectory(const std::string &path);

    /**
     * @brief Check that a directory exists and the process may create files in it
     */
    static bool isWritableDirectory(const std::string &path);

    /**
     * Computes SHA256 hash of a file
     * @param file_path Path to the file
     * @return SHA256 hash as hexadecimal string, empty if the file cannot be read
     */
    static std::string computeFileHash(const std::string &file_path);

    /**
     * @brief Read at most max_bytes from the start of a file
     * @return Bytes read (possibly fewer than requested), or nullopt if the file cannot be opened
     */
    static std::optional<std::vector<uint8_t>> readFilePrefix(const std::string &file_path, size_t max_bytes);

    /**
     * @brief Lower-case extension without the dot ("" when there is none)
     */
    static std::string getFileExtension(const std::string &file_path);

    static std::string toLower(const std::string &value);

    /**
     * @brief Remove empty directories below root, bottom-up; root itself is kept
     * @return Number of directories removed
     */
    static size_t removeEmptyDirectories(const std::string &root);
};
