#include "core/file_utils.hpp"
#include "logging/logger.hpp"
#include <openssl/sha.h>
#include <algorithm>
#include <cctype>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <vector>
#include <sys/stat.h>
#include <unistd.h>

namespace fs = std::filesystem;

bool FileUtils::isValidDirectory(const std::string &path)
{
    try
    {
        fs::path dir_path(path);
        return fs::exists(dir_path) && fs::is_directory(dir_path);
    }
    catch (const std::exception &e)
    {
        return false;
    }
}

bool FileUtils::isWritableDirectory(const std::string &path)
{
    return isValidDirectory(path) && ::access(path.c_str(), W_OK | X_OK) == 0;
}

void FileUtils::scanDirectoryRecursively(const std::string &dir_path,
                                         std::function<void(const std::string &)> onNext,
                                         std::function<bool(const fs::path &)> skipDirectory)
{
    std::function<void(const fs::path &)> scanDirectory = [&](const fs::path &current_path)
    {
        try
        {
            // Sorted so that discovery order, and with it planning order, is stable
            std::vector<fs::directory_entry> entries;
            for (const auto &entry : fs::directory_iterator(current_path))
            {
                entries.push_back(entry);
            }
            std::sort(entries.begin(), entries.end(),
                      [](const fs::directory_entry &a, const fs::directory_entry &b)
                      { return a.path() < b.path(); });

            for (const auto &entry : entries)
            {
                try
                {
                    if (entry.is_symlink())
                    {
                        Logger::debug("Skipping symbolic link: " + entry.path().string());
                        continue;
                    }
                    if (entry.is_regular_file())
                    {
                        onNext(entry.path().string());
                    }
                    else if (entry.is_directory())
                    {
                        if (skipDirectory && skipDirectory(entry.path()))
                        {
                            Logger::debug("Not descending into: " + entry.path().string());
                            continue;
                        }
                        scanDirectory(entry.path());
                    }
                }
                catch (const fs::filesystem_error &e)
                {
                    // Log the error but continue scanning
                    Logger::warn("Skipping entry due to permission error: " + entry.path().string() + " - " + e.what());
                    continue;
                }
            }
        }
        catch (const fs::filesystem_error &e)
        {
            // Log the error but don't stop the entire scan
            Logger::warn("Error accessing directory " + current_path.string() + ": " + e.what());
        }
    };
    scanDirectory(fs::path(dir_path));
}

std::string FileUtils::computeFileHash(const std::string &file_path)
{
    Logger::debug("Reading entire file for hash computation: " + file_path);
    constexpr size_t buffer_size = 65536;
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256_CTX sha256;
    if (SHA256_Init(&sha256) != 1)
        return "";
    std::ifstream file(file_path, std::ios::binary);
    if (!file.is_open())
        return "";
    std::vector<char> buffer(buffer_size);
    while (file.good())
    {
        file.read(buffer.data(), buffer_size);
        std::streamsize bytes_read = file.gcount();
        if (bytes_read > 0)
        {
            if (SHA256_Update(&sha256, buffer.data(), bytes_read) != 1)
                return "";
        }
    }
    if (file.bad())
        return "";
    if (SHA256_Final(hash, &sha256) != 1)
        return "";
    std::stringstream ss;
    for (int i = 0; i < SHA256_DIGEST_LENGTH; ++i)
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
    return ss.str();
}

std::optional<std::vector<uint8_t>> FileUtils::readFilePrefix(const std::string &file_path, size_t max_bytes)
{
    std::ifstream file(file_path, std::ios::binary);
    if (!file.is_open())
        return std::nullopt;
    std::vector<uint8_t> buffer(max_bytes);
    file.read(reinterpret_cast<char *>(buffer.data()), static_cast<std::streamsize>(max_bytes));
    if (file.bad())
        return std::nullopt;
    buffer.resize(static_cast<size_t>(file.gcount()));
    return buffer;
}

std::string FileUtils::toLower(const std::string &value)
{
    std::string result = value;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c)
                   { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::string FileUtils::getFileExtension(const std::string &file_path)
{
    std::string ext = fs::path(file_path).extension().string();
    if (ext.size() <= 1)
        return "";
    return toLower(ext.substr(1));
}

size_t FileUtils::removeEmptyDirectories(const std::string &root)
{
    size_t removed = 0;
    std::function<bool(const fs::path &)> prune = [&](const fs::path &dir) -> bool
    {
        bool empty = true;
        try
        {
            std::vector<fs::path> children;
            for (const auto &entry : fs::directory_iterator(dir))
            {
                children.push_back(entry.path());
            }
            for (const auto &child : children)
            {
                std::error_code ec;
                if (fs::is_directory(fs::symlink_status(child, ec)) && prune(child))
                {
                    if (fs::remove(child, ec))
                    {
                        Logger::info("Removed empty directory: " + child.string());
                        ++removed;
                        continue;
                    }
                    Logger::warn("Could not remove directory " + child.string() + ": " + ec.message());
                }
                empty = false;
            }
        }
        catch (const fs::filesystem_error &e)
        {
            Logger::warn("Error during directory cleanup of " + dir.string() + ": " + e.what());
            return false;
        }
        return empty;
    };
    prune(fs::path(root));
    return removed;
}

std::string FileMetadata::toString() const
{
    std::stringstream ss;
    ss << "FileMetadata{"
       << "path='" << file_path << "', "
       << "mod_time=" << modification_time << ", "
       << "size=" << file_size << "}";
    return ss.str();
}

std::optional<FileMetadata> FileUtils::getFileMetadata(const std::string &file_path)
{
    struct stat st;
    if (::stat(file_path.c_str(), &st) != 0 || !S_ISREG(st.st_mode))
    {
        return std::nullopt;
    }

    FileMetadata metadata;
    metadata.file_path = file_path;
    metadata.modification_time = st.st_mtime;
    metadata.file_size = static_cast<uint64_t>(st.st_size);
    return metadata;
}
