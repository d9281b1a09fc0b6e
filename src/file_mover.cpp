#include "core/file_mover.hpp"
#include "logging/logger.hpp"
#include <cerrno>
#include <chrono>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <sys/stat.h>
#include <unistd.h>
#include <vector>

namespace fs = std::filesystem;

namespace
{
    std::string errnoText(int err)
    {
        return std::strerror(err);
    }

    bool linkUnsupported(int err)
    {
        return err == EXDEV || err == EPERM || err == ENOTSUP || err == EOPNOTSUPP || err == EMLINK || err == ENOSYS;
    }

    // Closes the descriptor on scope exit
    class FdGuard
    {
    public:
        explicit FdGuard(int fd) : fd_(fd) {}
        ~FdGuard()
        {
            if (fd_ >= 0)
                ::close(fd_);
        }
        int get() const { return fd_; }
        int release()
        {
            int fd = fd_;
            fd_ = -1;
            return fd;
        }

        FdGuard(const FdGuard &) = delete;
        FdGuard &operator=(const FdGuard &) = delete;

    private:
        int fd_;
    };
}

bool FileMover::tryLinkMove(const std::string &source, const std::string &destination, TransferError &error)
{
    if (::link(source.c_str(), destination.c_str()) == 0)
    {
        return true;
    }

    int err = errno;
    if (err == EEXIST)
    {
        error.kind = ErrorKind::DESTINATION_CONFLICT;
        error.message = "Destination appeared unexpectedly: " + destination;
    }
    else if (err == ENOENT && ::access(source.c_str(), F_OK) != 0)
    {
        error.kind = ErrorKind::SOURCE_UNREADABLE;
        error.message = "Source vanished: " + source;
    }
    // Anything else is retried as a byte copy, which classifies the failure precisely
    return false;
}

bool FileMover::publish(const std::string &temporary, const std::string &destination, TransferError &error)
{
    if (::link(temporary.c_str(), destination.c_str()) == 0)
    {
        ::unlink(temporary.c_str());
        return true;
    }

    int err = errno;
    if (err == EEXIST)
    {
        error.kind = ErrorKind::DESTINATION_CONFLICT;
        error.message = "Destination appeared unexpectedly: " + destination;
        return false;
    }
    if (!linkUnsupported(err))
    {
        error.kind = ErrorKind::DESTINATION_WRITE_FAILED;
        error.message = "Cannot finalize " + destination + ": " + errnoText(err);
        return false;
    }

    // Filesystems without hard links: rename is atomic but may clobber, so check first
    if (::access(destination.c_str(), F_OK) == 0)
    {
        error.kind = ErrorKind::DESTINATION_CONFLICT;
        error.message = "Destination appeared unexpectedly: " + destination;
        return false;
    }
    if (::rename(temporary.c_str(), destination.c_str()) != 0)
    {
        error.kind = ErrorKind::DESTINATION_WRITE_FAILED;
        error.message = "Cannot finalize " + destination + ": " + errnoText(errno);
        return false;
    }
    return true;
}

bool FileMover::copyViaTemporary(const std::string &source, const std::string &destination, TransferError &error)
{
    FdGuard in(::open(source.c_str(), O_RDONLY | O_CLOEXEC));
    if (in.get() < 0)
    {
        error.kind = ErrorKind::SOURCE_UNREADABLE;
        error.message = "Cannot open source " + source + ": " + errnoText(errno);
        return false;
    }

    struct stat source_stat;
    if (::fstat(in.get(), &source_stat) != 0)
    {
        error.kind = ErrorKind::SOURCE_UNREADABLE;
        error.message = "Cannot stat source " + source + ": " + errnoText(errno);
        return false;
    }

    fs::path destination_path(destination);
    std::string pattern = (destination_path.parent_path() / ("." + destination_path.filename().string() + ".XXXXXX" + TEMPORARY_SUFFIX)).string();
    std::vector<char> temporary_name(pattern.begin(), pattern.end());
    temporary_name.push_back('\0');

    FdGuard out(::mkstemps(temporary_name.data(), static_cast<int>(std::strlen(TEMPORARY_SUFFIX))));
    if (out.get() < 0)
    {
        error.kind = ErrorKind::DESTINATION_WRITE_FAILED;
        error.message = "Cannot create temporary file in " + destination_path.parent_path().string() + ": " + errnoText(errno);
        return false;
    }
    std::string temporary(temporary_name.data());

    auto fail = [&](ErrorKind kind, const std::string &message)
    {
        error.kind = kind;
        error.message = message;
        ::close(out.release());
        ::unlink(temporary.c_str());
        return false;
    };

    std::vector<char> buffer(1 << 16);
    while (true)
    {
        ssize_t bytes_read = ::read(in.get(), buffer.data(), buffer.size());
        if (bytes_read < 0)
        {
            if (errno == EINTR)
                continue;
            return fail(ErrorKind::SOURCE_UNREADABLE, "Read error on " + source + ": " + errnoText(errno));
        }
        if (bytes_read == 0)
            break;

        ssize_t offset = 0;
        while (offset < bytes_read)
        {
            ssize_t written = ::write(out.get(), buffer.data() + offset, static_cast<size_t>(bytes_read - offset));
            if (written < 0)
            {
                if (errno == EINTR)
                    continue;
                return fail(ErrorKind::DESTINATION_WRITE_FAILED, "Write error on " + temporary + ": " + errnoText(errno));
            }
            offset += written;
        }
    }

    // Keep permission bits and modification time of the source
    if (::fchmod(out.get(), source_stat.st_mode & 0777) != 0)
    {
        Logger::debug("Could not preserve permissions on " + temporary + ": " + errnoText(errno));
    }
    struct timespec times[2];
    times[0] = source_stat.st_atim;
    times[1] = source_stat.st_mtim;
    if (::futimens(out.get(), times) != 0)
    {
        Logger::debug("Could not preserve timestamps on " + temporary + ": " + errnoText(errno));
    }

    if (::fsync(out.get()) != 0)
    {
        return fail(ErrorKind::DESTINATION_WRITE_FAILED, "fsync failed on " + temporary + ": " + errnoText(errno));
    }
    if (::close(out.release()) != 0)
    {
        ::unlink(temporary.c_str());
        error.kind = ErrorKind::DESTINATION_WRITE_FAILED;
        error.message = "close failed on " + temporary + ": " + errnoText(errno);
        return false;
    }

    if (!publish(temporary, destination, error))
    {
        ::unlink(temporary.c_str());
        return false;
    }
    return true;
}

ProcessingResult FileMover::apply(const PlacementDecision &decision, const MediaFile &file) const
{
    auto start = std::chrono::steady_clock::now();
    ProcessingResult result;
    result.source_path = file.path;
    result.kind = file.kind;
    result.has_decision = true;
    result.decision = decision;

    if (decision.action == PlacementAction::SKIP_DUPLICATE)
    {
        result.success = true;
        return result;
    }

    std::error_code ec;
    fs::create_directories(fs::path(decision.destination_path).parent_path(), ec);
    if (ec)
    {
        result.error_kind = ErrorKind::DESTINATION_WRITE_FAILED;
        result.error_message = "Cannot create directory for " + decision.destination_path + ": " + ec.message();
        return result;
    }

    TransferError error;
    bool placed = false;
    bool linked = false;
    if (decision.transfer == TransferMode::MOVE)
    {
        linked = tryLinkMove(file.path, decision.destination_path, error);
        placed = linked;
    }
    if (!placed && error.kind == ErrorKind::NONE)
    {
        placed = copyViaTemporary(file.path, decision.destination_path, error);
    }

    if (!placed)
    {
        result.error_kind = error.kind;
        result.error_message = error.message;
        return result;
    }

    if (decision.transfer == TransferMode::MOVE)
    {
        // Only drop the source once the destination is confirmed in place
        struct stat source_stat;
        struct stat destination_stat;
        if (::stat(decision.destination_path.c_str(), &destination_stat) != 0 ||
            ::stat(file.path.c_str(), &source_stat) != 0 ||
            destination_stat.st_size != source_stat.st_size)
        {
            result.error_kind = ErrorKind::DESTINATION_WRITE_FAILED;
            result.error_message = "Destination could not be verified, source kept: " + decision.destination_path;
            return result;
        }
        if (::unlink(file.path.c_str()) != 0)
        {
            result.error_message = "Placed, but source could not be removed: " + errnoText(errno);
            Logger::warn(result.error_message + " (" + file.path + ")");
        }
    }

    result.success = true;
    result.applied = true;
    result.processing_time_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                                    std::chrono::steady_clock::now() - start)
                                    .count();
    Logger::debug(std::string(linked ? "Linked " : "Copied ") + file.path + " -> " + decision.destination_path);
    return result;
}
