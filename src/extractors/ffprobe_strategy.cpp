#include "core/extractors/ffprobe_strategy.hpp"
#include "logging/logger.hpp"
#include <Poco/Environment.h>
#include <Poco/Exception.h>
#include <Poco/File.h>
#include <Poco/Path.h>
#include <Poco/Pipe.h>
#include <Poco/PipeStream.h>
#include <Poco/Process.h>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <sstream>
#include <thread>

FfprobeStrategy::FfprobeStrategy(const std::string &ffprobe_path, int timeout_ms, const DatePolicy &policy)
    : executable_(locateExecutable(ffprobe_path)), timeout_ms_(timeout_ms), validator_(policy)
{
    if (executable_.empty())
    {
        Logger::info("ffprobe not found (" + ffprobe_path + "), videos use the in-process container parser");
    }
    else
    {
        Logger::debug("Using ffprobe at " + executable_);
    }
}

std::string FfprobeStrategy::locateExecutable(const std::string &ffprobe_path)
{
    if (ffprobe_path.empty())
    {
        return "";
    }

    try
    {
        if (ffprobe_path.find('/') != std::string::npos)
        {
            Poco::File candidate(ffprobe_path);
            return (candidate.exists() && candidate.canExecute()) ? ffprobe_path : "";
        }

        Poco::Path found;
        if (Poco::Path::find(Poco::Environment::get("PATH", ""), ffprobe_path, found))
        {
            return found.toString();
        }
    }
    catch (const Poco::Exception &e)
    {
        Logger::warn("ffprobe lookup failed: " + e.displayText());
    }
    return "";
}

ExtractionOutcome FfprobeStrategy::tryExtract(const MediaFile &file) const
{
    if (!isAvailable())
    {
        return ExtractionOutcome::failed("ffprobe not available");
    }

    try
    {
        Poco::Process::Args args = {
            "-v", "quiet",
            "-show_entries", "format_tags=creation_time:stream_tags=creation_time",
            "-of", "default=noprint_wrappers=1:nokey=1",
            file.path};

        Poco::Pipe out_pipe;
        Poco::ProcessHandle handle = Poco::Process::launch(executable_, args, nullptr, &out_pipe, nullptr);

        // Watchdog kills the probe once the deadline passes; the read below then hits EOF
        std::mutex mutex;
        std::condition_variable cv;
        bool finished = false;
        bool timed_out = false;
        std::thread watchdog([&]()
                             {
            std::unique_lock<std::mutex> lock(mutex);
            if (!cv.wait_for(lock, std::chrono::milliseconds(timeout_ms_), [&]() { return finished; }))
            {
                timed_out = true;
                try
                {
                    Poco::Process::kill(handle);
                }
                catch (const Poco::Exception &e)
                {
                    Logger::debug("ffprobe kill failed: " + e.displayText());
                }
            } });

        std::string output;
        int exit_code = -1;
        try
        {
            Poco::PipeInputStream istr(out_pipe);
            std::string line;
            while (std::getline(istr, line))
            {
                output += line + "\n";
            }
            exit_code = handle.wait();
        }
        catch (...)
        {
            {
                std::lock_guard<std::mutex> lock(mutex);
                finished = true;
            }
            cv.notify_one();
            watchdog.join();
            throw;
        }

        {
            std::lock_guard<std::mutex> lock(mutex);
            finished = true;
        }
        cv.notify_one();
        watchdog.join();

        if (timed_out)
        {
            return ExtractionOutcome::failed("ffprobe timed out after " + std::to_string(timeout_ms_) + " ms");
        }
        if (exit_code != 0)
        {
            return ExtractionOutcome::failed("ffprobe exited with code " + std::to_string(exit_code));
        }

        std::istringstream lines(output);
        std::string line;
        while (std::getline(lines, line))
        {
            auto date = validator_.parseAndValidate(line);
            if (date)
            {
                Logger::debug("Found ffprobe creation_time in " + file.path + ": " + date->toString());
                return ExtractionOutcome::found(*date, getName(), getTier());
            }
        }
        return ExtractionOutcome::noDate();
    }
    catch (const Poco::Exception &e)
    {
        return ExtractionOutcome::failed("ffprobe launch failed: " + e.displayText());
    }
    catch (const std::exception &e)
    {
        return ExtractionOutcome::failed(std::string("ffprobe error: ") + e.what());
    }
}
