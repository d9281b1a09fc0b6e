#include "core/extractors/ffmpeg_container_strategy.hpp"
#include "core/external_library_wrappers.hpp"
#include "logging/logger.hpp"
#include <chrono>
#include <mutex>
#include <vector>

extern "C"
{
#include <libavutil/dict.h>
#include <libavutil/error.h>
#include <libavutil/log.h>
}

namespace
{
    // Apple's local-time tag first, then the generic UTC tags
    const std::vector<std::string> CONTAINER_DATE_KEYS = {
        "com.apple.quicktime.creationdate",
        "creation_time",
        "date"};

    struct InterruptDeadline
    {
        std::chrono::steady_clock::time_point deadline;
    };

    int interruptCallback(void *opaque)
    {
        auto *deadline = static_cast<InterruptDeadline *>(opaque);
        return std::chrono::steady_clock::now() > deadline->deadline ? 1 : 0;
    }
}

FfmpegContainerStrategy::FfmpegContainerStrategy(int timeout_ms, const DatePolicy &policy)
    : timeout_ms_(timeout_ms), validator_(policy)
{
    static std::once_flag ffmpeg_log_init;
    std::call_once(ffmpeg_log_init, []()
                   { av_log_set_level(AV_LOG_QUIET); });
}

ExtractionOutcome FfmpegContainerStrategy::tryExtract(const MediaFile &file) const
{
    try
    {
        InterruptDeadline deadline{std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms_)};

        AVFormatContextRAII format_ctx;
        format_ctx.set(avformat_alloc_context());
        if (!format_ctx.get())
        {
            return ExtractionOutcome::failed("Could not allocate format context");
        }
        format_ctx.get()->interrupt_callback.callback = interruptCallback;
        format_ctx.get()->interrupt_callback.opaque = &deadline;

        // On failure avformat_open_input frees the context and nulls the pointer
        int open_result = avformat_open_input(format_ctx.address(), file.path.c_str(), nullptr, nullptr);
        if (open_result < 0)
        {
            if (std::chrono::steady_clock::now() > deadline.deadline)
            {
                return ExtractionOutcome::failed("Container probe timed out after " + std::to_string(timeout_ms_) + " ms");
            }
            char err_buf[AV_ERROR_MAX_STRING_SIZE];
            av_strerror(open_result, err_buf, AV_ERROR_MAX_STRING_SIZE);
            return ExtractionOutcome::failed("Could not open container: " + std::string(err_buf));
        }

        std::vector<AVDictionary *> dictionaries;
        dictionaries.push_back(format_ctx.get()->metadata);
        for (unsigned int i = 0; i < format_ctx.get()->nb_streams; ++i)
        {
            dictionaries.push_back(format_ctx.get()->streams[i]->metadata);
        }

        for (const auto &key : CONTAINER_DATE_KEYS)
        {
            for (AVDictionary *dict : dictionaries)
            {
                if (!dict)
                    continue;
                AVDictionaryEntry *entry = av_dict_get(dict, key.c_str(), nullptr, 0);
                if (!entry || !entry->value)
                    continue;

                auto date = validator_.parseAndValidate(entry->value);
                if (date)
                {
                    Logger::debug("Found container date [" + key + "] in " + file.path + ": " + date->toString());
                    return ExtractionOutcome::found(*date, getName(), getTier());
                }
            }
        }
        return ExtractionOutcome::noDate();
    }
    catch (const std::exception &e)
    {
        return ExtractionOutcome::failed(std::string("Container probe error: ") + e.what());
    }
}
