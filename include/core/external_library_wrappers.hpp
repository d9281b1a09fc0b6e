#pragma once

#include <libraw/libraw.h>

extern "C"
{
#include <libavformat/avformat.h>
}

// RAII wrapper for FFmpeg AVFormatContext
class AVFormatContextRAII
{
private:
    AVFormatContext *ctx_;

public:
    AVFormatContextRAII() : ctx_(nullptr) {}
    ~AVFormatContextRAII()
    {
        if (ctx_)
            avformat_close_input(&ctx_);
    }

    AVFormatContext *get() { return ctx_; }
    AVFormatContext **address() { return &ctx_; }

    // Takes ownership of a context from avformat_alloc_context()
    void set(AVFormatContext *ctx)
    {
        if (ctx_)
            avformat_close_input(&ctx_);
        ctx_ = ctx;
    }

    // Disable copy
    AVFormatContextRAII(const AVFormatContextRAII &) = delete;
    AVFormatContextRAII &operator=(const AVFormatContextRAII &) = delete;

    // Allow move
    AVFormatContextRAII(AVFormatContextRAII &&other) noexcept : ctx_(other.ctx_)
    {
        other.ctx_ = nullptr;
    }
};

// RAII wrapper for a LibRaw processor used for metadata only
class LibRawRAII
{
private:
    LibRaw *raw_;

public:
    LibRawRAII() : raw_(nullptr) {}

    ~LibRawRAII() { cleanup(); }

    // Disable copy constructor and assignment
    LibRawRAII(const LibRawRAII &) = delete;
    LibRawRAII &operator=(const LibRawRAII &) = delete;

    // Allow move constructor and assignment
    LibRawRAII(LibRawRAII &&other) noexcept : raw_(other.raw_)
    {
        other.raw_ = nullptr;
    }

    LibRawRAII &operator=(LibRawRAII &&other) noexcept
    {
        if (this != &other)
        {
            cleanup();
            raw_ = other.raw_;
            other.raw_ = nullptr;
        }
        return *this;
    }

    void cleanup()
    {
        if (raw_)
        {
            raw_->recycle();
            delete raw_;
            raw_ = nullptr;
        }
    }

    LibRaw *getRaw() { return raw_; }
    void setRaw(LibRaw *r)
    {
        cleanup();
        raw_ = r;
    }
};
