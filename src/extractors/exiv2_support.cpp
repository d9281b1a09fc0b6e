#include "core/extractors/exiv2_support.hpp"
#include "logging/logger.hpp"
#include <exiv2/exiv2.hpp>
#include <mutex>

namespace
{
    std::mutex xmp_toolkit_mutex;

    // The XMP toolkit is not reentrant; Exiv2 brackets its calls with this
    void lockXmpToolkit(void *lock_data, bool lock)
    {
        auto *mutex = static_cast<std::mutex *>(lock_data);
        if (lock)
            mutex->lock();
        else
            mutex->unlock();
    }
}

void Exiv2Support::initialize()
{
    static std::once_flag exiv2_init;
    std::call_once(exiv2_init, []()
                   {
        Exiv2::LogMsg::setLevel(Exiv2::LogMsg::mute);
#ifdef EXV_ENABLE_BMFF
        Exiv2::enableBMFF(true);
#endif
        if (!Exiv2::XmpParser::initialize(lockXmpToolkit, &xmp_toolkit_mutex))
        {
            Logger::warn("Exiv2 XMP toolkit failed to initialize, XMP dates will not be read");
        } });
}

bool Exiv2Support::canRead(MediaKind kind)
{
    switch (kind)
    {
    case MediaKind::JPEG:
    case MediaKind::PNG:
    case MediaKind::TIFF:
    case MediaKind::WEBP:
    case MediaKind::HEIF:
    case MediaKind::AVIF:
    case MediaKind::JPEG2000:
    case MediaKind::RAW:
        return true;
    default:
        return false;
    }
}
