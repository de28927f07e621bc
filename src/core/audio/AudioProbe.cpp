#include "AudioProbe.h"

extern "C" {
#include <libavformat/avformat.h>
#include <libavutil/avutil.h>
}

#include <QDebug>

std::optional<double> AudioProbe::durationSeconds(const QString& filePath)
{
    AVFormatContext* fmtCtx = nullptr;
    if (avformat_open_input(&fmtCtx, filePath.toUtf8().constData(), nullptr, nullptr) < 0) {
        qDebug() << "[Probe] Cannot open" << filePath;
        return std::nullopt;
    }

    if (avformat_find_stream_info(fmtCtx, nullptr) < 0) {
        avformat_close_input(&fmtCtx);
        return std::nullopt;
    }

    std::optional<double> result;
    if (fmtCtx->duration != AV_NOPTS_VALUE && fmtCtx->duration > 0)
        result = static_cast<double>(fmtCtx->duration) / AV_TIME_BASE;

    avformat_close_input(&fmtCtx);
    return result;
}
