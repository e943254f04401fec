#include "MediaProbe.h"

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/avutil.h>
#include <libavutil/error.h>
}

namespace AutoScrub {

namespace {

std::string avErrorString(int err) {
    char buf[AV_ERROR_MAX_STRING_SIZE] = {0};
    av_strerror(err, buf, sizeof(buf));
    return buf;
}

} // namespace

MediaProbe::MediaProbe()
    : m_formatCtx(nullptr)
{
}

MediaProbe::~MediaProbe() {
    close();
}

bool MediaProbe::open(const std::string& filePath) {
    close();
    m_lastError.clear();

    int err = avformat_open_input(&m_formatCtx, filePath.c_str(), nullptr, nullptr);
    if (err < 0) {
        m_lastError = "Could not open media file: " + filePath + " (" + avErrorString(err) + ")";
        m_formatCtx = nullptr;
        return false;
    }

    err = avformat_find_stream_info(m_formatCtx, nullptr);
    if (err < 0) {
        m_lastError = "Could not find stream information: " + avErrorString(err);
        close();
        return false;
    }

    for (unsigned int i = 0; i < m_formatCtx->nb_streams; i++) {
        const AVCodecParameters* par = m_formatCtx->streams[i]->codecpar;
        if (par->codec_type == AVMEDIA_TYPE_VIDEO && m_info.videoStreamIndex < 0) {
            m_info.videoStreamIndex = static_cast<int>(i);
            m_info.videoCodec = avcodec_get_name(par->codec_id);
        }
        if (par->codec_type == AVMEDIA_TYPE_AUDIO && m_info.audioStreamIndex < 0) {
            m_info.audioStreamIndex = static_cast<int>(i);
            m_info.audioCodec = avcodec_get_name(par->codec_id);
            m_info.sampleRate = par->sample_rate;
        }
    }

    if (m_formatCtx->duration != AV_NOPTS_VALUE) {
        m_info.duration = m_formatCtx->duration / static_cast<double>(AV_TIME_BASE);
    }
    if (m_formatCtx->iformat && m_formatCtx->iformat->name) {
        m_info.formatName = m_formatCtx->iformat->name;
    }

    return true;
}

void MediaProbe::close() {
    if (m_formatCtx) {
        avformat_close_input(&m_formatCtx);
        m_formatCtx = nullptr;
    }
    m_info = MediaInfo{};
}

bool MediaProbe::requireAudioVideo(const std::string& filePath) {
    if (!open(filePath)) {
        return false;
    }
    if (!m_info.hasVideo()) {
        m_lastError = "No video stream in " + filePath;
        return false;
    }
    if (!m_info.hasAudio()) {
        m_lastError = "No audio stream in " + filePath;
        return false;
    }
    return true;
}

} // namespace AutoScrub
