/********************************************************************************
 *                               Splice Project                                 *
 *                  Fragmented Stream Reconstruction Toolkit                    *
 *                                                                              *
 *  Copyright (c) 2025 Oinkognito                                               *
 *  All rights reserved.                                                        *
 *                                                                              *
 *  License:                                                                    *
 *  This software is licensed under the BSD-3-Clause License. You may use,      *
 *  modify, and distribute this software under the conditions stated in the     *
 *  LICENSE file provided in the project root.                                  *
 *                                                                              *
 *  Warranty Disclaimer:                                                        *
 *  This software is provided "AS IS", without any warranties or guarantees,    *
 *  either expressed or implied, including but not limited to fitness for a     *
 *  particular purpose.                                                         *
 *                                                                              *
 *  Contributions:                                                              *
 *  Contributions are welcome. By submitting code, you agree to license your    *
 *  contributions under the same BSD-3-Clause terms.                            *
 *                                                                              *
 *  See LICENSE file for full legal details.                                    *
 ********************************************************************************/

#include <libsplice/ffmpeg/decoder/entry.hpp>

#include <optional>

#include <libsplice/common/error.hpp>
#include <libsplice/common/macros.hpp>
#include <libsplice/ffmpeg/misc/avlog.hpp>
#include <libsplice/log-macros.hpp>

extern "C"
{
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/channel_layout.h>
#include <libavutil/samplefmt.h>
#include <libswresample/swresample.h>
#include <libswscale/swscale.h>
}

using Decoder = libsplice::log::DECODER;

inline constexpr double FallbackFrameRate = 25.0;
inline constexpr int    PcmBitDepth       = 16;

namespace libsplice::ffmpeg
{

namespace
{

void check(int ret, const std::string& what)
{
  if (ret < 0)
    throw DecodeError(what + ": " + av_error_string(ret));
}

auto open_input(const fs::path& path) -> AVFormatContext*
{
  AVFormatContext* ctx = nullptr;
  check(avformat_open_input(&ctx, path.c_str(), nullptr, nullptr),
        "Cannot open fragment " + path.string());

  const int ret = avformat_find_stream_info(ctx, nullptr);
  if (ret < 0)
  {
    avformat_close_input(&ctx);
    check(ret, "Cannot read stream info of " + path.string());
  }
  return ctx;
}

auto open_codec(AVStream* stream) -> AVCodecContext*
{
  const AVCodec* codec = avcodec_find_decoder(stream->codecpar->codec_id);
  if (!codec)
    throw DecodeError(std::string("No decoder for codec ") +
                      avcodec_get_name(stream->codecpar->codec_id));

  AVCodecContext* ctx = avcodec_alloc_context3(codec);
  if (!ctx)
    throw DecodeError("Cannot allocate decoder context");

  int ret = avcodec_parameters_to_context(ctx, stream->codecpar);
  if (ret >= 0)
    ret = avcodec_open2(ctx, codec, nullptr);
  if (ret < 0)
  {
    avcodec_free_context(&ctx);
    check(ret, std::string("Cannot open decoder ") + codec->name);
  }
  return ctx;
}

void print_stream_metadata(AVFormatContext* fmt, AVCodecParameters* params)
{
  log::DBG<Decoder>("-------------- Fragment Stream Metadata -----------------");
  log::DBG<Decoder>("Codec:           {}", avcodec_get_name(params->codec_id));
  log::DBG<Decoder>("Type:            {}", av_get_media_type_string(params->codec_type));
  log::DBG<Decoder>("Bitrate:         {} kbps", (double)params->bit_rate / 1000.0);
  if (params->codec_type == AVMEDIA_TYPE_VIDEO)
    log::DBG<Decoder>("Dimensions:      {}x{}", params->width, params->height);
  else
    log::DBG<Decoder>("Sample Rate:     {} Hz, {} channels", params->sample_rate,
                      params->ch_layout.nb_channels);
  log::DBG<Decoder>("Format:          {}", fmt->iformat->long_name);
}

// Whole audio track as S16 interleaved, or nothing when there is no audio stream
auto extract_audio(const fs::path& path) -> std::optional<stitch::FragmentAudio>
{
  AVFormatContext* fmt_ctx   = open_input(path);
  AVCodecContext*  codec_ctx = nullptr;
  SwrContext*      swr_ctx   = nullptr;
  AVPacket*        packet    = nullptr;
  AVFrame*         frame     = nullptr;

  auto cleanup = [&]()
  {
    av_frame_free(&frame);
    av_packet_free(&packet);
    swr_free(&swr_ctx);
    avcodec_free_context(&codec_ctx);
    avformat_close_input(&fmt_ctx);
  };

  try
  {
    const int stream_idx = av_find_best_stream(fmt_ctx, AVMEDIA_TYPE_AUDIO, -1, -1, nullptr, 0);
    if (stream_idx < 0)
    {
      cleanup();
      return std::nullopt;
    }

    AVStream* stream = fmt_ctx->streams[stream_idx];
    print_stream_metadata(fmt_ctx, stream->codecpar);
    codec_ctx = open_codec(stream);

    AVChannelLayout layout{};
    if (codec_ctx->ch_layout.order == AV_CHANNEL_ORDER_UNSPEC)
      av_channel_layout_default(&layout, codec_ctx->ch_layout.nb_channels);
    else
      check(av_channel_layout_copy(&layout, &codec_ctx->ch_layout), "Cannot copy channel layout");

    const int rate = codec_ctx->sample_rate;
    int       ret  = swr_alloc_set_opts2(&swr_ctx, &layout, AV_SAMPLE_FMT_S16, rate, &layout,
                                         codec_ctx->sample_fmt, rate, 0, nullptr);
    av_channel_layout_uninit(&layout);
    check(ret, "Cannot configure resampler");
    check(swr_init(swr_ctx), "Cannot initialize resampler");

    packet = av_packet_alloc();
    frame  = av_frame_alloc();
    if (!packet || !frame)
      throw DecodeError("Failed to allocate packet or frame");

    stitch::FragmentAudio out{
      .format = {.channels    = codec_ctx->ch_layout.nb_channels,
                 .sample_rate = rate,
                 .bit_depth   = PcmBitDepth},
      .samples = {}};
    const int bytes_per_frame = out.format.bytes_per_frame();

    auto convert = [&](const uint8_t** in, int in_samples)
    {
      const int capacity = swr_get_out_samples(swr_ctx, in_samples);
      if (capacity <= 0)
        return 0;

      const std::size_t offset = out.samples.size();
      out.samples.resize(offset + static_cast<std::size_t>(capacity) * bytes_per_frame);
      uint8_t* dst = out.samples.data() + offset;

      const int got = swr_convert(swr_ctx, &dst, capacity, in, in_samples);
      if (got < 0)
        out.samples.resize(offset);
      check(got, "Error resampling audio");
      out.samples.resize(offset + static_cast<std::size_t>(got) * bytes_per_frame);
      return got;
    };

    auto drain = [&]()
    {
      int r = 0;
      while ((r = avcodec_receive_frame(codec_ctx, frame)) == 0)
      {
        convert(const_cast<const uint8_t**>(frame->extended_data), frame->nb_samples);
        av_frame_unref(frame);
      }
      if (r != AVERROR(EAGAIN) && r != AVERROR_EOF)
        check(r, "Error receiving audio frame");
    };

    while ((ret = av_read_frame(fmt_ctx, packet)) >= 0)
    {
      if (packet->stream_index == stream_idx)
      {
        ret = avcodec_send_packet(codec_ctx, packet);
        av_packet_unref(packet);
        check(ret, "Error sending audio packet");
        drain();
      }
      else
        av_packet_unref(packet);
    }
    if (ret != AVERROR_EOF)
      check(ret, "Error reading fragment");

    check(avcodec_send_packet(codec_ctx, nullptr), "Error flushing audio decoder");
    drain();

    // resampler delay
    while (convert(nullptr, 0) > 0)
    {
    }

    log::DBG<Decoder>("Audio decoded: {} bytes, {} Hz, {} channels", out.samples.size(), rate,
                      out.format.channels);

    cleanup();
    return out;
  }
  catch (...)
  {
    cleanup();
    throw;
  }
}

class FFmpegDecodedFragment final : public stitch::IDecodedFragment
{
public:
  explicit FFmpegDecodedFragment(utils::TempFile file) : m_file(std::move(file))
  {
    try
    {
      m_audio = extract_audio(m_file.path());
      open_video();
    }
    catch (...)
    {
      cleanup();
      throw;
    }
  }

  ~FFmpegDecodedFragment() override { cleanup(); }

  FFmpegDecodedFragment(const FFmpegDecodedFragment&)                    = delete;
  auto operator=(const FFmpegDecodedFragment&) -> FFmpegDecodedFragment& = delete;

  [[nodiscard]] auto duration() const -> Seconds override { return m_duration; }
  [[nodiscard]] auto fps() const -> double override { return m_fps; }

  auto frame_at(Seconds local_time) -> stitch::VideoFrame override;

  auto take_audio() -> std::optional<stitch::FragmentAudio> override
  {
    return std::exchange(m_audio, std::nullopt);
  }

private:
  utils::TempFile  m_file; // destroyed after cleanup() closed everything reading it
  AVFormatContext* m_fmtCtx   = nullptr;
  AVCodecContext*  m_codecCtx = nullptr;
  SwsContext*      m_swsCtx   = nullptr;
  AVPacket*        m_packet   = nullptr;
  AVFrame*         m_current  = nullptr; // last frame shown
  AVFrame*         m_pending  = nullptr; // decoded ahead, not shown yet
  StreamIdx        m_videoIdx = -1;

  Seconds m_duration    = 0;
  double  m_fps         = 0;
  Seconds m_origin      = 0; // timestamp of the first frame
  Seconds m_currentTime = 0;
  Seconds m_pendingTime = 0;
  long    m_decoded     = 0;
  bool    m_haveCurrent = false;
  bool    m_havePending = false;
  bool    m_flushing    = false;

  stitch::VideoFrame m_rgb;
  bool               m_rgbValid = false;

  std::optional<stitch::FragmentAudio> m_audio;

  void open_video();
  auto decode_next(AVFrame* out) -> bool;
  auto frame_time(const AVFrame* frame) const -> Seconds;
  auto convert(const AVFrame* frame) -> stitch::VideoFrame;
  void cleanup();
};

void FFmpegDecodedFragment::open_video()
{
  m_fmtCtx   = open_input(m_file.path());
  m_videoIdx = av_find_best_stream(m_fmtCtx, AVMEDIA_TYPE_VIDEO, -1, -1, nullptr, 0);
  if (m_videoIdx < 0)
    throw DecodeError("Fragment " + m_file.path().string() + " has no video stream");

  AVStream* stream = m_fmtCtx->streams[m_videoIdx];
  print_stream_metadata(m_fmtCtx, stream->codecpar);
  m_codecCtx = open_codec(stream);

  m_packet  = av_packet_alloc();
  m_current = av_frame_alloc();
  m_pending = av_frame_alloc();
  if (!m_packet || !m_current || !m_pending)
    throw DecodeError("Failed to allocate packet or frames");

  if (m_fmtCtx->duration != AV_NOPTS_VALUE)
    m_duration = static_cast<double>(m_fmtCtx->duration) / AV_TIME_BASE;
  else if (stream->duration != AV_NOPTS_VALUE)
    m_duration = static_cast<double>(stream->duration) * av_q2d(stream->time_base);
  else
    throw DecodeError("Fragment " + m_file.path().string() + " has no known duration");

  const AVRational rate = av_guess_frame_rate(m_fmtCtx, stream, nullptr);
  if (rate.num > 0 && rate.den > 0)
    m_fps = av_q2d(rate);
  else
  {
    log::WARN<Decoder>("Unknown frame rate, assuming {} fps", FallbackFrameRate);
    m_fps = FallbackFrameRate;
  }
}

auto FFmpegDecodedFragment::decode_next(AVFrame* out) -> bool
{
  while (true)
  {
    int ret = avcodec_receive_frame(m_codecCtx, out);
    if (ret == 0)
    {
      ++m_decoded;
      return true;
    }
    if (ret == AVERROR_EOF)
      return false;
    if (ret != AVERROR(EAGAIN))
      check(ret, "Error receiving video frame");

    ret = av_read_frame(m_fmtCtx, m_packet);
    if (ret == AVERROR_EOF)
    {
      if (m_flushing)
        return false;
      check(avcodec_send_packet(m_codecCtx, nullptr), "Error flushing video decoder");
      m_flushing = true;
      continue;
    }
    check(ret, "Error reading fragment");

    if (m_packet->stream_index == m_videoIdx)
    {
      ret = avcodec_send_packet(m_codecCtx, m_packet);
      av_packet_unref(m_packet);
      check(ret, "Error sending video packet");
    }
    else
      av_packet_unref(m_packet);
  }
}

auto FFmpegDecodedFragment::frame_time(const AVFrame* frame) const -> Seconds
{
  int64_t ts = frame->best_effort_timestamp;
  if (ts == AV_NOPTS_VALUE)
    ts = frame->pts;
  if (ts == AV_NOPTS_VALUE)
    return static_cast<double>(m_decoded - 1) / m_fps;
  return static_cast<double>(ts) * av_q2d(m_fmtCtx->streams[m_videoIdx]->time_base);
}

auto FFmpegDecodedFragment::frame_at(Seconds local_time) -> stitch::VideoFrame
{
  if (!m_haveCurrent)
  {
    if (!decode_next(m_current))
      throw DecodeError("Fragment " + m_file.path().string() + " has no video frames");
    m_haveCurrent = true;
    m_origin      = frame_time(m_current);
    m_currentTime = 0;
  }

  // forward only: earlier requests get the frame already shown
  while (true)
  {
    if (!m_havePending)
    {
      if (!decode_next(m_pending))
        break;
      m_havePending = true;
      m_pendingTime = frame_time(m_pending) - m_origin;
    }

    if (m_pendingTime > local_time)
      break;

    av_frame_unref(m_current);
    av_frame_move_ref(m_current, m_pending);
    m_currentTime = m_pendingTime;
    m_havePending = false;
    m_rgbValid    = false;
  }

  if (!m_rgbValid)
  {
    m_rgb      = convert(m_current);
    m_rgbValid = true;
  }
  return m_rgb;
}

auto FFmpegDecodedFragment::convert(const AVFrame* frame) -> stitch::VideoFrame
{
  const int width  = frame->width;
  const int height = frame->height;

  m_swsCtx = sws_getCachedContext(m_swsCtx, width, height, static_cast<AVPixelFormat>(frame->format),
                                  width, height, AV_PIX_FMT_RGB24, SWS_BILINEAR, nullptr, nullptr,
                                  nullptr);
  if (!m_swsCtx)
    throw DecodeError("Cannot create RGB24 converter");

  stitch::VideoFrame out{.width = width, .height = height, .rgb24 = {}};
  out.rgb24.resize(static_cast<std::size_t>(width) * height * 3);

  uint8_t* dst[1]        = {out.rgb24.data()};
  int      dst_stride[1] = {width * 3};
  sws_scale(m_swsCtx, frame->data, frame->linesize, 0, height, dst, dst_stride);

  return out;
}

void FFmpegDecodedFragment::cleanup()
{
  sws_freeContext(m_swsCtx);
  m_swsCtx = nullptr;
  av_frame_free(&m_pending);
  av_frame_free(&m_current);
  av_packet_free(&m_packet);
  avcodec_free_context(&m_codecCtx);
  avformat_close_input(&m_fmtCtx);
}

} // namespace

auto FFmpegFragmentDecoder::open(const NetResponse& bytes, utils::ScratchDir& scratch)
  -> std::unique_ptr<stitch::IDecodedFragment>
{
  utils::TempFile file(scratch.unique_file("fragment", macros::MP4_FILE_EXT));
  utils::FileUtil<fs::path>::writeFile(file.path(), bytes);

  log::DBG<Decoder>("Fragment written to {} ({} bytes)", file.path().string(), bytes.size());
  return std::make_unique<FFmpegDecodedFragment>(std::move(file));
}

} // namespace libsplice::ffmpeg
