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

#include <libsplice/ffmpeg/muxer/entry.hpp>

#include <algorithm>
#include <cmath>
#include <fstream>
#include <vector>

#include <libsplice/common/error.hpp>
#include <libsplice/common/macros.hpp>
#include <libsplice/ffmpeg/misc/avlog.hpp>
#include <libsplice/log-macros.hpp>

extern "C"
{
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/channel_layout.h>
#include <libavutil/mathematics.h>
#include <libavutil/opt.h>
#include <libswresample/swresample.h>
#include <libswscale/swscale.h>
}

using Muxer = libsplice::log::MUXER;

inline constexpr int64_t AudioBitrate       = 128000;
inline constexpr int64_t Mpeg4Bitrate       = 4000000;
inline constexpr int     VideoGopSize       = 12;
inline constexpr int     DefaultAacFrameLen = 1024;

namespace libsplice::ffmpeg
{

namespace
{

void check(int ret, const std::string& what)
{
  if (ret < 0)
    throw MuxError(what + ": " + av_error_string(ret));
}

auto open_output(const fs::path& path) -> AVFormatContext*
{
  AVFormatContext* ctx = nullptr;
  check(avformat_alloc_output_context2(&ctx, nullptr, nullptr, path.c_str()),
        "Cannot pick an output format for " + path.string());
  return ctx;
}

void open_output_file(AVFormatContext* ctx, const fs::path& path)
{
  if (!(ctx->oformat->flags & AVFMT_NOFILE))
    check(avio_open(&ctx->pb, path.c_str(), AVIO_FLAG_WRITE), "Cannot open " + path.string());
}

void close_output(AVFormatContext*& ctx)
{
  if (!ctx)
    return;
  if (!(ctx->oformat->flags & AVFMT_NOFILE) && ctx->pb)
    avio_closep(&ctx->pb);
  avformat_free_context(ctx);
  ctx = nullptr;
}

auto find_video_encoder() -> const AVCodec*
{
  const AVCodec* codec = avcodec_find_encoder(AV_CODEC_ID_H264);
  if (!codec)
  {
    log::WARN<Muxer>("No H.264 encoder available, falling back to MPEG-4 Part 2");
    codec = avcodec_find_encoder(AV_CODEC_ID_MPEG4);
  }
  if (!codec)
    throw MuxError("Neither an H.264 nor an MPEG-4 encoder is available");
  return codec;
}

// Drains every packet the encoder has ready into the output
void write_packets(AVCodecContext* enc, AVFormatContext* out, AVStream* stream, AVPacket* pkt)
{
  int ret = 0;
  while ((ret = avcodec_receive_packet(enc, pkt)) == 0)
  {
    av_packet_rescale_ts(pkt, enc->time_base, stream->time_base);
    pkt->stream_index = stream->index;
    check(av_interleaved_write_frame(out, pkt), "Error writing packet");
  }
  if (ret != AVERROR(EAGAIN) && ret != AVERROR_EOF)
    check(ret, "Error encoding");
}

struct VideoPass
{
  AVFormatContext* out = nullptr;
  AVCodecContext*  enc = nullptr;
  SwsContext*      sws = nullptr;
  AVFrame*         yuv = nullptr;
  AVPacket*        pkt = nullptr;

  VideoPass() = default;
  VideoPass(const VideoPass&)                    = delete;
  auto operator=(const VideoPass&) -> VideoPass& = delete;

  ~VideoPass()
  {
    av_packet_free(&pkt);
    av_frame_free(&yuv);
    sws_freeContext(sws);
    avcodec_free_context(&enc);
    close_output(out);
  }
};

struct MuxPass
{
  AVFormatContext* in    = nullptr;
  AVFormatContext* out   = nullptr;
  AVCodecContext*  enc   = nullptr;
  SwrContext*      swr   = nullptr;
  AVFrame*         frame = nullptr;
  AVPacket*        vpkt  = nullptr;
  AVPacket*        apkt  = nullptr;

  MuxPass() = default;
  MuxPass(const MuxPass&)                    = delete;
  auto operator=(const MuxPass&) -> MuxPass& = delete;

  ~MuxPass()
  {
    av_packet_free(&apkt);
    av_packet_free(&vpkt);
    av_frame_free(&frame);
    swr_free(&swr);
    avcodec_free_context(&enc);
    avformat_close_input(&in);
    close_output(out);
  }
};

} // namespace

void MediaMuxer::mux(const stitch::MuxRequest& request, utils::ScratchDir& scratch)
{
  if (request.fps <= 0)
    throw MuxError("Invalid frame rate " + std::to_string(request.fps));
  if (request.duration <= 0)
    throw MuxError("Nothing to write, the timeline is empty");

  utils::TempFile intermediate(scratch.path() /
                               macros::to_string(macros::INTERMEDIATE_VIDEO_NAME));

  log::INFO<Muxer>("Pass 1/2: encoding {:.3f}s of video at {:.3f} fps", request.duration,
                   request.fps);
  const long    frames         = encode_video(request, intermediate.path());
  const Seconds video_duration = static_cast<double>(frames) / request.fps;

  const stitch::AudioStream audio = request.audio ? request.audio() : stitch::AudioStream{};

  log::INFO<Muxer>("Pass 2/2: muxing into {}", request.output.string());
  try
  {
    mux_output(intermediate.path(), audio, video_duration, request.output);
  }
  catch (...)
  {
    // no half-written output
    std::error_code ec;
    fs::remove(request.output, ec);
    throw;
  }

  log::INFO<Muxer>("Wrote {} ({} frames, {:.3f}s)", request.output.string(), frames,
                   video_duration);
}

auto MediaMuxer::encode_video(const stitch::MuxRequest& request, const fs::path& intermediate)
  -> long
{
  const double fps   = request.fps;
  const long   total = stitch::frame_count(fps, request.duration);

  VideoPass          pass;
  stitch::VideoFrame first = request.frames(0.0);

  // YUV420P wants even dimensions
  const int width  = first.width & ~1;
  const int height = first.height & ~1;
  if (width <= 0 || height <= 0)
    throw MuxError(std::format("Cannot encode a {}x{} picture", first.width, first.height));

  pass.out             = open_output(intermediate);
  const AVCodec* codec = find_video_encoder();

  pass.enc = avcodec_alloc_context3(codec);
  if (!pass.enc)
    throw MuxError("Cannot allocate video encoder context");

  const AVRational rate = av_d2q(fps, 100000);
  pass.enc->width       = width;
  pass.enc->height      = height;
  pass.enc->pix_fmt     = AV_PIX_FMT_YUV420P;
  pass.enc->time_base   = av_inv_q(rate);
  pass.enc->framerate   = rate;
  pass.enc->gop_size    = VideoGopSize;

  if (codec->id == AV_CODEC_ID_MPEG4)
    pass.enc->bit_rate = Mpeg4Bitrate;
  else if (av_opt_set(pass.enc->priv_data, "preset", "medium", 0) < 0)
    log::DBG<Muxer>("Encoder {} has no preset option", codec->name);

  if (pass.out->oformat->flags & AVFMT_GLOBALHEADER)
    pass.enc->flags |= AV_CODEC_FLAG_GLOBAL_HEADER;

  check(avcodec_open2(pass.enc, codec, nullptr), std::string("Cannot open encoder ") + codec->name);

  AVStream* stream = avformat_new_stream(pass.out, nullptr);
  if (!stream)
    throw MuxError("Cannot add a video stream");
  check(avcodec_parameters_from_context(stream->codecpar, pass.enc),
        "Cannot copy encoder parameters");
  stream->time_base = pass.enc->time_base;

  open_output_file(pass.out, intermediate);
  check(avformat_write_header(pass.out, nullptr), "Cannot write header");

  pass.yuv = av_frame_alloc();
  pass.pkt = av_packet_alloc();
  if (!pass.yuv || !pass.pkt)
    throw MuxError("Failed to allocate frame or packet");

  pass.yuv->format = AV_PIX_FMT_YUV420P;
  pass.yuv->width  = width;
  pass.yuv->height = height;
  check(av_frame_get_buffer(pass.yuv, 0), "Cannot allocate picture");

  log::DBG<Muxer>("Video encoder {} {}x{}, {} frames", codec->name, width, height, total);

  int last_decile = 0;
  for (long i = 0; i < total; ++i)
  {
    const stitch::VideoFrame frame =
      i == 0 ? std::move(first) : request.frames(static_cast<double>(i) / fps);

    if (frame.width <= 0 || frame.height <= 0 ||
        frame.rgb24.size() < static_cast<std::size_t>(frame.width) * frame.height * 3)
      throw MuxError("Frame " + std::to_string(i) + " has a truncated picture");

    // fragments may change resolution, everything is scaled to the first one
    pass.sws = sws_getCachedContext(pass.sws, frame.width, frame.height, AV_PIX_FMT_RGB24, width,
                                    height, AV_PIX_FMT_YUV420P, SWS_BILINEAR, nullptr, nullptr,
                                    nullptr);
    if (!pass.sws)
      throw MuxError("Cannot create YUV420P converter");

    check(av_frame_make_writable(pass.yuv), "Picture is not writable");

    const uint8_t* src[1]        = {frame.rgb24.data()};
    const int      src_stride[1] = {frame.width * 3};
    sws_scale(pass.sws, src, src_stride, 0, frame.height, pass.yuv->data, pass.yuv->linesize);

    pass.yuv->pts = i;
    check(avcodec_send_frame(pass.enc, pass.yuv), "Error sending frame to encoder");
    write_packets(pass.enc, pass.out, stream, pass.pkt);

    const int percent = static_cast<int>((i + 1) * 100 / total);
    if (percent / 10 > last_decile)
    {
      last_decile = percent / 10;
      log::INFO<Muxer>("Encoding video: {}% ({}/{} frames)", percent, i + 1, total);
    }
  }

  check(avcodec_send_frame(pass.enc, nullptr), "Error flushing encoder");
  write_packets(pass.enc, pass.out, stream, pass.pkt);
  check(av_write_trailer(pass.out), "Cannot write trailer");

  return total;
}

void MediaMuxer::mux_output(const fs::path& intermediate, const stitch::AudioStream& audio,
                            Seconds video_duration, const fs::path& output)
{
  MuxPass pass;

  check(avformat_open_input(&pass.in, intermediate.c_str(), nullptr, nullptr),
        "Cannot reopen " + intermediate.string());
  check(avformat_find_stream_info(pass.in, nullptr), "Cannot read stream info");

  const int video_idx = av_find_best_stream(pass.in, AVMEDIA_TYPE_VIDEO, -1, -1, nullptr, 0);
  check(video_idx, "No video stream in " + intermediate.string());
  AVStream* video_in = pass.in->streams[video_idx];

  pass.out            = open_output(output);
  AVStream* video_out = avformat_new_stream(pass.out, nullptr);
  if (!video_out)
    throw MuxError("Cannot add a video stream");
  check(avcodec_parameters_copy(video_out->codecpar, video_in->codecpar),
        "Cannot copy video parameters");
  video_out->codecpar->codec_tag = 0;
  video_out->time_base           = video_in->time_base;

  AVStream*     audio_out       = nullptr;
  int64_t       audio_limit     = 0;
  int           bytes_per_frame = 0;
  int           frame_samples   = 0;
  std::ifstream pcm;

  if (audio.has_audio())
  {
    const auto& format = *audio.format;
    if (format.bit_depth != 16)
      throw MuxError("Only 16 bit PCM can be muxed, got " + std::to_string(format.bit_depth));

    const AVCodec* aac = avcodec_find_encoder(AV_CODEC_ID_AAC);
    if (!aac)
      throw MuxError("No AAC encoder available");

    pass.enc = avcodec_alloc_context3(aac);
    if (!pass.enc)
      throw MuxError("Cannot allocate audio encoder context");

    pass.enc->sample_fmt  = AV_SAMPLE_FMT_FLTP;
    pass.enc->sample_rate = format.sample_rate;
    pass.enc->bit_rate    = AudioBitrate;
    pass.enc->time_base   = AVRational{1, format.sample_rate};
    av_channel_layout_default(&pass.enc->ch_layout, format.channels);
    if (pass.out->oformat->flags & AVFMT_GLOBALHEADER)
      pass.enc->flags |= AV_CODEC_FLAG_GLOBAL_HEADER;

    check(avcodec_open2(pass.enc, aac, nullptr), "Cannot open AAC encoder");

    audio_out = avformat_new_stream(pass.out, nullptr);
    if (!audio_out)
      throw MuxError("Cannot add an audio stream");
    check(avcodec_parameters_from_context(audio_out->codecpar, pass.enc),
          "Cannot copy encoder parameters");
    audio_out->time_base = pass.enc->time_base;

    check(swr_alloc_set_opts2(&pass.swr, &pass.enc->ch_layout, pass.enc->sample_fmt,
                              format.sample_rate, &pass.enc->ch_layout, AV_SAMPLE_FMT_S16,
                              format.sample_rate, 0, nullptr),
          "Cannot configure resampler");
    check(swr_init(pass.swr), "Cannot initialize resampler");

    frame_samples = pass.enc->frame_size > 0 ? pass.enc->frame_size : DefaultAacFrameLen;

    pass.frame = av_frame_alloc();
    if (!pass.frame)
      throw MuxError("Failed to allocate audio frame");
    pass.frame->format      = pass.enc->sample_fmt;
    pass.frame->sample_rate = format.sample_rate;
    pass.frame->nb_samples  = frame_samples;
    check(av_channel_layout_copy(&pass.frame->ch_layout, &pass.enc->ch_layout),
          "Cannot copy channel layout");
    check(av_frame_get_buffer(pass.frame, 0), "Cannot allocate audio frame");

    audio_limit     = std::llround(video_duration * format.sample_rate);
    bytes_per_frame = format.bytes_per_frame();

    pcm.open(audio.path, std::ios::binary);
    if (!pcm)
      throw MuxError("Cannot open accumulated audio " + audio.path.string());
  }
  else
    log::WARN<Muxer>("No audio was accumulated, writing video only");

  open_output_file(pass.out, output);
  check(avformat_write_header(pass.out, nullptr), "Cannot write header");

  pass.vpkt = av_packet_alloc();
  pass.apkt = av_packet_alloc();
  if (!pass.vpkt || !pass.apkt)
    throw MuxError("Failed to allocate packets");

  auto next_video_packet = [&]() -> bool
  {
    int ret = 0;
    while ((ret = av_read_frame(pass.in, pass.vpkt)) >= 0)
    {
      if (pass.vpkt->stream_index == video_idx)
        return true;
      av_packet_unref(pass.vpkt);
    }
    if (ret != AVERROR_EOF)
      check(ret, "Error reading intermediate video");
    return false;
  };

  std::vector<char> pcm_buffer(static_cast<std::size_t>(frame_samples) * bytes_per_frame);

  bool    video_done = !next_video_packet();
  bool    audio_done = audio_out == nullptr;
  int64_t audio_pts  = 0;

  while (!video_done || !audio_done)
  {
    bool take_video = !video_done;
    if (take_video && !audio_done)
    {
      int64_t video_ts = pass.vpkt->dts;
      if (video_ts == AV_NOPTS_VALUE)
        video_ts = pass.vpkt->pts == AV_NOPTS_VALUE ? 0 : pass.vpkt->pts;
      take_video = av_compare_ts(video_ts, video_in->time_base, audio_pts, pass.enc->time_base) <= 0;
    }

    if (take_video)
    {
      av_packet_rescale_ts(pass.vpkt, video_in->time_base, video_out->time_base);
      pass.vpkt->stream_index = video_out->index;
      pass.vpkt->pos          = -1;
      check(av_interleaved_write_frame(pass.out, pass.vpkt), "Error writing video packet");
      video_done = !next_video_packet();
      continue;
    }

    const auto wanted = static_cast<int>(std::min<int64_t>(frame_samples, audio_limit - audio_pts));
    int        got    = 0;
    if (wanted > 0)
    {
      pcm.read(pcm_buffer.data(), static_cast<std::streamsize>(wanted) * bytes_per_frame);
      got = static_cast<int>(pcm.gcount() / bytes_per_frame);
    }

    if (got == 0)
    {
      check(avcodec_send_frame(pass.enc, nullptr), "Error flushing audio encoder");
      write_packets(pass.enc, pass.out, audio_out, pass.apkt);
      audio_done = true;
      continue;
    }

    pass.frame->nb_samples = frame_samples;
    check(av_frame_make_writable(pass.frame), "Audio frame is not writable");

    const uint8_t* in[1]     = {reinterpret_cast<const uint8_t*>(pcm_buffer.data())};
    const int      converted = swr_convert(pass.swr, pass.frame->data, frame_samples, in, got);
    check(converted, "Error converting audio");

    pass.frame->nb_samples = converted;
    pass.frame->pts        = audio_pts;
    audio_pts += got;

    check(avcodec_send_frame(pass.enc, pass.frame), "Error sending audio to encoder");
    write_packets(pass.enc, pass.out, audio_out, pass.apkt);
  }

  check(av_write_trailer(pass.out), "Cannot write trailer");

  if (audio_out)
    log::DBG<Muxer>("Audio: {} samples muxed (limit {})", audio_pts, audio_limit);
}

} // namespace libsplice::ffmpeg
