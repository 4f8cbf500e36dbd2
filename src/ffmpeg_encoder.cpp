/*
* @license
* (C) zachbabanov
*
*/

#include <peerlink/ffmpeg_encoder.hpp>
#include <peerlink/logger.hpp>

#include <fmt/core.h>

#include <chrono>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <mutex>

#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace peerlink::video {

    namespace h264 {

        namespace {
            size_t startCodeLen(const std::vector<uint8_t> &d, size_t p) {
                if (p + 3 < d.size() && d[p] == 0 && d[p + 1] == 0 && d[p + 2] == 0 && d[p + 3] == 1) return 4;
                if (p + 2 < d.size() && d[p] == 0 && d[p + 1] == 0 && d[p + 2] == 1) return 3;
                return 0;
            }

            std::vector<size_t> startCodePositions(const std::vector<uint8_t> &d) {
                std::vector<size_t> starts;
                for (size_t p = 0; p + 2 < d.size(); ++p) {
                    size_t l = startCodeLen(d, p);
                    if (l) {
                        starts.push_back(p);
                        p += l - 1;
                    }
                }
                return starts;
            }
        } // namespace

        std::vector<std::vector<uint8_t>> splitNals(const std::vector<uint8_t> &data) {
            std::vector<std::vector<uint8_t>> nals;
            auto starts = startCodePositions(data);
            for (size_t i = 0; i < starts.size(); ++i) {
                size_t end = (i + 1 < starts.size()) ? starts[i + 1] : data.size();
                nals.emplace_back(data.begin() + starts[i], data.begin() + end);
            }
            return nals;
        }

        uint8_t nalType(const std::vector<uint8_t> &nal) {
            size_t l = startCodeLen(nal, 0);
            if (l == 0 || nal.size() <= l) return 0xFF;
            return nal[l] & 0x1F;
        }

        std::vector<std::vector<uint8_t>> extractCompleteAccessUnits(std::vector<uint8_t> &accum) {
            std::vector<std::vector<uint8_t>> out;
            std::vector<size_t> audStarts;
            for (size_t p : startCodePositions(accum)) {
                size_t l = startCodeLen(accum, p);
                if (p + l < accum.size() && (accum[p + l] & 0x1F) == NAL_AUD) audStarts.push_back(p);
            }
            if (audStarts.empty()) return out;

            // leading bytes before the first delimiter cannot be attributed to a frame
            if (audStarts.front() > 0) {
                LOG_VIDEO_DEBUG("discarding {} bytes before first access unit delimiter", audStarts.front());
            }
            for (size_t i = 0; i + 1 < audStarts.size(); ++i) {
                out.emplace_back(accum.begin() + audStarts[i], accum.begin() + audStarts[i + 1]);
            }
            accum.erase(accum.begin(), accum.begin() + audStarts.back());
            return out;
        }

        bool containsIdr(const std::vector<uint8_t> &accessUnit) {
            for (const auto &nal : splitNals(accessUnit)) {
                if (nalType(nal) == NAL_IDR) return true;
            }
            return false;
        }

    } // namespace h264

    static std::vector<char*> build_argv(const std::string &cmd, const std::vector<std::string> &args) {
        std::vector<char*> argv;
        argv.push_back(const_cast<char*>(cmd.c_str()));
        for (auto &a : args) argv.push_back(const_cast<char*>(a.c_str()));
        argv.push_back(nullptr);
        return argv;
    }

    static void ignoreSigpipeOnce() {
        static std::once_flag once;
        std::call_once(once, [] { std::signal(SIGPIPE, SIG_IGN); });
    }

    std::unique_ptr<EncoderProcess> EncoderProcess::launch(const std::string &cmd, const std::vector<std::string> &args) {
        ignoreSigpipeOnce();

        int inPipe[2];
        int outPipe[2];
        if (pipe(inPipe) != 0) {
            LOG_VIDEO_ERROR("encoder stdin pipe creation failed: {}", strerror(errno));
            return nullptr;
        }
        if (pipe(outPipe) != 0) {
            LOG_VIDEO_ERROR("encoder stdout pipe creation failed: {}", strerror(errno));
            close(inPipe[0]);
            close(inPipe[1]);
            return nullptr;
        }

        // argv is built before fork so the child only calls async-signal-safe functions
        std::vector<char*> argv = build_argv(cmd, args);

        pid_t pid = fork();
        if (pid < 0) {
            LOG_VIDEO_ERROR("encoder fork failed: {}", strerror(errno));
            close(inPipe[0]); close(inPipe[1]);
            close(outPipe[0]); close(outPipe[1]);
            return nullptr;
        }
        if (pid == 0) {
            dup2(inPipe[0], STDIN_FILENO);
            dup2(outPipe[1], STDOUT_FILENO);
            int devnull = open("/dev/null", O_WRONLY);
            if (devnull >= 0) dup2(devnull, STDERR_FILENO);
            close(inPipe[0]); close(inPipe[1]);
            close(outPipe[0]); close(outPipe[1]);
            execvp(cmd.c_str(), argv.data());
            _exit(127);
        }

        close(inPipe[0]);
        close(outPipe[1]);
        std::unique_ptr<EncoderProcess> p(new EncoderProcess());
        p->writeFd_ = inPipe[1];
        p->readFd_ = outPipe[0];
        p->pid_ = pid;
        for (int fd : {p->writeFd_, p->readFd_}) {
            int flags = fcntl(fd, F_GETFL, 0);
            fcntl(fd, F_SETFL, flags | O_NONBLOCK);
        }
        LOG_VIDEO_INFO("Encoder started: cmd='{}' pid={} stdin={} stdout={}", cmd, (int)pid, p->writeFd_, p->readFd_);
        return p;
    }

    EncoderProcess::~EncoderProcess() {
        stop();
    }

    ssize_t EncoderProcess::writeSome(const uint8_t *buf, size_t len) {
        if (writeFd_ < 0) return -1;
        ssize_t n = ::write(writeFd_, buf, len);
        if (n < 0) {
            if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) return 0;
            LOG_VIDEO_WARN("Encoder write error: {}", strerror(errno));
            return -1;
        }
        return n;
    }

    ssize_t EncoderProcess::readSome(uint8_t *buf, size_t len) {
        if (readFd_ < 0) return -1;
        ssize_t n = ::read(readFd_, buf, len);
        if (n == 0) return -1;
        if (n < 0) {
            if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) return 0;
            LOG_VIDEO_WARN("Encoder read error: {}", strerror(errno));
            return -1;
        }
        return n;
    }

    void EncoderProcess::stop() {
        if (writeFd_ >= 0) {
            close(writeFd_);
            writeFd_ = -1;
        }
        if (readFd_ >= 0) {
            close(readFd_);
            readFd_ = -1;
        }
        if (pid_ > 0) {
            kill(pid_, SIGTERM);
            waitpid(pid_, nullptr, 0);
            LOG_VIDEO_INFO("Encoder process terminated pid={}", (int)pid_);
            pid_ = -1;
        }
    }

    FfmpegEncoder::FfmpegEncoder(std::string ffmpegPath) : ffmpegPath_(std::move(ffmpegPath)) {}

    FfmpegEncoder::~FfmpegEncoder() {
        release();
    }

    std::vector<std::string> FfmpegEncoder::buildArgs(const EncoderConfig &cfg, uint32_t inputWidth,
                                                      uint32_t inputHeight) {
        std::string gop = std::to_string(cfg.targetFps);
        std::string kbps = std::to_string(cfg.targetBitrate / 1000) + "k";
        if (inputWidth == 0 || inputHeight == 0) {
            inputWidth = cfg.width;
            inputHeight = cfg.height;
        }
        return {
                "-hide_banner", "-loglevel", "error",
                "-f", "rawvideo",
                "-pix_fmt", "bgra",
                "-s", fmt::format("{}x{}", inputWidth, inputHeight),
                "-r", std::to_string(cfg.targetFps),
                "-i", "-",
                "-an",
                "-vf", fmt::format("scale={}:{}", cfg.width, cfg.height),
                "-c:v", "libx264",
                "-preset", "ultrafast",
                "-tune", "zerolatency",
                "-pix_fmt", "yuv420p",
                "-b:v", kbps,
                "-maxrate", kbps,
                "-bufsize", kbps,
                "-g", gop,
                "-bf", "0",
                "-x264-params", fmt::format("keyint={}:min-keyint={}:scenecut=0:aud=1:repeat-headers=1", gop, gop),
                "-flush_packets", "1",
                "-f", "h264",
                "-"
        };
    }

    Status FfmpegEncoder::configure(const EncoderConfig &cfg) {
        std::lock_guard<std::mutex> lk(mtx_);
        if (cfg.codec != Codec::H264) {
            return Status::err(ErrorKind::ConfigError,
                               fmt::format("codec {} is not supported by {}", codecName(cfg.codec), name()));
        }
        if (configured_ && process_ && cfg == config_) return success();
        config_ = cfg;
        configured_ = true;
        return restart();
    }

    Status FfmpegEncoder::restart() {
        if (process_) process_->stop();
        process_.reset();
        accum_.clear();
        framesSinceStart_ = 0;
        if (inputWidth_ == 0 || inputHeight_ == 0) {
            inputWidth_ = config_.width;
            inputHeight_ = config_.height;
        }

        process_ = EncoderProcess::launch(ffmpegPath_, buildArgs(config_, inputWidth_, inputHeight_));
        if (!process_) {
            return Status::err(ErrorKind::EncodeError, fmt::format("cannot launch '{}'", ffmpegPath_));
        }
        LOG_VIDEO_INFO("{} configured {}x{}@{} {} bps (input {}x{})", name(), config_.width, config_.height,
                       config_.targetFps, config_.targetBitrate, inputWidth_, inputHeight_);
        return success();
    }

    bool FfmpegEncoder::drainOutput(int timeoutMs) {
        uint8_t buf[64 * 1024];
        pollfd pfd{process_->readFd(), POLLIN, 0};
        if (poll(&pfd, 1, timeoutMs) <= 0) return true;
        for (;;) {
            ssize_t n = process_->readSome(buf, sizeof(buf));
            if (n < 0) return false;
            if (n == 0) return true;
            accum_.insert(accum_.end(), buf, buf + n);
        }
    }

    Status FfmpegEncoder::writeFrame(const RawFrame &frame) {
        const size_t rowBytes = (size_t)frame.width * 4;
        const size_t stride = frame.stride ? frame.stride : rowBytes;
        auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(2000);

        for (uint32_t row = 0; row < frame.height; ++row) {
            const uint8_t *p = frame.pixels.data() + row * stride;
            size_t left = rowBytes;
            while (left > 0) {
                if (std::chrono::steady_clock::now() > deadline) {
                    return Status::err(ErrorKind::EncodeError, "timed out feeding the encoder");
                }
                pollfd pfds[2] = {{process_->writeFd(), POLLOUT, 0}, {process_->readFd(), POLLIN, 0}};
                if (poll(pfds, 2, 100) < 0 && errno != EINTR) {
                    return Status::err(ErrorKind::EncodeError, fmt::format("poll failed: {}", strerror(errno)));
                }
                // keep draining stdout so the child never blocks on a full output pipe
                if ((pfds[1].revents & (POLLIN | POLLHUP)) && !drainOutput(0)) {
                    return Status::err(ErrorKind::EncodeError, "encoder process closed its output");
                }
                if (pfds[0].revents & (POLLERR | POLLHUP)) {
                    return Status::err(ErrorKind::EncodeError, "encoder process closed its input");
                }
                if (!(pfds[0].revents & POLLOUT)) continue;
                ssize_t n = process_->writeSome(p, left);
                if (n < 0) return Status::err(ErrorKind::EncodeError, "encoder process exited");
                p += n;
                left -= (size_t)n;
            }
        }
        return success();
    }

    Result<EncodedFrame> FfmpegEncoder::encode(const RawFrame &frame, bool forceKeyframe) {
        std::lock_guard<std::mutex> lk(mtx_);
        if (!configured_) {
            return Result<EncodedFrame>::err(ErrorKind::EncodeError, "encoder not configured");
        }
        if (frame.width == 0 || frame.height == 0) {
            return Result<EncodedFrame>::err(ErrorKind::EncodeError, "empty frame");
        }
        size_t stride = frame.stride ? frame.stride : (size_t)frame.width * 4;
        if (frame.pixels.size() < stride * frame.height) {
            return Result<EncodedFrame>::err(ErrorKind::EncodeError, "frame buffer is smaller than its geometry");
        }

        bool onGop = config_.targetFps == 0 || framesSinceStart_ % config_.targetFps == 0;
        bool inputChanged = frame.width != inputWidth_ || frame.height != inputHeight_;
        if (inputChanged) {
            // capture geometry changed; ffmpeg scales whatever arrives to the configured size
            inputWidth_ = frame.width;
            inputHeight_ = frame.height;
        }
        if (!process_ || inputChanged || (forceKeyframe && !onGop)) {
            Status st = restart();
            if (!st) return st.error();
        }

        Status st = writeFrame(frame);
        if (!st) {
            LOG_VIDEO_WARN("{}: {}", name(), st.error().message);
            process_->stop();
            process_.reset(); // relaunched on the next frame
            return st.error();
        }
        ++framesSinceStart_;

        if (!drainOutput(5)) {
            process_->stop();
            process_.reset();
            return Result<EncodedFrame>::err(ErrorKind::EncodeError, "encoder process exited");
        }

        EncodedFrame out;
        out.captureTimestamp = frame.captureTimestampUs;
        for (auto &au : h264::extractCompleteAccessUnits(accum_)) {
            out.isKeyframe = out.isKeyframe || h264::containsIdr(au);
            out.payload.insert(out.payload.end(), au.begin(), au.end());
        }
        return out;
    }

    void FfmpegEncoder::release() {
        std::lock_guard<std::mutex> lk(mtx_);
        if (process_) {
            process_->stop();
            process_.reset();
        }
        accum_.clear();
        configured_ = false;
    }

} // namespace peerlink::video
