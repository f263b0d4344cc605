// Copyright 2022-2026 Open Research Institute, Inc.
//
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "SampleSource.h"

#include <atomic>
#include <cerrno>
#include <cstdint>
#include <cstring>
#include <stdexcept>
#include <string>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

namespace zvei
{

enum class IQFormat { CU8, CS16 };

inline IQFormat parse_iq_format(const std::string& name)
{
    if (name == "cu8") return IQFormat::CU8;
    if (name == "cs16") return IQFormat::CS16;
    throw std::invalid_argument("unknown sample format: " + name);
}

/**
 * Reads interleaved I/Q from a file descriptor.
 *
 *   cu8  - unsigned 8-bit, 127.5 = 0 (rtl_sdr output)
 *   cs16 - signed 16-bit little endian
 *
 * The descriptor is not owned. A read that ends part way through a block
 * is end of stream; the partial block is discarded. Reads wait in poll()
 * on the descriptor and an internal wake pipe, so cancel() ends the
 * stream even when the producer has stalled.
 */
class RawIQSource : public SampleSource
{
public:
    RawIQSource(int fd, IQFormat format, size_t block_samples)
    : fd_(fd)
    , format_(format)
    , block_samples_(block_samples)
    , buffer_(block_samples * bytes_per_sample(format))
    {
        if (pipe(wake_) < 0)
        {
            throw AcquisitionError(std::string("failed to create pipe: ") + std::strerror(errno));
        }
        for (int fd : wake_)
        {
            fcntl(fd, F_SETFD, FD_CLOEXEC);
            fcntl(fd, F_SETFL, fcntl(fd, F_GETFL) | O_NONBLOCK);
        }
    }

    ~RawIQSource()
    {
        close(wake_[0]);
        close(wake_[1]);
    }

    RawIQSource(const RawIQSource&) = delete;
    RawIQSource& operator=(const RawIQSource&) = delete;

    static size_t bytes_per_sample(IQFormat format)
    {
        return format == IQFormat::CU8 ? 2 : 4;
    }

    size_t block_samples() const { return block_samples_; }

    bool next_block(sample_block_t& block) override
    {
        if (!fill()) return false;

        block.resize(block_samples_);
        if (format_ == IQFormat::CU8)
        {
            for (size_t i = 0; i != block_samples_; ++i)
            {
                float I = (buffer_[2 * i] - 127.5f) / 127.5f;
                float Q = (buffer_[2 * i + 1] - 127.5f) / 127.5f;
                block[i] = iq_sample_t(I, Q);
            }
        }
        else
        {
            for (size_t i = 0; i != block_samples_; ++i)
            {
                const uint8_t* p = &buffer_[4 * i];
                int16_t I = int16_t(uint16_t(p[0]) | (uint16_t(p[1]) << 8));
                int16_t Q = int16_t(uint16_t(p[2]) | (uint16_t(p[3]) << 8));
                block[i] = iq_sample_t(I / 32768.0f, Q / 32768.0f);
            }
        }
        return true;
    }

    void cancel() override
    {
        cancelled_.store(true);
        char wake = 1;
        ssize_t ignored = ::write(wake_[1], &wake, 1);
        (void) ignored;
    }

    bool cancelled() const { return cancelled_.load(); }

private:
    bool fill()
    {
        if (fd_ < 0) throw AcquisitionError("read failed: no input descriptor");

        size_t have = 0;
        while (have < buffer_.size())
        {
            if (cancelled_.load()) return false;

            struct pollfd fds[2];
            fds[0].fd = fd_;
            fds[0].events = POLLIN;
            fds[0].revents = 0;
            fds[1].fd = wake_[0];
            fds[1].events = POLLIN;
            fds[1].revents = 0;

            if (poll(fds, 2, -1) < 0)
            {
                if (errno == EINTR) continue;
                throw AcquisitionError(std::string("poll failed: ") + std::strerror(errno));
            }
            if (fds[1].revents) return false;
            if (!fds[0].revents) continue;

            ssize_t n = ::read(fd_, buffer_.data() + have, buffer_.size() - have);
            if (n > 0)
            {
                have += n;
                continue;
            }
            if (n == 0) return false;
            if (errno == EINTR) continue;
            throw AcquisitionError(std::string("read failed: ") + std::strerror(errno));
        }
        return true;
    }

    int fd_;
    IQFormat format_;
    size_t block_samples_;
    std::vector<uint8_t> buffer_;
    int wake_[2] = {-1, -1};
    std::atomic<bool> cancelled_{false};
};

} // zvei
