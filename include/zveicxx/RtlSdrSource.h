// Copyright 2022-2026 Open Research Institute, Inc.
//
// SPDX-License-Identifier: GPL-3.0-or-later
//
// Sample source backed by an rtl_sdr child process writing cu8 I/Q to a
// pipe. The child exiting on its own is a device fault; only cancel()
// ends the stream cleanly.

#pragma once

#include "RawIQSource.h"
#include "SampleSource.h"

#include <atomic>
#include <cerrno>
#include <cstring>
#include <memory>
#include <string>
#include <vector>

#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace zvei
{

class RtlSdrSource : public SampleSource
{
public:
    /**
     * @param config - validated tuning parameters
     * @param block_samples - complex samples per block
     * @param program - rtl_sdr executable, looked up on PATH
     * @param verbose - pass the child's stderr through
     */
    RtlSdrSource(const AcquisitionConfig& config, size_t block_samples,
        std::string program = "rtl_sdr", bool verbose = false)
    : program_(program)
    {
        args_ = arguments(config);
        start(verbose);
        try
        {
            reader_ = std::make_unique<RawIQSource>(pipe_from_rtl_[0], IQFormat::CU8, block_samples);
        }
        catch (const AcquisitionError&)
        {
            stop();
            throw;
        }
    }

    ~RtlSdrSource()
    {
        stop();
    }

    RtlSdrSource(const RtlSdrSource&) = delete;
    RtlSdrSource& operator=(const RtlSdrSource&) = delete;

    /**
     * @throws AcquisitionError when rtl_sdr exits without being cancelled,
     *  e.g. device unplugged or not found.
     */
    bool next_block(sample_block_t& block) override
    {
        if (!reader_ || finished_) return false;
        if (reader_->next_block(block)) return true;

        finished_ = true;
        if (cancelled_.load()) return false;
        throw AcquisitionError(reap());
    }

    void cancel() override
    {
        cancelled_.store(true);
        if (reader_) reader_->cancel();
    }

    /// Command line handed to exec, for the startup banner.
    std::string command_line() const
    {
        std::string result;
        for (auto& arg : args_)
        {
            if (!result.empty()) result += ' ';
            result += arg;
        }
        return result;
    }

    std::vector<std::string> arguments(const AcquisitionConfig& config) const
    {
        std::vector<std::string> result = {
            program_,
            "-f", std::to_string(config.frequency),
            "-s", std::to_string(config.sample_rate),
            "-d", std::to_string(config.device_index)
        };

        // rtl_sdr uses automatic gain when -g is absent.
        if (!config.gain.automatic)
        {
            result.push_back("-g");
            result.push_back(config.gain.to_string());
        }
        if (config.ppm != 0)
        {
            result.push_back("-p");
            result.push_back(std::to_string(config.ppm));
        }
        result.push_back("-");
        return result;
    }

    void stop()
    {
        reader_.reset();

        if (pipe_from_rtl_[0] >= 0)
        {
            close(pipe_from_rtl_[0]);
            pipe_from_rtl_[0] = -1;
        }

        if (pid_ > 0)
        {
            int status;
            if (waitpid(pid_, &status, WNOHANG) == 0)
            {
                kill(pid_, SIGTERM);
                waitpid(pid_, &status, 0);
            }
            pid_ = -1;
        }
    }

private:
    /// Wait for the child after its output has ended and describe its exit.
    std::string reap()
    {
        std::string result = program_ + " closed its output";
        if (pid_ <= 0) return result;

        int status = 0;
        pid_t waited;
        do {
            waited = waitpid(pid_, &status, 0);
        } while (waited < 0 && errno == EINTR);
        pid_ = -1;

        if (waited < 0) return result;
        if (WIFEXITED(status))
        {
            return program_ + " exited with status " + std::to_string(WEXITSTATUS(status));
        }
        if (WIFSIGNALED(status))
        {
            return program_ + " killed by signal " + std::to_string(WTERMSIG(status));
        }
        return result;
    }

    void start(bool verbose)
    {
        if (pipe(pipe_from_rtl_) < 0)
        {
            throw AcquisitionError(std::string("failed to create pipe: ") + std::strerror(errno));
        }

        // A failed exec is reported through this close-on-exec pipe.
        int exec_status[2];
        if (pipe(exec_status) < 0)
        {
            int err = errno;
            close(pipe_from_rtl_[0]);
            close(pipe_from_rtl_[1]);
            pipe_from_rtl_[0] = -1;
            throw AcquisitionError(std::string("failed to create pipe: ") + std::strerror(err));
        }
        fcntl(exec_status[1], F_SETFD, FD_CLOEXEC);

        std::vector<char*> argv;
        for (auto& arg : args_) argv.push_back(const_cast<char*>(arg.c_str()));
        argv.push_back(nullptr);

        pid_ = fork();

        if (pid_ < 0)
        {
            int err = errno;
            close(pipe_from_rtl_[0]);
            close(pipe_from_rtl_[1]);
            close(exec_status[0]);
            close(exec_status[1]);
            pipe_from_rtl_[0] = -1;
            throw AcquisitionError(std::string("fork failed: ") + std::strerror(err));
        }

        if (pid_ == 0)
        {
            // Child process - run rtl_sdr with stdout on the pipe
            close(pipe_from_rtl_[0]);
            close(exec_status[0]);

            dup2(pipe_from_rtl_[1], STDOUT_FILENO);
            close(pipe_from_rtl_[1]);

            if (!verbose)
            {
                int devnull = open("/dev/null", O_WRONLY);
                dup2(devnull, STDERR_FILENO);
                close(devnull);
            }

            execvp(argv[0], argv.data());

            int err = errno;
            ssize_t ignored = write(exec_status[1], &err, sizeof(err));
            (void) ignored;
            _exit(127);
        }

        // Parent process
        close(pipe_from_rtl_[1]);
        pipe_from_rtl_[1] = -1;
        close(exec_status[1]);

        int err = 0;
        ssize_t n;
        do {
            n = read(exec_status[0], &err, sizeof(err));
        } while (n < 0 && errno == EINTR);
        close(exec_status[0]);

        if (n == sizeof(err))
        {
            int status;
            waitpid(pid_, &status, 0);
            pid_ = -1;
            close(pipe_from_rtl_[0]);
            pipe_from_rtl_[0] = -1;
            throw AcquisitionError("failed to exec " + program_ + ": " + std::strerror(err));
        }
    }

    std::string program_;
    std::vector<std::string> args_;
    int pipe_from_rtl_[2] = {-1, -1};
    pid_t pid_ = -1;
    std::unique_ptr<RawIQSource> reader_;
    std::atomic<bool> cancelled_{false};
    bool finished_ = false;
};

} // zvei
