// Copyright 2022-2026 Open Research Institute, Inc.
//
// SPDX-License-Identifier: GPL-3.0-or-later
//
// Record sinks and the dispatcher thread that feeds them. The pipeline
// hands records to the dispatcher without waiting; sinks do their file
// I/O on the dispatcher's thread.

#pragma once

#include "ConsoleLog.h"
#include "Numerology.h"
#include "Queue.h"
#include "SequenceDecoder.h"
#include "Statistics.h"

#include <chrono>
#include <cmath>
#include <cstdint>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

namespace zvei
{

using wall_clock_t = std::chrono::system_clock;

/// A record as the sinks see it: numbered and placed in wall-clock time.
struct Detection
{
    SequenceRecord record;
    uint64_t number = 0;            // 1-based, in emission order
    wall_clock_t::time_point time;  // wall-clock time of the first digit
    double frequency = 0;           // Hz

    double signal_strength() const  // dB relative to full deviation
    {
        return record.mean_energy > 0 ? 10.0 * std::log10(record.mean_energy) : -99.0;
    }
};

/// "%Y-%m-%d %H:%M:%S.mmm" in local time.
inline std::string format_datetime(wall_clock_t::time_point t)
{
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(t.time_since_epoch()).count() % 1000;
    std::time_t tt = wall_clock_t::to_time_t(t);
    std::tm tm;
    localtime_r(&tt, &tm);

    std::ostringstream out;
    out << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << '.'
        << std::setw(3) << std::setfill('0') << ms;
    return out.str();
}

/// "%Y%m%d_%H%M%S" in local time, for file names.
inline std::string format_file_stamp(wall_clock_t::time_point t)
{
    std::time_t tt = wall_clock_t::to_time_t(t);
    std::tm tm;
    localtime_r(&tt, &tm);

    std::ostringstream out;
    out << std::put_time(&tm, "%Y%m%d_%H%M%S");
    return out.str();
}

inline double to_unix_seconds(wall_clock_t::time_point t)
{
    return std::chrono::duration<double>(t.time_since_epoch()).count();
}

/**
 * Log file path: <dir>/zvei_<MHz>MHz_<stamp>.<extension>
 */
inline std::string log_file_path(const std::string& dir, double frequency,
    wall_clock_t::time_point session_start, const std::string& extension)
{
    std::ostringstream out;
    out << dir;
    if (!dir.empty() && dir.back() != '/') out << '/';
    out << "zvei_" << static_cast<long>(frequency / 1e6) << "MHz_"
        << format_file_stamp(session_start) << '.' << extension;
    return out.str();
}

class RecordSink
{
public:
    virtual ~RecordSink() {}

    virtual void write(const Detection& detection) = 0;
    virtual void flush() {}

    /// Short name for status output.
    virtual std::string name() const = 0;

    /// Output file, empty when the sink writes no file.
    virtual std::string path() const { return std::string(); }
};

/**
 * Common handling for file-backed sinks: open in append mode, report the
 * first failure once, keep going.
 */
class FileSink : public RecordSink
{
public:
    FileSink(const std::string& name, const std::string& path)
    : name_(name)
    , path_(path)
    , out_(path, std::ios::out | std::ios::app)
    {
        if (!out_) report("cannot open");
    }

    std::string name() const override { return name_; }
    std::string path() const override { return path_; }

    void flush() override
    {
        out_.flush();
        if (!out_) report("write failed");
    }

protected:
    std::ostream& out() { return out_; }

    void check()
    {
        if (!out_) report("write failed");
    }

private:
    void report(const char* what)
    {
        if (failed_) return;
        failed_ = true;
        std::cerr << name_ << " sink: " << what << ": " << path_ << std::endl;
    }

    std::string name_;
    std::string path_;
    std::ofstream out_;
    bool failed_ = false;
};

/// One JSON object per line.
class JsonLinesSink : public FileSink
{
public:
    JsonLinesSink(const std::string& path)
    : FileSink("json", path)
    {}

    static std::string format(const Detection& d)
    {
        std::ostringstream line;
        line << std::fixed
            << "{\"timestamp\": " << std::setprecision(3) << to_unix_seconds(d.time)
            << ", \"datetime\": \"" << format_datetime(d.time) << '"'
            << ", \"zvei_code\": \"" << d.record.code() << '"'
            << ", \"frequency_mhz\": " << std::setprecision(6) << d.frequency / 1e6
            << ", \"signal_strength\": " << std::setprecision(1) << d.signal_strength()
            << ", \"confidence\": " << std::setprecision(3) << d.record.mean_confidence
            << ", \"start\": " << std::setprecision(3) << d.record.start_time
            << ", \"end\": " << d.record.end_time
            << ", \"detection_number\": " << d.number
            << '}';
        return line.str();
    }

    void write(const Detection& detection) override
    {
        out() << format(detection) << '\n';
        check();
    }
};

class CsvSink : public FileSink
{
public:
    CsvSink(const std::string& path)
    : FileSink("csv", path)
    {
        out() << header() << '\n';
        check();
    }

    static const char* header()
    {
        return "timestamp,date_time,zvei_code,frequency_mhz,signal_strength,confidence,duration_ms";
    }

    static std::string format(const Detection& d)
    {
        std::ostringstream row;
        row << std::fixed
            << std::setprecision(3) << to_unix_seconds(d.time) << ','
            << format_datetime(d.time) << ','
            << d.record.code() << ','
            << std::setprecision(6) << d.frequency / 1e6 << ','
            << std::setprecision(1) << d.signal_strength() << ','
            << std::setprecision(3) << d.record.mean_confidence << ','
            << std::setprecision(0) << (d.record.end_time - d.record.start_time) * 1000.0;
        return row.str();
    }

    void write(const Detection& detection) override
    {
        out() << format(detection) << '\n';
        check();
    }
};

class TextSink : public FileSink
{
public:
    TextSink(const std::string& path, double frequency, wall_clock_t::time_point session_start)
    : FileSink("text", path)
    {
        out() << "ZVEI/CCIR Signal Detection Log\n"
            << "Frequency: " << std::fixed << std::setprecision(3) << frequency / 1e6 << " MHz\n"
            << "Started: " << format_datetime(session_start).substr(0, 19) << '\n'
            << std::string(50, '=') << "\n\n";
        check();
    }

    static std::string format(const Detection& d)
    {
        std::ostringstream line;
        line << '[' << format_datetime(d.time) << "] ZVEI: " << d.record.code()
            << std::fixed << std::setprecision(1)
            << " (Signal: " << d.signal_strength() << "dB, confidence "
            << std::setprecision(2) << d.record.mean_confidence << ')';
        return line.str();
    }

    void write(const Detection& detection) override
    {
        out() << format(detection) << '\n';
        check();
    }
};

/// "ZVEI DETECTED" lines, handed to the console writer thread.
class ConsoleSink : public RecordSink
{
public:
    explicit ConsoleSink(ConsoleLog& log)
    : log_(log)
    {}

    std::string name() const override { return "console"; }

    static std::string format(const Detection& d)
    {
        std::ostringstream line;
        line << "ZVEI DETECTED: " << d.record.code() << " at " << format_datetime(d.time)
            << std::fixed << std::setprecision(2) << " (confidence " << d.record.mean_confidence << ')';
        return line.str();
    }

    void write(const Detection& detection) override
    {
        log_(format(detection));
    }

private:
    ConsoleLog& log_;
};

/**
 * Tallies codes for the status line and the session summary. Written on
 * the dispatcher thread, readable from any thread.
 */
class SummarySink : public RecordSink
{
public:
    struct Tally
    {
        uint64_t total = 0;
        size_t unique = 0;
        std::string most_common;    // ties go to the lowest code; empty if none
    };

    std::string name() const override { return "summary"; }

    void write(const Detection& detection) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++total_;
        ++codes_[detection.record.code()];
    }

    Tally tally() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        Tally result;
        result.total = total_;
        result.unique = codes_.size();

        uint64_t best = 0;
        for (auto& entry : codes_)
        {
            if (entry.second > best)
            {
                best = entry.second;
                result.most_common = entry.first;
            }
        }
        return result;
    }

    uint64_t total() const { return tally().total; }
    size_t unique() const { return tally().unique; }
    std::string most_common() const { return tally().most_common; }

private:
    mutable std::mutex mutex_;
    uint64_t total_ = 0;
    std::map<std::string, uint64_t> codes_;
};

/**
 * Owns the sink thread. `operator()` never blocks: when the queue is full
 * the record is dropped and counted in Statistics.
 */
class RecordDispatcher
{
public:
    using queue_t = queue<SequenceRecord, default_queue_depth>;

    RecordDispatcher(Statistics& stats, wall_clock_t::time_point session_start, double frequency)
    : stats_(stats)
    , session_start_(session_start)
    , frequency_(frequency)
    {}

    ~RecordDispatcher()
    {
        close();
    }

    RecordDispatcher(const RecordDispatcher&) = delete;
    RecordDispatcher& operator=(const RecordDispatcher&) = delete;

    /// Add a sink before start(). The dispatcher shares ownership.
    void add(std::shared_ptr<RecordSink> sink)
    {
        sinks_.push_back(sink);
    }

    const std::vector<std::shared_ptr<RecordSink>>& sinks() const { return sinks_; }

    void start()
    {
        if (thread_.joinable()) return;
        thread_ = std::thread([this](){ run(); });
    }

    void operator()(const SequenceRecord& record)
    {
        if (!queue_.try_put(record)) stats_.dropped();
    }

    /// Deliver everything queued, flush the sinks and stop the thread.
    void close()
    {
        queue_.close();
        if (thread_.joinable()) thread_.join();
    }

private:
    void run()
    {
        SequenceRecord record;
        while (queue_.get(record))
        {
            Detection detection;
            detection.record = record;
            detection.number = ++count_;
            detection.time = session_start_ + std::chrono::duration_cast<wall_clock_t::duration>(
                std::chrono::duration<double>(record.start_time));
            detection.frequency = frequency_;

            for (auto& sink : sinks_) sink->write(detection);
            if (queue_.empty())
            {
                for (auto& sink : sinks_) sink->flush();
            }
        }
        for (auto& sink : sinks_) sink->flush();
    }

    Statistics& stats_;
    wall_clock_t::time_point session_start_;
    double frequency_;
    std::vector<std::shared_ptr<RecordSink>> sinks_;
    queue_t queue_;
    std::thread thread_;
    uint64_t count_ = 0;
};

} // zvei
