// Copyright 2022-2026 Open Research Institute, Inc.
//
// ZVEI/CCIR five-tone monitor for RTL-SDR
//
// Pipeline: rtl_sdr I/Q → FM discriminator → decimate → Goertzel tone detection → sequence decoder → JSON/CSV/text logs

#include "ConsoleLog.h"
#include "MonitorConfig.h"
#include "Pipeline.h"
#include "RawIQSource.h"
#include "RecordSink.h"
#include "RtlSdrSource.h"
#include "Statistics.h"

#include <atomic>
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <utility>

#include <cerrno>
#include <cstdlib>
#include <cstring>

#include <signal.h>
#include <sys/stat.h>
#include <unistd.h>

const char VERSION[] = "0.1";

using namespace zvei;

using pipeline_t = Pipeline<float>;

std::optional<MonitorConfig> config;

std::atomic<pipeline_t*> active_pipeline{nullptr};


// =============================================================================
// SIGNAL HANDLER
// =============================================================================

void signal_handler(int)
{
    pipeline_t* pipeline = active_pipeline.load();
    if (pipeline) pipeline->stop();
}


// =============================================================================
// STATUS OUTPUT
// =============================================================================

std::string format_status(const Statistics::Snapshot& stats, const SummarySink::Tally& tally,
    double frequency)
{
    std::ostringstream line;
    line << "--- Status: " << std::fixed << std::setprecision(3) << frequency / 1e6 << " MHz"
        << ", uptime " << std::setprecision(0) << stats.uptime << " s"
        << ", samples " << stats.samples
        << ", tones " << stats.tone_observations << "/" << stats.observations
        << ", sequences " << stats.sequences_completed
        << ", unique " << tally.unique;
    if (!tally.most_common.empty()) line << ", most common " << tally.most_common;
    line << ", aborted " << stats.sequences_aborted
        << ", dropped " << stats.records_dropped
        << ", max block " << stats.max_block_us << " us";
    return line.str();
}

void dump_summary(const Statistics::Snapshot& stats, const SummarySink& summary,
    const RecordDispatcher& dispatcher, const ConsoleLog& console)
{
    auto tally = summary.tally();
    std::cerr << std::string(60, '=') << '\n'
        << "Session Summary\n"
        << std::string(60, '=') << '\n'
        << "Total detections: " << tally.total << '\n';
    if (tally.total)
    {
        std::cerr << "Unique codes detected: " << tally.unique << '\n'
            << "Most common code: " << tally.most_common << '\n';
    }
    std::cerr << "Sequences aborted: " << stats.sequences_aborted
        << " (silence " << stats.aborted(AbortReason::SILENCE_TIMEOUT)
        << ", gap " << stats.aborted(AbortReason::GAP_EXCEEDED)
        << ", shutdown " << stats.aborted(AbortReason::SHUTDOWN) << ")\n";
    if (stats.records_dropped)
    {
        std::cerr << "Records dropped (sinks too slow): " << stats.records_dropped << '\n';
    }
    if (console.dropped())
    {
        std::cerr << "Console lines dropped: " << console.dropped() << '\n';
    }

    std::cerr << "Symbol counts:";
    for (size_t i = 0; i != tone_count; ++i)
    {
        if (stats.symbol_counts[i]) std::cerr << ' ' << tone_table[i].digit << '=' << stats.symbol_counts[i];
    }
    std::cerr << '\n';

    bool header = false;
    for (auto& sink : dispatcher.sinks())
    {
        if (sink->path().empty()) continue;
        if (!header) std::cerr << "Log files saved:\n";
        header = true;
        std::cerr << "  " << sink->name() << ": " << sink->path() << '\n';
    }
    std::cerr << std::string(60, '=') << std::endl;
}


// =============================================================================
// MAIN
// =============================================================================

int main(int argc, char* argv[])
{
    try
    {
        config = MonitorConfig::parse(argc, argv, VERSION);
    }
    catch (const std::exception& e)
    {
        std::cerr << argv[0] << ": " << e.what() << '\n'
            << "Try '" << argv[0] << " --help' for more information." << std::endl;
        return EXIT_FAILURE;
    }

    if (!config) return EXIT_SUCCESS;

    const auto& acq = config->acquisition;
    const auto& dec = config->decoder;
    const auto session_start = wall_clock_t::now();
    const size_t block_samples = dec.window_samples() * dec.decimation();

    Statistics stats;
    ConsoleLog console;
    RecordDispatcher dispatcher(stats, session_start, acq.frequency);
    auto summary = std::make_shared<SummarySink>();
    dispatcher.add(summary);
    if (!config->quiet) dispatcher.add(std::make_shared<ConsoleSink>(console));

    if (config->json || config->csv || config->text)
    {
        if (mkdir(config->log_dir.c_str(), 0755) < 0 && errno != EEXIST)
        {
            std::cerr << "Cannot create log directory " << config->log_dir << ": "
                << std::strerror(errno) << std::endl;
            return EXIT_FAILURE;
        }
        if (config->json)
        {
            dispatcher.add(std::make_shared<JsonLinesSink>(
                log_file_path(config->log_dir, acq.frequency, session_start, "json")));
        }
        if (config->csv)
        {
            dispatcher.add(std::make_shared<CsvSink>(
                log_file_path(config->log_dir, acq.frequency, session_start, "csv")));
        }
        if (config->text)
        {
            dispatcher.add(std::make_shared<TextSink>(
                log_file_path(config->log_dir, acq.frequency, session_start, "txt"), acq.frequency, session_start));
        }
    }

    std::unique_ptr<SampleSource> source;
    std::string source_name;
    try
    {
        if (config->input == "-")
        {
            source = std::make_unique<RawIQSource>(STDIN_FILENO, config->format, block_samples);
            source_name = "stdin";
        }
        else
        {
            auto rtl = std::make_unique<RtlSdrSource>(acq, block_samples, config->rtl_sdr, config->debug);
            source_name = rtl->command_line();
            source = std::move(rtl);
        }
    }
    catch (const AcquisitionError& e)
    {
        std::cerr << "Failed to initialize SDR receiver: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }

    if (!config->quiet)
    {
        std::cerr << std::string(60, '=') << '\n'
            << "ZVEI/CCIR Tone Monitor " << VERSION << '\n'
            << std::string(60, '=') << '\n'
            << "Frequency: " << std::fixed << std::setprecision(3) << acq.frequency / 1e6 << " MHz\n"
            << "Sample Rate: " << acq.sample_rate / 1000.0 << " kHz, audio "
            << dec.audio_rate / 1000.0 << " kHz\n"
            << "Gain: " << acq.gain.to_string() << '\n'
            << "Source: " << source_name << '\n'
            << "Window: " << std::setprecision(1) << dec.window_duration() * 1000 << " ms, threshold "
            << std::setprecision(3) << dec.detection_threshold << ", margin "
            << std::setprecision(1) << dec.discrimination_margin << " dB\n"
            << "Logs: " << config->log_dir << "/\n"
            << std::string(60, '=') << '\n'
            << "Monitoring... Press Ctrl+C to stop" << std::endl;
    }

    // Everything below runs on the decode thread; console output only
    // queues lines for the writer thread.
    pipeline_t pipeline(dec, *source, stats, [&dispatcher](const SequenceRecord& record) {
        dispatcher(record);
    });

    if (!config->quiet)
    {
        pipeline.status([&console, &summary, &acq](const Statistics::Snapshot& snapshot) {
            console(format_status(snapshot, summary->tally(), acq.frequency));
        });
    }

    if (config->verbose || config->debug)
    {
        pipeline.aborts([&console, &pipeline](AbortReason reason, size_t digits) {
            std::ostringstream line;
            line << "Sequence aborted after " << digits << " digit(s): " << to_string(reason)
                << " at " << std::fixed << std::setprecision(3) << pipeline.stream_time() << " s";
            console(line.str());
        });
    }

    if (config->debug)
    {
        pipeline.diagnostics([&console](const ToneObservation& obs, SequenceDecoder::DecodeResult result) {
            if (!obs.symbol) return;
            std::ostringstream line;
            line << std::fixed << std::setprecision(3) << obs.timestamp << " s: tone "
                << to_char(*obs.symbol) << " energy " << std::setprecision(4) << obs.energy
                << " confidence " << std::setprecision(2) << obs.confidence
                << " -> " << to_string(result);
            console(line.str());
        });
    }

    console.start();
    dispatcher.start();

    active_pipeline = &pipeline;
    signal(SIGINT, &signal_handler);
    signal(SIGTERM, &signal_handler);

    auto result = pipeline.run();

    active_pipeline = nullptr;
    signal(SIGINT, SIG_DFL);
    signal(SIGTERM, SIG_DFL);

    source.reset();
    dispatcher.close();
    console.close();

    if (!config->quiet)
    {
        dump_summary(stats.snapshot(), *summary, dispatcher, console);
    }

    switch (result.status)
    {
    case pipeline_t::Status::SHUTDOWN:
        if (!config->quiet) std::cerr << "Stopped." << std::endl;
        break;
    case pipeline_t::Status::END_OF_STREAM:
        if (!config->quiet) std::cerr << "End of sample stream." << std::endl;
        break;
    case pipeline_t::Status::ACQUISITION_FAULT:
        std::cerr << "Acquisition failed: " << result.message << std::endl;
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
