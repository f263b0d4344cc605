// Copyright 2022-2026 Open Research Institute, Inc.
//
// SPDX-License-Identifier: GPL-3.0-or-later
//
// Command line and configuration file for zvei-monitor.
//
// The command line is stored before the file, so a value given on the
// command line wins. Frequency (MHz) and gain have command line overrides.

#pragma once

#include "DecoderConfig.h"
#include "Numerology.h"
#include "RawIQSource.h"
#include "SampleSource.h"

#include <boost/program_options.hpp>

#include <cmath>
#include <fstream>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>

namespace zvei
{

struct MonitorConfig
{
    static constexpr const char* default_config_path = "zvei.conf";

    std::string config_path = default_config_path;
    std::string input;                  // "-" reads I/Q from stdin
    IQFormat format = IQFormat::CU8;
    std::string rtl_sdr = "rtl_sdr";

    AcquisitionConfig acquisition;
    DecoderConfig decoder;

    std::string log_dir = "logs";
    bool json = true;
    bool csv = true;
    bool text = true;

    bool verbose = false;
    bool debug = false;
    bool quiet = false;

    /**
     * @return empty after printing help or version
     * @throws std::exception (boost::program_options::error,
     *  std::invalid_argument) on bad options or an invalid configuration
     */
    static std::optional<MonitorConfig> parse(int argc, char* argv[],
        const char* version = "", std::ostream& out = std::cout)
    {
        namespace po = boost::program_options;

        MonitorConfig result;
        double frequency_mhz = 0;
        std::string gain;
        std::string format = "cu8";

        po::options_description desc("Program options");
        desc.add_options()
            ("help,h", "Print this help message and exit.")
            ("version,V", "Print the application version and exit.")
            ("config,c", po::value<std::string>(&result.config_path)->default_value(default_config_path),
                "configuration file.")
            ("frequency,f", po::value<double>(&frequency_mhz),
                "receive frequency in MHz (overrides the config file).")
            ("gain,g", po::value<std::string>(&gain),
                "tuner gain: auto or 0-50 dB (overrides the config file).")
            ("input,i", po::value<std::string>(&result.input),
                "read cu8/cs16 I/Q from stdin ('-') instead of starting rtl_sdr.")
            ("format", po::value<std::string>(&format)->default_value("cu8"),
                "sample format of --input: cu8 or cs16.")
            ("verbose,v", po::bool_switch(&result.verbose), "verbose output")
            ("debug,d", po::bool_switch(&result.debug), "debug-level output")
            ("quiet,q", po::bool_switch(&result.quiet), "silence all output")
            ;

        // Durations in the file are milliseconds.
        uint32_t file_frequency = default_frequency;
        std::string file_gain = "auto";
        double window_ms = default_detection_window * 1000;
        double suppression_ms = default_repeat_suppression_window * 1000;
        double gap_ms = default_max_inter_digit_gap * 1000;
        double silence_ms = default_silence_timeout * 1000;
        auto& acq = result.acquisition;
        auto& dec = result.decoder;

        po::options_description file_desc("Configuration file");
        file_desc.add_options()
            ("sdr.frequency", po::value<uint32_t>(&file_frequency)->default_value(default_frequency), "Hz")
            ("sdr.sample_rate", po::value<uint32_t>(&acq.sample_rate)->default_value(default_sample_rate), "Hz")
            ("sdr.gain", po::value<std::string>(&file_gain)->default_value("auto"), "auto or dB")
            ("sdr.ppm", po::value<int>(&acq.ppm)->default_value(0), "frequency correction")
            ("sdr.device_index", po::value<int>(&acq.device_index)->default_value(0), "rtl_sdr device")
            ("sdr.rtl_sdr", po::value<std::string>(&result.rtl_sdr)->default_value("rtl_sdr"), "rtl_sdr program")
            ("decoder.audio_rate", po::value<uint32_t>(&dec.audio_rate)->default_value(default_audio_rate), "Hz")
            ("decoder.fm_deviation", po::value<double>(&dec.fm_deviation)->default_value(default_fm_deviation), "Hz")
            ("decoder.detection_window", po::value<double>(&window_ms)->default_value(window_ms), "ms")
            ("decoder.detection_threshold", po::value<double>(&dec.detection_threshold)
                ->default_value(default_detection_threshold), "normalized energy")
            ("decoder.discrimination_margin", po::value<double>(&dec.discrimination_margin)
                ->default_value(default_discrimination_margin_db), "dB")
            ("decoder.repeat_suppression_window", po::value<double>(&suppression_ms)->default_value(suppression_ms), "ms")
            ("decoder.max_inter_digit_gap", po::value<double>(&gap_ms)->default_value(gap_ms), "ms")
            ("decoder.silence_timeout", po::value<double>(&silence_ms)->default_value(silence_ms), "ms")
            ("logging.log_dir", po::value<std::string>(&result.log_dir)->default_value("logs"), "")
            ("logging.json", po::value<bool>(&result.json)->default_value(true), "")
            ("logging.csv", po::value<bool>(&result.csv)->default_value(true), "")
            ("logging.text", po::value<bool>(&result.text)->default_value(true), "")
            ("monitoring.display_interval", po::value<double>(&dec.status_interval)
                ->default_value(default_status_interval), "seconds")
            ;

        po::variables_map vm;
        po::store(po::parse_command_line(argc, argv, desc), vm);

        if (vm.count("help"))
        {
            out << "Decode ZVEI/CCIR five-tone sequences from an RTL-SDR receiver\n"
                << desc << '\n' << file_desc << std::endl;
            return std::nullopt;
        }

        if (vm.count("version"))
        {
            out << argv[0] << ": " << version << std::endl;
            return std::nullopt;
        }

        po::notify(vm);

        std::ifstream file(result.config_path);
        if (file)
        {
            po::store(po::parse_config_file(file, file_desc), vm);
        }
        else if (!vm["config"].defaulted())
        {
            throw std::invalid_argument("cannot read config file: " + result.config_path);
        }
        po::notify(vm);

        if (result.debug + result.verbose + result.quiet > 1)
        {
            throw std::invalid_argument("Only one of quiet, verbose or debug may be chosen.");
        }

        acq.frequency = file_frequency;
        acq.gain = GainSetting::parse(file_gain);

        if (vm.count("frequency"))
        {
            double hz = frequency_mhz * 1e6;
            if (!(hz >= min_frequency && hz <= max_frequency))
            {
                throw std::invalid_argument("frequency out of range: " + std::to_string(frequency_mhz) + " MHz");
            }
            acq.frequency = static_cast<uint32_t>(std::llround(frequency_mhz * 1e6));
        }
        if (vm.count("gain"))
        {
            acq.gain = GainSetting::parse(gain);
        }

        if (!result.input.empty() && result.input != "-")
        {
            throw std::invalid_argument("--input only accepts '-' (stdin)");
        }
        result.format = parse_iq_format(format);

        dec.sample_rate = acq.sample_rate;
        dec.detection_window = window_ms / 1000.0;
        dec.repeat_suppression_window = suppression_ms / 1000.0;
        dec.max_inter_digit_gap = gap_ms / 1000.0;
        dec.silence_timeout = silence_ms / 1000.0;

        acq.validate();
        dec.validate();

        return result;
    }
};

} // zvei
