// Copyright 2022-2026 Open Research Institute, Inc.
//
// ZVEI/CCIR five-tone test signal generator
//
// Pipeline: code digits → tone sequence → FM modulate → (noise) → cu8/cs16 I/Q on STDOUT
//
// Feed the output to `zvei-monitor -i -` to exercise the decoder without a receiver.

#include "Numerology.h"
#include "ToneModulator.h"
#include "ToneTable.h"

#include <boost/program_options.hpp>

#include <algorithm>
#include <atomic>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <random>
#include <string>
#include <vector>

#include <signal.h>

const char VERSION[] = "0.1";

using namespace zvei;

struct Config
{
    std::vector<std::string> codes;
    double tone_ms = nominal_tone_ms;
    double gap_ms = 0;
    double pause_ms = 500;
    double lead_ms = 200;
    uint32_t sample_rate = default_sample_rate;
    double deviation = 3000;
    uint32_t repeat = 1;
    std::string format = "cu8";
    double noise = 0;
    uint32_t seed = 1;
    bool verbose = false;
    bool quiet = false;

    static std::optional<Config> parse(int argc, char* argv[])
    {
        namespace po = boost::program_options;

        Config result;

        po::options_description desc("Program options");
        desc.add_options()
            ("help,h", "Print this help message and exit.")
            ("version,V", "Print the application version and exit.")
            ("code,c", po::value<std::vector<std::string>>(&result.codes)->required()->composing(),
                "code to send, e.g. 12345 (may be repeated).")
            ("tone-ms,t", po::value<double>(&result.tone_ms)->default_value(nominal_tone_ms),
                "tone length in ms.")
            ("gap-ms", po::value<double>(&result.gap_ms)->default_value(0),
                "carrier between digits in ms.")
            ("pause-ms", po::value<double>(&result.pause_ms)->default_value(500),
                "carrier between codes in ms.")
            ("lead-ms", po::value<double>(&result.lead_ms)->default_value(200),
                "carrier before the first and after the last code in ms.")
            ("rate,r", po::value<uint32_t>(&result.sample_rate)->default_value(default_sample_rate),
                "I/Q sample rate.")
            ("deviation", po::value<double>(&result.deviation)->default_value(3000),
                "FM deviation in Hz.")
            ("repeat,n", po::value<uint32_t>(&result.repeat)->default_value(1),
                "send the code list this many times.")
            ("format", po::value<std::string>(&result.format)->default_value("cu8"),
                "output sample format: cu8 or cs16.")
            ("noise", po::value<double>(&result.noise)->default_value(0),
                "gaussian noise standard deviation per component (full scale = 1).")
            ("seed", po::value<uint32_t>(&result.seed)->default_value(1), "noise seed.")
            ("verbose,v", po::bool_switch(&result.verbose), "verbose output")
            ("quiet,q", po::bool_switch(&result.quiet), "silence all output")
            ;

        po::positional_options_description positional;
        positional.add("code", -1);

        po::variables_map vm;
        po::store(po::command_line_parser(argc, argv).options(desc).positional(positional).run(), vm);

        if (vm.count("help"))
        {
            std::cout << "Write ZVEI/CCIR five-tone FM I/Q baseband to STDOUT\n"
                << desc << std::endl;
            return std::nullopt;
        }

        if (vm.count("version"))
        {
            std::cout << argv[0] << ": " << VERSION << std::endl;
            return std::nullopt;
        }

        try {
            po::notify(vm);
        } catch (std::exception& ex)
        {
            std::cerr << ex.what() << std::endl;
            std::cerr << desc << std::endl;
            return std::nullopt;
        }

        if (result.verbose + result.quiet > 1)
        {
            std::cerr << "Only one of quiet or verbose may be chosen." << std::endl;
            return std::nullopt;
        }

        if (result.format != "cu8" && result.format != "cs16")
        {
            std::cerr << "Unknown sample format: " << result.format << std::endl;
            return std::nullopt;
        }

        for (auto& code : result.codes)
        {
            for (char c : code)
            {
                if (!symbol_for_char(c))
                {
                    std::cerr << "Not a tone digit in " << code << ": " << c << std::endl;
                    return std::nullopt;
                }
            }
        }

        if (result.sample_rate == 0 || !(result.tone_ms > 0) || result.gap_ms < 0
            || result.pause_ms < 0 || result.lead_ms < 0 || result.noise < 0)
        {
            std::cerr << "Invalid timing, rate or noise parameter." << std::endl;
            return std::nullopt;
        }

        return result;
    }
};

std::optional<Config> config;

std::atomic<bool> running{true};

void signal_handler(int)
{
    running = false;
}

using modulator_t = ToneModulator<float>;

std::mt19937 generator;

// =============================================================================
// OUTPUT
// =============================================================================

bool output_iq(const modulator_t::block_t& samples)
{
    std::normal_distribution<float> noise(0.0f, float(config->noise));
    const bool add_noise = config->noise > 0;

    if (config->format == "cu8")
    {
        std::vector<uint8_t> bytes;
        bytes.reserve(samples.size() * 2);
        for (auto s : samples)
        {
            float I = s.real(), Q = s.imag();
            if (add_noise) { I += noise(generator); Q += noise(generator); }
            bytes.push_back(uint8_t(std::clamp(std::lround(I * 127.5f + 127.5f), 0L, 255L)));
            bytes.push_back(uint8_t(std::clamp(std::lround(Q * 127.5f + 127.5f), 0L, 255L)));
        }
        std::cout.write(reinterpret_cast<const char*>(bytes.data()), bytes.size());
    }
    else
    {
        std::vector<uint8_t> bytes;
        bytes.reserve(samples.size() * 4);
        for (auto s : samples)
        {
            float I = s.real(), Q = s.imag();
            if (add_noise) { I += noise(generator); Q += noise(generator); }
            for (float v : {I, Q})
            {
                auto x = uint16_t(int16_t(std::clamp(std::lround(v * 32767.0f), -32768L, 32767L)));
                bytes.push_back(uint8_t(x & 0xff));
                bytes.push_back(uint8_t(x >> 8));
            }
        }
        std::cout.write(reinterpret_cast<const char*>(bytes.data()), bytes.size());
    }
    return bool(std::cout);
}

// =============================================================================
// MAIN
// =============================================================================

int main(int argc, char* argv[])
{
    try
    {
        config = Config::parse(argc, argv);
    }
    catch(const std::exception& e)
    {
        std::cerr << e.what() << '\n';
        return EXIT_FAILURE;
    }

    if (!config) return 0;

    signal(SIGINT, &signal_handler);
    signal(SIGPIPE, SIG_IGN);

    generator.seed(config->seed);

    modulator_t modulator(config->sample_rate, config->deviation);
    modulator.set_amplitude(0.9);

    if (!config->quiet)
    {
        std::cerr << "Rate: " << config->sample_rate << " SPS " << config->format
            << ", deviation " << config->deviation << " Hz"
            << ", tone " << config->tone_ms << " ms, gap " << config->gap_ms << " ms" << std::endl;
    }

    modulator_t::block_t block;
    modulator.silence(config->lead_ms / 1000.0, block);
    if (!output_iq(block)) return EXIT_FAILURE;

    for (uint32_t n = 0; n != config->repeat && running; ++n)
    {
        for (size_t i = 0; i != config->codes.size() && running; ++i)
        {
            auto& code = config->codes[i];
            if (config->verbose)
            {
                std::cerr << "Sending " << code << std::endl;
            }

            block.clear();
            if (n != 0 || i != 0) modulator.silence(config->pause_ms / 1000.0, block);
            modulator.code(code, config->tone_ms / 1000.0, config->gap_ms / 1000.0, block);
            if (!output_iq(block))
            {
                std::cerr << "Output failed." << std::endl;
                return EXIT_FAILURE;
            }
        }
    }

    block.clear();
    modulator.silence(config->lead_ms / 1000.0, block);
    output_iq(block);
    std::cout.flush();

    return std::cout ? EXIT_SUCCESS : EXIT_FAILURE;
}
