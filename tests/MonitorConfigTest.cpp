// Copyright 2022-2026 Open Research Institute, Inc.
//
// SPDX-License-Identifier: GPL-3.0-or-later

#include "MonitorConfig.h"

#include <gtest/gtest.h>

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <initializer_list>
#include <sstream>
#include <string>
#include <vector>

#include <unistd.h>

using namespace zvei;

namespace {

class Args
{
public:
    Args(std::initializer_list<std::string> args)
    : strings_(args)
    {
        strings_.insert(strings_.begin(), "zvei-monitor");
        for (auto& s : strings_) argv_.push_back(const_cast<char*>(s.c_str()));
        argv_.push_back(nullptr);
    }

    Args(const Args&) = delete;
    Args& operator=(const Args&) = delete;

    int argc() const { return int(strings_.size()); }
    char** argv() { return argv_.data(); }

private:
    std::vector<std::string> strings_;
    std::vector<char*> argv_;
};

/// A config file that is removed again at the end of the test.
class ConfigFile
{
public:
    explicit ConfigFile(const std::string& contents)
    {
        char name[] = "/tmp/zvei-conf-XXXXXX";
        int fd = mkstemp(name);
        if (fd >= 0)
        {
            close(fd);
            path_ = name;
            std::ofstream out(path_);
            out << contents;
        }
    }

    ~ConfigFile()
    {
        if (!path_.empty()) std::remove(path_.c_str());
    }

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

std::optional<MonitorConfig> parse(Args args)
{
    std::ostringstream out;
    return MonitorConfig::parse(args.argc(), args.argv(), "test", out);
}

const char* full_config =
    "[sdr]\n"
    "frequency = 446006250\n"
    "sample_rate = 250000\n"
    "gain = 32.8\n"
    "ppm = 12\n"
    "device_index = 1\n"
    "\n"
    "[decoder]\n"
    "audio_rate = 25000\n"
    "fm_deviation = 2500\n"
    "detection_window = 12\n"
    "detection_threshold = 0.05\n"
    "discrimination_margin = 8\n"
    "repeat_suppression_window = 50\n"
    "max_inter_digit_gap = 80\n"
    "silence_timeout = 150\n"
    "\n"
    "[logging]\n"
    "log_dir = /var/log/zvei\n"
    "json = true\n"
    "csv = false\n"
    "text = no\n"
    "\n"
    "[monitoring]\n"
    "display_interval = 30\n";

} // namespace

TEST(MonitorConfig, ReadsConfigFile)
{
    ConfigFile file(full_config);
    ASSERT_FALSE(file.path().empty());

    auto config = parse({"-c", file.path()});
    ASSERT_TRUE(config.has_value());

    EXPECT_EQ(config->acquisition.frequency, 446006250u);
    EXPECT_EQ(config->acquisition.sample_rate, 250000u);
    EXPECT_FALSE(config->acquisition.gain.automatic);
    EXPECT_DOUBLE_EQ(config->acquisition.gain.db, 32.8);
    EXPECT_EQ(config->acquisition.ppm, 12);
    EXPECT_EQ(config->acquisition.device_index, 1);

    auto& dec = config->decoder;
    EXPECT_EQ(dec.sample_rate, 250000u);
    EXPECT_DOUBLE_EQ(dec.fm_deviation, 2500.0);
    EXPECT_DOUBLE_EQ(dec.detection_window, 0.012);
    EXPECT_DOUBLE_EQ(dec.detection_threshold, 0.05);
    EXPECT_DOUBLE_EQ(dec.discrimination_margin, 8.0);
    EXPECT_DOUBLE_EQ(dec.repeat_suppression_window, 0.050);
    EXPECT_DOUBLE_EQ(dec.max_inter_digit_gap, 0.080);
    EXPECT_DOUBLE_EQ(dec.silence_timeout, 0.150);
    EXPECT_DOUBLE_EQ(dec.status_interval, 30.0);

    EXPECT_EQ(config->log_dir, "/var/log/zvei");
    EXPECT_TRUE(config->json);
    EXPECT_FALSE(config->csv);
    EXPECT_FALSE(config->text);
}

TEST(MonitorConfig, MissingKeysUseDefaults)
{
    ConfigFile file("[sdr]\nfrequency = 160000000\n");
    auto config = parse({"-c", file.path()});
    ASSERT_TRUE(config.has_value());

    EXPECT_EQ(config->acquisition.frequency, 160000000u);
    EXPECT_TRUE(config->acquisition.gain.automatic);
    EXPECT_EQ(config->decoder.audio_rate, default_audio_rate);
    EXPECT_DOUBLE_EQ(config->decoder.detection_window, default_detection_window);
    EXPECT_DOUBLE_EQ(config->decoder.detection_threshold, default_detection_threshold);
    EXPECT_DOUBLE_EQ(config->decoder.silence_timeout, default_silence_timeout);
    EXPECT_EQ(config->log_dir, "logs");
    EXPECT_TRUE(config->csv);
    EXPECT_TRUE(config->input.empty());
    EXPECT_EQ(config->format, IQFormat::CU8);
}

TEST(MonitorConfig, CommandLineOverridesFile)
{
    ConfigFile file(full_config);
    auto config = parse({"-c", file.path(), "-f", "169.8", "-g", "auto"});
    ASSERT_TRUE(config.has_value());

    EXPECT_EQ(config->acquisition.frequency, 169800000u);
    EXPECT_TRUE(config->acquisition.gain.automatic);
    EXPECT_EQ(config->acquisition.ppm, 12);
}

TEST(MonitorConfig, GainOverride)
{
    ConfigFile file("");
    auto config = parse({"-c", file.path(), "--gain", "20"});
    ASSERT_TRUE(config.has_value());
    EXPECT_FALSE(config->acquisition.gain.automatic);
    EXPECT_DOUBLE_EQ(config->acquisition.gain.db, 20.0);
}

TEST(MonitorConfig, StdinInput)
{
    ConfigFile file("");
    auto config = parse({"-c", file.path(), "-i", "-", "--format", "cs16", "-q"});
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->input, "-");
    EXPECT_EQ(config->format, IQFormat::CS16);
    EXPECT_TRUE(config->quiet);
}

TEST(MonitorConfig, HelpAndVersion)
{
    std::ostringstream out;
    Args help{"--help"};
    EXPECT_FALSE(MonitorConfig::parse(help.argc(), help.argv(), "1.0", out).has_value());
    EXPECT_NE(out.str().find("--frequency"), std::string::npos);
    EXPECT_NE(out.str().find("decoder.silence_timeout"), std::string::npos);

    std::ostringstream version_out;
    Args version{"-V"};
    EXPECT_FALSE(MonitorConfig::parse(version.argc(), version.argv(), "1.0", version_out).has_value());
    EXPECT_NE(version_out.str().find("1.0"), std::string::npos);
}

TEST(MonitorConfig, Rejections)
{
    ConfigFile file("");

    EXPECT_THROW(parse({"-c", "/nonexistent/zvei.conf"}), std::invalid_argument);
    EXPECT_THROW(parse({"-c", file.path(), "-v", "-q"}), std::invalid_argument);
    EXPECT_THROW(parse({"-c", file.path(), "-f", "5"}), std::invalid_argument);
    EXPECT_THROW(parse({"-c", file.path(), "-f", "99999"}), std::invalid_argument);
    EXPECT_THROW(parse({"-c", file.path(), "-g", "loud"}), std::invalid_argument);
    EXPECT_THROW(parse({"-c", file.path(), "-g", "60"}), std::invalid_argument);
    EXPECT_THROW(parse({"-c", file.path(), "-i", "capture.cu8"}), std::invalid_argument);
    EXPECT_THROW(parse({"-c", file.path(), "-i", "-", "--format", "wav"}), std::invalid_argument);
    EXPECT_THROW(parse({"-c", file.path(), "--bogus"}), boost::program_options::error);
}

TEST(MonitorConfig, InvalidFileValues)
{
    ConfigFile bad_rate("[sdr]\nsample_rate = 1000000\n[decoder]\naudio_rate = 30000\n");
    EXPECT_THROW(parse({"-c", bad_rate.path()}), std::invalid_argument);

    ConfigFile short_window("[decoder]\ndetection_window = 5\n");
    EXPECT_THROW(parse({"-c", short_window.path()}), std::invalid_argument);

    ConfigFile bad_timeout("[decoder]\nsilence_timeout = 0\n");
    EXPECT_THROW(parse({"-c", bad_timeout.path()}), std::invalid_argument);

    ConfigFile long_suppression("[decoder]\nrepeat_suppression_window = 70\n");
    EXPECT_THROW(parse({"-c", long_suppression.path()}), std::invalid_argument);

    ConfigFile unknown_key("[decoder]\nwindow_size = 10\n");
    EXPECT_THROW(parse({"-c", unknown_key.path()}), boost::program_options::error);

    ConfigFile not_a_number("[sdr]\nfrequency = high\n");
    EXPECT_THROW(parse({"-c", not_a_number.path()}), boost::program_options::error);
}

TEST(DecoderConfig, TimingParametersMustNest)
{
    DecoderConfig config;
    EXPECT_NO_THROW(config.validate());

    config.repeat_suppression_window = 0.080;   // longer than the 60 ms gap
    EXPECT_THROW(config.validate(), std::invalid_argument);

    config.repeat_suppression_window = config.max_inter_digit_gap;
    EXPECT_THROW(config.validate(), std::invalid_argument);

    config = DecoderConfig();
    config.silence_timeout = 0.050;             // shorter than the 60 ms gap
    EXPECT_THROW(config.validate(), std::invalid_argument);

    config.silence_timeout = config.max_inter_digit_gap;
    EXPECT_NO_THROW(config.validate());
}
