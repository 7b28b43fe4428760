#include "adsb/config.hpp"
#include "adsb/iq_loader.hpp"
#include "adsb/msg/log_line.hpp"
#include "adsb/receiver.hpp"

#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <fstream>
#include <memory>
#include <span>
#include <stdexcept>
#include <string>

using namespace adsb;

static void usage(const char* a0) {
    std::fprintf(stderr,
        "Usage: %s --in <iq_file> [--format auto|f32|cs16|bb] [--rate <Hz>] [--threshold 0.5] [--csv out.csv] [--normalize] [--summary]\n",
        a0);
}

int main(int argc, char** argv) {
    std::string in_path;
    std::string csv_path;
    IqFormat fmt = IqFormat::Auto;
    double rate = 0.0;
    float threshold = 0.5f;
    bool normalize = false;
    bool summary = false;

    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "--in" && i + 1 < argc) in_path = argv[++i];
        else if (a == "--format" && i + 1 < argc) {
            std::string v = argv[++i];
            if (v == "auto") fmt = IqFormat::Auto;
            else if (v == "f32") fmt = IqFormat::F32;
            else if (v == "cs16") fmt = IqFormat::CS16;
            else if (v == "bb") fmt = IqFormat::BB;
            else { usage(argv[0]); return 2; }
        }
        else if (a == "--rate" && i + 1 < argc) rate = std::strtod(argv[++i], nullptr);
        else if (a == "--threshold" && i + 1 < argc) threshold = std::strtof(argv[++i], nullptr);
        else if (a == "--csv" && i + 1 < argc) csv_path = argv[++i];
        else if (a == "--normalize") normalize = true;
        else if (a == "--summary") summary = true;
        else { usage(argv[0]); return 2; }
    }
    if (in_path.empty()) { usage(argv[0]); return 2; }

    IqCapture cap;
    try {
        cap = load_iq(in_path, fmt);
    } catch (const std::exception& e) {
        std::fprintf(stderr, "%s\n", e.what());
        return 3;
    }
    if (cap.samples.empty()) { std::fprintf(stderr, "No samples in %s\n", in_path.c_str()); return 3; }
    if (normalize)
        condition_capture(cap.samples);

    ReceiverParams params = rtlsdr_params();
    if (rate > 0.0) params.front_end_sample_rate = rate;
    else if (cap.sample_rate > 0.0) params.front_end_sample_rate = cap.sample_rate;
    params.sync_threshold = threshold;

    ReceiverConfig cfg;
    std::unique_ptr<Receiver> rx;
    try {
        cfg = make_receiver_config(params);
        rx = std::make_unique<Receiver>(cfg);
    } catch (const std::exception& e) {
        std::fprintf(stderr, "Invalid configuration: %s\n", e.what());
        return 4;
    }

    std::FILE* csv = nullptr;
    if (!csv_path.empty()) {
        csv = std::fopen(csv_path.c_str(), "w");
        if (!csv) { std::fprintf(stderr, "Failed to open %s\n", csv_path.c_str()); return 3; }
        std::fprintf(csv, "%s\n", msg::log_header().c_str());
    }

    std::printf("%s\n", msg::log_header().c_str());
    const std::size_t total = cap.samples.size();
    for (std::size_t pos = 0; pos < total; pos += cfg.samples_per_frame) {
        const std::size_t n = std::min(cfg.samples_per_frame, total - pos);
        FrameResult fr = rx->process_next(std::span<const std::complex<float>>(cap.samples.data() + pos, n));
        for (const auto& m : fr.messages) {
            std::string line = msg::format_log_line(m);
            std::printf("%s\n", line.c_str());
            if (csv) std::fprintf(csv, "%s\n", line.c_str());
        }
    }
    if (csv) std::fclose(csv);

    if (summary) {
        const auto& st = rx->stats();
        std::fprintf(stderr,
            "rate=%.0f Hz interp=%u frames=%llu packets=%llu crc_ok=%llu crc_fail=%llu dropped=%llu messages=%llu per=%.3f\n",
            cfg.front_end_sample_rate, cfg.interpolation_factor,
            static_cast<unsigned long long>(st.frames), static_cast<unsigned long long>(st.packets),
            static_cast<unsigned long long>(st.crc_ok), static_cast<unsigned long long>(st.crc_failed),
            static_cast<unsigned long long>(st.dropped), static_cast<unsigned long long>(st.messages),
            st.packet_error_rate());
        for (std::size_t df = 0; df < st.per_df.size(); ++df)
            if (st.per_df[df])
                std::fprintf(stderr, "  DF%-2zu %llu\n", df, static_cast<unsigned long long>(st.per_df[df]));
        for (std::size_t tc = 0; tc < st.per_tc.size(); ++tc)
            if (st.per_tc[tc])
                std::fprintf(stderr, "  TC%-2zu %llu\n", tc, static_cast<unsigned long long>(st.per_tc[tc]));
    }
    return 0;
}
