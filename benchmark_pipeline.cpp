#include <iostream>
#include <vector>
#include <chrono>
#include <cmath>
#include <complex>
#include <random>
#include "SubcarrierMapping.hpp"
#include "CsiPipeline.hpp"
#include "SpectrumAnalysis.hpp"

using namespace OpenCSI;
using namespace OpenCSI::Core;

// Unit-power QPSK samples
AlignedVector generate_random_iq(size_t size, std::mt19937& rng) {
    std::uniform_int_distribution<int> bits(0, 3);
    const double a = std::sqrt(0.5);
    AlignedVector data(size);
    for (size_t i = 0; i < size; ++i) {
        const int b = bits(rng);
        data[i] = Complex((b & 1) ? a : -a, (b & 2) ? a : -a);
    }
    return data;
}

int main() {
    std::cout << "Starting Pipeline Benchmark..." << std::endl;

    // Parameters
    const size_t num_frames = 2000;
    const size_t tx_len = 320;
    const size_t rx_offset = 67;
    const size_t rx_len = tx_len + 2 * rx_offset;
    const double amplitude = 200.0;     // ADC counts, well below 12-bit full scale
    const std::vector<Complex> channel = {{1.0, 0.0}, {0.4, -0.2}, {0.1, 0.05}};

    const DSP::SubcarrierMapping mapping =
        DSP::get_subcarrier_mapping(DSP::make_ht_field_config("HT-LTF", "CBW20"));

    std::mt19937 rng(1234);
    const AlignedVector tx = generate_random_iq(tx_len, rng);

    // Channel Simulation (static 3-tap channel, fixed delay)
    AlignedVector rx_frame(rx_len, Complex(0.0, 0.0));
    for (size_t n = 0; n < tx_len; ++n) {
        for (size_t k = 0; k < channel.size() && n + k < tx_len; ++k) {
            rx_frame[rx_offset + n + k] += amplitude * channel[k] * tx[n];
        }
    }

    CsiPipeline::Params params;
    params.dataset_id = "benchmark";
    params.chunk_size = 500;
    params.rx_start_offset = rx_offset;
    params.fft_planner_flags = FFTW_MEASURE;

    CsiPipeline pipeline(mapping, params, [](const Diagnostic&) {});

    auto reader = [&](size_t chunk_index, size_t chunk_size, FrameChunk& chunk) {
        const size_t first = chunk_index * chunk_size;
        if (first >= num_frames) return false;
        chunk.num_frames = std::min(chunk_size, num_frames - first);
        chunk.num_antennas = 1;
        chunk.num_samples = rx_len;
        chunk.rx.clear();
        for (size_t f = 0; f < chunk.num_frames; ++f) {
            chunk.rx.insert(chunk.rx.end(), rx_frame.begin(), rx_frame.end());
        }
        chunk.tx_samples = tx_len;
        chunk.tx = tx;
        return true;
    };

    std::vector<uint64_t> ticks(num_frames);
    for (size_t f = 0; f < num_frames; ++f) ticks[f] = f * 1000000ULL;   // 100 Hz at 100 MHz

    std::cout << "Running " << num_frames << " frames..." << std::endl;

    auto start_time = std::chrono::high_resolution_clock::now();
    CsiDataset ds = pipeline.run(num_frames, reader, ticks);
    auto mid_time = std::chrono::high_resolution_clock::now();

    pipeline.apply_filter(ds, 5);
    auto end_time = std::chrono::high_resolution_clock::now();

    const AlignedRealVector series = extract_channel_series(ds, ChannelDomain::Cir, 0, 0, ChannelComponent::Magnitude);
    DSP::ResampleParams rp;
    rp.target_rate = 20.0;
    const DSP::ResampledSignal resampled = DSP::apply_resample(series, ds.timestamps, rp, [](const Diagnostic&) {});
    const DSP::PsdResult psd = DSP::spectrum_psd(resampled.signal, rp.target_rate);
    auto psd_time = std::chrono::high_resolution_clock::now();

    auto us = [](auto a, auto b) {
        return std::chrono::duration_cast<std::chrono::microseconds>(b - a).count();
    };

    std::cout << "Estimation: " << us(start_time, mid_time) / 1000.0 << " ms ("
              << us(start_time, mid_time) / static_cast<double>(num_frames) << " us per frame)" << std::endl;
    std::cout << "CSI filtering (window 5): " << us(mid_time, end_time) / 1000.0 << " ms" << std::endl;
    std::cout << "Resample + PSD: " << us(end_time, psd_time) / 1000.0 << " ms (" << psd.freq.size() << " bins)" << std::endl;
    std::cout << "CIR tap 0 magnitude: " << std::abs(ds.cir_at(0, 0, 0)) << std::endl;

    return 0;
}
