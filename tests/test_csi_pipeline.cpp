#define BOOST_TEST_MODULE csi_pipeline
#include <boost/test/unit_test.hpp>

#include <algorithm>
#include <cmath>
#include <random>
#include <sstream>
#include <vector>
#include <SubcarrierMapping.hpp>
#include <CsiPipeline.hpp>

using namespace OpenCSI;
using namespace OpenCSI::Core;

namespace {

struct DiagnosticLog {
    std::vector<Diagnostic> entries;
    DiagnosticHandler handler() {
        return [this](const Diagnostic& d) { entries.push_back(d); };
    }
    size_t count(DiagnosticKind kind) const {
        size_t n = 0;
        for (const auto& d : entries) n += d.kind == kind ? 1 : 0;
        return n;
    }
};

AlignedVector random_qpsk(size_t n, unsigned seed) {
    std::mt19937 rng(seed);
    std::uniform_int_distribution<int> bits(0, 3);
    const double a = std::sqrt(0.5);
    AlignedVector out(n);
    for (auto& s : out) {
        const int b = bits(rng);
        s = Complex((b & 1) ? a : -a, (b & 2) ? a : -a);
    }
    return out;
}

/**
 * In-memory dataset: every frame is tx scaled by gain and delayed by lead
 * samples, plus complex white noise of power noise_power when it is set.
 * Frames listed in clipped get a 3000-count sample ahead of the burst.
 * Chunks carry reported_tx instead of tx when it is set.
 */
struct SyntheticCapture {
    size_t num_frames = 10;
    size_t lead = 20;
    size_t tail = 20;
    Complex gain = Complex(0.5, 0.0);
    double noise_power = 0.0;
    AlignedVector tx = random_qpsk(4096, 42);
    AlignedVector reported_tx;
    std::vector<size_t> clipped;
    size_t antennas_first_chunk = 1;
    size_t antennas_later = 1;

    size_t frame_len() const { return lead + tx.size() + tail; }

    AlignedVector frame(size_t f) const {
        AlignedVector rx(frame_len(), Complex(0.0, 0.0));
        for (size_t n = 0; n < tx.size(); ++n) rx[lead + n] = gain * tx[n];
        if (noise_power > 0.0) {
            std::mt19937 rng(1000 + static_cast<unsigned>(f));
            std::normal_distribution<double> noise(0.0, std::sqrt(noise_power / 2.0));
            for (auto& s : rx) {
                const double re = noise(rng);
                const double im = noise(rng);
                s += Complex(re, im);
            }
        }
        if (std::find(clipped.begin(), clipped.end(), f) != clipped.end()) {
            rx[0] = Complex(3000.0, 0.0);
        }
        return rx;
    }

    ChunkReader reader() const {
        return [this](size_t chunk_index, size_t chunk_size, FrameChunk& chunk) {
            const size_t first = chunk_index * chunk_size;
            if (first >= num_frames) return false;
            chunk.num_frames = std::min(chunk_size, num_frames - first);
            chunk.num_antennas = chunk_index == 0 ? antennas_first_chunk : antennas_later;
            chunk.num_samples = frame_len();
            chunk.rx.clear();
            for (size_t f = 0; f < chunk.num_frames; ++f) {
                const AlignedVector rx = frame(first + f);
                for (size_t a = 0; a < chunk.num_antennas; ++a) {
                    chunk.rx.insert(chunk.rx.end(), rx.begin(), rx.end());
                }
            }
            chunk.tx = reported_tx.empty() ? tx : reported_tx;
            chunk.tx_samples = chunk.tx.size();
            return true;
        };
    }
};

DSP::SubcarrierMapping legacy20() {
    return DSP::get_subcarrier_mapping(DSP::make_ht_field_config("L-LTF", "CBW20"));
}

CsiPipeline::Params base_params(size_t offset) {
    CsiPipeline::Params p;
    p.dataset_id = "synthetic";
    p.chunk_size = 3;
    p.rx_start_offset = offset;
    return p;
}

} // namespace

BOOST_AUTO_TEST_CASE(estimates_every_frame_across_chunks) {
    const SyntheticCapture cap;
    DiagnosticLog log;
    CsiPipeline pipeline(legacy20(), base_params(cap.lead), log.handler());

    const CsiDataset ds = pipeline.run(cap.num_frames, cap.reader());

    BOOST_CHECK_EQUAL(ds.dataset_id, "synthetic");
    BOOST_CHECK_EQUAL(ds.num_frames, 10u);
    BOOST_CHECK_EQUAL(ds.num_antennas, 1u);
    BOOST_CHECK_EQUAL(ds.num_tones, 52u);
    BOOST_CHECK_EQUAL(ds.fft_length, 64u);
    BOOST_CHECK_EQUAL(ds.csi.size(), 10u * 52u);
    BOOST_CHECK_EQUAL(ds.cir.size(), 10u * 64u);
    BOOST_CHECK_EQUAL(ds.clipped_frames, 0u);
    BOOST_CHECK(log.entries.empty());
    BOOST_CHECK(ds.timestamps.empty());

    for (size_t f = 0; f < ds.num_frames; ++f) {
        BOOST_CHECK_SMALL(std::abs(ds.cir_at(f, 0, 0) - cap.gain), 0.05);
        for (size_t t = 0; t < ds.num_tones; ++t) {
            BOOST_CHECK_SMALL(std::abs(ds.csi_at(f, 0, t)) - 0.5, 0.25);
        }
    }
}

BOOST_AUTO_TEST_CASE(delay_shows_in_cir_tap_and_csi_phase_slope) {
    const size_t offset = 20;
    const size_t delay = 3;

    SyntheticCapture cap;
    cap.lead = offset + delay;
    cap.noise_power = std::norm(cap.gain) * 1e-3;     // 30 dB SNR

    const DSP::SubcarrierMapping mapping = legacy20();
    DiagnosticLog log;
    CsiPipeline pipeline(mapping, base_params(offset), log.handler());
    const CsiDataset ds = pipeline.run(cap.num_frames, cap.reader());
    BOOST_CHECK(log.entries.empty());

    // Signed subcarrier index of every active tone
    std::vector<double> tone(ds.num_tones);
    for (size_t t = 0; t < ds.num_tones; ++t) {
        tone[t] = static_cast<double>(mapping.active_fft_indices[t]) -
                  static_cast<double>(pipeline.dft().dc_index());
    }
    double tone_mean = 0.0;
    for (double k : tone) tone_mean += k;
    tone_mean /= static_cast<double>(tone.size());

    const double expected_slope = -2.0 * M_PI * static_cast<double>(delay) / 64.0;
    for (size_t f = 0; f < ds.num_frames; ++f) {
        size_t peak = 0;
        for (size_t k = 1; k < ds.fft_length; ++k) {
            if (std::abs(ds.cir_at(f, 0, k)) > std::abs(ds.cir_at(f, 0, peak))) peak = k;
        }
        BOOST_CHECK_EQUAL(peak, delay);
        BOOST_CHECK_SMALL(std::abs(ds.cir_at(f, 0, delay) - cap.gain), 0.05);

        AlignedRealVector phase(ds.num_tones);
        for (size_t t = 0; t < ds.num_tones; ++t) phase[t] = std::arg(ds.csi_at(f, 0, t));
        unwrap(phase);

        double phase_mean = 0.0;
        for (double p : phase) phase_mean += p;
        phase_mean /= static_cast<double>(phase.size());

        double num = 0.0;
        double den = 0.0;
        for (size_t t = 0; t < ds.num_tones; ++t) {
            num += (tone[t] - tone_mean) * (phase[t] - phase_mean);
            den += (tone[t] - tone_mean) * (tone[t] - tone_mean);
        }
        BOOST_CHECK_CLOSE(num / den, expected_slope, 2.0);
    }
}

BOOST_AUTO_TEST_CASE(matches_direct_estimation) {
    const SyntheticCapture cap;
    CsiPipeline pipeline(legacy20(), base_params(cap.lead), [](const Diagnostic&) {});
    const CsiDataset ds = pipeline.run(cap.num_frames, cap.reader());

    const AlignedVector cir = compute_cir_corr(cap.tx, cap.frame(4), cap.lead, 64);
    AlignedVector csi(52);
    pipeline.dft().cir_to_csi(cir.data(), csi.data());

    for (size_t k = 0; k < 64; ++k) {
        BOOST_CHECK_SMALL(std::abs(ds.cir_at(4, 0, k) - cir[k]), 1e-12);
    }
    for (size_t t = 0; t < 52; ++t) {
        BOOST_CHECK_SMALL(std::abs(ds.csi_at(4, 0, t) - csi[t]), 1e-12);
    }
}

BOOST_AUTO_TEST_CASE(clipping_is_counted_and_warnings_capped) {
    SyntheticCapture cap;
    cap.clipped = {1, 2, 5, 7, 9};

    CsiPipeline::Params params = base_params(cap.lead);
    params.adc_bit_width = 12;
    params.clipping_max_warnings = 2;

    DiagnosticLog log;
    CsiPipeline pipeline(legacy20(), params, log.handler());
    const CsiDataset ds = pipeline.run(cap.num_frames, cap.reader());

    BOOST_CHECK_EQUAL(ds.clipped_frames, 5u);
    BOOST_CHECK_EQUAL(pipeline.clipped_frames(), 5u);
    BOOST_CHECK_EQUAL(log.count(DiagnosticKind::Clipping), 2u);
    BOOST_REQUIRE(!log.entries.empty());
    BOOST_CHECK(log.entries[0].message.find("Frame 1") != std::string::npos);
}

BOOST_AUTO_TEST_CASE(antenna_count_change_follows_policy) {
    SyntheticCapture cap;
    cap.antennas_first_chunk = 1;
    cap.antennas_later = 2;

    DiagnosticLog log;
    CsiPipeline realloc(legacy20(), base_params(cap.lead), log.handler());
    const CsiDataset ds = realloc.run(cap.num_frames, cap.reader());
    BOOST_CHECK_EQUAL(ds.num_antennas, 2u);
    BOOST_CHECK_EQUAL(log.count(DiagnosticKind::AntennaReallocation), 1u);
    BOOST_CHECK_EQUAL(ds.csi.size(), 10u * 2u * 52u);
    // Frames of the first chunk were discarded, later ones hold both antennas
    BOOST_CHECK_EQUAL(std::abs(ds.cir_at(0, 0, 0)), 0.0);
    BOOST_CHECK_SMALL(std::abs(ds.cir_at(5, 1, 0) - cap.gain), 0.05);

    CsiPipeline::Params strict_params = base_params(cap.lead);
    strict_params.antenna_policy = AntennaPolicy::Fail;
    CsiPipeline strict(legacy20(), strict_params, [](const Diagnostic&) {});
    BOOST_CHECK_THROW(strict.run(cap.num_frames, cap.reader()), DatasetError);

    BOOST_CHECK(parse_antenna_policy("Reallocate") == AntennaPolicy::Reallocate);
    BOOST_CHECK_THROW(parse_antenna_policy("truncate"), InvalidArgument);
}

BOOST_AUTO_TEST_CASE(timestamps_are_relative_seconds) {
    const SyntheticCapture cap;
    std::vector<uint64_t> ticks(cap.num_frames);
    for (size_t f = 0; f < ticks.size(); ++f) ticks[f] = 5000000000ULL + f * 1000000ULL;

    CsiPipeline::Params params = base_params(cap.lead);
    params.clock_rate = 100e6;
    CsiPipeline pipeline(legacy20(), params, [](const Diagnostic&) {});

    const std::vector<double> freqs(cap.num_frames, 2.412e9);
    const CsiDataset ds = pipeline.run(cap.num_frames, cap.reader(), ticks, freqs);
    BOOST_REQUIRE_EQUAL(ds.timestamps.size(), cap.num_frames);
    BOOST_CHECK_EQUAL(ds.timestamps[0], 0.0);
    BOOST_CHECK_SMALL(ds.timestamps[9] - 0.09, 1e-12);
    BOOST_CHECK_EQUAL(ds.center_freqs.size(), cap.num_frames);

    const std::vector<double> short_freqs(cap.num_frames - 1, 2.412e9);
    BOOST_CHECK_THROW(pipeline.run(cap.num_frames, cap.reader(), ticks, short_freqs), DatasetError);
    BOOST_CHECK_THROW(pipeline.run(cap.num_frames, cap.reader(), std::vector<uint64_t>(), short_freqs),
                      DatasetError);

    ticks.pop_back();
    BOOST_CHECK_THROW(pipeline.run(cap.num_frames, cap.reader(), ticks), DatasetError);
}

BOOST_AUTO_TEST_CASE(timestamp_statistics) {
    const AlignedRealVector ts = {0.0, 0.1, 0.3, 0.4};
    const TimestampStats s = compute_timestamp_stats(ts);
    BOOST_CHECK_SMALL(s.min_interval - 0.1, 1e-12);
    BOOST_CHECK_SMALL(s.max_interval - 0.2, 1e-12);
    BOOST_CHECK_SMALL(s.median_interval - 0.1, 1e-12);
    BOOST_CHECK_SMALL(s.rate_max - 10.0, 1e-9);
    BOOST_CHECK_SMALL(s.rate_min - 5.0, 1e-9);

    std::ostringstream os;
    print_timestamp_stats(s, os);
    BOOST_CHECK(os.str().find("Median difference") != std::string::npos);

    BOOST_CHECK_THROW(compute_timestamp_stats(AlignedRealVector{1.0}), InvalidArgument);
}

BOOST_AUTO_TEST_CASE(offset_search_runs_once) {
    SyntheticCapture cap;
    cap.lead = 25;

    CsiPipeline::Params params = base_params(0);
    params.use_fixed_offset = false;
    params.offset_search_length = 60;
    CsiPipeline pipeline(legacy20(), params, [](const Diagnostic&) {});

    const CsiDataset ds = pipeline.run(cap.num_frames, cap.reader());
    BOOST_CHECK_EQUAL(ds.rx_start_offset, 25u);
    BOOST_CHECK_SMALL(std::abs(ds.cir_at(9, 0, 0) - cap.gain), 0.05);
}

BOOST_AUTO_TEST_CASE(bad_offsets_and_short_readers_fail_the_dataset) {
    const SyntheticCapture cap;

    CsiPipeline past_end(legacy20(), base_params(cap.frame_len()), [](const Diagnostic&) {});
    BOOST_CHECK_THROW(past_end.run(cap.num_frames, cap.reader()), DatasetError);

    CsiPipeline short_reader(legacy20(), base_params(cap.lead), [](const Diagnostic&) {});
    BOOST_CHECK_THROW(short_reader.run(cap.num_frames + 5, cap.reader()), DatasetError);

    CsiPipeline::Params strict_params = base_params(0);
    strict_params.peak_policy = PeakPolicy::Fail;
    SyntheticCapture late = cap;
    late.lead = 50;
    CsiPipeline strict(legacy20(), strict_params, [](const Diagnostic&) {});
    BOOST_CHECK_THROW(strict.run(late.num_frames, late.reader()), DatasetError);

    CsiPipeline::Params zero_chunk = base_params(cap.lead);
    zero_chunk.chunk_size = 0;
    BOOST_CHECK_THROW(CsiPipeline(legacy20(), zero_chunk), InvalidArgument);
}

BOOST_AUTO_TEST_CASE(filtering_rebuilds_cir_from_csi) {
    const SyntheticCapture cap;
    CsiPipeline::Params params = base_params(cap.lead);
    params.csi_filter_size = 5;
    CsiPipeline pipeline(legacy20(), params, [](const Diagnostic&) {});

    const CsiDataset ds = pipeline.run(cap.num_frames, cap.reader());
    for (size_t f = 0; f < ds.num_frames; ++f) {
        AlignedVector csi(ds.num_tones);
        pipeline.dft().cir_to_csi(ds.cir_ptr(f, 0), csi.data());
        for (size_t t = 0; t < ds.num_tones; ++t) {
            BOOST_CHECK(std::isfinite(ds.csi_at(f, 0, t).real()));
            BOOST_CHECK_SMALL(std::abs(csi[t] - ds.csi_at(f, 0, t)), 1e-8);
        }
    }
}

BOOST_AUTO_TEST_CASE(shared_reference_and_series_extraction) {
    SyntheticCapture cap;
    cap.reported_tx = random_qpsk(4096, 1);

    CsiPipeline pipeline(legacy20(), base_params(cap.lead), [](const Diagnostic&) {});
    pipeline.set_reference_tx(cap.tx);
    const CsiDataset ds = pipeline.run(cap.num_frames, cap.reader());
    BOOST_CHECK_SMALL(std::abs(ds.cir_at(0, 0, 0) - cap.gain), 0.05);

    pipeline.clear_reference_tx();
    const CsiDataset wrong = pipeline.run(cap.num_frames, cap.reader());
    BOOST_CHECK_LT(std::abs(wrong.cir_at(0, 0, 0)), 0.1);

    const AlignedRealVector mag = extract_channel_series(ds, ChannelDomain::Cir, 0, 0, ChannelComponent::Magnitude);
    BOOST_REQUIRE_EQUAL(mag.size(), ds.num_frames);
    for (double v : mag) BOOST_CHECK_SMALL(v - 0.5, 0.05);

    const AlignedRealVector phase = extract_channel_series(ds, ChannelDomain::Csi, 0, 10, ChannelComponent::Phase);
    BOOST_CHECK_EQUAL(phase.size(), ds.num_frames);

    BOOST_CHECK_THROW(extract_channel_series(ds, ChannelDomain::Csi, 1, 0, ChannelComponent::Real), InvalidArgument);
    BOOST_CHECK_THROW(extract_channel_series(ds, ChannelDomain::Csi, 0, 52, ChannelComponent::Imag), InvalidArgument);
    BOOST_CHECK(parse_channel_component("IMAG") == ChannelComponent::Imag);
    BOOST_CHECK(parse_channel_domain("csi") == ChannelDomain::Csi);
}
