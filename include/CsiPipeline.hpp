#ifndef CSI_PIPELINE_HPP
#define CSI_PIPELINE_HPP

#include <vector>
#include <complex>
#include <functional>
#include <string>
#include <iostream>
#include <iomanip>
#include <cstdint>
#include <algorithm>
#include <Common.hpp>
#include <SubcarrierMapping.hpp>
#include <PrunedDFT.hpp>
#include <CirEstimator.hpp>
#include <CsiFilter.hpp>

namespace OpenCSI {
namespace Core {

    enum class AntennaPolicy {
        Reallocate,     // zero the tensor at the new width and keep going
        Fail            // throw DatasetError
    };

    inline AntennaPolicy parse_antenna_policy(const std::string& name) {
        const std::string key = to_lower(name);
        if (key == "reallocate") return AntennaPolicy::Reallocate;
        if (key == "fail") return AntennaPolicy::Fail;
        throw InvalidArgument("Unknown antenna policy '" + name + "' (expected reallocate or fail)");
    }

    /**
     * @brief One block of consecutive frames handed over by the reader.
     *
     * rx is frame-major: rx[(f * num_antennas + a) * num_samples + n].
     * tx holds either one shared reference (tx_samples long) or one reference
     * per frame (num_frames * tx_samples long).
     */
    struct FrameChunk {
        size_t num_frames = 0;
        size_t num_antennas = 0;
        size_t num_samples = 0;
        AlignedVector rx;
        size_t tx_samples = 0;
        AlignedVector tx;

        const Complex* rx_frame(size_t frame, size_t antenna) const {
            return rx.data() + (frame * num_antennas + antenna) * num_samples;
        }

        const Complex* tx_frame(size_t frame) const {
            return tx.size() == tx_samples ? tx.data() : tx.data() + frame * tx_samples;
        }
    };

    /**
     * Fills @p chunk with up to chunk_size frames starting at chunk_index * chunk_size.
     * Returns false when no more frames are available.
     */
    using ChunkReader = std::function<bool(size_t chunk_index, size_t chunk_size, FrameChunk& chunk)>;

    /**
     * @brief Per-dataset result: CSI (frames x antennas x tones) and CIR (frames x antennas x taps).
     */
    struct CsiDataset {
        std::string dataset_id;
        size_t num_frames = 0;
        size_t num_antennas = 0;
        size_t num_tones = 0;
        size_t fft_length = 0;
        size_t rx_start_offset = 0;
        size_t clipped_frames = 0;

        AlignedVector csi;
        AlignedVector cir;
        AlignedRealVector timestamps;       // seconds relative to the first frame
        std::vector<double> center_freqs;

        void allocate(size_t frames, size_t antennas, size_t tones, size_t taps) {
            num_frames = frames;
            num_antennas = antennas;
            num_tones = tones;
            fft_length = taps;
            csi.assign(frames * antennas * tones, Complex(0.0, 0.0));
            cir.assign(frames * antennas * taps, Complex(0.0, 0.0));
        }

        Complex* csi_ptr(size_t frame, size_t antenna) {
            return csi.data() + (frame * num_antennas + antenna) * num_tones;
        }
        const Complex* csi_ptr(size_t frame, size_t antenna) const {
            return csi.data() + (frame * num_antennas + antenna) * num_tones;
        }
        Complex* cir_ptr(size_t frame, size_t antenna) {
            return cir.data() + (frame * num_antennas + antenna) * fft_length;
        }
        const Complex* cir_ptr(size_t frame, size_t antenna) const {
            return cir.data() + (frame * num_antennas + antenna) * fft_length;
        }

        Complex csi_at(size_t frame, size_t antenna, size_t tone) const {
            return csi_ptr(frame, antenna)[tone];
        }
        Complex cir_at(size_t frame, size_t antenna, size_t tap) const {
            return cir_ptr(frame, antenna)[tap];
        }
    };

    struct TimestampStats {
        double min_interval = 0.0;
        double max_interval = 0.0;
        double mean_interval = 0.0;
        double median_interval = 0.0;
        double rate_min = 0.0;          // 1 / max_interval
        double rate_max = 0.0;          // 1 / min_interval
        double rate_mean = 0.0;
        double rate_median = 0.0;
    };

    /**
     * @brief Interval statistics of a timestamp series in seconds.
     */
    inline TimestampStats compute_timestamp_stats(const AlignedRealVector& seconds) {
        if (seconds.size() < 2) {
            throw InvalidArgument("compute_timestamp_stats: need at least 2 timestamps, got " +
                                  std::to_string(seconds.size()));
        }
        std::vector<double> diffs(seconds.size() - 1);
        for (size_t i = 1; i < seconds.size(); ++i) {
            diffs[i - 1] = seconds[i] - seconds[i - 1];
        }

        TimestampStats s;
        s.min_interval = *std::min_element(diffs.begin(), diffs.end());
        s.max_interval = *std::max_element(diffs.begin(), diffs.end());
        double sum = 0.0;
        for (double d : diffs) sum += d;
        s.mean_interval = sum / static_cast<double>(diffs.size());

        std::sort(diffs.begin(), diffs.end());
        const size_t m = diffs.size();
        s.median_interval = (m % 2) ? diffs[m / 2] : 0.5 * (diffs[m / 2 - 1] + diffs[m / 2]);

        s.rate_min = 1.0 / s.max_interval;
        s.rate_max = 1.0 / s.min_interval;
        s.rate_mean = 1.0 / s.mean_interval;
        s.rate_median = 1.0 / s.median_interval;
        return s;
    }

    inline void print_timestamp_stats(const TimestampStats& s, std::ostream& os = std::cout) {
        os << std::fixed << std::setprecision(3);
        os << "Minimum difference:  " << s.min_interval << " seconds (" << s.min_interval * 1e3 << " ms)\n";
        os << "Maximum difference:  " << s.max_interval << " seconds (" << s.max_interval * 1e3 << " ms)\n";
        os << "Mean difference:     " << s.mean_interval << " seconds (" << s.mean_interval * 1e3 << " ms)\n";
        os << "Median difference:   " << s.median_interval << " seconds (" << s.median_interval * 1e3 << " ms)\n";
        os << std::setprecision(2);
        os << "Rates: Min=" << s.rate_min << " Hz, Max=" << s.rate_max << " Hz, Mean=" << s.rate_mean
           << " Hz, Median=" << s.rate_median << " Hz" << std::endl;
        os << std::defaultfloat;
    }

    enum class ChannelDomain { Cir, Csi };
    enum class ChannelComponent { Magnitude, Phase, Real, Imag };

    inline ChannelDomain parse_channel_domain(const std::string& name) {
        const std::string key = to_lower(name);
        if (key == "cir") return ChannelDomain::Cir;
        if (key == "csi") return ChannelDomain::Csi;
        throw InvalidArgument("Unknown channel domain '" + name + "' (expected cir or csi)");
    }

    inline ChannelComponent parse_channel_component(const std::string& name) {
        const std::string key = to_lower(name);
        if (key == "magnitude") return ChannelComponent::Magnitude;
        if (key == "phase") return ChannelComponent::Phase;
        if (key == "real") return ChannelComponent::Real;
        if (key == "imag") return ChannelComponent::Imag;
        throw InvalidArgument("Unknown channel component '" + name + "' (expected magnitude, phase, real or imag)");
    }

    /**
     * @brief Time series of one CIR tap or CSI tone across all frames.
     *
     * Phase is unwrapped along time.
     */
    inline AlignedRealVector extract_channel_series(const CsiDataset& ds,
                                                    ChannelDomain domain,
                                                    size_t antenna,
                                                    size_t bin,
                                                    ChannelComponent component)
    {
        const size_t width = domain == ChannelDomain::Cir ? ds.fft_length : ds.num_tones;
        if (antenna >= ds.num_antennas) {
            throw InvalidArgument("extract_channel_series: antenna " + std::to_string(antenna) +
                                  " out of range (dataset has " + std::to_string(ds.num_antennas) + ")");
        }
        if (bin >= width) {
            throw InvalidArgument("extract_channel_series: bin " + std::to_string(bin) +
                                  " out of range (width " + std::to_string(width) + ")");
        }

        AlignedRealVector series(ds.num_frames);
        for (size_t f = 0; f < ds.num_frames; ++f) {
            const Complex v = domain == ChannelDomain::Cir ? ds.cir_at(f, antenna, bin)
                                                            : ds.csi_at(f, antenna, bin);
            switch (component) {
                case ChannelComponent::Magnitude: series[f] = std::abs(v); break;
                case ChannelComponent::Phase:     series[f] = std::arg(v); break;
                case ChannelComponent::Real:      series[f] = v.real(); break;
                case ChannelComponent::Imag:      series[f] = v.imag(); break;
            }
        }
        if (component == ChannelComponent::Phase) {
            unwrap(series);
        }
        return series;
    }

    /**
     * @brief Batch CSI/CIR estimation over a chunked dataset.
     *
     * Chunks are requested strictly in order. For every frame and antenna the
     * RX vector is checked for ADC clipping, its CIR is estimated by cross
     * correlation, and the CSI follows through the pruned DFT matrix. Optional
     * smoothing of the CSI runs after all frames are in, and the CIR is then
     * rebuilt through the pseudo-inverse.
     */
    class CsiPipeline {
    public:
        struct Params {
            std::string dataset_id;
            size_t chunk_size = 1000;
            int adc_bit_width = 12;
            size_t clipping_max_warnings = 100;
            bool use_fixed_offset = true;
            size_t rx_start_offset = 67;
            size_t offset_search_length = 0;
            size_t csi_filter_size = 1;
            double clock_rate = 100e6;
            PeakPolicy peak_policy = PeakPolicy::Warn;
            AntennaPolicy antenna_policy = AntennaPolicy::Reallocate;
            unsigned fft_planner_flags = FFTW_ESTIMATE;
            bool verbose = false;
        };

        CsiPipeline(const DSP::SubcarrierMapping& mapping, const Params& params,
                    DiagnosticHandler diag = DiagnosticHandler())
            : _params(params),
              _mapping(mapping),
              _diag(std::move(diag)),
              _dft(mapping.fft_length, mapping.active_fft_indices, 0,
                   [this](const Diagnostic& d) { report(_diag, d.kind, _context() + d.message); }),
              _correlator(mapping.fft_length, params.peak_policy,
                          [this](const Diagnostic& d) { report(_diag, d.kind, _context() + d.message); },
                          params.fft_planner_flags)
        {
            if (_params.chunk_size == 0) {
                throw InvalidArgument("CsiPipeline: chunk size must be at least 1");
            }
            if (_params.adc_bit_width < 2 || _params.adc_bit_width > 32) {
                throw InvalidArgument("CsiPipeline: ADC bit width " + std::to_string(_params.adc_bit_width) +
                                      " outside [2, 32]");
            }
            if (!(_params.clock_rate > 0.0)) {
                throw InvalidArgument("CsiPipeline: clock rate must be positive");
            }
            _full_scale = std::ldexp(1.0, _params.adc_bit_width - 1) - 1.0;
        }

        // Non-copyable: the diagnostic lambdas capture this
        CsiPipeline(const CsiPipeline&) = delete;
        CsiPipeline& operator=(const CsiPipeline&) = delete;

        /**
         * @brief Use one externally supplied reference for every frame instead of chunk TX.
         */
        void set_reference_tx(const AlignedVector& tx) { _reference_tx = tx; }
        void clear_reference_tx() { _reference_tx.clear(); }

        const PrunedDFTMatrix& dft() const { return _dft; }
        const Params& params() const { return _params; }

        /**
         * @brief Process one dataset.
         *
         * @param num_frames Frames expected in the dataset
         * @param reader Chunk source, called with chunk_index = 0, 1, ...
         * @param timestamp_ticks Capture timestamps in clock ticks (empty or num_frames entries)
         * @param center_freqs Per-frame centre frequencies (empty or num_frames entries)
         * @throws DatasetError on malformed input or a frame that cannot be processed
         */
        CsiDataset run(size_t num_frames,
                       const ChunkReader& reader,
                       const std::vector<uint64_t>& timestamp_ticks = std::vector<uint64_t>(),
                       const std::vector<double>& center_freqs = std::vector<double>())
        {
            CsiDataset ds;
            ds.dataset_id = _params.dataset_id;
            if (!center_freqs.empty() && center_freqs.size() != num_frames) {
                throw DatasetError(_dataset_prefix() + "found " + std::to_string(center_freqs.size()) +
                                   " centre frequencies for " + std::to_string(num_frames) + " frames");
            }
            ds.center_freqs = center_freqs;
            ds.timestamps = _convert_timestamps(num_frames, timestamp_ticks);
            ds.rx_start_offset = _params.rx_start_offset;

            if (_params.verbose && ds.timestamps.size() >= 2) {
                std::cout << "\nTimestamp Statistics:\n-------------------\n";
                print_timestamp_stats(compute_timestamp_stats(ds.timestamps));
            }

            _clipped_frames = 0;
            _offset_known = _params.use_fixed_offset;
            _offset = _params.rx_start_offset;

            const size_t num_tones = _mapping.num_tones;
            const size_t fft_length = _mapping.fft_length;
            bool allocated = false;

            if (_params.verbose) std::cout << "\nProcessing frames:\n";

            size_t frame = 0;
            size_t chunk_index = 0;
            FrameChunk chunk;
            while (frame < num_frames) {
                chunk = FrameChunk();
                if (!reader(chunk_index, _params.chunk_size, chunk)) {
                    throw DatasetError(_dataset_prefix() + "reader delivered " + std::to_string(frame) +
                                       " of " + std::to_string(num_frames) + " frames");
                }
                _validate_chunk(chunk, chunk_index, num_frames - frame);

                if (!allocated) {
                    ds.allocate(num_frames, chunk.num_antennas, num_tones, fft_length);
                    allocated = true;
                } else if (chunk.num_antennas != ds.num_antennas) {
                    _handle_antenna_mismatch(ds, chunk.num_antennas, frame);
                }

                for (size_t fc = 0; fc < chunk.num_frames; ++fc, ++frame) {
                    if (_params.verbose && (frame + 1) % 100 == 0) {
                        std::cout << "Processing frame " << (frame + 1) << "/" << num_frames << std::endl;
                    }
                    const Complex* tx = _reference_tx.empty() ? chunk.tx_frame(fc) : _reference_tx.data();
                    const size_t tx_len = _reference_tx.empty() ? chunk.tx_samples : _reference_tx.size();

                    for (size_t a = 0; a < chunk.num_antennas; ++a) {
                        _cur_frame = frame;
                        _cur_antenna = a;
                        _process_frame(ds, tx, tx_len, chunk.rx_frame(fc, a), chunk.num_samples, frame, a);
                    }
                }
                ++chunk_index;
            }
            _cur_frame = kNoFrame;

            if (!allocated) {
                ds.allocate(0, 0, num_tones, fft_length);
            }
            ds.clipped_frames = _clipped_frames;
            ds.rx_start_offset = _offset;

            if (_params.csi_filter_size > 1) {
                if (_params.verbose) std::cout << "\nApplying CSI filtering...\n";
                apply_filter(ds, _params.csi_filter_size);
            }
            return ds;
        }

        /**
         * @brief Smooth CSI per antenna and rebuild the CIR from it.
         */
        void apply_filter(CsiDataset& ds, size_t filter_size) const {
            if (ds.num_frames == 0) return;
            for (size_t a = 0; a < ds.num_antennas; ++a) {
                DSP::CMatrixX csi(static_cast<Eigen::Index>(ds.num_frames), static_cast<Eigen::Index>(ds.num_tones));
                for (size_t f = 0; f < ds.num_frames; ++f) {
                    const Complex* src = ds.csi_ptr(f, a);
                    for (size_t t = 0; t < ds.num_tones; ++t) csi(f, t) = src[t];
                }

                const DSP::CMatrixX filtered = DSP::filter_csi(csi, _mapping.active_fft_indices, filter_size);

                CVectorX row(static_cast<Eigen::Index>(ds.num_tones));
                for (size_t f = 0; f < ds.num_frames; ++f) {
                    Complex* dst = ds.csi_ptr(f, a);
                    for (size_t t = 0; t < ds.num_tones; ++t) {
                        dst[t] = filtered(f, t);
                        row(t) = filtered(f, t);
                    }
                    _dft.csi_to_cir(row.data(), ds.cir_ptr(f, a));
                }
            }
        }

        size_t clipped_frames() const { return _clipped_frames; }

    private:
        static constexpr size_t kNoFrame = static_cast<size_t>(-1);

        Params _params;
        DSP::SubcarrierMapping _mapping;
        DiagnosticHandler _diag;
        size_t _cur_frame = kNoFrame;       // context for diagnostics, set before _dft
        size_t _cur_antenna = 0;
        PrunedDFTMatrix _dft;
        CirCorrelator _correlator;
        AlignedVector _reference_tx;

        double _full_scale = 0.0;
        size_t _clipped_frames = 0;
        bool _offset_known = true;
        size_t _offset = 0;

        std::string _dataset_prefix() const {
            return _params.dataset_id.empty() ? std::string() : "Dataset " + _params.dataset_id + ": ";
        }

        std::string _context() const {
            if (_cur_frame == kNoFrame) return _dataset_prefix();
            return _dataset_prefix() + "Frame " + std::to_string(_cur_frame) +
                   ", Antenna " + std::to_string(_cur_antenna) + ": ";
        }

        AlignedRealVector _convert_timestamps(size_t num_frames, const std::vector<uint64_t>& ticks) const {
            AlignedRealVector seconds;
            if (ticks.empty()) return seconds;
            if (ticks.size() != num_frames) {
                throw DatasetError(_dataset_prefix() + "found " + std::to_string(ticks.size()) +
                                   " timestamps for " + std::to_string(num_frames) + " frames");
            }
            seconds.resize(ticks.size());
            for (size_t i = 0; i < ticks.size(); ++i) {
                const int64_t delta = static_cast<int64_t>(ticks[i] - ticks[0]);
                seconds[i] = static_cast<double>(delta) / _params.clock_rate;
            }
            return seconds;
        }

        void _validate_chunk(const FrameChunk& chunk, size_t chunk_index, size_t frames_left) const {
            const std::string where = _dataset_prefix() + "chunk " + std::to_string(chunk_index) + ": ";
            if (chunk.num_frames == 0) {
                throw DatasetError(where + "reader returned an empty chunk");
            }
            if (chunk.num_frames > frames_left) {
                throw DatasetError(where + std::to_string(chunk.num_frames) + " frames delivered but only " +
                                   std::to_string(frames_left) + " remain in the dataset");
            }
            if (chunk.num_antennas == 0 || chunk.num_samples == 0) {
                throw DatasetError(where + "chunk has no antennas or no samples");
            }
            if (chunk.rx.size() != chunk.num_frames * chunk.num_antennas * chunk.num_samples) {
                throw DatasetError(where + "RX buffer holds " + std::to_string(chunk.rx.size()) +
                                   " samples, expected " +
                                   std::to_string(chunk.num_frames * chunk.num_antennas * chunk.num_samples));
            }
            if (_reference_tx.empty()) {
                if (chunk.tx_samples == 0 ||
                    (chunk.tx.size() != chunk.tx_samples && chunk.tx.size() != chunk.num_frames * chunk.tx_samples)) {
                    throw DatasetError(where + "TX buffer holds " + std::to_string(chunk.tx.size()) +
                                       " samples, expected " + std::to_string(chunk.tx_samples) + " or " +
                                       std::to_string(chunk.num_frames * chunk.tx_samples));
                }
            }
        }

        void _handle_antenna_mismatch(CsiDataset& ds, size_t new_antennas, size_t frames_done) {
            const std::string msg = _dataset_prefix() + "chunk reports " + std::to_string(new_antennas) +
                                    " antennas but the dataset was allocated for " +
                                    std::to_string(ds.num_antennas);
            if (_params.antenna_policy == AntennaPolicy::Fail) {
                throw DatasetError(msg);
            }
            report(_diag, DiagnosticKind::AntennaReallocation,
                   msg + "; reallocating and discarding " + std::to_string(frames_done) + " processed frames");
            ds.allocate(ds.num_frames, new_antennas, ds.num_tones, ds.fft_length);
        }

        void _process_frame(CsiDataset& ds, const Complex* tx, size_t tx_len,
                            const Complex* rx, size_t rx_len, size_t frame, size_t antenna)
        {
            size_t clipped = 0;
            for (size_t n = 0; n < rx_len; ++n) {
                if (std::abs(rx[n]) >= _full_scale) ++clipped;
            }
            if (clipped > 0) {
                ++_clipped_frames;
                if (_clipped_frames <= _params.clipping_max_warnings) {
                    report(_diag, DiagnosticKind::Clipping,
                           _context() + std::to_string(clipped) + " samples clipped");
                }
            }

            try {
                if (!_offset_known) {
                    _offset = _correlator.find_rx_start_offset(tx, tx_len, rx, rx_len, _params.offset_search_length);
                    _offset_known = true;
                    if (_params.verbose) {
                        std::cout << "Estimated RX start offset: " << _offset << std::endl;
                    }
                }
                _correlator.compute(tx, tx_len, rx, rx_len, _offset, ds.cir_ptr(frame, antenna));
            } catch (const std::out_of_range& e) {
                throw DatasetError(_context() + e.what());
            } catch (const PeakDiscrepancyError& e) {
                throw DatasetError(_context() + e.what());
            }

            _dft.cir_to_csi(ds.cir_ptr(frame, antenna), ds.csi_ptr(frame, antenna));
        }
    };

} // namespace Core
} // namespace OpenCSI

#endif // CSI_PIPELINE_HPP
