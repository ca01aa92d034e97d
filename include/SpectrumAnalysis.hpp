#ifndef SPECTRUM_ANALYSIS_HPP
#define SPECTRUM_ANALYSIS_HPP

#include <vector>
#include <complex>
#include <cmath>
#include <string>
#include <algorithm>
#include <fftw3.h>
#include <Eigen/Dense>
#include <Common.hpp>
#include <SpectralPrimitives.hpp>
#include <CsiFilter.hpp>

namespace OpenCSI {
namespace DSP {

    struct ResampleParams {
        double target_rate = 20.0;      // Hz
        size_t median_window = 5;
        size_t mean_window = 5;
        double edge_cut_seconds = 1.0;
    };

    struct ResampledSignal {
        AlignedRealVector signal;
        AlignedRealVector timestamps;   // seconds, starting at 0
    };

    struct PsdParams {
        size_t nfft = 0;                // 0: next power of two >= signal length
        double window_shape = 5.0;      // see get_window
        double f_min = 0.0;
        double f_max = -1.0;            // < 0: fs / 2
        int detrend_order = 0;
    };

    struct PsdResult {
        std::vector<double> pxx;
        std::vector<double> freq;       // ascending, positive frequencies
    };

    /**
     * @brief Centred moving median with shrinking end windows (even k widened to odd).
     */
    inline AlignedRealVector moving_median(const AlignedRealVector& x, size_t k) {
        if (k <= 1 || x.empty()) return x;
        if (k % 2 == 0) ++k;
        const size_t h = k / 2;
        const size_t n = x.size();

        AlignedRealVector y(n);
        std::vector<double> window;
        window.reserve(k);
        for (size_t i = 0; i < n; ++i) {
            const size_t lo = i >= h ? i - h : 0;
            const size_t hi = std::min(n - 1, i + h);
            window.assign(x.begin() + lo, x.begin() + hi + 1);
            const size_t m = window.size();
            std::nth_element(window.begin(), window.begin() + m / 2, window.end());
            double med = window[m / 2];
            if (m % 2 == 0) {
                const double lower = *std::max_element(window.begin(), window.begin() + m / 2);
                med = 0.5 * (med + lower);
            }
            y[i] = med;
        }
        return y;
    }

    /**
     * @brief Resample an irregularly sampled series onto a uniform grid.
     *
     * 1. Moving median (outlier suppression)
     * 2. Linear interpolation onto t0 + k / target_rate
     * 3. Drop round(edge_cut_seconds * target_rate) samples at both ends
     * 4. Zero-phase moving mean
     * 5. Timestamps re-zeroed to start at 0
     */
    inline ResampledSignal apply_resample(const AlignedRealVector& signal,
                                          const AlignedRealVector& timestamps,
                                          const ResampleParams& params,
                                          const DiagnosticHandler& diag = DiagnosticHandler())
    {
        if (signal.size() != timestamps.size()) {
            throw InvalidArgument("apply_resample: signal has " + std::to_string(signal.size()) +
                                  " samples but " + std::to_string(timestamps.size()) + " timestamps");
        }
        if (signal.size() < 2) {
            throw InvalidArgument("apply_resample: need at least 2 samples");
        }
        if (!(params.target_rate > 0.0)) {
            throw InvalidArgument("apply_resample: target rate must be positive");
        }
        if (params.edge_cut_seconds < 0.0) {
            throw InvalidArgument("apply_resample: edge cut must not be negative");
        }
        for (size_t i = 1; i < timestamps.size(); ++i) {
            if (!(timestamps[i] > timestamps[i - 1])) {
                throw InvalidArgument("apply_resample: timestamps are not strictly increasing at sample " +
                                      std::to_string(i));
            }
        }

        const AlignedRealVector filtered = moving_median(signal, params.median_window);

        const double t0 = timestamps.front();
        const double span = timestamps.back() - t0;
        const size_t num_out = static_cast<size_t>(std::floor(span * params.target_rate + 1e-9)) + 1;

        AlignedRealVector uniform(num_out);
        size_t seg = 0;
        for (size_t k = 0; k < num_out; ++k) {
            const double t = t0 + static_cast<double>(k) / params.target_rate;
            while (seg + 2 < timestamps.size() && timestamps[seg + 1] < t) ++seg;
            const double ta = timestamps[seg];
            const double tb = timestamps[seg + 1];
            const double frac = std::min(1.0, std::max(0.0, (t - ta) / (tb - ta)));
            uniform[k] = filtered[seg] + frac * (filtered[seg + 1] - filtered[seg]);
        }

        const size_t cut = static_cast<size_t>(std::llround(params.edge_cut_seconds * params.target_rate));
        if (2 * cut >= num_out) {
            throw InvalidArgument("apply_resample: edge cut of " + std::to_string(cut) +
                                  " samples per side leaves nothing of " + std::to_string(num_out) + " samples");
        }

        AlignedRealVector trimmed(uniform.begin() + cut, uniform.end() - cut);

        ResampledSignal out;
        out.signal = moving_mean_fb(trimmed, params.mean_window, diag);
        out.timestamps.resize(out.signal.size());
        for (size_t k = 0; k < out.timestamps.size(); ++k) {
            out.timestamps[k] = static_cast<double>(k) / params.target_rate;
        }
        return out;
    }

    /**
     * @brief Remove a least-squares polynomial of the given order (0 = mean).
     */
    inline AlignedRealVector polynomial_detrend(const AlignedRealVector& x, int order) {
        if (order < 0) {
            throw InvalidArgument("polynomial_detrend: order must not be negative");
        }
        const Eigen::Index n = static_cast<Eigen::Index>(x.size());
        if (n == 0) return x;

        const Eigen::Index cols = std::min<Eigen::Index>(order + 1, n);
        Eigen::MatrixXd V(n, cols);
        for (Eigen::Index i = 0; i < n; ++i) {
            // Abscissa scaled to [-1, 1] keeps the Vandermonde matrix well conditioned
            const double t = n > 1 ? 2.0 * static_cast<double>(i) / static_cast<double>(n - 1) - 1.0 : 0.0;
            double p = 1.0;
            for (Eigen::Index c = 0; c < cols; ++c) {
                V(i, c) = p;
                p *= t;
            }
        }

        Eigen::Map<const Eigen::VectorXd> y(x.data(), n);
        const Eigen::VectorXd coeffs = V.colPivHouseholderQr().solve(y);
        const Eigen::VectorXd residual = y - V * coeffs;

        return AlignedRealVector(residual.data(), residual.data() + n);
    }

    /**
     * @brief Two-sided, centred periodogram.
     *
     * Pxx = |FFT(x .* w)|^2 / (fs * sum(w^2)). Input longer than nfft is
     * wrapped modulo nfft. Bin j maps to (j - floor((nfft-1)/2)) * fs / nfft,
     * i.e. (-fs/2, fs/2] for even nfft.
     *
     * @return {pxx, freq}
     */
    inline std::pair<std::vector<double>, std::vector<double>> periodogram_centered(
        const AlignedRealVector& x,
        const AlignedRealVector& window,
        size_t nfft,
        double fs)
    {
        if (x.size() != window.size()) {
            throw InvalidArgument("periodogram_centered: signal and window lengths differ");
        }
        if (nfft == 0 || x.empty()) {
            throw InvalidArgument("periodogram_centered: empty signal or zero nfft");
        }
        if (!(fs > 0.0)) {
            throw InvalidArgument("periodogram_centered: sample rate must be positive");
        }

        AlignedVector buf(nfft, Complex(0.0, 0.0));
        double U = 0.0;
        for (size_t i = 0; i < x.size(); ++i) {
            buf[i % nfft] += x[i] * window[i];
            U += window[i] * window[i];
        }

        fftw_plan plan = fftw_plan_dft_1d(static_cast<int>(nfft),
                                          reinterpret_cast<fftw_complex*>(buf.data()),
                                          reinterpret_cast<fftw_complex*>(buf.data()),
                                          FFTW_FORWARD, FFTW_ESTIMATE);
        if (!plan) {
            throw std::runtime_error("periodogram_centered: FFTW plan creation failed for nfft " +
                                     std::to_string(nfft));
        }
        fftw_execute(plan);
        fftw_destroy_plan(plan);

        const double scale = 1.0 / (fs * U);
        const long offset = static_cast<long>((nfft - 1) / 2);
        const long N = static_cast<long>(nfft);

        std::vector<double> pxx(nfft);
        std::vector<double> freq(nfft);
        for (long j = 0; j < N; ++j) {
            const long k = j - offset;
            const size_t bin = static_cast<size_t>(((k % N) + N) % N);
            pxx[j] = std::norm(buf[bin]) * scale;
            freq[j] = static_cast<double>(k) * fs / static_cast<double>(nfft);
        }
        return {pxx, freq};
    }

    /**
     * @brief One-sided power spectral density of a real series.
     *
     * Detrend, energy-normalised window, centred periodogram, fold onto
     * positive frequencies and keep [f_min, f_max].
     */
    inline PsdResult spectrum_psd(const AlignedRealVector& signal, double fs, const PsdParams& params = PsdParams()) {
        if (signal.empty()) {
            throw InvalidArgument("spectrum_psd: signal is empty");
        }
        if (!(fs > 0.0)) {
            throw InvalidArgument("spectrum_psd: sample rate must be positive");
        }

        const size_t nfft = params.nfft == 0 ? next_pow2(signal.size()) : params.nfft;
        const double f_max = params.f_max < 0.0 ? fs / 2.0 : params.f_max;

        const AlignedRealVector win = get_window(params.window_shape, signal.size(), WindowNorm::Energy);
        const AlignedRealVector detrended = polynomial_detrend(signal, params.detrend_order);

        auto [psd, freq] = periodogram_centered(detrended, win, nfft, fs);
        auto [folded, freq_pos] = combine_symmetric_frequencies(psd, freq);

        PsdResult result;
        for (size_t i = 0; i < freq_pos.size(); ++i) {
            if (freq_pos[i] >= params.f_min && freq_pos[i] <= f_max) {
                result.pxx.push_back(folded[i]);
                result.freq.push_back(freq_pos[i]);
            }
        }
        return result;
    }

    /**
     * @brief Frequency of the PSD maximum.
     */
    inline double dominant_frequency(const PsdResult& psd) {
        if (psd.pxx.empty()) {
            throw InvalidArgument("dominant_frequency: PSD is empty");
        }
        const auto it = std::max_element(psd.pxx.begin(), psd.pxx.end());
        return psd.freq[static_cast<size_t>(it - psd.pxx.begin())];
    }

} // namespace DSP
} // namespace OpenCSI

#endif // SPECTRUM_ANALYSIS_HPP
