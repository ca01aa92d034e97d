#ifndef CSI_FILTER_HPP
#define CSI_FILTER_HPP

#include <vector>
#include <complex>
#include <cmath>
#include <string>
#include <limits>
#include <algorithm>
#include <Eigen/Dense>
#include <Common.hpp>

namespace OpenCSI {
namespace DSP {

    using CMatrixX = Eigen::Matrix<std::complex<double>, Eigen::Dynamic, Eigen::Dynamic>;

    /**
     * @brief Phase unwrapping of a real sequence (NaN entries are skipped).
     */
    inline AlignedRealVector unwrap_phase(const AlignedRealVector& phase) {
        AlignedRealVector out(phase);
        unwrap(out);
        return out;
    }

    /**
     * @brief Linear gap filling.
     *
     * NaN entries are replaced by linear interpolation between the nearest
     * finite neighbours. Leading and trailing gaps are extrapolated from the
     * first and last pair of finite samples. A single finite sample fills the
     * whole sequence; an all-NaN sequence is returned unchanged.
     */
    inline void fill_missing_linear(AlignedRealVector& x) {
        IndexVector known;
        for (size_t i = 0; i < x.size(); ++i) {
            if (!std::isnan(x[i])) known.push_back(i);
        }
        if (known.empty() || known.size() == x.size()) return;
        if (known.size() == 1) {
            std::fill(x.begin(), x.end(), x[known[0]]);
            return;
        }

        auto line = [&x](size_t a, size_t b, size_t i) {
            const double slope = (x[b] - x[a]) / static_cast<double>(b - a);
            return x[a] + slope * (static_cast<double>(i) - static_cast<double>(a));
        };

        // Leading edge
        for (size_t i = 0; i < known.front(); ++i) {
            x[i] = line(known[0], known[1], i);
        }
        // Interior gaps
        for (size_t k = 0; k + 1 < known.size(); ++k) {
            for (size_t i = known[k] + 1; i < known[k + 1]; ++i) {
                x[i] = line(known[k], known[k + 1], i);
            }
        }
        // Trailing edge
        const size_t n_known = known.size();
        for (size_t i = known.back() + 1; i < x.size(); ++i) {
            x[i] = line(known[n_known - 2], known[n_known - 1], i);
        }
    }

    /**
     * @brief Centred moving mean with shrinking end windows, NaN omitted.
     *
     * An even window length is widened to the next odd length so the kernel
     * stays symmetric about each sample.
     */
    inline AlignedRealVector moving_mean(const AlignedRealVector& x, size_t k) {
        if (k <= 1 || x.empty()) return x;
        if (k % 2 == 0) ++k;
        const size_t h = k / 2;
        const size_t n = x.size();

        AlignedRealVector y(n);
        for (size_t i = 0; i < n; ++i) {
            const size_t lo = i >= h ? i - h : 0;
            const size_t hi = std::min(n - 1, i + h);
            double sum = 0.0;
            size_t count = 0;
            for (size_t j = lo; j <= hi; ++j) {
                if (std::isnan(x[j])) continue;
                sum += x[j];
                ++count;
            }
            y[i] = count ? sum / static_cast<double>(count) : std::numeric_limits<double>::quiet_NaN();
        }
        return y;
    }

    /**
     * @brief Zero-phase boxcar smoothing (forward-backward filtering).
     *
     * Runs b = ones(k)/k forwards, then over the time-reversed result, on a
     * signal extended at both ends by odd reflection of 3*(k-1) samples, with
     * the filter state initialised to the first extended sample. k is made odd.
     */
    inline AlignedRealVector moving_mean_fb(const AlignedRealVector& x, size_t k,
                                            const DiagnosticHandler& diag = DiagnosticHandler())
    {
        if (k == 0) {
            throw InvalidArgument("moving_mean_fb: window length must be positive");
        }
        if (k == 1 || x.size() < 2) return x;
        if (k % 2 == 0) ++k;

        const size_t n = x.size();
        if (n < 3 * k) {
            report(diag, DiagnosticKind::ShortData,
                   "Data length " + std::to_string(n) + " should be at least 3 times the window length " +
                   std::to_string(k));
        }

        const size_t nfact = std::min(3 * (k - 1), n - 1);

        AlignedRealVector ext(n + 2 * nfact);
        for (size_t i = 0; i < nfact; ++i) {
            ext[i] = 2.0 * x[0] - x[nfact - i];
        }
        std::copy(x.begin(), x.end(), ext.begin() + nfact);
        for (size_t i = 0; i < nfact; ++i) {
            ext[nfact + n + i] = 2.0 * x[n - 1] - x[n - 2 - i];
        }

        // Causal boxcar with history equal to the first sample
        auto boxcar = [k](AlignedRealVector& s) {
            const double inv_k = 1.0 / static_cast<double>(k);
            const double s0 = s[0];
            double acc = s0 * static_cast<double>(k);
            AlignedRealVector out(s.size());
            for (size_t i = 0; i < s.size(); ++i) {
                if (i > 0) {
                    const double leaving = i >= k ? s[i - k] : s0;
                    acc += s[i] - leaving;
                }
                out[i] = acc * inv_k;
            }
            s.swap(out);
        };

        boxcar(ext);
        std::reverse(ext.begin(), ext.end());
        boxcar(ext);
        std::reverse(ext.begin(), ext.end());

        return AlignedRealVector(ext.begin() + nfact, ext.begin() + nfact + n);
    }

    /**
     * @brief Smooth phase without flattening its slope.
     *
     * A least-squares line is removed, the residual is smoothed with the
     * centred moving mean and the line is added back.
     *
     * @throws NaNInputError if the phase holds NaN values
     */
    inline AlignedRealVector smooth_phase_detrended(const AlignedRealVector& phase, size_t filter_size) {
        for (size_t i = 0; i < phase.size(); ++i) {
            if (std::isnan(phase[i])) {
                throw NaNInputError("Input phase contains NaN values at subcarrier " + std::to_string(i) +
                                    ". Interpolate missing data first.");
            }
        }

        const auto [slope, intercept] = linear_regression(phase);

        AlignedRealVector residual(phase.size());
        for (size_t i = 0; i < phase.size(); ++i) {
            residual[i] = phase[i] - (slope * static_cast<double>(i) + intercept);
        }

        AlignedRealVector smoothed = moving_mean(residual, filter_size);
        for (size_t i = 0; i < smoothed.size(); ++i) {
            smoothed[i] += slope * static_cast<double>(i) + intercept;
        }
        return smoothed;
    }

    /**
     * @brief Smooth CSI across subcarriers (frames x active tones).
     *
     * Active tones are placed on the dense bin range [first active, last active].
     * Magnitude and phase (unwrapped over the active tones) are gap-filled
     * linearly. With filter_size <= 1 the filled values are recombined as they
     * are; otherwise magnitude gets a centred moving mean and phase is smoothed
     * around its linear trend. Output holds the active tones only.
     *
     * @param csi Frames x tones, column order matching active_fft_indices
     * @param active_fft_indices 1-based, strictly increasing
     * @throws NaNInputError when a frame cannot be gap-filled
     */
    inline CMatrixX filter_csi(const CMatrixX& csi, const IndexVector& active_fft_indices, size_t filter_size = 5) {
        const size_t num_tones = active_fft_indices.size();
        if (num_tones == 0) {
            throw InvalidArgument("filter_csi: active index set is empty");
        }
        if (static_cast<size_t>(csi.cols()) != num_tones) {
            throw InvalidArgument("filter_csi: CSI has " + std::to_string(csi.cols()) +
                                  " subcarriers but " + std::to_string(num_tones) + " active indices were given");
        }
        for (size_t i = 1; i < num_tones; ++i) {
            if (active_fft_indices[i] <= active_fft_indices[i - 1]) {
                throw InvalidArgument("filter_csi: active indices are not strictly increasing at position " +
                                      std::to_string(i));
            }
        }

        const size_t first = active_fft_indices.front();
        const size_t dense_len = active_fft_indices.back() - first + 1;

        IndexVector mapped(num_tones);
        for (size_t t = 0; t < num_tones; ++t) {
            mapped[t] = active_fft_indices[t] - first;
        }

        CMatrixX out(csi.rows(), csi.cols());
        const double nan = std::numeric_limits<double>::quiet_NaN();

        AlignedRealVector phase_active(num_tones);
        for (Eigen::Index f = 0; f < csi.rows(); ++f) {
            AlignedRealVector mag(dense_len, nan);
            AlignedRealVector phase(dense_len, nan);

            for (size_t t = 0; t < num_tones; ++t) {
                phase_active[t] = std::arg(csi(f, t));
            }
            unwrap(phase_active);

            for (size_t t = 0; t < num_tones; ++t) {
                mag[mapped[t]] = std::abs(csi(f, t));
                phase[mapped[t]] = phase_active[t];
            }

            fill_missing_linear(mag);
            fill_missing_linear(phase);

            for (size_t i = 0; i < dense_len; ++i) {
                if (std::isnan(mag[i]) || std::isnan(phase[i])) {
                    throw NaNInputError("filter_csi: frame " + std::to_string(f) +
                                        " still contains NaN values after gap filling");
                }
            }

            if (filter_size > 1) {
                mag = moving_mean(mag, filter_size);
                phase = smooth_phase_detrended(phase, filter_size);
            }

            for (size_t t = 0; t < num_tones; ++t) {
                out(f, t) = mag[mapped[t]] * std::exp(Complex(0.0, phase[mapped[t]]));
            }
        }
        return out;
    }

} // namespace DSP
} // namespace OpenCSI

#endif // CSI_FILTER_HPP
