#ifndef CIR_ESTIMATOR_HPP
#define CIR_ESTIMATOR_HPP

#include <vector>
#include <complex>
#include <string>
#include <sstream>
#include <algorithm>
#include <fftw3.h>
#include <Common.hpp>

namespace OpenCSI {
namespace Core {

    enum class PeakPolicy {
        Warn,   // report a PeakDiscrepancy diagnostic and keep the CIR
        Fail    // throw PeakDiscrepancyError
    };

    inline PeakPolicy parse_peak_policy(const std::string& name) {
        const std::string key = to_lower(name);
        if (key == "warn") return PeakPolicy::Warn;
        if (key == "fail") return PeakPolicy::Fail;
        throw InvalidArgument("Unknown peak policy '" + name + "' (expected warn or fail)");
    }

    /**
     * @brief Cross-correlation CIR estimator.
     *
     * Computes R(m) = sum_n rx[n + m] * conj(tx[n]) for m in [-max_lag, max_lag]
     * (linear correlation, zero padding) with FFTW. Plans and buffers are
     * rebuilt only when the padded transform length changes, and the transform
     * of the reference is reused while the reference does not change.
     * With FFTW_MEASURE (or stronger) planning the plans are drawn from and
     * added to the FFTW wisdom store.
     */
    class CirCorrelator {
    public:
        /**
         * @param fft_length CIR length N (also the correlation lag range)
         * @param policy Reaction to a correlation peak outside the CIR window
         * @param diag Receives OddFftLength and PeakDiscrepancy diagnostics
         * @param planner_flags FFTW planner rigour (FFTW_ESTIMATE, FFTW_MEASURE, ...)
         */
        explicit CirCorrelator(size_t fft_length,
                               PeakPolicy policy = PeakPolicy::Warn,
                               DiagnosticHandler diag = DiagnosticHandler(),
                               unsigned planner_flags = FFTW_ESTIMATE)
            : _fft_length(fft_length),
              _policy(policy),
              _diag(std::move(diag)),
              _planner_flags(planner_flags)
        {
            if (_fft_length == 0) {
                throw InvalidArgument("CirCorrelator: FFT length must be positive");
            }
            if (_fft_length % 2 != 0) {
                report(_diag, DiagnosticKind::OddFftLength,
                       "fftLength " + std::to_string(_fft_length) +
                       " is not even. Ensure indexing for extracting CIR is correct.");
            }
        }

        ~CirCorrelator() {
            _destroy_plans();
        }

        // Non-copyable due to FFTW plans
        CirCorrelator(const CirCorrelator&) = delete;
        CirCorrelator& operator=(const CirCorrelator&) = delete;

        // Move constructible
        CirCorrelator(CirCorrelator&& other) noexcept
            : _fft_length(other._fft_length),
              _policy(other._policy),
              _diag(std::move(other._diag)),
              _planner_flags(other._planner_flags),
              _corr_len(other._corr_len),
              _fft_x(other._fft_x),
              _fft_h(other._fft_h),
              _ifft_corr(other._ifft_corr),
              _x_padded(std::move(other._x_padded)),
              _h_padded(std::move(other._h_padded)),
              _X(std::move(other._X)),
              _H(std::move(other._H)),
              _corr_result(std::move(other._corr_result)),
              _lags(std::move(other._lags)),
              _cached_ref(std::move(other._cached_ref)),
              _ref_valid(other._ref_valid)
        {
            other._fft_x = nullptr;
            other._fft_h = nullptr;
            other._ifft_corr = nullptr;
            other._corr_len = 0;
            other._ref_valid = false;
        }

        size_t fft_length() const { return _fft_length; }
        unsigned planner_flags() const { return _planner_flags; }
        void set_peak_policy(PeakPolicy policy) { _policy = policy; }
        void set_diagnostic_handler(DiagnosticHandler diag) { _diag = std::move(diag); }

        /**
         * @brief Linear cross-correlation over lags [-max_lag, max_lag].
         *
         * @param out Resized to 2 * max_lag + 1; out[max_lag] is zero lag
         */
        void xcorr(const Complex* rx, size_t rx_len,
                   const Complex* tx, size_t tx_len,
                   size_t max_lag,
                   AlignedVector& out)
        {
            const size_t L = next_pow2(std::max({rx_len + tx_len, rx_len + max_lag + 1, tx_len + max_lag + 1}));
            _prepare(L);
            _load_reference(tx, tx_len);

            std::fill(_x_padded.begin(), _x_padded.end(), Complex(0.0, 0.0));
            std::copy(rx, rx + rx_len, _x_padded.begin());
            fftw_execute(_fft_x);

            // X = X .* conj(H)
            #pragma omp simd
            for (size_t i = 0; i < _corr_len; ++i) {
                _X[i] *= std::conj(_H[i]);
            }

            fftw_execute(_ifft_corr);

            // Lag m >= 0 sits at index m, lag m < 0 at index L + m
            const double norm_factor = 1.0 / static_cast<double>(_corr_len);
            out.resize(2 * max_lag + 1);
            for (size_t j = 0; j < out.size(); ++j) {
                const long lag = static_cast<long>(j) - static_cast<long>(max_lag);
                const size_t idx = lag >= 0 ? static_cast<size_t>(lag)
                                            : _corr_len - static_cast<size_t>(-lag);
                out[j] = _corr_result[idx] * norm_factor;
            }
        }

        /**
         * @brief Estimate the CIR of one TX/RX frame pair.
         *
         * Correlates rx[rx_start_offset:] against the whole tx over lags
         * [-N, N], extracts the N lags centred on zero lag, rotates so zero
         * lag is tap 0 and divides by len(tx).
         *
         * @param cir Output buffer with room for N taps
         * @throws IndexOutOfRange when rx_start_offset >= rx_len
         * @throws ExtractionOutOfBounds when the window leaves the correlation output
         * @throws PeakDiscrepancyError under PeakPolicy::Fail
         */
        void compute(const Complex* tx, size_t tx_len,
                     const Complex* rx, size_t rx_len,
                     size_t rx_start_offset,
                     Complex* cir)
        {
            if (rx_start_offset >= rx_len) {
                throw IndexOutOfRange("RX start offset " + std::to_string(rx_start_offset) +
                                      " exceeds the length of the RX data (" + std::to_string(rx_len) + ")");
            }
            if (tx_len == 0) {
                throw InvalidArgument("CirCorrelator: TX reference is empty");
            }

            const size_t N = _fft_length;
            const size_t max_lag = N;
            xcorr(rx + rx_start_offset, rx_len - rx_start_offset, tx, tx_len, max_lag, _lags);

            double full_corr_max = 0.0;
            for (const auto& v : _lags) full_corr_max = std::max(full_corr_max, std::abs(v));

            const size_t half = N / 2;
            const size_t mid_point = max_lag;          // zero lag
            if (mid_point < half || mid_point - half + N > _lags.size()) {
                throw ExtractionOutOfBounds("Extraction range for CIR [" +
                                            std::to_string(static_cast<long>(mid_point) - static_cast<long>(half)) +
                                            ", " + std::to_string(mid_point - half + N - 1) +
                                            "] exceeds cross-correlation result bounds [0, " +
                                            std::to_string(_lags.size() - 1) + "]");
            }
            const size_t start_point = mid_point - half;

            // ifftshift of the window: the centre tap moves to index 0
            double cir_max = 0.0;
            for (size_t k = 0; k < N; ++k) {
                cir[k] = _lags[start_point + (k + half) % N];
                cir_max = std::max(cir_max, std::abs(cir[k]));
            }

            if (std::abs(full_corr_max - cir_max) > 1e-10) {
                std::ostringstream msg;
                msg << "Possible peak discrepancy in CIR extraction: original peak value " << full_corr_max
                    << ", extracted peak value " << cir_max
                    << ", difference " << (full_corr_max - cir_max);
                if (_policy == PeakPolicy::Fail) {
                    throw PeakDiscrepancyError(msg.str());
                }
                report(_diag, DiagnosticKind::PeakDiscrepancy, msg.str());
            }

            const double inv_len = 1.0 / static_cast<double>(tx_len);
            #pragma omp simd
            for (size_t k = 0; k < N; ++k) {
                cir[k] *= inv_len;
            }
        }

        AlignedVector compute(const AlignedVector& tx, const AlignedVector& rx, size_t rx_start_offset) {
            AlignedVector cir(_fft_length);
            compute(tx.data(), tx.size(), rx.data(), rx.size(), rx_start_offset, cir.data());
            return cir;
        }

        /**
         * @brief Locate the RX sample where the reference starts.
         *
         * Returns the non-negative lag in [0, search_length] with the largest
         * correlation magnitude (search_length == 0 searches the whole frame).
         */
        size_t find_rx_start_offset(const Complex* tx, size_t tx_len,
                                    const Complex* rx, size_t rx_len,
                                    size_t search_length = 0)
        {
            if (rx_len == 0 || tx_len == 0) {
                throw InvalidArgument("find_rx_start_offset: empty TX or RX data");
            }
            const size_t max_lag = (search_length == 0 || search_length >= rx_len) ? rx_len - 1 : search_length;
            xcorr(rx, rx_len, tx, tx_len, max_lag, _lags);

            size_t max_pos = 0;
            double max_corr = -1.0;
            for (size_t m = 0; m <= max_lag; ++m) {
                const double corr = std::norm(_lags[max_lag + m]);
                if (corr > max_corr) {
                    max_corr = corr;
                    max_pos = m;
                }
            }
            return max_pos;
        }

        size_t find_rx_start_offset(const AlignedVector& tx, const AlignedVector& rx, size_t search_length = 0) {
            return find_rx_start_offset(tx.data(), tx.size(), rx.data(), rx.size(), search_length);
        }

    private:
        size_t _fft_length;
        PeakPolicy _policy;
        DiagnosticHandler _diag;
        unsigned _planner_flags;

        size_t _corr_len = 0;
        fftw_plan _fft_x = nullptr;
        fftw_plan _fft_h = nullptr;
        fftw_plan _ifft_corr = nullptr;

        AlignedVector _x_padded;
        AlignedVector _h_padded;
        AlignedVector _X;
        AlignedVector _H;
        AlignedVector _corr_result;
        AlignedVector _lags;

        AlignedVector _cached_ref;
        bool _ref_valid = false;

        void _destroy_plans() {
            if (_fft_x) fftw_destroy_plan(_fft_x);
            if (_fft_h) fftw_destroy_plan(_fft_h);
            if (_ifft_corr) fftw_destroy_plan(_ifft_corr);
            _fft_x = nullptr;
            _fft_h = nullptr;
            _ifft_corr = nullptr;
        }

        void _prepare(size_t L) {
            if (L == _corr_len) return;
            _destroy_plans();
            _corr_len = L;
            _ref_valid = false;

            // Planning may overwrite the buffers (FFTW_MEASURE); they are refilled before every use
            _x_padded.assign(L, Complex(0.0, 0.0));
            _h_padded.assign(L, Complex(0.0, 0.0));
            _X.assign(L, Complex(0.0, 0.0));
            _H.assign(L, Complex(0.0, 0.0));
            _corr_result.assign(L, Complex(0.0, 0.0));

            const int n = static_cast<int>(L);
            _fft_x = fftw_plan_dft_1d(n,
                reinterpret_cast<fftw_complex*>(_x_padded.data()),
                reinterpret_cast<fftw_complex*>(_X.data()),
                FFTW_FORWARD, _planner_flags);
            _fft_h = fftw_plan_dft_1d(n,
                reinterpret_cast<fftw_complex*>(_h_padded.data()),
                reinterpret_cast<fftw_complex*>(_H.data()),
                FFTW_FORWARD, _planner_flags);
            _ifft_corr = fftw_plan_dft_1d(n,
                reinterpret_cast<fftw_complex*>(_X.data()),
                reinterpret_cast<fftw_complex*>(_corr_result.data()),
                FFTW_BACKWARD, _planner_flags);
            if (!_fft_x || !_fft_h || !_ifft_corr) {
                _destroy_plans();
                _corr_len = 0;
                throw std::runtime_error("CirCorrelator: FFTW plan creation failed for length " + std::to_string(L));
            }
        }

        // Transform of the reference, skipped while the same reference repeats
        void _load_reference(const Complex* tx, size_t tx_len) {
            if (_ref_valid && _cached_ref.size() == tx_len &&
                std::equal(tx, tx + tx_len, _cached_ref.begin())) {
                return;
            }
            _cached_ref.assign(tx, tx + tx_len);
            std::fill(_h_padded.begin(), _h_padded.end(), Complex(0.0, 0.0));
            std::copy(tx, tx + tx_len, _h_padded.begin());
            fftw_execute(_fft_h);
            _ref_valid = true;
        }
    };

    /**
     * @brief One-shot CIR estimate (builds a temporary correlator).
     */
    inline AlignedVector compute_cir_corr(const AlignedVector& tx,
                                          const AlignedVector& rx,
                                          size_t rx_start_offset,
                                          size_t fft_length,
                                          PeakPolicy policy = PeakPolicy::Warn,
                                          const DiagnosticHandler& diag = DiagnosticHandler())
    {
        CirCorrelator correlator(fft_length, policy, diag);
        return correlator.compute(tx, rx, rx_start_offset);
    }

} // namespace Core
} // namespace OpenCSI

#endif // CIR_ESTIMATOR_HPP
