#ifndef PRUNED_DFT_HPP
#define PRUNED_DFT_HPP

#include <vector>
#include <complex>
#include <string>
#include <Eigen/Dense>
#include <Common.hpp>
#include <SubcarrierMapping.hpp>

namespace OpenCSI {
namespace Core {

    using CMatrixX = Eigen::Matrix<std::complex<double>, Eigen::Dynamic, Eigen::Dynamic>;
    using CVectorX = Eigen::Matrix<std::complex<double>, Eigen::Dynamic, 1>;

    /**
     * @brief DFT matrix restricted to the active subcarriers.
     *
     * Rows are frequency-centred (fftshift along the row axis), columns keep causal
     * time order so column 0 is the zero-lag CIR tap. Row k corresponds to
     * the k-th active 1-based FFT bin. The unnormalised DFT kernel is used, so
     * the DC row is exactly all ones.
     *
     * CIR -> CSI:  csi = M * cir
     * CSI -> CIR:  cir = pinv(M) * csi   (least squares)
     */
    class PrunedDFTMatrix {
    public:
        /**
         * @param fft_length Transform length N
         * @param active_fft_indices 1-based active bins in [1, N]
         * @param dc_index 1-based DC row of the centred matrix (0 = floor(N/2)+1)
         * @param diag Receives the DC-row mismatch diagnostic
         */
        PrunedDFTMatrix(size_t fft_length,
                        const IndexVector& active_fft_indices,
                        size_t dc_index = 0,
                        const DiagnosticHandler& diag = DiagnosticHandler())
            : _fft_length(fft_length),
              _active(active_fft_indices)
        {
            if (_fft_length == 0) {
                throw InvalidArgument("PrunedDFTMatrix: FFT length must be positive");
            }
            if (_active.empty()) {
                throw InvalidArgument("PrunedDFTMatrix: active index set is empty");
            }
            for (size_t bin : _active) {
                if (bin < 1 || bin > _fft_length) {
                    throw InvalidArgument("PrunedDFTMatrix: active index " + std::to_string(bin) +
                                          " outside [1, " + std::to_string(_fft_length) + "]");
                }
            }
            _dc_index = dc_index == 0 ? DSP::fft_dc_index(_fft_length) : dc_index;
            if (_dc_index > _fft_length) {
                throw InvalidArgument("PrunedDFTMatrix: DC index " + std::to_string(_dc_index) +
                                      " outside [1, " + std::to_string(_fft_length) + "]");
            }

            _build(diag);
            _pinv = _matrix.completeOrthogonalDecomposition().pseudoInverse();
        }

        size_t fft_length() const { return _fft_length; }
        size_t num_tones() const { return _active.size(); }
        size_t dc_index() const { return _dc_index; }
        const IndexVector& active_indices() const { return _active; }

        const CMatrixX& matrix() const { return _matrix; }
        const CMatrixX& pseudo_inverse() const { return _pinv; }

        CVectorX cir_to_csi(const CVectorX& cir) const {
            _check_length(static_cast<size_t>(cir.size()), _fft_length, "cir_to_csi");
            return _matrix * cir;
        }

        CVectorX csi_to_cir(const CVectorX& csi) const {
            _check_length(static_cast<size_t>(csi.size()), _active.size(), "csi_to_cir");
            return _pinv * csi;
        }

        /**
         * @brief CIR -> CSI writing into a caller buffer (no allocation in the frame loop)
         */
        void cir_to_csi(const Complex* cir, Complex* csi) const {
            Eigen::Map<const CVectorX> in(cir, static_cast<Eigen::Index>(_fft_length));
            Eigen::Map<CVectorX> out(csi, static_cast<Eigen::Index>(_active.size()));
            out.noalias() = _matrix * in;
        }

        void csi_to_cir(const Complex* csi, Complex* cir) const {
            Eigen::Map<const CVectorX> in(csi, static_cast<Eigen::Index>(_active.size()));
            Eigen::Map<CVectorX> out(cir, static_cast<Eigen::Index>(_fft_length));
            out.noalias() = _pinv * in;
        }

    private:
        size_t _fft_length;
        size_t _dc_index = 0;
        IndexVector _active;
        CMatrixX _matrix;
        CMatrixX _pinv;

        // Entry of the fftshift-ed DFT matrix at (row, col), both 0-based
        Complex _centred_entry(size_t row, size_t col) const {
            const size_t N = _fft_length;
            const size_t k = (row + (N + 1) / 2) % N;
            const size_t kn = (k * col) % N;
            return std::polar(1.0, -2.0 * M_PI * static_cast<double>(kn) / static_cast<double>(N));
        }

        void _build(const DiagnosticHandler& diag) {
            const size_t N = _fft_length;

            const size_t dc_row = _dc_index - 1;
            for (size_t n = 0; n < N; ++n) {
                if (_centred_entry(dc_row, n) != Complex(1.0, 0.0)) {
                    report(diag, DiagnosticKind::DcRowMismatch,
                           "The DC carrier row " + std::to_string(_dc_index) +
                           " does not match the expected pattern, indicating different indexing assumptions.");
                    break;
                }
            }

            _matrix.resize(static_cast<Eigen::Index>(_active.size()), static_cast<Eigen::Index>(N));
            for (size_t r = 0; r < _active.size(); ++r) {
                const size_t row = _active[r] - 1;
                for (size_t n = 0; n < N; ++n) {
                    _matrix(r, n) = _centred_entry(row, n);
                }
            }
        }

        static void _check_length(size_t got, size_t expected, const char* op) {
            if (got != expected) {
                throw InvalidArgument(std::string(op) + ": expected " + std::to_string(expected) +
                                      " samples, got " + std::to_string(got));
            }
        }
    };

} // namespace Core
} // namespace OpenCSI

#endif // PRUNED_DFT_HPP
