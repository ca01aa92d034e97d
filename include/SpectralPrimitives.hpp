#ifndef SPECTRAL_PRIMITIVES_HPP
#define SPECTRAL_PRIMITIVES_HPP

#include <vector>
#include <cmath>
#include <string>
#include <numeric>
#include <Eigen/Dense>
#include <boost/math/special_functions/bessel.hpp>
#include <Common.hpp>

namespace OpenCSI {
namespace DSP {

    enum class WindowNorm {
        Energy,
        Peak,
        Coherent,
        Noise,
        None
    };

    /**
     * @brief Parse a normalization method name (case-insensitive).
     *
     * @throws InvalidArgument for anything other than energy, peak, coherent, noise, none
     */
    inline WindowNorm parse_window_norm(const std::string& name) {
        const std::string key = to_lower(name);
        if (key == "energy") return WindowNorm::Energy;
        if (key == "peak") return WindowNorm::Peak;
        if (key == "coherent") return WindowNorm::Coherent;
        if (key == "noise") return WindowNorm::Noise;
        if (key == "none") return WindowNorm::None;
        throw InvalidArgument("Invalid normalization method specified: " + name);
    }

    /**
     * @brief Equivalent noise bandwidth in bins: N * sum(w^2) / sum(w)^2
     */
    template <typename Vec>
    double equivalent_noise_bandwidth(const Vec& window) {
        double sum = 0.0;
        double sum_sq = 0.0;
        for (size_t i = 0; i < window.size(); ++i) {
            sum += window[i];
            sum_sq += window[i] * window[i];
        }
        if (sum == 0.0) return 0.0;
        return static_cast<double>(window.size()) * sum_sq / (sum * sum);
    }

    /**
     * @brief Window Generator
     *
     * Shape parameter selects the family:
     *   0 -> rectangular
     *   5 -> periodic Hamming
     *   6 -> periodic Hann
     *   other -> symmetric Kaiser with beta = shape_param
     *
     * @param shape_param Window shape parameter (Kaiser beta for the generic case)
     * @param length Window length in samples
     * @param norm Normalization applied after generation
     * @return AlignedRealVector containing the window values
     */
    inline AlignedRealVector get_window(double shape_param, size_t length, WindowNorm norm = WindowNorm::Energy) {
        if (length == 0) {
            throw InvalidArgument("get_window: window length must be at least 1");
        }

        AlignedRealVector window(length, 1.0);
        const double N = static_cast<double>(length);

        if (shape_param == 0.0 || length == 1) {
            // Rectangular (and every family degenerates to a single 1 at length 1)
        } else if (shape_param == 5.0) {
            #pragma omp simd
            for (size_t n = 0; n < length; ++n) {
                window[n] = 0.54 - 0.46 * std::cos(2.0 * M_PI * n / N);
            }
        } else if (shape_param == 6.0) {
            #pragma omp simd
            for (size_t n = 0; n < length; ++n) {
                window[n] = 0.5 - 0.5 * std::cos(2.0 * M_PI * n / N);
            }
        } else {
            const double beta = shape_param;
            const double denom = boost::math::cyl_bessel_i(0.0, beta);
            for (size_t n = 0; n < length; ++n) {
                const double r = 2.0 * n / (N - 1.0) - 1.0;
                const double arg = beta * std::sqrt(std::max(0.0, 1.0 - r * r));
                window[n] = boost::math::cyl_bessel_i(0.0, arg) / denom;
            }
        }

        double scale = 1.0;
        switch (norm) {
            case WindowNorm::Energy: {
                double sum_sq = 0.0;
                for (double w : window) sum_sq += w * w;
                scale = std::sqrt(sum_sq / N);
                break;
            }
            case WindowNorm::Peak: {
                double peak = 0.0;
                for (double w : window) peak = std::max(peak, std::abs(w));
                scale = peak;
                break;
            }
            case WindowNorm::Coherent:
                scale = std::accumulate(window.begin(), window.end(), 0.0) / N;
                break;
            case WindowNorm::Noise: {
                const double bw = equivalent_noise_bandwidth(window);
                if (bw != 0.0) scale = std::sqrt(bw);
                break;
            }
            case WindowNorm::None:
                break;
        }

        if (scale != 1.0) {
            const double inv = 1.0 / scale;
            #pragma omp simd
            for (size_t n = 0; n < length; ++n) {
                window[n] *= inv;
            }
        }
        return window;
    }

    inline AlignedRealVector get_window(double shape_param, size_t length, const std::string& norm_method) {
        return get_window(shape_param, length, parse_window_norm(norm_method));
    }

    /**
     * @brief Fold a two-sided real spectrum onto its positive frequencies.
     *
     * Rows of @p spectrum are frequency bins matching @p freq, columns are preserved.
     * DC is discarded. For an even number of bins the unpaired extreme bin (the
     * larger of the most positive and the magnitude of the most negative
     * frequency) is discarded before pairing. Paired bins must mirror each other
     * within 1% of the frequency resolution.
     *
     * @param spectrum Two-sided magnitude or power spectrum (bins x columns)
     * @param freq Frequency axis, ascending and symmetric about zero
     * @return {folded spectrum (positive bins x columns), positive frequencies}
     * @throws FrequencySymmetryError when the axis cannot be folded
     */
    inline std::pair<Eigen::MatrixXd, std::vector<double>> combine_symmetric_frequencies(
        const Eigen::MatrixXd& spectrum,
        const std::vector<double>& freq)
    {
        if (static_cast<size_t>(spectrum.rows()) != freq.size()) {
            throw InvalidArgument("combine_symmetric_frequencies: spectrum has " +
                                  std::to_string(spectrum.rows()) + " rows but freq has " +
                                  std::to_string(freq.size()) + " entries");
        }
        if (freq.size() < 2) {
            throw FrequencySymmetryError("Frequency axis is too short to fold (" +
                                         std::to_string(freq.size()) + " bins).");
        }

        IndexVector neg_idx;
        IndexVector pos_idx;
        for (size_t i = 0; i < freq.size(); ++i) {
            if (freq[i] < 0.0) neg_idx.push_back(i);
            else if (freq[i] > 0.0) pos_idx.push_back(i);
        }

        if (freq.size() % 2 == 0) {
            if (neg_idx.size() < 2 || pos_idx.size() < 2) {
                throw FrequencySymmetryError("Frequency axis is too short to fold (" +
                                             std::to_string(neg_idx.size()) + " negative, " +
                                             std::to_string(pos_idx.size()) + " positive bins).");
            }
            const double neg_max = freq[neg_idx[0]];
            const double pos_max = freq[pos_idx.back()];
            if (std::abs(neg_max) < std::abs(freq[neg_idx[1]]) ||
                std::abs(pos_max) < std::abs(freq[pos_idx[pos_idx.size() - 2]])) {
                throw FrequencySymmetryError("Frequency axis is not sorted correctly.");
            }
            if (pos_max > std::abs(neg_max)) {
                pos_idx.pop_back();
            } else {
                neg_idx.erase(neg_idx.begin());
            }
        }

        const double resolution = std::abs(freq[1] - freq[0]);
        if (neg_idx.size() != pos_idx.size()) {
            throw FrequencySymmetryError("Frequency axis is not symmetric around zero (" +
                                         std::to_string(neg_idx.size()) + " negative vs " +
                                         std::to_string(pos_idx.size()) + " positive bins).");
        }
        const size_t num_pairs = pos_idx.size();
        for (size_t k = 0; k < num_pairs; ++k) {
            const double f_pos = freq[pos_idx[k]];
            const double f_neg = std::abs(freq[neg_idx[num_pairs - 1 - k]]);
            if (!(std::abs(f_neg - f_pos) < resolution / 100.0)) {
                throw FrequencySymmetryError("Frequency axis is not symmetric around zero (" +
                                             std::to_string(f_pos) + " Hz vs -" +
                                             std::to_string(f_neg) + " Hz).");
            }
        }

        Eigen::MatrixXd folded(num_pairs, spectrum.cols());
        std::vector<double> freq_pos(num_pairs);
        for (size_t k = 0; k < num_pairs; ++k) {
            folded.row(k) = spectrum.row(pos_idx[k]) + spectrum.row(neg_idx[num_pairs - 1 - k]);
            freq_pos[k] = freq[pos_idx[k]];
        }
        return {folded, freq_pos};
    }

    /**
     * @brief Single-column convenience overload.
     */
    inline std::pair<std::vector<double>, std::vector<double>> combine_symmetric_frequencies(
        const std::vector<double>& spectrum,
        const std::vector<double>& freq)
    {
        const Eigen::Map<const Eigen::VectorXd> column(spectrum.data(), static_cast<Eigen::Index>(spectrum.size()));
        auto result = combine_symmetric_frequencies(Eigen::MatrixXd(column), freq);
        std::vector<double> folded(result.first.data(), result.first.data() + result.first.rows());
        return {folded, result.second};
    }

} // namespace DSP
} // namespace OpenCSI

#endif // SPECTRAL_PRIMITIVES_HPP
