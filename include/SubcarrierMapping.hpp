#ifndef SUBCARRIER_MAPPING_HPP
#define SUBCARRIER_MAPPING_HPP

#include <vector>
#include <string>
#include <algorithm>
#include <iterator>
#include <Common.hpp>

namespace OpenCSI {
namespace DSP {

    /**
     * @brief 1-based FFT bin that holds DC: floor(nfft/2) + 1
     */
    inline size_t fft_dc_index(size_t nfft) {
        if (nfft == 0) {
            throw InvalidArgument("fft_dc_index: nfft must be positive");
        }
        return nfft / 2 + 1;
    }

    /**
     * @brief OFDM field descriptor.
     *
     * active_fft_indices are 1-based FFT bins in [1, fft_length], ascending.
     * data_indices and pilot_indices are 1-based positions inside the active set.
     * sample_rate == 0 means the descriptor does not carry a rate.
     */
    struct OFDMFieldConfig {
        std::string field_name;
        size_t fft_length = 0;
        double sample_rate = 0.0;
        size_t cp_length = 0;
        IndexVector active_fft_indices;
        IndexVector data_indices;
        IndexVector pilot_indices;
    };

    /**
     * @brief Derived subcarrier bookkeeping for one field. Immutable once built.
     */
    struct SubcarrierMapping {
        std::string field_name;
        size_t fft_length = 0;
        size_t cp_length = 0;
        double sample_rate = 0.0;
        double freq_spacing = 0.0;
        long carrier_idx = 0;                       // fft_length / 2
        size_t num_tones = 0;

        std::vector<long> frequency_indices;        // (0..N-1) - N/2
        std::vector<long> active_frequency_indices;
        std::vector<long> null_frequency_indices;
        std::vector<long> pilot_frequency_indices;
        std::vector<long> data_frequency_indices;

        std::vector<double> frequency_axis;         // Hz, all bins
        std::vector<double> active_frequency_axis;  // Hz, active bins

        IndexVector indices;                        // 1..N
        IndexVector active_fft_indices;             // 1-based
        IndexVector null_indices;                   // 1-based
        IndexVector pilot_fft_indices;              // 1-based
        IndexVector data_fft_indices;               // 1-based
        IndexVector data_indices;                   // positions in the active set
        IndexVector pilot_indices;
    };

    namespace detail {

        inline IndexVector tones_from_frequencies(const std::vector<long>& freq_idx, size_t nfft) {
            IndexVector out;
            out.reserve(freq_idx.size());
            const long dc = static_cast<long>(fft_dc_index(nfft));
            for (long f : freq_idx) out.push_back(static_cast<size_t>(f + dc));
            return out;
        }

        inline std::vector<long> symmetric_range(long lo, long hi, const std::vector<long>& skip) {
            std::vector<long> out;
            for (long f = -hi; f <= -lo; ++f) {
                if (std::find(skip.begin(), skip.end(), f) == skip.end()) out.push_back(f);
            }
            for (long f = lo; f <= hi; ++f) {
                if (std::find(skip.begin(), skip.end(), f) == skip.end()) out.push_back(f);
            }
            return out;
        }

        inline void split_data_pilots(OFDMFieldConfig& cfg, const std::vector<long>& active,
                                      const std::vector<long>& pilots) {
            cfg.data_indices.clear();
            cfg.pilot_indices.clear();
            for (size_t i = 0; i < active.size(); ++i) {
                if (std::find(pilots.begin(), pilots.end(), active[i]) != pilots.end()) {
                    cfg.pilot_indices.push_back(i + 1);
                } else {
                    cfg.data_indices.push_back(i + 1);
                }
            }
        }

        inline void check_ascending(const IndexVector& idx, size_t lo, size_t hi, const std::string& what) {
            for (size_t i = 0; i < idx.size(); ++i) {
                if (idx[i] < lo || idx[i] > hi) {
                    throw InvalidArgument(what + " index " + std::to_string(idx[i]) +
                                          " outside [" + std::to_string(lo) + ", " + std::to_string(hi) + "]");
                }
                if (i > 0 && idx[i] <= idx[i - 1]) {
                    throw InvalidArgument(what + " indices are not strictly increasing at position " +
                                          std::to_string(i));
                }
            }
        }

    } // namespace detail

    /**
     * @brief Index tables of the 802.11n HT-mixed fields.
     *
     * @param field "L-LTF" or "HT-LTF"
     * @param bandwidth "CBW20" or "CBW40"
     */
    inline OFDMFieldConfig make_ht_field_config(const std::string& field, const std::string& bandwidth) {
        OFDMFieldConfig cfg;
        cfg.field_name = field;

        std::vector<long> active;
        std::vector<long> pilots;

        if (bandwidth == "CBW20") {
            cfg.fft_length = 64;
            cfg.sample_rate = 20e6;
            cfg.cp_length = 16;
            pilots = {-21, -7, 7, 21};
            if (field == "L-LTF") {
                active = detail::symmetric_range(1, 26, {});
            } else if (field == "HT-LTF") {
                active = detail::symmetric_range(1, 28, {});
            } else {
                throw InvalidArgument("Unsupported field '" + field + "' (expected L-LTF or HT-LTF)");
            }
        } else if (bandwidth == "CBW40") {
            cfg.fft_length = 128;
            cfg.sample_rate = 40e6;
            cfg.cp_length = 32;
            if (field == "L-LTF") {
                // Duplicated legacy: two 20 MHz halves centred on -32 and +32
                active = detail::symmetric_range(6, 58, {-32, 32});
                pilots = {-53, -39, -25, -11, 11, 25, 39, 53};
            } else if (field == "HT-LTF") {
                active = detail::symmetric_range(2, 58, {});
                pilots = {-53, -25, -11, 11, 25, 53};
            } else {
                throw InvalidArgument("Unsupported field '" + field + "' (expected L-LTF or HT-LTF)");
            }
        } else {
            throw InvalidArgument("Unsupported channel bandwidth '" + bandwidth + "' (expected CBW20 or CBW40)");
        }

        cfg.active_fft_indices = detail::tones_from_frequencies(active, cfg.fft_length);
        detail::split_data_pilots(cfg, active, pilots);
        return cfg;
    }

    /**
     * @brief Build the subcarrier mapping of a field.
     *
     * @param field Field descriptor (1-based active bins, positions for data/pilots)
     * @param sample_rate Used when the descriptor has none (0 = not given)
     * @throws MissingSampleRate when neither source supplies a rate
     * @throws InvalidArgument on malformed index sets
     */
    inline SubcarrierMapping get_subcarrier_mapping(const OFDMFieldConfig& field, double sample_rate = 0.0) {
        const size_t N = field.fft_length;
        if (N == 0) {
            throw InvalidArgument("Field '" + field.field_name + "': FFT length must be positive");
        }

        double fs = field.sample_rate;
        if (fs <= 0.0) {
            if (sample_rate <= 0.0) {
                throw MissingSampleRate("Field '" + field.field_name +
                                        "' does not provide a sample rate. Please specify it explicitly.");
            }
            fs = sample_rate;
        }

        const IndexVector& active = field.active_fft_indices;
        detail::check_ascending(active, 1, N, "Active FFT");
        detail::check_ascending(field.data_indices, 1, active.size(), "Data");
        detail::check_ascending(field.pilot_indices, 1, active.size(), "Pilot");

        IndexVector covered;
        std::set_union(field.data_indices.begin(), field.data_indices.end(),
                       field.pilot_indices.begin(), field.pilot_indices.end(),
                       std::back_inserter(covered));
        if (covered.size() != field.data_indices.size() + field.pilot_indices.size()) {
            throw InvalidArgument("Field '" + field.field_name + "': data and pilot positions overlap");
        }
        if (covered.size() != active.size()) {
            throw InvalidArgument("Field '" + field.field_name + "': data and pilot positions cover " +
                                  std::to_string(covered.size()) + " of " +
                                  std::to_string(active.size()) + " active tones");
        }

        SubcarrierMapping info;
        info.field_name = field.field_name;
        info.fft_length = N;
        info.cp_length = field.cp_length;
        info.sample_rate = fs;
        info.freq_spacing = fs / static_cast<double>(N);
        info.carrier_idx = static_cast<long>(N / 2);
        info.num_tones = active.size();
        info.active_fft_indices = active;
        info.data_indices = field.data_indices;
        info.pilot_indices = field.pilot_indices;

        // A bin i (1-based) sits at signed index i - carrier_idx - 1
        auto to_signed = [&info](size_t bin) { return static_cast<long>(bin) - info.carrier_idx - 1; };

        info.frequency_indices.resize(N);
        info.frequency_axis.resize(N);
        info.indices.resize(N);
        for (size_t i = 0; i < N; ++i) {
            info.frequency_indices[i] = static_cast<long>(i) - info.carrier_idx;
            info.frequency_axis[i] = info.frequency_indices[i] * info.freq_spacing;
            info.indices[i] = i + 1;
        }

        for (size_t bin : active) {
            info.active_frequency_indices.push_back(to_signed(bin));
            info.active_frequency_axis.push_back(to_signed(bin) * info.freq_spacing);
        }
        for (size_t pos : field.pilot_indices) {
            info.pilot_fft_indices.push_back(active[pos - 1]);
            info.pilot_frequency_indices.push_back(to_signed(active[pos - 1]));
        }
        for (size_t pos : field.data_indices) {
            info.data_fft_indices.push_back(active[pos - 1]);
            info.data_frequency_indices.push_back(to_signed(active[pos - 1]));
        }

        std::set_difference(info.indices.begin(), info.indices.end(),
                            active.begin(), active.end(),
                            std::back_inserter(info.null_indices));
        for (size_t bin : info.null_indices) {
            info.null_frequency_indices.push_back(to_signed(bin));
        }

        return info;
    }

} // namespace DSP
} // namespace OpenCSI

#endif // SUBCARRIER_MAPPING_HPP
