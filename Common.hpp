#ifndef COMMON_HPP
#define COMMON_HPP

#include <vector>
#include <complex>
#include <functional>
#include <memory>
#include <iostream>
#include <fstream>
#include <cstdlib>
#include <cstdio>
#include <cstdint>
#include <stdexcept>
#include <limits>
#include <string>
#include <sstream>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <fftw3.h>
#include <yaml-cpp/yaml.h>
#ifdef _OPENMP
#include <omp.h>
#endif

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

/**
 * @brief STL-compliant Aligned Memory Allocator.
 *
 * Ensures that allocated memory is aligned to specific boundaries (default 64 bytes).
 * FFTW picks its SIMD codelets only for aligned buffers, so every sample buffer
 * handed to a plan goes through this allocator.
 */
template <typename T, size_t Alignment = 64>
class AlignedAllocator {
    static_assert(Alignment != 0 && (Alignment & (Alignment - 1)) == 0,
                  "AlignedAllocator: alignment must be a power of two");
    static_assert(Alignment % sizeof(void*) == 0 && Alignment >= alignof(T),
                  "AlignedAllocator: alignment too small for aligned_alloc");

public:
    using value_type = T;
    using pointer = T*;
    using const_pointer = const T*;
    using size_type = size_t;

    template <class U>
    struct rebind {
        using other = AlignedAllocator<U, Alignment>;
    };

    AlignedAllocator() noexcept = default;
    template <class U>
    AlignedAllocator(const AlignedAllocator<U, Alignment>&) noexcept {}

    bool operator==(const AlignedAllocator&) const { return true; }
    bool operator!=(const AlignedAllocator& other) const { return !(*this == other); }

    pointer allocate(size_type n) {
        if (n > (std::numeric_limits<size_type>::max() / sizeof(value_type))) {
            throw std::bad_alloc();
        }
        size_type bytes = n * sizeof(value_type);
        size_type aligned_bytes = (bytes + Alignment - 1) & ~(Alignment - 1);
        if (aligned_bytes == 0) aligned_bytes = Alignment;
        void* ptr = std::aligned_alloc(Alignment, aligned_bytes);
        if (!ptr) throw std::bad_alloc();
        return static_cast<pointer>(ptr);
    }

    void deallocate(pointer p, size_type) { std::free(p); }
};

// Type Definitions (64-byte alignment, double precision for offline estimation)
using Complex = std::complex<double>;
using AlignedVector = std::vector<Complex, AlignedAllocator<Complex, 64>>;
using AlignedRealVector = std::vector<double, AlignedAllocator<double, 64>>;
using IndexVector = std::vector<size_t>;

namespace OpenCSI {

// ---------------------------------------------------------------------------
// Error taxonomy
// ---------------------------------------------------------------------------

/** @brief Configuration or argument error. Fatal, never retried. */
class InvalidArgument : public std::invalid_argument {
public:
    explicit InvalidArgument(const std::string& what) : std::invalid_argument(what) {}
};

/** @brief Field descriptor without sample rate and none supplied by the caller. */
class MissingSampleRate : public InvalidArgument {
public:
    explicit MissingSampleRate(const std::string& what) : InvalidArgument(what) {}
};

/** @brief Two-sided frequency axis cannot be folded onto its positive half. */
class FrequencySymmetryError : public std::runtime_error {
public:
    explicit FrequencySymmetryError(const std::string& what) : std::runtime_error(what) {}
};

/** @brief RX start offset lies beyond the received data. */
class IndexOutOfRange : public std::out_of_range {
public:
    explicit IndexOutOfRange(const std::string& what) : std::out_of_range(what) {}
};

/** @brief CIR extraction window falls outside the correlation output. */
class ExtractionOutOfBounds : public std::out_of_range {
public:
    explicit ExtractionOutOfBounds(const std::string& what) : std::out_of_range(what) {}
};

/** @brief Correlation peak outside the extracted CIR window (strict peak policy only). */
class PeakDiscrepancyError : public std::runtime_error {
public:
    explicit PeakDiscrepancyError(const std::string& what) : std::runtime_error(what) {}
};

/** @brief NaN values reached the phase smoothing path. */
class NaNInputError : public std::runtime_error {
public:
    explicit NaNInputError(const std::string& what) : std::runtime_error(what) {}
};

/** @brief Dataset-level failure; aborts processing of that dataset. */
class DatasetError : public std::runtime_error {
public:
    explicit DatasetError(const std::string& what) : std::runtime_error(what) {}
};

// ---------------------------------------------------------------------------
// Soft diagnostics
// ---------------------------------------------------------------------------

enum class DiagnosticKind {
    DcRowMismatch,
    OddFftLength,
    PeakDiscrepancy,
    Clipping,
    AntennaReallocation,
    ShortData
};

inline const char* to_string(DiagnosticKind kind) {
    switch (kind) {
        case DiagnosticKind::DcRowMismatch:       return "dc-row-mismatch";
        case DiagnosticKind::OddFftLength:        return "odd-fft-length";
        case DiagnosticKind::PeakDiscrepancy:     return "peak-discrepancy";
        case DiagnosticKind::Clipping:            return "clipping";
        case DiagnosticKind::AntennaReallocation: return "antenna-reallocation";
        case DiagnosticKind::ShortData:           return "short-data";
    }
    return "unknown";
}

/**
 * @brief Non-fatal finding reported by a processing stage.
 */
struct Diagnostic {
    DiagnosticKind kind;
    std::string message;
};

using DiagnosticHandler = std::function<void(const Diagnostic&)>;

inline void default_diagnostic_handler(const Diagnostic& diag) {
    std::cerr << "Warning: " << diag.message << std::endl;
}

/**
 * @brief Deliver a diagnostic to the handler, or to stderr when none is installed.
 */
inline void report(const DiagnosticHandler& handler, DiagnosticKind kind, const std::string& message) {
    Diagnostic diag{kind, message};
    if (handler) {
        handler(diag);
    } else {
        default_diagnostic_handler(diag);
    }
}

// ---------------------------------------------------------------------------
// Small numerical helpers
// ---------------------------------------------------------------------------

inline size_t next_pow2(size_t n) {
    size_t p = 1;
    while (p < n) p <<= 1;
    return p;
}

/**
 * @brief Standard Linear Regression.
 *
 * Least squares fit y = beta * x + alpha over x = 0..N-1.
 *
 * @return std::pair<double, double> {slope (beta), intercept (alpha)}
 */
template <typename Vec>
std::pair<double, double> linear_regression(const Vec& y_values) {
    const size_t N = y_values.size();
    if (N == 0) return std::make_pair(0.0, 0.0);
    if (N == 1) return std::make_pair(0.0, static_cast<double>(y_values[0]));

    double sum_x = 0.0;
    double sum_y = 0.0;
    double sum_xx = 0.0;
    double sum_xy = 0.0;

    for (size_t i = 0; i < N; ++i) {
        const double x = static_cast<double>(i);
        const double y = y_values[i];
        sum_x += x;
        sum_y += y;
        sum_xx += x * x;
        sum_xy += x * y;
    }

    double beta = 0.0, alpha = sum_y / N;
    const double n = static_cast<double>(N);
    const double denom = n * sum_xx - sum_x * sum_x;  // n*Σx² - (Σx)²
    if (std::abs(denom) > 1e-12) {
        beta = (n * sum_xy - sum_x * sum_y) / denom;
        alpha = (sum_y - beta * sum_x) / n;
    }

    return std::make_pair(beta, alpha);
}

/**
 * @brief Phase Unwrapping Function.
 *
 * Unwraps the phase values in a vector to eliminate 2*pi jumps.
 * NaN entries are skipped: the next finite sample is unwrapped against the
 * last finite one.
 */
template <typename Vec>
void unwrap(Vec& phase) {
    bool have_prev = false;
    double prev_raw = 0.0;
    double prev_out = 0.0;
    for (size_t i = 0; i < phase.size(); ++i) {
        const double raw = phase[i];
        if (std::isnan(raw)) continue;
        if (!have_prev) {
            have_prev = true;
            prev_raw = raw;
            prev_out = raw;
            continue;
        }
        double d = raw - prev_raw;
        d -= 2.0 * M_PI * std::round(d / (2.0 * M_PI));
        prev_out += d;
        prev_raw = raw;
        phase[i] = prev_out;
    }
}

/**
 * @brief Manager for FFTW Wisdom.
 *
 * Handles importing and exporting FFTW wisdom to/from a file.
 * This allows saving optimized FFT plans to disk to speed up subsequent initializations.
 * All transforms run in double precision, so this is the fftw_ wisdom store
 * (single-precision fftwf_ wisdom is a separate file format and not read here).
 * Only plans made with FFTW_MEASURE or stronger add wisdom; FFTW_ESTIMATE plans
 * neither read nor write it.
 */
class FFTWManager {
public:
    static void import_wisdom(const std::string& filename = "fftw_wisdom.dat") {
        if (FILE* f = std::fopen(filename.c_str(), "r")) {
            fftw_import_wisdom_from_file(f);
            std::fclose(f);
            std::cout << "Imported FFTW wisdom from " << filename << std::endl;
        } else {
            std::cout << "No existing FFTW wisdom found (will act as cold start)." << std::endl;
        }
    }

    static void export_wisdom(const std::string& filename = "fftw_wisdom.dat") {
        if (FILE* f = std::fopen(filename.c_str(), "w")) {
            fftw_export_wisdom_to_file(f);
            std::fclose(f);
            std::cout << "Exported FFTW wisdom to " << filename << std::endl;
        } else {
            std::cerr << "Failed to export FFTW wisdom to " << filename << std::endl;
        }
    }
};

// ---------------------------------------------------------------------------
// Configuration
// ---------------------------------------------------------------------------

/**
 * @brief Processing Configuration Structure.
 *
 * Holds all configurable parameters of the estimation run: field layout, dataset
 * geometry and file naming, clipping diagnostics, offset handling, CSI filtering
 * and the spectral analysis of one selected channel.
 */
struct Config {
    // OFDM field
    std::string field_name = "HT-LTF";     // L-LTF or HT-LTF
    std::string channel_bandwidth = "CBW20"; // CBW20 or CBW40
    double sample_rate = 0.0;              // 0: take the preset rate

    // Dataset
    std::string input_base = "";           // <base>_rx_iq0.<fmt>, <base>_tx_iq.<fmt>, ...
    std::string output_base = "";          // defaults to input_base + "_interim"
    std::string iq_format = "sc16";        // sc16 or fc32
    size_t num_rx_samples = 0;             // RX samples per frame and antenna
    size_t num_tx_samples = 0;             // TX reference samples per frame
    size_t num_antennas = 1;               // 1 (iq0) or 2 (iq0 + iq1)
    std::string dataset_id = "";
    double clock_rate = 100e6;             // Timestamp tick rate
    bool verbose = false;

    // Chunking and clipping
    size_t chunk_size = 1000;              // Frames per chunk
    int adc_bit_width = 12;                // ADC resolution
    size_t clipping_max_warnings = 100;    // Clipping warnings before going quiet

    // Alignment
    bool use_fixed_offset = true;          // Fixed RX start offset or correlation search
    size_t rx_start_offset = 67;           // 0-based RX sample where the frame starts
    size_t offset_search_length = 0;       // 0: search the whole frame
    std::string peak_policy = "warn";      // warn or fail
    std::string antenna_policy = "reallocate"; // reallocate or fail

    // CSI filtering
    size_t csi_filter_size = 1;            // <= 1 disables smoothing

    // Spectral analysis of one channel
    bool psd_enable = false;
    std::string psd_domain = "cir";        // cir or csi
    std::string psd_component = "magnitude"; // magnitude, phase, real, imag
    size_t psd_antenna = 0;
    size_t psd_bin = 0;                    // CIR tap or CSI tone (0-based position)
    double resample_rate = 20.0;           // Hz
    size_t median_window = 5;
    size_t mean_window = 5;
    double edge_cut_seconds = 1.0;
    size_t psd_nfft = 0;                   // 0: next power of two
    double window_shape = 5.0;             // 0 rect, 5 Hamming, 6 Hann, else Kaiser beta
    double f_min = 0.0;
    double f_max = -1.0;                   // < 0: fs / 2

    std::string wisdom_file = "fftw_wisdom.dat";
    std::string fft_planner = "measure";   // estimate, measure or patient

    std::string resolved_output_base() const {
        return output_base.empty() ? input_base + "_interim" : output_base;
    }

    double adc_full_scale() const {
        return std::ldexp(1.0, adc_bit_width - 1) - 1.0;
    }
};

inline std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

/**
 * @brief FFTW planner rigour for the cached correlation plans.
 */
inline unsigned parse_fft_planner(const std::string& name) {
    const std::string key = to_lower(name);
    if (key == "estimate") return FFTW_ESTIMATE;
    if (key == "measure") return FFTW_MEASURE;
    if (key == "patient") return FFTW_PATIENT;
    throw InvalidArgument("Unknown FFT planner '" + name + "' (expected estimate, measure or patient)");
}

/**
 * @brief Reject configurations that cannot produce a meaningful run.
 */
inline void validate_config(const Config& cfg) {
    auto fail = [](const std::string& msg) { throw InvalidArgument("Invalid config: " + msg); };

    if (cfg.field_name != "L-LTF" && cfg.field_name != "HT-LTF")
        fail("field_name must be L-LTF or HT-LTF, got '" + cfg.field_name + "'");
    if (cfg.channel_bandwidth != "CBW20" && cfg.channel_bandwidth != "CBW40")
        fail("channel_bandwidth must be CBW20 or CBW40, got '" + cfg.channel_bandwidth + "'");
    if (cfg.sample_rate < 0.0) fail("sample_rate must not be negative");
    if (cfg.clock_rate <= 0.0) fail("clock_rate must be positive");
    if (cfg.iq_format != "sc16" && cfg.iq_format != "fc32")
        fail("iq_format must be sc16 or fc32, got '" + cfg.iq_format + "'");
    if (cfg.num_antennas != 1 && cfg.num_antennas != 2) fail("num_antennas must be 1 or 2");
    if (cfg.chunk_size == 0) fail("chunk_size must be at least 1");
    if (cfg.adc_bit_width < 2 || cfg.adc_bit_width > 32) fail("adc_bit_width must be in [2, 32]");
    if (cfg.peak_policy != "warn" && cfg.peak_policy != "fail")
        fail("peak_policy must be warn or fail, got '" + cfg.peak_policy + "'");
    if (cfg.antenna_policy != "reallocate" && cfg.antenna_policy != "fail")
        fail("antenna_policy must be reallocate or fail, got '" + cfg.antenna_policy + "'");
    if (cfg.psd_domain != "cir" && cfg.psd_domain != "csi")
        fail("psd_domain must be cir or csi, got '" + cfg.psd_domain + "'");
    if (cfg.psd_component != "magnitude" && cfg.psd_component != "phase" &&
        cfg.psd_component != "real" && cfg.psd_component != "imag")
        fail("psd_component must be magnitude, phase, real or imag, got '" + cfg.psd_component + "'");
    if (cfg.resample_rate <= 0.0) fail("resample_rate must be positive");
    if (cfg.edge_cut_seconds < 0.0) fail("edge_cut_seconds must not be negative");
    if (cfg.median_window == 0 || cfg.mean_window == 0) fail("filter windows must be at least 1");
    if (cfg.window_shape < 0.0) fail("window_shape must not be negative");
    if (cfg.f_min < 0.0) fail("f_min must not be negative");
    if (cfg.f_max >= 0.0 && cfg.f_min > cfg.f_max) fail("f_min must not exceed f_max");
    if (cfg.fft_planner != "estimate" && cfg.fft_planner != "measure" && cfg.fft_planner != "patient")
        fail("fft_planner must be estimate, measure or patient, got '" + cfg.fft_planner + "'");
}

/**
 * @brief Save config to a YAML file.
 */
inline bool save_config_to_yaml(const Config& cfg, const std::string& filepath) {
    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "field_name" << YAML::Value << cfg.field_name;
    out << YAML::Key << "channel_bandwidth" << YAML::Value << cfg.channel_bandwidth;
    out << YAML::Key << "sample_rate" << YAML::Value << cfg.sample_rate;
    out << YAML::Key << "input_base" << YAML::Value << cfg.input_base;
    out << YAML::Key << "output_base" << YAML::Value << cfg.output_base;
    out << YAML::Key << "iq_format" << YAML::Value << cfg.iq_format;
    out << YAML::Key << "num_rx_samples" << YAML::Value << cfg.num_rx_samples;
    out << YAML::Key << "num_tx_samples" << YAML::Value << cfg.num_tx_samples;
    out << YAML::Key << "num_antennas" << YAML::Value << cfg.num_antennas;
    out << YAML::Key << "dataset_id" << YAML::Value << cfg.dataset_id;
    out << YAML::Key << "clock_rate" << YAML::Value << cfg.clock_rate;
    out << YAML::Key << "verbose" << YAML::Value << cfg.verbose;
    out << YAML::Key << "chunk_size" << YAML::Value << cfg.chunk_size;
    out << YAML::Key << "adc_bit_width" << YAML::Value << cfg.adc_bit_width;
    out << YAML::Key << "clipping_max_warnings" << YAML::Value << cfg.clipping_max_warnings;
    out << YAML::Key << "use_fixed_offset" << YAML::Value << cfg.use_fixed_offset;
    out << YAML::Key << "rx_start_offset" << YAML::Value << cfg.rx_start_offset;
    out << YAML::Key << "offset_search_length" << YAML::Value << cfg.offset_search_length;
    out << YAML::Key << "peak_policy" << YAML::Value << cfg.peak_policy;
    out << YAML::Key << "antenna_policy" << YAML::Value << cfg.antenna_policy;
    out << YAML::Key << "csi_filter_size" << YAML::Value << cfg.csi_filter_size;
    out << YAML::Key << "psd_enable" << YAML::Value << cfg.psd_enable;
    out << YAML::Key << "psd_domain" << YAML::Value << cfg.psd_domain;
    out << YAML::Key << "psd_component" << YAML::Value << cfg.psd_component;
    out << YAML::Key << "psd_antenna" << YAML::Value << cfg.psd_antenna;
    out << YAML::Key << "psd_bin" << YAML::Value << cfg.psd_bin;
    out << YAML::Key << "resample_rate" << YAML::Value << cfg.resample_rate;
    out << YAML::Key << "median_window" << YAML::Value << cfg.median_window;
    out << YAML::Key << "mean_window" << YAML::Value << cfg.mean_window;
    out << YAML::Key << "edge_cut_seconds" << YAML::Value << cfg.edge_cut_seconds;
    out << YAML::Key << "psd_nfft" << YAML::Value << cfg.psd_nfft;
    out << YAML::Key << "window_shape" << YAML::Value << cfg.window_shape;
    out << YAML::Key << "f_min" << YAML::Value << cfg.f_min;
    out << YAML::Key << "f_max" << YAML::Value << cfg.f_max;
    out << YAML::Key << "wisdom_file" << YAML::Value << cfg.wisdom_file;
    out << YAML::Key << "fft_planner" << YAML::Value << cfg.fft_planner;
    out << YAML::EndMap;

    std::ofstream fout(filepath);
    if (!fout) {
        std::cerr << "Error: Cannot write to config file: " << filepath << std::endl;
        return false;
    }
    fout << out.c_str();
    fout.close();
    return true;
}

/**
 * @brief Load config from a YAML file. Keys absent from the file keep their current value.
 */
inline bool load_config_from_yaml(Config& cfg, const std::string& filepath) {
    try {
        YAML::Node config = YAML::LoadFile(filepath);
        if (config["field_name"]) cfg.field_name = config["field_name"].as<std::string>();
        if (config["channel_bandwidth"]) cfg.channel_bandwidth = config["channel_bandwidth"].as<std::string>();
        if (config["sample_rate"]) cfg.sample_rate = config["sample_rate"].as<double>();
        if (config["input_base"]) cfg.input_base = config["input_base"].as<std::string>();
        if (config["output_base"]) cfg.output_base = config["output_base"].as<std::string>();
        if (config["iq_format"]) cfg.iq_format = config["iq_format"].as<std::string>();
        if (config["num_rx_samples"]) cfg.num_rx_samples = config["num_rx_samples"].as<size_t>();
        if (config["num_tx_samples"]) cfg.num_tx_samples = config["num_tx_samples"].as<size_t>();
        if (config["num_antennas"]) cfg.num_antennas = config["num_antennas"].as<size_t>();
        if (config["dataset_id"]) cfg.dataset_id = config["dataset_id"].as<std::string>();
        if (config["clock_rate"]) cfg.clock_rate = config["clock_rate"].as<double>();
        if (config["verbose"]) cfg.verbose = config["verbose"].as<bool>();
        if (config["chunk_size"]) cfg.chunk_size = config["chunk_size"].as<size_t>();
        if (config["adc_bit_width"]) cfg.adc_bit_width = config["adc_bit_width"].as<int>();
        if (config["clipping_max_warnings"]) cfg.clipping_max_warnings = config["clipping_max_warnings"].as<size_t>();
        if (config["use_fixed_offset"]) cfg.use_fixed_offset = config["use_fixed_offset"].as<bool>();
        if (config["rx_start_offset"]) cfg.rx_start_offset = config["rx_start_offset"].as<size_t>();
        if (config["offset_search_length"]) cfg.offset_search_length = config["offset_search_length"].as<size_t>();
        if (config["peak_policy"]) cfg.peak_policy = config["peak_policy"].as<std::string>();
        if (config["antenna_policy"]) cfg.antenna_policy = config["antenna_policy"].as<std::string>();
        if (config["csi_filter_size"]) cfg.csi_filter_size = config["csi_filter_size"].as<size_t>();
        if (config["psd_enable"]) cfg.psd_enable = config["psd_enable"].as<bool>();
        if (config["psd_domain"]) cfg.psd_domain = config["psd_domain"].as<std::string>();
        if (config["psd_component"]) cfg.psd_component = config["psd_component"].as<std::string>();
        if (config["psd_antenna"]) cfg.psd_antenna = config["psd_antenna"].as<size_t>();
        if (config["psd_bin"]) cfg.psd_bin = config["psd_bin"].as<size_t>();
        if (config["resample_rate"]) cfg.resample_rate = config["resample_rate"].as<double>();
        if (config["median_window"]) cfg.median_window = config["median_window"].as<size_t>();
        if (config["mean_window"]) cfg.mean_window = config["mean_window"].as<size_t>();
        if (config["edge_cut_seconds"]) cfg.edge_cut_seconds = config["edge_cut_seconds"].as<double>();
        if (config["psd_nfft"]) cfg.psd_nfft = config["psd_nfft"].as<size_t>();
        if (config["window_shape"]) cfg.window_shape = config["window_shape"].as<double>();
        if (config["f_min"]) cfg.f_min = config["f_min"].as<double>();
        if (config["f_max"]) cfg.f_max = config["f_max"].as<double>();
        if (config["wisdom_file"]) cfg.wisdom_file = config["wisdom_file"].as<std::string>();
        if (config["fft_planner"]) cfg.fft_planner = config["fft_planner"].as<std::string>();
        return true;
    } catch (const YAML::Exception& e) {
        std::cerr << "Error parsing YAML config: " << e.what() << std::endl;
        return false;
    }
}

} // namespace OpenCSI

#endif // COMMON_HPP
