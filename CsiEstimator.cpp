#include <iostream>
#include <fstream>
#include <string>
#include <vector>
#include <filesystem>
#include <boost/program_options.hpp>
#include <yaml-cpp/yaml.h>
#include "Common.hpp"
#include "RawIqReader.hpp"
#include "SubcarrierMapping.hpp"
#include "CsiPipeline.hpp"
#include "SpectrumAnalysis.hpp"

namespace po = boost::program_options;
namespace fs = std::filesystem;

using namespace OpenCSI;
using namespace OpenCSI::Core;

namespace {

// Complex tensors are written as interleaved float32 I/Q, frame-major
bool write_fc32(const std::string& path, const AlignedVector& data) {
    std::ofstream out(path, std::ios::binary);
    if (!out) {
        std::cerr << "ERROR: Cannot write " << path << std::endl;
        return false;
    }
    std::vector<float> buf(2 * data.size());
    for (size_t i = 0; i < data.size(); ++i) {
        buf[2 * i] = static_cast<float>(data[i].real());
        buf[2 * i + 1] = static_cast<float>(data[i].imag());
    }
    out.write(reinterpret_cast<const char*>(buf.data()), static_cast<std::streamsize>(buf.size() * sizeof(float)));
    return static_cast<bool>(out);
}

bool write_f64(const std::string& path, const AlignedRealVector& data) {
    std::ofstream out(path, std::ios::binary);
    if (!out) {
        std::cerr << "ERROR: Cannot write " << path << std::endl;
        return false;
    }
    out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size() * sizeof(double)));
    return static_cast<bool>(out);
}

bool write_psd_csv(const std::string& path, const DSP::PsdResult& psd) {
    std::ofstream out(path);
    if (!out) {
        std::cerr << "ERROR: Cannot write " << path << std::endl;
        return false;
    }
    out << "frequency_hz,pxx\n";
    out.precision(10);
    for (size_t i = 0; i < psd.freq.size(); ++i) {
        out << psd.freq[i] << "," << psd.pxx[i] << "\n";
    }
    return static_cast<bool>(out);
}

bool write_metadata(const std::string& path, const CsiDataset& ds, const DSP::SubcarrierMapping& mapping) {
    YAML::Emitter meta;
    meta << YAML::BeginMap;
    meta << YAML::Key << "dataset_id" << YAML::Value << ds.dataset_id;
    meta << YAML::Key << "field" << YAML::Value << mapping.field_name;
    meta << YAML::Key << "num_frames" << YAML::Value << ds.num_frames;
    meta << YAML::Key << "num_antennas" << YAML::Value << ds.num_antennas;
    meta << YAML::Key << "num_tones" << YAML::Value << ds.num_tones;
    meta << YAML::Key << "fft_length" << YAML::Value << ds.fft_length;
    meta << YAML::Key << "sample_rate" << YAML::Value << mapping.sample_rate;
    meta << YAML::Key << "rx_start_offset" << YAML::Value << ds.rx_start_offset;
    meta << YAML::Key << "clipped_frames" << YAML::Value << ds.clipped_frames;
    meta << YAML::Key << "active_fft_indices" << YAML::Value << YAML::Flow << mapping.active_fft_indices;
    meta << YAML::Key << "active_frequency_indices" << YAML::Value << YAML::Flow << mapping.active_frequency_indices;
    meta << YAML::EndMap;

    std::ofstream fout(path);
    if (!fout) {
        std::cerr << "ERROR: Cannot write " << path << std::endl;
        return false;
    }
    fout << meta.c_str() << std::endl;
    return true;
}

CsiPipeline::Params make_pipeline_params(const Config& cfg) {
    CsiPipeline::Params p;
    p.dataset_id = cfg.dataset_id.empty() ? fs::path(cfg.input_base).filename().string() : cfg.dataset_id;
    p.chunk_size = cfg.chunk_size;
    p.adc_bit_width = cfg.adc_bit_width;
    p.clipping_max_warnings = cfg.clipping_max_warnings;
    p.use_fixed_offset = cfg.use_fixed_offset;
    p.rx_start_offset = cfg.rx_start_offset;
    p.offset_search_length = cfg.offset_search_length;
    p.csi_filter_size = cfg.csi_filter_size;
    p.clock_rate = cfg.clock_rate;
    p.peak_policy = parse_peak_policy(cfg.peak_policy);
    p.antenna_policy = parse_antenna_policy(cfg.antenna_policy);
    p.fft_planner_flags = parse_fft_planner(cfg.fft_planner);
    p.verbose = cfg.verbose;
    return p;
}

void run_psd(const Config& cfg, const CsiDataset& ds, const std::string& out_base) {
    if (ds.timestamps.size() != ds.num_frames) {
        throw DatasetError("PSD analysis needs one timestamp per frame (found " +
                           std::to_string(ds.timestamps.size()) + " for " + std::to_string(ds.num_frames) + ")");
    }

    const AlignedRealVector series = extract_channel_series(ds,
                                                            parse_channel_domain(cfg.psd_domain),
                                                            cfg.psd_antenna,
                                                            cfg.psd_bin,
                                                            parse_channel_component(cfg.psd_component));

    DSP::ResampleParams rp;
    rp.target_rate = cfg.resample_rate;
    rp.median_window = cfg.median_window;
    rp.mean_window = cfg.mean_window;
    rp.edge_cut_seconds = cfg.edge_cut_seconds;
    const DSP::ResampledSignal resampled = DSP::apply_resample(series, ds.timestamps, rp);

    DSP::PsdParams pp;
    pp.nfft = cfg.psd_nfft;
    pp.window_shape = cfg.window_shape;
    pp.f_min = cfg.f_min;
    pp.f_max = cfg.f_max;
    const DSP::PsdResult psd = DSP::spectrum_psd(resampled.signal, cfg.resample_rate, pp);

    if (psd.pxx.empty()) {
        std::cerr << "Warning: no PSD bins inside [" << cfg.f_min << ", " << cfg.f_max << "] Hz" << std::endl;
        return;
    }

    const double f_dom = DSP::dominant_frequency(psd);
    std::cout << "Dominant frequency (" << cfg.psd_domain << " " << cfg.psd_component
              << ", antenna " << cfg.psd_antenna << ", bin " << cfg.psd_bin << "): "
              << f_dom << " Hz (" << f_dom * 60.0 << " per minute)" << std::endl;

    if (write_psd_csv(out_base + "_psd.csv", psd)) {
        std::cout << "PSD written to: " << out_base << "_psd.csv" << std::endl;
    }
}

} // namespace

int main(int argc, char* argv[]) {
    const std::string default_config_file = "CsiEstimator.yaml";
    Config cfg;

    std::string config_file = default_config_file;
    std::string save_config = "";

    po::options_description desc("Allowed options");
    desc.add_options()
        ("help", "help message")
        ("config,c", po::value<std::string>(&config_file)->default_value(default_config_file), "Config file path (default: CsiEstimator.yaml)")
        ("save-config,s", po::value<std::string>(&save_config)->implicit_value(""), "Save current config to file and exit (optionally specify filename)")
        ("input,i", po::value<std::string>(&cfg.input_base), "Dataset base name (<base>_rx_iq0.<fmt>, <base>_tx_iq.<fmt>, ...)")
        ("output,o", po::value<std::string>(&cfg.output_base), "Output base name (default: <input>_interim)")
        ("dataset-id", po::value<std::string>(&cfg.dataset_id), "Dataset identifier used in messages")
        ("iq-format", po::value<std::string>(&cfg.iq_format), "IQ sample format: sc16 or fc32 (default: sc16)")
        ("rx-samples", po::value<size_t>(&cfg.num_rx_samples), "RX samples per frame and antenna")
        ("tx-samples", po::value<size_t>(&cfg.num_tx_samples), "TX samples per frame (0: whole TX file)")
        ("antennas", po::value<size_t>(&cfg.num_antennas), "RX antennas: 1 or 2 (default: 1)")
        ("field", po::value<std::string>(&cfg.field_name), "OFDM field: L-LTF or HT-LTF (default: HT-LTF)")
        ("bandwidth", po::value<std::string>(&cfg.channel_bandwidth), "Channel bandwidth: CBW20 or CBW40 (default: CBW20)")
        ("sample-rate", po::value<double>(&cfg.sample_rate), "Sample rate override in Hz (default: from field)")
        ("clock-rate", po::value<double>(&cfg.clock_rate), "Timestamp clock rate (default: 100e6)")
        ("chunk-size", po::value<size_t>(&cfg.chunk_size), "Frames per chunk (default: 1000)")
        ("adc-bits", po::value<int>(&cfg.adc_bit_width), "ADC bit width for clipping detection (default: 12)")
        ("clipping-max-warnings", po::value<size_t>(&cfg.clipping_max_warnings), "Clipping warnings before going quiet (default: 100)")
        ("fixed-offset", po::value<bool>(&cfg.use_fixed_offset), "Use the fixed RX start offset (default: true)")
        ("rx-offset", po::value<size_t>(&cfg.rx_start_offset), "RX start offset in samples, 0-based (default: 67)")
        ("offset-search", po::value<size_t>(&cfg.offset_search_length), "Lag range of the offset search (0: whole frame)")
        ("peak-policy", po::value<std::string>(&cfg.peak_policy), "CIR peak discrepancy: warn or fail (default: warn)")
        ("antenna-policy", po::value<std::string>(&cfg.antenna_policy), "Antenna count change: reallocate or fail (default: reallocate)")
        ("csi-filter", po::value<size_t>(&cfg.csi_filter_size), "CSI smoothing window, <= 1 disables (default: 1)")
        ("psd", po::value<bool>(&cfg.psd_enable), "Run the PSD analysis (default: false)")
        ("psd-domain", po::value<std::string>(&cfg.psd_domain), "PSD source: cir or csi (default: cir)")
        ("psd-component", po::value<std::string>(&cfg.psd_component), "magnitude, phase, real or imag (default: magnitude)")
        ("psd-antenna", po::value<size_t>(&cfg.psd_antenna), "PSD antenna (default: 0)")
        ("psd-bin", po::value<size_t>(&cfg.psd_bin), "PSD CIR tap or CSI tone (default: 0)")
        ("resample-rate", po::value<double>(&cfg.resample_rate), "Resampling rate in Hz (default: 20)")
        ("median-window", po::value<size_t>(&cfg.median_window), "Moving median window (default: 5)")
        ("mean-window", po::value<size_t>(&cfg.mean_window), "Moving mean window (default: 5)")
        ("edge-cut", po::value<double>(&cfg.edge_cut_seconds), "Seconds dropped at both ends (default: 1)")
        ("nfft", po::value<size_t>(&cfg.psd_nfft), "PSD FFT length (0: next power of two)")
        ("window-shape", po::value<double>(&cfg.window_shape), "0 rect, 5 Hamming, 6 Hann, else Kaiser beta (default: 5)")
        ("f-min", po::value<double>(&cfg.f_min), "Lowest PSD frequency in Hz (default: 0)")
        ("f-max", po::value<double>(&cfg.f_max), "Highest PSD frequency in Hz (default: fs/2)")
        ("wisdom", po::value<std::string>(&cfg.wisdom_file), "FFTW wisdom file (default: fftw_wisdom.dat)")
        ("fft-planner", po::value<std::string>(&cfg.fft_planner), "FFTW planner: estimate, measure or patient (default: measure)")
        ("verbose,v", po::value<bool>(&cfg.verbose)->implicit_value(true), "Print progress and timestamp statistics");

    po::variables_map vm;
    try {
        po::store(po::parse_command_line(argc, argv, desc), vm);
        po::notify(vm);
    } catch (const po::error& e) {
        std::cerr << "ERROR: " << e.what() << std::endl;
        std::cerr << desc << std::endl;
        return 1;
    }

    if (vm.count("help")) {
        std::cout << desc << std::endl;
        return 0;
    }

    // Load config from YAML file (if exists), then CLI args override
    if (fs::exists(config_file)) {
        if (load_config_from_yaml(cfg, config_file)) {
            std::cout << "Loaded config from: " << config_file << std::endl;
        } else {
            return 1;
        }
    } else if (config_file == default_config_file) {
        // Auto-create default config file with current defaults
        if (save_config_to_yaml(cfg, config_file)) {
            std::cout << "Config file '" << config_file << "' not found. Created with default values." << std::endl;
        }
    }

    // Re-parse CLI to override YAML values (only options explicitly provided in CLI)
    vm.clear();
    po::store(po::parse_command_line(argc, argv, desc), vm);
    po::notify(vm);

    if (vm.count("save-config")) {
        const std::string output_file = save_config.empty() ? config_file : save_config;
        if (save_config_to_yaml(cfg, output_file)) {
            std::cout << "Config saved to: " << output_file << std::endl;
        }
        return 0;
    }

    try {
        validate_config(cfg);
        if (cfg.input_base.empty()) {
            throw InvalidArgument("No dataset given (use --input or input_base in the config file)");
        }

        DSP::OFDMFieldConfig field = DSP::make_ht_field_config(cfg.field_name, cfg.channel_bandwidth);
        if (cfg.sample_rate > 0.0) field.sample_rate = cfg.sample_rate;
        const DSP::SubcarrierMapping mapping = DSP::get_subcarrier_mapping(field);
        std::cout << "Field " << mapping.field_name << " " << cfg.channel_bandwidth << ": FFT "
                  << mapping.fft_length << ", " << mapping.num_tones << " active tones, "
                  << mapping.sample_rate / 1e6 << " MHz" << std::endl;

        FFTWManager::import_wisdom(cfg.wisdom_file);

        RawIqReader::Params rp;
        rp.base = cfg.input_base;
        rp.format = cfg.iq_format;
        rp.num_rx_samples = cfg.num_rx_samples;
        rp.num_tx_samples = cfg.num_tx_samples;
        rp.num_antennas = cfg.num_antennas;
        const RawIqReader reader(rp);

        std::cout << "Processing dataset: " << cfg.input_base << " (" << reader.num_frames() << " frames, "
                  << cfg.num_antennas << " antenna(s), TX reference "
                  << (reader.tx_per_frame() ? "per frame" : "shared") << ")" << std::endl;

        CsiPipeline pipeline(mapping, make_pipeline_params(cfg));
        const CsiDataset ds = pipeline.run(
            reader.num_frames(),
            [&reader](size_t chunk_index, size_t chunk_size, FrameChunk& chunk) {
                return reader.read_chunk(chunk_index, chunk_size, chunk);
            },
            reader.read_timestamps(),
            reader.read_center_freqs());

        std::cout << "Clipped frames: " << ds.clipped_frames << std::endl;

        const std::string out_base = cfg.resolved_output_base();
        bool ok = write_fc32(out_base + "_csi.fc32", ds.csi);
        ok = write_fc32(out_base + "_cir.fc32", ds.cir) && ok;
        if (!ds.timestamps.empty()) ok = write_f64(out_base + "_timestamps.f64", ds.timestamps) && ok;
        ok = write_metadata(out_base + "_meta.yaml", ds, mapping) && ok;
        if (!ok) return 1;
        std::cout << "Results written to: " << out_base << "_{csi,cir}.fc32" << std::endl;

        if (cfg.psd_enable) {
            run_psd(cfg, ds, out_base);
        }

        FFTWManager::export_wisdom(cfg.wisdom_file);
    } catch (const std::exception& e) {
        std::cerr << "ERROR: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
