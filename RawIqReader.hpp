#ifndef RAW_IQ_READER_HPP
#define RAW_IQ_READER_HPP

/**
 * @file RawIqReader.hpp
 * @brief Chunked reader for captured IQ datasets stored as raw binary files.
 *
 * Layout for a dataset with base name <base>:
 *   <base>_rx_iq0.<fmt>       RX antenna 0, frames back to back
 *   <base>_rx_iq1.<fmt>       RX antenna 1 (two-antenna captures only)
 *   <base>_tx_iq.<fmt>        TX reference, one shared frame or one per RX frame
 *   <base>_timestamps.u64     optional, capture time of each frame in clock ticks
 *   <base>_freq.f64           optional, centre frequency per frame in Hz
 *
 * <fmt> is sc16 (interleaved int16 I/Q, raw ADC counts) or fc32 (interleaved float).
 */

#include <vector>
#include <complex>
#include <string>
#include <fstream>
#include <filesystem>
#include <cstdint>
#include <Common.hpp>
#include <CsiPipeline.hpp>

namespace OpenCSI {

namespace fs = std::filesystem;

class RawIqReader {
public:
    struct Params {
        std::string base;
        std::string format = "sc16";
        size_t num_rx_samples = 0;      // per frame and antenna
        size_t num_tx_samples = 0;      // per frame, 0: whole TX file is one reference
        size_t num_antennas = 1;
    };

    explicit RawIqReader(const Params& params)
        : _params(params)
    {
        if (_params.format == "sc16") {
            _sample_bytes = 2 * sizeof(int16_t);
        } else if (_params.format == "fc32") {
            _sample_bytes = 2 * sizeof(float);
        } else {
            throw InvalidArgument("RawIqReader: unsupported IQ format '" + _params.format + "'");
        }
        if (_params.num_rx_samples == 0) {
            throw InvalidArgument("RawIqReader: number of RX samples per frame must be set");
        }
        if (_params.num_antennas != 1 && _params.num_antennas != 2) {
            throw InvalidArgument("RawIqReader: 1 or 2 antennas supported, got " +
                                  std::to_string(_params.num_antennas));
        }

        for (size_t a = 0; a < _params.num_antennas; ++a) {
            _rx_paths.push_back(_params.base + "_rx_iq" + std::to_string(a) + "." + _params.format);
        }
        _tx_path = _params.base + "_tx_iq." + _params.format;

        const size_t frame_bytes = _params.num_rx_samples * _sample_bytes;
        const uintmax_t rx_bytes = _file_size(_rx_paths[0]);
        if (rx_bytes % frame_bytes != 0) {
            throw DatasetError(_rx_paths[0] + ": size " + std::to_string(rx_bytes) +
                               " is not a multiple of the frame size " + std::to_string(frame_bytes));
        }
        _num_frames = static_cast<size_t>(rx_bytes / frame_bytes);
        for (size_t a = 1; a < _rx_paths.size(); ++a) {
            if (_file_size(_rx_paths[a]) != rx_bytes) {
                throw DatasetError(_rx_paths[a] + ": size differs from " + _rx_paths[0]);
            }
        }

        const uintmax_t tx_bytes = _file_size(_tx_path);
        if (tx_bytes == 0 || tx_bytes % _sample_bytes != 0) {
            throw DatasetError(_tx_path + ": size " + std::to_string(tx_bytes) + " is not a whole number of samples");
        }
        const size_t tx_total = static_cast<size_t>(tx_bytes / _sample_bytes);
        _tx_samples = _params.num_tx_samples == 0 ? tx_total : _params.num_tx_samples;
        if (tx_total == _tx_samples) {
            _tx_per_frame = false;
        } else if (tx_total == _tx_samples * _num_frames) {
            _tx_per_frame = true;
        } else {
            throw DatasetError(_tx_path + ": holds " + std::to_string(tx_total) + " samples, expected " +
                               std::to_string(_tx_samples) + " (shared) or " +
                               std::to_string(_tx_samples * _num_frames) + " (per frame)");
        }
        if (!_tx_per_frame) {
            _shared_tx.resize(_tx_samples);
            _read_samples(_tx_path, 0, _tx_samples, _shared_tx.data());
        }
    }

    size_t num_frames() const { return _num_frames; }
    size_t tx_samples() const { return _tx_samples; }
    bool tx_per_frame() const { return _tx_per_frame; }

    /**
     * @brief Fill one chunk; matches Core::ChunkReader.
     */
    bool read_chunk(size_t chunk_index, size_t chunk_size, Core::FrameChunk& chunk) const {
        const size_t first = chunk_index * chunk_size;
        if (chunk_size == 0 || first >= _num_frames) return false;
        const size_t count = std::min(chunk_size, _num_frames - first);
        const size_t ns = _params.num_rx_samples;
        const size_t na = _params.num_antennas;

        chunk.num_frames = count;
        chunk.num_antennas = na;
        chunk.num_samples = ns;
        chunk.rx.resize(count * na * ns);

        AlignedVector frame_buf(count * ns);
        for (size_t a = 0; a < na; ++a) {
            _read_samples(_rx_paths[a], first * ns, count * ns, frame_buf.data());
            for (size_t f = 0; f < count; ++f) {
                std::copy(frame_buf.begin() + f * ns, frame_buf.begin() + (f + 1) * ns,
                          chunk.rx.begin() + (f * na + a) * ns);
            }
        }

        chunk.tx_samples = _tx_samples;
        if (_tx_per_frame) {
            chunk.tx.resize(count * _tx_samples);
            _read_samples(_tx_path, first * _tx_samples, count * _tx_samples, chunk.tx.data());
        } else {
            chunk.tx = _shared_tx;
        }
        return true;
    }

    /**
     * @brief Frame timestamps in clock ticks (empty when the file does not exist).
     */
    std::vector<uint64_t> read_timestamps() const {
        return _read_metadata<uint64_t>(_params.base + "_timestamps.u64");
    }

    /**
     * @brief Centre frequency per frame in Hz (empty when the file does not exist).
     */
    std::vector<double> read_center_freqs() const {
        return _read_metadata<double>(_params.base + "_freq.f64");
    }

private:
    Params _params;
    size_t _sample_bytes = 0;
    size_t _num_frames = 0;
    size_t _tx_samples = 0;
    bool _tx_per_frame = false;
    std::vector<std::string> _rx_paths;
    std::string _tx_path;
    AlignedVector _shared_tx;

    static uintmax_t _file_size(const std::string& path) {
        std::error_code ec;
        const uintmax_t size = fs::file_size(path, ec);
        if (ec) {
            throw DatasetError("Cannot open " + path + ": " + ec.message());
        }
        return size;
    }

    void _read_samples(const std::string& path, size_t offset, size_t count, Complex* out) const {
        std::ifstream file(path, std::ios::binary);
        if (!file) {
            throw DatasetError("Cannot open " + path);
        }
        file.seekg(static_cast<std::streamoff>(offset * _sample_bytes), std::ios::beg);

        if (_params.format == "sc16") {
            std::vector<int16_t> raw(2 * count);
            file.read(reinterpret_cast<char*>(raw.data()), static_cast<std::streamsize>(raw.size() * sizeof(int16_t)));
            if (!file) {
                throw DatasetError("Short read from " + path + " at sample " + std::to_string(offset));
            }
            for (size_t i = 0; i < count; ++i) {
                out[i] = Complex(raw[2 * i], raw[2 * i + 1]);
            }
        } else {
            std::vector<float> raw(2 * count);
            file.read(reinterpret_cast<char*>(raw.data()), static_cast<std::streamsize>(raw.size() * sizeof(float)));
            if (!file) {
                throw DatasetError("Short read from " + path + " at sample " + std::to_string(offset));
            }
            for (size_t i = 0; i < count; ++i) {
                out[i] = Complex(raw[2 * i], raw[2 * i + 1]);
            }
        }
    }

    template <typename T>
    static std::vector<T> _read_metadata(const std::string& path) {
        std::vector<T> values;
        if (!fs::exists(path)) return values;

        const uintmax_t bytes = _file_size(path);
        if (bytes % sizeof(T) != 0) {
            throw DatasetError(path + ": size " + std::to_string(bytes) + " is not a multiple of " +
                               std::to_string(sizeof(T)) + " bytes");
        }
        values.resize(static_cast<size_t>(bytes / sizeof(T)));
        std::ifstream file(path, std::ios::binary);
        file.read(reinterpret_cast<char*>(values.data()), static_cast<std::streamsize>(bytes));
        if (!file) {
            throw DatasetError("Cannot read " + path);
        }
        return values;
    }
};

} // namespace OpenCSI

#endif // RAW_IQ_READER_HPP
