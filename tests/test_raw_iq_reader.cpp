#define BOOST_TEST_MODULE raw_iq_reader
#include <boost/test/unit_test.hpp>

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <vector>
#include <RawIqReader.hpp>

using namespace OpenCSI;

namespace {

namespace fs = std::filesystem;

template <typename T>
void write_raw(const std::string& path, const std::vector<T>& values) {
    std::ofstream out(path, std::ios::binary);
    out.write(reinterpret_cast<const char*>(values.data()),
              static_cast<std::streamsize>(values.size() * sizeof(T)));
}

// Temporary dataset directory, removed with the fixture
struct DatasetDir {
    fs::path dir;
    std::string base;

    DatasetDir() {
        dir = fs::temp_directory_path() /
              ("opencsi_reader_" + boost::unit_test::framework::current_test_case().p_name.get());
        fs::create_directories(dir);
        base = (dir / "capture").string();
    }
    ~DatasetDir() {
        std::error_code ec;
        fs::remove_all(dir, ec);
    }
};

// Frame f, antenna a, sample n holds I = 100 * a + 10 * f + n, Q = -I
std::vector<int16_t> sc16_antenna(size_t frames, size_t samples, size_t antenna) {
    std::vector<int16_t> raw;
    for (size_t f = 0; f < frames; ++f) {
        for (size_t n = 0; n < samples; ++n) {
            const int16_t v = static_cast<int16_t>(100 * antenna + 10 * f + n);
            raw.push_back(v);
            raw.push_back(static_cast<int16_t>(-v));
        }
    }
    return raw;
}

} // namespace

BOOST_FIXTURE_TEST_CASE(reads_sc16_chunks_with_shared_reference, DatasetDir) {
    write_raw(base + "_rx_iq0.sc16", sc16_antenna(5, 8, 0));
    write_raw(base + "_rx_iq1.sc16", sc16_antenna(5, 8, 1));
    write_raw(base + "_tx_iq.sc16", std::vector<int16_t>{1, 2, 3, 4, 5, 6});

    RawIqReader::Params p;
    p.base = base;
    p.format = "sc16";
    p.num_rx_samples = 8;
    p.num_antennas = 2;
    RawIqReader reader(p);

    BOOST_CHECK_EQUAL(reader.num_frames(), 5u);
    BOOST_CHECK_EQUAL(reader.tx_samples(), 3u);
    BOOST_CHECK(!reader.tx_per_frame());

    Core::FrameChunk chunk;
    BOOST_REQUIRE(reader.read_chunk(1, 2, chunk));
    BOOST_CHECK_EQUAL(chunk.num_frames, 2u);
    BOOST_CHECK_EQUAL(chunk.num_antennas, 2u);
    BOOST_CHECK_EQUAL(chunk.num_samples, 8u);
    BOOST_CHECK_EQUAL(chunk.rx.size(), 2u * 2u * 8u);
    // Chunk frame 1 is dataset frame 3
    BOOST_CHECK_EQUAL(chunk.rx_frame(1, 1)[4], Complex(134.0, -134.0));
    BOOST_CHECK_EQUAL(chunk.rx_frame(0, 0)[0], Complex(20.0, -20.0));
    BOOST_CHECK_EQUAL(chunk.tx_frame(1)[2], Complex(5.0, 6.0));

    BOOST_REQUIRE(reader.read_chunk(2, 2, chunk));
    BOOST_CHECK_EQUAL(chunk.num_frames, 1u);
    BOOST_CHECK(!reader.read_chunk(3, 2, chunk));

    BOOST_CHECK(reader.read_timestamps().empty());
    BOOST_CHECK(reader.read_center_freqs().empty());
}

BOOST_FIXTURE_TEST_CASE(reads_fc32_per_frame_reference_and_metadata, DatasetDir) {
    std::vector<float> rx;
    for (int i = 0; i < 3 * 4; ++i) {
        rx.push_back(0.5f * i);
        rx.push_back(1.0f);
    }
    std::vector<float> tx;
    for (int i = 0; i < 3 * 2; ++i) {
        tx.push_back(static_cast<float>(i));
        tx.push_back(0.0f);
    }
    write_raw(base + "_rx_iq0.fc32", rx);
    write_raw(base + "_tx_iq.fc32", tx);
    write_raw(base + "_timestamps.u64", std::vector<uint64_t>{100, 200, 300});
    write_raw(base + "_freq.f64", std::vector<double>{2.4e9, 2.4e9, 2.4e9});

    RawIqReader::Params p;
    p.base = base;
    p.format = "fc32";
    p.num_rx_samples = 4;
    p.num_tx_samples = 2;
    RawIqReader reader(p);

    BOOST_CHECK_EQUAL(reader.num_frames(), 3u);
    BOOST_CHECK(reader.tx_per_frame());

    Core::FrameChunk chunk;
    BOOST_REQUIRE(reader.read_chunk(0, 10, chunk));
    BOOST_CHECK_EQUAL(chunk.num_frames, 3u);
    BOOST_CHECK_EQUAL(chunk.rx_frame(2, 0)[1], Complex(4.5, 1.0));
    BOOST_CHECK_EQUAL(chunk.tx_frame(2)[1], Complex(5.0, 0.0));

    const std::vector<uint64_t> ticks = reader.read_timestamps();
    BOOST_REQUIRE_EQUAL(ticks.size(), 3u);
    BOOST_CHECK_EQUAL(ticks[2], 300u);
    BOOST_CHECK_EQUAL(reader.read_center_freqs().size(), 3u);
}

BOOST_FIXTURE_TEST_CASE(malformed_datasets_are_rejected, DatasetDir) {
    RawIqReader::Params p;
    p.base = base;
    p.num_rx_samples = 8;

    BOOST_CHECK_THROW(RawIqReader{p}, DatasetError);

    write_raw(base + "_rx_iq0.sc16", std::vector<int16_t>(2 * 12, 0));
    write_raw(base + "_tx_iq.sc16", std::vector<int16_t>(2 * 4, 0));
    BOOST_CHECK_THROW(RawIqReader{p}, DatasetError);     // 12 samples is not whole frames

    p.num_rx_samples = 4;
    p.num_tx_samples = 3;
    BOOST_CHECK_THROW(RawIqReader{p}, DatasetError);     // 4 TX samples fit neither layout

    p.num_tx_samples = 0;
    BOOST_CHECK_NO_THROW(RawIqReader{p});

    p.format = "cs8";
    BOOST_CHECK_THROW(RawIqReader{p}, InvalidArgument);
    p.format = "sc16";
    p.num_antennas = 3;
    BOOST_CHECK_THROW(RawIqReader{p}, InvalidArgument);
}
