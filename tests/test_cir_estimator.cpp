#define BOOST_TEST_MODULE cir_estimator
#include <boost/test/unit_test.hpp>

#include <random>
#include <string>
#include <vector>
#include <CirEstimator.hpp>

using namespace OpenCSI;
using namespace OpenCSI::Core;

namespace {

struct DiagnosticLog {
    std::vector<Diagnostic> entries;
    DiagnosticHandler handler() {
        return [this](const Diagnostic& d) { entries.push_back(d); };
    }
    size_t count(DiagnosticKind kind) const {
        size_t n = 0;
        for (const auto& d : entries) n += d.kind == kind ? 1 : 0;
        return n;
    }
};

AlignedVector random_qpsk(size_t n, unsigned seed) {
    std::mt19937 rng(seed);
    std::uniform_int_distribution<int> bits(0, 3);
    const double a = std::sqrt(0.5);
    AlignedVector out(n);
    for (auto& s : out) {
        const int b = bits(rng);
        s = Complex((b & 1) ? a : -a, (b & 2) ? a : -a);
    }
    return out;
}

// rx = [lead zeros | tx convolved with h | tail zeros]
AlignedVector through_channel(const AlignedVector& tx, const std::vector<Complex>& h, size_t lead, size_t tail) {
    AlignedVector rx(lead + tx.size() + tail, Complex(0.0, 0.0));
    for (size_t n = 0; n < tx.size(); ++n) {
        for (size_t k = 0; k < h.size(); ++k) {
            rx[lead + n + k] += h[k] * tx[n];
        }
    }
    return rx;
}

} // namespace

BOOST_AUTO_TEST_CASE(xcorr_lag_layout) {
    CirCorrelator corr(8);
    const AlignedVector rx = {Complex(1, 0), Complex(2, 0), Complex(3, 0)};
    const AlignedVector tx = {Complex(1, 0)};

    AlignedVector out;
    corr.xcorr(rx.data(), rx.size(), tx.data(), tx.size(), 2, out);

    const std::vector<double> expected = {0.0, 0.0, 1.0, 2.0, 3.0};
    BOOST_REQUIRE_EQUAL(out.size(), expected.size());
    for (size_t i = 0; i < expected.size(); ++i) {
        BOOST_CHECK_SMALL(std::abs(out[i] - Complex(expected[i], 0.0)), 1e-12);
    }
}

BOOST_AUTO_TEST_CASE(recovers_three_tap_channel) {
    const AlignedVector tx = random_qpsk(4096, 11);
    const std::vector<Complex> h = {{1.0, 0.0}, {0.5, 0.0}, {0.2, 0.0}};
    const AlignedVector rx = through_channel(tx, h, 10, 50);

    DiagnosticLog log;
    CirCorrelator corr(64, PeakPolicy::Warn, log.handler());
    const AlignedVector cir = corr.compute(tx, rx, 10);

    BOOST_REQUIRE_EQUAL(cir.size(), 64u);
    BOOST_CHECK_SMALL(std::abs(cir[0] - h[0]), 0.1);
    BOOST_CHECK_SMALL(std::abs(cir[1] - h[1]), 0.1);
    BOOST_CHECK_SMALL(std::abs(cir[2] - h[2]), 0.1);
    for (size_t k = 3; k < cir.size(); ++k) {
        BOOST_CHECK_SMALL(std::abs(cir[k]), 0.1);
    }
    BOOST_CHECK_EQUAL(log.count(DiagnosticKind::PeakDiscrepancy), 0u);
}

BOOST_AUTO_TEST_CASE(one_shot_matches_correlator) {
    const AlignedVector tx = random_qpsk(512, 3);
    const AlignedVector rx = through_channel(tx, {{0.8, 0.1}, {0.0, 0.3}}, 20, 20);

    CirCorrelator corr(32);
    const AlignedVector a = corr.compute(tx, rx, 20);
    const AlignedVector b = compute_cir_corr(tx, rx, 20, 32);
    BOOST_REQUIRE_EQUAL(a.size(), b.size());
    for (size_t k = 0; k < a.size(); ++k) {
        BOOST_CHECK_SMALL(std::abs(a[k] - b[k]), 1e-12);
    }

    // Reference change with the same transform length
    const AlignedVector tx2 = random_qpsk(512, 4);
    const AlignedVector rx2 = through_channel(tx2, {{0.5, 0.0}}, 20, 20);
    const AlignedVector c = corr.compute(tx2, rx2, 20);
    BOOST_CHECK_SMALL(std::abs(c[0] - Complex(0.5, 0.0)), 0.1);
}

BOOST_AUTO_TEST_CASE(offset_past_rx_end_throws) {
    const AlignedVector tx = random_qpsk(64, 5);
    const AlignedVector rx = through_channel(tx, {{1.0, 0.0}}, 4, 4);

    CirCorrelator corr(16);
    BOOST_CHECK_THROW(corr.compute(tx, rx, rx.size()), IndexOutOfRange);
    BOOST_CHECK_THROW(corr.compute(tx, rx, rx.size() + 5), IndexOutOfRange);
    BOOST_CHECK_NO_THROW(corr.compute(tx, rx, rx.size() - 1));
    BOOST_CHECK_THROW(corr.compute(AlignedVector(), rx, 0), InvalidArgument);
}

BOOST_AUTO_TEST_CASE(odd_length_is_reported) {
    DiagnosticLog log;
    CirCorrelator corr(63, PeakPolicy::Warn, log.handler());
    BOOST_CHECK_EQUAL(log.count(DiagnosticKind::OddFftLength), 1u);
    BOOST_CHECK_THROW(CirCorrelator(0), InvalidArgument);
}

BOOST_AUTO_TEST_CASE(finds_rx_start_offset) {
    const AlignedVector tx = random_qpsk(256, 21);
    const AlignedVector rx = through_channel(tx, {{0.7, -0.2}}, 37, 107);

    CirCorrelator corr(64);
    BOOST_CHECK_EQUAL(corr.find_rx_start_offset(tx, rx), 37u);
    BOOST_CHECK_EQUAL(corr.find_rx_start_offset(tx, rx, 50), 37u);
}

BOOST_AUTO_TEST_CASE(peak_outside_window_follows_policy) {
    const AlignedVector tx = random_qpsk(1024, 8);
    // Reference arrives 40 samples after the assumed start, outside the +-32 lag window
    const AlignedVector rx = through_channel(tx, {{1.0, 0.0}}, 40, 64);

    DiagnosticLog log;
    CirCorrelator warn(64, PeakPolicy::Warn, log.handler());
    BOOST_CHECK_NO_THROW(warn.compute(tx, rx, 0));
    BOOST_CHECK_EQUAL(log.count(DiagnosticKind::PeakDiscrepancy), 1u);

    CirCorrelator strict(64, PeakPolicy::Fail);
    BOOST_CHECK_THROW(strict.compute(tx, rx, 0), PeakDiscrepancyError);

    BOOST_CHECK(parse_peak_policy("FAIL") == PeakPolicy::Fail);
    BOOST_CHECK_THROW(parse_peak_policy("ignore"), InvalidArgument);
}

BOOST_AUTO_TEST_CASE(moved_correlator_keeps_working) {
    const AlignedVector tx = random_qpsk(256, 2);
    const AlignedVector rx = through_channel(tx, {{1.0, 0.0}}, 8, 8);

    CirCorrelator first(32);
    const AlignedVector before = first.compute(tx, rx, 8);
    CirCorrelator second(std::move(first));
    const AlignedVector after = second.compute(tx, rx, 8);
    for (size_t k = 0; k < before.size(); ++k) {
        BOOST_CHECK_SMALL(std::abs(before[k] - after[k]), 1e-12);
    }
}

BOOST_AUTO_TEST_CASE(measured_plans_match_and_feed_wisdom) {
    const AlignedVector tx = random_qpsk(300, 4);
    const AlignedVector rx = through_channel(tx, {{0.6, -0.2}, {0.0, 0.25}}, 12, 12);

    fftw_forget_wisdom();
    char* empty = fftw_export_wisdom_to_string();
    BOOST_REQUIRE(empty != nullptr);
    const std::string empty_wisdom(empty);
    fftw_free(empty);

    CirCorrelator estimated(64);
    CirCorrelator measured(64, PeakPolicy::Warn, DiagnosticHandler(), FFTW_MEASURE);
    BOOST_CHECK_EQUAL(estimated.planner_flags(), static_cast<unsigned>(FFTW_ESTIMATE));
    BOOST_CHECK_EQUAL(measured.planner_flags(), static_cast<unsigned>(FFTW_MEASURE));

    const AlignedVector a = estimated.compute(tx, rx, 12);
    const AlignedVector b = measured.compute(tx, rx, 12);
    for (size_t k = 0; k < a.size(); ++k) {
        BOOST_CHECK_SMALL(std::abs(a[k] - b[k]), 1e-12);
    }

    char* learned = fftw_export_wisdom_to_string();
    BOOST_REQUIRE(learned != nullptr);
    BOOST_CHECK_GT(std::string(learned).size(), empty_wisdom.size());
    fftw_free(learned);
    fftw_forget_wisdom();

    BOOST_CHECK_EQUAL(parse_fft_planner("Measure"), static_cast<unsigned>(FFTW_MEASURE));
    BOOST_CHECK_EQUAL(parse_fft_planner("estimate"), static_cast<unsigned>(FFTW_ESTIMATE));
    BOOST_CHECK_THROW(parse_fft_planner("exhaustive"), InvalidArgument);
}
