#include <catch2/catch.hpp>
#include <dsmash/cost/metrics.hpp>
#include <cmath>

using namespace dsmash;
using namespace dsmash::metrics;
using Catch::Detail::Approx;

namespace {

Vector make_vector(std::initializer_list<Real> values) {
    Vector v(static_cast<Index>(values.size()));
    Index i = 0;
    for (Real x : values) v(i++) = x;
    return v;
}

} // anonymous namespace

TEST_CASE("Quantile interpolation", "[metrics][quantile]") {
    REQUIRE(quantile({1.0, 2.0, 3.0, 4.0}, 0.5) == Approx(2.5));
    REQUIRE(quantile({5.0, 1.0, 3.0}, 0.5) == Approx(3.0));
    REQUIRE(quantile({4.0, 1.0, 3.0, 2.0}, 0.0) == Approx(1.0));
    REQUIRE(quantile({4.0, 1.0, 3.0, 2.0}, 1.0) == Approx(4.0));
    REQUIRE(quantile({1.0, 2.0, 3.0, 4.0, 5.0}, 0.9) == Approx(4.6));
    REQUIRE(quantile({7.0}, 0.3) == 7.0);
    REQUIRE(quantile({}, 0.5) == 0.0);
}

TEST_CASE("NSE", "[metrics]") {
    Vector x = make_vector({1.0, 3.0, 2.0, 5.0, 4.0});

    REQUIRE(nse(x, x) == Approx(0.0).margin(1e-12));

    Vector mean = Vector::Constant(5, 3.0);
    REQUIRE(nse(x, mean) == Approx(1.0));
}

TEST_CASE("KGE", "[metrics]") {
    Vector x = make_vector({1.0, 3.0, 2.0, 5.0, 4.0});

    REQUIRE(kge(x, x) == Approx(0.0).margin(1e-6));
    REQUIRE(kge2(x, x) == Approx(0.0).margin(1e-10));

    Vector y = 2.0 * x;
    auto c = kge_components(x, y);
    REQUIRE(c.r == Approx(1.0));
    REQUIRE(c.alpha == Approx(2.0));
    REQUIRE(c.beta == Approx(2.0));
    REQUIRE(kge(x, y) == Approx(std::sqrt(2.0)));
    REQUIRE(kge2(x, y) == Approx(2.0));
}

TEST_CASE("Squared errors", "[metrics]") {
    Vector x = make_vector({1.0, 2.0, 3.0, 4.0});
    Vector y = make_vector({2.0, 2.0, 5.0, 4.0});

    REQUIRE(se(x, y) == Approx(5.0));
    REQUIRE(rmse(x, y) == Approx(std::sqrt(5.0 / 4.0)));
}

TEST_CASE("Logarithmic error", "[metrics]") {
    Vector x = make_vector({1.0, 2.0, 0.0});
    Vector y = make_vector({std::exp(1.0), 2.0, 5.0});

    REQUIRE(logarithmic(x, y) == Approx(1.0));
    REQUIRE(logarithmic(x, x) == 0.0);
}

TEST_CASE("Missing observations are ignored", "[metrics][missing]") {
    Vector x = make_vector({1.0, -99.0, 3.0, -1.0});
    Vector y = make_vector({2.0, 1000.0, 3.0, 1000.0});

    REQUIRE(se(x, y) == Approx(1.0));
    REQUIRE(rmse(x, y) == Approx(std::sqrt(0.5)));

    Vector missing = Vector::Constant(4, -99.0);
    REQUIRE(nse(missing, y) == 0.0);
    REQUIRE(kge(missing, y) == 0.0);
    REQUIRE(se(missing, y) == 0.0);
    REQUIRE(rmse(missing, y) == 0.0);
}
