#include <gtest/gtest.h>
#include "../utils/macros.h"

#include "../utils/compare_almost_equal.h"
#include "../data/Simulator.hpp"

#include "anchormap/neighbors/FindNeighbors.hpp"
#include "anchormap/utils/errors.hpp"

#include <vector>
#include <algorithm>
#include <cmath>

class FindNeighborsTest : public ::testing::TestWithParam<std::tuple<int, int> > {
protected:
    static std::vector<std::pair<int, double> > brute_force(int ndim, size_t nobs, const double* data, const double* point, int k, int self = -1) {
        std::vector<std::pair<double, int> > distances;
        for (size_t o = 0; o < nobs; ++o) {
            if (static_cast<int>(o) == self) {
                continue;
            }
            double d2 = 0;
            for (int d = 0; d < ndim; ++d) {
                double diff = data[o * ndim + d] - point[d];
                d2 += diff * diff;
            }
            distances.emplace_back(std::sqrt(d2), o);
        }
        std::sort(distances.begin(), distances.end());

        std::vector<std::pair<int, double> > output;
        for (int i = 0; i < k && i < static_cast<int>(distances.size()); ++i) {
            output.emplace_back(distances[i].second, distances[i].first);
        }
        return output;
    }

    static void compare_neighbors(const std::vector<std::pair<int, double> >& expected, const std::vector<std::pair<int, double> >& observed) {
        ASSERT_EQ(expected.size(), observed.size());
        for (size_t i = 0; i < expected.size(); ++i) {
            EXPECT_EQ(expected[i].first, observed[i].first);
            compare_almost_equal(expected[i].second, observed[i].second);
        }
    }
};

TEST_P(FindNeighborsTest, Self) {
    auto param = GetParam();
    int k = std::get<0>(param);
    int nthreads = std::get<1>(param);

    int ndim = 5;
    size_t nobs = 101;
    Simulator sim;
    sim.density = 1;
    auto data = sim.vector(ndim * nobs);

    anchormap::FindNeighbors finder;
    finder.set_num_neighbors(k).set_num_threads(nthreads);
    auto res = finder.run(ndim, nobs, data.data());

    ASSERT_EQ(res.size(), nobs);
    for (size_t o = 0; o < nobs; ++o) {
        auto expected = brute_force(ndim, nobs, data.data(), data.data() + o * ndim, k, o);
        compare_neighbors(expected, res[o]);
    }
}

TEST_P(FindNeighborsTest, Query) {
    auto param = GetParam();
    int k = std::get<0>(param);
    int nthreads = std::get<1>(param);

    int ndim = 4;
    size_t nobs = 80, nquery = 33;
    Simulator sim;
    sim.density = 1;
    auto data = sim.vector(ndim * nobs);
    sim.seed = 10;
    auto query = sim.vector(ndim * nquery);

    anchormap::FindNeighbors finder;
    finder.set_num_neighbors(k).set_num_threads(nthreads);
    auto res = finder.run(ndim, nobs, data.data(), nquery, query.data());

    ASSERT_EQ(res.size(), nquery);
    for (size_t q = 0; q < nquery; ++q) {
        auto expected = brute_force(ndim, nobs, data.data(), query.data() + q * ndim, k);
        compare_neighbors(expected, res[q]);
    }

    // Re-using an index gives the same results.
    auto index = finder.build(ndim, nobs, data.data());
    EXPECT_EQ(index->nobs(), nobs);
    EXPECT_EQ(index->ndim(), ndim);
    auto reused = finder.run(index.get(), nquery, query.data());
    EXPECT_EQ(reused, res);
}

INSTANTIATE_TEST_SUITE_P(
    FindNeighbors,
    FindNeighborsTest,
    ::testing::Combine(
        ::testing::Values(1, 5, 20), // number of neighbors
        ::testing::Values(1, 3) // number of threads
    )
);

TEST(FindNeighbors, Approximate) {
    int ndim = 3;
    size_t nobs = 200;
    Simulator sim;
    sim.density = 1;
    auto data = sim.vector(ndim * nobs);

    anchormap::FindNeighbors finder;
    finder.set_num_neighbors(10).set_approximate(true);
    auto res = finder.run(ndim, nobs, data.data());

    ASSERT_EQ(res.size(), nobs);
    for (size_t o = 0; o < nobs; ++o) {
        EXPECT_EQ(res[o].size(), 10);
        for (size_t i = 0; i < res[o].size(); ++i) {
            EXPECT_NE(res[o][i].first, static_cast<int>(o));
            if (i) {
                EXPECT_TRUE(res[o][i - 1].second <= res[o][i].second);
            }
        }
    }
}

TEST(FindNeighbors, CheckNeighborList) {
    anchormap::NeighborList nl(3);
    for (auto& current : nl) {
        current.emplace_back(0, 0.1);
        current.emplace_back(1, 0.2);
        current.emplace_back(2, 0.3);
    }

    anchormap::check_neighbor_list(nl, 3, 3, "reference_neighbors");
    anchormap::check_neighbor_list(nl, 3, 2, "reference_neighbors");

    try {
        anchormap::check_neighbor_list(nl, 4, 2, "reference_neighbors");
        FAIL() << "expected a ValidationError";
    } catch (anchormap::ValidationError& e) {
        EXPECT_EQ(e.parameter(), "reference_neighbors");
    }

    EXPECT_THROW(anchormap::check_neighbor_list(nl, 3, 4, "reference_neighbors"), anchormap::ValidationError);

    auto truncated = anchormap::truncate_neighbors(nl, 2);
    ASSERT_EQ(truncated.size(), 3);
    for (const auto& current : truncated) {
        ASSERT_EQ(current.size(), 2);
        EXPECT_EQ(current[0].first, 0);
        EXPECT_EQ(current[1].first, 1);
    }

    // Truncation to a larger number leaves the list unchanged.
    EXPECT_EQ(anchormap::truncate_neighbors(nl, 10), nl);
}
