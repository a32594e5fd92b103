#include <gtest/gtest.h>
#include "macros.h"
#include "anchormap/utils/blocking.hpp"
#include <vector>
#include <string>

TEST(Blocking, CountIds) {
    {
        std::vector<int> x { 0, 5, 2, 1, 3 };
        EXPECT_EQ(anchormap::count_ids(x.size(), x.data()), 6);
    }

    // Correctly casts the type before increment.
    {
        std::vector<unsigned char> x { 255, 0, 5, 2, 3};
        EXPECT_EQ(anchormap::count_ids(x.size(), x.data()), 256);
    }

    EXPECT_EQ(anchormap::count_ids(0, static_cast<int*>(NULL)), 0);
}

TEST(Blocking, TabulateIds) {
    {
        std::vector<int> x { 0, 5, 5, 4, 2, 1, 1, 1, 3 };
        std::vector<int> expected { 1, 3, 1, 1, 1, 2 };
        EXPECT_EQ(anchormap::tabulate_ids(x.size(), x.data()), expected);
    }

    {
        std::vector<int> x { 1, 3, 2, 1, 3, 3, 5 };
        std::vector<int> expected { 0, 2, 1, 3, 0, 1 };
        EXPECT_EQ(anchormap::tabulate_ids(x.size(), x.data(), true), expected);

        EXPECT_ANY_THROW({
            try {
                anchormap::tabulate_ids(x.size(), x.data());
            } catch (anchormap::DataError& e) {
                EXPECT_TRUE(std::string(e.what()).find("no empty blocks") != std::string::npos);
                throw;
            }
        });
    }
}

TEST(Blocking, Factorize) {
    std::vector<std::string> labels { "B", "A", "B", "C", "A" };
    auto fac = anchormap::factorize(labels);

    std::vector<std::string> levels { "B", "A", "C" };
    EXPECT_EQ(fac.levels, levels);
    std::vector<int> codes { 0, 1, 0, 2, 1 };
    EXPECT_EQ(fac.codes, codes);

    auto empty = anchormap::factorize(std::vector<std::string>());
    EXPECT_TRUE(empty.codes.empty());
    EXPECT_TRUE(empty.levels.empty());
}
