#include "gtest/gtest.h"
#include "episweep/plotting/Visibility.hpp"
#include "exceptions/Exceptions.hpp"
#include <algorithm>
#include <vector>

using namespace episweep;

TEST(VisibilityTest, ExactlyOneTracePerCompartmentIsVisible) {
    const int num_beta = 100;
    const int compartment_count = 4;
    for (int selected : {0, 1, 49, 99}) {
        std::vector<bool> visible = computeVisibility(selected, num_beta, compartment_count);
        ASSERT_EQ(visible.size(), 400u);
        EXPECT_EQ(std::count(visible.begin(), visible.end(), true), compartment_count);
        for (int k = 0; k < compartment_count; ++k) {
            EXPECT_TRUE(visible[selected + k * num_beta]) << "selected=" << selected << " k=" << k;
        }
    }
}

TEST(VisibilityTest, SmallLayout) {
    // Compartment-major: [S(b0) S(b1) S(b2) I(b0) I(b1) I(b2)]
    std::vector<bool> visible = computeVisibility(1, 3, 2);
    EXPECT_EQ(visible, (std::vector<bool>{false, true, false, false, true, false}));
}

TEST(VisibilityTest, TraceIndexIsCompartmentMajor) {
    EXPECT_EQ(traceIndex(0, 0, 100), 0);
    EXPECT_EQ(traceIndex(0, 99, 100), 99);
    EXPECT_EQ(traceIndex(2, 49, 100), 249);
}

TEST(VisibilityTest, InvalidArguments) {
    EXPECT_THROW(computeVisibility(3, 3, 4), OutOfRangeException);
    EXPECT_THROW(computeVisibility(-1, 3, 4), OutOfRangeException);
    EXPECT_THROW(computeVisibility(0, 0, 4), InvalidParameterException);
    EXPECT_THROW(computeVisibility(0, 3, 0), InvalidParameterException);
}
