#include "gtest/gtest.h"
#include "episweep/SEIRModel.hpp"
#include "exceptions/Exceptions.hpp"
#include <cmath>
#include <limits>
#include <memory>
#include <numeric>
#include <vector>

using namespace episweep;

class SEIRModelTest : public ::testing::Test {
protected:
    SEIRParameters params;
    std::shared_ptr<SEIRModel> model;

    void SetUp() override {
        params.N = 1000.0;
        params.beta = 0.5;
        params.gamma = 0.1;
        params.sigma = 0.2;
        model = SEIRModel::create(params);
    }
};

TEST_F(SEIRModelTest, Metadata) {
    EXPECT_EQ(model->getStateSize(), 4);
    EXPECT_EQ(model->getStateNames(), (std::vector<std::string>{"S", "E", "I", "R"}));
    EXPECT_EQ(model->getModelName(), "SEIR");
    EXPECT_DOUBLE_EQ(model->getPopulationSize(), 1000.0);
    EXPECT_DOUBLE_EQ(model->getTransmissionRate(), 0.5);
    EXPECT_DOUBLE_EQ(model->getRecoveryRate(), 0.1);
    EXPECT_DOUBLE_EQ(model->getLatentRate(), 0.2);
    EXPECT_EQ(model->getCompartmentIndex("I"), 2);
    EXPECT_THROW(model->getCompartmentIndex("D"), InvalidParameterException);
}

TEST_F(SEIRModelTest, FixedParametersExcludeBeta) {
    auto fixed = model->getFixedParameters();
    ASSERT_EQ(fixed.size(), 3u);
    EXPECT_EQ(fixed[0].first, "N");
    EXPECT_EQ(fixed[1].first, "gamma");
    EXPECT_EQ(fixed[2].first, "sigma");
    EXPECT_DOUBLE_EQ(fixed[2].second, 0.2);
}

TEST_F(SEIRModelTest, ComputeDerivatives) {
    std::vector<double> state = {900.0, 50.0, 40.0, 10.0};
    std::vector<double> derivs(4);
    model->computeDerivatives(state, derivs, 0.0);

    const double infection = 0.5 * 900.0 * 40.0 / 1000.0; // 18
    EXPECT_NEAR(derivs[0], -infection, 1e-12);
    EXPECT_NEAR(derivs[1], infection - 0.2 * 50.0, 1e-12);
    EXPECT_NEAR(derivs[2], 0.2 * 50.0 - 0.1 * 40.0, 1e-12);
    EXPECT_NEAR(derivs[3], 0.1 * 40.0, 1e-12);
}

TEST_F(SEIRModelTest, DerivativesConservePopulation) {
    std::vector<std::vector<double>> states = {
        {999.0, 0.0, 1.0, 0.0},
        {500.0, 100.0, 300.0, 100.0},
        {0.0, 0.0, 0.0, 1000.0}
    };
    std::vector<double> derivs(4);
    for (const auto& state : states) {
        (*model)(state, derivs, 3.0);
        EXPECT_NEAR(std::accumulate(derivs.begin(), derivs.end(), 0.0), 0.0, 1e-9);
    }
}

TEST_F(SEIRModelTest, DiseaseFreeStateIsEquilibrium) {
    std::vector<double> state = {1000.0, 0.0, 0.0, 0.0};
    std::vector<double> derivs(4, 1.0);
    model->computeDerivatives(state, derivs, 0.0);
    for (double d : derivs) {
        EXPECT_DOUBLE_EQ(d, 0.0);
    }
}

TEST_F(SEIRModelTest, SizeMismatchThrows) {
    std::vector<double> short_state = {1.0, 2.0, 3.0};
    std::vector<double> derivs(4);
    EXPECT_THROW(model->computeDerivatives(short_state, derivs, 0.0), InvalidParameterException);

    std::vector<double> state = {1.0, 2.0, 3.0, 4.0};
    std::vector<double> short_derivs(2);
    EXPECT_THROW(model->computeDerivatives(state, short_derivs, 0.0), InvalidParameterException);
}

TEST(SEIRModelCreationTest, InvalidParametersThrow) {
    SEIRParameters p;
    p.N = 0.0;
    EXPECT_THROW(SEIRModel::create(p), ModelConstructionException);

    p = SEIRParameters();
    p.N = std::numeric_limits<double>::infinity();
    EXPECT_THROW(SEIRModel::create(p), ModelConstructionException);

    p = SEIRParameters();
    p.beta = -0.1;
    EXPECT_THROW(SEIRModel::create(p), ModelConstructionException);

    p = SEIRParameters();
    p.sigma = std::nan("");
    EXPECT_THROW(SEIRModel::create(p), ModelConstructionException);

    p = SEIRParameters();
    p.beta = 0.0;
    EXPECT_NO_THROW(SEIRModel::create(p));
}
