#include "gtest/gtest.h"
#include "episweep/ModelFactory.hpp"
#include "exceptions/Exceptions.hpp"
#include <Eigen/Dense>
#include <memory>

using namespace episweep;

class ModelFactoryTest : public ::testing::Test {
protected:
    SEIRParameters seir;
    SIRDParameters sird;

    void SetUp() override {
        seir.N = 330e6;
        seir.beta = 0.25;
        seir.gamma = 0.1;
        seir.sigma = 0.2;

        sird.N = 330e6;
        sird.beta = 0.25;
        sird.gamma = 0.1;
        sird.alpha = 0.03;
    }
};

TEST_F(ModelFactoryTest, CreateSEIRModelSuccess) {
    std::shared_ptr<SEIRModel> model;
    ASSERT_NO_THROW(model = ModelFactory::createSEIRModel(seir));
    ASSERT_NE(model, nullptr);
    EXPECT_DOUBLE_EQ(model->getTransmissionRate(), 0.25);
    EXPECT_DOUBLE_EQ(model->getParameters().sigma, 0.2);
}

TEST_F(ModelFactoryTest, CreateSIRDModelSuccess) {
    std::shared_ptr<SIRDModel> model;
    ASSERT_NO_THROW(model = ModelFactory::createSIRDModel(sird));
    ASSERT_NE(model, nullptr);
    EXPECT_DOUBLE_EQ(model->getParameters().alpha, 0.03);
}

TEST_F(ModelFactoryTest, CreateModelFailures) {
    seir.gamma = -1.0;
    EXPECT_THROW(ModelFactory::createSEIRModel(seir), ModelConstructionException);

    sird.alpha = 2.0;
    EXPECT_THROW(ModelFactory::createSIRDModel(sird), ModelConstructionException);
}

TEST_F(ModelFactoryTest, CreateInitialSEIRState) {
    Eigen::VectorXd state = ModelFactory::createInitialSEIRState(330e6, 1.0);
    ASSERT_EQ(state.size(), 4);
    EXPECT_DOUBLE_EQ(state(0), 330e6 - 1.0);
    EXPECT_DOUBLE_EQ(state(1), 0.0);
    EXPECT_DOUBLE_EQ(state(2), 1.0);
    EXPECT_DOUBLE_EQ(state(3), 0.0);
    EXPECT_DOUBLE_EQ(state.sum(), 330e6);
}

TEST_F(ModelFactoryTest, CreateInitialSIRDState) {
    Eigen::VectorXd state = ModelFactory::createInitialSIRDState(1000.0, 10.0);
    ASSERT_EQ(state.size(), 4);
    EXPECT_DOUBLE_EQ(state(0), 990.0);
    EXPECT_DOUBLE_EQ(state(1), 10.0);
    EXPECT_DOUBLE_EQ(state(2), 0.0);
    EXPECT_DOUBLE_EQ(state(3), 0.0);
}

TEST_F(ModelFactoryTest, CreateInitialStateFailures) {
    EXPECT_THROW(ModelFactory::createInitialSEIRState(0.0, 1.0), InvalidParameterException);
    EXPECT_THROW(ModelFactory::createInitialSEIRState(100.0, 0.0), InvalidParameterException);
    EXPECT_THROW(ModelFactory::createInitialSIRDState(100.0, 101.0), InvalidParameterException);
    EXPECT_NO_THROW(ModelFactory::createInitialSIRDState(100.0, 100.0));
}
