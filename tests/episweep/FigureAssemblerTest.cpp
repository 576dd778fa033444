#include "gtest/gtest.h"
#include "episweep/plotting/FigureAssembler.hpp"
#include "episweep/plotting/Visibility.hpp"
#include "exceptions/Exceptions.hpp"
#include <algorithm>
#include <vector>

using namespace episweep;

class FigureAssemblerTest : public ::testing::Test {
protected:
    std::vector<double> time_axis = {0.0, 1.0, 2.0};
    std::vector<double> betas = {0.01, 0.5, 1.0};
    std::vector<std::pair<std::string, double>> fixed = {{"N", 330e6}, {"gamma", 0.1}, {"sigma", 0.2}};
    const int compartments = 4;

    std::vector<Trace> makeTraces() const {
        const int num_beta = static_cast<int>(betas.size());
        std::vector<Trace> traces(static_cast<size_t>(num_beta) * compartments);
        for (int c = 0; c < compartments; ++c) {
            for (int b = 0; b < num_beta; ++b) {
                Trace& trace = traces[traceIndex(c, b, num_beta)];
                trace.compartment_index = c;
                trace.beta_index = b;
                trace.beta = betas[b];
                trace.y.assign(time_axis.size(), c + b);
            }
        }
        return traces;
    }
};

TEST_F(FigureAssemblerTest, OneStepPerBeta) {
    Figure figure = FigureAssembler::assemble(time_axis, makeTraces(), betas, compartments, 1, "SEIR", fixed);
    ASSERT_EQ(figure.steps.size(), 3u);
    EXPECT_EQ(figure.traces.size(), 12u);
    EXPECT_EQ(figure.active_step, 1);
    EXPECT_EQ(figure.steps[0].label, "0.01");
    EXPECT_EQ(figure.steps[1].label, "0.50");
    EXPECT_EQ(figure.steps[2].label, "1.00");
    for (int s = 0; s < 3; ++s) {
        EXPECT_EQ(figure.steps[s].group_index, s);
        EXPECT_DOUBLE_EQ(figure.steps[s].beta, betas[s]);
    }
}

TEST_F(FigureAssemblerTest, StepVisibilityShowsOneGroup) {
    Figure figure = FigureAssembler::assemble(time_axis, makeTraces(), betas, compartments, 0, "SEIR", fixed);
    for (int s = 0; s < 3; ++s) {
        std::vector<bool> visible = figure.visibilityForStep(s);
        ASSERT_EQ(visible.size(), figure.traces.size());
        EXPECT_EQ(std::count(visible.begin(), visible.end(), true), compartments);
        for (size_t i = 0; i < visible.size(); ++i) {
            EXPECT_EQ(visible[i], figure.traces[i].beta_index == s);
        }
    }
    EXPECT_EQ(figure.initialVisibility(), figure.visibilityForStep(0));
    EXPECT_THROW(figure.visibilityForStep(3), OutOfRangeException);
}

TEST_F(FigureAssemblerTest, TitlesCarryBetaAndFixedParameters) {
    Figure figure = FigureAssembler::assemble(time_axis, makeTraces(), betas, compartments, 1, "SEIR", fixed);
    EXPECT_EQ(figure.steps[1].title, "SEIR model, β = 0.50 (N = 330000000, γ = 0.1, σ = 0.2)");
    EXPECT_EQ(figure.activeTitle(), figure.steps[1].title);
    EXPECT_EQ(FigureAssembler::buildTitle("SIRD", 0.25, {{"N", 1000.0}, {"gamma", 0.1}, {"alpha", 0.03}}),
              "SIRD model, β = 0.25 (N = 1000, γ = 0.1, α = 0.03)");
    EXPECT_EQ(FigureAssembler::buildTitle("SIRD", 0.25, {}), "SIRD model, β = 0.25");
}

TEST_F(FigureAssemblerTest, LabelFormatting) {
    EXPECT_EQ(FigureAssembler::formatStepLabel(0.5), "0.50");
    EXPECT_EQ(FigureAssembler::formatStepLabel(0.07), "0.07");
    EXPECT_EQ(FigureAssembler::formatParameterValue(330e6), "330000000");
    EXPECT_EQ(FigureAssembler::formatParameterValue(0.2), "0.2");
    EXPECT_EQ(FigureAssembler::parameterSymbol("sigma"), "σ");
    EXPECT_EQ(FigureAssembler::parameterSymbol("N"), "N");
}

TEST_F(FigureAssemblerTest, CountMismatchThrows) {
    std::vector<Trace> traces = makeTraces();
    traces.pop_back();
    EXPECT_THROW(FigureAssembler::assemble(time_axis, traces, betas, compartments, 0, "SEIR", fixed),
                 FigureConstructionException);
    EXPECT_THROW(FigureAssembler::assemble(time_axis, makeTraces(), {0.1, 0.2}, compartments, 0, "SEIR", fixed),
                 FigureConstructionException);
}

TEST_F(FigureAssemblerTest, OrderAndLengthMismatchThrow) {
    std::vector<Trace> swapped = makeTraces();
    std::swap(swapped[0], swapped[1]);
    EXPECT_THROW(FigureAssembler::assemble(time_axis, swapped, betas, compartments, 0, "SEIR", fixed),
                 FigureConstructionException);

    std::vector<Trace> short_trace = makeTraces();
    short_trace[5].y.pop_back();
    EXPECT_THROW(FigureAssembler::assemble(time_axis, short_trace, betas, compartments, 0, "SEIR", fixed),
                 FigureConstructionException);
}

TEST_F(FigureAssemblerTest, DefaultStepOutOfRangeThrows) {
    EXPECT_THROW(FigureAssembler::assemble(time_axis, makeTraces(), betas, compartments, 3, "SEIR", fixed),
                 FigureConstructionException);
    EXPECT_THROW(FigureAssembler::assemble(time_axis, makeTraces(), betas, compartments, -1, "SEIR", fixed),
                 FigureConstructionException);
}
