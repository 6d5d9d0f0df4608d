#include <gtest/gtest.h>
#include <stdexcept>
#include "pipeline.hpp"
#include "test_helpers.hpp"

namespace {

// Always throws from calculate()
class ExplodingCalculator : public MetricCalculator {
public:
    using MetricCalculator::MetricCalculator;
    std::string name() const override { return "exploding"; }

protected:
    PartialMetrics calculate(const PoseSequence&, const CalibrationContext&) const override {
        throw std::runtime_error("boom");
    }
};

// Returns a fixed contribution
class FixedCalculator : public MetricCalculator {
public:
    FixedCalculator(const RunnerProfile& profile, std::string name, PartialMetrics values)
        : MetricCalculator(profile, CalculatorParams{}),
          name_(std::move(name)),
          values_(std::move(values)) {}
    std::string name() const override { return name_; }

protected:
    PartialMetrics calculate(const PoseSequence&, const CalibrationContext&) const override {
        return values_;
    }

private:
    std::string name_;
    PartialMetrics values_;
};

}  // namespace

class PipelineConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        config = PipelineConfig{};
    }

    PipelineConfig config;
};

TEST_F(PipelineConfigTest, DefaultValues) {
    EXPECT_EQ(config.calculator.smoothing.window, 5);
    EXPECT_EQ(config.calculator.smoothing.order, 3);
    EXPECT_DOUBLE_EQ(config.calculator.peaks.min_prominence, 0.01);
    EXPECT_EQ(config.calculator.peaks.min_distance, 5);
    EXPECT_DOUBLE_EQ(config.calculator.contact_threshold_ratio, 0.2);
    EXPECT_EQ(config.calibration.reference, CalibrationReference::HIPS);
    EXPECT_FALSE(config.parallel);
}

class MetricsPipelineTest : public ::testing::Test {
protected:
    void SetUp() override {
        profile = make_profile(175);
        frames = make_running_session();
    }

    RunnerProfile profile;
    PoseSequence frames;
};

TEST_F(MetricsPipelineTest, DefaultCalculators) {
    MetricsPipeline pipeline(profile);
    EXPECT_EQ(pipeline.calculator_names().size(), 9u);
    EXPECT_EQ(pipeline.calculator_names().front(), "cadence");
    EXPECT_EQ(pipeline.calculator_names().back(), "joint_angles");
}

TEST_F(MetricsPipelineTest, RunningSession) {
    MetricsPipeline pipeline(profile);
    PipelineReport report = pipeline.run_detailed(frames);

    EXPECT_TRUE(report.failures.empty());
    EXPECT_TRUE(report.calibration.valid);
    EXPECT_GE(report.run_ms, 0.0);

    const RunningMetrics& m = report.metrics;
    EXPECT_NEAR(m.cadence, 240.0, 5.0);
    EXPECT_DOUBLE_EQ(m.left_right_symmetry, 1.0);
    EXPECT_GT(m.speed, 0.0);
    EXPECT_GT(m.stride_length, 0.0);
    EXPECT_GT(m.ground_contact_time, 0.0);
    EXPECT_GT(m.flight_time, 0.0);
    EXPECT_GT(m.vertical_oscillation, 0.0);
    EXPECT_GT(m.forward_lean, 0.0);
    EXPECT_EQ(m.joint_angles.size(), 4u);

    EXPECT_EQ(report.details.step_count, std::optional<int>(40));
    EXPECT_EQ(report.details.measurement_method,
              std::optional<MeasurementMethod>(MeasurementMethod::POSE_ANALYSIS));
}

TEST_F(MetricsPipelineTest, EveryFieldPresentWithoutLandmarks) {
    MetricsPipeline pipeline(profile);
    RunningMetrics m = pipeline.run(make_empty_pose_session(30));

    EXPECT_DOUBLE_EQ(m.cadence, 0.0);
    EXPECT_DOUBLE_EQ(m.speed, 0.0);
    EXPECT_DOUBLE_EQ(m.ground_contact_time, 0.0);
    EXPECT_DOUBLE_EQ(m.flight_time, 0.0);
    EXPECT_DOUBLE_EQ(m.vertical_oscillation, 0.0);
    EXPECT_DOUBLE_EQ(m.forward_lean, 0.0);
    EXPECT_DOUBLE_EQ(m.left_right_symmetry, 0.0);
    EXPECT_EQ(m.center_of_gravity, cv::Point3d(0, 0, 0));
    // No gait events: stride and step come from body height
    EXPECT_DOUBLE_EQ(m.stride_length, profile.height_m() * kStrideHeightRatio);
    EXPECT_DOUBLE_EQ(m.step_length, profile.height_m() * kStepHeightRatio);
    ASSERT_EQ(m.joint_angles.size(), 4u);
    for (const auto& [name, angle] : m.joint_angles) EXPECT_DOUBLE_EQ(angle, 0.0) << name;
}

TEST_F(MetricsPipelineTest, EmptySession) {
    MetricsPipeline pipeline(profile);
    PipelineReport report = pipeline.run_detailed({});
    EXPECT_TRUE(report.failures.empty());
    EXPECT_FALSE(report.calibration.valid);
    EXPECT_DOUBLE_EQ(report.metrics.cadence, 0.0);
    EXPECT_DOUBLE_EQ(report.metrics.stride_length, 0.0);
}

TEST_F(MetricsPipelineTest, FailingCalculatorIsIsolated) {
    auto calcs = create_default_calculators(profile, CalculatorParams{});
    calcs.push_back(std::make_unique<ExplodingCalculator>(profile, CalculatorParams{}));
    MetricsPipeline pipeline(profile, PipelineConfig{}, std::move(calcs));

    PipelineReport report = pipeline.run_detailed(frames);
    ASSERT_EQ(report.failures.size(), 1u);
    EXPECT_EQ(report.failures[0].calculator, "exploding");
    EXPECT_EQ(report.failures[0].reason, "boom");
    EXPECT_NEAR(report.metrics.cadence, 240.0, 5.0);
}

TEST_F(MetricsPipelineTest, FailedFieldsFallBackToDefaults) {
    std::vector<std::unique_ptr<MetricCalculator>> calcs;
    calcs.push_back(std::make_unique<ExplodingCalculator>(profile, CalculatorParams{}));
    MetricsPipeline pipeline(profile, PipelineConfig{}, std::move(calcs));

    RunningMetrics m = pipeline.run(frames);
    EXPECT_DOUBLE_EQ(m.cadence, 0.0);
    EXPECT_DOUBLE_EQ(m.stride_length, 0.0);
    EXPECT_TRUE(m.joint_angles.empty());
}

TEST_F(MetricsPipelineTest, LaterCalculatorsOverride) {
    PartialMetrics first;
    first.cadence = 150.0;
    first.speed = 2.5;
    PartialMetrics second;
    second.cadence = 175.0;

    std::vector<std::unique_ptr<MetricCalculator>> calcs;
    calcs.push_back(std::make_unique<FixedCalculator>(profile, "first", first));
    calcs.push_back(std::make_unique<FixedCalculator>(profile, "second", second));
    MetricsPipeline pipeline(profile, PipelineConfig{}, std::move(calcs));

    RunningMetrics m = pipeline.run(frames);
    EXPECT_DOUBLE_EQ(m.cadence, 175.0);
    EXPECT_DOUBLE_EQ(m.speed, 2.5);
}

TEST_F(MetricsPipelineTest, ParallelMatchesSequential) {
    PipelineConfig parallel_cfg;
    parallel_cfg.parallel = true;

    RunningMetrics seq = MetricsPipeline(profile).run(frames);
    RunningMetrics par = MetricsPipeline(profile, parallel_cfg).run(frames);

    EXPECT_DOUBLE_EQ(par.cadence, seq.cadence);
    EXPECT_DOUBLE_EQ(par.speed, seq.speed);
    EXPECT_DOUBLE_EQ(par.step_length, seq.step_length);
    EXPECT_DOUBLE_EQ(par.stride_length, seq.stride_length);
    EXPECT_DOUBLE_EQ(par.ground_contact_time, seq.ground_contact_time);
    EXPECT_DOUBLE_EQ(par.flight_time, seq.flight_time);
    EXPECT_DOUBLE_EQ(par.vertical_oscillation, seq.vertical_oscillation);
    EXPECT_DOUBLE_EQ(par.forward_lean, seq.forward_lean);
    EXPECT_DOUBLE_EQ(par.left_right_symmetry, seq.left_right_symmetry);
    EXPECT_EQ(par.center_of_gravity, seq.center_of_gravity);
    EXPECT_EQ(par.joint_angles, seq.joint_angles);
}

TEST_F(MetricsPipelineTest, ParallelIsolatesFailures) {
    PipelineConfig parallel_cfg;
    parallel_cfg.parallel = true;
    auto calcs = create_default_calculators(profile, parallel_cfg.calculator);
    calcs.insert(calcs.begin(), std::make_unique<ExplodingCalculator>(profile, CalculatorParams{}));
    MetricsPipeline pipeline(profile, parallel_cfg, std::move(calcs));

    PipelineReport report = pipeline.run_detailed(frames);
    ASSERT_EQ(report.failures.size(), 1u);
    EXPECT_DOUBLE_EQ(report.metrics.left_right_symmetry, 1.0);
}

TEST_F(MetricsPipelineTest, ThreadCapRunsRemainingCalculatorsInline) {
    PipelineConfig capped;
    capped.parallel = true;
    capped.max_threads = 2;
    auto calcs = create_default_calculators(profile, capped.calculator);
    calcs.push_back(std::make_unique<ExplodingCalculator>(profile, CalculatorParams{}));
    MetricsPipeline pipeline(profile, capped, std::move(calcs));

    PipelineReport report = pipeline.run_detailed(frames);
    RunningMetrics seq = MetricsPipeline(profile).run(frames);

    ASSERT_EQ(report.failures.size(), 1u);
    EXPECT_EQ(report.failures[0].calculator, "exploding");
    EXPECT_DOUBLE_EQ(report.metrics.cadence, seq.cadence);
    EXPECT_DOUBLE_EQ(report.metrics.stride_length, seq.stride_length);
    EXPECT_DOUBLE_EQ(report.metrics.flight_time, seq.flight_time);
    EXPECT_EQ(report.metrics.joint_angles, seq.joint_angles);
}

TEST_F(MetricsPipelineTest, RejectsProfileOutsideAcceptedRange) {
    RunnerProfile negative = profile;
    negative.height_cm = -170;
    EXPECT_THROW(MetricsPipeline pipeline(negative), std::invalid_argument);

    RunnerProfile zero = profile;
    zero.height_cm = 0;
    EXPECT_THROW(MetricsPipeline pipeline(zero), std::invalid_argument);
}
