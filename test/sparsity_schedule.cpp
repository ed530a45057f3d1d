#include <cmath>
#include <cstdint>
#include <limits>

#include <gtest/gtest.h>

#include "support.hpp"

namespace {
    std::unique_ptr<Shear::Sparsity::Schedule> polynomial(std::int64_t begin, std::int64_t end, double final_sparsity, double power = 3.0)
    {
        return Shear::Sparsity::Details::build_schedule(Shear::Sparsity::Descriptor{Shear::Sparsity::PolynomialDecay(
            {.begin_step = begin, .end_step = end, .initial_sparsity = 0.0, .final_sparsity = final_sparsity, .power = power})});
    }
}

TEST(sparsity_schedule, zero_before_start_step)
{
    const auto schedule = polynomial(100, 1100, 0.75);
    EXPECT_DOUBLE_EQ(schedule->target(0), 0.0);
    EXPECT_DOUBLE_EQ(schedule->target(99), 0.0);
}

TEST(sparsity_schedule, reaches_and_holds_max_after_end_step)
{
    const auto schedule = polynomial(100, 1100, 0.75);
    EXPECT_DOUBLE_EQ(schedule->target(1100), 0.75);
    EXPECT_DOUBLE_EQ(schedule->target(5000), 0.75);
    EXPECT_DOUBLE_EQ(schedule->target(std::numeric_limits<std::int64_t>::max()), 0.75);
}

TEST(sparsity_schedule, monotonic_and_bounded_across_the_ramp)
{
    for (const double power : {0.5, 1.0, 2.0, 3.0, 7.0}) {
        const auto schedule = polynomial(10, 510, 0.9, power);
        double previous = schedule->target(0);
        for (std::int64_t step = 1; step <= 600; ++step) {
            const double current = schedule->target(step);
            EXPECT_GE(current, previous) << "power " << power << " step " << step;
            EXPECT_GE(current, 0.0);
            EXPECT_LE(current, 0.9);
            previous = current;
        }
    }
}

TEST(sparsity_schedule, linear_ramp_midpoint)
{
    const auto schedule = polynomial(0, 100, 0.5, 1.0);
    EXPECT_NEAR(schedule->target(50), 0.25, 1e-12);
    EXPECT_NEAR(schedule->target(25), 0.125, 1e-12);
}

TEST(sparsity_schedule, cubic_ramp_front_loads_sparsity)
{
    const auto schedule = polynomial(0, 100, 0.5, 3.0);
    // 0.5 * (1 - 0.5^3)
    EXPECT_NEAR(schedule->target(50), 0.4375, 1e-12);
}

TEST(sparsity_schedule, pure_function_of_step)
{
    const auto schedule = polynomial(0, 1000, 0.6);
    const double first = schedule->target(437);
    (void)schedule->target(999);
    (void)schedule->target(3);
    EXPECT_DOUBLE_EQ(schedule->target(437), first);

    const auto replica = polynomial(0, 1000, 0.6);
    EXPECT_DOUBLE_EQ(replica->target(437), first);
}

TEST(sparsity_schedule, begin_equal_to_end_is_a_step_function)
{
    const auto schedule = polynomial(50, 50, 0.4);
    EXPECT_DOUBLE_EQ(schedule->target(49), 0.0);
    EXPECT_DOUBLE_EQ(schedule->target(50), 0.4);
}

TEST(sparsity_schedule, constant_sparsity)
{
    const auto schedule = Shear::Sparsity::Details::build_schedule(
        Shear::Sparsity::Descriptor{Shear::Sparsity::ConstantSparsity({.begin_step = 20, .target_sparsity = 0.3})});
    EXPECT_DOUBLE_EQ(schedule->target(19), 0.0);
    EXPECT_DOUBLE_EQ(schedule->target(20), 0.3);
    EXPECT_DOUBLE_EQ(schedule->target(10'000), 0.3);
    EXPECT_DOUBLE_EQ(schedule->final_sparsity(), 0.3);
}

TEST(sparsity_schedule, rejects_invalid_configuration)
{
    using Shear::ScheduleConfigError;
    EXPECT_THROW(polynomial(100, 50, 0.5), ScheduleConfigError);
    EXPECT_THROW(polynomial(-1, 50, 0.5), ScheduleConfigError);
    EXPECT_THROW(polynomial(0, 50, 1.5), ScheduleConfigError);
    EXPECT_THROW(polynomial(0, 50, -0.1), ScheduleConfigError);
    EXPECT_THROW(polynomial(0, 50, std::nan("")), ScheduleConfigError);
    EXPECT_THROW(polynomial(0, 50, 0.5, 0.0), ScheduleConfigError);

    EXPECT_THROW((void)Shear::Sparsity::Details::PolynomialDecaySchedule(
                     {.begin_step = 0, .end_step = 10, .initial_sparsity = 0.6, .final_sparsity = 0.5}),
                 ScheduleConfigError);
    EXPECT_THROW((void)Shear::Sparsity::Details::ConstantSparsitySchedule({.begin_step = 0, .target_sparsity = 2.0}),
                 ScheduleConfigError);
}

TEST(sparsity_schedule, config_errors_are_invalid_arguments)
{
    EXPECT_THROW(polynomial(10, 0, 0.5), std::invalid_argument);
}
