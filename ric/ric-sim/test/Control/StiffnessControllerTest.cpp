// Ticket: 0004_adaptive_contact_stiffness

#include <gtest/gtest.h>

#include <limits>

#include "ric-sim/src/Control/StiffnessController.hpp"

using namespace ric_sim;

namespace
{
constexpr double kContactLength{0.1};
constexpr double kInitialStiffness{1e5};
}  // namespace

// ============================================================================
// Schedule factor
// ============================================================================

TEST(StiffnessController, ScheduleFactor_RelaxesWhenSeparating)
{
  EXPECT_DOUBLE_EQ(
    StiffnessController::scheduleFactor(0.2, 0.15, kContactLength), 0.999);
}

TEST(StiffnessController, ScheduleFactor_SeparatingWithinMargin_Holds)
{
  EXPECT_DOUBLE_EQ(
    StiffnessController::scheduleFactor(0.103, 0.101, kContactLength), 1.0);
}

TEST(StiffnessController, ScheduleFactor_ApproachingOutsideContact_Holds)
{
  EXPECT_DOUBLE_EQ(
    StiffnessController::scheduleFactor(0.15, 0.2, kContactLength), 1.0);
}

TEST(StiffnessController, ScheduleFactor_PenetrationBands)
{
  EXPECT_DOUBLE_EQ(
    StiffnessController::scheduleFactor(0.090, 0.1, kContactLength), 1.01);
  EXPECT_DOUBLE_EQ(
    StiffnessController::scheduleFactor(0.097, 0.1, kContactLength), 1.005);
  EXPECT_DOUBLE_EQ(
    StiffnessController::scheduleFactor(0.0985e0, 0.1, kContactLength), 1.003);
  EXPECT_DOUBLE_EQ(
    StiffnessController::scheduleFactor(0.09995, 0.1, kContactLength), 1.001);
}

TEST(StiffnessController, ScheduleFactor_PenetratingButReceding_Holds)
{
  EXPECT_DOUBLE_EQ(
    StiffnessController::scheduleFactor(0.09, 0.08, kContactLength), 1.0);
}

TEST(StiffnessController, ScheduleFactor_Unchanged_Holds)
{
  EXPECT_DOUBLE_EQ(
    StiffnessController::scheduleFactor(0.09, 0.09, kContactLength), 1.0);
}

// ============================================================================
// Update
// ============================================================================

TEST(StiffnessController, Update_CompoundsFactors)
{
  StiffnessController controller{kInitialStiffness, kContactLength};
  controller.update(0.09, 0.1);
  controller.update(0.08, 0.09);
  EXPECT_NEAR(controller.getStiffness(), kInitialStiffness * 1.01 * 1.01, 1e-6);

  controller.update(0.3, 0.2);
  EXPECT_NEAR(controller.getStiffness(),
              kInitialStiffness * 1.01 * 1.01 * 0.999,
              1e-6);
}

TEST(StiffnessController, Update_NonFiniteDistance_Unchanged)
{
  StiffnessController controller{kInitialStiffness, kContactLength};
  const double inf = std::numeric_limits<double>::infinity();
  EXPECT_DOUBLE_EQ(controller.update(inf, 0.05), kInitialStiffness);
  EXPECT_DOUBLE_EQ(controller.update(0.05, inf), kInitialStiffness);
  EXPECT_DOUBLE_EQ(
    controller.update(std::numeric_limits<double>::quiet_NaN(), 0.05),
    kInitialStiffness);
}

TEST(StiffnessController, Update_RespectsLimits)
{
  StiffnessLimits limits;
  limits.floor = 0.9995 * kInitialStiffness;
  limits.ceiling = 1.015 * kInitialStiffness;
  StiffnessController controller{kInitialStiffness, kContactLength, limits};

  controller.update(0.09, 0.1);
  controller.update(0.08, 0.09);
  EXPECT_DOUBLE_EQ(controller.getStiffness(), 1.015 * kInitialStiffness);

  StiffnessController relaxing{kInitialStiffness, kContactLength, limits};
  relaxing.update(0.3, 0.2);
  relaxing.update(0.4, 0.3);
  EXPECT_DOUBLE_EQ(relaxing.getStiffness(), 0.9995 * kInitialStiffness);
}

TEST(StiffnessController, Update_NoLimitsByDefault)
{
  StiffnessController controller{kInitialStiffness, kContactLength};
  EXPECT_FALSE(controller.getLimits().floor.has_value());
  EXPECT_FALSE(controller.getLimits().ceiling.has_value());

  for (int i = 0; i < 10; ++i)
  {
    controller.update(0.05, 0.06);
  }
  EXPECT_GT(controller.getStiffness(), 1.1 * kInitialStiffness);
}

TEST(StiffnessController, InvalidParameters_Throw)
{
  EXPECT_THROW((StiffnessController{0.0, kContactLength}), std::invalid_argument);
  EXPECT_THROW((StiffnessController{kInitialStiffness, -1.0}),
               std::invalid_argument);

  StiffnessLimits inverted;
  inverted.floor = 2.0;
  inverted.ceiling = 1.0;
  EXPECT_THROW((StiffnessController{kInitialStiffness, kContactLength, inverted}),
               std::invalid_argument);
}

TEST(StiffnessController, MonotonicResponse_ToDistanceSequences)
{
  StiffnessController separating{kInitialStiffness, kContactLength};
  double previous = 0.11;
  double gain = separating.getStiffness();
  for (double current = 0.12; current < 0.3; current += 0.02)
  {
    separating.update(current, previous);
    EXPECT_LE(separating.getStiffness(), gain);
    gain = separating.getStiffness();
    previous = current;
  }

  StiffnessController approaching{kInitialStiffness, kContactLength};
  previous = 0.12;
  gain = approaching.getStiffness();
  for (double current = 0.11; current > 0.05; current -= 0.005)
  {
    approaching.update(current, previous);
    EXPECT_GE(approaching.getStiffness(), gain);
    gain = approaching.getStiffness();
    previous = current;
  }
  EXPECT_GT(approaching.getStiffness(), kInitialStiffness);
}
