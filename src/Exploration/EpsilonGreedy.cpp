//
// Created by moinshaikh on 3/4/26.
//

#include<cmath>
#include<set>
#include<stdexcept>
#include<string>

#include"../../include/Exploration/EpsilonGreedy.hpp"

#include<doctest/doctest.h>

namespace PoleBalancer
{
    double EpsilonSchedule::at(int64_t step) const
    {
        return end + (start - end) * std::exp(-static_cast<double>(step) / decay);
    }

    EpsilonGreedy::EpsilonGreedy(EpsilonSchedule schedule, int64_t numActions) :
    schedule(schedule),
    numActions(numActions),
    stepsDone(0)
    {
        if (numActions <= 0)
        {
            throw std::invalid_argument("Epsilon-greedy selection needs at least one action, got " +
                                        std::to_string(numActions));
        }
        if (!(schedule.decay > 0))
        {
            throw std::invalid_argument("Epsilon decay must be positive, got " + std::to_string(schedule.decay));
        }
    }

    /**
     * @brief Epsilon-greedy selection.
     *
     * @details The exploration threshold is computed from the step count before it is incremented,
     * so the first call uses ε(0) = start. Both the uniform draw and the random action come from the
     * libtorch generator, which keeps whole training runs reproducible under torch::manual_seed().
     */
    ActionId EpsilonGreedy::selectAction(const torch::Tensor &state, ValueEstimator &estimator)
    {
        const double threshold = schedule.at(stepsDone);
        const double sample = torch::rand({1}, torch::kDouble).item<double>();
        ++stepsDone;

        if (sample > threshold)
        {
            return estimator.bestAction(state);
        }
        return torch::randint(numActions, {1}, torch::TensorOptions(torch::kLong)).item<int64_t>();
    }

    TEST_CASE("EpsilonSchedule")
    {
        EpsilonSchedule schedule{0.9, 0.05, 1000};

        SUBCASE("Starts at the initial rate")
        {
            CHECK(schedule.at(0) == doctest::Approx(0.9));
        }

        SUBCASE("Decreases strictly")
        {
            for (int64_t step = 0; step < 5000; step += 50)
            {
                CHECK(schedule.at(step + 1) < schedule.at(step));
            }
        }

        SUBCASE("Approaches the final rate from above")
        {
            CHECK(schedule.at(1000) == doctest::Approx(0.05 + 0.85 * std::exp(-1.0)));
            CHECK(schedule.at(20000) > 0.05);
            CHECK(schedule.at(20000) == doctest::Approx(0.05).epsilon(1e-6));
        }
    }

    TEST_CASE("EpsilonGreedy")
    {
        torch::manual_seed(0);
        ValueEstimator estimator(4, 3, 8);

        SUBCASE("Counter advances on every call")
        {
            EpsilonGreedy selector(EpsilonSchedule{0.9, 0.05, 1000}, 3);
            for (int i = 0; i < 10; ++i)
            {
                selector.selectAction(torch::rand({4}), estimator);
            }

            CHECK(selector.getStepsDone() == 10);
            CHECK(selector.currentEpsilon() == doctest::Approx(EpsilonSchedule{0.9, 0.05, 1000}.at(10)));
        }

        SUBCASE("Zero exploration always follows the policy")
        {
            EpsilonGreedy selector(EpsilonSchedule{0, 0, 1000}, 3);
            for (int i = 0; i < 20; ++i)
            {
                auto state = torch::rand({4});
                CHECK(selector.selectAction(state, estimator) == estimator.bestAction(state));
            }
        }

        SUBCASE("Full exploration covers every action")
        {
            EpsilonGreedy selector(EpsilonSchedule{1, 1, 1000}, 3);
            std::set<ActionId> seen;
            auto state = torch::rand({4});
            for (int i = 0; i < 200; ++i)
            {
                auto action = selector.selectAction(state, estimator);
                CHECK(action >= 0);
                CHECK(action < 3);
                seen.insert(action);
            }

            CHECK(seen.size() == 3);
        }

        SUBCASE("Invalid configuration throws")
        {
            CHECK_THROWS_AS(EpsilonGreedy(EpsilonSchedule{}, 0), std::invalid_argument);
            CHECK_THROWS_AS(EpsilonGreedy(EpsilonSchedule{0.9, 0.05, 0}, 2), std::invalid_argument);
        }
    }
}
