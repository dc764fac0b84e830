//
// Created by moinshaikh on 3/6/26.
//

#include<cmath>
#include<stdexcept>
#include<string>

#include<spdlog/spdlog.h>

#include"../include/RewardShaping.hpp"

#include<doctest/doctest.h>

namespace PoleBalancer
{
    float shapeReward(const torch::Tensor &observation, double singularityEpsilon)
    {
        auto flat = observation.reshape({-1});
        if (flat.numel() < 3)
        {
            throw std::invalid_argument("Reward shaping needs an observation of at least 3 elements, got " +
                                        std::to_string(flat.numel()));
        }
        const double position = flat[0].item<double>();
        const double angle = flat[2].item<double>();

        double denominator = 1.0 - std::abs(position);
        if (std::abs(denominator) < singularityEpsilon)
        {
            spdlog::warn("Cart position {} is at the reward singularity, clamping", position);
            denominator = std::copysign(singularityEpsilon, denominator);
        }
        return static_cast<float>(1.0 / denominator - std::abs(angle));
    }

    ShapedRewardEnvironment::ShapedRewardEnvironment(Environment &environment, double singularityEpsilon) :
    environment(environment),
    singularityEpsilon(singularityEpsilon)
    {
        if (!(singularityEpsilon > 0))
        {
            throw std::invalid_argument("Reward singularity epsilon must be positive, got " +
                                        std::to_string(singularityEpsilon));
        }
    }

    ResetResult ShapedRewardEnvironment::reset()
    {
        return environment.reset();
    }

    StepResult ShapedRewardEnvironment::step(ActionId action)
    {
        auto result = environment.step(action);
        result.reward = shapeReward(result.observation, singularityEpsilon);
        return result;
    }

    // Returns a fixed observation and reward 1 on every step
    class ConstantEnvironment : public Environment
    {
    public:
        torch::Tensor observation;

        explicit ConstantEnvironment(torch::Tensor observation) : observation(observation) {}

        ResetResult reset() override
        {
            return {observation, {}};
        }

        StepResult step(ActionId) override
        {
            return {observation, 1, false, true, {{"steps", 1}}};
        }

        ActionSpace getActionSpace() const override
        {
            return {"Discrete", {2}};
        }

        int64_t getObservationSize() const override
        {
            return 4;
        }
    };

    TEST_CASE("shapeReward()")
    {
        SUBCASE("Centred upright state scores one")
        {
            CHECK(shapeReward(torch::zeros({4})) == doctest::Approx(1.0));
        }

        SUBCASE("Off-centre cart and tilted pole")
        {
            auto observation = torch::tensor({0.5f, 0.f, 0.3f, 0.f});

            CHECK(shapeReward(observation) == doctest::Approx(1.7));
        }

        SUBCASE("Velocities do not contribute")
        {
            auto observation = torch::tensor({-0.5f, 3.f, -0.3f, -2.f});

            CHECK(shapeReward(observation) == doctest::Approx(1.7));
        }

        SUBCASE("Denominator is clamped at the singularity")
        {
            CHECK(shapeReward(torch::tensor({1.f, 0.f, 0.f, 0.f})) == doctest::Approx(1e6));
            CHECK(std::isfinite(shapeReward(torch::tensor({-1.f, 0.f, 0.5f, 0.f}))));
            CHECK(shapeReward(torch::tensor({1.f, 0.f, 0.f, 0.f}), 1e-2) == doctest::Approx(100));
        }

        SUBCASE("Beyond the singularity the reward turns negative")
        {
            CHECK(shapeReward(torch::tensor({2.f, 0.f, 0.f, 0.f})) == doctest::Approx(-1.0));
        }

        SUBCASE("Short observations throw")
        {
            CHECK_THROWS_AS(shapeReward(torch::zeros({2})), std::invalid_argument);
        }
    }

    TEST_CASE("ShapedRewardEnvironment")
    {
        ConstantEnvironment inner(torch::tensor({0.5f, 0.f, 0.3f, 0.f}));
        ShapedRewardEnvironment environment(inner);

        auto result = environment.step(0);

        CHECK(result.reward == doctest::Approx(1.7));
        CHECK(!result.terminated);
        CHECK(result.truncated);
        CHECK(result.info.at("steps") == 1);
        CHECK(torch::equal(environment.reset().observation, inner.observation));
        CHECK(environment.getObservationSize() == 4);
        CHECK(environment.getActionSpace().shape[0] == 2);
    }
}
