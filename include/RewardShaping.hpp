#pragma once
//
// Created by moinshaikh on 3/6/26.
//

#ifndef POLEBALANCER_REWARDSHAPING_HPP
#define POLEBALANCER_REWARDSHAPING_HPP

#include<torch/torch.h>

#include"Environment.hpp"

namespace PoleBalancer
{
    /**
     * @brief Dense reward computed from a cart-pole observation
     *
     * ```
     * r = 1 / (1 - |x|) - |θ|
     * ```
     *
     * where x = observation[0] (cart position) and θ = observation[2] (pole
     * angle). The environment's own reward is discarded. Near |x| = 1 the first
     * term diverges; a denominator closer to zero than `singularityEpsilon` is
     * replaced by ±singularityEpsilon with its sign kept, and a warning is
     * logged.
     *
     * @param observation Observation with at least three elements
     * @param singularityEpsilon Smallest denominator magnitude allowed, positive
     *
     * @throws std::invalid_argument if the observation has fewer than three elements
     */
    float shapeReward(const torch::Tensor &observation, double singularityEpsilon = 1e-6);

    /**
     * @brief Environment decorator replacing step rewards by shapeReward()
     *
     * Reset results and termination flags pass through unchanged. The wrapped
     * environment must outlive the wrapper.
     */
    class ShapedRewardEnvironment : public Environment
    {
    private:
        Environment &environment;
        double singularityEpsilon;

    public:
        explicit ShapedRewardEnvironment(Environment &environment, double singularityEpsilon = 1e-6);

        ResetResult reset() override;
        StepResult step(ActionId action) override;

        ActionSpace getActionSpace() const override
        {
            return environment.getActionSpace();
        }

        int64_t getObservationSize() const override
        {
            return environment.getObservationSize();
        }
    };
}

#endif //POLEBALANCER_REWARDSHAPING_HPP
