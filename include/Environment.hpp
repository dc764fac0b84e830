#pragma once
//
// Created by moinshaikh on 3/6/26.
//

#ifndef POLEBALANCER_ENVIRONMENT_HPP
#define POLEBALANCER_ENVIRONMENT_HPP

#include<string>
#include<unordered_map>

#include<torch/torch.h>

#include"Space.hpp"

namespace PoleBalancer
{
    /** @brief Auxiliary diagnostics returned alongside observations */
    using Info = std::unordered_map<std::string, float>;

    struct ResetResult
    {
        torch::Tensor observation; /**< Initial observation, shape [observation_size] */
        Info info;
    };

    struct StepResult
    {
        torch::Tensor observation; /**< Observation after the action, shape [observation_size] */
        float reward;              /**< Reward for the step */
        bool terminated;           /**< True terminal condition reached, no bootstrap */
        bool truncated;            /**< Episode cut by a time limit, still bootstrapped */
        Info info;
    };

    /**
     * @brief Episodic environment with a discrete action space
     *
     * Implementations own their simulator (local or remote). Calling step()
     * after an episode ended without a reset() is undefined and is never done
     * by the Trainer.
     */
    class Environment
    {
    public:
        virtual ~Environment() = 0;

        /** @brief Starts a new episode */
        virtual ResetResult reset() = 0;

        /**
         * @brief Advances the episode by one action
         *
         * @param action Action in [0, number of actions)
         */
        virtual StepResult step(ActionId action) = 0;

        virtual ActionSpace getActionSpace() const = 0;

        /** @return Number of elements in one observation */
        virtual int64_t getObservationSize() const = 0;
    };
    inline Environment::~Environment() {}
}

#endif //POLEBALANCER_ENVIRONMENT_HPP
