#pragma once

//
// Created by moinshaikh on 1/28/26.
//

#ifndef POLEBALANCER_ALGORITHM_HPP
#define POLEBALANCER_ALGORITHM_HPP
#include<string>
#include<vector>


#include"../ReplayBuffer.hpp"

namespace PoleBalancer
{
    /**
     * @brief Data structure for storing algorithm training metrics
     *
     * `UpdateDatum` encapsulates a single scalar metric produced during a training
     * update step. Each metric is identified by a name (for logging and monitoring)
     * and contains a floating-point value representing the measurement.
     *
     * Typical uses:
     * - Temporal-difference loss of the value network
     * - Mean predicted Q-value of the sampled batch
     *
     * Multiple `UpdateDatum` objects are collected in a vector and returned from
     * Algorithms::update(). An empty vector means no optimisation step was taken.
     */
    struct UpdateDatum
    {
        std::string name; /**< Identifier for this metric (e.g., "Loss", "Mean Q"). */
        float value;      /**< Scalar metric value. */
    };

    /**
     * @brief Abstract base class for off-policy value-based learning algorithms
     *
     * The algorithm pattern:
     * 1. Interact with the environment (managed by the Trainer)
     * 2. Push every transition into a ReplayBuffer
     * 3. Call update() with the buffer once per environment step
     * 4. Receive training metrics for monitoring
     *
     * Subclasses decide how a minibatch is drawn from the buffer and how the
     * networks are updated from it.
     */
    class Algorithms
    {
    public:
        virtual ~Algorithms() = 0;

        /**
         * @brief Performs a single optimisation step from replayed experience
         *
         * @param replayBuffer Experience to sample a minibatch from
         * @param decayLevel Learning-rate multiplier in (0, 1]; 1 keeps the base rate
         *
         * @return Training metrics of this step, empty when the buffer does not
         *         yet hold enough transitions to learn from
         */
        virtual std::vector<UpdateDatum> update(ReplayBuffer &replayBuffer, float decayLevel = 1) = 0;
    };
    inline Algorithms::~Algorithms() {}
}


#endif //POLEBALANCER_ALGORITHM_HPP
