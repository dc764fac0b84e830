#pragma once

//
// Created by moinshaikh on 3/5/26.
//

#ifndef POLEBALANCER_DQN_HPP

#define POLEBALANCER_DQN_HPP

#include<cstddef>
#include<memory>
#include<vector>

#include"Algorithm.hpp"
#include"../Config.hpp"
#include"../Model/ValueEstimator.hpp"
#include"../Transition.hpp"
#include<torch/torch.h>


namespace PoleBalancer {
    class ReplayBuffer;

    /**
     * @class DQN
     * @brief Deep Q-Network update with a softly tracking target network.
     *
     * Each call to update() samples a minibatch from the replay buffer and
     * regresses the policy network's Q(s, a) onto the one-step TD target
     *
     * ```
     * y = r + γ · max_a' Q_target(s', a')   for continuing transitions
     * y = r                                  for terminal transitions
     * ```
     *
     * with the Huber (smooth L1) loss. Gradients are clipped elementwise to
     * [-gradClipValue, gradClipValue] before an AdamW step with AMSGrad, after
     * which the target network is blended toward the policy network with rate τ.
     *
     * @see Algorithms - Base class defining the update interface
    */
    class DQN : public Algorithms
    {
    private:
        ValueEstimator &estimator;                        ///< Policy/target network pair being trained
        size_t batchSize;                                 ///< Transitions per minibatch
        float gamma;                                      ///< Discount factor of the TD target
        float tau;                                        ///< Soft target update rate
        float gradClipValue;                              ///< Elementwise gradient clip bound
        float originalLearningRate;                       ///< Base learning rate; decayLevel scales it
        std::unique_ptr<torch::optim::AdamW> optimizer;   ///< AdamW (AMSGrad) over the policy parameters only
    public:
        /**
         * @brief Constructs a DQN learner over an existing estimator.
         *
         * @param estimator Policy/target pair; must outlive the learner
         * @param batchSize Transitions sampled per update, positive
         * @param gamma Discount factor in [0, 1]
         * @param tau Soft update rate in (0, 1]
         * @param learningRate AdamW step size, positive
         * @param gradClipValue Elementwise gradient clip bound, positive
         *
         * @throws std::invalid_argument if any hyperparameter is out of range
         */
        DQN(ValueEstimator &estimator,
            size_t batchSize,
            float gamma,
            float tau,
            float learningRate,
            float gradClipValue = 100);

        /**
         * @brief Constructs a DQN learner from a training configuration.
         *
         * Uses batchSize, gamma, tau, learningRate and gradClipValue.
         */
        DQN(ValueEstimator &estimator, const Hyperparameters &hyperparameters);

        /**
         * @brief Performs one optimisation step and one soft target update.
         *
         * Does nothing and returns an empty vector while the buffer holds fewer
         * transitions than a batch.
         *
         * @param replayBuffer Experience to sample from
         * @param decayLevel Learning-rate multiplier: lr = learningRate * decayLevel
         *
         * @return "Loss" (Huber loss of the batch) and "Mean Q" (mean predicted
         *         Q-value of the taken actions)
         */
        std::vector<UpdateDatum> update(ReplayBuffer &replayBuffer, float decayLevel = 1) override;

        /**
         * @brief One-step TD targets of a batch, without gradient
         *
         * @param batch Collated transitions
         * @return Tensor of shape [B]
         */
        torch::Tensor computeTdTargets(const TransitionBatch &batch);

        /** @return Learning rate currently set on the optimiser */
        double currentLearningRate() const;

        inline size_t getBatchSize() const
        {
            return batchSize;
        }

        inline float getGamma() const
        {
            return gamma;
        }

        inline float getTau() const
        {
            return tau;
        }

        inline float getGradClipValue() const
        {
            return gradClipValue;
        }

        /** @return Learning rate before decay */
        inline float getBaseLearningRate() const
        {
            return originalLearningRate;
        }

        inline ValueEstimator &getEstimator()
        {
            return estimator;
        }
    };
};






#endif //POLEBALANCER_DQN_HPP
