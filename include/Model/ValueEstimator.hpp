//
// Created by moinshaikh on 3/3/26.
//

#ifndef POLEBALANCER_VALUEESTIMATOR_HPP
#define POLEBALANCER_VALUEESTIMATOR_HPP

#include<utility>
#include<vector>

#include<torch/torch.h>

#include"QNetwork.hpp"
#include"../Space.hpp"

namespace PoleBalancer
{
    /**
     * @brief Policy/target Q-network pair and their synchronisation
     *
     * The policy network selects actions and receives gradient updates. The
     * target network supplies the bootstrapped values of the TD target and is
     * never optimised directly: it only moves toward the policy network through
     * an exponential moving average applied after every optimisation step,
     *
     * ```
     * θ_target ← τ · θ_policy + (1 - τ) · θ_target
     * ```
     *
     * The parameter tensors of both networks are paired once, at construction,
     * into an ordered list that soft and hard updates walk in lock-step.
     * Construction also copies the policy parameters into the target network so
     * both start identical.
     */
    class ValueEstimator
    {
    private:
        QNetwork policyNetwork;   /**< Network trained by the optimiser */
        QNetwork targetNetwork;   /**< Slowly tracking copy used for TD targets */
        std::vector<std::pair<torch::Tensor, torch::Tensor>> parameterPairs; /**< (policy, target) tensors in registration order */
        torch::Device device;     /**< Device holding both networks */

    public:
        /**
         * @brief Pairs two existing networks
         *
         * @param policyNetwork Network to train
         * @param targetNetwork Network to track it; its parameters are
         *                      overwritten by the policy parameters
         * @param device Device both networks are moved to
         *
         * @throws std::invalid_argument if the two networks do not expose the same
         *         parameter names and shapes
         */
        ValueEstimator(QNetwork policyNetwork, QNetwork targetNetwork, torch::Device device = torch::kCPU);

        /**
         * @brief Builds a fresh policy/target pair of identical architecture
         *
         * @param numInputs Observation size
         * @param numActions Number of discrete actions
         * @param hiddenSize Width of the hidden layers
         * @param device Device both networks live on
         */
        ValueEstimator(int64_t numInputs, int64_t numActions, int64_t hiddenSize, torch::Device device = torch::kCPU);

        /**
         * @brief Q-values of the policy network, with gradient tracking
         *
         * @param states Observations of shape [batch_size, num_inputs]
         * @return Q-values of shape [batch_size, num_actions]
         */
        torch::Tensor evaluatePolicy(const torch::Tensor &states);

        /**
         * @brief Q-values of the target network, always detached
         *
         * @param states Observations of shape [batch_size, num_inputs]
         * @return Q-values of shape [batch_size, num_actions]
         */
        torch::Tensor evaluateTarget(const torch::Tensor &states);

        /**
         * @brief Greedy action of the policy network for one state
         *
         * Ties resolve to the lowest action index.
         *
         * @param state Observation of shape [num_inputs] or [1, num_inputs]
         */
        ActionId bestAction(const torch::Tensor &state);

        /**
         * @brief Blends policy parameters into target parameters
         *
         * @param tau Blend rate in (0, 1]; 1 copies the policy exactly
         *
         * @throws std::invalid_argument if tau is outside (0, 1]
         */
        void softUpdate(double tau);

        /**
         * @brief Copies the policy parameters into the target parameters
         */
        void hardUpdate();

        /** @return Trainable parameters (the policy network's) for optimiser attachment */
        std::vector<torch::Tensor> policyParameters() const;

        inline QNetwork &getPolicyNetwork()
        {
            return policyNetwork;
        }

        inline QNetwork &getTargetNetwork()
        {
            return targetNetwork;
        }

        inline int64_t getNumActions() const
        {
            return policyNetwork->getNumActions();
        }

        inline int64_t getNumInputs() const
        {
            return policyNetwork->getNumInputs();
        }

        inline int64_t getHiddenSize() const
        {
            return policyNetwork->getHiddenSize();
        }

        inline const torch::Device &getDevice() const
        {
            return device;
        }
    };
}

#endif //POLEBALANCER_VALUEESTIMATOR_HPP
