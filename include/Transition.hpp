#pragma once
//
// Created by moinshaikh on 3/2/26.
//

#ifndef POLEBALANCER_TRANSITION_HPP
#define POLEBALANCER_TRANSITION_HPP

#include<variant>
#include<vector>

#include<torch/torch.h>

#include"Space.hpp"

namespace PoleBalancer
{
    /** @brief Marks a transition whose episode ended by true termination */
    struct Terminal
    {
    };

    /** @brief Carries the observation reached by a non-terminal transition */
    struct Continuing
    {
        torch::Tensor state;
    };

    /**
     * @brief Successor of a transition
     *
     * A truncated episode still produces a Continuing successor: only a true
     * terminal condition removes the bootstrap term from the TD target.
     */
    using NextState = std::variant<Terminal, Continuing>;

    /**
     * @brief One observed (state, action, next state, reward) tuple
     *
     * `Transition` is an immutable record stored by the ReplayBuffer. States are
     * kept as one dimensional float tensors of the observation size reported by
     * the environment.
     */
    class Transition
    {
    private:
        torch::Tensor state;   /**< Observation the action was taken in, shape [observation_size] */
        ActionId action;       /**< Action taken */
        NextState nextState;   /**< Terminal or the observation reached */
        float reward;          /**< Reward received for the step */

    public:
        /**
         * @brief Builds a transition and checks its dimensionality
         *
         * Observations of shape [1, observation_size] are flattened.
         *
         * @param state Observation the action was taken in
         * @param action Action taken
         * @param nextState Terminal or the observation reached
         * @param reward Reward received
         *
         * @throws std::invalid_argument if a continuing next state does not have
         *         the same number of elements as the state
         */
        Transition(torch::Tensor state, ActionId action, NextState nextState, float reward);

        inline const torch::Tensor &getState() const
        {
            return state;
        }

        inline ActionId getAction() const
        {
            return action;
        }

        inline const NextState &getNextState() const
        {
            return nextState;
        }

        inline float getReward() const
        {
            return reward;
        }

        inline bool isTerminal() const
        {
            return std::holds_alternative<Terminal>(nextState);
        }
    };

    /**
     * @brief Column-wise view of a sampled batch of transitions
     *
     * Produced by collate() and consumed by the learning update.
     */
    struct TransitionBatch
    {
        torch::Tensor states;             /**< [B, observation_size] float */
        torch::Tensor actions;            /**< [B, 1] long, ready for gather() */
        torch::Tensor rewards;            /**< [B] float */
        torch::Tensor nonFinalMask;       /**< [B] bool, true where the next state exists */
        torch::Tensor nonFinalNextStates; /**< [N, observation_size] float, N = nonFinalMask.sum() */
    };

    /**
     * @brief Transposes a list of transitions into a TransitionBatch
     *
     * @param transitions Non-empty list of transitions sharing one observation size
     * @param device Device the batch tensors are moved to
     *
     * @throws std::invalid_argument if the list is empty or the observation sizes differ
     */
    TransitionBatch collate(const std::vector<Transition> &transitions, torch::Device device);
}

#endif //POLEBALANCER_TRANSITION_HPP
