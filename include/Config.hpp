#pragma once
//
// Created by moinshaikh on 3/6/26.
//

#ifndef POLEBALANCER_CONFIG_HPP
#define POLEBALANCER_CONFIG_HPP

#include<cstddef>
#include<cstdint>

namespace PoleBalancer
{
    /**
     * @brief Training configuration
     *
     * Defaults reproduce the reference CartPole run.
     */
    struct Hyperparameters
    {
        size_t batchSize = 128;               /**< Transitions per optimisation step */
        float gamma = 0.8;                    /**< Discount factor */
        double epsStart = 0.9;                /**< Initial exploration rate */
        double epsEnd = 0.05;                 /**< Asymptotic exploration rate */
        double epsDecay = 1000;               /**< Exploration decay constant, in steps */
        float tau = 0.005;                    /**< Soft target update rate */
        float learningRate = 1e-4;            /**< AdamW learning rate */
        int earlyStoppingThreshold = 10;      /**< Stop once more than this many consecutive episodes truncate */
        size_t replayCapacity = 10000;        /**< Replay buffer size */
        int numEpisodes = 600;                /**< Episode budget */
        int64_t hiddenSize = 128;             /**< Width of the Q-network hidden layers */
        float gradClipValue = 100;            /**< Elementwise gradient clip bound */
        bool useLrDecay = false;              /**< Anneal the learning rate linearly over the episode budget */
        int logInterval = 10;                 /**< Episodes between progress logs */
        double rewardSingularityEpsilon = 1e-6; /**< Smallest |1 - |x|| the reward shaping divides by */
        int64_t maxEpisodeSteps = 0;          /**< Treat longer episodes as truncated, 0 disables */

        /**
         * @brief Checks every field for a usable value
         *
         * @throws std::invalid_argument naming the first offending field
         */
        void validate() const;

        /** @brief Writes every field to the info log */
        void log() const;
    };
}

#endif //POLEBALANCER_CONFIG_HPP
