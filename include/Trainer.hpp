#pragma once
//
// Created by moinshaikh on 3/7/26.
//

#ifndef POLEBALANCER_TRAINER_HPP
#define POLEBALANCER_TRAINER_HPP

#include<cstdint>
#include<vector>

#include"Algorithms/DQN.hpp"
#include"Config.hpp"
#include"Environment.hpp"
#include"EpisodeLog.hpp"
#include"Exploration/EpsilonGreedy.hpp"
#include"Model/ValueEstimator.hpp"
#include"ReplayBuffer.hpp"

namespace PoleBalancer
{
    /**
     * @brief Counts consecutive truncated episodes
     *
     * A truncated episode directly following the previous truncated one extends
     * the streak, a truncated episode after a gap starts a new streak of one and
     * an episode ending by termination resets it to zero.
     */
    class TruncationStreak
    {
    private:
        int threshold;
        int length;
        int lastTruncatedEpisode;

    public:
        /** @param threshold Streak length that may be reached without stopping */
        explicit TruncationStreak(int threshold);

        /**
         * @brief Records how an episode ended
         *
         * @param episode Zero-based episode index, increasing between calls
         * @param truncated True if the episode was truncated rather than terminated
         * @return True once the streak exceeds the threshold
         */
        bool observe(int episode, bool truncated);

        inline int getLength() const
        {
            return length;
        }
    };

    struct TrainingResult
    {
        std::vector<int64_t> episodeDurations; /**< Steps per completed episode */
        int episodesRun;                       /**< Number of episodes played */
        int64_t totalSteps;                    /**< Environment steps over all episodes */
        bool earlyStopped;                     /**< Stopped by the truncation streak */
    };

    /**
     * @brief Episodic DQN training loop
     *
     * Every environment step the trainer selects an action epsilon-greedily,
     * stores the resulting transition and runs one learning update. The replay
     * buffer, the exploration schedule and the episode log belong to the
     * trainer; network parameters are only written by the DQN.
     *
     * Training ends after the episode budget or once more than
     * `earlyStoppingThreshold` consecutive episodes were truncated, i.e. the
     * pole stayed up for the whole time limit that many times in a row.
     */
    class Trainer
    {
    private:
        Environment &environment;
        ValueEstimator &estimator;
        DQN &algorithm;
        Hyperparameters hyperparameters;
        ReplayBuffer replayBuffer;
        EpsilonGreedy explorer;
        EpisodeLog episodeLog;
        TruncationStreak truncationStreak;
        int64_t totalSteps;

        torch::Tensor toState(const torch::Tensor &observation) const;

    public:
        /**
         * @brief Checks the environment and the learner against the configuration
         *
         * Actions are selected with the learner's own estimator, so the
         * networks that act are the networks that learn.
         *
         * @throws std::invalid_argument if the hyperparameters are invalid, the
         *         action space is not discrete, the action count or observation
         *         size differ from the estimator's, or the learner was built with
         *         a batch size, gamma, tau, learning rate, gradient clip value or
         *         hidden size other than the configured ones
         */
        Trainer(Environment &environment,
                DQN &algorithm,
                const Hyperparameters &hyperparameters);

        /** @brief Plays and learns until the episode budget or early stopping */
        TrainingResult run();

        /**
         * @brief Greedy roll-outs without exploration or learning
         *
         * @param numEpisodes Episodes to play
         * @return Duration of each episode
         */
        std::vector<int64_t> evaluate(int numEpisodes);

        inline const EpisodeLog &getEpisodeLog() const
        {
            return episodeLog;
        }

        inline const ReplayBuffer &getReplayBuffer() const
        {
            return replayBuffer;
        }

        inline const EpsilonGreedy &getExplorer() const
        {
            return explorer;
        }
    };
}

#endif //POLEBALANCER_TRAINER_HPP
