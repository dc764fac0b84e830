//
// Created by moinshaikh on 3/4/26.
//

#ifndef POLEBALANCER_EPSILONGREEDY_HPP
#define POLEBALANCER_EPSILONGREEDY_HPP

#include<cstdint>

#include<torch/torch.h>

#include"../Model/ValueEstimator.hpp"
#include"../Space.hpp"

namespace PoleBalancer
{
    /**
     * @brief Exponentially decaying exploration rate
     *
     * ```
     * ε(t) = end + (start - end) · exp(-t / decay)
     * ```
     *
     * ε(0) equals `start` and ε(t) approaches `end` from above as t grows, never
     * reaching it.
     */
    struct EpsilonSchedule
    {
        double start = 0.9;   /**< Exploration rate at step 0 */
        double end = 0.05;    /**< Asymptotic exploration rate */
        double decay = 1000;  /**< Steps for the gap to shrink by a factor e */

        /** @return Exploration rate after `step` action selections */
        double at(int64_t step) const;
    };

    /**
     * @brief Epsilon-greedy action selection over a decaying schedule
     *
     * With probability ε a uniformly random action is returned, otherwise the
     * policy network's greedy action. The schedule advances once per call,
     * explore or exploit, so ε decays per environment step rather than per
     * episode.
     *
     * The step counter is a plain member: the owning Trainer decides its
     * lifetime, one counter per training run.
     */
    class EpsilonGreedy
    {
    private:
        EpsilonSchedule schedule;   /**< Decay parameters */
        int64_t numActions;         /**< Size of the legal action set [0, numActions) */
        int64_t stepsDone;          /**< Number of selections made so far */

    public:
        /**
         * @brief Constructs a selector positioned at step 0
         *
         * @param schedule Decay parameters
         * @param numActions Number of legal actions
         *
         * @throws std::invalid_argument if numActions is not positive or the
         *         schedule decay is not positive
         */
        EpsilonGreedy(EpsilonSchedule schedule, int64_t numActions);

        /**
         * @brief Picks an action for `state` and advances the schedule
         *
         * @param state Current observation
         * @param estimator Supplies the greedy action when exploiting
         * @return Selected action in [0, numActions)
         */
        ActionId selectAction(const torch::Tensor &state, ValueEstimator &estimator);

        /** @return Exploration rate the next selection will use */
        inline double currentEpsilon() const
        {
            return schedule.at(stepsDone);
        }

        inline int64_t getStepsDone() const
        {
            return stepsDone;
        }

        inline const EpsilonSchedule &getSchedule() const
        {
            return schedule;
        }
    };
}

#endif //POLEBALANCER_EPSILONGREEDY_HPP
