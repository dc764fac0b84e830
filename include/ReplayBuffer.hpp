#pragma once
//
// Created by moinshaikh on 3/2/26.
//

#ifndef POLEBALANCER_REPLAYBUFFER_HPP
#define POLEBALANCER_REPLAYBUFFER_HPP

#include<cstddef>
#include<vector>

#include"Transition.hpp"

namespace PoleBalancer
{
    /**
     * @brief Bounded store of past transitions used by off-policy algorithms
     *
     * `ReplayBuffer` keeps at most `capacity` transitions in a ring. Once full,
     * every push overwrites the oldest entry, so the buffer always holds the
     * `capacity` most recently pushed transitions. Sampling draws uniformly
     * without replacement, which decorrelates consecutive environment steps
     * before they reach the learning update.
     *
     * Random draws use the libtorch generator (`torch::randperm`), so a call to
     * `torch::manual_seed` makes sampling reproducible.
     */
    class ReplayBuffer
    {
    private:
        std::vector<Transition> memory; /**< Ring storage, grows up to capacity */
        size_t maxSize;                 /**< Maximum number of stored transitions */
        size_t head;                    /**< Slot overwritten by the next push once full (the oldest entry) */

    public:
        /**
         * @brief Constructs an empty replay buffer
         *
         * @param capacity Maximum number of transitions kept
         *
         * @throws std::invalid_argument if capacity is 0
         */
        explicit ReplayBuffer(size_t capacity);

        /**
         * @brief Appends a transition, evicting the oldest one when full
         *
         * @param transition Transition to store
         */
        void push(Transition transition);

        /**
         * @brief Draws transitions uniformly at random without replacement
         *
         * Callers are expected to check size() first; the learning update skips
         * optimisation while the buffer holds fewer transitions than a batch.
         *
         * @param batchSize Number of distinct transitions to return
         * @return The sampled transitions in random order
         *
         * @throws std::out_of_range if batchSize exceeds the current occupancy
         */
        std::vector<Transition> sample(size_t batchSize) const;

        /**
         * @brief Stored transitions from oldest to newest
         *
         * Inspection helper: training only samples, this copy is for callers that
         * want to look at what the buffer holds.
         */
        std::vector<Transition> contents() const;

        /** @return Current number of stored transitions */
        inline size_t size() const
        {
            return memory.size();
        }

        /** @return Maximum number of stored transitions */
        inline size_t capacity() const
        {
            return maxSize;
        }

        inline bool empty() const
        {
            return memory.empty();
        }
    };
}

#endif //POLEBALANCER_REPLAYBUFFER_HPP
