#pragma once
//
// Created by moinshaikh on 3/6/26.
//

#ifndef POLEBALANCER_EPISODELOG_HPP
#define POLEBALANCER_EPISODELOG_HPP

#include<cstddef>
#include<cstdint>
#include<vector>

namespace PoleBalancer
{
    /**
     * @brief Append-only record of episode durations
     *
     * Durations are stored in episode order. Nothing is persisted; the log
     * lives as long as the Trainer that owns it.
     */
    class EpisodeLog
    {
    private:
        std::vector<int64_t> durations;

    public:
        void record(int64_t duration);

        /**
         * @brief Sliding-window mean over the whole series
         *
         * The result has one entry per recorded episode. Entry i is the mean of
         * episodes [i - window + 1, i]; the first window - 1 entries are zero,
         * which keeps the curve aligned with the raw durations when plotted.
         *
         * @throws std::invalid_argument if window is 0
         */
        std::vector<float> movingAverage(size_t window) const;

        /**
         * @brief Mean of the last min(window, size()) durations, 0 when empty
         *
         * @throws std::invalid_argument if window is 0
         */
        float recentAverage(size_t window) const;

        inline const std::vector<int64_t> &getDurations() const
        {
            return durations;
        }

        inline size_t size() const
        {
            return durations.size();
        }
    };
}

#endif //POLEBALANCER_EPISODELOG_HPP
