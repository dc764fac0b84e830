//
// Created by moinshaikh on 3/6/26.
//

#include<algorithm>
#include<stdexcept>

#include"../include/EpisodeLog.hpp"

#include<doctest/doctest.h>

namespace PoleBalancer
{
    void EpisodeLog::record(int64_t duration)
    {
        durations.push_back(duration);
    }

    std::vector<float> EpisodeLog::movingAverage(size_t window) const
    {
        if (window == 0)
        {
            throw std::invalid_argument("Moving average window must be positive");
        }

        std::vector<float> averages(durations.size(), 0.f);
        int64_t windowSum = 0;
        for (size_t i = 0; i < durations.size(); ++i)
        {
            windowSum += durations[i];
            if (i >= window)
            {
                windowSum -= durations[i - window];
            }
            if (i + 1 >= window)
            {
                averages[i] = static_cast<float>(windowSum) / static_cast<float>(window);
            }
        }
        return averages;
    }

    float EpisodeLog::recentAverage(size_t window) const
    {
        if (window == 0)
        {
            throw std::invalid_argument("Average window must be positive");
        }
        if (durations.empty())
        {
            return 0;
        }

        const size_t count = std::min(window, durations.size());
        int64_t sum = 0;
        for (auto it = durations.end() - static_cast<std::ptrdiff_t>(count); it != durations.end(); ++it)
        {
            sum += *it;
        }
        return static_cast<float>(sum) / static_cast<float>(count);
    }

    TEST_CASE("EpisodeLog")
    {
        EpisodeLog log;
        for (int64_t duration : {10, 20, 30, 40, 50})
        {
            log.record(duration);
        }

        SUBCASE("Keeps durations in order")
        {
            REQUIRE(log.size() == 5);
            CHECK(log.getDurations().front() == 10);
            CHECK(log.getDurations().back() == 50);
        }

        SUBCASE("Moving average pads the first window with zeros")
        {
            auto averages = log.movingAverage(3);

            REQUIRE(averages.size() == 5);
            CHECK(averages[0] == 0);
            CHECK(averages[1] == 0);
            CHECK(averages[2] == doctest::Approx(20));
            CHECK(averages[3] == doctest::Approx(30));
            CHECK(averages[4] == doctest::Approx(40));
        }

        SUBCASE("Window longer than the series is all zeros")
        {
            auto averages = log.movingAverage(100);

            CHECK(averages.size() == 5);
            CHECK(std::all_of(averages.begin(), averages.end(), [](float value) { return value == 0; }));
        }

        SUBCASE("Recent average uses what is available")
        {
            CHECK(log.recentAverage(2) == doctest::Approx(45));
            CHECK(log.recentAverage(100) == doctest::Approx(30));
            CHECK(EpisodeLog().recentAverage(100) == 0);
        }

        SUBCASE("Zero window throws")
        {
            CHECK_THROWS_AS(log.movingAverage(0), std::invalid_argument);
            CHECK_THROWS_AS(log.recentAverage(0), std::invalid_argument);
        }
    }
}
