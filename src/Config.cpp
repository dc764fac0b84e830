//
// Created by moinshaikh on 3/6/26.
//

#include<stdexcept>
#include<string>

#include<spdlog/spdlog.h>

#include"../include/Config.hpp"

#include<doctest/doctest.h>

namespace PoleBalancer
{
    void Hyperparameters::validate() const
    {
        if (batchSize == 0)
        {
            throw std::invalid_argument("batchSize must be positive");
        }
        if (replayCapacity == 0)
        {
            throw std::invalid_argument("replayCapacity must be positive");
        }
        if (batchSize > replayCapacity)
        {
            throw std::invalid_argument("batchSize " + std::to_string(batchSize) +
                                        " exceeds replayCapacity " + std::to_string(replayCapacity));
        }
        if (!(gamma >= 0 && gamma <= 1))
        {
            throw std::invalid_argument("gamma must be in [0, 1], got " + std::to_string(gamma));
        }
        if (!(epsStart >= 0 && epsStart <= 1) || !(epsEnd >= 0 && epsEnd <= 1))
        {
            throw std::invalid_argument("epsStart and epsEnd must be in [0, 1]");
        }
        if (!(epsDecay > 0))
        {
            throw std::invalid_argument("epsDecay must be positive, got " + std::to_string(epsDecay));
        }
        if (!(tau > 0 && tau <= 1))
        {
            throw std::invalid_argument("tau must be in (0, 1], got " + std::to_string(tau));
        }
        if (!(learningRate > 0))
        {
            throw std::invalid_argument("learningRate must be positive, got " + std::to_string(learningRate));
        }
        if (earlyStoppingThreshold < 0)
        {
            throw std::invalid_argument("earlyStoppingThreshold must not be negative");
        }
        if (numEpisodes < 0)
        {
            throw std::invalid_argument("numEpisodes must not be negative");
        }
        if (hiddenSize <= 0)
        {
            throw std::invalid_argument("hiddenSize must be positive");
        }
        if (!(gradClipValue > 0))
        {
            throw std::invalid_argument("gradClipValue must be positive");
        }
        if (logInterval <= 0)
        {
            throw std::invalid_argument("logInterval must be positive");
        }
        if (!(rewardSingularityEpsilon > 0))
        {
            throw std::invalid_argument("rewardSingularityEpsilon must be positive");
        }
        if (maxEpisodeSteps < 0)
        {
            throw std::invalid_argument("maxEpisodeSteps must not be negative");
        }
    }

    void Hyperparameters::log() const
    {
        spdlog::info("Batch size: {}, replay capacity: {}", batchSize, replayCapacity);
        spdlog::info("Gamma: {}, tau: {}, learning rate: {}{}", gamma, tau, learningRate,
                     useLrDecay ? " (decayed)" : "");
        spdlog::info("Epsilon: {} -> {} over {} steps", epsStart, epsEnd, epsDecay);
        spdlog::info("Episodes: {}, early stopping after {} truncations", numEpisodes, earlyStoppingThreshold);
        if (maxEpisodeSteps > 0)
        {
            spdlog::info("Episodes capped at {} steps", maxEpisodeSteps);
        }
    }

    TEST_CASE("Hyperparameters")
    {
        Hyperparameters hyperparameters;

        SUBCASE("Defaults are valid")
        {
            CHECK_NOTHROW(hyperparameters.validate());
            CHECK(hyperparameters.batchSize == 128);
            CHECK(hyperparameters.gamma == doctest::Approx(0.8));
            CHECK(hyperparameters.earlyStoppingThreshold == 10);
        }

        SUBCASE("Batch larger than the buffer is rejected")
        {
            hyperparameters.replayCapacity = 64;

            CHECK_THROWS_AS(hyperparameters.validate(), std::invalid_argument);
        }

        SUBCASE("Out of range rates are rejected")
        {
            Hyperparameters badGamma;
            badGamma.gamma = 1.5;
            Hyperparameters badTau;
            badTau.tau = 0;
            Hyperparameters badDecay;
            badDecay.epsDecay = 0;

            CHECK_THROWS_AS(badGamma.validate(), std::invalid_argument);
            CHECK_THROWS_AS(badTau.validate(), std::invalid_argument);
            CHECK_THROWS_AS(badDecay.validate(), std::invalid_argument);
        }

        SUBCASE("Zero capacity is rejected")
        {
            hyperparameters.replayCapacity = 0;
            hyperparameters.batchSize = 0;

            CHECK_THROWS_AS(hyperparameters.validate(), std::invalid_argument);
        }
    }
}
