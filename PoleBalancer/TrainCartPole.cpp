//
// Created by moinshaikh on 3/8/26.
//

#include<exception>
#include<string>

#include<spdlog/spdlog.h>

#include<ATen/Parallel.h>

#include"../include/PoleBalancer.hpp"

#include"Communication.hpp"
#include"GymEnvironment.hpp"

using namespace PoleBalancer;

// Gym server
const std::string serverUrl = "tcp://127.0.0.1:10201";
const std::string envName = "CartPole-v1";
const int receiveTimeoutMs = 5000;

// Post-training viewing
const int evaluationEpisodes = 5;

const bool useCuda = false;

int main()
{
    spdlog::set_level(spdlog::level::info);
    spdlog::set_pattern("%^[%T %7l] %v%$");
    at::set_num_threads(1);
    torch::manual_seed(0);

    torch::Device device = useCuda ? torch::kCUDA : torch::kCPU;

    Hyperparameters hyperparameters;

    try
    {
        hyperparameters.validate();
        hyperparameters.log();

        spdlog::info("Connecting to the Gym Environment");
        GymClient::Communicator communicator(serverUrl, receiveTimeoutMs);
        GymClient::GymEnvironment gymEnvironment(communicator, envName);
        ShapedRewardEnvironment environment(gymEnvironment, hyperparameters.rewardSingularityEpsilon);

        ValueEstimator estimator(environment.getObservationSize(),
                                 discreteActionCount(environment.getActionSpace()),
                                 hyperparameters.hiddenSize,
                                 device);
        DQN dqn(estimator, hyperparameters);

        Trainer trainer(environment, dqn, hyperparameters);
        auto result = trainer.run();

        if (result.earlyStopped)
        {
            spdlog::info("Early stopping threshold met after {} episodes", result.episodesRun);
        }
        spdlog::info("Complete");
        spdlog::info("Episodes: {}, total steps: {}", result.episodesRun, result.totalSteps);
        spdlog::info("Average duration (last 100 episodes): {:.1f}", trainer.getEpisodeLog().recentAverage(100));
        auto movingAverage = trainer.getEpisodeLog().movingAverage(100);
        if (!movingAverage.empty())
        {
            spdlog::info("100-episode moving average: {:.1f}", movingAverage.back());
        }

        spdlog::info("Training complete, now watching the trained model...");
        gymEnvironment.setRender(true);
        trainer.evaluate(evaluationEpisodes);
    }
    catch (const std::exception &e)
    {
        spdlog::error(e.what());
        return 1;
    }

    return 0;
}
