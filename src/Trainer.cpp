//
// Created by moinshaikh on 3/7/26.
//

#include<cmath>
#include<functional>
#include<stdexcept>
#include<string>
#include<utility>

#include<spdlog/spdlog.h>

#include"../include/Trainer.hpp"

#include<doctest/doctest.h>

namespace PoleBalancer
{
    TruncationStreak::TruncationStreak(int threshold) :
    threshold(threshold),
    length(0),
    lastTruncatedEpisode(-1)
    {
        if (threshold < 0)
        {
            throw std::invalid_argument("Early stopping threshold must not be negative, got " + std::to_string(threshold));
        }
    }

    bool TruncationStreak::observe(int episode, bool truncated)
    {
        if (!truncated)
        {
            length = 0;
            return false;
        }

        if (length > 0 && episode == lastTruncatedEpisode + 1)
        {
            ++length;
        }
        else
        {
            length = 1;
        }
        lastTruncatedEpisode = episode;
        return length > threshold;
    }

    Trainer::Trainer(Environment &environment,
                     DQN &algorithm,
                     const Hyperparameters &hyperparameters) :
    environment(environment),
    estimator(algorithm.getEstimator()),
    algorithm(algorithm),
    hyperparameters(hyperparameters),
    replayBuffer(hyperparameters.replayCapacity),
    explorer(EpsilonSchedule{hyperparameters.epsStart, hyperparameters.epsEnd, hyperparameters.epsDecay},
             algorithm.getEstimator().getNumActions()),
    truncationStreak(hyperparameters.earlyStoppingThreshold),
    totalSteps(0)
    {
        this->hyperparameters.validate();

        const auto numActions = discreteActionCount(environment.getActionSpace());
        if (numActions != estimator.getNumActions())
        {
            throw std::invalid_argument("Environment has " + std::to_string(numActions) +
                                        " actions but the Q-network outputs " +
                                        std::to_string(estimator.getNumActions()));
        }
        if (environment.getObservationSize() != estimator.getNumInputs())
        {
            throw std::invalid_argument("Environment observations have " +
                                        std::to_string(environment.getObservationSize()) +
                                        " elements but the Q-network expects " +
                                        std::to_string(estimator.getNumInputs()));
        }
        if (estimator.getHiddenSize() != hyperparameters.hiddenSize)
        {
            throw std::invalid_argument("Q-network hidden size " + std::to_string(estimator.getHiddenSize()) +
                                        " differs from the configured " + std::to_string(hyperparameters.hiddenSize));
        }
        if (algorithm.getBatchSize() != hyperparameters.batchSize)
        {
            throw std::invalid_argument("Learner batch size " + std::to_string(algorithm.getBatchSize()) +
                                        " differs from the configured " + std::to_string(hyperparameters.batchSize));
        }
        if (algorithm.getGamma() != hyperparameters.gamma ||
            algorithm.getTau() != hyperparameters.tau ||
            algorithm.getBaseLearningRate() != hyperparameters.learningRate ||
            algorithm.getGradClipValue() != hyperparameters.gradClipValue)
        {
            throw std::invalid_argument("Learner gamma, tau, learning rate or gradient clip value differ from the configuration");
        }
    }

    torch::Tensor Trainer::toState(const torch::Tensor &observation) const
    {
        auto state = observation.reshape({-1}).to(torch::kFloat);
        if (state.numel() != estimator.getNumInputs())
        {
            throw std::invalid_argument("Observation has " + std::to_string(state.numel()) +
                                        " elements, expected " + std::to_string(estimator.getNumInputs()));
        }
        return state;
    }

    /**
     * @brief Runs the training loop.
     *
     * @details An episode ends on termination, on truncation, or when maxEpisodeSteps is reached, which
     * counts as truncation. Only termination stores a Terminal successor: a truncated step still
     * bootstraps from the observation it reached.
     */
    TrainingResult Trainer::run()
    {
        TrainingResult result{{}, 0, 0, false};
        std::vector<UpdateDatum> lastUpdate;
        bool learning = false;

        for (int episode = 0; episode < hyperparameters.numEpisodes; ++episode)
        {
            const float decayLevel = hyperparameters.useLrDecay
                                     ? 1.f - static_cast<float>(episode) / static_cast<float>(hyperparameters.numEpisodes)
                                     : 1.f;

            auto state = toState(environment.reset().observation);
            int64_t duration = 0;
            bool terminated = false;
            bool truncated = false;
            while (!terminated && !truncated)
            {
                auto action = explorer.selectAction(state, estimator);
                auto step = environment.step(action);
                ++duration;
                ++totalSteps;

                auto nextState = toState(step.observation);
                terminated = step.terminated;
                truncated = step.truncated ||
                            (hyperparameters.maxEpisodeSteps > 0 && duration >= hyperparameters.maxEpisodeSteps);

                NextState successor = terminated ? NextState(Terminal{}) : NextState(Continuing{nextState});
                replayBuffer.push(Transition(state, action, std::move(successor), step.reward));

                auto data = algorithm.update(replayBuffer, decayLevel);
                if (!data.empty())
                {
                    if (!learning)
                    {
                        spdlog::debug("Replay buffer holds {} transitions, learning started", replayBuffer.size());
                        learning = true;
                    }
                    lastUpdate = std::move(data);
                }
                state = nextState;
            }

            episodeLog.record(duration);
            result.episodesRun = episode + 1;

            if ((episode + 1) % hyperparameters.logInterval == 0)
            {
                spdlog::info("---");
                spdlog::info("Episode: {}/{}", episode + 1, hyperparameters.numEpisodes);
                spdlog::info("Duration: {}", duration);
                spdlog::info("Average duration (100 episodes): {:.1f}", episodeLog.recentAverage(100));
                spdlog::info("Epsilon: {:.3f}", explorer.currentEpsilon());
                for (const auto &datum : lastUpdate)
                {
                    spdlog::info("{}: {}", datum.name, datum.value);
                }
            }

            if (truncationStreak.observe(episode, truncated && !terminated))
            {
                spdlog::info("Early stopping after {} consecutive truncated episodes", truncationStreak.getLength());
                result.earlyStopped = true;
                break;
            }
        }

        result.episodeDurations = episodeLog.getDurations();
        result.totalSteps = totalSteps;
        return result;
    }

    std::vector<int64_t> Trainer::evaluate(int numEpisodes)
    {
        if (numEpisodes < 0)
        {
            throw std::invalid_argument("Number of evaluation episodes must not be negative");
        }

        std::vector<int64_t> durations;
        durations.reserve(static_cast<size_t>(numEpisodes));
        for (int episode = 0; episode < numEpisodes; ++episode)
        {
            auto state = toState(environment.reset().observation);
            int64_t duration = 0;
            while (true)
            {
                auto step = environment.step(estimator.bestAction(state));
                ++duration;
                state = toState(step.observation);
                if (step.terminated || step.truncated ||
                    (hyperparameters.maxEpisodeSteps > 0 && duration >= hyperparameters.maxEpisodeSteps))
                {
                    break;
                }
            }
            spdlog::info("Evaluation episode {}: duration {}", episode + 1, duration);
            durations.push_back(duration);
        }
        return durations;
    }

    /**
     * Plays episodes of fixed length. Episode i lasts episodeLengths[i % n] steps (0 never ends) and
     * ends by truncation if truncateEpisode[i % n] is set, by termination otherwise. With
     * terminateOnTruncation a truncated ending carries both flags. Observations
     * are a function of the global step count and every action received is recorded.
     */
    class ScriptedEnvironment : public Environment
    {
    public:
        std::vector<int64_t> episodeLengths;
        std::vector<bool> truncateEpisode;
        std::function<torch::Tensor(int64_t)> observationAt;
        std::vector<ActionId> actions;
        int64_t numActions = 2;
        int64_t observationSize = 4;
        bool terminateOnTruncation = false; ///< Report truncated endings as terminated too
        int64_t episode = -1;
        int64_t stepInEpisode = 0;
        int64_t globalStep = 0;

        ScriptedEnvironment(std::vector<int64_t> episodeLengths,
                            std::vector<bool> truncateEpisode,
                            std::function<torch::Tensor(int64_t)> observationAt) :
        episodeLengths(std::move(episodeLengths)),
        truncateEpisode(std::move(truncateEpisode)),
        observationAt(std::move(observationAt))
        {
        }

        ResetResult reset() override
        {
            ++episode;
            stepInEpisode = 0;
            return {observationAt(globalStep), {}};
        }

        StepResult step(ActionId action) override
        {
            actions.push_back(action);
            ++stepInEpisode;
            ++globalStep;
            const auto length = episodeLengths[static_cast<size_t>(episode) % episodeLengths.size()];
            const bool truncate = truncateEpisode[static_cast<size_t>(episode) % truncateEpisode.size()];
            const bool ended = length > 0 && stepInEpisode >= length;
            return {observationAt(globalStep), 1, ended && (!truncate || terminateOnTruncation), ended && truncate, {}};
        }

        ActionSpace getActionSpace() const override
        {
            return {"Discrete", {numActions}};
        }

        int64_t getObservationSize() const override
        {
            return observationSize;
        }
    };

    static torch::Tensor smoothObservation(int64_t step)
    {
        const auto t = static_cast<float>(step);
        return torch::tensor({0.1f * std::sin(t), std::cos(t), 0.05f * std::sin(0.5f * t), 0.f});
    }

    // Policy whose Q-values are relu(-s0) for action 0 and relu(s0) for action 1
    static void setThresholdPolicy(ValueEstimator &estimator)
    {
        torch::NoGradGuard noGrad;
        auto parameters = estimator.getPolicyNetwork()->named_parameters();
        for (auto &parameter : parameters)
        {
            parameter.value().zero_();
        }
        parameters["layer1.weight"][0][0] = 1.0;
        parameters["layer1.weight"][1][0] = -1.0;
        parameters["layer2.weight"].copy_(torch::eye(parameters["layer2.weight"].size(0)));
        parameters["layer3.weight"].copy_(torch::eye(parameters["layer3.weight"].size(0)));
        parameters["output.weight"][0][1] = 1.0;
        parameters["output.weight"][1][0] = 1.0;
        estimator.hardUpdate();
    }

    static Hyperparameters smallRun()
    {
        Hyperparameters hyperparameters;
        hyperparameters.batchSize = 4;
        hyperparameters.replayCapacity = 64;
        hyperparameters.numEpisodes = 20;
        hyperparameters.epsDecay = 20;
        hyperparameters.hiddenSize = 16;
        hyperparameters.gamma = 0.9;
        hyperparameters.learningRate = 1e-3;
        return hyperparameters;
    }

    // Trains on a smooth scripted environment and returns the actions it received
    static std::vector<ActionId> seededRun(uint64_t seed, torch::Tensor &firstWeight)
    {
        torch::manual_seed(seed);
        auto hyperparameters = smallRun();
        hyperparameters.numEpisodes = 4;
        ValueEstimator estimator(4, 2, hyperparameters.hiddenSize);
        DQN dqn(estimator, hyperparameters);
        ScriptedEnvironment environment({6}, {false}, smoothObservation);

        Trainer trainer(environment, dqn, hyperparameters);
        trainer.run();

        firstWeight = estimator.getPolicyNetwork()->parameters()[0].clone();
        return environment.actions;
    }

    TEST_CASE("TruncationStreak")
    {
        TruncationStreak streak(2);

        SUBCASE("Stops once the streak exceeds the threshold")
        {
            CHECK(!streak.observe(0, true));
            CHECK(!streak.observe(1, true));
            CHECK(streak.observe(2, true));
            CHECK(streak.getLength() == 3);
        }

        SUBCASE("Termination resets the streak")
        {
            streak.observe(0, true);
            streak.observe(1, true);
            CHECK(!streak.observe(2, false));
            CHECK(streak.getLength() == 0);
            CHECK(!streak.observe(3, true));
            CHECK(streak.getLength() == 1);
        }

        SUBCASE("A gap starts a new streak")
        {
            streak.observe(0, true);
            streak.observe(1, true);
            CHECK(!streak.observe(5, true));
            CHECK(streak.getLength() == 1);
        }

        SUBCASE("Zero threshold stops on the first truncation")
        {
            TruncationStreak eager(0);

            CHECK(eager.observe(0, true));
        }
    }

    TEST_CASE("Trainer")
    {
        torch::manual_seed(0);
        auto hyperparameters = smallRun();

        SUBCASE("Early stopping after threshold + 1 truncated episodes")
        {
            hyperparameters.earlyStoppingThreshold = 2;
            ValueEstimator estimator(4, 2, hyperparameters.hiddenSize);
            DQN dqn(estimator, hyperparameters);
            ScriptedEnvironment environment({3}, {true}, smoothObservation);

            Trainer trainer(environment, dqn, hyperparameters);
            auto result = trainer.run();

            CHECK(result.earlyStopped);
            CHECK(result.episodesRun == 3);
            CHECK(result.episodeDurations == std::vector<int64_t>{3, 3, 3});
            CHECK(result.totalSteps == 9);
            CHECK(trainer.getReplayBuffer().size() == 9);
        }

        SUBCASE("Alternating endings never stop early")
        {
            hyperparameters.numEpisodes = 10;
            hyperparameters.earlyStoppingThreshold = 1;
            ValueEstimator estimator(4, 2, hyperparameters.hiddenSize);
            DQN dqn(estimator, hyperparameters);
            ScriptedEnvironment environment({2}, {true, false}, smoothObservation);

            Trainer trainer(environment, dqn, hyperparameters);
            auto result = trainer.run();

            CHECK(!result.earlyStopped);
            CHECK(result.episodesRun == 10);
            CHECK(result.totalSteps == 20);

            int terminalTransitions = 0;
            for (const auto &transition : trainer.getReplayBuffer().contents())
            {
                terminalTransitions += transition.isTerminal() ? 1 : 0;
            }
            CHECK(terminalTransitions == 5);
        }

        SUBCASE("Episode both terminated and truncated counts as terminated")
        {
            hyperparameters.numEpisodes = 3;
            hyperparameters.earlyStoppingThreshold = 0;
            ValueEstimator estimator(4, 2, hyperparameters.hiddenSize);
            DQN dqn(estimator, hyperparameters);
            ScriptedEnvironment environment({2}, {true}, smoothObservation);
            environment.terminateOnTruncation = true;

            Trainer trainer(environment, dqn, hyperparameters);
            auto result = trainer.run();

            CHECK(!result.earlyStopped);
            CHECK(result.episodesRun == 3);
            auto transitions = trainer.getReplayBuffer().contents();
            REQUIRE(transitions.size() == 6);
            CHECK(transitions[1].isTerminal());
            CHECK(transitions[5].isTerminal());
        }

        SUBCASE("Step cap counts as truncation")
        {
            hyperparameters.numEpisodes = 3;
            hyperparameters.maxEpisodeSteps = 5;
            ValueEstimator estimator(4, 2, hyperparameters.hiddenSize);
            DQN dqn(estimator, hyperparameters);
            ScriptedEnvironment environment({0}, {false}, smoothObservation);

            Trainer trainer(environment, dqn, hyperparameters);
            auto result = trainer.run();

            CHECK(!result.earlyStopped);
            CHECK(result.episodeDurations == std::vector<int64_t>{5, 5, 5});
            for (const auto &transition : trainer.getReplayBuffer().contents())
            {
                CHECK(!transition.isTerminal());
            }
        }

        SUBCASE("Greedy policy reproduces the expected action trace")
        {
            hyperparameters.hiddenSize = 4;
            hyperparameters.batchSize = 8;
            hyperparameters.replayCapacity = 16;
            hyperparameters.learningRate = 1e-4;
            hyperparameters.numEpisodes = 1;
            hyperparameters.epsStart = 0;
            hyperparameters.epsEnd = 0;
            ValueEstimator estimator(4, 2, hyperparameters.hiddenSize);
            setThresholdPolicy(estimator);
            DQN dqn(estimator, hyperparameters);
            const std::vector<float> positions{0.1f, -0.2f, 0.3f, 0.f, -0.05f, 0.f};
            ScriptedEnvironment environment({5}, {false}, [&positions](int64_t step) {
                return torch::tensor({positions[static_cast<size_t>(step)], 0.f, 0.f, 0.f});
            });

            Trainer trainer(environment, dqn, hyperparameters);
            auto result = trainer.run();

            CHECK(environment.actions == std::vector<ActionId>{1, 0, 1, 0, 0});
            CHECK(result.episodeDurations == std::vector<int64_t>{5});
            CHECK(!result.earlyStopped);
            auto transitions = trainer.getReplayBuffer().contents();
            REQUIRE(transitions.size() == 5);
            CHECK(transitions.back().isTerminal());
            CHECK(!transitions.front().isTerminal());
            CHECK(transitions[2].getAction() == 1);
        }

        SUBCASE("Same seed gives the same run")
        {
            torch::Tensor firstWeight;
            torch::Tensor secondWeight;
            auto firstActions = seededRun(7, firstWeight);
            auto secondActions = seededRun(7, secondWeight);

            CHECK(firstActions.size() == 24);
            CHECK(firstActions == secondActions);
            CHECK(torch::equal(firstWeight, secondWeight));
        }

        SUBCASE("Evaluation is greedy and does not learn")
        {
            hyperparameters.hiddenSize = 4;
            ValueEstimator estimator(4, 2, hyperparameters.hiddenSize);
            setThresholdPolicy(estimator);
            DQN dqn(estimator, hyperparameters);
            ScriptedEnvironment environment({4}, {true}, [](int64_t step) {
                return torch::tensor({step % 2 == 0 ? 0.2f : -0.2f, 0.f, 0.f, 0.f});
            });

            Trainer trainer(environment, dqn, hyperparameters);
            auto durations = trainer.evaluate(2);

            CHECK(durations == std::vector<int64_t>{4, 4});
            CHECK(environment.actions == std::vector<ActionId>{1, 0, 1, 0, 1, 0, 1, 0});
            CHECK(trainer.getReplayBuffer().empty());
            CHECK(trainer.getExplorer().getStepsDone() == 0);
        }

        SUBCASE("Mismatched environment throws")
        {
            ValueEstimator estimator(4, 2, hyperparameters.hiddenSize);
            DQN dqn(estimator, hyperparameters);
            ScriptedEnvironment wrongActions({3}, {true}, smoothObservation);
            wrongActions.numActions = 3;
            ScriptedEnvironment wrongObservations({3}, {true}, smoothObservation);
            wrongObservations.observationSize = 5;

            CHECK_THROWS_AS(Trainer(wrongActions, dqn, hyperparameters), std::invalid_argument);
            CHECK_THROWS_AS(Trainer(wrongObservations, dqn, hyperparameters), std::invalid_argument);
        }

        SUBCASE("Learner built with other settings throws")
        {
            ScriptedEnvironment environment({3}, {true}, smoothObservation);
            ValueEstimator estimator(4, 2, hyperparameters.hiddenSize);

            auto otherBatch = hyperparameters;
            otherBatch.batchSize = 8;
            DQN batchLearner(estimator, otherBatch);
            CHECK_THROWS_AS(Trainer(environment, batchLearner, hyperparameters), std::invalid_argument);

            auto otherGamma = hyperparameters;
            otherGamma.gamma = 0.5;
            DQN gammaLearner(estimator, otherGamma);
            CHECK_THROWS_AS(Trainer(environment, gammaLearner, hyperparameters), std::invalid_argument);

            auto otherTau = hyperparameters;
            otherTau.tau = 0.1;
            DQN tauLearner(estimator, otherTau);
            CHECK_THROWS_AS(Trainer(environment, tauLearner, hyperparameters), std::invalid_argument);

            auto otherRate = hyperparameters;
            otherRate.learningRate = 1e-2;
            DQN rateLearner(estimator, otherRate);
            CHECK_THROWS_AS(Trainer(environment, rateLearner, hyperparameters), std::invalid_argument);

            auto otherClip = hyperparameters;
            otherClip.gradClipValue = 1;
            DQN clipLearner(estimator, otherClip);
            CHECK_THROWS_AS(Trainer(environment, clipLearner, hyperparameters), std::invalid_argument);

            ValueEstimator narrowEstimator(4, 2, 8);
            DQN narrowLearner(narrowEstimator, hyperparameters);
            CHECK_THROWS_AS(Trainer(environment, narrowLearner, hyperparameters), std::invalid_argument);

            DQN matchingLearner(estimator, hyperparameters);
            CHECK_NOTHROW(Trainer(environment, matchingLearner, hyperparameters));
        }
    }
}
