/**
 * @file DQN.cpp
 * @brief Implementation of the Deep Q-Network learning update
 * @author moinshaikh
 * @date 3/5/26
 *
 * Key features:
 * - Uniform minibatch sampling from a replay buffer
 * - One-step TD targets from a separate target network
 * - Huber loss with elementwise gradient clipping
 * - AdamW with AMSGrad and an optional learning-rate decay
 * - Soft (Polyak) target update after every optimisation step
 */

#include<stdexcept>
#include<string>

#include<torch/torch.h>

#include"../../include/Algorithms/DQN.hpp"
#include"../../include/Algorithms/Algorithm.hpp"
#include"../../include/ReplayBuffer.hpp"
#include"../../include/Transition.hpp"

#include<doctest/doctest.h>

namespace PoleBalancer
{
    DQN::DQN(ValueEstimator &estimator,
        size_t batchSize,
        float gamma,
        float tau,
        float learningRate,
        float gradClipValue) :
    estimator(estimator),
    batchSize(batchSize),
    gamma(gamma),
    tau(tau),
    gradClipValue(gradClipValue),
    originalLearningRate(learningRate),
    optimizer(std::make_unique<torch::optim::AdamW>(estimator.policyParameters(),torch::optim::AdamWOptions(learningRate).amsgrad(true)))
    {
        if (batchSize == 0)
        {
            throw std::invalid_argument("DQN batch size must be positive");
        }
        if (!(gamma >= 0 && gamma <= 1))
        {
            throw std::invalid_argument("Discount factor must be in [0, 1], got " + std::to_string(gamma));
        }
        if (!(tau > 0 && tau <= 1))
        {
            throw std::invalid_argument("Soft update rate must be in (0, 1], got " + std::to_string(tau));
        }
        if (!(learningRate > 0))
        {
            throw std::invalid_argument("Learning rate must be positive, got " + std::to_string(learningRate));
        }
        if (!(gradClipValue > 0))
        {
            throw std::invalid_argument("Gradient clip value must be positive, got " + std::to_string(gradClipValue));
        }
    }

    DQN::DQN(ValueEstimator &estimator, const Hyperparameters &hyperparameters) :
    DQN(estimator,
        hyperparameters.batchSize,
        hyperparameters.gamma,
        hyperparameters.tau,
        hyperparameters.learningRate,
        hyperparameters.gradClipValue)
    {

    }

    /**
     * @brief Computes y = r + γ · max_a' Q_target(s', a'), with the bootstrap term zero on terminal rows.
     *
     * @details Only the rows flagged by nonFinalMask are passed through the target network. Truncated
     * transitions carry a next state and are therefore bootstrapped like any other non-terminal step.
     */
    torch::Tensor DQN::computeTdTargets(const TransitionBatch &batch)
    {
        torch::NoGradGuard noGrad;
        const auto &device = estimator.getDevice();
        auto nextStateValues = torch::zeros({batch.rewards.size(0)}, torch::TensorOptions(torch::kFloat).device(device));
        if (batch.nonFinalNextStates.size(0) > 0)
        {
            auto maxValues = std::get<0>(estimator.evaluateTarget(batch.nonFinalNextStates).max(1));
            nextStateValues.index_put_({batch.nonFinalMask.to(device)}, maxValues);
        }
        return batch.rewards.to(device) + nextStateValues * gamma;
    }

    double DQN::currentLearningRate() const
    {
        return static_cast<torch::optim::AdamWOptions&>(optimizer->param_groups().front().options()).lr();
    }

    /**
     * @brief Perform one DQN optimisation step
     * @param replayBuffer Experience to sample a minibatch from
     * @param decayLevel Learning rate decay factor for scheduling
     * @return Vector of UpdateDatum containing loss metrics for monitoring
     *
     * This method implements the update:
     * 1. Skips entirely while the buffer holds fewer than batchSize transitions
     * 2. Updates learning rate based on decay schedule
     * 3. Samples and collates a minibatch
     * 4. Gathers Q(s, a) of the taken actions from the policy network
     * 5. Computes TD targets from the target network
     * 6. Minimises the Huber loss with elementwise gradient clipping
     * 7. Blends the target network toward the policy network
     */
    std::vector<UpdateDatum> DQN::update(ReplayBuffer &replayBuffer, float decayLevel)
    {
        if (replayBuffer.size() < batchSize)
        {
            return {};
        }

        for (auto& group :optimizer->param_groups())
        {
            static_cast<torch::optim::AdamWOptions&> (group.options()).lr(originalLearningRate* decayLevel);
        }

        auto batch = collate(replayBuffer.sample(batchSize), estimator.getDevice());

        // Q(s, a) for the actions actually taken, shape [B, 1]
        auto stateActionValues = estimator.evaluatePolicy(batch.states).gather(1, batch.actions);
        auto expectedValues = computeTdTargets(batch).unsqueeze(1);

        auto loss = torch::nn::functional::smooth_l1_loss(stateActionValues, expectedValues);

        optimizer->zero_grad();
        loss.backward();
        torch::nn::utils::clip_grad_value_(estimator.policyParameters(), gradClipValue);
        optimizer->step();

        estimator.softUpdate(tau);

        return {{"Loss", loss.item().toFloat()},
                {"Mean Q", stateActionValues.mean().item().toFloat()}};
    }

    // Two opposite states; in each one action pays +1, the other -1, and both end the episode
    static void fillTerminalTask(ReplayBuffer &buffer, size_t count)
    {
        for (size_t i = 0; i < count; ++i)
        {
            const bool positive = (i / 2) % 2 == 1;
            const ActionId action = static_cast<ActionId>(i % 2);
            const bool correct = (action == 1) == positive;
            buffer.push(Transition(torch::full({4}, positive ? 1.f : -1.f),
                                   action,
                                   Terminal{},
                                   correct ? 1.f : -1.f));
        }
    }

    TEST_CASE("DQN")
    {
        torch::manual_seed(0);
        ValueEstimator estimator(4, 2, 16);

        SUBCASE("Terminal transitions target the reward alone")
        {
            DQN dqn(estimator, 2, 0.9, 0.005, 1e-3);
            auto batch = collate({Transition(torch::rand({4}), 0, Terminal{}, 1.5),
                                  Transition(torch::rand({4}), 1, Terminal{}, -2)},
                                 torch::kCPU);

            auto targets = dqn.computeTdTargets(batch);

            CHECK(targets.size(0) == 2);
            CHECK(targets[0].item<float>() == doctest::Approx(1.5));
            CHECK(targets[1].item<float>() == doctest::Approx(-2));
        }

        SUBCASE("Continuing transitions bootstrap from the target network")
        {
            DQN dqn(estimator, 2, 0.9, 0.005, 1e-3);
            auto nextState = torch::rand({4});
            auto batch = collate({Transition(torch::rand({4}), 0, Continuing{nextState}, 0.5),
                                  Transition(torch::rand({4}), 1, Terminal{}, 1)},
                                 torch::kCPU);

            auto targets = dqn.computeTdTargets(batch);
            auto bootstrap = estimator.evaluateTarget(nextState).max().item<float>();

            CHECK(targets[0].item<float>() == doctest::Approx(0.5 + 0.9 * bootstrap));
            CHECK(targets[1].item<float>() == doctest::Approx(1));
            CHECK(!targets.requires_grad());
        }

        SUBCASE("No update before the buffer holds a batch")
        {
            DQN dqn(estimator, 8, 0.9, 0.005, 1e-3);
            ReplayBuffer buffer(16);
            fillTerminalTask(buffer, 7);
            auto before = estimator.getPolicyNetwork()->parameters()[0].clone();

            auto data = dqn.update(buffer);

            CHECK(data.empty());
            CHECK(torch::equal(before, estimator.getPolicyNetwork()->parameters()[0]));
        }

        SUBCASE("Reports loss and mean Q")
        {
            DQN dqn(estimator, 8, 0.9, 0.005, 1e-3);
            ReplayBuffer buffer(16);
            fillTerminalTask(buffer, 16);

            auto data = dqn.update(buffer);

            REQUIRE(data.size() == 2);
            CHECK(data[0].name == "Loss");
            CHECK(data[1].name == "Mean Q");
            CHECK(data[0].value >= 0);
        }

        SUBCASE("Loss decreases on a fixed task")
        {
            DQN dqn(estimator, 8, 0.9, 0.01, 1e-2);
            ReplayBuffer buffer(32);
            fillTerminalTask(buffer, 32);

            float firstLoss = dqn.update(buffer)[0].value;
            float lastLoss = firstLoss;
            for (int i = 0; i < 200; ++i)
            {
                lastLoss = dqn.update(buffer)[0].value;
            }

            CHECK(lastLoss < firstLoss * 0.5);
            CHECK(estimator.bestAction(torch::full({4}, 1.f)) == 1);
            CHECK(estimator.bestAction(torch::full({4}, -1.f)) == 0);
        }

        SUBCASE("Target network follows by a soft update")
        {
            DQN dqn(estimator, 8, 0.9, 0.1, 1e-2);
            ReplayBuffer buffer(16);
            fillTerminalTask(buffer, 16);
            std::vector<torch::Tensor> before;
            for (const auto &parameter : estimator.getTargetNetwork()->parameters())
            {
                before.push_back(parameter.clone());
            }

            dqn.update(buffer);

            auto policy = estimator.getPolicyNetwork()->parameters();
            auto target = estimator.getTargetNetwork()->parameters();
            bool moved = false;
            for (size_t i = 0; i < target.size(); ++i)
            {
                auto expected = 0.9 * before[i] + 0.1 * policy[i].detach();
                CHECK(torch::allclose(target[i], expected, 1e-5, 1e-6));
                moved = moved || !torch::equal(target[i], before[i]);
            }
            CHECK(moved);
        }

        SUBCASE("Decay level scales the learning rate")
        {
            DQN dqn(estimator, 8, 0.9, 0.005, 1e-3);
            ReplayBuffer buffer(16);
            fillTerminalTask(buffer, 16);

            dqn.update(buffer, 0.5);

            CHECK(dqn.currentLearningRate() == doctest::Approx(5e-4));
        }

        SUBCASE("Invalid hyperparameters throw")
        {
            CHECK_THROWS_AS(DQN(estimator, 0, 0.9, 0.005, 1e-3), std::invalid_argument);
            CHECK_THROWS_AS(DQN(estimator, 8, 1.5, 0.005, 1e-3), std::invalid_argument);
            CHECK_THROWS_AS(DQN(estimator, 8, 0.9, 0, 1e-3), std::invalid_argument);
            CHECK_THROWS_AS(DQN(estimator, 8, 0.9, 0.005, 0), std::invalid_argument);
            CHECK_THROWS_AS(DQN(estimator, 8, 0.9, 0.005, 1e-3, -1), std::invalid_argument);
        }

        SUBCASE("Configuration constructor copies the learning settings")
        {
            Hyperparameters hyperparameters;
            hyperparameters.batchSize = 32;
            hyperparameters.gamma = 0.95;
            hyperparameters.tau = 0.02;
            hyperparameters.learningRate = 5e-4;
            hyperparameters.gradClipValue = 10;

            DQN dqn(estimator, hyperparameters);

            CHECK(dqn.getBatchSize() == 32);
            CHECK(dqn.getGamma() == hyperparameters.gamma);
            CHECK(dqn.getTau() == hyperparameters.tau);
            CHECK(dqn.getBaseLearningRate() == hyperparameters.learningRate);
            CHECK(dqn.getGradClipValue() == hyperparameters.gradClipValue);
            CHECK(&dqn.getEstimator() == &estimator);
            CHECK(dqn.currentLearningRate() == doctest::Approx(5e-4));
        }
    }
}
