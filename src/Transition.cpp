//
// Created by moinshaikh on 3/2/26.
//

#include<stdexcept>
#include<string>
#include<utility>
#include<vector>

#include"../include/Transition.hpp"

#include<doctest/doctest.h>

namespace PoleBalancer
{
    Transition::Transition(torch::Tensor state, ActionId action, NextState nextState, float reward) :
    state(state.reshape({-1}).clone()),
    action(action),
    nextState(std::move(nextState)),
    reward(reward)
    {
        if (auto *continuing = std::get_if<Continuing>(&this->nextState))
        {
            continuing->state = continuing->state.reshape({-1}).clone();
            if (continuing->state.numel() != this->state.numel())
            {
                throw std::invalid_argument("Next state has " + std::to_string(continuing->state.numel()) +
                                            " elements but state has " + std::to_string(this->state.numel()));
            }
        }
    }

    /**
     * @brief Transposes sampled transitions into batch tensors.
     *
     * @details Terminal transitions contribute no row to `nonFinalNextStates`; their position is
     * recorded as false in `nonFinalMask` so the learning update can scatter the bootstrapped values
     * back into a full size [B] tensor.
     */
    TransitionBatch collate(const std::vector<Transition> &transitions, torch::Device device)
    {
        if (transitions.empty())
        {
            throw std::invalid_argument("Cannot collate an empty list of transitions");
        }

        const auto observationSize = transitions.front().getState().numel();
        std::vector<torch::Tensor> states;
        std::vector<torch::Tensor> nextStates;
        std::vector<int64_t> actions;
        std::vector<float> rewards;
        std::vector<uint8_t> mask;
        states.reserve(transitions.size());
        actions.reserve(transitions.size());
        rewards.reserve(transitions.size());
        mask.reserve(transitions.size());

        for (const auto &transition : transitions)
        {
            if (transition.getState().numel() != observationSize)
            {
                throw std::invalid_argument("Batch mixes observation sizes " + std::to_string(observationSize) +
                                            " and " + std::to_string(transition.getState().numel()));
            }
            states.push_back(transition.getState().to(torch::kFloat));
            actions.push_back(transition.getAction());
            rewards.push_back(transition.getReward());
            if (const auto *continuing = std::get_if<Continuing>(&transition.getNextState()))
            {
                nextStates.push_back(continuing->state.to(torch::kFloat));
                mask.push_back(1);
            }
            else
            {
                mask.push_back(0);
            }
        }

        TransitionBatch batch;
        batch.states = torch::stack(states).to(device);
        batch.actions = torch::tensor(actions, torch::kLong).view({-1, 1}).to(device);
        batch.rewards = torch::tensor(rewards, torch::kFloat).to(device);
        batch.nonFinalMask = torch::tensor(mask, torch::kUInt8).to(torch::kBool).to(device);
        if (nextStates.empty())
        {
            batch.nonFinalNextStates = torch::empty({0, observationSize}, torch::TensorOptions(device));
        }
        else
        {
            batch.nonFinalNextStates = torch::stack(nextStates).to(device);
        }
        return batch;
    }

    TEST_CASE("Transition")
    {
        SUBCASE("Flattens row vector observations")
        {
            Transition transition(torch::ones({1, 4}), 1, Continuing{torch::zeros({1, 4})}, 0.5);

            CHECK(transition.getState().dim() == 1);
            CHECK(transition.getState().size(0) == 4);
            CHECK(std::get<Continuing>(transition.getNextState()).state.dim() == 1);
            CHECK(!transition.isTerminal());
        }

        SUBCASE("Terminal transitions carry no next state")
        {
            Transition transition(torch::ones({4}), 0, Terminal{}, 1);

            CHECK(transition.isTerminal());
            CHECK(transition.getReward() == doctest::Approx(1));
        }

        SUBCASE("Later writes to the source tensors do not reach the transition")
        {
            auto observation = torch::ones({1, 4});
            auto successor = torch::ones({4});
            Transition transition(observation, 1, Continuing{successor}, 0);

            observation.fill_(5);
            successor.fill_(7);

            CHECK(torch::equal(transition.getState(), torch::ones({4})));
            CHECK(torch::equal(std::get<Continuing>(transition.getNextState()).state, torch::ones({4})));
        }

        SUBCASE("Mismatched next state size throws")
        {
            CHECK_THROWS_AS(Transition(torch::ones({4}), 0, Continuing{torch::ones({3})}, 0),
                            std::invalid_argument);
        }
    }

    TEST_CASE("collate()")
    {
        std::vector<Transition> transitions{
            Transition(torch::full({4}, 1.f), 0, Continuing{torch::full({4}, 2.f)}, 1),
            Transition(torch::full({4}, 3.f), 1, Terminal{}, -1),
            Transition(torch::full({4}, 5.f), 1, Continuing{torch::full({4}, 6.f)}, 0.5)};

        auto batch = collate(transitions, torch::kCPU);

        SUBCASE("Stacks states and actions")
        {
            CHECK(batch.states.size(0) == 3);
            CHECK(batch.states.size(1) == 4);
            CHECK(batch.actions.size(0) == 3);
            CHECK(batch.actions.size(1) == 1);
            CHECK(batch.actions.dtype() == torch::kLong);
            CHECK(batch.actions[1][0].item<int64_t>() == 1);
            CHECK(batch.rewards[1].item<float>() == doctest::Approx(-1));
        }

        SUBCASE("Masks terminal transitions")
        {
            CHECK(batch.nonFinalMask.dtype() == torch::kBool);
            CHECK(batch.nonFinalMask[0].item<bool>());
            CHECK(!batch.nonFinalMask[1].item<bool>());
            CHECK(batch.nonFinalMask[2].item<bool>());
            CHECK(batch.nonFinalNextStates.size(0) == 2);
            CHECK(batch.nonFinalNextStates[1][0].item<float>() == doctest::Approx(6));
        }

        SUBCASE("All terminal batch has no next states")
        {
            std::vector<Transition> terminal{Transition(torch::ones({4}), 0, Terminal{}, 1)};
            auto terminalBatch = collate(terminal, torch::kCPU);

            CHECK(terminalBatch.nonFinalNextStates.size(0) == 0);
            CHECK(terminalBatch.nonFinalNextStates.size(1) == 4);
        }

        SUBCASE("Empty list throws")
        {
            CHECK_THROWS_AS(collate({}, torch::kCPU), std::invalid_argument);
        }
    }
}
