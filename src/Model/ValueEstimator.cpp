//
// Created by moinshaikh on 3/3/26.
//

#include<algorithm>
#include<stdexcept>
#include<string>

#include<torch/torch.h>

#include"../../include/Model/ValueEstimator.hpp"

#include<doctest/doctest.h>

namespace PoleBalancer
{
    /**
     * @brief Pairs a policy network with a target network.
     *
     * @details Parameters are matched by name. Every target tensor has gradient tracking disabled so
     * that no optimiser step or backward pass can ever reach it. Once paired, the target is hard
     * synchronised, which is the only hard copy made during training.
     *
     * @throws std::invalid_argument If names or shapes of the two parameter sets differ.
     */
    ValueEstimator::ValueEstimator(QNetwork policyNetwork, QNetwork targetNetwork, torch::Device device) :
    policyNetwork(policyNetwork),
    targetNetwork(targetNetwork),
    device(device)
    {
        this->policyNetwork->to(device);
        this->targetNetwork->to(device);

        auto policyParameters = this->policyNetwork->named_parameters();
        auto targetParameters = this->targetNetwork->named_parameters();
        if (policyParameters.size() != targetParameters.size())
        {
            throw std::invalid_argument("Policy network has " + std::to_string(policyParameters.size()) +
                                        " parameter tensors but target network has " +
                                        std::to_string(targetParameters.size()));
        }

        parameterPairs.reserve(policyParameters.size());
        for (const auto &parameter : policyParameters)
        {
            auto *target = targetParameters.find(parameter.key());
            if (target == nullptr)
            {
                throw std::invalid_argument("Target network has no parameter named " + parameter.key());
            }
            if (parameter.value().sizes() != target->sizes())
            {
                throw std::invalid_argument("Parameter " + parameter.key() + " differs in shape between the policy and target networks");
            }
            target->requires_grad_(false);
            parameterPairs.emplace_back(parameter.value(), *target);
        }

        this->targetNetwork->eval();
        hardUpdate();
    }

    ValueEstimator::ValueEstimator(int64_t numInputs, int64_t numActions, int64_t hiddenSize, torch::Device device) :
    ValueEstimator(QNetwork(numInputs, numActions, hiddenSize),
                   QNetwork(numInputs, numActions, hiddenSize),
                   device)
    {

    }

    torch::Tensor ValueEstimator::evaluatePolicy(const torch::Tensor &states)
    {
        return policyNetwork->forward(states.to(device));
    }

    torch::Tensor ValueEstimator::evaluateTarget(const torch::Tensor &states)
    {
        torch::NoGradGuard noGrad;
        return targetNetwork->forward(states.to(device)).detach();
    }

    /**
     * @brief Returns the argmax of the policy network's output.
     *
     * @details The scan keeps the first index holding the maximum, so equal values resolve to the
     * lowest action regardless of backend argmax behaviour.
     */
    ActionId ValueEstimator::bestAction(const torch::Tensor &state)
    {
        torch::NoGradGuard noGrad;
        auto values = policyNetwork->forward(state.to(device)).reshape({-1}).to(torch::kCPU);
        auto accessor = values.accessor<float, 1>();

        ActionId best = 0;
        for (int64_t action = 1; action < accessor.size(0); ++action)
        {
            if (accessor[action] > accessor[best])
            {
                best = action;
            }
        }
        return best;
    }

    /**
     * @brief Soft target update.
     *
     * @details Applied in place on every (policy, target) pair:
     * \f[
     * \theta' \leftarrow \tau \theta + (1 - \tau) \theta'
     * \f]
     * With \f$ \tau = 1 \f$ the blend degenerates to a copy, which is performed with copy_() so the
     * result is bit-identical to the policy.
     */
    void ValueEstimator::softUpdate(double tau)
    {
        if (!(tau > 0.0 && tau <= 1.0))
        {
            throw std::invalid_argument("Soft update rate must be in (0, 1], got " + std::to_string(tau));
        }
        if (tau == 1.0)
        {
            hardUpdate();
            return;
        }

        torch::NoGradGuard noGrad;
        for (auto &pair : parameterPairs)
        {
            pair.second.mul_(1.0 - tau).add_(pair.first, tau);
        }
    }

    void ValueEstimator::hardUpdate()
    {
        torch::NoGradGuard noGrad;
        for (auto &pair : parameterPairs)
        {
            pair.second.copy_(pair.first);
        }
    }

    std::vector<torch::Tensor> ValueEstimator::policyParameters() const
    {
        return policyNetwork->parameters();
    }

    // Largest absolute difference over every (policy, target) parameter pair
    static float maxParameterGap(ValueEstimator &estimator)
    {
        auto policy = estimator.getPolicyNetwork()->parameters();
        auto target = estimator.getTargetNetwork()->parameters();
        float gap = 0;
        for (size_t i = 0; i < policy.size(); ++i)
        {
            gap = std::max(gap, (policy[i] - target[i]).abs().max().item<float>());
        }
        return gap;
    }

    // Moves the policy away from the target so updates have something to close
    static void perturbPolicy(ValueEstimator &estimator)
    {
        torch::NoGradGuard noGrad;
        for (auto &parameter : estimator.getPolicyNetwork()->parameters())
        {
            parameter.add_(torch::randn_like(parameter));
        }
    }

    TEST_CASE("ValueEstimator")
    {
        torch::manual_seed(0);

        SUBCASE("Target starts equal to the policy")
        {
            ValueEstimator estimator(4, 2, 16);

            CHECK(maxParameterGap(estimator) == 0);
            auto states = torch::rand({5, 4});
            CHECK(torch::equal(estimator.evaluatePolicy(states), estimator.evaluateTarget(states)));
        }

        SUBCASE("Target parameters never require gradients")
        {
            ValueEstimator estimator(4, 2, 16);

            for (const auto &parameter : estimator.getTargetNetwork()->parameters())
            {
                CHECK(!parameter.requires_grad());
            }
            CHECK(!estimator.evaluateTarget(torch::rand({3, 4})).requires_grad());
            CHECK(estimator.evaluatePolicy(torch::rand({3, 4})).requires_grad());
        }

        SUBCASE("softUpdate() applies the exponential blend")
        {
            ValueEstimator estimator(4, 2, 16);
            perturbPolicy(estimator);

            auto policy = estimator.getPolicyNetwork()->parameters();
            auto before = estimator.getTargetNetwork()->parameters();
            std::vector<torch::Tensor> expected;
            for (size_t i = 0; i < policy.size(); ++i)
            {
                expected.push_back(0.1 * policy[i].detach() + 0.9 * before[i].detach());
            }

            estimator.softUpdate(0.1);

            auto after = estimator.getTargetNetwork()->parameters();
            for (size_t i = 0; i < after.size(); ++i)
            {
                CHECK(torch::allclose(after[i], expected[i], 1e-5, 1e-6));
            }
        }

        SUBCASE("Repeated soft updates converge to a fixed policy")
        {
            ValueEstimator estimator(4, 2, 16);
            perturbPolicy(estimator);
            auto initialGap = maxParameterGap(estimator);

            for (int i = 0; i < 2000; ++i)
            {
                estimator.softUpdate(0.05);
            }

            CHECK(initialGap > 0.1);
            CHECK(maxParameterGap(estimator) < 1e-5);
        }

        SUBCASE("softUpdate() with tau = 1 copies exactly")
        {
            ValueEstimator estimator(4, 2, 16);
            perturbPolicy(estimator);

            estimator.softUpdate(1.0);

            CHECK(maxParameterGap(estimator) == 0);
        }

        SUBCASE("softUpdate() rejects rates outside (0, 1]")
        {
            ValueEstimator estimator(4, 2, 16);

            CHECK_THROWS_AS(estimator.softUpdate(0.0), std::invalid_argument);
            CHECK_THROWS_AS(estimator.softUpdate(1.5), std::invalid_argument);
        }

        SUBCASE("Mismatched architectures throw")
        {
            CHECK_THROWS_AS(ValueEstimator(QNetwork(4, 2, 16), QNetwork(4, 2, 8)), std::invalid_argument);
            CHECK_THROWS_AS(ValueEstimator(QNetwork(4, 2, 16), QNetwork(4, 3, 16)), std::invalid_argument);
        }

        SUBCASE("bestAction() breaks ties toward the lowest index")
        {
            ValueEstimator estimator(4, 3, 8);
            {
                torch::NoGradGuard noGrad;
                for (auto &parameter : estimator.getPolicyNetwork()->parameters())
                {
                    parameter.zero_();
                }
            }

            CHECK(estimator.bestAction(torch::rand({4})) == 0);

            {
                torch::NoGradGuard noGrad;
                auto parameters = estimator.getPolicyNetwork()->named_parameters();
                parameters["output.bias"][1] = 2.0;
                parameters["output.bias"][2] = 2.0;
            }

            CHECK(estimator.bestAction(torch::rand({4})) == 1);
        }
    }
}
