//
// Created by moinshaikh on 3/3/26.
//

#include<stdexcept>
#include<string>

#include<torch/torch.h>

#include"../../include/Model/QNetwork.hpp"

#include<doctest/doctest.h>

namespace PoleBalancer
{
    /**
     * @brief Constructs the Q-value MLP.
     *
     * @details All four layers are registered with register_module() so that parameters() and
     * named_parameters() expose them in declaration order (layer1, layer2, layer3, output). The
     * ValueEstimator relies on that order being identical for two instances built with the same
     * sizes.
     */
    QNetworkImpl::QNetworkImpl(int64_t numInputs, int64_t numActions, int64_t hiddenSize) :
    layer1(nullptr),
    layer2(nullptr),
    layer3(nullptr),
    output(nullptr),
    numInputs(numInputs),
    numActions(numActions),
    hiddenSize(hiddenSize)
    {
        if (numInputs <= 0 || numActions <= 0 || hiddenSize <= 0)
        {
            throw std::invalid_argument("QNetwork sizes must be positive, got inputs=" + std::to_string(numInputs) +
                                        " actions=" + std::to_string(numActions) +
                                        " hidden=" + std::to_string(hiddenSize));
        }
        layer1 = register_module("layer1", torch::nn::Linear(numInputs, hiddenSize));
        layer2 = register_module("layer2", torch::nn::Linear(hiddenSize, hiddenSize));
        layer3 = register_module("layer3", torch::nn::Linear(hiddenSize, hiddenSize));
        output = register_module("output", torch::nn::Linear(hiddenSize, numActions));
    }

    torch::Tensor QNetworkImpl::forward(torch::Tensor inputs)
    {
        if (inputs.dim() == 1)
        {
            inputs = inputs.unsqueeze(0);
        }
        auto x = torch::relu(layer1->forward(inputs));
        x = torch::relu(layer2->forward(x));
        x = torch::relu(layer3->forward(x));
        return output->forward(x);
    }

    TEST_CASE("QNetwork")
    {
        QNetwork network(4, 2, 16);

        SUBCASE("Output has one column per action")
        {
            auto outputs = network->forward(torch::rand({7, 4}));

            CHECK(outputs.size(0) == 7);
            CHECK(outputs.size(1) == 2);
        }

        SUBCASE("Single observation is treated as a batch of one")
        {
            auto outputs = network->forward(torch::rand({4}));

            CHECK(outputs.dim() == 2);
            CHECK(outputs.size(0) == 1);
        }

        SUBCASE("Registers four layers with weights and biases")
        {
            auto parameters = network->named_parameters();

            CHECK(parameters.size() == 8);
            CHECK(parameters.contains("layer1.weight"));
            CHECK(parameters.contains("output.bias"));
            CHECK(parameters["output.weight"].size(0) == 2);
            CHECK(parameters["output.weight"].size(1) == 16);
        }

        SUBCASE("Non-positive sizes throw")
        {
            CHECK_THROWS_AS(QNetwork(0, 2), std::invalid_argument);
            CHECK_THROWS_AS(QNetwork(4, 0), std::invalid_argument);
        }
    }
}
