//
// Created by moinshaikh on 3/3/26.
//

#ifndef POLEBALANCER_QNETWORK_HPP
#define POLEBALANCER_QNETWORK_HPP

#include<torch/torch.h>
#include<torch/nn.h>

namespace PoleBalancer
{
    /**
     * @brief Multi-layer perceptron estimating one Q-value per discrete action
     *
     * `QNetworkImpl` maps an observation vector to the estimated return of every
     * legal action. The architecture is three ReLU hidden layers of equal width
     * followed by a linear output layer:
     *
     * ```
     * Q(x) = W4 · relu(W3 · relu(W2 · relu(W1 · x + b1) + b2) + b3) + b4
     * ```
     *
     * The same class is instantiated twice by the ValueEstimator: once as the
     * policy network trained by gradient descent, once as the target network
     * that only tracks it through soft updates.
     *
     * @note Wrapped with TORCH_MODULE so it is handled through a shared holder
     *       (`QNetwork`), like every other libtorch module.
     */
    class QNetworkImpl : public torch::nn::Module
    {
    private:
        torch::nn::Linear layer1;   /**< Observation to first hidden layer */
        torch::nn::Linear layer2;   /**< Hidden to hidden */
        torch::nn::Linear layer3;   /**< Hidden to hidden */
        torch::nn::Linear output;   /**< Hidden to one value per action */
        int64_t numInputs;          /**< Observation size */
        int64_t numActions;         /**< Number of discrete actions */
        int64_t hiddenSize;         /**< Width of every hidden layer */

    public:
        /**
         * @brief Constructs the network with libtorch's default initialisation
         *
         * @param numInputs Dimensionality of the observation vector
         * @param numActions Number of discrete actions (output size)
         * @param hiddenSize Width of the hidden layers. Default: 128.
         *
         * @throws std::invalid_argument if any size is not positive
         */
        QNetworkImpl(int64_t numInputs, int64_t numActions, int64_t hiddenSize = 128);

        /**
         * @brief Evaluates Q-values
         *
         * @param inputs Observations of shape [batch_size, num_inputs], or a
         *               single observation of shape [num_inputs] which is
         *               treated as a batch of one
         * @return Q-values of shape [batch_size, num_actions]
         */
        torch::Tensor forward(torch::Tensor inputs);

        inline int64_t getNumInputs() const
        {
            return numInputs;
        }

        inline int64_t getNumActions() const
        {
            return numActions;
        }

        inline int64_t getHiddenSize() const
        {
            return hiddenSize;
        }
    };
    TORCH_MODULE(QNetwork);
}

#endif //POLEBALANCER_QNETWORK_HPP
