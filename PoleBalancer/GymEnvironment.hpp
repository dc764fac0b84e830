#pragma once
//
// Created by moinshaikh on 3/8/26.
//

#ifndef POLEBALANCER_GYMENVIRONMENT_HPP
#define POLEBALANCER_GYMENVIRONMENT_HPP

#include<string>

#include"../include/Environment.hpp"

#include"Communication.hpp"
#include"Request.hpp"

namespace GymClient
{
    /**
     * @brief Environment backed by a remote gym server
     *
     * Construction sends "make" followed by "info"; every reset() and step()
     * is one request/reply round trip. The communicator must outlive the
     * environment.
     */
    class GymEnvironment : public PoleBalancer::Environment
    {
    private:
        Communicator &communicator;
        InfoResponse info;
        bool render;

        torch::Tensor toObservation(const std::vector<float> &values) const;

    public:
        /**
         * @throws std::runtime_error if the server does not answer or the
         *         observation space is empty
         */
        GymEnvironment(Communicator &communicator, const std::string &envName);

        PoleBalancer::ResetResult reset() override;
        PoleBalancer::StepResult step(PoleBalancer::ActionId action) override;
        PoleBalancer::ActionSpace getActionSpace() const override;
        int64_t getObservationSize() const override;

        /** @brief Asks the server to render the frames of subsequent steps */
        inline void setRender(bool enabled)
        {
            render = enabled;
        }
    };
}

#endif //POLEBALANCER_GYMENVIRONMENT_HPP
