#pragma once
/**
 * @file Request.hpp
 * @brief Request and response structures for GymClient communication
 * @author moinshaikh
 * @date 3/8/26
 *
 * This file defines the messages exchanged with a single-environment gym
 * server. Every message is a MessagePack map whose keys are the field names.
 */

#ifndef POLEBALANCER_REQUEST_HPP
#define POLEBALANCER_REQUEST_HPP

#include<msgpack.hpp>

#include<cstdint>
#include<memory>
#include<string>
#include<vector>


namespace GymClient
{
    /**
     * @template Request
     * @brief Generic request template for gym operations
     * @tparam T The parameter type for the specific gym operation
     *
     * Each request contains a method name and a shared pointer to the
     * parameter structure specific to that operation.
     */
    template<class T>
    struct Request
    {
        std::string method; ///< The name of the gym operation to perform
        std::shared_ptr<T> param; ///< Operation-specific parameters

        Request(const std::string &method, std::shared_ptr<T> param) : method(method), param(param)
        {

        }

        MSGPACK_DEFINE_MAP(method, param);
    };

    /**
     * @struct InfoParam
     * @brief Parameters of the "info" request, which carries no data
     */
    struct InfoParam
    {
        int x = 0; ///< Placeholder, the server ignores it
        MSGPACK_DEFINE_MAP(x);
    };

    /**
     * @struct MakeParam
     * @brief Parameters for creating the gym environment
     */
    struct MakeParam
    {
        std::string envName; ///< Registered gym id, e.g. "CartPole-v1"
        MSGPACK_DEFINE_MAP(envName);
    };

    /**
     * @struct ResetParam
     * @brief Parameters of the "reset" request, which carries no data
     */
    struct ResetParam
    {
        int x = 0; ///< Placeholder, the server ignores it
        MSGPACK_DEFINE_MAP(x);
    };

    /**
     * @struct StepParam
     * @brief Parameters for stepping the environment with one discrete action
     */
    struct StepParam
    {
        int64_t action; ///< Index of the action to take
        bool render;    ///< Whether the server should render the frame
        MSGPACK_DEFINE_MAP(action, render);
    };

    /**
     * @struct InfoResponse
     * @brief Action and observation space description
     */
    struct InfoResponse
    {
        std::string actionSpaceType; ///< Type of the action space (e.g., "Discrete", "Box")
        std::vector<int64_t> actionSpaceShape; ///< Number of actions for a discrete space
        std::string observationSpaceType; ///< Type of the observation space (e.g., "Box")
        std::vector<int64_t> observationSpaceShape; ///< Shape of one observation
        MSGPACK_DEFINE_MAP(actionSpaceType,actionSpaceShape,observationSpaceType,observationSpaceShape);
    };

    /**
     * @struct MakeResponse
     * @brief Result message of environment creation
     */
    struct MakeResponse
    {
        std::string result;
        MSGPACK_DEFINE_MAP(result);
    };

    /**
     * @struct ResetResponse
     * @brief Initial observation of a new episode
     */
    struct ResetResponse
    {
        std::vector<float> observation;
        MSGPACK_DEFINE_MAP(observation);
    };

    /**
     * @struct StepResponse
     * @brief Outcome of one environment step
     *
     * `terminated` and `truncated` follow the gym convention: the first marks a
     * true terminal state, the second a time-limit cut.
     */
    struct StepResponse
    {
        std::vector<float> observation;
        float reward;
        bool terminated;
        bool truncated;
        MSGPACK_DEFINE_MAP(observation, reward, terminated, truncated);
    };
}

#endif //POLEBALANCER_REQUEST_HPP
