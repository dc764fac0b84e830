#pragma once
//
// Created by moinshaikh on 1/27/26.
//

#ifndef POLEBALANCER_SPACE_HPP
#define POLEBALANCER_SPACE_HPP

#include<cstdint>
#include<stdexcept>
#include<string>
#include<vector>

namespace PoleBalancer
{
    /**
     * @brief Identifier of a discrete action (index into the network output)
     */
    using ActionId = int64_t;

    /**
     * @brief Gym style description of an action space
     *
     * Only "Discrete" spaces with a single dimension holding the number of
     * actions are understood by the value based core.
     */
    struct ActionSpace
    {
        std::string type;
        std::vector<int64_t> shape;
    };

    /**
     * @brief Number of legal actions of a discrete action space
     *
     * @throws std::invalid_argument if the space is not "Discrete" or is empty
     */
    inline int64_t discreteActionCount(const ActionSpace &space)
    {
        if (space.type != "Discrete" || space.shape.size() != 1)
        {
            throw std::invalid_argument("Expected a one dimensional Discrete action space, got " +
                                        space.type + " with " + std::to_string(space.shape.size()) +
                                        " dimensions");
        }
        if (space.shape[0] <= 0)
        {
            throw std::invalid_argument("Discrete action space must contain at least one action, got " +
                                        std::to_string(space.shape[0]));
        }
        return space.shape[0];
    }
}

#endif //POLEBALANCER_SPACE_HPP
