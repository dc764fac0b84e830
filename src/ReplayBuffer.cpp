//
// Created by moinshaikh on 3/2/26.
//

#include<set>
#include<stdexcept>
#include<string>
#include<utility>
#include<vector>

#include"../include/ReplayBuffer.hpp"

#include<doctest/doctest.h>

namespace PoleBalancer
{
    /**
     * @brief Constructs a ReplayBuffer.
     *
     * @details Storage is reserved up front so pushes never reallocate once the
     * ring is full.
     *
     * @param capacity Maximum number of transitions kept.
     * @throws std::invalid_argument If capacity is 0.
     */
    ReplayBuffer::ReplayBuffer(size_t capacity) : maxSize(capacity), head(0)
    {
        if (capacity == 0)
        {
            throw std::invalid_argument("Replay buffer capacity must be greater than 0");
        }
        memory.reserve(capacity);
    }

    /**
     * @brief Inserts a transition into the ring.
     *
     * @details While the buffer is filling, transitions are appended. Afterwards the slot at `head`
     * holds the oldest transition; it is overwritten and `head` advances modulo the capacity.
     */
    void ReplayBuffer::push(Transition transition)
    {
        if (memory.size() < maxSize)
        {
            memory.push_back(std::move(transition));
            return;
        }
        memory[head] = std::move(transition);
        head = (head + 1) % maxSize;
    }

    /**
     * @brief Samples a batch without replacement.
     *
     * @details A random permutation of the occupied slots is drawn with `torch::randperm()` and its
     * first `batchSize` indices are used, which yields distinct transitions with uniform probability.
     */
    std::vector<Transition> ReplayBuffer::sample(size_t batchSize) const
    {
        if (batchSize > memory.size())
        {
            throw std::out_of_range("Cannot sample " + std::to_string(batchSize) +
                                    " transitions from a replay buffer holding " +
                                    std::to_string(memory.size()));
        }

        auto indices = torch::randperm(static_cast<int64_t>(memory.size()), torch::TensorOptions(torch::kLong))
                           .slice(0, 0, static_cast<int64_t>(batchSize));
        auto accessor = indices.accessor<int64_t, 1>();

        std::vector<Transition> batch;
        batch.reserve(batchSize);
        for (int64_t i = 0; i < accessor.size(0); ++i)
        {
            batch.push_back(memory[accessor[i]]);
        }
        return batch;
    }

    std::vector<Transition> ReplayBuffer::contents() const
    {
        std::vector<Transition> ordered;
        ordered.reserve(memory.size());
        for (size_t i = 0; i < memory.size(); ++i)
        {
            ordered.push_back(memory[(head + i) % memory.size()]);
        }
        return ordered;
    }

    // Builds a transition whose state is filled with `value` so tests can tell entries apart
    static Transition makeTransition(float value)
    {
        return Transition(torch::full({4}, value), 0, Continuing{torch::full({4}, value + 1)}, value);
    }

    TEST_CASE("ReplayBuffer")
    {
        SUBCASE("Zero capacity throws")
        {
            CHECK_THROWS_AS(ReplayBuffer(0), std::invalid_argument);
        }

        SUBCASE("Grows until capacity")
        {
            ReplayBuffer buffer(5);
            CHECK(buffer.empty());
            for (int i = 0; i < 3; ++i)
            {
                buffer.push(makeTransition(i));
            }

            CHECK(buffer.size() == 3);
            CHECK(buffer.capacity() == 5);
        }

        SUBCASE("Keeps exactly the most recent transitions when overfilled")
        {
            ReplayBuffer buffer(4);
            for (int i = 0; i < 11; ++i)
            {
                buffer.push(makeTransition(i));
            }

            REQUIRE(buffer.size() == 4);
            auto stored = buffer.contents();
            for (int i = 0; i < 4; ++i)
            {
                CHECK(stored[i].getReward() == doctest::Approx(7 + i));
                CHECK(stored[i].getState()[0].item<float>() == doctest::Approx(7 + i));
            }
        }

        SUBCASE("sample() returns distinct stored transitions")
        {
            torch::manual_seed(0);
            ReplayBuffer buffer(10);
            for (int i = 0; i < 25; ++i)
            {
                buffer.push(makeTransition(i));
            }

            auto batch = buffer.sample(6);

            REQUIRE(batch.size() == 6);
            std::set<int> seen;
            for (const auto &transition : batch)
            {
                auto reward = static_cast<int>(transition.getReward());
                CHECK(reward >= 15);
                CHECK(reward < 25);
                seen.insert(reward);
            }
            CHECK(seen.size() == 6);
        }

        SUBCASE("sample() of the whole buffer is a permutation")
        {
            ReplayBuffer buffer(8);
            for (int i = 0; i < 8; ++i)
            {
                buffer.push(makeTransition(i));
            }

            auto batch = buffer.sample(8);

            std::set<int> seen;
            for (const auto &transition : batch)
            {
                seen.insert(static_cast<int>(transition.getReward()));
            }
            CHECK(seen.size() == 8);
        }

        SUBCASE("sample() larger than occupancy throws")
        {
            ReplayBuffer buffer(10);
            buffer.push(makeTransition(0));
            buffer.push(makeTransition(1));

            CHECK_THROWS_AS(buffer.sample(3), std::out_of_range);
            CHECK_NOTHROW(buffer.sample(2));
        }

        SUBCASE("sample() is reproducible under a fixed seed")
        {
            ReplayBuffer buffer(50);
            for (int i = 0; i < 50; ++i)
            {
                buffer.push(makeTransition(i));
            }

            torch::manual_seed(42);
            auto first = buffer.sample(10);
            torch::manual_seed(42);
            auto second = buffer.sample(10);

            for (size_t i = 0; i < first.size(); ++i)
            {
                CHECK(first[i].getReward() == doctest::Approx(second[i].getReward()));
            }
        }
    }
}
