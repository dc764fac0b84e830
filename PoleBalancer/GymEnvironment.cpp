//
// Created by moinshaikh on 3/8/26.
//

#include<map>
#include<memory>
#include<stdexcept>
#include<string>

#include<doctest/doctest.h>
#include<msgpack.hpp>
#include<spdlog/spdlog.h>
#include<torch/torch.h>
#include<zmq.hpp>

#include"GymEnvironment.hpp"

namespace GymClient
{
    GymEnvironment::GymEnvironment(Communicator &communicator, const std::string &envName) :
    communicator(communicator),
    render(false)
    {
        spdlog::info("Creating Environment");
        auto makeParams = std::make_shared<MakeParam>();
        makeParams->envName = envName;
        communicator.sendRequest(Request<MakeParam>("make", makeParams));
        spdlog::info(communicator.getResponse<MakeResponse>()->result);

        communicator.sendRequest(Request<InfoParam>("info", std::make_shared<InfoParam>()));
        info = *communicator.getResponse<InfoResponse>();
        spdlog::info("Action space: {} - [{}]", info.actionSpaceType,
                     info.actionSpaceShape.empty() ? 0 : info.actionSpaceShape[0]);
        spdlog::info("Observation space: {} - {} dimensions", info.observationSpaceType,
                     info.observationSpaceShape.size());

        if (getObservationSize() <= 0)
        {
            throw std::runtime_error("Gym server reported an empty observation space");
        }
    }

    torch::Tensor GymEnvironment::toObservation(const std::vector<float> &values) const
    {
        if (static_cast<int64_t>(values.size()) != getObservationSize())
        {
            throw std::runtime_error("Gym server sent an observation of " + std::to_string(values.size()) +
                                     " elements, expected " + std::to_string(getObservationSize()));
        }
        return torch::tensor(values, torch::kFloat);
    }

    PoleBalancer::ResetResult GymEnvironment::reset()
    {
        communicator.sendRequest(Request<ResetParam>("reset", std::make_shared<ResetParam>()));
        auto response = communicator.getResponse<ResetResponse>();
        return {toObservation(response->observation), {}};
    }

    PoleBalancer::StepResult GymEnvironment::step(PoleBalancer::ActionId action)
    {
        auto stepParams = std::make_shared<StepParam>();
        stepParams->action = action;
        stepParams->render = render;
        communicator.sendRequest(Request<StepParam>("step", stepParams));

        auto response = communicator.getResponse<StepResponse>();
        return {toObservation(response->observation),
                response->reward,
                response->terminated,
                response->truncated,
                {}};
    }

    PoleBalancer::ActionSpace GymEnvironment::getActionSpace() const
    {
        return {info.actionSpaceType, info.actionSpaceShape};
    }

    int64_t GymEnvironment::getObservationSize() const
    {
        if (info.observationSpaceShape.empty())
        {
            return 0;
        }
        int64_t size = 1;
        for (auto dimension : info.observationSpaceShape)
        {
            size *= dimension;
        }
        return size;
    }

    // Server end of an inproc PAIR pair; replies are queued before the client asks
    class ScriptedServer
    {
    public:
        std::shared_ptr<zmq::context_t> context;
        zmq::socket_t socket;

        ScriptedServer() :
        context(std::make_shared<zmq::context_t>(1)),
        socket(*context, zmq::socket_type::pair)
        {
            socket.set(zmq::sockopt::linger, 0);
            socket.set(zmq::sockopt::rcvtimeo, 1000);
            socket.bind("inproc://gym");
        }

        template<class T>
        void reply(const T &response)
        {
            msgpack::sbuffer buffer;
            msgpack::pack(buffer, response);
            socket.send(zmq::buffer(buffer.data(), buffer.size()), zmq::send_flags::none);
        }

        std::map<std::string, msgpack::object> nextRequest(msgpack::object_handle &handle)
        {
            zmq::message_t message;
            if (!socket.recv(message, zmq::recv_flags::none))
            {
                throw std::runtime_error("No request reached the scripted server");
            }
            handle = msgpack::unpack(static_cast<const char *>(message.data()), message.size());
            return handle.get().as<std::map<std::string, msgpack::object>>();
        }
    };

    static InfoResponse cartPoleInfo()
    {
        return {"Discrete", {2}, "Box", {4}};
    }

    TEST_CASE("GymEnvironment")
    {
        ScriptedServer server;
        Communicator communicator(server.context, "inproc://gym", 50);

        SUBCASE("Construction reads the spaces")
        {
            server.reply(MakeResponse{"CartPole-v1 created"});
            server.reply(cartPoleInfo());
            GymEnvironment environment(communicator, "CartPole-v1");

            CHECK(environment.getObservationSize() == 4);
            CHECK(PoleBalancer::discreteActionCount(environment.getActionSpace()) == 2);
        }

        SUBCASE("Step sends the action and decodes the reply")
        {
            server.reply(MakeResponse{"CartPole-v1 created"});
            server.reply(cartPoleInfo());
            GymEnvironment environment(communicator, "CartPole-v1");
            environment.setRender(true);

            server.reply(StepResponse{{0.1f, 0.2f, 0.3f, 0.4f}, 1, true, false});
            auto result = environment.step(1);

            CHECK(torch::allclose(result.observation, torch::tensor({0.1f, 0.2f, 0.3f, 0.4f})));
            CHECK(result.reward == doctest::Approx(1));
            CHECK(result.terminated);
            CHECK(!result.truncated);

            msgpack::object_handle handle;
            CHECK(server.nextRequest(handle).at("method").as<std::string>() == "make");
            CHECK(server.nextRequest(handle).at("method").as<std::string>() == "info");
            auto request = server.nextRequest(handle);
            CHECK(request.at("method").as<std::string>() == "step");
            auto stepParams = request.at("param").as<StepParam>();
            CHECK(stepParams.action == 1);
            CHECK(stepParams.render);
        }

        SUBCASE("Observation of the wrong length throws")
        {
            server.reply(MakeResponse{"CartPole-v1 created"});
            server.reply(cartPoleInfo());
            GymEnvironment environment(communicator, "CartPole-v1");

            server.reply(ResetResponse{{0.1f, 0.2f, 0.3f}});
            CHECK_THROWS_AS(environment.reset(), std::runtime_error);
        }

        SUBCASE("Empty observation space throws")
        {
            server.reply(MakeResponse{"CartPole-v1 created"});
            server.reply(InfoResponse{"Discrete", {2}, "Box", {}});

            CHECK_THROWS_AS(GymEnvironment(communicator, "CartPole-v1"), std::runtime_error);
        }

        SUBCASE("Silent server throws")
        {
            CHECK_THROWS_AS(GymEnvironment(communicator, "CartPole-v1"), std::runtime_error);
        }
    }
}
