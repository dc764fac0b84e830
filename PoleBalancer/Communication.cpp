//
// Created by moinshaikh on 3/8/26.
//

#include<map>
#include<memory>
#include<string>
#include<utility>

#include"Communication.hpp"

#include<doctest/doctest.h>
#include<msgpack.hpp>
#include<spdlog/spdlog.h>
#include<zmq.hpp>

namespace GymClient
{
    Communicator::Communicator(const std::string &url, int timeoutMs) :
    Communicator(std::make_shared<zmq::context_t>(1), url, timeoutMs)
    {
    }

    Communicator::Communicator(std::shared_ptr<zmq::context_t> context, const std::string &url, int timeoutMs) :
    context(std::move(context))
    {
        socket = std::make_unique<zmq::socket_t>(*this->context, zmq::socket_type::pair);

        socket->set(zmq::sockopt::rcvtimeo, timeoutMs);
        socket->set(zmq::sockopt::linger, 0);

        socket->connect(url);
        spdlog::info("Connected to gym environment at: {}", url);
    }

    TEST_CASE("Communicator")
    {
        auto context = std::make_shared<zmq::context_t>(1);
        zmq::socket_t server(*context, zmq::socket_type::pair);
        server.set(zmq::sockopt::linger, 0);
        server.bind("inproc://gym");
        Communicator communicator(context, "inproc://gym", 50);

        SUBCASE("Request reaches the server as a map")
        {
            auto makeParams = std::make_shared<MakeParam>();
            makeParams->envName = "CartPole-v1";
            communicator.sendRequest(Request<MakeParam>("make", makeParams));

            zmq::message_t message;
            REQUIRE(server.recv(message, zmq::recv_flags::none).has_value());
            auto handle = msgpack::unpack(static_cast<const char *>(message.data()), message.size());
            auto fields = handle.get().as<std::map<std::string, msgpack::object>>();
            CHECK(fields.at("method").as<std::string>() == "make");
            CHECK(fields.at("param").as<MakeParam>().envName == "CartPole-v1");
        }

        SUBCASE("Reply decodes into the response type")
        {
            msgpack::sbuffer buffer;
            msgpack::pack(buffer, MakeResponse{"CartPole-v1 created"});
            server.send(zmq::buffer(buffer.data(), buffer.size()), zmq::send_flags::none);

            CHECK(communicator.getResponse<MakeResponse>()->result == "CartPole-v1 created");
        }

        SUBCASE("Missing reply times out")
        {
            CHECK_THROWS_AS(communicator.getResponse<MakeResponse>(), std::runtime_error);
        }

        SUBCASE("Bytes that are not MessagePack throw")
        {
            const char garbage[] = {'\xc1'};
            server.send(zmq::buffer(garbage, sizeof(garbage)), zmq::send_flags::none);

            CHECK_THROWS_AS(communicator.getResponse<MakeResponse>(), std::runtime_error);
        }

        SUBCASE("Reply of the wrong shape throws")
        {
            msgpack::sbuffer buffer;
            msgpack::pack(buffer, 42);
            server.send(zmq::buffer(buffer.data(), buffer.size()), zmq::send_flags::none);

            CHECK_THROWS_AS(communicator.getResponse<StepResponse>(), std::runtime_error);
        }
    }
}
