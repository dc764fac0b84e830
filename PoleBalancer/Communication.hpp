#pragma once
/**
 * @file Communication.hpp
 * @brief ZeroMQ-based communication client for gym environment interaction
 * @author moinshaikh
 * @date 3/8/26
 *
 * This file implements a communication client using ZeroMQ for interacting with
 * gym environment servers. It provides templated methods for sending requests
 * and receiving responses using MessagePack serialization.
 */

#ifndef POLEBALANCER_COMMUNICATION_HPP
#define POLEBALANCER_COMMUNICATION_HPP

#include<cstring>
#include<exception>
#include<memory>
#include<stdexcept>
#include<string>

#include<msgpack.hpp>
#include<spdlog/spdlog.h>
#include<zmq.hpp>

#include"Request.hpp"

namespace GymClient
{
    /**
     * @class Communicator
     * @brief ZeroMQ PAIR client for a gym environment server
     *
     * Usage pattern:
     * 1. Create Communicator with server URL
     * 2. Send requests using sendRequest<T>()
     * 3. Receive the reply using getResponse<T>()
     *
     * Every reply must arrive within the receive timeout. A timeout, a socket
     * error or a reply that does not decode into the expected type throws
     * std::runtime_error; the socket is closed when the Communicator is
     * destroyed.
     */
    class Communicator
    {
    private:
        std::shared_ptr<zmq::context_t> context; ///< ZeroMQ context for socket management
        std::unique_ptr<zmq::socket_t> socket;   ///< ZeroMQ socket for communication

    public:
        /**
         * @brief Connects to a gym server
         * @param url The ZeroMQ server URL (e.g., "tcp://127.0.0.1:10201")
         * @param timeoutMs Receive timeout in milliseconds
         *
         * @throws zmq::error_t if socket creation or connection fails
         */
        explicit Communicator(const std::string &url, int timeoutMs = 5000);

        /**
         * @brief Connects to a gym server through an existing context
         *
         * Needed for inproc:// endpoints, which only reach sockets of the same
         * context.
         *
         * @param context Context the socket is created in, kept alive by the Communicator
         * @param url The ZeroMQ server URL
         * @param timeoutMs Receive timeout in milliseconds
         */
        Communicator(std::shared_ptr<zmq::context_t> context, const std::string &url, int timeoutMs = 5000);

        /**
         * @brief Receive and deserialize typed response from server
         * @tparam T Response type, must be MessagePack-serializable
         * @return Deserialized response
         *
         * @throws std::runtime_error on timeout, socket error or decoding failure
         */
        template <typename T>
        std::unique_ptr<T> getResponse()
        {
            zmq::message_t packedMessage;
            zmq::recv_result_t received;
            try
            {
                received = socket->recv(packedMessage, zmq::recv_flags::none);
            }
            catch (const zmq::error_t &e)
            {
                spdlog::error("ZMQ error receiving response: {}", e.what());
                throw std::runtime_error(std::string("Failed to receive from gym server: ") + e.what());
            }
            if (!received)
            {
                spdlog::error("Timeout waiting for response from gym server");
                throw std::runtime_error("Timeout waiting for response from gym server");
            }

            auto response = std::make_unique<T>();
            try
            {
                msgpack::object_handle objectHandle = msgpack::unpack(static_cast<const char *>(packedMessage.data()), packedMessage.size());
                objectHandle.get().convert(*response);
            }
            catch (const std::exception &e)
            {
                spdlog::error("Communication error: {}", e.what());
                throw std::runtime_error(std::string("Malformed response from gym server: ") + e.what());
            }
            return response;
        }

        /**
         * @brief Serialize and send request to server
         * @tparam T The request parameter type
         * @param request The Request object containing method and parameters
         *
         * @throws zmq::error_t if sending fails
         */
        template<class T>
        void sendRequest(const Request<T> &request)
        {
            msgpack::sbuffer buffer;
            msgpack::pack(buffer, request);

            zmq::message_t message(buffer.size());
            std::memcpy(message.data(), buffer.data(), buffer.size());

            socket->send(message, zmq::send_flags::none);
        }
    };
}

#endif //POLEBALANCER_COMMUNICATION_HPP
