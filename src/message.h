#if !defined(_RXCP_MESSAGE_H_INCLUDED_)
#define _RXCP_MESSAGE_H_INCLUDED_

#if !defined(_RXCP_COMMON_H_INCLUDED_)
#error "Please don't directly #include this file. Instead, #include common.h"
#endif  // !defined(_RXCP_COMMON_H_INCLUDED_)


namespace rxcp
{
    struct agent_protocol
    {
        static constexpr const uint32_t GREETING_MAGIC_1 = 0x72786370;  // "rxcp"
        static constexpr const uint32_t GREETING_MAGIC_2 = 0x9d3a61c4;

        struct version
        {
            static constexpr const uint16_t INVALID = 0x0000;
            static constexpr const uint16_t V1 = 0x0001;
        };

        // Largest message body accepted from a peer
        static constexpr const uint32_t MAX_MESSAGE_SIZE = 256 * 1024 * 1024;
    };

    enum class message_type : std::uint32_t
    {
        AGENT_INFORMATION = 0,
        INVOKE_REQUEST = 1,
        INVOKE_RESPONSE = 2,
    };

    template<message_type _MessageType>
    struct message_base
    {
        static constexpr const message_type type = _MessageType;
    };

    struct message_agent_information : message_base<message_type::AGENT_INFORMATION>
    {
        std::string host_id;
        channel_limits limits;

        RXCP_DEFAULT_SERIALIZATION(host_id, limits)
    };

    struct message_invoke_request : message_base<message_type::INVOKE_REQUEST>
    {
        uint64_t sequence = 0;
        work_request request;

        RXCP_DEFAULT_SERIALIZATION(sequence, request)
    };

    struct message_invoke_response : message_base<message_type::INVOKE_RESPONSE>
    {
        uint64_t sequence = 0;
        work_response response;

        RXCP_DEFAULT_SERIALIZATION(sequence, response)
    };



    template<typename T>
    inline bool message_send(const std::shared_ptr<infra::os_socket_t>& sock, const T& msg)
    {
        const message_type type = T::type;

        std::string binary;
        try {
            std::ostringstream oss(std::ios::binary);
            {
                cereal::PortableBinaryOutputArchive ar(oss);
                ar(msg);
            }
            binary = oss.str();
        }
        catch (const cereal::Exception& ex) {
            PANIC_TERMINATE("Serialization exception: {}", ex.what());
        }

        if (binary.size() > agent_protocol::MAX_MESSAGE_SIZE) {
            LOG_ERROR("Message ({} bytes) is too large to send", binary.size());
            return false;
        }

        const uint32_t binary_size = (uint32_t)binary.size();

        char header[8];
        *(std::uint32_t*)&header[0] = htonl((std::uint32_t)type);
        *(std::uint32_t*)&header[4] = htonl(binary_size);

        const infra::socket_io_vec vec[2] {
            { header, sizeof(header) },
            { binary.data(), binary_size },
        };
        if (!sock->sendv(vec)) {
            LOG_ERROR("message_send: sendv() failed");
            return false;
        }

        return true;
    }


    // peer_closed is set if the peer closed the connection before the header
    template<typename T>
    inline bool message_recv(const std::shared_ptr<infra::os_socket_t>& sock, /*out*/ T& msg, /*out,opt*/ bool* peer_closed = nullptr)
    {
        const message_type expected_type = T::type;

        char header[8];
        if (!sock->recv(header, sizeof(header), peer_closed)) {
            if (peer_closed && *peer_closed) {
                LOG_DEBUG("message_recv: peer closed the connection");
            }
            else {
                LOG_ERROR("message_recv: recv() message header failed");
            }
            return false;
        }

        const message_type type = (message_type)ntohl(*(std::uint32_t*)&header[0]);
        const uint32_t binary_size = ntohl(*(std::uint32_t*)&header[4]);

        if (type != expected_type) {
            LOG_ERROR("Expects message type {}, but got message type {}",
                      (std::uint32_t)expected_type, (std::uint32_t)type);
            return false;
        }
        if (binary_size > agent_protocol::MAX_MESSAGE_SIZE) {
            LOG_ERROR("Message body of {} bytes is too large", binary_size);
            return false;
        }

        std::string binary;
        binary.resize(binary_size);
        if (binary_size > 0 && !sock->recv(binary.data(), binary_size)) {
            LOG_ERROR("message_recv: recv() message body failed");
            return false;
        }

        try {
            std::istringstream iss(binary, std::ios::binary);
            cereal::PortableBinaryInputArchive ar(iss);
            ar(msg);
        }
        catch (const cereal::Exception& ex) {
            LOG_ERROR("Deserialization exception: {}", ex.what());
            return false;
        }

        return true;
    }

}  // namespace rxcp


#endif  // !defined(_RXCP_MESSAGE_H_INCLUDED_)
