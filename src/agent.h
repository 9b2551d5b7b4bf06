#if !defined(_RXCP_AGENT_H_INCLUDED_)
#define _RXCP_AGENT_H_INCLUDED_

#if !defined(_RXCP_COMMON_H_INCLUDED_)
#error "Please don't directly #include this file. Instead, #include common.h"
#endif  // !defined(_RXCP_COMMON_H_INCLUDED_)

namespace rxcp
{
    struct agent_state;
    struct rxcpd_program_options;

    //
    // One connected client. Owns its own handle table for the connection's lifetime.
    //
    struct agent_connection : infra::disposable
    {
    public:
        RXCP_DISABLE_COPY_CONSTRUCTOR(agent_connection)
        RXCP_DISABLE_MOVE_CONSTRUCTOR(agent_connection)

        agent_connection(
            agent_state& agent,
            std::shared_ptr<infra::os_socket_t> accepted_socket,
            const infra::tcp_sockaddr& peer_endpoint) noexcept
            : agent(agent),
              peer_endpoint(peer_endpoint),
              accepted_socket(std::move(accepted_socket)),
              id(__next_id++)
        { }

        void start();
        void dispose_impl() noexcept override final;
        ~agent_connection() noexcept override final { this->dispose(); }

        [[nodiscard]]
        bool is_finished() const noexcept { return _finished; }

    private:
        void fn_serve();
        bool handshake();

    public:
        agent_state& agent;
        const infra::tcp_sockaddr peer_endpoint;
        std::shared_ptr<infra::os_socket_t> accepted_socket;
        const uint64_t id;

    private:
        std::thread _thread { };
        work_executor _executor { };
        std::atomic_bool _finished { false };

        static inline std::atomic_uint64_t __next_id { 1 };
    };


    struct agent_state : infra::disposable
    {
    public:
        RXCP_DISABLE_COPY_CONSTRUCTOR(agent_state)
        RXCP_DISABLE_MOVE_CONSTRUCTOR(agent_state)

        explicit agent_state(std::shared_ptr<rxcpd_program_options> program_options)
            : program_options(std::move(program_options))
        { }

        bool init();
        void dispose_impl() noexcept override final;
        ~agent_state() noexcept override final { this->dispose(); }

        [[nodiscard]]
        size_t connection_count();

    private:
        void fn_thread_accept();
        void reap_finished_connections();

    public:
        std::shared_ptr<rxcpd_program_options> program_options;
        infra::tcp_sockaddr bound_local_endpoint { };

    private:
        std::thread _thread_accept { };
        std::shared_ptr<infra::os_socket_t> _sock { nullptr };

        std::vector<std::shared_ptr<agent_connection>> _connections { };
        std::mutex _connections_mutex { };
    };

}  // namespace rxcp

#endif  // !defined(_RXCP_AGENT_H_INCLUDED_)
