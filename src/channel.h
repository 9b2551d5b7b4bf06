#if !defined(_RXCP_CHANNEL_H_INCLUDED_)
#define _RXCP_CHANNEL_H_INCLUDED_

#if !defined(_RXCP_COMMON_H_INCLUDED_)
#error "Please don't directly #include this file. Instead, #include common.h"
#endif  // !defined(_RXCP_COMMON_H_INCLUDED_)


namespace rxcp
{
    //
    // Payload limits advertised by the executing side; 0 means unset
    //
    struct channel_limits
    {
        uint64_t max_received_data_per_command = 0;
        uint64_t max_received_object_size = 0;

        RXCP_DEFAULT_SERIALIZATION(max_received_data_per_command, max_received_object_size)
    };


    //
    // A persistent handle bound to one host: state created by one invoke()
    // (like an open file handle) is visible to later invokes on the same channel.
    //
    // invoke() reports failures of the unit of work in the response, and throws
    // copy_error(channel_failure) only if the channel itself is broken.
    //
    class execution_channel
    {
    public:
        virtual ~execution_channel() noexcept = default;

        virtual work_response invoke(const work_request& request) = 0;
        virtual std::future<work_response> invoke_async(work_request request) = 0;

        [[nodiscard]]
        virtual const std::string& host_id() const noexcept = 0;

        [[nodiscard]]
        virtual channel_limits limits() const noexcept = 0;
    };


    //
    // Runs units of work in this process
    //
    class local_channel : public execution_channel, public infra::disposable
    {
    public:
        RXCP_DISABLE_COPY_CONSTRUCTOR(local_channel)
        RXCP_DISABLE_MOVE_CONSTRUCTOR(local_channel)

        explicit local_channel(std::string host_id, const channel_limits& limits = { })
            : _host_id(std::move(host_id)),
              _limits(limits)
        { }

        work_response invoke(const work_request& request) override;
        std::future<work_response> invoke_async(work_request request) override;

        [[nodiscard]]
        const std::string& host_id() const noexcept override { return _host_id; }

        [[nodiscard]]
        channel_limits limits() const noexcept override { return _limits; }

        [[nodiscard]]
        size_t open_handle_count();

        void dispose_impl() noexcept override final;
        ~local_channel() noexcept override final { this->dispose(); }

    private:
        const std::string _host_id;
        const channel_limits _limits;

        std::mutex _mutex { };
        work_executor _executor { };
    };


    //
    // Connection to an rxcpd agent
    //
    class remote_channel : public execution_channel, public infra::disposable
    {
    public:
        RXCP_DISABLE_COPY_CONSTRUCTOR(remote_channel)
        RXCP_DISABLE_MOVE_CONSTRUCTOR(remote_channel)

        explicit remote_channel(infra::tcp_endpoint agent_endpoint)
            : _agent_endpoint(std::move(agent_endpoint))
        { }

        // Connect and handshake. Throws copy_error(channel_failure)
        void connect();

        work_response invoke(const work_request& request) override;
        std::future<work_response> invoke_async(work_request request) override;

        [[nodiscard]]
        const std::string& host_id() const noexcept override { return _host_id; }

        [[nodiscard]]
        channel_limits limits() const noexcept override { return _limits; }

        void dispose_impl() noexcept override final;
        ~remote_channel() noexcept override final { this->dispose(); }

    private:
        infra::tcp_endpoint _agent_endpoint;
        infra::tcp_sockaddr _connected_addr { };
        std::shared_ptr<infra::os_socket_t> _sock { nullptr };

        std::string _host_id { };
        channel_limits _limits { };

        std::mutex _mutex { };
        uint64_t _next_sequence = 1;
        bool _broken = false;
    };


    //
    // Connected channels, by host id (case-insensitive)
    //
    class session_registry
    {
    public:
        RXCP_DISABLE_COPY_CONSTRUCTOR(session_registry)
        RXCP_DISABLE_MOVE_CONSTRUCTOR(session_registry)

        explicit session_registry(std::string local_host_id)
            : _local_host_id(std::move(local_host_id))
        { }

        void add(const std::string& host_id, std::shared_ptr<execution_channel> channel);

        // Throws copy_error(no_open_session)
        [[nodiscard]]
        std::shared_ptr<execution_channel> lookup(const host_ref& host) const;

        [[nodiscard]]
        const std::string& local_host_id() const noexcept { return _local_host_id; }

    private:
        const std::string _local_host_id;
        std::unordered_map<std::string, std::shared_ptr<execution_channel>> _channels { };
        mutable std::shared_mutex _channels_mutex { };
    };

}  // namespace rxcp


#endif  // !defined(_RXCP_CHANNEL_H_INCLUDED_)
