#include "common.h"


//==============================================================================
// class local_channel
//==============================================================================

rxcp::work_response rxcp::local_channel::invoke(const work_request& request)
{
    std::lock_guard<std::mutex> lock(_mutex);
    if (is_dispose_required()) {
        throw copy_error(error_kind::channel_failure, "Local channel for " + _host_id + " is closed");
    }
    return _executor.execute(request);
}

std::future<rxcp::work_response> rxcp::local_channel::invoke_async(work_request request)
{
    return std::async(
        std::launch::async,
        [this, request = std::move(request)]() -> work_response {
            return this->invoke(request);
        });
}

size_t rxcp::local_channel::open_handle_count()
{
    std::lock_guard<std::mutex> lock(_mutex);
    return _executor.open_handle_count();
}

void rxcp::local_channel::dispose_impl() noexcept /*override*/
{
    std::lock_guard<std::mutex> lock(_mutex);
    _executor.dispose();
}



//==============================================================================
// class remote_channel
//==============================================================================

/**

Client & agent handshake:

    C: Send: magic_1(4B) magic_2(4B) min_ver(2B) max_ver(2B)
    A: Send: ver(2B)

Protocol V1 (after a valid version):

    A: Send message_agent_information
    C: Send message_invoke_request, A: Send message_invoke_response
    ... (one request in flight at a time, until C closes the connection)
*/

void rxcp::remote_channel::connect()
{
    ASSERT(_sock == nullptr);

    if (!_agent_endpoint.resolve()) {
        throw copy_error(error_kind::channel_failure, "Can't resolve agent endpoint " + _agent_endpoint.to_string());
    }

    for (const infra::tcp_sockaddr& addr : _agent_endpoint.resolved_sockaddrs) {
        std::shared_ptr<infra::os_socket_t> sock = std::make_shared<infra::os_socket_t>();
        if (!sock->init_tcp(addr.family())) {
            LOG_WARN("Agent {}: socket init_tcp() failed (skipped)", addr.to_string());
            sock->dispose();
            continue;
        }

        if (!sock->connect(addr, &_connected_addr)) {
            LOG_WARN("Agent {}: connect() failed (skipped)", addr.to_string());
            sock->dispose();
            continue;
        }

        LOG_DEBUG("Connected to agent {} at {}", _agent_endpoint.to_string(), _connected_addr.to_string());
        _sock = std::move(sock);
        break;
    }

    if (!_sock) {
        throw copy_error(error_kind::channel_failure, "Can't connect to agent " + _agent_endpoint.to_string());
    }

    infra::sweeper error_cleanup = [&]() {
        _sock->dispose();
        _sock.reset();
    };

    //
    // Send greeting magics and supported protocol versions
    //
    {
        static constexpr const uint16_t CLIENT_MIN_PROTOCOL_VERSION = agent_protocol::version::V1;
        static constexpr const uint16_t CLIENT_MAX_PROTOCOL_VERSION = agent_protocol::version::V1;
        static_assert(CLIENT_MIN_PROTOCOL_VERSION <= CLIENT_MAX_PROTOCOL_VERSION);

        char buffer[12];
        *(uint32_t*)&buffer[0] = htonl(agent_protocol::GREETING_MAGIC_1);
        *(uint32_t*)&buffer[4] = htonl(agent_protocol::GREETING_MAGIC_2);
        *(uint16_t*)&buffer[8] = htons(CLIENT_MIN_PROTOCOL_VERSION);
        *(uint16_t*)&buffer[10] = htons(CLIENT_MAX_PROTOCOL_VERSION);
        if (!_sock->send(buffer, sizeof(buffer))) {
            throw copy_error(error_kind::channel_failure, "Send greeting to agent " + _agent_endpoint.to_string() + " failed");
        }
    }

    //
    // Receive chosen protocol version
    //
    {
        uint16_t version_be = 0;
        if (!_sock->recv(&version_be, sizeof(version_be))) {
            throw copy_error(error_kind::channel_failure, "Receive protocol version from agent " + _agent_endpoint.to_string() + " failed");
        }

        const uint16_t version = ntohs(version_be);
        if (version == agent_protocol::version::INVALID) {
            throw copy_error(error_kind::channel_failure, "Protocol version negotiation with agent " + _agent_endpoint.to_string() + " failed");
        }
        LOG_TRACE("Agent {} uses protocol version {}", _agent_endpoint.to_string(), version);
    }

    //
    // Receive agent information
    //
    {
        message_agent_information msg;
        if (!message_recv(_sock, msg)) {
            throw copy_error(error_kind::channel_failure, "Receive agent information from " + _agent_endpoint.to_string() + " failed");
        }

        _host_id = std::move(msg.host_id);
        _limits = msg.limits;
        LOG_DEBUG("Agent {} is host {}, max_received_data_per_command={}, max_received_object_size={}",
                  _agent_endpoint.to_string(), _host_id,
                  _limits.max_received_data_per_command, _limits.max_received_object_size);
    }

    error_cleanup.suppress_sweep();
}

rxcp::work_response rxcp::remote_channel::invoke(const work_request& request)
{
    std::lock_guard<std::mutex> lock(_mutex);

    if (_sock == nullptr || _broken || is_dispose_required()) {
        throw copy_error(error_kind::channel_failure, "Channel to agent " + _agent_endpoint.to_string() + " is not connected");
    }

    infra::sweeper mark_broken = [&]() {
        _broken = true;
    };

    message_invoke_request req;
    req.sequence = _next_sequence++;
    req.request = request;
    if (!message_send(_sock, req)) {
        throw copy_error(error_kind::channel_failure,
                         std::string("Send ") + work_name(request) + " to agent " + _agent_endpoint.to_string() + " failed");
    }

    message_invoke_response resp;
    if (!message_recv(_sock, resp)) {
        throw copy_error(error_kind::channel_failure,
                         std::string("Receive ") + work_name(request) + " response from agent " + _agent_endpoint.to_string() + " failed");
    }

    if (resp.sequence != req.sequence) {
        throw copy_error(error_kind::channel_failure,
                         "Agent " + _agent_endpoint.to_string() + " responded to request #" + std::to_string(resp.sequence) +
                         ", expects #" + std::to_string(req.sequence));
    }

    LOG_TRACE("Agent {}: {} #{} returns {}", _host_id, work_name(request), req.sequence, resp.response.error_code);
    mark_broken.suppress_sweep();
    return std::move(resp.response);
}

std::future<rxcp::work_response> rxcp::remote_channel::invoke_async(work_request request)
{
    return std::async(
        std::launch::async,
        [this, request = std::move(request)]() -> work_response {
            return this->invoke(request);
        });
}

void rxcp::remote_channel::dispose_impl() noexcept /*override*/
{
    if (_sock) {
        LOG_DEBUG("Close channel to agent {}", _agent_endpoint.to_string());
        _sock->dispose();
    }
}



//==============================================================================
// class session_registry
//==============================================================================

void rxcp::session_registry::add(const std::string& host_id, std::shared_ptr<execution_channel> channel)
{
    ASSERT(channel != nullptr);

    std::unique_lock<std::shared_mutex> lock(_channels_mutex);
    const std::string key = to_lower(host_id);
    if (_channels.count(key) > 0) {
        LOG_WARN("Session for host {} is replaced", host_id);
    }
    _channels[key] = std::move(channel);
    LOG_DEBUG("Session for host {} registered", host_id);
}

std::shared_ptr<rxcp::execution_channel> rxcp::session_registry::lookup(const host_ref& host) const
{
    std::shared_lock<std::shared_mutex> lock(_channels_mutex);
    const auto it = _channels.find(to_lower(host.id));
    if (it == _channels.end()) {
        throw copy_error(error_kind::no_open_session, "No open session for host " + host.id);
    }
    return it->second;
}

