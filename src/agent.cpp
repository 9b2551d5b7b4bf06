#include "common.h"


//==============================================================================
// struct agent_connection
//==============================================================================

void rxcp::agent_connection::start()
{
    ASSERT(!_thread.joinable());

    _thread = std::thread([this]() {
        try {
            this->fn_serve();
        }
        catch (const std::exception& ex) {
            LOG_ERROR("Connection #{}: fn_serve() exception: {}", this->id, ex.what());
            // Don't PANIC_TERMINATE
        }
        _finished = true;
    });
}

bool rxcp::agent_connection::handshake()
{
    //
    // Receive greeting magics and client supported protocol version
    //
    uint16_t min_ver;
    uint16_t max_ver;
    {
        char buffer[12];
        if (!accepted_socket->recv(buffer, sizeof(buffer))) {
            LOG_ERROR("Connection #{}: receive greeting from peer {} failed", this->id, peer_endpoint.to_string());
            return false;
        }

        const uint32_t magic1 = ntohl(*(uint32_t*)&buffer[0]);
        const uint32_t magic2 = ntohl(*(uint32_t*)&buffer[4]);
        min_ver = ntohs(*(uint16_t*)&buffer[8]);
        max_ver = ntohs(*(uint16_t*)&buffer[10]);

        if (magic1 != agent_protocol::GREETING_MAGIC_1 || magic2 != agent_protocol::GREETING_MAGIC_2) {
            LOG_ERROR("Connection #{}: greeting magics from peer {} mismatched: "
                      "expects (0x{:08x}, 0x{:08x}), but got (0x{:08x}, 0x{:08x})",
                      this->id, peer_endpoint.to_string(),
                      agent_protocol::GREETING_MAGIC_1, agent_protocol::GREETING_MAGIC_2, magic1, magic2);
            return false;
        }
    }

    //
    // Choose protocol version
    //
    static constexpr const uint16_t AGENT_MIN_PROTOCOL_VERSION = agent_protocol::version::V1;
    static constexpr const uint16_t AGENT_MAX_PROTOCOL_VERSION = agent_protocol::version::V1;
    static_assert(AGENT_MIN_PROTOCOL_VERSION <= AGENT_MAX_PROTOCOL_VERSION);

    uint16_t protocol_version;
    if (min_ver > max_ver) {
        protocol_version = agent_protocol::version::INVALID;
        LOG_ERROR("Connection #{}: invalid protocol version range: min={}, max={} (min is larger than max)",
                  this->id, min_ver, max_ver);
    }
    else if (min_ver > AGENT_MAX_PROTOCOL_VERSION) {
        protocol_version = agent_protocol::version::INVALID;
        LOG_ERROR("Connection #{}: client protocol version is too high: [{}, {}], but agent only supports max={}",
                  this->id, min_ver, max_ver, AGENT_MAX_PROTOCOL_VERSION);
    }
    else if (max_ver < AGENT_MIN_PROTOCOL_VERSION) {
        protocol_version = agent_protocol::version::INVALID;
        LOG_ERROR("Connection #{}: client protocol version is too low: [{}, {}], but agent only supports min={}",
                  this->id, min_ver, max_ver, AGENT_MIN_PROTOCOL_VERSION);
    }
    else {
        // Use the highest protocol version
        protocol_version = std::min<uint16_t>(AGENT_MAX_PROTOCOL_VERSION, max_ver);
        LOG_DEBUG("Connection #{}: client protocol version range: [{}, {}], finally use {}",
                  this->id, min_ver, max_ver, protocol_version);
    }

    const uint16_t protocol_version_be = htons(protocol_version);
    if (!accepted_socket->send(&protocol_version_be, sizeof(protocol_version_be))) {
        LOG_ERROR("Connection #{}: send protocol version ({}) failed", this->id, protocol_version);
        return false;
    }
    if (protocol_version == agent_protocol::version::INVALID) {
        return false;
    }

    //
    // Tell the client who we are
    //
    message_agent_information msg;
    msg.host_id = agent.program_options->host_id;
    msg.limits = agent.program_options->limits;
    if (!message_send(accepted_socket, msg)) {
        LOG_ERROR("Connection #{}: send message_agent_information failed", this->id);
        return false;
    }

    LOG_TRACE("Connection #{}: sent message_agent_information", this->id);
    return true;
}

void rxcp::agent_connection::fn_serve()
{
    if (!handshake()) {
        return;
    }

    uint64_t served = 0;
    while (!is_dispose_required()) {
        message_invoke_request req;
        bool peer_closed = false;
        if (!message_recv(accepted_socket, req, &peer_closed)) {
            if (peer_closed) {
                LOG_DEBUG("Connection #{}: peer {} disconnected", this->id, peer_endpoint.to_string());
            }
            else if (!is_dispose_required()) {
                LOG_ERROR("Connection #{}: receive message_invoke_request failed", this->id);
            }
            break;
        }

        message_invoke_response resp;
        resp.sequence = req.sequence;
        resp.response = _executor.execute(req.request);

        if (!message_send(accepted_socket, resp)) {
            LOG_ERROR("Connection #{}: send message_invoke_response #{} failed", this->id, resp.sequence);
            break;
        }
        ++served;
    }

    LOG_DEBUG("Connection #{}: served {} units of work", this->id, served);
}

void rxcp::agent_connection::dispose_impl() noexcept /*override*/
{
    // Wake up the serving thread
    if (accepted_socket) {
        accepted_socket->dispose();
    }

    if (_thread.joinable()) {
        _thread.join();
    }

    // Close file handles left by the client
    _executor.dispose();
}



//==============================================================================
// struct agent_state
//==============================================================================

bool rxcp::agent_state::init()
{
    ASSERT(program_options->arg_portal.has_value());
    ASSERT(!program_options->arg_portal->resolved_sockaddrs.empty());

    bool bound = false;
    for (const infra::tcp_sockaddr& addr : program_options->arg_portal->resolved_sockaddrs) {
        _sock = std::make_shared<infra::os_socket_t>();

        infra::sweeper error_cleanup = [&]() {
            _sock->dispose();
            _sock.reset();
        };

        // Init socket
        if (!_sock->init_tcp(addr.family())) {
            LOG_WARN("Agent portal: socket init_tcp() failed (skipped)");
            continue;
        }

        // Bind to specified endpoint
        if (!_sock->bind(addr, &bound_local_endpoint)) {
            LOG_WARN("Agent portal: can't bind to {} (skipped)", addr.to_string());
            continue;
        }

        // Start listen()
        if (!_sock->listen(256)) {
            LOG_ERROR("Agent portal: listen() on {} failed (skipped)", addr.to_string());
            continue;
        }

        LOG_INFO("Agent portal {} binds to {}", program_options->arg_portal->to_string(), bound_local_endpoint.to_string());
        bound = true;
        error_cleanup.suppress_sweep();
        break;
    }

    if (!bound) {
        LOG_ERROR("Can't create and bind agent portal endpoint {}", program_options->arg_portal->to_string());
        return false;
    }

    //
    // Start a thread to accept on portal
    //
    _thread_accept = std::thread([this]() {
        try {
            this->fn_thread_accept();
        }
        catch (const std::exception& ex) {
            PANIC_TERMINATE("fn_thread_accept() exception: {}", ex.what());
        }
    });

    return true;
}

void rxcp::agent_state::dispose_impl() noexcept /*override*/
{
    // Stop agent portal socket
    if (_sock) {
        LOG_INFO("Close agent portal {} bound to {}", program_options->arg_portal->to_string(), bound_local_endpoint.to_string());
        _sock->dispose();
    }

    if (_thread_accept.joinable()) {
        _thread_accept.join();
    }

    // Close all connections
    LOG_DEBUG("Closing all connections...");
    {
        std::lock_guard<std::mutex> lock(_connections_mutex);
        for (std::shared_ptr<agent_connection>& conn : _connections) {
            conn->dispose();
            conn.reset();
        }
        _connections.clear();
    }
    LOG_DEBUG("All connections closed");
}

size_t rxcp::agent_state::connection_count()
{
    std::lock_guard<std::mutex> lock(_connections_mutex);
    return _connections.size();
}

void rxcp::agent_state::reap_finished_connections()
{
    std::lock_guard<std::mutex> lock(_connections_mutex);
    for (auto it = _connections.begin(); it != _connections.end(); ) {
        if ((*it)->is_finished()) {
            LOG_TRACE("Remove finished connection #{}", (*it)->id);
            (*it)->dispose();
            it = _connections.erase(it);
        }
        else {
            ++it;
        }
    }
}

void rxcp::agent_state::fn_thread_accept()
{
    LOG_TRACE("Agent portal accepting: {}", bound_local_endpoint.to_string());

    while (true) {
        infra::tcp_sockaddr peer_addr { };
        std::shared_ptr<infra::os_socket_t> accepted_sock = _sock->accept(&peer_addr);
        if (!accepted_sock) {
            if (is_dispose_required() || infra::sighandle::is_exit_required()) {
                LOG_DEBUG("Stop accept() on agent portal {}", bound_local_endpoint.to_string());
                break;
            }
            else {
                LOG_ERROR("Agent portal: accept() on {} failed", bound_local_endpoint.to_string());
                continue;
            }
        }
        LOG_DEBUG("Accepted from agent portal: {}", peer_addr.to_string());

        reap_finished_connections();

        std::shared_ptr<agent_connection> conn = std::make_shared<agent_connection>(*this, accepted_sock, peer_addr);
        {
            std::lock_guard<std::mutex> lock(_connections_mutex);
            _connections.emplace_back(conn);
        }
        conn->start();
    }
}
