#include "infra.h"



//==============================================================================
// get_local_host_name
//==============================================================================

std::string infra::get_local_host_name()
{
    char buffer[256] { };
    if (gethostname(buffer, sizeof(buffer) - 1) != 0) {
        LOG_ERROR("gethostname() failed. {}", os_socket_t::error_description());
        return { };
    }
    return std::string(buffer);
}



//==============================================================================
// struct tcp_sockaddr
//==============================================================================

void infra::tcp_sockaddr::set_port(const uint16_t port_in_host_endian) noexcept
{
    if (family() == AF_INET) {
        addr_ipv4().sin_port = htons(port_in_host_endian);
    }
    else if (family() == AF_INET6) {
        addr_ipv6().sin6_port = htons(port_in_host_endian);
    }
    else {
        PANIC_TERMINATE("BUG: Unknown family: {}", address()->sa_family);
    }
}

uint16_t infra::tcp_sockaddr::port() const noexcept
{
    if (family() == AF_INET) {
        return ntohs(addr_ipv4().sin_port);
    }
    else if (family() == AF_INET6) {
        return ntohs(addr_ipv6().sin6_port);
    }
    else {
        PANIC_TERMINATE("BUG: Unknown family: {}", address()->sa_family);
    }
}

socklen_t infra::tcp_sockaddr::socklen() const noexcept
{
    if (family() == AF_INET) {
        return sizeof(sockaddr_in);
    }
    else if (family() == AF_INET6) {
        return sizeof(sockaddr_in6);
    }
    else {
        PANIC_TERMINATE("BUG: Unknown family: {}", address()->sa_family);
    }
}

std::string infra::tcp_sockaddr::to_string() const
{
    char buffer[64];
    std::string result;

    if (family() == AF_INET) {
        if (inet_ntop(AF_INET, (void*)&addr_ipv4().sin_addr, buffer, sizeof(buffer)) == nullptr) {
            LOG_ERROR("inet_ntop(AF_INET) unexpectedly failed");
            return "FAILED_TO_STRING";
        }
        result = buffer;
        result += ":";
        result += std::to_string(ntohs(addr_ipv4().sin_port));
    }
    else if (family() == AF_INET6) {
        if (inet_ntop(AF_INET6, (void*)&addr_ipv6().sin6_addr, buffer, sizeof(buffer)) == nullptr) {
            LOG_ERROR("inet_ntop(AF_INET6) unexpectedly failed");
            return "FAILED_TO_STRING";
        }
        result = "[";
        result += buffer;
        result += "]:";
        result += std::to_string(ntohs(addr_ipv6().sin6_port));
    }
    else {
        PANIC_TERMINATE("BUG: Unknown family: {}", address()->sa_family);
    }

    return result;
}



//==============================================================================
// struct tcp_endpoint
//==============================================================================

bool infra::tcp_endpoint::parse(const std::string& value)
{
    // Valid format:
    //   <host>
    //   <host>:<port>
    //   <host>:*
    //
    // <host> is a host name, an IPv4 address, an IPv6 address in brackets, or '*'

    static const std::regex re_endpoint(
        R"(^((?:[A-Za-z0-9](?:[A-Za-z0-9\-]*[A-Za-z0-9])?\.)*[A-Za-z0-9](?:[A-Za-z0-9\-]*[A-Za-z0-9])?|\[[0-9A-Fa-f:.]+\]|\*)(?::([0-9]+|\*))?$)",
        std::regex::optimize);

    std::smatch match;
    if (!std::regex_match(value, match, re_endpoint)) {
        return false;
    }

    // NOTE: If host is IPv6 surrounded by '[' ']', DO NOT trim the beginning '[' and ending ']'
    // resolve() takes care of this
    host = match[1].str();

    const std::string port_str = match[2].str();
    if (port_str.empty()) {
        port = { };
    }
    else if (port_str == "*") {
        port = static_cast<uint16_t>(0);
    }
    else {
        try {
            const int port_int = std::stoi(port_str);
            if (port_int < 0 || port_int >= 65536) {
                return false;
            }
            port = static_cast<uint16_t>(port_int);
        }
        catch (const std::out_of_range& /*ex*/) {
            return false;
        }
    }

    return true;
}

bool infra::tcp_endpoint::resolve()
{
    ASSERT(this->port.has_value());

    std::vector<tcp_sockaddr> sockaddrs;

    // Special treat '*' as host
    if (this->host == "*") {
        // IPv6: [::]
        {
            tcp_sockaddr tmp { };
            tmp.addr_ipv6().sin6_family = AF_INET6;
            tmp.addr_ipv6().sin6_addr = in6addr_any;
            tmp.addr_ipv6().sin6_port = htons(this->port.value());
            sockaddrs.emplace_back(tmp);
        }
        // IPv4: 0.0.0.0
        {
            tcp_sockaddr tmp { };
            tmp.addr_ipv4().sin_family = AF_INET;
            tmp.addr_ipv4().sin_addr.s_addr = INADDR_ANY;
            tmp.addr_ipv4().sin_port = htons(this->port.value());
            sockaddrs.emplace_back(tmp);
        }
        this->resolved_sockaddrs = std::move(sockaddrs);
        return true;
    }

    addrinfo hint { };
    hint.ai_family = AF_UNSPEC;
    hint.ai_socktype = SOCK_STREAM;
    hint.ai_flags = AI_ADDRCONFIG;

    std::string str_host = this->host;
    if (str_host.size() >= 2 && str_host.front() == '[' && str_host.back() == ']') {
        // host is IPv6, trim the beginning '[' and ending ']'
        str_host = str_host.substr(1, str_host.size() - 2);
    }

    addrinfo* results = nullptr;
    const int ret = getaddrinfo(str_host.c_str(), nullptr, &hint, &results);
    if (ret != 0) {
        LOG_ERROR("getaddrinfo() '{}' failed with {} ({})", host, ret, gai_strerror(ret));
        return false;
    }

    const sweeper free_results = [&]() {
        freeaddrinfo(results);
    };

    for (addrinfo* p = results; p != nullptr; p = p->ai_next) {
        tcp_sockaddr tmp { };
        if (p->ai_family == AF_INET) {
            tmp.addr_ipv4() = *reinterpret_cast<sockaddr_in*>(p->ai_addr);
        }
        else if (p->ai_family == AF_INET6) {
            tmp.addr_ipv6() = *reinterpret_cast<sockaddr_in6*>(p->ai_addr);
        }
        else {
            LOG_WARN("Unknown ai_family: {} (ignored)", p->ai_family);
            continue;
        }
        tmp.set_port(this->port.value());
        sockaddrs.emplace_back(tmp);
    }

    this->resolved_sockaddrs = std::move(sockaddrs);
    return !this->resolved_sockaddrs.empty();
}

std::string infra::tcp_endpoint::to_string() const
{
    std::string result = host;
    if (port.has_value()) {
        result += ":";
        result += std::to_string(port.value());
    }
    return result;
}



//==============================================================================
// struct os_socket_t
//==============================================================================

void infra::os_socket_t::non_thread_safe_close() noexcept
{
#if PLATFORM_WINDOWS || PLATFORM_CYGWIN
    if (_sock != INVALID_SOCKET_VALUE) {
        (void)shutdown(_sock, SD_BOTH);
        (void)closesocket(_sock);
        _sock = INVALID_SOCKET_VALUE;
    }
#elif PLATFORM_LINUX
    if (_sock != INVALID_SOCKET_VALUE) {
        (void)shutdown(_sock, SHUT_RDWR);
        (void)close(_sock);
        _sock = INVALID_SOCKET_VALUE;
    }
#else
#   error "Unknown platform"
#endif
}

bool infra::os_socket_t::init_tcp(const uint16_t family)
{
    const int value_1 = 1;

    ASSERT(_sock == INVALID_SOCKET_VALUE);

    //
    // Create socket
    //
    _sock = socket(family, SOCK_STREAM, IPPROTO_TCP);
    if (_sock == INVALID_SOCKET_VALUE) {
        LOG_ERROR("socket() failed. {}", error_description());
        return false;
    }

    sweeper error_cleanup = [&]() {
        this->non_thread_safe_close();
    };

    //
    // Enable SO_REUSEADDR
    //
    if (setsockopt(_sock, SOL_SOCKET, SO_REUSEADDR, (const char*)&value_1, sizeof(value_1)) != 0) {
        LOG_ERROR("setsockopt(SO_REUSEADDR) failed. {}", error_description());
        return false;
    }

    //
    // Enable TCP_NODELAY: every unit of work is a small request waiting for its response
    //
    if (setsockopt(_sock, IPPROTO_TCP, TCP_NODELAY, (const char*)&value_1, sizeof(value_1)) != 0) {
        LOG_ERROR("setsockopt(TCP_NODELAY) failed. {}", error_description());
        return false;
    }

    //
    // Enable KeepAlive
    //
    if (setsockopt(_sock, SOL_SOCKET, SO_KEEPALIVE, (const char*)&value_1, sizeof(value_1)) != 0) {
        LOG_ERROR("setsockopt(SO_KEEPALIVE) failed. {}", error_description());
        return false;
    }

    error_cleanup.suppress_sweep();
    return true;
}

bool infra::os_socket_t::bind(const infra::tcp_sockaddr& addr, /*out,opt*/ infra::tcp_sockaddr* bound_addr)
{
    ASSERT(_sock != INVALID_SOCKET_VALUE);

    // Enable dual stack on IPv6
    enable_dual_stack_if_inet6(addr.family());

    if (::bind(_sock, addr.address(), addr.socklen()) != 0) {
        LOG_ERROR("bind() to {} failed. {}", addr.to_string(), error_description());
        return false;
    }

    // Get local endpoint (the port might be chosen by the OS)
    if (bound_addr) {
        *bound_addr = addr;
        socklen_t len = bound_addr->max_socklen();
        if (getsockname(_sock, bound_addr->address(), &len) != 0) {
            LOG_ERROR("bind() to {} succeeded but getsockname() failed. {}", addr.to_string(), error_description());
            return false;
        }
    }

    return true;
}

bool infra::os_socket_t::listen(const int backlog)
{
    ASSERT(_sock != INVALID_SOCKET_VALUE);

    if (::listen(_sock, backlog) != 0) {
        LOG_ERROR("listen(backlog={}) failed. {}", backlog, error_description());
        return false;
    }

    return true;
}

std::shared_ptr<infra::os_socket_t> infra::os_socket_t::accept(/*out,opt*/ tcp_sockaddr* const remote_addr)
{
    // _sock might be INVALID_SOCKET_VALUE if already disposed

    sockaddr* addr = nullptr;
    socklen_t dummy_len;
    socklen_t* plen = nullptr;
    if (remote_addr) {
        addr = remote_addr->address();
        dummy_len = remote_addr->max_socklen();
        plen = &dummy_len;
    }

    const socket_t new_sock = ::accept(_sock, addr, plen);
    if (new_sock == INVALID_SOCKET_VALUE) {
        LOG_DEBUG("accept() failed. {}", error_description());
        return nullptr;
    }

    return std::make_shared<os_socket_t>(new_sock);
}

bool infra::os_socket_t::connect(const tcp_sockaddr& addr, /*out,opt*/ tcp_sockaddr* remote_addr)
{
    ASSERT(_sock != INVALID_SOCKET_VALUE);

    // Enable dual stack on IPv6
    enable_dual_stack_if_inet6(addr.family());

    if (::connect(_sock, addr.address(), addr.socklen()) != 0) {
        LOG_ERROR("connect() to {} failed. {}", addr.to_string(), error_description());
        return false;
    }

    if (remote_addr) {
        socklen_t len = remote_addr->max_socklen();
        if (getpeername(_sock, remote_addr->address(), &len) != 0) {
            LOG_ERROR("connect() to {} succeeded but getpeername() failed. {}", addr.to_string(), error_description());
            return false;
        }
    }

    return true;
}

bool infra::os_socket_t::recv(void* const ptr, const uint32_t size, /*out,opt*/ bool* const peer_closed)
{
    if (peer_closed) {
        *peer_closed = false;
    }

    uint32_t received = 0;
    while (received < size) {
        const int ret = (int)::recv(_sock, (char*)ptr + received, (int)(size - received), MSG_WAITALL);
        if (ret == 0) {
            if (peer_closed) {
                *peer_closed = true;
            }
            LOG_DEBUG("recv() got end of stream after {} of {} bytes", received, size);
            return false;
        }
        if (ret < 0) {
#if PLATFORM_LINUX
            if (errno == EINTR) continue;
#endif
            LOG_ERROR("recv() expects {} more bytes, but returns {}. {}", size - received, ret, error_description());
            return false;
        }
        received += (uint32_t)ret;
    }

    return true;
}

void infra::os_socket_t::enable_dual_stack_if_inet6(const uint16_t family)
{
    // If not IPv6, do nothing
    if (family != AF_INET6) {
        return;
    }

    const int value_0 = 0;
    if (setsockopt(_sock, IPPROTO_IPV6, IPV6_V6ONLY, (const char*)&value_0, sizeof(value_0)) != 0) {
        LOG_WARN("setsockopt(IPV6_V6ONLY) to 0 failed. {}", error_description());
    }
}

bool infra::os_socket_t::internal_sendv(void* const vec, const uint32_t vec_count, const uint64_t expected_written)
{
#if PLATFORM_WINDOWS || PLATFORM_CYGWIN
    DWORD sent = 0;
    const int ret = WSASend(_sock, (LPWSABUF)vec, vec_count, &sent, 0, NULL, NULL);
    if (ret != 0) {
        LOG_ERROR("WSASend({} parts, totally {} bytes) failed with {}. {}",
                  vec_count, expected_written, ret, error_description());
        return false;
    }
    if ((uint64_t)sent != expected_written) {
        LOG_ERROR("WSASend() expected to send {} bytes, actually sent {} bytes", expected_written, sent);
        return false;
    }

#elif PLATFORM_LINUX
    iovec* iov = (iovec*)vec;
    uint32_t iov_count = vec_count;
    uint64_t written = 0;

    while (written < expected_written) {
        msghdr msg { };
        msg.msg_iov = iov;
        msg.msg_iovlen = iov_count;

        // MSG_NOSIGNAL: a closed peer is reported as EPIPE instead of SIGPIPE
        const ssize_t cnt = sendmsg(_sock, &msg, MSG_NOSIGNAL);
        if (cnt < 0) {
            if (errno == EINTR) continue;
            LOG_ERROR("sendmsg({} parts) expects to send {} more bytes, but failed. {}",
                      iov_count, expected_written - written, error_description());
            return false;
        }
        written += (uint64_t)cnt;

        // Skip fully sent parts, and adjust the partially sent one
        size_t remain = (size_t)cnt;
        while (iov_count > 0 && remain >= iov->iov_len) {
            remain -= iov->iov_len;
            ++iov;
            --iov_count;
        }
        if (iov_count > 0) {
            iov->iov_base = (char*)iov->iov_base + remain;
            iov->iov_len -= remain;
        }
    }

#else
#   error "Unknown platform"
#endif

    return true;
}
