#if !defined(_RXCP_INFRA_NETWORK_H_INCLUDED_)
#define _RXCP_INFRA_NETWORK_H_INCLUDED_

#if !defined(_RXCP_INFRA_INFRA_H_INCLUDED_)
#error "Please don't directly #include this file. Instead, #include infra.h"
#endif  // !defined(_RXCP_INFRA_INFRA_H_INCLUDED_)


namespace infra
{
    inline void global_initialize_network()
    {
#if PLATFORM_WINDOWS || PLATFORM_CYGWIN
        const WORD wVersionRequested = MAKEWORD(2, 2);
        WSADATA wsaData { };
        const int ret = WSAStartup(wVersionRequested, &wsaData);
        if (ret != 0) {
            LOG_ERROR("WSAStartup() failed with {} ({})", ret, str_getlasterror(ret));
            throw std::system_error(std::error_code(ret, std::system_category()), "WSAStartup() failed");
        }
#elif PLATFORM_LINUX
#else
#   error "Unknown platform"
#endif
    }

    inline void global_finalize_network() noexcept
    {
#if PLATFORM_WINDOWS || PLATFORM_CYGWIN
        if (WSACleanup() != 0) {
            const int wsagle = WSAGetLastError();
            LOG_ERROR("WSACleanup() failed. WSAGetLastError = {} ({})", wsagle, str_getlasterror(wsagle));
        }
#elif PLATFORM_LINUX
#else
#   error "Unknown platform"
#endif
    }

    // Host name of the local machine; empty on failure
    [[nodiscard]]
    std::string get_local_host_name();


    struct tcp_sockaddr
    {
    public:
        RXCP_DEFAULT_COPY_CONSTRUCTOR(tcp_sockaddr)
        RXCP_DEFAULT_MOVE_CONSTRUCTOR(tcp_sockaddr)
        tcp_sockaddr() = default;

        void set_port(uint16_t port_in_host_endian) noexcept;
        [[nodiscard]]
        uint16_t port() const noexcept;

        [[nodiscard]]
        uint16_t family() const noexcept { return _addr.ss_family; }

        [[nodiscard]]
        const sockaddr* address() const noexcept { return (const sockaddr*)&_addr; }

        [[nodiscard]]
        sockaddr* address() noexcept { return (sockaddr*)&_addr; }

        [[nodiscard]]
        sockaddr_in& addr_ipv4() noexcept { return *(sockaddr_in*)&_addr; }
        [[nodiscard]]
        const sockaddr_in& addr_ipv4() const noexcept { return *(const sockaddr_in*)&_addr; }

        [[nodiscard]]
        sockaddr_in6& addr_ipv6() noexcept { return *(sockaddr_in6*)&_addr; }
        [[nodiscard]]
        const sockaddr_in6& addr_ipv6() const noexcept { return *(const sockaddr_in6*)&_addr; }

        [[nodiscard]]
        socklen_t socklen() const noexcept;

        [[nodiscard]]
        socklen_t max_socklen() const noexcept { return (socklen_t)sizeof(sockaddr_storage); }

        [[nodiscard]]
        std::string to_string() const;

    private:
        sockaddr_storage _addr { };
    };


    struct tcp_endpoint
    {
    public:
        std::string host { };
        std::optional<uint16_t> port { };
        std::vector<tcp_sockaddr> resolved_sockaddrs;

    public:
        RXCP_DEFAULT_COPY_CONSTRUCTOR(tcp_endpoint)
        RXCP_DEFAULT_MOVE_CONSTRUCTOR(tcp_endpoint)
        tcp_endpoint() = default;

        bool parse(const std::string& value);
        bool resolve();

        [[nodiscard]]
        std::string to_string() const;
    };



    //
    // OS-specific "socket" type
    //
    struct socket_io_vec
    {
        const void* ptr { };
        size_t len { };

        socket_io_vec() noexcept = default;
        socket_io_vec(const void* const ptr, const size_t len) noexcept
            : ptr(ptr), len(len)
        { }
    };

    struct os_socket_t : disposable
    {
    private:
#if PLATFORM_WINDOWS || PLATFORM_CYGWIN
        typedef SOCKET socket_t;
        static constexpr const SOCKET INVALID_SOCKET_VALUE = INVALID_SOCKET;

#elif PLATFORM_LINUX
        typedef int socket_t;
        static constexpr const int INVALID_SOCKET_VALUE = -1;

#else
#   error "Unknown platform"
#endif

    public:
#if PLATFORM_WINDOWS || PLATFORM_CYGWIN
        static std::string error_description(const DWORD wsagle) {
            return std::string("WSAGetLastError = ") + std::to_string(wsagle) + " (" + str_getlasterror(wsagle) + ")";
        }
        static std::string error_description() {
            return error_description(WSAGetLastError());
        }

#elif PLATFORM_LINUX
        static std::string error_description(const int err) {
            return std::string("errno = ") + std::to_string(err) + " (" + strerror(err) + ")";
        }
        static std::string error_description() {
            return error_description(errno);
        }

#else
#   error "Unknown platform"
#endif

    public:
        RXCP_DISABLE_COPY_CONSTRUCTOR(os_socket_t)
        RXCP_DISABLE_MOVE_CONSTRUCTOR(os_socket_t)
        os_socket_t() noexcept = default;
        explicit os_socket_t(const socket_t sock) noexcept : _sock(sock) { }

        void dispose_impl() noexcept override final { this->non_thread_safe_close(); }
        ~os_socket_t() override final { this->dispose(); }

        bool init_tcp(uint16_t family);
        bool bind(const tcp_sockaddr& addr, /*out,opt*/tcp_sockaddr* bound_addr);
        bool listen(int backlog);
        std::shared_ptr<os_socket_t> accept(/*out,opt*/ tcp_sockaddr* remote_addr);
        bool connect(const tcp_sockaddr& addr, /*out,opt*/tcp_sockaddr* remote_addr);

        // Returns false on error or if the peer closed the connection (peer_closed is set then)
        bool recv(void* ptr, uint32_t size, /*out,opt*/bool* peer_closed = nullptr);

        bool send(const void* ptr, const uint32_t size) {
            const socket_io_vec vec[1] { { ptr, size } };
            return sendv(vec);
        }

#if PLATFORM_WINDOWS || PLATFORM_CYGWIN
        template<uint32_t _N>
        bool sendv(const socket_io_vec (&vec)[_N]) {
            WSABUF buffers[_N];
            uint64_t expected_written = 0;
            for (uint32_t i = 0; i < _N; ++i) {
                buffers[i].buf = (char*)vec[i].ptr;
                ASSERT(vec[i].len <= ULONG_MAX);
                buffers[i].len = (ULONG)vec[i].len;
                expected_written += vec[i].len;
            }
            return internal_sendv((void*)buffers, _N, expected_written);
        }
#elif PLATFORM_LINUX
        template<uint32_t _N>
        bool sendv(const socket_io_vec (&vec)[_N]) {
            iovec buffers[_N];
            uint64_t expected_written = 0;
            for (uint32_t i = 0; i < _N; ++i) {
                buffers[i].iov_base = (void*)vec[i].ptr;
                buffers[i].iov_len = vec[i].len;
                expected_written += vec[i].len;
            }
            return internal_sendv((void*)buffers, _N, expected_written);
        }
#else
#   error "Unknown platform"
#endif

    private:
        bool internal_sendv(void* vec, uint32_t vec_count, uint64_t expected_written);
        void enable_dual_stack_if_inet6(uint16_t family);
        void non_thread_safe_close() noexcept;

    private:
        socket_t _sock = INVALID_SOCKET_VALUE;
    };

}  // namespace infra


#endif  // !defined(_RXCP_INFRA_NETWORK_H_INCLUDED_)
