#if !defined(_RXCP_INFRA_SIGHANDLE_H_INCLUDED_)
#define _RXCP_INFRA_SIGHANDLE_H_INCLUDED_

#if !defined(_RXCP_INFRA_INFRA_H_INCLUDED_)
#error "Please don't directly #include this file. Instead, #include infra.h"
#endif  // !defined(_RXCP_INFRA_INFRA_H_INCLUDED_)


namespace infra
{
    class sighandle
    {
    private:
        static inline manual_reset_event __exit_required { false };

#if PLATFORM_LINUX || PLATFORM_CYGWIN
        static void stop_handler(
            const int sig,
            [[maybe_unused]] siginfo_t* const info,
            [[maybe_unused]] void* const ucontext)
        {
            LOG_INFO("Caught signal: {}", sig);
            require_exit();
        }
#elif PLATFORM_WINDOWS
        static void stop_handler(const int sig)
        {
            LOG_INFO("Caught signal: {}", sig);
            require_exit();
        }
#else
#   error "Unknown platform"
#endif

    public:
        static void wait_for_exit_required()
        {
            __exit_required.wait();
        }

        static void require_exit()
        {
            __exit_required.set();
        }

        static bool is_exit_required() noexcept
        {
            return __exit_required.is_set();
        }

        static void setup_signal_handler()
        {
#if PLATFORM_LINUX || PLATFORM_CYGWIN
            #define _SETUP_FOR_SIGNAL(_Signal_) \
                do { \
                    struct sigaction act { }; \
                    act.sa_flags = SA_RESTART | SA_SIGINFO; \
                    act.sa_sigaction = &stop_handler; \
                    if (sigaction((_Signal_), &act, nullptr) != 0) { \
                        LOG_ERROR("sigaction() for {} failed: errno = {} ({})", #_Signal_, errno, strerror(errno)); \
                        THROW_SYSTEM_ERROR(errno, sigaction); \
                    } \
                    LOG_TRACE("Setup signal handler for {}", #_Signal_); \
                } while(false)

            _SETUP_FOR_SIGNAL(SIGINT);
            _SETUP_FOR_SIGNAL(SIGTERM);
            _SETUP_FOR_SIGNAL(SIGQUIT);

            #undef _SETUP_FOR_SIGNAL

            // A peer closing its channel must not kill the agent
            if (signal(SIGPIPE, SIG_IGN) == SIG_ERR) {
                LOG_ERROR("signal() for SIGPIPE failed: errno = {} ({})", errno, strerror(errno));
                THROW_SYSTEM_ERROR(errno, signal);
            }
            LOG_TRACE("Ignore signal: SIGPIPE");

#elif PLATFORM_WINDOWS

            #define _SETUP_FOR_SIGNAL(_Signal_) \
                do { \
                    if (signal((_Signal_), stop_handler) == SIG_ERR) { \
                        LOG_ERROR("signal() for {} failed: errno = {} ({})", #_Signal_, errno, strerror(errno)); \
                        THROW_SYSTEM_ERROR(errno, signal); \
                    } \
                    LOG_TRACE("Setup signal handler for {}", #_Signal_); \
                } while(false)

            _SETUP_FOR_SIGNAL(SIGINT);
            _SETUP_FOR_SIGNAL(SIGTERM);

            #undef _SETUP_FOR_SIGNAL
#else
#   error "Unknown platform"
#endif
        }
    };

}  // namespace infra


#endif  // !defined(_RXCP_INFRA_SIGHANDLE_H_INCLUDED_)
