#if !defined(_RXCP_INFRA_DISPOSABLE_H_INCLUDED_)
#define _RXCP_INFRA_DISPOSABLE_H_INCLUDED_

#if !defined(_RXCP_INFRA_INFRA_H_INCLUDED_)
#error "Please don't directly #include this file. Instead, #include infra.h"
#endif  // !defined(_RXCP_INFRA_INFRA_H_INCLUDED_)


namespace infra
{
    //
    // Base for objects owning OS resources (sockets, file handles, threads).
    // dispose_impl() runs exactly once, whichever thread calls dispose() first.
    //
    class disposable
    {
    protected:
        virtual void dispose_impl() noexcept = 0;
        disposable() noexcept = default;

    public:
        RXCP_DISABLE_COPY_CONSTRUCTOR(disposable)
        RXCP_DISABLE_MOVE_CONSTRUCTOR(disposable)

        virtual ~disposable() noexcept
        {
            ASSERT(_status == STATUS_DISPOSED);
        }

        void dispose() noexcept
        {
            int status = STATUS_NORMAL;
            if (_status.compare_exchange_strong(status, STATUS_DISPOSING)) {
                dispose_impl();
                _status = STATUS_DISPOSED;
                return;
            }

            if (status == STATUS_DISPOSED) {
                return;
            }

            wait_for_dispose_done();
        }

        [[nodiscard]]
        bool is_dispose_required() const noexcept
        {
            return (_status != STATUS_NORMAL);
        }

    private:
        void wait_for_dispose_done() const noexcept
        {
            while (_status == STATUS_DISPOSING) {
                std::this_thread::sleep_for(std::chrono::milliseconds(1));
            }
        }

    private:
        static constexpr const int STATUS_NORMAL = 0;
        static constexpr const int STATUS_DISPOSING = 1;
        static constexpr const int STATUS_DISPOSED = 2;

        std::atomic_int _status { STATUS_NORMAL };
    };

}  // namespace infra


#endif  // !defined(_RXCP_INFRA_DISPOSABLE_H_INCLUDED_)
