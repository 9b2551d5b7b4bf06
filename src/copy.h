#if !defined(_RXCP_COPY_H_INCLUDED_)
#define _RXCP_COPY_H_INCLUDED_

#if !defined(_RXCP_COMMON_H_INCLUDED_)
#error "Please don't directly #include this file. Instead, #include common.h"
#endif  // !defined(_RXCP_COMMON_H_INCLUDED_)


namespace rxcp
{
    struct copy_options
    {
        bool check = false;
        bool force = false;
        uint64_t sub_chunk_size = DEFAULT_SUB_CHUNK_SIZE;
    };

    struct copy_result
    {
        error_kind kind = error_kind::success;
        std::string message { };
        copy_phase last_phase = copy_phase::none;

        [[nodiscard]]
        bool succeeded() const noexcept { return kind == error_kind::success; }
    };

    //
    // Copy one file between two path specs, local or remote.
    // Never throws: every failure, copy_error or otherwise, is reported in the result.
    //
    copy_result copy_file(
        session_registry& sessions,
        const std::string& source,
        const std::string& destination,
        const copy_options& options,
        const copy_event_sink& on_event = nullptr);

}  // namespace rxcp


#endif  // !defined(_RXCP_COPY_H_INCLUDED_)
