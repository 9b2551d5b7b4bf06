#if !defined(_RXCP_ERROR_H_INCLUDED_)
#define _RXCP_ERROR_H_INCLUDED_

#if !defined(_RXCP_COMMON_H_INCLUDED_)
#error "Please don't directly #include this file. Instead, #include common.h"
#endif  // !defined(_RXCP_COMMON_H_INCLUDED_)


namespace rxcp
{
    enum class error_kind : uint32_t
    {
        success = 0,
        invalid_path_spec,
        no_open_session,
        file_not_found,
        file_already_exists,
        destination_path_missing,
        insufficient_space,
        checksum_computation_error,
        checksum_mismatch,
        unsupported_source,
        io_failure,
        channel_failure,
    };

    [[nodiscard]]
    inline const char* to_string(const error_kind kind) noexcept
    {
        switch (kind) {
            case error_kind::success: return "Success";
            case error_kind::invalid_path_spec: return "InvalidPathSpec";
            case error_kind::no_open_session: return "NoOpenSession";
            case error_kind::file_not_found: return "FileNotFound";
            case error_kind::file_already_exists: return "FileAlreadyExists";
            case error_kind::destination_path_missing: return "DestinationPathMissing";
            case error_kind::insufficient_space: return "InsufficientSpace";
            case error_kind::checksum_computation_error: return "ChecksumComputationError";
            case error_kind::checksum_mismatch: return "ChecksumMismatch";
            case error_kind::unsupported_source: return "UnsupportedSource";
            case error_kind::io_failure: return "IoFailure";
            case error_kind::channel_failure: return "ChannelFailure";
        }
        return "Unknown";
    }


    //
    // Phases of one copy, strictly in this order
    //
    enum class copy_phase : uint32_t
    {
        none = 0,
        parsed,
        source_resolved,
        destination_resolved,
        capacity_checked,
        local_short_circuit,
        same_host_short_circuit,
        transferred,
        verified,
        done,
    };

    [[nodiscard]]
    inline const char* to_string(const copy_phase phase) noexcept
    {
        switch (phase) {
            case copy_phase::none: return "None";
            case copy_phase::parsed: return "Parsed";
            case copy_phase::source_resolved: return "SourceResolved";
            case copy_phase::destination_resolved: return "DestinationResolved";
            case copy_phase::capacity_checked: return "CapacityChecked";
            case copy_phase::local_short_circuit: return "LocalShortCircuit";
            case copy_phase::same_host_short_circuit: return "SameHostShortCircuit";
            case copy_phase::transferred: return "Transferred";
            case copy_phase::verified: return "Verified";
            case copy_phase::done: return "Done";
        }
        return "Unknown";
    }


    struct copy_error : std::exception
    {
    public:
        const error_kind kind;
        const std::string error_message;

    public:
        copy_error(const error_kind kind, std::string error_message) noexcept
            : kind(kind),
              error_message(std::move(error_message))
        { }

        [[nodiscard]]
        const char* what() const noexcept override { return error_message.c_str(); }
    };


    //
    // Observability events raised while copying
    //
    enum class copy_event_kind : uint32_t
    {
        host_verification,
        required_space,
        progress,
        timing_summary,
        digest,
    };

    struct copy_event
    {
        copy_event_kind kind;
        std::string message;

        // Only for progress
        uint64_t iteration = 0;
        uint64_t total_iterations = 0;
    };

    typedef std::function<void(const copy_event&)> copy_event_sink;

    inline void raise_event(const copy_event_sink& sink, const copy_event_kind kind, std::string message)
    {
        LOG_DEBUG("Event: {}", message);
        if (sink) {
            sink(copy_event { kind, std::move(message) });
        }
    }

}  // namespace rxcp


#endif  // !defined(_RXCP_ERROR_H_INCLUDED_)
