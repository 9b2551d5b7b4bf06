#if !defined(_RXCP_CAPACITY_H_INCLUDED_)
#define _RXCP_CAPACITY_H_INCLUDED_

#if !defined(_RXCP_COMMON_H_INCLUDED_)
#error "Please don't directly #include this file. Instead, #include common.h"
#endif  // !defined(_RXCP_COMMON_H_INCLUDED_)


namespace rxcp
{
    struct capacity_report
    {
        uint64_t required = 0;     // 1.1 x source length, for reporting only
        uint64_t available = 0;
        uint64_t available95 = 0;  // the comparison threshold
    };

    //
    // Fails with insufficient_space if source_length >= 95% of the free bytes
    // on the volume holding directory_path. Opens no file handle.
    //
    capacity_report check_capacity(
        endpoint_session& destination,
        const std::string& directory_path,
        uint64_t source_length,
        const copy_event_sink& on_event);

}  // namespace rxcp


#endif  // !defined(_RXCP_CAPACITY_H_INCLUDED_)
