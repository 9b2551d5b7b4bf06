#if !defined(_RXCP_VERIFICATION_H_INCLUDED_)
#define _RXCP_VERIFICATION_H_INCLUDED_

#if !defined(_RXCP_COMMON_H_INCLUDED_)
#error "Please don't directly #include this file. Instead, #include common.h"
#endif  // !defined(_RXCP_COMMON_H_INCLUDED_)


namespace rxcp
{
    struct verification_result
    {
        std::string source_digest { };
        std::string destination_digest { };
    };

    //
    // Digest both files concurrently and compare.
    // A failed digest throws checksum_computation_error and leaves the destination alone.
    // A mismatch deletes the destination and throws checksum_mismatch.
    //
    verification_result verify_transfer(
        endpoint_session& source,
        const std::string& source_path,
        endpoint_session& destination,
        const std::string& destination_path,
        const copy_event_sink& on_event);

}  // namespace rxcp


#endif  // !defined(_RXCP_VERIFICATION_H_INCLUDED_)
