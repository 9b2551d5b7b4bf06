#if !defined(_RXCP_TRANSFER_H_INCLUDED_)
#define _RXCP_TRANSFER_H_INCLUDED_

#if !defined(_RXCP_COMMON_H_INCLUDED_)
#error "Please don't directly #include this file. Instead, #include common.h"
#endif  // !defined(_RXCP_COMMON_H_INCLUDED_)

namespace rxcp
{
    static constexpr const uint64_t DEFAULT_CHUNK_SIZE = 128ULL * 1024 * 1024;    // 128 MiB
    static constexpr const uint64_t DEFAULT_SUB_CHUNK_SIZE = 5ULL * 1024 * 1024;  // 5 MiB

    // The destination handle is closed and reopened for append after this many sub-chunks
    static constexpr const uint32_t RECYCLE_SUB_CHUNK_COUNT = 7;


    // limit / 4, falling back to the secondary limit, then to DEFAULT_CHUNK_SIZE
    [[nodiscard]]
    uint64_t negotiate_chunk_size(const channel_limits& limits) noexcept;


    struct transfer_plan
    {
        file_metadata source { };
        std::string destination_path { };
        uint64_t total_bytes = 0;
        uint64_t chunk_size = 0;
        uint64_t sub_chunk_size = 0;  // never larger than chunk_size
        bool check = false;
        bool force = false;
    };

    [[nodiscard]]
    transfer_plan make_transfer_plan(
        const file_metadata& source,
        std::string destination_path,
        const channel_limits& limits,
        bool check,
        bool force,
        uint64_t sub_chunk_size = DEFAULT_SUB_CHUNK_SIZE);


    //
    // Pulls the encoded sub-chunks of one chunk from the source, in order.
    // Ends early if the source hits end of file.
    //
    class sub_chunk_sequence
    {
    public:
        RXCP_DISABLE_COPY_CONSTRUCTOR(sub_chunk_sequence)
        RXCP_DISABLE_MOVE_CONSTRUCTOR(sub_chunk_sequence)

        sub_chunk_sequence(endpoint_session& source, uint64_t handle, uint64_t send_size, uint64_t sub_chunk_size);

        // Nominal number of sub-chunks: ceil(send_size / sub_chunk_size)
        [[nodiscard]]
        uint64_t count() const noexcept { return _count; }

        [[nodiscard]]
        uint64_t produced_bytes() const noexcept { return _produced; }

        // false when the sequence is exhausted
        bool next(/*out*/ sub_chunk_result& sub_chunk);

    private:
        endpoint_session& _source;
        const uint64_t _handle;
        const uint64_t _send_size;
        const uint64_t _sub_chunk_size;
        const uint64_t _count;

        uint64_t _produced = 0;
        bool _end_of_file = false;
    };


    struct transfer_statistics
    {
        uint64_t iterations = 0;
        uint64_t bytes = 0;
        uint64_t sub_chunks = 0;
        uint64_t recycles = 0;
        std::chrono::steady_clock::duration elapsed { };
    };


    class transfer_engine
    {
    public:
        RXCP_DISABLE_COPY_CONSTRUCTOR(transfer_engine)
        RXCP_DISABLE_MOVE_CONSTRUCTOR(transfer_engine)

        transfer_engine(
            endpoint_session& source,
            endpoint_session& destination,
            const transfer_plan& plan,
            copy_event_sink on_event)
            : _source(source),
              _destination(destination),
              _plan(plan),
              _on_event(std::move(on_event))
        { }

        // Throws copy_error; handles still open are closed on a best-effort basis
        transfer_statistics run();

        // The step follows total_iterations: 1 up to 10 iterations, 5 up to 100, 25 up to 1000, else 100.
        // The last iteration is always reported.
        [[nodiscard]]
        static bool should_report_progress(uint64_t iteration, uint64_t total_iterations) noexcept;

    private:
        void close_quietly(endpoint_session& endpoint, std::optional<uint64_t>& handle) noexcept;

    private:
        endpoint_session& _source;
        endpoint_session& _destination;
        const transfer_plan& _plan;
        const copy_event_sink _on_event;
    };

}  // namespace rxcp

#endif  // !defined(_RXCP_TRANSFER_H_INCLUDED_)
