#if !defined(_RXCP_ENDPOINT_H_INCLUDED_)
#define _RXCP_ENDPOINT_H_INCLUDED_

#if !defined(_RXCP_COMMON_H_INCLUDED_)
#error "Please don't directly #include this file. Instead, #include common.h"
#endif  // !defined(_RXCP_COMMON_H_INCLUDED_)


namespace rxcp
{
    //
    // One side of a copy: the channel of its host plus typed units of work.
    // A failed unit of work throws copy_error(io_failure).
    //
    class endpoint_session
    {
    public:
        RXCP_DISABLE_COPY_CONSTRUCTOR(endpoint_session)
        RXCP_DISABLE_MOVE_CONSTRUCTOR(endpoint_session)

        endpoint_session(std::string role, host_ref host, std::shared_ptr<execution_channel> channel)
            : _role(std::move(role)),
              _host(std::move(host)),
              _channel(std::move(channel))
        {
            ASSERT(_channel != nullptr);
        }

        [[nodiscard]] const std::string& role() const noexcept { return _role; }
        [[nodiscard]] const host_ref& host() const noexcept { return _host; }
        [[nodiscard]] execution_channel& channel() const noexcept { return *_channel; }

        file_metadata stat(const std::string& path);
        void create_directory(const std::string& path);
        uint64_t query_free_space(const std::string& path);
        uint64_t open_read(const std::string& path);
        uint64_t open_write(const std::string& path, bool append);
        sub_chunk_result read_sub_chunk(uint64_t handle, uint64_t max_bytes);
        void append_sub_chunk(uint64_t handle, std::string encoded);
        void close(uint64_t handle);
        void delete_file(const std::string& path);
        void copy_local(const std::string& source, const std::string& destination, bool overwrite);

        // Raw response: the caller decides how a failed digest is reported
        std::future<work_response> digest_async(const std::string& path);

    private:
        template<typename TResult>
        TResult call(work_request request);

    private:
        const std::string _role;
        const host_ref _host;
        const std::shared_ptr<execution_channel> _channel;
    };


    //
    // Probe the source; throws file_not_found or unsupported_source
    //
    [[nodiscard]]
    file_metadata probe_source(endpoint_session& source, const path_spec& spec);


    struct destination_resolution
    {
        std::string full_path { };
        std::string parent_path { };
    };

    //
    // Resolve the final destination file:
    //   empty path       -> same path as the source
    //   existing dir     -> dir + source file name (only reachable with force)
    //   anything else    -> the path itself
    // Throws file_already_exists, destination_path_missing
    //
    [[nodiscard]]
    destination_resolution resolve_destination(
        endpoint_session& destination,
        const path_spec& spec,
        const file_metadata& source,
        bool force);

}  // namespace rxcp


#endif  // !defined(_RXCP_ENDPOINT_H_INCLUDED_)
