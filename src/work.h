#if !defined(_RXCP_WORK_H_INCLUDED_)
#define _RXCP_WORK_H_INCLUDED_

#if !defined(_RXCP_COMMON_H_INCLUDED_)
#error "Please don't directly #include this file. Instead, #include common.h"
#endif  // !defined(_RXCP_COMMON_H_INCLUDED_)


namespace rxcp
{
    //
    // Units of work, executed on the endpoint's host
    //
    struct work_stat
    {
        std::string path;
        RXCP_DEFAULT_SERIALIZATION(path)
    };

    struct work_create_directory
    {
        std::string path;
        RXCP_DEFAULT_SERIALIZATION(path)
    };

    struct work_query_free_space
    {
        std::string path;
        RXCP_DEFAULT_SERIALIZATION(path)
    };

    struct work_open_read
    {
        std::string path;
        RXCP_DEFAULT_SERIALIZATION(path)
    };

    struct work_open_write
    {
        std::string path;
        bool append = false;  // false: create or truncate
        RXCP_DEFAULT_SERIALIZATION(path, append)
    };

    struct work_read_sub_chunk
    {
        uint64_t handle = 0;
        uint64_t max_bytes = 0;
        RXCP_DEFAULT_SERIALIZATION(handle, max_bytes)
    };

    struct work_append_sub_chunk
    {
        uint64_t handle = 0;
        std::string encoded;
        RXCP_DEFAULT_SERIALIZATION(handle, encoded)
    };

    struct work_close
    {
        uint64_t handle = 0;
        RXCP_DEFAULT_SERIALIZATION(handle)
    };

    struct work_delete_file
    {
        std::string path;
        RXCP_DEFAULT_SERIALIZATION(path)
    };

    struct work_digest_file
    {
        std::string path;
        RXCP_DEFAULT_SERIALIZATION(path)
    };

    struct work_copy_local
    {
        std::string source;
        std::string destination;
        bool overwrite = false;
        RXCP_DEFAULT_SERIALIZATION(source, destination, overwrite)
    };

    typedef std::variant<
        work_stat,
        work_create_directory,
        work_query_free_space,
        work_open_read,
        work_open_write,
        work_read_sub_chunk,
        work_append_sub_chunk,
        work_close,
        work_delete_file,
        work_digest_file,
        work_copy_local> work_request;

    [[nodiscard]]
    const char* work_name(const work_request& request) noexcept;


    //
    // Results of units of work
    //
    struct empty_result
    {
        RXCP_EMPTY_SERIALIZATION()
    };

    struct file_metadata
    {
        bool exists = false;
        bool is_directory = false;
        std::string full_path { };
        std::string parent_path { };
        std::string file_name { };
        uint64_t length = 0;

        RXCP_DEFAULT_SERIALIZATION(exists, is_directory, full_path, parent_path, file_name, length)
    };

    struct handle_result
    {
        uint64_t handle = 0;
        RXCP_DEFAULT_SERIALIZATION(handle)
    };

    struct sub_chunk_result
    {
        std::string encoded { };
        uint64_t raw_length = 0;  // 0 means end of file
        RXCP_DEFAULT_SERIALIZATION(encoded, raw_length)
    };

    struct free_space_result
    {
        uint64_t available = 0;
        RXCP_DEFAULT_SERIALIZATION(available)
    };

    struct digest_result
    {
        std::string hex { };
        RXCP_DEFAULT_SERIALIZATION(hex)
    };

    typedef std::variant<
        empty_result,
        file_metadata,
        handle_result,
        sub_chunk_result,
        free_space_result,
        digest_result> work_result;

    struct work_response
    {
        int error_code = 0;  // errno-style, 0 on success
        std::string error_message { };
        work_result result { };

        RXCP_DEFAULT_SERIALIZATION(error_code, error_message, result)
    };


    //
    // Largest raw sub-chunk one read_sub_chunk may ask for
    //
    static constexpr const uint64_t MAX_SUB_CHUNK_READ = 64ULL * 1024 * 1024;


    //
    // Runs units of work on this host against its own handle table.
    // Handles are never reused within one executor.
    //
    class work_executor : public infra::disposable
    {
    public:
        RXCP_DISABLE_COPY_CONSTRUCTOR(work_executor)
        RXCP_DISABLE_MOVE_CONSTRUCTOR(work_executor)
        work_executor() noexcept = default;

        // Never throws on failures of the unit of work itself
        work_response execute(const work_request& request);

        [[nodiscard]]
        size_t open_handle_count() const noexcept { return _handles.size(); }

        void dispose_impl() noexcept override final;
        ~work_executor() noexcept override final { this->dispose(); }

    private:
        struct work_error : std::exception
        {
        public:
            const int error_code;
            const std::string error_message;

        public:
            work_error(const int error_code, std::string error_message) noexcept
                : error_code(error_code),
                  error_message(std::move(error_message))
            { }
        };

        file_metadata run(const work_stat& work);
        empty_result run(const work_create_directory& work);
        free_space_result run(const work_query_free_space& work);
        handle_result run(const work_open_read& work);
        handle_result run(const work_open_write& work);
        sub_chunk_result run(const work_read_sub_chunk& work);
        empty_result run(const work_append_sub_chunk& work);
        empty_result run(const work_close& work);
        empty_result run(const work_delete_file& work);
        digest_result run(const work_digest_file& work);
        empty_result run(const work_copy_local& work);

        handle_result open_handle(const std::string& path, const char* mode);
        std::FILE* find_handle(uint64_t handle) const;

    private:
        std::unordered_map<uint64_t, std::FILE*> _handles { };
        uint64_t _next_handle = 1;
    };

}  // namespace rxcp


#endif  // !defined(_RXCP_WORK_H_INCLUDED_)
