#if !defined(_RXCP_TESTS_TEST_COMMON_H_INCLUDED_)
#define _RXCP_TESTS_TEST_COMMON_H_INCLUDED_

#include "common.h"


namespace rxcp_test
{
    //
    // A fresh directory under the system temp directory, removed on exit
    //
    class scratch_directory
    {
    public:
        RXCP_DISABLE_COPY_CONSTRUCTOR(scratch_directory)
        RXCP_DISABLE_MOVE_CONSTRUCTOR(scratch_directory)

        explicit scratch_directory(const std::string& name)
        {
            const auto now = std::chrono::steady_clock::now().time_since_epoch().count();
            _root = stdfs::temp_directory_path() / ("rxcp-" + name + "-" + std::to_string(getpid()) + "-" + std::to_string(now));
            stdfs::create_directories(_root);
        }

        ~scratch_directory()
        {
            std::error_code ec;
            stdfs::remove_all(_root, ec);
            if (ec) {
                LOG_WARN("Remove scratch directory {} failed: {}", _root.string(), ec.message());
            }
        }

        [[nodiscard]]
        std::string path(const std::string& relative) const
        {
            return (_root / relative).string();
        }

        [[nodiscard]]
        std::string root() const { return _root.string(); }

    private:
        stdfs::path _root;
    };


    inline std::string make_content(const size_t size, const uint32_t seed)
    {
        std::string content;
        content.resize(size);
        uint32_t state = seed * 2654435761u + 1;
        for (size_t i = 0; i < size; ++i) {
            state = state * 1664525u + 1013904223u;
            content[i] = (char)(state >> 24);
        }
        return content;
    }

    inline void write_file(const std::string& path, const std::string& content)
    {
        std::FILE* const file = std::fopen(path.c_str(), "wb");
        ASSERT(file != nullptr, "fopen {} failed", path);
        if (!content.empty()) {
            ASSERT(std::fwrite(content.data(), 1, content.size(), file) == content.size());
        }
        ASSERT(std::fclose(file) == 0);
    }

    inline std::string read_file(const std::string& path)
    {
        std::FILE* const file = std::fopen(path.c_str(), "rb");
        ASSERT(file != nullptr, "fopen {} failed", path);

        std::string content;
        char buffer[65536];
        while (true) {
            const size_t count = std::fread(buffer, 1, sizeof(buffer), file);
            content.append(buffer, count);
            if (count < sizeof(buffer)) break;
        }
        ASSERT(!std::ferror(file));
        ASSERT(std::fclose(file) == 0);
        return content;
    }

    inline bool file_exists(const std::string& path)
    {
        std::error_code ec;
        return stdfs::exists(path, ec);
    }


    template<typename TFunc>
    inline void expect_copy_error(const rxcp::error_kind kind, TFunc&& fn)
    {
        try {
            fn();
        }
        catch (const rxcp::copy_error& ex) {
            ASSERT(ex.kind == kind, "expects {}, got {}: {}", rxcp::to_string(kind), rxcp::to_string(ex.kind), ex.error_message);
            return;
        }
        PANIC_TERMINATE("expects copy_error {}, but nothing was thrown", rxcp::to_string(kind));
    }


    //
    // Wraps a channel: records every unit of work, and lets a test replace responses
    //
    class recording_channel : public rxcp::execution_channel
    {
    public:
        typedef std::function<std::optional<rxcp::work_response>(const rxcp::work_request&)> override_fn;

        recording_channel(std::shared_ptr<rxcp::execution_channel> inner, std::string host_id, const rxcp::channel_limits& limits = { })
            : _inner(std::move(inner)),
              _host_id(std::move(host_id)),
              _limits(limits)
        { }

        rxcp::work_response invoke(const rxcp::work_request& request) override
        {
            override_fn fn;
            {
                std::lock_guard<std::mutex> lock(_mutex);
                _names.emplace_back(rxcp::work_name(request));
                fn = _override;
            }

            if (fn) {
                std::optional<rxcp::work_response> replaced = fn(request);
                if (replaced.has_value()) {
                    return std::move(replaced.value());
                }
            }
            return _inner->invoke(request);
        }

        std::future<rxcp::work_response> invoke_async(rxcp::work_request request) override
        {
            return std::async(
                std::launch::async,
                [this, request = std::move(request)]() -> rxcp::work_response {
                    return this->invoke(request);
                });
        }

        [[nodiscard]]
        const std::string& host_id() const noexcept override { return _host_id; }

        [[nodiscard]]
        rxcp::channel_limits limits() const noexcept override { return _limits; }

        void set_override(override_fn fn)
        {
            std::lock_guard<std::mutex> lock(_mutex);
            _override = std::move(fn);
        }

        [[nodiscard]]
        size_t count(const std::string& name)
        {
            std::lock_guard<std::mutex> lock(_mutex);
            return (size_t)std::count(_names.begin(), _names.end(), name);
        }

        [[nodiscard]]
        size_t total()
        {
            std::lock_guard<std::mutex> lock(_mutex);
            return _names.size();
        }

        void clear()
        {
            std::lock_guard<std::mutex> lock(_mutex);
            _names.clear();
        }

    private:
        const std::shared_ptr<rxcp::execution_channel> _inner;
        const std::string _host_id;
        const rxcp::channel_limits _limits;

        std::mutex _mutex { };
        std::vector<std::string> _names { };
        override_fn _override { };
    };


    //
    // A host stand-in running in this process, wrapped for recording
    //
    inline std::shared_ptr<recording_channel> make_host(const std::string& host_id, const rxcp::channel_limits& limits = { })
    {
        return std::make_shared<recording_channel>(std::make_shared<rxcp::local_channel>(host_id), host_id, limits);
    }

}  // namespace rxcp_test


#endif  // !defined(_RXCP_TESTS_TEST_COMMON_H_INCLUDED_)
