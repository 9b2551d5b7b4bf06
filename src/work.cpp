#include "common.h"

namespace
{
    struct work_name_visitor
    {
        const char* operator()(const rxcp::work_stat&) const noexcept { return "stat"; }
        const char* operator()(const rxcp::work_create_directory&) const noexcept { return "create_directory"; }
        const char* operator()(const rxcp::work_query_free_space&) const noexcept { return "query_free_space"; }
        const char* operator()(const rxcp::work_open_read&) const noexcept { return "open_read"; }
        const char* operator()(const rxcp::work_open_write&) const noexcept { return "open_write"; }
        const char* operator()(const rxcp::work_read_sub_chunk&) const noexcept { return "read_sub_chunk"; }
        const char* operator()(const rxcp::work_append_sub_chunk&) const noexcept { return "append_sub_chunk"; }
        const char* operator()(const rxcp::work_close&) const noexcept { return "close"; }
        const char* operator()(const rxcp::work_delete_file&) const noexcept { return "delete_file"; }
        const char* operator()(const rxcp::work_digest_file&) const noexcept { return "digest_file"; }
        const char* operator()(const rxcp::work_copy_local&) const noexcept { return "copy_local"; }
    };

    std::string errno_message(const std::string& what, const std::string& path, const int err)
    {
        return what + " " + path + " failed: " + strerror(err);
    }

}  // namespace


const char* rxcp::work_name(const work_request& request) noexcept
{
    return std::visit(work_name_visitor { }, request);
}



//==============================================================================
// class work_executor
//==============================================================================

rxcp::work_response rxcp::work_executor::execute(const work_request& request)
{
    ASSERT(!is_dispose_required());

    work_response response;
    try {
        response.result = std::visit(
            [this](const auto& work) -> work_result {
                return this->run(work);
            },
            request);
    }
    catch (const work_error& ex) {
        response.error_code = ex.error_code;
        response.error_message = ex.error_message;
    }
    catch (const stdfs::filesystem_error& ex) {
        response.error_code = ex.code().value() != 0 ? ex.code().value() : EIO;
        response.error_message = ex.what();
    }
    catch (const std::invalid_argument& ex) {
        response.error_code = EINVAL;
        response.error_message = ex.what();
    }
    catch (const std::bad_alloc& ex) {
        response.error_code = ENOMEM;
        response.error_message = ex.what();
    }
    catch (const std::runtime_error& ex) {
        response.error_code = EIO;
        response.error_message = ex.what();
    }

    if (response.error_code != 0) {
        LOG_DEBUG("Work {} failed: {} (errno = {})", work_name(request), response.error_message, response.error_code);
    }
    else {
        LOG_TRACE("Work {} done", work_name(request));
    }
    return response;
}

void rxcp::work_executor::dispose_impl() noexcept /*override*/
{
    for (auto& it : _handles) {
        LOG_DEBUG("Close leftover handle #{}", it.first);
        if (std::fclose(it.second) != 0) {
            LOG_WARN("fclose() leftover handle #{} failed. errno = {} ({})", it.first, errno, strerror(errno));
        }
    }
    _handles.clear();
}

rxcp::file_metadata rxcp::work_executor::run(const work_stat& work)
{
    file_metadata metadata;
    metadata.full_path = work.path;
    metadata.parent_path = parent_path_of(work.path);
    metadata.file_name = file_name_of(work.path);

    std::error_code ec;
    const stdfs::file_status status = stdfs::status(work.path, ec);
    if (ec && status.type() != stdfs::file_type::not_found) {
        throw work_error(ec.value(), "stat " + work.path + " failed: " + ec.message());
    }

    switch (status.type()) {
        case stdfs::file_type::not_found:
            metadata.exists = false;
            break;
        case stdfs::file_type::directory:
            metadata.exists = true;
            metadata.is_directory = true;
            break;
        case stdfs::file_type::regular: {
            metadata.exists = true;
            const uintmax_t size = stdfs::file_size(work.path, ec);
            if (ec) {
                throw work_error(ec.value(), "file_size " + work.path + " failed: " + ec.message());
            }
            metadata.length = (uint64_t)size;
            break;
        }
        default:
            throw work_error(ENOSYS, "Not a regular file or directory: " + work.path);
    }

    return metadata;
}

rxcp::empty_result rxcp::work_executor::run(const work_create_directory& work)
{
    std::error_code ec;
    stdfs::create_directories(work.path, ec);
    if (ec) {
        throw work_error(ec.value(), "create_directories " + work.path + " failed: " + ec.message());
    }
    return { };
}

rxcp::free_space_result rxcp::work_executor::run(const work_query_free_space& work)
{
    std::error_code ec;
    const stdfs::space_info space = stdfs::space(work.path, ec);
    if (ec) {
        throw work_error(ec.value(), "space " + work.path + " failed: " + ec.message());
    }
    return free_space_result { (uint64_t)space.available };
}

rxcp::handle_result rxcp::work_executor::run(const work_open_read& work)
{
    return open_handle(work.path, "rb");
}

rxcp::handle_result rxcp::work_executor::run(const work_open_write& work)
{
    return open_handle(work.path, work.append ? "ab" : "wb");
}

rxcp::sub_chunk_result rxcp::work_executor::run(const work_read_sub_chunk& work)
{
    std::FILE* const file = find_handle(work.handle);
    if (work.max_bytes > MAX_SUB_CHUNK_READ) {
        throw work_error(EINVAL, "Sub-chunk of " + std::to_string(work.max_bytes) + " bytes is too large");
    }

    std::string buffer;
    buffer.resize((size_t)work.max_bytes);
    const size_t count = std::fread(buffer.data(), 1, buffer.size(), file);
    if (count < buffer.size() && std::ferror(file)) {
        throw work_error(EIO, "fread() on handle #" + std::to_string(work.handle) + " failed");
    }

    sub_chunk_result result;
    result.encoded = base64_encode(buffer.data(), count);
    result.raw_length = count;
    return result;
}

rxcp::empty_result rxcp::work_executor::run(const work_append_sub_chunk& work)
{
    std::FILE* const file = find_handle(work.handle);

    const std::string raw = base64_decode(work.encoded);
    if (!raw.empty() && std::fwrite(raw.data(), 1, raw.size(), file) != raw.size()) {
        const int err = errno;
        throw work_error(err != 0 ? err : EIO, "fwrite() on handle #" + std::to_string(work.handle) + " failed");
    }
    return { };
}

rxcp::empty_result rxcp::work_executor::run(const work_close& work)
{
    std::FILE* const file = find_handle(work.handle);
    _handles.erase(work.handle);

    if (std::fclose(file) != 0) {
        const int err = errno;
        throw work_error(err, "fclose() handle #" + std::to_string(work.handle) + " failed: " + strerror(err));
    }
    LOG_TRACE("Closed handle #{}", work.handle);
    return { };
}

rxcp::empty_result rxcp::work_executor::run(const work_delete_file& work)
{
    std::error_code ec;
    const bool removed = stdfs::remove(work.path, ec);
    if (ec) {
        throw work_error(ec.value(), "remove " + work.path + " failed: " + ec.message());
    }
    if (!removed) {
        throw work_error(ENOENT, errno_message("remove", work.path, ENOENT));
    }
    return { };
}

rxcp::digest_result rxcp::work_executor::run(const work_digest_file& work)
{
    std::FILE* const file = std::fopen(work.path.c_str(), "rb");
    if (file == nullptr) {
        const int err = errno;
        throw work_error(err, errno_message("open", work.path, err));
    }

    const infra::sweeper close_file = [&]() {
        (void)std::fclose(file);
    };

    sha256_accumulator sha256;
    std::vector<char> buffer(1024 * 1024);
    while (true) {
        const size_t count = std::fread(buffer.data(), 1, buffer.size(), file);
        if (count > 0) {
            sha256.update(buffer.data(), count);
        }
        if (count < buffer.size()) {
            if (std::ferror(file)) {
                throw work_error(EIO, "read " + work.path + " failed");
            }
            break;
        }
    }

    return digest_result { sha256.finish_hex() };
}

rxcp::empty_result rxcp::work_executor::run(const work_copy_local& work)
{
    const stdfs::copy_options options = work.overwrite
        ? stdfs::copy_options::overwrite_existing
        : stdfs::copy_options::none;

    std::error_code ec;
    stdfs::copy_file(work.source, work.destination, options, ec);
    if (ec) {
        throw work_error(ec.value(), "copy " + work.source + " to " + work.destination + " failed: " + ec.message());
    }
    return { };
}

rxcp::handle_result rxcp::work_executor::open_handle(const std::string& path, const char* const mode)
{
    std::FILE* const file = std::fopen(path.c_str(), mode);
    if (file == nullptr) {
        const int err = errno;
        throw work_error(err, errno_message(std::string("open(") + mode + ")", path, err));
    }

    const uint64_t handle = _next_handle++;
    _handles.emplace(handle, file);
    LOG_TRACE("Opened {} ({}) as handle #{}", path, mode, handle);
    return handle_result { handle };
}

std::FILE* rxcp::work_executor::find_handle(const uint64_t handle) const
{
    const auto it = _handles.find(handle);
    if (it == _handles.end()) {
        throw work_error(EBADF, "Unknown handle #" + std::to_string(handle));
    }
    return it->second;
}
