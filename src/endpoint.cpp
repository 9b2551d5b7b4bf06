#include "common.h"


//==============================================================================
// class endpoint_session
//==============================================================================

template<typename TResult>
TResult rxcp::endpoint_session::call(work_request request)
{
    const char* const name = work_name(request);
    work_response response = _channel->invoke(request);

    if (response.error_code != 0) {
        throw copy_error(error_kind::io_failure,
                         fmt::format("{} at {} ({}) failed: {} (errno = {})",
                                     name, _role, _host.to_string(), response.error_message, response.error_code));
    }

    TResult* const result = std::get_if<TResult>(&response.result);
    if (result == nullptr) {
        throw copy_error(error_kind::channel_failure,
                         fmt::format("{} at {} ({}) returned an unexpected result", name, _role, _host.to_string()));
    }
    return std::move(*result);
}

rxcp::file_metadata rxcp::endpoint_session::stat(const std::string& path)
{
    return call<file_metadata>(work_stat { path });
}

void rxcp::endpoint_session::create_directory(const std::string& path)
{
    (void)call<empty_result>(work_create_directory { path });
}

uint64_t rxcp::endpoint_session::query_free_space(const std::string& path)
{
    return call<free_space_result>(work_query_free_space { path }).available;
}

uint64_t rxcp::endpoint_session::open_read(const std::string& path)
{
    return call<handle_result>(work_open_read { path }).handle;
}

uint64_t rxcp::endpoint_session::open_write(const std::string& path, const bool append)
{
    return call<handle_result>(work_open_write { path, append }).handle;
}

rxcp::sub_chunk_result rxcp::endpoint_session::read_sub_chunk(const uint64_t handle, const uint64_t max_bytes)
{
    return call<sub_chunk_result>(work_read_sub_chunk { handle, max_bytes });
}

void rxcp::endpoint_session::append_sub_chunk(const uint64_t handle, std::string encoded)
{
    (void)call<empty_result>(work_append_sub_chunk { handle, std::move(encoded) });
}

void rxcp::endpoint_session::close(const uint64_t handle)
{
    (void)call<empty_result>(work_close { handle });
}

void rxcp::endpoint_session::delete_file(const std::string& path)
{
    (void)call<empty_result>(work_delete_file { path });
}

void rxcp::endpoint_session::copy_local(const std::string& source, const std::string& destination, const bool overwrite)
{
    (void)call<empty_result>(work_copy_local { source, destination, overwrite });
}

std::future<rxcp::work_response> rxcp::endpoint_session::digest_async(const std::string& path)
{
    return _channel->invoke_async(work_digest_file { path });
}



//==============================================================================
// Probing
//==============================================================================

rxcp::file_metadata rxcp::probe_source(endpoint_session& source, const path_spec& spec)
{
    ASSERT(!spec.path.empty());

    file_metadata metadata = source.stat(spec.path);
    if (!metadata.exists) {
        throw copy_error(error_kind::file_not_found, "File not found: " + spec.path);
    }
    if (metadata.is_directory) {
        throw copy_error(error_kind::unsupported_source, "Source is a directory: " + spec.path);
    }

    LOG_DEBUG("Source {} on {}: {} bytes", metadata.full_path, source.host().to_string(), metadata.length);
    return metadata;
}

rxcp::destination_resolution rxcp::resolve_destination(
    endpoint_session& destination,
    const path_spec& spec,
    const file_metadata& source,
    const bool force)
{
    const std::string path = spec.path.empty() ? source.full_path : spec.path;

    destination_resolution resolution;

    const file_metadata metadata = destination.stat(path);
    if (metadata.exists && !force) {
        throw copy_error(error_kind::file_already_exists, "Destination already exists: " + path);
    }

    if (metadata.exists && metadata.is_directory) {
        resolution.full_path = join_path(path, source.file_name);
        resolution.parent_path = path;
        LOG_DEBUG("Destination {} is a directory, copy into {}", path, resolution.full_path);

        // Forced: an existing file inside is overwritten, a directory can't be
        const file_metadata target = destination.stat(resolution.full_path);
        if (target.exists && target.is_directory) {
            throw copy_error(error_kind::file_already_exists, "Destination is an existing directory: " + resolution.full_path);
        }
    }
    else {
        resolution.full_path = path;
        resolution.parent_path = metadata.parent_path;
    }

    const file_metadata parent = destination.stat(resolution.parent_path);
    if (!parent.exists) {
        if (!force) {
            throw copy_error(error_kind::destination_path_missing, "Destination directory does not exist: " + resolution.parent_path);
        }

        LOG_INFO("Create destination directory {} on {}", resolution.parent_path, destination.host().to_string());
        destination.create_directory(resolution.parent_path);
    }
    else if (!parent.is_directory) {
        throw copy_error(error_kind::destination_path_missing, "Destination parent is not a directory: " + resolution.parent_path);
    }

    return resolution;
}
