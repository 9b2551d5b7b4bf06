#include "common.h"


//==============================================================================
// struct session_option
//==============================================================================

bool rxcp::session_option::parse(const std::string& value)
{
    // Handle strings like:
    //  "fileserver=10.0.0.5"
    //  "fileserver=10.0.0.5:62591"
    //  "build-01=[::1]:7000"

    const size_t pos = value.find('=');
    if (pos == std::string::npos || pos == 0 || pos + 1 >= value.size()) {
        return false;
    }

    host_id = value.substr(0, pos);
    if (!endpoint.parse(value.substr(pos + 1))) {
        return false;
    }

    return true;
}



//==============================================================================
// struct base_program_options
//==============================================================================

void rxcp::base_program_options::add_options(CLI::App& app)
{
    app.add_flag(
        "-V,--version",
        [&](const size_t /*count*/) {
            printf("Version %d.%d.%d\n", RXCP_VERSION_MAJOR, RXCP_VERSION_MINOR, RXCP_VERSION_PATCH);
            exit(0);
        },
        "Print version and exit");

    app.add_flag(
        "-q,--quiet",
        [&](const size_t count) { this->arg_verbosity -= static_cast<int>(count); },
        "Be more quiet");

    app.add_flag(
        "-v,--verbose",
        [&](const size_t count) { this->arg_verbosity += static_cast<int>(count); },
        "Be more verbose");
}

bool rxcp::base_program_options::post_process()
{
    // Set verbosity
    infra::set_logging_verbosity(this->arg_verbosity);

    return true;
}



//==============================================================================
// struct rxcp_program_options
//==============================================================================

void rxcp::rxcp_program_options::add_options(CLI::App& app)
{
    base_program_options::add_options(app);

    CLI::Option* opt_session = app.add_option(
        "-s,--session",
        this->arg_sessions,
        "Agent serving a host, as HOST=ENDPOINT (repeatable)");
    opt_session->type_name("<host>=<endpoint>");
    opt_session->allow_extra_args(false);  // one value per -s, leave positionals alone

    app.add_flag(
        "-c,--check",
        this->arg_check,
        "Verify SHA-256 digests of both files after copying");

    app.add_flag(
        "-f,--force",
        this->arg_force,
        "Overwrite an existing destination and create missing destination directories");

    CLI::Option* opt_from = app.add_option(
        "from",
        this->arg_from_path,
        "Copy from this path spec: [\\\\Host\\]Path");
    opt_from->type_name("<from>");
    opt_from->required();

    CLI::Option* opt_to = app.add_option(
        "to",
        this->arg_to_path,
        "Copy to this path spec (default: the source path)");
    opt_to->type_name("<to>");
}

bool rxcp::rxcp_program_options::post_process()
{
    if (!base_program_options::post_process()) {
        return false;
    }

    //----------------------------------------------------------------
    // arg_sessions
    //----------------------------------------------------------------
    for (session_option& session : arg_sessions) {
        if (!session.endpoint.port.has_value()) {
            session.endpoint.port = program_options_defaults::AGENT_PORTAL_PORT;
        }
        else if (session.endpoint.port.value() == 0) {
            LOG_ERROR("Agent port 0 is invalid for host {}", session.host_id);
            return false;
        }
        LOG_DEBUG("Session: host {} served by agent {}", session.host_id, session.endpoint.to_string());
    }

    //----------------------------------------------------------------
    // arg_from_path, arg_to_path
    //----------------------------------------------------------------
    LOG_DEBUG("Copy from {}", arg_from_path);
    if (arg_to_path.empty()) {
        LOG_DEBUG("Copy to the same path as the source");
    }
    else {
        LOG_DEBUG("Copy to {}", arg_to_path);
    }

    if (arg_check) {
        LOG_TRACE("Digests will be verified after copying");
    }
    if (arg_force) {
        LOG_TRACE("Force: overwrite destination, create missing directories");
    }

    return true;
}



//==============================================================================
// struct rxcpd_program_options
//==============================================================================

void rxcp::rxcpd_program_options::add_options(CLI::App& app)
{
    base_program_options::add_options(app);

    CLI::Option* opt_portal = app.add_option(
        "-p,--portal",
        this->arg_portal,
        "Agent portal endpoint to bind and listen");
    opt_portal->type_name("<endpoint>");

    CLI::Option* opt_host_id = app.add_option(
        "--host-id",
        this->arg_host_id,
        "Host id reported to clients (default: local host name)");
    opt_host_id->type_name("<id>");

    CLI::Option* opt_data = app.add_option(
        "--max-data-per-command",
        this->arg_max_data_per_command,
        "Advertised limit of data received per command (0: unset)");
    opt_data->type_name("<size>");
    opt_data->transform(CLI::AsSizeValue(false));

    CLI::Option* opt_object = app.add_option(
        "--max-object-size",
        this->arg_max_object_size,
        "Advertised limit of one received object (0: unset)");
    opt_object->type_name("<size>");
    opt_object->transform(CLI::AsSizeValue(false));
}

bool rxcp::rxcpd_program_options::post_process()
{
    if (!base_program_options::post_process()) {
        return false;
    }

    //----------------------------------------------------------------
    // arg_portal
    //----------------------------------------------------------------
    if (!arg_portal.has_value()) {
        arg_portal = infra::tcp_endpoint();
        arg_portal->host = program_options_defaults::AGENT_PORTAL_HOST;
        LOG_INFO("Agent portal is not specified, use default host {}", program_options_defaults::AGENT_PORTAL_HOST);
    }

    if (arg_portal->port.has_value()) {
        if (arg_portal->port.value() == 0) {
            LOG_WARN("Agent portal binds to a random port");
        }
        else {
            LOG_TRACE("Agent portal binds to port {}", arg_portal->port.value());
        }
    }
    else {  // !arg_portal->port.has_value()
        arg_portal->port = program_options_defaults::AGENT_PORTAL_PORT;
        LOG_TRACE("Agent portal binds to default port {}", arg_portal->port.value());
    }

    LOG_INFO("Agent portal endpoint: {}", arg_portal->to_string());
    if (!arg_portal->resolve()) {
        LOG_ERROR("Can't resolve specified portal: {}", arg_portal->to_string());
        return false;
    }
    else {
        for (const infra::tcp_sockaddr& addr : arg_portal->resolved_sockaddrs) {
            LOG_DEBUG("  Candidate agent portal endpoint: {}", addr.to_string());
        }
    }

    //----------------------------------------------------------------
    // arg_host_id
    //----------------------------------------------------------------
    if (arg_host_id.has_value() && !arg_host_id->empty()) {
        host_id = arg_host_id.value();
    }
    else {
        host_id = infra::get_local_host_name();
        if (host_id.empty()) {
            LOG_ERROR("Can't get local host name. Specify --host-id");
            return false;
        }
    }
    LOG_INFO("Agent host id: {}", host_id);

    //----------------------------------------------------------------
    // arg_max_data_per_command, arg_max_object_size
    //----------------------------------------------------------------
    limits.max_received_data_per_command =
        arg_max_data_per_command.value_or(program_options_defaults::MAX_RECEIVED_DATA_PER_COMMAND);
    limits.max_received_object_size =
        arg_max_object_size.value_or(program_options_defaults::MAX_RECEIVED_OBJECT_SIZE);
    LOG_DEBUG("Advertised limits: max_received_data_per_command={}, max_received_object_size={}",
              limits.max_received_data_per_command, limits.max_received_object_size);

    return true;
}
