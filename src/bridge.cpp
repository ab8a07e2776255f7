#include "internal/logger.hpp"

#include <atomic>
#include <chrono>
#include <mcpbridge/bridge.hpp>
#include <mcpbridge/errors.hpp>
#include <mcpbridge/protocol/jsonrpc.hpp>
#include <mcpbridge/version.hpp>
#include <mutex>
#include <set>
#include <sstream>

namespace mcpbridge
{

namespace
{

// One named tool server: child process plus its JSON-RPC state
struct ServerConnection
{
    std::string name;
    LaunchSpec launch;

    // Guards one "write request, read response" exchange and everything
    // below that is not atomic
    std::mutex exchange_mutex;

    std::unique_ptr<Transport> transport;
    std::int64_t next_id = 1;
    // Requests that timed out; a late response to one of them is discarded
    std::set<std::int64_t> abandoned_ids;

    std::atomic<ConnectionState> state{ConnectionState::Unstarted};
    // Set once the transport exists; it then lives as long as the connection
    std::atomic<Transport*> live_transport{nullptr};
    std::atomic<bool> cancel_requested{false};
    std::atomic<bool> busy{false};

    mutable std::mutex info_mutex;
    std::optional<json> server_info;

    std::int64_t take_id()
    {
        return next_id++;
    }
};

using ConnectionPtr = std::shared_ptr<ServerConnection>;

// Marks a connection busy for the duration of a request
class BusyGuard
{
  public:
    explicit BusyGuard(ServerConnection& conn) : conn_(conn)
    {
        conn_.busy = true;
    }
    ~BusyGuard()
    {
        conn_.busy = false;
    }

  private:
    ServerConnection& conn_;
};

std::string join_names(const std::vector<std::string>& names)
{
    std::string text;
    for (const auto& name : names)
        text += (text.empty() ? "" : ", ") + name;
    return text;
}

} // namespace

class ProtocolBridge::Impl
{
  public:
    BridgeOptions options_;
    TransportFactory transport_factory_;
    std::shared_ptr<internal::Logger> logger_;

    mutable std::mutex registry_mutex_;
    std::vector<ConnectionPtr> connections_; // configure() order
    bool torn_down_ = false;

    Impl(BridgeOptions opts, TransportFactory factory)
        : options_(std::move(opts)), transport_factory_(std::move(factory)),
          logger_(std::make_shared<internal::Logger>(options_.log_callback,
                                                     options_.min_log_level))
    {
        if (options_.client_version.empty())
            options_.client_version = version_string();

        if (!transport_factory_)
            transport_factory_ = [this](const std::string& name)
            { return make_process_transport(name); };
    }

    ~Impl()
    {
        shutdown();
    }

    std::unique_ptr<Transport> make_process_transport(const std::string& name) const
    {
        TransportOptions transport_opts;
        transport_opts.read_chunk_size = options_.read_chunk_size;
        transport_opts.max_line_size = options_.max_line_size;

        if (options_.stderr_callback.has_value())
        {
            transport_opts.stderr_callback = options_.stderr_callback;
        }
        else
        {
            // Capture the logger by value: the stderr thread may outlive this call
            auto logger = logger_;
            transport_opts.stderr_callback = [logger, name](const std::string& line)
            { logger->debug("[" + name + " stderr] " + line); };
        }

        return create_process_transport(transport_opts);
    }

    // ------------------------------------------------------------------------
    // Registry
    // ------------------------------------------------------------------------

    void configure(const std::vector<ServerConfig>& servers)
    {
        std::set<std::string> seen;
        for (const auto& server : servers)
        {
            if (server.name.empty())
                throw ConfigurationError("Server name must not be empty");
            if (!seen.insert(server.name).second)
                throw ConfigurationError("Duplicate server name: " + server.name);
            if (server.launch.argv.empty() || server.launch.argv.front().empty())
                throw ConfigurationError("Server '" + server.name + "' has an empty command");
        }

        std::lock_guard<std::mutex> lock(registry_mutex_);

        for (const auto& conn : connections_)
        {
            auto state = conn->state.load();
            if (state != ConnectionState::Unstarted && state != ConnectionState::Closed)
                throw ConfigurationError("Server '" + conn->name +
                                         "' is live; call shutdown() before configure()");
        }

        connections_.clear();
        for (const auto& server : servers)
        {
            auto conn = std::make_shared<ServerConnection>();
            conn->name = server.name;
            conn->launch = server.launch;
            connections_.push_back(std::move(conn));
        }
        torn_down_ = false;
    }

    ConnectionPtr find(const std::string& name, const std::string& method = {}) const
    {
        std::lock_guard<std::mutex> lock(registry_mutex_);

        if (torn_down_)
            throw ConnectionClosed("Bridge has been shut down", ErrorContext{name, method, {}});

        for (const auto& conn : connections_)
            if (conn->name == name)
                return conn;

        throw UnknownConnection("Unknown server: " + name, ErrorContext{name, method, {}});
    }

    ConnectionPtr find_or_null(const std::string& name) const
    {
        std::lock_guard<std::mutex> lock(registry_mutex_);
        for (const auto& conn : connections_)
            if (conn->name == name)
                return conn;
        return nullptr;
    }

    std::vector<ConnectionPtr> snapshot() const
    {
        std::lock_guard<std::mutex> lock(registry_mutex_);
        return connections_;
    }

    // ------------------------------------------------------------------------
    // Connection lifecycle
    // ------------------------------------------------------------------------

    // Caller holds conn.exchange_mutex. Failures log at Warning; a requested
    // close (shutdown) at Info.
    void close_connection(ServerConnection& conn, const std::string& reason,
                          LogLevel level = LogLevel::Warning)
    {
        auto previous = conn.state.exchange(ConnectionState::Closed);
        if (previous != ConnectionState::Closed && previous != ConnectionState::Unstarted)
            logger_->log(level, "Closing connection to " + conn.name + ": " + reason);

        if (!conn.transport)
            return;

        try
        {
            conn.transport->terminate(options_.graceful_shutdown_timeout);
        }
        catch (const BridgeError& e)
        {
            logger_->warning("Error closing " + conn.name + ": " + e.what());
        }
    }

    void start_all()
    {
        {
            std::lock_guard<std::mutex> lock(registry_mutex_);
            if (torn_down_)
                throw ConnectionClosed("Bridge has been shut down; call configure() again");
        }

        logger_->info("Starting MCP server connections...");

        std::vector<std::string> succeeded;
        std::map<std::string, std::string> failed;

        for (const auto& conn : snapshot())
        {
            try
            {
                start_connection(*conn);
                succeeded.push_back(conn->name);
                logger_->info("Connected to " + conn->name + " MCP server");
            }
            catch (const BridgeError& e)
            {
                failed[conn->name] = e.what();
                logger_->error("Failed to connect to " + conn->name + ": " + e.what());
            }
        }

        if (!failed.empty())
        {
            std::ostringstream oss;
            oss << "Failed to start " << failed.size() << " of "
                << (failed.size() + succeeded.size()) << " MCP servers:";
            for (const auto& [name, message] : failed)
                oss << " [" << name << ": " << message << "]";
            if (!succeeded.empty())
                oss << "; running: " << join_names(succeeded);
            throw PartialStartupFailure(oss.str(), std::move(succeeded), std::move(failed));
        }

        logger_->info("All MCP servers connected successfully");
    }

    void start_connection(ServerConnection& conn)
    {
        std::lock_guard<std::mutex> lock(conn.exchange_mutex);

        auto state = conn.state.load();
        if (state == ConnectionState::Ready)
            return;
        if (state == ConnectionState::Closed)
            throw ConnectionClosed("Connection is closed", ErrorContext{conn.name, {}, {}});

        conn.state = ConnectionState::Starting;

        try
        {
            conn.transport = transport_factory_(conn.name);
            if (!conn.transport)
                throw LaunchError("No transport available", ErrorContext{conn.name, {}, {}});
            conn.live_transport = conn.transport.get();
            if (conn.cancel_requested)
                conn.transport->cancel();

            try
            {
                conn.transport->start(conn.launch);
            }
            catch (const LaunchError& e)
            {
                throw LaunchError(e.what(), ErrorContext{conn.name, {}, {}});
            }

            conn.state = ConnectionState::Handshaking;
            handshake(conn);
            conn.state = ConnectionState::Ready;
        }
        catch (const BridgeError&)
        {
            close_connection(conn, "startup failed");
            throw;
        }
    }

    void handshake(ServerConnection& conn)
    {
        protocol::Request request;
        request.id = conn.take_id();
        request.method = protocol::Method::Initialize;
        request.params = protocol::make_initialize_params(
            options_.protocol_version, options_.client_name, options_.client_version);

        auto response = exchange(conn, request, options_.initialize_timeout);
        if (response.is_error())
            throw HandshakeError("Initialization failed: " +
                                     protocol::describe_error(*response.error),
                                 *response.error, ErrorContext{conn.name, request.method, request.id});

        {
            std::lock_guard<std::mutex> lock(conn.info_mutex);
            conn.server_info = response.result.value_or(json::object());
        }
        logger_->debug("MCP server " + conn.name + " initialized: " + conn.server_info->dump());

        // Required by MCP before any other request; no id, no response
        protocol::Notification initialized;
        initialized.method = protocol::Method::Initialized;
        send_notification(conn, initialized, options_.initialize_timeout);

        logger_->debug("Sent initialized notification to " + conn.name);
    }

    // ------------------------------------------------------------------------
    // Request / response
    // ------------------------------------------------------------------------

    // Caller holds conn.exchange_mutex. A write that does not complete leaves
    // a partial line on the wire, so every failure closes the connection.
    void write_message(ServerConnection& conn, const json& message,
                       std::chrono::milliseconds timeout, const ErrorContext& ctx)
    {
        try
        {
            conn.transport->write_line(protocol::serialize_line(message), timeout);
        }
        catch (const TimeoutExpired& e)
        {
            close_connection(conn, "write timed out");
            std::string text = "Timeout writing to " + conn.name + ": " + e.what() + " (" +
                               ctx.describe() + ")";
            logger_->warning(text);
            throw RequestTimeout(text, ctx);
        }
        catch (const OperationCancelled&)
        {
            close_connection(conn, "request cancelled");
            throw OperationCancelled("Request cancelled while writing; connection closed (" +
                                         ctx.describe() + ")",
                                     ctx);
        }
        catch (const TransportClosed& e)
        {
            close_connection(conn, e.what());
            throw TransportClosed(std::string(e.what()) + " (" + ctx.describe() + ")", ctx);
        }
    }

    // Caller holds conn.exchange_mutex
    void send_notification(ServerConnection& conn, const protocol::Notification& notification,
                           std::chrono::milliseconds timeout)
    {
        write_message(conn, notification.to_json(), timeout,
                      ErrorContext{conn.name, notification.method, {}});
    }

    static std::chrono::milliseconds
    remaining_until(std::chrono::steady_clock::time_point deadline)
    {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        return remaining.count() < 0 ? std::chrono::milliseconds(0) : remaining;
    }

    // Caller holds conn.exchange_mutex. Writes the request and reads until the
    // matching response arrives. Fatal errors close the connection; a timeout
    // leaves it open.
    protocol::Response exchange(ServerConnection& conn, const protocol::Request& request,
                                std::chrono::milliseconds timeout)
    {
        const ErrorContext ctx{conn.name, request.method, request.id};

        if (conn.cancel_requested)
        {
            close_connection(conn, "cancelled before request was sent");
            throw OperationCancelled("Request cancelled before it was sent", ctx);
        }

        // One deadline covers writing the request and reading its response
        const auto deadline = std::chrono::steady_clock::now() + timeout;

        write_message(conn, request.to_json(), timeout, ctx);

        while (true)
        {
            auto remaining = remaining_until(deadline);

            std::string line;
            try
            {
                line = conn.transport->read_line(remaining);
            }
            catch (const TimeoutExpired&)
            {
                conn.abandoned_ids.insert(request.id);
                std::string message = "Timeout reading response from " + conn.name + " after " +
                                      std::to_string(timeout.count()) + " ms (" +
                                      ctx.describe() + ")";
                logger_->warning(message);
                throw RequestTimeout(message, ctx);
            }
            catch (const OperationCancelled&)
            {
                // A stray response could arrive later and be misattributed
                close_connection(conn, "request cancelled");
                throw OperationCancelled("Request cancelled; connection closed (" +
                                             ctx.describe() + ")",
                                         ctx);
            }
            catch (const PrematureEOF& e)
            {
                close_connection(conn, e.what());
                throw PrematureEOF(std::string(e.what()) + " (" + ctx.describe() + ")", ctx);
            }
            catch (const TransportClosed& e)
            {
                close_connection(conn, e.what());
                throw TransportClosed(std::string(e.what()) + " (" + ctx.describe() + ")", ctx);
            }
            catch (const JSONDecodeError& e)
            {
                close_connection(conn, e.what());
                throw JSONDecodeError(std::string(e.what()) + " (" + ctx.describe() + ")", ctx);
            }

            protocol::IncomingMessage msg;
            try
            {
                msg = protocol::decode_line(line);
            }
            catch (const JSONDecodeError& e)
            {
                close_connection(conn, "malformed response");
                throw JSONDecodeError(std::string(e.what()) + " (" + ctx.describe() + ")", ctx);
            }
            catch (const ProtocolError& e)
            {
                close_connection(conn, "invalid JSON-RPC envelope");
                throw ProtocolError(std::string(e.what()) + " (" + ctx.describe() + ")", ctx);
            }

            if (msg.kind == protocol::MessageKind::Notification)
            {
                logger_->debug("Skipping notification '" + msg.method + "' from " + conn.name);
                continue;
            }

            if (msg.kind == protocol::MessageKind::ServerRequest)
            {
                reject_server_request(conn, msg, remaining_until(deadline), ctx);
                continue;
            }

            auto id = msg.response.int_id();
            if (id && *id == request.id)
                return msg.response;

            if (id && conn.abandoned_ids.erase(*id) > 0)
            {
                logger_->warning("Discarding late response to timed-out request " +
                                 std::to_string(*id) + " from " + conn.name);
                continue;
            }

            close_connection(conn, "response id mismatch");
            throw ResponseIdMismatch("Expected response id " + std::to_string(request.id) +
                                         " from " + conn.name + " but received " +
                                         msg.response.id.dump(),
                                     request.id, msg.response.id, ctx);
        }
    }

    // The bridge offers no client-side methods; answer so the server does not wait
    void reject_server_request(ServerConnection& conn, const protocol::IncomingMessage& msg,
                               std::chrono::milliseconds timeout, const ErrorContext& ctx)
    {
        logger_->debug("Rejecting server request '" + msg.method + "' from " + conn.name);

        protocol::Response reply;
        reply.id = msg.raw["id"];
        reply.error = json{{"code", -32601}, {"message", "Method not found: " + msg.method}};
        write_message(conn, reply.to_json(), timeout, ctx);
    }

    protocol::Response request(const std::string& server, const std::string& method,
                               const json& params)
    {
        auto conn = find(server, method);
        ErrorContext ctx{server, method, {}};

        check_ready(*conn, ctx);

        std::lock_guard<std::mutex> lock(conn->exchange_mutex);
        check_ready(*conn, ctx); // May have closed while we waited
        BusyGuard busy(*conn);

        protocol::Request req;
        req.id = conn->take_id();
        req.method = method;
        req.params = params;

        return exchange(*conn, req, options_.request_timeout);
    }

    static void check_ready(const ServerConnection& conn, const ErrorContext& ctx)
    {
        switch (conn.state.load())
        {
        case ConnectionState::Ready:
            return;
        case ConnectionState::Closed:
            throw ConnectionClosed("Connection to " + conn.name + " is closed", ctx);
        default:
            throw NotInitialized("MCP server " + conn.name +
                                     " not initialized. Call start_all() first.",
                                 ctx);
        }
    }

    // ------------------------------------------------------------------------
    // Tool operations
    // ------------------------------------------------------------------------

    std::vector<ToolDescriptor> list_tools(const std::string& server)
    {
        auto response = request(server, protocol::Method::ToolsList, json::object());
        ErrorContext ctx{server, protocol::Method::ToolsList, response.int_id()};

        if (response.is_error())
            throw ToolInvocationError("Failed to list tools on " + server + ": " +
                                          protocol::describe_error(*response.error),
                                      *response.error, ctx);

        std::vector<ToolDescriptor> tools;
        const json& result = *response.result;
        if (!result.is_object() || !result.contains("tools"))
            return tools;

        const json& items = result["tools"];
        if (!items.is_array())
            throw ProtocolError("tools/list result 'tools' is not an array", ctx);

        for (const auto& item : items)
        {
            try
            {
                tools.push_back(ToolDescriptor::from_json(item));
            }
            catch (const json::exception& e)
            {
                throw ProtocolError(std::string("Invalid tool descriptor: ") + e.what(), ctx);
            }
        }
        return tools;
    }

    ToolResult call_tool(const std::string& server, const std::string& tool,
                         const json& arguments)
    {
        logger_->info("Calling " + server + "." + tool + " with args: " + arguments.dump());

        auto response = request(server, protocol::Method::ToolsCall,
                                protocol::make_tool_call_params(tool, arguments));

        if (response.is_error())
        {
            std::string message = "MCP error from " + server + "." + tool + ": " +
                                  protocol::describe_error(*response.error);
            logger_->error(message);
            throw ToolInvocationError(
                message, *response.error,
                ErrorContext{server, protocol::Method::ToolsCall, response.int_id()});
        }

        return unwrap_tool_result(*response.result);
    }

    void cancel(const std::string& server)
    {
        auto conn = find_or_null(server);
        if (!conn || !conn->busy)
            return;

        logger_->warning("Cancelling in-flight request on " + server);
        conn->cancel_requested = true;
        if (auto* transport = conn->live_transport.load())
            transport->cancel();
    }

    void shutdown() noexcept
    {
        auto connections = snapshot();

        if (!connections.empty())
            logger_->info("Shutting down MCP connections...");

        // Wake any blocked reader first so the exchange locks free up quickly
        for (const auto& conn : connections)
        {
            conn->cancel_requested = true;
            if (auto* transport = conn->live_transport.load())
                transport->cancel();
        }

        for (const auto& conn : connections)
        {
            try
            {
                std::lock_guard<std::mutex> lock(conn->exchange_mutex);
                bool had_process = conn->transport != nullptr &&
                                   conn->state.load() != ConnectionState::Closed;
                close_connection(*conn, "shutdown", LogLevel::Info);
                if (had_process)
                    logger_->info("Closed connection to " + conn->name);
            }
            catch (const std::exception& e)
            {
                logger_->warning("Error closing " + conn->name + ": " + e.what());
            }
        }

        std::lock_guard<std::mutex> lock(registry_mutex_);
        connections_.clear();
        torn_down_ = true;
    }
};

// ============================================================================
// ProtocolBridge
// ============================================================================

ProtocolBridge::ProtocolBridge(BridgeOptions options)
    : impl_(std::make_unique<Impl>(std::move(options), nullptr))
{
}

ProtocolBridge::ProtocolBridge(BridgeOptions options, TransportFactory transport_factory)
    : impl_(std::make_unique<Impl>(std::move(options), std::move(transport_factory)))
{
}

ProtocolBridge::~ProtocolBridge() = default;

ProtocolBridge::ProtocolBridge(ProtocolBridge&&) noexcept = default;
ProtocolBridge& ProtocolBridge::operator=(ProtocolBridge&&) noexcept = default;

void ProtocolBridge::configure(const std::vector<ServerConfig>& servers)
{
    impl_->configure(servers);
}

void ProtocolBridge::start_all()
{
    impl_->start_all();
}

std::vector<ToolDescriptor> ProtocolBridge::list_tools(const std::string& server)
{
    return impl_->list_tools(server);
}

ToolResult ProtocolBridge::call_tool(const std::string& server, const std::string& tool,
                                     const json& arguments)
{
    return impl_->call_tool(server, tool, arguments);
}

Result<std::vector<ToolDescriptor>> ProtocolBridge::try_list_tools(const std::string& server)
{
    try
    {
        return Result<std::vector<ToolDescriptor>>::ok(impl_->list_tools(server));
    }
    catch (const BridgeError& e)
    {
        return Result<std::vector<ToolDescriptor>>::fail(ErrorInfo::from_exception(e));
    }
}

Result<ToolResult> ProtocolBridge::try_call_tool(const std::string& server, const std::string& tool,
                                                 const json& arguments)
{
    try
    {
        return Result<ToolResult>::ok(impl_->call_tool(server, tool, arguments));
    }
    catch (const BridgeError& e)
    {
        return Result<ToolResult>::fail(ErrorInfo::from_exception(e));
    }
}

void ProtocolBridge::cancel(const std::string& server)
{
    impl_->cancel(server);
}

void ProtocolBridge::shutdown() noexcept
{
    if (impl_)
        impl_->shutdown();
}

std::vector<std::string> ProtocolBridge::connection_names() const
{
    std::vector<std::string> names;
    for (const auto& conn : impl_->snapshot())
        names.push_back(conn->name);
    return names;
}

ConnectionState ProtocolBridge::state(const std::string& server) const
{
    auto conn = impl_->find_or_null(server);
    if (!conn)
        throw UnknownConnection("Unknown server: " + server, ErrorContext{server, {}, {}});
    return conn->state.load();
}

std::optional<json> ProtocolBridge::server_info(const std::string& server) const
{
    auto conn = impl_->find_or_null(server);
    if (!conn)
        return std::nullopt;
    std::lock_guard<std::mutex> lock(conn->info_mutex);
    return conn->server_info;
}

long ProtocolBridge::get_pid(const std::string& server) const
{
    auto conn = impl_->find_or_null(server);
    if (!conn)
        return 0;
    if (auto* transport = conn->live_transport.load())
        return transport->get_pid();
    return 0;
}

bool ProtocolBridge::is_torn_down() const
{
    std::lock_guard<std::mutex> lock(impl_->registry_mutex_);
    return impl_->torn_down_;
}

const BridgeOptions& ProtocolBridge::options() const
{
    return impl_->options_;
}

} // namespace mcpbridge
