/*
 * bashgate C++17 - Tool Dispatcher
 *
 * Line-delimited JSON-RPC 2.0 front end. One request object per line in,
 * one response object per line out; notifications (no "id") get nothing.
 *
 *   initialize   -> server name/version and capabilities
 *   ping         -> {}
 *   tools/list   -> the execute_command tool and its input schema
 *   tools/call   -> Gateway::execute, result JSON as a text content block
 */
#ifndef bashgate_CORE_TOOL_DISPATCHER_HPP
#define bashgate_CORE_TOOL_DISPATCHER_HPP

#include "json.hpp"
#include <bashgate/gate/gateway.hpp>
#include <string>

namespace bashgate {

namespace rpc {
const int PARSE_ERROR = -32700;
const int INVALID_REQUEST = -32600;
const int METHOD_NOT_FOUND = -32601;
const int INVALID_PARAMS = -32602;
const int INTERNAL_ERROR = -32603;
}

class ToolDispatcher {
public:
    static const char* const TOOL_NAME;

    explicit ToolDispatcher(const Gateway& gateway);

    // Handle one raw line. Returns false when there is nothing to send back
    // (blank line or notification); otherwise `response` holds one line of
    // JSON without the trailing newline.
    bool handle_line(const std::string& line, std::string& response) const;

    // Handle one parsed message. Returns null for notifications.
    Json handle_message(const Json& message) const;

    static Json tool_definition();

    static Json make_result(const Json& id, const Json& result);
    static Json make_error(const Json& id, int code, const std::string& message);

private:
    Json handle_initialize(const Json& params) const;
    Json handle_tools_list() const;
    Json handle_tools_call(const Json& id, const Json& params) const;

    const Gateway& gateway_;
};

} // namespace bashgate

#endif // bashgate_CORE_TOOL_DISPATCHER_HPP
