#include <bashgate/core/tool_dispatcher.hpp>
#include <bashgate/core/app_info.hpp>
#include <bashgate/core/logger.hpp>
#include <bashgate/core/utils.hpp>

#include <exception>

namespace bashgate {

const char* const ToolDispatcher::TOOL_NAME = "execute_command";

ToolDispatcher::ToolDispatcher(const Gateway& gateway) : gateway_(gateway) {}

// ============================================================================
// Framing
// ============================================================================

bool ToolDispatcher::handle_line(const std::string& line, std::string& response) const {
    std::string text = trim(line);
    if (text.empty()) {
        return false;
    }

    Json reply;
    try {
        Json message = Json::parse(text);
        reply = handle_message(message);
    } catch (const Json::parse_error& e) {
        LOG_WARN("Unparseable request line: %s", e.what());
        reply = make_error(Json(), rpc::PARSE_ERROR, "Parse error");
    }

    if (reply.is_null()) {
        return false;
    }
    response = reply.dump(-1, ' ', false, Json::error_handler_t::replace);
    return true;
}

Json ToolDispatcher::make_result(const Json& id, const Json& result) {
    Json reply = Json::object();
    reply["jsonrpc"] = "2.0";
    reply["id"] = id;
    reply["result"] = result;
    return reply;
}

Json ToolDispatcher::make_error(const Json& id, int code, const std::string& message) {
    Json reply = Json::object();
    reply["jsonrpc"] = "2.0";
    reply["id"] = id;
    reply["error"] = { {"code", code}, {"message", message} };
    return reply;
}

// ============================================================================
// Dispatch
// ============================================================================

Json ToolDispatcher::handle_message(const Json& message) const {
    if (!message.is_object()) {
        return make_error(Json(), rpc::INVALID_REQUEST, "Invalid Request");
    }

    bool is_notification = !message.contains("id");
    Json id = is_notification ? Json() : message["id"];
    if (!id.is_null() && !id.is_string() && !id.is_number_integer()) {
        return make_error(Json(), rpc::INVALID_REQUEST, "Invalid Request: bad id");
    }

    Json::const_iterator version = message.find("jsonrpc");
    if (version != message.end() && (!version->is_string() || version->get<std::string>() != "2.0")) {
        return is_notification ? Json() : make_error(id, rpc::INVALID_REQUEST, "Invalid Request: jsonrpc must be \"2.0\"");
    }

    Json::const_iterator method_it = message.find("method");
    if (method_it == message.end() || !method_it->is_string()) {
        return is_notification ? Json() : make_error(id, rpc::INVALID_REQUEST, "Invalid Request: missing method");
    }
    std::string method = method_it->get<std::string>();

    Json params = Json::object();
    Json::const_iterator params_it = message.find("params");
    if (params_it != message.end() && !params_it->is_null()) {
        params = *params_it;
    }

    if (is_notification) {
        // notifications/initialized, notifications/cancelled, ...
        LOG_DEBUG("Notification: %s", method.c_str());
        return Json();
    }

    LOG_DEBUG("Request %s: %s", id.dump().c_str(), method.c_str());

    if (method == "initialize") {
        return make_result(id, handle_initialize(params));
    }
    if (method == "ping") {
        return make_result(id, Json::object());
    }
    if (method == "tools/list") {
        return make_result(id, handle_tools_list());
    }
    if (method == "tools/call") {
        return handle_tools_call(id, params);
    }

    return make_error(id, rpc::METHOD_NOT_FOUND, "Method not found: " + method);
}

Json ToolDispatcher::handle_initialize(const Json& params) const {
    std::string protocol = AppInfo::PROTOCOL_VERSION;
    if (params.is_object() && params.contains("protocolVersion") && params["protocolVersion"].is_string()) {
        protocol = params["protocolVersion"].get<std::string>();
    }

    Json result = Json::object();
    result["protocolVersion"] = protocol;
    result["serverInfo"] = { {"name", AppInfo::NAME}, {"version", AppInfo::VERSION} };
    result["capabilities"] = { {"tools", Json::object()} };
    return result;
}

Json ToolDispatcher::tool_definition() {
    Json schema = {
        {"type", "object"},
        {"properties", {
            {"command", { {"type", "string"}, {"description", "The bash command to execute"} }},
            {"cwd", { {"type", "string"}, {"description", "Working directory for the command"} }},
            {"timeout", { {"type", "number"}, {"description", "Optional timeout in seconds"} }}
        }},
        {"required", Json::array({"command", "cwd"})}
    };

    Json tool = Json::object();
    tool["name"] = TOOL_NAME;
    tool["description"] = "Execute a bash command in a secure environment";
    tool["inputSchema"] = schema;
    return tool;
}

Json ToolDispatcher::handle_tools_list() const {
    Json tools = Json::array();
    tools.push_back(tool_definition());
    return { {"tools", tools} };
}

Json ToolDispatcher::handle_tools_call(const Json& id, const Json& params) const {
    if (!params.is_object()) {
        return make_error(id, rpc::INVALID_PARAMS, "Invalid params");
    }

    Json::const_iterator name = params.find("name");
    if (name == params.end() || !name->is_string()) {
        return make_error(id, rpc::INVALID_PARAMS, "Missing tool name");
    }
    if (name->get<std::string>() != TOOL_NAME) {
        return make_error(id, rpc::INVALID_PARAMS, "Unknown tool: " + name->get<std::string>());
    }

    Json arguments = Json::object();
    Json::const_iterator args_it = params.find("arguments");
    if (args_it != params.end() && !args_it->is_null()) {
        arguments = *args_it;
    }

    ExecutionRequest request;
    std::string error;
    if (!ExecutionRequest::from_json(arguments, request, error)) {
        return make_error(id, rpc::INVALID_PARAMS, error);
    }

    ExecutionResult result;
    try {
        result = gateway_.execute(request);
    } catch (const std::exception& e) {
        LOG_ERROR("tools/call failed: %s", e.what());
        return make_error(id, rpc::INTERNAL_ERROR, std::string("Internal error: ") + e.what());
    }

    Json content = Json::array();
    content.push_back({
        {"type", "text"},
        {"text", result.to_json().dump(2, ' ', false, Json::error_handler_t::replace)}
    });

    Json reply = Json::object();
    reply["content"] = content;
    reply["isError"] = !result.success;
    return make_result(id, reply);
}

} // namespace bashgate
