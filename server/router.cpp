#include "router.hpp"
#include "api_codec.hpp"
#include "gateway.hpp"
#include "fundamentals/json_utils.hpp"

#include <format>
#include <tuple>

namespace json = boost::json;
using namespace json_utils;

namespace
{

json::object ok(json::object body)
{
    body["status"] = "ok";
    return body;
}

} // namespace

Router::Router(Gateway& gw) : gateway(gw), hdls{
    {"public_keys", handle_public_keys},
    {"client_hello", handle_client_hello},
    {"client_key_exchange", handle_key_exchange},
    {"verify_session", handle_verify},
    {"invalidate_session", handle_invalidate},
    {"health", handle_health},
    {"metrics", handle_metrics},
}
{
}

void Router::register_handler(std::string action, Handler hdl)
{
    hdls[std::move(action)] = std::move(hdl);
}

json::object Router::route(const json::object& request)
{
    auto it = request.find("action");
    if (it == request.end())
    {
        return api::error_reply({ErrorCode::InvalidArgument, "Missing 'action' field"});
    }
    if (!it->value().is_string())
    {
        return api::error_reply({ErrorCode::InvalidArgument, "'action' must be string"});
    }

    std::string action_str(it->value().as_string());
    auto handler_it = hdls.find(action_str);
    if (handler_it == hdls.end())
    {
        return api::error_reply({ErrorCode::InvalidArgument, std::format("Unknown action: {}", action_str)});
    }

    return handler_it->second(gateway, request);
}

std::string Router::route(std::string_view body)
{
    boost::system::error_code ec;
    auto jv = json::parse(body, ec);
    if (ec || !jv.is_object())
    {
        return json::serialize(api::error_reply({ErrorCode::InvalidArgument, "Request is not a JSON object"}));
    }
    return json::serialize(route(jv.as_object()));
}

json::object Router::handle_public_keys(Gateway& gw, const json::object& request)
{
    std::ignore = request;
    return ok(api::to_json(gw.public_keys()));
}

json::object Router::handle_client_hello(Gateway& gw, const json::object& request)
{
    auto hello = api::client_hello_from_json(request);
    if (!hello)
    {
        return api::error_reply({ErrorCode::InvalidArgument, hello.error()});
    }

    auto reply = gw.client_hello(*hello);
    if (!reply)
    {
        return api::error_reply(reply.error());
    }
    return ok(api::to_json(*reply));
}

json::object Router::handle_key_exchange(Gateway& gw, const json::object& request)
{
    auto cke = api::key_exchange_from_json(request);
    if (!cke)
    {
        return api::error_reply({ErrorCode::InvalidArgument, cke.error()});
    }

    auto reply = gw.client_key_exchange(*cke);
    if (!reply)
    {
        return api::error_reply(reply.error());
    }
    return ok(api::to_json(*reply));
}

json::object Router::handle_verify(Gateway& gw, const json::object& request)
{
    auto id = extract_str(request, "session_id");
    if (!id)
    {
        return api::error_reply({ErrorCode::InvalidArgument, id.error()});
    }

    auto result = gw.verify_session(*id);
    if (!result.valid && result.reason == ErrorCode::SessionNotFound)
    {
        return api::error_reply({ErrorCode::SessionNotFound, std::format("Unknown session {}", *id)});
    }
    return ok(api::to_json(result));
}

json::object Router::handle_invalidate(Gateway& gw, const json::object& request)
{
    auto id = extract_str(request, "session_id");
    if (!id)
    {
        return api::error_reply({ErrorCode::InvalidArgument, id.error()});
    }

    if (auto res = gw.invalidate_session(*id); !res)
    {
        return api::error_reply(res.error());
    }
    return status_msg("ok", "Session invalidated");
}

json::object Router::handle_health(Gateway& gw, const json::object& request)
{
    std::ignore = request;
    return ok(api::to_json(gw.health()));
}

json::object Router::handle_metrics(Gateway& gw, const json::object& request)
{
    std::ignore = request;
    return ok(api::to_json(gw.metrics()));
}
