#pragma once

#include <boost/json.hpp>
#include <functional>
#include <string>
#include <unordered_map>

class Gateway;

/**
 * Transport-independent dispatcher for gateway requests. A request is a JSON
 * object whose "action" field names the operation; the reply is a JSON object
 * with "status" set to "ok" or "error".
 */
class Router
{
public:
    using Handler = std::function<boost::json::object(Gateway&, const boost::json::object&)>;

    explicit Router(Gateway& gateway);

    void register_handler(std::string action, Handler hdl);
    [[nodiscard]] boost::json::object route(const boost::json::object& request);
    // Parses `body` as JSON first; malformed input yields an error reply.
    [[nodiscard]] std::string route(std::string_view body);

    static boost::json::object handle_public_keys(Gateway& gw, const boost::json::object& request);
    static boost::json::object handle_client_hello(Gateway& gw, const boost::json::object& request);
    static boost::json::object handle_key_exchange(Gateway& gw, const boost::json::object& request);
    static boost::json::object handle_verify(Gateway& gw, const boost::json::object& request);
    static boost::json::object handle_invalidate(Gateway& gw, const boost::json::object& request);
    static boost::json::object handle_health(Gateway& gw, const boost::json::object& request);
    static boost::json::object handle_metrics(Gateway& gw, const boost::json::object& request);

private:
    Gateway& gateway;
    std::unordered_map<std::string, Handler> hdls;
};
