#pragma once

#include <boost/json.hpp>
#include <expected>
#include <string>

#include "errors.hpp"
#include "gateway.hpp"
#include "handshake/messages.hpp"
#include "keys/key_pair.hpp"
#include "session/session_record.hpp"

/**
 * JSON shapes handed to whatever transport fronts the gateway. Binary fields
 * travel as lowercase hex and timestamps as unix milliseconds.
 */
namespace api
{

[[nodiscard]] boost::json::object to_json(const keys::PublicKeyInfo& info);
[[nodiscard]] boost::json::object to_json(const keys::PublicKeyBundle& bundle);
[[nodiscard]] boost::json::object to_json(const handshake::ServerHello& sh);
[[nodiscard]] boost::json::object to_json(const handshake::ServerFinished& sf);
[[nodiscard]] boost::json::object to_json(const session::VerifyResult& vr);
[[nodiscard]] boost::json::object to_json(const HealthReport& report);
[[nodiscard]] boost::json::object to_json(const GatewayMetrics& m);

// {"status": "error", "code": ..., "message": ...}
[[nodiscard]] boost::json::object error_reply(const Error& err);

[[nodiscard]] std::expected<handshake::ClientHello, std::string> client_hello_from_json(const boost::json::object& obj);
[[nodiscard]] std::expected<handshake::ClientKeyExchange, std::string> key_exchange_from_json(const boost::json::object& obj);

// Client side of the same mapping.
[[nodiscard]] boost::json::object to_json(const handshake::ClientHello& ch);
[[nodiscard]] boost::json::object to_json(const handshake::ClientKeyExchange& cke);
[[nodiscard]] std::expected<handshake::ServerHello, std::string> server_hello_from_json(const boost::json::object& obj);
[[nodiscard]] std::expected<handshake::ServerFinished, std::string> server_finished_from_json(const boost::json::object& obj);

} // namespace api
