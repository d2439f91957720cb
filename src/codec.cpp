#include "vexdoc/codec.hpp"
#include "vexdoc/error.hpp"
#include "vexdoc/version.hpp"
#include <nlohmann/json.hpp>
#include <simdjson.h>
#include <optional>
#include <stdexcept>
#include <string>

namespace vexdoc {

namespace {

// Convert simdjson value to nlohmann::json recursively
nlohmann::json simdjson_to_nlohmann(simdjson::ondemand::value val) {
    switch (val.type()) {
        case simdjson::ondemand::json_type::object: {
            nlohmann::json obj = nlohmann::json::object();
            for (auto field : val.get_object()) {
                std::string_view key = field.unescaped_key();
                obj[std::string(key)] = simdjson_to_nlohmann(field.value());
            }
            return obj;
        }
        case simdjson::ondemand::json_type::array: {
            nlohmann::json arr = nlohmann::json::array();
            for (auto elem : val.get_array()) {
                arr.push_back(simdjson_to_nlohmann(elem.value()));
            }
            return arr;
        }
        case simdjson::ondemand::json_type::string: {
            std::string_view sv = val.get_string();
            return nlohmann::json(std::string(sv));
        }
        case simdjson::ondemand::json_type::number: {
            auto as_int = val.get_int64();
            if (as_int.error() == simdjson::SUCCESS) {
                return nlohmann::json(as_int.value());
            }
            auto as_uint = val.get_uint64();
            if (as_uint.error() == simdjson::SUCCESS) {
                return nlohmann::json(as_uint.value());
            }
            return nlohmann::json(val.get_double().value());
        }
        case simdjson::ondemand::json_type::boolean:
            return nlohmann::json(val.get_bool().value());
        case simdjson::ondemand::json_type::null:
            return nlohmann::json(nullptr);
        default:
            return nlohmann::json(nullptr);
    }
}

// Scalar documents ("42", "true") have no value() view in on-demand mode.
nlohmann::json simdjson_doc_to_nlohmann(simdjson::ondemand::document& doc) {
    simdjson::ondemand::json_type type;
    if (auto err = doc.type().get(type)) {
        throw ParseError(error::ParseError,
                         std::string("JSON parse error: ") + simdjson::error_message(err));
    }
    if (type == simdjson::ondemand::json_type::object ||
        type == simdjson::ondemand::json_type::array) {
        simdjson::ondemand::value val;
        if (auto err = doc.get_value().get(val)) {
            throw ParseError(error::ParseError,
                             std::string("JSON parse error: ") + simdjson::error_message(err));
        }
        auto j = simdjson_to_nlohmann(val);
        if (!doc.at_end()) {
            throw ParseError(error::ParseError, "JSON parse error: trailing content");
        }
        return j;
    }
    // A top-level scalar is never an envelope, but it still has to be valid JSON.
    simdjson::error_code scalar_err = simdjson::SUCCESS;
    switch (type) {
        case simdjson::ondemand::json_type::string:
            scalar_err = doc.get_string().error();
            break;
        case simdjson::ondemand::json_type::number:
            scalar_err = doc.get_double().error();
            break;
        case simdjson::ondemand::json_type::boolean:
            scalar_err = doc.get_bool().error();
            break;
        case simdjson::ondemand::json_type::null:
            scalar_err = doc.is_null().error();
            break;
        default:
            break;
    }
    if (scalar_err) {
        throw ParseError(error::ParseError,
                         std::string("JSON parse error: ") + simdjson::error_message(scalar_err));
    }
    return nlohmann::json(nullptr);
}

std::optional<RequestId> recover_id(const nlohmann::json& j) {
    auto it = j.find("id");
    if (it == j.end()) return std::nullopt;
    RequestId id;
    try {
        from_json(*it, id);
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    }
    return id;
}

} // anonymous namespace

JsonRpcMessage Codec::parse_object(const nlohmann::json& j) {
    const auto id = recover_id(j);

    auto version = j.find("jsonrpc");
    if (version == j.end()) {
        throw ParseError(error::InvalidRequest, "Missing 'jsonrpc' field", id);
    }
    if (!version->is_string() || version->get<std::string>() != JSONRPC_VERSION) {
        throw ParseError(error::InvalidRequest, "Invalid jsonrpc version, expected '2.0'", id);
    }

    bool has_id = j.contains("id");
    bool has_method = j.contains("method");

    if (has_id && !id) {
        throw ParseError(error::InvalidRequest, "Request ID must be a string or a 64-bit signed integer");
    }

    std::optional<nlohmann::json> params;
    if (j.contains("params")) {
        const auto& p = j.at("params");
        if (!p.is_object() && !p.is_array() && !p.is_null()) {
            throw ParseError(error::InvalidRequest, "'params' must be an object or an array", id);
        }
        if (!p.is_null()) params = p;
    }

    if (has_method) {
        if (!j.at("method").is_string()) {
            throw ParseError(error::InvalidRequest, "'method' must be a string", id);
        }
        if (has_id) {
            JsonRpcRequest req;
            req.id = *id;
            req.method = j.at("method").get<std::string>();
            req.params = std::move(params);
            return req;
        }
        JsonRpcNotification notif;
        notif.method = j.at("method").get<std::string>();
        notif.params = std::move(params);
        return notif;
    }

    if (has_id) {
        JsonRpcResponse resp;
        resp.id = *id;
        if (j.contains("result")) resp.result = j.at("result");
        if (j.contains("error")) {
            try {
                resp.error = j.at("error").get<JsonRpcError>();
            } catch (const nlohmann::json::exception& e) {
                throw ParseError(error::InvalidRequest,
                                 std::string("Malformed error object: ") + e.what(), id);
            }
        }
        if (resp.result.has_value() == resp.error.has_value()) {
            throw ParseError(error::InvalidRequest,
                             "Response must carry exactly one of 'result' or 'error'", id);
        }
        return resp;
    }

    throw ParseError(error::InvalidRequest,
                     "Cannot determine message type: missing both 'id' and 'method'");
}

JsonRpcMessage Codec::parse(std::string_view raw) {
    if (raw.empty()) {
        throw ParseError(error::ParseError, "Empty input");
    }

    simdjson::ondemand::parser parser;
    // simdjson requires padded input
    simdjson::padded_string padded(raw.data(), raw.size());

    simdjson::ondemand::document doc;
    auto err = parser.iterate(padded).get(doc);
    if (err) {
        throw ParseError(error::ParseError,
                         std::string("JSON parse error: ") + simdjson::error_message(err));
    }

    nlohmann::json j;
    try {
        j = simdjson_doc_to_nlohmann(doc);
    } catch (const simdjson::simdjson_error& e) {
        throw ParseError(error::ParseError, std::string("JSON parse error: ") + e.what());
    }

    if (!j.is_object()) {
        throw ParseError(error::InvalidRequest, "Message must be a JSON object");
    }

    return parse_object(j);
}

std::string Codec::serialize(const JsonRpcMessage& msg) {
    nlohmann::json j;
    to_json(j, msg);
    // Tool text may carry invalid UTF-8; replace it rather than fail the write.
    return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

} // namespace vexdoc
