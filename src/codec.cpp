#include "mcpkit/codec.hpp"
#include <nlohmann/json.hpp>
#include <simdjson.h>
#include <stdexcept>
#include <string>

namespace mcpkit {

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
            if (as_int.error() == simdjson::SUCCESS) return nlohmann::json(as_int.value());
            auto as_uint = val.get_uint64();
            if (as_uint.error() == simdjson::SUCCESS) return nlohmann::json(as_uint.value());
            return nlohmann::json(val.get_double().value());
        }
        case simdjson::ondemand::json_type::boolean:
            return nlohmann::json(val.get_bool().value());
        case simdjson::ondemand::json_type::null:
        default:
            return nlohmann::json(nullptr);
    }
}

} // anonymous namespace

nlohmann::json Codec::parse_json(std::string_view raw) {
    if (raw.empty()) {
        throw McpParseError("empty input");
    }

    simdjson::ondemand::parser parser;
    simdjson::padded_string padded(raw.data(), raw.size());

    simdjson::ondemand::document doc;
    auto error = parser.iterate(padded).get(doc);
    if (error) {
        throw McpParseError(simdjson::error_message(error));
    }

    try {
        simdjson::ondemand::value root;
        error = doc.get_value().get(root);
        if (error) throw McpParseError(simdjson::error_message(error));
        return simdjson_to_nlohmann(root);
    } catch (const simdjson::simdjson_error& e) {
        throw McpParseError(e.what());
    }
}

Request Codec::parse_request(std::string_view raw) {
    nlohmann::json j = parse_json(raw);
    if (!j.is_object()) {
        throw McpParseError("message must be a JSON object");
    }
    if (!j.contains("method") || !j.at("method").is_string()) {
        throw McpParseError("missing or non-string 'method'");
    }
    // Field conversions throw nlohmann::json::exception for wrong types and
    // std::invalid_argument for a progressToken that is neither integer nor string.
    try {
        return j.get<Request>();
    } catch (const std::exception& e) {
        throw McpParseError(e.what());
    }
}

std::string Codec::serialize(const Response& resp) {
    nlohmann::json j;
    to_json(j, resp);
    return j.dump();
}

std::string Codec::serialize(const ServerNotification& n) {
    nlohmann::json j;
    to_json(j, n);
    return j.dump();
}

} // namespace mcpkit
