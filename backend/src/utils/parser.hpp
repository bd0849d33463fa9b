#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <msgpack.hpp>
#include <nlohmann/json.hpp>

namespace proptrade::utils {

// Recursively convert a MsgPack object to JSON. Map keys that are not
// strings are skipped.
inline nlohmann::json convertMsgPackToJson(const msgpack::object& obj) {
    switch (obj.type) {
        case msgpack::type::NIL:
            return nullptr;
        case msgpack::type::STR: {
            std::string str;
            obj.convert(str);
            return str;
        }
        case msgpack::type::POSITIVE_INTEGER: {
            uint64_t num;
            obj.convert(num);
            return num;
        }
        case msgpack::type::NEGATIVE_INTEGER: {
            int64_t num;
            obj.convert(num);
            return num;
        }
        case msgpack::type::FLOAT32:
        case msgpack::type::FLOAT64: {
            double num;
            obj.convert(num);
            return num;
        }
        case msgpack::type::BOOLEAN: {
            bool b;
            obj.convert(b);
            return b;
        }
        case msgpack::type::ARRAY: {
            nlohmann::json::array_t arr;
            for (size_t i = 0; i < obj.via.array.size; i++) {
                arr.push_back(convertMsgPackToJson(obj.via.array.ptr[i]));
            }
            return arr;
        }
        case msgpack::type::MAP: {
            nlohmann::json::object_t map;
            for (size_t i = 0; i < obj.via.map.size; i++) {
                const auto& pair = obj.via.map.ptr[i];
                if (pair.key.type != msgpack::type::STR) {
                    continue;
                }
                std::string key;
                pair.key.convert(key);
                map[key] = convertMsgPackToJson(pair.val);
            }
            return map;
        }
        default:
            return nullptr;
    }
}

// Payloads arrive as MsgPack maps; UTF-8 JSON text is accepted as well.
// Returns nothing when the bytes are neither.
inline std::optional<nlohmann::json> parsePayload(const std::vector<uint8_t>& req) {
    if (req.empty()) {
        return nlohmann::json::object();
    }

    if (req.front() == '{' || req.front() == '[') {
        auto parsed = nlohmann::json::parse(req.begin(), req.end(), nullptr, false);
        if (!parsed.is_discarded()) {
            return parsed;
        }
    }

    try {
        msgpack::object_handle oh = msgpack::unpack(reinterpret_cast<const char*>(req.data()), req.size());
        return convertMsgPackToJson(oh.get());
    } catch (const msgpack::unpack_error&) {
        return std::nullopt;
    } catch (const msgpack::type_error&) {
        return std::nullopt;
    }
}

} // namespace proptrade::utils
