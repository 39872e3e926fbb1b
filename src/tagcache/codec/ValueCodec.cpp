#include "tagcache/codec/ValueCodec.hpp"
#include <cmath>
#include "tagcache/cache/base/CacheError.hpp"

namespace tagcache {
namespace codec {

namespace {

// JSON не умеет NaN и бесконечности: dump() пишет вместо них null
bool hasNonFinite(const Value& value) {
    if (value.is_number_float()) {
        return !std::isfinite(value.get<double>());
    }
    if (value.is_structured()) {
        for (const auto& item : value) {
            if (hasNonFinite(item)) {
                return true;
            }
        }
    }
    return false;
}

} // namespace

CodecFormat parseFormat(const std::string& name) {
    if (name == "msgpack") return CodecFormat::MessagePack;
    if (name == "cbor") return CodecFormat::Cbor;
    if (name == "json") return CodecFormat::Json;
    throw ConfigurationError("Unsupported codec: " + name);
}

std::string formatName(CodecFormat format) {
    switch (format) {
        case CodecFormat::MessagePack: return "msgpack";
        case CodecFormat::Cbor: return "cbor";
        case CodecFormat::Json: return "json";
    }
    return "unknown";
}

ValueCodec::ValueCodec(CodecFormat format) : format_(format) {}

Bytes ValueCodec::encode(const Value& value) const {
    try {
        switch (format_) {
            case CodecFormat::MessagePack:
                return nlohmann::json::to_msgpack(value);
            case CodecFormat::Cbor:
                return nlohmann::json::to_cbor(value);
            case CodecFormat::Json: {
                if (hasNonFinite(value)) {
                    throw SerializationError("Failed to encode value: JSON cannot represent NaN or infinity");
                }
                // Невалидный UTF-8 в строках - type_error 316
                auto text = value.dump();
                return Bytes(text.begin(), text.end());
            }
        }
    } catch (const nlohmann::json::exception& e) {
        throw SerializationError(std::string("Failed to encode value: ") + e.what());
    }
    throw SerializationError("Failed to encode value: unknown codec format");
}

Value ValueCodec::decode(const Bytes& bytes) const {
    try {
        switch (format_) {
            case CodecFormat::MessagePack:
                return nlohmann::json::from_msgpack(bytes);
            case CodecFormat::Cbor:
                return nlohmann::json::from_cbor(bytes);
            case CodecFormat::Json:
                return nlohmann::json::parse(bytes.begin(), bytes.end());
        }
    } catch (const nlohmann::json::exception& e) {
        throw SerializationError(std::string("Failed to decode stored value (") +
                                 formatName(format_) + "): " + e.what());
    }
    throw SerializationError("Failed to decode stored value: unknown codec format");
}

} // namespace codec
} // namespace tagcache
