#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace tagcache {

/// Значение, хранимое в кэше: null, скаляры, массивы и вложенные объекты.
using Value = nlohmann::json;
/// Закодированное значение.
using Bytes = std::vector<uint8_t>;

namespace codec {

enum class CodecFormat {
    MessagePack,
    Cbor,
    Json
};

/// "msgpack", "cbor", "json". Неизвестное имя - ConfigurationError.
CodecFormat parseFormat(const std::string& name);
std::string formatName(CodecFormat format);

/**
 * @brief Кодек значений для удалённых бэкендов.
 * decode(encode(v)) == v для любого Value.
 * Ошибки кодирования и декодирования - SerializationError.
 * Формат Json отказывается кодировать NaN и бесконечности.
 */
class ValueCodec {
public:
    explicit ValueCodec(CodecFormat format = CodecFormat::MessagePack);

    Bytes encode(const Value& value) const;
    Value decode(const Bytes& bytes) const;

    CodecFormat format() const { return format_; }

private:
    CodecFormat format_;
};

} // namespace codec
} // namespace tagcache
