#include <cassert>
#include <cmath>
#include <iostream>
#include <limits>
#include <string>
#include "tagcache/cache/base/CacheError.hpp"
#include "tagcache/codec/ValueCodec.hpp"

using tagcache::Bytes;
using tagcache::Value;
using tagcache::codec::CodecFormat;
using tagcache::codec::ValueCodec;

namespace {

const CodecFormat kFormats[] = {CodecFormat::MessagePack, CodecFormat::Cbor, CodecFormat::Json};

bool decodeFails(const ValueCodec& codec, const Bytes& bytes) {
    try {
        codec.decode(bytes);
    } catch (const tagcache::SerializationError&) {
        return true;
    }
    return false;
}

} // namespace

void smokeTestRoundTrip() {
    const Value samples[] = {
        nullptr,
        true,
        -17,
        18446744073709551615ull,
        3.25,
        "",
        "строка",
        Value::array(),
        Value::object(),
        {{"users", {{{"id", 1}, {"roles", {"admin", "dev"}}}}}, {"none", nullptr}}
    };
    for (auto format : kFormats) {
        ValueCodec codec(format);
        assert(codec.format() == format);
        for (const auto& sample : samples) {
            assert(codec.decode(codec.encode(sample)) == sample);
        }
    }
    std::cout << "[OK] ValueCodec round trip\n";
}

void smokeTestGarbage() {
    assert(decodeFails(ValueCodec(CodecFormat::MessagePack), Bytes{0xc1}));
    assert(decodeFails(ValueCodec(CodecFormat::MessagePack), Bytes{}));
    assert(decodeFails(ValueCodec(CodecFormat::Cbor), Bytes{0xff}));
    assert(decodeFails(ValueCodec(CodecFormat::Json), Bytes{'{', 'x'}));

    // Хвост после значения тоже ошибка
    ValueCodec msgpack;
    auto bytes = msgpack.encode(Value(1));
    bytes.push_back(0x01);
    assert(decodeFails(msgpack, bytes));

    // JSON не пропускает невалидный UTF-8
    bool rejected = false;
    try {
        ValueCodec(CodecFormat::Json).encode(Value("\xff"));
    } catch (const tagcache::SerializationError&) {
        rejected = true;
    }
    assert(rejected);
    std::cout << "[OK] ValueCodec rejects garbage\n";
}

void smokeTestNonFiniteNumbers() {
    const double inf = std::numeric_limits<double>::infinity();
    Value nested = {{"ratio", {1.5, -inf}}};

    // Двоичные форматы хранят бесконечность без потерь
    for (auto format : {CodecFormat::MessagePack, CodecFormat::Cbor}) {
        ValueCodec codec(format);
        assert(codec.decode(codec.encode(nested)) == nested);
        auto nan = codec.decode(codec.encode(Value(std::numeric_limits<double>::quiet_NaN())));
        assert(nan.is_number_float() && std::isnan(nan.get<double>()));
    }

    ValueCodec json(CodecFormat::Json);
    for (const auto& value : {Value(inf), Value(std::numeric_limits<double>::quiet_NaN()), nested}) {
        bool rejected = false;
        try {
            json.encode(value);
        } catch (const tagcache::SerializationError&) {
            rejected = true;
        }
        assert(rejected);
    }
    assert(json.decode(json.encode(Value({{"ratio", 1.5}}))) == Value({{"ratio", 1.5}}));
    std::cout << "[OK] ValueCodec non-finite numbers\n";
}

void smokeTestFormatNames() {
    for (auto format : kFormats) {
        assert(tagcache::codec::parseFormat(tagcache::codec::formatName(format)) == format);
    }
    bool rejected = false;
    try {
        tagcache::codec::parseFormat("xml");
    } catch (const tagcache::ConfigurationError& e) {
        rejected = std::string(e.what()) == "Unsupported codec: xml";
    }
    assert(rejected);
    std::cout << "[OK] ValueCodec format names\n";
}

int main() {
    smokeTestRoundTrip();
    smokeTestGarbage();
    smokeTestNonFiniteNumbers();
    smokeTestFormatNames();
    std::cout << "All ValueCodec tests passed!\n";
    return 0;
}
