#include "chunknet/protocol/Json.hpp"

#include <cassert>
#include <string>

namespace json = chunknet::json;

int main() {
    const auto document = json::parse(R"({"name": "movie_1.mp4", "size": 102400, "ratio": 0.5,
                                          "ok": true, "none": null, "ports": [5001, 5002],
                                          "text": "tab\tquote\"slash\\ é"})");
    assert(document.is_object());
    assert(document.find("name")->string_value == "movie_1.mp4");
    assert(document.find("size")->as_int64() == 102400);
    assert(document.find("ratio")->type == json::ValueType::Double);
    assert(document.find("ok")->boolean_value);
    assert(document.find("none")->is_null());
    assert(document.find("ports")->as_array().size() == 2);
    assert(document.find("text")->string_value == "tab\tquote\"slash\\ \xc3\xa9");
    assert(document.find("absent") == nullptr);

    auto built = json::Value::make_object();
    built.as_object()["chunk"] = "a_1.bin";
    built.as_object()["count"] = json::Value(static_cast<std::int64_t>(-3));
    assert(json::dump(built) == R"({"chunk":"a_1.bin","count":-3})");

    const auto reparsed = json::parse(json::dump(document, 4));
    assert(json::dump(reparsed) == json::dump(document));

    assert(!json::try_parse("{\"a\": 1").has_value());
    assert(!json::try_parse("{\"a\": 1} trailing").has_value());
    assert(!json::try_parse("[1, 2,]").has_value());
    assert(!json::try_parse("").has_value());

    // \u escapes decode to UTF-8; a surrogate pair is one four-byte code point.
    assert(json::parse(R"("clip_\u00e9_1.bin")").string_value == "clip_\xc3\xa9_1.bin");
    assert(json::parse(R"("\u20AC")").string_value == "\xe2\x82\xac");
    assert(json::parse(R"("\uD83D\uDE00_1.bin")").string_value == "\xf0\x9f\x98\x80_1.bin");
    assert(!json::try_parse(R"("\uD83D")").has_value());
    assert(!json::try_parse(R"("\uD83D_1.bin")").has_value());
    assert(!json::try_parse(R"("\uD83D\u0041")").has_value());
    assert(!json::try_parse(R"("\uDE00")").has_value());

    std::string deep(100, '[');
    deep.append(100, ']');
    assert(!json::try_parse(deep).has_value());

    bool threw = false;
    try {
        json::parse("{\"key\" 1}");
    } catch (const json::ParseError& error) {
        threw = true;
        assert(error.offset() > 0);
    }
    assert(threw);

    return 0;
}
