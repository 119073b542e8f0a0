#include <catch2/catch_all.hpp>

#include "stanza/stanza.hpp"
#include "test_models.hpp"

#include <limits>
#include <sstream>

using namespace Catch;
using fixtures::mapping;
using fixtures::sequence;

namespace {

    std::string render_ok(std::string_view format, const Stanza::value& tree, const Stanza::RenderOptions& opts = {}) {
        auto text = Stanza::renderer_table::builtin().render(format, tree, opts);
        INFO((text ? std::string{} : text.error().msg));
        REQUIRE(text);
        return *std::move(text);
    }

    void expect_fail(std::string_view format, const Stanza::value& tree, Stanza::SerializeError::code code) {
        auto text = Stanza::renderer_table::builtin().render(format, tree);
        REQUIRE_FALSE(text);
        INFO(text.error().msg);
        REQUIRE(text.error().errc == code);
    }

    const std::string xml_header = "<?xml version=\"1.0\" encoding=\"utf-8\"?>\n";

} // namespace

#pragma region JSON

TEST_CASE("JSON Compact Output") {
    auto tree = mapping({
        { "a", 1 },
        { "b", sequence({ true, nullptr }) },
        { "c", "x\"y\n" },
    });

    REQUIRE(render_ok("json", tree) == R"({"a":1,"b":[true,null],"c":"x\"y\n"})");
}

TEST_CASE("JSON Pretty Output") {
    auto tree = mapping({ { "a", 1 }, { "b", sequence({ 2 }) }, { "c", Stanza::value{ Stanza::object{} } } });
    Stanza::RenderOptions opts{ .pretty = true };

    REQUIRE(render_ok("json", tree, opts) == "{\n  \"a\": 1,\n  \"b\": [\n    2\n  ],\n  \"c\": {}\n}");
}

TEST_CASE("JSON Numbers") {
    REQUIRE(Stanza::render_json(Stanza::value{ 2.0 }) == "2.0");
    REQUIRE(Stanza::render_json(Stanza::value{ 0.5 }) == "0.5");
    REQUIRE(Stanza::render_json(Stanza::value{ -7 }) == "-7");
    REQUIRE(Stanza::render_json(Stanza::value{ std::numeric_limits<double>::infinity() }) == "null");
}

TEST_CASE("JSON Control Characters Are Escaped") {
    std::string s = "a";
    s.push_back('\x01');
    REQUIRE(Stanza::render_json(Stanza::value{ s }) == "\"a\\u0001\"");
}

TEST_CASE("JSON Sort Keys") {
    auto tree = mapping({ { "b", 1 }, { "a", 2 } });
    REQUIRE(Stanza::render_json(tree) == R"({"b":1,"a":2})");
    REQUIRE(Stanza::render_json(tree, { .sort_keys = true }) == R"({"a":2,"b":1})");
}

TEST_CASE("JSON Stream Overload") {
    std::ostringstream os;
    Stanza::render_json(sequence({ 1, "x" }), os);
    REQUIRE(os.str() == R"([1,"x"])");
}

#pragma endregion
#pragma region YAML

TEST_CASE("YAML Block Mapping") {
    auto tree = mapping({ { "first_name", "john" }, { "age", 42 } });
    REQUIRE(render_ok("yaml", tree) == "first_name: john\nage: 42\n");
}

TEST_CASE("YAML Nested Collections") {
    auto tree = mapping({ { "name", "ada" }, { "tags", sequence({ "a", "b" }) } });
    auto text = render_ok("yaml", tree);

    REQUIRE(text.starts_with("name: ada\ntags:\n"));
    REQUIRE(text.find("- a\n") != std::string::npos);
    REQUIRE(text.find("- b\n") != std::string::npos);
    REQUIRE(text.ends_with("\n"));
}

TEST_CASE("YAML Quotes Strings That Would Change Type") {
    auto tree = mapping({ { "a", "true" }, { "b", "42" }, { "c", "" }, { "d", "null" }, { "e", "plain" } });
    auto text = render_ok("yaml", tree);

    REQUIRE(text.find("a: \"true\"") != std::string::npos);
    REQUIRE(text.find("b: \"42\"") != std::string::npos);
    REQUIRE(text.find("c: \"\"") != std::string::npos);
    REQUIRE(text.find("d: \"null\"") != std::string::npos);
    REQUIRE(text.find("e: plain") != std::string::npos);
}

TEST_CASE("YAML Quotes Prefixed And Separated Numbers") {
    auto tree = mapping({ { "h", "0x10" }, { "o", "0o17" }, { "s", "1_000" }, { "b", "-0b101" }, { "w", "0xgg" } });
    auto text = render_ok("yaml", tree);

    REQUIRE(text.find("h: \"0x10\"") != std::string::npos);
    REQUIRE(text.find("o: \"0o17\"") != std::string::npos);
    REQUIRE(text.find("s: \"1_000\"") != std::string::npos);
    REQUIRE(text.find("b: \"-0b101\"") != std::string::npos);
    REQUIRE(text.find("w: 0xgg") != std::string::npos);
}

TEST_CASE("YAML Scalars Keep Their Types") {
    auto tree = mapping({ { "flag", true }, { "none", nullptr }, { "n", 3 } });
    auto text = render_ok("yaml", tree);

    REQUIRE(text.find("flag: true") != std::string::npos);
    REQUIRE(text.find("none: ~") != std::string::npos);
    REQUIRE(text.find("n: 3") != std::string::npos);
}

TEST_CASE("YAML Flow Style") {
    auto tree = mapping({ { "a", 1 }, { "b", sequence({ 1, 2 }) } });
    auto text = render_ok("yaml", tree, { .flow_style = true });

    REQUIRE(text.front() == '{');
    REQUIRE(text.find("[1, 2]") != std::string::npos);
}

#pragma endregion
#pragma region XML

TEST_CASE("XML Compact Output") {
    auto tree = mapping({ { "tags", sequence({ 1, 2 }) }, { "name", "a<b&c" }, { "empty", nullptr } });

    REQUIRE(render_ok("xml", tree) == xml_header +
        "<root><empty></empty><name>a&lt;b&amp;c</name>"
        "<tags><list-item>1</list-item><list-item>2</list-item></tags></root>");
}

TEST_CASE("XML Pretty Output") {
    auto tree = mapping({ { "a", 1 }, { "b", sequence({ 2 }) } });

    REQUIRE(render_ok("xml", tree, { .pretty = true }) == xml_header +
        "<root>\n"
        "  <a>1</a>\n"
        "  <b>\n"
        "    <list-item>2</list-item>\n"
        "  </b>\n"
        "</root>\n");
}

TEST_CASE("XML Scalars And Custom Tags") {
    Stanza::RenderOptions opts{ .root_tag = "people", .item_tag = "person" };
    auto tree = sequence({ mapping({ { "ok", true } }), mapping({ { "ok", false } }) });

    REQUIRE(render_ok("xml", tree, opts) == xml_header +
        "<people><person><ok>true</ok></person><person><ok>false</ok></person></people>");
}

TEST_CASE("XML Element Names Are Sanitized") {
    auto tree = mapping({ { "1st key", "x" } });
    REQUIRE(render_ok("xml", tree) == xml_header + "<root><_1st_key>x</_1st_key></root>");

    Stanza::RenderOptions opts{ .item_tag = "list item" };
    REQUIRE(render_ok("xml", sequence({ 1 }), opts) == xml_header + "<root><list_item>1</list_item></root>");
}

TEST_CASE("XML Drops Control Characters") {
    std::string text = "a";
    text.push_back('\x01');
    text += "b\tc";

    REQUIRE(render_ok("xml", mapping({ { "k", Stanza::value{ text } } })) == xml_header + "<root><k>ab\tc</k></root>");
}

#pragma endregion
#pragma region CSV

TEST_CASE("CSV Rows From A Sequence") {
    auto tree = sequence({
        mapping({ { "name", "a,b" }, { "age", 1 } }),
        mapping({ { "name", "say \"hi\"" }, { "age", nullptr } }),
        mapping({ { "name", "c" } }),
    });

    REQUIRE(render_ok("csv", tree) ==
        "name,age\r\n"
        "\"a,b\",1\r\n"
        "\"say \"\"hi\"\"\",\r\n"
        "c,\r\n");
}

TEST_CASE("CSV Single Mapping And Sorted Header") {
    auto tree = mapping({ { "b", true }, { "a", sequence({ 1, 2 }) } });

    REQUIRE(render_ok("csv", tree) == "b,a\r\ntrue,\"[1,2]\"\r\n");
    REQUIRE(render_ok("csv", tree, { .sort_keys = true }) == "a,b\r\n\"[1,2]\",true\r\n");
}

TEST_CASE("CSV Empty Sequence") {
    REQUIRE(render_ok("csv", Stanza::value{ Stanza::array{} }).empty());
}

TEST_CASE("CSV Rejects Unrepresentable Trees") {
    using code = Stanza::SerializeError::code;
    expect_fail("csv", Stanza::value{ 5 }, code::invalid_data);
    expect_fail("csv", sequence({ 1, 2 }), code::invalid_data);
    expect_fail("csv", sequence({ mapping({ { "a", 1 } }), mapping({ { "b", 2 } }) }), code::invalid_data);
}

#pragma endregion
#pragma region Dispatch

TEST_CASE("Builtin Formats") {
    const auto& table = Stanza::renderer_table::builtin();
    REQUIRE(table.formats() == std::vector<std::string>{ "csv", "json", "xml", "yaml" });
    REQUIRE(table.contains("json"));
    REQUIRE_FALSE(table.contains("JSON"));
}

TEST_CASE("Unknown Formats Are Rejected") {
    auto text = Stanza::renderer_table::builtin().render("toml", Stanza::value{ 1 });
    REQUIRE_FALSE(text);
    REQUIRE(text.error().errc == Stanza::SerializeError::code::unsupported_format);
    REQUIRE(text.error().path == "toml");
}

TEST_CASE("Custom Renderers Can Be Added") {
    Stanza::renderer_table table = Stanza::renderer_table::builtin();
    table.add("count", [](const Stanza::value& tree, const Stanza::RenderOptions&) -> Stanza::RenderResult {
        return std::to_string(tree.size());
    });

    auto text = table.render("count", sequence({ 1, 2, 3 }));
    REQUIRE(text);
    REQUIRE(*text == "3");
    REQUIRE(table.contains("json"));
}

#pragma endregion
#pragma region Encode

TEST_CASE("Encode Without A Format Returns The Tree") {
    auto p = fixtures::john();
    auto s = Stanza::serializer_builder{}.fields({ "age" }).build();
    REQUIRE(s);

    auto out = Stanza::encode(**s, p);
    REQUIRE(out);
    REQUIRE(std::holds_alternative<Stanza::value>(*out));
    REQUIRE(std::get<Stanza::value>(*out) == mapping({ { "age", 42 } }));
}

TEST_CASE("Encode With A Format Returns Text") {
    auto p = fixtures::john();
    auto s = Stanza::serializer_builder{}.exclude({ "first_name", "last_name" }).include({ "full_name" }).build();
    REQUIRE(s);

    auto out = Stanza::encode(**s, p, "json");
    REQUIRE(out);
    REQUIRE(std::get<std::string>(*out) == R"({"age":42,"full_name":"john doe"})");
}

TEST_CASE("Encode Reports Serializer And Renderer Errors") {
    auto p = fixtures::john();
    auto bad_field = Stanza::serializer_builder{}.fields({ "missing" }).build();
    REQUIRE(bad_field);

    auto out = Stanza::encode(**bad_field, p, "json");
    REQUIRE_FALSE(out);
    REQUIRE(out.error().errc == Stanza::SerializeError::code::attribute_resolution);

    out = Stanza::encode(*Stanza::default_serializer(), p, "ini");
    REQUIRE_FALSE(out);
    REQUIRE(out.error().errc == Stanza::SerializeError::code::unsupported_format);
}

TEST_CASE("Encode Uses The Given Renderer Table") {
    auto p = fixtures::john();
    Stanza::renderer_table table;
    table.add("keys", [](const Stanza::value& tree, const Stanza::RenderOptions&) -> Stanza::RenderResult {
        std::string keys;
        for (const auto& [k, _] : tree.as_object()) keys += k;
        return keys;
    });

    auto out = Stanza::encode(*Stanza::default_serializer(), Stanza::make_raw(p), "keys", {}, table);
    REQUIRE(out);
    REQUIRE(std::get<std::string>(*out) == "agefirst_namelast_name");
}

#pragma endregion
