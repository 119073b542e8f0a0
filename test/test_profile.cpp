#include <catch2/catch_all.hpp>

#include "stanza/stanza.hpp"
#include "test_models.hpp"

#include <filesystem>
#include <fstream>

using namespace Catch;
using fixtures::mapping;
using fixtures::sequence;

namespace {

    Stanza::serializer_ptr from_profile(std::string_view text) {
        auto builder = Stanza::parse_profile(text);
        INFO((builder ? std::string{} : builder.error().msg));
        REQUIRE(builder);
        auto s = builder->build();
        INFO((s ? std::string{} : s.error().msg));
        REQUIRE(s);
        return *s;
    }

    void expect_fail(std::string_view text, std::string_view path = {}) {
        auto builder = Stanza::parse_profile(text);
        REQUIRE_FALSE(builder);
        INFO(builder.error().msg);
        REQUIRE(builder.error().errc == Stanza::SerializeError::code::invalid_configuration);
        if (!path.empty()) REQUIRE(builder.error().path == path);
    }

    Stanza::value serialize_ok(const Stanza::serializer& s, const Stanza::raw& root) {
        auto r = s.serialize(root);
        INFO((r ? std::string{} : r.error().msg));
        REQUIRE(r);
        return *std::move(r);
    }

} // namespace

#pragma region Profiles

TEST_CASE("Profile Fields And Ordering") {
    auto s = from_profile("fields: [first_name, age]\npreserve_field_ordering: true\n");
    auto p = fixtures::john();

    REQUIRE(Stanza::render_json(serialize_ok(*s, Stanza::make_raw(p))) == R"({"first_name":"john","age":42})");
}

TEST_CASE("Profile Include And Exclude Accept Scalars") {
    auto s = from_profile(
        "include: full_name\n"
        "exclude: [first_name, last_name]\n");
    auto p = fixtures::john();

    REQUIRE(serialize_ok(*s, Stanza::make_raw(p)) == mapping({ { "age", 42 }, { "full_name", "john doe" } }));
}

TEST_CASE("Profile Depth") {
    auto c = fixtures::sample_contact();

    auto flat = from_profile("depth: 0\nfields: [address]\n");
    REQUIRE(serialize_ok(*flat, Stanza::make_raw(c)) == mapping({ { "address", "Baker Street, London" } }));

    for (auto text : { "depth: unbounded\nfields: [address]\n", "depth: ~\nfields: [address]\n" }) {
        auto deep = from_profile(text);
        REQUIRE(serialize_ok(*deep, Stanza::make_raw(c)) == mapping({
            { "address", mapping({ { "city", "London" }, { "street", "Baker Street" } }) },
        }));
    }
}

TEST_CASE("Profile Declarations") {
    auto s = from_profile(
        "declare:\n"
        "  name: full_name\n"
        "  age:\n"
        "    label: Age\n"
        "  age_plain: ~\n"
        "include: [last_name]\n");
    auto p = fixtures::john();

    auto r = s->serialize(Stanza::make_raw(p));
    REQUIRE_FALSE(r);
    REQUIRE(r.error().errc == Stanza::SerializeError::code::attribute_resolution);
    REQUIRE(r.error().path == "age_plain");

    auto ok = from_profile(
        "declare:\n"
        "  name: full_name\n"
        "  age:\n"
        "    label: Age\n"
        "include: [last_name]\n");
    REQUIRE(serialize_ok(*ok, Stanza::make_raw(p)) == mapping({ { "name", "john doe" }, { "Age", 42 }, { "last_name", "doe" } }));
}

TEST_CASE("Profile Nested Serializers") {
    auto s = from_profile(
        "fields: [name, address]\n"
        "declare:\n"
        "  address:\n"
        "    kind: serializer\n"
        "    label: where\n"
        "    fields: [city]\n");
    auto c = fixtures::sample_contact();

    REQUIRE(serialize_ok(*s, Stanza::make_raw(c)) == mapping({ { "name", "ada" }, { "where", mapping({ { "city", "London" } }) } }));
}

TEST_CASE("Profile Model Fields") {
    fixtures::Author ada{ 3, "ada" };
    auto s = from_profile(
        "introspector: model\n"
        "primary_key: false\n"
        "include_default_fields: true\n"
        "preserve_field_ordering: true\n"
        "declare:\n"
        "  model:\n"
        "    kind: model_name\n"
        "  key:\n"
        "    kind: primary_key\n"
        "    source: '*'\n");

    REQUIRE(Stanza::render_json(serialize_ok(*s, Stanza::make_raw(ada))) == R"({"model":"blog.author","key":3,"name":"ada"})");
}

TEST_CASE("Profiles Loaded From Files") {
    auto path = std::filesystem::temp_directory_path() / "stanza_profile_test.yaml";
    {
        std::ofstream out{ path };
        out << "fields: [age]\n";
    }

    auto builder = Stanza::load_profile(path);
    std::filesystem::remove(path);
    REQUIRE(builder);
    auto s = builder->build();
    REQUIRE(s);

    auto p = fixtures::john();
    REQUIRE(serialize_ok(**s, Stanza::make_raw(p)) == mapping({ { "age", 42 } }));
}

TEST_CASE("Missing Profile Files Are Reported") {
    auto builder = Stanza::load_profile(std::filesystem::temp_directory_path() / "stanza_no_such_profile.yaml");
    REQUIRE_FALSE(builder);
    REQUIRE(builder.error().errc == Stanza::SerializeError::code::invalid_configuration);
}

TEST_CASE("Malformed Profiles Are Rejected") {
    expect_fail("fields: [first_name\n");
    expect_fail("- just\n- a list\n");
    expect_fail("colour: blue\n", "colour");
    expect_fail("depth: -1\n", "depth");
    expect_fail("depth: deep\n");
    expect_fail("fields: {a: 1}\n", "fields");
    expect_fail("introspector: magic\n", "introspector");
    expect_fail("declare: [a, b]\n", "declare");
    expect_fail("declare:\n  a:\n    kind: unknown\n", "declare.a.kind");
    expect_fail("declare:\n  a:\n    colour: blue\n", "declare.a.colour");
    expect_fail("declare:\n  a:\n    kind: model_name\n    source: b\n", "declare.a.source");
    expect_fail("declare:\n  a:\n    kind: serializer\n    colour: blue\n", "declare.a.colour");
}

TEST_CASE("Profile Build Errors Surface At Build") {
    auto builder = Stanza::parse_profile("fields: ['*']\n");
    REQUIRE(builder);

    auto s = builder->build();
    REQUIRE_FALSE(s);
    REQUIRE(s.error().errc == Stanza::SerializeError::code::field_name_conflict);
}

TEST_CASE("Empty Profile Is The Default Serializer") {
    auto s = from_profile("");
    auto p = fixtures::john();
    REQUIRE(serialize_ok(*s, Stanza::make_raw(p)) == mapping({ { "first_name", "john" }, { "last_name", "doe" }, { "age", 42 } }));
}

#pragma endregion
#pragma region Dump records

TEST_CASE("Dump Record Layout") {
    fixtures::Author ada{ 1, "ada" };
    fixtures::Tag cpp{ 10, "c++" };
    fixtures::Tag math{ 11, "math" };
    fixtures::Article article{ 7, "notes", &ada, { &cpp, &math } };

    auto tree = serialize_ok(*Stanza::dumpdata_serializer(), Stanza::make_raw(article));
    REQUIRE(Stanza::render_json(tree) ==
        R"({"pk":7,"model":"blog.article","fields":{"title":"notes","author":1,"tags":[10,11]}})");
}

TEST_CASE("Dump Records For Several Objects") {
    fixtures::Author ada{ 1, "ada" };
    fixtures::Author grace{ 2, "grace" };
    std::vector<const fixtures::Author*> authors{ &ada, &grace };

    auto tree = serialize_ok(*Stanza::dumpdata_serializer(), Stanza::make_raw(authors));
    REQUIRE(tree == sequence({
        mapping({ { "pk", 1 }, { "model", "blog.author" }, { "fields", mapping({ { "name", "ada" } }) } }),
        mapping({ { "pk", 2 }, { "model", "blog.author" }, { "fields", mapping({ { "name", "grace" } }) } }),
    }));
}

TEST_CASE("Dump Records Reject Plain Objects") {
    auto p = fixtures::john();
    auto tree = Stanza::dumpdata_serializer()->serialize(Stanza::make_raw(p));
    REQUIRE_FALSE(tree);
    REQUIRE(tree.error().errc == Stanza::SerializeError::code::not_a_model);
}

#pragma endregion
