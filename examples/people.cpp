#include <print>
#include <string>
#include <vector>

#include "stanza/stanza.hpp"

struct Person {
    std::string first_name;
    std::string last_name;
    int age = 0;
    std::vector<const Person*> friends;

    std::string full_name() const { return first_name + " " + last_name; }
};

int main() {
    Stanza::registry::global().reflect<Person>("Person")
        .member("first_name", &Person::first_name)
        .member("last_name", &Person::last_name)
        .member("age", &Person::age)
        .member("friends", &Person::friends)
        .property("full_name", &Person::full_name)
        .display(&Person::full_name);

    Person john{ "john", "doe", 42 };
    Person jane{ "jane", "roe", 37 };
    john.friends = { &jane };
    jane.friends = { &john };

    auto s = Stanza::serializer_builder{}
        .exclude({ "first_name", "last_name" })
        .include({ "full_name" })
        .depth(1)
        .build();
    if (!s) {
        std::println("Build error! -> {}", s.error().msg);
        return 1;
    }

    for (auto format : { "json", "yaml", "xml" }) {
        auto text = Stanza::encode(**s, john, format, { .pretty = true, .indent = 4 });
        if (!text) {
            std::println("Encode error! [{}] -> {}", Stanza::SerializeError::code_name(text.error().errc), text.error().msg);
            return 1;
        }
        std::println("{}\n", std::get<std::string>(*text));
    }

    auto profile = Stanza::parse_profile("fields: [full_name, age]\npreserve_field_ordering: true\n");
    if (!profile) {
        std::println("Profile error! [{}] -> {}", Stanza::SerializeError::code_name(profile.error().errc), profile.error().msg);
        return 1;
    }
    auto from_profile = profile->build();
    if (!from_profile) {
        std::println("Build error! -> {}", from_profile.error().msg);
        return 1;
    }

    std::vector<const Person*> people{ &john, &jane };
    auto csv = Stanza::encode(**from_profile, people, "csv");
    if (!csv) {
        std::println("Encode error! [{}] -> {}", Stanza::SerializeError::code_name(csv.error().errc), csv.error().msg);
        return 1;
    }
    std::print("{}", std::get<std::string>(*csv));

    return 0;
}
