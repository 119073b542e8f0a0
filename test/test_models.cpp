#include "test_models.hpp"

#include <mutex>

namespace fixtures {

    void register_types() {
        static std::once_flag once;
        std::call_once(once, [] {
            auto& reg = Stanza::registry::global();

            reg.reflect<ExampleObject>("ExampleObject")
                .member("a", &ExampleObject::a)
                .member("b", &ExampleObject::b)
                .member("c", &ExampleObject::c)
                .member("_hidden", &ExampleObject::_hidden);

            reg.reflect<Person>("Person")
                .member("first_name", &Person::first_name)
                .member("last_name", &Person::last_name)
                .member("age", &Person::age)
                .property("full_name", &Person::full_name)
                .method("is_child", &Person::is_child)
                .constant("CHILD_AGE", Person::CHILD_AGE)
                .display(&Person::full_name);

            reg.reflect<Relative>("Relative")
                .member("first_name", &Relative::first_name)
                .member("last_name", &Relative::last_name)
                .member("age", &Relative::age)
                .member("siblings", &Relative::siblings)
                .member("partner", &Relative::partner)
                .display([](const Relative& r) { return r.first_name + " " + r.last_name; });

            reg.reflect<Address>("Address")
                .member("city", &Address::city)
                .member("street", &Address::street)
                .display([](const Address& a) { return a.street + ", " + a.city; });

            reg.reflect<Contact>("Contact")
                .member("name", &Contact::name)
                .member("address", &Contact::address)
                .member("nickname", &Contact::nickname)
                .member("birthday", &Contact::birthday)
                .member("last_seen", &Contact::last_seen)
                .property("home", [](const Contact& c) { return Address{ c.address.city, "home" }; });

            reg.reflect<Author>("Author")
                .model("blog", "author")
                .primary_key("id", &Author::id)
                .member("name", &Author::name)
                .display(&Author::name);

            reg.reflect<Tag>("Tag")
                .model("blog", "tag")
                .primary_key("id", &Tag::id)
                .member("label", &Tag::label)
                .display(&Tag::label);

            reg.reflect<Article>("Article")
                .model("blog", "article")
                .primary_key("id", &Article::id)
                .member("title", &Article::title)
                .member("author", &Article::author)
                .relation("tags", &Article::tags)
                .display(&Article::title);
        });
    }

    namespace {
        // Registration runs before Catch2 starts executing test cases.
        const bool registered = (register_types(), true);
    }

    Person john() {
        return Person{ "john", "doe", 42 };
    }

    Contact sample_contact() {
        using namespace std::chrono;
        Contact c;
        c.name = "ada";
        c.address = Address{ "London", "Baker Street" };
        c.birthday = year{ 1815 } / December / 10;
        c.last_seen = sys_days{ year{ 2024 } / March / 5 } + hours{ 14 } + minutes{ 3 } + seconds{ 9 } + milliseconds{ 250 };
        return c;
    }

    Stanza::value mapping(std::initializer_list<std::pair<std::string_view, Stanza::value>> members) {
        Stanza::value v;
        auto& obj = v.as_object();
        for (const auto& [key, item] : members) {
            obj.emplace_back(Stanza::string{ key.begin(), key.end(), v.resource() }, item);
        }
        return v;
    }

    Stanza::value sequence(std::initializer_list<Stanza::value> items) {
        Stanza::value v;
        auto& arr = v.as_array();
        for (const auto& item : items) arr.push_back(item);
        return v;
    }

} // namespace fixtures
