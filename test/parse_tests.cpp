#include <catch2/catch_all.hpp>

#include "stanza/stanza.hpp"
#include "support.hpp"

#include <atomic>
#include <map>
#include <optional>
#include <set>
#include <thread>
#include <variant>
#include <vector>

using namespace Catch;

namespace {

    struct Foo { std::string bar; };

    struct WithDefault {
        std::string a;
        int b = 7;
    };

    struct Numbers { std::vector<int> values; };

    enum class Color { red, green, blue };

    struct Paint { Color color = Color::red; };

    struct Inner { std::string label; };

    struct Holder { std::variant<std::string, Inner> content; };

    struct Account {
        std::string created_at;
        std::optional<std::string> display_name;
    };

    struct Price { Stanza::decimal amount; };

    struct Node {
        std::string name;
        std::vector<Node> children;
    };

    struct Item { int qty = 0; };

    struct Order {
        std::string id;
        std::vector<Item> items;
        std::map<std::string, int> tags;
        std::set<std::string> labels;
        Stanza::value extra;
    };

    struct NoDefault {
        explicit NoDefault(int) {}
        std::string s;
    };

    struct Collide {
        std::string created_at;
        std::string createdAt;
    };

    struct Stranger { int x = 0; };
    struct UsesStranger { Stranger s; };

    enum class Hollow { only };
    struct UsesHollow { Hollow h = Hollow::only; };

    struct Broken { int n = 0; };
    struct UsesBroken { Broken b; };

    void declare_foo(Stanza::Registry& r) {
        r.declare<Foo>("Foo").field("bar", &Foo::bar);
    }

    void declare_order(Stanza::Registry& r) {
        r.declare<Item>("Item").field("qty", &Item::qty);
        r.declare<Order>("Order")
            .field("id", &Order::id)
            .field("items", &Order::items)
            .field("tags", &Order::tags, Stanza::presence::defaulted)
            .field("labels", &Order::labels, Stanza::presence::defaulted)
            .field("extra", &Order::extra, Stanza::presence::defaulted);
    }

} // namespace

#pragma region Parsing

TEST_CASE("Required String Field") {
    Stanza::Registry registry;
    declare_foo(registry);

    auto ok = Stanza::parse<Foo>(registry, test::obj({ { "bar", "x" } }));
    REQUIRE(ok);
    REQUIRE(ok->bar == "x");

    auto missing = Stanza::parse<Foo>(registry, test::obj({}));
    REQUIRE_FALSE(missing);
    REQUIRE(missing.error().errc == Stanza::Error::code::missing_field);
    REQUIRE(missing.error().owner == "Foo");
    REQUIRE(missing.error().path == ".bar");
}

TEST_CASE("Unknown Members Are Ignored") {
    Stanza::Registry registry;
    declare_foo(registry);

    auto ok = Stanza::parse<Foo>(registry, test::obj({ { "bar", "x" }, { "baz", 1 } }));
    REQUIRE(ok);
    REQUIRE(ok->bar == "x");
}

TEST_CASE("Root Must Be an Object") {
    Stanza::Registry registry;
    declare_foo(registry);

    auto r = Stanza::parse<Foo>(registry, Stanza::value{ "bar" });
    REQUIRE_FALSE(r);
    REQUIRE(r.error().errc == Stanza::Error::code::type_mismatch);
    REQUIRE(r.error().owner == "Foo");
    REQUIRE(r.error().path.empty());
}

TEST_CASE("Null for a Required Field is a Type Mismatch") {
    Stanza::Registry registry;
    declare_foo(registry);

    auto r = Stanza::parse<Foo>(registry, test::obj({ { "bar", nullptr } }));
    REQUIRE_FALSE(r);
    REQUIRE(r.error().errc == Stanza::Error::code::type_mismatch);
    REQUIRE(r.error().path == ".bar");
}

TEST_CASE("Defaulted Field Keeps Its Default When Absent") {
    Stanza::Registry registry;
    registry.declare<WithDefault>("WithDefault")
        .field("a", &WithDefault::a)
        .field("b", &WithDefault::b, Stanza::presence::defaulted);

    auto absent = Stanza::parse<WithDefault>(registry, test::obj({ { "a", "x" } }));
    REQUIRE(absent);
    REQUIRE(absent->b == 7);

    auto present = Stanza::parse<WithDefault>(registry, test::obj({ { "a", "x" }, { "b", 3 } }));
    REQUIRE(present);
    REQUIRE(present->b == 3);

    auto null = Stanza::parse<WithDefault>(registry, test::obj({ { "a", "x" }, { "b", nullptr } }));
    REQUIRE(null);
    REQUIRE(null->b == 7);
}

TEST_CASE("List Field") {
    Stanza::Registry registry;
    registry.declare<Numbers>("Numbers").field("values", &Numbers::values);

    auto ok = Stanza::parse<Numbers>(registry, test::obj({ { "values", test::arr({ 1, 2 }) } }));
    REQUIRE(ok);
    REQUIRE(ok->values == std::vector<int>{ 1, 2 });

    auto bad = Stanza::parse<Numbers>(registry, test::obj({ { "values", "not-a-list" } }));
    REQUIRE_FALSE(bad);
    REQUIRE(bad.error().errc == Stanza::Error::code::type_mismatch);
    REQUIRE(bad.error().path == ".values");
}

TEST_CASE("Enum Field Matches Exact Names by Default") {
    Stanza::Registry registry;
    registry.enumeration<Color>("Color")
        .member("red", Color::red)
        .member("green", Color::green)
        .member("blue", Color::blue);
    registry.declare<Paint>("Paint").field("color", &Paint::color);

    auto ok = Stanza::parse<Paint>(registry, test::obj({ { "color", "green" } }));
    REQUIRE(ok);
    REQUIRE(ok->color == Color::green);

    REQUIRE_FALSE(Stanza::parse<Paint>(registry, test::obj({ { "color", "GREEN" } })));
    REQUIRE_FALSE(Stanza::parse<Paint>(registry, test::obj({ { "color", "purple" } })));
}

TEST_CASE("Enum Matching Policies") {
    Stanza::Registry registry;
    registry.enumeration<Color>("Color")
        .member("red", Color::red, "#f00")
        .member("green", Color::green, "#0f0")
        .member("blue", Color::blue, "#00f");

    SECTION("Case Insensitive") {
        registry.declare<Paint>("Paint")
            .enums(Stanza::EnumMatching::case_insensitive)
            .field("color", &Paint::color);

        auto ok = Stanza::parse<Paint>(registry, test::obj({ { "color", "BLUE" } }));
        REQUIRE(ok);
        REQUIRE(ok->color == Color::blue);

        auto bad = Stanza::parse<Paint>(registry, test::obj({ { "color", "purple" } }));
        REQUIRE_FALSE(bad);
        REQUIRE(bad.error().errc == Stanza::Error::code::type_mismatch);
    }

    SECTION("By Value From Registry Default") {
        Stanza::Registry by_value{ { .enum_matching = Stanza::EnumMatching::by_value } };
        by_value.enumeration<Color>("Color")
            .member("red", Color::red, "#f00")
            .member("green", Color::green, "#0f0");
        by_value.declare<Paint>("Paint").field("color", &Paint::color);

        auto ok = Stanza::parse<Paint>(by_value, test::obj({ { "color", "#0f0" } }));
        REQUIRE(ok);
        REQUIRE(ok->color == Color::green);
        REQUIRE_FALSE(Stanza::parse<Paint>(by_value, test::obj({ { "color", "green" } })));
    }
}

TEST_CASE("Union of String and Nested Class") {
    Stanza::Registry registry;
    registry.declare<Inner>("Inner").field("label", &Inner::label);
    registry.declare<Holder>("Holder").field("content", &Holder::content);

    auto text = Stanza::parse<Holder>(registry, test::obj({ { "content", "plain" } }));
    REQUIRE(text);
    REQUIRE(std::get<std::string>(text->content) == "plain");

    auto nested = Stanza::parse<Holder>(registry, test::obj({ { "content", test::obj({ { "label", "boxed" } }) } }));
    REQUIRE(nested);
    REQUIRE(std::get<Inner>(nested->content).label == "boxed");

    auto number = Stanza::parse<Holder>(registry, test::obj({ { "content", 42 } }));
    REQUIRE_FALSE(number);
    REQUIRE(number.error().errc == Stanza::Error::code::type_mismatch);
    REQUIRE(number.error().path == ".content");
    REQUIRE(number.error().owner == "Holder");
    REQUIRE(number.error().value == "42");
}

TEST_CASE("Accepted Union Alternative Reports Its Own Failure") {
    Stanza::Registry registry;
    registry.declare<Inner>("Inner").field("label", &Inner::label);
    registry.declare<Holder>("Holder").field("content", &Holder::content);

    auto r = Stanza::parse<Holder>(registry, test::obj({ { "content", test::obj({}) } }));
    REQUIRE_FALSE(r);
    REQUIRE(r.error().errc == Stanza::Error::code::missing_field);
    REQUIRE(r.error().owner == "Inner");
    REQUIRE(r.error().path == ".content.label");
}

TEST_CASE("Camel Case Names and Optional Members") {
    Stanza::Registry registry;
    registry.declare<Account>("Account")
        .naming(Stanza::naming::camel_case)
        .field("created_at", &Account::created_at)
        .field("display_name", &Account::display_name);

    auto full = Stanza::parse<Account>(registry,
        test::obj({ { "createdAt", "2024-01-01" }, { "displayName", "Ada" } }));
    REQUIRE(full);
    REQUIRE(full->created_at == "2024-01-01");
    REQUIRE(full->display_name == "Ada");

    auto bare = Stanza::parse<Account>(registry, test::obj({ { "createdAt", "2024-01-01" } }));
    REQUIRE(bare);
    REQUIRE_FALSE(bare->display_name.has_value());

    auto null = Stanza::parse<Account>(registry,
        test::obj({ { "createdAt", "2024-01-01" }, { "displayName", nullptr } }));
    REQUIRE(null);
    REQUIRE_FALSE(null->display_name.has_value());

    auto declared_name = Stanza::parse<Account>(registry, test::obj({ { "created_at", "2024-01-01" } }));
    REQUIRE_FALSE(declared_name);
    REQUIRE(declared_name.error().path == ".createdAt");
}

TEST_CASE("Null is Converted When null_as_absent is Off") {
    Stanza::Registry registry{ { .null_as_absent = false } };
    registry.declare<Account>("Account")
        .field("created_at", &Account::created_at)
        .field("display_name", &Account::display_name);

    auto r = Stanza::parse<Account>(registry, test::obj({ { "created_at", "x" }, { "display_name", nullptr } }));
    REQUIRE_FALSE(r);
    REQUIRE(r.error().errc == Stanza::Error::code::type_mismatch);
    REQUIRE(r.error().path == ".display_name");
}

TEST_CASE("Registry Default Naming Applies to Every Class") {
    Stanza::Registry registry{ { .naming = Stanza::naming::camel_case } };
    registry.declare<Account>("Account")
        .field("created_at", &Account::created_at)
        .field("display_name", &Account::display_name);

    auto model = registry.model<Account>();
    REQUIRE(model);
    REQUIRE((*model)->attributes()[0].external_name == "createdAt");
    REQUIRE((*model)->attributes()[1].external_name == "displayName");

    registry.declare<Foo>("Foo").naming(Stanza::naming::identity).field("bar", &Foo::bar);
    auto foo = registry.model<Foo>();
    REQUIRE(foo);
    REQUIRE((*foo)->attributes()[0].external_name == "bar");
}

TEST_CASE("Decimal Field") {
    Stanza::Registry registry;
    registry.declare<Price>("Price").field("amount", &Price::amount);

    auto text = Stanza::parse<Price>(registry, test::obj({ { "amount", "19.99" } }));
    REQUIRE(text);
    REQUIRE(text->amount == Stanza::decimal{ "19.99" });

    auto number = Stanza::parse<Price>(registry, test::obj({ { "amount", 0.1 } }));
    REQUIRE(number);
    REQUIRE(number->amount == Stanza::decimal{ "0.1" });

    auto bad = Stanza::parse<Price>(registry, test::obj({ { "amount", "12,50" } }));
    REQUIRE_FALSE(bad);
    REQUIRE(bad.error().errc == Stanza::Error::code::type_mismatch);
    REQUIRE(bad.error().value == R"("12,50")");

    for (const char* huge : { "1e9223372036854775807", "1e100000000" }) {
        auto out_of_range = Stanza::parse<Price>(registry, test::obj({ { "amount", huge } }));
        REQUIRE_FALSE(out_of_range);
        REQUIRE(out_of_range.error().errc == Stanza::Error::code::type_mismatch);
        REQUIRE(out_of_range.error().path == ".amount");
    }
}

TEST_CASE("Nested Containers, Maps, Sets and Raw Values") {
    Stanza::Registry registry;
    declare_order(registry);

    auto payload = test::obj({
        { "id", "o-1" },
        { "items", test::arr({ test::obj({ { "qty", 2 } }), test::obj({ { "qty", 5 } }) }) },
        { "tags", test::obj({ { "priority", 1 } }) },
        { "labels", test::arr({ "a", "b", "a" }) },
        { "extra", test::obj({ { "anything", test::arr({ true, nullptr }) } }) },
    });

    auto r = Stanza::parse<Order>(registry, payload);
    REQUIRE(r);
    REQUIRE(r->id == "o-1");
    REQUIRE(r->items.size() == 2);
    REQUIRE(r->items[1].qty == 5);
    REQUIRE(r->tags.at("priority") == 1);
    REQUIRE(r->labels.size() == 2);
    REQUIRE(r->extra == *payload.find("extra"));
}

TEST_CASE("Errors Carry the Full JSON Path") {
    Stanza::Registry registry;
    declare_order(registry);

    auto payload = test::obj({
        { "id", "o-1" },
        { "items", test::arr({ test::obj({ { "qty", 2 } }), test::obj({ { "qty", "many" } }) }) },
    });

    auto r = Stanza::parse<Order>(registry, payload);
    REQUIRE_FALSE(r);
    REQUIRE(r.error().errc == Stanza::Error::code::type_mismatch);
    REQUIRE(r.error().path == ".items[1].qty");
    REQUIRE(r.error().owner == "Item");
    REQUIRE(r.error().what() == R"(type_mismatch at $.items[1].qty in Item: expected int, got string (got "many"))");

    auto in_map = Stanza::parse<Order>(registry, test::obj({
        { "id", "o-1" }, { "items", test::arr({}) }, { "tags", test::obj({ { "k", 1.5 } }) } }));
    REQUIRE_FALSE(in_map);
    REQUIRE(in_map.error().path == R"(.tags["k"])");
    REQUIRE(in_map.error().owner == "Order");
}

TEST_CASE("Self-Referential Class") {
    Stanza::Registry registry;
    registry.declare<Node>("Node")
        .field("name", &Node::name)
        .field("children", &Node::children, Stanza::presence::defaulted);

    auto tree = test::obj({
        { "name", "root" },
        { "children", test::arr({
            test::obj({ { "name", "leaf" } }),
            test::obj({ { "name", "branch" }, { "children", test::arr({ test::obj({ { "name", "deep" } }) }) } }),
        }) },
    });

    auto r = Stanza::parse<Node>(registry, tree);
    REQUIRE(r);
    REQUIRE(r->children.size() == 2);
    REQUIRE(r->children[0].children.empty());
    REQUIRE(r->children[1].children[0].name == "deep");

    auto bad = Stanza::parse<Node>(registry, test::obj({
        { "name", "root" }, { "children", test::arr({ test::obj({}) }) } }));
    REQUIRE_FALSE(bad);
    REQUIRE(bad.error().path == ".children[0].name");
}

TEST_CASE("Field Override Replaces the Converter") {
    Stanza::Registry registry;
    registry.declare<Foo>("Foo")
        .field("bar", &Foo::bar)
        .override_field("bar", Stanza::make_converter<std::string>("number as string",
            [](const Stanza::value& v) -> Stanza::Result<std::string> {
                if (!v.is_number()) return std::unexpected(Stanza::detail::mismatch(v, "number"));
                return Stanza::render(v);
            }));

    auto r = Stanza::parse<Foo>(registry, test::obj({ { "bar", 12 } }));
    REQUIRE(r);
    REQUIRE(r->bar == "12");
    REQUIRE_FALSE(Stanza::parse<Foo>(registry, test::obj({ { "bar", "12" } })));
}

TEST_CASE("Override Producing the Wrong Type is a Type Mismatch") {
    Stanza::Registry registry;
    declare_foo(registry);
    registry.override_field<Foo>("bar", Stanza::make_converter<int>("int",
        [](const Stanza::value&) -> Stanza::Result<int> { return 1; }));

    auto r = Stanza::parse<Foo>(registry, test::obj({ { "bar", "x" } }));
    REQUIRE_FALSE(r);
    REQUIRE(r.error().errc == Stanza::Error::code::type_mismatch);
    REQUIRE(r.error().path == ".bar");
    REQUIRE(r.error().owner == "Foo");
}

TEST_CASE("Element Converter Producing the Wrong Type is a Type Mismatch") {
    auto text_rule = Stanza::make_converter<std::string>("text",
        [](const Stanza::value&) -> Stanza::Result<std::string> { return std::string{ "oops" }; });

    SECTION("List Element") {
        Stanza::Registry registry;
        registry.register_type<int>(text_rule);
        registry.declare<Numbers>("Numbers").field("values", &Numbers::values);

        auto r = Stanza::parse<Numbers>(registry, test::obj({ { "values", test::arr({ 1, 2 }) } }));
        REQUIRE_FALSE(r);
        REQUIRE(r.error().errc == Stanza::Error::code::type_mismatch);
        REQUIRE(r.error().path == ".values[0]");
        REQUIRE(r.error().owner == "Numbers");
    }

    SECTION("Map Value") {
        Stanza::Registry registry;
        registry.register_type<int>(text_rule);
        declare_order(registry);

        auto r = Stanza::parse<Order>(registry, test::obj({
            { "id", "o-1" },
            { "items", test::arr({}) },
            { "tags", test::obj({ { "k", 1 } }) },
        }));
        REQUIRE_FALSE(r);
        REQUIRE(r.error().errc == Stanza::Error::code::type_mismatch);
        REQUIRE(r.error().path == R"(.tags["k"])");
    }

    SECTION("Union Alternative") {
        Stanza::Registry registry;
        registry.register_type<std::string>(Stanza::make_converter<int>("int",
            [](const Stanza::value&) -> Stanza::Result<int> { return 1; },
            [](const Stanza::value& v) { return v.is_string(); }));
        registry.declare<Inner>("Inner").field("label", &Inner::label, Stanza::presence::defaulted);
        registry.declare<Holder>("Holder").field("content", &Holder::content);

        auto r = Stanza::parse<Holder>(registry, test::obj({ { "content", "plain" } }));
        REQUIRE_FALSE(r);
        REQUIRE(r.error().errc == Stanza::Error::code::type_mismatch);
        REQUIRE(r.error().path == ".content");
        REQUIRE(r.error().owner == "Holder");
    }
}

TEST_CASE("Exact Type Rule Teaches a Custom Leaf") {
    Stanza::Registry registry;
    registry.register_type<Stranger>(Stanza::make_converter<Stranger>("stranger",
        [](const Stanza::value& v) -> Stanza::Result<Stranger> {
            if (!v.is_integral()) return std::unexpected(Stanza::detail::mismatch(v, "integer"));
            return Stranger{ static_cast<int>(v.as_number()) };
        }));
    registry.declare<UsesStranger>("UsesStranger").field("s", &UsesStranger::s);

    auto r = Stanza::parse<UsesStranger>(registry, test::obj({ { "s", 9 } }));
    REQUIRE(r);
    REQUIRE(r->s.x == 9);
}

#pragma endregion
#pragma region Model Building

TEST_CASE("Class Without Default Constructor is Rejected") {
    Stanza::Registry registry;
    registry.declare<NoDefault>("NoDefault").field("s", &NoDefault::s);

    auto m = registry.model<NoDefault>();
    REQUIRE_FALSE(m);
    REQUIRE(m.error().errc == Stanza::Error::code::configuration);
    REQUIRE(m.error().owner == "NoDefault");
}

TEST_CASE("Unnamed and Untyped Fields are Rejected") {
    struct Shape { int n = 0; };
    Stanza::Registry registry;

    Stanza::ClassSchema unnamed;
    unnamed.type = typeid(Shape);
    unnamed.name = "Shape";
    unnamed.construct = [] { return std::any(Shape{}); };
    unnamed.fields.push_back({ "", Stanza::describe<int>() });
    registry.declare_schema(unnamed);

    auto a = registry.model<Shape>();
    REQUIRE_FALSE(a);
    REQUIRE(a.error().errc == Stanza::Error::code::configuration);
    REQUIRE(a.error().msg.find("not a named field") != std::string::npos);

    Stanza::ClassSchema untyped = unnamed;
    untyped.fields.clear();
    untyped.fields.push_back({ "n", Stanza::TypeDescriptor{} });
    registry.declare_schema(untyped);

    auto b = registry.model<Shape>();
    REQUIRE_FALSE(b);
    REQUIRE(b.error().errc == Stanza::Error::code::configuration);
    REQUIRE(b.error().msg.find("no declared type") != std::string::npos);
}

TEST_CASE("Casing Collisions Fail at Build Time") {
    Stanza::Registry registry;
    registry.declare<Collide>("Collide")
        .naming(Stanza::naming::camel_case)
        .field("created_at", &Collide::created_at)
        .field("createdAt", &Collide::createdAt);

    auto m = registry.model<Collide>();
    REQUIRE_FALSE(m);
    REQUIRE(m.error().errc == Stanza::Error::code::configuration);
    REQUIRE(m.error().msg.find("createdAt") != std::string::npos);

    auto p = Stanza::parse<Collide>(registry, test::obj({ { "createdAt", "x" } }));
    REQUIRE_FALSE(p);
    REQUIRE(p.error().errc == Stanza::Error::code::configuration);
}

TEST_CASE("Undeclared Nested Class is a Configuration Error") {
    Stanza::Registry registry;
    registry.declare<UsesStranger>("UsesStranger").field("s", &UsesStranger::s);

    auto m = registry.model<UsesStranger>();
    REQUIRE_FALSE(m);
    REQUIRE(m.error().errc == Stanza::Error::code::configuration);
    REQUIRE(m.error().path == ".s");
    REQUIRE(m.error().msg.find("not declared") != std::string::npos);
}

TEST_CASE("Enum Without Members is a Configuration Error") {
    Stanza::Registry registry;
    registry.enumeration<Hollow>("Hollow");
    registry.declare<UsesHollow>("UsesHollow").field("h", &UsesHollow::h);

    auto m = registry.model<UsesHollow>();
    REQUIRE_FALSE(m);
    REQUIRE(m.error().errc == Stanza::Error::code::configuration);
}

TEST_CASE("Nested Configuration Errors Surface at the Outer Build") {
    Stanza::Registry registry;
    registry.declare<Broken>("Broken").field("n", &Broken::n).field("n", &Broken::n);
    registry.declare<UsesBroken>("UsesBroken").field("b", &UsesBroken::b);

    auto m = registry.model<UsesBroken>();
    REQUIRE_FALSE(m);
    REQUIRE(m.error().errc == Stanza::Error::code::configuration);
    REQUIRE(m.error().owner == "Broken");
    REQUIRE_FALSE(registry.is_built(typeid(UsesBroken)));
}

TEST_CASE("Nested Models are Built Eagerly") {
    Stanza::Registry registry;
    registry.declare<Inner>("Inner").field("label", &Inner::label);
    registry.declare<Holder>("Holder").field("content", &Holder::content);

    REQUIRE_FALSE(registry.is_built(typeid(Inner)));
    REQUIRE(registry.model<Holder>());
    REQUIRE(registry.is_built(typeid(Inner)));
}

TEST_CASE("Model Build is Deterministic") {
    auto declare = [](Stanza::Registry& r) {
        r.declare<Item>("Item").field("qty", &Item::qty);
        r.declare<Order>("Order")
            .naming(Stanza::naming::camel_case)
            .field("id", &Order::id)
            .field("items", &Order::items)
            .field("tags", &Order::tags, Stanza::presence::defaulted)
            .field("labels", &Order::labels, Stanza::presence::defaulted)
            .field("extra", &Order::extra, Stanza::presence::defaulted);
    };

    Stanza::Registry first;
    Stanza::Registry second;
    declare(first);
    declare(second);

    auto cold = first.model<Order>();
    auto warm = first.model<Order>();
    auto other = second.model<Order>();
    REQUIRE(cold);
    REQUIRE(warm);
    REQUIRE(other);
    REQUIRE(cold->get() == warm->get());

    const auto& a = (*cold)->attributes();
    const auto& b = (*other)->attributes();
    REQUIRE(a.size() == b.size());

    std::set<std::string> names;
    for (size_t i = 0; i < a.size(); i++) {
        REQUIRE(a[i].source_name == b[i].source_name);
        REQUIRE(a[i].external_name == b[i].external_name);
        REQUIRE(a[i].declared_type.name == b[i].declared_type.name);
        REQUIRE(a[i].optional == b[i].optional);
        REQUIRE(a[i].converter->target() == b[i].converter->target());
        names.insert(a[i].external_name);
    }
    REQUIRE(names.size() == a.size());
    REQUIRE((*cold)->find("items") != nullptr);
    REQUIRE((*cold)->find("missing") == nullptr);
}

TEST_CASE("Optional Members Unwrap Their Declared Type") {
    Stanza::Registry registry;
    registry.declare<Account>("Account")
        .field("created_at", &Account::created_at)
        .field("display_name", &Account::display_name);

    auto m = registry.model<Account>();
    REQUIRE(m);
    const auto& attrs = (*m)->attributes();
    REQUIRE_FALSE(attrs[0].optional);
    REQUIRE(attrs[1].optional);
    REQUIRE(attrs[1].declared_type.kind == Stanza::type_kind::string);
}

TEST_CASE("build_all Reports the First Failure") {
    Stanza::Registry registry;
    declare_foo(registry);
    REQUIRE(registry.build_all());

    registry.declare<Collide>("Collide")
        .naming(Stanza::naming::camel_case)
        .field("created_at", &Collide::created_at)
        .field("createdAt", &Collide::createdAt);

    auto all = registry.build_all();
    REQUIRE_FALSE(all);
    REQUIRE(all.error().owner == "Collide");
}

TEST_CASE("Parsing an Undeclared Class Fails") {
    Stanza::Registry registry;
    auto r = Stanza::parse<Foo>(registry, test::obj({ { "bar", "x" } }));
    REQUIRE_FALSE(r);
    REQUIRE(r.error().errc == Stanza::Error::code::configuration);
}

#pragma endregion
#pragma region Ambient

TEST_CASE("Configuration Failures are Logged Once") {
    test::LogCapture capture{ Stanza::log::level::debug };

    Stanza::Registry registry;
    registry.declare<Broken>("Broken").field("n", &Broken::n).field("n", &Broken::n);
    registry.declare<UsesBroken>("UsesBroken").field("b", &UsesBroken::b);
    declare_foo(registry);

    REQUIRE_FALSE(registry.model<UsesBroken>());
    REQUIRE(registry.model<Foo>());

    size_t warnings = 0;
    for (const auto& [lvl, msg] : capture.lines) {
        if (lvl == Stanza::log::level::warn) warnings++;
    }
    REQUIRE(warnings == 1);
    REQUIRE(capture.contains("cannot build model for UsesBroken"));
    REQUIRE(capture.contains("built model for Foo"));
}

TEST_CASE("Conversion Failures are Not Logged") {
    test::LogCapture capture{ Stanza::log::level::trace };

    Stanza::Registry registry;
    declare_foo(registry);
    REQUIRE(registry.build_all());
    capture.lines.clear();

    REQUIRE_FALSE(Stanza::parse<Foo>(registry, test::obj({})));
    REQUIRE(capture.lines.empty());
}

TEST_CASE("Concurrent First Use Builds One Model") {
    Stanza::Registry registry;
    declare_order(registry);

    auto payload = test::obj({
        { "id", "o-1" },
        { "items", test::arr({ test::obj({ { "qty", 2 } }) }) },
    });

    constexpr int threads = 8;
    std::vector<const Stanza::ClassModel*> seen(threads, nullptr);
    std::atomic<int> failures{ 0 };
    {
        std::vector<std::jthread> pool;
        for (int t = 0; t < threads; t++) {
            pool.emplace_back([&, t] {
                for (int i = 0; i < 50; i++) {
                    auto r = Stanza::parse<Order>(registry, payload);
                    if (!r || r->items.size() != 1) failures++;
                }
                if (auto m = registry.model<Order>()) seen[t] = m->get();
            });
        }
    }

    REQUIRE(failures.load() == 0);
    for (auto* m : seen) REQUIRE(m == seen.front());
    REQUIRE(seen.front() != nullptr);
}

#pragma endregion
