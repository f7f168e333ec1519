#include <print>

#include "stanza/stanza.hpp"

namespace {

    enum class Status { active, retired };

    struct Item {
        std::string sku;
        int quantity = 1;
        Stanza::decimal unit_price;
    };

    struct Order {
        std::string order_id;
        Status status = Status::active;
        std::vector<Item> items;
        std::optional<std::string> note;
        std::variant<std::string, Item> gift;
    };

    Stanza::value sample_order() {
        Stanza::value item;
        item["sku"] = "A-100";
        item["quantity"] = 3;
        item["unitPrice"] = "19.99";

        Stanza::value v;
        v["orderId"] = "o-42";
        v["status"] = "retired";
        v["items"][0] = item;
        v["gift"] = "gift card";
        return v;
    }

} // namespace

int main() {
    Stanza::log::set_level(Stanza::log::level::debug);

    Stanza::Registry registry{ { .naming = Stanza::naming::camel_case } };
    registry.enumeration<Status>("Status")
        .member("active", Status::active)
        .member("retired", Status::retired);
    registry.declare<Item>("Item")
        .field("sku", &Item::sku)
        .field("quantity", &Item::quantity, Stanza::presence::defaulted)
        .field("unit_price", &Item::unit_price);
    registry.declare<Order>("Order")
        .field("order_id", &Order::order_id)
        .field("status", &Order::status, Stanza::presence::defaulted)
        .field("items", &Order::items)
        .field("note", &Order::note)
        .field("gift", &Order::gift);

    if (auto built = registry.build_all(); !built) {
        std::println(stderr, "{}", built.error().what());
        return 1;
    }

    Stanza::value json = sample_order();
    auto order = Stanza::parse<Order>(registry, json);
    if (!order) {
        std::println(stderr, "{}", order.error().what());
        return 1;
    }

    std::println("order {} ({} item(s), retired: {})", order->order_id, order->items.size(), order->status == Status::retired);
    for (const auto& item : order->items) {
        std::println("  {} x{} at {}", item.sku, item.quantity, item.unit_price.str());
    }

    json["items"][0]["quantity"] = 2.5;
    auto bad = Stanza::parse<Order>(registry, json);
    if (!bad) std::println("rejected: {}", bad.error().what());

    return 0;
}
