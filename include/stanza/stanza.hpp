#pragma once


/*
    ----------------------------------------------------------
    Stanza - JSON values onto declared C++ data classes
    ----------------------------------------------------------

    This is the main public header for Stanza

    It brings together:
        - The JSON input tree:          `Stanza::value`
        - Error reporting types:        `Stanza::Error`, `Stanza::Result<T>`
        - Declarations and the cache:   `Stanza::Registry`
        - Parsing functions:            `Stanza::parse<T>(...)`
        - Converters and their rules:   `Stanza::Converter`,
                                        `Stanza::ConverterProvider`
        - Configuration options:        `Stanza::ModelOptions`
        - Diagnostics:                  `Stanza::log`

    -------------------
    High-Level Overview
    -------------------
    - Declaration:
        * Each class lists its fields once through `Registry::declare<T>()`:
          member pointer, declared name, and whether it may be absent
        * Enums list their members through `Registry::enumeration<E>()`
    - Model building:
        * On first use a class's declaration becomes a `ClassModel`: one
          attribute per field with its external (JSON) name, its declared
          type and the converter resolved for that type
        * Shape problems (no default constructor, undeclared nested class,
          enum without members, colliding names) are `configuration` errors
          reported at this point, before any data is looked at
        * Models are cached per class for the lifetime of the registry
    - Conversion:
        * Converters compose: a `std::vector<std::variant<std::string, Item>>`
          field is a List over a Union over a Scalar and an Object converter
        * `Stanza::parse<T>(registry, json)` returns `Result<T>`; failures
          carry the JSON path, the innermost class and the offending value

    The core does not decode JSON text. Callers build the `Stanza::value`
    tree with their own parser, or by hand.

    -----
    Usage
    -----
        enum class Status { active, retired };

        struct Item { std::string id; Stanza::decimal price; };
        struct Order {
            std::string order_id;
            Status status = Status::active;
            std::vector<Item> items;
            std::optional<std::string> note;
        };

        Stanza::Registry registry{ { .naming = Stanza::naming::camel_case } };
        registry.enumeration<Status>("Status")
            .member("active", Status::active)
            .member("retired", Status::retired);
        registry.declare<Item>("Item")
            .field("id", &Item::id)
            .field("price", &Item::price);
        registry.declare<Order>("Order")
            .field("order_id", &Order::order_id)
            .field("status", &Order::status, Stanza::presence::defaulted)
            .field("items", &Order::items)
            .field("note", &Order::note);

        if (auto ok = registry.build_all(); !ok) {
            std::println(stderr, "{}", ok.error().what());
        }

        auto order = Stanza::parse<Order>(registry, json);
*/

#include "stanza/config.hpp"
#include "stanza/converter.hpp"
#include "stanza/error.hpp"
#include "stanza/log.hpp"
#include "stanza/model.hpp"
#include "stanza/naming.hpp"
#include "stanza/options.hpp"
#include "stanza/parse.hpp"
#include "stanza/provider.hpp"
#include "stanza/registry.hpp"
#include "stanza/schema.hpp"
#include "stanza/type.hpp"
#include "stanza/value.hpp"

/// @defgroup Stanza Stanza
/// @brief JSON to data class mapping
