#include <MarrowCore.hpp>
#include <cassert>
#include <iostream>
#include <algorithm>
#include <atomic>
#include <set>
#include <thread>

using namespace marrow;

// ============================================================================
// Helpers
// ============================================================================

namespace {

bool starts_with(const std::string& s, const std::string& prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

std::vector<std::string> strings(const json& value) {
    std::vector<std::string> out;
    if (!value.is_array()) return out;
    for (const auto& v : value) out.push_back(v.get<std::string>());
    return out;
}

size_t count_of(const std::vector<std::string>& list, const std::string& v) {
    return static_cast<size_t>(std::count(list.begin(), list.end(), v));
}

void register_tag(schema_registry& registry) {
    auto tag = registry.register_skeleton("tag");
    tag->add<string_bone>("name");
    tag->add<string_bone>("color");
}

/// "item" with a name and a relational bone "tag" (or "tags" if multiple).
void register_item(schema_registry& registry, relational_consistency consistency, bool multiple = false) {
    auto item = registry.register_skeleton("item");
    item->add<string_bone>("name");
    item->add<numeric_bone>("price");

    relational_options rel;
    rel.kind = "tag";
    rel.consistency = consistency;
    bone_options options;
    options.multiple = multiple;
    item->add<relational_bone>(multiple ? "tags" : "tag", rel, options);
}

db_key create_record(marrow_db& db, const std::string& kind, const std::string& name, const std::string& bone = "",
                     const json& reference = nullptr) {
    auto skel = db.create(kind);
    bool ok = skel.set_bone_value("name", name);
    assert(ok);
    if (!bone.empty()) {
        ok = skel.set_bone_value(bone, reference);
        assert(ok);
    }
    auto key = skel.write();
    assert(key);
    return *key;
}

json stored(marrow_db& db, const db_key& key, const std::string& property) {
    auto e = db.store().get(key);
    assert(e);
    return e->get(property);
}

std::vector<entity> edges_of(marrow_db& db, const db_key& owner) {
    auto q = db.store().make_query(layout::relations_kind);
    q.ancestor(owner);
    return q.run(SIZE_MAX);
}

/// A bone whose string values name stored blobs.
class blob_name_bone : public string_bone {
public:
    std::set<std::string> get_referenced_blob_keys(skeleton_instance& skel, const std::string& name) const override {
        std::set<std::string> out;
        json value = skel.get(name);
        if (value.is_string() && !value.get<std::string>().empty()) out.insert(value.get<std::string>());
        return out;
    }
};

} // namespace

// ============================================================================
// Test: Keys
// ============================================================================

void test_key_encoding() {
    std::cout << "Testing key encoding..." << std::endl;

    db_key tag("tag", 12);
    assert(tag.to_string() == "tag:i12");
    assert(tag.is_complete());
    assert(!tag.has_name());

    db_key edge("_relations", std::string("a/b:c%d"), tag);
    std::string encoded = edge.to_string();
    assert(encoded == "tag:i12/_relations:sa%2Fb%3Ac%25d");

    db_key parsed = db_key::from_string(encoded);
    assert(parsed == edge);
    assert(parsed.name() == "a/b:c%d");
    assert(parsed.parent() && *parsed.parent() == tag);
    assert(parsed.root() == tag);
    assert(parsed.is_descendant_of(tag));
    assert(!tag.is_descendant_of(parsed));

    assert(!db_key::try_parse("garbage"));
    assert(!db_key::try_parse("tag:x1"));
    assert(!db_key::try_parse(""));
    assert(db_key::try_parse("tag:s%2F")->name() == "/");

    std::cout << "  Key encoding test passed!" << std::endl;
}

// ============================================================================
// Test: Entity store transactions
// ============================================================================

void test_store_transactions() {
    std::cout << "Testing store transactions..." << std::endl;

    entity_store store{configuration{}};

    db_key a = store.allocate_key("counter");
    db_key b = store.allocate_key("counter");
    assert(a.id() == 1 && b.id() == 2);

    entity e(a);
    e["value"] = 1;
    store.put(e);

    // Commit
    bool ran_after_commit = false;
    store.run_in_transaction([&] {
        auto current = store.get(a);
        assert(current);
        (*current)["value"] = current->get("value").get<int>() + 1;
        store.put(*current);
        // Buffered writes are visible to point reads of the same transaction.
        assert(store.get(a)->get("value") == 2);
        store.after_commit([&] { ran_after_commit = true; });
        assert(!ran_after_commit);
    });
    assert(ran_after_commit);
    assert(store.get(a)->get("value") == 2);

    // Rollback
    bool rolled_back_callback = false;
    try {
        store.run_in_transaction([&] {
            entity doomed(b);
            doomed["value"] = 99;
            store.put(doomed);
            store.after_commit([&] { rolled_back_callback = true; });
            throw std::runtime_error("Simulated error");
        });
        assert(false);
    } catch (const std::runtime_error&) {
        // Expected
    }
    assert(!store.get(b));
    assert(!rolled_back_callback);

    // Nested calls join the running transaction and return values
    int result = store.run_in_transaction([&] {
        return store.run_in_transaction([&] {
            assert(store.is_in_transaction());
            return 7;
        });
    });
    assert(result == 7);
    assert(!store.is_in_transaction());

    std::cout << "  Store transactions test passed!" << std::endl;
}

void test_store_conflict_retry() {
    std::cout << "Testing optimistic conflict retry..." << std::endl;

    entity_store store{configuration{}};
    db_key shared("counter", std::string("shared"));
    entity e(shared);
    e["value"] = 0;
    store.put(e);

    int attempts = 0;
    store.run_in_transaction([&] {
        ++attempts;
        auto current = store.get(shared);
        if (attempts == 1) {
            // Another writer commits between our read and our commit.
            std::thread other([&] {
                entity theirs(shared);
                theirs["value"] = 100;
                store.put(theirs);
            });
            other.join();
        }
        (*current)["value"] = current->get("value").get<int>() + 1;
        store.put(*current);
    });
    assert(attempts == 2);
    assert(store.get(shared)->get("value") == 101);

    // Too many entity groups fails fast and is not retried
    configuration small;
    small.max_entity_groups_per_transaction = 2;
    entity_store limited{small};
    int tries = 0;
    bool too_large = false;
    try {
        limited.run_in_transaction([&] {
            ++tries;
            for (int i = 1; i <= 3; ++i) {
                entity root(db_key("group", static_cast<int64_t>(i)));
                limited.put(root);
            }
        });
    } catch (const transaction_too_large&) {
        too_large = true;
    }
    assert(too_large);
    assert(tries == 1);
    assert(!limited.get(db_key("group", static_cast<int64_t>(1))));

    std::cout << "  Conflict retry test passed!" << std::endl;
}

// ============================================================================
// Test: Queries
// ============================================================================

void test_store_queries() {
    std::cout << "Testing store queries..." << std::endl;

    entity_store store{configuration{}};
    for (int i = 1; i <= 7; ++i) {
        entity e(store.allocate_key("n"));
        e["v"] = i % 4;
        e["tags"] = json::array({"all", i % 2 ? "odd" : "even"});
        e["nested"] = {{"label", "n" + std::to_string(i)}};
        store.put(e);
    }

    assert(store.make_query("n").run(100).size() == 7);
    assert(store.make_query("n").filter("tags =", "odd").run(100).size() == 4);
    assert(store.make_query("n").filter("v IN", json::array({1, 3})).run(100).size() == 4);
    assert(store.make_query("n").filter("v >=", 2).run(100).size() == 4);
    assert(store.make_query("n").filter("nested.label =", "n5").run(100).size() == 1);

    // Descending order with keyset pagination
    auto q = store.make_query("n");
    q.order("v", sort_direction::descending);
    std::vector<std::string> seen;
    int last = 100;
    while (true) {
        auto page = q.run(3);
        if (page.empty()) break;
        for (const auto& e : page) {
            assert(e.get("v").get<int>() <= last);
            last = e.get("v").get<int>();
            seen.push_back(e.key.to_string());
        }
        q.cursor(q.get_cursor());
    }
    assert(seen.size() == 7);
    assert(std::set<std::string>(seen.begin(), seen.end()).size() == 7);

    // Ancestor scoping
    db_key parent("folder", std::string("docs"));
    store.put(entity(db_key("file", static_cast<int64_t>(1), parent)));
    store.put(entity(db_key("file", static_cast<int64_t>(2), db_key("folder", std::string("docs2")))));
    assert(store.make_query("file").ancestor(parent).run(10).size() == 1);

    bool rejected = false;
    try {
        store.make_query("n").filter("v ~", 1);
    } catch (const invalid_query&) {
        rejected = true;
    }
    assert(rejected);

    std::cout << "  Store queries test passed!" << std::endl;
}

// ============================================================================
// Test: Schema registry
// ============================================================================

void test_schema_registry() {
    std::cout << "Testing schema registry..." << std::endl;

    {
        schema_registry registry;
        register_tag(registry);
        register_item(registry, relational_consistency::ignore);

        bool unsealed_rejected = false;
        try {
            marrow_db db(registry);
        } catch (const schema_error&) {
            unsealed_rejected = true;
        }
        assert(unsealed_rejected);

        registry.seal();
        assert(registry.is_sealed());
        assert(registry.kinds().size() == 2);

        auto item = registry.get("item");
        auto rel = dynamic_cast<const relational_bone*>(item->find_bone("tag"));
        assert(rel);
        assert(rel->ref_keys().front() == "key");
        assert(rel->ref_skel() && rel->ref_skel()->has_bone("name"));
        assert(!rel->ref_skel()->has_bone("color"));

        bool late_rejected = false;
        try {
            registry.register_skeleton("late");
        } catch (const schema_error&) {
            late_rejected = true;
        }
        assert(late_rejected);

        bool unknown_rejected = false;
        try {
            registry.get("nope");
        } catch (const schema_error&) {
            unknown_rejected = true;
        }
        assert(unknown_rejected);
    }

    {
        schema_registry registry;
        auto item = registry.register_skeleton("item");
        item->add<string_bone>("name");
        relational_options rel;
        rel.kind = "missing";
        item->add<relational_bone>("tag", rel);

        bool target_rejected = false;
        try {
            registry.seal();
        } catch (const schema_error&) {
            target_rejected = true;
        }
        assert(target_rejected);
    }

    {
        schema_registry registry;
        register_tag(registry);
        auto item = registry.register_skeleton("item");
        item->add<string_bone>("name");
        relational_options rel;
        rel.kind = "tag";
        rel.ref_keys = {"name", "weight"};
        item->add<relational_bone>("tag", rel);

        bool field_rejected = false;
        try {
            registry.seal();
        } catch (const schema_error&) {
            field_rejected = true;
        }
        assert(field_rejected);
    }

    {
        schema_registry registry;
        bool reserved_rejected = false;
        try {
            registry.register_skeleton("_internal");
        } catch (const schema_error&) {
            reserved_rejected = true;
        }
        assert(reserved_rejected);

        auto thing = registry.register_skeleton("thing");
        bool duplicate_rejected = false;
        try {
            thing->add<string_bone>("key");
        } catch (const schema_error&) {
            duplicate_rejected = true;
        }
        assert(duplicate_rejected);
    }

    std::cout << "  Schema registry test passed!" << std::endl;
}

// ============================================================================
// Test: Client input
// ============================================================================

void test_from_client_errors() {
    std::cout << "Testing from_client errors..." << std::endl;

    schema_registry registry;
    auto person = registry.register_skeleton("person");
    bone_options required;
    required.required = true;
    person->add<string_bone>("name", required);
    person->add<numeric_bone>("age", bone_options{}, 0, 0.0, 150.0);
    person->add<boolean_bone>("active");
    registry.seal();
    marrow_db db(registry);

    auto skel = db.create("person");
    assert(skel.get("active") == false);
    assert(skel.get("name").is_null());

    bool complete = skel.from_client({{"age", std::string("abc")}});
    assert(!complete);
    bool name_not_set = false;
    bool age_invalid = false;
    for (const auto& e : skel.errors()) {
        if (e.field_path == std::vector<std::string>{"name"} && e.severity == error_severity::not_set) {
            name_not_set = true;
        }
        if (e.field_path == std::vector<std::string>{"age"} && e.severity == error_severity::invalid) {
            age_invalid = true;
        }
    }
    assert(name_not_set);
    assert(age_invalid);
    assert(skel.get("age").is_null());

    complete = skel.from_client({{"name", std::string("Ann")}, {"age", std::string("42")},
                                 {"active", std::string("yes")}});
    assert(complete);
    assert(skel.get("age") == 42);
    assert(skel.get("active") == true);

    assert(!skel.from_client({{"name", std::string("")}}));
    bool name_empty = false;
    for (const auto& e : skel.errors()) {
        if (e.severity == error_severity::empty) name_empty = true;
    }
    assert(name_empty);

    // Amending leaves missing fields alone
    assert(skel.from_client({{"age", std::string("200")}}, true) == false);
    assert(skel.from_client({{"age", std::string("150")}}, true));

    // set_bone_value is all-or-nothing
    assert(!skel.set_bone_value("age", "old"));
    assert(skel.get("age") == 150);

    bool unknown_rejected = false;
    try {
        skel.get("nope");
    } catch (const schema_error&) {
        unknown_rejected = true;
    }
    assert(unknown_rejected);

    std::cout << "  from_client errors test passed!" << std::endl;
}

// ============================================================================
// Test: Unique values
// ============================================================================

void register_user(schema_registry& registry) {
    auto user = registry.register_skeleton("user");
    user->add<string_bone>("name");
    bone_options unique;
    unique.unique = unique_value{};
    user->add<string_bone>("email", unique, 254, false);
}

void test_unique_values() {
    std::cout << "Testing unique values..." << std::endl;

    schema_registry registry;
    register_user(registry);
    registry.seal();
    marrow_db db(registry);

    auto first = db.create("user");
    first.set_bone_value("name", "first");
    first.set_bone_value("email", "a@example.com");
    auto first_key = first.write();
    assert(first_key);

    const std::string lock_kind = layout::unique_lock_kind("user", "email");
    auto lock = db.store().get(db_key(lock_kind, unique_value_hash("a@example.com")));
    assert(lock);
    assert(lock->get("references") == first_key->to_string());

    // Case-insensitive: "A@EXAMPLE.COM" collides
    auto second = db.create("user");
    second.set_bone_value("name", "second");
    second.set_bone_value("email", "A@EXAMPLE.COM");
    assert(!second.write());
    assert(!second.errors().empty());
    assert(second.errors().back().message == "Value not available");
    assert(second.errors().back().field_path == std::vector<std::string>{"email"});
    assert(db.store().make_query("user").run(10).size() == 1);

    // from_client reports the taken value before any write
    auto third = db.create("user");
    assert(!third.from_client({{"name", std::string("third")}, {"email", std::string("a@example.com")}}));

    // Rewriting the owner keeps its own lock
    assert(first.set_bone_value("name", "first again"));
    assert(first.write());
    assert(db.store().get(db_key(lock_kind, unique_value_hash("a@example.com"))));

    // Changing the value releases the old lock after commit
    assert(first.set_bone_value("email", "b@example.com"));
    assert(first.write());
    assert(!db.store().get(db_key(lock_kind, unique_value_hash("a@example.com"))));
    assert(db.store().get(db_key(lock_kind, unique_value_hash("b@example.com"))));

    second.errors().clear();
    auto second_key = second.write();
    assert(second_key);
    lock = db.store().get(db_key(lock_kind, unique_value_hash("a@example.com")));
    assert(lock && lock->get("references") == second_key->to_string());

    // Deleting releases the locks
    second.remove();
    assert(!db.store().get(db_key(lock_kind, unique_value_hash("a@example.com"))));

    std::cout << "  Unique values test passed!" << std::endl;
}

void test_unique_concurrent_writers() {
    std::cout << "Testing concurrent unique writers..." << std::endl;

    schema_registry registry;
    register_user(registry);
    registry.seal();
    marrow_db db(registry);

    std::atomic<int> succeeded{0};
    std::atomic<int> refused{0};
    auto writer = [&](const std::string& name) {
        auto skel = db.create("user");
        skel.set_bone_value("name", name);
        skel.set_bone_value("email", "race@example.com");
        if (skel.write()) {
            ++succeeded;
        } else if (!skel.errors().empty()) {
            ++refused;
        }
    };

    std::thread t1(writer, "one");
    std::thread t2(writer, "two");
    t1.join();
    t2.join();

    assert(succeeded == 1);
    assert(refused == 1);
    assert(db.store().make_query("user").run(10).size() == 1);

    std::cout << "  Concurrent unique writers test passed!" << std::endl;
}

void test_unique_multiple_methods() {
    std::cout << "Testing unique lock methods..." << std::endl;

    schema_registry registry;
    auto group = registry.register_skeleton("group");
    group->add<string_bone>("name");
    bone_options as_set;
    as_set.multiple = true;
    as_set.unique = unique_value{unique_lock_method::same_set, false, "Member set taken"};
    group->add<string_bone>("members", as_set);
    registry.seal();
    marrow_db db(registry);

    auto a = db.create("group");
    a.set_bone_value("name", "a");
    a.set_bone_value("members", json::array({"x", "y"}));
    assert(a.write());

    // Same set in another order is taken
    auto b = db.create("group");
    b.set_bone_value("name", "b");
    b.set_bone_value("members", json::array({"y", "x"}));
    assert(!b.write());
    assert(b.errors().back().message == "Member set taken");

    // A different set is fine
    b.set_bone_value("members", json::array({"x", "z"}));
    assert(b.write());

    std::cout << "  Unique lock methods test passed!" << std::endl;
}

// ============================================================================
// Test: Relational locks
// ============================================================================

void test_prevent_deletion_scenario() {
    std::cout << "Testing PreventDeletion scenario..." << std::endl;

    schema_registry registry;
    register_tag(registry);
    register_item(registry, relational_consistency::prevent_deletion);
    registry.seal();
    marrow_db db(registry);

    db_key red = create_record(db, "tag", "red");
    db_key shirt = create_record(db, "item", "shirt", "tag", red.to_string());

    // (a) cached copy, (b) lock on the target
    auto item = db.load(shirt);
    assert(item);
    assert(item->get("tag")["dest"]["name"] == "red");
    assert(item->get("tag")["dest"]["key"] == red.to_string());
    assert(strings(stored(db, red, layout::incoming_locks_property)) == std::vector<std::string>{shirt.to_string()});
    assert(strings(stored(db, shirt, layout::outgoing_locks_property("tag"))) ==
           std::vector<std::string>{red.to_string()});

    // One edge per reference, stored below the owner
    auto edges = edges_of(db, shirt);
    assert(edges.size() == 1);
    assert(edges.front().get("dest")["key"] == red.to_string());
    assert(edges.front().get("src_kind") == "item");
    assert(edges.front().get("src")["name"] == "shirt");

    // Deleting the target is refused and changes nothing
    auto tag = db.load(red);
    bool locked = false;
    try {
        tag->remove();
    } catch (const locked_error&) {
        locked = true;
    }
    assert(locked);
    assert(db.store().get(red));
    assert(strings(stored(db, red, layout::incoming_locks_property)).size() == 1);

    // Deleting the owner releases the lock and its edges
    item->remove();
    assert(!db.store().get(shirt));
    assert(strings(stored(db, red, layout::incoming_locks_property)).empty());
    assert(edges_of(db, shirt).empty());

    tag = db.load(red);
    tag->remove();
    assert(!db.store().get(red));
    db.drain_tasks();
    assert(db.queue().pending_count() == 0);

    std::cout << "  PreventDeletion scenario test passed!" << std::endl;
}

void test_lock_symmetry() {
    std::cout << "Testing relational lock symmetry..." << std::endl;

    schema_registry registry;
    register_tag(registry);
    register_item(registry, relational_consistency::prevent_deletion, true);
    registry.seal();
    marrow_db db(registry);

    db_key red = create_record(db, "tag", "red");
    db_key blue = create_record(db, "tag", "blue");
    db_key green = create_record(db, "tag", "green");

    db_key hat = create_record(db, "item", "hat", "tags", json::array({red.to_string(), blue.to_string()}));
    const std::string owner = hat.to_string();
    assert(count_of(strings(stored(db, red, layout::incoming_locks_property)), owner) == 1);
    assert(count_of(strings(stored(db, blue, layout::incoming_locks_property)), owner) == 1);
    assert(edges_of(db, hat).size() == 2);

    auto item = db.load(hat);
    assert(item->set_bone_value("tags", json::array({blue.to_string(), green.to_string()})));
    assert(item->write());

    assert(count_of(strings(stored(db, red, layout::incoming_locks_property)), owner) == 0);
    assert(count_of(strings(stored(db, blue, layout::incoming_locks_property)), owner) == 1);
    assert(count_of(strings(stored(db, green, layout::incoming_locks_property)), owner) == 1);

    auto outgoing = strings(stored(db, hat, layout::outgoing_locks_property("tags")));
    assert(std::set<std::string>(outgoing.begin(), outgoing.end()) ==
           std::set<std::string>({blue.to_string(), green.to_string()}));

    auto edges = edges_of(db, hat);
    assert(edges.size() == 2);
    std::set<std::string> dests;
    for (const auto& e : edges) dests.insert(e.get("dest")["key"].get<std::string>());
    assert(dests == std::set<std::string>({blue.to_string(), green.to_string()}));

    // Appending a reference
    assert(item->set_bone_value("tags", red.to_string(), true));
    assert(item->write());
    assert(count_of(strings(stored(db, red, layout::incoming_locks_property)), owner) == 1);
    assert(edges_of(db, hat).size() == 3);

    assert(db.integrity().count() == 0);

    std::cout << "  Relational lock symmetry test passed!" << std::endl;
}

// ============================================================================
// Test: Propagation
// ============================================================================

void test_cache_propagation() {
    std::cout << "Testing cache propagation..." << std::endl;

    schema_registry registry;
    register_tag(registry);
    register_item(registry, relational_consistency::ignore);
    registry.seal();
    marrow_db db(registry);

    db_key red = create_record(db, "tag", "red");
    db_key shirt = create_record(db, "item", "shirt", "tag", red.to_string());
    db_key sock = create_record(db, "item", "sock", "tag", red.to_string());
    db.drain_tasks();

    auto tag = db.load(red);
    assert(tag->set_bone_value("name", "crimson"));
    assert(tag->write());

    // Stale until propagation runs
    assert(db.load(shirt)->get("tag")["dest"]["name"] == "red");
    assert(db.queue().pending_count() == 1);

    db.drain_tasks();
    assert(db.load(shirt)->get("tag")["dest"]["name"] == "crimson");
    assert(db.load(sock)->get("tag")["dest"]["name"] == "crimson");
    for (const auto& e : edges_of(db, shirt)) {
        assert(e.get("dest")["name"] == "crimson");
    }

    // Fields that are not cached leave the copies alone
    json cached = stored(db, shirt, "tag");
    assert(tag->set_bone_value("color", "dark"));
    assert(tag->write());
    db.drain_tasks();
    assert(db.queue().pending_count() == 0);
    assert(stored(db, shirt, "tag") == cached);

    // Redelivery is a no-op
    json before = stored(db, shirt, "tag");
    db.tasks().enqueue(update_relations_task{red, now_seconds() + 1, std::string("name"), std::nullopt});
    db.tasks().enqueue(update_relations_task{red, now_seconds() + 1, std::string("name"), std::nullopt});
    db.drain_tasks();
    assert(stored(db, shirt, "tag") == before);
    assert(db.queue().pending_count() == 0);

    std::cout << "  Cache propagation test passed!" << std::endl;
}

void test_propagation_batches() {
    std::cout << "Testing batched propagation..." << std::endl;

    schema_registry registry;
    register_tag(registry);
    register_item(registry, relational_consistency::ignore);
    registry.seal();
    marrow_db db(registry);

    db_key red = create_record(db, "tag", "red");
    std::vector<db_key> items;
    for (int i = 0; i < 12; ++i) {
        items.push_back(create_record(db, "item", "item" + std::to_string(i), "tag", red.to_string()));
    }

    auto tag = db.load(red);
    tag->set_bone_value("name", "scarlet");
    tag->write();

    // 12 referrers in batches of 5: three runs
    size_t ran = db.drain_tasks();
    assert(ran == 3);
    for (const auto& key : items) {
        assert(db.load(key)->get("tag")["dest"]["name"] == "scarlet");
    }

    std::cout << "  Batched propagation test passed!" << std::endl;
}

void test_propagation_many_references() {
    std::cout << "Testing propagation into records with many references..." << std::endl;

    schema_registry registry;
    register_tag(registry);
    register_item(registry, relational_consistency::ignore, true);
    registry.seal();
    marrow_db db(registry);

    // More targets than one transaction may touch
    const size_t count = 30;
    assert(count > db.config().max_entity_groups_per_transaction);
    std::vector<db_key> tags;
    json all = json::array();
    for (size_t i = 0; i < count; ++i) {
        tags.push_back(create_record(db, "tag", "tag" + std::to_string(i)));
        all.push_back(tags.back().to_string());
    }
    db_key big = create_record(db, "item", "big", "tags", all);
    db_key small = create_record(db, "item", "small", "tags", json::array({tags[0].to_string()}));
    db.drain_tasks();
    assert(db.load(big)->get("tags").size() == count);

    auto first = db.load(tags[0]);
    assert(first->set_bone_value("name", "first"));
    assert(first->write());
    db.drain_tasks();

    assert(db.queue().pending_count() == 0);
    json refs = db.load(big)->get("tags");
    assert(refs.size() == count);
    assert(refs[0]["dest"]["name"] == "first");
    assert(refs[1]["dest"]["name"] == "tag1");
    assert(db.load(small)->get("tags")[0]["dest"]["name"] == "first");

    // The rebuild walks the same path
    auto raw = db.store().get(tags[count - 1]);
    (*raw)["name"] = "last";
    db.store().put(*raw);

    rebuild_search_index_task rebuild;
    rebuild.kind = "item";
    db.tasks().enqueue(rebuild);
    db.drain_tasks();
    assert(db.load(big)->get("tags")[count - 1]["dest"]["name"] == "last");
    assert(db.load(big)->get("tags")[0]["dest"]["name"] == "first");

    std::cout << "  Many references propagation test passed!" << std::endl;
}

void test_set_null_scenario() {
    std::cout << "Testing SetNull scenario..." << std::endl;

    schema_registry registry;
    register_tag(registry);
    register_item(registry, relational_consistency::set_null);
    registry.seal();
    marrow_db db(registry);

    db_key red = create_record(db, "tag", "red");
    db_key shirt = create_record(db, "item", "shirt", "tag", red.to_string());

    db.load(red)->remove();
    assert(!db.store().get(red));

    // Stale until the removal task runs
    assert(!db.load(shirt)->get("tag").is_null());

    db.drain_tasks();
    auto item = db.load(shirt);
    assert(item);
    assert(item->get("tag").is_null());
    assert(item->get("name") == "shirt");
    assert(edges_of(db, shirt).empty());

    // Redelivery is a no-op
    json before = db.store().get(shirt)->properties;
    db.tasks().enqueue(process_removed_relations_task{red, std::nullopt});
    db.drain_tasks();
    assert(db.store().get(shirt)->properties == before);

    std::cout << "  SetNull scenario test passed!" << std::endl;
}

void test_set_null_multiple() {
    std::cout << "Testing SetNull on a multiple bone..." << std::endl;

    schema_registry registry;
    register_tag(registry);
    register_item(registry, relational_consistency::set_null, true);
    registry.seal();
    marrow_db db(registry);

    db_key red = create_record(db, "tag", "red");
    db_key blue = create_record(db, "tag", "blue");
    db_key hat = create_record(db, "item", "hat", "tags", json::array({red.to_string(), blue.to_string()}));

    db.load(red)->remove();
    db.drain_tasks();

    json tags = db.load(hat)->get("tags");
    assert(tags.is_array() && tags.size() == 1);
    assert(tags[0]["dest"]["key"] == blue.to_string());
    assert(edges_of(db, hat).size() == 1);

    std::cout << "  SetNull multiple test passed!" << std::endl;
}

void test_cascade_deletion() {
    std::cout << "Testing CascadeDeletion..." << std::endl;

    schema_registry registry;
    register_tag(registry);
    register_item(registry, relational_consistency::cascade_deletion);
    auto box = registry.register_skeleton("box");
    box->add<string_bone>("name");
    relational_options rel;
    rel.kind = "item";
    rel.consistency = relational_consistency::cascade_deletion;
    box->add<relational_bone>("item", rel);
    registry.seal();
    marrow_db db(registry);

    db_key red = create_record(db, "tag", "red");
    db_key blue = create_record(db, "tag", "blue");
    db_key shirt = create_record(db, "item", "shirt", "tag", red.to_string());
    db_key hat = create_record(db, "item", "hat", "tag", blue.to_string());
    db_key crate = create_record(db, "box", "crate", "item", shirt.to_string());

    db.load(red)->remove();
    db.drain_tasks();

    assert(!db.load(shirt));
    assert(!db.load(crate));
    assert(db.load(hat));
    assert(db.load(blue));
    assert(edges_of(db, shirt).empty());
    assert(edges_of(db, crate).empty());

    // Redelivery after everything is gone
    db.tasks().enqueue(process_removed_relations_task{red, std::nullopt});
    db.drain_tasks();
    assert(db.queue().pending_count() == 0);

    std::cout << "  CascadeDeletion test passed!" << std::endl;
}

void test_update_levels() {
    std::cout << "Testing update levels..." << std::endl;

    schema_registry registry;
    register_tag(registry);
    auto item = registry.register_skeleton("item");
    item->add<string_bone>("name");
    relational_options frozen;
    frozen.kind = "tag";
    frozen.update_level = relational_update_level::never;
    item->add<relational_bone>("tag", frozen);
    registry.seal();
    marrow_db db(registry);

    db_key red = create_record(db, "tag", "red");
    db_key shirt = create_record(db, "item", "shirt", "tag", red.to_string());

    auto tag = db.load(red);
    tag->set_bone_value("name", "pink");
    tag->write();
    db.drain_tasks();
    assert(db.load(shirt)->get("tag")["dest"]["name"] == "red");

    auto skel = db.load(shirt);
    skel->refresh();
    assert(skel->get("tag")["dest"]["name"] == "red");

    std::cout << "  Update levels test passed!" << std::endl;
}

// ============================================================================
// Test: Relational client input
// ============================================================================

void test_relational_from_client() {
    std::cout << "Testing relational from_client..." << std::endl;

    schema_registry registry;
    register_tag(registry);

    auto usage = std::make_shared<skeleton_definition>("tag_usage");
    bone_options required;
    required.required = true;
    usage->add<string_bone>("role", required);

    auto item = registry.register_skeleton("item");
    item->add<string_bone>("name");
    relational_options rel;
    rel.kind = "tag";
    rel.using_skel = usage;
    bone_options multiple;
    multiple.multiple = true;
    item->add<relational_bone>("tags", rel, multiple);

    auto note = registry.register_skeleton("note");
    note->add<string_bone>("name");
    relational_options plain;
    plain.kind = "tag";
    note->add<relational_bone>("tag", plain);
    registry.seal();
    marrow_db db(registry);

    db_key red = create_record(db, "tag", "red");

    // Key plus edge data
    auto skel = db.create("item");
    assert(skel.from_client({{"name", std::string("hat")},
                             {"tags.0.key", red.to_string()},
                             {"tags.0.role", std::string("primary")}}));
    assert(skel.get("tags").size() == 1);
    assert(skel.get("tags")[0]["rel"]["role"] == "primary");
    assert(skel.get("tags")[0]["dest"]["name"] == "red");

    auto hat = skel.write();
    assert(hat);
    auto edges = edges_of(db, *hat);
    assert(edges.size() == 1 && edges.front().get("rel")["role"] == "primary");

    // Edge data missing a required field
    auto incomplete = db.create("item");
    assert(!incomplete.from_client({{"name", std::string("cap")}, {"tags.0.key", red.to_string()}}));
    bool reported = false;
    for (const auto& e : incomplete.errors()) {
        if (e.message == "Incomplete data") {
            reported = true;
            assert(e.field_path.front() == "tags");
        }
    }
    assert(reported);

    // Wrong kind and garbage keys
    auto wrong = db.create("note");
    assert(!wrong.from_client({{"name", std::string("n")}, {"tag", hat->to_string()}}));
    assert(!wrong.from_client({{"name", std::string("n")}, {"tag", std::string("not a key")}}));
    assert(wrong.get("tag").is_null());

    // A dangling reference keeps the cached copy
    db_key memo = create_record(db, "note", "memo", "tag", red.to_string());
    db.load(red)->remove();
    auto stale = db.load(memo);
    assert(!stale->from_client({{"tag", red.to_string()}}, true));
    assert(stale->get("tag")["dest"]["name"] == "red");
    assert(stale->errors().back().severity == error_severity::invalid);

    std::cout << "  Relational from_client test passed!" << std::endl;
}

// ============================================================================
// Test: Query rewriting
// ============================================================================

void test_query_rewriting() {
    std::cout << "Testing relational query rewriting..." << std::endl;

    schema_registry registry;
    register_tag(registry);
    register_item(registry, relational_consistency::ignore, true);
    auto note = registry.register_skeleton("note");
    note->add<string_bone>("name");
    relational_options plain;
    plain.kind = "tag";
    note->add<relational_bone>("tag", plain);
    registry.seal();
    marrow_db db(registry);

    db_key red = create_record(db, "tag", "red");
    db_key blue = create_record(db, "tag", "blue");
    create_record(db, "item", "shirt", "tags", json::array({red.to_string()}));
    create_record(db, "item", "hat", "tags", json::array({red.to_string(), blue.to_string()}));
    create_record(db, "item", "sock", "tags", json::array({blue.to_string()}));

    auto by_tag = db.select("item");
    by_tag.merge_client_params({{"tags.dest.name", "red"}});
    assert(by_tag.is_relational());
    assert(by_tag.raw().kind() == layout::relations_kind);
    std::set<std::string> names;
    for (auto& skel : by_tag.fetch(10)) names.insert(skel.get("name").get<std::string>());
    assert(names == std::set<std::string>({"shirt", "hat"}));

    // Owner filters on parent keys become src.* filters
    auto combined = db.select("item");
    combined.merge_client_params({{"name", "hat"}, {"tags.dest.name", "blue"}});
    auto hats = combined.fetch(10);
    assert(hats.size() == 1 && hats.front().get("name") == "hat");
    bool moved = false;
    for (const auto& f : combined.raw().filters()) {
        if (f.property == "src.name") moved = true;
    }
    assert(moved);

    // Filters that are not parent keys cannot be combined
    bool rejected = false;
    try {
        db.select("item").merge_client_params({{"price", 5}, {"tags.dest.name", "red"}});
    } catch (const invalid_query&) {
        rejected = true;
    }
    assert(rejected);

    // Uncached target fields cannot be filtered
    rejected = false;
    try {
        db.select("item").merge_client_params({{"tags.dest.color", "x"}});
    } catch (const invalid_query&) {
        rejected = true;
    }
    assert(rejected);

    // Single-valued bones filter the owner's cached copy directly
    create_record(db, "note", "memo", "tag", red.to_string());
    create_record(db, "note", "todo", "tag", blue.to_string());
    auto notes = db.select("note");
    notes.merge_client_params({{"tag.dest.name", "blue"}});
    assert(!notes.is_relational());
    auto found = notes.fetch(10);
    assert(found.size() == 1 && found.front().get("name") == "todo");

    // Plain ordering
    auto ordered = db.select("item");
    ordered.merge_client_params({{"orderby", "name"}, {"orderdir", "1"}});
    auto all = ordered.fetch(10);
    assert(all.size() == 3);
    assert(all[0].get("name") == "sock" && all[2].get("name") == "hat");

    std::cout << "  Query rewriting test passed!" << std::endl;
}

// ============================================================================
// Test: Tasks
// ============================================================================

void test_task_queue() {
    std::cout << "Testing task queue..." << std::endl;

    entity_store store{configuration{}};
    store_task_queue queue(store, 3);

    int permanent_calls = 0;
    int flaky_calls = 0;
    queue.set_handler([&](const task& t) {
        const auto& v = std::get<vacuum_relations_task>(t);
        if (v.kind == "permanent") {
            ++permanent_calls;
            throw permanent_task_error("never going to work");
        }
        ++flaky_calls;
        throw std::runtime_error("try again");
    });

    vacuum_relations_task permanent;
    permanent.kind = "permanent";
    queue.enqueue(permanent);
    queue.drain();
    assert(permanent_calls == 1);
    assert(queue.pending_count() == 0);

    vacuum_relations_task flaky;
    flaky.kind = "flaky";
    queue.enqueue(flaky);
    queue.drain();
    assert(flaky_calls == 1);
    assert(queue.pending_count() == 1);
    // Backed off: not due yet
    assert(queue.run_pending() == 0);
    assert(flaky_calls == 1);
    queue.drain();
    queue.drain();
    assert(flaky_calls == 3);
    assert(queue.pending_count() == 0);

    // Enqueue inside a transaction takes effect only on commit
    try {
        store.run_in_transaction([&] {
            queue.enqueue(flaky);
            throw std::runtime_error("rollback");
        });
    } catch (const std::runtime_error&) {
        // Expected
    }
    assert(queue.pending_count() == 0);
    store.run_in_transaction([&] { queue.enqueue(flaky); });
    assert(queue.pending_count() == 1);

    // Payloads survive the round trip through the queue table
    update_relations_task update{db_key("tag", static_cast<int64_t>(3)), 12.5, std::string("name"), std::string("c")};
    task parsed = task_from_json(task_name(update), task_to_json(update));
    const auto& back = std::get<update_relations_task>(parsed);
    assert(back.dest_key == update.dest_key && back.min_change_time == 12.5);
    assert(back.changed_bone == update.changed_bone && back.cursor == update.cursor);

    bool permanent_parse = false;
    try {
        task_from_json("no_such_task", json::object());
    } catch (const permanent_task_error&) {
        permanent_parse = true;
    }
    assert(permanent_parse);

    std::cout << "  Task queue test passed!" << std::endl;
}

void test_vacuum_and_rebuild() {
    std::cout << "Testing vacuum and rebuild..." << std::endl;

    schema_registry registry;
    register_tag(registry);
    auto item = registry.register_skeleton("item");
    bone_options searchable;
    searchable.searchable = true;
    item->add<string_bone>("name", searchable);
    relational_options rel;
    rel.kind = "tag";
    item->add<relational_bone>("tag", rel);
    registry.seal();
    marrow_db db(registry);

    db_key red = create_record(db, "tag", "red");
    db_key shirt = create_record(db, "item", "Blue Shirt", "tag", red.to_string());

    auto tags = strings(stored(db, shirt, layout::meta_property)[layout::search_tags]);
    assert(std::set<std::string>(tags.begin(), tags.end()) == std::set<std::string>({"blue", "shirt"}));

    // An edge left behind by a kind that no longer exists
    entity orphan(db_key(layout::relations_kind, static_cast<int64_t>(999), db_key("gone", static_cast<int64_t>(1))));
    orphan["src_kind"] = "gone";
    orphan["src_property"] = "tag";
    orphan["dest"] = {{"key", red.to_string()}};
    db.store().put(orphan);

    vacuum_relations_task vacuum;
    vacuum.kind = "*";
    db.tasks().enqueue(vacuum);
    db.drain_tasks();
    assert(!db.store().get(orphan.key));
    assert(edges_of(db, shirt).size() == 1);

    // Change the target behind the pipeline's back, then rebuild
    auto raw = db.store().get(red);
    (*raw)["name"] = "navy";
    db.store().put(*raw);
    assert(db.load(shirt)->get("tag")["dest"]["name"] == "red");

    rebuild_search_index_task rebuild;
    rebuild.kind = "item";
    db.tasks().enqueue(rebuild);
    db.drain_tasks();
    assert(db.load(shirt)->get("tag")["dest"]["name"] == "navy");

    std::cout << "  Vacuum and rebuild test passed!" << std::endl;
}

// ============================================================================
// Test: Write pipeline bookkeeping
// ============================================================================

void test_blob_locks_and_seo_keys() {
    std::cout << "Testing blob locks and SEO keys..." << std::endl;

    schema_registry registry;
    auto article = registry.register_skeleton("article");
    article->add<string_bone>("name");
    article->add<blob_name_bone>("image");
    article->set_seo_keys([](skeleton_instance& skel) -> std::map<std::string, std::string> {
        return {{"en", skel.get("name").get<std::string>()}};
    });
    registry.seal();
    marrow_db db(registry);

    auto first = db.create("article");
    first.set_bone_value("name", "Hello, World!");
    first.set_bone_value("image", "blob-a");
    auto first_key = first.write();
    assert(first_key);

    db_key lock_key(layout::blob_locks_kind, first_key->to_string());
    auto lock = db.store().get(lock_key);
    assert(lock);
    assert(strings(lock->get("active_blob_references")) == std::vector<std::string>{"blob-a"});
    assert(lock->get("has_old_blob_references") == false);

    first.set_bone_value("image", "blob-b");
    assert(first.write());
    lock = db.store().get(lock_key);
    assert(strings(lock->get("active_blob_references")) == std::vector<std::string>{"blob-b"});
    assert(strings(lock->get("old_blob_references")) == std::vector<std::string>{"blob-a"});
    assert(lock->get("has_old_blob_references") == true);

    json meta = stored(db, *first_key, layout::meta_property);
    assert(meta[layout::seo_keys]["en"] == "hello-world");

    // The same title gets a suffixed key
    db_key second_key = create_record(db, "article", "hello world");
    std::string second_seo = stored(db, second_key, layout::meta_property)[layout::seo_keys]["en"];
    assert(second_seo != "hello-world");
    assert(starts_with(second_seo, "hello-world-"));

    // Old keys stay active after a rename
    first.set_bone_value("name", "Goodbye");
    assert(first.write());
    auto active = strings(stored(db, *first_key, layout::meta_property)[layout::active_seo_keys]);
    assert(active.size() == 2 && active.front() == "goodbye" && active.back() == "hello-world");

    first.remove();
    assert(db.store().get(lock_key)->get("is_stale") == true);

    std::cout << "  Blob locks and SEO keys test passed!" << std::endl;
}

struct counting_adapter : database_adapter {
    int preprocessed = 0;
    int updated = 0;
    int deleted = 0;
    std::vector<std::string> last_changes;

    void preprocess_entry(entity& e, skeleton_instance&, bool, const std::vector<std::string>&) override {
        ++preprocessed;
        e["stamped"] = true;
    }
    void update_entry(const entity&, skeleton_instance&, bool, const std::vector<std::string>& changes) override {
        ++updated;
        last_changes = changes;
    }
    void delete_entry(const entity&, skeleton_instance&) override { ++deleted; }
};

void test_adapters_and_hooks() {
    std::cout << "Testing adapters and hooks..." << std::endl;

    schema_registry registry;
    auto adapter = std::make_shared<counting_adapter>();
    int saved_hooks = 0;
    int deleted_hooks = 0;
    auto thing = registry.register_skeleton("thing");
    thing->add<string_bone>("name");
    thing->add<string_bone>("color");
    thing->add_adapter(adapter);
    thing->set_post_saved_hook([&](skeleton_instance&, const db_key&) { ++saved_hooks; });
    thing->set_post_deleted_hook([&](skeleton_instance&, const db_key&) { ++deleted_hooks; });
    thing->add_validation([](skeleton_instance& skel) {
        std::vector<read_from_client_error> errors;
        if (skel.get("name") == skel.get("color")) {
            errors.push_back(make_error(error_severity::invalidates_other, "Name and color must differ", {"color"}));
        }
        return errors;
    });
    registry.seal();
    marrow_db db(registry);

    auto skel = db.create("thing");
    assert(!skel.from_client({{"name", std::string("x")}, {"color", std::string("x")}}));
    assert(skel.from_client({{"name", std::string("x")}, {"color", std::string("y")}}));

    auto key = skel.write();
    assert(key);
    assert(adapter->preprocessed == 1 && adapter->updated == 1);
    assert(stored(db, *key, "stamped") == true);
    assert(saved_hooks == 1);

    // Partial write: only the touched bone changes
    auto loaded = db.load(*key);
    loaded->set_bone_value("color", "z");
    loaded->write();
    assert(adapter->last_changes == std::vector<std::string>{"color"});
    assert(stored(db, *key, "name") == "x");

    loaded->remove();
    assert(adapter->deleted == 1);
    assert(deleted_hooks == 1);

    bool not_found = false;
    try {
        db.create("thing").remove();
    } catch (const not_found_error&) {
        not_found = true;
    }
    assert(not_found);

    std::cout << "  Adapters and hooks test passed!" << std::endl;
}

struct failing_adapter : database_adapter {
    int updated = 0;
    int deleted = 0;

    void update_entry(const entity&, skeleton_instance&, bool, const std::vector<std::string>&) override {
        ++updated;
        throw std::runtime_error("search index unavailable");
    }
    void delete_entry(const entity&, skeleton_instance&) override {
        ++deleted;
        throw std::runtime_error("search index unavailable");
    }
};

void test_failing_adapter_after_commit() {
    std::cout << "Testing failing adapters after commit..." << std::endl;

    schema_registry registry;
    register_tag(registry);
    auto adapter = std::make_shared<failing_adapter>();
    int saved_hooks = 0;
    auto item = registry.register_skeleton("item");
    item->add<string_bone>("name");
    relational_options rel;
    rel.kind = "tag";
    rel.consistency = relational_consistency::prevent_deletion;
    item->add<relational_bone>("tag", rel);
    item->add_adapter(adapter);
    item->set_post_saved_hook([&](skeleton_instance&, const db_key&) { ++saved_hooks; });
    registry.seal();
    marrow_db db(registry);

    db_key red = create_record(db, "tag", "red");

    auto skel = db.create("item");
    assert(skel.set_bone_value("name", "shirt"));
    assert(skel.set_bone_value("tag", red.to_string()));
    auto key = skel.write();
    assert(key);
    assert(adapter->updated == 1);
    assert(saved_hooks == 1);
    assert(skel.key() && *skel.key() == *key);
    assert(edges_of(db, *key).size() == 1);

    // Writing again updates the same record
    assert(skel.set_bone_value("name", "blouse"));
    auto again = skel.write();
    assert(again && *again == *key);
    assert(adapter->updated == 2);
    assert(saved_hooks == 2);
    assert(db.store().make_query("item").run(10).size() == 1);
    assert(stored(db, *key, "name") == "blouse");
    assert(edges_of(db, *key).size() == 1);

    skel.remove();
    assert(adapter->deleted == 1);
    assert(!skel.key());
    assert(!db.store().get(*key));
    assert(edges_of(db, *key).empty());
    assert(count_of(strings(stored(db, red, layout::incoming_locks_property)), key->to_string()) == 0);

    std::cout << "  Failing adapters after commit test passed!" << std::endl;
}

// ============================================================================
// Test: Integrity warnings
// ============================================================================

void test_integrity_warnings() {
    std::cout << "Testing integrity warnings..." << std::endl;

    schema_registry registry;
    register_tag(registry);
    register_item(registry, relational_consistency::prevent_deletion);
    register_user(registry);
    registry.seal();
    marrow_db db(registry);

    std::vector<integrity_issue> seen;
    auto observer = db.integrity().add_observer([&](const integrity_warning& w) { seen.push_back(w.issue); });

    db_key red = create_record(db, "tag", "red");
    db_key shirt = create_record(db, "item", "shirt", "tag", red.to_string());

    // Corrupt the lock list on the target
    auto raw = db.store().get(red);
    (*raw)[layout::incoming_locks_property] = json::array();
    db.store().put(*raw);

    db.load(shirt)->remove();
    assert(!db.store().get(shirt));
    assert(db.integrity().count(integrity_issue::lock_asymmetry) == 1);
    assert(seen.size() == 1 && seen.front() == integrity_issue::lock_asymmetry);

    // A missing unique lock
    auto user = db.create("user");
    user.set_bone_value("name", "u");
    user.set_bone_value("email", "u@example.com");
    auto user_key = user.write();
    assert(user_key);
    db.store().remove(db_key(layout::unique_lock_kind("user", "email"), unique_value_hash("u@example.com")));
    user.remove();
    assert(db.integrity().count(integrity_issue::unique_lock_missing) == 1);

    db.integrity().remove_observer(observer);
    db_key blue = create_record(db, "tag", "blue");
    db_key hat = create_record(db, "item", "hat", "tag", blue.to_string());
    db.store().remove(blue);
    db.load(hat)->remove();
    assert(db.integrity().count(integrity_issue::lock_target_missing) == 1);
    assert(seen.size() == 2);
    assert(db.integrity().recent().size() == 3);

    std::cout << "  Integrity warnings test passed!" << std::endl;
}

// ============================================================================
// Main
// ============================================================================

int main() {
    std::cout << "=== MarrowCore Tests ===" << std::endl;
    std::cout << std::endl;

    set_log_level(log_level::off);

    try {
        // Store tests
        test_key_encoding();
        test_store_transactions();
        test_store_conflict_retry();
        test_store_queries();

        // Schema and client input
        test_schema_registry();
        test_from_client_errors();

        // Unique values
        test_unique_values();
        test_unique_concurrent_writers();
        test_unique_multiple_methods();

        // Relational locks and propagation
        test_prevent_deletion_scenario();
        test_lock_symmetry();
        test_cache_propagation();
        test_propagation_batches();
        test_propagation_many_references();
        test_set_null_scenario();
        test_set_null_multiple();
        test_cascade_deletion();
        test_update_levels();
        test_relational_from_client();
        test_query_rewriting();

        // Background tasks
        test_task_queue();
        test_vacuum_and_rebuild();

        // Write pipeline bookkeeping
        test_blob_locks_and_seo_keys();
        test_adapters_and_hooks();
        test_failing_adapter_after_commit();
        test_integrity_warnings();

        std::cout << std::endl;
        std::cout << "========================================" << std::endl;
        std::cout << "All tests passed! (26 test suites)" << std::endl;
        std::cout << "========================================" << std::endl;
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
