#include <tristore/tristore.hpp>
#include <iostream>
#include <cassert>
#include <cstdlib>
#include <atomic>
#include <memory>
#include <random>
#include <set>
#include <stdexcept>
#include <thread>

using namespace tristore;

template <typename E, typename F>
bool throws(F&& f) {
    try {
        f();
    } catch (const E&) {
        return true;
    }
    return false;
}

static bool is_integer(const Value& v) { return v.integer() != nullptr; }

// ═══════════════════════════════════════════════════════════════════════════
// Identity
// ═══════════════════════════════════════════════════════════════════════════

void test_id128() {
    std::cout << "Testing Id128..." << std::endl;

    std::set<Id128> ids;
    for (int i = 0; i < 10000; ++i) {
        ids.insert(Id128::generate());
    }
    assert(ids.size() == 10000);

    Id128 id{0x0123456789abcdefULL, 0xfedcba9876543210ULL};
    std::string text = id.to_string();
    assert(text == "01234567-89ab-cdef-fedc-ba9876543210");
    assert(Id128::parse(text) == id);
    assert(Id128::parse("01234567-89AB-CDEF-FEDC-BA9876543210") == id);

    assert(!Id128::from_string(""));
    assert(!Id128::from_string("not-a-uuid"));
    assert(!Id128::from_string("01234567-89ab-cdef-fedc-ba987654321"));    // short
    assert(!Id128::from_string("01234567-89ab-cdef-fedc-ba98765432100"));  // long
    assert(!Id128::from_string("0123456789ab-cdef-fedc-ba9876543210-"));   // dashes moved
    assert(!Id128::from_string("01234567-89ab-cdef-fedc-ba987654321g"));   // bad digit
    assert(throws<InvalidIdentifier>([] { Id128::parse("xyz"); }));

    std::cout << "  PASS" << std::endl;
}

void test_entity() {
    std::cout << "Testing Entity..." << std::endl;

    Entity anon;
    Entity anon2;
    assert(anon != anon2);
    assert(!anon.name());
    assert(anon.to_string().size() == 6);
    assert(anon.to_string()[0] == '_');
    assert(anon.to_string().substr(1) == anon.id().to_string().substr(0, 5));

    Entity head("head");
    assert(head.to_string() == "head");
    assert(throws<InvalidName>([] { Entity("two words"); }));
    assert(throws<InvalidName>([] { Entity("9lives"); }));
    assert(throws<InvalidName>([] { Entity(""); }));

    // Same id: same entity, whatever the other fields say
    Entity same(head.id());
    assert(same == head);
    assert(EntityHash{}(same) == EntityHash{}(head));

    std::cout << "  PASS" << std::endl;
}

void test_entity_round_trip() {
    std::cout << "Testing Entity round trip..." << std::endl;

    std::string id = "6ba7b810-9dad-11d1-80b4-00c04fd430c8";
    Entity e = new_entity("ring", id, "https://example.org/ring");
    assert(e.to_string() == "ring");
    assert(e.id().to_string() == id);
    assert(e.repr() == "E(name='ring', id_='" + id + "', url='https://example.org/ring')");

    Entity again = new_entity(*e.name(), e.id().to_string(), *e.url());
    assert(again == e);

    Entity bare = new_entity(std::nullopt, id);
    assert(bare == e);
    assert(bare.repr() == "E(id_='" + id + "')");

    assert(throws<InvalidIdentifier>([] { new_entity("ring", std::string("1234")); }));

    std::cout << "  PASS" << std::endl;
}

void test_predicate() {
    std::cout << "Testing Predicate..." << std::endl;

    PredicateKind age_kind{"age", is_integer};
    Predicate age = new_predicate(age_kind);
    Predicate age2 = new_predicate(age_kind, std::string("years"));
    assert(age.name() == "age");
    assert(age2.name() == "years");
    assert(age != age2);
    assert(age.has_validator());
    assert(age.validate(Value(3)));
    assert(!age.validate(Value("three")));

    Predicate name("name");
    assert(!name.has_validator());
    assert(name.validate(Value("anything")));
    assert(name.validate(Value(1.5)));

    std::cout << "  PASS" << std::endl;
}

void test_values() {
    std::cout << "Testing Value..." << std::endl;

    Value s("1");
    Value i(1);
    Value b(true);
    assert(s.kind() == Value::Kind::String);
    assert(i.kind() == Value::Kind::Integer);
    assert(b.kind() == Value::Kind::Bool);
    assert(s.id() != i.id() && s.id() != b.id() && i.id() != b.id());
    assert(s != i);

    assert(Value("head") == Value(std::string("head")));
    assert(Value(int64_t{7}) == Value(7));
    assert(Value(0.0) == Value(-0.0));
    assert(Value(1.0) != Value(1));
    assert(Value(false) != Value(true));

    assert(std::string(Value::kind_name(s.kind())) == "string");
    assert(std::string(Value::kind_name(b.kind())) == "bool");
    assert(std::string(Value::kind_name(Value::Kind::Triple)) == "triple");

    assert(b.to_string() == "true");
    assert(i.to_string() == "1");
    assert(Value(2.5).to_string() == "2.5");

    Entity e("hand");
    Value ev(e);
    assert(ev.is_entity());
    assert(ev.id() == e.id());
    assert(*ev.entity() == e);

    assert(throws<InvalidArgument>([] {
        Subject literal_subject{Value("literal")};
        (void)literal_subject;
    }));
    assert(throws<InvalidArgument>([] {
        Value null_triple{std::shared_ptr<const Triple>{}};
        (void)null_triple;
    }));

    std::cout << "  PASS" << std::endl;
}

void test_triple_identity() {
    std::cout << "Testing Triple identity..." << std::endl;

    Entity hand("hand");
    Entity ring("ring");
    Predicate has("has");

    Triple t1(hand, has, ring);
    Triple t2(hand, has, ring);
    Triple t3(ring, has, hand);
    assert(t1 == t2);
    assert(t1.id() == t2.id());
    assert(t1 != t3);
    assert(t1.id() != t3.id());

    // A triple as a term: same id whether used as subject or object
    Subject as_subject(t1);
    Value as_object(t1);
    assert(as_subject.is_triple());
    assert(as_subject.id() == t1.id());
    assert(as_object.id() == t1.id());
    assert(*as_subject.triple() == t1);

    assert(t1.to_string() == "Triple(s=hand, p=has, o=ring)");

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// Index engine
// ═══════════════════════════════════════════════════════════════════════════

void test_insert_and_contains() {
    std::cout << "Testing insert/contains..." << std::endl;

    TripleStore store;
    Entity a("a");
    Entity b("b");
    Predicate knows("knows");

    assert(store.empty());
    assert(store.insert(a, knows, b));
    assert(!store.insert(a, knows, b));          // duplicate: no-op
    assert(!store.insert(Triple(a, knows, b)));
    assert(store.size() == 1);
    assert(store.contains(Triple(a, knows, b)));
    assert(store.contains(a, knows, b));
    assert(!store.contains(b, knows, a));
    assert(!store.contains(a, Predicate("knows"), b));  // other predicate id

    // Entity with the same id is the same term
    Entity a_again(a.id());
    assert(store.contains(a_again, knows, b));

    std::cout << "  PASS" << std::endl;
}

void test_term_kinds() {
    std::cout << "Testing entity and literal sharing an id..." << std::endl;

    TripleStore store;
    Value literal("x");
    Entity twin(literal.id());
    Entity a("a");
    Predicate p("p");
    Predicate q("q");

    assert(Value(twin).id() == literal.id());
    assert(Value(twin) != literal);

    assert(store.insert(a, p, literal));
    assert(store.insert(a, p, twin));
    assert(store.insert(twin, q, 1));
    assert(store.size() == 3);
    assert(store.stats().terms == 4);

    auto objects = store.objects(a, p);
    assert(objects.size() == 2);
    assert(objects.count(literal) == 1);
    assert(objects.count(Value(twin)) == 1);

    for (const auto& t : store.triples()) {
        assert(store.contains(t));
        assert(store.objects(t.s(), t.p()).count(t.o()) == 1);
    }

    // The literal never shows up as a subject
    assert(store.attributes_of(twin).size() == 1);
    assert(store.attributes_of(twin).count(q) == 1);
    assert(store.get_which(q, 1) == EntitySet{twin});
    assert(store.subjects(p, literal).size() == 1);
    assert(store.subjects(p, twin).size() == 1);

    std::cout << "  PASS" << std::endl;
}

// Validator whose copies throw while armed
struct ArmedCopy {
    std::shared_ptr<bool> armed;

    explicit ArmedCopy(std::shared_ptr<bool> flag) : armed(std::move(flag)) {}
    ArmedCopy(const ArmedCopy& other) : armed(other.armed) {
        if (*armed) throw std::runtime_error("copy failed");
    }
    ArmedCopy(ArmedCopy&& other) noexcept = default;

    bool operator()(const Value&) const { return true; }
};

static void assert_same_indices(const EngineStats& a, const EngineStats& b) {
    assert(a.triples == b.triples);
    assert(a.subjects == b.subjects);
    assert(a.sp_keys == b.sp_keys);
    assert(a.po_keys == b.po_keys);
    assert(a.os_keys == b.os_keys);
}

void test_insert_rollback() {
    std::cout << "Testing insert rollback..." << std::endl;

    auto armed = std::make_shared<bool>(false);
    Predicate fragile("fragile", ArmedCopy(armed));
    Predicate plain("plain");
    Entity a("a");
    Entity b("b");

    IndexEngine engine;
    assert(engine.insert(Triple(a, fragile, 1)));
    assert(engine.insert(Triple(a, plain, b)));
    EngineStats before = engine.stats();

    Entity fresh("fresh");
    Triple first(fresh, plain, b);
    Triple second(fresh, fragile, 2);
    std::vector<Triple> batch = {first, second};

    // Single insert: the log copy fails, nothing is left behind
    *armed = true;
    assert(throws<std::runtime_error>([&] { engine.insert(second); }));
    assert_same_indices(engine.stats(), before);
    assert(!engine.contains(second));

    // Batch: the first triple is fully indexed, then undone
    assert(throws<std::runtime_error>([&] { engine.insert_all(batch); }));
    *armed = false;

    assert_same_indices(engine.stats(), before);
    assert(!engine.contains(first));
    assert(engine.with_subject(fresh).empty());
    assert(engine.objects(fresh, plain).empty());
    assert(engine.subjects(plain, b).size() == 1);
    assert(engine.predicates(fresh, b).empty());
    assert(engine.subjects_matching({{plain, b}}).size() == 1);
    assert(engine.with_object(b).size() == 1);
    assert(engine.last_added() == a);
    assert(engine.sp_index().entry_count() == engine.size());
    assert(engine.po_index().entry_count() == engine.size());
    assert(engine.os_index().entry_count() == engine.size());

    // Positions stay dense: the retried batch lands where the undone one was
    assert(engine.insert_all(batch) == 2);
    assert(engine.size() == 4);
    assert(engine.triples()[2] == first);
    assert(engine.triples()[3] == second);
    assert(engine.with_subject(fresh).size() == 2);
    assert(engine.objects(fresh, fragile).count(Value(2)) == 1);
    assert(engine.last_added() == fresh);
    for (const auto& t : engine.triples()) {
        assert(engine.contains(t));
        assert(engine.subjects(t.p(), t.o()).count(t.s()) == 1);
        assert(engine.predicates(t.s(), t.o()).count(t.p()) == 1);
    }

    std::cout << "  PASS" << std::endl;
}

void test_composite_entries() {
    std::cout << "Testing composite index entries..." << std::endl;

    IndexEngine engine;
    std::vector<Entity> entities(25);
    std::vector<Predicate> preds = {Predicate("p0"), Predicate("p1")};

    std::mt19937 rng(23);
    size_t added = 0;
    for (int i = 0; i < 400; ++i) {
        Triple t(entities[rng() % entities.size()], preds[rng() % preds.size()],
                 entities[rng() % entities.size()]);
        if (engine.insert(t)) ++added;
    }
    assert(added == engine.size());

    // One slot per stored triple on every axis
    assert(engine.sp_index().entry_count() == engine.size());
    assert(engine.po_index().entry_count() == engine.size());
    assert(engine.os_index().entry_count() == engine.size());

    EngineStats st = engine.stats();
    assert(engine.sp_index().key_count() == st.sp_keys);
    assert(engine.po_index().key_count() == st.po_keys);
    assert(engine.os_index().key_count() == st.os_keys);
    assert(st.sp_keys <= engine.size());

    for (const auto& t : engine.triples()) {
        const Posting* posting = engine.sp_index().find(t.s().id(), t.p().id());
        assert(posting != nullptr);
        assert(posting->cardinality() == engine.objects(t.s(), t.p()).size());
    }

    std::cout << "  PASS" << std::endl;
}

void test_last_added() {
    std::cout << "Testing last_added..." << std::endl;

    TripleStore store;
    assert(throws<EmptyStoreError>([&] { store.last_added(); }));

    Entity a("a");
    Entity b("b");
    Predicate p("p");
    store.insert(a, p, 1);
    assert(store.last_added() == a);
    store.insert(b, p, 1);
    assert(store.last_added() == b);

    // Re-inserting an existing triple does not move the pointer
    store.insert(a, p, 1);
    assert(store.last_added() == b);

    // Nor does a triple whose subject is a triple
    Predicate noted("noted");
    store.insert(Triple(a, p, 1), noted, true);
    assert(store.last_added() == b);

    std::cout << "  PASS" << std::endl;
}

void test_index_consistency() {
    std::cout << "Testing index consistency..." << std::endl;

    TripleStore store;
    std::vector<Entity> entities;
    for (int i = 0; i < 40; ++i) entities.emplace_back();
    std::vector<Predicate> preds = {Predicate("p0"), Predicate("p1"), Predicate("p2")};

    std::mt19937 rng(17);
    for (int i = 0; i < 600; ++i) {
        const Entity& s = entities[rng() % entities.size()];
        const Predicate& p = preds[rng() % preds.size()];
        if (rng() % 2) {
            store.insert(s, p, entities[rng() % entities.size()]);
        } else {
            store.insert(s, p, static_cast<int>(rng() % 10));
        }
    }

    auto triples = store.triples();
    assert(triples.size() == store.size());
    for (const auto& t : triples) {
        assert(store.objects(t.s(), t.p()).count(t.o()) == 1);
        assert(store.subjects(t.p(), t.o()).count(t.s()) == 1);
        assert(store.predicates(t.s(), t.o()).count(t.p()) == 1);
    }

    // Converse: everything an index returns is a stored triple
    for (const auto& s : entities) {
        for (const auto& p : preds) {
            for (const auto& o : store.objects(s, p)) {
                assert(store.contains(s, p, o));
            }
        }
    }
    for (const auto& p : preds) {
        for (int v = 0; v < 10; ++v) {
            for (const auto& s : store.subjects(p, v)) {
                assert(store.contains(s, p, v));
            }
        }
    }
    for (const auto& s : entities) {
        std::vector<Value> objects(entities.begin(), entities.end());
        for (int v = 0; v < 10; ++v) objects.emplace_back(v);
        for (const auto& o : objects) {
            for (const auto& p : store.predicates(s, o)) {
                assert(store.contains(s, p, o));
            }
        }
    }

    // Iteration yields every triple exactly once
    std::set<Id128> seen;
    size_t visited = 0;
    store.for_each([&](const Triple& t) {
        seen.insert(t.id());
        ++visited;
    });
    assert(visited == store.size());
    assert(seen.size() == store.size());

    auto st = store.stats();
    assert(st.triples == store.size());
    assert(st.predicates == preds.size());
    assert(st.subjects <= entities.size());
    assert(st.sp_keys > 0 && st.po_keys > 0 && st.os_keys > 0);
    assert(st.memory_bytes > 0);

    std::cout << "  PASS" << std::endl;
}

void test_attributes_of() {
    std::cout << "Testing attributes_of..." << std::endl;

    TripleStore store;
    Entity e;
    Predicate name("name");
    Predicate tag("tag");
    store.insert(e, name, "head");
    store.insert(e, tag, "round");
    store.insert(e, tag, "small");
    store.insert(Entity(), tag, "other");

    Attributes attrs = store.attributes_of(e);
    assert(attrs.size() == 2);
    assert(attrs.at(name) == (ValueSet{Value("head")}));
    assert(attrs.at(tag) == (ValueSet{Value("round"), Value("small")}));

    assert(store.attributes_of(Entity()).empty());

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// Validation
// ═══════════════════════════════════════════════════════════════════════════

void test_validation_atomicity() {
    std::cout << "Testing validation atomicity..." << std::endl;

    TripleStore store;
    Entity bob("bob");
    Predicate age("age");
    store.insert(bob, age, 41);

    store.set_check(age, is_integer);
    assert(store.has_check(age));

    auto before = store.stats();
    bool rejected = false;
    try {
        store.insert(bob, age, "forty");
    } catch (const ValidationError& e) {
        rejected = true;
        assert(std::string(e.what()) == "forty does not match the criteria for predicate age");
    }
    assert(rejected);
    assert(!store.contains(bob, age, "forty"));
    assert(store.size() == 1);
    assert(store.objects(bob, age) == (ValueSet{Value(41)}));
    assert(store.get_which(age, "forty").empty());

    auto after = store.stats();
    assert(after.triples == before.triples);
    assert(after.sp_keys == before.sp_keys);
    assert(after.po_keys == before.po_keys);
    assert(after.os_keys == before.os_keys);
    assert(after.terms == before.terms);

    // Only future inserts are checked
    store.set_check(age, [](const Value& v) { return v.integer() && *v.integer() < 40; });
    assert(store.contains(bob, age, 41));
    assert(throws<ValidationError>([&] { store.insert(bob, age, 42); }));
    assert(store.insert(bob, age, 39));

    assert(store.clear_check(age));
    assert(!store.has_check(age));
    assert(store.insert(bob, age, "any"));

    std::cout << "  PASS" << std::endl;
}

void test_validation_sources() {
    std::cout << "Testing validation lookup order..." << std::endl;

    TripleStore store;
    Entity e;
    Predicate count = new_predicate(PredicateKind{"count", is_integer});

    // Kind validator applies without registration
    assert(throws<ValidationError>([&] { store.insert(e, count, "x"); }));
    assert(store.insert(e, count, 3));

    // A registered check wins over the kind validator
    store.set_check(count, [](const Value& v) { return v.string() != nullptr; });
    assert(store.insert(e, count, "x"));
    assert(throws<ValidationError>([&] { store.insert(e, count, 4); }));

    // Back to the kind validator
    store.clear_check(count);
    assert(store.insert(e, count, 4));

    // A throwing check propagates and changes nothing
    Predicate flaky("flaky");
    store.set_check(flaky, [](const Value&) -> bool { throw std::logic_error("boom"); });
    size_t size = store.size();
    assert(throws<std::logic_error>([&] { store.insert(e, flaky, 1); }));
    assert(store.size() == size);

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// Queries
// ═══════════════════════════════════════════════════════════════════════════

void test_get_all() {
    std::cout << "Testing get_all / get / get_which..." << std::endl;

    TripleStore store;
    Predicate color("color");
    Predicate shape("shape");
    Entity a, b, c;
    store.insert(a, color, "red");
    store.insert(a, shape, "round");
    store.insert(b, color, "red");
    store.insert(b, shape, "square");
    store.insert(c, color, "blue");
    store.insert(c, shape, "round");

    assert(store.get_all({{color, "red"}}) == (EntitySet{a, b}));
    assert(store.get_all({{color, "red"}, {shape, "round"}}) == (EntitySet{a}));
    assert(store.get_all({{color, "green"}}).empty());
    assert(store.get_all({{color, "red"}, {shape, "oval"}}).empty());

    // Same predicate twice: both must hold
    assert(store.get_all({{color, "red"}, {color, "blue"}}).empty());

    assert(store.get({{color, "blue"}}) == c);
    assert(store.get({{color, "red"}, {shape, "square"}}) == b);

    assert(throws<EmptyQueryError>([&] { store.get_all({}); }));
    assert(throws<EmptyQueryError>([&] { store.get({}); }));
    assert(throws<NoResultError>([&] { store.get({{color, "green"}}); }));

    bool ambiguous = false;
    try {
        store.get({{color, "red"}});
    } catch (const AmbiguousResultError& e) {
        ambiguous = true;
        assert(e.matches() == 2);
    }
    assert(ambiguous);

    assert(!store.find_entity({{color, "green"}}));
    assert(store.find_entity({{color, "blue"}}) == c);

    assert(store.get_which(shape, "round") == (EntitySet{a, c}));

    std::cout << "  PASS" << std::endl;
}

void test_set_algebra() {
    std::cout << "Testing set-algebra equivalence..." << std::endl;

    TripleStore store;
    Predicate p1("p1");
    Predicate p2("p2");
    std::vector<Entity> entities(200);

    std::mt19937 rng(23);
    for (const auto& e : entities) {
        store.insert(e, p1, static_cast<int>(rng() % 4));
        store.insert(e, p2, static_cast<int>(rng() % 5));
        if (rng() % 3 == 0) store.insert(e, p2, static_cast<int>(rng() % 5));
    }

    for (int o1 = 0; o1 < 4; ++o1) {
        for (int o2 = 0; o2 < 5; ++o2) {
            EntitySet both = store.get_all({{p1, o1}, {p2, o2}});
            EntitySet left = store.get_which(p1, o1);
            EntitySet right = store.get_which(p2, o2);

            EntitySet expected;
            for (const auto& e : left) {
                if (right.count(e)) expected.insert(e);
            }
            assert(both == expected);
        }
    }

    std::cout << "  PASS" << std::endl;
}

void test_match_patterns() {
    std::cout << "Testing pattern match..." << std::endl;

    TripleStore store;
    Entity hand("hand");
    Entity ring("ring");
    Entity cup("cup");
    Predicate has("has");
    Predicate sees("sees");
    store.insert(hand, has, ring);
    store.insert(hand, has, cup);
    store.insert(hand, sees, ring);
    store.insert(cup, has, "water");

    auto count = [&](const Pattern& q) { return store.match(q).size(); };

    assert(count({hand, has, Value(ring)}) == 1);
    assert(count({hand, has, Value(hand)}) == 0);
    assert(count({hand, has, std::nullopt}) == 2);
    assert(count({std::nullopt, has, Value(ring)}) == 1);
    assert(count({hand, std::nullopt, Value(ring)}) == 2);
    assert(count({hand, std::nullopt, std::nullopt}) == 3);
    assert(count({std::nullopt, has, std::nullopt}) == 3);
    assert(count({std::nullopt, std::nullopt, Value(ring)}) == 2);
    assert(count({std::nullopt, std::nullopt, Value("water")}) == 1);
    assert(count({}) == 4);

    auto preds = store.predicates(hand, ring);
    assert(preds == (PredicateSet{has, sees}));

    for (const auto& t : store.match({hand, has, std::nullopt})) {
        assert(t.s() == Subject(hand));
        assert(t.p() == has);
        assert(store.contains(t));
    }

    std::cout << "  PASS" << std::endl;
}

void test_end_to_end() {
    std::cout << "Testing end-to-end scenario..." << std::endl;

    TripleStore store;
    Predicate name("name");

    auto created = store.create_subjects_with({{name, {Value("head")}}});
    assert(created.size() == 1);
    Entity e = created.front();

    Attributes attrs = store.attributes_of(e);
    assert(attrs.size() == 1);
    assert(attrs.at(name) == (ValueSet{Value("head")}));

    assert(store.get({{name, "head"}}) == e);

    Entity e2;
    store.set_all(std::vector<Entity>{e2}, store.attributes_of(e));
    assert(store.last_added() == e2);

    auto all = store.triples();
    TripleSet actual(all.begin(), all.end());
    TripleSet expected{Triple(e, name, "head"), Triple(e2, name, "head")};
    assert(actual == expected);

    std::cout << "  PASS" << std::endl;
}

void test_reification() {
    std::cout << "Testing reification scenario..." << std::endl;

    TripleStore store;
    Entity hand("hand");
    Entity ring("ring");
    Predicate has("has");
    Predicate destroyed("destroyed");

    Triple holding(hand, has, ring);
    store.insert(holding);
    store.insert(holding, destroyed, true);

    assert(store.contains(holding));
    assert(store.contains(holding, destroyed, true));
    assert(store.objects(holding, destroyed) == (ValueSet{Value(true)}));

    SubjectSet gone = store.subjects(destroyed, true);
    assert(gone.size() == 1);
    assert(gone.begin()->is_triple());
    assert(*gone.begin()->triple() == holding);

    // get_all returns entities only
    assert(store.get_which(destroyed, true).empty());

    Attributes attrs = store.attributes_of(holding);
    assert(attrs.size() == 1);
    assert(attrs.at(destroyed) == (ValueSet{Value(true)}));

    // A fact about a fact that was never stated
    Triple unknown(ring, has, hand);
    assert(throws<UnknownSubject>([&] { store.insert(unknown, destroyed, true); }));
    assert(!store.contains(unknown, destroyed, true));
    assert(store.size() == 2);

    // Triples may also be objects, without needing to be stored
    Predicate about("about");
    assert(store.insert(hand, about, Value(unknown)));
    assert(store.objects(hand, about).count(Value(unknown)) == 1);

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// Batches
// ═══════════════════════════════════════════════════════════════════════════

void test_create_subjects_with() {
    std::cout << "Testing create_subjects_with..." << std::endl;

    TripleStore store;
    Predicate kind("kind");
    Predicate label("label");

    auto rows = store.create_subjects_with({
        {kind, {Value("finger")}},
        {label, {Value("thumb"), Value("index"), Value("middle")}},
    });
    assert(rows.size() == 3);
    assert(store.size() == 6);
    assert(store.get_which(kind, "finger").size() == 3);
    assert(store.get({{label, "thumb"}}) == rows[0]);
    assert(store.get({{label, "index"}}) == rows[1]);
    assert(store.get({{label, "middle"}}) == rows[2]);
    assert(store.last_added() == rows[2]);

    // Misaligned columns and empty columns are rejected up front
    assert(throws<InvalidArgument>([&] {
        store.create_subjects_with({
            {kind, {Value("a"), Value("b")}},
            {label, {Value("x"), Value("y"), Value("z")}},
        });
    }));
    assert(throws<InvalidArgument>([&] { store.create_subjects_with({{kind, {}}}); }));
    assert(store.size() == 6);

    assert(store.create_subjects_with({}).empty());
    assert(store.size() == 6);

    std::cout << "  PASS" << std::endl;
}

void test_add_all() {
    std::cout << "Testing add_all..." << std::endl;

    TripleStore store;
    Predicate likes("likes");
    std::vector<Entity> people(3);
    std::vector<Value> foods = {Value("tea"), Value("rice")};

    assert(store.add_all(people, foods, likes) == 6);
    for (const auto& person : people) {
        for (const auto& food : foods) {
            assert(store.contains(person, likes, food));
        }
    }
    assert(store.add_all(people, foods, likes) == 0);
    assert(store.size() == 6);

    std::cout << "  PASS" << std::endl;
}

void test_batch_atomicity() {
    std::cout << "Testing batch atomicity..." << std::endl;

    TripleStore store;
    Predicate score("score");
    store.set_check(score, is_integer);
    std::vector<Entity> players(4);

    // One bad object poisons the whole batch
    assert(throws<ValidationError>([&] {
        store.add_all(players, {Value(1), Value("two"), Value(3)}, score);
    }));
    assert(store.empty());

    assert(throws<ValidationError>([&] {
        store.create_subjects_with({{score, {Value(1), Value(2.5)}}});
    }));
    assert(store.empty());

    // Reified subjects must be stored, or earlier in the same batch
    Entity a("a");
    Predicate p("p");
    Predicate flag("flag");
    Triple base(a, p, 1);
    assert(throws<UnknownSubject>([&] {
        store.add_all(std::vector<Subject>{Subject(base)}, {Value(true)}, flag);
    }));
    assert(store.empty());

    Attributes attrs;
    attrs[flag].insert(Value(true));
    store.insert(base);
    assert(store.set_all(std::vector<Subject>{Subject(base)}, attrs) == 1);
    assert(store.contains(base, flag, true));

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// Ambient: dumps, config, concurrency
// ═══════════════════════════════════════════════════════════════════════════

void test_dumps() {
    std::cout << "Testing text and JSON dumps..." << std::endl;

    TripleStore store;
    Entity hand("hand");
    Entity ring("ring");
    Predicate has("has");
    Predicate weight("weight");
    store.insert(hand, has, ring);
    store.insert(ring, weight, 2.5);

    assert(store.str() == "hand has ring\nring weight 2.5\n");

    json j = store.to_json();
    assert(j["name"] == "store");
    assert(j["version"] == TRISTORE_VERSION);
    assert(j["triples"].size() == 2);
    assert(j["triples"][0]["s"]["name"] == "hand");
    assert(j["triples"][0]["p"]["name"] == "has");
    assert(j["triples"][0]["o"]["kind"] == "entity");
    assert(j["triples"][1]["o"]["kind"] == "real");
    assert(j["triples"][1]["o"]["value"] == 2.5);
    assert(j["stats"]["triples"] == 2);

    json t = Triple(hand, has, ring);
    assert(t["s"]["id"] == hand.id().to_string());

    std::cout << "  PASS" << std::endl;
}

void test_config() {
    std::cout << "Testing StoreConfig..." << std::endl;

    StoreConfig defaults;
    assert(defaults.name == "store");
    assert(!defaults.verbose);
    assert(defaults.verify_candidates);
    assert(defaults.reserve_triples == 0);

    setenv("TRISTORE_VERBOSE", "1", 1);
    setenv("TRISTORE_RESERVE", "256", 1);
    StoreConfig env = StoreConfig::from_env();
    assert(env.verbose);
    assert(env.reserve_triples == 256);

    setenv("TRISTORE_VERBOSE", "0", 1);
    setenv("TRISTORE_RESERVE", "lots", 1);
    env = StoreConfig::from_env();
    assert(!env.verbose);
    assert(env.reserve_triples == 0);

    unsetenv("TRISTORE_VERBOSE");
    unsetenv("TRISTORE_RESERVE");

    StoreConfig custom;
    custom.name = "facts";
    custom.reserve_triples = 64;
    custom.verify_candidates = false;
    TripleStore store(custom);
    Entity e;
    Predicate p("p");
    store.insert(e, p, 1);
    assert(store.config().name == "facts");
    assert(store.objects(e, p) == (ValueSet{Value(1)}));

    std::cout << "  PASS" << std::endl;
}

void test_concurrent_readers() {
    std::cout << "Testing concurrent readers and writer..." << std::endl;

    TripleStore store;
    Predicate step("step");
    std::vector<Entity> entities(50);
    std::atomic<bool> done{false};
    std::atomic<int> checks{0};

    std::thread writer([&] {
        for (int i = 0; i < 2000; ++i) {
            store.insert(entities[i % entities.size()], step, i);
        }
        done = true;
    });

    std::vector<std::thread> readers;
    for (int r = 0; r < 3; ++r) {
        readers.emplace_back([&] {
            while (!done) {
                auto snapshot = store.triples();
                for (size_t k = 0; k < snapshot.size(); k += 37) {
                    const auto& t = snapshot[k];
                    assert(store.contains(t));
                    assert(store.objects(t.s(), t.p()).count(t.o()) == 1);
                    checks++;
                }
            }
        });
    }

    writer.join();
    for (auto& t : readers) t.join();

    assert(store.size() == 2000);
    assert(store.subject_count() == entities.size());

    std::cout << "  PASS (" << checks.load() << " reader checks)" << std::endl;
}

int main() {
    std::cout << "=== Tristore Tests ===" << std::endl;
    std::cout << "version " << version::string() << std::endl;
    std::cout << std::endl;

    test_id128();
    test_entity();
    test_entity_round_trip();
    test_predicate();
    test_values();
    test_triple_identity();

    std::cout << std::endl;
    std::cout << "=== Index Engine ===" << std::endl;
    test_insert_and_contains();
    test_term_kinds();
    test_last_added();
    test_index_consistency();
    test_insert_rollback();
    test_composite_entries();
    test_attributes_of();
    test_validation_atomicity();
    test_validation_sources();

    std::cout << std::endl;
    std::cout << "=== Queries and Batches ===" << std::endl;
    test_get_all();
    test_set_algebra();
    test_match_patterns();
    test_end_to_end();
    test_reification();
    test_create_subjects_with();
    test_add_all();
    test_batch_atomicity();

    std::cout << std::endl;
    std::cout << "=== Store ===" << std::endl;
    test_dumps();
    test_config();
    test_concurrent_readers();

    std::cout << std::endl;
    std::cout << "=== All tests passed! ===" << std::endl;
    return 0;
}
