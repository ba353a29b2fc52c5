#include "test_utils.hpp"

#include <iostream>

#include "schema/consistency_checker.hpp"

using namespace schemalint;
using namespace schemalint::test;

static SchemaErrorKind check_fails(const Schema& schema) {
    ConsistencyChecker checker;
    auto error = expect_throw<SchemaError>([&] { checker.check(schema); });
    return error.kind();
}

// orders.user_id -> users.id
static TableSpec orders_table() {
    TableSpec orders = make_table("orders", {{"id", int_type(), true},
                                             {"user_id", int_type(), true},
                                             {"note", string_type(), false}});
    orders.primary_key = Column{"id"};
    orders.foreign_keys.push_back(ForeignKeyMapping{Column{"user_id"}, "users", Column{"id"}});
    return orders;
}

static void test_valid_schema_is_annotated() {
    TableSpec pairs = make_table("pairs", {{"note", string_type(), false},
                                           {"b", int_type(), true},
                                           {"a", string_type(), true}});
    pairs.primary_key = Column{"a", "b"};
    pairs.unique_columns.push_back(Column{"note"});

    ConsistencyChecker checker;
    const AnnotatedSchema checked = checker.check({users_table(), orders_table(), pairs});
    assert(checked.size() == 3);

    // schema order is preserved
    auto it = checked.begin();
    assert(it->spec.name == "users");
    assert((++it)->spec.name == "orders");
    assert((++it)->spec.name == "pairs");

    assert(checked.at("users").primary_key_indices == std::vector<std::size_t>{0});
    // indices follow key order, not column order
    assert((checked.at("pairs").primary_key_indices == std::vector<std::size_t>{2, 1}));
    assert(checked.find("missing") == nullptr);
}

static void test_table_without_primary_key_is_legal() {
    ConsistencyChecker checker;
    const AnnotatedSchema checked = checker.check({make_table("log", {{"line", string_type(), false}})});
    assert(checked.at("log").primary_key_indices.empty());
}

static void test_table_names() {
    assert(check_fails({users_table(), users_table()}) == SchemaErrorKind::DUPLICATE_TABLE);
    assert(check_fails({make_table("", {{"a", int_type(), false}})}) == SchemaErrorKind::EMPTY_TABLE_NAME);

    // duplicate table names are reported before anything inside a table
    TableSpec broken = make_table("users", {{"a", int_type(), false}, {"a", int_type(), false}});
    auto error = expect_throw<SchemaError>([&] { ConsistencyChecker().check({broken, users_table()}); });
    assert(error.kind() == SchemaErrorKind::DUPLICATE_TABLE);
    assert(contains(error.what(), "'users'"));
}

static void test_column_names() {
    TableSpec dup = make_table("t", {{"a", int_type(), false}, {"a", string_type(), false}});
    auto error = expect_throw<SchemaError>([&] { ConsistencyChecker().check({dup}); });
    assert(error.kind() == SchemaErrorKind::DUPLICATE_COLUMN);
    assert(error.table() == "t");
    assert(contains(error.what(), "'t'.'a'"));

    assert(check_fails({make_table("t", {{"", int_type(), false}})}) == SchemaErrorKind::EMPTY_COLUMN_NAME);
}

static void test_key_resolution() {
    TableSpec pk = make_table("t", {{"a", int_type(), false}});
    pk.primary_key = Column{"a", "b"};
    assert(check_fails({pk}) == SchemaErrorKind::UNRESOLVED_PRIMARY_KEY);

    TableSpec unique = make_table("t", {{"a", int_type(), false}});
    unique.unique_columns.push_back(Column{"a"});
    unique.unique_columns.push_back(Column{"a", "zz"});
    auto error = expect_throw<SchemaError>([&] { ConsistencyChecker().check({unique}); });
    assert(error.kind() == SchemaErrorKind::UNRESOLVED_UNIQUE_COLUMN);
    assert(contains(error.what(), "'zz'"));
}

static void test_foreign_keys() {
    // forward reference: orders comes before users
    ConsistencyChecker().check({orders_table(), users_table()});

    // a. arity
    TableSpec arity = orders_table();
    arity.foreign_keys[0].local_column = Column{"user_id", "note"};
    assert(check_fails({users_table(), arity}) == SchemaErrorKind::FOREIGN_KEY_ARITY);

    // b. unknown table
    TableSpec unknown = orders_table();
    unknown.foreign_keys[0].foreign_table = "people";
    assert(check_fails({users_table(), unknown}) == SchemaErrorKind::UNRESOLVED_FOREIGN_TABLE);

    // c. foreign table without primary key
    TableSpec keyless = users_table();
    keyless.primary_key.reset();
    assert(check_fails({keyless, orders_table()}) == SchemaErrorKind::FOREIGN_TABLE_WITHOUT_PRIMARY_KEY);

    // d. not the primary key
    TableSpec by_name = orders_table();
    by_name.foreign_keys[0].foreign_column = Column{"name"};
    assert(check_fails({users_table(), by_name}) == SchemaErrorKind::FOREIGN_COLUMN_NOT_PRIMARY_KEY);

    // e. unresolved local column
    TableSpec local = orders_table();
    local.foreign_keys[0].local_column = Column{"customer_id"};
    assert(check_fails({users_table(), local}) == SchemaErrorKind::UNRESOLVED_LOCAL_COLUMN);

    // e. unresolved foreign column: the key names a column the table lacks
    TableSpec ghost_key = make_table("ghosts", {{"id", int_type(), true}});
    ghost_key.primary_key = Column{"gid"};
    TableSpec haunted = make_table("haunted", {{"gid", int_type(), false}});
    haunted.foreign_keys.push_back(ForeignKeyMapping{Column{"gid"}, "ghosts", Column{"gid"}});
    assert(check_fails({haunted, ghost_key}) == SchemaErrorKind::UNRESOLVED_FOREIGN_COLUMN);
}

static void test_foreign_key_order_is_significant() {
    TableSpec target = make_table("target", {{"a", int_type(), true}, {"b", int_type(), true}});
    target.primary_key = Column{"a", "b"};

    TableSpec ref = make_table("ref", {{"x", int_type(), false}, {"y", int_type(), false}});
    ref.foreign_keys.push_back(ForeignKeyMapping{Column{"x", "y"}, "target", Column{"a", "b"}});
    ConsistencyChecker().check({target, ref});

    // same set of columns, different order
    ref.foreign_keys[0].foreign_column = Column{"b", "a"};
    assert(check_fails({target, ref}) == SchemaErrorKind::FOREIGN_COLUMN_NOT_PRIMARY_KEY);
}

static void test_foreign_key_types() {
    TableSpec users = make_table("users", {{"id", string_type(), true}});
    users.primary_key = Column{"id"};
    TableSpec orders = make_table("orders", {{"user_id", int_type(), false}});
    orders.foreign_keys.push_back(ForeignKeyMapping{Column{"user_id"}, "users", Column{"id"}});

    auto error = expect_throw<SchemaError>([&] { ConsistencyChecker().check({users, orders}); });
    assert(error.kind() == SchemaErrorKind::FOREIGN_KEY_TYPE_MISMATCH);
    assert(error.table() == "orders");
    assert(contains(error.what(), "(int)"));
    assert(contains(error.what(), "(string)"));

    // dates only match with the same layout
    TableSpec days = make_table("days", {{"day", date_type("%Y-%m-%d"), true}});
    days.primary_key = Column{"day"};
    TableSpec events = make_table("events", {{"day", date_type("%d/%m/%Y"), false}});
    events.foreign_keys.push_back(ForeignKeyMapping{Column{"day"}, "days", Column{"day"}});
    assert(check_fails({days, events}) == SchemaErrorKind::FOREIGN_KEY_TYPE_MISMATCH);
    events.columns[0].type = date_type("%Y-%m-%d");
    ConsistencyChecker().check({days, events});
}

static void test_first_violation_wins() {
    // the first table's foreign key problem is reported, not the second table's duplicate column
    TableSpec first = orders_table();
    first.foreign_keys[0].foreign_table = "nowhere";
    TableSpec second = make_table("second", {{"c", int_type(), false}, {"c", int_type(), false}});
    assert(check_fails({first, second, users_table()}) == SchemaErrorKind::UNRESOLVED_FOREIGN_TABLE);
}

int main() {
    test_valid_schema_is_annotated();
    test_table_without_primary_key_is_legal();
    test_table_names();
    test_column_names();
    test_key_resolution();
    test_foreign_keys();
    test_foreign_key_order_is_significant();
    test_foreign_key_types();
    test_first_violation_wins();
    std::cout << "All consistency checker tests passed.\n";
    return 0;
}
