#include <gtest/gtest.h>
#include <cloudconnect/cloudconnect.hpp>

#include <memory>

using namespace cloudconnect;

namespace {

// Minimal resource type used to exercise registration
class Database : public Resource {
public:
    Database(std::string name, std::string engine)
        : Resource(std::move(name), "Database"), engine_(std::move(engine)) {}

    static std::unique_ptr<Resource> from_fields(const std::string& name,
                                                 const FieldBag& fields) {
        return std::make_unique<Database>(name, require_string(fields, "engine"));
    }

    std::string describe() const override { return "Database: engine=" + engine_; }

private:
    std::string engine_;
};

FieldBag database_fields(const std::string& engine) {
    FieldBag f;
    f["engine"] = engine;
    return f;
}

} // anonymous namespace

TEST(ResourceRegistryTest, StartsEmpty) {
    ResourceRegistry registry;
    EXPECT_EQ(registry.size(), 0u);
    EXPECT_TRUE(registry.registered_types().empty());
    EXPECT_FALSE(registry.contains("AppService"));
}

TEST(ResourceRegistryTest, RegisterAndCreate) {
    ResourceRegistry registry;
    registry.register_type("Database", &Database::from_fields);

    EXPECT_TRUE(registry.contains("Database"));
    auto r = registry.create("Database", "db1", database_fields("postgres"));
    ASSERT_NE(r.get(), nullptr);
    EXPECT_EQ(r->name(), "db1");
    EXPECT_EQ(r->type_tag(), "Database");
    EXPECT_NE(r->describe().find("postgres"), std::string::npos);
    EXPECT_EQ(r->state(), ResourceState::Stopped);
}

TEST(ResourceRegistryTest, DuplicateRegistrationIsRejectedNotOverwritten) {
    ResourceRegistry registry;
    registry.register_type("Database", &Database::from_fields);

    bool replacement_called = false;
    ResourceRegistry::Factory replacement =
        [&](const std::string& name, const FieldBag&) -> std::unique_ptr<Resource> {
            replacement_called = true;
            return std::make_unique<Database>(name, "other");
        };
    EXPECT_THROW(registry.register_type("Database", replacement), DuplicateTypeError);

    auto r = registry.create("Database", "db1", database_fields("mysql"));
    EXPECT_FALSE(replacement_called);
    EXPECT_EQ(r->describe(), "Database: engine=mysql");
    EXPECT_EQ(registry.size(), 1u);
}

TEST(ResourceRegistryTest, UnknownTypeIsRejected) {
    ResourceRegistry registry;
    try {
        registry.create("Unregistered", "x", {});
        FAIL() << "expected UnknownTypeError";
    } catch (const UnknownTypeError& e) {
        EXPECT_EQ(e.type_name(), "Unregistered");
        EXPECT_EQ(e.kind(), ErrorKind::UnknownType);
    }
}

TEST(ResourceRegistryTest, FactoryValidationErrorPropagates) {
    ResourceRegistry registry;
    registry.register_type("Database", &Database::from_fields);
    EXPECT_THROW(registry.create("Database", "db1", {}), ValidationError);
}

TEST(ResourceRegistryTest, RegisteredTypesKeepRegistrationOrder) {
    ResourceRegistry registry;
    registry.register_type("Zeta", &Database::from_fields);
    registry.register_type("Alpha", &Database::from_fields);
    registry.register_type("Mid", &Database::from_fields);

    std::vector<std::string> expected{"Zeta", "Alpha", "Mid"};
    EXPECT_EQ(registry.registered_types(), expected);
}

TEST(ResourceRegistryTest, EmptyFactoryIsRejected) {
    ResourceRegistry registry;
    EXPECT_THROW(registry.register_type("Nothing", ResourceRegistry::Factory{}),
                 std::invalid_argument);
    EXPECT_FALSE(registry.contains("Nothing"));
}

TEST(ResourceRegistryTest, BuiltinTypes) {
    ResourceRegistry registry;
    register_builtin_types(registry);

    std::vector<std::string> expected{"AppService", "StorageAccount", "CacheDB"};
    EXPECT_EQ(registry.registered_types(), expected);
}

TEST(ResourceRegistryTest, GlobalRegistryHasBuiltinTypes) {
    auto& global = ResourceRegistry::global();
    EXPECT_TRUE(global.contains("AppService"));
    EXPECT_TRUE(global.contains("StorageAccount"));
    EXPECT_TRUE(global.contains("CacheDB"));
    EXPECT_EQ(&global, &ResourceRegistry::global());
}

TEST(ResourceRegistryTest, GlobalRegistryRejectsBuiltinReRegistration) {
    EXPECT_THROW(register_builtin_types(ResourceRegistry::global()), DuplicateTypeError);
}
