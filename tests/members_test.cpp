// Typed elements: type resolution, properties, parameters, methods.
#include <gtest/gtest.h>
#include <metamodel/metamodel.hpp>

using namespace metamodel;

TEST(TypedElementTest, TypeNamesResolveToPrimitives)
{
    Arena arena;
    auto& pages = arena.make<Property>("pages", "int");
    auto& title = arena.make<Property>("title", "string");
    EXPECT_EQ(pages.type(), integer_type());
    EXPECT_EQ(title.type(), string_type());
}

TEST(TypedElementTest, UnknownTypeNameBecomesPlainType)
{
    Arena arena;
    auto& owner = arena.make<Property>("owner", "Customer");
    ASSERT_NE(owner.type(), nullptr);
    EXPECT_EQ(owner.type()->name(), "Customer");
    EXPECT_EQ(dynamic_cast<PrimitiveDataType*>(owner.type()), nullptr);
    EXPECT_EQ(dynamic_cast<Class*>(owner.type()), nullptr);

    // Each reference gets its own type object.
    auto& other = arena.make<Property>("other", "Customer");
    EXPECT_NE(owner.type(), other.type());
}

TEST(TypedElementTest, NullTypeIsRejectedAndKeepsPreviousType)
{
    Arena arena;
    auto& pages = arena.make<Property>("pages", "int");
    EXPECT_THROW(pages.set_type(static_cast<Type*>(nullptr)), InvalidValue);
    EXPECT_EQ(pages.type(), integer_type());

    auto& book = arena.make<Class>("Book");
    pages.set_type(&book);
    EXPECT_EQ(pages.type(), &book);
    pages.set_type(std::string("float"));
    EXPECT_EQ(pages.type(), float_type());
}

TEST(TypedElementTest, ReassigningOwnAdHocTypeKeepsItAlive)
{
    Arena arena;
    auto& balance = arena.make<Property>("balance", "Money");
    Type* money = balance.type();
    balance.set_type(money);
    ASSERT_EQ(balance.type(), money);
    EXPECT_EQ(balance.type()->name(), "Money");

    balance.set_type(balance.type());
    EXPECT_EQ(balance.type()->name(), "Money");
}

TEST(TypedElementTest, AdHocTypeHandedToAnotherElementOutlivesFirstHolder)
{
    Arena arena;
    auto& balance = arena.make<Property>("balance", "Money");
    auto& total = arena.make<Parameter>("total", balance.type());
    auto& refund = arena.make<Property>("refund", "int");
    refund.set_type(balance.type());

    balance.set_type(std::string("int"));
    EXPECT_EQ(balance.type(), integer_type());
    ASSERT_NE(total.type(), nullptr);
    EXPECT_EQ(total.type()->name(), "Money");
    EXPECT_EQ(refund.type(), total.type());

    total.set_type(std::string("float"));
    EXPECT_EQ(refund.type()->name(), "Money");
}

TEST(PropertyTest, Defaults)
{
    Arena arena;
    auto& p = arena.make<Property>("name", "str");
    EXPECT_EQ(p.multiplicity(), Multiplicity(1, 1));
    EXPECT_EQ(p.visibility(), Visibility::Public);
    EXPECT_FALSE(p.is_composite());
    EXPECT_TRUE(p.is_navigable());
    EXPECT_FALSE(p.is_id());
    EXPECT_FALSE(p.is_read_only());
    EXPECT_EQ(p.owner(), nullptr);
}

TEST(PropertyTest, FlagsAndMultiplicityAreMutable)
{
    Arena arena;
    auto& p = arena.make<Property>("tags", "str", Multiplicity(0, "*"), Visibility::Private);
    EXPECT_TRUE(p.multiplicity().is_unbounded());
    EXPECT_EQ(p.visibility(), Visibility::Private);

    p.set_id(true);
    p.set_read_only(true);
    p.set_navigable(false);
    p.set_composite(true);
    EXPECT_TRUE(p.is_id());
    EXPECT_TRUE(p.is_read_only());
    EXPECT_FALSE(p.is_navigable());
    EXPECT_TRUE(p.is_composite());

    p.multiplicity().set_max(3);
    EXPECT_EQ(p.multiplicity().to_string(), "0..3");
    p.set_multiplicity(Multiplicity(1, 2));
    EXPECT_EQ(p.multiplicity().min(), 1);
}

TEST(PropertyTest, DataTypeCannotOwnProperty)
{
    Arena arena;
    auto& literal = arena.make<EnumerationLiteral>("Low");
    auto& level = arena.make<Enumeration>("Level", ElementSet<EnumerationLiteral>{ &literal });
    auto& p = arena.make<Property>("value", "int");

    EXPECT_THROW(p.set_owner(&level), InvalidOwner);
    EXPECT_THROW(p.set_owner(integer_type()), InvalidOwner);
    EXPECT_EQ(p.owner(), nullptr);

    auto& cls = arena.make<Class>("Sensor");
    p.set_owner(&cls);
    EXPECT_EQ(p.owner(), &cls);
}

TEST(MethodTest, DefaultsToOclVoidReturnType)
{
    Arena arena;
    auto& m = arena.make<Method>("refresh");
    ASSERT_NE(m.type(), nullptr);
    EXPECT_EQ(m.type()->name(), "OclVoid");
    EXPECT_TRUE(m.parameters().empty());
    EXPECT_FALSE(m.is_abstract());
    EXPECT_TRUE(m.code().empty());
}

TEST(MethodTest, ParametersMustHaveDistinctNames)
{
    Arena arena;
    auto& amount = arena.make<Parameter>("amount", "int", std::string("1"));
    auto& other = arena.make<Parameter>("amount", "float");
    auto& reason = arena.make<Parameter>("reason", "str");
    auto& m = arena.make<Method>("heal", ElementSet<Parameter>{ &amount });

    ASSERT_TRUE(amount.default_value().has_value());
    EXPECT_EQ(*amount.default_value(), "1");
    EXPECT_FALSE(reason.default_value().has_value());

    EXPECT_THROW(m.add_parameter(other), DuplicateName);
    ElementSet<Parameter> clash{ &amount, &other };
    EXPECT_THROW(m.set_parameters(clash), DuplicateName);
    EXPECT_EQ(m.parameters().size(), 1u);

    m.add_parameter(reason);
    EXPECT_EQ(m.parameter("reason"), &reason);
    EXPECT_EQ(m.parameter("missing"), nullptr);
}

TEST(MethodTest, DataTypeCannotOwnMethod)
{
    Arena arena;
    auto& m = arena.make<Method>("describe", ElementSet<Parameter>{}, std::string("str"));
    EXPECT_EQ(m.type(), string_type());
    EXPECT_THROW(m.set_owner(string_type()), InvalidOwner);

    m.set_abstract(true);
    m.set_code("return self.name");
    EXPECT_TRUE(m.is_abstract());
    EXPECT_EQ(m.code(), "return self.name");
}
