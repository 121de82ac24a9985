// Class attribute/method integrity and derived queries.
#include <gtest/gtest.h>
#include <metamodel/metamodel.hpp>

using namespace metamodel;

TEST(ClassTest, AttributesAreOwnedByTheirClass)
{
    Arena arena;
    auto& isbn = arena.make<Property>("isbn", "str", Multiplicity(1, 1), Visibility::Public,
        false, true, true);
    auto& title = arena.make<Property>("title", "str");
    auto& book = arena.make<Class>("Book", ElementSet<Property>{ &isbn, &title });

    EXPECT_EQ(isbn.owner(), &book);
    EXPECT_EQ(title.owner(), &book);
    EXPECT_EQ(book.attribute("title"), &title);
    EXPECT_EQ(book.id_attribute(), &isbn);
    EXPECT_FALSE(book.is_abstract());
}

TEST(ClassTest, DuplicateAttributeNameIsRejected)
{
    Arena arena;
    auto& title = arena.make<Property>("title", "str");
    auto& again = arena.make<Property>("title", "int");
    auto& book = arena.make<Class>("Book", ElementSet<Property>{ &title });

    EXPECT_THROW(book.add_attribute(again), DuplicateName);
    EXPECT_EQ(book.attributes().size(), 1u);
    EXPECT_EQ(again.owner(), nullptr);

    ElementSet<Property> clash{ &title, &again };
    EXPECT_THROW(book.set_attributes(clash), DuplicateName);
    EXPECT_EQ(book.attributes().size(), 1u);
}

TEST(ClassTest, AtMostOneIdAttribute)
{
    Arena arena;
    auto& isbn = arena.make<Property>("isbn", "str");
    auto& code = arena.make<Property>("code", "str");
    isbn.set_id(true);
    code.set_id(true);

    ElementSet<Property> both{ &isbn, &code };
    EXPECT_THROW(arena.make<Class>("Book", both), MultipleIdentifiers);

    auto& book = arena.make<Class>("Book", ElementSet<Property>{ &isbn });
    EXPECT_THROW(book.add_attribute(code), MultipleIdentifiers);
    EXPECT_THROW(book.set_attributes(both), MultipleIdentifiers);
    EXPECT_EQ(book.attributes().size(), 1u);
    EXPECT_EQ(book.id_attribute(), &isbn);
}

TEST(ClassTest, AttributeLeftOutOfReplacementKeepsItsOwner)
{
    Arena arena;
    auto& title = arena.make<Property>("title", "str");
    auto& pages = arena.make<Property>("pages", "int");
    auto& book = arena.make<Class>("Book", ElementSet<Property>{ &title, &pages });

    auto remaining = book.attributes();
    remaining.erase(&title);
    book.set_attributes(remaining);

    EXPECT_EQ(book.attributes().count(&title), 0u);
    EXPECT_EQ(book.attributes().count(&pages), 1u);
    EXPECT_EQ(title.owner(), &book);
}

TEST(ClassTest, MethodsAreOwnedAndUniquelyNamed)
{
    Arena arena;
    auto& find = arena.make<Method>("find");
    auto& find_again = arena.make<Method>("find");
    auto& close = arena.make<Method>("close");
    auto& library = arena.make<Class>("Library", ElementSet<Property>{}, ElementSet<Method>{ &find });

    EXPECT_EQ(find.owner(), &library);
    EXPECT_THROW(library.add_method(find_again), DuplicateName);
    ElementSet<Method> clash{ &find, &find_again };
    EXPECT_THROW(library.set_methods(clash), DuplicateName);

    library.add_method(close);
    EXPECT_EQ(library.method("close"), &close);
    EXPECT_EQ(close.owner(), &library);
    EXPECT_EQ(library.methods().size(), 2u);
}

TEST(ClassTest, AllAttributesIncludesAncestors)
{
    Arena arena;
    auto& name = arena.make<Property>("name", "str");
    auto& email = arena.make<Property>("email", "str");
    auto& bio = arena.make<Property>("bio", "str");
    auto& person = arena.make<Class>("Person", ElementSet<Property>{ &name }, ElementSet<Method>{}, true);
    auto& author = arena.make<Class>("Author", ElementSet<Property>{ &email });
    auto& poet = arena.make<Class>("Poet", ElementSet<Property>{ &bio });
    arena.make<Generalization>(&person, &author);
    arena.make<Generalization>(&author, &poet);

    EXPECT_TRUE(person.is_abstract());
    EXPECT_EQ(poet.all_attributes(), (ElementSet<Property>{ &name, &email, &bio }));
    EXPECT_EQ(poet.inherited_attributes(), (ElementSet<Property>{ &name, &email }));
    EXPECT_EQ(person.all_attributes(), (ElementSet<Property>{ &name }));
}

TEST(ClassTest, SameNamedAttributesOfDifferentClassesAllAppear)
{
    Arena arena;
    auto& parent_name = arena.make<Property>("name", "str");
    auto& child_name = arena.make<Property>("name", "str");
    auto& parent = arena.make<Class>("Parent", ElementSet<Property>{ &parent_name });
    auto& child = arena.make<Class>("Child", ElementSet<Property>{ &child_name });
    arena.make<Generalization>(&parent, &child);

    EXPECT_EQ(child.all_attributes().size(), 2u);
}

TEST(ClassTest, AssociationEndsPointAwayFromTheClass)
{
    Arena arena;
    auto& library = arena.make<Class>("Library");
    auto& book = arena.make<Class>("Book");
    auto& located_in = arena.make<Property>("locatedIn", &library);
    auto& has = arena.make<Property>("has", &book, Multiplicity(0, "*"));
    arena.make<BinaryAssociation>("lib_book", ElementSet<Property>{ &located_in, &has });

    EXPECT_EQ(book.association_ends(), (ElementSet<Property>{ &located_in }));
    EXPECT_EQ(library.association_ends(), (ElementSet<Property>{ &has }));
}

TEST(ClassTest, SelfAssociationReturnsBothEnds)
{
    Arena arena;
    auto& tile = arena.make<Class>("Tile");
    auto& neighbours = arena.make<Property>("neighbours", &tile, Multiplicity(0, 8));
    auto& neighbour_of = arena.make<Property>("neighbourOf", &tile, Multiplicity(0, 8));
    arena.make<BinaryAssociation>("Tile_neighbours", ElementSet<Property>{ &neighbours, &neighbour_of });

    EXPECT_EQ(tile.association_ends(), (ElementSet<Property>{ &neighbours, &neighbour_of }));
}

TEST(ClassTest, AllAssociationEndsIncludesInheritedEnds)
{
    Arena arena;
    auto& person = arena.make<Class>("Person");
    auto& author = arena.make<Class>("Author");
    auto& address = arena.make<Class>("Address");
    auto& lives_at = arena.make<Property>("livesAt", &address);
    auto& resident = arena.make<Property>("resident", &person);
    arena.make<BinaryAssociation>("person_address", ElementSet<Property>{ &lives_at, &resident });
    arena.make<Generalization>(&person, &author);

    EXPECT_TRUE(author.association_ends().empty());
    EXPECT_EQ(author.all_association_ends(), (ElementSet<Property>{ &lives_at }));
}

TEST(AssociationClassTest, RequiresAnAssociation)
{
    Arena arena;
    auto& student = arena.make<Class>("Student");
    auto& course = arena.make<Class>("Course");
    auto& attends = arena.make<Property>("attends", &course);
    auto& attendee = arena.make<Property>("attendee", &student);
    auto& enrolment = arena.make<Association>("enrolment", ElementSet<Property>{ &attends, &attendee });
    auto& grade = arena.make<Property>("grade", "float");

    ElementSet<Property> attributes{ &grade };
    EXPECT_THROW(arena.make<AssociationClass>("Enrolment", attributes, nullptr), InvalidValue);

    auto& record = arena.make<AssociationClass>("Enrolment", attributes, &enrolment);
    EXPECT_EQ(record.association(), &enrolment);
    EXPECT_EQ(grade.owner(), &record);
    EXPECT_THROW(record.set_association(nullptr), InvalidValue);
    EXPECT_EQ(record.association(), &enrolment);
}
