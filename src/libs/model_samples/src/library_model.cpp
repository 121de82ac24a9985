#include <model_samples/samples.hpp>
#include <metamodel/metamodel.hpp>

namespace model_samples {

using namespace metamodel;

DomainModel& make_library_model(Arena& arena) {
    auto& genre = arena.make<Enumeration>("Genre", ElementSet<EnumerationLiteral>{
        &arena.make<EnumerationLiteral>("Fiction"),
        &arena.make<EnumerationLiteral>("Poetry"),
        &arena.make<EnumerationLiteral>("History") });

    auto& library = arena.make<Class>("Library", ElementSet<Property>{
        &arena.make<Property>("name", "str"),
        &arena.make<Property>("address", "str") });

    auto& isbn = arena.make<Property>("isbn", "str");
    isbn.set_id(true);
    auto& book = arena.make<Class>("Book", ElementSet<Property>{
        &isbn,
        &arena.make<Property>("title", "str"),
        &arena.make<Property>("pages", "int"),
        &arena.make<Property>("release", "datetime"),
        &arena.make<Property>("genre", &genre) });

    auto& person = arena.make<Class>("Person", ElementSet<Property>{
        &arena.make<Property>("name", "str") }, ElementSet<Method>{}, true);
    auto& author = arena.make<Class>("Author", ElementSet<Property>{
        &arena.make<Property>("email", "str") });
    auto& author_is_person = arena.make<Generalization>(&person, &author);

    auto& located_in = arena.make<Property>("locatedIn", &library, Multiplicity(1, 1));
    auto& has = arena.make<Property>("has", &book, Multiplicity(0, "*"));
    auto& lib_book = arena.make<BinaryAssociation>("lib_book", ElementSet<Property>{ &located_in, &has });

    auto& publishes = arena.make<Property>("publishes", &book, Multiplicity(0, "*"));
    auto& writed_by = arena.make<Property>("writedBy", &author, Multiplicity(1, "*"));
    auto& book_author = arena.make<BinaryAssociation>("book_author", ElementSet<Property>{ &publishes, &writed_by });

    auto& title = arena.make<Parameter>("title", "str");
    auto& find_book = arena.make<Method>("find_book", ElementSet<Parameter>{ &title }, &book);
    library.add_method(find_book);

    auto& catalogue = arena.make<Package>("catalogue", ElementSet<Class>{ &library, &book });
    auto& pages_positive = arena.make<Constraint>("book_pages_positive", &book,
        "context Book inv: self.pages > 0", "OCL");

    return arena.make<DomainModel>("Library_model",
        ElementSet<Type>{ &genre, &library, &book, &person, &author },
        ElementSet<Association>{ &lib_book, &book_author },
        ElementSet<Generalization>{ &author_is_person },
        ElementSet<Package>{ &catalogue },
        ElementSet<Constraint>{ &pages_positive });
}

std::vector<std::string> sample_names() {
    return { "library", "game" };
}

DomainModel* make_sample_model(const std::string& name, Arena& arena) {
    if (name == "library") return &make_library_model(arena);
    if (name == "game") return &make_game_model(arena);
    return nullptr;
}

} // namespace model_samples
