#include <model_samples/samples.hpp>
#include <metamodel/metamodel.hpp>
#include <initializer_list>
#include <string>

namespace model_samples {

using namespace metamodel;

DomainModel& make_game_model(Arena& arena) {
    auto& model = arena.make<DomainModel>("RPG roguelike classes");

    auto prop = [&](const char* name, const char* type) -> Property* {
        return &arena.make<Property>(name, type);
    };
    auto add_class =
        [&](const char* name,
            std::initializer_list<const char*> parents,
            std::initializer_list<Property*> attributes,
            bool is_abstract = false) -> Class&
    {
        auto& cl = arena.make<Class>(name, ElementSet<Property>(attributes.begin(), attributes.end()),
            ElementSet<Method>{}, is_abstract);
        model.add_type(cl);
        for (const char* parent : parents)
            model.add_generalization(arena.make<Generalization>(model.get_class_by_name(parent), &cl));
        return cl;
    };
    // Whole-part link: `owner` holds `part` under `role`.
    auto compose = [&](Class& owner, Class& part, const char* role) {
        auto& whole_end = arena.make<Property>(owner.name() + "_owner", &owner, Multiplicity(1, 1));
        whole_end.set_composite(true);
        auto& part_end = arena.make<Property>(role, &part, Multiplicity(1, 1));
        model.add_association(arena.make<BinaryAssociation>(owner.name() + "_" + role,
            ElementSet<Property>{ &whole_end, &part_end }));
    };
    // Plain reference from `from` to any number of `to` instances.
    auto refer = [&](Class& from, Class& to, const char* role, Multiplicity multiplicity) {
        auto& from_end = arena.make<Property>(from.name() + "_" + role + "_source", &from, Multiplicity(0, "*"));
        from_end.set_navigable(false);
        auto& to_end = arena.make<Property>(role, &to, multiplicity);
        model.add_association(arena.make<BinaryAssociation>(from.name() + "_" + role,
            ElementSet<Property>{ &from_end, &to_end }));
    };

    auto& rarity = arena.make<Enumeration>("Rarity", ElementSet<EnumerationLiteral>{
        &arena.make<EnumerationLiteral>("common"),
        &arena.make<EnumerationLiteral>("rare"),
        &arena.make<EnumerationLiteral>("epic") });
    model.add_type(rarity);

    auto* object_id = prop("id", "int");
    object_id->set_id(true);
    auto& game_object = add_class("GameObject", {}, { object_id, prop("name", "string"), prop("enabled", "bool") }, true);
    auto& entity = add_class("Entity", {"GameObject"}, { prop("active", "bool"), prop("layer", "int"), prop("zIndex", "int") });
    auto& character = add_class("Character", {"Entity"},
        { prop("health", "int"), prop("maxHealth", "int"), prop("speed", "float"), prop("level", "int") }, true);

    // Mixin classes for multiple inheritance.
    add_class("Serializable", {}, { prop("serializeVersion", "int") }, true);
    add_class("Saveable", {}, { prop("saveSlot", "int") }, true);

    auto& player = add_class("Player", {"Character", "Serializable", "Saveable"},
        { prop("experience", "int"), prop("playerName", "string"), prop("classType", "string") });
    auto& enemy = add_class("Enemy", {"Character"},
        { prop("aggroRadius", "float"), prop("expReward", "int"), prop("lootChance", "float") });
    auto& melee_enemy = add_class("MeleeEnemy", {"Enemy"},
        { prop("attackDamage", "int"), prop("attackRange", "float"), prop("attackSpeed", "float") });
    auto& ranged_enemy = add_class("RangedEnemy", {"Enemy"},
        { prop("projectileType", "string"), prop("fireRate", "float"), prop("range", "float") });
    add_class("NPC", {"Character"}, { prop("dialogue", "string"), prop("shopEnabled", "bool"), prop("questId", "string") });

    auto& item = add_class("Item", {"Entity"},
        { prop("stackable", "bool"), prop("maxStack", "int"), &arena.make<Property>("rarity", &rarity),
          prop("value", "int"), prop("weight", "float") });
    add_class("Weapon", {"Item"}, { prop("damage", "int"), prop("durability", "int"), prop("damageType", "string") });
    add_class("Sword", {"Weapon"}, { prop("slashDamage", "int"), prop("parryChance", "float") });
    add_class("Bow", {"Weapon"}, { prop("drawSpeed", "float"), prop("projectileSpeed", "float"), prop("ammoType", "string") });
    auto& container = add_class("Container", {"Entity"},
        { prop("maxSlots", "int"), prop("maxWeight", "float"), prop("sortable", "bool") });

    auto& tile = add_class("Tile", {"GameObject"}, { prop("walkable", "bool"), prop("tileset", "string"), prop("tileIndex", "int") });
    auto& floor_tile = add_class("FloorTile", {"Tile"}, { prop("hasTrap", "bool"), prop("trapDamage", "int") });
    auto& door_tile = add_class("DoorTile", {"Tile"}, { prop("locked", "bool"), prop("keyId", "string"), prop("autoClose", "bool") });

    auto& ui_element = add_class("UIElement", {"GameObject"},
        { prop("visible", "bool"), prop("zOrder", "int"), prop("anchor", "string"), prop("opacity", "float") }, true);
    auto& health_bar = add_class("HealthBar", {"UIElement"}, { prop("barColor", "string"), prop("showText", "bool") });
    auto& inventory_slot = add_class("InventorySlot", {"UIElement"}, { prop("slotIndex", "int"), prop("acceptType", "string") });
    auto& level = add_class("Level", {"GameObject"},
        { prop("width", "int"), prop("height", "int"), prop("difficulty", "int"), prop("seed", "int") });

    // Components become composite parts.
    auto& transform = add_class("Transform", {}, { prop("x", "float"), prop("y", "float"), prop("rotation", "float") });
    auto& stats = add_class("StatsComponent", {}, { prop("strength", "int"), prop("dexterity", "int"), prop("intelligence", "int") });
    auto& ai = add_class("AIController", {}, { prop("behaviorTree", "string") });
    compose(game_object, transform, "transform");
    compose(character, stats, "stats");
    compose(enemy, ai, "ai");

    // Child objects become references.
    refer(character, health_bar, "statusBar", Multiplicity(0, 1));
    refer(player, container, "inventory", Multiplicity(1, 1));
    refer(container, inventory_slot, "slot", Multiplicity(0, "*"));
    refer(enemy, container, "lootContainer", Multiplicity(0, 1));
    refer(level, door_tile, "entrance", Multiplicity(1, 1));
    refer(level, door_tile, "exit", Multiplicity(1, 1));

    auto& neighbours = arena.make<Property>("neighbours", &tile, Multiplicity(0, 8));
    auto& neighbour_of = arena.make<Property>("neighbourOf", &tile, Multiplicity(0, 8));
    model.add_association(arena.make<BinaryAssociation>("Tile_neighbours",
        ElementSet<Property>{ &neighbours, &neighbour_of }));

    auto* heal_amount = &arena.make<Parameter>("amount", "int", std::string("1"));
    auto& heal = arena.make<Method>("heal", ElementSet<Parameter>{ heal_amount });
    heal.set_code("health = min(health + amount, maxHealth)");
    character.add_method(heal);
    auto& attack = arena.make<Method>("attack", ElementSet<Parameter>{ &arena.make<Parameter>("target", &character) },
        "int", Visibility::Public, true);
    character.add_method(attack);

    model.add_package(arena.make<Package>("world", ElementSet<Class>{ &tile, &floor_tile, &door_tile, &level }));
    model.add_package(arena.make<Package>("ui", ElementSet<Class>{ &ui_element, &health_bar, &inventory_slot }));

    // Every enemy is of exactly one kind or of none.
    ElementSet<Generalization> enemy_kinds;
    for (Class* kind : { &melee_enemy, &ranged_enemy })
        for (Generalization* g : kind->generalizations())
            if (g->general() == &enemy) enemy_kinds.insert(g);
    model.add_generalization_set(arena.make<GeneralizationSet>("enemy_kinds", enemy_kinds, true, false));

    model.add_constraint(arena.make<Constraint>("health_within_bounds", &character,
        "context Character inv: self.health >= 0 and self.health <= self.maxHealth", "OCL"));
    model.add_constraint(arena.make<Constraint>("item_weight_positive", &item,
        "context Item inv: self.weight > 0", "OCL"));

    return model;
}

} // namespace model_samples
