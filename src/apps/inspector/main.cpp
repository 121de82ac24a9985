// Model inspector: builds a sample structural model and logs its derived views.
#include <metamodel/metamodel.hpp>
#include <model_config/settings.hpp>
#include <model_samples/samples.hpp>
#include <cstdio>
#include <optional>
#include <string>

namespace {

std::string class_line(const metamodel::Class& cl) {
    std::string line = cl.name();
    if (cl.is_abstract()) line += " {abstract}";
    const auto parents = cl.parents();
    if (!parents.empty()) {
        line += " : ";
        bool first = true;
        for (const auto* parent : parents) {
            if (!first) line += ", ";
            line += parent->name();
            first = false;
        }
    }
    return line;
}

void log_model(spdlog::logger& log, const metamodel::DomainModel& model) {
    log.info("model '{}': {} types, {} associations, {} generalizations, {} packages, {} constraints",
        model.name(), model.types().size(), model.associations().size(),
        model.generalizations().size(), model.packages().size(), model.constraints().size());

    for (const auto* enumeration : metamodel::sort_by_creation_order(model.get_enumerations())) {
        std::string literals;
        for (const auto* literal : enumeration->literals())
            literals += (literals.empty() ? "" : ", ") + literal->name();
        log.info("enum {} [{}]", enumeration->name(), literals);
    }

    for (const auto* cl : model.classes_sorted_by_inheritance()) {
        const auto* id = cl->id_attribute();
        log.info("class {}", class_line(*cl));
        log.info("    attributes: {} own, {} total; id: {}", cl->attributes().size(),
            cl->all_attributes().size(), id ? id->name() : std::string("-"));
        for (const auto* end : cl->all_association_ends())
            log.info("    -> {}: {} [{}]{}", end->name(), end->type()->name(),
                end->multiplicity().to_string(), end->is_composite() ? " composite" : "");
        for (const auto* method : cl->methods())
            log.info("    {}({} params): {}", method->name(), method->parameters().size(),
                method->type()->name());
    }

    for (const auto* constraint : model.constraints())
        log.info("constraint {} on {} ({}): {}", constraint->name(), constraint->context()->name(),
            constraint->language(), constraint->expression());
}

} // namespace

int main(int argc, char* argv[])
{
    std::optional<std::string> config_path;
    std::optional<std::string> sample_override;
    for (int i = 1; i < argc; ++i) {
        const std::string arg(argv[i]);
        if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--sample" && i + 1 < argc) {
            sample_override = argv[++i];
        } else {
            (void)fprintf(stderr, "usage: %s [--config path] [--sample name]\n", argv[0]);
            return 1;
        }
    }

    std::optional<model_config::Settings> settings;
    if (config_path) {
        settings = model_config::load_settings_from_json_file(*config_path);
        if (!settings) {
            (void)fprintf(stderr, "Cannot read settings from '%s'\n", config_path->c_str());
            return 1;
        }
    } else {
        const char* settings_paths[] = { "data/inspector.json", "inspector.json" };
        for (const char* path : settings_paths) {
            settings = model_config::load_settings_from_json_file(path);
            if (settings) break;
        }
    }
    if (!settings)
        settings = model_config::Settings{};
    if (sample_override)
        settings->sample = *sample_override;

    auto log = model_config::configure_logging(*settings);

    metamodel::Arena arena;
    try {
        const auto* model = model_samples::make_sample_model(settings->sample, arena);
        if (!model) {
            std::string known;
            for (const auto& name : model_samples::sample_names())
                known += (known.empty() ? "" : ", ") + name;
            log->error("Unknown sample '{}' (known: {})", settings->sample, known);
            return 1;
        }
        log_model(*log, *model);
    } catch (const metamodel::ModelError& e) {
        log->error("{}: {}", metamodel::to_string(e.kind()), e.what());
        return 1;
    }
    return 0;
}
