#include "codecstore/attribute_grammar.hpp"
#include "codecstore/codec_store.hpp"
#include "codecstore/instance_registry.hpp"
#include "codecstore/media_codecs_xml.hpp"
#include "codecstore/reporting.hpp"
#include "omx/plugin_loader.hpp"
#include "omx/provider.hpp"

#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

using namespace codecstore;

namespace {

void print_usage(const char* prog) {
    std::cout << "Usage: " << prog << " [--instance=platform|vendor] [--search-dir=DIR]... [--config=FILE]\n"
              << "       [--prefix=P] [--owner=NAME] [--provider=NAME:NODE,...]... [--provider-lib=PATH]...\n"
              << "       [--lookup=NAME]... [--check-grammar] [--csv-report] [--debug]\n";
    std::cout << "  --config=FILE         main media codecs file (overrides the search dirs)\n";
    std::cout << "  --provider=NAME:N,... register an in-process provider owning nodes N\n";
    std::cout << "  --provider-lib=PATH   load a provider plugin\n";
    std::cout << "  --check-grammar       warn about attribute values off the usual grammar\n";
    std::cout << "  --csv-report          print listings as CSV\n";
}

std::vector<std::string> split(const std::string& text, char sep) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (start < text.size()) {
        auto pos = text.find(sep, start);
        if (pos == std::string::npos) pos = text.size();
        parts.push_back(text.substr(start, pos - start));
        start = pos + 1;
    }
    return parts;
}

void print_attributes(const char* scope, const std::string& owner, const AttributeList& attrs) {
    for (const auto& a : attrs) {
        if (reporting::csv_enabled()) {
            std::cout << scope << "," << owner << "," << a.key << "," << a.value << "\n";
        } else {
            std::cout << "    " << a.key << " = " << a.value << "\n";
        }
    }
}

unsigned check_grammar(const std::string& where, const AttributeList& attrs) {
    unsigned bad = 0;
    for (const auto& a : attrs) {
        if (!grammar::check_attribute(a)) {
            reporting::warn("grammar", where + ": " + a.key + "=\"" + a.value + "\" is off-convention");
            ++bad;
        }
    }
    return bad;
}

} // namespace

int main(int argc, char** argv) {
    std::string instance = kPlatformInstance;
    LoaderOptions opts;
    bool custom_dirs = false;
    std::string config;
    std::vector<std::string> provider_specs;
    std::vector<std::string> provider_libs;
    std::vector<std::string> lookups;
    bool grammar_check = false;
    bool csv_report = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg(argv[i]);
        if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        }
        if (arg.rfind("--instance=", 0) == 0) {
            instance = arg.substr(sizeof("--instance=") - 1);
            continue;
        }
        if (arg.rfind("--search-dir=", 0) == 0) {
            if (!custom_dirs) opts.search_dirs.clear();
            custom_dirs = true;
            opts.search_dirs.push_back(arg.substr(sizeof("--search-dir=") - 1));
            continue;
        }
        if (arg.rfind("--config=", 0) == 0) {
            config = arg.substr(sizeof("--config=") - 1);
            continue;
        }
        if (arg.rfind("--prefix=", 0) == 0) {
            opts.prefix = arg.substr(sizeof("--prefix=") - 1);
            continue;
        }
        if (arg.rfind("--owner=", 0) == 0) {
            opts.default_owner = arg.substr(sizeof("--owner=") - 1);
            continue;
        }
        if (arg.rfind("--provider=", 0) == 0) {
            provider_specs.push_back(arg.substr(sizeof("--provider=") - 1));
            continue;
        }
        if (arg.rfind("--provider-lib=", 0) == 0) {
            provider_libs.push_back(arg.substr(sizeof("--provider-lib=") - 1));
            continue;
        }
        if (arg.rfind("--lookup=", 0) == 0) {
            lookups.push_back(arg.substr(sizeof("--lookup=") - 1));
            continue;
        }
        if (arg == "--check-grammar") {
            grammar_check = true;
            continue;
        }
        if (arg == "--csv-report") {
            csv_report = true;
            continue;
        }
        if (arg == "--debug") {
            reporting::set_debug(true);
            continue;
        }
        std::cerr << "Unknown option: " << arg << "\n";
        print_usage(argv[0]);
        return 1;
    }

    if (instance != kPlatformInstance && instance != kVendorInstance) {
        std::cerr << "Unknown instance: " << instance << "\n";
        return 1;
    }
    if (!config.empty()) {
        std::filesystem::path p(config);
        opts.search_dirs = {p.parent_path().empty() ? std::string(".") : p.parent_path().string()};
        opts.main_xml = p.filename().string();
    }
    reporting::set_csv(csv_report);

    CodecStore::Builder builder(instance);
    for (const auto& entry : provider_specs) {
        auto colon = entry.find(':');
        std::string name = entry.substr(0, colon);
        std::vector<std::string> nodes;
        if (colon != std::string::npos) nodes = split(entry.substr(colon + 1), ',');
        Status ps = builder.add_provider(omx::make_listed_provider(name, nodes));
        if (ps != Status::Ok) {
            std::cerr << "Failed to register provider '" << name << "': " << to_string(ps) << "\n";
            return 1;
        }
    }
    for (const auto& lib : provider_libs) {
        auto provider = omx::load_provider_plugin(lib);
        if (!provider) {
            std::cerr << "Failed to load provider plugin " << lib << "\n";
            return 1;
        }
        Status ps = builder.add_provider(provider);
        if (ps != Status::Ok) {
            std::cerr << "Failed to register provider from " << lib << ": " << to_string(ps) << "\n";
            return 1;
        }
    }
    if (provider_specs.empty() && provider_libs.empty()) {
        // Everything belongs to the default owner unless told otherwise.
        if (builder.add_provider(omx::make_listed_provider(opts.default_owner, {})) != Status::Ok) {
            std::cerr << "Invalid default owner '" << opts.default_owner << "'\n";
            return 1;
        }
    }

    Status st = load_media_codecs(opts, builder);
    if (st != Status::Ok) {
        std::cerr << "Failed to read media codecs configuration: " << to_string(st) << "\n";
        return 1;
    }

    std::shared_ptr<const CodecStore> store = builder.build(&st);
    if (!store) {
        std::cerr << "Failed to load instance '" << instance << "': " << to_string(st) << "\n";
        return 1;
    }

    InstanceRegistry instances;
    if (instances.publish(instance, store) != Status::Ok) {
        std::cerr << "Failed to publish instance '" << instance << "'\n";
        return 1;
    }
    auto live = instances.lookup(instance);

    AttributeList service;
    st = live->list_service_attributes(service);
    if (st != Status::Ok) {
        std::cerr << "list_service_attributes: " << to_string(st) << "\n";
        return 1;
    }

    unsigned bad = 0;
    if (!reporting::csv_enabled()) {
        std::cout << "instance: " << live->instance_name() << "\n";
        std::cout << "prefix: " << live->get_node_prefix() << "\n";
        std::cout << "service attributes:\n";
    }
    print_attributes("service", "", service);
    if (grammar_check) bad += check_grammar("service", service);

    for (const auto& role : live->list_roles()) {
        if (reporting::csv_enabled()) {
            std::cout << "role," << role.role << "," << role.type << "," << (role.is_encoder ? 1 : 0) << ","
                      << (role.prefer_platform_nodes ? 1 : 0) << "\n";
        } else {
            std::cout << "role " << role.role << " type=" << role.type
                      << (role.is_encoder ? " encoder" : " decoder")
                      << (role.prefer_platform_nodes ? " prefer-platform" : "") << "\n";
        }
        for (const auto& node : role.nodes) {
            if (reporting::csv_enabled()) {
                std::cout << "node," << role.role << "," << node.name << "," << node.owner << "\n";
            } else {
                std::cout << "  node " << node.name << " owner=" << node.owner << "\n";
            }
            print_attributes("node", node.name, node.attributes);
            if (grammar_check) bad += check_grammar(node.name, node.attributes);
        }
    }

    for (const auto& name : lookups) {
        auto provider = live->get_omx(name);
        if (reporting::csv_enabled()) {
            std::cout << "lookup," << name << "," << (provider ? "found" : "not-found") << "\n";
        } else if (provider) {
            std::cout << "lookup " << name << ": " << provider->list_nodes().size() << " nodes\n";
        } else {
            std::cout << "lookup " << name << ": not found\n";
        }
    }

    if (grammar_check && bad > 0) {
        reporting::warn("grammar", std::to_string(bad) + " attribute(s) off-convention");
    }
    return 0;
}
