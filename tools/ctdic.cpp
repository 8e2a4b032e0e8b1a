/// ctdic: compile a scanner document into a wiring plan.
///
///   ctdic [options] scan.yaml
///
/// The plan is written as YAML to stdout (or --output).  Diagnostics go to
/// stderr.  Exit codes: 0 success, 1 compile error, 2 usage error.

#include <libctdi.hpp>

#include <boost/program_options.hpp>

#include <fstream>
#include <iostream>
#include <string>

namespace po = boost::program_options;

namespace {

constexpr int exit_compile_error = 1;
constexpr int exit_usage = 2;

struct cli_options {
    std::string input;
    std::string output;
    std::string config_file;
    std::string log_level;
    bool strict_imports = false;
    bool no_name_matching = false;
    bool warnings_as_errors = false;
};

po::options_description visible_options(cli_options& o) {
    po::options_description desc("Options");
    desc.add_options()
        ("help,h", "Show this help")
        ("config,c", po::value<std::string>(&o.config_file), "YAML tool configuration")
        ("output,o", po::value<std::string>(&o.output), "Write the plan here instead of stdout")
        ("log-level,l", po::value<std::string>(&o.log_level),
            "trace, debug, info, warning, error or fatal")
        ("strict-imports", po::bool_switch(&o.strict_imports),
            "Fail on module imports that name no module")
        ("no-name-matching", po::bool_switch(&o.no_name_matching),
            "Do not wire primitive parameters by factory method name")
        ("warnings-as-errors", po::bool_switch(&o.warnings_as_errors),
            "Fail the run if any warning is produced");
    return desc;
}

void print_usage(std::ostream& os, const po::options_description& desc) {
    os << "Usage: ctdic [options] SCAN.yaml\n\n" << desc << '\n';
}

} // namespace

int main(int argc, char* argv[]) {
    cli_options opts;
    auto desc = visible_options(opts);

    po::options_description hidden;
    hidden.add_options()("input", po::value<std::string>(&opts.input));
    po::options_description all;
    all.add(desc).add(hidden);
    po::positional_options_description positional;
    positional.add("input", 1);

    po::variables_map vm;
    try {
        po::store(po::command_line_parser(argc, argv)
                      .options(all).positional(positional).run(), vm);
        po::notify(vm);
    } catch (const po::error& e) {
        std::cerr << "ctdic: " << e.what() << "\n\n";
        print_usage(std::cerr, desc);
        return exit_usage;
    }

    if (vm.count("help")) {
        print_usage(std::cout, desc);
        return 0;
    }
    if (opts.input.empty()) {
        std::cerr << "ctdic: no scan document given\n\n";
        print_usage(std::cerr, desc);
        return exit_usage;
    }

    try {
        libctdi::tool_config config;
        if (!opts.config_file.empty()) {
            config = libctdi::load_tool_config(opts.config_file);
        }
        if (!opts.log_level.empty()) {
            auto lvl = libctdi::log::level_from_string(opts.log_level);
            if (!lvl) {
                std::cerr << "ctdic: unknown log level \"" << opts.log_level << "\"\n";
                return exit_usage;
            }
            config.log.minimum = *lvl;
        }
        if (opts.strict_imports) config.compile.strict_imports = true;
        if (opts.no_name_matching) config.compile.primitive_name_matching = false;
        if (opts.warnings_as_errors) config.compile.warnings_as_errors = true;

        libctdi::log::init(config.log);

        libctdi::compiler compiler;
        compiler.add(libctdi::load_scan_result(opts.input));
        auto plan = compiler.compile(config.compile);

        if (opts.output.empty()) {
            std::cout << libctdi::plan_to_yaml(plan) << '\n';
        } else {
            std::ofstream out(opts.output);
            if (!out) {
                std::cerr << "ctdic: cannot write " << opts.output << '\n';
                return exit_compile_error;
            }
            out << libctdi::plan_to_yaml(plan) << '\n';
        }

        LIBCTDI_LOG_INFO << "wrote " << plan.components.size() << " components";
        return 0;
    } catch (const libctdi::compile_error& e) {
        std::cerr << e.full_diagnostic() << '\n';
        return exit_compile_error;
    }
}
