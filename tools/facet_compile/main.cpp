/**
 * Facet compiler CLI
 * Usage: facet-compile [--manifest] [file.json] or pipe a document to stdin
 */

#include "facet/loader/document.hpp"
#include "facet/style/compiler.hpp"
#include "facet/core/logger.hpp"
#include <iostream>
#include <sstream>
#include <string_view>

using namespace facet;

namespace {

void print_usage() {
    std::cerr << "Usage: facet-compile [--manifest] [file.json]\n"
              << "  Compiles a declaration document into a stylesheet.\n"
              << "  Reads stdin when no file is given.\n"
              << "  --manifest  print the class string of every rule instead\n";
}

int fail(const CompileError& error) {
    std::cerr << "Error: " << error.to_string() << "\n";
    logging::shutdown();
    return 1;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    logging::init();
    logging::set_level(LogLevel::Warn);

    bool print_manifest = false;
    const char* input_path = nullptr;

    for (int i = 1; i < argc; ++i) {
        std::string_view arg(argv[i]);
        if (arg == "--manifest") {
            print_manifest = true;
        } else if (arg == "--help" || arg == "-h") {
            print_usage();
            return 0;
        } else if (!input_path) {
            input_path = argv[i];
        } else {
            print_usage();
            return 1;
        }
    }

    auto document = [&]() {
        if (input_path) {
            return loader::load_document(String(input_path));
        }
        std::stringstream buffer;
        buffer << std::cin.rdbuf();
        return loader::parse_document(buffer.str());
    }();
    if (!document) {
        return fail(document.error());
    }
    logging::set_level(document.value().config.log_level);

    auto context = style::BuildContext::create(document.value().config);
    if (!context) {
        return fail(context.error());
    }

    style::Compiler compiler(*context.value());
    if (auto result = loader::compile_document(document.value(), compiler); !result) {
        return fail(result.error());
    }

    if (print_manifest) {
        for (const auto& [key, rule] : context.value()->manifest().classes()) {
            std::cout << key << ": " << rule.class_string << "\n";
        }
    } else {
        std::cout << compiler.stylesheet();
    }

    logging::shutdown();
    return 0;
}
