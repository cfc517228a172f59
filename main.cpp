// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  GraphStax

#include <iostream>
#include <string>
#include <vector>

#include <boost/program_options.hpp>

#include "catalog/catalog_loader.hpp"
#include "catalog/memory_catalog.hpp"
#include "catalog/table_resolver.hpp"
#include "typing/typing_parser.hpp"
#include "utility/config.hpp"
#include "utility/logger.hpp"

namespace po = boost::program_options;

int main(int argc, char* argv[]) {
    auto config = make_describe_config({});
    std::string catalog_path;
    std::string log_level = "info";

    // Define command-line options
    po::options_description desc("Allowed options");
    desc.add_options()("help,h", "Show help message")
    ("catalog,c",
    po::value<std::string>(&catalog_path)->required(),
    "Catalog description file")
    ("log-dir",
    po::value<std::string>(&config.log_path)->default_value(config.log_path),
    "Directory for log files, empty to log to stdout only")
    ("log-level",
    po::value<std::string>(&log_level)->default_value(log_level),
    "trace, debug, info, warn, err, critical or off")
    ("table",
    po::value<std::vector<std::string>>(&config.tables)->required(),
    "Tables to describe");

    po::positional_options_description positional;
    positional.add("table", -1);

    // Parse arguments
    po::variables_map vm;
    try {
        po::store(po::command_line_parser(argc, argv).options(desc).positional(positional).run(), vm);
        if (vm.count("help")) {
            std::cout << desc << "\n";
            return 0;
        }
        po::notify(vm);
    } catch (const std::exception& e) {
        std::cerr << "Error parsing arguments: " << e.what() << "\n";
        std::cerr << desc << "\n";
        return 1;
    }

    config.catalog_path = catalog_path;
    if (auto level = parse_log_level(log_level)) {
        config.log_level = *level;
    } else {
        std::cerr << "Error parsing arguments: unknown log level '" << log_level << "'\n";
        std::cerr << desc << "\n";
        return 1;
    }

    // Logging
    initialize_all_loggers(config.log_path, config.log_level);
    auto log = get_logger(logger_tag::CLI);

    catalog::MemoryCatalog memory_catalog;
    try {
        catalog::load_catalog_file(config.catalog_path, memory_catalog);
    } catch (const std::exception& e) {
        log->error("failed to load catalog {}: {}", config.catalog_path.string(), e.what());
        return 1;
    }

    auto parser = typing::make_typing_parser();
    catalog::TableResolver resolver(memory_catalog, *parser);

    int status = 0;
    for (const auto& table : config.tables) {
        auto result = resolver.resolve_table_info(table);
        if (result.is_error()) {
            log->error("{}: {}", table, result.get_error().to_string());
            status = 2;
            continue;
        }
        std::cout << table << ": " << result.value();
    }

    return status;
}
