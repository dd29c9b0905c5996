/*
 * AEVUMDB COMMUNITY LICENSE
 * Version 1.0, February 2026
 *
 * Copyright (c) 2026 Ananda Firmansyah.
 * Official Organization: AevumDB (https://github.com/aevumdb)
 *
 * This source code is licensed under the AevumDB Community License.
 * You may not use this file except in compliance with the License.
 */

/**
 * @file main.cpp
 * @brief Entry point of the `lineage-gen` tool.
 *
 * @details
 * Hands the command line to `lineage::cli::Cli::run`, which parses options,
 * configures the logger and prints a derivation tree or an audit summary.
 */

#include "lineage/cli/cli.hpp"

#include <iostream>

/**
 * @brief Main Execution Entry Point.
 */
int main(int argc, char* argv[])
{
    return lineage::cli::Cli::run(argc, argv, std::cout);
}
