// src/main.cpp - skyalign entry point
//
//  1. Parse the command line
//  2. Load and quality-filter per-beam catalogues
//  3. Register every beam onto a common frame
//  4. Write offsets, the initial match matrix and convergence statistics

#include "app/options.hpp"
#include "app/pipeline.hpp"
#include "core/logger.hpp"

#include <cstdlib>
#include <iostream>

using namespace skyalign;

int main(int argc, char** argv)
{
    const auto options = app::parse_options(argc, argv, std::cerr);
    if (!options)
    {
        return EXIT_FAILURE;
    }
    if (options->show_help)
    {
        return EXIT_SUCCESS;
    }

    core::Logger::init(options->log_level);

    SKY_INFO("skyalign: SB{} ({} beams) from {}",
             options->sbid, options->beams, options->catalogue_dir.string());

    const auto result = app::Pipeline::run(*options);
    if (!result)
    {
        core::Logger::shutdown();
        return EXIT_FAILURE;
    }

    app::Pipeline::log_summary(*result);

    core::Logger::shutdown();
    return EXIT_SUCCESS;
}
