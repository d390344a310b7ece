#pragma once

#include <boost/program_options.hpp>
#include <sharevault/execution/options.hpp>
#include <optional>
#include <string>

namespace sharevault::service {

/// Options shared by the command line and the `--config` file.
boost::program_options::options_description make_engine_options_description();

/// Convert parsed options into engine options. Returns std::nullopt and sets
/// `error` on an unknown mode name, malformed amount or invalid account id.
std::optional<sharevault::execution::engine_options> try_make_engine_options(
    const boost::program_options::variables_map& vm,
    std::string& error);

}  // namespace sharevault::service
