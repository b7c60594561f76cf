#pragma once
#include "gitsaga/config.hpp"
#include "gitsaga/logger.hpp"

#include <exception>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace gitsaga::cli {

// Arguments after the command name
std::vector<std::string> collect_args(int argc, char **argv);

// Remove "<flag> <value>" from args and return the value
std::optional<std::string> take_option(std::vector<std::string> &args, std::string_view flag);

std::filesystem::path repo_root();

// spdlog sink on stderr at the configured level
std::shared_ptr<Logger> make_logger(const Settings &settings);

// Print "<command>: <message>" (plus rollback failures of a SagaError); returns 1
int report_error(std::string_view command, const std::exception &e);

} // namespace gitsaga::cli
