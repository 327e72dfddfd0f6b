#pragma once

#include "fleet/update_orchestrator.hpp"
#include "store/firmware_state_store.hpp"
#include "util/result.hpp"

#include <cstddef>
#include <cstdio>
#include <optional>
#include <string>
#include <string_view>

namespace fwfleet::cli {

enum class Command {
    List,
    Check,
    Update,
    Verify,
    Log,
};

bool ParseCommand(std::string_view name, Command& out);
const char* ToString(Command cmd);

struct CommandArgs {
    std::optional<std::string> device;
    std::optional<std::string> component;
    std::optional<FirmwareStatus> status;
    bool dry_run = false;
    std::size_t limit = 20;
};

// Parses the options following the subcommand name; argv[0] is the name.
// InvalidArgument for options the command does not take.
Result ParseCommandArgs(Command cmd, int argc, char** argv, CommandArgs& out);

// Exit status: 0 ok, 1 failure (see each command).
int RunCommand(Command cmd,
               const CommandArgs& args,
               IFirmwareStateStore& store,
               UpdateOrchestrator& orchestrator,
               std::FILE* out);

void PrintCommandUsage(std::FILE* out);

} // namespace fwfleet::cli
