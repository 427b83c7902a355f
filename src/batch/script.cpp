#include "pluscode/batch/script.hpp"
#include <utility>

namespace pluscode {
namespace batch {

const char* command_name(CommandKind kind) {
    switch (kind) {
        case CommandKind::Encode:
            return "encode";
        case CommandKind::Decode:
            return "decode";
        case CommandKind::Shorten:
            return "shorten";
        case CommandKind::Recover:
            return "recover";
        case CommandKind::Validate:
            return "validate";
    }
    return "unknown";
}

void Script::add_command(Command command) {
    commands_.push_back(std::move(command));
}

} // namespace batch
} // namespace pluscode
