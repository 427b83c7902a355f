#include "pluscode/batch/runner.hpp"
#include "pluscode/pluscode.hpp"
#include <optional>

namespace pluscode {
namespace batch {

Runner::Runner(std::ostream& out, std::ostream& log)
    : out_(out), log_(log) {}

size_t Runner::run(const Script& script) {
    size_t failed = 0;
    for (const auto& command : script.commands()) {
        if (!execute(command)) {
            ++failed;
        }
    }
    return failed;
}

bool Runner::execute(const Command& command) {
    ++stats_.command_count;

    if (verbose_) {
        log_ << "% [verbose] line " << command.line << ": " << command_name(command.kind);
        if (!command.code.empty()) {
            log_ << " \"" << command.code << "\"";
        }
        if (command.kind != CommandKind::Decode && command.kind != CommandKind::Validate) {
            log_ << " " << command.latitude << " " << command.longitude;
        }
        if (command.kind == CommandKind::Encode) {
            log_ << " " << command.code_length.value_or(default_code_length_);
        }
        log_ << "\n";
    }

    std::optional<ErrorCode> error;
    switch (command.kind) {
        case CommandKind::Encode: {
            int code_length = command.code_length.value_or(default_code_length_);
            auto code = encode(command.latitude, command.longitude, code_length);
            if (code) {
                out_ << *code << "\n";
            } else {
                error = code.error();
            }
            break;
        }
        case CommandKind::Decode: {
            auto area = decode(command.code);
            if (area) {
                auto old_precision = out_.precision(15);
                out_ << area->latitude_lo << " " << area->longitude_lo << " "
                     << area->latitude_hi << " " << area->longitude_hi << " "
                     << area->latitude_center << " " << area->longitude_center << " "
                     << area->code_length << "\n";
                out_.precision(old_precision);
            } else {
                error = area.error();
            }
            break;
        }
        case CommandKind::Shorten: {
            auto code = shorten(command.code, command.latitude, command.longitude);
            if (code) {
                out_ << *code << "\n";
            } else {
                error = code.error();
            }
            break;
        }
        case CommandKind::Recover: {
            auto code = recover_nearest(command.code, command.latitude, command.longitude);
            if (code) {
                out_ << *code << "\n";
            } else {
                error = code.error();
            }
            break;
        }
        case CommandKind::Validate:
            out_ << command.code
                 << " valid=" << (is_valid(command.code) ? "true" : "false")
                 << " short=" << (is_short(command.code) ? "true" : "false")
                 << " full=" << (is_full(command.code) ? "true" : "false") << "\n";
            break;
    }

    if (error) {
        ++stats_.error_count;
        out_ << "ERROR " << error_name(*error) << "\n";
        log_ << "% [error] line " << command.line << ": " << command_name(command.kind)
             << ": " << error_name(*error) << "\n";
        return false;
    }
    return true;
}

} // namespace batch
} // namespace pluscode
