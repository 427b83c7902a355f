#include <catch2/catch_test_macros.hpp>
#include "pluscode/batch/script.hpp"
#include "pluscode/batch/runner.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>

using namespace pluscode;
using namespace pluscode::batch;

// ============================================================================
// Parser tests
// ============================================================================

TEST_CASE("parse_string reads every statement", "[batch][parser]") {
    auto script = parse_string(
        "% reference location\n"
        "encode 47.365590 8.524997;\n"
        "encode -33.5 151 11;\n"
        "decode \"8FVC9G8F+6X\";\n"
        "shorten \"8FVC9G8F+6X\" 47.5 8.5;\n"
        "recover \"9G8F+6X\" 47.4 8.6;\n"
        "validate \"8fvc9g8f+6x\";\n");

    REQUIRE(script->size() == 6);
    const auto& commands = script->commands();

    SECTION("encode without length") {
        REQUIRE(commands[0].kind == CommandKind::Encode);
        REQUIRE(commands[0].latitude == 47.365590);
        REQUIRE(commands[0].longitude == 8.524997);
        REQUIRE(!commands[0].code_length.has_value());
    }

    SECTION("encode with length and integer literal") {
        REQUIRE(commands[1].kind == CommandKind::Encode);
        REQUIRE(commands[1].latitude == -33.5);
        REQUIRE(commands[1].longitude == 151.0);
        REQUIRE(commands[1].code_length.value() == 11);
    }

    SECTION("code arguments") {
        REQUIRE(commands[2].kind == CommandKind::Decode);
        REQUIRE(commands[2].code == "8FVC9G8F+6X");
        REQUIRE(commands[3].kind == CommandKind::Shorten);
        REQUIRE(commands[3].latitude == 47.5);
        REQUIRE(commands[4].kind == CommandKind::Recover);
        REQUIRE(commands[4].code == "9G8F+6X");
        REQUIRE(commands[5].kind == CommandKind::Validate);
        REQUIRE(commands[5].code == "8fvc9g8f+6x");
    }
}

TEST_CASE("parse_string handles exponents and empty input", "[batch][parser]") {
    auto script = parse_string("encode 4.5e1 -1E1;");
    REQUIRE(script->size() == 1);
    REQUIRE(script->commands()[0].latitude == 45.0);
    REQUIRE(script->commands()[0].longitude == -10.0);

    REQUIRE(parse_string("")->empty());
    REQUIRE(parse_string("% only a comment\n")->empty());
}

TEST_CASE("parse_string accepts explicitly signed numbers", "[batch][parser]") {
    auto script = parse_string("encode +47.5 +8.5;\nencode +1E1 -151 +10;");
    REQUIRE(script->size() == 2);
    const auto& commands = script->commands();
    REQUIRE(commands[0].latitude == 47.5);
    REQUIRE(commands[0].longitude == 8.5);
    REQUIRE(commands[1].latitude == 10.0);
    REQUIRE(commands[1].longitude == -151.0);
    REQUIRE(commands[1].code_length.value() == 10);
}

TEST_CASE("parse_string rejects malformed scripts", "[batch][parser]") {
    REQUIRE_THROWS_AS(parse_string("encode 1;"), std::runtime_error);
    REQUIRE_THROWS_AS(parse_string("encode 1 2 3.5;"), std::runtime_error);
    REQUIRE_THROWS_AS(parse_string("decode 8FVC9G8F;"), std::runtime_error);
    REQUIRE_THROWS_AS(parse_string("validate \"8FVC9G8F+6X\""), std::runtime_error);
    REQUIRE_THROWS_AS(parse_string("locate 1 2;"), std::runtime_error);
}

TEST_CASE("parse_file reports missing files", "[batch][parser]") {
    REQUIRE_THROWS_AS(parse_file("/nonexistent/pluscode/script.pcs"), std::runtime_error);
}

TEST_CASE("Parse errors name the input, line and commands read", "[batch][parser]") {
    std::string message;
    try {
        parse_string("encode 1 2;\nvalidate \"8FVC9G8F+6X\";\ndecode 8FVC;\n");
    } catch (const std::runtime_error& e) {
        message = e.what();
    }
    REQUIRE(message.find("<string>") != std::string::npos);
    REQUIRE(message.find("line 3") != std::string::npos);
    REQUIRE(message.find("after 2 commands") != std::string::npos);
}

TEST_CASE("parse_file reads a script from disk", "[batch][parser]") {
    const auto path = std::filesystem::temp_directory_path() / "pluscode_test_script.pcs";
    {
        std::ofstream out(path);
        out << "% from a file\n"
            << "encode 47.365590 8.524997;\n"
            << "shorten \"8FVC9G8F+6X\" 47.5 8.5;\n";
    }

    SECTION("valid script") {
        auto script = parse_file(path.string());
        REQUIRE(script->size() == 2);
        REQUIRE(script->commands()[0].kind == CommandKind::Encode);
        REQUIRE(script->commands()[1].kind == CommandKind::Shorten);
        REQUIRE(script->commands()[1].line == 3);
    }

    SECTION("broken script names the file") {
        {
            std::ofstream out(path, std::ios::app);
            out << "recover \"9G8F+6X\";\n";
        }
        std::string message;
        try {
            parse_file(path.string());
        } catch (const std::runtime_error& e) {
            message = e.what();
        }
        REQUIRE(message.find(path.string()) != std::string::npos);
        REQUIRE(message.find("after 2 commands") != std::string::npos);
    }

    std::filesystem::remove(path);
}

// ============================================================================
// Runner tests
// ============================================================================

TEST_CASE("Runner prints one line per command", "[batch][runner]") {
    auto script = parse_string(
        "encode 47.365590 8.524997;\n"
        "shorten \"8FVC9G8F+6X\" 47.5 8.5;\n"
        "recover \"9G8F+6X\" 47.4 8.6;\n"
        "validate \"8FVC9G8F+6X\";\n"
        "decode \"CFX30000+\";\n"
        "encode 1 1 3;\n"
        "decode \"9G8F+6X\";\n");

    std::ostringstream out;
    std::ostringstream log;
    Runner runner(out, log);
    size_t failed = runner.run(*script);

    REQUIRE(failed == 2);
    REQUIRE(out.str() ==
            "8FVC9G8F+6X\n"
            "9G8F+6X\n"
            "8FVC9G8F+6X\n"
            "8FVC9G8F+6X valid=true short=false full=true\n"
            "89 1 90 2 89.5 1.5 4\n"
            "ERROR invalid_open_location_code_length\n"
            "ERROR full_code_expected\n");

    REQUIRE(runner.stats().command_count == 7);
    REQUIRE(runner.stats().error_count == 2);
    REQUIRE(log.str().find("% [error]") != std::string::npos);
    REQUIRE(log.str().find("full_code_expected") != std::string::npos);
    REQUIRE(log.str().find("% [verbose]") == std::string::npos);
}

TEST_CASE("Runner configuration", "[batch][runner]") {
    auto script = parse_string("encode 47.365590 8.524997;");
    std::ostringstream out;
    std::ostringstream log;
    Runner runner(out, log);

    SECTION("default code length") {
        runner.set_default_code_length(11);
        REQUIRE(runner.run(*script) == 0);
        REQUIRE(out.str() == "8FVC9G8F+6XQ\n");
    }

    SECTION("invalid default code length") {
        runner.set_default_code_length(7);
        REQUIRE(runner.run(*script) == 1);
        REQUIRE(out.str() == "ERROR invalid_open_location_code_length\n");
    }

    SECTION("verbose") {
        runner.set_verbose(true);
        REQUIRE(runner.run(*script) == 0);
        REQUIRE(log.str().find("% [verbose]") != std::string::npos);
        REQUIRE(log.str().find("encode") != std::string::npos);
    }
}
