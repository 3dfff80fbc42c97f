// ==============================================================================
// test_cli_gtest.cpp - Тесты CLI модуля (GoogleTest)
// ==============================================================================

#include "turbosort/cli.hpp"

#include <gtest/gtest.h>
#include <string>
#include <vector>

namespace turbosort::cli::test {

// ==============================================================================
// Вспомогательные функции
// ==============================================================================

// Конвертация вектора строк в argc/argv
struct Args {
    std::vector<std::string> strings;
    std::vector<char*> ptrs;

    explicit Args(std::initializer_list<std::string> args) : strings(args) {
        for (auto& s : strings) {
            ptrs.push_back(s.data());
        }
        ptrs.push_back(nullptr);
    }

    int argc() const { return static_cast<int>(strings.size()); }

    char** argv() { return ptrs.data(); }
};

// ==============================================================================
// Команда по умолчанию
// ==============================================================================

TEST(CliTest, Parse_NoArguments_ReturnsRunCommand) {
    // Arrange
    Args args{"turbosort"};

    // Act
    ParseResult result = parse(args.argc(), args.argv());

    // Assert
    EXPECT_TRUE(result.ok);
    EXPECT_TRUE(std::holds_alternative<RunCommand>(result.command));
    EXPECT_FALSE(result.global.config.has_value());
}

TEST(CliTest, Parse_Subcommands) {
    Args scan{"turbosort", "scan"};
    Args run{"turbosort", "run"};
    Args clear{"turbosort", "clear-history"};

    EXPECT_TRUE(std::holds_alternative<ScanCommand>(parse(scan.argc(), scan.argv()).command));
    EXPECT_TRUE(std::holds_alternative<RunCommand>(parse(run.argc(), run.argv()).command));
    EXPECT_TRUE(
        std::holds_alternative<ClearHistoryCommand>(parse(clear.argc(), clear.argv()).command));
}

// ==============================================================================
// history
// ==============================================================================

TEST(CliTest, Parse_HistoryFlag_EquivalentToCommand) {
    Args flag{"turbosort", "--history", "--detailed"};

    ParseResult result = parse(flag.argc(), flag.argv());

    ASSERT_TRUE(result.ok);
    const auto* cmd = std::get_if<HistoryCommand>(&result.command);
    ASSERT_NE(cmd, nullptr);
    EXPECT_TRUE(cmd->detailed);
    EXPECT_FALSE(cmd->json);
}

TEST(CliTest, Parse_HistoryJson) {
    Args args{"turbosort", "history", "--json"};

    ParseResult result = parse(args.argc(), args.argv());

    ASSERT_TRUE(result.ok);
    const auto* cmd = std::get_if<HistoryCommand>(&result.command);
    ASSERT_NE(cmd, nullptr);
    EXPECT_TRUE(cmd->json);
}

TEST(CliTest, Parse_DetailedWithoutHistory_IsUsageError) {
    Args args{"turbosort", "--detailed"};

    ParseResult result = parse(args.argc(), args.argv());

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.diagnostic.exit_code, 2);
    EXPECT_NE(result.diagnostic.stderr_message.find("--detailed"), std::string::npos);
}

TEST(CliTest, Parse_JsonWithDetailed_IsUsageError) {
    Args args{"turbosort", "history", "--json", "--detailed"};
    EXPECT_FALSE(parse(args.argc(), args.argv()).ok);
}

TEST(CliTest, Parse_HistoryFlagWithOtherCommand_IsUsageError) {
    Args args{"turbosort", "scan", "--history"};

    ParseResult result = parse(args.argc(), args.argv());

    EXPECT_FALSE(result.ok);
    EXPECT_NE(result.diagnostic.stderr_message.find("cannot be used with 'scan'"),
              std::string::npos);
}

// ==============================================================================
// Глобальные опции
// ==============================================================================

TEST(CliTest, Parse_GlobalOptions_AnyPosition) {
    Args args{"turbosort", "-q", "scan", "--no-banner", "-vv", "--config", "/etc/ts.yaml"};

    ParseResult result = parse(args.argc(), args.argv());

    ASSERT_TRUE(result.ok);
    EXPECT_TRUE(result.global.quiet);
    EXPECT_TRUE(result.global.no_banner);
    EXPECT_EQ(result.global.verbose, 2);
    ASSERT_TRUE(result.global.config.has_value());
    EXPECT_EQ(result.global.config->string(), "/etc/ts.yaml");
}

TEST(CliTest, Parse_ConfigEqualsForm) {
    Args args{"turbosort", "--config=cfg.yaml"};

    ParseResult result = parse(args.argc(), args.argv());

    ASSERT_TRUE(result.ok);
    EXPECT_EQ(result.global.config->string(), "cfg.yaml");
}

TEST(CliTest, Parse_ConfigWithoutValue_IsUsageError) {
    Args args{"turbosort", "-c"};

    ParseResult result = parse(args.argc(), args.argv());

    EXPECT_FALSE(result.ok);
    EXPECT_NE(result.diagnostic.stderr_message.find("a value is required"), std::string::npos);
}

// ==============================================================================
// help / version
// ==============================================================================

TEST(CliTest, Parse_Help_ReturnsHelpCommand) {
    Args args{"turbosort", "--help"};

    ParseResult result = parse(args.argc(), args.argv());

    EXPECT_TRUE(result.ok);
    EXPECT_TRUE(std::holds_alternative<HelpCommand>(result.command));
}

TEST(CliTest, Parse_HelpSubcommand_WithTopic) {
    Args args{"turbosort", "help", "history"};

    ParseResult result = parse(args.argc(), args.argv());

    ASSERT_TRUE(result.ok);
    const auto* cmd = std::get_if<HelpCommand>(&result.command);
    ASSERT_NE(cmd, nullptr);
    EXPECT_EQ(cmd->command, "history");
}

TEST(CliTest, Parse_SubcommandHelp) {
    Args args{"turbosort", "scan", "-h"};

    ParseResult result = parse(args.argc(), args.argv());

    ASSERT_TRUE(result.ok);
    EXPECT_EQ(std::get<HelpCommand>(result.command).command, "scan");
}

TEST(CliTest, Parse_Version_ReturnsVersionCommand) {
    Args args{"turbosort", "-V", "--bogus"};

    ParseResult result = parse(args.argc(), args.argv());

    EXPECT_TRUE(result.ok);
    EXPECT_TRUE(std::holds_alternative<VersionCommand>(result.command));
}

TEST(CliTest, RenderVersion) {
    EXPECT_EQ(render_version(), "turbosort 1.2.0\n");
}

TEST(CliTest, RenderHelp_ListsCommandsAndEnvironment) {
    std::string help = render_help();

    EXPECT_NE(help.find("Usage: turbosort [OPTIONS] [COMMAND]"), std::string::npos);
    EXPECT_NE(help.find("clear-history"), std::string::npos);
    EXPECT_NE(help.find("DEST_DIR"), std::string::npos);
    EXPECT_NE(render_help(std::string("history")).find("--json"), std::string::npos);
}

// ==============================================================================
// Ошибки
// ==============================================================================

TEST(CliTest, Parse_UnknownOption_IsUsageError) {
    Args args{"turbosort", "--frobnicate"};

    ParseResult result = parse(args.argc(), args.argv());

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.diagnostic.exit_code, 2);
    EXPECT_NE(result.diagnostic.stderr_message.find("unexpected argument '--frobnicate'"),
              std::string::npos);
    EXPECT_NE(result.diagnostic.stderr_message.find("For more information, try '--help'."),
              std::string::npos);
}

TEST(CliTest, Parse_UnknownSubcommand_IsUsageError) {
    Args args{"turbosort", "deploy"};

    ParseResult result = parse(args.argc(), args.argv());

    EXPECT_FALSE(result.ok);
    EXPECT_NE(result.diagnostic.stderr_message.find("unrecognized subcommand 'deploy'"),
              std::string::npos);
}

TEST(CliTest, Parse_ExtraPositional_IsUsageError) {
    Args args{"turbosort", "scan", "now"};
    EXPECT_FALSE(parse(args.argc(), args.argv()).ok);
}

}  // namespace turbosort::cli::test
