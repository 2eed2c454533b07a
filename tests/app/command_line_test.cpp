#include "mirror/app/command_line.hpp"

#include "support/temp_dir.hpp"

#include <gtest/gtest.h>

#include <map>
#include <sstream>

using mirror::ErrorKind;
using mirror::app::Action;
using mirror::app::CommandLine;
using mirror::app::parse_command_line;
using mirror::app::resolve_config;
using mirror::test_support::TempDir;
using mirror::test_support::write_file;

namespace {

mirror::Result<CommandLine> parse(std::vector<const char*> args) {
    args.insert(args.begin(), "treemirror");
    return parse_command_line(static_cast<int>(args.size()), args.data());
}

mirror::EnvLookup environment(std::map<std::string, std::string> values) {
    return [values = std::move(values)](const std::string& name) -> std::optional<std::string> {
        const auto it = values.find(name);
        if (it == values.end()) {
            return std::nullopt;
        }
        return it->second;
    };
}

} // namespace

TEST(CommandLine, DefaultsToRun) {
    auto parsed = parse({});
    ASSERT_TRUE(parsed.is_ok());
    EXPECT_EQ(parsed.value().action, Action::Run);
    EXPECT_FALSE(parsed.value().root_url.has_value());
    EXPECT_FALSE(parsed.value().verbose);
}

TEST(CommandLine, ParsesOptions) {
    auto parsed = parse({"-u", "https://m.test/", "-d", "out", "-t", "4", "--timeout", "30",
                         "--db-file", "state.db", "--user-agent", "me/1.0", "--summary-json", "s.json", "-v"});
    ASSERT_TRUE(parsed.is_ok()) << parsed.error().message;

    const auto& cmd = parsed.value();
    EXPECT_EQ(cmd.root_url, std::optional<std::string>("https://m.test/"));
    EXPECT_EQ(cmd.destination_root, std::optional<std::string>("out"));
    EXPECT_EQ(cmd.worker_count, std::optional<std::size_t>(4));
    EXPECT_EQ(cmd.timeout_seconds, std::optional<std::size_t>(30));
    EXPECT_EQ(cmd.ledger_path, std::optional<std::string>("state.db"));
    EXPECT_EQ(cmd.user_agent, std::optional<std::string>("me/1.0"));
    EXPECT_EQ(cmd.summary_json, std::optional<std::string>("s.json"));
    EXPECT_TRUE(cmd.verbose);
}

TEST(CommandLine, RegionTakesSeveralValues) {
    auto parsed = parse({"-r", "USA", "EU,JP", "--count"});
    ASSERT_TRUE(parsed.is_ok());
    ASSERT_TRUE(parsed.value().regions.has_value());
    EXPECT_EQ(*parsed.value().regions, (std::vector<std::string>{"USA", "EU", "JP"}));
    EXPECT_EQ(parsed.value().action, Action::Count);
}

TEST(CommandLine, Actions) {
    EXPECT_EQ(parse({"count"}).value().action, Action::Count);
    EXPECT_EQ(parse({"run", "-u", "x"}).value().action, Action::Run);
    EXPECT_EQ(parse({"--help"}).value().action, Action::Help);

    auto forget = parse({"forget", "https://m.test/a.bin"});
    ASSERT_TRUE(forget.is_ok());
    EXPECT_EQ(forget.value().action, Action::Forget);
    EXPECT_EQ(forget.value().forget_location, "https://m.test/a.bin");
}

TEST(CommandLine, RejectsBadInput) {
    EXPECT_EQ(parse({"--bogus"}).error().kind, ErrorKind::InvalidArgument);
    EXPECT_TRUE(parse({"-t"}).is_error());
    EXPECT_TRUE(parse({"-t", "lots"}).is_error());
    EXPECT_TRUE(parse({"-r"}).is_error());
    EXPECT_TRUE(parse({"forget"}).is_error());
    EXPECT_TRUE(parse({"run", "count"}).is_error());
}

TEST(CommandLine, PrecedenceFileEnvironmentFlags) {
    TempDir dir;
    const auto config_path = dir / "mirror.json";
    write_file(config_path, R"({"root_url": "https://file.test/", "destination_root": "from-file", "worker_count": 2})");

    auto parsed = parse({"-t", "6"});
    ASSERT_TRUE(parsed.is_ok());

    auto resolved = resolve_config(parsed.value(), environment({
        {"MIRROR_CONFIG", config_path.string()},
        {"DOWNLOAD_DIR", "from-env"},
        {"MAX_THREADS", "3"},
    }));
    ASSERT_TRUE(resolved.is_ok()) << resolved.error().message;

    const auto& config = resolved.value();
    EXPECT_EQ(config.root_url, "https://file.test/");
    EXPECT_EQ(config.destination_root.string(), "from-env");
    EXPECT_EQ(config.worker_count, 6u);
}

TEST(CommandLine, MissingRootUrlIsConfigError) {
    auto parsed = parse({"-d", "out"});
    ASSERT_TRUE(parsed.is_ok());

    auto resolved = resolve_config(parsed.value(), environment({}));
    ASSERT_TRUE(resolved.is_error());
    EXPECT_EQ(resolved.error().kind, ErrorKind::Config);
}

TEST(CommandLine, ForgetNeedsOnlyLedgerPath) {
    auto parsed = parse({"forget", "https://m.test/a.bin", "--db-file", "x.db"});
    ASSERT_TRUE(parsed.is_ok());

    auto resolved = resolve_config(parsed.value(), environment({}));
    ASSERT_TRUE(resolved.is_ok());
    EXPECT_EQ(resolved.value().ledger_path.string(), "x.db");
}

TEST(CommandLine, UsageMentionsEveryAction) {
    std::ostringstream out;
    mirror::app::print_usage(out, "treemirror");
    const auto text = out.str();
    EXPECT_NE(text.find("run"), std::string::npos);
    EXPECT_NE(text.find("count"), std::string::npos);
    EXPECT_NE(text.find("forget URL"), std::string::npos);
    EXPECT_NE(text.find("--region"), std::string::npos);
}
