#include "tests/test_suite.hpp"
#include "tests/testing_utils.hpp"

#include "keel/artifact_cache.hpp"
#include "keel/engine.hpp"
#include "keel/manifest.hpp"
#include "keel/resolver.hpp"

#include <sstream>

using namespace keel;
using namespace keel::testing;

namespace {

struct Workspace {
    TempDir dir;
    std::ostringstream sink;

    std::string path(const std::string &name) const {
        return (dir / name).string();
    }

    // Parses `text`, resolves it with the built-in rule kinds and builds every rule.
    BuildReport build(const std::string &text, bool keep_going = true) {
        auto manifest = parse_manifest(text);
        if (!manifest)
            throw std::runtime_error(manifest.error().message);

        EngineConfig config;
        config.jobs = 2;
        config.keep_going = keep_going;
        config.out_dir = dir / "keel-out";
        config.cache_dir = dir / "cache";
        config.out = &sink;
        config.err = &sink;
        if (auto res = apply_definitions(manifest->definitions, config); !res)
            throw std::runtime_error(res.error().message);

        BuildRuleResolver resolver(config.out_dir);
        if (auto res = add_rules(*manifest, RuleKindRegistry::with_builtin_kinds(), resolver); !res)
            throw std::runtime_error(res.error().message);
        auto graph = resolver.resolve();
        if (!graph)
            throw std::runtime_error(graph.error().message);

        DirArtifactCache cache(config.cache_dir);
        BuildEngine engine(*graph, cache, config);
        return engine.build_all();
    }
};

void test_genrule_runs_shell_and_reuses() {
    Workspace ws;
    create_file(ws.dir / "src/a.txt", "alpha\n");
    create_file(ws.dir / "src/b.txt", "beta\n");
    const std::string text = "genrule|//gen:upper||" + ws.path("src/a.txt") + "," + ws.path("src/b.txt") +
                             "|out=upper.txt|cmd=cat $SRCS | tr a-z A-Z > $OUT\n";

    BuildReport first = ws.build(text);
    ASSERT(first.success());
    ASSERT_EQ(first.steps_executed(), 2u);
    ASSERT_EQ(read_file(ws.dir / "keel-out/gen/gen/upper.txt"), "ALPHA\nBETA\n");
    ASSERT(ws.sink.str().find("genrule //gen:upper") != std::string::npos);

    BuildReport second = ws.build(text);
    ASSERT_EQ(second.count(RuleState::Reused), 1u);
    ASSERT_EQ(second.steps_executed(), 0u);

    create_file(ws.dir / "src/b.txt", "gamma\n");
    BuildReport third = ws.build(text);
    ASSERT_EQ(third.count(RuleState::Built), 1u);
    ASSERT_EQ(read_file(ws.dir / "keel-out/gen/gen/upper.txt"), "ALPHA\nGAMMA\n");
}

void test_failing_command_reports_exit_code() {
    Workspace ws;
    BuildReport report = ws.build("genrule|//gen:broken|||out=never.txt|cmd=exit 3\n"
                                  "genrule|//gen:after|//gen:broken||out=after.txt|cmd=touch $OUT\n");
    ASSERT_EQ(report.exit_code(), 1);
    const RuleOutcome *broken = report.find(target("//gen:broken"));
    ASSERT_EQ(broken->state, RuleState::Failed);
    ASSERT(broken->error->message.find("exited with code 3") != std::string::npos);
    ASSERT_EQ(report.find(target("//gen:after"))->state, RuleState::Blocked);
}

void test_package_genrule_wraps_package() {
    Workspace ws;
    create_file(ws.dir / "app/Manifest.xml", "<manifest package=\"com.example\"/>");
    create_file(ws.dir / "app/classes.txt", "classes");
    const std::string text = "package|//app:app||" + ws.path("app/classes.txt") +
                             "|manifest=" + ws.path("app/Manifest.xml") + "|cmd=cat $SRCS > $OUT\n" +
                             "package_genrule|//app:signed|//app:app||package=//app:app|cmd=cp $PACKAGE $OUT && "
                             "echo signed >> $OUT\n";

    BuildReport report = ws.build(text);
    ASSERT(report.success());
    ASSERT_EQ(read_file(ws.dir / "keel-out/gen/app/signed.pkg"), "classessigned\n");

    auto manifest = parse_manifest(text);
    ASSERT_OK(manifest);
    BuildRuleResolver resolver(ws.dir / "keel-out");
    ASSERT_OK(add_rules(*manifest, RuleKindRegistry::with_builtin_kinds(), resolver));
    auto graph = resolver.resolve();
    ASSERT_OK(graph);
    auto artifact = (*graph->find(target("//app:signed")))->installable();
    ASSERT(artifact.has_value());
    auto descriptor = read_manifest(*artifact);
    ASSERT_OK(descriptor);
    ASSERT_EQ(*descriptor, "<manifest package=\"com.example\"/>");
}

void test_prebuilt_needs_no_steps() {
    Workspace ws;
    create_file(ws.dir / "lib/guava.jar", "jar bytes");
    const std::string text = "DEF|keep_going|false\nprebuilt|//lib:guava|||binary=" + ws.path("lib/guava.jar") + "\n";

    BuildReport first = ws.build(text);
    ASSERT(first.success());
    ASSERT_EQ(first.count(RuleState::Built), 1u);
    ASSERT_EQ(first.steps_executed(), 0u);

    BuildReport second = ws.build(text);
    ASSERT_EQ(second.count(RuleState::Reused), 1u);
    ASSERT_EQ(read_file(ws.dir / "lib/guava.jar"), "jar bytes");
}

} // namespace

void integration_tests() {
    std::cout << "Integration\n";
    TEST(genrule_runs_shell_and_reuses);
    TEST(failing_command_reports_exit_code);
    TEST(package_genrule_wraps_package);
    TEST(prebuilt_needs_no_steps);
}
