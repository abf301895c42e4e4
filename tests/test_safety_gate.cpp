#include "catch2_custom.hpp"

#include <codekata/sandbox/safety_gate.hpp>

#include <regex>
#include <string>
#include <string_view>
#include <vector>

using codekata::Capability;
using codekata::Rejection;
using codekata::SafetyGate;
using codekata::SafetyRule;

TEST_CASE("Ordinary programs pass the gate") {
    const SafetyGate gate;

    auto source = GENERATE(as<std::string>{}, "", "1 + 1", "IO.puts(\"Hello, World!\")",
                           "Enum.map([1, 2, 3], fn(x) -> x * 2 end)",
                           "def fact(n) do\n  if n <= 1 do 1 else n * fact(n - 1) end\nend\nfact(5)",
                           "String.upcase(\"file\")", "%{files: 3}");

    REQUIRE(gate.check(source).has_value());
}

TEST_CASE("Restricted operations are rejected with their capability") {
    const SafetyGate gate;

    SECTION("Filesystem") {
        REQUIRE(gate.check("File.read!(\"/etc/passwd\")") == Rejection{"File.", Capability::Filesystem});
        REQUIRE(gate.check("Path.expand(\"~\")") == Rejection{"Path.", Capability::Filesystem});
        REQUIRE(gate.check(":file.list_dir(\"/\")") == Rejection{":file.", Capability::Filesystem});
    }

    SECTION("Network") {
        REQUIRE(gate.check("HTTPoison.get(\"http://example.com\")") == Rejection{"HTTPoison", Capability::Network});
        REQUIRE(gate.check(":gen_tcp.connect('localhost', 80, [])") == Rejection{":gen_tcp", Capability::Network});
        REQUIRE(gate.check("Socket.open()") == Rejection{"Socket.", Capability::Network});
    }

    SECTION("Process spawning") {
        REQUIRE(gate.check("Process.spawn(fn() -> 1 end)") ==
                Rejection{"Process.spawn", Capability::ProcessSpawn});
        REQUIRE(gate.check("spawn_link(fn() -> 1 end)") == Rejection{"spawn", Capability::ProcessSpawn});
        REQUIRE(gate.check(":os.cmd('ls')") == Rejection{":os.", Capability::ProcessSpawn});
    }

    SECTION("Code evaluation") {
        REQUIRE(gate.check("Code.eval_string(\"1\")") == Rejection{"Code.eval", Capability::CodeEvaluation});
        REQUIRE(gate.check("Code.load_file(\"x\")") == Rejection{"Code.load", Capability::CodeEvaluation});
    }

    SECTION("Shared state") {
        REQUIRE(gate.check(":ets.new(:t, [])") == Rejection{":ets", Capability::SharedState});
        REQUIRE(gate.check("Agent.start_link(fn() -> 0 end)") == Rejection{"Agent.", Capability::SharedState});
        REQUIRE(gate.check("Task.async(fn() -> 1 end)") == Rejection{"Task.", Capability::SharedState});
    }

    SECTION("Shell") {
        REQUIRE(gate.check("Port.open({:spawn, \"ls\"}, [])") == Rejection{"Port.", Capability::ShellCommand});
        REQUIRE(gate.check(":erlang.port_info(p)") == Rejection{":erlang.port", Capability::ShellCommand});
    }
}

TEST_CASE("The first matching rule in table order is reported") {
    const SafetyGate gate;

    // "System." precedes "System.cmd"
    REQUIRE(gate.check("System.cmd(\"ls\", [])") == Rejection{"System.", Capability::ProcessSpawn});

    // Both rules match; "File." is listed first
    REQUIRE(gate.check("Task.async(fn() -> File.read(\"x\") end)") == Rejection{"File.", Capability::Filesystem});
}

TEST_CASE("Matches inside comments and strings are still rejected") {
    const SafetyGate gate;

    REQUIRE(gate.check("# File.read is not allowed\n1 + 1").has_error());
    REQUIRE(gate.check("IO.puts(\"System.halt\")").has_error());
}

TEST_CASE("Matching is case sensitive and literal") {
    const SafetyGate gate;

    REQUIRE(gate.check("file.read").has_value());
    REQUIRE(gate.check("Files").has_value());
    // '.' is literal in the default patterns
    REQUIRE(gate.check("FileX").has_value());
}

TEST_CASE("Capabilities have readable descriptions") {
    REQUIRE(codekata::describe(Capability::Filesystem) == "filesystem access");
    REQUIRE(codekata::describe(Capability::Network) == "network access");
    REQUIRE(codekata::describe(Capability::ShellCommand) == "shell command execution");
}

TEST_CASE("Custom rule tables") {
    const SafetyGate gate{std::vector<SafetyRule>{{"forbidden", Capability::CodeEvaluation, R"(\bforbidden\b)"}}};

    REQUIRE(gate.rules().size() == 1);
    REQUIRE(gate.check("x = forbidden") == Rejection{"forbidden", Capability::CodeEvaluation});
    REQUIRE(gate.check("x = unforbidden").has_value());
    REQUIRE(gate.check("File.read(\"x\")").has_value());

    REQUIRE_THROWS_AS(SafetyGate{std::vector<SafetyRule>{{"bad", Capability::Network, "("}}}, std::regex_error);
}
