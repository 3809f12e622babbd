#include <doctest/doctest.h>

#include <gsp/interpreter/InterpreterOptions.hpp>

#include <cstdlib>
#include <optional>
#include <string>
#include <utility>

using namespace GSP::Interpreter;

namespace {

class EnvGuard {
public:
    EnvGuard(std::string key, const char* value) : key(std::move(key)) {
        if (const char* existing = std::getenv(this->key.c_str())) {
            original = std::string(existing);
        }
        if (value) {
            setenv(this->key.c_str(), value, 1);
        } else {
            unsetenv(this->key.c_str());
        }
    }

    EnvGuard(const EnvGuard&)            = delete;
    EnvGuard& operator=(const EnvGuard&) = delete;

    ~EnvGuard() {
        if (original) {
            setenv(key.c_str(), original->c_str(), 1);
        } else {
            unsetenv(key.c_str());
        }
    }

private:
    std::string                key;
    std::optional<std::string> original;
};

} // namespace

TEST_SUITE("interpreter.options") {
TEST_CASE("InterpreterOptions defaults without environment overrides") {
    EnvGuard nodes{"GSP_MAX_NODES", nullptr};
    EnvGuard bytes{"GSP_MAX_LINE_BYTES", nullptr};
    EnvGuard marker{"GSP_BIND_MARKER", nullptr};
    EnvGuard depth{"GSP_MAX_DEPTH", nullptr};

    auto options = interpreterOptionsFromEnvironment();
    CHECK_EQ(options.max_depth, 256U);
    CHECK_EQ(options.max_nodes, InterpreterOptions::kUnlimitedNodes);
    CHECK_EQ(options.max_line_bytes, InterpreterOptions::kDefaultMaxLineBytes);
    CHECK_EQ(options.bind_marker, "$bind");
}

TEST_CASE("InterpreterOptions reads limits and marker from the environment") {
    EnvGuard nodes{"GSP_MAX_NODES", " 128 "};
    EnvGuard bytes{"GSP_MAX_LINE_BYTES", "4096"};
    EnvGuard marker{"GSP_BIND_MARKER", "@bind"};
    EnvGuard depth{"GSP_MAX_DEPTH", "32"};

    auto options = interpreterOptionsFromEnvironment();
    CHECK_EQ(options.max_depth, 32U);
    CHECK_EQ(options.max_nodes, 128U);
    CHECK_EQ(options.max_line_bytes, 4096U);
    CHECK_EQ(options.bind_marker, "@bind");
}

TEST_CASE("InterpreterOptions ignores unusable environment values") {
    EnvGuard nodes{"GSP_MAX_NODES", "lots"};
    EnvGuard bytes{"GSP_MAX_LINE_BYTES", "0"};
    EnvGuard marker{"GSP_BIND_MARKER", "   "};
    EnvGuard depth{"GSP_MAX_DEPTH", "0"};

    InterpreterOptions defaults;
    defaults.max_nodes = 7;
    auto options       = interpreterOptionsFromEnvironment(defaults);
    CHECK_EQ(options.max_nodes, 7U);
    CHECK_EQ(options.max_line_bytes, InterpreterOptions::kDefaultMaxLineBytes);
    CHECK_EQ(options.bind_marker, "$bind");
    CHECK_EQ(options.max_depth, GSP::Protocol::kDefaultMaxDepth);
}
}
