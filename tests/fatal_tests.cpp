#include <catch2/catch_test_macros.hpp>
#include "../src/core/corridor.hpp"
#include <csignal>
#include <cstdio>
#include <functional>
#include <sys/wait.h>
#include <unistd.h>

// Misuse of the scheduler ends the process. Each case runs the offending call
// in a forked child and checks that it died from SIGABRT.

using namespace corridor;

namespace {

struct Unregistered {
    int value = 0;
};

// Returns the child's wait status.
int run_in_child(const std::function<void()>& body) {
    std::fflush(nullptr);
    const pid_t pid = fork();
    if (pid == 0) {
        body();
        _exit(0);
    }
    int status = 0;
    if (pid < 0 || waitpid(pid, &status, 0) != pid) return -1;
    return status;
}

bool aborted(int status) {
    return status != -1 && WIFSIGNALED(status) && WTERMSIG(status) == SIGABRT;
}

} // namespace

TEST_CASE("Reading a missing resource aborts", "[fatal]") {
    const int status = run_in_child([] {
        App app = App::create().build();
        app.resource<Unregistered>().value = 1;
    });
    CHECK(aborted(status));
}

TEST_CASE("A missing resource inside a system aborts", "[fatal]") {
    const int status = run_in_child([] {
        App app = App::create()
            .add_system([](Context& ctx) { ctx.resource<Unregistered>().value++; })
            .build();
        app.tick();
    });
    CHECK(aborted(status));
}

TEST_CASE("Building twice aborts", "[fatal]") {
    const int status = run_in_child([] {
        AppBuilder builder = App::create();
        App first = builder.build();
        first.tick();
        App second = builder.build();
        second.tick();
    });
    CHECK(aborted(status));
}

TEST_CASE("Registering after build aborts", "[fatal]") {
    const int status = run_in_child([] {
        AppBuilder builder = App::create();
        App app = builder.build();
        builder.add_system([](Context&) {});
        app.tick();
    });
    CHECK(aborted(status));
}

TEST_CASE("A healthy child exits normally", "[fatal]") {
    const int status = run_in_child([] {
        App app = App::create().insert_resource(Unregistered{}).build();
        app.resource<Unregistered>().value = 1;
    });
    REQUIRE(status != -1);
    CHECK(WIFEXITED(status));
    CHECK(WEXITSTATUS(status) == 0);
}
