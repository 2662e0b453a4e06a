#include "Shell.hpp"
#include "Session.hpp"
#include "Vfs.hpp"
#include "TestUtils.hpp"

#include <cassert>
#include <iostream>
#include <sstream>
#include <string>

static SessionOptions testOptions() {
    SessionOptions opts;
    opts.user = "u";
    opts.host = "h";
    return opts;
}

static void test_simple_scenario() {
    Vfs v(makeSimpleTree());
    Session s(v);
    std::istringstream in("ls\ncd dir_1\nls\ncat file_a.txt\nexit\nls\n");
    std::ostringstream out, err;

    auto end = Shell::runSession(v, s, in, out, err, testOptions());
    assert(end == SessionEnd::Exit);
    assert(s.terminated);
    assert(out.str() == "dir_1/\nfile_a.txt\nhello\n");
    assert(err.str().empty());
    assert(Vfs::fullPathOf(s.cwd) == "/dir_1");
}

static void test_startup_script_echo_and_errors() {
    Vfs v(makeSimpleTree());
    Session s(v);
    std::istringstream in(
        "# comment\n"
        "\n"
        "ls\n"
        "cd dir_1\n"
        "ls \"file with unclosed quote\n"
        "unknown_cmd --test\n"
        "cat file_a.txt\n"
        "exit\n"
        "cat file_a.txt\n");
    std::ostringstream out, err;
    auto opts = testOptions();
    opts.echoCommands = true;

    auto end = Shell::runSession(v, s, in, out, err, opts);
    assert(end == SessionEnd::Exit);
    assert(out.str() ==
        "Executing: u@h:/$ ls\n"
        "dir_1/\n"
        "Executing: u@h:/$ cd dir_1\n"
        "Executing: u@h:/dir_1$ ls \"file with unclosed quote\n"
        "Executing: u@h:/dir_1$ unknown_cmd --test\n"
        "Executing: u@h:/dir_1$ cat file_a.txt\n"
        "hello\n"
        "Executing: u@h:/dir_1$ exit\n");
    assert(err.str() ==
        "shell: parser error: No closing quotation\n"
        "shell: ERROR in script line 5: Skipping command.\n"
        "shell: unknown_cmd: command not found\n");
}

static void test_deep_scenario_errors_continue() {
    Vfs v(makeDeepTree());
    Session s(v);
    std::istringstream in(
        "cat level1\n"
        "cat no_such_file.txt\n"
        "cd level1/level2/level3\n"
        "cd file.txt\n"
        "cd no_such_dir\n"
        "cat file.txt\n");
    std::ostringstream out, err;

    auto end = Shell::runSession(v, s, in, out, err, testOptions());
    assert(end == SessionEnd::EndOfInput);
    assert(!s.terminated);
    assert(out.str() == "deep file\n");
    assert(err.str() ==
        "shell: cat: level1: Is a directory\n"
        "shell: cat: no_such_file.txt: No such file or directory\n"
        "shell: cd: file.txt: Not a directory\n"
        "shell: cd: no_such_dir: No such file or directory\n");
    assert(Vfs::fullPathOf(s.cwd) == "/level1/level2/level3");
}

static void test_interactive_prompt_and_eof() {
    Vfs v(makeSimpleTree());
    Session s(v);
    std::istringstream in("cd dir_1\n");
    std::ostringstream out, err;
    auto opts = testOptions();
    opts.interactive = true;

    auto end = Shell::runSession(v, s, in, out, err, opts);
    assert(end == SessionEnd::EndOfInput);
    assert(out.str() == "u@h:/$ u@h:/dir_1$ \n");
    assert(Shell::makePrompt(s, opts) == "u@h:/dir_1$ ");
}

static void test_sessions_share_one_tree() {
    Vfs v(makeSimpleTree());
    Session a(v), b(v);
    std::istringstream inA("cd dir_1\nexit\n");
    std::istringstream inB("ls\n");
    std::ostringstream outA, outB, err;

    assert(Shell::runSession(v, a, inA, outA, err, testOptions()) == SessionEnd::Exit);
    assert(Shell::runSession(v, b, inB, outB, err, testOptions()) == SessionEnd::EndOfInput);
    assert(Vfs::fullPathOf(a.cwd) == "/dir_1");
    assert(b.cwd == v.root());
    assert(outB.str() == "dir_1/\n");
}

static void test_terminated_session_reads_nothing() {
    Vfs v(makeSimpleTree());
    Session s(v);
    s.terminated = true;
    std::istringstream in("ls\n");
    std::ostringstream out, err;
    assert(Shell::runSession(v, s, in, out, err, testOptions()) == SessionEnd::Exit);
    assert(out.str().empty());
    std::string rest;
    assert(std::getline(in, rest) && rest == "ls");
}

int main() {
    test_simple_scenario();
    test_startup_script_echo_and_errors();
    test_deep_scenario_errors_continue();
    test_interactive_prompt_and_eof();
    test_sessions_share_one_tree();
    test_terminated_session_reads_nothing();
    std::cout << "[OK] test_session\n";
}
