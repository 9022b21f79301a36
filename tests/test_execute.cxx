#include <cassert>
#include <cstddef>
#include <cstdint>
#include <sstream>
#include <string>
#include <vector>

#include "bfwalk.hxx"
#include "helpers.hxx"

using bfwalk::Status;

static bfwalk::Options withLimit(std::uint64_t cycles, std::size_t tapeSize = 64) {
    bfwalk::Options options;
    options.cycleLimit = cycles;
    options.tapeSize = tapeSize;
    return options;
}

static void test_loops() {
    std::ostringstream out;
    bfwalk::Context ctx(2, BFWALK_DEFAULT_CYCLE_LIMIT, nullptr, out);
    assert(runIn(ctx, "++[>++<-]") == Status::Ok);
    assert(ctx.cells()[0] == 0);
    assert(ctx.cells()[1] == 4);
    assert(ctx.pointer() == 0);
}

static void test_io() {
    Status ret;
    std::string out = runProgram(",.", "A", &ret);
    assert(ret == Status::Ok);
    assert(out == "A");

    out = runProgram(",.", std::string(1, static_cast<char>(65)), &ret);
    assert(out.size() == 1 && static_cast<unsigned char>(out[0]) == 65);

    // exhausted input reads as zero and keeps running
    out = runProgram("+,.,.", "", &ret);
    assert(ret == Status::Ok);
    assert(out == std::string(2, '\0'));
}

static void test_no_input_source() {
    std::ostringstream out;
    Status ret = bfwalk::execute("+,.", nullptr, out, bfwalk::Options{});
    assert(ret == Status::Ok);
    assert(out.str() == std::string(1, '\0'));
    (void)ret;
}

static void test_wrapping() {
    std::ostringstream out;
    bfwalk::Context ctx(4, 100, nullptr, out);
    assert(runIn(ctx, "-") == Status::Ok);
    assert(ctx.cell() == 255);
    assert(runIn(ctx, "<") == Status::Ok);
    assert(ctx.pointer() == 3);
    assert(runIn(ctx, ">") == Status::Ok);
    assert(ctx.pointer() == 0);
    assert(runIn(ctx, "+") == Status::Ok);
    assert(ctx.cell() == 0);
}

static void test_print_walk() {
    std::ostringstream out;
    bfwalk::Context ctx(8, BFWALK_DEFAULT_CYCLE_LIMIT, nullptr, out, std::string("\x03\x05", 2));
    assert(runIn(ctx, "[.>]") == Status::Ok);
    assert(out.str() == std::string("\x03\x05", 2));
    assert(ctx.pointer() == 2);
}

static void test_initial_tape_through_execute() {
    Status ret;
    std::string out = runProgram("[.>]", "", &ret, withLimit(1000, 8), nullptr, "hi");
    assert(ret == Status::Ok);
    assert(out == "hi");
}

static void test_zero_iterations() {
    Status ret;
    bfwalk::ProfileInfo profile;
    std::string out = runProgram("[.+.]", "", &ret, withLimit(1000), &profile);
    assert(ret == Status::Ok);
    assert(out.empty());
    assert(profile.instructions == 0);
}

static void test_cycle_limit() {
    Status ret;
    std::string out = runProgram("+[]", "", &ret, withLimit(1000));
    assert(ret == Status::CycleLimit);
    assert(out.empty());

    // output flushed before the limit stays valid
    out = runProgram("+++[.]", "", &ret, withLimit(10));
    assert(ret == Status::CycleLimit);
    assert(out == std::string(3, '\x03'));
}

static void test_cycle_accounting() {
    // leaves cost one unit each, every pass through a loop body costs one more
    Status ret;
    bfwalk::ProfileInfo profile;
    runProgram("+++", "", &ret, withLimit(3), &profile);
    assert(ret == Status::Ok);
    assert(profile.instructions == 3);

    runProgram("+++", "", &ret, withLimit(2));
    assert(ret == Status::CycleLimit);

    runProgram("+[-]", "", &ret, withLimit(3), &profile);
    assert(ret == Status::Ok);
    assert(profile.instructions == 3);

    std::ostringstream out;
    bfwalk::Context ctx(4, 2, nullptr, out);
    assert(runIn(ctx, "+[-]") == Status::CycleLimit);
    assert(ctx.cell() == 1);
    assert(ctx.cyclesLeft() == 0);
}

static void test_syntax_error_runs_nothing() {
    Status ret;
    std::string out = runProgram("+.#", "", &ret);
    assert(ret == Status::SyntaxError);
    assert(out.empty());

    bfwalk::ParseError error;
    std::ostringstream sink;
    ret = bfwalk::execute("..x", nullptr, sink, bfwalk::Options{}, nullptr, {}, &error);
    assert(ret == Status::SyntaxError);
    assert(error.offset == 2 && error.token == 'x');
    assert(sink.str().empty());
}

static void test_brackets() {
    Status ret;
    std::string out = runProgram("]", "", &ret);
    assert(ret == Status::Ok);
    assert(out.empty());

    // a stray ']' ends the program, even before an invalid byte
    out = runProgram("+.].#", "", &ret);
    assert(ret == Status::Ok);
    assert(out == std::string(1, '\x01'));

    // an unclosed loop runs as if closed at the end
    out = runProgram("+++[.-", "", &ret);
    assert(ret == Status::Ok);
    assert(out == std::string("\x03\x02\x01", 3));

    bfwalk::Options strict;
    strict.strict = true;
    out = runProgram("+.]", "", &ret, strict);
    assert(ret == Status::UnmatchedClose);
    assert(out.empty());
    out = runProgram("+.[", "", &ret, strict);
    assert(ret == Status::UnmatchedOpen);
    assert(out.empty());
}

static void test_deep_nesting() {
    // every level is entered once and the innermost '-' lets all of them exit
    const std::string deepest = "+" + std::string(BFWALK_MAX_NESTING, '[') + "-" +
                                std::string(BFWALK_MAX_NESTING, ']') + ".";
    Status ret;
    bfwalk::ProfileInfo profile;
    std::string out = runProgram(deepest, "", &ret, bfwalk::Options{}, &profile);
    assert(ret == Status::Ok);
    assert(out == std::string(1, '\0'));
    assert(profile.instructions == BFWALK_MAX_NESTING + 3);

    // too deep to parse: reported, nothing runs, no crash
    out = runProgram("." + std::string(1000000, '['), "", &ret);
    assert(ret == Status::NestingTooDeep);
    assert(out.empty());
}

static void test_hello() {
    const std::string helloA = "++++++++[>++++++++<-]>+.";  // prints 'A'
    Status ret;
    assert(runProgram(helloA, "", &ret) == "A");
    assert(ret == Status::Ok);

    const std::string hello =
        "++++++++[>++++[>++>+++>+++>+<<<<-]>+>+>->>+[<]<-]>>.>---.+++++++..+++.>>.<-.<.+++.------."
        "--------.>>+.>++.";
    std::string out = runProgram(hello, "", &ret);
    assert(ret == Status::Ok);
    assert(out == "Hello World!\n");
}

static void test_deterministic_output() {
    // shifts every input byte up by one; exhausted input reads as 0 and ends the loop
    const std::string shift = ",[+.,]";
    const std::string input = "HAL 9000";
    Status ret1, ret2;
    const std::string out1 = runProgram(shift, input, &ret1);
    const std::string out2 = runProgram(shift, input, &ret2);
    assert(ret1 == Status::Ok && ret2 == Status::Ok);
    assert(out1 == "IBM!:111");
    assert(hashOutput(out1) == hashOutput(out2));
    assert(hashOutput(out1) != hashOutput(input));
}

int main() {
    test_loops();
    test_io();
    test_no_input_source();
    test_wrapping();
    test_print_walk();
    test_initial_tape_through_execute();
    test_zero_iterations();
    test_cycle_limit();
    test_cycle_accounting();
    test_syntax_error_runs_nothing();
    test_brackets();
    test_deep_nesting();
    test_hello();
    test_deterministic_output();
    return 0;
}
