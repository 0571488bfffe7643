#include <gtest/gtest.h>
#include <parexec/config_file.hh>
#include <string>
#include <vector>

using std::string;
using std::vector;

// NOLINTNEXTLINE
TEST(config_file, load_config_from_string) {
    ConfigFile cf;
    cf.add_vars("a", "b", "c", "arr", "empty", "esc", "num");
    cf.load_config_from_string(R"(
# comment
a: foo bar   # trailing comment
b = 'it''s quoted'
c: "tab\there \x41"
arr: [
    x, 'y z'
    "w" # comment inside
]
empty:
num = 42
ignored: 1
)");

    EXPECT_EQ(cf["a"].as_string(), "foo bar");
    EXPECT_EQ(cf["b"].as_string(), "it's quoted");
    EXPECT_EQ(cf["c"].as_string(), "tab\there A");
    EXPECT_TRUE(cf["arr"].is_array());
    EXPECT_EQ(cf["arr"].as_array(), (vector<string>{"x", "y z", "w"}));
    EXPECT_TRUE(cf["empty"].is_set());
    EXPECT_EQ(cf["empty"].as_string(), "");
    EXPECT_EQ(cf["num"].as<int>(), 42);
    EXPECT_FALSE(cf["esc"].is_set());
    EXPECT_FALSE(cf["ignored"].is_set());
    EXPECT_EQ(cf.get_vars().count("ignored"), 0);
}

// NOLINTNEXTLINE
TEST(config_file, load_all) {
    ConfigFile cf;
    cf.load_config_from_string("x: 1\ny: [a]\n", true);
    EXPECT_EQ(cf["x"].as<int>(), 1);
    EXPECT_EQ(cf["y"].as_array(), vector<string>{"a"});
}

// NOLINTNEXTLINE
TEST(config_file, unknown_variable_is_unset_and_empty) {
    ConfigFile cf;
    const auto& var = cf.get_var("missing");
    EXPECT_FALSE(var.is_set());
    EXPECT_FALSE(var.is_array());
    EXPECT_EQ(var.as_string(), "");
    EXPECT_TRUE(var.as_array().empty());
    EXPECT_EQ(&var, &cf["other"]);
}

// NOLINTNEXTLINE
TEST(config_file, reload_unsets_variables) {
    ConfigFile cf;
    cf.add_vars("a");
    cf.load_config_from_string("a: 1");
    EXPECT_TRUE(cf["a"].is_set());
    cf.load_config_from_string("");
    EXPECT_FALSE(cf["a"].is_set());
}

// NOLINTNEXTLINE
TEST(config_file, as_number) {
    ConfigFile cf;
    cf.load_config_from_string("a: 12x\nb: -3\nc: 7\n", true);
    EXPECT_EQ(cf["a"].as<int>(), std::nullopt);
    EXPECT_EQ(cf["b"].as<int>(), -3);
    EXPECT_EQ(cf["b"].as<unsigned>(), std::nullopt);
    EXPECT_EQ(cf["c"].as<size_t>(), 7);
}

// NOLINTNEXTLINE
TEST(config_file, parse_errors) {
    auto parse_error_of = [](const string& config) -> string {
        ConfigFile cf;
        try {
            cf.load_config_from_string(config, true);
        } catch (const ConfigFile::ParseError& pe) {
            return pe.what();
        }
        return "no error";
    };

    EXPECT_EQ(parse_error_of("a: 1\n= 2"), "line 2:1: Invalid or missing variable's name");
    EXPECT_EQ(parse_error_of("abc"), "line 1:4: Incomplete directive: `abc`");
    EXPECT_EQ(parse_error_of("a - 1"), "line 1:3: Invalid assignment operator: `-`");
    EXPECT_EQ(parse_error_of("a: 'x"), "line 1:6: Missing terminating ' character");
    EXPECT_EQ(parse_error_of("a: \"x"), "line 1:6: Missing terminating \" character");
    EXPECT_EQ(parse_error_of("a: \"\\q\""), "line 1:6: Unknown escape sequence: `\\q`");
    EXPECT_EQ(parse_error_of("a: 'x' y"), "line 1:8: Invalid sequence after the value: `y`");
    EXPECT_EQ(
        parse_error_of("a: [x\n"), "line 2:1: Missing terminating ] character at the end of an array"
    );
}

// NOLINTNEXTLINE
TEST(config_file, parse_error_diagnostics) {
    ConfigFile cf;
    try {
        cf.load_config_from_string("first: 1\nsecond - 2\n", true);
        FAIL() << "expected ParseError";
    } catch (const ConfigFile::ParseError& pe) {
        EXPECT_EQ(pe.diagnostics(), "second - 2\n       ^");
    }
}
