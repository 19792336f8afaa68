#include <gtest/gtest.h>

#include "ArgumentBinder.hpp"
#include "HttpError.hpp"

using namespace minnow;

namespace {

struct Sources {
    std::vector<std::string> positional;
    FieldMap query;
    FieldMap body;
    FileMap files;
    boost::json::object session;

    BindingSources view() const { return {positional, query, body, files, session}; }
};

HandlerDescriptor handler(std::vector<Parameter> params) { return {"h", std::move(params)}; }

}  // namespace

TEST(ArgumentBinderTest, PositionalThenDefault) {
    Sources s;
    s.positional = {"42"};
    auto args = bind_arguments(handler({"id", {"name", "anon"}}), s.view());

    ASSERT_EQ(args.size(), 2u);
    EXPECT_EQ(std::get<std::string>(args[0]), "42");
    EXPECT_EQ(std::get<boost::json::value>(args[1]), boost::json::value("anon"));
    EXPECT_EQ(as_string(args[1]), "anon");
}

TEST(ArgumentBinderTest, PositionalParamsAreConsumedInOrderRegardlessOfName) {
    Sources s;
    s.positional = {"x", "y"};
    s.query = {{"b", {"from-query"}}, {"c", {"q"}}};
    auto args = bind_arguments(handler({"a", "b", "c"}), s.view());

    EXPECT_EQ(as_string(args[0]), "x");
    EXPECT_EQ(as_string(args[1]), "y");
    EXPECT_EQ(as_string(args[2]), "q");
}

TEST(ArgumentBinderTest, PrecedenceQueryBodyFileSessionDefault) {
    Sources s;
    s.query = {{"p", {"query", "second"}}};
    s.body = {{"p", {"body"}}, {"q", {"body"}}};
    s.files = {{"q", FileRecord{"f.txt", "text/plain", "data"}},
               {"r", FileRecord{"r.bin", "application/octet-stream", "bin"}}};
    s.session = {{"r", "session"}, {"t", 7}};

    auto args = bind_arguments(handler({"p", "q", "r", "t", {"u", true}}), s.view());
    ASSERT_EQ(args.size(), 5u);
    EXPECT_EQ(as_string(args[0]), "query");
    EXPECT_EQ(as_string(args[1]), "body");
    ASSERT_NE(as_file(args[2]), nullptr);
    EXPECT_EQ(as_file(args[2])->filename, "r.bin");
    EXPECT_EQ(std::get<boost::json::value>(args[3]), boost::json::value(7));
    EXPECT_EQ(std::get<boost::json::value>(args[4]), boost::json::value(true));
}

TEST(ArgumentBinderTest, MissingRequiredParameterNamesIt) {
    Sources s;
    s.positional = {"1"};
    try {
        bind_arguments(handler({"id", "name"}), s.view());
        FAIL() << "expected MissingParameter";
    } catch (const MissingParameter& e) {
        EXPECT_EQ(e.name(), "name");
        EXPECT_EQ(e.status(), 400);
        EXPECT_EQ(e.client_message(), "400 Bad Request: Missing required parameter 'name'");
    }
}

TEST(ArgumentBinderTest, RepeatedBindsAreIdentical) {
    Sources s;
    s.positional = {"a", "b"};
    s.query = {{"z", {"1"}}};
    auto h = handler({"x", "y", "z", {"w", nullptr}});

    auto first = bind_arguments(h, s.view());
    auto second = bind_arguments(h, s.view());
    EXPECT_EQ(first, second);
    EXPECT_TRUE(is_null(first[3]));
}

TEST(ArgumentBinderTest, NoParametersBindsNothingAndIgnoresPositionals) {
    Sources s;
    s.positional = {"unused"};
    EXPECT_TRUE(bind_arguments(handler({}), s.view()).empty());
}
