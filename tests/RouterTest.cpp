#include <gtest/gtest.h>

#include "Router.hpp"

using namespace minnow;

namespace {

HandlerFn ok_handler() {
    return [](RequestContext&, Arguments) -> boost::asio::awaitable<HandlerResult> {
        co_return Body{std::string{"ok"}};
    };
}

Router make_router() {
    Router router;
    router.add("index", {"page"}, ok_handler());
    router.add("greet", {"id", {"name", "anon"}}, ok_handler());
    return router;
}

}  // namespace

TEST(RouterTest, EmptyPathSelectsIndexWithoutParams) {
    auto router = make_router();
    for (const char* path : {"", "/", "//"}) {
        auto match = router.resolve(path);
        EXPECT_EQ(match.name, "index") << path;
        EXPECT_TRUE(match.positional.empty()) << path;
        EXPECT_FALSE(match.fallback) << path;
        EXPECT_EQ(match.route, router.find("index"));
    }
}

TEST(RouterTest, FirstSegmentSelectsHandler) {
    auto router = make_router();
    auto match = router.resolve("/greet/42/extra");
    EXPECT_EQ(match.name, "greet");
    EXPECT_EQ(match.route, router.find("greet"));
    EXPECT_EQ(match.positional, (std::vector<std::string>{"42", "extra"}));
    EXPECT_FALSE(match.fallback);
}

TEST(RouterTest, UnknownNameFallsBackWithWholePath) {
    auto router = make_router();
    auto match = router.resolve("a/b/c");
    EXPECT_EQ(match.name, "index");
    EXPECT_EQ(match.route, router.find("index"));
    EXPECT_EQ(match.positional, (std::vector<std::string>{"a", "b", "c"}));
    EXPECT_TRUE(match.fallback);
}

TEST(RouterTest, MissingFallbackYieldsNoRoute) {
    Router router;
    router.add("greet", {"id"}, ok_handler());
    EXPECT_EQ(router.resolve("nothing").route, nullptr);
    EXPECT_EQ(router.resolve("").route, nullptr);
}

TEST(RouterTest, ExplicitIndexIsAnOrdinaryMatch) {
    auto router = make_router();
    auto match = router.resolve("/index/2");
    EXPECT_FALSE(match.fallback);
    EXPECT_EQ(match.positional, std::vector<std::string>{"2"});
}

TEST(RouterTest, SplitKeepsInnerAndTrailingEmptySegments) {
    EXPECT_EQ(Router::split_path("/a//b/"), (std::vector<std::string>{"a", "", "b", ""}));
    EXPECT_TRUE(Router::split_path("///").empty());
}

TEST(RouterTest, RejectsEmptyCallable) {
    Router router;
    EXPECT_THROW(router.add("x", {}, HandlerFn{}), std::invalid_argument);
    EXPECT_THROW(router.add_websocket("x", WebSocketHandlerFn{}), std::invalid_argument);
}

TEST(RouterTest, WebSocketHandlersAreSeparate) {
    Router router;
    router.add_websocket("echo", [](WebSocketStream&, std::vector<std::string>)
                                     -> boost::asio::awaitable<void> { co_return; });
    EXPECT_NE(router.find_websocket("echo"), nullptr);
    EXPECT_EQ(router.find("echo"), nullptr);
}
