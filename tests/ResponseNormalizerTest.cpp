#include <gtest/gtest.h>

#include <boost/beast/core/string.hpp>

#include "HttpError.hpp"
#include "ResponseNormalizer.hpp"

using namespace minnow;

namespace {

int count(const HeaderList& headers, std::string_view name) {
    int n = 0;
    for (const auto& [key, value] : headers) {
        if (boost::beast::iequals(key, name)) ++n;
    }
    return n;
}

}  // namespace

TEST(ResponseNormalizerTest, BareBodyDefaultsTo200WithCookieAndContentType) {
    auto res = normalize_response(Body{std::string{"hi"}}, "sid");
    EXPECT_EQ(res.status, 200);
    EXPECT_EQ(res.reason, "OK");
    EXPECT_EQ(std::get<std::string>(res.body), "hi");
    EXPECT_EQ(find_header(res.headers, "set-cookie"),
              "session_id=sid; Path=/; HttpOnly; SameSite=Strict");
    EXPECT_EQ(find_header(res.headers, "content-type"), "text/html; charset=utf-8");
}

TEST(ResponseNormalizerTest, NormalizingTwiceNeverDuplicates) {
    auto res = normalize_response(StatusBody{200, std::string{"hi"}}, "sid");
    auto again = normalize_response(StatusBodyHeaders{res.status, std::string{"hi"}, res.headers},
                                    "sid");
    EXPECT_EQ(count(again.headers, "Content-Type"), 1);
    EXPECT_EQ(count(again.headers, "Set-Cookie"), 1);

    ensure_content_type(again.headers);
    ensure_session_cookie(again.headers, "sid");
    EXPECT_EQ(again.headers.size(), res.headers.size());
}

TEST(ResponseNormalizerTest, HandlerHeadersWinAndKeepOrder) {
    HeaderList handler_headers{{"content-type", "text/plain"},
                               {"Set-Cookie", "theme=dark"},
                               {"X-A", "1"}};
    auto res = normalize_response(StatusBodyHeaders{201, std::string{}, handler_headers}, "sid",
                                  {{"X-Pre", "p"}});

    ASSERT_EQ(res.headers.size(), 5u);
    EXPECT_EQ(res.headers[0].first, "X-Pre");
    EXPECT_EQ(res.headers[1], (Header{"content-type", "text/plain"}));
    EXPECT_EQ(res.headers[4].first, "Set-Cookie");
    EXPECT_EQ(count(res.headers, "Set-Cookie"), 2);  // unrelated cookie kept
    EXPECT_EQ(count(res.headers, "Content-Type"), 1);
}

TEST(ResponseNormalizerTest, HandlerSessionCookieIsRespected) {
    auto res = normalize_response(
        StatusBodyHeaders{200, std::string{}, {{"SET-COOKIE", "session_id=other; Path=/"}}}, "sid");
    EXPECT_EQ(count(res.headers, "Set-Cookie"), 1);
    EXPECT_EQ(find_header(res.headers, "Set-Cookie"), "session_id=other; Path=/");
}

TEST(ResponseNormalizerTest, SessionCookieAnywhereInHeaderIsRespected) {
    HeaderList headers{{"Set-Cookie", "theme=dark; session_id=abc"}};
    ensure_session_cookie(headers, "abc");
    EXPECT_EQ(count(headers, "Set-Cookie"), 1);

    auto res = normalize_response(StatusBodyHeaders{200, std::string{}, headers}, "abc");
    EXPECT_EQ(count(res.headers, "Set-Cookie"), 1);
    EXPECT_EQ(find_header(res.headers, "Set-Cookie"), "theme=dark; session_id=abc");
}

TEST(ResponseNormalizerTest, BodylessStatusesDropTheBody) {
    for (int status : {101, 204, 304}) {
        auto res = normalize_response(StatusBody{status, std::string{"x"}}, "sid");
        EXPECT_EQ(res.status, status);
        ASSERT_FALSE(res.streaming()) << status;
        EXPECT_TRUE(std::get<std::string>(res.body).empty()) << status;
        EXPECT_EQ(count(res.headers, "Set-Cookie"), 1);
    }

    auto streamed = normalize_response(StatusBody{204, ChunkStream::from_chunks({"a"})}, "sid");
    EXPECT_FALSE(streamed.streaming());

    EXPECT_TRUE(status_allows_body(200));
    EXPECT_TRUE(status_allows_body(404));
    EXPECT_FALSE(status_allows_body(100));
    EXPECT_FALSE(status_allows_body(204));
    EXPECT_FALSE(status_allows_body(304));
}

TEST(ResponseNormalizerTest, BytesAndStreamsPassThrough) {
    auto bytes = normalize_response(Body{Bytes{'a', 0, 'b'}}, "sid");
    EXPECT_EQ(std::get<std::string>(bytes.body), std::string("a\0b", 3));

    auto streamed = normalize_response(Body{ChunkStream::from_chunks({"a", "b"})}, "sid");
    ASSERT_TRUE(streamed.streaming());
    auto& stream = std::get<ChunkStream>(streamed.body);
    EXPECT_EQ(stream.next(), "a");
    EXPECT_EQ(stream.next(), "b");
    EXPECT_EQ(stream.next(), std::nullopt);
    EXPECT_TRUE(stream.exhausted());
}

TEST(ResponseNormalizerTest, InvalidShapesAreRejected) {
    EXPECT_THROW(normalize_response(StatusBody{42, std::string{}}, "sid"), InvalidResponseShape);
    EXPECT_THROW(normalize_response(StatusBody{1000, std::string{}}, "sid"), InvalidResponseShape);
    EXPECT_THROW(normalize_response(Body{ChunkStream{}}, "sid"), InvalidResponseShape);
}

TEST(ResponseNormalizerTest, ReasonPhrases) {
    EXPECT_EQ(reason_phrase(206), "Partial Content");
    EXPECT_EQ(reason_phrase(302), "Found");
    EXPECT_EQ(reason_phrase(403), "Forbidden");
    EXPECT_EQ(reason_phrase(404), "Not Found");
    EXPECT_EQ(reason_phrase(500), "Internal Server Error");
    EXPECT_EQ(reason_phrase(418), "OK");

    auto res = normalize_response(StatusBody{418, std::string{"teapot"}}, "sid");
    EXPECT_EQ(res.status, 418);
}

TEST(ResponseNormalizerTest, RedirectBuildsMetaRefresh) {
    auto r = redirect("/paste/1");
    EXPECT_EQ(r.status, 302);
    EXPECT_NE(std::get<std::string>(r.content).find("url=/paste/1"), std::string::npos);
    EXPECT_EQ(find_header(r.headers, "Location"), "/paste/1");
}
