#include <gtest/gtest.h>

#include "BodyDecoder.hpp"
#include "HttpError.hpp"

using namespace minnow;

namespace {

constexpr const char* BOUNDARY_TYPE = "multipart/form-data; boundary=XyZ";

std::string file_part(const std::string& name, const std::string& filename,
                      const std::string& payload, const std::string& type = "") {
    std::string part = "--XyZ\r\nContent-Disposition: form-data; name=\"" + name +
                       "\"; filename=\"" + filename + "\"\r\n";
    if (!type.empty()) part += "Content-Type: " + type + "\r\n";
    part += "\r\n" + payload + "\r\n";
    return part;
}

std::string field_part(const std::string& name, const std::string& value) {
    return "--XyZ\r\nContent-Disposition: form-data; name=\"" + name + "\"\r\n\r\n" + value +
           "\r\n";
}

}  // namespace

TEST(BodyDecoderTest, UrlEncodedBodyBecomesFields) {
    auto decoded =
        decode_body("name=J%C3%B6rg+B&tag=a&tag=b&empty=", "application/x-www-form-urlencoded");
    EXPECT_EQ(decoded.fields["name"], std::vector<std::string>{"Jörg B"});
    EXPECT_EQ(decoded.fields["tag"], (std::vector<std::string>{"a", "b"}));
    EXPECT_EQ(decoded.fields["empty"], std::vector<std::string>{""});
    EXPECT_TRUE(decoded.files.empty());
}

TEST(BodyDecoderTest, UrlEncodedRoundTrip) {
    FieldMap fields{
        {"plain", {"value"}},
        {"spaced key", {"a b", "c+d"}},
        {"symbols", {"&=?#%/"}},
        {"utf8", {"żółw"}},
    };
    auto decoded = decode_body(encode_query(fields), "application/x-www-form-urlencoded");
    EXPECT_EQ(decoded.fields, fields);
}

TEST(BodyDecoderTest, SingleFilePart) {
    std::string body = file_part("file", "x.txt", "P") + "--XyZ--\r\n";
    auto decoded = decode_body(body, BOUNDARY_TYPE);

    ASSERT_EQ(decoded.files.count("file"), 1u);
    const auto& record = decoded.files["file"];
    EXPECT_EQ(record.filename, "x.txt");
    EXPECT_EQ(record.data, "P");
    EXPECT_EQ(record.content_type, "application/octet-stream");
    EXPECT_TRUE(decoded.fields.empty());
}

TEST(BodyDecoderTest, MixedPartsKeepPartContentTypeAndBinaryPayload) {
    std::string binary("\x00\x01\r\n\xff", 5);
    std::string body = field_part("title", "Report") + field_part("title", "Second") +
                       file_part("doc", "report.pdf", binary, "application/pdf") + "--XyZ--\r\n";
    auto decoded = decode_body(body, BOUNDARY_TYPE);

    EXPECT_EQ(decoded.fields["title"], (std::vector<std::string>{"Report", "Second"}));
    ASSERT_EQ(decoded.files.count("doc"), 1u);
    EXPECT_EQ(decoded.files["doc"].content_type, "application/pdf");
    EXPECT_EQ(decoded.files["doc"].data, binary);
}

TEST(BodyDecoderTest, QuotedBoundaryAndCaseInsensitiveType) {
    std::string body = field_part("a", "1") + "--XyZ--\r\n";
    auto decoded = decode_body(body, "Multipart/Form-Data; charset=utf-8; boundary=\"XyZ\"");
    EXPECT_EQ(decoded.fields["a"], std::vector<std::string>{"1"});
}

TEST(BodyDecoderTest, EmptyFilenameIsAFormField) {
    std::string body = file_part("file", "", "") + "--XyZ--\r\n";
    auto decoded = decode_body(body, BOUNDARY_TYPE);
    EXPECT_TRUE(decoded.files.empty());
    EXPECT_EQ(decoded.fields["file"], std::vector<std::string>{""});
}

TEST(BodyDecoderTest, MissingBoundaryIsMalformed) {
    EXPECT_THROW(decode_body("whatever", "multipart/form-data"), MalformedBody);
    try {
        decode_body("whatever", "multipart/form-data; charset=utf-8");
        FAIL() << "expected MalformedBody";
    } catch (const HttpError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::MalformedBody);
        EXPECT_EQ(e.status(), 400);
    }
}

TEST(BodyDecoderTest, PartWithoutHeaderSeparatorIsSkipped) {
    std::string body = "--XyZ\r\nContent-Disposition: form-data; name=\"broken\"\r\n" +
                       field_part("ok", "yes") + "--XyZ--\r\n";
    auto decoded = decode_body(body, BOUNDARY_TYPE);
    EXPECT_EQ(decoded.fields.count("broken"), 0u);
    EXPECT_EQ(decoded.fields["ok"], std::vector<std::string>{"yes"});
}

TEST(BodyDecoderTest, OtherContentTypesYieldNothing) {
    auto decoded = decode_body(R"({"a":1})", "application/json");
    EXPECT_TRUE(decoded.fields.empty());
    EXPECT_TRUE(decoded.files.empty());
}

TEST(BodyDecoderTest, MissingContentTypeParsesAsForm) {
    auto decoded = decode_body("a=1", "");
    EXPECT_EQ(decoded.fields["a"], std::vector<std::string>{"1"});
}

TEST(BodyDecoderTest, QueryParsing) {
    auto fields = parse_query("q=hello+world&flag&q=%2B");
    EXPECT_EQ(fields["q"], (std::vector<std::string>{"hello world", "+"}));
    EXPECT_EQ(fields["flag"], std::vector<std::string>{""});
    EXPECT_TRUE(parse_query("").empty());
}
