#include "chsync/network/http_types.hpp"

#include <gtest/gtest.h>

using namespace chsync::network;

TEST(UrlTest, ParsesHttpsWithDefaultPort) {
    auto url = Url::parse("https://api.telegram.org/bot123:abc/getMe");
    ASSERT_TRUE(url.is_ok()) << url.error();
    EXPECT_EQ(url.value().scheme, "https");
    EXPECT_EQ(url.value().host, "api.telegram.org");
    EXPECT_EQ(url.value().port, "443");
    EXPECT_EQ(url.value().target, "/bot123:abc/getMe");
    EXPECT_TRUE(url.value().is_tls());
}

TEST(UrlTest, ParsesExplicitPortAndQuery) {
    auto url = Url::parse("HTTP://localhost:3000?x=1");
    ASSERT_TRUE(url.is_ok());
    EXPECT_EQ(url.value().scheme, "http");
    EXPECT_EQ(url.value().host, "localhost");
    EXPECT_EQ(url.value().port, "3000");
    EXPECT_EQ(url.value().target, "/?x=1");
    EXPECT_FALSE(url.value().is_tls());
}

TEST(UrlTest, RootTargetWhenPathIsMissing) {
    auto url = Url::parse("http://example.com");
    ASSERT_TRUE(url.is_ok());
    EXPECT_EQ(url.value().port, "80");
    EXPECT_EQ(url.value().target, "/");
}

TEST(UrlTest, StripsIpv6Brackets) {
    auto with_port = Url::parse("http://[::1]:8080/health");
    ASSERT_TRUE(with_port.is_ok());
    EXPECT_EQ(with_port.value().host, "::1");
    EXPECT_EQ(with_port.value().port, "8080");

    auto without_port = Url::parse("https://[fe80::1]/");
    ASSERT_TRUE(without_port.is_ok());
    EXPECT_EQ(without_port.value().host, "fe80::1");
    EXPECT_EQ(without_port.value().port, "443");
}

TEST(UrlTest, RejectsUnsupportedInput) {
    EXPECT_TRUE(Url::parse("localhost:3000").is_error());
    EXPECT_TRUE(Url::parse("ftp://example.com").is_error());
    EXPECT_TRUE(Url::parse("http:///path").is_error());
    EXPECT_TRUE(Url::parse("http://user:pw@example.com").is_error());
    EXPECT_TRUE(Url::parse("http://example.com:http/").is_error());
    EXPECT_TRUE(Url::parse("http://example.com:/").is_error());
}

TEST(HttpHeadersTest, LookupIsCaseInsensitive) {
    HttpResponse response;
    response.headers["content-type"] = "application/json; charset=utf-8";
    response.headers["Retry-After"] = "12";

    EXPECT_EQ(response.get_header("Content-Type"), "application/json; charset=utf-8");
    EXPECT_EQ(response.get_header("retry-after"), "12");
    EXPECT_EQ(response.get_header("X-Missing"), "");
    EXPECT_TRUE(response.has_content_type("application/json"));
    EXPECT_FALSE(response.has_content_type("text/html"));
}

TEST(HttpHeadersTest, JsonBodySetsContentType) {
    HttpRequest request;
    request.set_json_body(R"({"a":1})");
    EXPECT_EQ(request.get_header("content-type"), "application/json");
    EXPECT_EQ(request.body, R"({"a":1})");
}

TEST(HttpResponseTest, SuccessRange) {
    HttpResponse response;
    response.status_code = 204;
    EXPECT_TRUE(response.is_success());
    response.status_code = 302;
    EXPECT_FALSE(response.is_success());
}

TEST(UrlEncodeTest, EncodesReservedCharacters) {
    EXPECT_EQ(url_encode("abc-_.~XYZ019"), "abc-_.~XYZ019");
    EXPECT_EQ(url_encode("123:ab/c d"), "123%3Aab%2Fc%20d");
    EXPECT_EQ(url_encode("@chan"), "%40chan");
    EXPECT_EQ(encode_query({{"chat_id", "@chan"}, {"user_id", "42"}}), "chat_id=%40chan&user_id=42");
    EXPECT_EQ(encode_query({}), "");
}

TEST(HttpMethodTest, Names) {
    EXPECT_EQ(to_string(HttpMethod::GET), "GET");
    EXPECT_EQ(to_string(HttpMethod::POST), "POST");
    EXPECT_EQ(to_string(HttpMethod::DELETE_METHOD), "DELETE");
}
