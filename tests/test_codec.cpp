/**
 * @file test_codec.cpp
 * @brief Tests for marshal/unmarshal using Google Test
 */

#include <gtest/gtest.h>
#include "patchmaker/Codec.hpp"

#include <map>
#include <vector>

using namespace patchmaker;

namespace codec_test {

struct Endpoint {
    std::string host;
    int port = 0;
    std::vector<std::string> tags;
    std::map<std::string, std::string> labels;
};

NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(Endpoint, host, port, tags, labels)

} // namespace codec_test

using codec_test::Endpoint;

TEST(Marshal, StructIsCompactWithSortedKeys) {
    Endpoint ep{"db", 5432, {"primary"}, {{"zone", "a"}}};
    EXPECT_EQ(marshal(ep), R"({"host":"db","labels":{"zone":"a"},"port":5432,"tags":["primary"]})");
}

TEST(Marshal, ValuePassesThrough) {
    Value doc = Value::parse(R"({ "b": [1, 2], "a": null })");
    EXPECT_EQ(marshal(doc), R"({"a":null,"b":[1,2]})");
}

TEST(Marshal, SameContentSameBytes) {
    Value first = Value::parse(R"({"x":1,"y":{"q":true,"p":false}})");
    Value second = Value::parse(R"({"y":{"p":false,"q":true},"x":1})");
    EXPECT_EQ(marshal(first), marshal(second));
}

TEST(Marshal, InvalidUtf8RaisesEncodingError) {
    Endpoint ep{"\xff\xfe", 1, {}, {}};
    EXPECT_THROW(marshal(ep), EncodingError);
}

TEST(Marshal, EncodingErrorCarriesCause) {
    Value doc = {{"name", "\xc3"}};
    try {
        marshal(doc);
        FAIL() << "expected EncodingError";
    } catch (const EncodingError& e) {
        EXPECT_EQ(e.step(), "marshal value");
        EXPECT_FALSE(e.details().empty());
    }
}

TEST(Unmarshal, RoundTrip) {
    Endpoint ep{"web", 80, {"a", "b"}, {{"team", "ops"}}};
    Endpoint back = unmarshal<Endpoint>(marshal(ep));
    EXPECT_EQ(back.host, "web");
    EXPECT_EQ(back.port, 80);
    EXPECT_EQ(back.tags, ep.tags);
    EXPECT_EQ(back.labels, ep.labels);
}

TEST(Unmarshal, MalformedBytesRaiseDecodingError) {
    EXPECT_THROW(unmarshal<Value>("{\"a\":"), DecodingError);
}

TEST(Unmarshal, ShapeMismatchRaisesDecodingError) {
    EXPECT_THROW(unmarshal<Endpoint>(R"({"host":"web","port":"eighty","tags":[],"labels":{}})"),
                 DecodingError);
    EXPECT_THROW(unmarshal<Endpoint>(R"({"host":"web"})"), DecodingError);
}
