#include <gtest/gtest.h>

#include "src/utils/json_utils.hpp"

TEST(JsonUtilsTest, PrettyPrintsNestedDocuments) {
    const std::string pretty = json_utils::pretty_print(R"({"args":{},"data":{"name":"request #1","requests_sent":1},"list":[1,true,null]})");

    EXPECT_EQ(pretty,
              "{\n"
              "  \"args\": {},\n"
              "  \"data\": {\n"
              "    \"name\": \"request #1\",\n"
              "    \"requests_sent\": 1\n"
              "  },\n"
              "  \"list\": [\n"
              "    1,\n"
              "    true,\n"
              "    null\n"
              "  ]\n"
              "}");
}

TEST(JsonUtilsTest, PrettyPrintKeepsEscapes) {
    EXPECT_EQ(json_utils::pretty_print(R"(["a\"b\\c\n"])"), "[\n  \"a\\\"b\\\\c\\n\"\n]");
}

TEST(JsonUtilsTest, InvalidJsonRaisesSerializationError) {
    EXPECT_THROW(json_utils::pretty_print("<html>Bad Gateway</html>"), json_utils::SerializationError);
    EXPECT_THROW(json_utils::pretty_print(""), json_utils::SerializationError);
}

TEST(JsonUtilsTest, ParsedDocumentsKeepMemberOrder) {
    const json_utils::Json doc = json_utils::parse(R"({"zeta":1,"alpha":"two","mid":[3.5,false]})");

    EXPECT_EQ(json_utils::dump(doc), R"({"zeta":1,"alpha":"two","mid":[3.5,false]})");
    EXPECT_EQ(doc["alpha"].get<std::string>(), "two");
}

TEST(JsonUtilsTest, DumpEscapesControlCharacters) {
    const json_utils::Json doc = {{"text", std::string("say \"hi\"\t") + '\x01'}};

    EXPECT_EQ(json_utils::dump(doc), R"({"text":"say \"hi\"\t\u0001"})");
}
