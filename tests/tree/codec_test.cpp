#include "chsync/tree/codec.hpp"

#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include <string>

using chsync::tree::CodecOptions;
using chsync::tree::FileEntry;
using chsync::tree::TreeCodec;
using chsync::tree::TreeNode;
using nlohmann::json;

namespace {

FileEntry make_file(const std::string& name, std::uint64_t size) {
    FileEntry file;
    file.name = name;
    file.size = size;
    file.local_path = "/tmp/" + name;
    return file;
}

TreeNode sample_tree() {
    TreeNode tree;
    auto readme = make_file("readme.md", 5);
    readme.assign_remote_ids("BQACAgIAAxkBAAIB", 101);
    tree.files.push_back(readme);

    auto& docs = tree.subfolders["docs"];
    docs.files.push_back(make_file("guide.txt", 10));
    docs.subfolders["img"].files.push_back(make_file("logo.png", 3));
    return tree;
}

TreeNode nested(std::size_t levels) {
    TreeNode root;
    TreeNode* node = &root;
    for (std::size_t i = 0; i < levels; ++i) {
        node = &node->subfolders["d"];
    }
    node->files.push_back(make_file("leaf.txt", 1));
    return root;
}

} // namespace

TEST(TreeCodecTest, SerializesExchangeForm) {
    TreeCodec codec;
    auto encoded = codec.serialize(sample_tree());
    ASSERT_TRUE(encoded.is_ok()) << encoded.error();

    const auto& doc = encoded.value();
    ASSERT_TRUE(doc["files"].is_array());
    EXPECT_EQ(doc["files"][0]["fileName"], "readme.md");
    EXPECT_EQ(doc["files"][0]["fileSize"], 5);
    EXPECT_EQ(doc["files"][0]["fileId"], "BQACAgIAAxkBAAIB");
    EXPECT_EQ(doc["files"][0]["messageId"], 101);
    EXPECT_FALSE(doc["files"][0].contains("localPath"));

    const auto& guide = doc["subfolders"]["docs"]["files"][0];
    EXPECT_EQ(guide["fileName"], "guide.txt");
    EXPECT_TRUE(guide["fileId"].is_null());
    EXPECT_TRUE(guide["messageId"].is_null());
    EXPECT_TRUE(doc["subfolders"]["docs"]["subfolders"]["img"]["subfolders"].is_object());
}

TEST(TreeCodecTest, DecodesWhatItEncodes) {
    TreeCodec codec;
    auto encoded = codec.serialize(sample_tree());
    ASSERT_TRUE(encoded.is_ok());

    auto decoded = codec.deserialize(encoded.value());
    ASSERT_TRUE(decoded.is_ok()) << decoded.error();

    const auto& tree = decoded.value();
    ASSERT_EQ(tree.files.size(), 1u);
    EXPECT_EQ(*tree.files[0].remote_object_id, "BQACAgIAAxkBAAIB");
    EXPECT_EQ(*tree.files[0].remote_message_id, 101);
    EXPECT_TRUE(tree.files[0].local_path.empty());
    EXPECT_FALSE(tree.subfolders.at("docs").files[0].has_remote_ids());
    EXPECT_EQ(tree.subfolders.at("docs").subfolders.at("img").files[0].size, 3u);
}

TEST(TreeCodecTest, MissingFileSizeDecodesAsZero) {
    TreeCodec codec;
    auto decoded = codec.parse(R"({"files":[{"fileName":"old.txt","fileId":"AgADBAADq6cxG","messageId":7}],"subfolders":{}})");
    ASSERT_TRUE(decoded.is_ok()) << decoded.error();
    EXPECT_EQ(decoded.value().files[0].size, 0u);
    EXPECT_TRUE(decoded.value().files[0].has_remote_ids());
}

TEST(TreeCodecTest, RejectsStructuralProblems) {
    TreeCodec codec;
    EXPECT_TRUE(codec.parse("[]").is_error());
    EXPECT_TRUE(codec.parse(R"({"files":[]})").is_error());
    EXPECT_TRUE(codec.parse(R"({"files":{},"subfolders":{}})").is_error());
    EXPECT_TRUE(codec.parse(R"({"files":[{"fileSize":1}],"subfolders":{}})").is_error());
    EXPECT_TRUE(codec.parse(R"({"files":[{"fileName":"a/b"}],"subfolders":{}})").is_error());
    EXPECT_TRUE(codec.parse(R"({"files":[{"fileName":"a","fileSize":-1}],"subfolders":{}})").is_error());
    EXPECT_TRUE(codec.parse(R"({"files":[],"subfolders":{"x":[]}})").is_error());
    EXPECT_TRUE(codec.parse("{not json").is_error());
}

TEST(TreeCodecTest, RejectsHalfAssignedOrMalformedIdentifiers) {
    TreeCodec codec;
    auto only_id = codec.parse(R"({"files":[{"fileName":"a","fileId":"AgADBAADq6cxG","messageId":null}],"subfolders":{}})");
    ASSERT_TRUE(only_id.is_error());
    EXPECT_NE(only_id.error().find("Incomplete"), std::string::npos);

    EXPECT_TRUE(codec.parse(R"({"files":[{"fileName":"a","fileId":"short","messageId":3}],"subfolders":{}})").is_error());
    EXPECT_TRUE(codec.parse(R"({"files":[{"fileName":"a","fileId":"AgADBAADq6cxG","messageId":0}],"subfolders":{}})").is_error());
    EXPECT_TRUE(codec.parse(R"({"files":[{"fileName":"a","fileId":"AgADBAADq6cxG","messageId":"3"}],"subfolders":{}})").is_error());
    EXPECT_TRUE(codec.parse(R"({"files":[{"fileName":"a","fileId":"AgAD BAADq6cxG","messageId":3}],"subfolders":{}})").is_error());
}

TEST(TreeCodecTest, SerializeRejectsInvalidIdentifiers) {
    TreeCodec codec;
    TreeNode tree;
    auto file = make_file("a.txt", 1);
    file.remote_object_id = "AgADBAADq6cxG";
    tree.files.push_back(file);
    EXPECT_TRUE(codec.serialize(tree).is_error());

    tree.files[0].remote_message_id = -5;
    EXPECT_TRUE(codec.serialize(tree).is_error());
}

TEST(TreeCodecTest, SerializeRejectsNamesThatAreNotUtf8) {
    TreeCodec codec;
    TreeNode tree;
    tree.files.push_back(make_file(std::string("caf\xe9.txt"), 4));
    auto encoded = codec.serialize(tree);
    ASSERT_TRUE(encoded.is_error());
    EXPECT_NE(encoded.error().find("not valid UTF-8"), std::string::npos);

    TreeNode folders;
    folders.subfolders[std::string("d\xe9p")].files.push_back(make_file("a.txt", 1));
    EXPECT_TRUE(codec.serialize(folders).is_error());
}

TEST(TreeCodecTest, EnforcesDepthLimit) {
    TreeCodec codec(CodecOptions{3, 10});
    EXPECT_TRUE(codec.serialize(nested(3)).is_ok());

    auto too_deep = codec.serialize(nested(4));
    ASSERT_TRUE(too_deep.is_error());
    EXPECT_NE(too_deep.error().find("Tree depth exceeds 3 levels"), std::string::npos);

    TreeCodec permissive(CodecOptions{10, 10});
    auto encoded = permissive.serialize(nested(4));
    ASSERT_TRUE(encoded.is_ok());
    EXPECT_TRUE(codec.deserialize(encoded.value()).is_error());
    EXPECT_TRUE(codec.extract_entries(nested(4)).is_error());
}

TEST(TreeCodecTest, ExtractsEntriesInScanOrder) {
    TreeCodec codec;
    auto entries = codec.extract_entries(sample_tree());
    ASSERT_TRUE(entries.is_ok());

    const auto& list = entries.value();
    ASSERT_EQ(list.size(), 3u);
    EXPECT_EQ(list[0].relative_path, "readme.md");
    EXPECT_EQ(list[1].relative_path, "docs/guide.txt");
    EXPECT_EQ(list[2].relative_path, "docs/img/logo.png");

    auto map = codec.extract_path_map(sample_tree());
    ASSERT_TRUE(map.is_ok());
    EXPECT_EQ(map.value().size(), 3u);
    EXPECT_EQ(map.value().at("docs/guide.txt").size, 10u);
}

TEST(TreeCodecTest, IdentifierShapes) {
    TreeCodec codec;
    EXPECT_TRUE(codec.is_valid_object_id("BQACAgIAAxkBAAIB"));
    EXPECT_FALSE(codec.is_valid_object_id("short"));
    EXPECT_FALSE(codec.is_valid_object_id("has\nnewline_in_it"));
    EXPECT_TRUE(TreeCodec::is_valid_message_id(1));
    EXPECT_FALSE(TreeCodec::is_valid_message_id(0));
}
