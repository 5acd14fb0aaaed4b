#include <gtest/gtest.h>
#include "peerdrop/core/utils.hpp"
#include <filesystem>
#include <fstream>
#include <variant>

using namespace peerdrop::core::utils;

class StringUtilsTest : public ::testing::Test {};

TEST_F(StringUtilsTest, Split) {
    auto result = StringUtils::split("a,b,c", ',');
    EXPECT_EQ(result.size(), 3);
    EXPECT_EQ(result[0], "a");
    EXPECT_EQ(result[1], "b");
    EXPECT_EQ(result[2], "c");
    
    auto empty = StringUtils::split("", ',');
    EXPECT_EQ(empty.size(), 1);
    EXPECT_EQ(empty[0], "");
    
    auto path = StringUtils::split("/api/session/ABC234/join", '/');
    ASSERT_EQ(path.size(), 5);
    EXPECT_EQ(path[0], "");
    EXPECT_EQ(path[3], "ABC234");
}

TEST_F(StringUtilsTest, Join) {
    std::vector<std::string> parts = {"a", "b", "c"};
    auto result = StringUtils::join(parts, ",");
    EXPECT_EQ(result, "a,b,c");
    
    std::vector<std::string> empty;
    auto empty_result = StringUtils::join(empty, ",");
    EXPECT_EQ(empty_result, "");
}

TEST_F(StringUtilsTest, Trim) {
    EXPECT_EQ(StringUtils::trim("  hello  "), "hello");
    EXPECT_EQ(StringUtils::trim("hello"), "hello");
    EXPECT_EQ(StringUtils::trim("\tAB12CD\n"), "AB12CD");
    EXPECT_EQ(StringUtils::trim("   "), "");
    EXPECT_EQ(StringUtils::trim(""), "");
}

TEST_F(StringUtilsTest, CaseConversion) {
    EXPECT_EQ(StringUtils::to_lower("Hello World"), "hello world");
}

TEST_F(StringUtilsTest, StartsWith) {
    EXPECT_TRUE(StringUtils::starts_with("hello world", "hello"));
    EXPECT_FALSE(StringUtils::starts_with("hello world", "world"));
    EXPECT_TRUE(StringUtils::starts_with("test", "test"));
    EXPECT_FALSE(StringUtils::starts_with("test", "testing"));
}

TEST_F(StringUtilsTest, EndsWith) {
    EXPECT_TRUE(StringUtils::ends_with("hello world", "world"));
    EXPECT_FALSE(StringUtils::ends_with("hello world", "hello"));
    EXPECT_TRUE(StringUtils::ends_with("test", "test"));
    EXPECT_FALSE(StringUtils::ends_with("test", "testing"));
}

TEST_F(StringUtilsTest, FormatBytes) {
    EXPECT_EQ(StringUtils::format_bytes(1024), "1.00 KB");
    EXPECT_EQ(StringUtils::format_bytes(1048576), "1.00 MB");
    EXPECT_EQ(StringUtils::format_bytes(500), "500.00 B");
    EXPECT_EQ(StringUtils::format_bytes(0), "0.00 B");
}

TEST_F(StringUtilsTest, Hex) {
    std::vector<std::uint8_t> bytes = {0x00, 0x7f, 0xab, 0xff};
    EXPECT_EQ(StringUtils::to_hex(bytes), "007fabff");
    
    auto decoded = StringUtils::from_hex("007FabFF");
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded, bytes);
    
    EXPECT_FALSE(StringUtils::from_hex("abc").has_value());
    EXPECT_FALSE(StringUtils::from_hex("zz").has_value());
    EXPECT_TRUE(StringUtils::from_hex("")->empty());
}

TEST_F(StringUtilsTest, UrlEncoding) {
    EXPECT_EQ(StringUtils::url_encode("AB12CD"), "AB12CD");
    EXPECT_EQ(StringUtils::url_encode("a b/c?d"), "a%20b%2Fc%3Fd");
    EXPECT_EQ(StringUtils::url_encode("safe-_.~"), "safe-_.~");
    
    EXPECT_EQ(StringUtils::url_decode("a%20b%2fc"), std::optional<std::string>("a b/c"));
    EXPECT_EQ(StringUtils::url_decode("x+y"), std::optional<std::string>("x y"));
    EXPECT_FALSE(StringUtils::url_decode("%2").has_value());
    EXPECT_FALSE(StringUtils::url_decode("%zz").has_value());
}

TEST_F(StringUtilsTest, PathSegmentsKeepPlus) {
    EXPECT_EQ(StringUtils::path_decode("AB+12"), std::optional<std::string>("AB+12"));
    EXPECT_EQ(StringUtils::path_decode("a%2Bb%20c"), std::optional<std::string>("a+b c"));
    EXPECT_EQ(StringUtils::path_decode(StringUtils::url_encode("x+y z")), std::optional<std::string>("x+y z"));
    EXPECT_FALSE(StringUtils::path_decode("%2").has_value());
}

class FileUtilsTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_file = "test_file.txt";
        test_dir = "test_dir";
    }
    
    void TearDown() override {
        if (std::filesystem::exists(test_file)) {
            std::filesystem::remove(test_file);
        }
        if (std::filesystem::exists(test_dir)) {
            std::filesystem::remove_all(test_dir);
        }
    }
    
    std::string test_file;
    std::string test_dir;
};

TEST_F(FileUtilsTest, Exists) {
    EXPECT_FALSE(FileUtils::exists(test_file));
    
    std::ofstream file(test_file);
    file << "test";
    file.close();
    
    EXPECT_TRUE(FileUtils::exists(test_file));
}

TEST_F(FileUtilsTest, IsFile) {
    std::ofstream file(test_file);
    file << "test";
    file.close();
    
    EXPECT_TRUE(FileUtils::is_file(test_file));
    
    FileUtils::create_directories(test_dir);
    EXPECT_FALSE(FileUtils::is_file(test_dir));
}

TEST_F(FileUtilsTest, CreateDirectories) {
    EXPECT_TRUE(FileUtils::create_directories(test_dir + "/nested/deeper"));
    EXPECT_TRUE(FileUtils::exists(test_dir + "/nested/deeper"));
    EXPECT_TRUE(FileUtils::create_directories(test_dir));
}

TEST_F(FileUtilsTest, WriteBinaryFileAndSize) {
    std::vector<std::uint8_t> content = {'H', 'i', 0x00, 0xff};
    
    EXPECT_TRUE(FileUtils::write_binary_file(test_file, content));
    
    auto size = FileUtils::file_size(test_file);
    ASSERT_TRUE(size.has_value());
    EXPECT_EQ(*size, content.size());
    
    EXPECT_FALSE(FileUtils::file_size("missing_file.bin").has_value());
}

TEST_F(FileUtilsTest, UniquePathNeverOverwrites) {
    ASSERT_TRUE(FileUtils::create_directories(test_dir));
    
    auto first = FileUtils::unique_path(test_dir, "report.pdf");
    EXPECT_EQ(first, std::filesystem::path(test_dir) / "report.pdf");
    
    std::vector<std::uint8_t> data = {1};
    ASSERT_TRUE(FileUtils::write_binary_file(first, data));
    
    auto second = FileUtils::unique_path(test_dir, "report.pdf");
    EXPECT_EQ(second, std::filesystem::path(test_dir) / "report (1).pdf");
    ASSERT_TRUE(FileUtils::write_binary_file(second, data));
    
    EXPECT_EQ(FileUtils::unique_path(test_dir, "report.pdf"), std::filesystem::path(test_dir) / "report (2).pdf");
}

TEST_F(FileUtilsTest, UniquePathStripsDirectories) {
    ASSERT_TRUE(FileUtils::create_directories(test_dir));
    
    EXPECT_EQ(FileUtils::unique_path(test_dir, "../../etc/passwd"), std::filesystem::path(test_dir) / "passwd");
    EXPECT_EQ(FileUtils::unique_path(test_dir, ""), std::filesystem::path(test_dir) / "received.bin");
    EXPECT_EQ(FileUtils::unique_path(test_dir, ".."), std::filesystem::path(test_dir) / "received.bin");
}

TEST(MimeUtilsTest, GuessesFromExtension) {
    EXPECT_EQ(MimeUtils::guess_mime_type("notes.txt"), "text/plain");
    EXPECT_EQ(MimeUtils::guess_mime_type("PHOTO.JPG"), "image/jpeg");
    EXPECT_EQ(MimeUtils::guess_mime_type("archive.tar.gz"), "application/gzip");
    EXPECT_EQ(MimeUtils::guess_mime_type("data.unknownext"), "application/octet-stream");
    EXPECT_EQ(MimeUtils::guess_mime_type("Makefile"), "application/octet-stream");
}

TEST(OverloadedTest, DispatchesOnVariantAlternative) {
    std::variant<int, std::string> value = std::string("text");
    auto name = std::visit(overloaded{
        [](int) { return std::string("int"); },
        [](const std::string&) { return std::string("string"); }
    }, value);
    EXPECT_EQ(name, "string");
}
