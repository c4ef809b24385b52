#include <jsonverse-cpp/error.hpp>

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>

using namespace jsonverse_cpp;

TEST(ErrorKind, to_string_view_covers_all_variants) {
    EXPECT_EQ(to_string_view(ErrorKind::document_not_found),         "document_not_found");
    EXPECT_EQ(to_string_view(ErrorKind::version_not_found),          "version_not_found");
    EXPECT_EQ(to_string_view(ErrorKind::invalid_content),            "invalid_content");
    EXPECT_EQ(to_string_view(ErrorKind::patch_conflict),             "patch_conflict");
    EXPECT_EQ(to_string_view(ErrorKind::concurrent_save_superseded), "concurrent_save_superseded");
    EXPECT_EQ(to_string_view(ErrorKind::storage_error),              "storage_error");
}

TEST(Error, construction_and_equality) {
    const auto e1 = Error{ErrorKind::patch_conflict, "bad base"};
    const auto e2 = Error{ErrorKind::patch_conflict, "bad base"};
    const auto e3 = Error{ErrorKind::invalid_content, "bad base"};

    EXPECT_EQ(e1, e2);
    EXPECT_NE(e1, e3);
}

TEST(Error, different_messages_are_not_equal) {
    EXPECT_NE((Error{ErrorKind::storage_error, "foo"}), (Error{ErrorKind::storage_error, "bar"}));
}

TEST(Exception, carries_the_error) {
    const auto e = Exception{ErrorKind::version_not_found, "no version \"v9\""};

    EXPECT_EQ(e.kind(), ErrorKind::version_not_found);
    EXPECT_EQ(e.error().message, "no version \"v9\"");
    EXPECT_EQ(std::string{e.what()}, "version_not_found: no version \"v9\"");
}

TEST(Exception, is_a_runtime_error) {
    try {
        throw Exception{ErrorKind::document_not_found, "gone"};
    } catch (const std::runtime_error& e) {
        EXPECT_NE(std::string{e.what()}.find("gone"), std::string::npos);
        return;
    }
    FAIL() << "exception was not caught as std::runtime_error";
}
