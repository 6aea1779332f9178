#include <gtest/gtest.h>

#include "transport.h"

using namespace xmlvalidate;

// ========================================================================
// HTTP status lines
// ========================================================================

TEST(StatusLineTest, ReasonPhrase) {
    std::string reason;
    EXPECT_TRUE(parseStatusLine("HTTP/1.1 400 Bad Request\r\n", reason));
    EXPECT_EQ(reason, "Bad Request");
    EXPECT_TRUE(parseStatusLine("HTTP/1.1 503 Service Unavailable\r\n", reason));
    EXPECT_EQ(reason, "Service Unavailable");
}

TEST(StatusLineTest, MissingReasonClearsPrevious) {
    std::string reason = "Moved Permanently";
    EXPECT_TRUE(parseStatusLine("HTTP/1.1 200\r\n", reason));
    EXPECT_EQ(reason, "");
}

TEST(StatusLineTest, OtherHeadersAreIgnored) {
    std::string reason = "OK";
    EXPECT_FALSE(parseStatusLine("Content-Type: application/xml\r\n", reason));
    EXPECT_FALSE(parseStatusLine("\r\n", reason));
    EXPECT_EQ(reason, "OK");
}

// ========================================================================
// FTP control replies
// ========================================================================

TEST(FtpReplyTest, FinalReplyLine) {
    std::string reply;
    EXPECT_TRUE(parseFtpReply("550 Failed to open file.\r\n", reply));
    EXPECT_EQ(reply, "550 Failed to open file.");
    EXPECT_TRUE(parseFtpReply("230 Login successful.\n", reply));
    EXPECT_EQ(reply, "230 Login successful.");
}

TEST(FtpReplyTest, MultiLineReplyKeepsFinalLine) {
    std::string reply;
    EXPECT_FALSE(parseFtpReply("550-Requested action not taken.\r\n", reply));
    EXPECT_EQ(reply, "");
    EXPECT_TRUE(parseFtpReply("550 File unavailable.\r\n", reply));
    EXPECT_EQ(reply, "550 File unavailable.");
}

TEST(FtpReplyTest, CurlSyntheticHeadersAreIgnored) {
    std::string reply = "213 2048";
    EXPECT_FALSE(parseFtpReply("Content-Length: 2048\r\n", reply));
    EXPECT_FALSE(parseFtpReply("Accept-ranges: bytes\r\n", reply));
    EXPECT_FALSE(parseFtpReply("550\r\n", reply));
    EXPECT_FALSE(parseFtpReply("\r\n", reply));
    EXPECT_EQ(reply, "213 2048");
}

// ========================================================================
// RETR paths
// ========================================================================

TEST(RetrievePathTest, FilePathIsAccepted) {
    EXPECT_NO_THROW(checkRetrievePath("/test_files/schema.xsd"));
    EXPECT_NO_THROW(checkRetrievePath("schema.xsd"));
}

TEST(RetrievePathTest, EmptyOrDirectoryPathIsRefused) {
    EXPECT_THROW(checkRetrievePath(""), FtpError);
    EXPECT_THROW(checkRetrievePath("/"), FtpError);
    EXPECT_THROW(checkRetrievePath("/pub/"), FtpError);
    try {
        checkRetrievePath("/pub/");
        FAIL() << "a directory path should be refused";
    } catch (const FtpError& e) {
        EXPECT_STREQ(e.what(), "550 Failed to open file.");
    }
}
