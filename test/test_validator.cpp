#include <gtest/gtest.h>

#include "fake_transport.h"
#include "resolver.h"
#include "validator.h"
#include "xerces_support.h"

using namespace xmlvalidate;

class SchemaValidatorTest : public ::testing::Test {
protected:
    XercesPlatform platform;
    SchemaValidator validator;

    static Resource local(const std::string& relative) {
        Resource resource;
        resource.origin = LocalPath;
        resource.argument = testFile(relative);
        resource.location = resource.argument;
        return resource;
    }

    static Resource remote(const std::string& relative, const std::string& url) {
        Resource resource;
        resource.origin = HttpUrl;
        resource.argument = url;
        resource.location = url;
        resource.content = readTestFile(relative);
        return resource;
    }

    Outcome validate(const std::string& xml, const std::string& xsd) {
        return validator.validate(local("xml/" + xml), local("schemas/" + xsd));
    }
};

TEST(DisplayNameTest, FileNameOrUrl) {
    Resource resource;
    resource.location = "/data/xml/SAMPLE.xml";
    EXPECT_EQ(displayName(resource), "SAMPLE.xml");
    resource.origin = FtpUrl;
    resource.location = "ftp://ftp.local.server/xml/SAMPLE.xml";
    EXPECT_EQ(displayName(resource), "ftp://ftp.local.server/xml/SAMPLE.xml");
}

TEST_F(SchemaValidatorTest, ValidSample) {
    Outcome outcome = validate("SAMPLE.xml", "SRA.sample.xsd");
    EXPECT_EQ(outcome.kind, Outcome::Valid) << outcome.detail;
    EXPECT_TRUE(outcome.detail.empty());
}

TEST_F(SchemaValidatorTest, ValidSubmission) {
    Outcome outcome = validate("SUBMISSION.xml", "SRA.submission.xsd");
    EXPECT_EQ(outcome.kind, Outcome::Valid) << outcome.detail;
}

TEST_F(SchemaValidatorTest, InvalidSubmissionListsReasons) {
    Outcome outcome = validate("invalid_SUBMISSION.xml", "SRA.submission.xsd");
    ASSERT_EQ(outcome.kind, Outcome::Invalid) << outcome.detail;
    EXPECT_EQ(outcome.detail.find("failed validating invalid_SUBMISSION.xml with SRA.submission.xsd:\n"), 0u);
    EXPECT_NE(outcome.detail.find("\nReason: line "), std::string::npos);
}

TEST_F(SchemaValidatorTest, WrongSchemaIsInvalid) {
    Outcome outcome = validate("SUBMISSION.xml", "SRA.sample.xsd");
    EXPECT_EQ(outcome.kind, Outcome::Invalid) << outcome.detail;
}

TEST_F(SchemaValidatorTest, MalformedXml) {
    Outcome outcome = validate("bad_syntax.xml", "SRA.submission.xsd");
    EXPECT_EQ(outcome.kind, Outcome::Malformed) << outcome.detail;
    EXPECT_NE(outcome.detail.find("line 9"), std::string::npos) << outcome.detail;
}

TEST_F(SchemaValidatorTest, MalformedSchema) {
    Outcome outcome = validate("SAMPLE.xml", "bad_syntax.xsd");
    EXPECT_EQ(outcome.kind, Outcome::Malformed) << outcome.detail;
}

TEST_F(SchemaValidatorTest, SchemaComponentErrorIsUnexpected) {
    Outcome outcome = validate("SAMPLE.xml", "undefined_type.xsd");
    EXPECT_EQ(outcome.kind, Outcome::Unexpected) << outcome.detail;
    EXPECT_NE(outcome.detail.find("SampleSetType"), std::string::npos) << outcome.detail;
}

TEST_F(SchemaValidatorTest, InMemoryDocumentAndSchema) {
    Outcome outcome = validator.validate(remote("xml/SAMPLE.xml", "http://example.com/SAMPLE.xml"),
                                         remote("schemas/SRA.sample.xsd", "ftp://ftp.local.server/SRA.sample.xsd"));
    EXPECT_EQ(outcome.kind, Outcome::Valid) << outcome.detail;
}

TEST_F(SchemaValidatorTest, InMemoryInvalidDocumentUsesUrl) {
    Outcome outcome = validator.validate(remote("xml/invalid_SUBMISSION.xml", "http://example.com/s.xml"),
                                         local("schemas/SRA.submission.xsd"));
    ASSERT_EQ(outcome.kind, Outcome::Invalid) << outcome.detail;
    EXPECT_EQ(outcome.detail.find("failed validating http://example.com/s.xml with SRA.submission.xsd:"), 0u);
}

TEST_F(SchemaValidatorTest, EmptyDocumentIsMalformed) {
    Resource empty;
    empty.origin = HttpUrl;
    empty.argument = "http://example.com/empty.xml";
    empty.location = empty.argument;
    Outcome outcome = validator.validate(empty, local("schemas/SRA.sample.xsd"));
    EXPECT_EQ(outcome.kind, Outcome::Malformed) << outcome.detail;
}
