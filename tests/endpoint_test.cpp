#include <gtest/gtest.h>

#include <string>

#include <stdlib.h>

#include "rangecat/core/errors.hpp"
#include "rangecat/storage/object_client.hpp"

using namespace rangecat::core;
using namespace rangecat::storage;

// ============================================================================
// parse_endpoint
// ============================================================================

TEST(Endpoint, LocalDirectory) {
    Endpoint ep;
    ASSERT_EQ(parse_endpoint("file:///srv/objects", &ep).code, StatusCode::Ok);
    EXPECT_EQ(ep.kind, EndpointKind::Local);
    EXPECT_EQ(ep.root, "/srv/objects");

    ASSERT_EQ(parse_endpoint("file:///srv/objects//", &ep).code, StatusCode::Ok);
    EXPECT_EQ(ep.root, "/srv/objects");

    ASSERT_EQ(parse_endpoint("file:///", &ep).code, StatusCode::Ok);
    EXPECT_EQ(ep.root, "/");
}

TEST(Endpoint, CustomHostAndPort) {
    Endpoint ep;
    ASSERT_EQ(parse_endpoint("http://minio.local:9000", &ep).code, StatusCode::Ok);
    EXPECT_EQ(ep.kind, EndpointKind::S3);
    EXPECT_EQ(ep.host, "minio.local");
    EXPECT_EQ(ep.port, 9000u);
    EXPECT_FALSE(ep.tls);
    EXPECT_TRUE(ep.region.empty());
    EXPECT_EQ(ep.authority(), "minio.local:9000");

    ASSERT_EQ(parse_endpoint("http://storage.example.org/", &ep).code, StatusCode::Ok);
    EXPECT_EQ(ep.host, "storage.example.org");
    EXPECT_EQ(ep.port, 0u);
    EXPECT_EQ(ep.authority(), "storage.example.org");

    ASSERT_EQ(parse_endpoint("http://[::1]:8080", &ep).code, StatusCode::Ok);
    EXPECT_EQ(ep.host, "::1");
    EXPECT_EQ(ep.port, 8080u);
    EXPECT_EQ(ep.authority(), "[::1]:8080");

    ASSERT_EQ(parse_endpoint("http://[fe80::1]", &ep).code, StatusCode::Ok);
    EXPECT_EQ(ep.host, "fe80::1");
    EXPECT_EQ(ep.port, 0u);
    EXPECT_EQ(ep.authority(), "[fe80::1]");
}

TEST(Endpoint, HttpsUsesTls) {
    Endpoint ep;
    ASSERT_EQ(parse_endpoint("https://s3.example.org:8443", &ep).code, StatusCode::Ok);
    EXPECT_EQ(ep.kind, EndpointKind::S3);
    EXPECT_TRUE(ep.tls);
    EXPECT_EQ(ep.authority(), "s3.example.org:8443");
}

TEST(Endpoint, RegionName) {
    Endpoint ep;
    ASSERT_EQ(parse_endpoint("eu-west-1", &ep).code, StatusCode::Ok);
    EXPECT_EQ(ep.kind, EndpointKind::S3);
    EXPECT_EQ(ep.region, "eu-west-1");
    EXPECT_TRUE(ep.host.empty());
    EXPECT_EQ(ep.authority(), "");
}

TEST(Endpoint, RejectsMalformed) {
    Endpoint ep;
    const char* bad[] = {
        "",
        "file://",
        "file://relative/dir",
        "http://",
        "http:///",
        "http://host:",
        "http://host:0",
        "http://host:65536",
        "http://host:80x",
        "http://host/bucket",
        "http://user@host",
        "http://[::1",
        "http://[]:80",
        "http://[::1]x",
        "EU-WEST-1",
        "-eu-west-1",
        "eu-west-1-",
        "eu_west_1",
        "ftp://host",
    };
    for (const char* spec : bad) {
        const Status s = parse_endpoint(spec, &ep);
        EXPECT_EQ(s.code, StatusCode::Invalid) << spec;
        EXPECT_EQ(s.domain, StatusDomain::Config) << spec;
    }
}

// ============================================================================
// make_object_client
// ============================================================================

TEST(Endpoint, FactoryFailuresAreConfigurationErrors) {
    ObjectClientPtr client;
    const char* bad[] = {
        "",
        "not a region",
        "https://example.org/bucket",
        "file:///nonexistent/rangecat/root",
    };
    for (const char* spec : bad) {
        const Status s = make_object_client(spec, ClientOptions{}, &client);
        EXPECT_TRUE(is_configuration_error(s)) << spec;
        EXPECT_FALSE(is_transport_error(s)) << spec;
    }
    EXPECT_EQ(client, nullptr);
}

class S3EndpointTest : public ::testing::Test {
protected:
    void SetUp() override { ::setenv("AWS_EC2_METADATA_DISABLED", "true", 1); }
};

TEST_F(S3EndpointTest, ClientsAreBuiltWithoutNetworkAccess) {
    ClientOptions opts;
    opts.region = "us-east-1";
    opts.anonymous = true;
    const char* good[] = {
        "http://127.0.0.1:9",
        "https://rangecat-no-such-host.invalid",
        "eu-west-1",
    };
    for (const char* spec : good) {
        ObjectClientPtr client;
        ASSERT_EQ(make_object_client(spec, opts, &client).code, StatusCode::Ok) << spec;
        EXPECT_NE(client, nullptr) << spec;
    }
}
