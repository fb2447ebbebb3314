#include "xfer/io/object_store.hpp"

#include <gtest/gtest.h>

#include <cstdlib>

using namespace xfer;
using namespace xfer::io;

TEST(ObjectStore, AcceptsHostPortAndUrls) {
    EXPECT_EQ(parse_endpoint("minio:9000").value(), "minio:9000");
    EXPECT_EQ(parse_endpoint("http://minio:9000").value(), "http://minio:9000");
    EXPECT_EQ(parse_endpoint("https://s3.eu-west-1.amazonaws.com/").value(),
              "https://s3.eu-west-1.amazonaws.com");
    EXPECT_EQ(parse_endpoint("127.0.0.1").value(), "127.0.0.1");
}

TEST(ObjectStore, RejectsMalformedEndpoints) {
    EXPECT_EQ(parse_endpoint("").error().kind, ErrorKind::Configuration);
    EXPECT_TRUE(parse_endpoint("ftp://minio:21").is_error());
    EXPECT_TRUE(parse_endpoint("http://").is_error());
    EXPECT_TRUE(parse_endpoint("minio:0").is_error());
    EXPECT_TRUE(parse_endpoint("minio:65536").is_error());
    EXPECT_TRUE(parse_endpoint("minio:").is_error());
    EXPECT_TRUE(parse_endpoint(":9000").is_error());
    EXPECT_TRUE(parse_endpoint("minio:90ab").is_error());
    EXPECT_TRUE(parse_endpoint("http://minio:9000/bucket").is_error());
    EXPECT_TRUE(parse_endpoint("mi nio").is_error());
    EXPECT_TRUE(parse_endpoint("user@minio").is_error());
}

TEST(ObjectStore, BuildsClientInsideSdkScope) {
    ::setenv("AWS_EC2_METADATA_DISABLED", "true", 1);
    AwsSdkScope sdk;

    ObjectStoreSettings settings;
    settings.endpoint = "http://127.0.0.1:9000";
    settings.region = "eu-west-1";
    settings.timeout = std::chrono::seconds{5};

    auto client = make_s3_client(settings);
    EXPECT_NE(client, nullptr);
}
