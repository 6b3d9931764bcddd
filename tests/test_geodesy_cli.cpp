/**
 * @file test_geodesy_cli.cpp
 * @brief Command-line parsing tests for the geodesy client
 */

#include <gtest/gtest.h>
#include <geodesy_cli.h>
#include <geodesy_service.h>
#include <great_circle.h>
#include <grpcpp/grpcpp.h>
#include <memory>
#include <string>
#include <vector>

namespace {

CliCommand Parse(const std::vector<std::string> &args)
{
    CliCommand cmd;
    std::string error;
    EXPECT_TRUE(ParseCommand(args, &cmd, &error)) << error;
    return cmd;
}

// In-process service on an ephemeral loopback port
class GeodesyCliServerTest : public ::testing::Test {
protected:
    void SetUp() override {
        service_ = std::make_unique<GeodesyServiceImpl>(great_circle::MEAN_EARTH_RADIUS);
        grpc::ServerBuilder builder;
        builder.AddListeningPort("127.0.0.1:0", grpc::InsecureServerCredentials(), &port_);
        builder.RegisterService(service_.get());
        server_ = builder.BuildAndStart();
        ASSERT_NE(server_, nullptr);
        ASSERT_GT(port_, 0);
    }

    void TearDown() override {
        if (server_)
            server_->Shutdown();
    }

    std::string Address() const { return "127.0.0.1:" + std::to_string(port_); }

    int Run(const std::vector<std::string> &args, std::string *out) {
        GeodesyCLI cli(Address());
        testing::internal::CaptureStdout();
        int code = cli.Execute(Parse(args));
        *out = testing::internal::GetCapturedStdout();
        return code;
    }

    std::unique_ptr<GeodesyServiceImpl> service_;
    std::unique_ptr<grpc::Server> server_;
    int port_ = 0;
};

} // namespace

TEST(GeodesyCliTest, ParsesDistance) {
    CliCommand cmd;
    std::string error;
    ASSERT_TRUE(ParseCommand({"distance", "50.0667", "-5.7167", "58.6439", "-3.07"}, &cmd, &error));
    EXPECT_EQ(cmd.kind, CliCommand::Kind::Distance);
    EXPECT_DOUBLE_EQ(cmd.lat1, 50.0667);
    EXPECT_DOUBLE_EQ(cmd.lon1, -5.7167);
    EXPECT_DOUBLE_EQ(cmd.lat2, 58.6439);
    EXPECT_DOUBLE_EQ(cmd.lon2, -3.07);
    EXPECT_FALSE(cmd.has_radius);
}

TEST(GeodesyCliTest, ParsesOptionalRadius) {
    CliCommand cmd;
    std::string error;
    ASSERT_TRUE(ParseCommand({"distance", "0", "0", "0", "90", "1"}, &cmd, &error));
    EXPECT_TRUE(cmd.has_radius);
    EXPECT_DOUBLE_EQ(cmd.radius_m, 1.0);
}

TEST(GeodesyCliTest, ParsesDestination) {
    CliCommand cmd;
    std::string error;
    ASSERT_TRUE(ParseCommand({"destination", "0", "0", "10000000", "0"}, &cmd, &error));
    EXPECT_EQ(cmd.kind, CliCommand::Kind::Destination);
    EXPECT_DOUBLE_EQ(cmd.distance_m, 1e7);
    EXPECT_DOUBLE_EQ(cmd.bearing_deg, 0.0);
}

TEST(GeodesyCliTest, BearingTakesNoRadius) {
    CliCommand cmd;
    std::string error;
    EXPECT_TRUE(ParseCommand({"bearing", "1", "2", "3", "4"}, &cmd, &error));
    EXPECT_EQ(cmd.kind, CliCommand::Kind::Bearing);
    EXPECT_FALSE(ParseCommand({"bearing", "1", "2", "3", "4", "5"}, &cmd, &error));
    EXPECT_FALSE(error.empty());
}

TEST(GeodesyCliTest, RejectsBadInput) {
    CliCommand cmd;
    std::string error;
    EXPECT_FALSE(ParseCommand({}, &cmd, &error));
    EXPECT_FALSE(ParseCommand({"azimuth", "1", "2", "3", "4"}, &cmd, &error));
    EXPECT_EQ(error, "unknown command: azimuth");
    EXPECT_FALSE(ParseCommand({"distance", "1", "2", "3"}, &cmd, &error));
    EXPECT_FALSE(ParseCommand({"distance", "1", "north", "3", "4"}, &cmd, &error));
    EXPECT_EQ(error, "not a number: north");
    EXPECT_FALSE(ParseCommand({"destination", "1", "2", "3km", "4"}, &cmd, &error));
}

TEST(GeodesyCliTest, UnreachableServiceExitsWithOne) {
    GeodesyCLI cli("127.0.0.1:1");
    testing::internal::CaptureStderr();
    int code = cli.Execute(Parse({"bearing", "0", "0", "1", "1"}));
    std::string err = testing::internal::GetCapturedStderr();
    EXPECT_EQ(code, 1);
    EXPECT_NE(err.find("[GEODESY-CLI] RPC failed:"), std::string::npos);
}

TEST_F(GeodesyCliServerTest, DistancePrintsTable) {
    std::string out;
    // Swapping lat2/lon2 would give 0.775
    ASSERT_EQ(Run({"distance", "10", "20", "40", "-30", "1"}, &out), 0);
    EXPECT_NE(out.find("GREAT-CIRCLE DISTANCE"), std::string::npos);
    EXPECT_NE(out.find("DISTANCE(m)     0.932"), std::string::npos) << out;
    EXPECT_NE(out.find("RADIUS(m)       1.0"), std::string::npos) << out;
}

TEST_F(GeodesyCliServerTest, DistanceDefaultRadius) {
    std::string out;
    ASSERT_EQ(Run({"distance", "0", "0", "0", "1"}, &out), 0);
    EXPECT_NE(out.find("RADIUS(m)       6371000.0"), std::string::npos) << out;
}

TEST_F(GeodesyCliServerTest, BearingPrintsDegrees) {
    std::string out;
    ASSERT_EQ(Run({"bearing", "0", "0", "0", "-10"}, &out), 0);
    EXPECT_NE(out.find("BEARING(deg)    270.000000"), std::string::npos) << out;
}

TEST_F(GeodesyCliServerTest, DestinationPrintsWrappedLongitude) {
    std::string out;
    // Two degrees east of 179 on a unit sphere
    ASSERT_EQ(Run({"destination", "0", "179", "0.03490658503988659", "90", "1"}, &out), 0);
    EXPECT_NE(out.find("LON(deg)        -179.000000"), std::string::npos) << out;
    EXPECT_NE(out.find("LAT(deg)        0.000000"), std::string::npos) << out;
}

TEST_F(GeodesyCliServerTest, InvalidRadiusExitsWithOne) {
    GeodesyCLI cli(Address());
    testing::internal::CaptureStderr();
    int code = cli.Execute(Parse({"distance", "0", "0", "1", "1", "-5"}));
    std::string err = testing::internal::GetCapturedStderr();
    EXPECT_EQ(code, 1);
    EXPECT_NE(err.find("radius_m must be finite and positive"), std::string::npos) << err;
}
