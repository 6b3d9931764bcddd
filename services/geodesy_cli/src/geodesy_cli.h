#pragma once

#include <grpcpp/grpcpp.h>
#include "geodesy/geodesy.grpc.pb.h"
#include <memory>
#include <string>
#include <vector>

// Parsed command line. Angles in degrees, lengths in meters.
struct CliCommand
{
    enum class Kind { Distance, Bearing, Destination };

    Kind kind = Kind::Distance;
    double lat1 = 0.0;
    double lon1 = 0.0;
    double lat2 = 0.0;
    double lon2 = 0.0;
    double distance_m = 0.0;
    double bearing_deg = 0.0;
    bool has_radius = false;
    double radius_m = 0.0;
};

// Parse "distance|bearing|destination <numbers...>" (argv without the program name).
// On failure returns false and fills error.
bool ParseCommand(const std::vector<std::string> &args, CliCommand *cmd, std::string *error);

const char *UsageText();

class GeodesyCLI
{
public:
    explicit GeodesyCLI(const std::string &geodesy_addr);

    // Returns the process exit code: 0 ok, 1 RPC failure
    int Execute(const CliCommand &cmd);

private:
    std::unique_ptr<geodesy::GeodesyService::Stub> stub_;

    int RunDistance(const CliCommand &cmd);
    int RunBearing(const CliCommand &cmd);
    int RunDestination(const CliCommand &cmd);
    void PrintRow(const std::string &label, double value, int precision);
};
